/**
 * AGL Core - Launch Readiness Resolver
 *
 * Decides what has to happen before a game can be launched by running
 * an ordered list of checks and stopping at the first unmet one:
 *
 *   1. runner selected and installed
 *   2. wine prefix exists, legacy folders migrated
 *   3. game version
 *   4. voice package versions
 *   5. patch cache sync and patch checks
 *   6. telemetry disabled
 *   7. predownload or launch
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/platform/RuntimeEnvironment.hpp"
#include "game/CheckContext.hpp"
#include "game/GameProfile.hpp"
#include "game/LaunchReadinessState.hpp"
#include "game/Providers.hpp"

namespace agl {

struct MirrorFailure {
    std::string server;
    std::string error;
};

/**
 * Side information collected during resolution
 *
 * Never changes the resolved state.
 */
struct ResolveDiagnostics {
    // Patch mirrors that failed before one succeeded (or all failed)
    std::vector<MirrorFailure> mirrorFailures;
};

class LaunchReadinessResolver {
public:
    /**
     * @param telemetry May be null, telemetry is then assumed disabled
     * @throws std::invalid_argument if the profile has no version provider
     */
    LaunchReadinessResolver(RuntimeEnvironment env,
                            GameProfile profile,
                            std::shared_ptr<TelemetryProvider> telemetry);

    /**
     * Resolve the launch state
     *
     * Provider exceptions propagate, except patch mirror sync failures
     * (recorded in diagnostics) and telemetry lookup failures (assumed
     * disabled).
     */
    LaunchReadinessState resolve(const CheckContext& ctx,
                                 ResolveDiagnostics* diagnostics = nullptr) const;

    const GameProfile& profile() const { return m_profile; }

private:
    LaunchReadinessState evaluate(const CheckContext& ctx, ResolveDiagnostics* diagnostics) const;

    bool runnerInstalled(const CheckContext& ctx) const;
    void syncPatches(const CheckContext& ctx, ResolveDiagnostics* diagnostics) const;
    bool telemetryDisabled(const CheckContext& ctx) const;

    RuntimeEnvironment m_env;
    GameProfile m_profile;
    std::shared_ptr<TelemetryProvider> m_telemetry;
};

} // namespace agl
