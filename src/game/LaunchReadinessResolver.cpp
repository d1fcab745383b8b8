/**
 * AGL Core - Launch Readiness Resolver Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "LaunchReadinessResolver.hpp"

#include "steam/ProtonDiscovery.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace agl {

LaunchReadinessResolver::LaunchReadinessResolver(RuntimeEnvironment env,
                                                 GameProfile profile,
                                                 std::shared_ptr<TelemetryProvider> telemetry)
    : m_env(std::move(env))
    , m_profile(std::move(profile))
    , m_telemetry(std::move(telemetry))
{
    if (!m_profile.versions) {
        throw std::invalid_argument("Game profile \"" + m_profile.name + "\" has no version provider");
    }
}

LaunchReadinessState LaunchReadinessResolver::resolve(const CheckContext& ctx,
                                                      ResolveDiagnostics* diagnostics) const {
    spdlog::debug("Trying to get {} launch state", m_profile.name);

    auto state = evaluate(ctx, diagnostics);

    if (state.canLaunch()) {
        spdlog::info("{} is ready to launch", m_profile.name);
    } else {
        spdlog::info("{} launch state: {}", m_profile.name, state.describe());
    }

    return state;
}

bool LaunchReadinessResolver::runnerInstalled(const CheckContext& ctx) const {
    const auto& runner = *ctx.runner;

    if (runner.managed) {
        // Steam owns the install, ask it
        if (m_env.launchedFromSteam()) {
            return ProtonDiscovery(m_env).isValidSelectedRunner(runner.name);
        }
        return true;
    }

    if (ctx.runnerBuildsFolder) {
        std::error_code ec;
        return std::filesystem::exists(*ctx.runnerBuildsFolder / runner.name, ec);
    }

    return true;
}

void LaunchReadinessResolver::syncPatches(const CheckContext& ctx, ResolveDiagnostics* diagnostics) const {
    if (!m_profile.patches || ctx.patchServers.empty()) {
        return;
    }

    if (auto remote = m_profile.patches->syncedRemote(ctx.patchServers)) {
        spdlog::debug("Patch folder is in sync with {}", *remote);
        return;
    }

    for (const auto& server : ctx.patchServers) {
        try {
            m_profile.patches->sync(server);
            spdlog::debug("Synced patch folder with {}", server);
            return;
        } catch (const std::exception& e) {
            spdlog::warn("Failed to sync patch folder with {}: {}", server, e.what());
            if (diagnostics) {
                diagnostics->mirrorFailures.push_back({server, e.what()});
            }
        }
    }

    spdlog::warn("Couldn't sync patch folder with any of {} server(s)", ctx.patchServers.size());
}

bool LaunchReadinessResolver::telemetryDisabled(const CheckContext& ctx) const {
    if (!m_telemetry) {
        return true;
    }

    try {
        auto domain = m_telemetry->resolvedDomain(ctx.edition, TELEMETRY_CHECK_TIMEOUT);
        if (domain) {
            spdlog::debug("Telemetry domain {} is resolvable", *domain);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to check telemetry servers: {}. Assuming they're disabled", e.what());
        return true;
    }
}

LaunchReadinessState LaunchReadinessResolver::evaluate(const CheckContext& ctx,
                                                       ResolveDiagnostics* diagnostics) const {
    using Kind = LaunchReadinessState::Kind;

    // Runner
    if (!ctx.runner || !runnerInstalled(ctx)) {
        return LaunchReadinessState::simple(Kind::WineNotInstalled);
    }

    // Managed runners own their prefix
    std::error_code ec;
    if (!ctx.runner->managed && !std::filesystem::exists(ctx.winePrefix / "drive_c", ec)) {
        return LaunchReadinessState::simple(Kind::PrefixNotExists);
    }

    if (auto migration = m_profile.paths.pendingMigration(ctx.gamePath)) {
        return LaunchReadinessState::folderMigrationRequired(std::move(*migration));
    }

    // Game
    ctx.notify(StatusStage::Game);

    auto gameDiff = m_profile.versions->gameDiff(ctx);
    spdlog::debug("Game diff: {}", toString(gameDiff.kind));

    switch (gameDiff.kind) {
        case DiffKind::Latest:
        case DiffKind::Predownload:
            break;
        default:
            return LaunchReadinessState::fromDiff(std::move(gameDiff));
    }

    // Voices
    std::vector<VersionDiff> predownloadVoices;

    for (const auto& locale : ctx.voiceLocales) {
        ctx.notify(StatusStage::Voice, locale);

        auto voiceDiff = m_profile.versions->voiceDiff(ctx, locale);
        if (voiceDiff.locale.empty()) {
            voiceDiff.locale = locale;
        }

        switch (voiceDiff.kind) {
            case DiffKind::Latest:
                break;
            case DiffKind::Predownload:
                predownloadVoices.push_back(std::move(voiceDiff));
                break;
            default:
                return LaunchReadinessState::fromDiff(std::move(voiceDiff));
        }
    }

    // Patches
    ctx.notify(StatusStage::Patch);

    syncPatches(ctx, diagnostics);

    for (const auto& check : m_profile.patchChecks) {
        if (auto state = check->evaluate(ctx, gameDiff)) {
            spdlog::debug("Stopped at {} check", check->name());
            return *state;
        }
    }

    // Telemetry
    ctx.notify(StatusStage::Telemetry);

    if (ctx.telemetryIgnored) {
        spdlog::debug("Telemetry check ignored by user");
    } else if (!telemetryDisabled(ctx)) {
        return LaunchReadinessState::simple(Kind::TelemetryNotDisabled);
    }

    if (gameDiff.kind == DiffKind::Predownload) {
        return LaunchReadinessState::predownloadAvailable(std::move(gameDiff), std::move(predownloadVoices));
    }

    return LaunchReadinessState::launch();
}

} // namespace agl
