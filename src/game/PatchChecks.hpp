/**
 * AGL Core - Patch Checks
 *
 * Game-specific patch state checks run by the readiness resolver after
 * the patch cache has been synced. Each game profile lists the checks
 * that apply to it, in order.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "game/CheckContext.hpp"
#include "game/LaunchReadinessState.hpp"
#include "game/Providers.hpp"
#include "game/VersionDiff.hpp"

namespace agl {

/**
 * Patch check interface
 */
class PatchCheck {
public:
    virtual ~PatchCheck() = default;

    virtual std::string name() const = 0;

    /**
     * Evaluate the check
     *
     * @param gameDiff Game diff, Latest or Predownload
     * @return State to stop at, or nullopt to continue
     */
    virtual std::optional<LaunchReadinessState> evaluate(const CheckContext& ctx,
                                                         const VersionDiff& gameDiff) = 0;
};

/**
 * Game binary compatibility patch, if enabled in the context
 */
class PlayerPatchCheck : public PatchCheck {
public:
    explicit PlayerPatchCheck(std::shared_ptr<PatchRepository> repository);

    std::string name() const override { return "player patch"; }
    std::optional<LaunchReadinessState> evaluate(const CheckContext& ctx,
                                                 const VersionDiff& gameDiff) override;

private:
    std::shared_ptr<PatchRepository> m_repository;
};

/**
 * Scripting engine patch, if enabled in the context
 */
class XluaPatchCheck : public PatchCheck {
public:
    explicit XluaPatchCheck(std::shared_ptr<PatchRepository> repository);

    std::string name() const override { return "xlua patch"; }
    std::optional<LaunchReadinessState> evaluate(const CheckContext& ctx,
                                                 const VersionDiff& gameDiff) override;

private:
    std::shared_ptr<PatchRepository> m_repository;
};

/**
 * Media Foundation libraries in the wine prefix, if enabled
 */
class MfplatPatchCheck : public PatchCheck {
public:
    explicit MfplatPatchCheck(std::shared_ptr<PatchRepository> repository);

    std::string name() const override { return "mfplat patch"; }
    std::optional<LaunchReadinessState> evaluate(const CheckContext& ctx,
                                                 const VersionDiff& gameDiff) override;

private:
    std::shared_ptr<PatchRepository> m_repository;
};

/**
 * Anti-cheat wrapper patch
 *
 * Must be installed, up to date, and verified for the installed game
 * version. Fetches remote metadata with PATCH_FETCHING_TIMEOUT.
 */
class WrapperPatchCheck : public PatchCheck {
public:
    explicit WrapperPatchCheck(std::shared_ptr<WrapperPatchSource> source);

    std::string name() const override { return "wrapper patch"; }
    std::optional<LaunchReadinessState> evaluate(const CheckContext& ctx,
                                                 const VersionDiff& gameDiff) override;

private:
    std::shared_ptr<WrapperPatchSource> m_source;
};

/**
 * Compare dotted version strings numerically ("1.10.0" > "1.9.2")
 *
 * Missing components count as 0, non-numeric suffixes are ignored.
 *
 * @return <0, 0 or >0
 */
int compareVersions(const std::string& a, const std::string& b);

} // namespace agl
