/**
 * AGL Core - Patch Checks Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PatchChecks.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace agl {

namespace {

std::vector<long> versionParts(const std::string& version) {
    std::vector<long> parts;
    std::stringstream stream(version);
    std::string item;

    while (std::getline(stream, item, '.')) {
        long value = 0;
        for (char c : item) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                break;
            }
            value = value * 10 + (c - '0');
        }
        parts.push_back(value);
    }

    return parts;
}

} // anonymous namespace

int compareVersions(const std::string& a, const std::string& b) {
    auto left = versionParts(a);
    auto right = versionParts(b);
    size_t count = std::max(left.size(), right.size());

    for (size_t i = 0; i < count; ++i) {
        long l = i < left.size() ? left[i] : 0;
        long r = i < right.size() ? right[i] : 0;
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }

    return 0;
}

PlayerPatchCheck::PlayerPatchCheck(std::shared_ptr<PatchRepository> repository)
    : m_repository(std::move(repository))
{
}

std::optional<LaunchReadinessState> PlayerPatchCheck::evaluate(const CheckContext& ctx,
                                                               const VersionDiff& /*gameDiff*/) {
    if (!ctx.patch.applyPlayerPatch) {
        return std::nullopt;
    }

    auto patch = m_repository->patch(PatchKind::Player, ctx);
    if (m_repository->isApplied(patch, ctx)) {
        return std::nullopt;
    }

    spdlog::debug("Player patch {} is not applied to {}", patch.version, ctx.gamePath.string());
    return LaunchReadinessState::playerPatchAvailable(std::move(patch), ctx.patch.disableMhypbase);
}

XluaPatchCheck::XluaPatchCheck(std::shared_ptr<PatchRepository> repository)
    : m_repository(std::move(repository))
{
}

std::optional<LaunchReadinessState> XluaPatchCheck::evaluate(const CheckContext& ctx,
                                                             const VersionDiff& /*gameDiff*/) {
    if (!ctx.patch.applyXluaPatch) {
        return std::nullopt;
    }

    auto patch = m_repository->patch(PatchKind::Xlua, ctx);
    if (m_repository->isApplied(patch, ctx)) {
        return std::nullopt;
    }

    return LaunchReadinessState::xluaPatchAvailable(std::move(patch));
}

MfplatPatchCheck::MfplatPatchCheck(std::shared_ptr<PatchRepository> repository)
    : m_repository(std::move(repository))
{
}

std::optional<LaunchReadinessState> MfplatPatchCheck::evaluate(const CheckContext& ctx,
                                                               const VersionDiff& /*gameDiff*/) {
    if (!ctx.patch.applyMfplat) {
        return std::nullopt;
    }

    auto patch = m_repository->patch(PatchKind::Mfplat, ctx);
    if (m_repository->isApplied(patch, ctx)) {
        return std::nullopt;
    }

    return LaunchReadinessState::simple(LaunchReadinessState::Kind::MfplatPatchAvailable);
}

WrapperPatchCheck::WrapperPatchCheck(std::shared_ptr<WrapperPatchSource> source)
    : m_source(std::move(source))
{
}

std::optional<LaunchReadinessState> WrapperPatchCheck::evaluate(const CheckContext& ctx,
                                                                const VersionDiff& gameDiff) {
    using Kind = LaunchReadinessState::Kind;

    if (!m_source->isInstalled(ctx.patchFolder)) {
        return LaunchReadinessState::simple(Kind::PatchNotInstalled);
    }

    auto metadata = m_source->fetchMetadata(PATCH_FETCHING_TIMEOUT);
    auto installed = m_source->installedVersion(ctx.patchFolder);

    if (compareVersions(metadata.latestVersion, installed) > 0) {
        spdlog::info("Wrapper patch update available: {} -> {}", installed, metadata.latestVersion);

        PatchDescriptor patch;
        patch.kind = PatchKind::Wrapper;
        patch.version = metadata.latestVersion;
        patch.status = metadata.statusFor(gameDiff.currentVersion);
        patch.target = ctx.patchFolder;
        return LaunchReadinessState::patchUpdateAvailable(std::move(patch));
    }

    switch (metadata.statusFor(gameDiff.currentVersion)) {
        case PatchStatus::Verified:
            return std::nullopt;
        case PatchStatus::Unverified:
            return LaunchReadinessState::simple(Kind::PatchNotVerified);
        case PatchStatus::Broken:
            return LaunchReadinessState::simple(Kind::PatchBroken);
        case PatchStatus::Unsafe:
            return LaunchReadinessState::simple(Kind::PatchUnsafe);
        case PatchStatus::Concerning:
            return LaunchReadinessState::simple(Kind::PatchConcerning);
    }

    return std::nullopt;
}

} // namespace agl
