/**
 * AGL Core - External Providers
 *
 * Interfaces to the collaborators the readiness resolver queries:
 * version diffing, patch mirrors, the wrapper patch and telemetry
 * DNS probes. Implementations live outside this library.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "game/CheckContext.hpp"
#include "game/PatchDescriptor.hpp"
#include "game/VersionDiff.hpp"

namespace agl {

constexpr std::chrono::seconds TELEMETRY_CHECK_TIMEOUT{3};
constexpr std::chrono::seconds PATCH_FETCHING_TIMEOUT{5};

class GameVersionProvider {
public:
    virtual ~GameVersionProvider() = default;

    virtual VersionDiff gameDiff(const CheckContext& ctx) = 0;

    /**
     * Diff of an installed or missing voice package
     *
     * The result is expected to carry the locale.
     */
    virtual VersionDiff voiceDiff(const CheckContext& ctx, const std::string& locale) = 0;
};

/**
 * Local patch cache synced from mirror servers
 */
class PatchRepository {
public:
    virtual ~PatchRepository() = default;

    /**
     * Get the server the local cache is in sync with, if any
     */
    virtual std::optional<std::string> syncedRemote(const std::vector<std::string>& servers) = 0;

    /**
     * Sync the local cache from a server
     *
     * @throws std::exception on failure
     */
    virtual void sync(const std::string& server) = 0;

    virtual PatchDescriptor patch(PatchKind kind, const CheckContext& ctx) = 0;

    virtual bool isApplied(const PatchDescriptor& patch, const CheckContext& ctx) = 0;
};

/**
 * Remote metadata of the wrapper patch
 */
struct WrapperMetadata {
    std::string latestVersion;
    // Game version -> patch status for it
    std::map<std::string, PatchStatus> gameStatus;

    /**
     * Get the patch status for a game version
     *
     * Versions the metadata doesn't list are unverified.
     */
    PatchStatus statusFor(const std::string& gameVersion) const {
        auto it = gameStatus.find(gameVersion);
        return it != gameStatus.end() ? it->second : PatchStatus::Unverified;
    }
};

class WrapperPatchSource {
public:
    virtual ~WrapperPatchSource() = default;

    virtual bool isInstalled(const std::filesystem::path& patchFolder) = 0;

    virtual std::string installedVersion(const std::filesystem::path& patchFolder) = 0;

    virtual WrapperMetadata fetchMetadata(std::chrono::seconds timeout) = 0;
};

class TelemetryProvider {
public:
    virtual ~TelemetryProvider() = default;

    /**
     * Resolve the game's telemetry domains
     *
     * @return First domain that resolved, nullopt if none did
     * @throws std::exception if the lookup itself failed
     */
    virtual std::optional<std::string> resolvedDomain(const std::string& edition,
                                                      std::chrono::seconds timeout) = 0;
};

} // namespace agl
