/**
 * AGL Core - Steam Proton Discovery
 *
 * Finds Proton builds installed through Steam and exposes them as one
 * externally managed runner group, bypassing the components catalog.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "components/Component.hpp"
#include "core/platform/RuntimeEnvironment.hpp"
#include "steam/SteamLibrary.hpp"

namespace agl {

/**
 * Name of the synthesized runner group
 */
constexpr const char* STEAM_PROTON_GROUP = "steam-proton";

/**
 * Contents of a Proton build's `version` file
 *
 * Format: "<build-id> <name>", e.g. "1697568410 proton-8.0-4"
 */
struct ProtonVersionInfo {
    std::string buildId;
    std::string name;
};

/**
 * Split a `version` file at its first space
 *
 * @return nullopt if there is no separator or nothing after it
 */
std::optional<ProtonVersionInfo> parseProtonVersion(const std::string& contents);

class ProtonDiscovery {
public:
    explicit ProtonDiscovery(RuntimeEnvironment env);

    /**
     * Enumerate installed Proton builds as runner groups
     *
     * Scans compatibilitytools.d and every library's steamapps/common for
     * real (non-symlink) directories holding a `proton` script. Builds
     * whose `version` file is unreadable or malformed are skipped.
     *
     * @return Exactly one managed group named STEAM_PROTON_GROUP. Empty
     *         when Steam isn't installed and we weren't launched from it.
     * @throws DiscoveryError if launched from Steam but Steam's install
     *         can't be located
     */
    std::vector<ComponentGroup> discoverProtonInstalls() const;

    /**
     * Get candidate Proton build folders
     *
     * @return nullopt unless launched from Steam with a locatable install
     */
    std::optional<std::vector<std::filesystem::path>> installedProtonPaths() const;

    /**
     * Check if a runner name matches a discovered Proton build
     */
    bool isValidSelectedRunner(const std::string& name) const;

    /**
     * Features shared by every Steam-managed Proton build
     */
    static Features protonFeatures(const std::filesystem::path& steamRoot);

    const RuntimeEnvironment& environment() const { return m_env; }

private:
    std::vector<std::filesystem::path> findProtonBuilds(const SteamLibrary& library) const;
    std::optional<ComponentVersion> readProtonBuild(const std::filesystem::path& path) const;

    RuntimeEnvironment m_env;
};

} // namespace agl
