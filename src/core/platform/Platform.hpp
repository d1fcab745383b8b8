/**
 * AGL Core - Platform Paths
 *
 * Launcher data, cache and config locations, plus the base directory
 * games get installed into when running inside a Steam compat prefix.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "core/platform/RuntimeEnvironment.hpp"

namespace agl {

/**
 * Folder name used under the XDG data and cache roots
 */
constexpr const char* DEFAULT_FOLDER_NAME = "agl-launcher";

class Platform {
public:
    /**
     * Get the launcher data directory
     *
     * $LAUNCHER_FOLDER if set, otherwise $XDG_DATA_HOME/<folder>,
     * otherwise $HOME/.local/share/<folder>
     */
    static std::filesystem::path getLauncherPath(const RuntimeEnvironment& env,
                                                 const std::string& folderName = DEFAULT_FOLDER_NAME);

    /**
     * Get the launcher cache directory
     *
     * $CACHE_FOLDER if set, otherwise $XDG_CACHE_HOME/<folder>,
     * otherwise $HOME/.cache/<folder>
     */
    static std::filesystem::path getCachePath(const RuntimeEnvironment& env,
                                              const std::string& folderName = DEFAULT_FOLDER_NAME);

    /**
     * Get the config file path (<launcher dir>/config.json)
     */
    static std::filesystem::path getConfigFile(const RuntimeEnvironment& env,
                                               const std::string& folderName = DEFAULT_FOLDER_NAME);

    /**
     * Get the C: drive of the Steam compat prefix we were started in
     *
     * @return $STEAM_COMPAT_DATA_PATH/pfx/drive_c if it exists
     */
    static std::optional<std::filesystem::path> getCompatDataDriveRoot(const RuntimeEnvironment& env);

    /**
     * Get the directory games should be installed into
     *
     * Independent launches use the launcher directory. Steam launches
     * prefer the compat prefix C: drive so the game lives inside the
     * prefix Proton runs it from.
     */
    static std::filesystem::path getBaseInstallPath(const RuntimeEnvironment& env,
                                                    const std::filesystem::path& launcherPath);
};

} // namespace agl
