/**
 * AGL Core - Platform Paths Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Platform.hpp"

#include <spdlog/spdlog.h>

namespace agl {

std::filesystem::path Platform::getLauncherPath(const RuntimeEnvironment& env,
                                                const std::string& folderName) {
    if (!env.launcherFolder.empty()) {
        return env.launcherFolder;
    }

    if (!env.xdgDataHome.empty()) {
        return env.xdgDataHome / folderName;
    }

    if (!env.home.empty()) {
        return env.home / ".local" / "share" / folderName;
    }

    return std::filesystem::path(".local/share") / folderName;
}

std::filesystem::path Platform::getCachePath(const RuntimeEnvironment& env,
                                             const std::string& folderName) {
    if (!env.cacheFolder.empty()) {
        return env.cacheFolder;
    }

    if (!env.xdgCacheHome.empty()) {
        return env.xdgCacheHome / folderName;
    }

    if (!env.home.empty()) {
        return env.home / ".cache" / folderName;
    }

    return std::filesystem::path(".cache") / folderName;
}

std::filesystem::path Platform::getConfigFile(const RuntimeEnvironment& env,
                                              const std::string& folderName) {
    return getLauncherPath(env, folderName) / "config.json";
}

std::optional<std::filesystem::path> Platform::getCompatDataDriveRoot(const RuntimeEnvironment& env) {
    if (env.steamCompatDataPath.empty()) {
        return std::nullopt;
    }

    auto driveRoot = env.steamCompatDataPath / "pfx" / "drive_c";

    std::error_code ec;
    if (!std::filesystem::is_directory(driveRoot, ec)) {
        spdlog::debug("Steam compat prefix has no C: drive yet: {}", driveRoot.string());
        return std::nullopt;
    }

    return driveRoot;
}

std::filesystem::path Platform::getBaseInstallPath(const RuntimeEnvironment& env,
                                                   const std::filesystem::path& launcherPath) {
    if (!env.launchedFromSteam()) {
        return launcherPath;
    }

    if (auto driveRoot = getCompatDataDriveRoot(env)) {
        return *driveRoot;
    }

    return launcherPath;
}

} // namespace agl
