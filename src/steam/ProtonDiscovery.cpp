/**
 * AGL Core - Steam Proton Discovery Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ProtonDiscovery.hpp"

#include "core/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

namespace agl {

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

} // anonymous namespace

std::optional<ProtonVersionInfo> parseProtonVersion(const std::string& contents) {
    auto text = trim(contents);
    auto separator = text.find_first_of(" \t");
    if (separator == std::string::npos) {
        return std::nullopt;
    }

    ProtonVersionInfo info;
    info.buildId = text.substr(0, separator);
    info.name = trim(text.substr(separator + 1));

    if (info.buildId.empty() || info.name.empty()) {
        return std::nullopt;
    }

    return info;
}

ProtonDiscovery::ProtonDiscovery(RuntimeEnvironment env)
    : m_env(std::move(env))
{
}

Features ProtonDiscovery::protonFeatures(const std::filesystem::path& steamRoot) {
    Features features;
    features.bundle = BundleKind::Proton;
    features.needDxvk = false;
    features.compactLaunch = true;
    features.command = "python3 '%build%/proton' waitforexitandrun";
    features.prefixSubdir = "pfx";
    features.env = {
        {"STEAM_COMPAT_DATA_PATH", "%prefix%"},
        {"STEAM_COMPAT_CLIENT_INSTALL_PATH", steamRoot.string()},
        {"SteamAppId", "0"}
    };
    return features;
}

std::vector<std::filesystem::path> ProtonDiscovery::findProtonBuilds(const SteamLibrary& library) const {
    std::vector<std::filesystem::path> builds;

    for (const auto& root : library.protonSearchRoots()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            continue;
        }

        std::vector<std::filesystem::path> found;
        try {
            for (const auto& entry : std::filesystem::directory_iterator(root)) {
                const auto& path = entry.path();

                // Symlinked builds are duplicates of something we already scan
                if (entry.is_symlink() || !entry.is_directory()) {
                    continue;
                }

                if (std::filesystem::exists(path / "proton", ec)) {
                    found.push_back(path);
                }
            }
        } catch (const std::filesystem::filesystem_error& e) {
            spdlog::warn("Error scanning {}: {}", root.string(), e.what());
        }

        // directory_iterator order is unspecified
        std::sort(found.begin(), found.end());
        builds.insert(builds.end(), found.begin(), found.end());
    }

    return builds;
}

std::optional<ComponentVersion> ProtonDiscovery::readProtonBuild(const std::filesystem::path& path) const {
    std::ifstream file(path / "version");
    if (!file) {
        spdlog::debug("Proton at {} has no readable version file. Skipping.", path.string());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto info = parseProtonVersion(buffer.str());
    if (!info) {
        spdlog::debug("Proton at {} is so old the version file doesn't follow the format. Skipping.",
            path.string());
        return std::nullopt;
    }

    ComponentVersion version;
    version.name = info->name;
    version.title = path.filename().string();
    version.uri = path.string();
    version.files = WineFiles{
        "files/bin/wine",
        std::string("files/bin/wine64"),
        std::string("files/bin/wineserver"),
        std::nullopt,
        std::string("files/lib64/wine/x86_64-windows/winecfg.exe")
    };
    version.managed = true;

    return version;
}

std::vector<ComponentGroup> ProtonDiscovery::discoverProtonInstalls() const {
    auto library = SteamLibrary::locate(m_env);

    if (!library) {
        if (m_env.launchedFromSteam()) {
            throw DiscoveryError("Launched from Steam but the Steam install could not be located");
        }
        spdlog::debug("Steam is not installed, no Proton builds to discover");
        return {};
    }

    ComponentGroup group;
    group.name = STEAM_PROTON_GROUP;
    group.title = "Proton Runners via Steam";
    group.features = protonFeatures(library->root());
    group.managed = true;

    for (const auto& path : findProtonBuilds(*library)) {
        if (auto version = readProtonBuild(path)) {
            spdlog::debug("Found Proton build {} at {}", version->name, path.string());
            group.versions.push_back(std::move(*version));
        }
    }

    spdlog::info("Discovered {} Steam-managed Proton build(s)", group.versions.size());

    return {group};
}

std::optional<std::vector<std::filesystem::path>> ProtonDiscovery::installedProtonPaths() const {
    if (!m_env.launchedFromSteam()) {
        return std::nullopt;
    }

    auto library = SteamLibrary::locate(m_env);
    if (!library) {
        return std::nullopt;
    }

    return findProtonBuilds(*library);
}

bool ProtonDiscovery::isValidSelectedRunner(const std::string& name) const {
    try {
        for (const auto& group : discoverProtonInstalls()) {
            if (group.findVersion(name)) {
                return true;
            }
        }
    } catch (const DiscoveryError& e) {
        spdlog::warn("Can't validate runner {}: {}", name, e.what());
    }
    return false;
}

} // namespace agl
