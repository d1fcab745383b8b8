/**
 * AGL Core - Steam Library Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SteamLibrary.hpp"

#include <algorithm>
#include <fstream>
#include <regex>

#include <spdlog/spdlog.h>

namespace agl {

SteamLibrary::SteamLibrary(std::filesystem::path root)
    : m_root(std::move(root))
{
}

std::optional<SteamLibrary> SteamLibrary::locate(const RuntimeEnvironment& env) {
    if (env.home.empty()) {
        spdlog::warn("HOME environment variable not set, can't locate Steam");
        return std::nullopt;
    }

    std::vector<std::filesystem::path> candidates = {
        env.home / ".steam/steam",
        env.home / ".steam/root",
        env.home / ".local/share/Steam",
        // Flatpak Steam
        env.home / ".var/app/com.valvesoftware.Steam/.steam/steam",
        env.home / ".var/app/com.valvesoftware.Steam/.local/share/Steam",
    };

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_directory(candidate / "steamapps", ec)) {
            auto root = std::filesystem::weakly_canonical(candidate, ec);
            if (ec) {
                root = candidate;
            }
            spdlog::debug("Found Steam install: {}", root.string());
            return SteamLibrary(root);
        }
    }

    spdlog::debug("Steam install not found under {}", env.home.string());
    return std::nullopt;
}

std::vector<std::filesystem::path> SteamLibrary::libraryFolders() const {
    std::vector<std::filesystem::path> libraries = {m_root};

    auto vdfPath = m_root / "steamapps" / "libraryfolders.vdf";
    std::error_code existsEc;
    if (!std::filesystem::exists(vdfPath, existsEc)) {
        return libraries;
    }

    try {
        std::ifstream file(vdfPath);
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        // Simple VDF parser - look for "path" entries
        // Format: "path"		"/path/to/library"
        std::regex pathRegex("\"path\"\\s+\"([^\"]+)\"");
        std::smatch match;
        std::string::const_iterator searchStart(content.cbegin());

        while (std::regex_search(searchStart, content.cend(), match, pathRegex)) {
            std::filesystem::path libPath = match[1].str();
            std::error_code ec;
            auto canonical = std::filesystem::weakly_canonical(libPath, ec);
            if (!ec) {
                libPath = canonical;
            }

            bool known = std::find(libraries.begin(), libraries.end(), libPath) != libraries.end();
            if (!known && std::filesystem::exists(libPath / "steamapps", ec)) {
                libraries.push_back(libPath);
                spdlog::debug("Found Steam library: {}", libPath.string());
            }
            searchStart = match.suffix().first;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Error parsing {}: {}", vdfPath.string(), e.what());
    }

    return libraries;
}

std::filesystem::path SteamLibrary::compatToolsPath() const {
    return m_root / "compatibilitytools.d";
}

std::vector<std::filesystem::path> SteamLibrary::protonSearchRoots() const {
    std::vector<std::filesystem::path> roots = {compatToolsPath()};

    for (const auto& library : libraryFolders()) {
        roots.push_back(library / "steamapps" / "common");
    }

    return roots;
}

} // namespace agl
