/**
 * AGL Core - Steam Library
 *
 * Locates the local Steam install and the library folders it manages.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "core/platform/RuntimeEnvironment.hpp"

namespace agl {

class SteamLibrary {
public:
    explicit SteamLibrary(std::filesystem::path root);

    /**
     * Find the Steam install of the current user
     *
     * Checks ~/.steam/steam, ~/.steam/root, ~/.local/share/Steam and the
     * Flatpak Steam locations. A candidate counts only if it has a
     * steamapps folder.
     *
     * @return Located install, or nullopt if Steam isn't installed
     */
    static std::optional<SteamLibrary> locate(const RuntimeEnvironment& env);

    const std::filesystem::path& root() const { return m_root; }

    /**
     * Get all library folders
     *
     * Parses steamapps/libraryfolders.vdf for "path" entries. The Steam
     * root is always the first library.
     */
    std::vector<std::filesystem::path> libraryFolders() const;

    /**
     * Get the folder custom compatibility tools are installed into
     */
    std::filesystem::path compatToolsPath() const;

    /**
     * Get every folder that may contain Proton builds
     *
     * compatibilitytools.d first, then each library's steamapps/common.
     */
    std::vector<std::filesystem::path> protonSearchRoots() const;

private:
    std::filesystem::path m_root;
};

} // namespace agl
