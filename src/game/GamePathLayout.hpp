/**
 * AGL Core - Game Path Layout
 *
 * Default install folders per game edition and legacy folder layouts
 * that must be migrated before the game can be diffed.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/platform/RuntimeEnvironment.hpp"
#include "game/LaunchReadinessState.hpp"

namespace agl {

/**
 * Legacy folder move, paths relative to the game folder
 */
struct FolderMigrationRule {
    std::filesystem::path from;
    std::filesystem::path to;
    std::optional<std::filesystem::path> cleanup;
};

class GamePathLayout {
public:
    GamePathLayout() = default;

    /**
     * Set the folder an edition installs into, under the base install
     * directory
     *
     * @param steamSubfolder Folder the game files sit in below `folder`
     *        when launched from Steam, empty if they sit in `folder`
     */
    GamePathLayout& setEditionFolder(const std::string& edition,
                                     const std::string& folder,
                                     const std::string& steamSubfolder = {});

    GamePathLayout& addMigration(FolderMigrationRule rule);

    /**
     * Get the default game folder for an edition
     *
     * @throws NotFoundError for an edition without a folder
     */
    std::filesystem::path defaultGamePath(const RuntimeEnvironment& env, const std::string& edition) const;

    /**
     * Get the first migration whose source folder exists
     *
     * Only applies to installed games (existing game folder).
     */
    std::optional<FolderMigration> pendingMigration(const std::filesystem::path& gamePath) const;

    const std::vector<FolderMigrationRule>& migrations() const { return m_migrations; }

private:
    struct EditionFolder {
        std::string folder;
        std::string steamSubfolder;
    };

    std::map<std::string, EditionFolder> m_editionFolders;
    std::vector<FolderMigrationRule> m_migrations;
};

} // namespace agl
