/**
 * AGL Core - Game Path Layout Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "GamePathLayout.hpp"

#include "core/Errors.hpp"
#include "core/platform/Platform.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace agl {

GamePathLayout& GamePathLayout::setEditionFolder(const std::string& edition,
                                                 const std::string& folder,
                                                 const std::string& steamSubfolder) {
    m_editionFolders[edition] = EditionFolder{folder, steamSubfolder};
    return *this;
}

GamePathLayout& GamePathLayout::addMigration(FolderMigrationRule rule) {
    m_migrations.push_back(std::move(rule));
    return *this;
}

std::filesystem::path GamePathLayout::defaultGamePath(const RuntimeEnvironment& env,
                                                      const std::string& edition) const {
    auto it = m_editionFolders.find(edition);
    if (it == m_editionFolders.end()) {
        throw NotFoundError("No install folder known for edition \"" + edition + "\"");
    }

    auto base = Platform::getBaseInstallPath(env, Platform::getLauncherPath(env));
    auto path = base / it->second.folder;

    if (env.launchedFromSteam() && !it->second.steamSubfolder.empty()) {
        path /= it->second.steamSubfolder;
    }

    return path;
}

std::optional<FolderMigration> GamePathLayout::pendingMigration(const std::filesystem::path& gamePath) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(gamePath, ec)) {
        return std::nullopt;
    }

    for (const auto& rule : m_migrations) {
        auto from = gamePath / rule.from;
        if (!std::filesystem::exists(from, ec)) {
            continue;
        }

        spdlog::debug("Legacy folder {} needs migrating", from.string());

        FolderMigration migration;
        migration.from = from;
        migration.to = gamePath / rule.to;
        if (rule.cleanup) {
            migration.cleanup = gamePath / *rule.cleanup;
        }
        return migration;
    }

    return std::nullopt;
}

} // namespace agl
