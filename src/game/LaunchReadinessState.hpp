/**
 * AGL Core - Launch Readiness State
 *
 * What the user has to do next before the game can be launched.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "game/PatchDescriptor.hpp"
#include "game/VersionDiff.hpp"

namespace agl {

/**
 * Legacy game folder that must be moved before the game can be diffed
 */
struct FolderMigration {
    std::filesystem::path from;
    std::filesystem::path to;
    // Folder left empty by the move, removed afterwards
    std::optional<std::filesystem::path> cleanup;

    bool operator==(const FolderMigration& other) const {
        return from == other.from && to == other.to && cleanup == other.cleanup;
    }
};

/**
 * Launch readiness state
 *
 * Immutable; build one with the static factories.
 */
class LaunchReadinessState {
public:
    enum class Kind {
        Launch,
        PredownloadAvailable,       // diff() is the game, voices() the voices

        FolderMigrationRequired,    // migration()

        PlayerPatchAvailable,       // patch(), disableMhypbase()
        XluaPatchAvailable,         // patch()
        MfplatPatchAvailable,

        PatchNotInstalled,
        PatchUpdateAvailable,       // patch() holds the available version
        PatchNotVerified,
        PatchBroken,
        PatchUnsafe,
        PatchConcerning,

        TelemetryNotDisabled,

        WineNotInstalled,
        PrefixNotExists,

        VoiceUpdateAvailable,       // diff()
        VoiceOutdated,
        VoiceNotInstalled,

        GameUpdateAvailable,        // diff()
        GameOutdated,
        GameNotInstalled
    };

    static LaunchReadinessState launch();
    static LaunchReadinessState predownloadAvailable(VersionDiff game, std::vector<VersionDiff> voices);
    static LaunchReadinessState folderMigrationRequired(FolderMigration migration);
    static LaunchReadinessState playerPatchAvailable(PatchDescriptor patch, bool disableMhypbase);
    static LaunchReadinessState xluaPatchAvailable(PatchDescriptor patch);
    static LaunchReadinessState patchUpdateAvailable(PatchDescriptor patch);

    /**
     * Any state that carries no payload
     */
    static LaunchReadinessState simple(Kind kind);

    /**
     * Game or voice state for a diff
     *
     * Kind follows from the diff (Diff, Outdated, NotInstalled) and
     * whether it has a voice locale.
     */
    static LaunchReadinessState fromDiff(VersionDiff diff);

    Kind kind() const { return m_kind; }

    bool canLaunch() const { return m_kind == Kind::Launch; }

    const std::optional<VersionDiff>& diff() const { return m_diff; }
    const std::vector<VersionDiff>& voices() const { return m_voices; }
    const std::optional<FolderMigration>& migration() const { return m_migration; }
    const std::optional<PatchDescriptor>& patch() const { return m_patch; }
    bool disableMhypbase() const { return m_disableMhypbase; }

    /**
     * Human readable summary for logs
     */
    std::string describe() const;

private:
    explicit LaunchReadinessState(Kind kind) : m_kind(kind) {}

    Kind m_kind;
    std::optional<VersionDiff> m_diff;
    std::vector<VersionDiff> m_voices;
    std::optional<FolderMigration> m_migration;
    std::optional<PatchDescriptor> m_patch;
    bool m_disableMhypbase = false;
};

std::string toString(LaunchReadinessState::Kind kind);

} // namespace agl
