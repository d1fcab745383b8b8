/**
 * AGL Core - Launch Readiness State Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "LaunchReadinessState.hpp"

#include <stdexcept>
#include <utility>

namespace agl {

LaunchReadinessState LaunchReadinessState::launch() {
    return LaunchReadinessState(Kind::Launch);
}

LaunchReadinessState LaunchReadinessState::predownloadAvailable(VersionDiff game, std::vector<VersionDiff> voices) {
    LaunchReadinessState state(Kind::PredownloadAvailable);
    state.m_diff = std::move(game);
    state.m_voices = std::move(voices);
    return state;
}

LaunchReadinessState LaunchReadinessState::folderMigrationRequired(FolderMigration migration) {
    LaunchReadinessState state(Kind::FolderMigrationRequired);
    state.m_migration = std::move(migration);
    return state;
}

LaunchReadinessState LaunchReadinessState::playerPatchAvailable(PatchDescriptor patch, bool disableMhypbase) {
    LaunchReadinessState state(Kind::PlayerPatchAvailable);
    state.m_patch = std::move(patch);
    state.m_disableMhypbase = disableMhypbase;
    return state;
}

LaunchReadinessState LaunchReadinessState::xluaPatchAvailable(PatchDescriptor patch) {
    LaunchReadinessState state(Kind::XluaPatchAvailable);
    state.m_patch = std::move(patch);
    return state;
}

LaunchReadinessState LaunchReadinessState::patchUpdateAvailable(PatchDescriptor patch) {
    LaunchReadinessState state(Kind::PatchUpdateAvailable);
    state.m_patch = std::move(patch);
    return state;
}

LaunchReadinessState LaunchReadinessState::simple(Kind kind) {
    return LaunchReadinessState(kind);
}

LaunchReadinessState LaunchReadinessState::fromDiff(VersionDiff diff) {
    bool voice = !diff.locale.empty();
    Kind kind;

    switch (diff.kind) {
        case DiffKind::Diff:
            kind = voice ? Kind::VoiceUpdateAvailable : Kind::GameUpdateAvailable;
            break;
        case DiffKind::Outdated:
            kind = voice ? Kind::VoiceOutdated : Kind::GameOutdated;
            break;
        case DiffKind::NotInstalled:
            kind = voice ? Kind::VoiceNotInstalled : Kind::GameNotInstalled;
            break;
        default:
            throw std::invalid_argument("No launch state for a " + toString(diff.kind) + " diff");
    }

    LaunchReadinessState state(kind);
    state.m_diff = std::move(diff);
    return state;
}

std::string LaunchReadinessState::describe() const {
    std::string result = toString(m_kind);

    if (m_diff) {
        if (!m_diff->locale.empty()) {
            result += " [" + m_diff->locale + "]";
        }
        if (!m_diff->currentVersion.empty()) {
            result += " " + m_diff->currentVersion;
        }
        if (m_diff->latestVersion != m_diff->currentVersion) {
            result += " -> " + m_diff->latestVersion;
        }
    }

    if (m_kind == Kind::PredownloadAvailable) {
        result += " (" + std::to_string(m_voices.size()) + " voice package(s))";
    }

    if (m_migration) {
        result += " " + m_migration->from.string() + " -> " + m_migration->to.string();
    }

    if (m_patch) {
        result += " " + toString(m_patch->kind);
        if (!m_patch->version.empty()) {
            result += " " + m_patch->version;
        }
    }

    return result;
}

std::string toString(LaunchReadinessState::Kind kind) {
    using Kind = LaunchReadinessState::Kind;

    switch (kind) {
        case Kind::Launch: return "Launch";
        case Kind::PredownloadAvailable: return "PredownloadAvailable";
        case Kind::FolderMigrationRequired: return "FolderMigrationRequired";
        case Kind::PlayerPatchAvailable: return "PlayerPatchAvailable";
        case Kind::XluaPatchAvailable: return "XluaPatchAvailable";
        case Kind::MfplatPatchAvailable: return "MfplatPatchAvailable";
        case Kind::PatchNotInstalled: return "PatchNotInstalled";
        case Kind::PatchUpdateAvailable: return "PatchUpdateAvailable";
        case Kind::PatchNotVerified: return "PatchNotVerified";
        case Kind::PatchBroken: return "PatchBroken";
        case Kind::PatchUnsafe: return "PatchUnsafe";
        case Kind::PatchConcerning: return "PatchConcerning";
        case Kind::TelemetryNotDisabled: return "TelemetryNotDisabled";
        case Kind::WineNotInstalled: return "WineNotInstalled";
        case Kind::PrefixNotExists: return "PrefixNotExists";
        case Kind::VoiceUpdateAvailable: return "VoiceUpdateAvailable";
        case Kind::VoiceOutdated: return "VoiceOutdated";
        case Kind::VoiceNotInstalled: return "VoiceNotInstalled";
        case Kind::GameUpdateAvailable: return "GameUpdateAvailable";
        case Kind::GameOutdated: return "GameOutdated";
        case Kind::GameNotInstalled: return "GameNotInstalled";
    }
    return "Unknown";
}

} // namespace agl
