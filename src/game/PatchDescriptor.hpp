/**
 * AGL Core - Patch Descriptor
 *
 * A game patch the user may apply before launching.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace agl {

enum class PatchKind {
    Player,     // Game binary compatibility patch
    Xlua,       // Scripting engine patch
    Mfplat,     // Media Foundation libraries in the wine prefix
    Wrapper     // Anti-cheat wrapper launched around the game (jadeite)
};

/**
 * Patch state for a particular game version
 */
enum class PatchStatus {
    Verified,
    Unverified,
    Broken,
    Unsafe,
    Concerning
};

std::string toString(PatchKind kind);
std::string toString(PatchStatus status);

struct PatchDescriptor {
    PatchKind kind = PatchKind::Player;
    std::string version;
    PatchStatus status = PatchStatus::Unverified;
    // Game folder or wine prefix the patch applies to
    std::filesystem::path target;

    bool operator==(const PatchDescriptor& other) const {
        return kind == other.kind && version == other.version &&
               status == other.status && target == other.target;
    }
};

} // namespace agl
