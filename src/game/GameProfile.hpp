/**
 * AGL Core - Game Profile
 *
 * Per-game capabilities the readiness resolver is parameterized by.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "game/GamePathLayout.hpp"
#include "game/PatchChecks.hpp"
#include "game/Providers.hpp"

namespace agl {

struct GameProfile {
    std::string name;

    // Required
    std::shared_ptr<GameVersionProvider> versions;

    // Patch cache synced from CheckContext::patchServers, may be null
    std::shared_ptr<PatchRepository> patches;

    // Run in order after the patch cache sync
    std::vector<std::shared_ptr<PatchCheck>> patchChecks;

    GamePathLayout paths;
};

} // namespace agl
