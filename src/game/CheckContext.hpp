/**
 * AGL Core - Check Context
 *
 * Everything the readiness resolver needs to know about the user's
 * setup. Assembled right before a resolve() call and dropped after.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agl {

/**
 * Runner picked in the launcher settings
 */
struct SelectedRunner {
    std::string name;
    // Steam-managed Proton, prefix and install are owned by Steam
    bool managed = false;
};

/**
 * Resolver stage being entered
 */
enum class StatusStage {
    Game,
    Voice,
    Patch,
    Telemetry
};

std::string toString(StatusStage stage);

struct StatusUpdate {
    StatusStage stage;
    std::string locale;     // Voice stage only
};

/**
 * Status callback type
 *
 * Notification only; must return quickly.
 */
using StatusCallback = std::function<void(const StatusUpdate&)>;

/**
 * Per-game patch toggles
 */
struct PatchOptions {
    bool applyPlayerPatch = false;
    bool applyXluaPatch = false;
    bool applyMfplat = false;
    bool disableMhypbase = false;
};

struct CheckContext {
    std::filesystem::path winePrefix;
    std::optional<SelectedRunner> runner;
    // Where unmanaged runners are downloaded to, if known
    std::optional<std::filesystem::path> runnerBuildsFolder;

    std::filesystem::path gamePath;
    std::string edition;

    std::vector<std::string> voiceLocales;

    std::vector<std::string> patchServers;
    std::filesystem::path patchFolder;
    PatchOptions patch;

    bool telemetryIgnored = false;

    StatusCallback statusUpdater;

    void notify(StatusStage stage, const std::string& locale = {}) const {
        if (statusUpdater) {
            statusUpdater(StatusUpdate{stage, locale});
        }
    }
};

} // namespace agl
