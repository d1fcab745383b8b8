/**
 * AGL Core - Runner Features
 *
 * Per-group and per-version runtime configuration of a runner build:
 * environment, launch command template, prefix layout and bundle kind.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace agl {

/**
 * Runner bundle kind
 */
enum class BundleKind {
    Proton
};

/**
 * Runtime features of a runner build
 *
 * Template placeholders accepted by `command` and `env` values:
 * - %build%    - path to the runner build
 * - %prefix%   - path to the wine prefix
 * - %temp%     - path to the temp folder
 * - %launcher% - path to the launcher folder
 * - %game%     - path to the game
 */
struct Features {
    std::optional<BundleKind> bundle;

    // Whether builds with these features need DXVK installed
    bool needDxvk = true;

    // Launch through a temporary batch file instead of passing flags
    // directly. Needed when `command` can't handle multiline arguments.
    bool compactLaunch = false;

    // Prefix subfolder the runner actually uses (Proton uses "pfx")
    std::optional<std::string> prefixSubdir;

    // Command used to launch the game
    std::optional<std::string> command;

    // Environment applied when the game launches
    std::map<std::string, std::string> env;

    /**
     * Parse features from a catalog entry
     *
     * Never fails: unknown or mistyped fields keep their defaults.
     */
    static Features fromJson(const nlohmann::json& value);
    nlohmann::json toJson() const;

    bool operator==(const Features& other) const;
    bool operator!=(const Features& other) const { return !(*this == other); }
};

/**
 * Resolve effective features of a version
 *
 * Version-level features replace group-level features entirely; the two
 * are never merged field by field. Falls back to the group's features,
 * then to Features{}.
 */
Features resolveFeatures(const std::optional<Features>& versionFeatures,
                         const std::optional<Features>& groupFeatures);

} // namespace agl
