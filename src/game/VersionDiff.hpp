/**
 * AGL Core - Version Diff
 *
 * Installed-vs-latest status of a game or voice package, as reported
 * by a game version provider.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace agl {

enum class DiffKind {
    Latest,         // Installed and up to date
    Predownload,    // Up to date, next version can be downloaded early
    Diff,           // Update available as a diff
    Outdated,       // Too old to be updated, needs a reinstall
    NotInstalled
};

std::string toString(DiffKind kind);

struct VersionDiff {
    DiffKind kind = DiffKind::NotInstalled;

    std::string currentVersion;     // Empty when not installed
    std::string latestVersion;
    std::optional<uint64_t> downloadSize;

    // Voice package locale, empty for the game itself
    std::string locale;

    static VersionDiff latest(const std::string& version);
    static VersionDiff predownload(const std::string& current, const std::string& next,
                                   std::optional<uint64_t> size = std::nullopt);
    static VersionDiff diff(const std::string& current, const std::string& latest,
                            std::optional<uint64_t> size = std::nullopt);
    static VersionDiff outdated(const std::string& current, const std::string& latest);
    static VersionDiff notInstalled(const std::string& latest,
                                    std::optional<uint64_t> size = std::nullopt);

    /**
     * Copy of this diff tagged with a voice locale
     */
    VersionDiff forLocale(const std::string& voiceLocale) const;

    bool operator==(const VersionDiff& other) const;
    bool operator!=(const VersionDiff& other) const { return !(*this == other); }
};

} // namespace agl
