/**
 * AGL Core - Version Diff Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "VersionDiff.hpp"

namespace agl {

std::string toString(DiffKind kind) {
    switch (kind) {
        case DiffKind::Latest: return "latest";
        case DiffKind::Predownload: return "predownload";
        case DiffKind::Diff: return "diff";
        case DiffKind::Outdated: return "outdated";
        case DiffKind::NotInstalled: return "not installed";
    }
    return "unknown";
}

VersionDiff VersionDiff::latest(const std::string& version) {
    VersionDiff result;
    result.kind = DiffKind::Latest;
    result.currentVersion = version;
    result.latestVersion = version;
    return result;
}

VersionDiff VersionDiff::predownload(const std::string& current, const std::string& next,
                                     std::optional<uint64_t> size) {
    VersionDiff result;
    result.kind = DiffKind::Predownload;
    result.currentVersion = current;
    result.latestVersion = next;
    result.downloadSize = size;
    return result;
}

VersionDiff VersionDiff::diff(const std::string& current, const std::string& latest,
                              std::optional<uint64_t> size) {
    VersionDiff result;
    result.kind = DiffKind::Diff;
    result.currentVersion = current;
    result.latestVersion = latest;
    result.downloadSize = size;
    return result;
}

VersionDiff VersionDiff::outdated(const std::string& current, const std::string& latest) {
    VersionDiff result;
    result.kind = DiffKind::Outdated;
    result.currentVersion = current;
    result.latestVersion = latest;
    return result;
}

VersionDiff VersionDiff::notInstalled(const std::string& latest, std::optional<uint64_t> size) {
    VersionDiff result;
    result.kind = DiffKind::NotInstalled;
    result.latestVersion = latest;
    result.downloadSize = size;
    return result;
}

VersionDiff VersionDiff::forLocale(const std::string& voiceLocale) const {
    VersionDiff result = *this;
    result.locale = voiceLocale;
    return result;
}

bool VersionDiff::operator==(const VersionDiff& other) const {
    return kind == other.kind &&
           currentVersion == other.currentVersion &&
           latestVersion == other.latestVersion &&
           downloadSize == other.downloadSize &&
           locale == other.locale;
}

} // namespace agl
