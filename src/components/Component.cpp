/**
 * AGL Core - Runtime Components Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Component.hpp"

#include <algorithm>

namespace agl {

std::string toString(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Wine: return "wine";
        case ComponentKind::Dxvk: return "dxvk";
    }
    return "unknown";
}

bool WineFiles::operator==(const WineFiles& other) const {
    return wine == other.wine &&
           wine64 == other.wine64 &&
           wineserver == other.wineserver &&
           wineboot == other.wineboot &&
           winecfg == other.winecfg;
}

std::filesystem::path ComponentVersion::runnerDir(const std::filesystem::path& buildsFolder) const {
    if (managed) {
        return std::filesystem::path(uri);
    }
    return buildsFolder / name;
}

bool ComponentVersion::isDownloadedIn(const std::filesystem::path& folder) const {
    std::error_code ec;
    return std::filesystem::is_directory(folder / name, ec);
}

bool ComponentVersion::operator==(const ComponentVersion& other) const {
    return name == other.name &&
           title == other.title &&
           uri == other.uri &&
           version == other.version &&
           files == other.files &&
           features == other.features &&
           managed == other.managed;
}

bool ComponentGroup::matches(const std::string& name) const {
    return this->name == name || findVersion(name) != nullptr;
}

const ComponentVersion* ComponentGroup::findVersion(const std::string& name) const {
    auto it = std::find_if(versions.begin(), versions.end(),
        [&name](const ComponentVersion& version) { return version.name == name; });

    return it != versions.end() ? &*it : nullptr;
}

Features ComponentGroup::featuresOf(const ComponentVersion& version) const {
    return resolveFeatures(version.features, features);
}

bool ComponentGroup::operator==(const ComponentGroup& other) const {
    return name == other.name &&
           title == other.title &&
           features == other.features &&
           versions == other.versions &&
           managed == other.managed;
}

} // namespace agl
