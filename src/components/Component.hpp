/**
 * AGL Core - Runtime Components
 *
 * Wine-family runner and DXVK builds as listed in the components
 * catalog or discovered from a Steam install.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "components/Features.hpp"

namespace agl {

/**
 * Component kind, also the catalog index key and versions subfolder
 */
enum class ComponentKind {
    Wine,
    Dxvk
};

std::string toString(ComponentKind kind);

/**
 * Binary layout of a wine build, relative to the build folder
 */
struct WineFiles {
    std::string wine;
    std::optional<std::string> wine64;
    std::optional<std::string> wineserver;
    std::optional<std::string> wineboot;
    std::optional<std::string> winecfg;

    bool operator==(const WineFiles& other) const;
};

struct ComponentVersion {
    std::string name;       // Unique within the group, on-disk folder name
    std::string title;
    std::string uri;        // Download artifact, or install path when managed

    // DXVK release version (e.g. "2.3"), empty for wine builds
    std::string version;

    // Present for wine builds only
    std::optional<WineFiles> files;

    std::optional<Features> features;

    // Owned by an external manager (Steam); `uri` is a local path
    bool managed = false;

    /**
     * Get the folder this build lives in
     *
     * Managed builds live at their uri, others at <buildsFolder>/<name>.
     */
    std::filesystem::path runnerDir(const std::filesystem::path& buildsFolder) const;

    /**
     * Check if this build has a folder in the given directory
     */
    bool isDownloadedIn(const std::filesystem::path& folder) const;

    bool operator==(const ComponentVersion& other) const;
};

struct ComponentGroup {
    std::string name;       // Unique within its kind
    std::string title;
    std::optional<Features> features;
    std::vector<ComponentVersion> versions;

    // Group is owned by an external manager (Steam)
    bool managed = false;

    /**
     * Check whether a name addresses this group or one of its versions
     */
    bool matches(const std::string& name) const;

    /**
     * Find a version of this group by name
     */
    const ComponentVersion* findVersion(const std::string& name) const;

    /**
     * Effective features of one of this group's versions
     */
    Features featuresOf(const ComponentVersion& version) const;

    bool operator==(const ComponentGroup& other) const;
};

} // namespace agl
