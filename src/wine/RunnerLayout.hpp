/**
 * AGL Core - Runner Layout
 *
 * Concrete binaries and prefix location of a selected runner build.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "components/Component.hpp"
#include "components/Features.hpp"

namespace agl {

/**
 * How a runner is driven
 */
enum class RunnerKind {
    Wine,       // Plain wine binaries
    Proton      // Proton bundle, launched through its script
};

/**
 * Architecture of the wine prefix a runner creates
 */
enum class WineArch {
    Win32,
    Win64
};

/**
 * How wineboot is invoked
 */
enum class WineBootKind {
    Unix,       // Shell script run directly
    Windows     // wineboot.exe run through wine
};

std::string toString(RunnerKind kind);
std::string toString(WineArch arch);

/**
 * Resolved layout of a runner build
 */
struct RunnerLayout {
    RunnerKind kind = RunnerKind::Wine;
    WineArch arch = WineArch::Win32;
    WineBootKind bootKind = WineBootKind::Unix;

    std::filesystem::path buildDir;
    std::filesystem::path wine;                 // wine64 if available
    std::optional<std::filesystem::path> wineboot;
    std::optional<std::filesystem::path> wineserver;
    std::optional<std::filesystem::path> winecfg;

    Features features;

    /**
     * Resolve a runner version into binaries and features
     *
     * Managed builds live at their uri, others at <buildsFolder>/<name>.
     *
     * @throws NotFoundError if the version carries no wine binary layout
     */
    static RunnerLayout resolve(const ComponentVersion& version,
                                const Features& features,
                                const std::filesystem::path& buildsFolder);

    /**
     * Get the prefix path the runner actually uses
     *
     * Appends the features' prefix subfolder (Proton's "pfx") if set.
     */
    std::filesystem::path prefixPath(const std::filesystem::path& basePrefix) const;
};

} // namespace agl
