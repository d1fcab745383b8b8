/**
 * AGL Core - Runner Layout Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "RunnerLayout.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

namespace agl {

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::string toString(RunnerKind kind) {
    switch (kind) {
        case RunnerKind::Wine: return "wine";
        case RunnerKind::Proton: return "proton";
    }
    return "unknown";
}

std::string toString(WineArch arch) {
    switch (arch) {
        case WineArch::Win32: return "win32";
        case WineArch::Win64: return "win64";
    }
    return "unknown";
}

RunnerLayout RunnerLayout::resolve(const ComponentVersion& version,
                                   const Features& features,
                                   const std::filesystem::path& buildsFolder) {
    if (!version.files) {
        throw NotFoundError("Runner " + version.name + " has no wine binaries listed");
    }

    const auto& files = *version.files;

    RunnerLayout layout;
    layout.buildDir = version.runnerDir(buildsFolder);
    layout.features = features;

    if (features.bundle == BundleKind::Proton) {
        layout.kind = RunnerKind::Proton;
    }

    if (files.wine64) {
        layout.arch = WineArch::Win64;
        layout.wine = layout.buildDir / *files.wine64;
    } else {
        layout.wine = layout.buildDir / files.wine;
    }

    if (files.wineboot) {
        layout.wineboot = layout.buildDir / *files.wineboot;
        if (endsWith(*files.wineboot, ".exe")) {
            layout.bootKind = WineBootKind::Windows;
        }
    }

    if (files.wineserver) {
        layout.wineserver = layout.buildDir / *files.wineserver;
    }

    if (files.winecfg) {
        layout.winecfg = layout.buildDir / *files.winecfg;
    }

    spdlog::debug("Runner {}: {} {} at {}", version.name,
        toString(layout.kind), toString(layout.arch), layout.buildDir.string());

    return layout;
}

std::filesystem::path RunnerLayout::prefixPath(const std::filesystem::path& basePrefix) const {
    if (features.prefixSubdir) {
        return basePrefix / *features.prefixSubdir;
    }
    return basePrefix;
}

} // namespace agl
