/**
 * AGL Core - Runtime Environment
 *
 * Snapshot of the process environment that drives Steam mode detection
 * and path defaults. Computed once at startup and passed explicitly to
 * discovery and the readiness resolver.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace agl {

/**
 * Where the launcher is running
 */
enum class EnvironmentKind {
    Independent,    // Plain desktop session, not started by Steam
    Desktop,        // Started by Steam on a regular desktop
    Deck,           // Started by Steam on a Steam Deck
    OS              // Started by Steam on SteamOS
};

std::string toString(EnvironmentKind kind);

struct WindowSize {
    int width = 0;
    int height = 0;
};

struct RuntimeEnvironment {
    // Boolean signals ("1" = true)
    bool steamEnv = false;      // SteamEnv
    bool steamDeck = false;     // SteamDeck
    bool steamOS = false;       // SteamOS

    // Path signals, empty when unset
    std::filesystem::path home;                 // HOME
    std::filesystem::path xdgDataHome;          // XDG_DATA_HOME
    std::filesystem::path xdgCacheHome;         // XDG_CACHE_HOME
    std::filesystem::path launcherFolder;       // LAUNCHER_FOLDER
    std::filesystem::path cacheFolder;          // CACHE_FOLDER
    std::filesystem::path steamCompatDataPath;  // STEAM_COMPAT_DATA_PATH

    /**
     * Read all signals from the current process environment
     */
    static RuntimeEnvironment fromSystem();

    /**
     * Classify the environment
     *
     * Anything not launched by Steam is Independent. Under Steam the
     * Deck flag wins over the SteamOS flag.
     */
    EnvironmentKind kind() const;

    bool launchedFromSteam() const { return steamEnv; }

    /**
     * Whether runner discovery should prefer Steam-managed Proton
     * over the components catalog
     */
    bool prefersSteamRunners() const { return steamEnv; }

    /**
     * Default game window size for this environment
     */
    WindowSize defaultWindowSize() const;
};

} // namespace agl
