/**
 * AGL Core - Runtime Environment Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "RuntimeEnvironment.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

namespace agl {

namespace {

bool envFlag(const char* name) {
    const char* value = std::getenv(name);
    return value && std::string(value) == "1";
}

std::filesystem::path envPath(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return std::filesystem::path(value);
    }
    return {};
}

} // anonymous namespace

std::string toString(EnvironmentKind kind) {
    switch (kind) {
        case EnvironmentKind::Independent: return "Independent";
        case EnvironmentKind::Desktop:     return "Desktop";
        case EnvironmentKind::Deck:        return "Deck";
        case EnvironmentKind::OS:          return "OS";
    }
    return "Unknown";
}

RuntimeEnvironment RuntimeEnvironment::fromSystem() {
    RuntimeEnvironment env;

    env.steamEnv = envFlag("SteamEnv");
    env.steamDeck = envFlag("SteamDeck");
    env.steamOS = envFlag("SteamOS");

    env.home = envPath("HOME");
    env.xdgDataHome = envPath("XDG_DATA_HOME");
    env.xdgCacheHome = envPath("XDG_CACHE_HOME");
    env.launcherFolder = envPath("LAUNCHER_FOLDER");
    env.cacheFolder = envPath("CACHE_FOLDER");
    env.steamCompatDataPath = envPath("STEAM_COMPAT_DATA_PATH");

    spdlog::debug("Runtime environment: {} (SteamEnv={}, SteamDeck={}, SteamOS={})",
        toString(env.kind()), env.steamEnv, env.steamDeck, env.steamOS);

    return env;
}

EnvironmentKind RuntimeEnvironment::kind() const {
    if (!steamEnv) {
        return EnvironmentKind::Independent;
    }
    if (steamDeck) {
        return EnvironmentKind::Deck;
    }
    if (steamOS) {
        return EnvironmentKind::OS;
    }
    return EnvironmentKind::Desktop;
}

WindowSize RuntimeEnvironment::defaultWindowSize() const {
    if (kind() == EnvironmentKind::Deck) {
        return {1280, 800};
    }
    return {1920, 1080};
}

} // namespace agl
