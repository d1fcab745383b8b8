/**
 * AGL Core - Runtime Environment and Platform Path Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "test_helpers.hpp"

#include <cstdlib>

#include "core/platform/Platform.hpp"
#include "core/platform/RuntimeEnvironment.hpp"

using agl::EnvironmentKind;
using agl::Platform;
using agl::RuntimeEnvironment;

namespace {

RuntimeEnvironment flags(bool steamEnv, bool steamDeck, bool steamOS) {
    RuntimeEnvironment env;
    env.steamEnv = steamEnv;
    env.steamDeck = steamDeck;
    env.steamOS = steamOS;
    return env;
}

} // anonymous namespace

TEST(RuntimeEnvironmentTest, IndependentUnlessLaunchedFromSteam) {
    EXPECT_EQ(flags(false, false, false).kind(), EnvironmentKind::Independent);
    EXPECT_EQ(flags(false, true, true).kind(), EnvironmentKind::Independent);
}

TEST(RuntimeEnvironmentTest, ClassifiesSteamLaunches) {
    EXPECT_EQ(flags(true, false, false).kind(), EnvironmentKind::Desktop);
    EXPECT_EQ(flags(true, true, false).kind(), EnvironmentKind::Deck);
    EXPECT_EQ(flags(true, false, true).kind(), EnvironmentKind::OS);
    // Deck wins over SteamOS
    EXPECT_EQ(flags(true, true, true).kind(), EnvironmentKind::Deck);
}

TEST(RuntimeEnvironmentTest, DefaultWindowSizeFitsDeckScreen) {
    auto deck = flags(true, true, false).defaultWindowSize();
    EXPECT_EQ(deck.width, 1280);
    EXPECT_EQ(deck.height, 800);

    auto desktop = flags(false, true, false).defaultWindowSize();
    EXPECT_EQ(desktop.width, 1920);
    EXPECT_EQ(desktop.height, 1080);
}

TEST(RuntimeEnvironmentTest, PrefersSteamRunnersOnlyUnderSteam) {
    EXPECT_TRUE(flags(true, false, false).prefersSteamRunners());
    EXPECT_FALSE(flags(false, false, false).prefersSteamRunners());
}

class RuntimeEnvironmentSystemTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"SteamEnv", "SteamDeck", "SteamOS", "LAUNCHER_FOLDER", "STEAM_COMPAT_DATA_PATH"}) {
            unsetenv(name);
        }
    }
};

TEST_F(RuntimeEnvironmentSystemTest, ReadsProcessEnvironment) {
    setenv("SteamEnv", "1", 1);
    setenv("SteamDeck", "0", 1);
    setenv("SteamOS", "1", 1);
    setenv("LAUNCHER_FOLDER", "/opt/launcher", 1);
    setenv("STEAM_COMPAT_DATA_PATH", "", 1);

    auto env = RuntimeEnvironment::fromSystem();

    EXPECT_TRUE(env.steamEnv);
    EXPECT_FALSE(env.steamDeck);
    EXPECT_TRUE(env.steamOS);
    EXPECT_EQ(env.kind(), EnvironmentKind::OS);
    EXPECT_EQ(env.launcherFolder, std::filesystem::path("/opt/launcher"));
    EXPECT_TRUE(env.steamCompatDataPath.empty());
}

TEST_F(RuntimeEnvironmentSystemTest, OnlyOneMeansTrue) {
    setenv("SteamEnv", "true", 1);
    EXPECT_FALSE(RuntimeEnvironment::fromSystem().steamEnv);
}

class PlatformPathsTest : public TempDirTest {};

TEST_F(PlatformPathsTest, LauncherFolderOverridesEverything) {
    RuntimeEnvironment env;
    env.home = "/home/user";
    env.xdgDataHome = "/data";
    env.launcherFolder = "/custom";

    EXPECT_EQ(Platform::getLauncherPath(env), std::filesystem::path("/custom"));
    EXPECT_EQ(Platform::getConfigFile(env), std::filesystem::path("/custom/config.json"));
}

TEST_F(PlatformPathsTest, FallsBackThroughXdgAndHome) {
    RuntimeEnvironment env;
    env.home = "/home/user";

    EXPECT_EQ(Platform::getLauncherPath(env), std::filesystem::path("/home/user/.local/share/agl-launcher"));
    EXPECT_EQ(Platform::getCachePath(env), std::filesystem::path("/home/user/.cache/agl-launcher"));

    env.xdgDataHome = "/data";
    env.xdgCacheHome = "/cache";

    EXPECT_EQ(Platform::getLauncherPath(env), std::filesystem::path("/data/agl-launcher"));
    EXPECT_EQ(Platform::getCachePath(env, "other"), std::filesystem::path("/cache/other"));

    env.cacheFolder = "/tmp/agl-cache";
    EXPECT_EQ(Platform::getCachePath(env), std::filesystem::path("/tmp/agl-cache"));
}

TEST_F(PlatformPathsTest, CompatDriveRootMustExist) {
    RuntimeEnvironment env;
    EXPECT_FALSE(Platform::getCompatDataDriveRoot(env).has_value());

    env.steamCompatDataPath = testDir / "compatdata";
    EXPECT_FALSE(Platform::getCompatDataDriveRoot(env).has_value());

    auto drive = makeDir("compatdata/pfx/drive_c");
    EXPECT_EQ(Platform::getCompatDataDriveRoot(env), std::optional<std::filesystem::path>(drive));
}

TEST_F(PlatformPathsTest, SteamLaunchesInstallIntoCompatPrefix) {
    auto launcher = testDir / "launcher";
    auto drive = makeDir("compatdata/pfx/drive_c");

    RuntimeEnvironment env;
    env.steamCompatDataPath = testDir / "compatdata";

    EXPECT_EQ(Platform::getBaseInstallPath(env, launcher), launcher);

    env.steamEnv = true;
    EXPECT_EQ(Platform::getBaseInstallPath(env, launcher), drive);

    std::filesystem::remove_all(testDir / "compatdata");
    EXPECT_EQ(Platform::getBaseInstallPath(env, launcher), launcher);
}
