/**
 * AGL Core - Patch Check and Launch State Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "fake_providers.hpp"

#include <memory>

#include "game/LaunchReadinessState.hpp"
#include "game/PatchChecks.hpp"

using agl::LaunchReadinessState;
using agl::PatchStatus;
using agl::VersionDiff;

using Kind = LaunchReadinessState::Kind;

TEST(VersionCompareTest, ComparesNumerically) {
    EXPECT_GT(agl::compareVersions("1.10.0", "1.9.2"), 0);
    EXPECT_LT(agl::compareVersions("3.0.9", "3.0.10"), 0);
    EXPECT_EQ(agl::compareVersions("3.0", "3.0.0"), 0);
    EXPECT_EQ(agl::compareVersions("v", ""), 0);
    EXPECT_GT(agl::compareVersions("3.1-rc1", "3.0.5"), 0);
}

class WrapperPatchCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx.patchFolder = "/data/patch";
        ctx.gamePath = "/games/test";
    }

    std::optional<LaunchReadinessState> evaluate() {
        agl::WrapperPatchCheck check(source);
        return check.evaluate(ctx, gameDiff);
    }

    std::shared_ptr<FakeWrapperSource> source = std::make_shared<FakeWrapperSource>();
    agl::CheckContext ctx;
    VersionDiff gameDiff = VersionDiff::latest("4.2.0");
};

TEST_F(WrapperPatchCheckTest, VerifiedPatchPasses) {
    EXPECT_FALSE(evaluate().has_value());
    EXPECT_EQ(source->lastTimeout, agl::PATCH_FETCHING_TIMEOUT);
}

TEST_F(WrapperPatchCheckTest, NotInstalledStopsBeforeFetching) {
    source->installed = false;

    auto state = evaluate();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->kind(), Kind::PatchNotInstalled);
    EXPECT_EQ(source->metadataCalls, 0);
}

TEST_F(WrapperPatchCheckTest, NewerRemoteVersionIsUpdate) {
    source->metadata.latestVersion = "3.1.0";

    auto state = evaluate();
    ASSERT_TRUE(state.has_value());
    ASSERT_EQ(state->kind(), Kind::PatchUpdateAvailable);
    EXPECT_EQ(state->patch()->kind, agl::PatchKind::Wrapper);
    EXPECT_EQ(state->patch()->version, "3.1.0");
    EXPECT_EQ(state->patch()->target, ctx.patchFolder);
}

TEST_F(WrapperPatchCheckTest, OlderRemoteVersionIsNotUpdate) {
    source->version = "3.2.0";
    EXPECT_FALSE(evaluate().has_value());
}

TEST_F(WrapperPatchCheckTest, StatusMapsToState) {
    const std::pair<PatchStatus, Kind> cases[] = {
        {PatchStatus::Unverified, Kind::PatchNotVerified},
        {PatchStatus::Broken, Kind::PatchBroken},
        {PatchStatus::Unsafe, Kind::PatchUnsafe},
        {PatchStatus::Concerning, Kind::PatchConcerning},
    };

    for (const auto& [status, kind] : cases) {
        source->metadata.gameStatus["4.2.0"] = status;

        auto state = evaluate();
        ASSERT_TRUE(state.has_value()) << agl::toString(status);
        EXPECT_EQ(state->kind(), kind) << agl::toString(status);
    }
}

TEST_F(WrapperPatchCheckTest, UnlistedGameVersionIsUnverified) {
    gameDiff = VersionDiff::predownload("4.3.0", "4.4.0");

    auto state = evaluate();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->kind(), Kind::PatchNotVerified);
}

class RepositoryPatchCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx.gamePath = "/games/test";
        ctx.winePrefix = "/data/prefix";
        repository->applied.clear();
    }

    std::shared_ptr<FakePatchRepository> repository = std::make_shared<FakePatchRepository>();
    agl::CheckContext ctx;
    VersionDiff gameDiff = VersionDiff::latest("4.2.0");
};

TEST_F(RepositoryPatchCheckTest, DisabledChecksDoNotTouchRepository) {
    agl::PlayerPatchCheck player(repository);
    agl::XluaPatchCheck xlua(repository);
    agl::MfplatPatchCheck mfplat(repository);

    EXPECT_FALSE(player.evaluate(ctx, gameDiff).has_value());
    EXPECT_FALSE(xlua.evaluate(ctx, gameDiff).has_value());
    EXPECT_FALSE(mfplat.evaluate(ctx, gameDiff).has_value());
    EXPECT_EQ(repository->patchCalls, 0);
}

TEST_F(RepositoryPatchCheckTest, MfplatTargetsPrefix) {
    ctx.patch.applyMfplat = true;

    auto state = agl::MfplatPatchCheck(repository).evaluate(ctx, gameDiff);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->kind(), Kind::MfplatPatchAvailable);

    repository->applied.insert(agl::PatchKind::Mfplat);
    EXPECT_FALSE(agl::MfplatPatchCheck(repository).evaluate(ctx, gameDiff).has_value());
}

TEST_F(RepositoryPatchCheckTest, PlayerPatchCarriesMhypbaseToggle) {
    ctx.patch.applyPlayerPatch = true;

    auto state = agl::PlayerPatchCheck(repository).evaluate(ctx, gameDiff);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->kind(), Kind::PlayerPatchAvailable);
    EXPECT_FALSE(state->disableMhypbase());
    EXPECT_EQ(state->patch()->version, "4.2.0");
}

TEST(LaunchReadinessStateTest, DiffStatesDependOnLocale) {
    EXPECT_EQ(LaunchReadinessState::fromDiff(VersionDiff::diff("1", "2")).kind(), Kind::GameUpdateAvailable);
    EXPECT_EQ(LaunchReadinessState::fromDiff(VersionDiff::outdated("1", "3")).kind(), Kind::GameOutdated);
    EXPECT_EQ(LaunchReadinessState::fromDiff(VersionDiff::notInstalled("3")).kind(), Kind::GameNotInstalled);

    auto voice = VersionDiff::diff("1", "2").forLocale("ko-kr");
    EXPECT_EQ(LaunchReadinessState::fromDiff(voice).kind(), Kind::VoiceUpdateAvailable);
    EXPECT_EQ(LaunchReadinessState::fromDiff(VersionDiff::outdated("1", "3").forLocale("ko-kr")).kind(),
              Kind::VoiceOutdated);
    EXPECT_EQ(LaunchReadinessState::fromDiff(VersionDiff::notInstalled("3").forLocale("ko-kr")).kind(),
              Kind::VoiceNotInstalled);
}

TEST(LaunchReadinessStateTest, UpToDateDiffHasNoState) {
    EXPECT_THROW(LaunchReadinessState::fromDiff(VersionDiff::latest("1")), std::invalid_argument);
    EXPECT_THROW(LaunchReadinessState::fromDiff(VersionDiff::predownload("1", "2")), std::invalid_argument);
}

TEST(LaunchReadinessStateTest, DescribesPayload) {
    auto state = LaunchReadinessState::fromDiff(VersionDiff::diff("4.1.0", "4.2.0").forLocale("en-us"));
    EXPECT_EQ(state.describe(), "VoiceUpdateAvailable [en-us] 4.1.0 -> 4.2.0");

    EXPECT_EQ(LaunchReadinessState::launch().describe(), "Launch");
    EXPECT_EQ(LaunchReadinessState::simple(Kind::TelemetryNotDisabled).describe(), "TelemetryNotDisabled");
}
