/**
 * AGL Core - Runner Features Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "components/Component.hpp"
#include "components/Features.hpp"

using agl::BundleKind;
using agl::Features;

class FeaturesTest : public ::testing::Test {
protected:
    const char* sampleFeatures = R"({
        "bundle": "Proton",
        "need_dxvk": false,
        "compact_launch": true,
        "prefix_subdir": "pfx",
        "command": "python3 '%build%/proton' waitforexitandrun",
        "env": {
            "STEAM_COMPAT_DATA_PATH": "%prefix%",
            "PROTON_LOG": 1
        }
    })";
};

TEST_F(FeaturesTest, ParsesAllFields) {
    auto features = Features::fromJson(nlohmann::json::parse(sampleFeatures));

    EXPECT_EQ(features.bundle, BundleKind::Proton);
    EXPECT_FALSE(features.needDxvk);
    EXPECT_TRUE(features.compactLaunch);
    EXPECT_EQ(features.prefixSubdir, std::optional<std::string>("pfx"));
    EXPECT_EQ(features.command, std::optional<std::string>("python3 '%build%/proton' waitforexitandrun"));
    ASSERT_EQ(features.env.size(), 2u);
    EXPECT_EQ(features.env.at("STEAM_COMPAT_DATA_PATH"), "%prefix%");
}

TEST_F(FeaturesTest, KeepsNonStringEnvValuesAsJsonText) {
    auto features = Features::fromJson(nlohmann::json::parse(sampleFeatures));
    EXPECT_EQ(features.env.at("PROTON_LOG"), "1");
}

TEST_F(FeaturesTest, MistypedFieldsFallBackToDefaults) {
    auto features = Features::fromJson(nlohmann::json::parse(R"({
        "bundle": "Wine",
        "need_dxvk": "no",
        "compact_launch": 1,
        "prefix_subdir": 42,
        "env": ["A=B"],
        "unknown": true
    })"));

    EXPECT_EQ(features, Features{});
}

TEST_F(FeaturesTest, NonObjectGivesDefaults) {
    EXPECT_EQ(Features::fromJson(nlohmann::json::array()), Features{});
    EXPECT_EQ(Features::fromJson(nlohmann::json()), Features{});
}

TEST_F(FeaturesTest, DefaultsNeedDxvk) {
    Features features;
    EXPECT_TRUE(features.needDxvk);
    EXPECT_FALSE(features.compactLaunch);
    EXPECT_FALSE(features.bundle.has_value());
    EXPECT_FALSE(features.command.has_value());
    EXPECT_TRUE(features.env.empty());
}

TEST_F(FeaturesTest, JsonRoundTripPreservesFeatures) {
    auto features = Features::fromJson(nlohmann::json::parse(sampleFeatures));
    EXPECT_EQ(Features::fromJson(features.toJson()), features);
}

class FeatureResolutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        versionFeatures.needDxvk = false;
        versionFeatures.env = {{"VERSION", "1"}};

        groupFeatures.compactLaunch = true;
        groupFeatures.command = "%build%/run";
        groupFeatures.env = {{"GROUP", "1"}};
    }

    Features versionFeatures;
    Features groupFeatures;
};

TEST_F(FeatureResolutionTest, VersionFeaturesReplaceGroupFeatures) {
    auto resolved = agl::resolveFeatures(versionFeatures, groupFeatures);

    EXPECT_EQ(resolved, versionFeatures);
    // Nothing leaks in from the group
    EXPECT_FALSE(resolved.command.has_value());
    EXPECT_FALSE(resolved.compactLaunch);
    EXPECT_EQ(resolved.env.count("GROUP"), 0u);
}

TEST_F(FeatureResolutionTest, FallsBackToGroupFeatures) {
    EXPECT_EQ(agl::resolveFeatures(std::nullopt, groupFeatures), groupFeatures);
}

TEST_F(FeatureResolutionTest, FallsBackToDefaults) {
    auto resolved = agl::resolveFeatures(std::nullopt, std::nullopt);

    EXPECT_EQ(resolved, Features{});
    EXPECT_TRUE(resolved.needDxvk);
}

TEST_F(FeatureResolutionTest, GroupResolvesItsVersions) {
    agl::ComponentGroup group;
    group.name = "lutris";
    group.features = groupFeatures;

    agl::ComponentVersion plain;
    plain.name = "lutris-7.2";

    agl::ComponentVersion custom;
    custom.name = "lutris-8.0";
    custom.features = versionFeatures;

    group.versions = {plain, custom};

    EXPECT_EQ(group.featuresOf(plain), groupFeatures);
    EXPECT_EQ(group.featuresOf(custom), versionFeatures);
}
