/**
 * AGL Core - Test Helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

/**
 * Fixture with a fresh temp directory per test
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        testDir = std::filesystem::temp_directory_path() /
            (std::string("agl-core-test-") + info->test_suite_name() + "-" + info->name());
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        // Clean up test directory
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path writeFile(const std::filesystem::path& relative, const std::string& content) {
        auto path = testDir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path makeDir(const std::filesystem::path& relative) {
        auto path = testDir / relative;
        std::filesystem::create_directories(path);
        return path;
    }

    /**
     * Create a Proton build folder with a `proton` script and, unless
     * empty, a `version` file
     */
    std::filesystem::path makeProtonBuild(const std::filesystem::path& relative,
                                          const std::string& versionContents) {
        auto build = makeDir(relative);
        writeFile(relative / "proton", "#!/usr/bin/env python3\n");
        if (!versionContents.empty()) {
            writeFile(relative / "version", versionContents);
        }
        return build;
    }

    std::filesystem::path testDir;
};
