/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/tool_locator.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <optional>

using namespace mediarun;
using mediarun::test::TempDir;

class ToolLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* current = std::getenv("MEDIARUN_BIN_DIR")) {
            saved_ = current;
        }
        ::setenv("MEDIARUN_BIN_DIR", dir.path().c_str(), 1);
    }

    void TearDown() override {
        if (saved_) {
            ::setenv("MEDIARUN_BIN_DIR", saved_->c_str(), 1);
        } else {
            ::unsetenv("MEDIARUN_BIN_DIR");
        }
    }

    std::filesystem::path makeTool(const std::string& name, bool executable) {
        auto path = dir / name;
        std::ofstream(path) << "#!/bin/sh\n";
        auto perms = executable ? std::filesystem::perms::owner_all : std::filesystem::perms::owner_read;
        std::filesystem::permissions(path, perms);
        return path;
    }

    TempDir dir;

private:
    std::optional<std::string> saved_;
};

TEST_F(ToolLocatorTest, EnvironmentDirectoryComesFirst) {
    auto dirs = bundledToolDirs("mrun");
    ASSERT_FALSE(dirs.empty());
    EXPECT_EQ(dirs.front(), dir.path());
}

TEST_F(ToolLocatorTest, PrefersBundledExecutable) {
    auto tool = makeTool("mediarun-fake-tool", true);
    EXPECT_EQ(resolveToolPath("mediarun-fake-tool", "mrun"), tool);
}

TEST_F(ToolLocatorTest, SkipsNonExecutableFiles) {
    (void)makeTool("mediarun-plain-file", false);
    EXPECT_EQ(resolveToolPath("mediarun-plain-file", "mrun"), std::filesystem::path("mediarun-plain-file"));
}

TEST_F(ToolLocatorTest, FallsBackToBareNameForPathLookup) {
    EXPECT_EQ(resolveToolPath("mediarun-no-such-tool", "mrun"), std::filesystem::path("mediarun-no-such-tool"));
}

TEST_F(ToolLocatorTest, ExplicitPathsAreKept) {
    EXPECT_EQ(resolveToolPath("./tools/ffmpeg", "mrun"), std::filesystem::path("./tools/ffmpeg"));
}
