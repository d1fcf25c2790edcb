/*
 * mediarun - Supervised External Tool Jobs
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediarun/resolver.hpp"
#include "test_support.hpp"
#include <fstream>
#include <gtest/gtest.h>

using namespace mediarun;
using mediarun::test::TempDir;

namespace {

void touch(const std::filesystem::path& path) {
    std::ofstream out(path);
    out << "data";
}

WaitResult exitedWith(int code) {
    WaitResult result;
    result.ok = true;
    result.status.exitCode = code;
    return result;
}

}

class CompletionResolverTest : public ::testing::Test {
protected:
    TempDir dir;
    CompletionResolver resolver;
    DiagnosticBuffer diagnostics;
};

TEST_F(CompletionResolverTest, RecordedRegularFileWins) {
    auto file = dir / "final.mp4";
    touch(file);
    JobRequest request;
    request.outputDirectory = dir.path();
    EXPECT_EQ(CompletionResolver::resolveOutputPath(file, request), file);
}

TEST_F(CompletionResolverTest, RebuildsPathFromHints) {
    touch(dir / "my_clip.mp4");
    JobRequest request;
    request.outputDirectory = dir.path();
    request.fileNameHint = "my.clip";
    request.expectedExtension = ".mp4";
    EXPECT_EQ(CompletionResolver::resolveOutputPath(dir / "my.clip.f137.mp4", request), dir / "my_clip.mp4");
}

TEST_F(CompletionResolverTest, FallsBackToStemMatch) {
    touch(dir / "my_clip.webm");
    touch(dir / "other.mp4");
    JobRequest request;
    request.outputDirectory = dir.path();
    request.fileNameHint = "my.clip";
    request.expectedExtension = "mp4";
    EXPECT_EQ(CompletionResolver::resolveOutputPath(std::nullopt, request), dir / "my_clip.webm");
}

TEST_F(CompletionResolverTest, DefaultStemWithoutHint) {
    JobRequest request;
    EXPECT_EQ(CompletionResolver::expectedStem(request), "downloaded_file");

    touch(dir / "downloaded_file.mp3");
    request.outputDirectory = dir.path();
    request.expectedExtension = "mp3";
    EXPECT_EQ(CompletionResolver::resolveOutputPath(std::nullopt, request), dir / "downloaded_file.mp3");
}

TEST_F(CompletionResolverTest, DirectoryDerivedFromRecordedPath) {
    touch(dir / "song.m4a");
    JobRequest request;
    request.fileNameHint = "song";
    request.expectedExtension = "mp3";
    EXPECT_EQ(CompletionResolver::resolveOutputPath(dir / "song.mp3", request), dir / "song.m4a");
}

TEST_F(CompletionResolverTest, UnresolvedPathIsReturnedUnchanged) {
    JobRequest request;
    request.outputDirectory = dir.path();
    request.fileNameHint = "missing";
    request.expectedExtension = "mp4";
    EXPECT_EQ(CompletionResolver::resolveOutputPath(dir / "missing.mp4", request), dir / "missing.mp4");
    EXPECT_EQ(CompletionResolver::resolveOutputPath(std::nullopt, request), dir.path());
}

TEST_F(CompletionResolverTest, SuccessfulExit) {
    auto file = dir / "out.mp4";
    touch(file);
    auto outcome = resolver.resolve(false, exitedWith(0), file, JobRequest{}, diagnostics);
    ASSERT_TRUE(outcome.isSucceeded());
    EXPECT_EQ(outcome.outputPath, file);
    EXPECT_TRUE(std::filesystem::exists(file));
}

TEST_F(CompletionResolverTest, CancellationOverridesSuccessAndRemovesOutput) {
    auto file = dir / "partial.mp4";
    touch(file);
    auto outcome = resolver.resolve(true, exitedWith(0), file, JobRequest{}, diagnostics);
    EXPECT_TRUE(outcome.isCancelled());
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(CompletionResolverTest, FailureCarriesExitCodeAndDiagnostics) {
    diagnostics.append("  in.mov: No such file or directory  ");
    auto outcome = resolver.resolve(false, exitedWith(1), std::nullopt, JobRequest{}, diagnostics);
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.exitCode, 1);
    EXPECT_EQ(outcome.diagnosticText, "in.mov: No such file or directory");
}

TEST_F(CompletionResolverTest, SignalledProcessFails) {
    WaitResult killed;
    killed.ok = true;
    killed.status.signaled = true;
    killed.status.signal = 9;
    killed.status.exitCode = 137;
    auto outcome = resolver.resolve(false, killed, std::nullopt, JobRequest{}, diagnostics);
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.exitCode, 137);
}

TEST_F(CompletionResolverTest, LostProcessFails) {
    WaitResult lost;
    lost.error = "waitpid failed: No child processes";
    auto outcome = resolver.resolve(false, lost, std::nullopt, JobRequest{}, diagnostics);
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.exitCode, -1);
    EXPECT_EQ(outcome.diagnosticText, lost.error);
}

TEST_F(CompletionResolverTest, RemovePartialOutputIsIdempotent) {
    auto file = dir / "partial.part";
    touch(file);
    EXPECT_TRUE(CompletionResolver::removePartialOutput(file));
    EXPECT_FALSE(CompletionResolver::removePartialOutput(file));
    EXPECT_FALSE(CompletionResolver::removePartialOutput(std::nullopt));
    EXPECT_FALSE(CompletionResolver::removePartialOutput(dir.path()));
    EXPECT_TRUE(std::filesystem::exists(dir.path()));
}
