/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/process.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace subfetch;
using subfetch::test::TempDir;

namespace {

std::filesystem::path writeScript(const TempDir& dir, const std::string& name, const std::string& body) {
    auto path = dir.touch(name, "#!/bin/sh\n" + body + "\n");
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

}

TEST(RunProcess, CapturesStdoutAndExitCode) {
    ProcessResult result = runProcess("echo", {"hello", "world"});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.out, "hello world\n");
    EXPECT_TRUE(result.err.empty());
}

TEST(RunProcess, CapturesStderrSeparately) {
    ProcessResult result = runProcess("sh", {"-c", "echo out; echo err >&2; exit 3"});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
}

TEST(RunProcess, MissingProgramIsNotLaunched) {
    ProcessResult result = runProcess("subfetch-definitely-not-installed", {"--version"});
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.error.empty());
}

TEST(RunProcess, AddsEnvironmentOverrides) {
    ProcessResult result = runProcess("sh", {"-c", "echo \"$SUBFETCH_TEST_VAR:$DEBIAN_FRONTEND\""},
                                      {{"SUBFETCH_TEST_VAR", "value"}});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.out, "value:noninteractive\n");
}

TEST(RunProcess, StdinIsClosed) {
    ProcessResult result = runProcess("cat", {});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_TRUE(result.out.empty());
}

TEST(RunProcess, SignalledChildReportsShellStyleCode) {
    ProcessResult result = runProcess("sh", {"-c", "kill -TERM $$"});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.exitCode, 128 + 15);
}

TEST(RunProcess, LargeOutputDoesNotDeadlock) {
    ProcessResult result = runProcess("sh", {"-c", "i=0; while [ $i -lt 2000 ]; do echo 0123456789abcdef0123456789abcdef; echo e >&2; i=$((i+1)); done"});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.out.size(), 2000u * 33u);
    EXPECT_EQ(result.err.size(), 2000u * 2u);
}

TEST(RunProcess, PathOverrideIsUsedForLookup) {
    TempDir dir;
    writeScript(dir, "subfetch-override-tool", "echo from-override");

    ProcessResult result = runProcess("subfetch-override-tool", {}, {{"PATH", dir.path().string()}});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.out, "from-override\n");
}

TEST(RunProcess, SkipsNonExecutableCandidates) {
    TempDir first;
    TempDir second;
    first.touch("subfetch-shadowed-tool", "not a program");
    writeScript(second, "subfetch-shadowed-tool", "echo second");

    ProcessResult result = runProcess("subfetch-shadowed-tool", {},
                                      {{"PATH", first.path().string() + ":" + second.path().string()}});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_EQ(result.out, "second\n");
}

TEST(SearchPath, AddedDirectoryIsSearchedAndInherited) {
    TempDir dir;
    writeScript(dir, "subfetch-added-dir-tool", "echo \"$PATH\"");

    EXPECT_FALSE(runProcess("subfetch-added-dir-tool", {}).launched);

    ASSERT_TRUE(addSearchDirectory(dir.path().string()));
    EXPECT_FALSE(addSearchDirectory(dir.path().string()));

    ProcessResult result = runProcess("subfetch-added-dir-tool", {});
    ASSERT_TRUE(result.launched) << result.error;
    EXPECT_NE(result.out.find(dir.path().string()), std::string::npos);
    EXPECT_NE(searchPath().find(dir.path().string()), std::string::npos);

    // The process environment is left alone
    const char* inherited = std::getenv("PATH");
    ASSERT_NE(inherited, nullptr);
    EXPECT_EQ(std::string(inherited).find(dir.path().string()), std::string::npos);
}

TEST(SearchPath, GrowsWhileOtherThreadsLaunch) {
    TempDir dir;
    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};

    std::vector<std::thread> launchers;
    for (int i = 0; i < 3; ++i) {
        launchers.emplace_back([&] {
            while (!stop.load()) {
                if (!runProcess("true", {}).ok()) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(addSearchDirectory((dir.path() / ("bin" + std::to_string(i))).string()));
    }
    stop = true;
    for (auto& t : launchers) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_NE(searchPath().find((dir.path() / "bin49").string()), std::string::npos);
}
