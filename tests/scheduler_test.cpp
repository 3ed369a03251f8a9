/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/scheduler.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <map>

using namespace subfetch;
using namespace subfetch::test;

namespace {

constexpr auto kTick = std::chrono::milliseconds(10);

std::vector<std::filesystem::path> videos(std::size_t n) {
    std::vector<std::filesystem::path> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.emplace_back("/library/episode" + std::to_string(i) + ".mkv");
    }
    return out;
}

// Tracks the live Running count and every job's state sequence.
struct TransitionLog {
    std::mutex mutex;
    std::atomic<int> running{0};
    std::atomic<int> peakRunning{0};
    std::map<std::size_t, std::vector<Status>> history;

    void attach(JobStore& store) {
        store.setObserver([this](std::size_t index, Status from, Status to) {
            if (to == Status::Running) {
                int now = running.fetch_add(1) + 1;
                int peak = peakRunning.load();
                while (now > peak && !peakRunning.compare_exchange_weak(peak, now)) {
                }
            }
            if (from == Status::Running) {
                running.fetch_sub(1);
            }
            std::lock_guard<std::mutex> lock(mutex);
            auto& seq = history[index];
            if (seq.empty()) {
                seq.push_back(from);
            }
            seq.push_back(to);
        });
    }
};

}

TEST(Scheduler, TenTargetsNeverMoreThanThreeRunning) {
    FakeFetchTool tool("Downloaded 1 subtitle", std::chrono::milliseconds(30));
    FakeLocator locator(1);
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    TransitionLog log;
    log.attach(scheduler.store());

    ASSERT_TRUE(scheduler.submit(videos(10), 3, false, {"en"}));
    scheduler.wait();

    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_LE(log.peakRunning.load(), 3);
    EXPECT_LE(tool.peak(), 3);
    EXPECT_EQ(tool.calls(), 10);

    Progress p = scheduler.progress();
    EXPECT_EQ(p.total, 10u);
    EXPECT_EQ(p.succeeded, 10u);
    EXPECT_EQ(p.terminal(), 10u);
}

TEST(Scheduler, TransitionsFollowPendingRunningTerminal) {
    FakeFetchTool tool("Downloaded 1 subtitle", std::chrono::milliseconds(5));
    FakeLocator locator(1);
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    TransitionLog log;
    log.attach(scheduler.store());

    ASSERT_TRUE(scheduler.submit(videos(6), 2, false, {"en"}));
    scheduler.wait();

    ASSERT_EQ(log.history.size(), 6u);
    for (const auto& entry : log.history) {
        const auto& seq = entry.second;
        ASSERT_EQ(seq.size(), 3u) << "job " << entry.first;
        EXPECT_EQ(seq[0], Status::Pending);
        EXPECT_EQ(seq[1], Status::Running);
        EXPECT_EQ(seq[2], Status::Success);
    }
}

TEST(Scheduler, CancelLeavesNothingPendingOrRunning) {
    FakeFetchTool tool("Downloaded 1 subtitle", std::chrono::milliseconds(100));
    FakeLocator locator(1);
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    ASSERT_TRUE(scheduler.submit(videos(20), 2, false, {"en"}));
    ASSERT_TRUE(waitFor([&] { return tool.calls() > 0; }));
    scheduler.cancel();
    scheduler.wait();

    EXPECT_FALSE(scheduler.isRunning());
    auto jobs = scheduler.snapshot();
    std::size_t cancelled = 0;
    for (const auto& job : jobs) {
        EXPECT_TRUE(job.status.terminal()) << job.target;
        if (job.status == JobStatus::cancelled()) {
            ++cancelled;
        }
    }
    EXPECT_GT(cancelled, 0u);
    EXPECT_LT(tool.calls(), 20);
}

TEST(Scheduler, RejectsInvalidSubmissions) {
    FakeFetchTool tool;
    FakeLocator locator;
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    EXPECT_EQ(scheduler.submit(videos(1), 0, false, {"en"}).error, SubmitError::InvalidConcurrency);
    EXPECT_EQ(scheduler.submit(videos(1), MAX_CONCURRENT_DOWNLOADS + 1, false, {"en"}).error,
              SubmitError::InvalidConcurrency);
    EXPECT_EQ(scheduler.submit(videos(1), 1, false, {}).error, SubmitError::NoLanguages);
    EXPECT_EQ(scheduler.submit({}, 1, false, {"en"}).error, SubmitError::NoTargets);
    EXPECT_FALSE(scheduler.isRunning());
}

TEST(Scheduler, RejectsSecondRunWhileBusy) {
    FakeFetchTool tool("Downloaded 1 subtitle", std::chrono::milliseconds(100));
    FakeLocator locator(1);
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    ASSERT_TRUE(scheduler.submit(videos(3), 1, false, {"en"}));
    SubmitResult second = scheduler.submit(videos(3), 1, false, {"en"});
    EXPECT_FALSE(second);
    EXPECT_EQ(second.error, SubmitError::AlreadyRunning);
    scheduler.wait();
}

TEST(Scheduler, RunsAgainAfterCompletion) {
    FakeFetchTool tool;
    FakeLocator locator(1);
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    ASSERT_TRUE(scheduler.submit(videos(2), 2, false, {"en"}));
    scheduler.wait();
    ASSERT_TRUE(scheduler.submit(videos(4), 2, false, {"en"}));
    scheduler.wait();

    EXPECT_EQ(scheduler.progress().total, 4u);
    EXPECT_EQ(scheduler.progress().succeeded, 4u);
    EXPECT_EQ(tool.calls(), 6);
}

TEST(Scheduler, UnlaunchableToolFailsEveryJob) {
    FakeFetchTool tool;
    tool.setLaunchable(false);
    FakeLocator locator(1);
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    ASSERT_TRUE(scheduler.submit(videos(3), 2, false, {"en"}));
    scheduler.wait();

    for (const auto& job : scheduler.snapshot()) {
        EXPECT_EQ(job.status.state, Status::Failed);
        EXPECT_EQ(job.status.reason, "tool not runnable");
        EXPECT_EQ(job.status.error, ErrorKind::LaunchFailure);
    }
}

TEST(Scheduler, EmbeddedSubtitlesReported) {
    FakeFetchTool tool("Downloaded 0 subtitles");
    FakeLocator locator(0);
    FakeProbe probe("English");
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    ASSERT_TRUE(scheduler.submit(videos(2), 2, false, {"en"}));
    scheduler.wait();

    Progress p = scheduler.progress();
    EXPECT_EQ(p.embedded, 2u);
    EXPECT_EQ(p.completed(), 2u);
    EXPECT_EQ(probe.calls(), 2);
    for (const auto& job : scheduler.snapshot()) {
        EXPECT_NE(job.status.reason.find("English"), std::string::npos);
    }
}

TEST(Scheduler, ResultPathsRecorded) {
    FakeFetchTool tool;
    FakeLocator locator(2);
    FakeProbe probe;
    Scheduler scheduler(Collaborators{tool, locator, probe}, kTick);

    ASSERT_TRUE(scheduler.submit(videos(1), 1, false, {"en", "fr"}));
    scheduler.wait();

    auto jobs = scheduler.snapshot();
    ASSERT_EQ(jobs.size(), 1u);
    ASSERT_EQ(jobs[0].resultPaths.size(), 2u);
    EXPECT_EQ(jobs[0].resultPaths[0].filename(), "episode0.en.srt");
    EXPECT_EQ(jobs[0].resultPaths[1].filename(), "episode0.fr.srt");
}
