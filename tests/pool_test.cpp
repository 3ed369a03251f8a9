/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/pool.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <set>

using namespace subfetch;
using subfetch::test::waitFor;

TEST(Pool, RejectsInvalidSizes) {
    Pool noWorkers(0, 1);
    EXPECT_FALSE(noWorkers.start([](const Task&, int) {}));

    Pool noQueue(2, 0);
    EXPECT_FALSE(noQueue.start([](const Task&, int) {}));

    Pool noProcessor(2, 2);
    EXPECT_FALSE(noProcessor.start(nullptr));
}

TEST(Pool, RunsEverySubmittedTask) {
    Pool pool(3, 8);
    std::mutex mutex;
    std::set<std::size_t> done;
    ASSERT_TRUE(pool.start([&](const Task& task, int) {
        std::lock_guard<std::mutex> lock(mutex);
        done.insert(task.index);
    }));

    for (std::size_t i = 0; i < 8; ++i) {
        ASSERT_TRUE(pool.submit(Task{i, "/videos/v" + std::to_string(i) + ".mkv"}));
    }
    pool.stop();

    EXPECT_EQ(done.size(), 8u);
    EXPECT_FALSE(pool.isRunning());
}

TEST(Pool, BoundedQueueRejectsOverflow) {
    Pool pool(1, 1);
    std::atomic<bool> release{false};
    std::atomic<int> started{0};
    ASSERT_TRUE(pool.start([&](const Task&, int) {
        started.fetch_add(1);
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }));

    ASSERT_TRUE(pool.submit(Task{0, "a.mkv"}));
    ASSERT_TRUE(waitFor([&] { return started.load() == 1; }));
    ASSERT_TRUE(pool.submit(Task{1, "b.mkv"}));   // fills the single slot
    EXPECT_FALSE(pool.submit(Task{2, "c.mkv"}));
    EXPECT_EQ(pool.queueSize(), 1u);

    release.store(true);
    pool.stop();
    EXPECT_EQ(started.load(), 2);
}

TEST(Pool, ProcessorExceptionDoesNotKillWorker) {
    Pool pool(1, 4);
    std::atomic<int> ran{0};
    ASSERT_TRUE(pool.start([&](const Task& task, int) {
        ran.fetch_add(1);
        if (task.index == 0) {
            throw std::runtime_error("boom");
        }
    }));

    ASSERT_TRUE(pool.submit(Task{0, "a.mkv"}));
    ASSERT_TRUE(pool.submit(Task{1, "b.mkv"}));
    pool.stop();
    EXPECT_EQ(ran.load(), 2);
}

TEST(Pool, SubmitAfterStopFails) {
    Pool pool(1, 1);
    ASSERT_TRUE(pool.start([](const Task&, int) {}));
    pool.stop();
    EXPECT_FALSE(pool.submit(Task{0, "a.mkv"}));
}
