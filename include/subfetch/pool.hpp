/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace subfetch {

struct Task {
    std::size_t index = 0;
    std::filesystem::path target;
};

using TaskProcessor = std::function<void(const Task&, int workerId)>;

// Fixed set of worker threads fed through a bounded queue.
class Pool {
public:
    Pool(int workers, std::size_t capacity) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(TaskProcessor processor);

    // Lets queued and running tasks finish, then joins every thread.
    void stop() noexcept;

    // False when stopped or the queue is full.
    [[nodiscard]] bool submit(Task task) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;

private:
    void workerLoop(int workerId);

    int workers_;
    std::size_t capacity_;
    TaskProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::queue<Task> taskQueue_;

    std::vector<std::thread> workerThreads_;
};

}
