/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/pool.hpp"
#include "subfetch/logger.hpp"

namespace subfetch {

Pool::Pool(int workers, std::size_t capacity) noexcept : workers_(workers), capacity_(capacity) {
    LOG_DEBUG("Pool created with " + std::to_string(workers) + " workers, queue capacity " +
              std::to_string(capacity));
}

Pool::~Pool() {
    stop();
}

bool Pool::start(TaskProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid task processor provided");
        return false;
    }

    if (workers_ < 1 || capacity_ < 1) {
        LOG_ERROR("Pool needs at least one worker and one queue slot");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load() && workerThreads_.empty()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    // Signal shutdown; workers drain the queue before exiting
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    taskAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(Task task) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit task to stopped pool: " + task.target.string());
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (taskQueue_.size() >= capacity_) {
                LOG_WARN("Pool queue full, rejecting: " + task.target.string());
                return false;
            }
            taskQueue_.push(std::move(task));
        }

        taskAvailable_.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task: " + std::string(e.what()));
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
}

void Pool::workerLoop(int workerId) {
    const std::string name = getThreadName(workerId);
    setThreadName(name);
    LOG_TRACE(name + " thread started");

    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            taskAvailable_.wait(lock, [this] {
                return !taskQueue_.empty() || shutdown_.load();
            });

            if (taskQueue_.empty()) {
                break;   // shutdown with nothing left to do
            }

            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        // Process outside of lock
        LOG_DEBUG(name + " claimed: " + task.target.string());
        try {
            processor_(task, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR(name + " task error: " + std::string(e.what()) + " (" + task.target.string() + ")");
        } catch (...) {
            LOG_ERROR(name + " unknown task error (" + task.target.string() + ")");
        }
    }

    LOG_TRACE(name + " stopped");
}

}
