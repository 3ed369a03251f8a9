/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "subfetch/cancellation.hpp"
#include "subfetch/config.hpp"
#include "subfetch/job_store.hpp"
#include "subfetch/worker.hpp"

namespace subfetch {

class Pool;

enum class SubmitError : uint8_t {
    None = 0,
    AlreadyRunning,
    InvalidConcurrency,
    NoLanguages,
    NoTargets,
    StartFailed
};

struct SubmitResult {
    bool ok = false;
    SubmitError error = SubmitError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

/*
 * Admission control for one fetch run.
 *
 * A dedicated thread pops job indices in FIFO order and hands them to a pool
 * of exactly `concurrency` threads, never letting more than `concurrency`
 * jobs be in flight. It only ever sleeps for a short tick, so a cancel()
 * stops admission within one tick. Jobs still queued or running at that point
 * are swept to Failed("Cancelled"); their subprocesses are left to finish.
 *
 * submit(), wait() and the destructor must be called from the owning thread.
 */
class Scheduler final {
public:
    explicit Scheduler(Collaborators collaborators,
                       std::chrono::milliseconds tick = SCHEDULER_TICK);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    [[nodiscard]] SubmitResult submit(const std::vector<std::filesystem::path>& targets,
                                      std::size_t concurrency,
                                      bool force,
                                      const Languages& languages);

    void cancel() noexcept;

    // True from a successful submit() until every job is terminal (or swept).
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Blocks until the admission loop has finished.
    void wait();

    [[nodiscard]] std::vector<Job> snapshot() const { return store_.snapshot(); }
    [[nodiscard]] Progress progress() const { return store_.progress(); }
    [[nodiscard]] const JobStore& store() const noexcept { return store_; }
    [[nodiscard]] JobStore& store() noexcept { return store_; }

private:
    void runLoop(std::size_t concurrency);
    void sweepCancelled() noexcept;
    void reap() noexcept;

    Collaborators collaborators_;
    std::chrono::milliseconds tick_;

    JobStore store_;
    CancellationToken token_;

    std::unique_ptr<Worker> worker_;
    std::unique_ptr<Pool> pool_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> inFlight_{0};
    std::thread schedulerThread_;
};

}
