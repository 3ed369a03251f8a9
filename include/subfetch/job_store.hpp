/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "subfetch/types.hpp"

namespace subfetch {

struct Progress {
    std::size_t total = 0;
    std::size_t pending = 0;
    std::size_t running = 0;
    std::size_t succeeded = 0;
    std::size_t embedded = 0;
    std::size_t failed = 0;

    // Jobs that ended with subtitles available (fetched or embedded)
    [[nodiscard]] std::size_t completed() const noexcept { return succeeded + embedded; }
    [[nodiscard]] std::size_t terminal() const noexcept { return succeeded + embedded + failed; }
};

Progress summarize(const std::vector<Job>& jobs) noexcept;

// Invoked under the store lock on every status change: (index, from, to).
using TransitionObserver = std::function<void(std::size_t, Status, Status)>;

// The jobs of one run. Every read and write takes the lock for the single
// access only; callers never hold it across a subprocess call.
class JobStore final {
public:
    JobStore() = default;

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // Discards the previous run and creates one Pending job per target.
    void reset(const std::vector<std::filesystem::path>& targets);

    // Pending -> Running. Returns the target, or nullopt if the job was not Pending.
    [[nodiscard]] std::optional<std::filesystem::path> markRunning(std::size_t index);

    // Running -> terminal. Ignored (returns false) when the job already left
    // Running, e.g. because the cancellation sweep reached it first.
    bool finish(std::size_t index, const JobStatus& status,
                std::vector<std::filesystem::path> resultPaths = {},
                bool recoverableWarning = false);

    // Every Pending/Running job becomes Failed("Cancelled"). Returns how many changed.
    std::size_t cancelRemaining();

    [[nodiscard]] std::vector<Job> snapshot() const;
    [[nodiscard]] Progress progress() const;
    [[nodiscard]] std::size_t size() const;

    void setObserver(TransitionObserver observer);

private:
    void transition(std::size_t index, const JobStatus& to);

    mutable std::mutex mutex_;
    std::vector<Job> jobs_;
    TransitionObserver observer_;
};

}
