/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <vector>

#include "subfetch/config.hpp"
#include "subfetch/job_store.hpp"

namespace subfetch {

// Rate-limited copy of a JobStore for pollers that run far more often than
// jobs change. The store lock is taken once per refresh, never per read.
// Not thread-safe itself; owned by the polling thread.
class ProgressCache {
public:
    explicit ProgressCache(const JobStore& store,
                           std::chrono::milliseconds interval = PROGRESS_REFRESH_INTERVAL) noexcept;

    ProgressCache(const ProgressCache&) = delete;
    ProgressCache& operator=(const ProgressCache&) = delete;

    // Re-snapshots when the interval has elapsed (or `force`). Returns true if it did.
    bool refresh(bool force = false);

    [[nodiscard]] const std::vector<Job>& jobs() const noexcept { return jobs_; }
    [[nodiscard]] const Progress& progress() const noexcept { return progress_; }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    const JobStore& store_;
    std::chrono::milliseconds interval_;
    std::optional<std::chrono::steady_clock::time_point> lastRefresh_;

    std::vector<Job> jobs_;
    Progress progress_;
};

}
