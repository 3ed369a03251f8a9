/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/progress_cache.hpp"
#include "subfetch/logger.hpp"

namespace subfetch {

ProgressCache::ProgressCache(const JobStore& store, std::chrono::milliseconds interval) noexcept
    : store_(store), interval_(interval) {
}

bool ProgressCache::refresh(bool force) {
    auto now = std::chrono::steady_clock::now();
    if (!force && lastRefresh_ && now - *lastRefresh_ < interval_) {
        return false;
    }

    jobs_ = store_.snapshot();
    progress_ = summarize(jobs_);
    lastRefresh_ = now;

    LOG_TRACE("Progress refreshed: " + std::to_string(progress_.terminal()) + "/" +
              std::to_string(progress_.total) + " done, " + std::to_string(progress_.running) + " running");
    return true;
}

}
