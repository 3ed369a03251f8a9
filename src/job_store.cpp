/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/job_store.hpp"
#include "subfetch/logger.hpp"

namespace subfetch {

const char* statusName(Status status) noexcept {
    switch (status) {
        case Status::Pending: return "Pending";
        case Status::Running: return "Running";
        case Status::Success: return "Success";
        case Status::EmbeddedExists: return "Embedded";
        case Status::Failed: return "Failed";
        default: return "Unknown";
    }
}

Progress summarize(const std::vector<Job>& jobs) noexcept {
    Progress p;
    p.total = jobs.size();
    for (const auto& job : jobs) {
        switch (job.status.state) {
            case Status::Pending: ++p.pending; break;
            case Status::Running: ++p.running; break;
            case Status::Success: ++p.succeeded; break;
            case Status::EmbeddedExists: ++p.embedded; break;
            case Status::Failed: ++p.failed; break;
        }
    }
    return p;
}

void JobStore::reset(const std::vector<std::filesystem::path>& targets) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();
    jobs_.reserve(targets.size());
    for (const auto& target : targets) {
        Job job;
        job.target = target;
        jobs_.push_back(std::move(job));
    }
    LOG_DEBUG("Job store reset with " + std::to_string(jobs_.size()) + " jobs");
}

std::optional<std::filesystem::path> JobStore::markRunning(std::size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= jobs_.size() || jobs_[index].status.state != Status::Pending) {
        return std::nullopt;
    }
    transition(index, JobStatus{Status::Running, "", ErrorKind::None});
    return jobs_[index].target;
}

bool JobStore::finish(std::size_t index, const JobStatus& status,
                      std::vector<std::filesystem::path> resultPaths, bool recoverableWarning) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= jobs_.size()) {
        LOG_ERROR("finish() for unknown job index " + std::to_string(index));
        return false;
    }

    Job& job = jobs_[index];
    if (job.status.state != Status::Running) {
        LOG_DEBUG("Dropping late result for " + job.target.string() + " (already " +
                  statusName(job.status.state) + ")");
        return false;
    }

    transition(index, status);
    job.resultPaths = std::move(resultPaths);
    job.recoverableWarning = recoverableWarning;
    return true;
}

std::size_t JobStore::cancelRemaining() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    for (std::size_t i = 0; i < jobs_.size(); ++i) {
        const Status state = jobs_[i].status.state;
        if (state == Status::Pending || state == Status::Running) {
            transition(i, JobStatus::cancelled());
            ++changed;
        }
    }
    return changed;
}

std::vector<Job> JobStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_;
}

Progress JobStore::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summarize(jobs_);
}

std::size_t JobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void JobStore::setObserver(TransitionObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

void JobStore::transition(std::size_t index, const JobStatus& to) {
    const Status from = jobs_[index].status.state;
    jobs_[index].status = to;
    if (observer_) {
        observer_(index, from, to.state);
    }
}

}
