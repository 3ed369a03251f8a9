/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/scheduler.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/pool.hpp"
#include <deque>
#include <numeric>

namespace subfetch {

Scheduler::Scheduler(Collaborators collaborators, std::chrono::milliseconds tick)
    : collaborators_(collaborators), tick_(tick) {
    LOG_DEBUG("Scheduler created - tick: " + std::to_string(tick_.count()) + "ms");
}

Scheduler::~Scheduler() {
    cancel();
    reap();
}

SubmitResult Scheduler::submit(const std::vector<std::filesystem::path>& targets,
                               std::size_t concurrency,
                               bool force,
                               const Languages& languages) {
    SubmitResult result;

    if (running_.load()) {
        result.error = SubmitError::AlreadyRunning;
        result.message = "A download run is already in progress";
        LOG_WARN(result.message);
        return result;
    }
    if (concurrency < 1 || concurrency > MAX_CONCURRENT_DOWNLOADS) {
        result.error = SubmitError::InvalidConcurrency;
        result.message = "Concurrent downloads must be between 1 and " + std::to_string(MAX_CONCURRENT_DOWNLOADS);
        LOG_WARN(result.message);
        return result;
    }
    if (languages.empty()) {
        result.error = SubmitError::NoLanguages;
        result.message = "Select at least one language";
        LOG_WARN(result.message);
        return result;
    }
    if (targets.empty()) {
        result.error = SubmitError::NoTargets;
        result.message = "No videos missing subtitles";
        LOG_INFO(result.message);
        return result;
    }

    // Workers left over from a cancelled run finish before the store is reused
    reap();

    store_.reset(targets);
    token_.reset();
    inFlight_.store(0);

    std::string langList;
    for (const auto& lang : languages) {
        langList += (langList.empty() ? "" : ",") + lang;
    }
    LOG_INFO("Starting subtitle downloads for " + std::to_string(targets.size()) + " videos, languages: " +
             langList + ", concurrency: " + std::to_string(concurrency) + ", force: " + (force ? "yes" : "no"));

    try {
        worker_ = std::make_unique<Worker>(store_, token_, collaborators_, RunOptions{languages, force});
        pool_ = std::make_unique<Pool>(static_cast<int>(concurrency), concurrency);

        if (!pool_->start([this](const Task& task, int /*workerId*/) {
                worker_->process(task.index, task.target);
                inFlight_.fetch_sub(1);
            })) {
            result.error = SubmitError::StartFailed;
            result.message = "Failed to start worker pool";
            LOG_ERROR(result.message);
            pool_.reset();
            worker_.reset();
            return result;
        }

        running_.store(true);
        schedulerThread_ = std::thread(&Scheduler::runLoop, this, concurrency);

    } catch (const std::exception& e) {
        running_.store(false);
        result.error = SubmitError::StartFailed;
        result.message = "Failed to start scheduler: " + std::string(e.what());
        LOG_ERROR(result.message);
        reap();
        return result;
    }

    result.ok = true;
    return result;
}

void Scheduler::cancel() noexcept {
    if (!token_.cancelled()) {
        LOG_DEBUG("Cancellation requested");
    }
    token_.cancel();
}

void Scheduler::wait() {
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
}

void Scheduler::runLoop(std::size_t concurrency) {
    setThreadName("Scheduler");
    LOG_DEBUG("Scheduler loop started");

    std::deque<std::size_t> pending(store_.size());
    std::iota(pending.begin(), pending.end(), std::size_t{0});

    try {
        while (!pending.empty() || inFlight_.load() > 0) {
            while (inFlight_.load() < concurrency && !pending.empty()) {
                if (token_.cancelled()) {
                    sweepCancelled();
                    running_.store(false);
                    return;
                }

                std::size_t index = pending.front();
                pending.pop_front();

                auto target = store_.markRunning(index);
                if (!target) {
                    continue;
                }

                inFlight_.fetch_add(1);
                if (!pool_->submit(Task{index, *target})) {
                    inFlight_.fetch_sub(1);
                    store_.finish(index, JobStatus::failed("could not be queued", ErrorKind::Internal));
                }
            }

            if (token_.cancelled()) {
                // In-flight workers run to completion; their late results are dropped
                sweepCancelled();
                break;
            }

            std::this_thread::sleep_for(tick_);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scheduler loop error: " + std::string(e.what()));
        store_.cancelRemaining();
    }

    if (!token_.cancelled()) {
        auto p = store_.progress();
        LOG_INFO("Download session completed: " + std::to_string(p.completed()) + " successful, " +
                 std::to_string(p.failed) + " failed");
    }
    LOG_DEBUG("Scheduler loop stopped");
    running_.store(false);
}

void Scheduler::sweepCancelled() noexcept {
    try {
        std::size_t swept = store_.cancelRemaining();
        LOG_INFO("Download cancelled by user (" + std::to_string(swept) + " jobs marked cancelled)");
    } catch (const std::exception& e) {
        LOG_ERROR("Cancellation sweep failed: " + std::string(e.what()));
    }
}

void Scheduler::reap() noexcept {
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    if (pool_) {
        if (inFlight_.load() > 0) {
            LOG_INFO("Waiting for " + std::to_string(inFlight_.load()) + " running fetches to exit");
        }
        pool_->stop();
        pool_.reset();
    }
    worker_.reset();
}

}
