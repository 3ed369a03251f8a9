/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/worker.hpp"
#include "subfetch/cancellation.hpp"
#include "subfetch/classifier.hpp"
#include "subfetch/fetch_tool.hpp"
#include "subfetch/job_store.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/subtitles.hpp"
#include <chrono>

namespace subfetch {

Worker::Worker(JobStore& store, const CancellationToken& token, Collaborators collaborators, RunOptions options)
    : store_(store), token_(token), collaborators_(collaborators), options_(std::move(options)) {
}

Status Worker::process(std::size_t index, const std::filesystem::path& target) noexcept {
    try {
        // Step 1: Last chance to honour a cancel before launching anything
        if (token_.cancelled()) {
            store_.finish(index, JobStatus::cancelled());
            return Status::Failed;
        }

        LOG_DEBUG("Processing video: " + target.string());
        auto startTime = std::chrono::steady_clock::now();

        // Step 2: Run the fetch tool (environment and fallback chain live in the tool)
        FetchRequest request{target, options_.languages, options_.force};
        FetchResult fetched = collaborators_.tool.fetch(request);

        if (!fetched.launched) {
            store_.finish(index, JobStatus::failed("tool not runnable", ErrorKind::LaunchFailure));
            return Status::Failed;
        }

        LOG_INFO("Subliminal output for " + target.string() + ":\n" + fetched.output);
        LOG_INFO("END subliminal output");

        // Step 3: Filesystem state is the ground truth for what was fetched
        auto subtitlePaths = collaborators_.locator.find(target, options_.languages);

        // Step 4: Classify
        const auto& probe = collaborators_.probe;
        const auto& languages = options_.languages;
        Outcome outcome = classifyOutcome(fetched.output, subtitlePaths.size(), options_.force, languages,
                                          [&probe, &target, &languages] {
                                              return probe.embeddedLanguage(target, languages);
                                          });

        if (outcome.recoverableWarning) {
            LOG_WARN("DBM cache error occurred but subtitles were downloaded successfully for " + target.string());
        } else if (outcome.status.error == ErrorKind::RecoverableCacheError) {
            LOG_WARN("DBM cache error for " + target.string() + " - this is often recoverable");
        }

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        LOG_INFO("SUBTITLE JOBS OUTPUT: " + target.filename().string() + " - " +
                 statusName(outcome.status.state) + " (" + std::to_string(elapsed) + "s)");
        for (const auto& path : subtitlePaths) {
            LOG_INFO("SUBTITLE JOBS OUTPUT: " + path.string());
        }

        // Step 5: Publish status and paths together
        store_.finish(index, outcome.status, std::move(subtitlePaths), outcome.recoverableWarning);
        return outcome.status.state;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing " + target.string() + ": " + std::string(e.what()));
        store_.finish(index, JobStatus::failed("internal error: " + std::string(e.what()), ErrorKind::Internal));
        return Status::Failed;
    } catch (...) {
        LOG_ERROR("Unknown exception processing: " + target.string());
        store_.finish(index, JobStatus::failed("internal error", ErrorKind::Internal));
        return Status::Failed;
    }
}

}
