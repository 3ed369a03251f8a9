/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>

#include "subfetch/types.hpp"

namespace subfetch {

class CancellationToken;
class EmbeddedProbe;
class FetchTool;
class JobStore;
class SubtitleLocator;

// External collaborators a Worker drives. All must be safe to call from
// several pool threads at once.
struct Collaborators {
    FetchTool& tool;
    const SubtitleLocator& locator;
    const EmbeddedProbe& probe;
};

struct RunOptions {
    Languages languages;
    bool force = false;
};

// Executes one job's fetch pipeline and records exactly one terminal status.
class Worker final {
public:
    Worker(JobStore& store, const CancellationToken& token, Collaborators collaborators, RunOptions options);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Returns the status this call wrote (or tried to write; the store may
    // already hold Failed("Cancelled") from a sweep).
    Status process(std::size_t index, const std::filesystem::path& target) noexcept;

private:
    JobStore& store_;
    const CancellationToken& token_;
    Collaborators collaborators_;
    RunOptions options_;
};

}
