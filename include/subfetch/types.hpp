/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace subfetch {

// Job lifecycle states. Success, EmbeddedExists and Failed are terminal.
enum class Status : std::uint8_t { Pending, Running, Success, EmbeddedExists, Failed };

// Failure taxonomy carried alongside a terminal status.
enum class ErrorKind : std::uint8_t {
    None = 0,
    LaunchFailure,
    ToolReportedError,
    RecoverableCacheError,
    NoSubtitles,
    Cancelled,
    InstallFailure,
    Internal
};

struct JobStatus {
    Status state = Status::Pending;
    std::string reason;   // set for EmbeddedExists and Failed
    ErrorKind error = ErrorKind::None;

    [[nodiscard]] bool terminal() const noexcept {
        return state == Status::Success || state == Status::EmbeddedExists || state == Status::Failed;
    }

    [[nodiscard]] static JobStatus success() { return {Status::Success, "", ErrorKind::None}; }
    [[nodiscard]] static JobStatus embedded(std::string why) {
        return {Status::EmbeddedExists, std::move(why), ErrorKind::None};
    }
    [[nodiscard]] static JobStatus failed(std::string why, ErrorKind kind) {
        return {Status::Failed, std::move(why), kind};
    }
    [[nodiscard]] static JobStatus cancelled() { return {Status::Failed, "Cancelled", ErrorKind::Cancelled}; }
};

inline bool operator==(const JobStatus& a, const JobStatus& b) noexcept {
    return a.state == b.state && a.reason == b.reason;
}
inline bool operator!=(const JobStatus& a, const JobStatus& b) noexcept { return !(a == b); }

struct Job {
    std::filesystem::path target;
    JobStatus status;
    std::vector<std::filesystem::path> resultPaths;
    bool recoverableWarning = false;
};

using Languages = std::vector<std::string>;

const char* statusName(Status status) noexcept;

}
