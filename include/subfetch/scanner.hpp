/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <vector>

#include "subfetch/types.hpp"

namespace subfetch {

struct ScanResult {
    std::vector<std::filesystem::path> videos;    // every video found, sorted
    std::vector<std::filesystem::path> targets;   // videos to fetch for, sorted
    std::size_t ignoredFolders = 0;
    bool ok = true;
};

struct ScanOptions {
    Languages languages;
    bool overwriteExisting = false;
    bool ignoreLocalExtras = false;
};

class Scanner {
public:
    explicit Scanner(const std::filesystem::path& folder) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    [[nodiscard]] ScanResult scan(const ScanOptions& options) const noexcept;

    [[nodiscard]] static bool isExtrasFolder(const std::filesystem::path& dir) noexcept;

private:
    std::filesystem::path folder_;
};

}
