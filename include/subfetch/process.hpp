/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <string>
#include <vector>

namespace subfetch {

using Environment = std::map<std::string, std::string>;

struct ProcessResult {
    bool launched = false;   // exec succeeded; exitCode/out/err are meaningful
    int exitCode = -1;       // 128 + signal when killed by a signal
    std::string out;
    std::string err;
    std::string error;       // why the launch failed

    [[nodiscard]] bool ok() const noexcept { return launched && exitCode == 0; }
};

// Runs `program` with `args`, stdin from /dev/null, capturing stdout and
// stderr. `env` entries are added to the inherited environment. A bare
// program name is looked up in searchPath() (or in `env`'s PATH when given).
// Blocks until the child exits. Never throws.
[[nodiscard]] ProcessResult runProcess(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const Environment& env = {}) noexcept;

// Appends `directory` to the PATH searched and passed on by every later
// runProcess call. The process environment itself is never modified, so this
// is safe while other threads launch processes. False when already present.
bool addSearchDirectory(const std::string& directory);

// Inherited PATH followed by the directories added with addSearchDirectory().
[[nodiscard]] std::string searchPath();

}
