/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "subfetch/process.hpp"
#include "subfetch/types.hpp"

namespace subfetch {

struct FetchRequest {
    std::filesystem::path target;
    Languages languages;
    bool force = false;
};

struct FetchResult {
    bool launched = false;
    int exitCode = -1;
    std::string output;     // stdout + "\n" + stderr, lower-cased
    std::string launcher;   // the invocation form that started
    std::string error;      // last launch error when nothing started
};

// The external subtitle fetcher, seen only through its process contract.
class FetchTool {
public:
    virtual ~FetchTool() = default;
    [[nodiscard]] virtual FetchResult fetch(const FetchRequest& request) = 0;
};

// One way of starting the tool: `program prefix... <arguments>`.
struct Launcher {
    std::string program;
    std::vector<std::string> prefix;

    [[nodiscard]] std::string describe() const;
};

class SubliminalTool final : public FetchTool {
public:
    explicit SubliminalTool(std::filesystem::path cacheDir = defaultCacheDir(),
                            std::vector<Launcher> launchers = defaultLaunchers());

    SubliminalTool(const SubliminalTool&) = delete;
    SubliminalTool& operator=(const SubliminalTool&) = delete;

    [[nodiscard]] FetchResult fetch(const FetchRequest& request) override;

    // `download [--force] -l <lang>... <target>`
    [[nodiscard]] static std::vector<std::string> buildArguments(const FetchRequest& request);

    // `subliminal`, then `python|py|python3 -m subliminal`
    [[nodiscard]] static std::vector<Launcher> defaultLaunchers();
    [[nodiscard]] static std::filesystem::path defaultCacheDir();

    [[nodiscard]] Environment environment() const;
    [[nodiscard]] const std::filesystem::path& cacheDir() const noexcept { return cacheDir_; }

private:
    void ensureCacheDir() const;

    std::filesystem::path cacheDir_;
    std::vector<Launcher> launchers_;
};

}
