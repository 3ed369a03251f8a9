/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/fetch_tool.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/subtitles.hpp"
#include <stdexcept>

namespace subfetch {

std::string Launcher::describe() const {
    std::string text = program;
    for (const auto& p : prefix) {
        text += " " + p;
    }
    return text;
}

SubliminalTool::SubliminalTool(std::filesystem::path cacheDir, std::vector<Launcher> launchers)
    : cacheDir_(std::move(cacheDir)), launchers_(std::move(launchers)) {
    if (launchers_.empty()) {
        throw std::invalid_argument("SubliminalTool needs at least one launcher");
    }
    LOG_DEBUG("Fetch tool created - cache: " + cacheDir_.string() + ", launchers: " +
              std::to_string(launchers_.size()));
}

std::vector<Launcher> SubliminalTool::defaultLaunchers() {
    return {
        {"subliminal", {}},
        {"python", {"-m", "subliminal"}},
        {"py", {"-m", "subliminal"}},
        {"python3", {"-m", "subliminal"}},
    };
}

std::filesystem::path SubliminalTool::defaultCacheDir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "subliminal_cache";
}

std::vector<std::string> SubliminalTool::buildArguments(const FetchRequest& request) {
    std::vector<std::string> args = {"download"};
    if (request.force) {
        args.emplace_back("--force");
    }
    for (const auto& lang : request.languages) {
        args.emplace_back("-l");
        args.push_back(lang);
    }
    args.push_back(request.target.string());
    return args;
}

Environment SubliminalTool::environment() const {
    return {
        {"PYTHONIOENCODING", "utf-8"},
        {"SUBLIMINAL_CACHE_DIR", cacheDir_.string()},
        {"PYTHONHASHSEED", "0"},
    };
}

void SubliminalTool::ensureCacheDir() const {
    std::error_code ec;
    std::filesystem::create_directories(cacheDir_, ec);
    if (ec) {
        // The tool falls back to its own default cache location
        LOG_WARN("Cannot create cache directory " + cacheDir_.string() + ": " + ec.message());
    }
}

FetchResult SubliminalTool::fetch(const FetchRequest& request) {
    ensureCacheDir();

    const auto args = buildArguments(request);
    const auto env = environment();
    FetchResult result;

    for (const auto& launcher : launchers_) {
        std::vector<std::string> full = launcher.prefix;
        full.insert(full.end(), args.begin(), args.end());

        LOG_DEBUG("Running: " + launcher.describe() + " " + request.target.string());
        ProcessResult run = runProcess(launcher.program, full, env);
        if (!run.launched) {
            LOG_DEBUG(launcher.describe() + " not runnable (" + run.error + "), trying next form");
            result.error = run.error;
            continue;
        }

        result.launched = true;
        result.exitCode = run.exitCode;
        result.launcher = launcher.describe();
        result.output = toLower(run.out + "\n" + run.err);
        return result;
    }

    LOG_ERROR("Failed to run subliminal for " + request.target.string() + ": " + result.error);
    return result;
}

}
