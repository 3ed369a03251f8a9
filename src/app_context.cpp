/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/app_context.hpp"
#include "subfetch/config.hpp"

namespace subfetch {

AppContext::AppContext(ContextOptions options)
    : options_(std::move(options)),
      dependencies_(std::make_shared<ToolchainProbe>()) {
    // Attach the file sink first so settings loading is captured too
    if (options_.logToFile) {
        logFile_ = std::make_unique<LogFile>(options_.logPath);
    }

    LOG_INFO(std::string("subfetch ") + VERSION + " starting");
    if (loggingToFile()) {
        LOG_DEBUG("Logging to " + options_.logPath.string());
    }

    settings_ = Settings::load(options_.settingsPath);
    LOG_DEBUG("Subliminal cache directory: " + tool_.cacheDir().string());
}

}
