/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>

#include "subfetch/fetch_tool.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/settings.hpp"
#include "subfetch/subtitles.hpp"
#include "subfetch/toolchain.hpp"
#include "subfetch/worker.hpp"

namespace subfetch {

struct ContextOptions {
    std::filesystem::path settingsPath = defaultSettingsPath();
    std::filesystem::path logPath = defaultLogPath();
    bool logToFile = true;
};

// Everything the process would otherwise keep in globals: loaded settings,
// the log file sink and the real external collaborators. Built once in main
// and handed down by reference.
class AppContext final {
public:
    explicit AppContext(ContextOptions options = ContextOptions{});

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    [[nodiscard]] Settings& settings() noexcept { return settings_; }
    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }
    [[nodiscard]] SettingsResult saveSettings() const { return settings_.save(options_.settingsPath); }
    [[nodiscard]] const std::filesystem::path& settingsPath() const noexcept { return options_.settingsPath; }

    [[nodiscard]] bool loggingToFile() const noexcept { return logFile_ && logFile_->isOpen(); }
    [[nodiscard]] const std::filesystem::path& logPath() const noexcept { return options_.logPath; }

    [[nodiscard]] Collaborators collaborators() noexcept { return Collaborators{tool_, locator_, probe_}; }
    [[nodiscard]] std::shared_ptr<DependencyProbe> dependencies() const noexcept { return dependencies_; }

private:
    ContextOptions options_;
    std::unique_ptr<LogFile> logFile_;
    Settings settings_;

    FilesystemLocator locator_;
    FfprobeProbe probe_;
    SubliminalTool tool_;
    std::shared_ptr<DependencyProbe> dependencies_;
};

}
