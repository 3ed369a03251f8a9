/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include "subfetch/config.hpp"
#include "subfetch/types.hpp"

namespace Json {
class Value;
}

namespace subfetch {

struct SettingsResult {
    bool ok = false;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// User preferences persisted as JSON between runs.
struct Settings {
    Languages languages;
    bool forceDownload = false;
    bool overwriteExisting = false;
    std::size_t concurrentDownloads = DEFAULT_CONCURRENT_DOWNLOADS;
    bool ignoreLocalExtras = false;

    // Missing or unreadable files yield defaults; bad fields fall back individually.
    [[nodiscard]] static Settings load(const std::filesystem::path& path);
    [[nodiscard]] SettingsResult save(const std::filesystem::path& path) const;

    [[nodiscard]] static Settings fromJson(const Json::Value& root);
    [[nodiscard]] Json::Value toJson() const;
};

// $XDG_CONFIG_HOME/subfetch/settings.json, else ~/.subfetch/settings.json
[[nodiscard]] std::filesystem::path defaultSettingsPath();

// $XDG_CACHE_HOME/subfetch/subfetch.log, else ~/.subfetch/subfetch.log
[[nodiscard]] std::filesystem::path defaultLogPath();

}
