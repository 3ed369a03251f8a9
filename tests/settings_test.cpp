/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/settings.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <json/json.h>
#include <cstdlib>

using namespace subfetch;
using subfetch::test::TempDir;

TEST(Settings, MissingFileGivesDefaults) {
    TempDir dir;
    Settings settings = Settings::load(dir.path() / "settings.json");
    EXPECT_TRUE(settings.languages.empty());
    EXPECT_FALSE(settings.forceDownload);
    EXPECT_FALSE(settings.overwriteExisting);
    EXPECT_FALSE(settings.ignoreLocalExtras);
    EXPECT_EQ(settings.concurrentDownloads, DEFAULT_CONCURRENT_DOWNLOADS);
}

TEST(Settings, SaveThenLoad) {
    TempDir dir;
    auto path = dir.path() / "nested" / "settings.json";

    Settings settings;
    settings.languages = {"en", "pt-br"};
    settings.forceDownload = true;
    settings.concurrentDownloads = 8;
    settings.ignoreLocalExtras = true;

    SettingsResult saved = settings.save(path);
    ASSERT_TRUE(saved) << saved.message;

    Settings loaded = Settings::load(path);
    EXPECT_EQ(loaded.languages, settings.languages);
    EXPECT_TRUE(loaded.forceDownload);
    EXPECT_FALSE(loaded.overwriteExisting);
    EXPECT_EQ(loaded.concurrentDownloads, 8u);
    EXPECT_TRUE(loaded.ignoreLocalExtras);
}

TEST(Settings, CorruptFileGivesDefaults) {
    TempDir dir;
    auto path = dir.touch("settings.json", "{ not json");
    Settings settings = Settings::load(path);
    EXPECT_TRUE(settings.languages.empty());
    EXPECT_EQ(settings.concurrentDownloads, DEFAULT_CONCURRENT_DOWNLOADS);
}

TEST(Settings, OutOfRangeConcurrencyFallsBack) {
    TempDir dir;
    auto path = dir.touch("settings.json",
                          R"({"selected_languages": ["en"], "concurrent_downloads": 500, "force_download": "yes"})");
    Settings settings = Settings::load(path);
    EXPECT_EQ(settings.languages, Languages{"en"});
    EXPECT_EQ(settings.concurrentDownloads, DEFAULT_CONCURRENT_DOWNLOADS);
    EXPECT_FALSE(settings.forceDownload);
}

TEST(Settings, JsonUsesSnakeCaseKeys) {
    Settings settings;
    settings.overwriteExisting = true;
    Json::Value root = settings.toJson();
    EXPECT_TRUE(root.isMember("selected_languages"));
    EXPECT_TRUE(root["overwrite_existing"].asBool());
    EXPECT_EQ(root["concurrent_downloads"].asUInt64(), DEFAULT_CONCURRENT_DOWNLOADS);
}

TEST(Settings, PathsFollowXdgVariables) {
    const char* oldConfig = std::getenv("XDG_CONFIG_HOME");
    const char* oldCache = std::getenv("XDG_CACHE_HOME");
    std::string savedConfig = oldConfig ? oldConfig : "";
    std::string savedCache = oldCache ? oldCache : "";

    setenv("XDG_CONFIG_HOME", "/cfg", 1);
    setenv("XDG_CACHE_HOME", "/cache", 1);
    EXPECT_EQ(defaultSettingsPath(), std::filesystem::path("/cfg/subfetch/settings.json"));
    EXPECT_EQ(defaultLogPath(), std::filesystem::path("/cache/subfetch/subfetch.log"));

    if (oldConfig) setenv("XDG_CONFIG_HOME", savedConfig.c_str(), 1); else unsetenv("XDG_CONFIG_HOME");
    if (oldCache) setenv("XDG_CACHE_HOME", savedCache.c_str(), 1); else unsetenv("XDG_CACHE_HOME");
}
