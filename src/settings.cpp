/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/settings.hpp"
#include "subfetch/logger.hpp"
#include <json/json.h>
#include <cstdlib>
#include <fstream>
#include <memory>

namespace subfetch {

namespace {

constexpr const char* KEY_LANGUAGES = "selected_languages";
constexpr const char* KEY_FORCE = "force_download";
constexpr const char* KEY_OVERWRITE = "overwrite_existing";
constexpr const char* KEY_CONCURRENT = "concurrent_downloads";
constexpr const char* KEY_IGNORE_EXTRAS = "ignore_local_extras";

std::filesystem::path appDir(const char* xdgVariable) {
    const char* xdg = std::getenv(xdgVariable);
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "subfetch";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".subfetch";
    }
    return std::filesystem::temp_directory_path() / "subfetch";
}

bool readBool(const Json::Value& root, const char* key, bool fallback) {
    if (!root.isMember(key)) {
        return fallback;
    }
    if (!root[key].isBool()) {
        LOG_WARN(std::string("Ignoring non-boolean setting '") + key + "'");
        return fallback;
    }
    return root[key].asBool();
}

}

Settings Settings::fromJson(const Json::Value& root) {
    Settings settings;
    if (!root.isObject()) {
        LOG_WARN("Settings root is not an object. Using defaults.");
        return settings;
    }

    const Json::Value& languages = root[KEY_LANGUAGES];
    if (languages.isArray()) {
        for (const auto& lang : languages) {
            if (lang.isString() && !lang.asString().empty()) {
                settings.languages.push_back(lang.asString());
            }
        }
    }

    settings.forceDownload = readBool(root, KEY_FORCE, settings.forceDownload);
    settings.overwriteExisting = readBool(root, KEY_OVERWRITE, settings.overwriteExisting);
    settings.ignoreLocalExtras = readBool(root, KEY_IGNORE_EXTRAS, settings.ignoreLocalExtras);

    if (root.isMember(KEY_CONCURRENT)) {
        const Json::Value& value = root[KEY_CONCURRENT];
        if (value.isUInt64() && value.asUInt64() >= 1 && value.asUInt64() <= MAX_CONCURRENT_DOWNLOADS) {
            settings.concurrentDownloads = static_cast<std::size_t>(value.asUInt64());
        } else {
            LOG_WARN("Concurrent downloads out of range [1, " + std::to_string(MAX_CONCURRENT_DOWNLOADS) +
                     "], using " + std::to_string(DEFAULT_CONCURRENT_DOWNLOADS));
        }
    }

    return settings;
}

Json::Value Settings::toJson() const {
    Json::Value root(Json::objectValue);

    Json::Value langs(Json::arrayValue);
    for (const auto& lang : languages) {
        langs.append(lang);
    }
    root[KEY_LANGUAGES] = langs;
    root[KEY_FORCE] = forceDownload;
    root[KEY_OVERWRITE] = overwriteExisting;
    root[KEY_CONCURRENT] = static_cast<Json::UInt64>(concurrentDownloads);
    root[KEY_IGNORE_EXTRAS] = ignoreLocalExtras;
    return root;
}

Settings Settings::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_DEBUG("Settings file not found or unreadable: " + path.string() + ". Using defaults.");
        return Settings{};
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        LOG_WARN("Failed to parse settings file: " + errors + ". Using defaults.");
        return Settings{};
    }

    LOG_INFO("Settings loaded from " + path.string());
    return fromJson(root);
}

SettingsResult Settings::save(const std::filesystem::path& path) const {
    SettingsResult result;

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            result.message = "Failed to create settings directory: " + ec.message();
            LOG_ERROR(result.message);
            return result;
        }
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        result.message = "Failed to write settings file: " + path.string();
        LOG_ERROR(result.message);
        return result;
    }
    writer->write(toJson(), &file);
    file << '\n';
    if (!file) {
        result.message = "Failed to write settings file: " + path.string();
        LOG_ERROR(result.message);
        return result;
    }

    result.ok = true;
    result.message = "Settings saved to " + path.string();
    LOG_DEBUG(result.message);
    return result;
}

std::filesystem::path defaultSettingsPath() {
    return appDir("XDG_CONFIG_HOME") / "settings.json";
}

std::filesystem::path defaultLogPath() {
    return appDir("XDG_CACHE_HOME") / "subfetch.log";
}

}
