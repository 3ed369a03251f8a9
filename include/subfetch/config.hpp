/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <chrono>
#include <cstddef>

namespace subfetch {

constexpr const char* VERSION = "2.1.0";

constexpr std::size_t DEFAULT_CONCURRENT_DOWNLOADS = 25;
constexpr std::size_t MAX_CONCURRENT_DOWNLOADS = 100;

// Scheduler admission loop tick and UI snapshot refresh
constexpr auto SCHEDULER_TICK = std::chrono::milliseconds(200);
constexpr auto PROGRESS_REFRESH_INTERVAL = std::chrono::milliseconds(500);

// Dependency monitor: probe every 5s, woken every 100ms to notice shutdown
constexpr auto MONITOR_PROBE_INTERVAL = std::chrono::seconds(5);
constexpr auto MONITOR_SLEEP_SLICE = std::chrono::milliseconds(100);
constexpr auto MONITOR_JOIN_TIMEOUT = std::chrono::seconds(2);

constexpr std::array<const char*, 5> SUBTITLE_EXTENSIONS = {"srt", "sub", "ssa", "ass", "vtt"};

constexpr std::array<const char*, 58> VIDEO_EXTENSIONS = {
    "mp4", "mkv", "avi", "mov", "wmv", "flv", "mpeg", "mpg", "webm", "m4v",
    "3gp", "3g2", "asf", "mts", "m2ts", "ts", "vob", "ogv", "rm", "rmvb",
    "divx", "f4v", "mxf", "mp2", "mpv", "dat", "tod", "vro", "drc", "mng",
    "qt", "yuv", "viv", "amv", "nsv", "svi", "mpe", "mpv2", "m2v", "m1v",
    "m2p", "trp", "tp", "ps", "evo", "ogm", "ogx", "mod", "rec", "dvr-ms",
    "pva", "wtv", "m4p", "m4b", "m4r", "m4a", "3gpp", "3gpp2"
};

// Directory names skipped when "ignore local extras" is on (Plex/Jellyfin extras layout)
constexpr std::array<const char*, 8> LOCAL_EXTRAS_FOLDERS = {
    "Behind The Scenes", "Deleted Scenes", "Featurettes", "Interviews",
    "Scenes", "Shorts", "Trailers", "Other"
};

}
