/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/scanner.hpp"
#include "subfetch/config.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/subtitles.hpp"
#include <algorithm>

namespace subfetch {

Scanner::Scanner(const std::filesystem::path& folder) noexcept
    : folder_(folder) {
}

ScanResult Scanner::scan(const ScanOptions& options) const noexcept {
    ScanResult result;

    try {
        if (!std::filesystem::is_directory(folder_)) {
            LOG_ERROR("Not a directory: " + folder_.string());
            result.ok = false;
            return result;
        }

        namespace fs = std::filesystem;
        fs::recursive_directory_iterator it(folder_, fs::directory_options::skip_permission_denied);
        for (; it != fs::recursive_directory_iterator(); ++it) {
            std::error_code ec;
            const auto& entry = *it;

            if (entry.is_directory(ec)) {
                if (options.ignoreLocalExtras && isExtrasFolder(entry.path())) {
                    LOG_DEBUG("Skipping extras folder: " + entry.path().string());
                    ++result.ignoredFolders;
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (entry.is_regular_file(ec) && isVideoFile(entry.path())) {
                result.videos.push_back(entry.path());
                LOG_TRACE("Found video: " + entry.path().string());
            }
        }

        std::sort(result.videos.begin(), result.videos.end());

        for (const auto& video : result.videos) {
            if (options.overwriteExisting || missingSubtitle(video, options.languages)) {
                result.targets.push_back(video);
            }
        }

        LOG_INFO("Scanned " + folder_.string() + ": " + std::to_string(result.videos.size()) + " videos, " +
                 std::to_string(result.targets.size()) + " need subtitles" +
                 (result.ignoredFolders > 0 ? ", " + std::to_string(result.ignoredFolders) + " extras folders ignored"
                                            : std::string()));

    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
        result.ok = false;
    }

    return result;
}

bool Scanner::isExtrasFolder(const std::filesystem::path& dir) noexcept {
    try {
        const std::string name = dir.filename().string();
        return std::any_of(LOCAL_EXTRAS_FOLDERS.begin(), LOCAL_EXTRAS_FOLDERS.end(),
                           [&name](const char* folder) { return name == folder; });
    } catch (const std::exception& e) {
        LOG_DEBUG("Cannot read folder name: " + std::string(e.what()));
        return false;
    }
}

}
