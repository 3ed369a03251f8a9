/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/classifier.hpp"
#include "subfetch/subtitles.hpp"
#include <algorithm>
#include <array>

namespace subfetch {

namespace {

constexpr const char* ZERO_MARKER = "downloaded 0 subtitle";

constexpr std::array<const char*, 2> ERROR_MARKERS = {"error", "failed"};

constexpr std::array<const char*, 2> CACHE_ERROR_MARKERS = {
    "dbm.error", "db type could not be determined"
};

constexpr std::array<const char*, 6> ALREADY_SATISFIED_MARKERS = {
    "embedded", "already exists", "no need to download",
    "subtitle(s) already present", "has embedded subtitles", "skipping"
};

template <std::size_t N>
bool containsAny(const std::string& text, const std::array<const char*, N>& needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&text](const char* needle) { return text.find(needle) != std::string::npos; });
}

}

std::string embeddedReason(const std::string& languageName) {
    return "Embedded " + languageName + " subtitles already exist (no external subtitles found online)";
}

Outcome classifyOutcome(const std::string& output,
                        std::size_t discoveredFiles,
                        bool force,
                        const Languages& languages,
                        const EmbeddedLookup& probeEmbedded) {
    const std::string text = toLower(output);
    const bool haveFiles = discoveredFiles > 0;

    if (text.find(ZERO_MARKER) != std::string::npos) {
        if (haveFiles) {
            return {JobStatus::success()};
        }
        if (force) {
            return {JobStatus::failed("no subtitles found online", ErrorKind::NoSubtitles)};
        }
        if (probeEmbedded) {
            if (auto name = probeEmbedded()) {
                return {JobStatus::embedded(embeddedReason(*name))};
            }
        }
        if (containsAny(text, ALREADY_SATISFIED_MARKERS)) {
            const std::string code = languages.empty() ? "unknown" : languages.front();
            return {JobStatus::embedded(embeddedReason(languageName(code)))};
        }
        return {JobStatus::failed("no subtitles available, embedded or external", ErrorKind::NoSubtitles)};
    }

    if (containsAny(text, ERROR_MARKERS)) {
        if (containsAny(text, CACHE_ERROR_MARKERS)) {
            if (haveFiles) {
                return {JobStatus::success(), true};
            }
            return {JobStatus::failed("recoverable cache error, retry later", ErrorKind::RecoverableCacheError)};
        }
        if (haveFiles) {
            return {JobStatus::success()};
        }
        return {JobStatus::failed("tool reported error", ErrorKind::ToolReportedError)};
    }

    return {JobStatus::success()};
}

}
