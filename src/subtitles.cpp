/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/subtitles.hpp"
#include "subfetch/config.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/process.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace subfetch {

namespace {

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::optional<std::filesystem::path> firstExisting(const std::filesystem::path& folder,
                                                   const std::string& base) {
    for (const char* ext : SUBTITLE_EXTENSIONS) {
        auto candidate = folder / (base + "." + ext);
        if (fileExists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}

std::string toLower(std::string value) {
    for (char& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}

std::vector<std::filesystem::path>
FilesystemLocator::find(const std::filesystem::path& video, const Languages& languages) const {
    std::vector<std::filesystem::path> found;
    const auto folder = video.parent_path();
    const std::string stem = video.stem().string();
    if (stem.empty()) {
        return found;
    }

    LOG_DEBUG("Searching for subtitle files for " + video.string() + " in " + folder.string());

    for (const auto& lang : languages) {
        if (auto hit = firstExisting(folder, stem + "." + lang)) {
            LOG_DEBUG("Found language-specific subtitle: " + hit->string());
            found.push_back(*hit);
        }
    }
    if (auto generic = firstExisting(folder, stem)) {
        LOG_DEBUG("Found generic subtitle: " + generic->string());
        found.push_back(*generic);
    }

    LOG_DEBUG("Found " + std::to_string(found.size()) + " subtitle files for " + video.string());
    return found;
}

FfprobeProbe::FfprobeProbe(std::string binary) : binary_(std::move(binary)) {}

std::optional<std::string>
FfprobeProbe::embeddedLanguage(const std::filesystem::path& video, const Languages& languages) const {
    auto result = runProcess(binary_, {
        "-v", "error",
        "-select_streams", "s",
        "-show_entries", "stream=index:stream_tags=language",
        "-of", "csv=p=0",
        video.string()
    });

    if (!result.launched) {
        LOG_WARN("Embedded subtitle probe unavailable: " + result.error);
        return std::nullopt;
    }
    if (result.exitCode != 0) {
        LOG_DEBUG("ffprobe exited with " + std::to_string(result.exitCode) + " for " + video.string());
        return std::nullopt;
    }
    return matchStreams(result.out, languages);
}

std::optional<std::string> FfprobeProbe::matchStreams(const std::string& csv, const Languages& languages) {
    std::istringstream lines(csv);
    std::string line;
    while (std::getline(lines, line)) {
        auto comma = line.find(',');
        if (comma == std::string::npos) {
            continue;
        }
        std::string lang = toLower(trim(line.substr(comma + 1)));
        if (lang.empty()) {
            continue;
        }
        // ffprobe reports ISO 639-2 ("eng"); accept a 2-letter request as a prefix
        for (const auto& requested : languages) {
            std::string req = toLower(requested);
            if (!req.empty() && lang.compare(0, req.size(), req) == 0) {
                return languageName(requested);
            }
        }
    }
    return std::nullopt;
}

std::string languageName(const std::string& code) {
    static const std::unordered_map<std::string, std::string> names = {
        {"en", "English"}, {"en-us", "English (US)"}, {"en-gb", "English (UK)"},
        {"fr", "French"}, {"fr-ca", "French (Canada)"},
        {"es", "Spanish"}, {"es-mx", "Spanish (Mexico)"}, {"es-es", "Spanish (Spain)"},
        {"de", "German"}, {"de-at", "German (Austria)"}, {"de-ch", "German (Switzerland)"},
        {"it", "Italian"}, {"it-ch", "Italian (Switzerland)"},
        {"pt", "Portuguese"}, {"pt-br", "Portuguese (Brazil)"}, {"pt-pt", "Portuguese (Portugal)"},
        {"nl", "Dutch"}, {"nl-be", "Dutch (Belgium)"},
        {"pl", "Polish"}, {"ru", "Russian"}, {"sv", "Swedish"}, {"fi", "Finnish"},
        {"da", "Danish"}, {"no", "Norwegian"}, {"cs", "Czech"}, {"hu", "Hungarian"},
        {"ro", "Romanian"}, {"bg", "Bulgarian"}, {"hr", "Croatian"}, {"et", "Estonian"},
        {"el", "Greek"}, {"is", "Icelandic"}, {"lv", "Latvian"}, {"lt", "Lithuanian"},
        {"mt", "Maltese"}, {"sk", "Slovak"}, {"sl", "Slovenian"}, {"tr", "Turkish"},
        {"uk", "Ukrainian"},
        {"he", "Hebrew"}, {"ar", "Arabic"}, {"ja", "Japanese"}, {"ko", "Korean"},
        {"zh", "Chinese"}, {"zh-cn", "Chinese (Simplified)"}, {"zh-tw", "Chinese (Traditional)"},
        {"th", "Thai"}, {"vi", "Vietnamese"}, {"id", "Indonesian"}, {"ms", "Malay"},
        {"fil", "Filipino/Tagalog"}, {"bn", "Bengali"}, {"hi", "Hindi"}, {"ur", "Urdu"},
        {"fa", "Persian/Farsi"},
        {"af", "Afrikaans"}, {"sw", "Swahili"}, {"zu", "Zulu"}, {"xh", "Xhosa"},
        {"ku", "Kurdish"}, {"az", "Azerbaijani"}, {"ka", "Georgian"}, {"am", "Amharic"},
        {"ta", "Tamil"}, {"te", "Telugu"}, {"kn", "Kannada"}, {"ml", "Malayalam"},
        {"gu", "Gujarati"}, {"pa", "Punjabi"}, {"or", "Odia"},
        {"mn", "Mongolian"}, {"my", "Burmese"}, {"lo", "Lao"}, {"km", "Khmer"},
    };

    auto it = names.find(code);
    return it != names.end() ? it->second : code;
}

bool isVideoFile(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return false;
    }
    ext = toLower(ext.substr(1));
    return std::any_of(VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end(),
                       [&ext](const char* known) { return ext == known; });
}

bool missingSubtitle(const std::filesystem::path& video, const Languages& languages) {
    const auto folder = video.parent_path();
    const std::string stem = video.stem().string();
    if (stem.empty()) {
        return false;
    }

    const bool hasGeneric = firstExisting(folder, stem).has_value();
    for (const auto& lang : languages) {
        if (!hasGeneric && !firstExisting(folder, stem + "." + lang)) {
            return true;
        }
    }
    return false;
}

}
