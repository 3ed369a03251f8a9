/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "subfetch/types.hpp"

namespace subfetch {

// Finds subtitle files that sit next to a video.
class SubtitleLocator {
public:
    virtual ~SubtitleLocator() = default;

    // Per language the first `<stem>.<lang>.<ext>`, then the first generic `<stem>.<ext>`.
    [[nodiscard]] virtual std::vector<std::filesystem::path>
    find(const std::filesystem::path& video, const Languages& languages) const = 0;
};

// Detects subtitle streams already muxed into a container.
class EmbeddedProbe {
public:
    virtual ~EmbeddedProbe() = default;

    // Name of the first requested language found embedded, if any.
    [[nodiscard]] virtual std::optional<std::string>
    embeddedLanguage(const std::filesystem::path& video, const Languages& languages) const = 0;
};

class FilesystemLocator final : public SubtitleLocator {
public:
    [[nodiscard]] std::vector<std::filesystem::path>
    find(const std::filesystem::path& video, const Languages& languages) const override;
};

// Runs `ffprobe` read-only over the subtitle streams.
class FfprobeProbe final : public EmbeddedProbe {
public:
    explicit FfprobeProbe(std::string binary = "ffprobe");

    [[nodiscard]] std::optional<std::string>
    embeddedLanguage(const std::filesystem::path& video, const Languages& languages) const override;

    // Parses `index,language` lines as printed with `-of csv=p=0`.
    [[nodiscard]] static std::optional<std::string>
    matchStreams(const std::string& csv, const Languages& languages);

private:
    std::string binary_;
};

// Human-readable name for a language code; unknown codes are returned unchanged.
[[nodiscard]] std::string languageName(const std::string& code);

[[nodiscard]] bool isVideoFile(const std::filesystem::path& path);

// True when at least one requested language has neither a language-specific
// nor a generic subtitle file.
[[nodiscard]] bool missingSubtitle(const std::filesystem::path& video, const Languages& languages);

[[nodiscard]] std::string toLower(std::string value);

}
