/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "subfetch/types.hpp"

namespace subfetch {

struct Outcome {
    JobStatus status;
    bool recoverableWarning = false;   // cache error seen, subtitles fetched anyway
};

// Deferred embedded-subtitle lookup; only invoked on the "nothing fetched" path.
using EmbeddedLookup = std::function<std::optional<std::string>()>;

/*
 * Turns the fetch tool's combined output into a terminal status.
 *
 * Files found on disk take precedence over anything the text claims. The
 * text is matched case-insensitively against fixed markers:
 *   "downloaded 0 subtitle"  nothing fetched
 *   "error" / "failed"       tool-reported failure
 *   "dbm.error", "db type could not be determined"
 *                            recoverable cache corruption
 * Output with none of these markers counts as success.
 */
[[nodiscard]] Outcome classifyOutcome(const std::string& output,
                                      std::size_t discoveredFiles,
                                      bool force,
                                      const Languages& languages,
                                      const EmbeddedLookup& probeEmbedded);

[[nodiscard]] std::string embeddedReason(const std::string& languageName);

}
