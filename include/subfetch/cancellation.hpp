/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>

namespace subfetch {

// Cooperative stop flag. Checked before admitting or launching work; a running
// subprocess is never interrupted.
class CancellationToken final {
public:
    CancellationToken() noexcept = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true); }
    void reset() noexcept { cancelled_.store(false); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}
