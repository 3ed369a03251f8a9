/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "subfetch/channel.hpp"
#include "subfetch/config.hpp"
#include "subfetch/toolchain.hpp"

namespace subfetch {

struct Availability {
    bool stage1 = false;
    bool stage2 = false;

    [[nodiscard]] bool ready() const noexcept { return stage1 && stage2; }
    bool operator==(const Availability& other) const noexcept {
        return stage1 == other.stage1 && stage2 == other.stage2;
    }
};

/*
 * Background dependency watcher.
 *
 * One thread probes both stages (stage two only once stage one is there),
 * sends the pair over a channel, and exits as soon as both are available or
 * the channel is closed. Installer threads run one attempt each and leave
 * their result in a one-shot cell for the owner to take.
 *
 * Threads share their state through a shared_ptr, so stop() can give up on
 * a slow installer after the timeout and detach it safely.
 */
class InstallationMonitor final {
public:
    explicit InstallationMonitor(std::shared_ptr<DependencyProbe> probe,
                                 std::chrono::milliseconds interval = MONITOR_PROBE_INTERVAL,
                                 std::chrono::milliseconds slice = MONITOR_SLEEP_SLICE);
    ~InstallationMonitor();

    InstallationMonitor(const InstallationMonitor&) = delete;
    InstallationMonitor& operator=(const InstallationMonitor&) = delete;
    InstallationMonitor(InstallationMonitor&&) = delete;
    InstallationMonitor& operator=(InstallationMonitor&&) = delete;

    bool start();

    // Closes the channel and joins every thread, detaching any that outlive `timeout`.
    // Returns true when all threads were joined.
    bool stop(std::chrono::milliseconds timeout = MONITOR_JOIN_TIMEOUT) noexcept;

    // Drains the channel and returns the most recent status, if any arrived.
    [[nodiscard]] std::optional<Availability> poll();

    // Starts one install attempt for `stage`. False if one is already in progress.
    bool startInstall(Stage stage);
    [[nodiscard]] bool installing(Stage stage) const noexcept;
    [[nodiscard]] std::optional<InstallResult> takeInstallResult(Stage stage);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t probesSent() const noexcept { return shared_->sent.load(); }

private:
    struct Shared {
        explicit Shared(std::shared_ptr<DependencyProbe> p) : probe(std::move(p)) {}

        std::shared_ptr<DependencyProbe> probe;
        Channel<Availability> channel;
        std::atomic<bool> shutdown{false};
        std::atomic<std::size_t> sent{0};

        OneShot<InstallResult> stage1Result;
        OneShot<InstallResult> stage2Result;
        std::atomic<bool> installingStage1{false};
        std::atomic<bool> installingStage2{false};

        OneShot<InstallResult>& result(Stage stage) noexcept {
            return stage == Stage::Pipx ? stage1Result : stage2Result;
        }
        std::atomic<bool>& installing(Stage stage) noexcept {
            return stage == Stage::Pipx ? installingStage1 : installingStage2;
        }
    };

    struct Tracked {
        std::thread thread;
        std::future<void> done;
    };

    static void probeLoop(std::shared_ptr<Shared> shared,
                          std::chrono::milliseconds interval,
                          std::chrono::milliseconds slice,
                          std::promise<void> done);
    static void installOnce(std::shared_ptr<Shared> shared, Stage stage, std::promise<void> done);

    static bool joinBefore(Tracked& tracked, std::chrono::steady_clock::time_point deadline) noexcept;

    std::shared_ptr<Shared> shared_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds slice_;

    std::atomic<bool> running_{false};
    Tracked probeThread_;

    std::mutex installersMutex_;
    std::vector<Tracked> installers_;
};

}
