/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/installation_monitor.hpp"
#include "subfetch/logger.hpp"
#include <stdexcept>

namespace subfetch {

InstallationMonitor::InstallationMonitor(std::shared_ptr<DependencyProbe> probe,
                                         std::chrono::milliseconds interval,
                                         std::chrono::milliseconds slice)
    : interval_(interval), slice_(slice) {
    if (!probe) {
        throw std::invalid_argument("InstallationMonitor requires a dependency probe");
    }
    if (slice_.count() <= 0) {
        throw std::invalid_argument("Monitor sleep slice must be positive");
    }
    shared_ = std::make_shared<Shared>(std::move(probe));
}

InstallationMonitor::~InstallationMonitor() {
    stop();
}

bool InstallationMonitor::start() {
    if (running_.load() || probeThread_.thread.joinable()) {
        LOG_WARN("Installation monitor already started");
        return false;
    }

    try {
        std::promise<void> done;
        probeThread_.done = done.get_future();
        probeThread_.thread = std::thread(&InstallationMonitor::probeLoop, shared_, interval_, slice_, std::move(done));
        running_.store(true);
        LOG_DEBUG("Installation monitor started - probe every " + std::to_string(interval_.count()) + "ms");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start installation monitor: " + std::string(e.what()));
        return false;
    }
}

bool InstallationMonitor::stop(std::chrono::milliseconds timeout) noexcept {
    shared_->shutdown.store(true);
    shared_->channel.close();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool joined = joinBefore(probeThread_, deadline);

    std::vector<Tracked> installers;
    {
        std::lock_guard<std::mutex> lock(installersMutex_);
        installers.swap(installers_);
    }
    for (auto& installer : installers) {
        joined = joinBefore(installer, deadline) && joined;
    }

    if (running_.exchange(false)) {
        LOG_DEBUG(std::string("Installation monitor stopped") + (joined ? "" : " (threads detached)"));
    }
    return joined;
}

std::optional<Availability> InstallationMonitor::poll() {
    std::optional<Availability> last;
    while (auto status = shared_->channel.tryReceive()) {
        last = *status;
    }
    if (last && last->ready()) {
        running_.store(false);
    }
    return last;
}

bool InstallationMonitor::startInstall(Stage stage) {
    if (shared_->shutdown.load()) {
        LOG_WARN(std::string("Monitor stopped, not installing ") + stageName(stage));
        return false;
    }

    auto& flag = shared_->installing(stage);
    if (flag.exchange(true)) {
        LOG_DEBUG(std::string(stageName(stage)) + " install already in progress");
        return false;
    }

    // A result nobody took before this attempt is discarded
    shared_->result(stage).rearm();

    try {
        std::promise<void> done;
        Tracked tracked;
        tracked.done = done.get_future();
        tracked.thread = std::thread(&InstallationMonitor::installOnce, shared_, stage, std::move(done));

        std::lock_guard<std::mutex> lock(installersMutex_);
        installers_.push_back(std::move(tracked));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to start ") + stageName(stage) + " installer: " + e.what());
        flag.store(false);
        return false;
    }
}

bool InstallationMonitor::installing(Stage stage) const noexcept {
    return shared_->installing(stage).load();
}

std::optional<InstallResult> InstallationMonitor::takeInstallResult(Stage stage) {
    return shared_->result(stage).take();
}

void InstallationMonitor::probeLoop(std::shared_ptr<Shared> shared,
                                    std::chrono::milliseconds interval,
                                    std::chrono::milliseconds slice,
                                    std::promise<void> done) {
    setThreadName("Monitor");
    LOG_TRACE("Dependency probe loop started");

    try {
        while (!shared->shutdown.load()) {
            Availability status;
            status.stage1 = shared->probe->stage1Available();
            status.stage2 = status.stage1 && shared->probe->stage2Available();

            if (!shared->channel.send(status)) {
                LOG_DEBUG("Dependency status receiver gone, stopping probe loop");
                break;
            }
            shared->sent.fetch_add(1);
            LOG_TRACE(std::string("Dependency status: pipx=") + (status.stage1 ? "yes" : "no") +
                      " subliminal=" + (status.stage2 ? "yes" : "no"));

            if (status.ready()) {
                LOG_DEBUG("All dependencies available, probe loop done");
                break;
            }

            // Sleep in short slices so shutdown is noticed quickly
            auto wakeAt = std::chrono::steady_clock::now() + interval;
            while (!shared->shutdown.load() && std::chrono::steady_clock::now() < wakeAt) {
                std::this_thread::sleep_for(slice);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Dependency probe loop error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown dependency probe loop error");
    }

    done.set_value();
}

void InstallationMonitor::installOnce(std::shared_ptr<Shared> shared, Stage stage, std::promise<void> done) {
    setThreadName(std::string("Install-") + stageName(stage));

    InstallResult result;
    try {
        result = stage == Stage::Pipx ? shared->probe->installStage1() : shared->probe->installStage2();
    } catch (const std::exception& e) {
        result.success = false;
        result.message = std::string(stageName(stage)) + " installer error: " + e.what();
        LOG_ERROR(result.message);
    } catch (...) {
        result.success = false;
        result.message = std::string(stageName(stage)) + " installer error: unknown exception";
        LOG_ERROR(result.message);
    }

    shared->result(stage).set(std::move(result));
    shared->installing(stage).store(false);
    done.set_value();
}

bool InstallationMonitor::joinBefore(Tracked& tracked, std::chrono::steady_clock::time_point deadline) noexcept {
    if (!tracked.thread.joinable()) {
        return true;
    }

    try {
        if (tracked.done.valid() && tracked.done.wait_until(deadline) != std::future_status::ready) {
            LOG_WARN("Background thread did not finish in time, detaching");
            tracked.thread.detach();
            return false;
        }
        tracked.thread.join();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to join background thread: " + std::string(e.what()));
        return false;
    }
}

}
