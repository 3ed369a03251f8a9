/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>
#include <vector>

#include "subfetch/installation_monitor.hpp"
#include "subfetch/toolchain.hpp"

namespace subfetch {

struct DependencyState {
    bool stage1Available = false;
    bool stage2Available = false;
    bool installingStage1 = false;
    bool installingStage2 = false;
};

struct InstallEvent {
    Stage stage;
    InstallResult result;
};

// Caller-side view of the dependencies. Applies the monitor's status
// transitions and starts the subliminal installer automatically, at most once,
// when pipx is present but subliminal is not. Single-threaded: call from the owner.
class DependencyManager final {
public:
    using PathRefresher = std::function<void()>;

    explicit DependencyManager(InstallationMonitor& monitor,
                               bool autoInstall = true,
                               PathRefresher refreshPath = &ToolchainProbe::refreshPath);

    DependencyManager(const DependencyManager&) = delete;
    DependencyManager& operator=(const DependencyManager&) = delete;

    // Applies one observed status.
    void apply(const Availability& status);

    // Polls the monitor, applies the latest status and drains finished installs.
    std::vector<InstallEvent> update();

    bool requestStage1Install();
    bool requestStage2Install();

    [[nodiscard]] const DependencyState& state() const noexcept { return state_; }
    // True once at least one status has been applied.
    [[nodiscard]] bool checked() const noexcept { return seenStatus_; }
    [[nodiscard]] bool ready() const noexcept { return state_.stage1Available && state_.stage2Available; }
    [[nodiscard]] bool installing() const noexcept { return state_.installingStage1 || state_.installingStage2; }
    [[nodiscard]] const std::string& statusText() const noexcept { return status_; }

private:
    void drain(Stage stage, std::vector<InstallEvent>& events);

    InstallationMonitor& monitor_;
    bool autoInstall_;
    PathRefresher refreshPath_;

    DependencyState state_;
    bool stage2Triggered_ = false;
    bool seenStatus_ = false;
    std::string status_ = "Checking dependencies...";
};

}
