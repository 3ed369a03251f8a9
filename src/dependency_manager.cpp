/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/dependency_manager.hpp"
#include "subfetch/logger.hpp"

namespace subfetch {

DependencyManager::DependencyManager(InstallationMonitor& monitor, bool autoInstall, PathRefresher refreshPath)
    : monitor_(monitor), autoInstall_(autoInstall), refreshPath_(std::move(refreshPath)) {
}

void DependencyManager::apply(const Availability& status) {
    const bool hadStage1 = state_.stage1Available;
    const bool hadStage2 = state_.stage2Available;
    const bool first = !seenStatus_;
    seenStatus_ = true;

    state_.stage1Available = status.stage1;
    // Stage two is only meaningful once stage one is there
    if (state_.stage1Available) {
        state_.stage2Available = status.stage2;
    }

    if (!state_.stage1Available) {
        status_ = "pipx not found. Run 'subfetch deps' to install it.";
    }

    const bool stage1Appeared = state_.stage1Available && (first || !hadStage1);
    if (stage1Appeared && !state_.stage2Available && autoInstall_ && !stage2Triggered_) {
        LOG_INFO("pipx available, starting automatic Subliminal installation");
        status_ = "pipx detected! Installing Subliminal...";
        requestStage2Install();
    }

    if (!hadStage2 && state_.stage2Available) {
        LOG_INFO("Subliminal became available");
    }
    if (ready()) {
        status_ = "All dependencies installed! Ready to download subtitles.";
    }
}

std::vector<InstallEvent> DependencyManager::update() {
    std::vector<InstallEvent> events;

    if (auto status = monitor_.poll()) {
        apply(*status);
    }

    drain(Stage::Pipx, events);
    drain(Stage::Subliminal, events);
    return events;
}

bool DependencyManager::requestStage1Install() {
    if (state_.installingStage1) {
        return false;
    }
    if (!monitor_.startInstall(Stage::Pipx)) {
        return false;
    }
    state_.installingStage1 = true;
    status_ = "Installing pipx...";
    return true;
}

bool DependencyManager::requestStage2Install() {
    if (state_.installingStage2) {
        return false;
    }
    if (!monitor_.startInstall(Stage::Subliminal)) {
        return false;
    }
    stage2Triggered_ = true;
    state_.installingStage2 = true;
    status_ = "Installing Subliminal...";
    return true;
}

void DependencyManager::drain(Stage stage, std::vector<InstallEvent>& events) {
    bool& installing = stage == Stage::Pipx ? state_.installingStage1 : state_.installingStage2;
    if (!installing) {
        return;
    }

    auto result = monitor_.takeInstallResult(stage);
    if (!result) {
        return;
    }
    installing = false;

    if (result->success) {
        if (refreshPath_) {
            refreshPath_();
        }
        if (stage == Stage::Subliminal) {
            state_.stage2Available = true;
            status_ = ready() ? "All dependencies installed! Ready to download subtitles." : "Subliminal installed.";
        } else {
            status_ = "pipx installed. Waiting for it to become available...";
        }
        LOG_INFO(std::string(stageName(stage)) + " installation completed: " + result->message);
    } else {
        status_ = std::string(stageName(stage)) + " install failed: " + result->message;
        LOG_ERROR(status_);
    }

    events.push_back(InstallEvent{stage, std::move(*result)});
}

}
