/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/toolchain.hpp"
#include "subfetch/logger.hpp"
#include "subfetch/process.hpp"
#include "subfetch/subtitles.hpp"
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

namespace subfetch {

namespace {

struct Command {
    const char* program;
    std::vector<std::string> args;
};

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string firstLine(const std::string& s) {
    std::string t = trim(s);
    return t.substr(0, t.find('\n'));
}

// Runs the commands in order until one exits 0. Returns the winner's program name.
std::optional<std::string> runFirstSuccessful(const std::vector<Command>& commands, std::string& lastError) {
    for (const auto& command : commands) {
        ProcessResult result = runProcess(command.program, command.args);
        if (result.ok()) {
            return std::string(command.program);
        }
        if (!result.launched) {
            LOG_DEBUG(std::string(command.program) + " not runnable: " + result.error);
            lastError = std::string(command.program) + ": " + result.error;
        } else {
            LOG_WARN(std::string(command.program) + " exited with " + std::to_string(result.exitCode) + ": " +
                     firstLine(result.err));
            lastError = std::string(command.program) + ": " + firstLine(result.err);
        }
    }
    return std::nullopt;
}

}

const char* stageName(Stage stage) noexcept {
    switch (stage) {
        case Stage::Pipx: return "pipx";
        case Stage::Subliminal: return "subliminal";
    }
    return "unknown";
}

bool ToolchainProbe::stage1Available() {
    ProcessResult result = runProcess("pipx", {"--version"});
    LOG_TRACE("pipx --version: " + (result.launched ? std::to_string(result.exitCode) : result.error));
    return result.ok();
}

bool ToolchainProbe::stage2Available() {
    ProcessResult direct = runProcess("subliminal", {"--version"});
    if (direct.ok() && (direct.out.find("subliminal") != std::string::npos ||
                        direct.err.find("subliminal") != std::string::npos)) {
        LOG_DEBUG("Subliminal found as direct command");
        return true;
    }

    ProcessResult pipx = runProcess("pipx", {"list"});
    if (pipx.ok() && toLower(pipx.out).find("subliminal") != std::string::npos) {
        LOG_DEBUG("Subliminal found via pipx list");
        return true;
    }

    for (const char* python : {"python3", "python", "py"}) {
        ProcessResult show = runProcess(python, {"-m", "pip", "show", "subliminal"});
        if (show.ok() && show.out.find("Name: subliminal") != std::string::npos) {
            LOG_DEBUG("Subliminal found via pip show using " + std::string(python));
            return true;
        }

        ProcessResult import = runProcess(python, {"-c", "import subliminal; print('subliminal available')"});
        if (import.ok() && import.out.find("subliminal available") != std::string::npos) {
            LOG_DEBUG("Subliminal found via direct import using " + std::string(python));
            return true;
        }
    }

    LOG_DEBUG("Subliminal not found");
    return false;
}

InstallResult ToolchainProbe::installStage1() {
    LOG_INFO("Attempting to install pipx");

    const std::vector<Command> attempts = {
        {"python3", {"-m", "pip", "install", "--user", "pipx"}},
        {"python", {"-m", "pip", "install", "--user", "pipx"}},
        {"apt", {"install", "-y", "python3-pipx"}},
        {"dnf", {"install", "-y", "python3-pipx"}},
        {"pacman", {"-S", "--noconfirm", "python-pipx"}},
    };

    InstallResult result;
    std::string lastError;
    if (auto winner = runFirstSuccessful(attempts, lastError)) {
        result.success = true;
        result.message = "pipx installed using " + *winner;
        LOG_INFO(result.message);
    } else {
        result.message = "Failed to install pipx" + (lastError.empty() ? std::string() : " (" + lastError + ")");
        LOG_ERROR(result.message);
    }
    return result;
}

InstallResult ToolchainProbe::installStage2() {
    LOG_INFO("Installing Subliminal via pipx");

    const std::vector<Command> attempts = {
        {"pipx", {"install", "subliminal"}},
        {"python3", {"-m", "pip", "install", "--user", "subliminal"}},
        {"python", {"-m", "pip", "install", "--user", "subliminal"}},
    };

    InstallResult result;
    std::string lastError;
    if (auto winner = runFirstSuccessful(attempts, lastError)) {
        result.success = true;
        result.message = "Subliminal installed using " + *winner;
        LOG_INFO(result.message);
    } else {
        result.message = "pipx/pip install failed" + (lastError.empty() ? std::string() : " (" + lastError + ")");
        LOG_ERROR(result.message);
    }
    return result;
}

std::optional<std::string> ToolchainProbe::pythonVersion() {
    for (const char* python : {"python3", "python", "py"}) {
        ProcessResult result = runProcess(python, {"--version"});
        if (!result.ok()) {
            continue;
        }
        std::string version = trim(result.out);
        if (version.empty()) {
            version = trim(result.err);
        }
        LOG_DEBUG("Python version output for " + std::string(python) + ": " + version);
        if (version.rfind("Python 3.", 0) == 0) {
            return version;
        }
    }
    LOG_DEBUG("No valid Python 3 installation found");
    return std::nullopt;
}

void ToolchainProbe::refreshPath() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        LOG_DEBUG("HOME not set, search path left unchanged");
        return;
    }

    const std::string localBin = (std::filesystem::path(home) / ".local" / "bin").string();
    if (addSearchDirectory(localBin)) {
        LOG_INFO("Added " + localBin + " to the tool search path");
    }
}

}
