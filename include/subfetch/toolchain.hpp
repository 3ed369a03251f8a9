/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace subfetch {

// Stage one is the package installer (pipx), stage two the fetch tool itself.
enum class Stage : uint8_t {
    Pipx = 1,
    Subliminal = 2
};

const char* stageName(Stage stage) noexcept;

struct InstallResult {
    bool success = false;
    std::string message;
};

// Probes and installs the two external dependencies. Every call may block
// on subprocesses, so callers run them off their own thread.
class DependencyProbe {
public:
    virtual ~DependencyProbe() = default;

    [[nodiscard]] virtual bool stage1Available() = 0;
    [[nodiscard]] virtual bool stage2Available() = 0;

    virtual InstallResult installStage1() = 0;
    virtual InstallResult installStage2() = 0;
};

class ToolchainProbe final : public DependencyProbe {
public:
    ToolchainProbe() = default;

    [[nodiscard]] bool stage1Available() override;
    [[nodiscard]] bool stage2Available() override;

    InstallResult installStage1() override;
    InstallResult installStage2() override;

    // "Python 3.x.y" as reported by the first working interpreter.
    [[nodiscard]] static std::optional<std::string> pythonVersion();

    // Adds ~/.local/bin (where pip --user and pipx put scripts) to the PATH
    // every later subprocess is looked up in and inherits.
    static void refreshPath();
};

}
