/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "subfetch/fetch_tool.hpp"
#include "subfetch/subtitles.hpp"
#include "subfetch/toolchain.hpp"

namespace subfetch::test {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        do {
            path_ = base / ("subfetch-test-" + std::to_string(rd()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path touch(const std::filesystem::path& relative, const std::string& content = "x") const {
        auto full = path_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream(full) << content;
        return full;
    }

private:
    std::filesystem::path path_;
};

// Scripted fetch tool: sleeps, records peak concurrency, returns fixed output.
class FakeFetchTool final : public FetchTool {
public:
    explicit FakeFetchTool(std::string output = "Downloaded 1 subtitle",
                           std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : output_(std::move(output)), delay_(delay) {}

    FetchResult fetch(const FetchRequest& request) override {
        int now = active_.fetch_add(1) + 1;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        calls_.fetch_add(1);

        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        FetchResult result;
        if (launchable_) {
            result.launched = true;
            result.exitCode = 0;
            result.output = toLower(output_);
            result.launcher = "fake";
        } else {
            result.error = "No such file or directory";
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.push_back(request.target);
        }
        active_.fetch_sub(1);
        return result;
    }

    void setLaunchable(bool launchable) { launchable_ = launchable; }

    int peak() const { return peak_.load(); }
    int calls() const { return calls_.load(); }
    std::vector<std::filesystem::path> seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }

private:
    std::string output_;
    std::chrono::milliseconds delay_;
    bool launchable_ = true;

    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};

    mutable std::mutex mutex_;
    std::vector<std::filesystem::path> seen_;
};

// Reports a fixed number of subtitle files next to every video.
class FakeLocator final : public SubtitleLocator {
public:
    explicit FakeLocator(std::size_t count = 1) : count_(count) {}

    std::vector<std::filesystem::path>
    find(const std::filesystem::path& video, const Languages& languages) const override {
        std::vector<std::filesystem::path> out;
        for (std::size_t i = 0; i < count_ && i < languages.size(); ++i) {
            out.push_back(video.parent_path() / (video.stem().string() + "." + languages[i] + ".srt"));
        }
        return out;
    }

private:
    std::size_t count_;
};

class FakeProbe final : public EmbeddedProbe {
public:
    explicit FakeProbe(std::optional<std::string> language = std::nullopt) : language_(std::move(language)) {}

    std::optional<std::string>
    embeddedLanguage(const std::filesystem::path&, const Languages&) const override {
        calls_.fetch_add(1);
        return language_;
    }

    int calls() const { return calls_.load(); }

private:
    std::optional<std::string> language_;
    mutable std::atomic<int> calls_{0};
};

// Dependency probe whose answers can be flipped from the test thread.
class FakeDependencies final : public DependencyProbe {
public:
    std::atomic<bool> stage1{false};
    std::atomic<bool> stage2{false};
    std::atomic<bool> installSucceeds{true};
    std::atomic<int> stage1Probes{0};
    std::atomic<int> stage2Probes{0};
    std::atomic<int> stage1Installs{0};
    std::atomic<int> stage2Installs{0};
    std::chrono::milliseconds installDelay{0};

    bool stage1Available() override {
        stage1Probes.fetch_add(1);
        return stage1.load();
    }
    bool stage2Available() override {
        stage2Probes.fetch_add(1);
        return stage2.load();
    }
    InstallResult installStage1() override {
        stage1Installs.fetch_add(1);
        return finishInstall(stage1, "pipx installed");
    }
    InstallResult installStage2() override {
        stage2Installs.fetch_add(1);
        return finishInstall(stage2, "subliminal installed");
    }

private:
    InstallResult finishInstall(std::atomic<bool>& flag, const std::string& message) {
        if (installDelay.count() > 0) {
            std::this_thread::sleep_for(installDelay);
        }
        InstallResult result;
        result.success = installSucceeds.load();
        result.message = result.success ? message : "install failed";
        if (result.success) {
            flag.store(true);
        }
        return result;
    }
};

// Polls `condition` until it holds or `timeout` passes.
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

}
