/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <deque>
#include <mutex>
#include <optional>

namespace subfetch {

// Unbounded multi-producer queue with a close flag. Once closed, send() fails,
// which producers treat as the receiver having gone away.
template <typename T>
class Channel final {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool send(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        return true;
    }

    [[nodiscard]] std::optional<T> tryReceive() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    void close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

private:
    std::mutex mutex_;
    std::deque<T> queue_;
    bool closed_ = false;
};

// Single-assignment result slot: written once by a producer thread, drained once by the owner.
template <typename T>
class OneShot final {
public:
    OneShot() = default;

    OneShot(const OneShot&) = delete;
    OneShot& operator=(const OneShot&) = delete;

    bool set(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (written_) {
            return false;
        }
        value_ = std::move(value);
        written_ = true;
        return true;
    }

    [[nodiscard]] std::optional<T> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> out = std::move(value_);
        value_.reset();
        return out;
    }

    // Allows the slot to be armed again for a new install attempt.
    void rearm() {
        std::lock_guard<std::mutex> lock(mutex_);
        value_.reset();
        written_ = false;
    }

private:
    std::mutex mutex_;
    std::optional<T> value_;
    bool written_ = false;
};

}
