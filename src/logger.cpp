/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/logger.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace subfetch {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;
static std::ostream* g_sink = nullptr;
static LogLevel g_sink_level = LogLevel::INFO;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::setSink(std::ostream* sink, LogLevel sinkLevel) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = sink;
    g_sink_level = sinkLevel;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        const bool toConsole = static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
        bool toSink = false;
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            toSink = g_sink && static_cast<uint8_t>(level) <= static_cast<uint8_t>(g_sink_level);
        }
        if (!toConsole && !toSink) {
            return; // Skip if below threshold
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::string thread_info;
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            auto tid = std::this_thread::get_id();
            auto it = g_thread_names.find(tid);
            if (it != g_thread_names.end()) {
                thread_info = it->second;
            } else {
                std::ostringstream oss;
                oss << "T" << tid;
                thread_info = oss.str();
            }
        }

        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << thread_info << "]";
        ss << " " << message;

        {
            // All logs go to stderr - stdout is reserved for progress output
            std::lock_guard<std::mutex> lock(g_log_mutex);
            if (toConsole) {
                std::cerr << ss.str() << std::endl;
            }
            if (toSink && g_sink) {
                *g_sink << ss.str() << '\n';
                g_sink->flush();
            }
        }
    } catch (...) {
        // Never throw from logging - would cause infinite loops
        std::fputs("subfetch: log write failed\n", stderr);
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("SUBFETCH_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

LogFile::LogFile(const std::filesystem::path& path, LogLevel level) : path_(path) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
        LOG_WARN("Cannot create log directory " + path_.parent_path().string() + ": " + ec.message());
        return;
    }

    stream_.open(path_, std::ios::out | std::ios::app);
    if (!stream_) {
        LOG_WARN("Cannot open log file: " + path_.string());
        return;
    }
    Logger::setSink(&stream_, level);
}

LogFile::~LogFile() {
    if (stream_.is_open()) {
        Logger::setSink(nullptr);
        stream_.flush();
    }
}

// Helper function to name threads for better logging
void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

}
