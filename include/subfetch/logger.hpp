/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace subfetch {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    // Mirror every emitted line into `sink` (nullptr detaches). The caller owns the stream.
    // Secondary output with its own threshold, independent of the console level.
    static void setSink(std::ostream* sink, LogLevel sinkLevel = LogLevel::INFO) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Append-mode log file attached to the Logger for the lifetime of the object.
class LogFile final {
public:
    explicit LogFile(const std::filesystem::path& path, LogLevel level = LogLevel::INFO);
    ~LogFile();

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    [[nodiscard]] bool isOpen() const noexcept { return stream_.is_open(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream stream_;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::subfetch::Logger::error(msg)
#define LOG_WARN(msg)  ::subfetch::Logger::warn(msg)
#define LOG_INFO(msg)  ::subfetch::Logger::info(msg)
#define LOG_DEBUG(msg) ::subfetch::Logger::debug(msg)
#define LOG_TRACE(msg) ::subfetch::Logger::trace(msg)
