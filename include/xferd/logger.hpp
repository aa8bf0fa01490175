/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace xferd {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Ordered key=value pairs appended to an event line.
using LogFields = std::vector<std::pair<std::string, std::string>>;

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;
    // Accepts error, warn/warning, info, debug, trace in any case.
    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    // "event=<name> k=v ..." with values quoted when they hold spaces,
    // quotes or '='. Empty values are skipped.
    static void event(LogLevel level, const std::string& name, const LogFields& fields) noexcept;
    [[nodiscard]] static std::string formatEvent(const std::string& name, const LogFields& fields);

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Writes one line to stdout under the logger lock (job log mirroring).
    static void writeStdout(const std::string& line) noexcept;

private:
    static const char* levelToString(LogLevel level) noexcept;
};

// Names the calling thread in log lines ("Dispatcher", "Job-<id>", ...).
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::xferd::Logger::error(msg)
#define LOG_WARN(msg)  ::xferd::Logger::warn(msg)
#define LOG_INFO(msg)  ::xferd::Logger::info(msg)
#define LOG_DEBUG(msg) ::xferd::Logger::debug(msg)
#define LOG_TRACE(msg) ::xferd::Logger::trace(msg)
#define LOG_EVENT(level, name, ...) ::xferd::Logger::event(::xferd::LogLevel::level, name, __VA_ARGS__)
