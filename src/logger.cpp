/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace xferd {

namespace {

std::mutex g_mutex;
LogLevel g_level = LogLevel::INFO;
bool g_configured = false;
std::unordered_map<std::thread::id, std::string> g_threads;

LogLevel levelFromEnv() noexcept {
    LogLevel level = LogLevel::INFO;
    if (const char* env = std::getenv("XFERD_LOG_LEVEL")) {
        if (!Logger::parseLevel(env, level)) {
            level = LogLevel::INFO;
        }
    }
    return level;
}

// UTC, millisecond precision; same shape as job timestamps.
std::string stamp() {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

// Caller holds g_mutex.
std::string threadLabel() {
    auto it = g_threads.find(std::this_thread::get_id());
    if (it != g_threads.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

bool needsQuotes(const std::string& value) {
    for (char c : value) {
        if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') {
            return true;
        }
    }
    return false;
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

} // namespace

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
    g_configured = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = levelFromEnv();
    g_configured = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_configured) {
        g_level = levelFromEnv();
        g_configured = true;
    }
    return g_level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

bool Logger::parseLevel(const std::string& text, LogLevel& out) noexcept {
    std::string v;
    v.reserve(text.size());
    for (char c : text) {
        if (c != ' ' && c != '\t') {
            v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (v == "error") out = LogLevel::ERROR;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "trace") out = LogLevel::TRACE;
    else return false;
    return true;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }
    try {
        const std::string ts = stamp();
        std::lock_guard<std::mutex> lock(g_mutex);
        // stderr only; stdout is reserved for command output and the job log mirror
        std::cerr << ts << " [" << levelToString(level) << "] [" << threadLabel() << "] " << message << std::endl;
    } catch (const std::exception&) {
        // Logging must never throw into the caller
    }
}

std::string Logger::formatEvent(const std::string& name, const LogFields& fields) {
    std::string line = "event=" + name;
    for (const auto& field : fields) {
        if (field.second.empty()) {
            continue;
        }
        line += ' ';
        line += field.first;
        line += '=';
        line += needsQuotes(field.second) ? quote(field.second) : field.second;
    }
    return line;
}

void Logger::event(LogLevel level, const std::string& name, const LogFields& fields) noexcept {
    if (!enabled(level)) {
        return;
    }
    try {
        log(level, formatEvent(name, fields));
    } catch (const std::exception&) {
        // Logging must never throw into the caller
    }
}

void Logger::writeStdout(const std::string& line) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_mutex);
        std::cout << line << '\n' << std::flush;
    } catch (const std::exception&) {
        // Logging must never throw into the caller
    }
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKN ";
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_threads[std::this_thread::get_id()] = name;
}

void clearThreadName() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_threads.erase(std::this_thread::get_id());
}

}
