/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/util.hpp"
#include "xferd/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <unistd.h>

namespace xferd {

std::string trim(std::string_view value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return std::string(value.substr(begin, end - begin));
}

std::string toLower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool startsWith(std::string_view value, std::string_view prefix) noexcept {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view value, std::string_view suffix) noexcept {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(std::string_view value, std::string_view needle) noexcept {
    return value.find(needle) != std::string_view::npos;
}

std::vector<std::string> split(std::string_view value, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = value.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(value.substr(start));
            break;
        }
        parts.emplace_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string formatTimestamp(Clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp) {
        secs -= std::chrono::seconds(1);
    }
    auto ms = std::chrono::duration_cast<Millis>(tp - secs).count();
    std::time_t t = Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

std::string nowTimestamp() {
    return formatTimestamp(Clock::now());
}

std::optional<Clock::time_point> parseTimestamp(const std::string& raw) {
    const std::string value = trim(raw);
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(value.c_str(), "%4d-%2d-%2d%*1[Tt ]%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    std::size_t pos = static_cast<std::size_t>(consumed);

    std::chrono::nanoseconds fraction{0};
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        std::int64_t nanos = 0;
        int digits = 0;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (value[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits < 9) {
            nanos *= 10;
            ++digits;
        }
        fraction = std::chrono::nanoseconds(nanos);
    }

    int offsetSeconds = 0;
    if (pos < value.size()) {
        char c = value[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(value.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                return std::nullopt;
            }
            offsetSeconds = (oh * 3600 + om * 60) * (c == '-' ? -1 : 1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != value.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    auto tp = Clock::from_time_t(t) - std::chrono::seconds(offsetSeconds);
    return tp + std::chrono::duration_cast<Clock::duration>(fraction);
}

std::string formatDuration(Millis d) {
    auto total = d.count();
    if (total == 0) {
        return "0s";
    }
    if (total < 1000) {
        return std::to_string(total) + "ms";
    }
    std::ostringstream out;
    auto hours = total / 3600000;
    auto minutes = (total / 60000) % 60;
    double seconds = static_cast<double>(total % 60000) / 1000.0;
    if (hours > 0) out << hours << "h";
    if (hours > 0 || minutes > 0) out << minutes << "m";

    std::ostringstream secs;
    secs << std::fixed;
    secs.precision(3);
    secs << seconds;
    std::string s = secs.str();
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    out << s << "s";
    return out.str();
}

std::optional<Millis> parseDuration(const std::string& raw) {
    const std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    if (value == "0") {
        return Millis(0);
    }

    double totalMs = 0;
    std::size_t pos = 0;
    while (pos < value.size()) {
        std::size_t start = pos;
        while (pos < value.size() &&
               (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.')) {
            ++pos;
        }
        if (start == pos) {
            return std::nullopt;
        }
        double number = 0;
        try {
            number = std::stod(value.substr(start, pos - start));
        } catch (const std::exception&) {
            return std::nullopt;
        }

        std::size_t unitStart = pos;
        while (pos < value.size() && std::isalpha(static_cast<unsigned char>(value[pos]))) {
            ++pos;
        }
        std::string unit = value.substr(unitStart, pos - unitStart);
        if (unit == "ns") totalMs += number / 1e6;
        else if (unit == "us" || unit == "µs") totalMs += number / 1e3;
        else if (unit == "ms") totalMs += number;
        else if (unit == "s") totalMs += number * 1000.0;
        else if (unit == "m") totalMs += number * 60000.0;
        else if (unit == "h") totalMs += number * 3600000.0;
        else return std::nullopt;
    }
    return Millis(static_cast<Millis::rep>(std::llround(totalMs)));
}

std::optional<Json::Value> parseJson(const std::string& text, std::string* error) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        if (error) *error = errs;
        return std::nullopt;
    }
    return root;
}

std::string toJsonLine(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string toJsonPretty(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool writeFileAtomic(const std::string& path, const std::string& content) noexcept {
    try {
        static std::atomic<std::uint64_t> counter{0};
        std::string tmpPath = path + ".tmp." + std::to_string(::getpid()) + "." +
                              std::to_string(counter.fetch_add(1));
        {
            std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << content;
            file.flush();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(tmpPath, ec);
                return false;
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmpPath, path, ec);
        if (ec) {
            LOG_ERROR("Failed to publish " + path + ": " + ec.message());
            std::filesystem::remove(tmpPath, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + path + ": " + std::string(e.what()));
        return false;
    }
}

std::optional<std::string> readFile(const std::string& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read " + path + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

} // namespace xferd
