/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace xferd {

using Clock = std::chrono::system_clock;
using Millis = std::chrono::milliseconds;

[[nodiscard]] std::string trim(std::string_view value);
[[nodiscard]] std::string toLower(std::string_view value);
[[nodiscard]] bool startsWith(std::string_view value, std::string_view prefix) noexcept;
[[nodiscard]] bool endsWith(std::string_view value, std::string_view suffix) noexcept;
[[nodiscard]] bool contains(std::string_view value, std::string_view needle) noexcept;
[[nodiscard]] std::vector<std::string> split(std::string_view value, char sep);

// RFC3339 UTC with millisecond precision ("2025-01-02T03:04:05.123Z").
[[nodiscard]] std::string formatTimestamp(Clock::time_point tp);
[[nodiscard]] std::string nowTimestamp();
// Accepts "Z" or numeric offsets and any number of fractional digits.
[[nodiscard]] std::optional<Clock::time_point> parseTimestamp(const std::string& value);

// "1.6s", "800ms", "2m0s" style, used in log messages.
[[nodiscard]] std::string formatDuration(Millis d);
// Parses "800ms", "2s", "1h30m", "1.5s". Returns nullopt on malformed input.
[[nodiscard]] std::optional<Millis> parseDuration(const std::string& value);

[[nodiscard]] std::optional<Json::Value> parseJson(const std::string& text, std::string* error = nullptr);
[[nodiscard]] std::string toJsonLine(const Json::Value& value);
[[nodiscard]] std::string toJsonPretty(const Json::Value& value);

// Writes content to path via a sibling temp file and rename.
[[nodiscard]] bool writeFileAtomic(const std::string& path, const std::string& content) noexcept;
[[nodiscard]] std::optional<std::string> readFile(const std::string& path) noexcept;

} // namespace xferd
