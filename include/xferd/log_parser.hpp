/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace xferd {

// `stats` block of a transfer tool JSON log line.
struct EngineStats {
    std::int64_t bytes = 0;
    std::int64_t totalBytes = 0;
    std::int64_t transfers = 0;
    std::int64_t totalTransfers = 0;
    double speed = 0.0;
    std::optional<double> eta;
    std::int64_t deletes = 0;
};

struct ParsedLine {
    // Empty when the line is not JSON; callers fall back to the raw line.
    std::string rendered;
    std::optional<EngineStats> stats;
};

// Which counter drives objectsDone.
enum class ProgressMode : std::uint8_t { Transfers, Deletes };

// One progress sample derived from a stats block.
struct StatsUpdate {
    std::int64_t bytesDone = 0;
    std::optional<std::int64_t> bytesTotal;
    std::int64_t objectsDone = 0;
    std::optional<std::int64_t> objectsTotal;
    std::optional<std::int64_t> speedBps;
    std::optional<std::int64_t> etaSeconds;
};

[[nodiscard]] ParsedLine parseEngineLine(const std::string& line);
[[nodiscard]] StatsUpdate progressFromStats(const EngineStats& stats, ProgressMode mode);

} // namespace xferd
