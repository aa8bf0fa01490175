/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "xferd/retry.hpp"

namespace xferd {

// Parallelism knobs handed to the transfer tool, divided across active jobs.
struct EngineTuning {
    bool enabled = true;
    int maxTransfers = 16;
    int maxCheckers = 32;
    int s3ChunkSizeMiB = 0;
    int s3UploadConcurrency = 0;
};

// Built once at startup and passed by reference; nothing below reads the environment.
struct Config {
    std::filesystem::path dataDir;

    int concurrency = 2;
    std::size_t queueCapacity = 256;

    std::uint64_t jobLogMaxBytes = 0;
    std::size_t jobLogMaxLineBytes = 256 * 1024;
    bool jobLogEmitStdout = false;

    std::chrono::milliseconds jobRetention{0};
    std::chrono::milliseconds jobLogRetention{0};
    std::chrono::milliseconds uploadSessionTTL{std::chrono::hours(24)};
    std::chrono::milliseconds maintenanceInterval{std::chrono::minutes(30)};

    std::vector<std::filesystem::path> allowedLocalDirs;

    // Explicit transfer tool path; empty means local fallbacks then PATH.
    std::string enginePath;
    std::chrono::milliseconds statsInterval{2000};
    RetryPolicy retry;
    bool captureUnknownErrors = false;
    EngineTuning tuning;

    static constexpr std::size_t kDefaultQueueCapacity = 256;
    static constexpr std::size_t kDefaultMaxLineBytes = 256 * 1024;
    static constexpr std::chrono::milliseconds kMinStatsInterval{500};

    // Defaults for a given data directory, with tuning derived from the CPU count.
    [[nodiscard]] static Config defaults(const std::filesystem::path& dataDir);
    [[nodiscard]] static Config fromEnvironment();

    // Applies the lower bounds and clamps every loader goes through.
    void normalize();

    [[nodiscard]] std::filesystem::path jobLogDir() const { return dataDir / "logs" / "jobs"; }
    [[nodiscard]] std::filesystem::path artifactDir() const { return dataDir / "artifacts" / "jobs"; }
    [[nodiscard]] std::filesystem::path stagingDir() const { return dataDir / "staging"; }
};

[[nodiscard]] int defaultMaxTransfers() noexcept;
[[nodiscard]] int defaultMaxCheckers() noexcept;

// Accepts 1/true/t/yes/y/on and 0/false/f/no/n/off, case-insensitive.
[[nodiscard]] std::optional<bool> parseBool(const std::string& value);

} // namespace xferd
