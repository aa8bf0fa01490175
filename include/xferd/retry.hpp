/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>

#include "xferd/errors.hpp"

namespace xferd {

struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{800};
    std::chrono::milliseconds maxDelay{8000};
    double jitterRatio = 0.2;

    [[nodiscard]] bool shouldRetry(int attempt, const Classification& c) const noexcept {
        return attempt < maxAttempts && c.retryable;
    }
};

// base * 2^(attempt-1), capped at max; rate limiting doubles the base.
// `unit` in [0,1] picks the jitter point: 0.5 is no jitter, 1 is +ratio.
[[nodiscard]] std::chrono::milliseconds retryDelay(const RetryPolicy& policy, int attempt,
                                                   ErrorCode code, double unit) noexcept;

// Thread-safe source of jitter points.
class JitterSource {
public:
    JitterSource();
    explicit JitterSource(std::function<double()> fixed);

    [[nodiscard]] double next();

private:
    std::function<double()> fixed_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

// Persists unclassified failure samples for later taxonomy work.
// Diagnostic only; write failures are logged and otherwise ignored.
class UnknownErrorRecorder {
public:
    UnknownErrorRecorder(std::filesystem::path dataDir, bool enabled) noexcept
        : dir_(dataDir / "logs" / "rcloneerrors" / "unknown"), enabled_(enabled) {}

    void record(const std::string& jobId, const std::string& provider,
                const std::string& context, const std::string& message) noexcept;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

    static constexpr std::size_t kMaxSampleBytes = 8192;

private:
    std::filesystem::path dir_;
    bool enabled_;
};

} // namespace xferd
