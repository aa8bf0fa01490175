/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/config.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace xferd {

namespace {

std::string env_string(const char* name) {
    const char* val = std::getenv(name);
    return val ? trim(val) : std::string();
}

int env_int(const char* name, int defv) {
    std::string val = env_string(name);
    if (val.empty()) {
        return defv;
    }
    try {
        std::size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != val.size()) {
            LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}

double env_float(const char* name, double defv) {
    std::string val = env_string(name);
    if (val.empty()) {
        return defv;
    }
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}

bool env_bool(const char* name, bool defv) {
    std::string val = env_string(name);
    if (val.empty()) {
        return defv;
    }
    auto parsed = parseBool(val);
    return parsed ? *parsed : defv;
}

std::chrono::milliseconds env_duration(const char* name, std::chrono::milliseconds defv) {
    std::string val = env_string(name);
    if (val.empty()) {
        return defv;
    }
    auto parsed = parseDuration(val);
    if (!parsed) {
        LOG_WARN(std::string("Ignoring malformed duration ") + name + "=" + val);
        return defv;
    }
    return *parsed;
}

int cpuCount() noexcept {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
}

} // namespace

std::optional<bool> parseBool(const std::string& value) {
    std::string v = toLower(trim(value));
    if (v == "1" || v == "true" || v == "t" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "0" || v == "false" || v == "f" || v == "no" || v == "n" || v == "off") return false;
    return std::nullopt;
}

int defaultMaxTransfers() noexcept {
    return std::clamp(cpuCount() * 4, 4, 128);
}

int defaultMaxCheckers() noexcept {
    return std::clamp(cpuCount() * 8, 8, 256);
}

Config Config::defaults(const std::filesystem::path& dataDir) {
    Config cfg;
    cfg.dataDir = dataDir;
    cfg.tuning.maxTransfers = defaultMaxTransfers();
    cfg.tuning.maxCheckers = defaultMaxCheckers();
    return cfg;
}

Config Config::fromEnvironment() {
    std::string dataDir = env_string("XFERD_DATA_DIR");
    Config cfg = defaults(dataDir.empty() ? std::filesystem::path("data") : std::filesystem::path(dataDir));

    cfg.concurrency = env_int("JOB_CONCURRENCY", cfg.concurrency);
    cfg.queueCapacity = static_cast<std::size_t>(
        std::max(0, env_int("JOB_QUEUE_CAPACITY", static_cast<int>(kDefaultQueueCapacity))));
    cfg.jobLogMaxLineBytes = static_cast<std::size_t>(
        std::max(0, env_int("JOB_LOG_MAX_LINE_BYTES", static_cast<int>(kDefaultMaxLineBytes))));
    cfg.jobLogMaxBytes = static_cast<std::uint64_t>(std::max(0, env_int("JOB_LOG_MAX_BYTES", 0)));
    cfg.jobLogEmitStdout = env_bool("JOB_LOG_EMIT_STDOUT", false);

    cfg.jobRetention = env_duration("JOB_RETENTION", cfg.jobRetention);
    cfg.jobLogRetention = env_duration("JOB_LOG_RETENTION", cfg.jobLogRetention);
    cfg.uploadSessionTTL = env_duration("UPLOAD_SESSION_TTL", cfg.uploadSessionTTL);

    for (const auto& dir : split(env_string("ALLOWED_LOCAL_DIRS"), ':')) {
        std::string d = trim(dir);
        if (!d.empty()) {
            cfg.allowedLocalDirs.emplace_back(d);
        }
    }

    cfg.enginePath = env_string("RCLONE_PATH");
    cfg.statsInterval = env_duration("RCLONE_STATS_INTERVAL", cfg.statsInterval);
    cfg.retry.maxAttempts = env_int("RCLONE_RETRY_ATTEMPTS", cfg.retry.maxAttempts);
    cfg.retry.baseDelay = env_duration("RCLONE_RETRY_BASE_DELAY", cfg.retry.baseDelay);
    cfg.retry.maxDelay = env_duration("RCLONE_RETRY_MAX_DELAY", cfg.retry.maxDelay);
    cfg.retry.jitterRatio = env_float("RCLONE_RETRY_JITTER_RATIO", cfg.retry.jitterRatio);
    cfg.captureUnknownErrors = env_bool("RCLONE_CAPTURE_UNKNOWN_ERRORS", false);

    cfg.tuning.enabled = env_bool("RCLONE_TUNE", true);
    cfg.tuning.maxTransfers = env_int("RCLONE_MAX_TRANSFERS", cfg.tuning.maxTransfers);
    cfg.tuning.maxCheckers = env_int("RCLONE_MAX_CHECKERS", cfg.tuning.maxCheckers);
    cfg.tuning.s3ChunkSizeMiB = env_int("RCLONE_S3_CHUNK_SIZE_MIB", 0);
    cfg.tuning.s3UploadConcurrency = env_int("RCLONE_S3_UPLOAD_CONCURRENCY", 0);

    cfg.normalize();
    return cfg;
}

void Config::normalize() {
    if (concurrency < 1) {
        concurrency = 1;
    }
    if (queueCapacity < 1) {
        queueCapacity = kDefaultQueueCapacity;
    }
    if (jobLogMaxLineBytes < 1) {
        jobLogMaxLineBytes = kDefaultMaxLineBytes;
    }
    if (statsInterval < kMinStatsInterval) {
        statsInterval = kMinStatsInterval;
    }
    if (retry.maxAttempts < 1) {
        retry.maxAttempts = 1;
    }
    if (retry.baseDelay.count() < 0) {
        retry.baseDelay = std::chrono::milliseconds(0);
    }
    if (retry.maxDelay < retry.baseDelay) {
        retry.maxDelay = retry.baseDelay;
    }
    retry.jitterRatio = std::clamp(retry.jitterRatio, 0.0, 1.0);

    std::vector<std::filesystem::path> cleaned;
    for (const auto& dir : allowedLocalDirs) {
        auto normal = dir.lexically_normal();
        if (normal.empty() || normal == ".") {
            continue;
        }
        cleaned.push_back(normal);
    }
    allowedLocalDirs = std::move(cleaned);
}

} // namespace xferd
