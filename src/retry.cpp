/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/retry.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sys/stat.h>

namespace xferd {

namespace {

// FNV-1a; only used to give sample files a stable short name.
std::uint32_t fnv1a(const std::string& data) noexcept {
    std::uint32_t hash = 2166136261u;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

std::string compactUtcStamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

} // namespace

std::chrono::milliseconds retryDelay(const RetryPolicy& policy, int attempt,
                                     ErrorCode code, double unit) noexcept {
    using std::chrono::milliseconds;

    double base = static_cast<double>(policy.baseDelay.count());
    if (base <= 0) {
        base = 800;
    }
    if (code == ErrorCode::RateLimited) {
        base *= 2;
    }

    int exp = attempt - 1;
    if (exp < 0) {
        exp = 0;
    }
    double delay = base * std::pow(2.0, exp);
    const double cap = static_cast<double>(policy.maxDelay.count());
    if (cap > 0 && delay > cap) {
        delay = cap;
    }

    double ratio = policy.jitterRatio;
    if (ratio > 0) {
        if (ratio > 1) ratio = 1;
        if (unit < 0) unit = 0;
        if (unit > 1) unit = 1;
        delay *= 1.0 + ratio * (2.0 * unit - 1.0);
        if (cap > 0 && delay > cap) {
            delay = cap;
        }
    }
    if (delay < 0) {
        delay = base;
    }
    return milliseconds(static_cast<milliseconds::rep>(std::llround(delay)));
}

JitterSource::JitterSource() : rng_(std::random_device{}()) {}

JitterSource::JitterSource(std::function<double()> fixed) : fixed_(std::move(fixed)) {}

double JitterSource::next() {
    if (fixed_) {
        return fixed_();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return dist_(rng_);
}

void UnknownErrorRecorder::record(const std::string& jobId, const std::string& provider,
                                  const std::string& context, const std::string& message) noexcept {
    if (!enabled_) {
        return;
    }
    try {
        std::string msg = trim(message);
        if (msg.empty()) {
            return;
        }
        if (msg.size() > kMaxSampleBytes) {
            msg = msg.substr(0, kMaxSampleBytes) + "\n...[truncated]\n";
        }

        char hash[16];
        std::snprintf(hash, sizeof(hash), "%08x", fnv1a(context + "\n" + msg));
        auto name = compactUtcStamp() + "_" + hash + ".txt";

        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            LOG_DEBUG("Cannot create unknown error sample dir: " + ec.message());
            return;
        }
        ::chmod(dir_.c_str(), 0700);

        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_DEBUG("Cannot write unknown error sample: " + path.string());
            return;
        }
        out << "captured_at=" << nowTimestamp() << "\n"
            << "job_id=" << jobId << "\n"
            << "provider=" << provider << "\n"
            << "context=" << context << "\n\n"
            << msg << "\n";
        out.close();
        ::chmod(path.c_str(), 0600);
    } catch (const std::exception& e) {
        LOG_DEBUG("Unknown error sample capture failed: " + std::string(e.what()));
    }
}

} // namespace xferd
