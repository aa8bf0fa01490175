/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "xferd/context.hpp"
#include "xferd/log_parser.hpp"
#include "xferd/types.hpp"

namespace xferd {

class Store;
class Hub;

// Bounded queue of stats samples. Producers never block: a full channel
// drops the sample.
class StatsChannel {
public:
    explicit StatsChannel(std::size_t capacity = 128) noexcept : capacity_(capacity) {}

    StatsChannel(const StatsChannel&) = delete;
    StatsChannel& operator=(const StatsChannel&) = delete;

    bool trySend(const StatsUpdate& update);
    // Blocks until a sample arrives; nullopt once closed and drained.
    [[nodiscard]] std::optional<StatsUpdate> receive();
    void close() noexcept;

private:
    std::size_t capacity_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StatsUpdate> queue_;
    bool closed_ = false;
};

// Persists progress snapshots and announces them as `job.progress`.
class ProgressReporter {
public:
    ProgressReporter(Store& store, Hub& hub) noexcept : store_(store), hub_(hub) {}

    // Store update bounded by kStoreTimeout, then publish with status running.
    void report(const JobId& jobId, const JobProgress& progress);
    [[nodiscard]] std::optional<JobProgress> load(const JobId& jobId);

    static constexpr std::chrono::milliseconds kStoreTimeout{2000};

private:
    Store& store_;
    Hub& hub_;
};

// Folds stats samples into job progress: totals only grow to positive
// values. Done counters never go backwards: they start from the stored
// snapshot and hold their highest value while a retried attempt recounts
// from zero.
class ProgressTracker {
public:
    ProgressTracker(ProgressReporter& reporter, JobId jobId) noexcept
        : reporter_(reporter), jobId_(std::move(jobId)) {}

    // Consumes the channel until it is closed or the context ends.
    void run(const Context::Ptr& ctx, StatsChannel& channel);

    // Merges one sample and reports the result.
    void apply(const StatsUpdate& update);

private:
    void loadTotals();

    ProgressReporter& reporter_;
    JobId jobId_;
    std::optional<std::int64_t> objectsTotal_;
    std::optional<std::int64_t> bytesTotal_;
    std::int64_t objectsDone_ = 0;
    std::int64_t bytesDone_ = 0;
    bool loaded_ = false;
};

} // namespace xferd
