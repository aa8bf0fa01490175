/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/progress.hpp"
#include "xferd/hub.hpp"
#include "xferd/logger.hpp"
#include "xferd/store.hpp"

#include <algorithm>

namespace xferd {

bool StatsChannel::trySend(const StatsUpdate& update) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(update);
    }
    cv_.notify_one();
    return true;
}

std::optional<StatsUpdate> StatsChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    StatsUpdate update = queue_.front();
    queue_.pop_front();
    return update;
}

void StatsChannel::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void ProgressReporter::report(const JobId& jobId, const JobProgress& progress) {
    auto ctx = Context::withTimeout(Context::background(), kStoreTimeout);
    if (!store_.updateJobProgress(ctx, jobId, progress)) {
        LOG_WARN("Progress update not persisted for job " + jobId);
    }

    Event event;
    event.type = "job.progress";
    event.jobId = jobId;
    event.payload["status"] = toString(JobStatus::Running);
    event.payload["progress"] = progressToJson(progress);
    hub_.publish(std::move(event));
}

std::optional<JobProgress> ProgressReporter::load(const JobId& jobId) {
    auto ctx = Context::withTimeout(Context::background(), kStoreTimeout);
    auto job = store_.getJob(ctx, jobId);
    if (!job) {
        return std::nullopt;
    }
    return job->progress;
}

void ProgressTracker::loadTotals() {
    loaded_ = true;
    auto progress = reporter_.load(jobId_);
    if (!progress) {
        return;
    }
    if (progress->objectsTotal) {
        objectsTotal_ = progress->objectsTotal;
    }
    if (progress->bytesTotal) {
        bytesTotal_ = progress->bytesTotal;
    }
    objectsDone_ = std::max(objectsDone_, progress->objectsDone.value_or(0));
    bytesDone_ = std::max(bytesDone_, progress->bytesDone.value_or(0));
}

void ProgressTracker::run(const Context::Ptr& ctx, StatsChannel& channel) {
    loadTotals();
    while (auto update = channel.receive()) {
        if (ctx->done()) {
            return;
        }
        apply(*update);
    }
}

void ProgressTracker::apply(const StatsUpdate& update) {
    if (!loaded_) {
        loadTotals();
    }
    if (update.objectsTotal && *update.objectsTotal > 0) {
        objectsTotal_ = update.objectsTotal;
    }
    if (update.bytesTotal && *update.bytesTotal > 0) {
        bytesTotal_ = update.bytesTotal;
    }
    if (!objectsTotal_ || !bytesTotal_) {
        loadTotals();
    }

    JobProgress jp;
    objectsDone_ = std::max(objectsDone_, update.objectsDone);
    bytesDone_ = std::max(bytesDone_, update.bytesDone);
    jp.objectsDone = objectsDone_;
    jp.bytesDone = bytesDone_;
    jp.objectsTotal = objectsTotal_;
    jp.bytesTotal = bytesTotal_;
    jp.speedBps = update.speedBps;
    jp.etaSeconds = update.etaSeconds;
    reporter_.report(jobId_, jp);
}

} // namespace xferd
