/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/pool.hpp"
#include "xferd/logger.hpp"

#include <chrono>

namespace xferd {

Pool::Pool(std::size_t capacity, int concurrency) noexcept
    : capacity_(capacity < 1 ? 1 : capacity), concurrency_(concurrency < 1 ? 1 : concurrency) {
    LOG_DEBUG("Pool created with capacity " + std::to_string(capacity_) + " and " +
              std::to_string(concurrency_) + " slots");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        dispatcher_ = std::thread(&Pool::dispatchLoop, this);
        LOG_INFO("Pool started with " + std::to_string(concurrency_) + " job slots");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    dispatchCv_.notify_all();
    spaceCv_.notify_all();

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    std::map<std::thread::id, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(jobThreads_);
        finished_.clear();
        // Still queued in the store; picked up again on the next start.
        queue_.clear();
    }
    for (auto& entry : threads) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }

    LOG_INFO("Pool stopped");
}

bool Pool::tryPush(const JobId& jobId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load() || !running_.load()) {
            LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
            return false;
        }
        if (queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(jobId);
    }
    dispatchCv_.notify_all();
    LOG_DEBUG("Job queued: " + jobId);
    return true;
}

bool Pool::pushBlocking(const JobId& jobId, const Context::Ptr& ctx) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (shutdown_.load() || !running_.load() || ctx->done()) {
                return false;
            }
            if (queue_.size() < capacity_) {
                break;
            }
            spaceCv_.wait_for(lock, std::chrono::milliseconds(100));
        }
        queue_.push_back(jobId);
    }
    dispatchCv_.notify_all();
    LOG_DEBUG("Job queued: " + jobId);
    return true;
}

QueueStats Pool::stats() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueStats{queue_.size(), capacity_};
}

void Pool::reapFinishedLocked() {
    for (const auto& id : finished_) {
        auto it = jobThreads_.find(id);
        if (it != jobThreads_.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            jobThreads_.erase(it);
        }
    }
    finished_.clear();
}

void Pool::dispatchLoop() {
    setThreadName("Dispatcher");
    LOG_DEBUG("Dispatcher thread started");

    try {
        while (!shutdown_.load()) {
            std::unique_lock<std::mutex> lock(mutex_);
            dispatchCv_.wait(lock, [this] { return !queue_.empty() || shutdown_.load(); });
            if (shutdown_.load()) {
                break;
            }

            JobId jobId = queue_.front();
            queue_.pop_front();
            spaceCv_.notify_one();

            // Wait for a free slot with the job already out of the queue.
            dispatchCv_.wait(lock, [this] { return active_.load() < concurrency_ || shutdown_.load(); });
            if (shutdown_.load()) {
                LOG_DEBUG("Dropping dispatch of " + jobId + " on shutdown");
                break;
            }

            reapFinishedLocked();
            std::thread worker(&Pool::jobMain, this, jobId);
            active_.fetch_add(1);
            auto id = worker.get_id();
            jobThreads_.emplace(id, std::move(worker));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatcher fatal error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Dispatcher unknown fatal error");
    }

    LOG_DEBUG("Dispatcher stopped");
    clearThreadName();
}

void Pool::jobMain(const JobId& jobId) {
    setThreadName("Job-" + jobId);
    try {
        processor_(jobId);
    } catch (const std::exception& e) {
        LOG_ERROR("Job processing error: " + std::string(e.what()) + " (job: " + jobId + ")");
    } catch (...) {
        LOG_ERROR("Unknown job processing error (job: " + jobId + ")");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.fetch_sub(1);
        finished_.push_back(std::this_thread::get_id());
    }
    dispatchCv_.notify_all();
    clearThreadName();
}

} // namespace xferd
