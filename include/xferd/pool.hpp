/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "xferd/context.hpp"
#include "xferd/types.hpp"

namespace xferd {

using JobProcessor = std::function<void(const JobId&)>;

// Fixed-capacity FIFO of job ids drained by one dispatcher thread. Each
// dispatched job runs on its own thread while holding one of `concurrency`
// slots.
class Pool {
public:
    Pool(std::size_t capacity, int concurrency) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    // Stops dispatching and joins every job thread. Running jobs must be
    // told to finish by the caller.
    void stop() noexcept;

    // Never blocks; false when the queue is full or the pool is stopped.
    [[nodiscard]] bool tryPush(const JobId& jobId);
    // Waits for room. False when the pool stops or `ctx` ends first.
    [[nodiscard]] bool pushBlocking(const JobId& jobId, const Context::Ptr& ctx);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] QueueStats stats() const noexcept;
    // Jobs currently holding a slot.
    [[nodiscard]] int active() const noexcept { return active_.load(); }
    [[nodiscard]] int concurrency() const noexcept { return concurrency_; }

private:
    void dispatchLoop();
    void jobMain(const JobId& jobId);
    void reapFinishedLocked();

    std::size_t capacity_;
    int concurrency_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> active_{0};

    mutable std::mutex mutex_;
    std::condition_variable dispatchCv_;
    std::condition_variable spaceCv_;
    std::deque<JobId> queue_;

    std::thread dispatcher_;
    std::map<std::thread::id, std::thread> jobThreads_;
    std::vector<std::thread::id> finished_;
};

} // namespace xferd
