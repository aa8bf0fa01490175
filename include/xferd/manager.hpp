/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "xferd/config.hpp"
#include "xferd/context.hpp"
#include "xferd/executor.hpp"
#include "xferd/pool.hpp"
#include "xferd/runner.hpp"
#include "xferd/types.hpp"

namespace xferd {

class Hub;
class Store;

// Outcome of one job execution as persisted and announced.
struct JobOutcome {
    JobStatus status = JobStatus::Succeeded;
    std::optional<std::string> error;
    std::optional<ErrorCode> code;
};

// Owns the job queue and every running job: claim, execute, finalize,
// cancel and restart recovery.
class Manager final : public RunnerHost {
public:
    Manager(const Config& config, Store& store, Hub& hub);
    ~Manager() override;

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(Manager&&) = delete;

    [[nodiscard]] bool start();
    // Cancels running jobs, then joins the dispatcher, job threads and the
    // background submitter.
    void stop() noexcept;

    // Never blocks. False (logged as "job queue is full") when there is no room.
    [[nodiscard]] bool enqueue(const JobId& jobId);
    [[nodiscard]] bool enqueueBlocking(const JobId& jobId);

    // Kills the live process group and cancels the job context. No-op for
    // jobs that are not running here.
    void cancel(const JobId& jobId);
    [[nodiscard]] bool isRunning(const JobId& jobId) const;

    [[nodiscard]] QueueStats queueStats() const noexcept { return pool_.stats(); }

    // Runs one queued job to completion on the calling thread.
    void runJob(const JobId& jobId);

    // Fails jobs left running by a previous process and requeues the queued
    // ones in creation order. Returns false when the store could not be read.
    [[nodiscard]] bool recoverAndRequeue();

    // RunnerHost
    [[nodiscard]] int activeJobs() const noexcept override { return pool_.active(); }
    void registerPid(const JobId& jobId, pid_t pid) override;
    void clearPid(const JobId& jobId, pid_t pid) override;

    [[nodiscard]] Runner& runner() noexcept { return runner_; }

    static constexpr const char* kQueueFullMessage = "job queue is full";
    static constexpr const char* kNotAcceptingMessage = "job pool is not running";
    static constexpr std::chrono::milliseconds kStoreTimeout{2000};

private:
    void finalize(const Job& job, const JobOutcome& outcome, std::chrono::steady_clock::duration elapsed);
    void submitRemaining(std::vector<JobId> ids);

    const Config& config_;
    Store& store_;
    Hub& hub_;
    Runner runner_;
    Executor executor_;
    Pool pool_;
    Context::Ptr rootCtx_;

    mutable std::mutex mutex_;
    std::map<JobId, Context::Ptr> cancels_;
    std::map<JobId, pid_t> pids_;

    std::mutex submitterMutex_;
    std::thread submitter_;
};

} // namespace xferd
