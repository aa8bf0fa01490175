/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "xferd/config.hpp"
#include "xferd/context.hpp"
#include "xferd/engine.hpp"
#include "xferd/errors.hpp"
#include "xferd/job_log.hpp"
#include "xferd/log_parser.hpp"
#include "xferd/process.hpp"
#include "xferd/progress.hpp"
#include "xferd/remote.hpp"
#include "xferd/retry.hpp"
#include "xferd/types.hpp"

namespace xferd {

class Hub;
class Store;

// Everything one executing job carries through the runner and executors.
struct JobRun {
    JobId jobId;
    JobType type = JobType::SyncLocalToS3;
    ProfileSecrets profile;
    Context::Ptr ctx;
    JobLog* log = nullptr;
};

// Callbacks into the owner of the running jobs.
class RunnerHost {
public:
    virtual ~RunnerHost() = default;
    // Jobs currently holding a worker slot.
    [[nodiscard]] virtual int activeJobs() const noexcept = 0;
    virtual void registerPid(const JobId& jobId, pid_t pid) = 0;
    // Forgets the pid only if it is still the recorded one.
    virtual void clearPid(const JobId& jobId, pid_t pid) = 0;
};

struct RunOptions {
    bool trackProgress = false;
    bool dryRun = false;
    ProgressMode mode = ProgressMode::Transfers;
};

struct Tune {
    int activeJobs = 1;
    int transfers = 0;
    int checkers = 0;
    int uploadConcurrency = 0;
};

struct AttemptResult {
    bool ok = false;
    std::string stderrTail;
    std::string error;
};

[[nodiscard]] bool hasFlag(const std::vector<std::string>& args, const std::string& flag);

// Fair share of the parallelism budget for one of `activeJobs` jobs.
// nullopt for commands that do not transfer or delete.
[[nodiscard]] std::optional<Tune> computeTune(const EngineTuning& tuning,
                                              const std::vector<std::string>& commandArgs,
                                              bool isS3, int activeJobs);
void applyTune(std::vector<std::string>& args, const Tune& tune, bool isS3);

// Builds the job error for a failed invocation: "<context>: <stderr or error>".
[[nodiscard]] JobError engineFailure(const std::string& processError, const std::string& stderrText,
                                     const std::string& context);

// A started engine process whose stdout the caller consumes. wait() reaps
// the child, collects stderr and removes the config and TLS files once.
class EngineProcess {
public:
    EngineProcess(std::unique_ptr<ChildProcess> child, std::filesystem::path configPath,
                  std::unique_ptr<TlsMaterial> tls, const Context::Ptr& ctx);
    ~EngineProcess();

    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;

    [[nodiscard]] int stdoutFd() const noexcept { return child_->stdoutFd(); }
    [[nodiscard]] pid_t pid() const noexcept { return child_->pid(); }
    // Kills the process group; wait() must still be called.
    void kill() noexcept { child_->killGroup(); }

    // Drains any unread stdout, then reaps. Returns false with the failure
    // description in `error`.
    [[nodiscard]] bool wait(std::string* error);
    // Available after wait().
    [[nodiscard]] const std::string& stderrText() const noexcept { return stderr_; }

private:
    void cleanup() noexcept;

    std::unique_ptr<ChildProcess> child_;
    std::filesystem::path configPath_;
    std::unique_ptr<TlsMaterial> tls_;
    Context::Ptr ctx_;
    std::atomic<bool> finished_{false};
    std::thread watcher_;
    std::thread stderrThread_;
    std::string stderr_;
    bool waited_ = false;
    std::optional<ExitStatus> status_;
};

// Drives the transfer tool for job executions.
class Runner final {
public:
    Runner(const Config& config, Store& store, Hub& hub, RunnerHost& host);

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    // Runs one command with retries, streaming output into the job log.
    // Throws JobError (CanceledError when the job context ends).
    void run(JobRun& job, const std::vector<std::string>& commandArgs, const RunOptions& options);

    // Starts a single invocation with only the config and TLS flags added.
    // `ctx` overrides the job context (preflight budgets).
    [[nodiscard]] std::unique_ptr<EngineProcess> start(JobRun& job, const std::vector<std::string>& args,
                                                       Context::Ptr ctx = nullptr);

    [[nodiscard]] EngineLocator& locator() noexcept { return locator_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] ProgressReporter& reporter() noexcept { return reporter_; }
    void setJitterSource(std::shared_ptr<JitterSource> jitter) { jitter_ = std::move(jitter); }

private:
    [[nodiscard]] AttemptResult attempt(JobRun& job, const std::string& enginePath,
                                        const std::vector<std::string>& args, const RunOptions& options,
                                        ProgressTracker* tracker);
    void pump(JobRun& job, int fd, const std::string& level, LogCapture* capture,
              StatsChannel* channel, ProgressMode mode);
    [[nodiscard]] std::filesystem::path configPath(const JobId& jobId) const;

    const Config& config_;
    ProgressReporter reporter_;
    RunnerHost& host_;
    EngineLocator locator_;
    UnknownErrorRecorder recorder_;
    std::shared_ptr<JitterSource> jitter_;
};

} // namespace xferd
