/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/manager.hpp"
#include "xferd/errors.hpp"
#include "xferd/hub.hpp"
#include "xferd/job_log.hpp"
#include "xferd/logger.hpp"
#include "xferd/store.hpp"
#include "xferd/util.hpp"

#include <csignal>

namespace xferd {

namespace {

Context::Ptr storeContext() {
    return Context::withTimeout(Context::background(), Manager::kStoreTimeout);
}

Event completedEvent(const JobId& jobId, const JobOutcome& outcome, const std::optional<JobProgress>& progress) {
    Event event;
    event.type = "job.completed";
    event.jobId = jobId;
    event.payload["status"] = toString(outcome.status);
    if (outcome.error) {
        event.payload["error"] = *outcome.error;
    }
    if (outcome.code) {
        event.payload["errorCode"] = toString(*outcome.code);
    }
    if (progress) {
        event.payload["progress"] = progressToJson(*progress);
    }
    return event;
}

} // namespace

Manager::Manager(const Config& config, Store& store, Hub& hub)
    : config_(config),
      store_(store),
      hub_(hub),
      runner_(config, store, hub, *this),
      executor_(config, store, runner_),
      pool_(config.queueCapacity, config.concurrency),
      rootCtx_(Context::withCancel(Context::background())) {}

Manager::~Manager() {
    stop();
}

bool Manager::start() {
    return pool_.start([this](const JobId& jobId) { runJob(jobId); });
}

void Manager::stop() noexcept {
    rootCtx_->cancel();
    pool_.stop();
    std::lock_guard<std::mutex> lock(submitterMutex_);
    if (submitter_.joinable()) {
        submitter_.join();
    }
}

bool Manager::enqueue(const JobId& jobId) {
    if (!pool_.tryPush(jobId)) {
        if (!pool_.isRunning()) {
            LOG_WARN(std::string(kNotAcceptingMessage) + ": " + jobId);
        } else {
            LOG_WARN(std::string(kQueueFullMessage) + ": " + jobId);
        }
        return false;
    }
    return true;
}

bool Manager::enqueueBlocking(const JobId& jobId) {
    return pool_.pushBlocking(jobId, rootCtx_);
}

void Manager::cancel(const JobId& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto pid = pids_.find(jobId);
    if (pid != pids_.end() && pid->second > 0) {
        ::kill(-pid->second, SIGKILL);
    }
    auto ctx = cancels_.find(jobId);
    if (ctx != cancels_.end()) {
        LOG_INFO("Canceling job " + jobId);
        ctx->second->cancel();
    }
}

bool Manager::isRunning(const JobId& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancels_.count(jobId) > 0;
}

void Manager::registerPid(const JobId& jobId, pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    pids_[jobId] = pid;
}

void Manager::clearPid(const JobId& jobId, pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pids_.find(jobId);
    if (it != pids_.end() && it->second == pid) {
        pids_.erase(it);
    }
}

void Manager::runJob(const JobId& jobId) {
    auto job = store_.getJob(storeContext(), jobId);
    if (!job) {
        LOG_WARN("Job not found: " + jobId);
        return;
    }
    if (job->status != JobStatus::Queued) {
        LOG_DEBUG("Skipping job " + jobId + " in status " + toString(job->status));
        return;
    }
    if (!store_.claimJob(storeContext(), jobId, nowTimestamp())) {
        LOG_DEBUG("Job " + jobId + " was claimed elsewhere");
        return;
    }

    const auto started = std::chrono::steady_clock::now();
    LOG_EVENT(INFO, "job.started", {{"job_id", jobId}, {"job_type", job->type}, {"profile_id", job->profileId}});

    auto ctx = Context::withCancel(rootCtx_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancels_[jobId] = ctx;
    }
    struct Unregister {
        Manager& self;
        const JobId& id;
        const Context::Ptr& ctx;
        ~Unregister() {
            ctx->cancel();
            std::lock_guard<std::mutex> lock(self.mutex_);
            self.cancels_.erase(id);
            self.pids_.erase(id);
        }
    } unregister{*this, jobId, ctx};

    {
        Event event;
        event.type = "job.progress";
        event.jobId = jobId;
        event.payload["status"] = toString(JobStatus::Running);
        hub_.publish(std::move(event));
    }

    JobLog log(jobId, config_.jobLogDir() / (jobId + ".log"), config_.jobLogMaxBytes, hub_,
               config_.jobLogEmitStdout);
    if (!log.open()) {
        LOG_WARN("Job " + jobId + " runs without a log file");
    }

    JobOutcome outcome;
    std::optional<ErrorCode> failure;
    std::string message;
    try {
        auto profile = store_.getProfileSecrets(storeContext(), job->profileId);
        if (!profile) {
            throw JobError(ErrorCode::NotFound, "profile not found");
        }
        auto type = parseJobType(job->type);
        if (!type) {
            throw ValidationError("unsupported job type: " + job->type);
        }

        JobRun run;
        run.jobId = jobId;
        run.type = *type;
        run.profile = std::move(*profile);
        run.ctx = ctx;
        run.log = &log;
        executor_.execute(run, *type, job->payload);
    } catch (const JobError& e) {
        failure = e.code();
        message = e.what();
    } catch (const std::exception& e) {
        failure = ErrorCode::Unknown;
        message = e.what();
    }

    if (ctx->canceled()) {
        outcome.status = JobStatus::Canceled;
        outcome.code = ErrorCode::Canceled;
    } else if (failure) {
        outcome.status = JobStatus::Failed;
        outcome.code = *failure;
        outcome.error = formatJobErrorMessage(message, *failure);
    } else {
        outcome.status = JobStatus::Succeeded;
    }

    finalize(*job, outcome, std::chrono::steady_clock::now() - started);
}

void Manager::finalize(const Job& job, const JobOutcome& outcome, std::chrono::steady_clock::duration elapsed) {
    std::optional<JobProgress> progress;
    if (auto current = store_.getJob(storeContext(), job.id)) {
        progress = finalizeProgress(current->progress);
    }

    std::optional<std::string> code;
    if (outcome.code) {
        code = toString(*outcome.code);
    }
    if (!store_.finishJob(storeContext(), job.id, outcome.status, nowTimestamp(), progress, outcome.error, code)) {
        LOG_ERROR("Failed to persist final status for job " + job.id);
    }

    hub_.publish(completedEvent(job.id, outcome, progress));

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    LogFields fields{{"job_id", job.id},
                     {"job_type", job.type},
                     {"profile_id", job.profileId},
                     {"status", toString(outcome.status)},
                     {"error_code", code.value_or("")},
                     {"duration_ms", std::to_string(ms)}};
    if (outcome.status == JobStatus::Failed) {
        fields.emplace_back("error", outcome.error.value_or(""));
        LOG_EVENT(ERROR, "job.completed", fields);
    } else {
        LOG_EVENT(INFO, "job.completed", fields);
    }
}

bool Manager::recoverAndRequeue() {
    auto ctx = Context::withTimeout(rootCtx_, std::chrono::seconds(30));
    CancelGuard guard(ctx);

    const std::string message = "server restarted";
    const auto code = ErrorCode::ServerRestarted;
    for (const auto& id : store_.listJobIdsByStatus(ctx, JobStatus::Running)) {
        auto job = store_.getJob(ctx, id);
        if (!job) {
            continue;
        }
        auto progress = finalizeProgress(job->progress);
        if (!store_.finishJob(storeContext(), id, JobStatus::Failed, nowTimestamp(), progress, message,
                              std::string(toString(code)))) {
            LOG_ERROR("Failed to mark interrupted job " + id + " as failed");
            return false;
        }

        JobOutcome outcome{JobStatus::Failed, message, code};
        hub_.publish(completedEvent(id, outcome, progress));
        LOG_EVENT(ERROR, "job.completed",
                  {{"job_id", id},
                   {"job_type", job->type},
                   {"profile_id", job->profileId},
                   {"status", toString(JobStatus::Failed)},
                   {"error_code", toString(code)},
                   {"error", message}});
    }

    if (ctx->done()) {
        LOG_ERROR("Recovery did not finish in time");
        return false;
    }

    auto queued = store_.listJobIdsByStatus(ctx, JobStatus::Queued);
    for (std::size_t i = 0; i < queued.size(); ++i) {
        if (!pool_.tryPush(queued[i])) {
            std::vector<JobId> remaining(queued.begin() + static_cast<std::ptrdiff_t>(i), queued.end());
            LOG_INFO("Queue full during recovery; submitting " + std::to_string(remaining.size()) +
                     " job(s) in the background");
            submitRemaining(std::move(remaining));
            break;
        }
    }
    if (!queued.empty()) {
        LOG_INFO("Requeued " + std::to_string(queued.size()) + " job(s)");
    }
    return true;
}

void Manager::submitRemaining(std::vector<JobId> ids) {
    std::lock_guard<std::mutex> lock(submitterMutex_);
    if (submitter_.joinable()) {
        submitter_.join();
    }
    submitter_ = std::thread([this, ids = std::move(ids)] {
        setThreadName("Submitter");
        for (const auto& id : ids) {
            if (!enqueueBlocking(id)) {
                LOG_DEBUG("Background submitter stopped before " + id);
                break;
            }
        }
        clearThreadName();
    });
}

} // namespace xferd
