/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/server.hpp"
#include "xferd/errors.hpp"
#include "xferd/file_store.hpp"
#include "xferd/logger.hpp"
#include "xferd/maintenance.hpp"
#include "xferd/manager.hpp"
#include "xferd/util.hpp"

#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace xferd {

// Note: Signal handling is done by the CLI (xferd.cpp), not by Server class

namespace {

constexpr auto kStoreBudget = std::chrono::seconds(2);
constexpr std::size_t kSubmittedTrimThreshold = 1000;

} // namespace

Server::Server(Config config) : config_(std::move(config)) {
    LOG_DEBUG("Server created - data dir: " + config_.dataDir.string() +
              ", concurrency: " + std::to_string(config_.concurrency));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting xferd server...");

    if (!createDataDirs()) {
        LOG_ERROR("Failed to create data directories");
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("xferd Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Data dir: " + config_.dataDir.string());
    LOG_DEBUG("Concurrency: " + std::to_string(config_.concurrency));
    LOG_DEBUG("Queue capacity: " + std::to_string(config_.queueCapacity));
    LOG_DEBUG("Transfer engine: " + (config_.enginePath.empty() ? std::string("rclone (PATH)") : config_.enginePath));
    LOG_DEBUG("Maintenance interval: " + formatDuration(config_.maintenanceInterval));
    LOG_DEBUG("========================================");

    try {
        store_ = std::make_unique<FileStore>(config_.dataDir);
        if (!store_->initialize()) {
            LOG_ERROR("Failed to initialize store under " + config_.dataDir.string());
            return false;
        }

        manager_ = std::make_unique<Manager>(config_, *store_, hub_);
        if (!manager_->start()) {
            LOG_ERROR("Failed to start job manager");
            return false;
        }

        if (!manager_->recoverAndRequeue()) {
            LOG_WARN("Some interrupted jobs could not be recovered");
        }

        loopCtx_ = Context::withCancel(Context::background());
        for (const auto& jobId :
             store_->listJobIdsByStatus(Context::withTimeout(loopCtx_, kStoreBudget), JobStatus::Queued)) {
            submittedJobs_.insert(jobId);
        }
        maintenance_ = std::make_unique<Maintenance>(
            config_, *store_, hub_, [this](const JobId& id) { return manager_->isRunning(id); });

        running_.store(true);

        maintenanceThread_ = std::thread([this] { maintenance_->run(loopCtx_); });
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_INFO("Server started");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        if (manager_) {
            manager_->stop();
        }
        return;
    }

    LOG_INFO("Shutting down server...");

    loopCtx_->cancel();
    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }
    if (maintenanceThread_.joinable()) {
        maintenanceThread_.join();
    }

    // Running jobs observe the canceled root context and finish as canceled.
    manager_->stop();

    maintenance_.reset();
    manager_.reset();
    store_.reset();

    LOG_INFO("Server shutdown complete");
}

bool Server::createDataDirs() noexcept {
    const fs::path dirs[] = {config_.dataDir, config_.jobLogDir(), config_.artifactDir(), config_.stagingDir()};
    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("Failed to create " + dir.string() + ": " + ec.message());
            return false;
        }
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) {
            LOG_WARN("Failed to restrict permissions on " + dir.string() + ": " + ec.message());
        }
    }
    LOG_DEBUG("Data directories ready under " + config_.dataDir.string());
    return true;
}

void Server::scanOnce() {
    std::lock_guard<std::mutex> lock(scanMutex_);
    if (!running_.load()) {
        return;
    }
    processCancelMarkers();
    submitQueuedJobs();
}

void Server::processCancelMarkers() {
    std::error_code ec;
    fs::directory_iterator it(config_.jobLogDir(), ec);
    if (ec) {
        LOG_WARN("Failed to list " + config_.jobLogDir().string() + ": " + ec.message());
        return;
    }

    for (const auto& entry : it) {
        const auto jobId = jobIdFromFileName(entry.path().filename().string(), ".cmd");
        if (jobId.empty()) {
            continue;
        }

        auto command = readFile(entry.path().string());
        if (command && trim(*command) == "cancel") {
            if (manager_->isRunning(jobId)) {
                manager_->cancel(jobId);
            } else {
                auto ctx = Context::withTimeout(loopCtx_, kStoreBudget);
                // Claiming first makes sure no worker picks the job up meanwhile.
                if (store_->claimJob(ctx, jobId, nowTimestamp())) {
                    if (store_->finishJob(ctx, jobId, JobStatus::Canceled, nowTimestamp(), std::nullopt,
                                          std::nullopt, std::string(toString(ErrorCode::Canceled)))) {
                        Event event;
                        event.type = "job.completed";
                        event.jobId = jobId;
                        event.payload["status"] = toString(JobStatus::Canceled);
                        hub_.publish(std::move(event));
                        LOG_EVENT(INFO, "job.completed",
                                  {{"job_id", jobId},
                                   {"status", toString(JobStatus::Canceled)},
                                   {"error_code", toString(ErrorCode::Canceled)}});
                    } else {
                        LOG_ERROR("Failed to cancel queued job " + jobId);
                    }
                } else {
                    // A worker claimed it but has not registered the run yet; try again next scan.
                    auto current = store_->getJob(ctx, jobId);
                    if (current && current->status == JobStatus::Running) {
                        LOG_DEBUG("Cancel marker for job " + jobId + " kept until its run starts");
                        continue;
                    }
                    LOG_DEBUG("Cancel marker for job " + jobId + " which is not queued or running");
                }
            }
        } else {
            LOG_WARN("Ignoring unknown command for job " + jobId);
        }

        std::error_code rmEc;
        fs::remove(entry.path(), rmEc);
        if (rmEc) {
            LOG_WARN("Failed to remove " + entry.path().string() + ": " + rmEc.message());
        }
    }
}

void Server::submitQueuedJobs() {
    auto queued = store_->listJobIdsByStatus(Context::withTimeout(loopCtx_, kStoreBudget), JobStatus::Queued);

    int newCount = 0;
    for (const auto& jobId : queued) {
        if (loopCtx_->done()) {
            break;
        }
        if (submittedJobs_.count(jobId) > 0) {
            continue;
        }
        // Retried on the next pass.
        if (!manager_->enqueue(jobId)) {
            break;
        }
        submittedJobs_.insert(jobId);
        ++newCount;
    }

    if (newCount > 0) {
        LOG_DEBUG("Submitted " + std::to_string(newCount) + " new jobs to the queue");
    }

    if (submittedJobs_.size() > kSubmittedTrimThreshold) {
        std::unordered_set<JobId> current(queued.begin(), queued.end());
        for (auto it = submittedJobs_.begin(); it != submittedJobs_.end();) {
            if (current.count(*it) == 0) {
                it = submittedJobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    do {
        try {
            scanOnce();
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
        }
    } while (loopCtx_->sleepFor(kScanInterval));

    LOG_DEBUG("Scanner loop stopped");
    clearThreadName();
}

} // namespace xferd
