/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

#include "xferd/config.hpp"
#include "xferd/context.hpp"
#include "xferd/types.hpp"

namespace xferd {

class Hub;
class Store;

// Counters for one maintenance pass.
struct MaintenanceReport {
    std::size_t expiredUploads = 0;
    std::size_t orphanLogs = 0;
    std::size_t orphanArtifacts = 0;
    std::size_t orphanStaging = 0;
    std::size_t retainedJobsDeleted = 0;
    std::size_t retainedLogsDeleted = 0;
};

// Periodic cleanup of expired upload sessions, files left behind by deleted
// jobs, and finished jobs past their retention window.
class Maintenance {
public:
    // Decides whether a job currently holds a worker slot in this process.
    using RunningCheck = std::function<bool(const JobId&)>;

    Maintenance(const Config& config, Store& store, Hub& hub, RunningCheck isRunning);

    Maintenance(const Maintenance&) = delete;
    Maintenance& operator=(const Maintenance&) = delete;

    MaintenanceReport runOnce(const Context::Ptr& ctx);

    // Runs a pass immediately, then every maintenanceInterval until ctx ends.
    void run(const Context::Ptr& ctx);

    static constexpr std::size_t kPageSize = 200;

private:
    std::size_t cleanupExpiredUploads(const Context::Ptr& ctx);
    std::size_t cleanupOrphanJobLogs(const Context::Ptr& ctx);
    std::size_t cleanupOrphanArtifacts(const Context::Ptr& ctx);
    std::size_t cleanupOrphanStaging(const Context::Ptr& ctx);
    std::size_t enforceJobRetention(const Context::Ptr& ctx);
    std::size_t enforceJobLogRetention(const Context::Ptr& ctx);

    // Only answers true when the store positively says the job is gone.
    [[nodiscard]] bool jobGone(const Context::Ptr& ctx, const JobId& jobId);
    void removeJobFiles(const JobId& jobId, bool artifacts);

    const Config& config_;
    Store& store_;
    Hub& hub_;
    RunningCheck isRunning_;
};

// Splits a job-owned file name into its job id: "<id>.log", "<id>.cmd",
// "<id>.rclone.conf", "<id>.zip" and "<id>.zip.tmp". Empty when the name
// does not match one of those suffixes.
[[nodiscard]] std::string jobIdFromFileName(const std::string& name, const std::string& suffix);

} // namespace xferd
