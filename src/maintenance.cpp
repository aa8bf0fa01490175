/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/maintenance.hpp"
#include "xferd/file_store.hpp"
#include "xferd/hub.hpp"
#include "xferd/logger.hpp"
#include "xferd/store.hpp"
#include "xferd/util.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace xferd {

namespace {

constexpr auto kStoreBudget = std::chrono::seconds(2);
constexpr auto kRetentionPageBudget = std::chrono::seconds(5);

const char* const kJobFileSuffixes[] = {".log", ".cmd", ".rclone.conf"};
const char* const kArtifactSuffixes[] = {".zip.tmp", ".zip"};

bool removeFile(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Failed to remove " + path.string() + ": " + ec.message());
        return false;
    }
    return removed;
}

std::vector<fs::path> listRegularFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            LOG_WARN("Failed to list " + dir.string() + ": " + ec.message());
        }
        return files;
    }
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path());
        }
    }
    return files;
}

} // namespace

std::string jobIdFromFileName(const std::string& name, const std::string& suffix) {
    if (name.size() <= suffix.size() || !endsWith(name, suffix)) {
        return {};
    }
    std::string id = name.substr(0, name.size() - suffix.size());
    return isSafeRecordId(id) ? id : std::string{};
}

Maintenance::Maintenance(const Config& config, Store& store, Hub& hub, RunningCheck isRunning)
    : config_(config), store_(store), hub_(hub), isRunning_(std::move(isRunning)) {}

MaintenanceReport Maintenance::runOnce(const Context::Ptr& ctx) {
    MaintenanceReport report;
    report.expiredUploads = cleanupExpiredUploads(ctx);
    report.orphanLogs = cleanupOrphanJobLogs(ctx);
    report.orphanArtifacts = cleanupOrphanArtifacts(ctx);
    report.orphanStaging = cleanupOrphanStaging(ctx);
    report.retainedJobsDeleted = enforceJobRetention(ctx);
    report.retainedLogsDeleted = enforceJobLogRetention(ctx);

    const auto total = report.expiredUploads + report.orphanLogs + report.orphanArtifacts +
                       report.orphanStaging + report.retainedJobsDeleted + report.retainedLogsDeleted;
    if (total > 0) {
        LOG_INFO("Maintenance: expired_uploads=" + std::to_string(report.expiredUploads) +
                 " orphan_logs=" + std::to_string(report.orphanLogs) +
                 " orphan_artifacts=" + std::to_string(report.orphanArtifacts) +
                 " orphan_staging=" + std::to_string(report.orphanStaging) +
                 " jobs_deleted=" + std::to_string(report.retainedJobsDeleted) +
                 " logs_deleted=" + std::to_string(report.retainedLogsDeleted));
    } else {
        LOG_DEBUG("Maintenance: nothing to clean");
    }
    return report;
}

void Maintenance::run(const Context::Ptr& ctx) {
    setThreadName("Maintenance");
    LOG_INFO("Maintenance loop started (interval " + formatDuration(config_.maintenanceInterval) + ")");
    do {
        try {
            runOnce(ctx);
        } catch (const std::exception& e) {
            LOG_ERROR("Maintenance pass failed: " + std::string(e.what()));
        }
    } while (ctx->sleepFor(config_.maintenanceInterval));
    LOG_INFO("Maintenance loop stopped");
    clearThreadName();
}

std::size_t Maintenance::cleanupExpiredUploads(const Context::Ptr& ctx) {
    std::size_t removed = 0;
    while (!ctx->done()) {
        auto sessions = store_.listExpiredUploadSessions(
            Context::withTimeout(ctx, kStoreBudget), nowTimestamp(), kPageSize);
        if (sessions.empty()) {
            break;
        }
        std::size_t deleted = 0;
        for (const auto& session : sessions) {
            if (!store_.deleteUploadSession(Context::withTimeout(ctx, kStoreBudget), session.profileId,
                                            session.id)) {
                LOG_WARN("Failed to delete expired upload session " + session.id);
                continue;
            }
            ++deleted;
            if (!session.stagingDir.empty()) {
                std::error_code ec;
                fs::remove_all(session.stagingDir, ec);
                if (ec) {
                    LOG_WARN("Failed to remove staging dir " + session.stagingDir + ": " + ec.message());
                }
            }
        }
        removed += deleted;
        if (deleted == 0 || sessions.size() < kPageSize) {
            break;
        }
    }
    return removed;
}

bool Maintenance::jobGone(const Context::Ptr& ctx, const JobId& jobId) {
    auto exists = store_.jobExists(Context::withTimeout(ctx, kStoreBudget), jobId);
    return exists.has_value() && !*exists;
}

std::size_t Maintenance::cleanupOrphanJobLogs(const Context::Ptr& ctx) {
    std::size_t removed = 0;
    for (const auto& path : listRegularFiles(config_.jobLogDir())) {
        if (ctx->done()) {
            break;
        }
        const auto name = path.filename().string();
        for (const char* suffix : kJobFileSuffixes) {
            const auto jobId = jobIdFromFileName(name, suffix);
            if (jobId.empty()) {
                continue;
            }
            // Credentials files only live as long as the job runs.
            const bool orphan = std::string(suffix) == ".rclone.conf"
                                    ? !isRunning_(jobId)
                                    : jobGone(ctx, jobId);
            if (orphan && removeFile(path)) {
                ++removed;
            }
            break;
        }
    }
    return removed;
}

std::size_t Maintenance::cleanupOrphanArtifacts(const Context::Ptr& ctx) {
    std::size_t removed = 0;
    for (const auto& path : listRegularFiles(config_.artifactDir())) {
        if (ctx->done()) {
            break;
        }
        const auto name = path.filename().string();
        for (const char* suffix : kArtifactSuffixes) {
            const auto jobId = jobIdFromFileName(name, suffix);
            if (jobId.empty()) {
                continue;
            }
            if (jobGone(ctx, jobId) && removeFile(path)) {
                ++removed;
            }
            break;
        }
    }
    return removed;
}

std::size_t Maintenance::cleanupOrphanStaging(const Context::Ptr& ctx) {
    std::size_t removed = 0;
    std::error_code ec;
    fs::directory_iterator it(config_.stagingDir(), ec);
    if (ec) {
        return 0;
    }
    for (const auto& entry : it) {
        if (ctx->done()) {
            break;
        }
        if (!entry.is_directory(ec)) {
            continue;
        }
        const auto uploadId = entry.path().filename().string();
        if (!isSafeRecordId(uploadId)) {
            continue;
        }
        auto exists = store_.uploadSessionExists(Context::withTimeout(ctx, kStoreBudget), uploadId);
        if (!exists.has_value() || *exists) {
            continue;
        }
        std::error_code rmEc;
        fs::remove_all(entry.path(), rmEc);
        if (rmEc) {
            LOG_WARN("Failed to remove orphan staging dir " + entry.path().string() + ": " + rmEc.message());
            continue;
        }
        ++removed;
    }
    return removed;
}

void Maintenance::removeJobFiles(const JobId& jobId, bool artifacts) {
    removeFile(config_.jobLogDir() / (jobId + ".log"));
    removeFile(config_.jobLogDir() / (jobId + ".cmd"));
    if (artifacts) {
        removeFile(config_.artifactDir() / (jobId + ".zip"));
        removeFile(config_.artifactDir() / (jobId + ".zip.tmp"));
    }
}

std::size_t Maintenance::enforceJobRetention(const Context::Ptr& ctx) {
    if (config_.jobRetention.count() <= 0) {
        return 0;
    }
    const auto cutoff = formatTimestamp(Clock::now() - config_.jobRetention);
    std::size_t deleted = 0;
    while (!ctx->done()) {
        auto ids = store_.deleteFinishedJobsBefore(Context::withTimeout(ctx, kRetentionPageBudget), cutoff,
                                                   kPageSize);
        if (ids.empty()) {
            break;
        }
        for (const auto& id : ids) {
            removeJobFiles(id, true);
        }

        Event event;
        event.type = "jobs.deleted";
        event.payload["reason"] = "retention";
        event.payload["jobIds"] = Json::Value(Json::arrayValue);
        for (const auto& id : ids) {
            event.payload["jobIds"].append(id);
        }
        hub_.publish(std::move(event));

        deleted += ids.size();
        if (ids.size() < kPageSize) {
            break;
        }
    }
    return deleted;
}

std::size_t Maintenance::enforceJobLogRetention(const Context::Ptr& ctx) {
    if (config_.jobLogRetention.count() <= 0) {
        return 0;
    }
    const auto cutoff = Clock::now() - config_.jobLogRetention;
    std::size_t removed = 0;
    for (const auto& path : listRegularFiles(config_.jobLogDir())) {
        if (ctx->done()) {
            break;
        }
        const auto jobId = jobIdFromFileName(path.filename().string(), ".log");
        if (jobId.empty()) {
            continue;
        }
        auto job = store_.getJob(Context::withTimeout(ctx, kStoreBudget), jobId);
        if (!job || !isTerminal(job->status) || !job->finishedAt) {
            continue;
        }
        auto finished = parseTimestamp(*job->finishedAt);
        if (!finished || *finished >= cutoff) {
            continue;
        }
        removeJobFiles(jobId, false);
        ++removed;
    }
    return removed;
}

} // namespace xferd
