/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "xferd/context.hpp"
#include "xferd/types.hpp"

namespace xferd {

// Persistence for jobs, profiles, upload sessions and the object index.
//
// Every call takes a context whose deadline bounds how long the call may
// wait; implementations return false / nullopt / empty when the deadline
// passes. Implementations must be safe for concurrent use.
class Store {
public:
    virtual ~Store() = default;

    // Jobs
    [[nodiscard]] virtual bool createJob(const Context::Ptr& ctx, const Job& job) = 0;
    [[nodiscard]] virtual std::optional<Job> getJob(const Context::Ptr& ctx, const JobId& jobId) = 0;
    [[nodiscard]] virtual std::optional<bool> jobExists(const Context::Ptr& ctx, const JobId& jobId) = 0;
    // Ordered by creation time, oldest first.
    [[nodiscard]] virtual std::vector<JobId> listJobIdsByStatus(const Context::Ptr& ctx, JobStatus status) = 0;
    // Most recent first.
    [[nodiscard]] virtual std::vector<Job> listJobs(const Context::Ptr& ctx, std::size_t limit) = 0;
    // queued -> running, only if the job is still queued.
    [[nodiscard]] virtual bool claimJob(const Context::Ptr& ctx, const JobId& jobId,
                                        const std::string& startedAt) = 0;
    [[nodiscard]] virtual bool updateJobProgress(const Context::Ptr& ctx, const JobId& jobId,
                                                 const JobProgress& progress) = 0;
    [[nodiscard]] virtual bool finishJob(const Context::Ptr& ctx, const JobId& jobId, JobStatus status,
                                         const std::string& finishedAt,
                                         const std::optional<JobProgress>& progress,
                                         const std::optional<std::string>& error,
                                         const std::optional<std::string>& errorCode) = 0;
    // Deletes at most `limit` terminal jobs finished before `cutoff`; returns their ids.
    [[nodiscard]] virtual std::vector<JobId> deleteFinishedJobsBefore(const Context::Ptr& ctx,
                                                                      const std::string& cutoff,
                                                                      std::size_t limit) = 0;

    // Profiles
    [[nodiscard]] virtual std::optional<ProfileSecrets> getProfileSecrets(const Context::Ptr& ctx,
                                                                         const std::string& profileId) = 0;

    // Upload sessions
    [[nodiscard]] virtual std::optional<UploadSession> getUploadSession(const Context::Ptr& ctx,
                                                                       const std::string& profileId,
                                                                       const std::string& uploadId) = 0;
    [[nodiscard]] virtual std::optional<bool> uploadSessionExists(const Context::Ptr& ctx,
                                                                  const std::string& uploadId) = 0;
    [[nodiscard]] virtual bool deleteUploadSession(const Context::Ptr& ctx, const std::string& profileId,
                                                   const std::string& uploadId) = 0;
    [[nodiscard]] virtual std::vector<UploadSession> listExpiredUploadSessions(const Context::Ptr& ctx,
                                                                               const std::string& now,
                                                                               std::size_t limit) = 0;

    // Object index
    [[nodiscard]] virtual bool clearObjectIndex(const Context::Ptr& ctx, const std::string& profileId,
                                                const std::string& bucket, const std::string& prefix) = 0;
    [[nodiscard]] virtual bool upsertObjectIndexBatch(const Context::Ptr& ctx, const std::string& profileId,
                                                      const std::string& bucket,
                                                      const std::vector<ObjectIndexEntry>& entries,
                                                      const std::string& indexedAt) = 0;
};

} // namespace xferd
