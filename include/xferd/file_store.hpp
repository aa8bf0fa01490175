/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>

#include "xferd/store.hpp"

namespace xferd {

// Store backed by one JSON document per record under <dataDir>/db.
// Writes go through a temp file and rename; a single timed lock serializes
// access from this process.
class FileStore final : public Store {
public:
    explicit FileStore(const std::filesystem::path& dataDir);

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    [[nodiscard]] bool initialize() noexcept;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    bool createJob(const Context::Ptr& ctx, const Job& job) override;
    std::optional<Job> getJob(const Context::Ptr& ctx, const JobId& jobId) override;
    std::optional<bool> jobExists(const Context::Ptr& ctx, const JobId& jobId) override;
    std::vector<JobId> listJobIdsByStatus(const Context::Ptr& ctx, JobStatus status) override;
    std::vector<Job> listJobs(const Context::Ptr& ctx, std::size_t limit) override;
    bool claimJob(const Context::Ptr& ctx, const JobId& jobId, const std::string& startedAt) override;
    bool updateJobProgress(const Context::Ptr& ctx, const JobId& jobId, const JobProgress& progress) override;
    bool finishJob(const Context::Ptr& ctx, const JobId& jobId, JobStatus status,
                   const std::string& finishedAt, const std::optional<JobProgress>& progress,
                   const std::optional<std::string>& error,
                   const std::optional<std::string>& errorCode) override;
    std::vector<JobId> deleteFinishedJobsBefore(const Context::Ptr& ctx, const std::string& cutoff,
                                                std::size_t limit) override;

    std::optional<ProfileSecrets> getProfileSecrets(const Context::Ptr& ctx,
                                                    const std::string& profileId) override;
    [[nodiscard]] bool putProfile(const Context::Ptr& ctx, const ProfileSecrets& profile);

    std::optional<UploadSession> getUploadSession(const Context::Ptr& ctx, const std::string& profileId,
                                                  const std::string& uploadId) override;
    std::optional<bool> uploadSessionExists(const Context::Ptr& ctx, const std::string& uploadId) override;
    bool deleteUploadSession(const Context::Ptr& ctx, const std::string& profileId,
                             const std::string& uploadId) override;
    std::vector<UploadSession> listExpiredUploadSessions(const Context::Ptr& ctx, const std::string& now,
                                                         std::size_t limit) override;
    [[nodiscard]] bool putUploadSession(const Context::Ptr& ctx, const UploadSession& session);

    bool clearObjectIndex(const Context::Ptr& ctx, const std::string& profileId,
                          const std::string& bucket, const std::string& prefix) override;
    bool upsertObjectIndexBatch(const Context::Ptr& ctx, const std::string& profileId,
                                const std::string& bucket, const std::vector<ObjectIndexEntry>& entries,
                                const std::string& indexedAt) override;
    [[nodiscard]] std::size_t objectIndexSize(const Context::Ptr& ctx, const std::string& profileId,
                                              const std::string& bucket);

private:
    using Lock = std::unique_lock<std::timed_mutex>;

    [[nodiscard]] Lock acquire(const Context::Ptr& ctx, const char* op);
    [[nodiscard]] std::filesystem::path jobPath(const JobId& jobId) const;
    [[nodiscard]] std::filesystem::path uploadPath(const std::string& uploadId) const;
    [[nodiscard]] std::filesystem::path indexPath(const std::string& profileId, const std::string& bucket) const;

    [[nodiscard]] std::optional<Job> readJob(const std::filesystem::path& path) const;
    [[nodiscard]] bool writeJob(const Job& job) const;
    [[nodiscard]] std::vector<Job> readAllJobs() const;
    [[nodiscard]] std::optional<Json::Value> readDocument(const std::filesystem::path& path) const;

    std::filesystem::path root_;
    std::timed_mutex mutex_;
};

// Accepts ids usable as a single path component.
[[nodiscard]] bool isSafeRecordId(const std::string& id) noexcept;

} // namespace xferd
