/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/file_store.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"
#include <algorithm>

namespace xferd {

namespace fs = std::filesystem;

bool isSafeRecordId(const std::string& id) noexcept {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return id.find('/') == std::string::npos && id.find('\\') == std::string::npos &&
           id.find('\0') == std::string::npos;
}

FileStore::FileStore(const fs::path& dataDir) : root_(dataDir / "db") {
    LOG_DEBUG("FileStore created at " + root_.string());
}

bool FileStore::initialize() noexcept {
    try {
        fs::create_directories(root_ / "jobs");
        fs::create_directories(root_ / "profiles");
        fs::create_directories(root_ / "uploads");
        fs::create_directories(root_ / "index");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize store: " + std::string(e.what()));
        return false;
    }
}

FileStore::Lock FileStore::acquire(const Context::Ptr& ctx, const char* op) {
    Lock lock(mutex_, std::defer_lock);
    if (ctx && ctx->deadline()) {
        if (!lock.try_lock_until(*ctx->deadline())) {
            LOG_WARN(std::string("Store ") + op + " timed out waiting for lock");
        }
    } else {
        lock.lock();
    }
    if (lock.owns_lock() && ctx && ctx->done()) {
        lock.unlock();
    }
    return lock;
}

fs::path FileStore::jobPath(const JobId& jobId) const {
    return root_ / "jobs" / (jobId + ".json");
}

fs::path FileStore::uploadPath(const std::string& uploadId) const {
    return root_ / "uploads" / (uploadId + ".json");
}

fs::path FileStore::indexPath(const std::string& profileId, const std::string& bucket) const {
    return root_ / "index" / profileId / (bucket + ".json");
}

std::optional<Json::Value> FileStore::readDocument(const fs::path& path) const {
    auto text = readFile(path.string());
    if (!text) {
        return std::nullopt;
    }
    std::string err;
    auto doc = parseJson(*text, &err);
    if (!doc) {
        LOG_WARN("Corrupt store record " + path.string() + ": " + err);
    }
    return doc;
}

std::optional<Job> FileStore::readJob(const fs::path& path) const {
    auto doc = readDocument(path);
    if (!doc) {
        return std::nullopt;
    }
    return jobFromJson(*doc);
}

bool FileStore::writeJob(const Job& job) const {
    return writeFileAtomic(jobPath(job.id).string(), toJsonPretty(jobToJson(job)));
}

std::vector<Job> FileStore::readAllJobs() const {
    std::vector<Job> jobs;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root_ / "jobs", ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        if (auto job = readJob(entry.path())) {
            jobs.push_back(std::move(*job));
        }
    }
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    return jobs;
}

bool FileStore::createJob(const Context::Ptr& ctx, const Job& job) {
    if (!isSafeRecordId(job.id)) {
        LOG_ERROR("Refusing job with unsafe id: " + job.id);
        return false;
    }
    auto lock = acquire(ctx, "createJob");
    if (!lock.owns_lock()) return false;
    if (fs::exists(jobPath(job.id))) {
        LOG_ERROR("Job already exists: " + job.id);
        return false;
    }
    return writeJob(job);
}

std::optional<Job> FileStore::getJob(const Context::Ptr& ctx, const JobId& jobId) {
    if (!isSafeRecordId(jobId)) return std::nullopt;
    auto lock = acquire(ctx, "getJob");
    if (!lock.owns_lock()) return std::nullopt;
    return readJob(jobPath(jobId));
}

std::optional<bool> FileStore::jobExists(const Context::Ptr& ctx, const JobId& jobId) {
    if (!isSafeRecordId(jobId)) return false;
    auto lock = acquire(ctx, "jobExists");
    if (!lock.owns_lock()) return std::nullopt;
    std::error_code ec;
    bool exists = fs::exists(jobPath(jobId), ec);
    if (ec) return std::nullopt;
    return exists;
}

std::vector<JobId> FileStore::listJobIdsByStatus(const Context::Ptr& ctx, JobStatus status) {
    std::vector<JobId> ids;
    auto lock = acquire(ctx, "listJobIdsByStatus");
    if (!lock.owns_lock()) return ids;
    for (const auto& job : readAllJobs()) {
        if (job.status == status) {
            ids.push_back(job.id);
        }
    }
    return ids;
}

std::vector<Job> FileStore::listJobs(const Context::Ptr& ctx, std::size_t limit) {
    auto lock = acquire(ctx, "listJobs");
    if (!lock.owns_lock()) return {};
    auto jobs = readAllJobs();
    std::reverse(jobs.begin(), jobs.end());
    if (limit > 0 && jobs.size() > limit) {
        jobs.resize(limit);
    }
    return jobs;
}

bool FileStore::claimJob(const Context::Ptr& ctx, const JobId& jobId, const std::string& startedAt) {
    auto lock = acquire(ctx, "claimJob");
    if (!lock.owns_lock()) return false;
    auto job = readJob(jobPath(jobId));
    if (!job || job->status != JobStatus::Queued) {
        return false;
    }
    job->status = JobStatus::Running;
    job->startedAt = startedAt;
    return writeJob(*job);
}

bool FileStore::updateJobProgress(const Context::Ptr& ctx, const JobId& jobId, const JobProgress& progress) {
    auto lock = acquire(ctx, "updateJobProgress");
    if (!lock.owns_lock()) return false;
    auto job = readJob(jobPath(jobId));
    if (!job) {
        return false;
    }
    job->progress = progress;
    return writeJob(*job);
}

bool FileStore::finishJob(const Context::Ptr& ctx, const JobId& jobId, JobStatus status,
                          const std::string& finishedAt, const std::optional<JobProgress>& progress,
                          const std::optional<std::string>& error,
                          const std::optional<std::string>& errorCode) {
    auto lock = acquire(ctx, "finishJob");
    if (!lock.owns_lock()) return false;
    auto job = readJob(jobPath(jobId));
    if (!job) {
        return false;
    }
    job->status = status;
    job->finishedAt = finishedAt;
    job->progress = progress;
    job->error = error;
    job->errorCode = errorCode;
    return writeJob(*job);
}

std::vector<JobId> FileStore::deleteFinishedJobsBefore(const Context::Ptr& ctx, const std::string& cutoff,
                                                       std::size_t limit) {
    std::vector<JobId> deleted;
    auto cutoffTime = parseTimestamp(cutoff);
    if (!cutoffTime) {
        LOG_ERROR("Invalid retention cutoff: " + cutoff);
        return deleted;
    }
    auto lock = acquire(ctx, "deleteFinishedJobsBefore");
    if (!lock.owns_lock()) return deleted;

    for (const auto& job : readAllJobs()) {
        if (limit > 0 && deleted.size() >= limit) break;
        if (!isTerminal(job.status) || !job.finishedAt) continue;
        auto finished = parseTimestamp(*job.finishedAt);
        if (!finished || *finished >= *cutoffTime) continue;

        std::error_code ec;
        fs::remove(jobPath(job.id), ec);
        if (ec) {
            LOG_WARN("Failed to delete job record " + job.id + ": " + ec.message());
            continue;
        }
        deleted.push_back(job.id);
    }
    return deleted;
}

std::optional<ProfileSecrets> FileStore::getProfileSecrets(const Context::Ptr& ctx, const std::string& profileId) {
    if (!isSafeRecordId(profileId)) return std::nullopt;
    auto lock = acquire(ctx, "getProfileSecrets");
    if (!lock.owns_lock()) return std::nullopt;
    auto doc = readDocument(root_ / "profiles" / (profileId + ".json"));
    if (!doc) {
        return std::nullopt;
    }
    return profileFromJson(*doc);
}

bool FileStore::putProfile(const Context::Ptr& ctx, const ProfileSecrets& profile) {
    if (!isSafeRecordId(profile.id)) return false;
    auto lock = acquire(ctx, "putProfile");
    if (!lock.owns_lock()) return false;
    return writeFileAtomic((root_ / "profiles" / (profile.id + ".json")).string(),
                           toJsonPretty(profileToJson(profile)));
}

std::optional<UploadSession> FileStore::getUploadSession(const Context::Ptr& ctx, const std::string& profileId,
                                                         const std::string& uploadId) {
    if (!isSafeRecordId(uploadId)) return std::nullopt;
    auto lock = acquire(ctx, "getUploadSession");
    if (!lock.owns_lock()) return std::nullopt;
    auto doc = readDocument(uploadPath(uploadId));
    if (!doc) {
        return std::nullopt;
    }
    auto session = uploadSessionFromJson(*doc);
    if (!session || session->profileId != profileId) {
        return std::nullopt;
    }
    return session;
}

std::optional<bool> FileStore::uploadSessionExists(const Context::Ptr& ctx, const std::string& uploadId) {
    if (!isSafeRecordId(uploadId)) return false;
    auto lock = acquire(ctx, "uploadSessionExists");
    if (!lock.owns_lock()) return std::nullopt;
    std::error_code ec;
    bool exists = fs::exists(uploadPath(uploadId), ec);
    if (ec) return std::nullopt;
    return exists;
}

bool FileStore::deleteUploadSession(const Context::Ptr& ctx, const std::string& profileId,
                                    const std::string& uploadId) {
    if (!isSafeRecordId(uploadId)) return false;
    auto lock = acquire(ctx, "deleteUploadSession");
    if (!lock.owns_lock()) return false;
    auto doc = readDocument(uploadPath(uploadId));
    if (!doc) {
        return false;
    }
    auto session = uploadSessionFromJson(*doc);
    if (!session || session->profileId != profileId) {
        return false;
    }
    std::error_code ec;
    return fs::remove(uploadPath(uploadId), ec) && !ec;
}

std::vector<UploadSession> FileStore::listExpiredUploadSessions(const Context::Ptr& ctx, const std::string& now,
                                                                std::size_t limit) {
    std::vector<UploadSession> out;
    auto nowTime = parseTimestamp(now);
    if (!nowTime) {
        return out;
    }
    auto lock = acquire(ctx, "listExpiredUploadSessions");
    if (!lock.owns_lock()) return out;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root_ / "uploads", ec)) {
        if (limit > 0 && out.size() >= limit) break;
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        auto doc = readDocument(entry.path());
        if (!doc) continue;
        auto session = uploadSessionFromJson(*doc);
        if (!session) continue;
        auto expires = parseTimestamp(session->expiresAt);
        if (expires && *expires <= *nowTime) {
            out.push_back(std::move(*session));
        }
    }
    return out;
}

bool FileStore::putUploadSession(const Context::Ptr& ctx, const UploadSession& session) {
    if (!isSafeRecordId(session.id)) return false;
    auto lock = acquire(ctx, "putUploadSession");
    if (!lock.owns_lock()) return false;
    return writeFileAtomic(uploadPath(session.id).string(), toJsonPretty(uploadSessionToJson(session)));
}

bool FileStore::clearObjectIndex(const Context::Ptr& ctx, const std::string& profileId,
                                 const std::string& bucket, const std::string& prefix) {
    if (!isSafeRecordId(profileId) || !isSafeRecordId(bucket)) return false;
    auto lock = acquire(ctx, "clearObjectIndex");
    if (!lock.owns_lock()) return false;

    auto path = indexPath(profileId, bucket);
    auto doc = readDocument(path);
    if (!doc || !doc->isObject()) {
        return true;
    }
    Json::Value kept(Json::objectValue);
    for (const auto& key : doc->getMemberNames()) {
        if (!startsWith(key, prefix)) {
            kept[key] = (*doc)[key];
        }
    }
    return writeFileAtomic(path.string(), toJsonLine(kept));
}

bool FileStore::upsertObjectIndexBatch(const Context::Ptr& ctx, const std::string& profileId,
                                       const std::string& bucket, const std::vector<ObjectIndexEntry>& entries,
                                       const std::string& indexedAt) {
    if (!isSafeRecordId(profileId) || !isSafeRecordId(bucket)) return false;
    auto lock = acquire(ctx, "upsertObjectIndexBatch");
    if (!lock.owns_lock()) return false;

    auto path = indexPath(profileId, bucket);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        LOG_ERROR("Failed to create index dir: " + ec.message());
        return false;
    }

    Json::Value doc(Json::objectValue);
    if (auto existing = readDocument(path); existing && existing->isObject()) {
        doc = *existing;
    }
    for (const auto& e : entries) {
        Json::Value row(Json::objectValue);
        row["size"] = Json::Int64(e.size);
        row["etag"] = e.etag;
        row["lastModified"] = e.lastModified;
        row["indexedAt"] = indexedAt;
        doc[e.key] = row;
    }
    return writeFileAtomic(path.string(), toJsonLine(doc));
}

std::size_t FileStore::objectIndexSize(const Context::Ptr& ctx, const std::string& profileId,
                                       const std::string& bucket) {
    if (!isSafeRecordId(profileId) || !isSafeRecordId(bucket)) return 0;
    auto lock = acquire(ctx, "objectIndexSize");
    if (!lock.owns_lock()) return 0;
    auto doc = readDocument(indexPath(profileId, bucket));
    return doc && doc->isObject() ? doc->size() : 0;
}

} // namespace xferd
