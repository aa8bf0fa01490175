/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/work.hpp"
#include "xferd/errors.hpp"
#include "xferd/file_store.hpp"
#include "xferd/logger.hpp"
#include "xferd/payloads.hpp"
#include "xferd/util.hpp"

#include <atomic>
#include <chrono>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace xferd {

namespace {

constexpr auto kStoreBudget = std::chrono::seconds(5);

Context::Ptr storeContext() {
    return Context::withTimeout(Context::background(), kStoreBudget);
}

} // namespace

Work::Work(const Config& config) : config_(config), store_(std::make_unique<FileStore>(config.dataDir)) {
    ready_ = store_->initialize();
    if (!ready_) {
        LOG_ERROR("Failed to initialize store under: " + config_.dataDir.string());
    }
}

Work::~Work() = default;

SubmitResult Work::submit(const std::string& profileId, const std::string& type, const Json::Value& payload) {
    auto jobType = parseJobType(type);
    if (!jobType) {
        return {false, "", SubmissionError::InvalidType, "unsupported job type: " + type};
    }
    if (!payload.isObject()) {
        return {false, "", SubmissionError::InvalidPayload, "payload must be a JSON object"};
    }
    try {
        (void)parsePayload(*jobType, payload);
    } catch (const std::exception& e) {
        LOG_DEBUG("Rejected payload for " + type + ": " + e.what());
        return {false, "", SubmissionError::InvalidPayload, e.what()};
    }

    if (!store_->getProfileSecrets(storeContext(), profileId)) {
        return {false, "", SubmissionError::ProfileNotFound, "profile not found: " + profileId};
    }

    Job job;
    job.id = generateId();
    job.profileId = profileId;
    job.type = toString(*jobType);
    job.payload = payload;
    job.status = JobStatus::Queued;
    job.createdAt = nowTimestamp();
    LOG_DEBUG("Generated job ID: " + job.id);

    if (!store_->createJob(storeContext(), job)) {
        LOG_ERROR("Failed to persist job: " + job.id);
        return {false, "", SubmissionError::IoError, "failed to persist job"};
    }

    LOG_INFO("Job submitted successfully: " + job.id);
    return {true, job.id, SubmissionError::None, ""};
}

SubmitResult Work::cancel(const JobId& jobId) {
    auto job = store_->getJob(storeContext(), jobId);
    if (!job) {
        return {false, jobId, SubmissionError::JobNotFound, "job not found: " + jobId};
    }
    if (isTerminal(job->status)) {
        return {false, jobId, SubmissionError::NotCancelable,
                "job already finished with status " + std::string(toString(job->status))};
    }
    if (!writeCancelMarker(jobId)) {
        return {false, jobId, SubmissionError::IoError, "failed to write cancel request"};
    }
    LOG_INFO("Cancel requested for job: " + jobId);
    return {true, jobId, SubmissionError::None, ""};
}

std::optional<Job> Work::status(const JobId& jobId) {
    return store_->getJob(storeContext(), jobId);
}

std::vector<Job> Work::list(std::size_t limit) {
    return store_->listJobs(storeContext(), limit);
}

SubmitResult Work::putProfile(const Json::Value& profile) {
    auto parsed = profileFromJson(profile);
    if (!parsed || parsed->id.empty()) {
        return {false, "", SubmissionError::InvalidPayload, "profile must be an object with an id"};
    }
    if (!isSafeRecordId(parsed->id)) {
        return {false, "", SubmissionError::InvalidPayload, "invalid profile id: " + parsed->id};
    }
    if (!store_->putProfile(storeContext(), *parsed)) {
        return {false, "", SubmissionError::IoError, "failed to persist profile"};
    }
    return {true, parsed->id, SubmissionError::None, ""};
}

SubmitResult Work::createUploadSession(const std::string& profileId, const std::string& bucket,
                                       const std::string& prefix) {
    if (trim(bucket).empty()) {
        return {false, "", SubmissionError::InvalidPayload, "bucket is required"};
    }
    if (!store_->getProfileSecrets(storeContext(), profileId)) {
        return {false, "", SubmissionError::ProfileNotFound, "profile not found: " + profileId};
    }

    UploadSession session;
    session.id = generateId();
    session.profileId = profileId;
    session.bucket = trim(bucket);
    session.prefix = trim(prefix);
    session.stagingDir = (config_.stagingDir() / session.id).string();
    const auto now = Clock::now();
    session.createdAt = formatTimestamp(now);
    session.expiresAt = formatTimestamp(now + config_.uploadSessionTTL);

    std::error_code ec;
    fs::create_directories(session.stagingDir, ec);
    if (ec) {
        return {false, "", SubmissionError::IoError, "create staging dir: " + ec.message()};
    }
    fs::permissions(session.stagingDir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Failed to restrict permissions on " + session.stagingDir + ": " + ec.message());
    }

    if (!store_->putUploadSession(storeContext(), session)) {
        fs::remove_all(session.stagingDir, ec);
        if (ec) {
            LOG_WARN("Failed to remove staging dir " + session.stagingDir + ": " + ec.message());
        }
        return {false, "", SubmissionError::IoError, "failed to persist upload session"};
    }
    return {true, session.id, SubmissionError::None, session.stagingDir};
}

std::optional<UploadSession> Work::uploadSession(const std::string& profileId, const std::string& uploadId) {
    return store_->getUploadSession(storeContext(), profileId, uploadId);
}

fs::path Work::logPath(const JobId& jobId) const {
    return config_.jobLogDir() / (jobId + ".log");
}

fs::path Work::artifactPath(const JobId& jobId) const {
    return config_.artifactDir() / (jobId + ".zip");
}

std::string Work::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t uniqueCounter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << uniqueCounter;
    return ss.str();
}

bool Work::writeCancelMarker(const JobId& jobId) const noexcept {
    std::error_code ec;
    fs::create_directories(config_.jobLogDir(), ec);
    if (ec) {
        LOG_ERROR("Failed to create " + config_.jobLogDir().string() + ": " + ec.message());
        return false;
    }
    return writeFileAtomic((config_.jobLogDir() / (jobId + ".cmd")).string(), "cancel\n");
}

} // namespace xferd
