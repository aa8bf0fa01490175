/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <json/json.h>

namespace xferd {

// Opaque job identifier.
using JobId = std::string;

// Core job lifecycle states.
enum class JobStatus : std::uint8_t { Queued, Running, Succeeded, Failed, Canceled };

enum class JobType : std::uint8_t {
    SyncLocalToS3,
    SyncStagingToS3,
    SyncS3ToLocal,
    DeletePrefix,
    CopyObject,
    MoveObject,
    CopyBatch,
    MoveBatch,
    CopyPrefix,
    MovePrefix,
    ZipPrefix,
    ZipObjects,
    DeleteObjects,
    IndexObjects
};

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept;
[[nodiscard]] bool isTerminal(JobStatus status) noexcept;

[[nodiscard]] const char* toString(JobType type) noexcept;
[[nodiscard]] std::optional<JobType> parseJobType(const std::string& value) noexcept;

// Point-in-time progress snapshot. Every field is unknown until observed.
struct JobProgress {
    std::optional<std::int64_t> objectsDone;
    std::optional<std::int64_t> objectsTotal;
    std::optional<std::int64_t> objectsPerSecond;
    std::optional<std::int64_t> bytesDone;
    std::optional<std::int64_t> bytesTotal;
    std::optional<std::int64_t> speedBps;
    std::optional<std::int64_t> etaSeconds;

    [[nodiscard]] bool empty() const noexcept;
    bool operator==(const JobProgress& other) const noexcept;
    bool operator!=(const JobProgress& other) const noexcept { return !(*this == other); }
};

// Drops the instantaneous fields; keeps stable done/total counts.
[[nodiscard]] std::optional<JobProgress> finalizeProgress(const std::optional<JobProgress>& progress);

struct Job {
    JobId id;
    std::string profileId;
    std::string type;
    Json::Value payload{Json::objectValue};
    JobStatus status = JobStatus::Queued;
    std::optional<JobProgress> progress;
    std::optional<std::string> error;
    std::optional<std::string> errorCode;
    std::string createdAt;
    std::optional<std::string> startedAt;
    std::optional<std::string> finishedAt;
};

struct QueueStats {
    std::size_t depth = 0;
    std::size_t capacity = 0;
};

enum class ProfileProvider : std::uint8_t { AwsS3, S3Compatible };

[[nodiscard]] const char* toString(ProfileProvider provider) noexcept;

enum class TlsMode : std::uint8_t { Disabled, Mtls };

struct ProfileTls {
    TlsMode mode = TlsMode::Disabled;
    std::string clientCertPem;
    std::string clientKeyPem;
    std::string caCertPem;
};

struct ProfileSecrets {
    std::string id;
    std::string name;
    ProfileProvider provider = ProfileProvider::S3Compatible;
    std::string endpoint;
    std::string region;
    bool forcePathStyle = false;
    std::string accessKeyId;
    std::string secretAccessKey;
    std::optional<std::string> sessionToken;
    bool preserveLeadingSlash = false;
    bool tlsInsecureSkipVerify = false;
    std::optional<ProfileTls> tls;
};

struct UploadSession {
    std::string id;
    std::string profileId;
    std::string bucket;
    std::string prefix;
    std::string stagingDir;
    std::string expiresAt;
    std::string createdAt;
};

struct ObjectIndexEntry {
    std::string key;
    std::int64_t size = 0;
    std::string etag;
    std::string lastModified;
};

// JSON mapping shared by the store, the event payloads and the CLI.
[[nodiscard]] Json::Value progressToJson(const JobProgress& progress);
[[nodiscard]] JobProgress progressFromJson(const Json::Value& value);
[[nodiscard]] Json::Value jobToJson(const Job& job);
[[nodiscard]] std::optional<Job> jobFromJson(const Json::Value& value);
[[nodiscard]] Json::Value profileToJson(const ProfileSecrets& profile);
[[nodiscard]] std::optional<ProfileSecrets> profileFromJson(const Json::Value& value);
[[nodiscard]] Json::Value uploadSessionToJson(const UploadSession& session);
[[nodiscard]] std::optional<UploadSession> uploadSessionFromJson(const Json::Value& value);

} // namespace xferd
