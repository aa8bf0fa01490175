/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/types.hpp"
#include <array>
#include <utility>

namespace xferd {

namespace {

constexpr std::array<std::pair<JobType, const char*>, 14> kJobTypeNames{{
    {JobType::SyncLocalToS3, "transfer_sync_local_to_s3"},
    {JobType::SyncStagingToS3, "transfer_sync_staging_to_s3"},
    {JobType::SyncS3ToLocal, "transfer_sync_s3_to_local"},
    {JobType::DeletePrefix, "transfer_delete_prefix"},
    {JobType::CopyObject, "transfer_copy_object"},
    {JobType::MoveObject, "transfer_move_object"},
    {JobType::CopyBatch, "transfer_copy_batch"},
    {JobType::MoveBatch, "transfer_move_batch"},
    {JobType::CopyPrefix, "transfer_copy_prefix"},
    {JobType::MovePrefix, "transfer_move_prefix"},
    {JobType::ZipPrefix, "s3_zip_prefix"},
    {JobType::ZipObjects, "s3_zip_objects"},
    {JobType::DeleteObjects, "s3_delete_objects"},
    {JobType::IndexObjects, "s3_index_objects"},
}};

void putOptional(Json::Value& out, const char* key, const std::optional<std::int64_t>& value) {
    if (value) {
        out[key] = Json::Int64(*value);
    }
}

void putOptional(Json::Value& out, const char* key, const std::optional<std::string>& value) {
    if (value) {
        out[key] = *value;
    }
}

std::optional<std::int64_t> getInt(const Json::Value& in, const char* key) {
    const Json::Value& v = in[key];
    if (v.isInt64()) return v.asInt64();
    if (v.isDouble()) return static_cast<std::int64_t>(v.asDouble());
    return std::nullopt;
}

std::optional<std::string> getString(const Json::Value& in, const char* key) {
    const Json::Value& v = in[key];
    if (v.isString()) return v.asString();
    return std::nullopt;
}

} // namespace

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Running: return "running";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed: return "failed";
        case JobStatus::Canceled: return "canceled";
    }
    return "unknown";
}

std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept {
    if (value == "queued") return JobStatus::Queued;
    if (value == "running") return JobStatus::Running;
    if (value == "succeeded") return JobStatus::Succeeded;
    if (value == "failed") return JobStatus::Failed;
    if (value == "canceled") return JobStatus::Canceled;
    return std::nullopt;
}

bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Succeeded || status == JobStatus::Failed ||
           status == JobStatus::Canceled;
}

const char* toString(JobType type) noexcept {
    for (const auto& entry : kJobTypeNames) {
        if (entry.first == type) return entry.second;
    }
    return "unknown";
}

std::optional<JobType> parseJobType(const std::string& value) noexcept {
    for (const auto& entry : kJobTypeNames) {
        if (value == entry.second) return entry.first;
    }
    return std::nullopt;
}

bool JobProgress::empty() const noexcept {
    return !objectsDone && !objectsTotal && !objectsPerSecond && !bytesDone &&
           !bytesTotal && !speedBps && !etaSeconds;
}

bool JobProgress::operator==(const JobProgress& other) const noexcept {
    return objectsDone == other.objectsDone && objectsTotal == other.objectsTotal &&
           objectsPerSecond == other.objectsPerSecond && bytesDone == other.bytesDone &&
           bytesTotal == other.bytesTotal && speedBps == other.speedBps &&
           etaSeconds == other.etaSeconds;
}

std::optional<JobProgress> finalizeProgress(const std::optional<JobProgress>& progress) {
    if (!progress) {
        return std::nullopt;
    }
    JobProgress out = *progress;
    out.objectsPerSecond.reset();
    out.speedBps.reset();
    out.etaSeconds.reset();
    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

Json::Value progressToJson(const JobProgress& progress) {
    Json::Value out(Json::objectValue);
    putOptional(out, "objectsDone", progress.objectsDone);
    putOptional(out, "objectsTotal", progress.objectsTotal);
    putOptional(out, "objectsPerSecond", progress.objectsPerSecond);
    putOptional(out, "bytesDone", progress.bytesDone);
    putOptional(out, "bytesTotal", progress.bytesTotal);
    putOptional(out, "speedBps", progress.speedBps);
    putOptional(out, "etaSeconds", progress.etaSeconds);
    return out;
}

JobProgress progressFromJson(const Json::Value& value) {
    JobProgress p;
    if (!value.isObject()) {
        return p;
    }
    p.objectsDone = getInt(value, "objectsDone");
    p.objectsTotal = getInt(value, "objectsTotal");
    p.objectsPerSecond = getInt(value, "objectsPerSecond");
    p.bytesDone = getInt(value, "bytesDone");
    p.bytesTotal = getInt(value, "bytesTotal");
    p.speedBps = getInt(value, "speedBps");
    p.etaSeconds = getInt(value, "etaSeconds");
    return p;
}

Json::Value jobToJson(const Job& job) {
    Json::Value out(Json::objectValue);
    out["id"] = job.id;
    out["profileId"] = job.profileId;
    out["type"] = job.type;
    out["payload"] = job.payload;
    out["status"] = toString(job.status);
    if (job.progress) {
        out["progress"] = progressToJson(*job.progress);
    }
    putOptional(out, "error", job.error);
    putOptional(out, "errorCode", job.errorCode);
    out["createdAt"] = job.createdAt;
    putOptional(out, "startedAt", job.startedAt);
    putOptional(out, "finishedAt", job.finishedAt);
    return out;
}

std::optional<Job> jobFromJson(const Json::Value& value) {
    if (!value.isObject() || !value["id"].isString() || !value["status"].isString()) {
        return std::nullopt;
    }
    auto status = parseJobStatus(value["status"].asString());
    if (!status) {
        return std::nullopt;
    }
    Job job;
    job.id = value["id"].asString();
    job.profileId = value.get("profileId", "").asString();
    job.type = value.get("type", "").asString();
    job.payload = value.isMember("payload") ? value["payload"] : Json::Value(Json::objectValue);
    job.status = *status;
    if (value["progress"].isObject()) {
        job.progress = progressFromJson(value["progress"]);
    }
    job.error = getString(value, "error");
    job.errorCode = getString(value, "errorCode");
    job.createdAt = value.get("createdAt", "").asString();
    job.startedAt = getString(value, "startedAt");
    job.finishedAt = getString(value, "finishedAt");
    return job;
}

const char* toString(ProfileProvider provider) noexcept {
    return provider == ProfileProvider::AwsS3 ? "aws_s3" : "s3_compatible";
}

Json::Value profileToJson(const ProfileSecrets& profile) {
    Json::Value out(Json::objectValue);
    out["id"] = profile.id;
    out["name"] = profile.name;
    out["provider"] = toString(profile.provider);
    out["endpoint"] = profile.endpoint;
    out["region"] = profile.region;
    out["forcePathStyle"] = profile.forcePathStyle;
    out["accessKeyId"] = profile.accessKeyId;
    out["secretAccessKey"] = profile.secretAccessKey;
    putOptional(out, "sessionToken", profile.sessionToken);
    out["preserveLeadingSlash"] = profile.preserveLeadingSlash;
    out["tlsInsecureSkipVerify"] = profile.tlsInsecureSkipVerify;
    if (profile.tls) {
        Json::Value tls(Json::objectValue);
        tls["mode"] = profile.tls->mode == TlsMode::Mtls ? "mtls" : "disabled";
        tls["clientCertPem"] = profile.tls->clientCertPem;
        tls["clientKeyPem"] = profile.tls->clientKeyPem;
        tls["caCertPem"] = profile.tls->caCertPem;
        out["tls"] = tls;
    }
    return out;
}

std::optional<ProfileSecrets> profileFromJson(const Json::Value& value) {
    if (!value.isObject() || !value["id"].isString()) {
        return std::nullopt;
    }
    ProfileSecrets p;
    p.id = value["id"].asString();
    p.name = value.get("name", "").asString();
    p.provider = value.get("provider", "").asString() == "aws_s3" ? ProfileProvider::AwsS3
                                                                  : ProfileProvider::S3Compatible;
    p.endpoint = value.get("endpoint", "").asString();
    p.region = value.get("region", "").asString();
    p.forcePathStyle = value.get("forcePathStyle", false).asBool();
    p.accessKeyId = value.get("accessKeyId", "").asString();
    p.secretAccessKey = value.get("secretAccessKey", "").asString();
    p.sessionToken = getString(value, "sessionToken");
    p.preserveLeadingSlash = value.get("preserveLeadingSlash", false).asBool();
    p.tlsInsecureSkipVerify = value.get("tlsInsecureSkipVerify", false).asBool();
    const Json::Value& tls = value["tls"];
    if (tls.isObject()) {
        ProfileTls t;
        t.mode = tls.get("mode", "").asString() == "mtls" ? TlsMode::Mtls : TlsMode::Disabled;
        t.clientCertPem = tls.get("clientCertPem", "").asString();
        t.clientKeyPem = tls.get("clientKeyPem", "").asString();
        t.caCertPem = tls.get("caCertPem", "").asString();
        p.tls = t;
    }
    return p;
}

Json::Value uploadSessionToJson(const UploadSession& session) {
    Json::Value out(Json::objectValue);
    out["id"] = session.id;
    out["profileId"] = session.profileId;
    out["bucket"] = session.bucket;
    out["prefix"] = session.prefix;
    out["stagingDir"] = session.stagingDir;
    out["expiresAt"] = session.expiresAt;
    out["createdAt"] = session.createdAt;
    return out;
}

std::optional<UploadSession> uploadSessionFromJson(const Json::Value& value) {
    if (!value.isObject() || !value["id"].isString()) {
        return std::nullopt;
    }
    UploadSession s;
    s.id = value["id"].asString();
    s.profileId = value.get("profileId", "").asString();
    s.bucket = value.get("bucket", "").asString();
    s.prefix = value.get("prefix", "").asString();
    s.stagingDir = value.get("stagingDir", "").asString();
    s.expiresAt = value.get("expiresAt", "").asString();
    s.createdAt = value.get("createdAt", "").asString();
    return s;
}

} // namespace xferd
