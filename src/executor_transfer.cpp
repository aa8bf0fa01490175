/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/errors.hpp"
#include "xferd/executor.hpp"
#include "xferd/listing.hpp"
#include "xferd/logger.hpp"
#include "xferd/remote.hpp"
#include "xferd/runner.hpp"
#include "xferd/store.hpp"
#include "xferd/util.hpp"

namespace xferd {

namespace fs = std::filesystem;

void Executor::syncLocalToS3(JobRun& job, const SyncLocalPayload& payload) {
    const auto bucket = trim(payload.bucket);
    const auto localPath = trim(payload.localPath);
    if (bucket.empty() || localPath.empty()) {
        throw ValidationError("payload.bucket and payload.localPath are required");
    }

    const auto src = fs::path(localPath).lexically_normal();
    ensureLocalPathAllowed(src);

    preflight(job, "local totals", [&](const Context::Ptr& ctx) {
        auto totals = computeLocalTotals(ctx, src, payload.include, payload.exclude);
        setTotals(job.jobId, totals.objects, totals.bytes);
    });

    const auto dst = remoteDir(bucket, payload.prefix, job.profile.preserveLeadingSlash);
    runSync(job, src.string(), dst, payload.deleteExtraneous, payload.include, payload.exclude, payload.dryRun);
}

void Executor::syncStagingToS3(JobRun& job, const SyncStagingPayload& payload) {
    const auto uploadId = trim(payload.uploadId);
    if (uploadId.empty()) {
        throw ValidationError("payload.uploadId is required");
    }

    auto session = store_.getUploadSession(storeContext(), job.profile.id, uploadId);
    if (!session) {
        throw JobError(ErrorCode::NotFound, "upload session not found");
    }
    if (auto expiresAt = parseTimestamp(session->expiresAt)) {
        if (Clock::now() > *expiresAt) {
            throw ValidationError("upload session expired");
        }
    }

    const auto src = fs::path(session->stagingDir).lexically_normal();
    const auto dst = remoteDir(session->bucket, session->prefix, job.profile.preserveLeadingSlash);

    preflight(job, "staging totals", [&](const Context::Ptr& ctx) {
        auto totals = computeLocalTotals(ctx, src, {}, {});
        setTotals(job.jobId, totals.objects, totals.bytes);
    });

    runSync(job, src.string(), dst, false, {}, {}, false);

    if (!store_.deleteUploadSession(storeContext(), job.profile.id, uploadId)) {
        LOG_WARN("Failed to delete upload session " + uploadId + " after job " + job.jobId);
    }
    std::error_code ec;
    fs::remove_all(src, ec);
    if (ec) {
        LOG_WARN("Failed to remove staging dir " + src.string() + ": " + ec.message());
    }
}

void Executor::syncS3ToLocal(JobRun& job, const SyncLocalPayload& payload) {
    const auto bucket = trim(payload.bucket);
    const auto prefix = normalizePathInput(payload.prefix, job.profile.preserveLeadingSlash);
    const auto localPath = trim(payload.localPath);
    if (bucket.empty() && localPath.empty()) {
        throw ValidationError("payload.bucket and payload.localPath are required");
    }
    if (bucket.empty()) {
        throw ValidationError("payload.bucket is required");
    }
    if (localPath.empty()) {
        throw ValidationError("payload.localPath is required");
    }
    if (contains(prefix, "*")) {
        throw ValidationError("wildcards are not allowed in prefix");
    }

    const auto dst = prepareLocalDestination(localPath);

    preflight(job, "remote totals", [&](const Context::Ptr& ctx) {
        auto totals = computeRemoteTotals(runner_, job, ctx, bucket, prefix, payload.include, payload.exclude);
        if (totals) {
            setTotals(job.jobId, totals->objects, totals->bytes);
        }
    });

    const auto src = remoteDir(bucket, prefix, job.profile.preserveLeadingSlash);
    runSync(job, src, dst, payload.deleteExtraneous, payload.include, payload.exclude, payload.dryRun);
}

void Executor::deletePrefix(JobRun& job, const DeletePrefixPayload& payload) {
    const bool keep = job.profile.preserveLeadingSlash;
    const auto bucket = trim(payload.bucket);
    const auto prefix = normalizePathInput(payload.prefix, keep);

    if (bucket.empty()) {
        throw ValidationError("payload.bucket is required");
    }
    if (payload.deleteAll && !prefix.empty()) {
        throw ValidationError("payload.prefix must be empty when payload.deleteAll=true");
    }
    if (prefix.empty() && !payload.deleteAll) {
        throw ValidationError("payload.prefix is required (or set payload.deleteAll=true)");
    }
    if (contains(prefix, "*")) {
        throw ValidationError("wildcards are not allowed in prefix");
    }
    if (!prefix.empty() && !endsWith(prefix, "/") && !payload.allowUnsafePrefix) {
        throw ValidationError("payload.prefix must end with '/' (or set payload.allowUnsafePrefix=true)");
    }

    preflight(job, "remote totals", [&](const Context::Ptr& ctx) {
        auto totals = computeRemoteTotals(runner_, job, ctx, bucket, prefix, payload.include, payload.exclude);
        if (totals) {
            setTotals(job.jobId, totals->objects, std::nullopt);
        }
    });

    const bool filtered = !trimEmpty(payload.include).empty() || !trimEmpty(payload.exclude).empty();
    std::vector<std::string> args;
    if (payload.deleteAll && !filtered) {
        args = {"purge", remoteBucket(bucket)};
    } else {
        args = {"delete"};
        appendFilters(args, payload.include, payload.exclude);
        args.push_back(payload.deleteAll ? remoteBucket(bucket) : remoteDir(bucket, prefix, keep));
    }

    RunOptions options;
    options.trackProgress = true;
    options.dryRun = payload.dryRun;
    options.mode = ProgressMode::Deletes;
    runner_.run(job, args, options);
}

void Executor::copyMoveObject(JobRun& job, const CopyMoveObjectPayload& payload, const std::string& op) {
    const bool keep = job.profile.preserveLeadingSlash;
    const auto srcBucket = trim(payload.srcBucket);
    const auto srcKey = normalizePathInput(payload.srcKey, keep);
    const auto dstBucket = trim(payload.dstBucket);
    const auto dstKey = normalizePathInput(payload.dstKey, keep);

    if (srcBucket.empty() || srcKey.empty() || dstBucket.empty() || dstKey.empty()) {
        throw ValidationError("payload.srcBucket, payload.srcKey, payload.dstBucket and payload.dstKey are required");
    }
    if (contains(srcKey, "*") || contains(dstKey, "*")) {
        throw ValidationError("wildcards are not allowed in keys");
    }
    if (srcBucket == dstBucket && srcKey == dstKey) {
        throw ValidationError("source and destination must be different");
    }

    setTotalsFromObject(job, srcBucket, srcKey);

    RunOptions options;
    options.trackProgress = true;
    options.dryRun = payload.dryRun;
    runner_.run(job, {op, remoteObject(srcBucket, srcKey, keep), remoteObject(dstBucket, dstKey, keep)}, options);
}

void Executor::copyMoveBatch(JobRun& job, const BatchPayload& payload, const std::string& op) {
    const bool keep = job.profile.preserveLeadingSlash;
    const auto srcBucket = trim(payload.srcBucket);
    const auto dstBucket = trim(payload.dstBucket);
    if (srcBucket.empty() || dstBucket.empty()) {
        throw ValidationError("payload.srcBucket and payload.dstBucket are required");
    }
    if (payload.items.empty()) {
        throw ValidationError("payload.items is required");
    }

    std::vector<BatchItem> pairs;
    pairs.reserve(payload.items.size());
    for (std::size_t i = 0; i < payload.items.size(); ++i) {
        const auto idx = std::to_string(i);
        auto srcKey = normalizePathInput(payload.items[i].srcKey, keep);
        auto dstKey = normalizePathInput(payload.items[i].dstKey, keep);
        if (srcKey.empty() || dstKey.empty()) {
            throw ValidationError("payload.items[" + idx + "].srcKey and payload.items[" + idx +
                                  "].dstKey are required");
        }
        if (contains(srcKey, "*") || contains(dstKey, "*")) {
            throw ValidationError("wildcards are not allowed in keys (items[" + idx + "])");
        }
        if (srcBucket == dstBucket && srcKey == dstKey) {
            throw ValidationError("source and destination must be different (items[" + idx + "])");
        }
        pairs.push_back({std::move(srcKey), std::move(dstKey)});
    }

    setTotals(job.jobId, static_cast<std::int64_t>(pairs.size()), std::nullopt);

    RunOptions options;
    options.trackProgress = false;
    options.dryRun = payload.dryRun;
    for (const auto& pair : pairs) {
        runner_.run(job, {op, remoteObject(srcBucket, pair.srcKey, keep), remoteObject(dstBucket, pair.dstKey, keep)},
                    options);
        incrementObjectsDone(job.jobId, 1);
    }
}

void Executor::copyMovePrefix(JobRun& job, const CopyMovePrefixPayload& payload, const std::string& op) {
    const bool keep = job.profile.preserveLeadingSlash;
    const auto srcBucket = trim(payload.srcBucket);
    const auto srcPrefix = normalizePathInput(payload.srcPrefix, keep);
    const auto dstBucket = trim(payload.dstBucket);
    auto dstPrefix = normalizePathInput(payload.dstPrefix, keep);

    if (srcBucket.empty() || dstBucket.empty()) {
        throw ValidationError("payload.srcBucket and payload.dstBucket are required");
    }
    if (srcPrefix.empty()) {
        throw ValidationError("payload.srcPrefix is required");
    }
    if (contains(srcPrefix, "*") || contains(dstPrefix, "*")) {
        throw ValidationError("wildcards are not allowed in prefixes");
    }
    if (!endsWith(srcPrefix, "/")) {
        throw ValidationError("payload.srcPrefix must end with '/'");
    }
    if (!dstPrefix.empty() && !endsWith(dstPrefix, "/")) {
        dstPrefix += '/';
    }
    if (srcBucket == dstBucket && !dstPrefix.empty()) {
        if (dstPrefix == srcPrefix) {
            throw ValidationError("source and destination must be different");
        }
        if (startsWith(dstPrefix, srcPrefix)) {
            throw ValidationError("destination prefix must not be under source prefix");
        }
    }

    preflight(job, "remote totals", [&](const Context::Ptr& ctx) {
        auto totals = computeRemoteTotals(runner_, job, ctx, srcBucket, srcPrefix, payload.include, payload.exclude);
        if (totals) {
            setTotals(job.jobId, totals->objects, totals->bytes);
        }
    });

    std::vector<std::string> args{op};
    appendFilters(args, payload.include, payload.exclude);
    args.push_back(remoteDir(srcBucket, srcPrefix, keep));
    args.push_back(remoteDir(dstBucket, dstPrefix, keep));

    RunOptions options;
    options.trackProgress = true;
    options.dryRun = payload.dryRun;
    runner_.run(job, args, options);
}

} // namespace xferd
