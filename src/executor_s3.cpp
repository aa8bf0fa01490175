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

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace xferd {

namespace fs = std::filesystem;

namespace {

std::optional<std::time_t> listTime(const std::string& value) {
    auto normalized = normalizeListTime(value);
    if (normalized.empty()) {
        return std::nullopt;
    }
    auto tp = parseTimestamp(normalized);
    if (!tp) {
        return std::nullopt;
    }
    return Clock::to_time_t(*tp);
}

std::string contextMessage(const Context::Ptr& ctx) {
    return ctx->error() == ContextError::DeadlineExceeded ? "context deadline exceeded" : "context canceled";
}

} // namespace

// s3_zip_prefix

std::vector<ZipObject> Executor::listZipObjectsForPrefix(JobRun& job, const std::string& bucket,
                                                         const std::string& prefix) {
    const bool keep = job.profile.preserveLeadingSlash;
    auto entries = runList(runner_, job, {"lsjson", "-R", "--fast-list", "--no-mimetype", remoteDir(bucket, prefix, keep)});

    std::vector<ZipObject> objects;
    for (const auto& entry : entries) {
        if (entry.isDir) {
            continue;
        }
        auto key = objectKey(prefix, entry.key(), keep);
        if (key.empty()) {
            continue;
        }
        if (entry.size == 0 && endsWith(key, "/")) {
            continue;
        }
        auto entryName = key;
        if (!prefix.empty() && startsWith(key, prefix)) {
            entryName = key.substr(prefix.size());
        }
        if (trim(entryName).empty()) {
            continue;
        }
        if (objects.size() >= kMaxZipObjects) {
            throw JobError(ErrorCode::Unknown, "too many objects to zip (>" + std::to_string(kMaxZipObjects) +
                                                   "); narrow the prefix");
        }

        ZipObject object;
        object.key = std::move(key);
        object.entryName = std::move(entryName);
        object.size = entry.size;
        object.lastModified = listTime(entry.modTime);
        objects.push_back(std::move(object));
    }
    return objects;
}

void Executor::zipPrefix(JobRun& job, const ZipPrefixPayload& payload) {
    const auto bucket = trim(payload.bucket);
    const auto prefix = normalizePathInput(payload.prefix, job.profile.preserveLeadingSlash);
    if (bucket.empty()) {
        throw ValidationError("payload.bucket is required");
    }

    auto objects = listZipObjectsForPrefix(job, bucket, prefix);

    job.log->info("creating zip from s3://" + bucket + "/" + prefix);
    ArtifactBuilder builder(runner_, job);
    builder.build(defaultZipNameFromPrefix(bucket, prefix), bucket, objects);
}

// s3_zip_objects

void Executor::fillZipObjectsFromKeys(JobRun& job, const std::string& bucket, std::vector<ZipObject>& objects) {
    if (objects.empty()) {
        return;
    }
    std::vector<std::string> keys;
    keys.reserve(objects.size());
    for (const auto& object : objects) {
        keys.push_back(object.key);
    }

    auto listPath = writeKeyList("rclone-zip-keys", "zip key list", keys, 0, keys.size());
    std::vector<ListEntry> entries;
    try {
        entries = runList(runner_, job,
                          {"lsjson", "--files-only", "--no-mimetype", "--files-from-raw", listPath.string(),
                           remoteBucket(bucket)});
    } catch (...) {
        std::error_code ec;
        fs::remove(listPath, ec);
        throw;
    }
    std::error_code ec;
    fs::remove(listPath, ec);

    std::map<std::string, const ListEntry*> byKey;
    for (const auto& entry : entries) {
        auto key = entry.key();
        if (!key.empty()) {
            byKey[key] = &entry;
        }
    }
    for (auto& object : objects) {
        auto it = byKey.find(object.key);
        if (it == byKey.end()) {
            continue;
        }
        object.size = it->second->size;
        object.lastModified = listTime(it->second->modTime);
    }
}

void Executor::zipObjects(JobRun& job, const ZipObjectsPayload& payload) {
    const bool keep = job.profile.preserveLeadingSlash;
    const auto bucket = trim(payload.bucket);
    const auto stripPrefix = normalizePathInput(payload.stripPrefix, keep);
    const auto keys = trimEmpty(payload.keys);

    if (bucket.empty()) {
        throw ValidationError("payload.bucket is required");
    }
    if (keys.empty()) {
        throw ValidationError("payload.keys must contain at least one key");
    }
    if (keys.size() > kMaxZipKeys) {
        throw ValidationError("too many keys (" + std::to_string(keys.size()) + " > " + std::to_string(kMaxZipKeys) +
                              "); use a prefix zip instead");
    }

    std::set<std::string> normalized;
    for (const auto& raw : keys) {
        auto key = normalizePathInput(raw, keep);
        if (key.empty() || key.find('\0') != std::string::npos) {
            continue;
        }
        normalized.insert(std::move(key));
    }

    std::vector<ZipObject> objects;
    objects.reserve(normalized.size());
    for (const auto& key : normalized) {
        ZipObject object;
        object.key = key;
        object.entryName = key;
        if (!stripPrefix.empty() && startsWith(key, stripPrefix)) {
            object.entryName = key.substr(stripPrefix.size());
        }
        objects.push_back(std::move(object));
    }

    fillZipObjectsFromKeys(job, bucket, objects);

    const auto total = static_cast<std::int64_t>(objects.size());
    JobProgress progress;
    progress.objectsTotal = total;
    progress.objectsDone = 0;
    progress.bytesDone = 0;
    runner_.reporter().report(job.jobId, progress);

    job.log->info("creating zip from " + std::to_string(total) + " object(s) in s3://" + bucket);
    ArtifactBuilder builder(runner_, job);
    builder.build(defaultZipNameFromKeys(bucket, stripPrefix, objects), bucket, objects);
}

// s3_delete_objects

void Executor::deleteObjects(JobRun& job, const DeleteObjectsPayload& payload) {
    const auto bucket = trim(payload.bucket);
    const auto keys = trimUnique(payload.keys);
    if (bucket.empty()) {
        throw ValidationError("payload.bucket is required");
    }
    if (keys.empty()) {
        throw ValidationError("payload.keys must contain at least one key");
    }

    const auto total = static_cast<std::int64_t>(keys.size());
    const auto startedAt = std::chrono::steady_clock::now();
    {
        JobProgress progress;
        progress.objectsTotal = total;
        progress.objectsDone = 0;
        runner_.reporter().report(job.jobId, progress);
    }
    job.log->info("deleting " + std::to_string(total) + " object(s) from s3://" + bucket);

    std::int64_t done = 0;
    for (std::size_t begin = 0; begin < keys.size(); begin += kDeleteBatchSize) {
        if (job.ctx->done()) {
            throw CanceledError(contextMessage(job.ctx));
        }
        const std::size_t end = std::min(begin + kDeleteBatchSize, keys.size());

        fs::path listPath;
        try {
            listPath = writeKeyList("rclone-delete", "delete list", keys, begin, end);
        } catch (const JobError& e) {
            job.log->error(e.what());
            throw;
        }

        std::unique_ptr<EngineProcess> proc;
        try {
            proc = runner_.start(job, {"delete", "--files-from-raw", listPath.string(), remoteBucket(bucket)});
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(listPath, ec);
            job.log->error("rclone delete failed: " + std::string(e.what()));
            throw;
        }
        (void)readAll(proc->stdoutFd());
        std::string waitErr;
        const bool ok = proc->wait(&waitErr);
        std::error_code ec;
        fs::remove(listPath, ec);
        if (!ok) {
            if (job.ctx->done()) {
                throw CanceledError(contextMessage(job.ctx));
            }
            auto err = engineFailure(waitErr, proc->stderrText(), "rclone delete");
            job.log->error(err.what());
            throw err;
        }

        done += static_cast<std::int64_t>(end - begin);

        JobProgress progress;
        progress.objectsTotal = total;
        progress.objectsDone = done;
        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt).count();
        if (done > 0 && elapsed > 0) {
            const double rate = static_cast<double>(done) / elapsed;
            if (rate > 0) {
                progress.objectsPerSecond = std::max<std::int64_t>(1, std::llround(rate));
                const auto remaining = total - done;
                if (remaining > 0) {
                    auto eta = static_cast<std::int64_t>(std::ceil(static_cast<double>(remaining) / rate));
                    if (eta > 0) {
                        progress.etaSeconds = eta;
                    }
                }
            }
        }
        runner_.reporter().report(job.jobId, progress);
    }

    job.log->info("completed");
}

// s3_index_objects

void Executor::indexObjects(JobRun& job, const IndexObjectsPayload& payload) {
    const bool keep = job.profile.preserveLeadingSlash;
    const auto bucket = trim(payload.bucket);
    auto prefix = trim(payload.prefix);
    if (startsWith(prefix, "/")) {
        prefix.erase(0, 1);
    }
    if (bucket.empty()) {
        throw ValidationError("payload.bucket is required");
    }
    if (contains(prefix, "*")) {
        throw ValidationError("wildcards are not allowed in prefix");
    }

    job.log->info("Starting index: bucket=\"" + bucket + "\" prefix=\"" + prefix + "\"");
    if (payload.fullReindex) {
        job.log->info("Clearing existing index entries...");
        if (!store_.clearObjectIndex(job.ctx, job.profile.id, bucket, prefix)) {
            job.ctx->check();
            throw JobError(ErrorCode::Unknown, "failed to clear object index");
        }
    }

    auto entries = runList(runner_, job,
                           {"lsjson", "-R", "--fast-list", "--hash", "--no-mimetype", remoteDir(bucket, prefix, keep)});

    const auto indexedAt = nowTimestamp();
    std::int64_t objectsDone = 0;
    std::int64_t bytesDone = 0;
    auto lastFlush = std::chrono::steady_clock::now();

    auto flushProgress = [&](bool force) {
        auto now = std::chrono::steady_clock::now();
        if (!force && now - lastFlush < std::chrono::seconds(1)) {
            return;
        }
        lastFlush = now;
        JobProgress progress;
        progress.objectsDone = objectsDone;
        progress.bytesDone = bytesDone;
        runner_.reporter().report(job.jobId, progress);
    };

    std::vector<ObjectIndexEntry> batch;
    batch.reserve(kIndexBatchSize);
    auto flushBatch = [&] {
        if (batch.empty()) {
            return true;
        }
        if (!store_.upsertObjectIndexBatch(job.ctx, job.profile.id, bucket, batch, indexedAt)) {
            return false;
        }
        batch.clear();
        return true;
    };

    for (const auto& entry : entries) {
        if (job.ctx->done()) {
            if (!flushBatch()) {
                LOG_WARN("Dropped pending index batch for canceled job " + job.jobId);
            }
            flushProgress(true);
            throw CanceledError(contextMessage(job.ctx));
        }
        if (entry.isDir) {
            continue;
        }
        auto key = objectKey(prefix, entry.key(), keep);
        if (key.empty()) {
            continue;
        }

        ObjectIndexEntry item;
        item.key = std::move(key);
        item.size = entry.size;
        item.etag = etagFromHashes(entry.hashes);
        item.lastModified = normalizeListTime(entry.modTime);
        batch.push_back(std::move(item));

        ++objectsDone;
        bytesDone += entry.size;

        if (batch.size() >= kIndexBatchSize && !flushBatch()) {
            job.ctx->check();
            throw JobError(ErrorCode::Unknown, "failed to write object index batch");
        }
        flushProgress(false);
    }

    if (!flushBatch()) {
        job.ctx->check();
        throw JobError(ErrorCode::Unknown, "failed to write object index batch");
    }
    flushProgress(true);
    job.log->info("Index complete: objects=" + std::to_string(objectsDone) + " bytes=" + std::to_string(bytesDone) +
                  " indexedAt=" + indexedAt);
}

} // namespace xferd
