/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <json/json.h>

#include "xferd/artifact.hpp"
#include "xferd/config.hpp"
#include "xferd/context.hpp"
#include "xferd/payloads.hpp"
#include "xferd/types.hpp"

namespace xferd {

class Runner;
class Store;
struct JobRun;

// Runs one job type end to end: validation, best-effort preflight, then the
// transfer tool invocations. Failures are thrown as JobError subclasses.
class Executor {
public:
    Executor(const Config& config, Store& store, Runner& runner) noexcept
        : config_(config), store_(store), runner_(runner) {}

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    void execute(JobRun& job, JobType type, const Json::Value& payload);

    static constexpr std::chrono::milliseconds kPreflightBudget{3000};
    static constexpr std::chrono::milliseconds kStatBudget{10000};
    static constexpr std::chrono::milliseconds kStoreTimeout{2000};
    static constexpr std::size_t kDeleteBatchSize = 1000;
    static constexpr std::size_t kIndexBatchSize = 500;
    static constexpr std::size_t kMaxZipObjects = 50000;
    static constexpr std::size_t kMaxZipKeys = 10000;

private:
    // transfer_*
    void syncLocalToS3(JobRun& job, const SyncLocalPayload& payload);
    void syncStagingToS3(JobRun& job, const SyncStagingPayload& payload);
    void syncS3ToLocal(JobRun& job, const SyncLocalPayload& payload);
    void deletePrefix(JobRun& job, const DeletePrefixPayload& payload);
    void copyMoveObject(JobRun& job, const CopyMoveObjectPayload& payload, const std::string& op);
    void copyMoveBatch(JobRun& job, const BatchPayload& payload, const std::string& op);
    void copyMovePrefix(JobRun& job, const CopyMovePrefixPayload& payload, const std::string& op);

    // s3_*
    void zipPrefix(JobRun& job, const ZipPrefixPayload& payload);
    void zipObjects(JobRun& job, const ZipObjectsPayload& payload);
    void deleteObjects(JobRun& job, const DeleteObjectsPayload& payload);
    void indexObjects(JobRun& job, const IndexObjectsPayload& payload);

    void runSync(JobRun& job, const std::string& src, const std::string& dst, bool deleteExtraneous,
                 const std::vector<std::string>& include, const std::vector<std::string>& exclude, bool dryRun);

    [[nodiscard]] std::vector<ZipObject> listZipObjectsForPrefix(JobRun& job, const std::string& bucket,
                                                                 const std::string& prefix);
    void fillZipObjectsFromKeys(JobRun& job, const std::string& bucket, std::vector<ZipObject>& objects);

    // Local path policy.
    void ensureLocalPathAllowed(const std::filesystem::path& localPath) const;
    [[nodiscard]] std::string prepareLocalDestination(const std::string& localPath) const;

    // Preflight helpers. Failures are logged at debug level only.
    void preflight(JobRun& job, const char* what, const std::function<void(const Context::Ptr&)>& body);
    void setTotals(const JobId& jobId, std::int64_t objects, std::optional<std::int64_t> bytes);
    void setTotalsFromObject(JobRun& job, const std::string& bucket, const std::string& key);
    void incrementObjectsDone(const JobId& jobId, std::int64_t delta);

    [[nodiscard]] static Context::Ptr storeContext();

    const Config& config_;
    Store& store_;
    Runner& runner_;
};

[[nodiscard]] bool isUnderDir(const std::filesystem::path& dir, const std::filesystem::path& path);

// Appends "--include <p>" / "--exclude <p>" for each non-blank pattern, trimmed.
void appendFilters(std::vector<std::string>& args, const std::vector<std::string>& include,
                   const std::vector<std::string>& exclude);

// Writes keys[begin, end) one per line to a fresh temp file
// "<stem>-XXXXXX.txt". Throws JobError "failed to create|write <label>: ...".
[[nodiscard]] std::filesystem::path writeKeyList(const std::string& stem, const std::string& label,
                                                 const std::vector<std::string>& keys, std::size_t begin,
                                                 std::size_t end);

} // namespace xferd
