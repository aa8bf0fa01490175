/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <variant>
#include <vector>

#include <json/json.h>

#include "xferd/types.hpp"

namespace xferd {

// Parsers only check shapes; each executor applies its own rules.

struct SyncLocalPayload {
    std::string bucket;
    std::string prefix;
    std::string localPath;
    bool dryRun = false;
    bool deleteExtraneous = false;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

struct SyncStagingPayload {
    std::string uploadId;
};

struct DeletePrefixPayload {
    std::string bucket;
    std::string prefix;
    bool deleteAll = false;
    bool allowUnsafePrefix = false;
    bool dryRun = false;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

struct CopyMoveObjectPayload {
    std::string srcBucket;
    std::string srcKey;
    std::string dstBucket;
    std::string dstKey;
    bool dryRun = false;
};

struct BatchItem {
    std::string srcKey;
    std::string dstKey;
};

struct BatchPayload {
    std::string srcBucket;
    std::string dstBucket;
    std::vector<BatchItem> items;
    bool dryRun = false;
};

struct CopyMovePrefixPayload {
    std::string srcBucket;
    std::string srcPrefix;
    std::string dstBucket;
    std::string dstPrefix;
    bool dryRun = false;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

struct ZipPrefixPayload {
    std::string bucket;
    std::string prefix;
};

struct ZipObjectsPayload {
    std::string bucket;
    std::vector<std::string> keys;
    std::string stripPrefix;
};

struct DeleteObjectsPayload {
    std::string bucket;
    std::vector<std::string> keys;
};

struct IndexObjectsPayload {
    std::string bucket;
    std::string prefix;
    bool fullReindex = true;
};

using JobPayload = std::variant<SyncLocalPayload, SyncStagingPayload, DeletePrefixPayload,
                                CopyMoveObjectPayload, BatchPayload, CopyMovePrefixPayload,
                                ZipPrefixPayload, ZipObjectsPayload, DeleteObjectsPayload,
                                IndexObjectsPayload>;

// Throws ValidationError with a field-qualified message.
[[nodiscard]] SyncLocalPayload parseSyncLocalPayload(const Json::Value& payload);
[[nodiscard]] SyncStagingPayload parseSyncStagingPayload(const Json::Value& payload);
[[nodiscard]] DeletePrefixPayload parseDeletePrefixPayload(const Json::Value& payload);
[[nodiscard]] CopyMoveObjectPayload parseCopyMoveObjectPayload(const Json::Value& payload);
[[nodiscard]] BatchPayload parseBatchPayload(const Json::Value& payload);
[[nodiscard]] CopyMovePrefixPayload parseCopyMovePrefixPayload(const Json::Value& payload);
[[nodiscard]] ZipPrefixPayload parseZipPrefixPayload(const Json::Value& payload);
[[nodiscard]] ZipObjectsPayload parseZipObjectsPayload(const Json::Value& payload);
[[nodiscard]] DeleteObjectsPayload parseDeleteObjectsPayload(const Json::Value& payload);
[[nodiscard]] IndexObjectsPayload parseIndexObjectsPayload(const Json::Value& payload);

// Dispatches on the job type.
[[nodiscard]] JobPayload parsePayload(JobType type, const Json::Value& payload);

// Trimmed values with blanks dropped, order kept.
[[nodiscard]] std::vector<std::string> trimEmpty(const std::vector<std::string>& values);

// trimEmpty() without repeats; the first occurrence wins.
[[nodiscard]] std::vector<std::string> trimUnique(const std::vector<std::string>& values);

} // namespace xferd
