/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/payloads.hpp"
#include "xferd/errors.hpp"
#include "xferd/util.hpp"

#include <unordered_set>

namespace xferd {

namespace {

const Json::Value* field(const Json::Value& payload, const char* key) {
    if (!payload.isObject() || !payload.isMember(key)) {
        return nullptr;
    }
    const Json::Value& v = payload[key];
    return v.isNull() ? nullptr : &v;
}

std::string optString(const Json::Value& payload, const char* key) {
    const auto* v = field(payload, key);
    if (!v) return {};
    if (!v->isString()) {
        throw ValidationError(std::string("payload.") + key + " must be a string");
    }
    return v->asString();
}

bool optBool(const Json::Value& payload, const char* key, bool defaultValue = false) {
    const auto* v = field(payload, key);
    if (!v) return defaultValue;
    if (!v->isBool()) {
        throw ValidationError(std::string("payload.") + key + " must be a boolean");
    }
    return v->asBool();
}

std::vector<std::string> optStrings(const Json::Value& payload, const char* key) {
    std::vector<std::string> out;
    const auto* v = field(payload, key);
    if (!v) return out;
    if (!v->isArray()) {
        throw ValidationError(std::string("payload.") + key + " must be an array of strings");
    }
    out.reserve(v->size());
    for (Json::ArrayIndex i = 0; i < v->size(); ++i) {
        const auto& item = (*v)[i];
        if (!item.isString()) {
            throw ValidationError(std::string("payload.") + key + "[" + std::to_string(i) + "] must be a string");
        }
        out.push_back(item.asString());
    }
    return out;
}

} // namespace

SyncLocalPayload parseSyncLocalPayload(const Json::Value& payload) {
    SyncLocalPayload p;
    p.bucket = optString(payload, "bucket");
    p.prefix = optString(payload, "prefix");
    p.localPath = optString(payload, "localPath");
    p.dryRun = optBool(payload, "dryRun");
    p.deleteExtraneous = optBool(payload, "deleteExtraneous");
    p.include = optStrings(payload, "include");
    p.exclude = optStrings(payload, "exclude");
    return p;
}

SyncStagingPayload parseSyncStagingPayload(const Json::Value& payload) {
    SyncStagingPayload p;
    p.uploadId = optString(payload, "uploadId");
    return p;
}

DeletePrefixPayload parseDeletePrefixPayload(const Json::Value& payload) {
    DeletePrefixPayload p;
    p.bucket = optString(payload, "bucket");
    p.prefix = optString(payload, "prefix");
    p.deleteAll = optBool(payload, "deleteAll");
    p.dryRun = optBool(payload, "dryRun");
    p.allowUnsafePrefix = optBool(payload, "allowUnsafePrefix");
    p.include = optStrings(payload, "include");
    p.exclude = optStrings(payload, "exclude");
    return p;
}

CopyMoveObjectPayload parseCopyMoveObjectPayload(const Json::Value& payload) {
    CopyMoveObjectPayload p;
    p.srcBucket = optString(payload, "srcBucket");
    p.srcKey = optString(payload, "srcKey");
    p.dstBucket = optString(payload, "dstBucket");
    p.dstKey = optString(payload, "dstKey");
    p.dryRun = optBool(payload, "dryRun");
    return p;
}

BatchPayload parseBatchPayload(const Json::Value& payload) {
    BatchPayload p;
    p.srcBucket = optString(payload, "srcBucket");
    p.dstBucket = optString(payload, "dstBucket");
    p.dryRun = optBool(payload, "dryRun");

    // A missing or non-array items field reads as an empty list.
    const auto* items = field(payload, "items");
    if (!items || !items->isArray()) {
        return p;
    }
    p.items.reserve(items->size());
    for (Json::ArrayIndex i = 0; i < items->size(); ++i) {
        const auto& item = (*items)[i];
        if (!item.isObject()) {
            throw ValidationError("payload.items[" + std::to_string(i) + "] must be an object");
        }
        BatchItem entry;
        if (item["srcKey"].isString()) entry.srcKey = item["srcKey"].asString();
        if (item["dstKey"].isString()) entry.dstKey = item["dstKey"].asString();
        p.items.push_back(std::move(entry));
    }
    return p;
}

CopyMovePrefixPayload parseCopyMovePrefixPayload(const Json::Value& payload) {
    CopyMovePrefixPayload p;
    p.srcBucket = optString(payload, "srcBucket");
    p.srcPrefix = optString(payload, "srcPrefix");
    p.dstBucket = optString(payload, "dstBucket");
    p.dstPrefix = optString(payload, "dstPrefix");
    p.dryRun = optBool(payload, "dryRun");
    p.include = optStrings(payload, "include");
    p.exclude = optStrings(payload, "exclude");
    return p;
}

ZipPrefixPayload parseZipPrefixPayload(const Json::Value& payload) {
    ZipPrefixPayload p;
    p.bucket = optString(payload, "bucket");
    p.prefix = optString(payload, "prefix");
    return p;
}

ZipObjectsPayload parseZipObjectsPayload(const Json::Value& payload) {
    ZipObjectsPayload p;
    p.bucket = optString(payload, "bucket");
    p.keys = optStrings(payload, "keys");
    p.stripPrefix = optString(payload, "stripPrefix");
    return p;
}

DeleteObjectsPayload parseDeleteObjectsPayload(const Json::Value& payload) {
    DeleteObjectsPayload p;
    p.bucket = optString(payload, "bucket");
    p.keys = optStrings(payload, "keys");
    return p;
}

IndexObjectsPayload parseIndexObjectsPayload(const Json::Value& payload) {
    IndexObjectsPayload p;
    p.bucket = optString(payload, "bucket");
    p.prefix = optString(payload, "prefix");
    p.fullReindex = optBool(payload, "fullReindex", true);
    return p;
}

JobPayload parsePayload(JobType type, const Json::Value& payload) {
    switch (type) {
        case JobType::SyncLocalToS3:
        case JobType::SyncS3ToLocal:
            return parseSyncLocalPayload(payload);
        case JobType::SyncStagingToS3:
            return parseSyncStagingPayload(payload);
        case JobType::DeletePrefix:
            return parseDeletePrefixPayload(payload);
        case JobType::CopyObject:
        case JobType::MoveObject:
            return parseCopyMoveObjectPayload(payload);
        case JobType::CopyBatch:
        case JobType::MoveBatch:
            return parseBatchPayload(payload);
        case JobType::CopyPrefix:
        case JobType::MovePrefix:
            return parseCopyMovePrefixPayload(payload);
        case JobType::ZipPrefix:
            return parseZipPrefixPayload(payload);
        case JobType::ZipObjects:
            return parseZipObjectsPayload(payload);
        case JobType::DeleteObjects:
            return parseDeleteObjectsPayload(payload);
        case JobType::IndexObjects:
            return parseIndexObjectsPayload(payload);
    }
    throw ValidationError(std::string("unsupported job type: ") + toString(type));
}

std::vector<std::string> trimEmpty(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& value : values) {
        auto v = trim(value);
        if (!v.empty()) {
            out.push_back(std::move(v));
        }
    }
    return out;
}

std::vector<std::string> trimUnique(const std::vector<std::string>& values) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> out;
    for (auto& value : trimEmpty(values)) {
        if (seen.insert(value).second) {
            out.push_back(std::move(value));
        }
    }
    return out;
}

} // namespace xferd
