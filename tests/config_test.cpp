/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "xferd/config.hpp"
#include "xferd/errors.hpp"
#include "xferd/payloads.hpp"
#include "xferd/util.hpp"

using namespace xferd;

namespace {

Json::Value parse(const std::string& text) {
    auto doc = parseJson(text);
    if (!doc) throw std::runtime_error("bad test json: " + text);
    return *doc;
}

std::string validationMessage(JobType type, const std::string& json) {
    try {
        (void)parsePayload(type, parse(json));
    } catch (const ValidationError& e) {
        return e.what();
    }
    return "";
}

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
};

} // namespace

TEST(PayloadTest, SyncLocalReadsAllFields) {
    auto payload = parse(R"({"bucket":"b","prefix":"in/","localPath":"/srv/x","dryRun":true,
                             "deleteExtraneous":true,"include":["*.csv"],"exclude":["tmp/**"]})");
    auto p = std::get<SyncLocalPayload>(parsePayload(JobType::SyncLocalToS3, payload));
    EXPECT_EQ(p.bucket, "b");
    EXPECT_EQ(p.prefix, "in/");
    EXPECT_EQ(p.localPath, "/srv/x");
    EXPECT_TRUE(p.dryRun);
    EXPECT_TRUE(p.deleteExtraneous);
    EXPECT_EQ(p.include, (std::vector<std::string>{"*.csv"}));
    EXPECT_EQ(p.exclude, (std::vector<std::string>{"tmp/**"}));
}

TEST(PayloadTest, MissingFieldsTakeDefaults) {
    auto p = std::get<IndexObjectsPayload>(parsePayload(JobType::IndexObjects, parse("{}")));
    EXPECT_TRUE(p.bucket.empty());
    EXPECT_TRUE(p.fullReindex);

    auto d = std::get<DeletePrefixPayload>(parsePayload(JobType::DeletePrefix, parse(R"({"prefix":null})")));
    EXPECT_TRUE(d.prefix.empty());
    EXPECT_FALSE(d.allowUnsafePrefix);
}

TEST(PayloadTest, WrongTypesNameTheField) {
    EXPECT_EQ(validationMessage(JobType::DeletePrefix, R"({"bucket":1})"), "payload.bucket must be a string");
    EXPECT_EQ(validationMessage(JobType::DeletePrefix, R"({"deleteAll":"yes"})"),
              "payload.deleteAll must be a boolean");
    EXPECT_EQ(validationMessage(JobType::DeleteObjects, R"({"keys":"a"})"),
              "payload.keys must be an array of strings");
    EXPECT_EQ(validationMessage(JobType::ZipObjects, R"({"keys":["a",2]})"), "payload.keys[1] must be a string");
    EXPECT_EQ(validationMessage(JobType::CopyBatch, R"({"items":[{"srcKey":"a"},"b"]})"),
              "payload.items[1] must be an object");
}

TEST(PayloadTest, BatchItemsToleratesMissingKeys) {
    auto p = std::get<BatchPayload>(
        parsePayload(JobType::MoveBatch, parse(R"({"srcBucket":"a","items":[{"srcKey":"k"}]})")));
    ASSERT_EQ(p.items.size(), 1u);
    EXPECT_EQ(p.items[0].srcKey, "k");
    EXPECT_TRUE(p.items[0].dstKey.empty());

    auto empty = std::get<BatchPayload>(parsePayload(JobType::CopyBatch, parse(R"({"items":5})")));
    EXPECT_TRUE(empty.items.empty());
}

TEST(PayloadTest, TrimEmptyDropsBlanks) {
    EXPECT_EQ(trimEmpty({" a ", "", "  ", "b"}), (std::vector<std::string>{"a", "b"}));
}

TEST(ConfigTest, ParseBoolAcceptsCommonSpellings) {
    for (const char* v : {"1", "true", "T", "yes", "Y", "on", " ON "}) {
        EXPECT_EQ(parseBool(v), std::optional<bool>(true)) << v;
    }
    for (const char* v : {"0", "false", "f", "NO", "n", "off"}) {
        EXPECT_EQ(parseBool(v), std::optional<bool>(false)) << v;
    }
    EXPECT_FALSE(parseBool("maybe").has_value());
    EXPECT_FALSE(parseBool("").has_value());
}

TEST(ConfigTest, ParseDurationSumsUnits) {
    EXPECT_EQ(parseDuration("0"), std::optional<std::chrono::milliseconds>(0));
    EXPECT_EQ(parseDuration("1500ms"), std::optional<std::chrono::milliseconds>(1500));
    EXPECT_EQ(parseDuration("2s"), std::optional<std::chrono::milliseconds>(2000));
    EXPECT_EQ(parseDuration("1h30m"), std::optional<std::chrono::milliseconds>(5400000));
    EXPECT_EQ(parseDuration("0.5s"), std::optional<std::chrono::milliseconds>(500));
    EXPECT_FALSE(parseDuration("10").has_value());
    EXPECT_FALSE(parseDuration("5d").has_value());
    EXPECT_FALSE(parseDuration("").has_value());
}

TEST(ConfigTest, NormalizeAppliesBounds) {
    Config cfg = Config::defaults("/tmp/x");
    cfg.concurrency = 0;
    cfg.queueCapacity = 0;
    cfg.jobLogMaxLineBytes = 0;
    cfg.statsInterval = std::chrono::milliseconds(10);
    cfg.retry.maxAttempts = -3;
    cfg.retry.baseDelay = std::chrono::milliseconds(-5);
    cfg.retry.maxDelay = std::chrono::milliseconds(0);
    cfg.retry.jitterRatio = 4.0;
    cfg.allowedLocalDirs = {"", ".", "/srv/data/../data/"};
    cfg.normalize();

    EXPECT_EQ(cfg.concurrency, 1);
    EXPECT_EQ(cfg.queueCapacity, Config::kDefaultQueueCapacity);
    EXPECT_EQ(cfg.jobLogMaxLineBytes, Config::kDefaultMaxLineBytes);
    EXPECT_EQ(cfg.statsInterval, Config::kMinStatsInterval);
    EXPECT_EQ(cfg.retry.maxAttempts, 1);
    EXPECT_EQ(cfg.retry.baseDelay.count(), 0);
    EXPECT_EQ(cfg.retry.maxDelay.count(), 0);
    EXPECT_DOUBLE_EQ(cfg.retry.jitterRatio, 1.0);
    ASSERT_EQ(cfg.allowedLocalDirs.size(), 1u);
    EXPECT_EQ(cfg.allowedLocalDirs[0], std::filesystem::path("/srv/data/"));
}

TEST(ConfigTest, DerivedDirectories) {
    Config cfg = Config::defaults("/var/lib/xferd");
    EXPECT_EQ(cfg.jobLogDir(), std::filesystem::path("/var/lib/xferd/logs/jobs"));
    EXPECT_EQ(cfg.artifactDir(), std::filesystem::path("/var/lib/xferd/artifacts/jobs"));
    EXPECT_EQ(cfg.stagingDir(), std::filesystem::path("/var/lib/xferd/staging"));
    EXPECT_GE(cfg.tuning.maxTransfers, 4);
    EXPECT_GE(cfg.tuning.maxCheckers, 8);
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    ScopedEnv dataDir("XFERD_DATA_DIR", "/tmp/xferd-env");
    ScopedEnv concurrency("JOB_CONCURRENCY", "4");
    ScopedEnv retention("JOB_RETENTION", "72h");
    ScopedEnv dirs("ALLOWED_LOCAL_DIRS", "/srv/a: /srv/b ");
    ScopedEnv attempts("RCLONE_RETRY_ATTEMPTS", "junk");
    ScopedEnv stats("RCLONE_STATS_INTERVAL", "100ms");

    Config cfg = Config::fromEnvironment();
    EXPECT_EQ(cfg.dataDir, std::filesystem::path("/tmp/xferd-env"));
    EXPECT_EQ(cfg.concurrency, 4);
    EXPECT_EQ(cfg.jobRetention, std::chrono::hours(72));
    ASSERT_EQ(cfg.allowedLocalDirs.size(), 2u);
    EXPECT_EQ(cfg.allowedLocalDirs[1], std::filesystem::path("/srv/b"));
    EXPECT_EQ(cfg.retry.maxAttempts, 3);
    EXPECT_EQ(cfg.statsInterval, Config::kMinStatsInterval);
}
