/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "xferd/engine.hpp"
#include "xferd/manager.hpp"
#include "xferd/runner.hpp"

using namespace xferd;

namespace {

EngineTuning tuning(int transfers, int checkers, int uploadConcurrency = 0) {
    EngineTuning t;
    t.enabled = true;
    t.maxTransfers = transfers;
    t.maxCheckers = checkers;
    t.s3UploadConcurrency = uploadConcurrency;
    return t;
}

} // namespace

TEST(TuneTest, OnlyTransferCommandsAreTuned) {
    EXPECT_FALSE(computeTune(tuning(16, 32), {"lsjson", "remote:b"}, true, 1).has_value());
    EXPECT_FALSE(computeTune(tuning(16, 32), {}, true, 1).has_value());
    EXPECT_TRUE(computeTune(tuning(16, 32), {"purge", "remote:b"}, true, 1).has_value());

    EngineTuning off = tuning(16, 32);
    off.enabled = false;
    EXPECT_FALSE(computeTune(off, {"copy", "a", "b"}, true, 1).has_value());
}

TEST(TuneTest, BudgetIsSharedAcrossActiveJobs) {
    auto tune = computeTune(tuning(16, 32), {"copy", "a", "b"}, true, 2);
    ASSERT_TRUE(tune.has_value());
    EXPECT_EQ(tune->transfers, 8);
    EXPECT_EQ(tune->checkers, 16);
    EXPECT_EQ(tune->uploadConcurrency, 0);

    auto crowded = computeTune(tuning(4, 8), {"sync", "a", "b"}, true, 10);
    ASSERT_TRUE(crowded.has_value());
    EXPECT_EQ(crowded->transfers, 1);
    EXPECT_EQ(crowded->checkers, 1);

    auto idle = computeTune(tuning(4, 8), {"sync", "a", "b"}, true, 0);
    ASSERT_TRUE(idle.has_value());
    EXPECT_EQ(idle->activeJobs, 1);
    EXPECT_EQ(idle->transfers, 4);
}

TEST(TuneTest, UploadConcurrencyOnlyWhenConfiguredForS3) {
    auto s3 = computeTune(tuning(16, 32, 8), {"copy", "a", "b"}, true, 4);
    ASSERT_TRUE(s3.has_value());
    EXPECT_EQ(s3->uploadConcurrency, 2);

    auto local = computeTune(tuning(16, 32, 8), {"copy", "a", "b"}, false, 4);
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->uploadConcurrency, 0);
}

TEST(TuneTest, ApplyKeepsExplicitFlags) {
    Tune tune;
    tune.transfers = 4;
    tune.checkers = 8;
    tune.uploadConcurrency = 2;

    std::vector<std::string> args{"--transfers", "1"};
    applyTune(args, tune, true);
    EXPECT_EQ(args, (std::vector<std::string>{"--transfers", "1", "--checkers", "8", "--s3-upload-concurrency", "2"}));
    EXPECT_TRUE(hasFlag(args, "--checkers"));
    EXPECT_FALSE(hasFlag(args, "--dry-run"));

    std::vector<std::string> local;
    applyTune(local, tune, false);
    EXPECT_EQ(local, (std::vector<std::string>{"--transfers", "4", "--checkers", "8"}));
}

TEST(EngineFailureTest, PrefersStderrAndClassifies) {
    auto err = engineFailure("exit status 1", "ERROR : AccessDenied: Access Denied", "rclone delete");
    EXPECT_EQ(err.code(), classify("exit status 1", "ERROR : AccessDenied: Access Denied").code);
    EXPECT_NE(std::string(err.what()).find("rclone delete: ERROR : AccessDenied"), std::string::npos);

    auto bare = engineFailure("", "", "");
    EXPECT_NE(std::string(bare.what()).find("rclone failed"), std::string::npos);
}

TEST(EngineVersionTest, ParsesSemver) {
    auto v = parseSemver("rclone v1.66.0\n- os/version: linux");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->major, 1);
    EXPECT_EQ(v->minor, 66);
    EXPECT_EQ(v->patch, 0);

    auto short_ = parseSemver("1.52");
    ASSERT_TRUE(short_.has_value());
    EXPECT_EQ(short_->patch, 0);
    EXPECT_FALSE(parseSemver("rclone dev").has_value());
}

TEST(EngineVersionTest, MinimumVersion) {
    EXPECT_TRUE(isEngineVersionCompatible("rclone v1.52.0"));
    EXPECT_TRUE(isEngineVersionCompatible("rclone v2.0.0"));
    EXPECT_FALSE(isEngineVersionCompatible("rclone v1.51.9"));
    EXPECT_FALSE(isEngineVersionCompatible("garbage"));
    EXPECT_EQ(incompatibleMessage("rclone v1.40.0", "version too old"),
              "rclone rclone v1.40.0 is incompatible (requires >= 1.52.0): version too old");
    EXPECT_EQ(incompatibleMessage("", ""), "rclone is incompatible (requires >= 1.52.0)");
}

TEST(EngineLocatorTest, AcceptsCompatibleTool) {
    test::TempDir dir;
    auto script = test::writeFakeEngine(dir.path());
    EngineLocator locator(script.string());
    auto info = locator.ensureCompatible();
    EXPECT_EQ(info.path, script.string());
    EXPECT_EQ(info.version, "rclone v1.66.0");
}

TEST(EngineLocatorTest, RejectsMissingAndOldTools) {
    test::TempDir dir;
    EngineLocator missing((dir.path() / "nope").string());
    try {
        (void)missing.ensureCompatible();
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TransferEngineMissing);
    }

    const auto old = dir.path() / "old-rclone";
    test::writeText(old, "#!/bin/sh\necho \"rclone v1.40.0\"\n");
    ::chmod(old.c_str(), 0755);
    EngineLocator outdated(old.string());
    try {
        (void)outdated.ensureCompatible();
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TransferEngineIncompatible);
        EXPECT_NE(std::string(e.what()).find("version too old"), std::string::npos);
    }
}

namespace {

Json::Value copyObject() {
    Json::Value payload(Json::objectValue);
    payload["srcBucket"] = "b1";
    payload["srcKey"] = "a.txt";
    payload["dstBucket"] = "b2";
    payload["dstKey"] = "a.txt";
    return payload;
}

// Runs transfer_copy_object jobs against a fake tool whose copyto step is
// scripted per attempt. $n is the 1-based attempt number.
class RetryLoopTest : public ::testing::Test {
protected:
    RetryLoopTest() : config_(Config::defaults(dir_.path() / "data")) {
        config_.retry.maxAttempts = 3;
        config_.retry.baseDelay = std::chrono::milliseconds(10);
        config_.retry.maxDelay = std::chrono::milliseconds(40);
        config_.retry.jitterRatio = 0;
        store_.putProfile(test::testProfile("p1"));
    }

    void scriptCopy(const std::string& body) {
        const auto counter = (bin() / "attempts").string();
        std::string extra = "case \" $* \" in *\" copyto \"*)\n";
        extra += "  n=$(cat \"" + counter + "\" 2>/dev/null || echo 0); n=$((n+1)); echo $n > \"" + counter + "\"\n";
        extra += body;
        extra += ";;\nesac\n";
        config_.enginePath = test::writeFakeEngine(bin(), "[]", extra).string();
    }

    int attempts() const {
        auto lines = test::readLines(bin() / "attempts");
        return lines.empty() ? 0 : std::stoi(lines.front());
    }

    Job job() { return store_.getJob(Context::background(), "j1").value_or(Job{}); }

    std::filesystem::path bin() const { return dir_.path() / "bin"; }

    test::TempDir dir_;
    Config config_;
    test::MemoryStore store_;
    test::RecordingHub hub_;
};

} // namespace

TEST_F(RetryLoopTest, RateLimitedAttemptsAreRetried) {
    scriptCopy("  if [ $n -le 2 ]; then echo \"ERROR : 429 Too Many Requests\" >&2; exit 1; fi\n");
    store_.putJob(test::queuedJob("j1", "transfer_copy_object", copyObject()));
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");

    EXPECT_EQ(job().status, JobStatus::Succeeded) << job().error.value_or("");
    EXPECT_EQ(attempts(), 3);
    const auto log = test::readText(config_.jobLogDir() / "j1.log");
    EXPECT_NE(log.find("retrying rclone copyto (attempt 2/3)"), std::string::npos);
    EXPECT_NE(log.find("failed with rate_limited"), std::string::npos);
}

TEST_F(RetryLoopTest, AccessDeniedStopsAfterOneAttempt) {
    scriptCopy("  echo \"AccessDenied: nope\" >&2; exit 1\n");
    store_.putJob(test::queuedJob("j1", "transfer_copy_object", copyObject()));
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");

    auto done = job();
    EXPECT_EQ(done.status, JobStatus::Failed);
    EXPECT_EQ(done.errorCode, std::optional<std::string>("access_denied"));
    EXPECT_NE(done.error.value_or("").find("AccessDenied: nope"), std::string::npos);
    EXPECT_EQ(attempts(), 1);
}

TEST_F(RetryLoopTest, CancelDuringBackoffEndsCanceled) {
    config_.retry.baseDelay = std::chrono::seconds(30);
    config_.retry.maxDelay = std::chrono::seconds(60);
    scriptCopy("  echo \"ERROR : 429 Too Many Requests\" >&2; exit 1\n");
    store_.putJob(test::queuedJob("j1", "transfer_copy_object", copyObject()));
    Manager manager(config_, store_, hub_);
    std::thread worker([&] { manager.runJob("j1"); });

    const auto logPath = config_.jobLogDir() / "j1.log";
    ASSERT_TRUE(test::eventually([&] { return test::readText(logPath).find("retrying in") != std::string::npos; }));
    const auto started = std::chrono::steady_clock::now();
    manager.cancel("j1");
    worker.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(20));
    auto done = job();
    EXPECT_EQ(done.status, JobStatus::Canceled);
    EXPECT_EQ(done.errorCode, std::optional<std::string>("canceled"));
    EXPECT_EQ(attempts(), 1);
}

TEST_F(RetryLoopTest, DoneCountersHoldAcrossAttempts) {
    scriptCopy(
        "  if [ $n -eq 1 ]; then\n"
        "    echo '{\"level\":\"notice\",\"msg\":\"stats\",\"stats\":{\"bytes\":500,\"transfers\":5}}' >&2\n"
        "    echo \"write tcp: broken pipe\" >&2; exit 1\n"
        "  fi\n"
        "  echo '{\"level\":\"notice\",\"msg\":\"stats\",\"stats\":{\"bytes\":100,\"transfers\":1}}' >&2\n");
    store_.putJob(test::queuedJob("j1", "transfer_copy_object", copyObject()));
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");

    auto done = job();
    ASSERT_EQ(done.status, JobStatus::Succeeded) << done.error.value_or("");
    EXPECT_EQ(attempts(), 2);

    std::int64_t lastObjects = 0;
    std::int64_t lastBytes = 0;
    int samples = 0;
    for (const auto& event : hub_.ofType("job.progress")) {
        const auto& progress = event.payload["progress"];
        if (!progress.isMember("objectsDone")) {
            continue;
        }
        EXPECT_GE(progress["objectsDone"].asInt64(), lastObjects);
        EXPECT_GE(progress["bytesDone"].asInt64(), lastBytes);
        lastObjects = progress["objectsDone"].asInt64();
        lastBytes = progress["bytesDone"].asInt64();
        ++samples;
    }
    EXPECT_GE(samples, 2);
    EXPECT_EQ(lastObjects, 5);
    EXPECT_EQ(lastBytes, 500);
    ASSERT_TRUE(done.progress.has_value());
    EXPECT_EQ(done.progress->objectsDone, std::optional<std::int64_t>(5));
    EXPECT_EQ(done.progress->bytesDone, std::optional<std::int64_t>(500));
}
