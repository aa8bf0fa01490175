/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "xferd/manager.hpp"

using namespace xferd;
namespace fs = std::filesystem;

namespace {

Json::Value deletePayload(std::size_t keys) {
    Json::Value payload(Json::objectValue);
    payload["bucket"] = "b1";
    payload["keys"] = Json::Value(Json::arrayValue);
    for (std::size_t i = 0; i < keys; ++i) {
        payload["keys"].append("k/" + std::to_string(i));
    }
    return payload;
}

class ManagerTest : public ::testing::Test {
protected:
    explicit ManagerTest(const std::string& extraScript = "") : config_(Config::defaults(dir_.path() / "data")) {
        config_.enginePath = test::writeFakeEngine(dir_.path() / "bin", "[]", extraScript).string();
        config_.retry.maxAttempts = 1;
        config_.concurrency = 2;
        store_.putProfile(test::testProfile("p1"));
    }

    Job job(const std::string& id) {
        return store_.getJob(Context::background(), id).value_or(Job{});
    }

    std::vector<std::string> calls() const { return test::readLines(dir_.path() / "bin" / "calls.log"); }

    test::TempDir dir_;
    Config config_;
    test::MemoryStore store_;
    test::RecordingHub hub_;
};

// Every delete invocation hangs until killed.
class SlowEngineTest : public ManagerTest {
protected:
    SlowEngineTest() : ManagerTest("case \" $* \" in *\" delete \"*) sleep 30;; esac\n") {}
};

} // namespace

TEST_F(ManagerTest, RunsQueuedJobToSuccess) {
    store_.putJob(test::queuedJob("j1", "s3_delete_objects", deletePayload(3)));
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");

    auto done = job("j1");
    EXPECT_EQ(done.status, JobStatus::Succeeded);
    EXPECT_TRUE(done.startedAt.has_value());
    EXPECT_TRUE(done.finishedAt.has_value());
    EXPECT_FALSE(done.errorCode.has_value());
    ASSERT_TRUE(done.progress.has_value());
    EXPECT_EQ(done.progress->objectsDone, std::optional<std::int64_t>(3));
    EXPECT_EQ(done.progress->objectsTotal, std::optional<std::int64_t>(3));
    EXPECT_FALSE(done.progress->objectsPerSecond.has_value());
    EXPECT_FALSE(done.progress->etaSeconds.has_value());

    auto running = hub_.ofType("job.progress");
    ASSERT_FALSE(running.empty());
    EXPECT_EQ(running.front().payload["status"].asString(), "running");
    auto completed = hub_.ofType("job.completed");
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].jobId, "j1");
    EXPECT_EQ(completed[0].payload["status"].asString(), "succeeded");

    EXPECT_TRUE(fs::exists(config_.jobLogDir() / "j1.log"));
    EXPECT_FALSE(fs::exists(config_.jobLogDir() / "j1.rclone.conf"));
    EXPECT_FALSE(manager.isRunning("j1"));
}

TEST_F(ManagerTest, SkipsJobsThatAreNotQueued) {
    Job j = test::queuedJob("j1", "s3_delete_objects", deletePayload(1));
    j.status = JobStatus::Canceled;
    store_.putJob(j);
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");
    manager.runJob("missing");

    EXPECT_EQ(job("j1").status, JobStatus::Canceled);
    EXPECT_TRUE(hub_.events().empty());
    EXPECT_TRUE(calls().empty());
}

TEST_F(ManagerTest, MissingProfileFailsAsNotFound) {
    store_.putJob(test::queuedJob("j1", "s3_delete_objects", deletePayload(1), "nobody"));
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");

    auto done = job("j1");
    EXPECT_EQ(done.status, JobStatus::Failed);
    EXPECT_EQ(done.errorCode, std::optional<std::string>("not_found"));
    EXPECT_EQ(done.error, std::optional<std::string>("[not_found] profile not found"));
    EXPECT_TRUE(calls().empty());
}

TEST_F(ManagerTest, UnknownTypeFailsValidation) {
    store_.putJob(test::queuedJob("j1", "s3_teleport", Json::Value(Json::objectValue)));
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");

    auto done = job("j1");
    EXPECT_EQ(done.status, JobStatus::Failed);
    EXPECT_EQ(done.errorCode, std::optional<std::string>("validation_error"));
    EXPECT_EQ(done.error, std::optional<std::string>("[validation_error] unsupported job type: s3_teleport"));
}

TEST_F(ManagerTest, PayloadValidationFailsBeforeAnyProcess) {
    Json::Value payload(Json::objectValue);
    payload["bucket"] = "b1";
    payload["prefix"] = "data";
    store_.putJob(test::queuedJob("j1", "transfer_delete_prefix", payload));
    Manager manager(config_, store_, hub_);
    manager.runJob("j1");

    auto done = job("j1");
    EXPECT_EQ(done.status, JobStatus::Failed);
    EXPECT_EQ(done.errorCode, std::optional<std::string>("validation_error"));
    EXPECT_EQ(done.error, std::optional<std::string>(
                              "[validation_error] payload.prefix must end with '/' (or set payload.allowUnsafePrefix=true)"));
    EXPECT_TRUE(calls().empty());
}

TEST_F(ManagerTest, RecoveryFailsInterruptedAndRequeuesQueued) {
    Job interrupted = test::queuedJob("r1", "s3_delete_objects", deletePayload(1));
    interrupted.status = JobStatus::Running;
    interrupted.startedAt = nowTimestamp();
    JobProgress progress;
    progress.objectsDone = 7;
    progress.speedBps = 1024;
    interrupted.progress = progress;
    store_.putJob(interrupted);
    store_.putJob(test::queuedJob("q1", "s3_delete_objects", deletePayload(1)));
    store_.putJob(test::queuedJob("q2", "s3_delete_objects", deletePayload(2)));

    Manager manager(config_, store_, hub_);
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(manager.recoverAndRequeue());

    auto failed = job("r1");
    EXPECT_EQ(failed.status, JobStatus::Failed);
    EXPECT_EQ(failed.error, std::optional<std::string>("server restarted"));
    EXPECT_EQ(failed.errorCode, std::optional<std::string>("server_restarted"));
    ASSERT_TRUE(failed.progress.has_value());
    EXPECT_EQ(failed.progress->objectsDone, std::optional<std::int64_t>(7));
    EXPECT_FALSE(failed.progress->speedBps.has_value());

    EXPECT_TRUE(test::eventually([&] {
        return job("q1").status == JobStatus::Succeeded && job("q2").status == JobStatus::Succeeded;
    }));
    manager.stop();

    auto completed = hub_.ofType("job.completed");
    ASSERT_EQ(completed.size(), 3u);
    EXPECT_EQ(completed[0].jobId, "r1");
    EXPECT_EQ(completed[0].payload["errorCode"].asString(), "server_restarted");
}

TEST_F(ManagerTest, RecoveryOverflowDrainsInBackground) {
    config_.queueCapacity = 1;
    config_.concurrency = 1;
    for (const char* id : {"q1", "q2", "q3", "q4"}) {
        store_.putJob(test::queuedJob(id, "s3_delete_objects", deletePayload(1)));
    }

    Manager manager(config_, store_, hub_);
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(manager.recoverAndRequeue());
    EXPECT_TRUE(test::eventually([&] {
        for (const char* id : {"q1", "q2", "q3", "q4"}) {
            if (job(id).status != JobStatus::Succeeded) return false;
        }
        return true;
    }));
    manager.stop();
}

TEST_F(ManagerTest, EnqueueRejectsWhenPoolIsNotRunning) {
    config_.queueCapacity = 1;
    Manager manager(config_, store_, hub_);
    EXPECT_FALSE(manager.enqueue("j1"));
    ASSERT_TRUE(manager.start());
    manager.stop();

    testing::internal::CaptureStderr();
    EXPECT_FALSE(manager.enqueue("j1"));
    const auto logged = testing::internal::GetCapturedStderr();
    EXPECT_NE(logged.find("job pool is not running: j1"), std::string::npos) << logged;
    EXPECT_EQ(logged.find("job queue is full"), std::string::npos) << logged;
}

TEST_F(SlowEngineTest, CancelKillsRunningJob) {
    store_.putJob(test::queuedJob("j1", "s3_delete_objects", deletePayload(5)));
    Manager manager(config_, store_, hub_);
    std::thread worker([&] { manager.runJob("j1"); });

    ASSERT_TRUE(test::eventually([&] { return manager.isRunning("j1") && !calls().empty(); }));
    const auto started = std::chrono::steady_clock::now();
    manager.cancel("j1");
    worker.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(20));
    auto done = job("j1");
    EXPECT_EQ(done.status, JobStatus::Canceled);
    EXPECT_EQ(done.errorCode, std::optional<std::string>("canceled"));
    EXPECT_FALSE(done.error.has_value());
    auto completed = hub_.ofType("job.completed");
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].payload["status"].asString(), "canceled");
    EXPECT_FALSE(manager.isRunning("j1"));
}

TEST_F(SlowEngineTest, StopCancelsRunningJobs) {
    store_.putJob(test::queuedJob("j1", "s3_delete_objects", deletePayload(5)));
    Manager manager(config_, store_, hub_);
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(manager.enqueue("j1"));
    ASSERT_TRUE(test::eventually([&] { return manager.isRunning("j1") && !calls().empty(); }));
    manager.stop();
    EXPECT_EQ(job("j1").status, JobStatus::Canceled);
}
