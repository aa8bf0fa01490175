/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "xferd/file_store.hpp"
#include "xferd/manager.hpp"
#include "xferd/server.hpp"
#include "xferd/work.hpp"

using namespace xferd;
namespace fs = std::filesystem;

namespace {

Json::Value deleteKeys(const std::string& bucket) {
    Json::Value payload(Json::objectValue);
    payload["bucket"] = bucket;
    payload["keys"] = Json::Value(Json::arrayValue);
    payload["keys"].append("a.txt");
    return payload;
}

class ServerTest : public ::testing::Test {
protected:
    explicit ServerTest(const std::string& extraScript = "") : config_(Config::defaults(dir_.path() / "data")) {
        config_.enginePath = test::writeFakeEngine(dir_.path() / "bin", "[]", extraScript).string();
        config_.retry.maxAttempts = 1;
        config_.concurrency = 1;
    }

    void SetUp() override {
        work_ = std::make_unique<Work>(config_);
        ASSERT_TRUE(work_->ready());
        ASSERT_TRUE(work_->putProfile(profileToJson(test::testProfile("p1"))));
    }

    JobStatus statusOf(const JobId& id) {
        auto job = work_->status(id);
        return job ? job->status : JobStatus::Queued;
    }

    test::TempDir dir_;
    Config config_;
    std::unique_ptr<Work> work_;
};

// Delete invocations against bucket "slow" hang until killed.
class SlowServerTest : public ServerTest {
protected:
    SlowServerTest() : ServerTest("case \" $* \" in *\"remote:slow\"*) sleep 30;; esac\n") {}
};

} // namespace

TEST_F(ServerTest, SubmitValidatesBeforePersisting) {
    auto badType = work_->submit("p1", "s3_teleport", Json::Value(Json::objectValue));
    EXPECT_FALSE(badType);
    EXPECT_EQ(badType.error, SubmissionError::InvalidType);

    Json::Value badPayload(Json::objectValue);
    badPayload["bucket"] = 7;
    auto invalid = work_->submit("p1", "s3_delete_objects", badPayload);
    EXPECT_EQ(invalid.error, SubmissionError::InvalidPayload);
    EXPECT_EQ(invalid.message, "payload.bucket must be a string");

    auto notObject = work_->submit("p1", "s3_delete_objects", Json::Value("x"));
    EXPECT_EQ(notObject.error, SubmissionError::InvalidPayload);

    auto noProfile = work_->submit("ghost", "s3_delete_objects", deleteKeys("b1"));
    EXPECT_EQ(noProfile.error, SubmissionError::ProfileNotFound);

    EXPECT_TRUE(work_->list(10).empty());

    auto ok = work_->submit("p1", "s3_delete_objects", deleteKeys("b1"));
    ASSERT_TRUE(ok) << ok.message;
    auto job = work_->status(ok.id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Queued);
    EXPECT_EQ(job->profileId, "p1");
    EXPECT_FALSE(job->createdAt.empty());
}

TEST_F(ServerTest, GeneratedIdsAreUniqueAndSafe) {
    auto a = Work::generateId();
    auto b = Work::generateId();
    EXPECT_NE(a, b);
    EXPECT_TRUE(isSafeRecordId(a));
}

TEST_F(ServerTest, CancelRejectsUnknownAndFinishedJobs) {
    EXPECT_EQ(work_->cancel("nope").error, SubmissionError::JobNotFound);

    Server server(config_);
    ASSERT_TRUE(server.start());
    auto submitted = work_->submit("p1", "s3_delete_objects", deleteKeys("b1"));
    ASSERT_TRUE(submitted);
    server.scanOnce();
    ASSERT_TRUE(test::eventually([&] { return statusOf(submitted.id) == JobStatus::Succeeded; }));

    auto late = work_->cancel(submitted.id);
    EXPECT_EQ(late.error, SubmissionError::NotCancelable);
    EXPECT_FALSE(fs::exists(config_.jobLogDir() / (submitted.id + ".cmd")));
    server.shutdown();
}

TEST_F(ServerTest, ScannerRunsSubmittedJobs) {
    Server server(config_);
    ASSERT_TRUE(server.start());
    ASSERT_TRUE(server.isRunning());

    auto submitted = work_->submit("p1", "s3_delete_objects", deleteKeys("b1"));
    ASSERT_TRUE(submitted);
    server.scanOnce();
    ASSERT_TRUE(test::eventually([&] { return statusOf(submitted.id) == JobStatus::Succeeded; }));

    bool completed = false;
    for (const auto& event : server.hub().since(0)) {
        if (event.type == "job.completed" && event.jobId == submitted.id) {
            completed = event.payload["status"].asString() == "succeeded";
        }
    }
    EXPECT_TRUE(completed);
    EXPECT_TRUE(fs::exists(work_->logPath(submitted.id)));

    server.shutdown();
    EXPECT_FALSE(server.isRunning());
}

TEST_F(ServerTest, StartupRecoversInterruptedJobs) {
    auto submitted = work_->submit("p1", "s3_delete_objects", deleteKeys("b1"));
    ASSERT_TRUE(submitted);
    {
        FileStore store(config_.dataDir);
        ASSERT_TRUE(store.claimJob(Context::background(), submitted.id, nowTimestamp()));
    }
    auto waiting = work_->submit("p1", "s3_delete_objects", deleteKeys("b1"));
    ASSERT_TRUE(waiting);

    Server server(config_);
    ASSERT_TRUE(server.start());
    auto failed = work_->status(submitted.id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, JobStatus::Failed);
    EXPECT_EQ(failed->errorCode, std::optional<std::string>("server_restarted"));
    EXPECT_TRUE(test::eventually([&] { return statusOf(waiting.id) == JobStatus::Succeeded; }));
    server.shutdown();
}

TEST_F(SlowServerTest, CancelMarkerStopsRunningJob) {
    Server server(config_);
    ASSERT_TRUE(server.start());
    auto submitted = work_->submit("p1", "s3_delete_objects", deleteKeys("slow"));
    ASSERT_TRUE(submitted);
    server.scanOnce();
    ASSERT_TRUE(test::eventually([&] { return server.manager()->isRunning(submitted.id); }));

    ASSERT_TRUE(work_->cancel(submitted.id));
    const auto marker = config_.jobLogDir() / (submitted.id + ".cmd");
    EXPECT_EQ(test::readText(marker), "cancel\n");
    server.scanOnce();

    EXPECT_TRUE(test::eventually([&] { return statusOf(submitted.id) == JobStatus::Canceled; }));
    EXPECT_FALSE(fs::exists(marker));
    auto job = work_->status(submitted.id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->errorCode, std::optional<std::string>("canceled"));
    server.shutdown();
}

TEST_F(ServerTest, CancelMarkerWaitsForClaimedJobToRegister) {
    Server server(config_);
    ASSERT_TRUE(server.start());

    // Claimed in the store, but no local run exists yet.
    FileStore store(config_.dataDir);
    Job claimed = test::queuedJob("claimed-1", "s3_delete_objects", deleteKeys("b1"));
    claimed.status = JobStatus::Running;
    claimed.startedAt = nowTimestamp();
    ASSERT_TRUE(store.createJob(Context::background(), claimed));
    ASSERT_TRUE(work_->cancel(claimed.id));
    const auto marker = config_.jobLogDir() / (claimed.id + ".cmd");
    server.scanOnce();

    EXPECT_TRUE(fs::exists(marker));
    EXPECT_EQ(statusOf(claimed.id), JobStatus::Running);

    ASSERT_TRUE(store.finishJob(Context::background(), claimed.id, JobStatus::Succeeded, nowTimestamp(),
                                std::nullopt, std::nullopt, std::nullopt));
    server.scanOnce();
    EXPECT_FALSE(fs::exists(marker));
    EXPECT_EQ(statusOf(claimed.id), JobStatus::Succeeded);
    server.shutdown();
}

TEST_F(SlowServerTest, CancelMarkerFinishesQueuedJob) {
    Server server(config_);
    ASSERT_TRUE(server.start());
    auto busy = work_->submit("p1", "s3_delete_objects", deleteKeys("slow"));
    ASSERT_TRUE(busy);
    server.scanOnce();
    ASSERT_TRUE(test::eventually([&] { return server.manager()->isRunning(busy.id); }));

    auto waiting = work_->submit("p1", "s3_delete_objects", deleteKeys("b1"));
    ASSERT_TRUE(waiting);
    ASSERT_TRUE(work_->cancel(waiting.id));
    server.scanOnce();

    auto job = work_->status(waiting.id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Canceled);
    EXPECT_TRUE(job->startedAt.has_value());
    EXPECT_EQ(job->errorCode, std::optional<std::string>("canceled"));

    server.shutdown();
    EXPECT_EQ(statusOf(busy.id), JobStatus::Canceled);
    for (const auto& line : test::readLines(dir_.path() / "bin" / "calls.log")) {
        EXPECT_EQ(line.find("remote:b1"), std::string::npos) << line;
    }
}

TEST_F(ServerTest, UploadSessionGetsStagingDirectory) {
    auto missing = work_->createUploadSession("p1", " ", "");
    EXPECT_EQ(missing.error, SubmissionError::InvalidPayload);
    EXPECT_EQ(work_->createUploadSession("ghost", "b1", "").error, SubmissionError::ProfileNotFound);

    auto created = work_->createUploadSession("p1", "b1", "in/");
    ASSERT_TRUE(created) << created.message;
    EXPECT_EQ(fs::path(created.message), config_.stagingDir() / created.id);
    EXPECT_TRUE(fs::is_directory(created.message));

    auto session = work_->uploadSession("p1", created.id);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->bucket, "b1");
    EXPECT_EQ(session->prefix, "in/");
    EXPECT_GT(session->expiresAt, session->createdAt);
    EXPECT_FALSE(work_->uploadSession("p2", created.id).has_value());
}
