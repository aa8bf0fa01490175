/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "xferd/errors.hpp"
#include "xferd/hub.hpp"
#include "xferd/listing.hpp"
#include "xferd/progress.hpp"

using namespace xferd;

TEST(ListingTest, DecodesLsjsonArray) {
    auto entries = decodeList(R"([
        {"Path":"a/b.txt","Name":"b.txt","Size":12,"ModTime":"2025-01-02T03:04:05Z","IsDir":false,
         "Hashes":{"MD5":"abc"}},
        {"Path":"","Name":"bucket-1","Size":-1,"IsDir":true,"IsBucket":true}
    ])");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key(), "a/b.txt");
    EXPECT_EQ(entries[0].size, 12);
    EXPECT_EQ(entries[0].hashes.at("MD5"), "abc");
    EXPECT_FALSE(entries[0].isDir);
    EXPECT_EQ(entries[1].key(), "bucket-1");
    EXPECT_TRUE(entries[1].isDir);

    EXPECT_TRUE(decodeList("[]").empty());
    EXPECT_THROW((void)decodeList("{not json"), JobError);
}

TEST(ListingTest, EtagPrefersNamedHashes) {
    EXPECT_EQ(etagFromHashes({{"SHA-1", "s"}, {"MD5", "m"}}), "m");
    EXPECT_EQ(etagFromHashes({{"SHA-1", " s "}}), "s");
    EXPECT_EQ(etagFromHashes({}), "");
}

TEST(ListingTest, ObjectKeyJoinsPrefix) {
    EXPECT_EQ(objectKey("", "a.txt", false), "a.txt");
    EXPECT_EQ(objectKey("logs/", "a.txt", false), "logs/a.txt");
    EXPECT_EQ(objectKey("logs", "a.txt", false), "logs/a.txt");
    EXPECT_EQ(objectKey("logs/", "", false), "logs");
}

TEST(ListingTest, NormalizesListTimes) {
    EXPECT_EQ(normalizeListTime("2025-01-02T03:04:05Z"), "2025-01-02T03:04:05.000Z");
    EXPECT_EQ(normalizeListTime("yesterday"), "");
}

TEST(ListingTest, WildcardsSpanSlashes) {
    EXPECT_TRUE(wildcardMatch("*.csv", "a.csv"));
    EXPECT_TRUE(wildcardMatch("*.csv", "dir/a.csv"));
    EXPECT_TRUE(wildcardMatch("a?c", "abc"));
    EXPECT_FALSE(wildcardMatch("a?c", "ac"));
    EXPECT_FALSE(wildcardMatch("*.csv", "a.json"));
}

TEST(ListingTest, IncludeThenExclude) {
    EXPECT_TRUE(shouldIncludePath("a.csv", {}, {}));
    EXPECT_TRUE(shouldIncludePath("/a.csv", {"*.csv"}, {}));
    EXPECT_FALSE(shouldIncludePath("a.json", {"*.csv"}, {}));
    EXPECT_FALSE(shouldIncludePath("tmp/a.csv", {"*.csv"}, {"tmp/*"}));
    EXPECT_FALSE(shouldIncludePath("a.json", {" "}, {}));
}

TEST(ListingTest, LocalTotalsApplyFilters) {
    test::TempDir dir;
    test::writeText(dir.path() / "a.csv", "12345");
    test::writeText(dir.path() / "sub" / "b.csv", "123");
    test::writeText(dir.path() / "sub" / "c.json", "1");

    auto all = computeLocalTotals(Context::background(), dir.path(), {}, {});
    EXPECT_EQ(all.objects, 3);
    EXPECT_EQ(all.bytes, 9);

    auto csv = computeLocalTotals(Context::background(), dir.path(), {"*.csv"}, {"sub/*"});
    EXPECT_EQ(csv.objects, 1);
    EXPECT_EQ(csv.bytes, 5);

    auto single = computeLocalTotals(Context::background(), dir.path() / "a.csv", {}, {});
    EXPECT_EQ(single.objects, 1);
    EXPECT_EQ(single.bytes, 5);

    auto canceled = Context::withCancel(Context::background());
    canceled->cancel();
    EXPECT_THROW((void)computeLocalTotals(canceled, dir.path(), {}, {}), CanceledError);
}

TEST(StatsChannelTest, DropsWhenFullAndDrainsAfterClose) {
    StatsChannel channel(1);
    StatsUpdate first;
    first.objectsDone = 1;
    EXPECT_TRUE(channel.trySend(first));
    EXPECT_FALSE(channel.trySend(StatsUpdate{}));
    channel.close();

    auto got = channel.receive();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->objectsDone, 1);
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(ProgressTrackerTest, KeepsKnownTotals) {
    test::MemoryStore store;
    test::RecordingHub hub;
    Job job = test::queuedJob("j1", "transfer_copy_prefix", Json::Value(Json::objectValue));
    JobProgress preflight;
    preflight.objectsTotal = 10;
    job.progress = preflight;
    store.putJob(job);

    ProgressReporter reporter(store, hub);
    ProgressTracker tracker(reporter, "j1");

    StatsUpdate update;
    update.objectsDone = 4;
    update.objectsTotal = 0;
    update.bytesDone = 100;
    update.bytesTotal = 500;
    update.speedBps = 50;
    tracker.apply(update);

    auto stored = store.getJob(Context::background(), "j1");
    ASSERT_TRUE(stored && stored->progress);
    EXPECT_EQ(stored->progress->objectsDone, std::optional<std::int64_t>(4));
    EXPECT_EQ(stored->progress->objectsTotal, std::optional<std::int64_t>(10));
    EXPECT_EQ(stored->progress->bytesTotal, std::optional<std::int64_t>(500));
    EXPECT_EQ(stored->progress->speedBps, std::optional<std::int64_t>(50));

    auto events = hub.ofType("job.progress");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].payload["status"].asString(), "running");
    EXPECT_EQ(events[0].payload["progress"]["objectsDone"].asInt64(), 4);
}

TEST(ProgressTrackerTest, DoneCountersNeverGoBackwards) {
    test::MemoryStore store;
    test::RecordingHub hub;
    store.putJob(test::queuedJob("j1", "transfer_copy_object", Json::Value(Json::objectValue)));

    ProgressReporter reporter(store, hub);
    ProgressTracker tracker(reporter, "j1");

    StatsUpdate update;
    update.objectsDone = 5;
    update.bytesDone = 500;
    tracker.apply(update);

    // A fresh attempt restarts the tool's counters.
    update.objectsDone = 1;
    update.bytesDone = 100;
    tracker.apply(update);

    auto stored = store.getJob(Context::background(), "j1");
    ASSERT_TRUE(stored && stored->progress);
    EXPECT_EQ(stored->progress->objectsDone, std::optional<std::int64_t>(5));
    EXPECT_EQ(stored->progress->bytesDone, std::optional<std::int64_t>(500));

    update.objectsDone = 7;
    update.bytesDone = 700;
    tracker.apply(update);

    auto events = hub.ofType("job.progress");
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].payload["progress"]["objectsDone"].asInt64(), 5);
    EXPECT_EQ(events[1].payload["progress"]["bytesDone"].asInt64(), 500);
    EXPECT_EQ(events[2].payload["progress"]["objectsDone"].asInt64(), 7);
    EXPECT_EQ(events[2].payload["progress"]["bytesDone"].asInt64(), 700);
}

TEST(ProgressTrackerTest, StartsFromStoredDoneCounters) {
    test::MemoryStore store;
    test::RecordingHub hub;
    Job job = test::queuedJob("j1", "transfer_copy_object", Json::Value(Json::objectValue));
    JobProgress earlier;
    earlier.objectsDone = 3;
    earlier.bytesDone = 300;
    job.progress = earlier;
    store.putJob(job);

    ProgressReporter reporter(store, hub);
    ProgressTracker tracker(reporter, "j1");
    StatsUpdate update;
    update.objectsDone = 1;
    update.bytesDone = 10;
    tracker.apply(update);

    auto events = hub.ofType("job.progress");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].payload["progress"]["objectsDone"].asInt64(), 3);
    EXPECT_EQ(events[0].payload["progress"]["bytesDone"].asInt64(), 300);
}

TEST(LocalHubTest, StampsSequenceAndReplays) {
    LocalHub hub(2);
    std::vector<std::string> seen;
    auto id = hub.subscribe([&](const Event& e) { seen.push_back(e.type); });

    for (const char* type : {"a", "b", "c"}) {
        Event e;
        e.type = type;
        hub.publish(std::move(e));
    }
    hub.unsubscribe(id);
    Event late;
    late.type = "d";
    hub.publish(std::move(late));

    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
    auto replay = hub.since(2);
    ASSERT_EQ(replay.size(), 2u);
    EXPECT_EQ(replay[0].seq, 3);
    EXPECT_EQ(replay[1].type, "d");
    EXPECT_FALSE(replay[1].ts.empty());

    auto json = replay[1].toJson();
    EXPECT_EQ(json["seq"].asInt64(), 4);
    EXPECT_FALSE(json.isMember("jobId"));
    EXPECT_FALSE(json.isMember("payload"));
}
