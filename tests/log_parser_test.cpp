/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "xferd/log_parser.hpp"

using namespace xferd;

TEST(LogParser, NonJsonLineIsNotRendered) {
    auto parsed = parseEngineLine("2025/01/01 NOTICE: plain text");
    EXPECT_TRUE(parsed.rendered.empty());
    EXPECT_FALSE(parsed.stats.has_value());
}

TEST(LogParser, RendersMessageAndObject) {
    auto parsed = parseEngineLine(R"json({"level":"info","msg":"Copied (new)","object":"a/b.txt"})json");
    EXPECT_EQ(parsed.rendered, "Copied (new) a/b.txt");

    parsed = parseEngineLine(R"({"msg":"Deleted a/b.txt","object":"a/b.txt"})");
    EXPECT_EQ(parsed.rendered, "Deleted a/b.txt");
}

TEST(LogParser, ExtractsStats) {
    auto parsed = parseEngineLine(
        R"({"msg":"stats","stats":{"bytes":100,"totalBytes":400,"transfers":1,"totalTransfers":4,"speed":50.7,"eta":6.4,"deletes":2}})");
    ASSERT_TRUE(parsed.stats.has_value());
    EXPECT_EQ(parsed.stats->bytes, 100);
    EXPECT_EQ(parsed.stats->totalBytes, 400);
    EXPECT_EQ(parsed.stats->totalTransfers, 4);
    EXPECT_EQ(parsed.stats->deletes, 2);
    ASSERT_TRUE(parsed.stats->eta.has_value());

    auto update = progressFromStats(*parsed.stats, ProgressMode::Transfers);
    EXPECT_EQ(update.bytesDone, 100);
    EXPECT_EQ(update.bytesTotal, 400);
    EXPECT_EQ(update.objectsDone, 1);
    EXPECT_EQ(update.objectsTotal, 4);
    EXPECT_EQ(update.speedBps, 50);
    EXPECT_EQ(update.etaSeconds, 6);
}

TEST(LogParser, DeleteModeCountsDeletes) {
    EngineStats stats;
    stats.transfers = 9;
    stats.totalTransfers = 9;
    stats.deletes = 3;
    auto update = progressFromStats(stats, ProgressMode::Deletes);
    EXPECT_EQ(update.objectsDone, 3);
    EXPECT_FALSE(update.objectsTotal.has_value());
    EXPECT_FALSE(update.bytesTotal.has_value());
    EXPECT_FALSE(update.speedBps.has_value());
    EXPECT_FALSE(update.etaSeconds.has_value());
}
