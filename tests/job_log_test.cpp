/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include "test_support.hpp"
#include "xferd/job_log.hpp"

using namespace xferd;

namespace {

// Read end of a pipe pre-filled with `data`.
int pipeWith(const std::string& data) {
    int fds[2];
    if (::pipe(fds) != 0) return -1;
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fds[1], data.data() + off, data.size() - off);
        if (n <= 0) break;
        off += static_cast<std::size_t>(n);
    }
    ::close(fds[1]);
    return fds[0];
}

} // namespace

TEST(LineReader, SplitsAndStripsCarriageReturns) {
    int fd = pipeWith("one\r\ntwo\nthree");
    ASSERT_GE(fd, 0);
    LineReader reader(fd, 1024);

    auto a = reader.next();
    ASSERT_TRUE(a);
    EXPECT_EQ(a->text, "one");
    auto b = reader.next();
    ASSERT_TRUE(b);
    EXPECT_EQ(b->text, "two");
    auto c = reader.next();
    ASSERT_TRUE(c);
    EXPECT_EQ(c->text, "three");
    EXPECT_FALSE(c->truncated);
    EXPECT_FALSE(reader.next());
    ::close(fd);
}

TEST(LineReader, TruncatesLongLinesAndKeepsGoing) {
    int fd = pipeWith(std::string(100, 'x') + "\nshort\n");
    ASSERT_GE(fd, 0);
    LineReader reader(fd, 10);

    auto first = reader.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->text, std::string(10, 'x'));
    EXPECT_TRUE(first->truncated);

    auto second = reader.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->text, "short");
    EXPECT_FALSE(second->truncated);
    ::close(fd);
}

TEST(LogCapture, KeepsLastNonEmptyLines) {
    LogCapture capture(2);
    capture.add("a");
    capture.add("   ");
    capture.add("b");
    capture.add("c");
    EXPECT_EQ(capture.text(), "b\nc");
}

TEST(JobLog, WritesFileAndPublishes) {
    test::TempDir dir;
    test::RecordingHub hub;
    JobLog log("job-1", dir.path() / "job-1.log", 0, hub, false);
    ASSERT_TRUE(log.open());

    log.info("hello");
    log.writeQuiet("warn", "quiet one");

    EXPECT_EQ(test::readText(dir.path() / "job-1.log"), "[info] hello\n[warn] quiet one\n");
    auto events = hub.ofType("job.log");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].jobId, "job-1");
    EXPECT_EQ(events[0].payload["level"].asString(), "info");
    EXPECT_EQ(events[0].payload["message"].asString(), "hello");
}

TEST(JobLogWriter, TruncatesToTail) {
    test::TempDir dir;
    const auto path = dir.path() / "big.log";
    JobLogWriter writer(path, 1024);
    ASSERT_TRUE(writer.open());

    const std::string chunk(64 * 1024, 'a');
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(writer.write(chunk));
    }
    ASSERT_TRUE(writer.write(std::string(1024, 'z')));
    writer.close();

    // 320 KiB of 'a' overflowed the slack, so only the newest KiB survives.
    EXPECT_EQ(test::readText(path), std::string(1024, 'z'));
}
