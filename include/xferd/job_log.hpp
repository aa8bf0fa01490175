/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "xferd/types.hpp"

namespace xferd {

class Hub;

// Append-only per-job log file. When `maxBytes` is set the file is cut back
// to its last `maxBytes` once it grows past `maxBytes + kTruncateSlack`.
class JobLogWriter {
public:
    JobLogWriter(std::filesystem::path path, std::uint64_t maxBytes) noexcept
        : path_(std::move(path)), maxBytes_(maxBytes) {}
    ~JobLogWriter();

    JobLogWriter(const JobLogWriter&) = delete;
    JobLogWriter& operator=(const JobLogWriter&) = delete;

    [[nodiscard]] bool open() noexcept;
    void close() noexcept;

    [[nodiscard]] bool write(const std::string& data) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    static constexpr std::uint64_t kTruncateSlack = 256 * 1024;

private:
    void truncateLocked() noexcept;

    std::filesystem::path path_;
    std::uint64_t maxBytes_;
    int fd_ = -1;
    std::mutex mutex_;
};

// Keeps the last N non-empty lines written to it.
class LogCapture {
public:
    explicit LogCapture(std::size_t maxLines = 50) : maxLines_(maxLines < 1 ? 1 : maxLines) {}

    void add(const std::string& line);
    // Retained lines joined by newlines, trimmed.
    [[nodiscard]] std::string text() const;

private:
    std::size_t maxLines_;
    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
};

// Reads newline-terminated lines from a file descriptor with a per-line size
// cap. The remainder of an oversized line is discarded.
class LineReader {
public:
    struct Line {
        std::string text;
        bool truncated = false;
    };

    LineReader(int fd, std::size_t maxLineBytes) noexcept
        : fd_(fd), maxLineBytes_(maxLineBytes == 0 ? 1 : maxLineBytes) {}

    // nullopt at end of stream or on read error.
    [[nodiscard]] std::optional<Line> next();

    static constexpr std::size_t kBufferSize = 64 * 1024;

private:
    [[nodiscard]] bool fill();

    int fd_;
    std::size_t maxLineBytes_;
    std::vector<char> buffer_ = std::vector<char>(kBufferSize);
    std::size_t begin_ = 0;
    std::size_t end_ = 0;
    bool eof_ = false;
};

// Job-scoped log sink: file line, `job.log` event and optional stdout mirror.
class JobLog {
public:
    JobLog(JobId jobId, const std::filesystem::path& path, std::uint64_t maxBytes,
           Hub& hub, bool emitStdout) noexcept
        : jobId_(std::move(jobId)), writer_(path, maxBytes), hub_(hub), emitStdout_(emitStdout) {}

    [[nodiscard]] bool open() noexcept { return writer_.open(); }

    // "[level] message" to the file, then event and stdout.
    void write(const std::string& level, const std::string& message);
    // File and stdout only.
    void writeQuiet(const std::string& level, const std::string& message);

    void info(const std::string& message) { write("info", message); }
    void warn(const std::string& message) { write("warn", message); }
    void error(const std::string& message) { write("error", message); }

    [[nodiscard]] const JobId& jobId() const noexcept { return jobId_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return writer_.path(); }

private:
    void emitStdout(const std::string& level, const std::string& message) const;

    JobId jobId_;
    JobLogWriter writer_;
    Hub& hub_;
    bool emitStdout_;
};

} // namespace xferd
