/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/job_log.hpp"
#include "xferd/hub.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace xferd {

namespace {

bool writeAll(int fd, const char* data, std::size_t size) noexcept {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

JobLogWriter::~JobLogWriter() {
    close();
}

bool JobLogWriter::open() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
        LOG_ERROR("Failed to create job log directory " + path_.parent_path().string() + ": " + ec.message());
        return false;
    }
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        LOG_ERROR("Failed to open job log " + path_.string() + ": " + std::strerror(errno));
        return false;
    }
    return true;
}

void JobLogWriter::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool JobLogWriter::write(const std::string& data) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return false;
    }
    if (!writeAll(fd_, data.data(), data.size())) {
        return false;
    }
    if (maxBytes_ > 0) {
        truncateLocked();
    }
    return true;
}

void JobLogWriter::truncateLocked() noexcept {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return;
    }
    auto size = static_cast<std::uint64_t>(st.st_size);
    if (size <= maxBytes_ + kTruncateSlack) {
        return;
    }

    // O_APPEND ignores the write offset, so rewrite through a second handle.
    int rw = ::open(path_.c_str(), O_RDWR | O_CLOEXEC);
    if (rw < 0) {
        return;
    }
    std::string tail(static_cast<std::size_t>(maxBytes_), '\0');
    off_t start = static_cast<off_t>(size - maxBytes_);
    std::size_t got = 0;
    while (got < tail.size()) {
        ssize_t n = ::pread(rw, &tail[got], tail.size() - got, start + static_cast<off_t>(got));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        got += static_cast<std::size_t>(n);
    }
    tail.resize(got);
    if (::ftruncate(rw, 0) == 0 && ::lseek(rw, 0, SEEK_SET) == 0) {
        if (!writeAll(rw, tail.data(), tail.size())) {
            LOG_WARN("Failed to rewrite truncated job log " + path_.string());
        }
    }
    ::close(rw);
}

void LogCapture::add(const std::string& line) {
    if (trim(line).empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
    while (lines_.size() > maxLines_) {
        lines_.pop_front();
    }
}

std::string LogCapture::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& line : lines_) {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return trim(out);
}

bool LineReader::fill() {
    if (eof_) {
        return false;
    }
    if (begin_ > 0) {
        std::memmove(buffer_.data(), buffer_.data() + begin_, end_ - begin_);
        end_ -= begin_;
        begin_ = 0;
    }
    if (end_ == buffer_.size()) {
        return true;
    }
    for (;;) {
        ssize_t n = ::read(fd_, buffer_.data() + end_, buffer_.size() - end_);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            eof_ = true;
            return false;
        }
        end_ += static_cast<std::size_t>(n);
        return true;
    }
}

std::optional<LineReader::Line> LineReader::next() {
    Line line;
    bool any = false;
    for (;;) {
        if (begin_ == end_ && !fill()) {
            break;
        }
        any = true;
        const char* start = buffer_.data() + begin_;
        const auto* nl = static_cast<const char*>(std::memchr(start, '\n', end_ - begin_));
        std::size_t chunk = nl ? static_cast<std::size_t>(nl - start) : end_ - begin_;

        std::size_t room = maxLineBytes_ > line.text.size() ? maxLineBytes_ - line.text.size() : 0;
        if (chunk > room) {
            line.truncated = true;
        }
        line.text.append(start, std::min(chunk, room));

        if (nl) {
            begin_ += chunk + 1;
            break;
        }
        begin_ = end_;
    }
    if (!any) {
        return std::nullopt;
    }
    while (!line.text.empty() && (line.text.back() == '\r' || line.text.back() == '\n')) {
        line.text.pop_back();
    }
    return line;
}

void JobLog::write(const std::string& level, const std::string& message) {
    writeQuiet(level, message);

    Event event;
    event.type = "job.log";
    event.jobId = jobId_;
    event.payload["level"] = level;
    event.payload["message"] = message;
    hub_.publish(std::move(event));
}

void JobLog::writeQuiet(const std::string& level, const std::string& message) {
    if (!writer_.write("[" + level + "] " + message + "\n")) {
        LOG_DEBUG("Job log write failed for " + jobId_);
    }
    emitStdout(level, message);
}

void JobLog::emitStdout(const std::string& level, const std::string& message) const {
    if (!emitStdout_) {
        return;
    }
    Json::Value line(Json::objectValue);
    line["ts"] = nowTimestamp();
    line["event"] = "job.log";
    line["component"] = "job";
    line["job_id"] = jobId_;
    line["level"] = level;
    line["msg"] = message;
    Logger::writeStdout(toJsonLine(line));
}

} // namespace xferd
