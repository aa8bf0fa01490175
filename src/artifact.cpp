/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/artifact.hpp"
#include "xferd/errors.hpp"
#include "xferd/logger.hpp"
#include "xferd/remote.hpp"
#include "xferd/runner.hpp"
#include "xferd/util.hpp"
#include "xferd/zip_writer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace xferd {

namespace fs = std::filesystem;

namespace {

// Lexical clean of a relative slash path: drops empty and "." segments and
// folds ".." into its parent where possible.
std::string cleanPath(const std::string& value) {
    std::vector<std::string> out;
    for (const auto& part : split(value, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == ".." && !out.empty() && out.back() != "..") {
            out.pop_back();
            continue;
        }
        out.push_back(part);
    }
    if (out.empty()) {
        return ".";
    }
    std::string joined;
    for (const auto& part : out) {
        if (!joined.empty()) joined += '/';
        joined += part;
    }
    return joined;
}

std::string trimChars(const std::string& value, char c) {
    auto begin = value.find_first_not_of(c);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(c);
    return value.substr(begin, end - begin + 1);
}

std::string stripSlashes(const std::string& value) {
    auto v = trim(value);
    if (startsWith(v, "/")) {
        v.erase(0, 1);
    }
    return trimChars(v, '/');
}

std::string baseName(const std::string& key) {
    auto k = key;
    while (k.size() > 1 && k.back() == '/') {
        k.pop_back();
    }
    if (k.empty()) {
        return ".";
    }
    auto pos = k.rfind('/');
    return pos == std::string::npos ? k : k.substr(pos + 1);
}

std::string contextMessage(const Context::Ptr& ctx) {
    return ctx->error() == ContextError::DeadlineExceeded ? "context deadline exceeded" : "context canceled";
}

} // namespace

std::string sanitizeZipEntryName(const std::string& input) {
    std::string name = trim(input);
    if (name.empty()) {
        throw std::invalid_argument("empty");
    }
    std::replace(name.begin(), name.end(), '\\', '/');
    auto first = name.find_first_not_of('/');
    name = first == std::string::npos ? std::string() : name.substr(first);
    if (name.find('\0') != std::string::npos) {
        throw std::invalid_argument("null");
    }

    auto clean = cleanPath(name);
    if (clean == "." || clean == ".." || clean.empty()) {
        throw std::invalid_argument("invalid");
    }
    if (startsWith(clean, "../")) {
        throw std::invalid_argument("traversal");
    }
    for (const auto& part : split(clean, '/')) {
        if (part.empty() || part == "." || part == "..") {
            throw std::invalid_argument("invalid segment");
        }
    }
    return clean;
}

std::string uniqueZipEntryName(std::set<std::string>& used, const std::string& name) {
    if (used.insert(name).second) {
        return name;
    }

    std::string ext;
    auto slash = name.rfind('/');
    auto dot = name.rfind('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        ext = name.substr(dot);
    }
    const std::string base = name.substr(0, name.size() - ext.size());
    for (int i = 2; i < 10000; ++i) {
        auto candidate = base + "-" + std::to_string(i) + ext;
        if (used.insert(candidate).second) {
            return candidate;
        }
    }
    return name;
}

std::string safeZipFilename(const std::string& input) {
    auto value = trim(input);
    if (value.empty()) {
        return "download";
    }

    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        // Multi-byte UTF-8 sequences are kept as-is.
        if (std::isalnum(c) || c >= 0x80 || c == '-' || c == '_' || c == '.' || c == ' ') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('-');
        }
    }
    out = trimChars(trim(out), '.');
    std::replace(out.begin(), out.end(), ' ', '-');
    out = trimChars(out, '-');
    if (out.empty()) {
        out = "download";
    }
    if (out.size() > 120) {
        out.resize(120);
    }
    return out;
}

std::string defaultZipNameFromPrefix(const std::string& bucket, const std::string& prefix) {
    auto b = trim(bucket);
    auto p = stripSlashes(prefix);
    if (b.empty()) {
        return "download.zip";
    }
    if (p.empty()) {
        return safeZipFilename(b) + ".zip";
    }
    return safeZipFilename(b + "-" + p) + ".zip";
}

std::string defaultZipNameFromKeys(const std::string& bucket, const std::string& stripPrefix,
                                   const std::vector<ZipObject>& objects) {
    auto b = trim(bucket);
    auto strip = stripSlashes(stripPrefix);
    if (b.empty()) {
        return "download.zip";
    }
    if (!strip.empty()) {
        return safeZipFilename(b + "-" + strip) + ".zip";
    }
    if (objects.size() == 1) {
        return safeZipFilename(b + "-" + baseName(objects.front().key)) + ".zip";
    }
    return safeZipFilename(b + "-selection") + ".zip";
}

// ArtifactBuilder

ArtifactBuilder::ArtifactBuilder(Runner& runner, JobRun& job)
    : runner_(runner), job_(job), buffer_(kCopyBufferSize) {}

fs::path ArtifactBuilder::finalPath() const {
    return runner_.config().artifactDir() / (job_.jobId + ".zip");
}

fs::path ArtifactBuilder::tempPath() const {
    return runner_.config().artifactDir() / (job_.jobId + ".zip.tmp");
}

void ArtifactBuilder::removeOutputs() noexcept {
    std::error_code ec;
    fs::remove(tempPath(), ec);
    fs::remove(finalPath(), ec);
}

void ArtifactBuilder::build(const std::string& artifactName, const std::string& bucket,
                            const std::vector<ZipObject>& objects) {
    std::error_code ec;
    fs::create_directories(runner_.config().artifactDir(), ec);
    if (ec) {
        throw JobError(ErrorCode::Unknown, "create " + runner_.config().artifactDir().string() + ": " + ec.message());
    }
    fs::permissions(runner_.config().artifactDir(), fs::perms::owner_all, fs::perm_options::replace, ec);
    removeOutputs();

    try {
        {
            ZipWriter zip(tempPath());
            fs::permissions(tempPath(), fs::perms::owner_read | fs::perms::owner_write,
                            fs::perm_options::replace, ec);
            writeObjects(zip, bucket, objects);
            zip.finish();
        }
        fs::rename(tempPath(), finalPath());
    } catch (...) {
        removeOutputs();
        throw;
    }

    if (!artifactName.empty()) {
        job_.log->info("artifact ready: " + artifactName);
    } else {
        job_.log->info("artifact ready");
    }
}

void ArtifactBuilder::writeObjects(ZipWriter& zip, const std::string& bucket, const std::vector<ZipObject>& objects) {
    startedAt_ = std::chrono::steady_clock::now();
    objectsDone_ = 0;
    bytesDone_ = 0;
    objectsTotal_ = static_cast<std::int64_t>(objects.size());
    bytesTotal_ = 0;
    for (const auto& object : objects) {
        bytesTotal_ += object.size;
    }
    usedNames_.clear();

    for (const auto& object : objects) {
        writeObject(zip, bucket, object);
    }
    publish(true);
}

void ArtifactBuilder::writeObject(ZipWriter& zip, const std::string& bucket, const ZipObject& object) {
    job_.ctx->check();

    std::string entryName;
    try {
        entryName = sanitizeZipEntryName(object.entryName);
    } catch (const std::invalid_argument& e) {
        throw JobError(ErrorCode::Unknown, "unsafe zip entry name for key \"" + object.key + "\": " + e.what());
    }
    entryName = uniqueZipEntryName(usedNames_, entryName);

    zip.beginEntry(entryName, object.lastModified ? *object.lastModified : std::time(nullptr),
                   static_cast<std::uint64_t>(std::max<std::int64_t>(object.size, 0)));

    auto proc = runner_.start(job_, {"cat", remoteObject(bucket, object.key, job_.profile.preserveLeadingSlash)});
    for (;;) {
        if (job_.ctx->done()) {
            proc->kill();
            std::string ignored;
            (void)proc->wait(&ignored);
            throw CanceledError(contextMessage(job_.ctx));
        }
        ssize_t n = ::read(proc->stdoutFd(), buffer_.data(), buffer_.size());
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            const int err = errno;
            proc->kill();
            std::string ignored;
            (void)proc->wait(&ignored);
            throw JobError(ErrorCode::Unknown, std::string("read rclone cat output: ") + std::strerror(err));
        }
        if (n == 0) break;
        try {
            zip.write(buffer_.data(), static_cast<std::size_t>(n));
        } catch (...) {
            proc->kill();
            std::string ignored;
            (void)proc->wait(&ignored);
            throw;
        }
        bytesDone_ += n;
        publish(false);
    }

    std::string waitErr;
    if (!proc->wait(&waitErr)) {
        if (job_.ctx->done()) {
            throw CanceledError(contextMessage(job_.ctx));
        }
        throw engineFailure(waitErr, proc->stderrText(), "rclone cat");
    }
    zip.endEntry();

    ++objectsDone_;
    publish(true);
}

void ArtifactBuilder::publish(bool force) {
    auto now = std::chrono::steady_clock::now();
    if (!force && lastPublish_ && now - *lastPublish_ < kPublishInterval) {
        return;
    }
    lastPublish_ = now;

    JobProgress progress;
    progress.objectsDone = objectsDone_;
    progress.bytesDone = bytesDone_;
    if (objectsTotal_ > 0) {
        progress.objectsTotal = objectsTotal_;
    }
    if (bytesTotal_ > 0) {
        progress.bytesTotal = bytesTotal_;
    }

    const double elapsed = std::chrono::duration<double>(now - startedAt_).count();
    if (elapsed > 0 && bytesDone_ > 0) {
        auto speed = static_cast<std::int64_t>(static_cast<double>(bytesDone_) / elapsed);
        if (speed > 0) {
            progress.speedBps = speed;
            auto remaining = bytesTotal_ - bytesDone_;
            if (bytesTotal_ > 0 && remaining > 0) {
                auto eta = static_cast<std::int64_t>(static_cast<double>(remaining) / static_cast<double>(speed));
                if (eta > 0) {
                    progress.etaSeconds = eta;
                }
            }
        }
    }
    if (elapsed > 0 && objectsDone_ > 0) {
        auto ops = static_cast<std::int64_t>(static_cast<double>(objectsDone_) / elapsed);
        if (ops > 0) {
            progress.objectsPerSecond = ops;
        }
    }

    runner_.reporter().report(job_.jobId, progress);
}

} // namespace xferd
