/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/listing.hpp"
#include "xferd/errors.hpp"
#include "xferd/remote.hpp"
#include "xferd/runner.hpp"
#include "xferd/util.hpp"

#include <cerrno>
#include <unistd.h>

namespace xferd {

namespace fs = std::filesystem;

std::string ListEntry::key() const {
    if (trim(path).empty() && !trim(name).empty()) {
        return name;
    }
    return path;
}

std::vector<ListEntry> decodeList(const std::string& text) {
    std::string error;
    auto doc = parseJson(text, &error);
    if (!doc || !doc->isArray()) {
        throw JobError(ErrorCode::Unknown, "unexpected rclone lsjson output" +
                                               (error.empty() ? std::string() : ": " + error));
    }
    std::vector<ListEntry> out;
    out.reserve(doc->size());
    for (const auto& item : *doc) {
        if (!item.isObject()) {
            throw JobError(ErrorCode::Unknown, "unexpected rclone lsjson output");
        }
        ListEntry e;
        e.path = item.get("Path", "").asString();
        e.name = item.get("Name", "").asString();
        const auto& size = item["Size"];
        e.size = size.isNumeric() ? size.asInt64() : 0;
        e.modTime = item.get("ModTime", "").asString();
        e.isDir = item.get("IsDir", false).asBool();
        e.isBucket = item.get("IsBucket", false).asBool();
        const auto& hashes = item["Hashes"];
        if (hashes.isObject()) {
            for (const auto& name : hashes.getMemberNames()) {
                if (hashes[name].isString()) {
                    e.hashes[name] = hashes[name].asString();
                }
            }
        }
        out.push_back(std::move(e));
    }
    return out;
}

std::string readAll(int fd) {
    std::string out;
    char buf[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

std::vector<ListEntry> runList(Runner& runner, JobRun& job, const std::vector<std::string>& args,
                               const Context::Ptr& ctx) {
    auto proc = runner.start(job, args, ctx);
    std::string output = readAll(proc->stdoutFd());
    std::string waitErr;
    if (!proc->wait(&waitErr)) {
        const auto& effective = ctx ? ctx : job.ctx;
        if (effective->done()) {
            throw CanceledError(effective->error() == ContextError::DeadlineExceeded ? "context deadline exceeded"
                                                                                     : "context canceled");
        }
        throw engineFailure(waitErr, proc->stderrText(), "rclone lsjson");
    }
    return decodeList(output);
}

std::string etagFromHashes(const std::map<std::string, std::string>& hashes) {
    for (const char* name : {"ETag", "etag", "MD5", "md5"}) {
        auto it = hashes.find(name);
        if (it != hashes.end()) {
            auto v = trim(it->second);
            if (!v.empty()) return v;
        }
    }
    for (const auto& entry : hashes) {
        auto v = trim(entry.second);
        if (!v.empty()) return v;
    }
    return {};
}

std::string normalizeListTime(const std::string& value) {
    auto tp = parseTimestamp(trim(value));
    return tp ? formatTimestamp(*tp) : std::string();
}

std::string objectKey(const std::string& prefix, const std::string& name, bool preserveLeadingSlash) {
    auto p = normalizePathInput(prefix, preserveLeadingSlash);
    auto n = normalizePathInput(name, preserveLeadingSlash);
    if (p.empty()) {
        return n;
    }
    if (n.empty()) {
        if (endsWith(p, "/")) p.pop_back();
        return p;
    }
    return endsWith(p, "/") ? p + n : p + "/" + n;
}

bool wildcardMatch(const std::string& pattern, const std::string& value) {
    std::size_t pi = 0;
    std::size_t si = 0;
    std::size_t star = std::string::npos;
    std::size_t match = 0;
    while (si < value.size()) {
        if (pi < pattern.size() && (pattern[pi] == '?' || pattern[pi] == value[si])) {
            ++pi;
            ++si;
        } else if (pi < pattern.size() && pattern[pi] == '*') {
            star = pi++;
            match = si;
        } else if (star != std::string::npos) {
            pi = star + 1;
            si = ++match;
        } else {
            return false;
        }
    }
    while (pi < pattern.size() && pattern[pi] == '*') {
        ++pi;
    }
    return pi == pattern.size();
}

bool shouldIncludePath(const std::string& path, const std::vector<std::string>& include,
                       const std::vector<std::string>& exclude) {
    std::string normalized = path;
    if (startsWith(normalized, "/")) {
        normalized.erase(0, 1);
    }

    bool included = true;
    if (!include.empty()) {
        included = false;
        for (const auto& raw : include) {
            auto pat = trim(raw);
            if (!pat.empty() && wildcardMatch(pat, normalized)) {
                included = true;
                break;
            }
        }
    }
    if (!included) {
        return false;
    }
    for (const auto& raw : exclude) {
        auto pat = trim(raw);
        if (!pat.empty() && wildcardMatch(pat, normalized)) {
            return false;
        }
    }
    return true;
}

Totals computeLocalTotals(const Context::Ptr& ctx, const fs::path& root, const std::vector<std::string>& include,
                          const std::vector<std::string>& exclude) {
    Totals totals;
    std::error_code ec;
    auto st = fs::status(root, ec);
    if (ec) {
        throw JobError(ErrorCode::NotFound, "stat " + root.string() + ": " + ec.message());
    }
    if (fs::is_regular_file(st)) {
        if (shouldIncludePath(root.filename().string(), include, exclude)) {
            totals.objects = 1;
            totals.bytes = static_cast<std::int64_t>(fs::file_size(root, ec));
        }
        return totals;
    }
    if (!fs::is_directory(st)) {
        return totals;
    }

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw JobError(ErrorCode::Unknown, "walk " + root.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw JobError(ErrorCode::Unknown, "walk " + root.string() + ": " + ec.message());
        }
        ctx->check();
        const auto& entry = *it;
        std::error_code fec;
        if (!entry.is_regular_file(fec) || entry.is_symlink(fec)) {
            continue;
        }
        auto rel = entry.path().lexically_relative(root).generic_string();
        if (rel.empty() || rel == ".") {
            rel = entry.path().filename().generic_string();
        }
        if (!shouldIncludePath(rel, include, exclude)) {
            continue;
        }
        totals.objects++;
        totals.bytes += static_cast<std::int64_t>(entry.file_size(fec));
    }
    if (ec) {
        throw JobError(ErrorCode::Unknown, "walk " + root.string() + ": " + ec.message());
    }
    return totals;
}

std::optional<Totals> computeRemoteTotals(Runner& runner, JobRun& job, const Context::Ptr& ctx,
                                          const std::string& bucket, const std::string& prefix,
                                          const std::vector<std::string>& include,
                                          const std::vector<std::string>& exclude, std::int64_t maxObjects) {
    if (maxObjects <= 0) {
        maxObjects = 50000;
    }
    const bool keep = job.profile.preserveLeadingSlash;
    auto entries = runList(runner, job,
                           {"lsjson", "-R", "--fast-list", "--no-mimetype", remoteDir(bucket, prefix, keep)}, ctx);

    Totals totals;
    for (const auto& entry : entries) {
        ctx->check();
        if (entry.isDir) {
            continue;
        }
        auto key = objectKey(prefix, entry.key(), keep);
        if (key.empty()) {
            continue;
        }
        auto rel = key;
        if (!prefix.empty() && startsWith(key, prefix)) {
            rel = key.substr(prefix.size());
        }
        if (!shouldIncludePath(rel, include, exclude)) {
            continue;
        }
        totals.objects++;
        totals.bytes += entry.size;
        if (totals.objects > maxObjects) {
            return std::nullopt;
        }
    }
    return totals;
}

} // namespace xferd
