/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/executor.hpp"
#include "xferd/errors.hpp"
#include "xferd/listing.hpp"
#include "xferd/logger.hpp"
#include "xferd/remote.hpp"
#include "xferd/runner.hpp"
#include "xferd/store.hpp"
#include "xferd/util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace xferd {

namespace fs = std::filesystem;

void Executor::execute(JobRun& job, JobType type, const Json::Value& payload) {
    switch (type) {
    case JobType::SyncLocalToS3:
        syncLocalToS3(job, parseSyncLocalPayload(payload));
        break;
    case JobType::SyncStagingToS3:
        syncStagingToS3(job, parseSyncStagingPayload(payload));
        break;
    case JobType::SyncS3ToLocal:
        syncS3ToLocal(job, parseSyncLocalPayload(payload));
        break;
    case JobType::DeletePrefix:
        deletePrefix(job, parseDeletePrefixPayload(payload));
        break;
    case JobType::CopyObject:
        copyMoveObject(job, parseCopyMoveObjectPayload(payload), "copyto");
        break;
    case JobType::MoveObject:
        copyMoveObject(job, parseCopyMoveObjectPayload(payload), "moveto");
        break;
    case JobType::CopyBatch:
        copyMoveBatch(job, parseBatchPayload(payload), "copyto");
        break;
    case JobType::MoveBatch:
        copyMoveBatch(job, parseBatchPayload(payload), "moveto");
        break;
    case JobType::CopyPrefix:
        copyMovePrefix(job, parseCopyMovePrefixPayload(payload), "copy");
        break;
    case JobType::MovePrefix:
        copyMovePrefix(job, parseCopyMovePrefixPayload(payload), "move");
        break;
    case JobType::ZipPrefix:
        zipPrefix(job, parseZipPrefixPayload(payload));
        break;
    case JobType::ZipObjects:
        zipObjects(job, parseZipObjectsPayload(payload));
        break;
    case JobType::DeleteObjects:
        deleteObjects(job, parseDeleteObjectsPayload(payload));
        break;
    case JobType::IndexObjects:
        indexObjects(job, parseIndexObjectsPayload(payload));
        break;
    default:
        throw ValidationError(std::string("unsupported job type: ") + toString(type));
    }
}

Context::Ptr Executor::storeContext() {
    return Context::withTimeout(Context::background(), kStoreTimeout);
}

void Executor::preflight(JobRun& job, const char* what, const std::function<void(const Context::Ptr&)>& body) {
    auto ctx = Context::withTimeout(job.ctx, kPreflightBudget);
    CancelGuard guard(ctx);
    try {
        body(ctx);
    } catch (const std::exception& e) {
        LOG_DEBUG("Preflight " + std::string(what) + " skipped for job " + job.jobId + ": " + e.what());
    }
}

void Executor::setTotals(const JobId& jobId, std::int64_t objects, std::optional<std::int64_t> bytes) {
    JobProgress progress;
    progress.objectsTotal = objects;
    progress.bytesTotal = bytes;
    runner_.reporter().report(jobId, progress);
}

void Executor::setTotalsFromObject(JobRun& job, const std::string& bucket, const std::string& key) {
    auto ctx = Context::withTimeout(job.ctx, kStatBudget);
    CancelGuard guard(ctx);
    try {
        auto proc = runner_.start(job, {"lsjson", "--stat", "--no-mimetype",
                                        remoteObject(bucket, key, job.profile.preserveLeadingSlash)},
                                  ctx);
        auto out = readAll(proc->stdoutFd());
        std::string waitErr;
        if (!proc->wait(&waitErr) || trim(out).empty()) {
            return;
        }
        auto doc = parseJson(out);
        if (!doc || !doc->isObject()) {
            return;
        }
        JobProgress progress;
        progress.objectsTotal = 1;
        const auto& size = (*doc)["Size"];
        if (size.isNumeric() && size.asInt64() > 0) {
            progress.bytesTotal = size.asInt64();
        }
        runner_.reporter().report(job.jobId, progress);
    } catch (const std::exception& e) {
        LOG_DEBUG("Object stat skipped for job " + job.jobId + ": " + e.what());
    }
}

void Executor::incrementObjectsDone(const JobId& jobId, std::int64_t delta) {
    if (delta <= 0) {
        return;
    }
    auto current = runner_.reporter().load(jobId);
    JobProgress progress = current ? *current : JobProgress{};
    progress.objectsDone = progress.objectsDone.value_or(0) + delta;
    runner_.reporter().report(jobId, progress);
}

void Executor::runSync(JobRun& job, const std::string& src, const std::string& dst, bool deleteExtraneous,
                       const std::vector<std::string>& include, const std::vector<std::string>& exclude,
                       bool dryRun) {
    std::vector<std::string> args{deleteExtraneous ? "sync" : "copy"};
    appendFilters(args, include, exclude);
    args.push_back(src);
    args.push_back(dst);

    RunOptions options;
    options.trackProgress = true;
    options.dryRun = dryRun;
    options.mode = ProgressMode::Transfers;
    runner_.run(job, args, options);
}

bool isUnderDir(const fs::path& dir, const fs::path& path) {
    auto rel = path.lexically_relative(dir);
    if (rel.empty()) {
        return false;
    }
    if (rel == ".") {
        return true;
    }
    return *rel.begin() != "..";
}

void Executor::ensureLocalPathAllowed(const fs::path& localPath) const {
    if (config_.allowedLocalDirs.empty()) {
        return;
    }
    std::error_code ec;
    auto real = fs::canonical(fs::absolute(localPath, ec), ec);
    if (ec) {
        throw ValidationError("localPath \"" + localPath.string() + "\" not found: " + ec.message());
    }

    std::string allowed;
    for (const auto& dir : config_.allowedLocalDirs) {
        std::error_code dec;
        auto base = fs::weakly_canonical(dir, dec);
        if (isUnderDir(dec ? dir : base, real)) {
            return;
        }
        if (!allowed.empty()) allowed += ", ";
        allowed += dir.string();
    }
    throw ValidationError("localPath \"" + real.string() + "\" is not allowed; must be under one of: " + allowed);
}

std::string Executor::prepareLocalDestination(const std::string& localPath) const {
    auto clean = fs::path(localPath).lexically_normal();
    if (clean.empty() || clean == ".") {
        throw ValidationError("invalid localPath \"" + localPath + "\"");
    }
    std::error_code ec;
    auto abs = fs::absolute(clean, ec);
    if (ec) {
        throw ValidationError("invalid localPath \"" + localPath + "\": " + ec.message());
    }
    abs = abs.lexically_normal();

    if (!config_.allowedLocalDirs.empty()) {
        // Resolves symlinks in the existing part; missing components are appended as-is.
        auto real = fs::weakly_canonical(abs, ec);
        if (ec) {
            throw ValidationError("invalid localPath \"" + localPath + "\": " + ec.message());
        }
        bool ok = false;
        std::string allowed;
        for (const auto& dir : config_.allowedLocalDirs) {
            std::error_code dec;
            auto base = fs::weakly_canonical(dir, dec);
            if (isUnderDir(dec ? dir : base, real)) {
                ok = true;
                break;
            }
            if (!allowed.empty()) allowed += ", ";
            allowed += dir.string();
        }
        if (!ok) {
            throw ValidationError("localPath \"" + real.string() + "\" is not allowed; must be under one of: " +
                                  allowed);
        }
    }

    auto st = fs::status(abs, ec);
    if (!ec && fs::exists(st)) {
        if (!fs::is_directory(st)) {
            throw ValidationError("localPath \"" + abs.string() + "\" must be a directory");
        }
    } else if (ec && ec != std::errc::no_such_file_or_directory) {
        throw ValidationError("invalid localPath \"" + abs.string() + "\": " + ec.message());
    } else {
        fs::create_directories(abs, ec);
        if (ec) {
            throw JobError(ErrorCode::Unknown, "failed to create localPath \"" + abs.string() + "\": " + ec.message());
        }
        fs::permissions(abs, fs::perms::owner_all, fs::perm_options::replace, ec);
    }

    auto out = abs.string();
    if (!endsWith(out, "/")) {
        out += '/';
    }
    return out;
}

void appendFilters(std::vector<std::string>& args, const std::vector<std::string>& include,
                   const std::vector<std::string>& exclude) {
    for (const auto& pattern : trimEmpty(include)) {
        args.insert(args.end(), {"--include", pattern});
    }
    for (const auto& pattern : trimEmpty(exclude)) {
        args.insert(args.end(), {"--exclude", pattern});
    }
}

fs::path writeKeyList(const std::string& stem, const std::string& label, const std::vector<std::string>& keys,
                      std::size_t begin, std::size_t end) {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    std::string tmpl = (dir / (stem + "-XXXXXX.txt")).string();
    int fd = ::mkstemps(tmpl.data(), 4);
    if (fd < 0) {
        throw JobError(ErrorCode::Unknown, "failed to create " + label + ": " + std::strerror(errno));
    }

    std::string content;
    for (std::size_t i = begin; i < end && i < keys.size(); ++i) {
        content += keys[i];
        content += '\n';
    }
    const char* data = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            const int err = errno;
            ::close(fd);
            fs::remove(tmpl, ec);
            throw JobError(ErrorCode::Unknown, "failed to write " + label + ": " + std::strerror(err));
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
        const int err = errno;
        fs::remove(tmpl, ec);
        throw JobError(ErrorCode::Unknown, "failed to write " + label + ": " + std::strerror(err));
    }
    return tmpl;
}

} // namespace xferd
