/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "xferd/hub.hpp"
#include "xferd/store.hpp"
#include "xferd/util.hpp"

namespace xferd::test {

// Unique directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "xferd-test-XXXXXX").string();
        if (::mkdtemp(tmpl.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline void writeText(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

inline std::string readText(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Polls `pred` until it holds or `timeout` passes.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

// Shell stand-in for the transfer tool. Reports a compatible version,
// appends every other invocation's arguments to <dir>/calls.log, records
// the line count of any --files-from-raw list in <dir>/lists.log and
// answers lsjson with `lsjsonOutput`. `extra` runs last and may exit.
inline std::filesystem::path writeFakeEngine(const std::filesystem::path& dir,
                                             const std::string& lsjsonOutput = "[]",
                                             const std::string& extra = "") {
    std::filesystem::create_directories(dir);
    const auto script = dir / "rclone";
    std::string body;
    body += "#!/bin/sh\n";
    body += "if [ \"$1\" = \"version\" ]; then echo \"rclone v1.66.0\"; exit 0; fi\n";
    body += "echo \"$*\" >> \"" + (dir / "calls.log").string() + "\"\n";
    body += "prev=\"\"\n";
    body += "for a in \"$@\"; do\n";
    body += "  if [ \"$prev\" = \"--files-from-raw\" ]; then wc -l < \"$a\" | tr -d ' ' >> \"" +
            (dir / "lists.log").string() + "\"; fi\n";
    body += "  prev=\"$a\"\n";
    body += "done\n";
    body += "case \" $* \" in *\" lsjson \"*) cat <<'JSON'\n" + lsjsonOutput + "\nJSON\n;; esac\n";
    body += extra;
    body += "exit 0\n";
    writeText(script, body);
    ::chmod(script.c_str(), 0755);
    return script;
}

// Thread-safe in-memory Store.
class MemoryStore final : public Store {
public:
    bool createJob(const Context::Ptr&, const Job& job) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.count(job.id)) return false;
        jobs_[job.id] = job;
        order_.push_back(job.id);
        return true;
    }

    std::optional<Job> getJob(const Context::Ptr&, const JobId& jobId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<bool> jobExists(const Context::Ptr&, const JobId& jobId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.count(jobId) > 0;
    }

    std::vector<JobId> listJobIdsByStatus(const Context::Ptr&, JobStatus status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<JobId> ids;
        for (const auto& id : order_) {
            auto it = jobs_.find(id);
            if (it != jobs_.end() && it->second.status == status) ids.push_back(id);
        }
        return ids;
    }

    std::vector<Job> listJobs(const Context::Ptr&, std::size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Job> out;
        for (auto it = order_.rbegin(); it != order_.rend() && out.size() < limit; ++it) {
            auto found = jobs_.find(*it);
            if (found != jobs_.end()) out.push_back(found->second);
        }
        return out;
    }

    bool claimJob(const Context::Ptr&, const JobId& jobId, const std::string& startedAt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end() || it->second.status != JobStatus::Queued) return false;
        it->second.status = JobStatus::Running;
        it->second.startedAt = startedAt;
        return true;
    }

    bool updateJobProgress(const Context::Ptr&, const JobId& jobId, const JobProgress& progress) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) return false;
        it->second.progress = progress;
        return true;
    }

    bool finishJob(const Context::Ptr&, const JobId& jobId, JobStatus status, const std::string& finishedAt,
                   const std::optional<JobProgress>& progress, const std::optional<std::string>& error,
                   const std::optional<std::string>& errorCode) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) return false;
        it->second.status = status;
        it->second.finishedAt = finishedAt;
        it->second.progress = progress;
        it->second.error = error;
        it->second.errorCode = errorCode;
        return true;
    }

    std::vector<JobId> deleteFinishedJobsBefore(const Context::Ptr&, const std::string& cutoff,
                                                std::size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<JobId> deleted;
        for (auto it = order_.begin(); it != order_.end() && deleted.size() < limit;) {
            const auto& job = jobs_[*it];
            if (isTerminal(job.status) && job.finishedAt && *job.finishedAt < cutoff) {
                deleted.push_back(*it);
                jobs_.erase(*it);
                it = order_.erase(it);
            } else {
                ++it;
            }
        }
        return deleted;
    }

    std::optional<ProfileSecrets> getProfileSecrets(const Context::Ptr&, const std::string& profileId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = profiles_.find(profileId);
        if (it == profiles_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<UploadSession> getUploadSession(const Context::Ptr&, const std::string& profileId,
                                                  const std::string& uploadId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(uploadId);
        if (it == uploads_.end() || it->second.profileId != profileId) return std::nullopt;
        return it->second;
    }

    std::optional<bool> uploadSessionExists(const Context::Ptr&, const std::string& uploadId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_.count(uploadId) > 0;
    }

    bool deleteUploadSession(const Context::Ptr&, const std::string& profileId,
                             const std::string& uploadId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(uploadId);
        if (it == uploads_.end() || it->second.profileId != profileId) return false;
        uploads_.erase(it);
        return true;
    }

    std::vector<UploadSession> listExpiredUploadSessions(const Context::Ptr&, const std::string& now,
                                                         std::size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<UploadSession> out;
        for (const auto& entry : uploads_) {
            if (out.size() >= limit) break;
            if (entry.second.expiresAt <= now) out.push_back(entry.second);
        }
        return out;
    }

    bool clearObjectIndex(const Context::Ptr&, const std::string& profileId, const std::string& bucket,
                          const std::string& prefix) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& index = index_[profileId + "/" + bucket];
        for (auto it = index.begin(); it != index.end();) {
            if (startsWith(it->first, prefix)) {
                it = index.erase(it);
            } else {
                ++it;
            }
        }
        ++clears_;
        return true;
    }

    bool upsertObjectIndexBatch(const Context::Ptr&, const std::string& profileId, const std::string& bucket,
                                const std::vector<ObjectIndexEntry>& entries, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& index = index_[profileId + "/" + bucket];
        for (const auto& e : entries) {
            index[e.key] = e;
        }
        return true;
    }

    // Test helpers
    void putProfile(const ProfileSecrets& profile) {
        std::lock_guard<std::mutex> lock(mutex_);
        profiles_[profile.id] = profile;
    }

    void putUploadSession(const UploadSession& session) {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_[session.id] = session;
    }

    void putJob(const Job& job) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!jobs_.count(job.id)) order_.push_back(job.id);
        jobs_[job.id] = job;
    }

    std::map<std::string, ObjectIndexEntry> index(const std::string& profileId, const std::string& bucket) {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_[profileId + "/" + bucket];
    }

    int clears() {
        std::lock_guard<std::mutex> lock(mutex_);
        return clears_;
    }

private:
    std::mutex mutex_;
    std::map<JobId, Job> jobs_;
    std::vector<JobId> order_;
    std::map<std::string, ProfileSecrets> profiles_;
    std::map<std::string, UploadSession> uploads_;
    std::map<std::string, std::map<std::string, ObjectIndexEntry>> index_;
    int clears_ = 0;
};

// Hub that keeps every published event.
class RecordingHub final : public Hub {
public:
    void publish(Event event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        event.seq = static_cast<std::int64_t>(events_.size()) + 1;
        events_.push_back(std::move(event));
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<Event> ofType(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> out;
        for (const auto& e : events_) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

inline ProfileSecrets testProfile(const std::string& id = "p1") {
    ProfileSecrets p;
    p.id = id;
    p.name = "test";
    p.provider = ProfileProvider::S3Compatible;
    p.endpoint = "http://127.0.0.1:9000";
    p.region = "us-east-1";
    p.forcePathStyle = true;
    p.accessKeyId = "AKIATEST";
    p.secretAccessKey = "secret";
    return p;
}

inline Job queuedJob(const std::string& id, const std::string& type, const Json::Value& payload,
                     const std::string& profileId = "p1") {
    Job job;
    job.id = id;
    job.profileId = profileId;
    job.type = type;
    job.payload = payload;
    job.status = JobStatus::Queued;
    job.createdAt = nowTimestamp();
    return job;
}

} // namespace xferd::test
