/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/runner.hpp"
#include "xferd/hub.hpp"
#include "xferd/logger.hpp"
#include "xferd/store.hpp"
#include "xferd/util.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace xferd {

namespace fs = std::filesystem;

namespace {

bool isS3Provider(ProfileProvider provider) noexcept {
    return provider == ProfileProvider::AwsS3 || provider == ProfileProvider::S3Compatible;
}

std::string contextError(const Context::Ptr& ctx) {
    return ctx->error() == ContextError::DeadlineExceeded ? "context deadline exceeded" : "context canceled";
}

} // namespace

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

std::optional<Tune> computeTune(const EngineTuning& tuning, const std::vector<std::string>& commandArgs,
                                bool isS3, int activeJobs) {
    if (!tuning.enabled || commandArgs.empty()) {
        return std::nullopt;
    }
    static const char* const kTunable[] = {"sync", "copy", "move", "copyto", "moveto", "delete", "purge"};
    const auto& command = commandArgs.front();
    if (std::none_of(std::begin(kTunable), std::end(kTunable), [&](const char* c) { return command == c; })) {
        return std::nullopt;
    }

    Tune tune;
    tune.activeJobs = std::max(activeJobs, 1);
    int maxTransfers = tuning.maxTransfers > 0 ? tuning.maxTransfers : 4;
    int maxCheckers = tuning.maxCheckers > 0 ? tuning.maxCheckers : 8;
    tune.transfers = std::clamp(maxTransfers / tune.activeJobs, 1, maxTransfers);
    tune.checkers = std::clamp(maxCheckers / tune.activeJobs, 1, maxCheckers);
    if (isS3 && tuning.s3UploadConcurrency > 0) {
        tune.uploadConcurrency = std::clamp(tuning.s3UploadConcurrency / tune.activeJobs, 1,
                                            tuning.s3UploadConcurrency);
    }
    return tune;
}

void applyTune(std::vector<std::string>& args, const Tune& tune, bool isS3) {
    if (tune.transfers > 0 && !hasFlag(args, "--transfers")) {
        args.insert(args.end(), {"--transfers", std::to_string(tune.transfers)});
    }
    if (tune.checkers > 0 && !hasFlag(args, "--checkers")) {
        args.insert(args.end(), {"--checkers", std::to_string(tune.checkers)});
    }
    if (isS3 && tune.uploadConcurrency > 0 && !hasFlag(args, "--s3-upload-concurrency")) {
        args.insert(args.end(), {"--s3-upload-concurrency", std::to_string(tune.uploadConcurrency)});
    }
}

JobError engineFailure(const std::string& processError, const std::string& stderrText,
                       const std::string& context) {
    std::string msg = trim(stderrText);
    if (msg.empty()) {
        msg = trim(processError);
    }
    if (msg.empty()) {
        msg = "rclone failed";
    }
    if (!context.empty()) {
        msg = context + ": " + msg;
    }
    auto code = classify(processError, stderrText).code;
    return JobError(code, formatJobErrorMessage(msg, code));
}

// EngineProcess

EngineProcess::EngineProcess(std::unique_ptr<ChildProcess> child, fs::path configPath,
                             std::unique_ptr<TlsMaterial> tls, const Context::Ptr& ctx)
    : child_(std::move(child)), configPath_(std::move(configPath)), tls_(std::move(tls)), ctx_(ctx) {
    stderrThread_ = std::thread([this] {
        char buf[8192];
        for (;;) {
            ssize_t n = ::read(child_->stderrFd(), buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            stderr_.append(buf, static_cast<std::size_t>(n));
        }
    });
    watcher_ = std::thread([this] {
        if (ctx_->waitUntilDone([this] { return finished_.load(); })) {
            child_->killGroup();
        }
    });
}

EngineProcess::~EngineProcess() {
    if (!waited_) {
        child_->killGroup();
        std::string ignored;
        (void)wait(&ignored);
    }
}

bool EngineProcess::wait(std::string* error) {
    if (!waited_) {
        waited_ = true;
        char buf[16 * 1024];
        for (;;) {
            ssize_t n = ::read(child_->stdoutFd(), buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
        }
        status_ = child_->wait();
        finished_.store(true);
        ctx_->wake();
        if (watcher_.joinable()) watcher_.join();
        if (stderrThread_.joinable()) stderrThread_.join();
        child_->closeOutputs();
        cleanup();
    }
    if (status_ && status_->success()) {
        return true;
    }
    if (error) {
        *error = status_ ? status_->describe() : "process did not exit cleanly";
    }
    return false;
}

void EngineProcess::cleanup() noexcept {
    if (!configPath_.empty()) {
        std::error_code ec;
        fs::remove(configPath_, ec);
        configPath_.clear();
    }
    if (tls_) {
        tls_->cleanup();
    }
}

// Runner

Runner::Runner(const Config& config, Store& store, Hub& hub, RunnerHost& host)
    : config_(config),
      reporter_(store, hub),
      host_(host),
      locator_(config.enginePath),
      recorder_(config.dataDir, config.captureUnknownErrors),
      jitter_(std::make_shared<JitterSource>()) {}

fs::path Runner::configPath(const JobId& jobId) const {
    return config_.jobLogDir() / (jobId + ".rclone.conf");
}

std::unique_ptr<EngineProcess> Runner::start(JobRun& job, const std::vector<std::string>& args,
                                             Context::Ptr ctx) {
    if (!ctx) {
        ctx = job.ctx;
    }
    auto engine = locator_.ensureCompatible();

    auto conf = configPath(job.jobId);
    writeRemoteConfig(conf, job.profile);
    std::unique_ptr<TlsMaterial> tls;
    try {
        tls = std::make_unique<TlsMaterial>(job.profile);
    } catch (...) {
        std::error_code ec;
        fs::remove(conf, ec);
        throw;
    }

    std::vector<std::string> fullArgs{"--config", conf.string()};
    fullArgs.insert(fullArgs.end(), tls->flags().begin(), tls->flags().end());
    fullArgs.insert(fullArgs.end(), args.begin(), args.end());

    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::spawn(engine.path, fullArgs);
    } catch (const std::system_error& e) {
        std::error_code ec;
        fs::remove(conf, ec);
        throw JobError(ErrorCode::Unknown, e.what());
    }
    LOG_DEBUG("Started " + (args.empty() ? std::string("rclone") : "rclone " + args.front()) +
              " for job " + job.jobId + " (pid " + std::to_string(child->pid()) + ")");
    return std::make_unique<EngineProcess>(std::move(child), conf, std::move(tls), ctx);
}

void Runner::run(JobRun& job, const std::vector<std::string>& commandArgs, const RunOptions& options) {
    auto engine = locator_.ensureCompatible();

    auto conf = configPath(job.jobId);
    writeRemoteConfig(conf, job.profile);
    struct ConfigRemover {
        fs::path path;
        ~ConfigRemover() {
            std::error_code ec;
            fs::remove(path, ec);
        }
    } remover{conf};

    TlsMaterial tls(job.profile);

    auto stats = options.trackProgress ? config_.statsInterval : Millis(0);
    std::vector<std::string> args{
        "--config", conf.string(),
        "--stats", formatDuration(stats),
        "--stats-log-level", "NOTICE",
        "--use-json-log",
    };
    args.insert(args.end(), tls.flags().begin(), tls.flags().end());
    if (options.dryRun) {
        args.emplace_back("--dry-run");
    }
    const bool isS3 = isS3Provider(job.profile.provider);
    if (isS3 && config_.tuning.s3ChunkSizeMiB > 0 && !hasFlag(args, "--s3-chunk-size")) {
        args.insert(args.end(), {"--s3-chunk-size", std::to_string(config_.tuning.s3ChunkSizeMiB) + "M"});
    }
    auto tune = computeTune(config_.tuning, commandArgs, isS3, host_.activeJobs());
    if (tune) {
        applyTune(args, *tune, isS3);
    }
    args.insert(args.end(), commandArgs.begin(), commandArgs.end());

    if (tune) {
        job.log->writeQuiet("info", "rclone tune: activeJobs=" + std::to_string(tune->activeJobs) +
                                        " transfers=" + std::to_string(tune->transfers) +
                                        " checkers=" + std::to_string(tune->checkers) +
                                        " uploadConcurrency=" + std::to_string(tune->uploadConcurrency));
    }

    const int maxAttempts = std::max(config_.retry.maxAttempts, 1);
    const std::string errContext = commandArgs.empty() ? "rclone" : "rclone " + commandArgs.front();

    // Shared by all attempts so a retry never publishes lower done counters.
    std::optional<ProgressTracker> tracker;
    if (options.trackProgress) {
        tracker.emplace(reporter_, job.jobId);
    }

    for (int attemptNo = 1; attemptNo <= maxAttempts; ++attemptNo) {
        if (attemptNo > 1) {
            job.log->warn("retrying " + errContext + " (attempt " + std::to_string(attemptNo) + "/" +
                          std::to_string(maxAttempts) + ")");
        }

        auto result = attempt(job, engine.path, args, options, tracker ? &*tracker : nullptr);
        if (result.ok) {
            return;
        }
        if (job.ctx->done()) {
            throw CanceledError(contextError(job.ctx));
        }

        auto cls = classify(result.error, result.stderrTail);
        if (cls.code == ErrorCode::Unknown && recorder_.enabled()) {
            recorder_.record(job.jobId, toString(job.profile.provider), errContext,
                             failureMessage(result.error, result.stderrTail));
        }

        if (!config_.retry.shouldRetry(attemptNo, cls)) {
            throw engineFailure(result.error, result.stderrTail, errContext);
        }

        auto delay = retryDelay(config_.retry, attemptNo, cls.code, jitter_->next());
        job.log->warn(errContext + " failed with " + toString(cls.code) + "; retrying in " +
                      formatDuration(delay) + " (attempt " + std::to_string(attemptNo + 1) + "/" +
                      std::to_string(maxAttempts) + ")");
        if (!job.ctx->sleepFor(delay)) {
            throw CanceledError(contextError(job.ctx));
        }
    }
}

AttemptResult Runner::attempt(JobRun& job, const std::string& enginePath, const std::vector<std::string>& args,
                              const RunOptions& options, ProgressTracker* tracker) {
    AttemptResult result;
    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::spawn(enginePath, args);
    } catch (const std::system_error& e) {
        result.error = e.what();
        return result;
    }
    const pid_t pid = child->pid();
    host_.registerPid(job.jobId, pid);

    StatsChannel channel(128);
    std::thread progressThread;
    if (tracker) {
        progressThread = std::thread([&job, &channel, tracker] {
            try {
                tracker->run(job.ctx, channel);
            } catch (const std::exception& e) {
                LOG_ERROR("Progress tracking failed for job " + job.jobId + ": " + std::string(e.what()));
            }
        });
    }
    StatsChannel* statsOut = tracker ? &channel : nullptr;

    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        if (job.ctx->waitUntilDone([&finished] { return finished.load(); })) {
            child->killGroup();
        }
    });

    LogCapture errCapture(50);
    std::thread outPump([&] { pump(job, child->stdoutFd(), "info", nullptr, statsOut, options.mode); });
    std::thread errPump([&] { pump(job, child->stderrFd(), "error", &errCapture, statsOut, options.mode); });

    auto status = child->wait();
    finished.store(true);
    job.ctx->wake();
    watcher.join();

    // Cancel must not reach an unrelated process once this one is reaped.
    host_.clearPid(job.jobId, pid);

    outPump.join();
    errPump.join();
    child->closeOutputs();

    channel.close();
    if (progressThread.joinable()) {
        progressThread.join();
    }

    result.ok = status.success();
    result.stderrTail = errCapture.text();
    if (!result.ok) {
        result.error = status.describe();
    }
    return result;
}

void Runner::pump(JobRun& job, int fd, const std::string& level, LogCapture* capture, StatsChannel* channel,
                  ProgressMode mode) {
    try {
        LineReader reader(fd, config_.jobLogMaxLineBytes);
        while (auto line = reader.next()) {
            if (line->text.empty()) {
                continue;
            }
            std::string raw = line->text;
            if (line->truncated) {
                raw += " [truncated]";
            }

            auto parsed = parseEngineLine(raw);
            std::string rendered = parsed.rendered.empty() ? raw : parsed.rendered;
            if (capture) {
                capture->add(rendered);
            }
            if (channel && parsed.stats) {
                channel->trySend(progressFromStats(*parsed.stats, mode));
            }
            job.log->write(level, rendered);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Log pump failed for job " + job.jobId + ": " + std::string(e.what()));
        // Keep draining so the child never blocks on a full pipe.
        char buf[8192];
        for (;;) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
        }
    }
}

} // namespace xferd
