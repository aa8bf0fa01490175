/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace xferd {

enum class ContextError : std::uint8_t { None, Canceled, DeadlineExceeded };

// Cancellation token with an optional deadline. Children are canceled with
// their parent and inherit the earlier deadline.
class Context {
public:
    using Ptr = std::shared_ptr<Context>;
    using SteadyClock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    [[nodiscard]] static Ptr background();
    [[nodiscard]] static Ptr withCancel(const Ptr& parent);
    [[nodiscard]] static Ptr withTimeout(const Ptr& parent, std::chrono::milliseconds timeout);

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void cancel() noexcept;

    [[nodiscard]] bool done() const noexcept { return error() != ContextError::None; }
    [[nodiscard]] bool canceled() const noexcept { return error() == ContextError::Canceled; }
    [[nodiscard]] ContextError error() const noexcept;
    [[nodiscard]] std::optional<SteadyClock::time_point> deadline() const noexcept { return deadline_; }

    // Throws CanceledError when done.
    void check() const;

    // Returns false when the context ended before `d` elapsed.
    [[nodiscard]] bool sleepFor(std::chrono::milliseconds d);

    // Blocks until the context is done or `stop` returns true; the predicate is
    // re-evaluated on every wake(). Returns true when the context ended the wait.
    [[nodiscard]] bool waitUntilDone(const std::function<bool()>& stop);

    // Wakes waiters so they re-check their predicate.
    void wake() noexcept;

    // Runs `cb` on cancellation (immediately if already canceled). Deadlines
    // do not trigger callbacks; waiters observe them on their own.
    std::uint64_t onCancel(Callback cb);
    void removeCallback(std::uint64_t id) noexcept;

private:
    Context() = default;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool canceled_ = false;
    std::optional<SteadyClock::time_point> deadline_;
    std::map<std::uint64_t, Callback> callbacks_;
    std::uint64_t nextCallbackId_ = 1;

    std::weak_ptr<Context> parent_;
    std::uint64_t parentCallbackId_ = 0;
};

// Cancels the wrapped context on scope exit.
class CancelGuard {
public:
    explicit CancelGuard(Context::Ptr ctx) noexcept : ctx_(std::move(ctx)) {}
    ~CancelGuard() { if (ctx_) ctx_->cancel(); }

    CancelGuard(const CancelGuard&) = delete;
    CancelGuard& operator=(const CancelGuard&) = delete;

private:
    Context::Ptr ctx_;
};

} // namespace xferd
