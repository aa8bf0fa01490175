/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/context.hpp"
#include "xferd/errors.hpp"
#include "xferd/logger.hpp"
#include <vector>

namespace xferd {

Context::Ptr Context::background() {
    return Ptr(new Context());
}

Context::Ptr Context::withCancel(const Ptr& parent) {
    Ptr child(new Context());
    if (!parent) {
        return child;
    }
    child->deadline_ = parent->deadline_;
    child->parent_ = parent;
    std::weak_ptr<Context> weak = child;
    child->parentCallbackId_ = parent->onCancel([weak] {
        if (auto c = weak.lock()) {
            c->cancel();
        }
    });
    return child;
}

Context::Ptr Context::withTimeout(const Ptr& parent, std::chrono::milliseconds timeout) {
    Ptr child = withCancel(parent);
    auto when = SteadyClock::now() + timeout;
    if (!child->deadline_ || when < *child->deadline_) {
        child->deadline_ = when;
    }
    return child;
}

Context::~Context() {
    if (auto parent = parent_.lock()) {
        parent->removeCallback(parentCallbackId_);
    }
}

void Context::cancel() noexcept {
    std::vector<Callback> toRun;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (canceled_) {
            return;
        }
        canceled_ = true;
        for (auto& entry : callbacks_) {
            toRun.push_back(std::move(entry.second));
        }
        callbacks_.clear();
    }
    cv_.notify_all();
    for (auto& cb : toRun) {
        try {
            cb();
        } catch (const std::exception& e) {
            LOG_ERROR("Cancel callback failed: " + std::string(e.what()));
        }
    }
}

ContextError Context::error() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canceled_) {
        return ContextError::Canceled;
    }
    if (deadline_ && SteadyClock::now() >= *deadline_) {
        return ContextError::DeadlineExceeded;
    }
    return ContextError::None;
}

void Context::check() const {
    switch (error()) {
        case ContextError::None:
            return;
        case ContextError::Canceled:
            throw CanceledError("context canceled");
        case ContextError::DeadlineExceeded:
            throw CanceledError("context deadline exceeded");
    }
}

bool Context::sleepFor(std::chrono::milliseconds d) {
    if (d.count() <= 0) {
        return !done();
    }
    auto until = SteadyClock::now() + d;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!canceled_) {
        auto limit = until;
        if (deadline_ && *deadline_ < limit) {
            limit = *deadline_;
        }
        if (cv_.wait_until(lock, limit) == std::cv_status::timeout) {
            auto now = SteadyClock::now();
            if (deadline_ && now >= *deadline_) {
                return false;
            }
            if (now >= until) {
                return true;
            }
        }
    }
    return false;
}

bool Context::waitUntilDone(const std::function<bool()>& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (canceled_) {
            return true;
        }
        if (deadline_ && SteadyClock::now() >= *deadline_) {
            return true;
        }
        if (stop && stop()) {
            return false;
        }
        if (deadline_) {
            cv_.wait_until(lock, *deadline_);
        } else {
            cv_.wait(lock);
        }
    }
}

void Context::wake() noexcept {
    // Take the lock so a waiter between its predicate check and wait cannot miss this.
    { std::lock_guard<std::mutex> lock(mutex_); }
    cv_.notify_all();
}

std::uint64_t Context::onCancel(Callback cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!canceled_) {
            auto id = nextCallbackId_++;
            callbacks_.emplace(id, std::move(cb));
            return id;
        }
    }
    cb();
    return 0;
}

void Context::removeCallback(std::uint64_t id) noexcept {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

} // namespace xferd
