/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/hub.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"

namespace xferd {

Json::Value Event::toJson() const {
    Json::Value out(Json::objectValue);
    out["type"] = type;
    out["ts"] = ts;
    out["seq"] = Json::Int64(seq);
    if (!jobId.empty()) {
        out["jobId"] = jobId;
    }
    if (!payload.isNull() && !(payload.isObject() && payload.empty())) {
        out["payload"] = payload;
    }
    return out;
}

void LocalHub::publish(Event event) {
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.seq = ++seq_;
        if (event.ts.empty()) {
            event.ts = nowTimestamp();
        }
        buffer_.push_back(event);
        while (buffer_.size() > bufferSize_) {
            buffer_.pop_front();
        }
        targets.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            targets.push_back(entry.second);
        }
    }

    for (const auto& subscriber : targets) {
        try {
            subscriber(event);
        } catch (const std::exception& e) {
            LOG_WARN("Event subscriber failed on " + event.type + ": " + std::string(e.what()));
        }
    }
}

std::uint64_t LocalHub::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = nextId_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void LocalHub::unsubscribe(std::uint64_t id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}

std::vector<Event> LocalHub::since(std::int64_t afterSeq) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out;
    for (const auto& event : buffer_) {
        if (event.seq > afterSeq) {
            out.push_back(event);
        }
    }
    return out;
}

} // namespace xferd
