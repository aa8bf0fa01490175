/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <json/json.h>

namespace xferd {

struct Event {
    std::string type;
    std::string ts;
    std::int64_t seq = 0;
    std::string jobId;
    Json::Value payload{Json::objectValue};

    [[nodiscard]] Json::Value toJson() const;
};

// Broadcast sink for job events. Must be safe for concurrent publishers.
class Hub {
public:
    virtual ~Hub() = default;
    virtual void publish(Event event) = 0;
};

// In-process hub: stamps seq/ts, keeps a short replay buffer and fans out
// to subscriber callbacks synchronously.
class LocalHub final : public Hub {
public:
    using Subscriber = std::function<void(const Event&)>;

    explicit LocalHub(std::size_t bufferSize = 256) noexcept : bufferSize_(bufferSize) {}

    LocalHub(const LocalHub&) = delete;
    LocalHub& operator=(const LocalHub&) = delete;

    void publish(Event event) override;

    std::uint64_t subscribe(Subscriber subscriber);
    void unsubscribe(std::uint64_t id) noexcept;

    // Buffered events with seq > `afterSeq`.
    [[nodiscard]] std::vector<Event> since(std::int64_t afterSeq) const;

private:
    std::size_t bufferSize_;
    mutable std::mutex mutex_;
    std::int64_t seq_ = 0;
    std::deque<Event> buffer_;
    std::map<std::uint64_t, Subscriber> subscribers_;
    std::uint64_t nextId_ = 1;
};

} // namespace xferd
