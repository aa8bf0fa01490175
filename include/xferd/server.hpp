/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>

#include "xferd/config.hpp"
#include "xferd/context.hpp"
#include "xferd/hub.hpp"
#include "xferd/types.hpp"

namespace xferd {

class FileStore;
class Maintenance;
class Manager;

// The daemon: owns the store, the event hub, the job manager and the
// background loops (queued-job scanner and maintenance).
class Server final {
public:
    explicit Server(Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] LocalHub& hub() noexcept { return hub_; }
    [[nodiscard]] Manager* manager() noexcept { return manager_.get(); }

    // One scanner pass: honors cancel markers, then submits queued jobs the
    // manager has not seen yet. Serialized with the scanner thread.
    void scanOnce();

    static constexpr std::chrono::seconds kScanInterval{5};

private:
    [[nodiscard]] bool createDataDirs() noexcept;
    void processCancelMarkers();
    void submitQueuedJobs();
    void scanLoop();

    Config config_;
    LocalHub hub_;
    std::unique_ptr<FileStore> store_;
    std::unique_ptr<Manager> manager_;
    std::unique_ptr<Maintenance> maintenance_;

    std::atomic<bool> running_{false};
    Context::Ptr loopCtx_;
    std::mutex scanMutex_;
    std::unordered_set<JobId> submittedJobs_;

    std::thread scannerThread_;
    std::thread maintenanceThread_;
};

} // namespace xferd
