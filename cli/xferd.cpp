/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/config.hpp"
#include "xferd/logger.hpp"
#include "xferd/server.hpp"
#include "xferd/util.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

#include <unistd.h>

using namespace xferd;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

void printUsage() {
    std::cout << "xferd " << VERSION << " - storage transfer job engine\n\n";
    std::cout << "Usage: xferd [options]\n\n";
    std::cout << "  -d, --data-dir <dir>     data directory (env XFERD_DATA_DIR, default ./data)\n";
    std::cout << "  -c, --concurrency <n>    jobs running at once (env JOB_CONCURRENCY)\n";
    std::cout << "  -q, --queue <n>          queue capacity (env JOB_QUEUE_CAPACITY)\n";
    std::cout << "  -h, --help               show this help\n";
    std::cout << "  -v, --version            print version\n\n";
    std::cout << "  Submit jobs with: xfer submit <profile> <type> <payload.json>\n";
}

std::optional<int> parsePositive(const std::string& value) {
    try {
        std::size_t pos = 0;
        int n = std::stoi(value, &pos);
        if (pos != value.size() || n <= 0) {
            return std::nullopt;
        }
        return n;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::initFromEnv();

    Config config = Config::fromEnvironment();
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--data-dir") && i + 1 < argc) {
            config.dataDir = argv[++i];
        } else if ((arg == "-c" || arg == "--concurrency") && i + 1 < argc) {
            auto n = parsePositive(argv[++i]);
            if (!n) {
                std::cerr << "Error: Invalid concurrency\n";
                return 1;
            }
            config.concurrency = *n;
        } else if ((arg == "-q" || arg == "--queue") && i + 1 < argc) {
            auto n = parsePositive(argv[++i]);
            if (!n) {
                std::cerr << "Error: Invalid queue capacity\n";
                return 1;
            }
            config.queueCapacity = static_cast<std::size_t>(*n);
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }
    config.normalize();

    std::filesystem::path pidPath = config.dataDir / ".xferd.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid)) {
        std::cerr << "Error: xferd already running for " << config.dataDir.string() << " (pid " << *pid << ")\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto server = std::make_unique<Server>(config);
        if (!server->start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        if (!writeFileAtomic(pidPath.string(), std::to_string(getpid()) + "\n")) {
            LOG_WARN("Failed to write pid file " + pidPath.string());
        }

        std::cout << "\n";
        std::cout << "  xferd " << VERSION << " RUNNING\n\n";
        std::cout << "    Data dir     " << config.dataDir.string() << "\n";
        std::cout << "    Concurrency  " << config.concurrency << "\n";
        std::cout << "    Queue        " << config.queueCapacity << "\n";
        std::cout << "\n" << std::flush;

        while (!g_shutdown_requested && server->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server->shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("xferd daemon stopped");
    return 0;
}
