/*
 * xferd - Job client (xfer)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/config.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"
#include "xferd/work.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace xferd;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "xferd Job Client v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [-d <data-dir>] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  submit <profile> <type> <payload.json|->   queue a job, prints its id\n";
    std::cout << "  status <job-id>                            job record as JSON\n";
    std::cout << "  list [-n <limit>]                          most recent jobs\n";
    std::cout << "  cancel <job-id>                            request cancellation\n";
    std::cout << "  wait <job-id>                              block until the job finishes\n";
    std::cout << "  log <job-id>                               print the job log\n";
    std::cout << "  profile add <profile.json|->               store connection profile\n";
    std::cout << "  upload create <profile> <bucket> [prefix]  new staging upload session\n\n";
    std::cout << "Job types:\n";
    std::cout << "  transfer_sync_local_to_s3 transfer_sync_staging_to_s3 transfer_sync_s3_to_local\n";
    std::cout << "  transfer_delete_prefix transfer_copy_object transfer_move_object\n";
    std::cout << "  transfer_copy_batch transfer_move_batch transfer_copy_prefix transfer_move_prefix\n";
    std::cout << "  s3_zip_prefix s3_zip_objects s3_delete_objects s3_index_objects\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  XFERD_DATA_DIR     Data directory shared with the daemon (default ./data)\n";
    std::cout << "  XFERD_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " profile add minio.json\n";
    std::cout << "  " << progName << " submit minio transfer_delete_prefix delete.json\n";
    std::cout << "  " << progName << " submit minio s3_zip_prefix - < zip.json | xargs " << progName << " wait\n";
}

std::optional<std::string> readInput(const std::string& source) {
    if (source == "-") {
        return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    }
    return readFile(source);
}

std::optional<Json::Value> readJsonArg(const std::string& source) {
    auto text = readInput(source);
    if (!text) {
        std::cerr << "Error: Cannot read " << source << "\n";
        return std::nullopt;
    }
    std::string error;
    auto value = parseJson(*text, &error);
    if (!value) {
        std::cerr << "Error: Invalid JSON in " << source << ": " << error << "\n";
    }
    return value;
}

int printResult(const SubmitResult& result) {
    if (result.ok) {
        std::cout << result.id << std::endl;
        return 0;
    }
    std::cerr << "Error: " << result.message << std::endl;
    return 1;
}

int cmdSubmit(Work& work, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        std::cerr << "Error: submit needs <profile> <type> <payload.json|->\n";
        return 1;
    }
    auto payload = readJsonArg(args[2]);
    if (!payload) {
        return 1;
    }
    return printResult(work.submit(args[0], args[1], *payload));
}

int cmdStatus(Work& work, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: status needs <job-id>\n";
        return 1;
    }
    auto job = work.status(args[0]);
    if (!job) {
        std::cerr << "Job not found: " << args[0] << std::endl;
        return 1;
    }
    std::cout << toJsonPretty(jobToJson(*job)) << std::endl;
    return 0;
}

int cmdList(Work& work, const std::vector<std::string>& args) {
    std::size_t limit = 20;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if ((args[i] == "-n" || args[i] == "--limit") && i + 1 < args.size()) {
            try {
                limit = static_cast<std::size_t>(std::stoul(args[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid limit\n";
                return 1;
            }
        }
    }
    for (const auto& job : work.list(limit)) {
        std::cout << std::left << std::setw(32) << job.id << " " << std::setw(10) << toString(job.status) << " "
                  << std::setw(28) << job.type << " " << job.createdAt;
        if (job.errorCode) {
            std::cout << " " << *job.errorCode;
        }
        std::cout << "\n";
    }
    return 0;
}

int cmdWait(Work& work, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: wait needs <job-id>\n";
        return 1;
    }
    while (true) {
        auto job = work.status(args[0]);
        if (!job) {
            std::cerr << "Job not found: " << args[0] << std::endl;
            return 1;
        }
        if (isTerminal(job->status)) {
            std::cout << toString(job->status) << std::endl;
            if (job->status == JobStatus::Succeeded) {
                return 0;
            }
            if (job->error) {
                std::cerr << "Error: " << *job->error << std::endl;
            }
            return job->status == JobStatus::Canceled ? 2 : 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
}

int cmdLog(Work& work, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: log needs <job-id>\n";
        return 1;
    }
    auto text = readFile(work.logPath(args[0]).string());
    if (!text) {
        std::cerr << "No log for job: " << args[0] << std::endl;
        return 1;
    }
    std::cout << *text;
    return 0;
}

int cmdProfile(Work& work, const std::vector<std::string>& args) {
    if (args.size() != 2 || args[0] != "add") {
        std::cerr << "Error: usage: profile add <profile.json|->\n";
        return 1;
    }
    auto profile = readJsonArg(args[1]);
    if (!profile) {
        return 1;
    }
    return printResult(work.putProfile(*profile));
}

int cmdUpload(Work& work, const std::vector<std::string>& args) {
    if (args.size() < 3 || args.size() > 4 || args[0] != "create") {
        std::cerr << "Error: usage: upload create <profile> <bucket> [prefix]\n";
        return 1;
    }
    auto result = work.createUploadSession(args[1], args[2], args.size() == 4 ? args[3] : "");
    if (!result.ok) {
        std::cerr << "Error: " << result.message << std::endl;
        return 1;
    }
    // id, then the directory to copy files into
    std::cout << result.id << "\n" << result.message << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; XFERD_LOG_LEVEL overrides
    if (std::getenv("XFERD_LOG_LEVEL")) {
        Logger::initFromEnv();
    } else {
        Logger::setLevel(LogLevel::WARN);
    }

    Config config = Config::fromEnvironment();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if ((arg == "-d" || arg == "--data-dir") && args.empty() && i + 1 < argc) {
            config.dataDir = argv[++i];
            continue;
        }
        args.push_back(arg);
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = args.front();
    args.erase(args.begin());

    try {
        Work work(config);
        if (!work.ready()) {
            std::cerr << "Error: Cannot open data directory " << config.dataDir.string() << "\n";
            return 1;
        }

        if (command == "submit") return cmdSubmit(work, args);
        if (command == "status") return cmdStatus(work, args);
        if (command == "list") return cmdList(work, args);
        if (command == "cancel") {
            if (args.size() != 1) {
                std::cerr << "Error: cancel needs <job-id>\n";
                return 1;
            }
            return printResult(work.cancel(args[0]));
        }
        if (command == "wait") return cmdWait(work, args);
        if (command == "log") return cmdLog(work, args);
        if (command == "profile") return cmdProfile(work, args);
        if (command == "upload") return cmdUpload(work, args);

        std::cerr << "Error: Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
