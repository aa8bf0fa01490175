/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace xferd {

// Stable, user-visible failure codes attached to failed jobs.
enum class ErrorCode : std::uint8_t {
    TransferEngineMissing,
    TransferEngineIncompatible,
    InvalidCredentials,
    AccessDenied,
    SignatureMismatch,
    RequestTimeSkewed,
    EndpointUnreachable,
    UpstreamTimeout,
    NetworkError,
    NotFound,
    Conflict,
    RateLimited,
    InvalidConfig,
    Canceled,
    ServerRestarted,
    ValidationError,
    Unknown
};

[[nodiscard]] const char* toString(ErrorCode code) noexcept;
[[nodiscard]] std::optional<ErrorCode> parseErrorCode(const std::string& value) noexcept;

// Prefixes "[code] " unless the message already mentions the code.
[[nodiscard]] std::string formatJobErrorMessage(const std::string& message, ErrorCode code);

// Failure of a job step with a classified code.
class JobError : public std::runtime_error {
public:
    JobError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Payload or precondition rejected before any subprocess runs.
class ValidationError : public JobError {
public:
    explicit ValidationError(const std::string& message)
        : JobError(ErrorCode::ValidationError, message) {}
};

// The job context was canceled or ran past its deadline.
class CanceledError : public JobError {
public:
    explicit CanceledError(const std::string& message = "context canceled")
        : JobError(ErrorCode::Canceled, message) {}
};

// Transfer tool missing or too old. Never retried.
class EngineError : public JobError {
public:
    EngineError(ErrorCode code, const std::string& message) : JobError(code, message) {}
};

struct Classification {
    ErrorCode code = ErrorCode::Unknown;
    bool retryable = false;
};

// Maps a failed invocation to a code using the stderr tail, falling back
// to the process error text. `canceled` short-circuits to Canceled.
[[nodiscard]] Classification classify(const std::string& processError,
                                      const std::string& stderrTail,
                                      bool canceled = false);

// Trimmed stderr if any, else the process error.
[[nodiscard]] std::string failureMessage(const std::string& processError,
                                         const std::string& stderrTail);

// Pattern families, each taking an already lower-cased message.
[[nodiscard]] bool isInvalidConfig(const std::string& msg);
[[nodiscard]] bool isSignatureMismatch(const std::string& msg);
[[nodiscard]] bool isInvalidCredentials(const std::string& msg);
[[nodiscard]] bool isAccessDenied(const std::string& msg);
[[nodiscard]] bool isNotFound(const std::string& msg);
[[nodiscard]] bool isRequestTimeSkewed(const std::string& msg);
[[nodiscard]] bool isRateLimited(const std::string& msg);
[[nodiscard]] bool isBucketNotEmpty(const std::string& msg);
[[nodiscard]] bool isConflict(const std::string& msg);
[[nodiscard]] bool isTimeout(const std::string& msg);
[[nodiscard]] bool isEndpointUnreachable(const std::string& msg);
[[nodiscard]] bool isNetworkError(const std::string& msg);

} // namespace xferd
