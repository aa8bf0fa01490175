/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/errors.hpp"
#include "xferd/util.hpp"
#include <array>
#include <initializer_list>
#include <utility>

namespace xferd {

namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 17> kCodeNames{{
    {ErrorCode::TransferEngineMissing, "transfer_engine_missing"},
    {ErrorCode::TransferEngineIncompatible, "transfer_engine_incompatible"},
    {ErrorCode::InvalidCredentials, "invalid_credentials"},
    {ErrorCode::AccessDenied, "access_denied"},
    {ErrorCode::SignatureMismatch, "signature_mismatch"},
    {ErrorCode::RequestTimeSkewed, "request_time_skewed"},
    {ErrorCode::EndpointUnreachable, "endpoint_unreachable"},
    {ErrorCode::UpstreamTimeout, "upstream_timeout"},
    {ErrorCode::NetworkError, "network_error"},
    {ErrorCode::NotFound, "not_found"},
    {ErrorCode::Conflict, "conflict"},
    {ErrorCode::RateLimited, "rate_limited"},
    {ErrorCode::InvalidConfig, "invalid_config"},
    {ErrorCode::Canceled, "canceled"},
    {ErrorCode::ServerRestarted, "server_restarted"},
    {ErrorCode::ValidationError, "validation_error"},
    {ErrorCode::Unknown, "unknown"},
}};

bool any(const std::string& msg, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (contains(msg, n)) return true;
    }
    return false;
}

bool all(const std::string& msg, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (!contains(msg, n)) return false;
    }
    return true;
}

} // namespace

const char* toString(ErrorCode code) noexcept {
    for (const auto& entry : kCodeNames) {
        if (entry.first == code) return entry.second;
    }
    return "unknown";
}

std::optional<ErrorCode> parseErrorCode(const std::string& value) noexcept {
    for (const auto& entry : kCodeNames) {
        if (value == entry.second) return entry.first;
    }
    return std::nullopt;
}

std::string formatJobErrorMessage(const std::string& message, ErrorCode code) {
    const std::string name = toString(code);
    std::string msg = trim(message);
    if (msg.empty() || contains(msg, name)) {
        return msg;
    }
    return "[" + name + "] " + msg;
}

std::string failureMessage(const std::string& processError, const std::string& stderrTail) {
    std::string msg = trim(stderrTail);
    if (!msg.empty()) {
        return msg;
    }
    return processError;
}

Classification classify(const std::string& processError, const std::string& stderrTail, bool canceled) {
    if (canceled) {
        return {ErrorCode::Canceled, false};
    }

    const std::string msg = toLower(failureMessage(processError, stderrTail));
    if (trim(msg).empty()) {
        return {ErrorCode::Unknown, false};
    }

    // Order matters: config errors and permission errors often mention "not found".
    if (isInvalidConfig(msg)) return {ErrorCode::InvalidConfig, false};
    if (isSignatureMismatch(msg)) return {ErrorCode::SignatureMismatch, false};
    if (isInvalidCredentials(msg)) return {ErrorCode::InvalidCredentials, false};
    if (isAccessDenied(msg)) return {ErrorCode::AccessDenied, false};
    if (isNotFound(msg)) return {ErrorCode::NotFound, false};
    if (isRequestTimeSkewed(msg)) return {ErrorCode::RequestTimeSkewed, false};
    if (isRateLimited(msg)) return {ErrorCode::RateLimited, true};
    if (isConflict(msg)) return {ErrorCode::Conflict, false};
    if (isTimeout(msg)) return {ErrorCode::UpstreamTimeout, true};
    if (isEndpointUnreachable(msg)) return {ErrorCode::EndpointUnreachable, true};
    if (isNetworkError(msg)) return {ErrorCode::NetworkError, true};
    return {ErrorCode::Unknown, false};
}

bool isNotFound(const std::string& msg) {
    return any(msg, {"nosuchkey", "no such key", "nosuchbucket", "no such bucket",
                     "containernotfound", "container not found", "blobnotfound",
                     "blob not found", "notfound", "resourcenotfound",
                     "the specified container does not exist",
                     "the specified bucket does not exist", "not found", "no such file",
                     "status 404", "error 404", " 404"});
}

bool isAccessDenied(const std::string& msg) {
    if (any(msg, {"accessdenied", "access denied", "permission denied", "forbidden",
                  "authorizationpermissionmismatch", "notauthorizedornotfound",
                  "not authorized", "authorizationfailure", "authorization failed",
                  "account is disabled", "permissiondenied", "insufficientpermissions",
                  "status 403", "error 403"})) {
        return true;
    }
    return all(msg, {"does not have", " access"});
}

bool isInvalidCredentials(const std::string& msg) {
    if (any(msg, {"invalidaccesskeyid", "access key id you provided does not exist",
                  "invalid access key", "invalidtoken", "expiredtoken",
                  "authenticationfailed", "invalidauthenticationinfo",
                  "failed to authenticate", "invalid_grant", "notauthenticated",
                  "server failed to authenticate the request", "unauthorized",
                  "status 401", "error 401"})) {
        return true;
    }
    return all(msg, {"security token", "invalid"}) || all(msg, {"oauth2:", "token"});
}

bool isSignatureMismatch(const std::string& msg) {
    return any(msg, {"signaturedoesnotmatch", "signature does not match",
                     "request signature we calculated does not match",
                     "invalid signature", "authorizationheader malformed"});
}

bool isRequestTimeSkewed(const std::string& msg) {
    return any(msg, {"request time too skewed", "requesttime"});
}

bool isRateLimited(const std::string& msg) {
    if (any(msg, {"rate limit", "too many requests", "toomanyrequests", "status 429",
                  "error 429", "slowdown", "slow down", "requestlimitexceeded",
                  "throttl", "serverbusy", "ratelimitexceeded", "resourceexhausted"})) {
        return true;
    }
    return all(msg, {"quota", "exceed"});
}

bool isBucketNotEmpty(const std::string& msg) {
    return any(msg, {"bucketnotempty", "bucket not empty", "directory not empty"}) ||
           all(msg, {"not empty", "bucket"});
}

bool isConflict(const std::string& msg) {
    return isBucketNotEmpty(msg) ||
           any(msg, {"conflict", "already exists", "precondition failed", "status 409",
                     "error 409", "status 412", "error 412"});
}

bool isTimeout(const std::string& msg) {
    return any(msg, {"timeout", "context deadline exceeded"});
}

bool isEndpointUnreachable(const std::string& msg) {
    return any(msg, {"no such host", "temporary failure in name resolution",
                     "connection refused", "connection reset", "dial tcp", "tls:", "x509:"});
}

bool isNetworkError(const std::string& msg) {
    return any(msg, {"broken pipe", "connection closed", "connection aborted",
                     "unexpected eof", "network error"}) ||
           trim(msg) == "eof";
}

bool isInvalidConfig(const std::string& msg) {
    return all(msg, {"didn't find section", "config"}) ||
           all(msg, {"did not find section", "config"}) ||
           all(msg, {"section", "not found", "config"}) ||
           any(msg, {"unknown backend", "unknown remote", "failed to create file system",
                     "invalid configuration", "bad configuration", "bad config"}) ||
           all(msg, {"failed to configure", "backend"}) ||
           all(msg, {"config file", "not found"}) ||
           all(msg, {"couldn't parse", "config"});
}

} // namespace xferd
