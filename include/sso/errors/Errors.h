//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed exceptions for the SSO handshake and their HTTP status mapping
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sso {
namespace errors {

// Categorization of handshake failures.
enum class ErrorCategory {
    InvalidCredential,
    MissingCredential,
    MissingParameter,
    UnknownBroker,
    InvalidChecksum,
    DomainNotAllowed,
    NoLinkedSession,
    AlreadyStarted,
    Infrastructure
};

// Map an ErrorCategory to the HTTP status used when surfacing it to a caller.
//
// Args:
//   category: The error category.
//
// Returns:
//   HTTP status code (400, 401, 403 or 500).
inline int httpStatusFromCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MissingCredential: return 401;
        case ErrorCategory::NoLinkedSession: return 403;
        case ErrorCategory::Infrastructure: return 500;
        case ErrorCategory::InvalidCredential:
        case ErrorCategory::MissingParameter:
        case ErrorCategory::UnknownBroker:
        case ErrorCategory::InvalidChecksum:
        case ErrorCategory::DomainNotAllowed:
        case ErrorCategory::AlreadyStarted:
        default: return 400;
    }
}

// Short machine-readable name for a category (used in logs and error payloads).
inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::InvalidCredential: return "invalid_credential";
        case ErrorCategory::MissingCredential: return "missing_credential";
        case ErrorCategory::MissingParameter: return "missing_parameter";
        case ErrorCategory::UnknownBroker: return "unknown_broker";
        case ErrorCategory::InvalidChecksum: return "invalid_checksum";
        case ErrorCategory::DomainNotAllowed: return "domain_not_allowed";
        case ErrorCategory::NoLinkedSession: return "no_linked_session";
        case ErrorCategory::AlreadyStarted: return "already_started";
        case ErrorCategory::Infrastructure: return "infrastructure";
        default: return "unknown";
    }
}

//==========================================================================================================
// SsoError
// Purpose: Base exception for all handshake failures. Carries broker id and token for audit correlation;
//          never the broker secret or an expected checksum.
//==========================================================================================================
class SsoError : public std::runtime_error {
public:
    SsoError(ErrorCategory category, const std::string& message,
             std::string brokerId = std::string(), std::optional<std::string> token = std::nullopt)
        : std::runtime_error(message),
          category_(category),
          brokerId_(std::move(brokerId)),
          token_(std::move(token)) {}

    ErrorCategory category() const noexcept { return category_; }
    int httpStatus() const noexcept { return httpStatusFromCategory(category_); }
    const std::string& brokerId() const noexcept { return brokerId_; }
    const std::optional<std::string>& token() const noexcept { return token_; }

private:
    ErrorCategory category_;
    std::string brokerId_;
    std::optional<std::string> token_;
};

// Caller/broker fault (malformed or unauthenticated request). Logged at warning.
class BrokerError : public SsoError {
public:
    using SsoError::SsoError;
};

// Server fault (cache or broker registry failure). Logged at error.
// cause() keeps the underlying failure for logs and callers; it is never written to HTTP bodies.
class ServerError : public SsoError {
public:
    ServerError(const std::string& message, std::string brokerId = std::string(),
                std::optional<std::string> token = std::nullopt, std::string cause = std::string())
        : SsoError(ErrorCategory::Infrastructure, message, std::move(brokerId), std::move(token)),
          cause_(std::move(cause)) {}

    const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

} // namespace errors
} // namespace sso
