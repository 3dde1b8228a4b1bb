// include/telemetry/errors.hpp
// Purpose: Error handling for the telemetry client
// Hierarchical error types; sinks throw them, the pipeline classifies them

#pragma once

#include <stdexcept>
#include <string>
#include <chrono>
#include <system_error>

namespace telemetry {

// Base error category for telemetry errors
class TelemetryErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "telemetry";
    }

    std::string message(int ev) const override;
};

// Global error category instance
const TelemetryErrorCategory& telemetry_error_category();

// Error codes enum
enum class ErrorCode {
    // Configuration errors (1-99)
    INVALID_CONFIG = 2,
    INVALID_ENDPOINT = 3,
    INVALID_BATCH_SIZE = 4,
    INVALID_FLUSH_INTERVAL = 5,
    INVALID_SAMPLE_RATE = 6,
    INVALID_SERVICE_NAME = 7,

    // Validation errors (100-199)
    INVALID_ALERT = 105,
    PAYLOAD_TOO_LARGE = 106,

    // Network errors (200-299)
    CONNECTION_FAILED = 200,
    CONNECTION_TIMEOUT = 201,
    DNS_RESOLUTION_FAILED = 202,
    SEND_FAILED = 203,
    RECEIVE_FAILED = 204,
    SOCKET_ERROR = 205,

    // Protocol errors (300-399)
    INVALID_RESPONSE = 300,
    SERIALIZATION_FAILED = 301,
    DESERIALIZATION_FAILED = 302,
    MALFORMED_DATA = 303,

    // Authentication errors (400-499)
    AUTHENTICATION_FAILED = 400,
    AUTHORIZATION_DENIED = 401,
    RATE_LIMITED = 402,

    // Server errors (500-599)
    SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 501,
    REQUEST_REJECTED = 502,

    // System errors (700-799)
    SYSTEM_ERROR = 700,

    // Unknown/Generic errors (800+)
    UNKNOWN_ERROR = 800,
    OPERATION_CANCELLED = 801,
    TIMEOUT = 802,
    RETRY_EXHAUSTED = 803
};

// Create error codes
std::error_code make_error_code(ErrorCode ec);

// Base exception class for all telemetry errors
class Error : public std::exception {
public:
    explicit Error(const std::string& message)
        : message_(message)
        , error_code_(ErrorCode::UNKNOWN_ERROR)
        , timestamp_(std::chrono::system_clock::now()) {}

    Error(ErrorCode code, const std::string& message)
        : message_(message)
        , error_code_(code)
        , timestamp_(std::chrono::system_clock::now()) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCode code() const noexcept {
        return error_code_;
    }

    std::chrono::system_clock::time_point timestamp() const noexcept {
        return timestamp_;
    }

    virtual std::string category() const {
        return "telemetry::Error";
    }

    // Whether a delivery that failed with this error may succeed on a later attempt
    virtual bool retryable() const {
        return false;
    }

protected:
    std::string message_;
    ErrorCode error_code_;
    std::chrono::system_clock::time_point timestamp_;
};

// Configuration-related errors
class ConfigError : public Error {
public:
    ConfigError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Configuration error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "telemetry::ConfigError";
    }

private:
    std::string field_;
};

// Validation-related errors
class ValidationError : public Error {
public:
    ValidationError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Validation error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "telemetry::ValidationError";
    }

private:
    std::string field_;
};

// Network-related errors
class NetworkError : public Error {
public:
    NetworkError(ErrorCode code, const std::string& operation, const std::string& message)
        : Error(code, "Network error during '" + operation + "': " + message)
        , operation_(operation) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::string category() const override {
        return "telemetry::NetworkError";
    }

    bool retryable() const override {
        return true;
    }

private:
    std::string operation_;
};

// Protocol-related errors
class ProtocolError : public Error {
public:
    ProtocolError(ErrorCode code, const std::string& message)
        : Error(code, "Protocol error: " + message) {}

    ProtocolError(ErrorCode code, const std::string& operation, const std::string& message)
        : Error(code, "Protocol error during '" + operation + "': " + message)
        , operation_(operation) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::string category() const override {
        return "telemetry::ProtocolError";
    }

private:
    std::string operation_;
};

// Authentication-related errors
class AuthError : public Error {
public:
    AuthError(ErrorCode code, const std::string& message)
        : Error(code, "Authentication error: " + message) {}

    std::string category() const override {
        return "telemetry::AuthError";
    }
};

// Server-related errors. 5xx and 429 are transient, other statuses are permanent.
class ServerError : public Error {
public:
    ServerError(ErrorCode code, const std::string& message)
        : Error(code, "Server error: " + message)
        , status_code_(0) {}

    ServerError(ErrorCode code, const std::string& message, int status_code)
        : Error(code, "Server error (" + std::to_string(status_code) + "): " + message)
        , status_code_(status_code) {}

    int status_code() const noexcept {
        return status_code_;
    }

    std::string category() const override {
        return "telemetry::ServerError";
    }

    bool retryable() const override {
        return status_code_ == 0 || status_code_ == 429 || status_code_ >= 500;
    }

private:
    int status_code_;
};

// System-related errors
class SystemError : public Error {
public:
    SystemError(ErrorCode code, const std::string& message)
        : Error(code, "System error: " + message) {}

    SystemError(ErrorCode code, const std::string& message, const std::error_code& system_error)
        : Error(code, "System error: " + message + " (" + system_error.message() + ")")
        , system_error_(system_error) {}

    const std::error_code& system_error() const noexcept {
        return system_error_;
    }

    std::string category() const override {
        return "telemetry::SystemError";
    }

    bool retryable() const override {
        return true;
    }

private:
    std::error_code system_error_;
};

// Timeout-related errors
class TimeoutError : public Error {
public:
    TimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
        : TimeoutError(ErrorCode::TIMEOUT, operation, timeout) {}

    TimeoutError(ErrorCode code, const std::string& operation, std::chrono::milliseconds timeout)
        : Error(code, "Operation '" + operation + "' timed out after " +
               std::to_string(timeout.count()) + "ms")
        , operation_(operation)
        , timeout_(timeout) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::chrono::milliseconds timeout() const noexcept {
        return timeout_;
    }

    std::string category() const override {
        return "telemetry::TimeoutError";
    }

    bool retryable() const override {
        return true;
    }

private:
    std::string operation_;
    std::chrono::milliseconds timeout_;
};

// Transient errors may succeed on a later attempt; everything else is permanent
inline bool is_retryable(const Error& error) {
    return error.retryable();
}

// Error factory functions for common error scenarios
namespace Errors {

// Configuration errors
ConfigError invalid_endpoint(const std::string& endpoint);
ConfigError invalid_batch_size(size_t batch_size);
ConfigError invalid_flush_interval(std::chrono::milliseconds interval);
ConfigError invalid_sample_rate(double sample_rate);
ConfigError invalid_service_name(const std::string& service_name);

// Validation errors
ValidationError invalid_alert(const std::string& reason);
// Encoded frame over the wire limit; never retried
ProtocolError payload_too_large(size_t size, size_t limit);

// Network errors
NetworkError connection_failed(const std::string& endpoint, const std::string& reason);
NetworkError dns_resolution_failed(const std::string& hostname);
NetworkError send_failed(const std::string& reason);
NetworkError receive_failed(const std::string& reason);
TimeoutError connection_timeout(const std::string& endpoint, std::chrono::milliseconds timeout);

// Protocol errors
ProtocolError serialization_failed(const std::string& details);
ProtocolError malformed_data(const std::string& details);
// Input that is not parseable at all, as opposed to well-formed input with bad content
ProtocolError deserialization_failed(const std::string& details);
// Collector acknowledgement that cannot be read
ProtocolError invalid_response(const std::string& details);

// Authentication errors
AuthError authentication_failed(int status_code);

// Server errors, classified by status code
ServerError server_error(int status_code, const std::string& message);
ServerError rate_limited();

} // namespace Errors

} // namespace telemetry

// Enable std::error_code support
namespace std {
template <>
struct is_error_code_enum<telemetry::ErrorCode> : true_type {};
}
