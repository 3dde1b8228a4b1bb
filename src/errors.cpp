// src/errors.cpp
// Implementation of error handling system with messages and factory functions

#include "telemetry/errors.hpp"
#include <sstream>

namespace telemetry {

// Error category implementation
std::string TelemetryErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        // Configuration errors (1-99)
        case ErrorCode::INVALID_CONFIG:
            return "Invalid configuration";
        case ErrorCode::INVALID_ENDPOINT:
            return "Invalid endpoint format";
        case ErrorCode::INVALID_BATCH_SIZE:
            return "Invalid batch size";
        case ErrorCode::INVALID_FLUSH_INTERVAL:
            return "Invalid flush interval";
        case ErrorCode::INVALID_SAMPLE_RATE:
            return "Invalid sample rate";
        case ErrorCode::INVALID_SERVICE_NAME:
            return "Invalid service name";

        // Validation errors (100-199)
        case ErrorCode::INVALID_ALERT:
            return "Invalid alert definition";
        case ErrorCode::PAYLOAD_TOO_LARGE:
            return "Payload too large";

        // Network errors (200-299)
        case ErrorCode::CONNECTION_FAILED:
            return "Connection failed";
        case ErrorCode::CONNECTION_TIMEOUT:
            return "Connection timeout";
        case ErrorCode::DNS_RESOLUTION_FAILED:
            return "DNS resolution failed";
        case ErrorCode::SEND_FAILED:
            return "Send operation failed";
        case ErrorCode::RECEIVE_FAILED:
            return "Receive operation failed";
        case ErrorCode::SOCKET_ERROR:
            return "Socket error";

        // Protocol errors (300-399)
        case ErrorCode::INVALID_RESPONSE:
            return "Invalid response";
        case ErrorCode::SERIALIZATION_FAILED:
            return "Serialization failed";
        case ErrorCode::DESERIALIZATION_FAILED:
            return "Deserialization failed";
        case ErrorCode::MALFORMED_DATA:
            return "Malformed data";

        // Authentication errors (400-499)
        case ErrorCode::AUTHENTICATION_FAILED:
            return "Authentication failed";
        case ErrorCode::AUTHORIZATION_DENIED:
            return "Authorization denied";
        case ErrorCode::RATE_LIMITED:
            return "Rate limited";

        // Server errors (500-599)
        case ErrorCode::SERVER_ERROR:
            return "Server error";
        case ErrorCode::SERVICE_UNAVAILABLE:
            return "Service unavailable";
        case ErrorCode::REQUEST_REJECTED:
            return "Request rejected";

        // System errors (700-799)
        case ErrorCode::SYSTEM_ERROR:
            return "System error";

        // Unknown/Generic errors (800+)
        case ErrorCode::UNKNOWN_ERROR:
            return "Unknown error";
        case ErrorCode::OPERATION_CANCELLED:
            return "Operation cancelled";
        case ErrorCode::TIMEOUT:
            return "Operation timeout";
        case ErrorCode::RETRY_EXHAUSTED:
            return "Retry attempts exhausted";

        default:
            return "Unknown error code";
    }
}

const TelemetryErrorCategory& telemetry_error_category() {
    static const TelemetryErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return std::error_code{static_cast<int>(ec), telemetry_error_category()};
}

// Error factory functions implementation
namespace Errors {

// Configuration errors
ConfigError invalid_endpoint(const std::string& endpoint) {
    return ConfigError(ErrorCode::INVALID_ENDPOINT, "endpoint",
        "Endpoint must be in format 'host:port', got: '" + endpoint + "'");
}

ConfigError invalid_batch_size(size_t batch_size) {
    return ConfigError(ErrorCode::INVALID_BATCH_SIZE, "batch_size",
        "Batch size must be between 1 and 10000, got: " + std::to_string(batch_size));
}

ConfigError invalid_flush_interval(std::chrono::milliseconds interval) {
    return ConfigError(ErrorCode::INVALID_FLUSH_INTERVAL, "flush_interval",
        "Flush interval must be positive, got: " + std::to_string(interval.count()) + "ms");
}

ConfigError invalid_sample_rate(double sample_rate) {
    std::ostringstream oss;
    oss << "Sample rate must be between 0.0 and 1.0, got: " << sample_rate;
    return ConfigError(ErrorCode::INVALID_SAMPLE_RATE, "sample_rate", oss.str());
}

ConfigError invalid_service_name(const std::string& service_name) {
    if (service_name.empty()) {
        return ConfigError(ErrorCode::INVALID_SERVICE_NAME, "service_name",
            "Service name cannot be empty");
    }
    return ConfigError(ErrorCode::INVALID_SERVICE_NAME, "service_name",
        "Service name too long (max 255 chars)");
}

// Validation errors
ValidationError invalid_alert(const std::string& reason) {
    return ValidationError(ErrorCode::INVALID_ALERT, "alert", reason);
}

ProtocolError payload_too_large(size_t size, size_t limit) {
    return ProtocolError(ErrorCode::PAYLOAD_TOO_LARGE, "encode",
        "Frame of " + std::to_string(size) + " bytes exceeds the " + std::to_string(limit) + " byte limit");
}

// Network errors
NetworkError connection_failed(const std::string& endpoint, const std::string& reason) {
    return NetworkError(ErrorCode::CONNECTION_FAILED, "connect",
        "Failed to connect to " + endpoint + ": " + reason);
}

NetworkError dns_resolution_failed(const std::string& hostname) {
    return NetworkError(ErrorCode::DNS_RESOLUTION_FAILED, "dns_resolve",
        "Failed to resolve hostname: " + hostname);
}

NetworkError send_failed(const std::string& reason) {
    return NetworkError(ErrorCode::SEND_FAILED, "send", reason);
}

NetworkError receive_failed(const std::string& reason) {
    return NetworkError(ErrorCode::RECEIVE_FAILED, "receive", reason);
}

TimeoutError connection_timeout(const std::string& endpoint, std::chrono::milliseconds timeout) {
    return TimeoutError(ErrorCode::CONNECTION_TIMEOUT, "connect to " + endpoint, timeout);
}

// Protocol errors
ProtocolError serialization_failed(const std::string& details) {
    return ProtocolError(ErrorCode::SERIALIZATION_FAILED, "encode",
        "Failed to serialize telemetry: " + details);
}

ProtocolError malformed_data(const std::string& details) {
    return ProtocolError(ErrorCode::MALFORMED_DATA, "parse",
        "Malformed data: " + details);
}

ProtocolError deserialization_failed(const std::string& details) {
    return ProtocolError(ErrorCode::DESERIALIZATION_FAILED, "decode",
        "Failed to deserialize telemetry: " + details);
}

ProtocolError invalid_response(const std::string& details) {
    return ProtocolError(ErrorCode::INVALID_RESPONSE, "ack",
        "Invalid collector response: " + details);
}

// Authentication errors
AuthError authentication_failed(int status_code) {
    if (status_code == 403) {
        return AuthError(ErrorCode::AUTHORIZATION_DENIED,
            "Write token is not allowed to ingest into this project");
    }
    return AuthError(ErrorCode::AUTHENTICATION_FAILED,
        "Invalid write token or authentication failed");
}

// Server errors
ServerError server_error(int status_code, const std::string& message) {
    if (status_code == 503) {
        return ServerError(ErrorCode::SERVICE_UNAVAILABLE, message, status_code);
    }
    if (status_code >= 400 && status_code < 500) {
        return ServerError(ErrorCode::REQUEST_REJECTED, message, status_code);
    }
    return ServerError(ErrorCode::SERVER_ERROR, message, status_code);
}

ServerError rate_limited() {
    return ServerError(ErrorCode::RATE_LIMITED, "Rate limited, please reduce request rate", 429);
}

} // namespace Errors

} // namespace telemetry
