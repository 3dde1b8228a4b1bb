// include/telemetry/config.hpp
// Purpose: Configuration system for the telemetry client
// Fluent setters, a builder, environment bootstrap and presets

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace telemetry {

// Batching and flush engine configuration
struct BatchConfig {
    size_t batch_size = 50;                             // Items per batch
    std::chrono::milliseconds flush_interval{5000};     // Time trigger for a non-empty batch
    size_t max_queue_size = 10000;                      // Pending items before drop-oldest
    size_t max_in_flight = 1;                           // Concurrent deliveries
    std::chrono::milliseconds drain_timeout{5000};      // Shutdown wait for in-flight deliveries
};

// Delivery pipeline and remote backend configuration
struct DeliveryConfig {
    std::string endpoint = "collect.telemetry.local:50000";
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds send_timeout{10000};
    int max_retries = 3;
    std::chrono::milliseconds retry_base_delay{500};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_retry_delay{30000};
    size_t retry_buffer_size = 16;                      // Batches kept while the circuit is open
    int failure_threshold = 5;
    std::chrono::milliseconds recovery_timeout{30000};
};

// Local sink used without a backend or during a long outage
struct FallbackConfig {
    std::chrono::milliseconds fallback_after{60000};    // Outage length before routing locally
    size_t capacity = 1000;                             // Ring buffer size in items
    bool echo_to_console = false;
};

// Logging configuration (for the library's own diagnostics, not user events)
enum class SystemLogLevel : uint8_t {
    NONE = 0,       // No diagnostics
    ERROR = 1,      // Only errors
    WARN = 2,       // Warnings and errors
    INFO = 3,       // Informational + above
    DEBUG = 4,      // Debug + above
    TRACE = 5       // Everything
};

struct LoggingConfig {
    SystemLogLevel level = SystemLogLevel::WARN;
    bool log_to_console = true;
    bool log_to_file = false;
    std::string log_file_path;
    size_t max_log_file_size = 10 * 1024 * 1024;       // 10MB
    int max_log_files = 5;
    bool async_logging = false;
};

// Default deny-list for data redaction
std::vector<std::string> default_redact_keys();

// Main configuration class
class Config {
public:
    explicit Config(const std::string& service_name);

    Config(const Config& other) = default;
    Config& operator=(const Config& other) = default;
    Config(Config&& other) noexcept = default;
    Config& operator=(Config&& other) noexcept = default;

    // Getters
    const std::string& service_name() const noexcept { return service_name_; }
    const std::optional<std::string>& api_key() const noexcept { return api_key_; }
    const std::optional<std::string>& project_id() const noexcept { return project_id_; }
    const std::string& environment() const noexcept { return environment_; }
    const std::string& service_version() const noexcept { return service_version_; }
    LogLevel min_log_level() const noexcept { return min_log_level_; }
    double sample_rate() const noexcept { return sample_rate_; }
    bool enable_metadata() const noexcept { return enable_metadata_; }
    const std::vector<std::string>& redact_keys() const noexcept { return redact_keys_; }
    const BatchConfig& batch() const noexcept { return batch_; }
    const DeliveryConfig& delivery() const noexcept { return delivery_; }
    const FallbackConfig& fallback() const noexcept { return fallback_; }
    const LoggingConfig& logging() const noexcept { return logging_; }

    // True when a write token and endpoint are both configured
    bool has_remote_backend() const noexcept;

    // Setters (fluent interface)
    Config& set_api_key(const std::string& api_key);
    Config& set_project_id(const std::string& project_id);
    Config& set_environment(const std::string& environment);
    Config& set_service_version(const std::string& version);
    Config& set_min_log_level(LogLevel level);
    Config& set_sample_rate(double rate);
    Config& set_enable_metadata(bool enable);
    Config& set_redact_keys(std::vector<std::string> keys);
    Config& set_endpoint(const std::string& endpoint);
    Config& set_batch_size(size_t size);
    Config& set_flush_interval(std::chrono::milliseconds interval);
    Config& set_max_queue_size(size_t size);
    Config& set_max_in_flight(size_t count);
    Config& set_drain_timeout(std::chrono::milliseconds timeout);
    Config& set_max_retries(int retries);
    Config& set_retry_backoff(std::chrono::milliseconds base_delay, double multiplier,
                              std::chrono::milliseconds max_delay);
    Config& set_connect_timeout(std::chrono::milliseconds timeout);
    Config& set_send_timeout(std::chrono::milliseconds timeout);
    Config& set_retry_buffer_size(size_t batches);
    Config& set_failure_threshold(int threshold);
    Config& set_recovery_timeout(std::chrono::milliseconds timeout);
    Config& set_fallback_after(std::chrono::milliseconds after);
    Config& set_fallback_capacity(size_t capacity);
    Config& set_fallback_echo(bool echo);
    Config& set_system_log_level(SystemLogLevel level);
    Config& set_log_to_file(const std::string& path);

    // Validation
    void validate() const;
    bool is_valid() const noexcept;
    std::vector<std::string> validation_errors() const;

    friend class ConfigBuilder;

private:
    std::string service_name_;
    std::optional<std::string> api_key_;
    std::optional<std::string> project_id_;
    std::string environment_ = "development";
    std::string service_version_ = "0.0.0";
    LogLevel min_log_level_ = LogLevel::INFO;
    double sample_rate_ = 1.0;
    bool enable_metadata_ = true;
    std::vector<std::string> redact_keys_;
    BatchConfig batch_;
    DeliveryConfig delivery_;
    FallbackConfig fallback_;
    LoggingConfig logging_;

    void validate_identity() const;
    void validate_sampling() const;
    void validate_batch_config() const;
    void validate_delivery_config() const;
};

// Configuration builder for advanced use cases
class ConfigBuilder {
public:
    explicit ConfigBuilder(const std::string& service_name);

    ConfigBuilder& service(const std::string& environment, const std::string& version = "0.0.0");
    // Leaves the service version untouched
    ConfigBuilder& environment(const std::string& environment);
    ConfigBuilder& credentials(const std::string& api_key, const std::string& project_id = "");
    ConfigBuilder& endpoint(const std::string& endpoint);
    ConfigBuilder& timeouts(std::chrono::milliseconds connect, std::chrono::milliseconds send);
    ConfigBuilder& batching(size_t batch_size, std::chrono::milliseconds flush_interval);
    ConfigBuilder& queue_limits(size_t max_queue_size, size_t max_in_flight);
    ConfigBuilder& retries(int max_retries, std::chrono::milliseconds base_delay,
                           double backoff_multiplier = 2.0);
    ConfigBuilder& circuit(int failure_threshold, std::chrono::milliseconds recovery_timeout);
    ConfigBuilder& fallback(std::chrono::milliseconds after, size_t capacity, bool echo = false);
    ConfigBuilder& sampling(double sample_rate, LogLevel min_level = LogLevel::INFO);
    ConfigBuilder& metadata(bool enable);
    ConfigBuilder& redact(std::vector<std::string> keys);
    ConfigBuilder& drain_timeout(std::chrono::milliseconds timeout);

    // Library diagnostics
    ConfigBuilder& system_logging(SystemLogLevel level, bool console = true);
    ConfigBuilder& file_logging(const std::string& path, size_t max_size, int max_files);

    // Build final configuration
    Config build() const;

private:
    Config config_;
};

// Environment variable configuration loader
class EnvConfig {
public:
    // TELEMETRY_WRITE_TOKEN, TELEMETRY_PROJECT_ID, TELEMETRY_SERVICE_NAME, ...
    // Without a write token the returned config routes to the local sink.
    // Unparseable values are ignored; parsed values out of range throw ConfigError.
    static Config from_environment(const std::string& default_service_name = "telemetry-service");

    static std::optional<std::string> get_write_token();
    static std::optional<std::string> get_project_id();
    static std::optional<std::string> get_service_name();
    static std::optional<std::string> get_environment();
    static std::optional<std::string> get_endpoint();
    static std::optional<LogLevel> get_min_level();
    static std::optional<double> get_sample_rate();
    static std::optional<size_t> get_batch_size();
    static std::optional<std::chrono::milliseconds> get_flush_interval();
    static std::optional<bool> get_debug();
    // Comma-separated keys added to the default deny-list
    static std::optional<std::vector<std::string>> get_redact_keys();

private:
    static std::optional<std::string> get_env(const std::string& name);
    static std::optional<long long> get_env_int(const std::string& name);
    static std::optional<bool> get_env_bool(const std::string& name);
};

// Configuration presets namespace
namespace Presets {

// Development: verbose diagnostics, small batches, console echo of local events
inline Config development(const std::string& service_name) {
    return ConfigBuilder(service_name)
        .service("development")
        .batching(10, std::chrono::milliseconds(1000))
        .sampling(1.0, LogLevel::DEBUG)
        .fallback(std::chrono::milliseconds(10000), 1000, true)
        .system_logging(SystemLogLevel::DEBUG)
        .retries(2, std::chrono::milliseconds(200))
        .build();
}

// Production: larger batches, conservative diagnostics
inline Config production(const std::string& service_name, const std::string& api_key,
                         const std::string& endpoint) {
    return ConfigBuilder(service_name)
        .service("production")
        .credentials(api_key)
        .endpoint(endpoint)
        .batching(100, std::chrono::milliseconds(5000))
        .retries(3, std::chrono::milliseconds(1000), 2.0)
        .circuit(5, std::chrono::milliseconds(30000))
        .system_logging(SystemLogLevel::ERROR)
        .build();
}

// Testing: no backend, no timer-driven flushes, tiny retry delays
inline Config testing(const std::string& service_name) {
    return ConfigBuilder(service_name)
        .service("test")
        .batching(50, std::chrono::milliseconds(60000))
        .retries(0, std::chrono::milliseconds(1))
        .metadata(false)
        .system_logging(SystemLogLevel::NONE)
        .build();
}

} // namespace Presets

} // namespace telemetry
