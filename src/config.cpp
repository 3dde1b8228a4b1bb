// src/config.cpp
// Implementation of configuration system with validation, environment bootstrap and presets

#include "telemetry/config.hpp"
#include "telemetry/utils.hpp"
#include <regex>
#include <sstream>
#include <cstdlib>
#include <cstring>

namespace telemetry {

std::vector<std::string> default_redact_keys() {
    return {"password", "token", "secret", "key", "apikey", "api_key",
            "authorization", "auth", "credential", "credentials"};
}

// Config implementation
Config::Config(const std::string& service_name)
    : service_name_(service_name), redact_keys_(default_redact_keys()) {}

bool Config::has_remote_backend() const noexcept {
    return api_key_.has_value() && !api_key_->empty() && !delivery_.endpoint.empty();
}

Config& Config::set_api_key(const std::string& api_key) {
    if (api_key.empty()) {
        api_key_.reset();
    } else {
        api_key_ = api_key;
    }
    return *this;
}

Config& Config::set_project_id(const std::string& project_id) {
    if (project_id.empty()) {
        project_id_.reset();
    } else {
        project_id_ = project_id;
    }
    return *this;
}

Config& Config::set_environment(const std::string& environment) {
    environment_ = environment;
    return *this;
}

Config& Config::set_service_version(const std::string& version) {
    service_version_ = version;
    return *this;
}

Config& Config::set_min_log_level(LogLevel level) {
    min_log_level_ = level;
    return *this;
}

Config& Config::set_sample_rate(double rate) {
    sample_rate_ = rate;
    return *this;
}

Config& Config::set_enable_metadata(bool enable) {
    enable_metadata_ = enable;
    return *this;
}

Config& Config::set_redact_keys(std::vector<std::string> keys) {
    redact_keys_ = std::move(keys);
    return *this;
}

Config& Config::set_endpoint(const std::string& endpoint) {
    delivery_.endpoint = endpoint;
    return *this;
}

Config& Config::set_batch_size(size_t size) {
    batch_.batch_size = size;
    return *this;
}

Config& Config::set_flush_interval(std::chrono::milliseconds interval) {
    batch_.flush_interval = interval;
    return *this;
}

Config& Config::set_max_queue_size(size_t size) {
    batch_.max_queue_size = size;
    return *this;
}

Config& Config::set_max_in_flight(size_t count) {
    batch_.max_in_flight = count;
    return *this;
}

Config& Config::set_drain_timeout(std::chrono::milliseconds timeout) {
    batch_.drain_timeout = timeout;
    return *this;
}

Config& Config::set_max_retries(int retries) {
    delivery_.max_retries = retries;
    return *this;
}

Config& Config::set_retry_backoff(std::chrono::milliseconds base_delay, double multiplier,
                                  std::chrono::milliseconds max_delay) {
    delivery_.retry_base_delay = base_delay;
    delivery_.backoff_multiplier = multiplier;
    delivery_.max_retry_delay = max_delay;
    return *this;
}

Config& Config::set_connect_timeout(std::chrono::milliseconds timeout) {
    delivery_.connect_timeout = timeout;
    return *this;
}

Config& Config::set_send_timeout(std::chrono::milliseconds timeout) {
    delivery_.send_timeout = timeout;
    return *this;
}

Config& Config::set_retry_buffer_size(size_t batches) {
    delivery_.retry_buffer_size = batches;
    return *this;
}

Config& Config::set_failure_threshold(int threshold) {
    delivery_.failure_threshold = threshold;
    return *this;
}

Config& Config::set_recovery_timeout(std::chrono::milliseconds timeout) {
    delivery_.recovery_timeout = timeout;
    return *this;
}

Config& Config::set_fallback_after(std::chrono::milliseconds after) {
    fallback_.fallback_after = after;
    return *this;
}

Config& Config::set_fallback_capacity(size_t capacity) {
    fallback_.capacity = capacity;
    return *this;
}

Config& Config::set_fallback_echo(bool echo) {
    fallback_.echo_to_console = echo;
    return *this;
}

Config& Config::set_system_log_level(SystemLogLevel level) {
    logging_.level = level;
    return *this;
}

Config& Config::set_log_to_file(const std::string& path) {
    logging_.log_to_file = true;
    logging_.log_file_path = path;
    return *this;
}

void Config::validate() const {
    std::vector<std::string> errors = validation_errors();
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Configuration validation failed:\n";
        for (const auto& error : errors) {
            oss << "  - " << error << "\n";
        }
        throw ConfigError(ErrorCode::INVALID_CONFIG, "config", oss.str());
    }
}

bool Config::is_valid() const noexcept {
    try {
        return validation_errors().empty();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> Config::validation_errors() const {
    std::vector<std::string> errors;

    try {
        validate_identity();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_sampling();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_batch_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_delivery_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    return errors;
}

void Config::validate_identity() const {
    if (Utils::trim(service_name_).empty() || service_name_.length() > 255) {
        throw Errors::invalid_service_name(service_name_);
    }
}

void Config::validate_sampling() const {
    if (!(sample_rate_ >= 0.0 && sample_rate_ <= 1.0)) {
        throw Errors::invalid_sample_rate(sample_rate_);
    }
}

void Config::validate_batch_config() const {
    if (batch_.batch_size == 0 || batch_.batch_size > 10000) {
        throw Errors::invalid_batch_size(batch_.batch_size);
    }

    if (batch_.flush_interval.count() <= 0) {
        throw Errors::invalid_flush_interval(batch_.flush_interval);
    }

    if (batch_.max_queue_size < batch_.batch_size || batch_.max_queue_size > 1000000) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "max_queue_size",
            "Max queue size must be between batch_size and 1,000,000");
    }

    if (batch_.max_in_flight == 0 || batch_.max_in_flight > 4) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "max_in_flight",
            "Max in-flight deliveries must be between 1 and 4");
    }

    if (batch_.drain_timeout.count() < 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "drain_timeout",
            "Drain timeout must not be negative");
    }
}

void Config::validate_delivery_config() const {
    if (api_key_) {
        static const std::regex endpoint_regex(R"(^[a-zA-Z0-9.-]+:\d+$)");
        if (!std::regex_match(delivery_.endpoint, endpoint_regex) ||
            Utils::parse_endpoint(delivery_.endpoint).second == 0) {
            throw Errors::invalid_endpoint(delivery_.endpoint);
        }
    }

    if (delivery_.max_retries < 0 || delivery_.max_retries > 10) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "max_retries",
            "Max retries must be between 0 and 10");
    }
    if (delivery_.backoff_multiplier < 1.0 || delivery_.backoff_multiplier > 10.0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "backoff_multiplier",
            "Backoff multiplier must be between 1.0 and 10.0");
    }
    if (delivery_.retry_base_delay.count() < 0 || delivery_.max_retry_delay < delivery_.retry_base_delay) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "retry_base_delay",
            "Retry delays must be non-negative and base must not exceed max");
    }
    if (delivery_.failure_threshold < 1) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "failure_threshold",
            "Failure threshold must be at least 1");
    }
    if (delivery_.recovery_timeout.count() <= 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "recovery_timeout",
            "Recovery timeout must be positive");
    }
    if (delivery_.send_timeout.count() <= 0 || delivery_.connect_timeout.count() <= 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "send_timeout",
            "Transport timeouts must be positive");
    }
}

// ConfigBuilder implementation
ConfigBuilder::ConfigBuilder(const std::string& service_name) : config_(service_name) {}

ConfigBuilder& ConfigBuilder::service(const std::string& environment, const std::string& version) {
    config_.environment_ = environment;
    config_.service_version_ = version;
    return *this;
}

ConfigBuilder& ConfigBuilder::environment(const std::string& environment) {
    config_.environment_ = environment;
    return *this;
}

ConfigBuilder& ConfigBuilder::credentials(const std::string& api_key, const std::string& project_id) {
    config_.set_api_key(api_key);
    config_.set_project_id(project_id);
    return *this;
}

ConfigBuilder& ConfigBuilder::endpoint(const std::string& endpoint) {
    config_.delivery_.endpoint = endpoint;
    return *this;
}

ConfigBuilder& ConfigBuilder::timeouts(std::chrono::milliseconds connect, std::chrono::milliseconds send) {
    config_.delivery_.connect_timeout = connect;
    config_.delivery_.send_timeout = send;
    return *this;
}

ConfigBuilder& ConfigBuilder::batching(size_t batch_size, std::chrono::milliseconds flush_interval) {
    config_.batch_.batch_size = batch_size;
    config_.batch_.flush_interval = flush_interval;
    return *this;
}

ConfigBuilder& ConfigBuilder::queue_limits(size_t max_queue_size, size_t max_in_flight) {
    config_.batch_.max_queue_size = max_queue_size;
    config_.batch_.max_in_flight = max_in_flight;
    return *this;
}

ConfigBuilder& ConfigBuilder::retries(int max_retries, std::chrono::milliseconds base_delay,
                                      double backoff_multiplier) {
    config_.delivery_.max_retries = max_retries;
    config_.delivery_.retry_base_delay = base_delay;
    config_.delivery_.backoff_multiplier = backoff_multiplier;
    if (config_.delivery_.max_retry_delay < base_delay) {
        config_.delivery_.max_retry_delay = base_delay;
    }
    return *this;
}

ConfigBuilder& ConfigBuilder::circuit(int failure_threshold, std::chrono::milliseconds recovery_timeout) {
    config_.delivery_.failure_threshold = failure_threshold;
    config_.delivery_.recovery_timeout = recovery_timeout;
    return *this;
}

ConfigBuilder& ConfigBuilder::fallback(std::chrono::milliseconds after, size_t capacity, bool echo) {
    config_.fallback_.fallback_after = after;
    config_.fallback_.capacity = capacity;
    config_.fallback_.echo_to_console = echo;
    return *this;
}

ConfigBuilder& ConfigBuilder::sampling(double sample_rate, LogLevel min_level) {
    config_.sample_rate_ = sample_rate;
    config_.min_log_level_ = min_level;
    return *this;
}

ConfigBuilder& ConfigBuilder::metadata(bool enable) {
    config_.enable_metadata_ = enable;
    return *this;
}

ConfigBuilder& ConfigBuilder::redact(std::vector<std::string> keys) {
    config_.redact_keys_ = std::move(keys);
    return *this;
}

ConfigBuilder& ConfigBuilder::drain_timeout(std::chrono::milliseconds timeout) {
    config_.batch_.drain_timeout = timeout;
    return *this;
}

ConfigBuilder& ConfigBuilder::system_logging(SystemLogLevel level, bool console) {
    config_.logging_.level = level;
    config_.logging_.log_to_console = console;
    return *this;
}

ConfigBuilder& ConfigBuilder::file_logging(const std::string& path, size_t max_size, int max_files) {
    config_.logging_.log_to_file = true;
    config_.logging_.log_file_path = path;
    config_.logging_.max_log_file_size = max_size;
    config_.logging_.max_log_files = max_files;
    return *this;
}

Config ConfigBuilder::build() const {
    Config config = config_;
    config.validate();
    return config;
}

// EnvConfig implementation
Config EnvConfig::from_environment(const std::string& default_service_name) {
    ConfigBuilder builder(get_service_name().value_or(default_service_name));

    if (auto token = get_write_token()) {
        builder.credentials(*token, get_project_id().value_or(""));
    }

    if (auto environment = get_environment()) {
        builder.environment(*environment);
    }

    if (auto endpoint = get_endpoint()) {
        builder.endpoint(*endpoint);
    }

    Config defaults(default_service_name);
    auto batch_size = get_batch_size().value_or(defaults.batch().batch_size);
    auto flush_interval = get_flush_interval().value_or(defaults.batch().flush_interval);
    builder.batching(batch_size, flush_interval);

    auto min_level = get_min_level().value_or(defaults.min_log_level());
    builder.sampling(get_sample_rate().value_or(defaults.sample_rate()), min_level);

    if (get_debug().value_or(false)) {
        builder.system_logging(SystemLogLevel::DEBUG);
    }

    if (auto extra = get_redact_keys()) {
        auto keys = default_redact_keys();
        keys.insert(keys.end(), extra->begin(), extra->end());
        builder.redact(std::move(keys));
    }

    return builder.build();
}

std::optional<std::vector<std::string>> EnvConfig::get_redact_keys() {
    auto value = get_env("TELEMETRY_REDACT_KEYS");
    if (!value) {
        return std::nullopt;
    }
    std::vector<std::string> keys;
    for (const auto& key : Utils::split(*value, ',')) {
        if (!key.empty()) {
            keys.push_back(Utils::to_lower(key));
        }
    }
    if (keys.empty()) {
        return std::nullopt;
    }
    return keys;
}

std::optional<std::string> EnvConfig::get_write_token() {
    return get_env("TELEMETRY_WRITE_TOKEN");
}

std::optional<std::string> EnvConfig::get_project_id() {
    return get_env("TELEMETRY_PROJECT_ID");
}

std::optional<std::string> EnvConfig::get_service_name() {
    return get_env("TELEMETRY_SERVICE_NAME");
}

std::optional<std::string> EnvConfig::get_environment() {
    return get_env("TELEMETRY_ENVIRONMENT");
}

std::optional<std::string> EnvConfig::get_endpoint() {
    return get_env("TELEMETRY_ENDPOINT");
}

std::optional<LogLevel> EnvConfig::get_min_level() {
    if (auto level = get_env("TELEMETRY_MIN_LEVEL")) {
        return Utils::string_to_log_level(*level);
    }
    return std::nullopt;
}

std::optional<double> EnvConfig::get_sample_rate() {
    if (auto str = get_env("TELEMETRY_SAMPLE_RATE")) {
        try {
            return std::stod(*str);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<size_t> EnvConfig::get_batch_size() {
    if (auto value = get_env_int("TELEMETRY_BATCH_SIZE")) {
        if (*value >= 0) {
            return static_cast<size_t>(*value);
        }
    }
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> EnvConfig::get_flush_interval() {
    if (auto ms = get_env_int("TELEMETRY_FLUSH_INTERVAL_MS")) {
        return std::chrono::milliseconds(*ms);
    }
    return std::nullopt;
}

std::optional<bool> EnvConfig::get_debug() {
    return get_env_bool("TELEMETRY_DEBUG");
}

std::optional<std::string> EnvConfig::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && strlen(value) > 0) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<long long> EnvConfig::get_env_int(const std::string& name) {
    if (auto str = get_env(name)) {
        try {
            return std::stoll(*str);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> EnvConfig::get_env_bool(const std::string& name) {
    if (auto str = get_env(name)) {
        std::string lower = Utils::to_lower(*str);
        return (lower == "true" || lower == "1" || lower == "yes" || lower == "on");
    }
    return std::nullopt;
}

} // namespace telemetry
