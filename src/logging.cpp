// src/logging.cpp
// Diagnostics logger construction on top of spdlog sinks

#include "telemetry/logging.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace telemetry {
namespace Logging {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& current_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> build_logger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;

    if (config.log_to_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (config.log_to_file && !config.log_file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file_path, config.max_log_file_size,
                static_cast<size_t>(config.max_log_files)));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async_logging) {
        if (!spdlog::thread_pool()) {
            spdlog::init_thread_pool(8192, 1);
        }
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(kPattern);
    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::err);
    if (!file_error.empty()) {
        logger->warn("Cannot open diagnostics log file {}: {}", config.log_file_path, file_error);
    }
    return logger;
}

} // namespace

spdlog::level::level_enum to_spdlog_level(SystemLogLevel level) {
    switch (level) {
        case SystemLogLevel::NONE: return spdlog::level::off;
        case SystemLogLevel::ERROR: return spdlog::level::err;
        case SystemLogLevel::WARN: return spdlog::level::warn;
        case SystemLogLevel::INFO: return spdlog::level::info;
        case SystemLogLevel::DEBUG: return spdlog::level::debug;
        case SystemLogLevel::TRACE: return spdlog::level::trace;
        default: return spdlog::level::warn;
    }
}

void configure(const LoggingConfig& config) {
    auto logger = build_logger(config);
    std::lock_guard<std::mutex> lock(logger_mutex());
    current_logger() = std::move(logger);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto& logger = current_logger();
    if (!logger) {
        logger = build_logger(LoggingConfig{});
    }
    return logger;
}

} // namespace Logging
} // namespace telemetry
