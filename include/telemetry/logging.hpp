// include/telemetry/logging.hpp
// Purpose: Internal diagnostics logger for the telemetry client itself
// Backed by spdlog; configured from LoggingConfig

#pragma once

#include "config.hpp"
#include <memory>
#include <spdlog/spdlog.h>

namespace telemetry {
namespace Logging {

constexpr const char* LOGGER_NAME = "telemetry";

// Replace the diagnostics logger with one built from config
void configure(const LoggingConfig& config);

// Current diagnostics logger. Falls back to a stderr logger at WARN.
std::shared_ptr<spdlog::logger> logger();

spdlog::level::level_enum to_spdlog_level(SystemLogLevel level);

} // namespace Logging
} // namespace telemetry
