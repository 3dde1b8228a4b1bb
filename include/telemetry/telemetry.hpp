// include/telemetry/telemetry.hpp
// Purpose: Main header file for the telemetry client library
// This is the primary include for application code

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "trace.hpp"
#include "sink.hpp"
#include "local_sink.hpp"
#include "network.hpp"
#include "metrics.hpp"
#include "alerts.hpp"
#include "monitor.hpp"

namespace telemetry {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string version() {
    return VERSION;
}

} // namespace telemetry
