// src/utils.cpp
// Implementation of utility functions for identifiers, time and host information

#include "telemetry/utils.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <random>
#include <cstdio>
#include <ctime>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <sys/utsname.h>
#endif

namespace telemetry {
namespace Utils {

namespace {

const char kHexChars[] = "0123456789abcdef";

std::mt19937_64& id_generator() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

// Random lowercase hex string that is never all zeros
std::string random_hex(size_t length) {
    auto& gen = id_generator();
    std::uniform_int_distribution<int> dis(0, 15);
    std::string result(length, '0');
    bool non_zero = false;
    for (auto& c : result) {
        int v = dis(gen);
        non_zero = non_zero || v != 0;
        c = kHexChars[v];
    }
    if (!non_zero) {
        result[length - 1] = '1';
    }
    return result;
}

} // namespace

// String utilities
std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

bool is_hex_string(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
}

// Network utilities
std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint) {
    size_t colon_pos = endpoint.find_last_of(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        return {"", 0};
    }

    std::string host = endpoint.substr(0, colon_pos);
    std::string port_str = endpoint.substr(colon_pos + 1);

    try {
        unsigned long port = std::stoul(port_str);
        if (port == 0 || port > 65535) {
            return {"", 0};
        }
        return {host, static_cast<uint16_t>(port)};
    } catch (const std::exception&) {
        return {"", 0};
    }
}

std::string get_hostname() {
#ifdef _WIN32
    char hostname[256];
    DWORD size = sizeof(hostname);
    if (GetComputerNameA(hostname, &size)) {
        return std::string(hostname);
    }
    return "unknown-host";
#else
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[255] = '\0';
        return std::string(hostname);
    }
    return "unknown-host";
#endif
}

std::string get_os_info() {
#ifdef _WIN32
    return "Windows";
#else
    struct utsname info;
    if (uname(&info) == 0) {
        return std::string(info.sysname) + " " + std::string(info.release);
    }
    return "Unix";
#endif
}

// Identifier generation
TraceId generate_trace_id() {
    return random_hex(32);
}

SpanId generate_span_id() {
    return random_hex(16);
}

std::string generate_event_id() {
    std::string hex = random_hex(32);
    // Version 4, variant 10xx
    hex[12] = '4';
    hex[16] = kHexChars[8 + (std::uniform_int_distribution<int>(0, 3)(id_generator()))];

    std::string uuid;
    uuid.reserve(36);
    uuid.append(hex, 0, 8).append("-")
        .append(hex, 8, 4).append("-")
        .append(hex, 12, 4).append("-")
        .append(hex, 16, 4).append("-")
        .append(hex, 20, 12);
    return uuid;
}

BatchId generate_batch_id() {
    static thread_local std::uniform_int_distribution<BatchId> dis(1);
    return dis(id_generator());
}

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    auto ms = timestamp_ms % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return ss.str();
}

std::optional<Timestamp> iso8601_to_timestamp(const std::string& iso) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    char zone = '\0';
    int matched = std::sscanf(iso.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d%c",
                              &year, &month, &day, &hour, &minute, &second, &millis, &zone);
    if (matched == 6) {
        millis = 0;
    } else if (matched != 8 || zone != 'Z') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
#ifdef _WIN32
    std::time_t seconds = _mkgmtime(&utc);
#else
    std::time_t seconds = timegm(&utc);
#endif
    if (seconds < 0) {
        return std::nullopt;
    }
    return static_cast<Timestamp>(seconds) * 1000 + static_cast<Timestamp>(millis);
}

// ExponentialBackoff implementation
ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds base_delay,
                                       double multiplier,
                                       std::chrono::milliseconds max_delay)
    : base_delay_(base_delay), multiplier_(multiplier), max_delay_(max_delay),
      attempts_(0), current_delay_(base_delay) {}

std::chrono::milliseconds ExponentialBackoff::next_delay() {
    if (attempts_ == 0) {
        attempts_++;
        return std::min(current_delay_, max_delay_);
    }

    attempts_++;
    current_delay_ = std::chrono::milliseconds(
        static_cast<long long>(current_delay_.count() * multiplier_)
    );

    if (current_delay_ > max_delay_) {
        current_delay_ = max_delay_;
    }

    return current_delay_;
}

void ExponentialBackoff::reset() {
    attempts_ = 0;
    current_delay_ = base_delay_;
}

int ExponentialBackoff::attempt_count() const {
    return attempts_;
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(std::function<void(Duration)> callback)
    : start_time_(Clock::now()), callback_(std::move(callback)) {}

ScopedTimer::~ScopedTimer() {
    if (callback_) {
        callback_(elapsed());
    }
}

ScopedTimer::Duration ScopedTimer::elapsed() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

} // namespace Utils
} // namespace telemetry
