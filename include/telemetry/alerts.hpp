// include/telemetry/alerts.hpp
// Purpose: In-memory alert definitions and their triggered instances

#pragma once

#include "types.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace telemetry {

enum class AlertStatus : uint8_t {
    ACTIVE = 0,
    ACKNOWLEDGED = 1,
    RESOLVED = 2
};

std::string alert_status_to_string(AlertStatus status);

struct AlertConfig {
    std::string alert_id;                     // Assigned on create when empty
    std::string name;
    std::string description;
    std::string component;
    std::string condition;
    LogLevel severity = LogLevel::WARNING;
    std::vector<std::string> notification_channels;
    std::chrono::seconds cooldown{300};
    bool enabled = true;
    std::vector<std::string> tags;
};

// Fields left empty are not changed
struct AlertUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> component;
    std::optional<std::string> condition;
    std::optional<LogLevel> severity;
    std::optional<std::vector<std::string>> notification_channels;
    std::optional<std::chrono::seconds> cooldown;
    std::optional<bool> enabled;
    std::optional<std::vector<std::string>> tags;
};

struct AlertInstance {
    std::string instance_id;
    std::string alert_id;
    AlertStatus status = AlertStatus::ACTIVE;
    double value = 0.0;
    std::string message;
    std::string component;
    LogLevel severity = LogLevel::WARNING;
    Properties metadata;
    Timestamp triggered_at = 0;
    std::optional<std::string> acknowledged_by;
    std::optional<Timestamp> acknowledged_at;
    std::optional<Timestamp> resolved_at;
    std::optional<std::string> resolution_message;
};

class AlertRegistry {
public:
    static constexpr size_t DEFAULT_MAX_INSTANCES = 1000;

    // Past max_instances the oldest resolved instance is evicted, or the
    // oldest instance of any status when none is resolved
    explicit AlertRegistry(size_t max_instances = DEFAULT_MAX_INSTANCES);

    AlertRegistry(const AlertRegistry&) = delete;
    AlertRegistry& operator=(const AlertRegistry&) = delete;

    // Throws ValidationError for an empty name or an id already in use
    AlertConfig create(AlertConfig config);
    std::optional<AlertConfig> update(const std::string& alert_id, const AlertUpdate& update);
    bool remove(const std::string& alert_id);

    std::optional<AlertConfig> get(const std::string& alert_id) const;
    std::vector<AlertConfig> list(const std::optional<std::string>& component = std::nullopt) const;

    // nullopt when the alert is unknown, disabled or still cooling down
    std::optional<AlertInstance> trigger(const std::string& alert_id, double value,
                                         const std::string& message, Timestamp now,
                                         const Properties& metadata = {});

    std::vector<AlertInstance> instances(const std::optional<std::string>& alert_id = std::nullopt,
                                         const std::optional<AlertStatus>& status = std::nullopt) const;

    // Only ACTIVE instances can be acknowledged
    std::optional<AlertInstance> acknowledge(const std::string& instance_id,
                                             const std::string& acknowledged_by, Timestamp now);
    // ACTIVE and ACKNOWLEDGED instances can be resolved
    std::optional<AlertInstance> resolve(const std::string& instance_id,
                                         const std::optional<std::string>& resolution_message,
                                         Timestamp now);

    size_t max_instances() const { return max_instances_; }

private:
    void evict_locked();

    const size_t max_instances_;
    mutable std::mutex mutex_;
    std::map<std::string, AlertConfig> alerts_;
    std::map<std::string, Timestamp> last_triggered_;
    std::vector<AlertInstance> instances_;
};

} // namespace telemetry
