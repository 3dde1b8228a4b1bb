// src/alerts.cpp
// Alert registry implementation

#include "telemetry/alerts.hpp"
#include "telemetry/errors.hpp"
#include "telemetry/utils.hpp"
#include <algorithm>
#include <iterator>

namespace telemetry {

std::string alert_status_to_string(AlertStatus status) {
    switch (status) {
        case AlertStatus::ACTIVE: return "active";
        case AlertStatus::ACKNOWLEDGED: return "acknowledged";
        case AlertStatus::RESOLVED: return "resolved";
        default: return "unknown";
    }
}

AlertRegistry::AlertRegistry(size_t max_instances)
    : max_instances_(std::max<size_t>(max_instances, 1)) {}

AlertConfig AlertRegistry::create(AlertConfig config) {
    if (Utils::trim(config.name).empty()) {
        throw Errors::invalid_alert("alert name cannot be empty");
    }
    if (config.cooldown.count() < 0) {
        throw Errors::invalid_alert("cooldown cannot be negative");
    }
    if (config.alert_id.empty()) {
        config.alert_id = Utils::generate_event_id();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (alerts_.count(config.alert_id) > 0) {
        throw Errors::invalid_alert("alert id '" + config.alert_id + "' already exists");
    }
    alerts_[config.alert_id] = config;
    return config;
}

std::optional<AlertConfig> AlertRegistry::update(const std::string& alert_id, const AlertUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end()) {
        return std::nullopt;
    }

    AlertConfig& config = it->second;
    if (update.name) {
        if (Utils::trim(*update.name).empty()) {
            throw Errors::invalid_alert("alert name cannot be empty");
        }
        config.name = *update.name;
    }
    if (update.description) config.description = *update.description;
    if (update.component) config.component = *update.component;
    if (update.condition) config.condition = *update.condition;
    if (update.severity) config.severity = *update.severity;
    if (update.notification_channels) config.notification_channels = *update.notification_channels;
    if (update.cooldown) config.cooldown = *update.cooldown;
    if (update.enabled) config.enabled = *update.enabled;
    if (update.tags) config.tags = *update.tags;
    return config;
}

bool AlertRegistry::remove(const std::string& alert_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_triggered_.erase(alert_id);
    return alerts_.erase(alert_id) > 0;
}

std::optional<AlertConfig> AlertRegistry::get(const std::string& alert_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AlertConfig> AlertRegistry::list(const std::optional<std::string>& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AlertConfig> result;
    for (const auto& pair : alerts_) {
        if (!component || pair.second.component == *component) {
            result.push_back(pair.second);
        }
    }
    return result;
}

std::optional<AlertInstance> AlertRegistry::trigger(const std::string& alert_id, double value,
                                                    const std::string& message, Timestamp now,
                                                    const Properties& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end() || !it->second.enabled) {
        return std::nullopt;
    }

    const AlertConfig& config = it->second;
    auto last = last_triggered_.find(alert_id);
    if (last != last_triggered_.end()) {
        auto cooldown_ms = static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::milliseconds>(config.cooldown).count());
        if (now < last->second + cooldown_ms) {
            return std::nullopt;
        }
    }

    AlertInstance instance;
    instance.instance_id = Utils::generate_event_id();
    instance.alert_id = alert_id;
    instance.value = value;
    instance.message = message;
    instance.component = config.component;
    instance.severity = config.severity;
    instance.metadata = metadata;
    instance.triggered_at = now;

    last_triggered_[alert_id] = now;
    instances_.push_back(instance);
    evict_locked();
    return instance;
}

void AlertRegistry::evict_locked() {
    while (instances_.size() > max_instances_) {
        auto victim = std::find_if(instances_.begin(), instances_.end(), [](const AlertInstance& instance) {
            return instance.status == AlertStatus::RESOLVED;
        });
        // Nothing resolved: history is full of open alerts, drop the oldest
        if (victim == instances_.end()) {
            victim = instances_.begin();
        }
        instances_.erase(victim);
    }
}

std::vector<AlertInstance> AlertRegistry::instances(const std::optional<std::string>& alert_id,
                                                    const std::optional<AlertStatus>& status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AlertInstance> result;
    std::copy_if(instances_.begin(), instances_.end(), std::back_inserter(result),
                 [&](const AlertInstance& instance) {
                     return (!alert_id || instance.alert_id == *alert_id) &&
                            (!status || instance.status == *status);
                 });
    return result;
}

std::optional<AlertInstance> AlertRegistry::acknowledge(const std::string& instance_id,
                                                        const std::string& acknowledged_by,
                                                        Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& instance : instances_) {
        if (instance.instance_id != instance_id) continue;
        if (instance.status != AlertStatus::ACTIVE) {
            return std::nullopt;
        }
        instance.status = AlertStatus::ACKNOWLEDGED;
        instance.acknowledged_by = acknowledged_by;
        instance.acknowledged_at = now;
        return instance;
    }
    return std::nullopt;
}

std::optional<AlertInstance> AlertRegistry::resolve(const std::string& instance_id,
                                                    const std::optional<std::string>& resolution_message,
                                                    Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& instance : instances_) {
        if (instance.instance_id != instance_id) continue;
        if (instance.status == AlertStatus::RESOLVED) {
            return std::nullopt;
        }
        instance.status = AlertStatus::RESOLVED;
        instance.resolved_at = now;
        instance.resolution_message = resolution_message;
        return instance;
    }
    return std::nullopt;
}

} // namespace telemetry
