// src/codec.cpp
// JSON encoding and decoding of events, metric samples and health reports

#include "telemetry/codec.hpp"
#include "telemetry/batch.hpp"
#include "telemetry/errors.hpp"
#include "telemetry/utils.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>

namespace telemetry {
namespace Codec {

namespace {

using json = nlohmann::json;

json properties_to_json(const Properties& properties) {
    json json_obj = json::object();

    for (const auto& entry : properties) {
        const std::string& key = entry.first;
        std::visit([&json_obj, &key](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                json_obj[key] = nullptr;
            } else {
                json_obj[key] = v;
            }
        }, entry.second);
    }

    return json_obj;
}

Properties properties_from_json(const json& json_obj) {
    Properties properties;
    if (!json_obj.is_object()) {
        throw Errors::malformed_data("data must be an object");
    }

    for (auto& [key, value] : json_obj.items()) {
        if (value.is_string()) {
            properties[key] = value.get<std::string>();
        } else if (value.is_number_integer()) {
            properties[key] = value.get<int64_t>();
        } else if (value.is_number_float()) {
            properties[key] = value.get<double>();
        } else if (value.is_boolean()) {
            properties[key] = value.get<bool>();
        } else if (value.is_null()) {
            properties[key] = nullptr;
        } else {
            // Nested values are flattened to their JSON text
            properties[key] = value.dump();
        }
    }

    return properties;
}

std::string iso(Timestamp timestamp) {
    return Utils::timestamp_to_iso8601(timestamp);
}

Timestamp parse_timestamp(const json& value) {
    if (value.is_number_unsigned() || value.is_number_integer()) {
        return value.get<Timestamp>();
    }
    if (!value.is_string()) {
        throw Errors::malformed_data("timestamp must be an ISO-8601 string");
    }
    auto parsed = Utils::iso8601_to_timestamp(value.get<std::string>());
    if (!parsed) {
        throw Errors::malformed_data("unparseable timestamp '" + value.get<std::string>() + "'");
    }
    return *parsed;
}

json event_to_json(const Event& event) {
    json j;
    j["event_id"] = event.event_id;
    j["timestamp"] = iso(event.timestamp);
    j["level"] = Utils::log_level_to_string(event.level);
    j["component"] = event.component;
    j["event_type"] = event.event_type;
    j["message"] = event.message;
    j["data"] = properties_to_json(event.data);
    j["tags"] = event.tags;
    if (event.trace_id) j["trace_id"] = *event.trace_id;
    if (event.span_id) j["span_id"] = *event.span_id;
    if (event.parent_span_id) j["parent_span_id"] = *event.parent_span_id;
    return j;
}

Event event_from_json(const json& j) {
    Event event;
    event.event_id = j.at("event_id").get<std::string>();
    event.timestamp = parse_timestamp(j.at("timestamp"));

    auto level = Utils::string_to_log_level(j.at("level").get<std::string>());
    if (!level) {
        throw Errors::malformed_data("unknown level '" + j.at("level").get<std::string>() + "'");
    }
    event.level = *level;

    event.component = j.at("component").get<std::string>();
    event.event_type = j.at("event_type").get<std::string>();
    event.message = j.at("message").get<std::string>();
    if (j.contains("data")) {
        event.data = properties_from_json(j.at("data"));
    }
    if (j.contains("tags")) {
        event.tags = j.at("tags").get<Tags>();
    }
    if (j.contains("trace_id") && !j.at("trace_id").is_null()) {
        event.trace_id = j.at("trace_id").get<std::string>();
    }
    if (j.contains("span_id") && !j.at("span_id").is_null()) {
        event.span_id = j.at("span_id").get<std::string>();
    }
    if (j.contains("parent_span_id") && !j.at("parent_span_id").is_null()) {
        event.parent_span_id = j.at("parent_span_id").get<std::string>();
    }
    return event;
}

json metric_to_json(const MetricSample& sample) {
    json j;
    j["kind"] = KIND_METRIC;
    j["name"] = sample.name;
    j["value"] = sample.value;
    if (sample.unit) j["unit"] = *sample.unit;
    j["tags"] = sample.tags;
    j["timestamp"] = iso(sample.timestamp);
    return j;
}

MetricSample metric_from_json(const json& j) {
    MetricSample sample;
    sample.name = j.at("name").get<std::string>();
    sample.value = j.at("value").get<double>();
    if (j.contains("unit") && !j.at("unit").is_null()) {
        sample.unit = j.at("unit").get<std::string>();
    }
    if (j.contains("tags")) {
        sample.tags = j.at("tags").get<MetricTags>();
    }
    sample.timestamp = parse_timestamp(j.at("timestamp"));
    return sample;
}

json health_to_json(const HealthReport& report) {
    const auto& usage = report.resource_usage;
    json j;
    j["kind"] = KIND_HEALTH;
    j["service_id"] = report.service_id;
    j["service_name"] = report.service_name;
    j["status"] = Utils::health_status_to_string(report.status);
    j["message"] = report.message;
    j["version"] = report.version;
    j["uptime_seconds"] = report.uptime_seconds;
    j["resource_usage"] = {
        {"cpu_percent", usage.cpu_percent},
        {"memory_percent", usage.memory_percent},
        {"memory_rss_bytes", usage.memory_rss_bytes},
        {"disk_io_read_bytes", usage.disk_io_read_bytes},
        {"disk_io_write_bytes", usage.disk_io_write_bytes},
        {"network_recv_bytes", usage.network_recv_bytes},
        {"network_sent_bytes", usage.network_sent_bytes},
        {"open_file_descriptors", usage.open_file_descriptors}
    };
    j["checks"] = report.checks;
    j["timestamp"] = iso(report.timestamp);
    return j;
}

HealthReport health_from_json(const json& j) {
    HealthReport report;
    report.service_id = j.at("service_id").get<std::string>();
    report.service_name = j.at("service_name").get<std::string>();

    auto status = Utils::string_to_health_status(j.at("status").get<std::string>());
    if (!status) {
        throw Errors::malformed_data("unknown health status '" + j.at("status").get<std::string>() + "'");
    }
    report.status = *status;

    report.message = j.value("message", "");
    report.version = j.value("version", "");
    report.uptime_seconds = j.value("uptime_seconds", 0.0);

    if (j.contains("resource_usage")) {
        const auto& u = j.at("resource_usage");
        auto& usage = report.resource_usage;
        usage.cpu_percent = u.value("cpu_percent", 0.0);
        usage.memory_percent = u.value("memory_percent", 0.0);
        usage.memory_rss_bytes = u.value("memory_rss_bytes", uint64_t{0});
        usage.disk_io_read_bytes = u.value("disk_io_read_bytes", uint64_t{0});
        usage.disk_io_write_bytes = u.value("disk_io_write_bytes", uint64_t{0});
        usage.network_recv_bytes = u.value("network_recv_bytes", uint64_t{0});
        usage.network_sent_bytes = u.value("network_sent_bytes", uint64_t{0});
        usage.open_file_descriptors = u.value("open_file_descriptors", uint32_t{0});
    }
    if (j.contains("checks")) {
        report.checks = j.at("checks").get<std::map<std::string, bool>>();
    }
    report.timestamp = parse_timestamp(j.at("timestamp"));
    return report;
}

json item_to_json(const TelemetryItem& item) {
    return std::visit([](const auto& value) -> json {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Event>) {
            return event_to_json(value);
        } else if constexpr (std::is_same_v<T, MetricSample>) {
            return metric_to_json(value);
        } else {
            return health_to_json(value);
        }
    }, item);
}

TelemetryItem item_from_json(const json& j) {
    if (!j.is_object()) {
        throw Errors::malformed_data("item must be an object");
    }
    std::string kind = j.value("kind", "");
    if (kind == KIND_METRIC) {
        return metric_from_json(j);
    }
    if (kind == KIND_HEALTH) {
        return health_from_json(j);
    }
    return event_from_json(j);
}

// Invalid UTF-8 in producer strings is replaced rather than failing the whole batch
std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

std::string encode_items(const std::vector<TelemetryItem>& items) {
    try {
        json array = json::array();
        for (const auto& item : items) {
            array.push_back(item_to_json(item));
        }
        return dump(array);
    } catch (const json::exception& e) {
        throw Errors::serialization_failed(e.what());
    }
}

std::string encode_batch(const Batch& batch) {
    return encode_items(batch.items());
}

std::vector<TelemetryItem> decode_batch(const std::string& payload) {
    try {
        json array = json::parse(payload);
        if (!array.is_array()) {
            throw Errors::malformed_data("batch payload must be a JSON array");
        }

        std::vector<TelemetryItem> items;
        items.reserve(array.size());
        for (const auto& entry : array) {
            items.push_back(item_from_json(entry));
        }
        return items;
    } catch (const json::parse_error& e) {
        throw Errors::deserialization_failed(e.what());
    } catch (const json::exception& e) {
        throw Errors::malformed_data(e.what());
    }
}

std::string encode_item(const TelemetryItem& item) {
    try {
        return dump(item_to_json(item));
    } catch (const json::exception& e) {
        throw Errors::serialization_failed(e.what());
    }
}

TelemetryItem decode_item(const std::string& payload) {
    try {
        return item_from_json(json::parse(payload));
    } catch (const json::parse_error& e) {
        throw Errors::deserialization_failed(e.what());
    } catch (const json::exception& e) {
        throw Errors::malformed_data(e.what());
    }
}

} // namespace Codec
} // namespace telemetry
