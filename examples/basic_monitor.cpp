// basic_monitor.cpp
// Basic Monitoring Example
// Structured logging, metrics, health reporting and alerts with the telemetry library

#include <iostream>
#include <thread>
#include "telemetry/telemetry.hpp"

using namespace telemetry;

int main() {
    std::cout << "🚀 Telemetry " << version() << " - Basic Monitoring\n" << std::endl;

    try {
        // TELEMETRY_WRITE_TOKEN and TELEMETRY_ENDPOINT select a remote collector;
        // without them everything lands in the local sink
        Config config = EnvConfig::from_environment("checkout-service");
        config.set_fallback_echo(true);

        MonitorHandle monitor = init(config);
        std::cout << "✅ Monitor started ("
                  << (monitor->telemetry_health().remote_backend ? "remote" : "local") << " delivery)" << std::endl;

        // Structured events
        monitor->info("Service starting", Components::SYSTEM, EventTypes::LIFECYCLE,
                      {{"version", std::string("2.3.1")}, {"workers", int64_t(4)}});
        monitor->warning("Cache warm-up slow", Components::INFRASTRUCTURE, EventTypes::SYSTEM,
                         {{"elapsed_ms", 1840.0}}, {"startup"});

        // Sensitive values never leave the process
        monitor->info("Payment provider configured", Components::API_GATEWAY, EventTypes::VALIDATION,
                      {{"provider", std::string("acme-pay")}, {"api_key", std::string("sk_live_123")}});

        // Metrics, timed with a performance tracker
        {
            PerformanceTracker tracker(*monitor, "load_catalog", Components::DATABASE);
            std::this_thread::sleep_for(std::chrono::milliseconds(25));
            tracker.add_data("products", int64_t(340));
        }
        monitor->record_model_validation("CartRequest", false, {{"field", std::string("quantity")}},
                                         "must be at least 1", Components::API_GATEWAY);
        monitor->record_metric("active_sessions", 128, std::string("sessions"), {{"region", "eu-west"}});
        monitor->record_api_call("/v1/cart", "POST", 201, 42.0);
        monitor->record_api_call("/v1/payment", "POST", 502, 1200.0, Components::API_GATEWAY, "upstream reset");

        // Health
        HealthReport report;
        report.service_id = "checkout-1";
        report.service_name = "checkout-service";
        report.status = HealthStatus::HEALTHY;
        report.message = "all checks passing";
        report.version = "2.3.1";
        report.resource_usage = ResourceMonitor::current_usage();
        report.checks = {{"database", true}, {"payment_provider", true}};
        monitor->record_health_status(report);

        // Alerts
        AlertConfig alert;
        alert.name = "Payment errors";
        alert.component = Components::API_GATEWAY;
        alert.condition = "5xx rate > 2%";
        alert.severity = LogLevel::ERROR;
        alert.cooldown = std::chrono::seconds(60);
        auto created = monitor->create_alert(alert);

        if (auto instance = monitor->trigger_alert(created.alert_id, 0.031, "5xx rate at 3.1%")) {
            monitor->acknowledge_alert(instance->instance_id, "oncall@example.com");
            monitor->resolve_alert(instance->instance_id, std::string("provider failover complete"));
        }

        monitor->flush();

        for (const auto& metric : monitor->get_metrics()) {
            std::cout << "📊 " << metric.definition.name << ": last=" << metric.last_value
                      << " avg=" << metric.average() << " (" << metric.count << " samples)" << std::endl;
        }

        auto health = monitor->telemetry_health();
        auto stats = monitor->stats();
        std::cout << "📈 Events logged: " << stats.events_logged
                  << ", redacted values: " << stats.values_redacted
                  << ", queue depth: " << health.queue_depth
                  << ", telemetry health: " << Utils::health_status_to_string(health.status) << std::endl;

        shutdown(monitor);
        std::cout << "✅ Monitor shut down" << std::endl;

    } catch (const Error& e) {
        std::cerr << "❌ " << e.category() << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
