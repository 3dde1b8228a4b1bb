// tracing_example.cpp
// Distributed Tracing Example
// Nested spans, scoped spans and trace propagation between two services

#include <iostream>
#include <stdexcept>
#include "telemetry/telemetry.hpp"

using namespace telemetry;

namespace {

// Stand-in for a downstream service receiving the propagated headers
void handle_inventory_request(Monitor& monitor, const TracePropagation::Headers& headers) {
    auto parent = monitor.extract_context(headers);
    auto span = monitor.start_span("inventory.reserve", Components::DATABASE, parent,
                                   {{"sku", std::string("SKU-1042")}});
    monitor.info("Reserving stock", Components::DATABASE, EventTypes::REQUEST, {{"quantity", int64_t(2)}});
    monitor.end_span(span, SpanStatus::OK, {{"reserved", true}});
}

double score_order(double total) {
    if (total <= 0.0) {
        throw std::invalid_argument("order total must be positive");
    }
    return total > 500.0 ? 0.8 : 0.1;
}

} // namespace

int main() {
    std::cout << "🚀 Telemetry " << version() << " - Distributed Tracing\n" << std::endl;

    try {
        Config config = Presets::development("order-service");
        Monitor monitor(config);

        // Root span for the incoming request
        auto request = monitor.start_span("POST /orders", Components::API_GATEWAY, std::nullopt,
                                          {{"http.method", std::string("POST")}});
        std::cout << "🔗 Trace " << request->trace_id() << std::endl;

        {
            // Child span picked up from the active span stack
            ScopedSpan validate(monitor, "validate_order", Components::AGENT_CORE);
            validate.set_attribute("items", int64_t(3));
            monitor.info("Order validated", Components::AGENT_CORE, EventTypes::VALIDATION);
        }

        // Outbound call: carry the trace to the next service
        TracePropagation::Headers headers;
        monitor.inject_context(headers);
        for (const auto& header : headers) {
            std::cout << "   " << header.first << ": " << header.second << std::endl;
        }
        handle_inventory_request(monitor, headers);

        double risk = traced(monitor, "fraud.score", Components::MODEL_SERVICE, []() {
            return score_order(129.90);
        });
        std::cout << "🛡️  Fraud risk " << risk << std::endl;

        try {
            traced(monitor, "fraud.score", Components::MODEL_SERVICE, []() {
                return score_order(0.0);
            });
        } catch (const std::invalid_argument& e) {
            monitor.error("Scoring rejected order", Components::MODEL_SERVICE, EventTypes::EXCEPTION,
                          {{"reason", std::string(e.what())}});
        }

        monitor.end_span(request, SpanStatus::OK, {{"http.status_code", int64_t(201)}});
        monitor.flush();

        auto stats = monitor.stats();
        std::cout << "✅ Spans started: " << stats.spans.spans_started
                  << ", ended: " << stats.spans.spans_ended
                  << ", local events: " << monitor.local_sink().size() << std::endl;

        monitor.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
