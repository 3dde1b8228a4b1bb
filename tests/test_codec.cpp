// tests/test_codec.cpp
// Tests for the JSON wire codec

#include <gtest/gtest.h>
#include "telemetry/batch.hpp"
#include "telemetry/codec.hpp"
#include "telemetry/errors.hpp"
#include <nlohmann/json.hpp>

using namespace telemetry;

class CodecTest : public ::testing::Test {
protected:
    Event sample_event() {
        Event event;
        event.event_id = "5b0e4f7c-2d0a-4a53-9c9b-0b5ef3c1a001";
        event.timestamp = 1700000000123ULL;
        event.level = LogLevel::WARNING;
        event.component = Components::MODEL_SERVICE;
        event.event_type = EventTypes::RESPONSE;
        event.message = "slow completion";
        event.data = {{"latency_ms", 812.5}, {"tokens", int64_t(1024)}, {"cached", false},
                      {"model", std::string("m-large")}, {"region", nullptr}};
        event.tags = {"inference", "latency"};
        event.trace_id = std::string("0af7651916cd43dd8448eb211c80319c");
        event.span_id = std::string("b7ad6b7169203331");
        event.parent_span_id = std::string("00f067aa0ba902b7");
        return event;
    }

    MetricSample sample_metric() {
        MetricSample sample;
        sample.name = "queue_depth";
        sample.value = 17.0;
        sample.unit = std::string("items");
        sample.tags = {{"queue", "ingest"}};
        sample.timestamp = 1700000000500ULL;
        return sample;
    }

    HealthReport sample_health() {
        HealthReport report;
        report.service_id = "svc-1";
        report.service_name = "orders";
        report.status = HealthStatus::DEGRADED;
        report.message = "database latency high";
        report.version = "1.4.2";
        report.uptime_seconds = 3600.5;
        report.resource_usage.cpu_percent = 72.5;
        report.resource_usage.memory_percent = 40.0;
        report.resource_usage.memory_rss_bytes = 123456789;
        report.resource_usage.open_file_descriptors = 64;
        report.checks = {{"database", false}, {"cache", true}};
        report.timestamp = 1700000000999ULL;
        return report;
    }
};

TEST_F(CodecTest, TestBatchRoundTripPreservesOrderAndFields) {
    Batch batch;
    batch.add_item(sample_event());
    batch.add_item(sample_metric());
    batch.add_item(sample_health());

    std::string payload = Codec::encode_batch(batch);
    auto decoded = Codec::decode_batch(payload);

    ASSERT_EQ(decoded.size(), 3u);
    ASSERT_TRUE(std::holds_alternative<Event>(decoded[0]));
    ASSERT_TRUE(std::holds_alternative<MetricSample>(decoded[1]));
    ASSERT_TRUE(std::holds_alternative<HealthReport>(decoded[2]));

    EXPECT_EQ(std::get<Event>(decoded[0]), sample_event());
    EXPECT_EQ(std::get<MetricSample>(decoded[1]), sample_metric());
    EXPECT_EQ(std::get<HealthReport>(decoded[2]), sample_health());
}

TEST_F(CodecTest, TestEventDocumentShape) {
    auto doc = nlohmann::json::parse(Codec::encode_item(sample_event()));

    EXPECT_FALSE(doc.contains("kind"));
    EXPECT_EQ(doc["timestamp"], "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(doc["level"], "WARNING");
    EXPECT_EQ(doc["data"]["tokens"], 1024);
    EXPECT_TRUE(doc["data"]["region"].is_null());
    EXPECT_EQ(doc["trace_id"], "0af7651916cd43dd8448eb211c80319c");
}

TEST_F(CodecTest, TestKindTags) {
    auto metric = nlohmann::json::parse(Codec::encode_item(sample_metric()));
    EXPECT_EQ(metric["kind"], "metric");
    EXPECT_EQ(metric["unit"], "items");

    auto health = nlohmann::json::parse(Codec::encode_item(sample_health()));
    EXPECT_EQ(health["kind"], "health");
    EXPECT_EQ(health["status"], "degraded");
}

TEST_F(CodecTest, TestOptionalFieldsOmitted) {
    Event event = sample_event();
    event.trace_id.reset();
    event.span_id.reset();
    event.parent_span_id.reset();

    auto doc = nlohmann::json::parse(Codec::encode_item(event));
    EXPECT_FALSE(doc.contains("trace_id"));
    EXPECT_FALSE(doc.contains("parent_span_id"));

    auto decoded = std::get<Event>(Codec::decode_item(doc.dump()));
    EXPECT_FALSE(decoded.trace_id.has_value());
}

TEST_F(CodecTest, TestNestedDataIsFlattened) {
    std::string payload = R"([{"event_id":"e1","timestamp":"2023-11-14T22:13:20.000Z","level":"INFO",
        "component":"system","event_type":"system","message":"m",
        "data":{"nested":{"a":1},"list":[1,2]},"tags":[]}])";

    auto items = Codec::decode_batch(payload);
    ASSERT_EQ(items.size(), 1u);
    const auto& data = std::get<Event>(items[0]).data;
    EXPECT_EQ(std::get<std::string>(data.at("nested")), R"({"a":1})");
    EXPECT_EQ(std::get<std::string>(data.at("list")), "[1,2]");
}

TEST_F(CodecTest, TestIntegerTimestampAccepted) {
    std::string payload = R"([{"kind":"metric","name":"m","value":1.5,"tags":{},"timestamp":1700000000000}])";
    auto items = Codec::decode_batch(payload);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(std::get<MetricSample>(items[0]).timestamp, 1700000000000ULL);
}

TEST_F(CodecTest, TestMalformedPayloadsThrow) {
    EXPECT_THROW(Codec::decode_batch("not json"), ProtocolError);
    EXPECT_THROW(Codec::decode_batch(R"({"event_id":"x"})"), ProtocolError);
    EXPECT_THROW(Codec::decode_batch(R"([{"event_id":"x"}])"), ProtocolError);
    EXPECT_THROW(Codec::decode_batch(
        R"([{"event_id":"x","timestamp":"later","level":"INFO","component":"c","event_type":"t","message":"m"}])"),
        ProtocolError);
    EXPECT_THROW(Codec::decode_batch(
        R"([{"event_id":"x","timestamp":0,"level":"LOUD","component":"c","event_type":"t","message":"m"}])"),
        ProtocolError);

    try {
        Codec::decode_batch("[1]");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_DATA);
    }

    // Unparseable text is a decode failure, parseable text with bad content is malformed
    try {
        Codec::decode_item("{\"event_id\":");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DESERIALIZATION_FAILED);
    }
}

TEST_F(CodecTest, TestEmptyBatch) {
    Batch batch;
    EXPECT_EQ(Codec::encode_batch(batch), "[]");
    EXPECT_TRUE(Codec::decode_batch("[]").empty());
}
