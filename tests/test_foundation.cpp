// tests/test_foundation.cpp
// Tests for the foundation components (types, utils, config, errors)

#include <gtest/gtest.h>
#include "telemetry/telemetry.hpp"
#include <cerrno>
#include <cstdlib>
#include <set>
#include <thread>

using namespace telemetry;

// Test fixture for foundation tests
class FoundationTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_env();
    }

    void TearDown() override {
        clear_env();
    }

    static void clear_env() {
        for (const char* name : {"TELEMETRY_WRITE_TOKEN", "TELEMETRY_PROJECT_ID", "TELEMETRY_SERVICE_NAME",
                                 "TELEMETRY_ENVIRONMENT", "TELEMETRY_ENDPOINT", "TELEMETRY_MIN_LEVEL",
                                 "TELEMETRY_SAMPLE_RATE", "TELEMETRY_BATCH_SIZE",
                                 "TELEMETRY_FLUSH_INTERVAL_MS", "TELEMETRY_DEBUG",
                                 "TELEMETRY_REDACT_KEYS"}) {
            unsetenv(name);
        }
    }
};

TEST_F(FoundationTest, TestLogLevelConversion) {
    EXPECT_EQ(Utils::log_level_to_string(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Utils::log_level_to_string(LogLevel::WARNING), "WARNING");
    EXPECT_EQ(Utils::log_level_to_string(LogLevel::CRITICAL), "CRITICAL");

    EXPECT_EQ(Utils::string_to_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(Utils::string_to_log_level(" error "), LogLevel::ERROR);
    EXPECT_FALSE(Utils::string_to_log_level("verbose").has_value());

    EXPECT_LT(LogLevel::DEBUG, LogLevel::INFO);
    EXPECT_LT(LogLevel::ERROR, LogLevel::CRITICAL);
}

TEST_F(FoundationTest, TestHealthStatusConversion) {
    EXPECT_EQ(Utils::health_status_to_string(HealthStatus::DEGRADED), "degraded");
    EXPECT_EQ(Utils::string_to_health_status("UNHEALTHY"), HealthStatus::UNHEALTHY);
    EXPECT_FALSE(Utils::string_to_health_status("sick").has_value());
    EXPECT_EQ(Utils::delivery_outcome_to_string(DeliveryOutcome::PARTIAL), "partial");
}

TEST_F(FoundationTest, TestTraceAndSpanIds) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        TraceId trace_id = Utils::generate_trace_id();
        SpanId span_id = Utils::generate_span_id();

        EXPECT_EQ(trace_id.size(), 32u);
        EXPECT_EQ(span_id.size(), 16u);
        EXPECT_TRUE(Utils::is_hex_string(trace_id));
        EXPECT_TRUE(Utils::is_hex_string(span_id));
        EXPECT_NE(trace_id, std::string(32, '0'));
        EXPECT_NE(span_id, std::string(16, '0'));
        EXPECT_EQ(trace_id, Utils::to_lower(trace_id));
        seen.insert(trace_id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST_F(FoundationTest, TestEventIdIsUuidV4) {
    std::string id = Utils::generate_event_id();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    EXPECT_NE(Utils::generate_event_id(), id);
}

TEST_F(FoundationTest, TestBatchIdGeneration) {
    BatchId id1 = Utils::generate_batch_id();
    BatchId id2 = Utils::generate_batch_id();

    EXPECT_NE(id1, 0u);
    EXPECT_NE(id2, 0u);
    EXPECT_NE(id1, id2);
}

TEST_F(FoundationTest, TestIso8601) {
    EXPECT_EQ(Utils::timestamp_to_iso8601(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(Utils::timestamp_to_iso8601(1700000000123ULL), "2023-11-14T22:13:20.123Z");

    EXPECT_EQ(Utils::iso8601_to_timestamp("2023-11-14T22:13:20.123Z"), 1700000000123ULL);
    EXPECT_EQ(Utils::iso8601_to_timestamp("2023-11-14T22:13:20"), 1700000000000ULL);
    EXPECT_FALSE(Utils::iso8601_to_timestamp("yesterday").has_value());
    EXPECT_FALSE(Utils::iso8601_to_timestamp("2023-13-14T22:13:20.123Z").has_value());

    Timestamp now = Utils::now_milliseconds();
    EXPECT_EQ(Utils::iso8601_to_timestamp(Utils::timestamp_to_iso8601(now)), now);
}

TEST_F(FoundationTest, TestPropertiesBasicOperations) {
    Properties props;
    EXPECT_TRUE(props.empty());

    props["string"] = std::string("value");
    props["int"] = int64_t(42);
    props["double"] = 3.5;
    props["bool"] = true;
    props["null"] = nullptr;

    EXPECT_EQ(props.size(), 5u);
    EXPECT_TRUE(props.contains("int"));
    EXPECT_EQ(std::get<int64_t>(props.at("int")), 42);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(props.at("null")));

    Properties other{{"int", int64_t(7)}, {"extra", std::string("x")}};
    props.merge(other);
    EXPECT_EQ(std::get<int64_t>(props.at("int")), 7);
    EXPECT_EQ(props.size(), 6u);

    EXPECT_EQ(props.erase("extra"), 1u);
    EXPECT_FALSE(props.contains("extra"));
}

TEST_F(FoundationTest, TestStringUtils) {
    EXPECT_EQ(Utils::trim("  padded \t"), "padded");
    EXPECT_EQ(Utils::to_upper("MiXed"), "MIXED");

    auto parts = Utils::split("a, b,,c ", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[2], "c");

    EXPECT_TRUE(Utils::starts_with("telemetry", "tele"));
    EXPECT_FALSE(Utils::is_hex_string("xyz"));
    EXPECT_FALSE(Utils::get_hostname().empty());
    EXPECT_FALSE(Utils::get_os_info().empty());
}

TEST_F(FoundationTest, TestParseEndpoint) {
    auto endpoint = Utils::parse_endpoint("collector.internal:50000");
    EXPECT_EQ(endpoint.first, "collector.internal");
    EXPECT_EQ(endpoint.second, 50000);

    EXPECT_EQ(Utils::parse_endpoint("no-port").second, 0);
    EXPECT_EQ(Utils::parse_endpoint("host:99999").second, 0);
    EXPECT_EQ(Utils::parse_endpoint(":80").second, 0);
}

TEST_F(FoundationTest, TestExponentialBackoff) {
    Utils::ExponentialBackoff backoff(std::chrono::milliseconds(100), 2.0, std::chrono::milliseconds(500));

    EXPECT_EQ(backoff.next_delay().count(), 100);
    EXPECT_EQ(backoff.next_delay().count(), 200);
    EXPECT_EQ(backoff.next_delay().count(), 400);
    EXPECT_EQ(backoff.next_delay().count(), 500);
    EXPECT_EQ(backoff.attempt_count(), 4);

    backoff.reset();
    EXPECT_EQ(backoff.next_delay().count(), 100);
}

TEST_F(FoundationTest, TestScopedTimer) {
    double measured = -1.0;
    {
        Utils::ScopedTimer timer([&measured](Utils::ScopedTimer::Duration elapsed) {
            measured = elapsed.count();
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_GE(measured, 4.0);
}

TEST_F(FoundationTest, TestErrorHierarchy) {
    NetworkError network(ErrorCode::CONNECTION_FAILED, "connect", "refused");
    EXPECT_EQ(network.code(), ErrorCode::CONNECTION_FAILED);
    EXPECT_EQ(network.operation(), "connect");
    EXPECT_TRUE(is_retryable(network));

    TimeoutError timeout("send", std::chrono::milliseconds(250));
    EXPECT_EQ(timeout.code(), ErrorCode::TIMEOUT);

    TimeoutError connect = Errors::connection_timeout("collector:6000", std::chrono::milliseconds(100));
    EXPECT_EQ(connect.code(), ErrorCode::CONNECTION_TIMEOUT);
    EXPECT_TRUE(is_retryable(connect));
    EXPECT_EQ(make_error_code(ErrorCode::CONNECTION_TIMEOUT).message(), "Connection timeout");
    EXPECT_TRUE(is_retryable(timeout));

    EXPECT_FALSE(is_retryable(Errors::authentication_failed(401)));
    EXPECT_EQ(Errors::authentication_failed(403).code(), ErrorCode::AUTHORIZATION_DENIED);
    EXPECT_FALSE(is_retryable(Errors::malformed_data("bad")));

    EXPECT_TRUE(is_retryable(Errors::server_error(503, "unavailable")));
    EXPECT_TRUE(is_retryable(Errors::rate_limited()));
    EXPECT_FALSE(is_retryable(Errors::server_error(400, "bad request")));

    SystemError system(ErrorCode::SYSTEM_ERROR, "cannot create socket",
                       std::error_code(EMFILE, std::system_category()));
    EXPECT_EQ(system.system_error().value(), EMFILE);
    EXPECT_EQ(system.category(), "telemetry::SystemError");
    EXPECT_TRUE(is_retryable(system));

    std::error_code ec = make_error_code(ErrorCode::SEND_FAILED);
    EXPECT_EQ(ec.value(), static_cast<int>(ErrorCode::SEND_FAILED));
    EXPECT_FALSE(ec.message().empty());
}

TEST_F(FoundationTest, TestConfigDefaults) {
    Config config("checkout-service");

    EXPECT_EQ(config.service_name(), "checkout-service");
    EXPECT_EQ(config.environment(), "development");
    EXPECT_EQ(config.min_log_level(), LogLevel::INFO);
    EXPECT_EQ(config.batch().batch_size, 50u);
    EXPECT_EQ(config.batch().flush_interval.count(), 5000);
    EXPECT_DOUBLE_EQ(config.sample_rate(), 1.0);
    EXPECT_EQ(config.delivery().max_retries, 3);
    EXPECT_EQ(config.delivery().failure_threshold, 5);
    EXPECT_EQ(config.delivery().recovery_timeout.count(), 30000);
    EXPECT_TRUE(config.enable_metadata());
    EXPECT_FALSE(config.has_remote_backend());
    EXPECT_TRUE(config.is_valid());

    config.set_api_key("write-token");
    EXPECT_TRUE(config.has_remote_backend());
}

TEST_F(FoundationTest, TestConfigValidation) {
    Config config("svc");
    config.set_batch_size(0).set_sample_rate(1.5).set_max_retries(11);

    EXPECT_FALSE(config.is_valid());
    EXPECT_THROW(config.validate(), ConfigError);
    EXPECT_GE(config.validation_errors().size(), 3u);

    Config bad_endpoint("svc");
    bad_endpoint.set_api_key("token").set_endpoint("not an endpoint");
    EXPECT_THROW(bad_endpoint.validate(), ConfigError);

    Config no_key("svc");
    no_key.set_endpoint("not an endpoint");
    EXPECT_NO_THROW(no_key.validate());

    EXPECT_THROW(Config("  ").validate(), ConfigError);
}

TEST_F(FoundationTest, TestConfigBuilder) {
    Config config = ConfigBuilder("orders")
        .service("staging", "2.1.0")
        .credentials("token", "project-1")
        .endpoint("collector:7000")
        .batching(25, std::chrono::milliseconds(2000))
        .retries(2, std::chrono::milliseconds(50))
        .circuit(3, std::chrono::milliseconds(1000))
        .sampling(0.5, LogLevel::WARNING)
        .build();

    EXPECT_EQ(config.environment(), "staging");
    EXPECT_EQ(config.service_version(), "2.1.0");
    EXPECT_EQ(config.project_id(), std::optional<std::string>("project-1"));
    EXPECT_EQ(config.batch().batch_size, 25u);
    EXPECT_EQ(config.delivery().failure_threshold, 3);
    EXPECT_EQ(config.min_log_level(), LogLevel::WARNING);
    EXPECT_TRUE(config.has_remote_backend());

    EXPECT_THROW(ConfigBuilder("x").batching(20000, std::chrono::milliseconds(10)).build(), ConfigError);
    EXPECT_THROW(ConfigBuilder("x").queue_limits(100, 8).build(), ConfigError);
}

TEST_F(FoundationTest, TestConfigFluentSetters) {
    Config config("svc");
    config.set_service_version("1.4.0")
        .set_redact_keys({"session_id"})
        .set_flush_interval(std::chrono::milliseconds(250))
        .set_max_queue_size(500)
        .set_max_in_flight(2)
        .set_drain_timeout(std::chrono::milliseconds(1500))
        .set_connect_timeout(std::chrono::milliseconds(750))
        .set_send_timeout(std::chrono::milliseconds(900))
        .set_system_log_level(SystemLogLevel::DEBUG)
        .set_log_to_file("/tmp/telemetry-diagnostics.log");

    EXPECT_EQ(config.service_version(), "1.4.0");
    ASSERT_EQ(config.redact_keys().size(), 1u);
    EXPECT_EQ(config.redact_keys()[0], "session_id");
    EXPECT_EQ(config.batch().flush_interval.count(), 250);
    EXPECT_EQ(config.batch().max_queue_size, 500u);
    EXPECT_EQ(config.batch().max_in_flight, 2u);
    EXPECT_EQ(config.batch().drain_timeout.count(), 1500);
    EXPECT_EQ(config.delivery().connect_timeout.count(), 750);
    EXPECT_EQ(config.delivery().send_timeout.count(), 900);
    EXPECT_EQ(config.logging().level, SystemLogLevel::DEBUG);
    EXPECT_TRUE(config.logging().log_to_file);
    EXPECT_EQ(config.logging().log_file_path, "/tmp/telemetry-diagnostics.log");
    EXPECT_TRUE(config.is_valid());

    Config built = ConfigBuilder("svc")
        .file_logging("/tmp/telemetry-rotating.log", 1024 * 1024, 3)
        .build();
    EXPECT_TRUE(built.logging().log_to_file);
    EXPECT_EQ(built.logging().max_log_file_size, 1024u * 1024u);
    EXPECT_EQ(built.logging().max_log_files, 3);
}

TEST_F(FoundationTest, TestConfigPresets) {
    Config dev = Presets::development("svc");
    EXPECT_EQ(dev.min_log_level(), LogLevel::DEBUG);
    EXPECT_TRUE(dev.fallback().echo_to_console);
    EXPECT_FALSE(dev.has_remote_backend());

    Config prod = Presets::production("svc", "token", "collector:50000");
    EXPECT_EQ(prod.environment(), "production");
    EXPECT_TRUE(prod.has_remote_backend());

    Config test = Presets::testing("svc");
    EXPECT_EQ(test.delivery().max_retries, 0);
    EXPECT_FALSE(test.enable_metadata());
}

TEST_F(FoundationTest, TestEnvConfigWithoutToken) {
    setenv("TELEMETRY_SERVICE_NAME", "env-service", 1);
    setenv("TELEMETRY_BATCH_SIZE", "20", 1);
    setenv("TELEMETRY_MIN_LEVEL", "warning", 1);

    Config config = EnvConfig::from_environment();
    EXPECT_EQ(config.service_name(), "env-service");
    EXPECT_EQ(config.batch().batch_size, 20u);
    EXPECT_EQ(config.min_log_level(), LogLevel::WARNING);
    EXPECT_FALSE(config.has_remote_backend());
}

TEST_F(FoundationTest, TestEnvironmentKeepsServiceVersion) {
    Config built = ConfigBuilder("svc").service("production", "2.4.0").environment("staging").build();
    EXPECT_EQ(built.environment(), "staging");
    EXPECT_EQ(built.service_version(), "2.4.0");

    setenv("TELEMETRY_ENVIRONMENT", "staging", 1);
    Config config = EnvConfig::from_environment("svc");
    EXPECT_EQ(config.environment(), "staging");
    EXPECT_EQ(config.service_version(), Config("svc").service_version());
}

TEST_F(FoundationTest, TestEnvConfigRedactKeys) {
    setenv("TELEMETRY_REDACT_KEYS", "Session_ID, ssn,,", 1);

    Config config = EnvConfig::from_environment("svc");
    const auto& keys = config.redact_keys();
    EXPECT_EQ(keys.size(), default_redact_keys().size() + 2);
    EXPECT_EQ(keys[keys.size() - 2], "session_id");
    EXPECT_EQ(keys.back(), "ssn");
}

TEST_F(FoundationTest, TestEnvConfigWithToken) {
    setenv("TELEMETRY_WRITE_TOKEN", "secret-token", 1);
    setenv("TELEMETRY_ENDPOINT", "collector.example:6000", 1);

    Config config = EnvConfig::from_environment("fallback-name");
    EXPECT_EQ(config.service_name(), "fallback-name");
    EXPECT_TRUE(config.has_remote_backend());
    EXPECT_EQ(config.delivery().endpoint, "collector.example:6000");
}

TEST_F(FoundationTest, TestSDKVersion) {
    EXPECT_EQ(version(), "1.0.0");
    EXPECT_EQ(VERSION_MAJOR, 1);
}
