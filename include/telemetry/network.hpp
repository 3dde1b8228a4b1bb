// include/telemetry/network.hpp
// Purpose: Framed TCP transport to the telemetry collector
// Each batch is a FlatBuffers Envelope behind a 4-byte big-endian length prefix

#pragma once

#include "sink.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace telemetry {

constexpr uint16_t WIRE_PROTOCOL_VERSION = 1;
constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

// Connection settings for a TcpSink
struct TcpSinkConfig {
    std::string host;
    uint16_t port = 0;
    std::string api_key;
    std::string project_id;
    std::string service_name;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds send_timeout{10000};

    // Throws ConfigError when the endpoint is not host:port
    static TcpSinkConfig from_config(const Config& config);
};

// Network statistics
struct NetworkStats {
    std::atomic<uint64_t> connections_created{0};
    std::atomic<uint64_t> connections_failed{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> send_operations{0};
    std::atomic<uint64_t> timeouts{0};

    void reset();

    struct Snapshot {
        uint64_t connections_created = 0;
        uint64_t connections_failed = 0;
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
        uint64_t send_operations = 0;
        uint64_t timeouts = 0;
    };

    Snapshot snapshot() const {
        Snapshot s;
        s.connections_created = connections_created.load();
        s.connections_failed = connections_failed.load();
        s.bytes_sent = bytes_sent.load();
        s.bytes_received = bytes_received.load();
        s.send_operations = send_operations.load();
        s.timeouts = timeouts.load();
        return s;
    }
};

// Sends one envelope per batch over a persistent connection and waits for the Ack.
// The connection is reopened lazily after any failure.
class TcpSink : public TelemetrySink {
public:
    explicit TcpSink(TcpSinkConfig config);
    ~TcpSink() override;

    TcpSink(const TcpSink&) = delete;
    TcpSink& operator=(const TcpSink&) = delete;

    SendResult send(const Batch& batch) override;
    std::string name() const override;
    void close() override;

    bool is_connected() const;
    NetworkStats::Snapshot get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// Decoded collector reply
struct AckFrame {
    uint16_t status = 0;
    uint32_t accepted = 0;
    std::string message;
};

// Decoded batch envelope, as the collector sees it
struct EnvelopeFrame {
    uint16_t protocol_version = 0;
    std::string api_key;
    std::string project_id;
    std::string service_name;
    BatchId batch_id = 0;
    uint32_t item_count = 0;
    std::string payload;
};

// Wire format helpers shared by the sink and collector-side test doubles
namespace Wire {

std::vector<uint8_t> build_envelope(const Batch& batch, const TcpSinkConfig& config);
std::vector<uint8_t> build_ack(uint16_t status, uint32_t accepted, const std::string& message = "");

// Throw ProtocolError when the buffer fails verification: MALFORMED_DATA for an
// envelope, INVALID_RESPONSE for an ack
EnvelopeFrame parse_envelope(const std::vector<uint8_t>& buffer);
AckFrame parse_ack(const std::vector<uint8_t>& buffer);

// Prepends the 4-byte big-endian length. Bodies over MAX_FRAME_SIZE throw
// ProtocolError(PAYLOAD_TOO_LARGE).
std::vector<uint8_t> frame(const std::vector<uint8_t>& body);
uint32_t read_length_prefix(const uint8_t* header);

// SendResult for a given Ack, or the matching Error thrown
SendResult interpret_ack(const AckFrame& ack, size_t item_count);

} // namespace Wire

namespace NetworkUtils {

int create_tcp_socket(int family);
bool set_socket_nodelay(int socket, bool enable);
bool set_non_blocking(int socket);

// Blocking helpers over a non-blocking socket, bounded by the deadline
void send_all(int socket, const std::vector<uint8_t>& data,
              std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds timeout);
std::vector<uint8_t> recv_exact(int socket, size_t length,
                                std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds timeout);

NetworkError create_network_error(const std::string& operation, int error_code);

} // namespace NetworkUtils

} // namespace telemetry
