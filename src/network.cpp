// src/network.cpp
// Framed TCP sink and FlatBuffers wire helpers

#include "telemetry/network.hpp"
#include "telemetry/batch.hpp"
#include "telemetry/codec.hpp"
#include "telemetry/logging.hpp"
#include "telemetry/utils.hpp"
#include "telemetry_generated.h"
#include <flatbuffers/flatbuffers.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace telemetry {

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

// TcpSinkConfig implementation
TcpSinkConfig TcpSinkConfig::from_config(const Config& config) {
    auto [host, port] = Utils::parse_endpoint(config.delivery().endpoint);
    if (host.empty() || port == 0) {
        throw Errors::invalid_endpoint(config.delivery().endpoint);
    }

    TcpSinkConfig sink_config;
    sink_config.host = host;
    sink_config.port = port;
    sink_config.api_key = config.api_key().value_or("");
    sink_config.project_id = config.project_id().value_or("");
    sink_config.service_name = config.service_name();
    sink_config.connect_timeout = config.delivery().connect_timeout;
    sink_config.send_timeout = config.delivery().send_timeout;
    return sink_config;
}

// NetworkStats implementation
void NetworkStats::reset() {
    connections_created = 0;
    connections_failed = 0;
    bytes_sent = 0;
    bytes_received = 0;
    send_operations = 0;
    timeouts = 0;
}

// TcpSink implementation
class TcpSink::Impl {
public:
    explicit Impl(TcpSinkConfig config) : config_(std::move(config)), socket_fd_(-1) {}

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_locked();
    }

    SendResult send(const Batch& batch) {
        auto body = Wire::build_envelope(batch, config_);
        auto frame = Wire::frame(body);

        std::lock_guard<std::mutex> lock(mutex_);
        stats_.send_operations++;

        try {
            if (socket_fd_ < 0) {
                connect_locked();
            }

            auto deadline = std::chrono::steady_clock::now() + config_.send_timeout;
            NetworkUtils::send_all(socket_fd_, frame, deadline, config_.send_timeout);
            stats_.bytes_sent += frame.size();

            auto header = NetworkUtils::recv_exact(socket_fd_, 4, deadline, config_.send_timeout);
            uint32_t length = Wire::read_length_prefix(header.data());
            if (length == 0 || length > MAX_FRAME_SIZE) {
                throw Errors::invalid_response("ack frame length " + std::to_string(length));
            }
            auto ack_body = NetworkUtils::recv_exact(socket_fd_, length, deadline, config_.send_timeout);
            stats_.bytes_received += header.size() + ack_body.size();

            AckFrame ack = Wire::parse_ack(ack_body);
            return Wire::interpret_ack(ack, batch.size());
        } catch (const TimeoutError&) {
            stats_.timeouts++;
            disconnect_locked();
            throw;
        } catch (const NetworkError&) {
            disconnect_locked();
            throw;
        } catch (const ProtocolError&) {
            // The stream position is unknown after a bad frame
            disconnect_locked();
            throw;
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_locked();
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return socket_fd_ >= 0;
    }

    std::string endpoint() const {
        return config_.host + ":" + std::to_string(config_.port);
    }

    NetworkStats::Snapshot get_stats() const { return stats_.snapshot(); }

private:
    void connect_locked() {
        stats_.connections_created++;

        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo* results = nullptr;
        std::string port = std::to_string(config_.port);

        int rc = getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &results);
        if (rc != 0 || results == nullptr) {
            stats_.connections_failed++;
            throw Errors::dns_resolution_failed(config_.host);
        }
        std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> guard(results, &freeaddrinfo);

        auto deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
        int last_error = ECONNREFUSED;
        bool socket_created = false;

        for (auto* addr = results; addr != nullptr; addr = addr->ai_next) {
            int fd = NetworkUtils::create_tcp_socket(addr->ai_family);
            if (fd < 0) {
                last_error = errno;
                continue;
            }
            socket_created = true;
            NetworkUtils::set_socket_nodelay(fd, true);

            if (::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0) {
                socket_fd_ = fd;
                return;
            }

            if (errno == EINPROGRESS) {
                struct pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;

                int poll_result = poll(&pfd, 1, remaining_ms(deadline));
                if (poll_result == 0) {
                    ::close(fd);
                    stats_.connections_failed++;
                    stats_.timeouts++;
                    throw Errors::connection_timeout(endpoint(), config_.connect_timeout);
                }

                int socket_error = 0;
                socklen_t len = sizeof(socket_error);
                if (poll_result > 0 &&
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &len) == 0 &&
                    socket_error == 0) {
                    socket_fd_ = fd;
                    return;
                }
                last_error = socket_error != 0 ? socket_error : errno;
            } else {
                last_error = errno;
            }
            ::close(fd);
        }

        stats_.connections_failed++;
        if (!socket_created) {
            throw SystemError(ErrorCode::SYSTEM_ERROR, "cannot create socket for " + endpoint(),
                              std::error_code(last_error, std::system_category()));
        }
        Logging::logger()->debug("Connection to {} failed: {}", endpoint(), std::strerror(last_error));
        throw Errors::connection_failed(endpoint(), std::strerror(last_error));
    }

    void disconnect_locked() {
        if (socket_fd_ >= 0) {
            ::close(socket_fd_);
            socket_fd_ = -1;
        }
    }

    TcpSinkConfig config_;
    int socket_fd_;
    mutable std::mutex mutex_;
    NetworkStats stats_;
};

TcpSink::TcpSink(TcpSinkConfig config)
    : pimpl_(std::make_unique<Impl>(std::move(config))) {}

TcpSink::~TcpSink() = default;

SendResult TcpSink::send(const Batch& batch) {
    return pimpl_->send(batch);
}

std::string TcpSink::name() const {
    return "tcp://" + pimpl_->endpoint();
}

void TcpSink::close() {
    pimpl_->close();
}

bool TcpSink::is_connected() const {
    return pimpl_->is_connected();
}

NetworkStats::Snapshot TcpSink::get_stats() const {
    return pimpl_->get_stats();
}

// Wire implementation
namespace Wire {

std::vector<uint8_t> build_envelope(const Batch& batch, const TcpSinkConfig& config) {
    std::string payload = Codec::encode_batch(batch);

    flatbuffers::FlatBufferBuilder builder(payload.size() + 256);
    auto api_key = builder.CreateString(config.api_key);
    auto project_id = builder.CreateString(config.project_id);
    auto service_name = builder.CreateString(config.service_name);
    auto payload_vector = builder.CreateVector(
        reinterpret_cast<const uint8_t*>(payload.data()), payload.size());

    auto envelope = telemetry::wire::CreateEnvelope(
        builder, WIRE_PROTOCOL_VERSION, api_key, project_id, service_name,
        batch.id(), static_cast<uint32_t>(batch.size()), payload_vector);
    builder.Finish(envelope);

    const uint8_t* buf = builder.GetBufferPointer();
    return std::vector<uint8_t>(buf, buf + builder.GetSize());
}

std::vector<uint8_t> build_ack(uint16_t status, uint32_t accepted, const std::string& message) {
    flatbuffers::FlatBufferBuilder builder(128);
    auto message_offset = builder.CreateString(message);
    auto ack = telemetry::wire::CreateAck(builder, status, accepted, message_offset);
    builder.Finish(ack);

    const uint8_t* buf = builder.GetBufferPointer();
    return std::vector<uint8_t>(buf, buf + builder.GetSize());
}

EnvelopeFrame parse_envelope(const std::vector<uint8_t>& buffer) {
    flatbuffers::Verifier verifier(buffer.data(), buffer.size());
    if (!telemetry::wire::VerifyEnvelopeBuffer(verifier)) {
        throw Errors::malformed_data("envelope failed verification");
    }

    const auto* envelope = telemetry::wire::GetEnvelope(buffer.data());
    EnvelopeFrame frame;
    frame.protocol_version = envelope->protocol_version();
    if (envelope->api_key()) frame.api_key = envelope->api_key()->str();
    if (envelope->project_id()) frame.project_id = envelope->project_id()->str();
    if (envelope->service_name()) frame.service_name = envelope->service_name()->str();
    frame.batch_id = envelope->batch_id();
    frame.item_count = envelope->item_count();
    if (envelope->payload()) {
        frame.payload.assign(reinterpret_cast<const char*>(envelope->payload()->data()),
                             envelope->payload()->size());
    }
    return frame;
}

AckFrame parse_ack(const std::vector<uint8_t>& buffer) {
    flatbuffers::Verifier verifier(buffer.data(), buffer.size());
    if (!verifier.VerifyBuffer<telemetry::wire::Ack>(nullptr)) {
        throw Errors::invalid_response("ack failed verification");
    }

    const auto* ack = flatbuffers::GetRoot<telemetry::wire::Ack>(buffer.data());
    AckFrame frame;
    frame.status = ack->status();
    frame.accepted = ack->accepted();
    if (ack->message()) frame.message = ack->message()->str();
    return frame;
}

std::vector<uint8_t> frame(const std::vector<uint8_t>& body) {
    if (body.size() > MAX_FRAME_SIZE) {
        throw Errors::payload_too_large(body.size(), MAX_FRAME_SIZE);
    }
    std::vector<uint8_t> framed;
    framed.reserve(body.size() + 4);

    uint32_t length = static_cast<uint32_t>(body.size());
    framed.push_back((length >> 24) & 0xFF);  // MSB
    framed.push_back((length >> 16) & 0xFF);
    framed.push_back((length >> 8) & 0xFF);
    framed.push_back(length & 0xFF);          // LSB

    framed.insert(framed.end(), body.begin(), body.end());
    return framed;
}

uint32_t read_length_prefix(const uint8_t* header) {
    return (static_cast<uint32_t>(header[0]) << 24) |
           (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) |
           static_cast<uint32_t>(header[3]);
}

SendResult interpret_ack(const AckFrame& ack, size_t item_count) {
    int status = ack.status;

    if (status >= 200 && status < 300) {
        SendResult result;
        result.accepted = std::min<size_t>(ack.accepted, item_count);
        result.rejected = item_count - result.accepted;
        result.outcome = result.rejected > 0 ? DeliveryOutcome::PARTIAL : DeliveryOutcome::SUCCESS;
        result.detail = ack.message;
        return result;
    }

    if (status == 401 || status == 403) {
        throw Errors::authentication_failed(status);
    }
    if (status == 429) {
        throw Errors::rate_limited();
    }

    std::string message = ack.message.empty()
        ? "Collector answered with status " + std::to_string(status)
        : ack.message;
    throw Errors::server_error(status, message);
}

} // namespace Wire

// NetworkUtils implementation
namespace NetworkUtils {

int create_tcp_socket(int family) {
    int sock = socket(family, SOCK_STREAM, 0);
    if (sock < 0) {
        return -1;
    }
    set_non_blocking(sock);
    return sock;
}

bool set_socket_nodelay(int socket, bool enable) {
    int nodelay = enable ? 1 : 0;
    return setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) == 0;
}

bool set_non_blocking(int socket) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(socket, F_SETFL, flags | O_NONBLOCK) == 0;
}

void send_all(int socket, const std::vector<uint8_t>& data,
              std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds timeout) {
    size_t total_sent = 0;

    while (total_sent < data.size()) {
        ssize_t sent = ::send(socket, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd{};
                pfd.fd = socket;
                pfd.events = POLLOUT;

                int poll_result = poll(&pfd, 1, remaining_ms(deadline));
                if (poll_result == 0) {
                    throw TimeoutError("send", timeout);
                }
                if (poll_result < 0 && errno != EINTR) {
                    throw create_network_error("send", errno);
                }
                continue;
            }
            throw create_network_error("send", errno);
        }
        if (sent == 0) {
            throw Errors::send_failed("Connection closed by peer");
        }

        total_sent += static_cast<size_t>(sent);
    }
}

std::vector<uint8_t> recv_exact(int socket, size_t length,
                                std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds timeout) {
    std::vector<uint8_t> buffer(length);
    size_t received_total = 0;

    while (received_total < length) {
        struct pollfd pfd{};
        pfd.fd = socket;
        pfd.events = POLLIN;

        int poll_result = poll(&pfd, 1, remaining_ms(deadline));
        if (poll_result == 0) {
            throw TimeoutError("receive", timeout);
        }
        if (poll_result < 0) {
            if (errno == EINTR) continue;
            throw create_network_error("receive", errno);
        }

        ssize_t received = recv(socket, buffer.data() + received_total, length - received_total, 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            throw create_network_error("receive", errno);
        }
        if (received == 0) {
            throw Errors::receive_failed("Connection closed by peer");
        }
        received_total += static_cast<size_t>(received);
    }

    return buffer;
}

NetworkError create_network_error(const std::string& operation, int error_code) {
    ErrorCode code = operation == "send" ? ErrorCode::SEND_FAILED
                   : operation == "receive" ? ErrorCode::RECEIVE_FAILED
                   : ErrorCode::SOCKET_ERROR;
    return NetworkError(code, operation, std::strerror(error_code));
}

} // namespace NetworkUtils

} // namespace telemetry
