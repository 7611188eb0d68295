#pragma once

#include "router.h"
#include "metrics.h"
#include "timing_recorder.h"
#include "../http/http3_connection.h"
#include "../net/tls_context.h"
#include "../net/udp_listener.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <unordered_map>
#include <vector>

namespace dualmeter {
namespace server {

struct Http3TerminatorConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8444;
    uint16_t num_workers = 0;             // 0 = auto
    uint32_t idle_timeout_ms = 60000;     // Advertised max_idle_timeout
    uint64_t stream_window = 256 * 1024;  // Per-stream receive window
    uint64_t connection_window = 1024 * 1024;
    uint64_t max_streams_bidi = 100;
};

/**
 * HTTP/3 over QUIC terminator.
 *
 * Connections are owned by the worker that received their first Initial;
 * with SO_REUSEPORT the kernel keeps a 4-tuple on one socket, so later
 * datagrams land on the same worker. Each connection has at most one
 * loop timer armed at its QUIC next_timeout().
 *
 * Lifecycle: bind() -> start() -> drain() -> [force_close()] -> stop()
 */
class Http3Terminator {
public:
    /**
     * @param tls Context from QuicTls::create_server_context()
     */
    Http3Terminator(const Http3TerminatorConfig& config,
                    std::shared_ptr<net::TlsContext> tls,
                    const Router& router,
                    MetricsAggregator& metrics);
    ~Http3Terminator();

    Http3Terminator(const Http3Terminator&) = delete;
    Http3Terminator& operator=(const Http3Terminator&) = delete;

    int bind();
    int start();

    /**
     * Refuse new connections and send GOAWAY on established ones.
     * Connections close once their requests finish. Thread-safe.
     */
    void drain();

    /**
     * Close every remaining connection with H3_NO_ERROR. Thread-safe.
     */
    void force_close();

    void stop();

    size_t active_connections() const noexcept {
        return active_connections_.load(std::memory_order_acquire);
    }

    uint16_t port() const noexcept { return listener_->port(); }

private:
    struct PendingRequest {
        RequestTiming timing;
        uint16_t status{0};
        uint64_t bytes{0};
    };

    struct Session {
        uint64_t id{0};
        std::unique_ptr<http3::Http3Connection> h3;
        net::UdpSocket* socket{nullptr};
        struct sockaddr_storage peer{};
        socklen_t peer_len{0};
        std::vector<quic::ConnectionID> cids;   // Routing keys
        int timer_id{-1};
        uint64_t timer_deadline{0};
        bool counted{false};
        std::unordered_map<uint64_t, PendingRequest> requests;
    };

    struct Worker {
        net::EventLoop* loop{nullptr};
        bool draining{false};
        std::map<uint64_t, std::unique_ptr<Session>> sessions;
        std::unordered_map<quic::ConnectionID, Session*, quic::ConnectionID::Hash> by_cid;
    };

    void on_worker_start(uint16_t worker_id, net::EventLoop* loop);
    void on_worker_stop(uint16_t worker_id, net::EventLoop* loop);
    void on_datagram(const uint8_t* data, size_t len, const struct sockaddr* addr,
                     socklen_t addrlen, uint16_t worker_id, net::UdpSocket& socket);

    Session* lookup(Worker& worker, const uint8_t* data, size_t len);
    Session* create_session(Worker& worker, const quic::LongHeader& initial,
                            const struct sockaddr* addr, socklen_t addrlen,
                            net::UdpSocket& socket);
    void send_version_negotiation(const quic::LongHeader& header,
                                  const struct sockaddr* addr, socklen_t addrlen,
                                  net::UdpSocket& socket);

    void on_handshake(Worker& worker, Session& session);
    void on_request(Session& session, const http3::Request& request);
    void on_stream_event(Session& session, uint64_t stream_id, http3::StreamEvent event);

    /**
     * Flush pending datagrams, re-arm the timer, retire closed connections.
     */
    void service(Worker& worker, Session& session);
    void flush(Session& session);
    void arm_timer(Worker& worker, Session& session);
    void on_timer(Worker& worker, uint64_t session_id);

    void remove_session(Worker& worker, uint64_t session_id);
    void close_all(Worker& worker, const char* reason);

    Http3TerminatorConfig config_;
    std::shared_ptr<net::TlsContext> tls_;
    const Router& router_;
    MetricsAggregator& metrics_;
    TimingRecorder recorder_;
    quic::TransportParameters transport_params_;

    std::unique_ptr<net::UdpListener> listener_;
    std::vector<std::unique_ptr<Worker>> workers_;

    std::atomic<uint64_t> next_session_id_{1};
    std::atomic<size_t> active_connections_{0};
};

} // namespace server
} // namespace dualmeter
