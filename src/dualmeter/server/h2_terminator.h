#pragma once

#include "router.h"
#include "metrics.h"
#include "timing_recorder.h"
#include "../http/http2_connection.h"
#include "../net/tcp_listener.h"
#include "../net/tls_context.h"
#include "../net/tls_socket.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dualmeter {
namespace server {

struct Http2TerminatorConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8443;
    uint16_t num_workers = 0;            // 0 = auto
    uint32_t idle_timeout_ms = 60000;
    uint32_t handshake_timeout_ms = 10000;
    uint16_t alt_svc_port = 8444;        // Advertised HTTP/3 port, 0 = no alt-svc
};

/**
 * HTTP/2 over TLS terminator.
 *
 * Each worker owns its listening socket, event loop and connections;
 * nothing is shared between workers except the router, the metrics and
 * the TLS context. Control calls (drain, force_close) are posted to the
 * workers' loops.
 *
 * Lifecycle: bind() -> start() -> drain() -> [force_close()] -> stop()
 */
class Http2Terminator {
public:
    Http2Terminator(const Http2TerminatorConfig& config,
                    std::shared_ptr<net::TlsContext> tls,
                    const Router& router,
                    MetricsAggregator& metrics);
    ~Http2Terminator();

    Http2Terminator(const Http2Terminator&) = delete;
    Http2Terminator& operator=(const Http2Terminator&) = delete;

    /**
     * Bind the listening sockets.
     *
     * @return 0 on success, -1 on error (errno preserved)
     */
    int bind();

    /**
     * Start the worker threads.
     */
    int start();

    /**
     * Stop accepting and send GOAWAY on every connection. Connections
     * close as their streams finish. Thread-safe.
     */
    void drain();

    /**
     * Close every remaining connection now. Thread-safe.
     */
    void force_close();

    /**
     * Stop the workers and wait for them.
     */
    void stop();

    size_t active_connections() const noexcept {
        return active_connections_.load(std::memory_order_acquire);
    }

    uint16_t port() const noexcept { return listener_->port(); }

    /**
     * Advertise HTTP/3 on this port, 0 = no alt-svc. Call before start().
     */
    void set_alt_svc_port(uint16_t port);

private:
    enum class SessionState : uint8_t { HANDSHAKING, ACTIVE, DRAINING, CLOSED };

    struct PendingRequest {
        RequestTiming timing;
        uint16_t status{0};
        uint64_t bytes{0};
    };

    struct Session {
        uint64_t id{0};
        int fd{-1};
        std::string peer;
        SessionState state{SessionState::HANDSHAKING};
        std::unique_ptr<net::TlsSocket> tls;
        std::unique_ptr<http2::Http2Connection> h2;
        uint64_t created_us{0};
        uint64_t handshake_us{0};
        uint64_t last_activity_us{0};
        bool counted{false};           // record_connection() called
        bool close_after_flush{false};
        std::unordered_map<uint32_t, PendingRequest> requests;
        // END_STREAM queued, recorded once the TLS output has drained
        std::vector<PendingRequest> unflushed;
    };

    struct Worker {
        net::EventLoop* loop{nullptr};
        int housekeeping_timer{-1};
        bool draining{false};
        std::unordered_map<int, std::unique_ptr<Session>> sessions;
    };

    void on_worker_start(uint16_t worker_id, net::EventLoop* loop);
    void on_worker_stop(uint16_t worker_id, net::EventLoop* loop);
    void on_connection(net::TcpSocket socket, const struct sockaddr_in& peer,
                       uint16_t worker_id, net::EventLoop* loop);
    void on_event(Worker& worker, int fd, net::IOEvent events);

    bool complete_handshake(Session& session, Worker& worker);
    void read_input(Session& session);
    void write_output(Session& session);
    void record_flushed(Session& session);
    void on_request(Session& session, http2::Http2Stream& stream);
    void on_stream_event(Session& session, const http2::Http2Stream& stream,
                         http2::StreamEvent event);

    void begin_drain(Session& session);
    void housekeeping(Worker& worker);
    void close_session(Worker& worker, int fd, const char* reason);
    void close_all(Worker& worker, const char* reason);

    Http2TerminatorConfig config_;
    std::shared_ptr<net::TlsContext> tls_;
    const Router& router_;
    MetricsAggregator& metrics_;
    TimingRecorder recorder_;
    std::string alt_svc_;

    std::unique_ptr<net::TcpListener> listener_;
    std::vector<std::unique_ptr<Worker>> workers_;

    std::atomic<uint64_t> next_session_id_{1};
    std::atomic<size_t> active_connections_{0};
};

} // namespace server
} // namespace dualmeter
