/**
 * dualmeter UDP Listener - Multi-threaded datagram receiver
 *
 * Each worker owns a UDP socket bound to the same port via SO_REUSEPORT,
 * its own event loop and a pre-allocated receive buffer. QUIC connection
 * state lives with the worker that received the first datagram.
 *
 * Same lifecycle as TcpListener: bind() synchronously, then start().
 * There is no stop_accepting(): datagrams for established connections
 * must keep flowing while they drain, so refusing new connections is
 * the terminator's decision.
 */

#pragma once

#include "event_loop.h"
#include "tcp_listener.h"
#include "udp_socket.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace dualmeter {
namespace net {

/**
 * Datagram callback, invoked on the receiving worker's thread.
 *
 * @param data Datagram bytes (valid only during the callback)
 * @param length Datagram length
 * @param addr Source address
 * @param addrlen Length of address structure
 * @param worker_id Index of the receiving worker
 * @param socket The worker's socket, for replies
 */
using DatagramCallback = std::function<void(
    const uint8_t* data,
    size_t length,
    const struct sockaddr* addr,
    socklen_t addrlen,
    uint16_t worker_id,
    UdpSocket& socket
)>;

/**
 * UDP Listener configuration
 */
struct UdpListenerConfig {
    std::string host = "0.0.0.0";      // Bind address
    uint16_t port = 8444;              // Bind port (0 = ephemeral)
    uint16_t num_workers = 0;          // 0 = auto (recommended_worker_count())
    bool use_reuseport = true;         // SO_REUSEPORT per worker
    int recv_buffer_size = 2 * 1024 * 1024;
    size_t max_datagram_size = 65535;
};

class UdpListener {
public:
    UdpListener(const UdpListenerConfig& config, DatagramCallback datagram_cb) noexcept;
    ~UdpListener() noexcept;

    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;
    UdpListener(UdpListener&&) = delete;
    UdpListener& operator=(UdpListener&&) = delete;

    void set_worker_hooks(WorkerHook on_start, WorkerHook on_stop) noexcept;

    /**
     * Create the event loops and bound sockets.
     *
     * @return 0 on success, -1 on error (errno preserved)
     */
    int bind() noexcept;

    /**
     * Launch worker threads. Requires a successful bind().
     */
    int start() noexcept;

    void post_to_workers(const std::function<void(uint16_t worker_id, EventLoop* loop)>& task);

    void stop() noexcept;
    void join() noexcept;
    bool is_running() const noexcept;

    uint16_t port() const noexcept { return bound_port_; }
    uint16_t num_workers() const noexcept { return config_.num_workers; }
    const UdpListenerConfig& config() const noexcept { return config_; }

    /**
     * Worker's event loop (valid after bind()).
     */
    EventLoop* loop(uint16_t worker_id) const noexcept {
        return worker_id < workers_.size() ? workers_[worker_id]->loop.get() : nullptr;
    }

private:
    struct Worker {
        std::unique_ptr<EventLoop> loop;
        UdpSocket socket{-1};
        std::vector<uint8_t> recv_buffer;
        std::thread thread;
    };

    void worker_thread(uint16_t worker_id) noexcept;
    int create_udp_socket(UdpSocket& socket, uint16_t port) noexcept;
    void on_readable(uint16_t worker_id) noexcept;

    UdpListenerConfig config_;
    DatagramCallback datagram_cb_;
    WorkerHook on_worker_start_;
    WorkerHook on_worker_stop_;
    std::vector<std::unique_ptr<Worker>> workers_;
    uint16_t bound_port_{0};
    std::atomic<bool> running_{false};
};

} // namespace net
} // namespace dualmeter
