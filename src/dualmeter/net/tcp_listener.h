/**
 * dualmeter TCP Listener - Multi-threaded TCP acceptor
 *
 * One worker thread per event loop; every worker owns its own listening
 * socket bound with SO_REUSEPORT so the kernel spreads connections.
 *
 * Lifecycle:
 *   bind()            creates every socket and loop on the calling thread
 *                     and reports bind errors synchronously
 *   start()           launches the worker threads and returns
 *   stop_accepting()  closes the listening sockets, loops keep running
 *   stop() / join()   stop the loops and wait for the threads
 */

#pragma once

#include "event_loop.h"
#include "tcp_socket.h"

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
 * Connection callback, invoked on the accepting worker's thread.
 *
 * @param socket The accepted client socket (non-blocking)
 * @param peer Client address
 * @param worker_id Index of the accepting worker
 * @param event_loop The worker's event loop
 */
using ConnectionCallback = std::function<void(
    TcpSocket socket,
    const struct sockaddr_in& peer,
    uint16_t worker_id,
    EventLoop* event_loop
)>;

/**
 * Per-worker hook, invoked on the worker thread before its loop starts
 * and after it stops.
 */
using WorkerHook = std::function<void(uint16_t worker_id, EventLoop* event_loop)>;

/**
 * TCP Listener configuration
 */
struct TcpListenerConfig {
    std::string host = "0.0.0.0";      // Bind address
    uint16_t port = 8443;              // Bind port (0 = ephemeral)
    int backlog = 1024;                // Listen backlog
    uint16_t num_workers = 0;          // 0 = auto (recommended_worker_count())
    bool use_reuseport = true;         // SO_REUSEPORT per worker
};

class TcpListener {
public:
    TcpListener(const TcpListenerConfig& config, ConnectionCallback connection_cb);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
    TcpListener(TcpListener&&) = delete;
    TcpListener& operator=(TcpListener&&) = delete;

    void set_worker_hooks(WorkerHook on_start, WorkerHook on_stop);

    /**
     * Create the event loops and listening sockets.
     *
     * With port 0 the first socket picks an ephemeral port and the
     * remaining workers bind to the same one.
     *
     * @return 0 on success, -1 on error (errno preserved)
     */
    int bind();

    /**
     * Launch worker threads. Requires a successful bind().
     *
     * @return 0 on success, -1 if not bound or already running
     */
    int start();

    /**
     * Remove and close every listening socket. Thread-safe.
     */
    void stop_accepting();

    /**
     * Run `task` on every worker's loop thread. Thread-safe.
     */
    void post_to_workers(const std::function<void(uint16_t worker_id, EventLoop* loop)>& task);

    /**
     * Stop every event loop. Thread-safe.
     */
    void stop();

    /**
     * Wait for all worker threads to exit.
     */
    void join();

    bool is_running() const;

    /**
     * Actually bound port (differs from config for port 0).
     */
    uint16_t port() const { return bound_port_; }

    uint16_t num_workers() const { return config_.num_workers; }

    const TcpListenerConfig& config() const { return config_; }

private:
    struct Worker {
        std::unique_ptr<EventLoop> loop;
        int listen_fd = -1;
        std::thread thread;
    };

    void worker_thread(uint16_t worker_id);
    int create_listen_socket(uint16_t port);
    void on_acceptable(uint16_t worker_id, int fd);
    void close_sockets();

    TcpListenerConfig config_;
    ConnectionCallback connection_cb_;
    WorkerHook on_worker_start_;
    WorkerHook on_worker_stop_;
    std::vector<std::unique_ptr<Worker>> workers_;
    uint16_t bound_port_{0};
    std::atomic<bool> running_{false};
};

} // namespace net
} // namespace dualmeter
