/**
 * dualmeter TCP Listener - Implementation
 */

#include "tcp_listener.h"
#include "../core/logger.h"

#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <errno.h>

namespace dualmeter {
namespace net {

TcpListener::TcpListener(const TcpListenerConfig& config, ConnectionCallback connection_cb)
    : config_(config)
    , connection_cb_(std::move(connection_cb))
{
    if (config_.num_workers == 0) {
        config_.num_workers = static_cast<uint16_t>(recommended_worker_count());
    }
}

TcpListener::~TcpListener() {
    stop();
    join();
    close_sockets();
}

void TcpListener::set_worker_hooks(WorkerHook on_start, WorkerHook on_stop) {
    on_worker_start_ = std::move(on_start);
    on_worker_stop_ = std::move(on_stop);
}

int TcpListener::bind() {
    if (!workers_.empty()) {
        errno = EALREADY;
        return -1;
    }

    uint16_t port = config_.port;
    for (uint16_t i = 0; i < config_.num_workers; i++) {
        auto worker = std::make_unique<Worker>();
        try {
            worker->loop = create_event_loop();
        } catch (const std::exception& e) {
            LOG_ERROR("Server", "Failed to create event loop: %s", e.what());
            close_sockets();
            workers_.clear();
            errno = EMFILE;
            return -1;
        }

        worker->listen_fd = create_listen_socket(port);
        if (worker->listen_fd < 0) {
            int saved = errno;
            close_sockets();
            workers_.clear();
            errno = saved;
            return -1;
        }

        // Later workers join the port the kernel picked for the first
        if (port == 0) {
            std::string ip;
            EventLoop::socket_address(worker->listen_fd, false, ip, port);
        }

        workers_.push_back(std::move(worker));
    }

    bound_port_ = port;
    LOG_INFO("Server", "TCP listener bound to %s:%u (%u workers)",
             config_.host.c_str(), bound_port_, config_.num_workers);
    return 0;
}

int TcpListener::start() {
    if (workers_.empty() || running_.load()) {
        return -1;
    }

    running_.store(true);
    for (uint16_t i = 0; i < workers_.size(); i++) {
        workers_[i]->thread = std::thread([this, i]() {
            worker_thread(i);
        });
    }
    return 0;
}

void TcpListener::stop_accepting() {
    for (auto& worker : workers_) {
        Worker* w = worker.get();
        w->loop->post([w]() {
            if (w->listen_fd >= 0) {
                w->loop->remove_fd(w->listen_fd);
                ::close(w->listen_fd);
                w->listen_fd = -1;
            }
        });
    }
}

void TcpListener::post_to_workers(const std::function<void(uint16_t, EventLoop*)>& task) {
    for (uint16_t i = 0; i < workers_.size(); i++) {
        EventLoop* loop = workers_[i]->loop.get();
        loop->post([task, i, loop]() {
            task(i, loop);
        });
    }
}

void TcpListener::stop() {
    for (auto& worker : workers_) {
        worker->loop->stop();
    }
}

void TcpListener::join() {
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    running_.store(false);
}

bool TcpListener::is_running() const {
    return running_.load();
}

void TcpListener::worker_thread(uint16_t worker_id) {
    Worker& worker = *workers_[worker_id];
    EventLoop* loop = worker.loop.get();

    LOG_DEBUG("Server", "TCP worker %u starting (%s)", worker_id, loop->platform_name());

    auto accept_handler = [this, worker_id](int fd, IOEvent events, void*) {
        if (events & IOEvent::READ) {
            on_acceptable(worker_id, fd);
        }
    };

    if (loop->add_fd(worker.listen_fd, IOEvent::READ | IOEvent::EDGE, accept_handler) < 0) {
        LOG_ERROR("Server", "TCP worker %u: failed to register listen socket: %s",
                  worker_id, strerror(errno));
        return;
    }

    if (on_worker_start_) {
        on_worker_start_(worker_id, loop);
    }

    loop->run();

    if (on_worker_stop_) {
        on_worker_stop_(worker_id, loop);
    }

    if (worker.listen_fd >= 0) {
        loop->remove_fd(worker.listen_fd);
    }

    LOG_DEBUG("Server", "TCP worker %u stopped", worker_id);
}

void TcpListener::on_acceptable(uint16_t worker_id, int fd) {
    EventLoop* loop = workers_[worker_id]->loop.get();

    // Edge-triggered: drain the accept queue
    while (true) {
        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept4(fd, (struct sockaddr*)&client_addr, &addr_len,
                                  SOCK_NONBLOCK | SOCK_CLOEXEC);

        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            LOG_WARN("Server", "accept() failed: %s", strerror(errno));
            break;
        }

        TcpSocket socket(client_fd);
        socket.set_nodelay();
        connection_cb_(std::move(socket), client_addr, worker_id, loop);
    }
}

int TcpListener::create_listen_socket(uint16_t port) {
    TcpSocket socket;
    if (!socket.is_valid()) {
        return -1;
    }

    if (socket.set_reuseaddr() < 0) {
        return -1;
    }

    if (config_.use_reuseport && socket.set_reuseport() < 0) {
        LOG_WARN("Server", "SO_REUSEPORT unavailable: %s", strerror(errno));
        if (config_.num_workers > 1) {
            return -1;
        }
    }

    if (socket.set_nonblocking() < 0) {
        return -1;
    }

    if (socket.bind(config_.host, port) < 0) {
        LOG_ERROR("Server", "Failed to bind TCP %s:%u: %s",
                  config_.host.c_str(), port, strerror(errno));
        return -1;
    }

    if (socket.listen(config_.backlog) < 0) {
        return -1;
    }

    return socket.release();
}

void TcpListener::close_sockets() {
    for (auto& worker : workers_) {
        if (worker->listen_fd >= 0) {
            ::close(worker->listen_fd);
            worker->listen_fd = -1;
        }
    }
}

} // namespace net
} // namespace dualmeter
