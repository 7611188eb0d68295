/**
 * dualmeter UDP Listener - Implementation
 */

#include "udp_listener.h"
#include "../core/logger.h"

#include <cstring>
#include <unistd.h>
#include <errno.h>

namespace dualmeter {
namespace net {

UdpListener::UdpListener(const UdpListenerConfig& config, DatagramCallback datagram_cb) noexcept
    : config_(config)
    , datagram_cb_(std::move(datagram_cb))
{
    if (config_.num_workers == 0) {
        config_.num_workers = static_cast<uint16_t>(recommended_worker_count());
    }
}

UdpListener::~UdpListener() noexcept {
    stop();
    join();
}

void UdpListener::set_worker_hooks(WorkerHook on_start, WorkerHook on_stop) noexcept {
    on_worker_start_ = std::move(on_start);
    on_worker_stop_ = std::move(on_stop);
}

int UdpListener::bind() noexcept {
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
            workers_.clear();
            errno = EMFILE;
            return -1;
        }

        if (create_udp_socket(worker->socket, port) < 0) {
            int saved = errno;
            workers_.clear();
            errno = saved;
            return -1;
        }

        if (port == 0) {
            std::string ip;
            worker->socket.get_local_address(ip, port);
        }

        worker->recv_buffer.resize(config_.max_datagram_size);
        workers_.push_back(std::move(worker));
    }

    bound_port_ = port;
    LOG_INFO("Server", "UDP listener bound to %s:%u (%u workers)",
             config_.host.c_str(), bound_port_, config_.num_workers);
    return 0;
}

int UdpListener::start() noexcept {
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

void UdpListener::post_to_workers(const std::function<void(uint16_t, EventLoop*)>& task) {
    for (uint16_t i = 0; i < workers_.size(); i++) {
        EventLoop* loop = workers_[i]->loop.get();
        loop->post([task, i, loop]() {
            task(i, loop);
        });
    }
}

void UdpListener::stop() noexcept {
    for (auto& worker : workers_) {
        worker->loop->stop();
    }
}

void UdpListener::join() noexcept {
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    running_.store(false);
}

bool UdpListener::is_running() const noexcept {
    return running_.load();
}

void UdpListener::worker_thread(uint16_t worker_id) noexcept {
    Worker& worker = *workers_[worker_id];
    EventLoop* loop = worker.loop.get();

    LOG_DEBUG("Server", "UDP worker %u starting (%s)", worker_id, loop->platform_name());

    auto recv_handler = [this, worker_id](int, IOEvent events, void*) {
        if (events & IOEvent::READ) {
            on_readable(worker_id);
        }
    };

    if (loop->add_fd(worker.socket.fd(), IOEvent::READ | IOEvent::EDGE, recv_handler) < 0) {
        LOG_ERROR("Server", "UDP worker %u: failed to register socket: %s",
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

    loop->remove_fd(worker.socket.fd());
    LOG_DEBUG("Server", "UDP worker %u stopped", worker_id);
}

void UdpListener::on_readable(uint16_t worker_id) noexcept {
    Worker& worker = *workers_[worker_id];

    // Edge-triggered: drain every pending datagram
    while (true) {
        struct sockaddr_storage addr;
        socklen_t addr_len = sizeof(addr);
        ssize_t n = worker.socket.recvfrom(worker.recv_buffer.data(), worker.recv_buffer.size(),
                                           (struct sockaddr*)&addr, &addr_len);

        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("Server", "recvfrom() failed: %s", strerror(errno));
            break;
        }

        if (n == 0) {
            continue;
        }

        datagram_cb_(worker.recv_buffer.data(), static_cast<size_t>(n),
                     (struct sockaddr*)&addr, addr_len, worker_id, worker.socket);
    }
}

int UdpListener::create_udp_socket(UdpSocket& socket, uint16_t port) noexcept {
    socket = UdpSocket();
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

    if (socket.set_recv_buffer_size(config_.recv_buffer_size) < 0) {
        LOG_WARN("Server", "Failed to set UDP receive buffer to %d: %s",
                 config_.recv_buffer_size, strerror(errno));
    }

    if (socket.set_dont_fragment() < 0) {
        LOG_WARN("Server", "Cannot set don't-fragment on UDP socket: %s", strerror(errno));
    }

    if (socket.bind(config_.host, port) < 0) {
        LOG_ERROR("Server", "Failed to bind UDP %s:%u: %s",
                  config_.host.c_str(), port, strerror(errno));
        return -1;
    }

    return 0;
}

} // namespace net
} // namespace dualmeter
