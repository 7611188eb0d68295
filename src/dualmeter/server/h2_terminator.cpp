#include "h2_terminator.h"
#include "../core/logger.h"
#include <cerrno>

namespace dualmeter {
namespace server {

namespace {

constexpr size_t kReadChunk = 16384;
constexpr size_t kOutputBudget = 64 * 1024;
constexpr size_t kMaxPendingCipher = 256 * 1024;
constexpr uint64_t kHousekeepingMs = 1000;

inline unsigned long long ull(uint64_t v) { return static_cast<unsigned long long>(v); }

} // namespace

Http2Terminator::Http2Terminator(const Http2TerminatorConfig& config,
                                 std::shared_ptr<net::TlsContext> tls,
                                 const Router& router,
                                 MetricsAggregator& metrics)
    : config_(config),
      tls_(std::move(tls)),
      router_(router),
      metrics_(metrics),
      recorder_(metrics, Protocol::HTTP2) {
    set_alt_svc_port(config_.alt_svc_port);

    net::TcpListenerConfig listener_config;
    listener_config.host = config_.host;
    listener_config.port = config_.port;
    listener_config.num_workers = config_.num_workers;

    listener_ = std::make_unique<net::TcpListener>(
        listener_config,
        [this](net::TcpSocket socket, const struct sockaddr_in& peer,
               uint16_t worker_id, net::EventLoop* loop) {
            on_connection(std::move(socket), peer, worker_id, loop);
        });
    listener_->set_worker_hooks(
        [this](uint16_t id, net::EventLoop* loop) { on_worker_start(id, loop); },
        [this](uint16_t id, net::EventLoop* loop) { on_worker_stop(id, loop); });

    for (uint16_t i = 0; i < listener_->num_workers(); i++) {
        workers_.push_back(std::make_unique<Worker>());
    }
}

void Http2Terminator::set_alt_svc_port(uint16_t port) {
    config_.alt_svc_port = port;
    alt_svc_.clear();
    if (port != 0) {
        alt_svc_ = "h3=\":" + std::to_string(port) + "\"";
    }
}

Http2Terminator::~Http2Terminator() {
    stop();
}

int Http2Terminator::bind() {
    return listener_->bind();
}

int Http2Terminator::start() {
    return listener_->start();
}

void Http2Terminator::drain() {
    listener_->stop_accepting();
    listener_->post_to_workers([this](uint16_t worker_id, net::EventLoop*) {
        Worker& worker = *workers_[worker_id];
        worker.draining = true;

        std::vector<int> fds;
        for (auto& entry : worker.sessions) fds.push_back(entry.first);
        for (int fd : fds) {
            auto it = worker.sessions.find(fd);
            if (it == worker.sessions.end()) continue;
            Session& session = *it->second;
            if (session.state == SessionState::HANDSHAKING) {
                close_session(worker, fd, "shutdown during handshake");
                continue;
            }
            begin_drain(session);
            write_output(session);
            if (session.state == SessionState::CLOSED) {
                close_session(worker, fd, "drained");
            }
        }
    });
}

void Http2Terminator::force_close() {
    listener_->post_to_workers([this](uint16_t worker_id, net::EventLoop*) {
        close_all(*workers_[worker_id], "grace period elapsed");
    });
}

void Http2Terminator::stop() {
    if (listener_) {
        listener_->stop();
        listener_->join();
    }
}

// ============================================================================
// Worker threads
// ============================================================================

void Http2Terminator::on_worker_start(uint16_t worker_id, net::EventLoop* loop) {
    Worker& worker = *workers_[worker_id];
    worker.loop = loop;
    worker.housekeeping_timer = loop->add_timer(kHousekeepingMs, true, [this, &worker]() {
        housekeeping(worker);
    });
}

void Http2Terminator::on_worker_stop(uint16_t worker_id, net::EventLoop* loop) {
    Worker& worker = *workers_[worker_id];
    close_all(worker, "worker stopped");
    if (worker.housekeeping_timer >= 0) {
        loop->cancel_timer(worker.housekeeping_timer);
        worker.housekeeping_timer = -1;
    }
    worker.loop = nullptr;
}

void Http2Terminator::on_connection(net::TcpSocket socket, const struct sockaddr_in& peer,
                                    uint16_t worker_id, net::EventLoop* loop) {
    Worker& worker = *workers_[worker_id];
    if (worker.draining) {
        return;  // Socket closes on scope exit
    }

    std::string peer_name = net::format_address(peer);
    auto tls = net::TlsSocket::accept(std::move(socket), tls_);
    if (!tls) {
        LOG_WARN("TLS", "Cannot create TLS session for %s", peer_name.c_str());
        metrics_.record_handshake_failure(Protocol::HTTP2);
        return;
    }

    auto session = std::make_unique<Session>();
    session->id = next_session_id_.fetch_add(1, std::memory_order_relaxed);
    session->fd = tls->fd();
    session->peer = std::move(peer_name);
    session->tls = std::move(tls);
    session->created_us = now_us();
    session->last_activity_us = session->created_us;

    int fd = session->fd;
    if (loop->add_fd(fd, net::IOEvent::READ | net::IOEvent::WRITE | net::IOEvent::EDGE,
                     [this, &worker](int ready_fd, net::IOEvent events, void*) {
                         on_event(worker, ready_fd, events);
                     }) < 0) {
        LOG_ERROR("Server", "HTTP/2 conn=%llu cannot register fd %d", ull(session->id), fd);
        metrics_.record_handshake_failure(Protocol::HTTP2);
        return;
    }

    LOG_DEBUG("Server", "HTTP/2 conn=%llu accepted from %s on worker %u",
              ull(session->id), session->peer.c_str(), worker_id);
    worker.sessions.emplace(fd, std::move(session));
    active_connections_.fetch_add(1, std::memory_order_acq_rel);
}

void Http2Terminator::on_event(Worker& worker, int fd, net::IOEvent events) {
    auto it = worker.sessions.find(fd);
    if (it == worker.sessions.end()) {
        return;
    }
    Session& session = *it->second;

    bool peer_closed = false;
    if (session.tls->fill_from_socket(peer_closed) < 0) {
        close_session(worker, fd, "socket error");
        return;
    }

    if (session.state == SessionState::HANDSHAKING) {
        int hs = session.tls->handshake();
        if (hs < 0) {
            session.tls->flush();
            close_session(worker, fd, "TLS handshake failed");
            return;
        }
        if (hs > 0) {
            if (session.tls->flush() < 0 || peer_closed) {
                close_session(worker, fd, "TLS handshake aborted");
                return;
            }
            return;
        }
        if (!complete_handshake(session, worker)) {
            close_session(worker, fd, "ALPN did not select h2");
            return;
        }
    }

    if (session.state != SessionState::CLOSED) {
        read_input(session);
    }
    if (peer_closed) {
        session.close_after_flush = true;
    }
    if ((events & net::IOEvent::ERROR) && !(events & net::IOEvent::READ)) {
        close_session(worker, fd, "socket error");
        return;
    }

    write_output(session);
    if (session.state == SessionState::CLOSED) {
        close_session(worker, fd, session.close_after_flush ? "closed" : "drained");
    }
}

bool Http2Terminator::complete_handshake(Session& session, Worker& worker) {
    std::string alpn = session.tls->get_alpn_protocol();
    if (alpn != "h2") {
        LOG_WARN("TLS", "HTTP/2 conn=%llu from %s negotiated '%s' instead of h2",
                 ull(session.id), session.peer.c_str(), alpn.c_str());
        return false;
    }

    uint64_t now = now_us();
    session.handshake_us = now - session.created_us;
    session.last_activity_us = now;
    session.counted = true;
    metrics_.record_connection(Protocol::HTTP2, static_cast<double>(session.handshake_us) / 1000.0);

    session.h2 = std::make_unique<http2::Http2Connection>(session.id);
    Session* s = &session;
    session.h2->set_request_callback([this, s](http2::Http2Stream& stream, bool) {
        on_request(*s, stream);
    });
    session.h2->set_stream_event_callback(
        [this, s](const http2::Http2Stream& stream, http2::StreamEvent event) {
            on_stream_event(*s, stream, event);
        });
    session.state = SessionState::ACTIVE;

    LOG_DEBUG("TLS", "HTTP/2 conn=%llu handshake complete in %.3fms",
              ull(session.id), static_cast<double>(session.handshake_us) / 1000.0);

    if (worker.draining) {
        begin_drain(session);
    }
    return true;
}

void Http2Terminator::read_input(Session& session) {
    uint8_t buf[kReadChunk];
    while (true) {
        ssize_t n = session.tls->read(buf, sizeof(buf));
        if (n > 0) {
            session.last_activity_us = now_us();
            auto processed = session.h2->process_input(buf, static_cast<size_t>(n));
            if (processed.is_err()) {
                // GOAWAY is queued; flush it and close
                session.close_after_flush = true;
                return;
            }
            continue;
        }
        if (n == 0) {
            session.close_after_flush = true;  // close_notify
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_DEBUG("TLS", "HTTP/2 conn=%llu read failed: %s",
                      ull(session.id), session.tls->get_error().c_str());
            session.close_after_flush = true;
        }
        return;
    }
}

void Http2Terminator::write_output(Session& session) {
    if (session.state == SessionState::CLOSED) {
        return;
    }

    if (session.h2) {
        std::vector<uint8_t> out;
        while (session.h2->has_output() && session.tls->pending_output() < kMaxPendingCipher) {
            out.clear();
            session.h2->produce_output(out, kOutputBudget);
            if (out.empty()) break;
            if (session.tls->write(out.data(), out.size()) < 0) {
                session.state = SessionState::CLOSED;
                return;
            }
        }
    }

    int flushed = session.tls->flush();
    if (flushed < 0) {
        session.state = SessionState::CLOSED;
        return;
    }
    if (flushed > 0) {
        return;  // Resume on EPOLLOUT
    }
    record_flushed(session);
    if (session.h2 && session.h2->has_output()) {
        return;
    }

    if (session.close_after_flush ||
        (session.state == SessionState::DRAINING && session.h2 && session.h2->is_drained())) {
        session.state = SessionState::CLOSED;
    }
}

void Http2Terminator::record_flushed(Session& session) {
    for (auto& pending : session.unflushed) {
        recorder_.end(pending.timing, pending.status, pending.bytes);
    }
    session.unflushed.clear();
}

void Http2Terminator::on_request(Session& session, http2::Http2Stream& stream) {
    PendingRequest& pending = session.requests[stream.id()];
    recorder_.begin(pending.timing, session.handshake_us);

    HeaderMap headers(stream.request_headers().begin(), stream.request_headers().end());
    std::string method = stream.request_header(":method");
    std::string path = stream.request_header(":path");

    RouteResponse route = router_.route(Protocol::HTTP2, method, path, headers);

    std::vector<http::HPACKHeader> response_headers;
    response_headers.reserve(route.headers.size() + 3);
    response_headers.push_back({"content-type", route.content_type, false});
    response_headers.push_back({"content-length", std::to_string(route.content_length), false});
    for (auto& header : route.headers) {
        response_headers.push_back({header.first, header.second, false});
    }
    if (!alt_svc_.empty()) {
        response_headers.push_back({"alt-svc", alt_svc_, false});
    }

    pending.status = route.status;
    pending.bytes = route.body ? route.body->size() : 0;

    LOG_DEBUG("HTTP2", "conn=%llu stream=%u %s %s -> %u", ull(session.id), stream.id(),
              method.c_str(), path.c_str(), static_cast<unsigned>(route.status));

    auto submitted = session.h2->submit_response(stream.id(), route.status,
                                                 std::move(response_headers), route.body);
    if (submitted.is_err()) {
        LOG_WARN("HTTP2", "conn=%llu stream=%u response rejected: %s", ull(session.id),
                 stream.id(), core::error_code_name(submitted.error()));
        recorder_.end(pending.timing, route.status, 0, true);
        session.requests.erase(stream.id());
    }
}

void Http2Terminator::on_stream_event(Session& session, const http2::Http2Stream& stream,
                                      http2::StreamEvent event) {
    auto it = session.requests.find(stream.id());
    if (it == session.requests.end()) {
        return;
    }
    PendingRequest& pending = it->second;

    switch (event) {
        case http2::StreamEvent::FIRST_BYTE:
            recorder_.mark_first_byte(pending.timing);
            return;
        case http2::StreamEvent::COMPLETE:
            // END_STREAM is only queued here; the request counts once it
            // has been written to the socket
            session.unflushed.push_back(std::move(pending));
            break;
        case http2::StreamEvent::RESET:
            LOG_DEBUG("HTTP2", "conn=%llu stream=%u reset before completion",
                      ull(session.id), stream.id());
            recorder_.end(pending.timing, pending.status, stream.body_sent(), true);
            break;
    }
    session.requests.erase(it);
}

void Http2Terminator::begin_drain(Session& session) {
    if (session.state != SessionState::ACTIVE) {
        return;
    }
    session.state = SessionState::DRAINING;
    session.h2->start_drain();
    LOG_DEBUG("HTTP2", "conn=%llu draining, %zu stream(s) in flight",
              ull(session.id), session.h2->stream_count());
}

void Http2Terminator::housekeeping(Worker& worker) {
    uint64_t now = now_us();
    std::vector<int> expired;
    for (auto& entry : worker.sessions) {
        Session& session = *entry.second;
        uint64_t idle_us = now - session.last_activity_us;
        if (session.state == SessionState::HANDSHAKING) {
            if (idle_us > static_cast<uint64_t>(config_.handshake_timeout_ms) * 1000) {
                expired.push_back(entry.first);
            }
            continue;
        }
        if (session.state == SessionState::ACTIVE && session.requests.empty() &&
            idle_us > static_cast<uint64_t>(config_.idle_timeout_ms) * 1000) {
            LOG_DEBUG("Server", "HTTP/2 conn=%llu idle for %llums",
                      ull(session.id), ull(idle_us / 1000));
            begin_drain(session);
            write_output(session);
            if (session.state == SessionState::CLOSED) {
                expired.push_back(entry.first);
            }
        }
    }
    for (int fd : expired) {
        auto it = worker.sessions.find(fd);
        if (it == worker.sessions.end()) continue;
        close_session(worker, fd, it->second->state == SessionState::HANDSHAKING
                                      ? "TLS handshake timed out" : "idle timeout");
    }
}

void Http2Terminator::close_session(Worker& worker, int fd, const char* reason) {
    auto it = worker.sessions.find(fd);
    if (it == worker.sessions.end()) {
        return;
    }
    std::unique_ptr<Session> session = std::move(it->second);
    worker.sessions.erase(it);

    if (session->counted) {
        for (auto& entry : session->requests) {
            recorder_.end(entry.second.timing, entry.second.status, 0, true);
        }
        session->requests.clear();
        for (auto& pending : session->unflushed) {
            recorder_.end(pending.timing, pending.status, 0, true);
        }
        session->unflushed.clear();
        metrics_.connection_closed(Protocol::HTTP2);
        LOG_DEBUG("Server", "HTTP/2 conn=%llu closed: %s", ull(session->id), reason);
    } else {
        metrics_.record_handshake_failure(Protocol::HTTP2);
        LOG_WARN("TLS", "HTTP/2 conn=%llu from %s: %s%s%s", ull(session->id),
                 session->peer.c_str(), reason,
                 session->tls->get_error().empty() ? "" : ": ",
                 session->tls->get_error().c_str());
    }

    if (worker.loop != nullptr) {
        worker.loop->remove_fd(fd);
    }
    if (session->tls->is_handshake_complete()) {
        session->tls->shutdown();
    }
    active_connections_.fetch_sub(1, std::memory_order_acq_rel);
}

void Http2Terminator::close_all(Worker& worker, const char* reason) {
    std::vector<int> fds;
    fds.reserve(worker.sessions.size());
    for (auto& entry : worker.sessions) fds.push_back(entry.first);
    for (int fd : fds) {
        close_session(worker, fd, reason);
    }
}

} // namespace server
} // namespace dualmeter
