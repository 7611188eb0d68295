#include "h3_terminator.h"
#include "../core/logger.h"
#include <cerrno>
#include <cstring>

namespace dualmeter {
namespace server {

namespace {

inline unsigned long long ull(uint64_t v) { return static_cast<unsigned long long>(v); }

} // namespace

Http3Terminator::Http3Terminator(const Http3TerminatorConfig& config,
                                 std::shared_ptr<net::TlsContext> tls,
                                 const Router& router,
                                 MetricsAggregator& metrics)
    : config_(config),
      tls_(std::move(tls)),
      router_(router),
      metrics_(metrics),
      recorder_(metrics, Protocol::HTTP3) {
    transport_params_.max_idle_timeout_ms = config_.idle_timeout_ms;
    transport_params_.initial_max_data = config_.connection_window;
    transport_params_.initial_max_stream_data_bidi_local = config_.stream_window;
    transport_params_.initial_max_stream_data_bidi_remote = config_.stream_window;
    transport_params_.initial_max_stream_data_uni = config_.stream_window;
    transport_params_.initial_max_streams_bidi = config_.max_streams_bidi;
    transport_params_.initial_max_streams_uni = 3;   // control, QPACK encoder, QPACK decoder

    net::UdpListenerConfig listener_config;
    listener_config.host = config_.host;
    listener_config.port = config_.port;
    listener_config.num_workers = config_.num_workers;

    listener_ = std::make_unique<net::UdpListener>(
        listener_config,
        [this](const uint8_t* data, size_t len, const struct sockaddr* addr,
               socklen_t addrlen, uint16_t worker_id, net::UdpSocket& socket) {
            on_datagram(data, len, addr, addrlen, worker_id, socket);
        });
    listener_->set_worker_hooks(
        [this](uint16_t id, net::EventLoop* loop) { on_worker_start(id, loop); },
        [this](uint16_t id, net::EventLoop* loop) { on_worker_stop(id, loop); });

    for (uint16_t i = 0; i < listener_->num_workers(); i++) {
        workers_.push_back(std::make_unique<Worker>());
    }
}

Http3Terminator::~Http3Terminator() {
    stop();
}

int Http3Terminator::bind() {
    return listener_->bind();
}

int Http3Terminator::start() {
    return listener_->start();
}

void Http3Terminator::drain() {
    listener_->post_to_workers([this](uint16_t worker_id, net::EventLoop*) {
        Worker& worker = *workers_[worker_id];
        worker.draining = true;

        std::vector<uint64_t> ids;
        for (auto& entry : worker.sessions) ids.push_back(entry.first);
        for (uint64_t id : ids) {
            auto it = worker.sessions.find(id);
            if (it == worker.sessions.end()) continue;
            Session& session = *it->second;
            if (!session.h3->handshake_complete()) {
                session.h3->close(http3::ErrorCode::NO_ERROR, "shutdown", now_us());
            } else {
                session.h3->start_drain();
            }
            service(worker, session);
        }
    });
}

void Http3Terminator::force_close() {
    listener_->post_to_workers([this](uint16_t worker_id, net::EventLoop*) {
        close_all(*workers_[worker_id], "grace period elapsed");
    });
}

void Http3Terminator::stop() {
    if (listener_) {
        listener_->stop();
        listener_->join();
    }
}

// ============================================================================
// Worker threads
// ============================================================================

void Http3Terminator::on_worker_start(uint16_t worker_id, net::EventLoop* loop) {
    workers_[worker_id]->loop = loop;
}

void Http3Terminator::on_worker_stop(uint16_t worker_id, net::EventLoop*) {
    Worker& worker = *workers_[worker_id];
    close_all(worker, "worker stopped");
    worker.loop = nullptr;
}

void Http3Terminator::on_datagram(const uint8_t* data, size_t len,
                                  const struct sockaddr* addr, socklen_t addrlen,
                                  uint16_t worker_id, net::UdpSocket& socket) {
    if (len == 0) {
        return;
    }
    Worker& worker = *workers_[worker_id];

    Session* session = lookup(worker, data, len);
    if (session == nullptr) {
        quic::LongHeader header;
        switch (quic::classify_client_initial(data, len, header)) {
            case quic::InitialDisposition::ACCEPT:
                if (worker.draining) {
                    LOG_DEBUG("QUIC", "Ignoring new connection while draining");
                    return;
                }
                session = create_session(worker, header, addr, addrlen, socket);
                if (session == nullptr) {
                    metrics_.record_handshake_failure(Protocol::HTTP3);
                    return;
                }
                break;
            case quic::InitialDisposition::VERSION_NEGOTIATION:
                send_version_negotiation(header, addr, addrlen, socket);
                return;
            case quic::InitialDisposition::MALFORMED:
                LOG_WARN("QUIC", "Malformed Initial of %zu bytes dropped", len);
                metrics_.record_handshake_failure(Protocol::HTTP3);
                return;
            case quic::InitialDisposition::IGNORE:
                return;
        }
    } else if (addrlen <= sizeof(session->peer)) {
        // Follow NAT rebinding
        std::memcpy(&session->peer, addr, addrlen);
        session->peer_len = addrlen;
    }

    session->h3->process_datagram(data, len, now_us());
    service(worker, *session);
}

Http3Terminator::Session* Http3Terminator::lookup(Worker& worker, const uint8_t* data, size_t len) {
    quic::ConnectionID dcid;
    if (quic::is_long_header(data[0])) {
        uint32_t version = 0;
        quic::ConnectionID scid;
        if (quic::parse_long_header_invariants(data, len, version, dcid, scid) != 0) {
            return nullptr;
        }
    } else {
        if (len < 1 + static_cast<size_t>(quic::LOCAL_CID_LENGTH)) {
            return nullptr;
        }
        dcid = quic::ConnectionID(data + 1, quic::LOCAL_CID_LENGTH);
    }

    auto it = worker.by_cid.find(dcid);
    return it == worker.by_cid.end() ? nullptr : it->second;
}

Http3Terminator::Session* Http3Terminator::create_session(Worker& worker,
                                                          const quic::LongHeader& initial,
                                                          const struct sockaddr* addr,
                                                          socklen_t addrlen,
                                                          net::UdpSocket& socket) {
    if (addrlen > sizeof(sockaddr_storage)) {
        return nullptr;
    }

    quic::ConnectionID local_cid;
    if (!quic::generate_connection_id(quic::LOCAL_CID_LENGTH, local_cid)) {
        LOG_ERROR("QUIC", "Connection ID generation failed");
        return nullptr;
    }

    uint64_t id = next_session_id_.fetch_add(1, std::memory_order_relaxed);
    if (!tls_) {
        LOG_ERROR("QUIC", "No TLS context, connection refused");
        return nullptr;
    }
    auto quic_conn = quic::QUICConnection::accept(id, local_cid, initial, transport_params_,
                                                  tls_->get_ssl_ctx(), now_us());
    if (!quic_conn) {
        return nullptr;
    }

    auto session = std::make_unique<Session>();
    session->id = id;
    session->socket = &socket;
    std::memcpy(&session->peer, addr, addrlen);
    session->peer_len = addrlen;
    session->h3 = std::make_unique<http3::Http3Connection>(std::move(quic_conn));
    session->cids.push_back(initial.dest_conn_id);
    session->cids.push_back(local_cid);

    Session* s = session.get();
    session->h3->set_handshake_callback([this, &worker, s]() { on_handshake(worker, *s); });
    session->h3->set_request_callback([this, s](const http3::Request& request) {
        on_request(*s, request);
    });
    session->h3->set_stream_event_callback([this, s](uint64_t stream_id, http3::StreamEvent event) {
        on_stream_event(*s, stream_id, event);
    });

    for (const auto& cid : session->cids) {
        worker.by_cid[cid] = s;
    }
    worker.sessions.emplace(id, std::move(session));
    active_connections_.fetch_add(1, std::memory_order_acq_rel);

    LOG_DEBUG("QUIC", "conn=%llu accepted, dcid=%s scid=%s", ull(id),
              initial.dest_conn_id.to_hex().c_str(), local_cid.to_hex().c_str());
    return s;
}

void Http3Terminator::send_version_negotiation(const quic::LongHeader& header,
                                               const struct sockaddr* addr, socklen_t addrlen,
                                               net::UdpSocket& socket) {
    uint8_t out[quic::MAX_DATAGRAM_SIZE];
    size_t n = quic::write_version_negotiation(header.source_conn_id, header.dest_conn_id,
                                               out, sizeof(out));
    if (n == 0) {
        return;
    }
    LOG_DEBUG("QUIC", "Version negotiation for version 0x%08x", header.version);
    if (socket.sendto(out, n, addr, addrlen) < 0) {
        LOG_DEBUG("QUIC", "Version negotiation send failed: %s", std::strerror(errno));
    }
}

// ============================================================================
// HTTP/3 events
// ============================================================================

void Http3Terminator::on_handshake(Worker& worker, Session& session) {
    uint64_t handshake_us = session.h3->quic().handshake_duration_us();
    session.counted = true;
    metrics_.record_connection(Protocol::HTTP3, static_cast<double>(handshake_us) / 1000.0);
    LOG_DEBUG("QUIC", "conn=%llu handshake complete in %.3fms",
              ull(session.id), static_cast<double>(handshake_us) / 1000.0);

    if (worker.draining) {
        session.h3->start_drain();
    }
}

void Http3Terminator::on_request(Session& session, const http3::Request& request) {
    PendingRequest& pending = session.requests[request.stream_id];
    recorder_.begin(pending.timing, session.h3->quic().handshake_duration_us());

    HeaderMap headers;
    headers[":authority"] = request.authority;
    headers[":scheme"] = request.scheme;
    for (const auto& field : request.headers) {
        auto it = headers.find(field.name);
        if (it == headers.end()) {
            headers.emplace(field.name, field.value);
        } else {
            it->second += ", " + field.value;
        }
    }

    RouteResponse route = router_.route(Protocol::HTTP3, request.method, request.path, headers);

    std::vector<qpack::HeaderField> response_headers;
    response_headers.reserve(route.headers.size() + 2);
    response_headers.push_back({"content-type", route.content_type});
    response_headers.push_back({"content-length", std::to_string(route.content_length)});
    for (auto& header : route.headers) {
        response_headers.push_back({header.first, header.second});
    }

    pending.status = route.status;
    pending.bytes = route.body ? route.body->size() : 0;

    LOG_DEBUG("HTTP3", "conn=%llu stream=%llu %s %s -> %u", ull(session.id),
              ull(request.stream_id), request.method.c_str(), request.path.c_str(),
              static_cast<unsigned>(route.status));

    auto submitted = session.h3->submit_response(request.stream_id, route.status,
                                                 std::move(response_headers), route.body);
    if (submitted.is_err()) {
        LOG_WARN("HTTP3", "conn=%llu stream=%llu response rejected: %s", ull(session.id),
                 ull(request.stream_id), core::error_code_name(submitted.error()));
        recorder_.end(pending.timing, route.status, 0, true);
        session.requests.erase(request.stream_id);
    }
}

void Http3Terminator::on_stream_event(Session& session, uint64_t stream_id,
                                      http3::StreamEvent event) {
    auto it = session.requests.find(stream_id);
    if (it == session.requests.end()) {
        return;
    }
    PendingRequest& pending = it->second;

    switch (event) {
        case http3::StreamEvent::FIRST_BYTE:
            recorder_.mark_first_byte(pending.timing);
            return;
        case http3::StreamEvent::COMPLETE:
            recorder_.end(pending.timing, pending.status, pending.bytes);
            break;
        case http3::StreamEvent::RESET:
            LOG_DEBUG("HTTP3", "conn=%llu stream=%llu reset before completion",
                      ull(session.id), ull(stream_id));
            recorder_.end(pending.timing, pending.status, 0, true);
            break;
    }
    session.requests.erase(it);
}

// ============================================================================
// Datagram output and timers
// ============================================================================

void Http3Terminator::service(Worker& worker, Session& session) {
    uint64_t id = session.id;
    auto& quic_conn = session.h3->quic();

    if (worker.draining && session.h3->is_drained() &&
        !quic_conn.is_closing() && !quic_conn.is_closed()) {
        session.h3->close(http3::ErrorCode::NO_ERROR, "shutdown", now_us());
    }

    flush(session);

    if (quic_conn.is_closed()) {
        remove_session(worker, id);
        return;
    }
    arm_timer(worker, session);
}

void Http3Terminator::flush(Session& session) {
    uint8_t out[quic::MAX_DATAGRAM_SIZE];
    while (true) {
        size_t n = session.h3->generate_datagram(out, sizeof(out), now_us());
        if (n == 0) {
            return;
        }
        ssize_t sent = session.socket->sendto(out, n,
                                              reinterpret_cast<const struct sockaddr*>(&session.peer),
                                              session.peer_len);
        if (sent < 0) {
            // Lost datagrams are recovered by QUIC retransmission
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_DEBUG("QUIC", "conn=%llu sendto failed: %s", ull(session.id), std::strerror(errno));
            }
            return;
        }
    }
}

void Http3Terminator::arm_timer(Worker& worker, Session& session) {
    if (worker.loop == nullptr) {
        return;
    }

    uint64_t deadline = session.h3->next_timeout();
    if (deadline == session.timer_deadline && session.timer_id >= 0) {
        return;
    }
    if (session.timer_id >= 0) {
        worker.loop->cancel_timer(session.timer_id);
        session.timer_id = -1;
        session.timer_deadline = 0;
    }
    if (deadline == 0) {
        return;
    }

    uint64_t now = now_us();
    uint64_t delay_ms = deadline > now ? (deadline - now + 999) / 1000 : 0;
    uint64_t id = session.id;
    session.timer_id = worker.loop->add_timer(delay_ms, false, [this, &worker, id]() {
        on_timer(worker, id);
    });
    if (session.timer_id >= 0) {
        session.timer_deadline = deadline;
    } else {
        LOG_ERROR("QUIC", "conn=%llu cannot arm timer", ull(id));
    }
}

void Http3Terminator::on_timer(Worker& worker, uint64_t session_id) {
    auto it = worker.sessions.find(session_id);
    if (it == worker.sessions.end()) {
        return;
    }
    Session& session = *it->second;
    session.timer_id = -1;
    session.timer_deadline = 0;

    session.h3->on_timeout(now_us());
    service(worker, session);
}

// ============================================================================
// Teardown
// ============================================================================

void Http3Terminator::remove_session(Worker& worker, uint64_t session_id) {
    auto it = worker.sessions.find(session_id);
    if (it == worker.sessions.end()) {
        return;
    }
    std::unique_ptr<Session> session = std::move(it->second);
    worker.sessions.erase(it);

    for (const auto& cid : session->cids) {
        auto cid_it = worker.by_cid.find(cid);
        if (cid_it != worker.by_cid.end() && cid_it->second == session.get()) {
            worker.by_cid.erase(cid_it);
        }
    }
    if (session->timer_id >= 0 && worker.loop != nullptr) {
        worker.loop->cancel_timer(session->timer_id);
    }

    const auto& quic_conn = session->h3->quic();
    if (session->counted) {
        for (auto& entry : session->requests) {
            recorder_.end(entry.second.timing, entry.second.status, 0, true);
        }
        metrics_.connection_closed(Protocol::HTTP3);
        LOG_DEBUG("QUIC", "conn=%llu closed (error 0x%llx%s%s)", ull(session->id),
                  ull(quic_conn.close_error_code()),
                  quic_conn.closed_by_peer() ? ", by peer" : "",
                  quic_conn.idle_timed_out() ? ", idle" : "");
    } else {
        metrics_.record_handshake_failure(Protocol::HTTP3);
        LOG_WARN("QUIC", "conn=%llu closed before handshake completed (error 0x%llx%s)",
                 ull(session->id), ull(quic_conn.close_error_code()),
                 quic_conn.handshake_failed() ? ", TLS failure" : "");
    }
    active_connections_.fetch_sub(1, std::memory_order_acq_rel);
}

void Http3Terminator::close_all(Worker& worker, const char* reason) {
    std::vector<uint64_t> ids;
    ids.reserve(worker.sessions.size());
    for (auto& entry : worker.sessions) ids.push_back(entry.first);

    uint64_t now = now_us();
    for (uint64_t id : ids) {
        auto it = worker.sessions.find(id);
        if (it == worker.sessions.end()) continue;
        Session& session = *it->second;
        if (!session.h3->quic().is_closing() && !session.h3->quic().is_closed()) {
            LOG_DEBUG("QUIC", "conn=%llu closing: %s", ull(id), reason);
            session.h3->close(http3::ErrorCode::NO_ERROR, reason, now);
            flush(session);
        }
        remove_session(worker, id);
    }
}

} // namespace server
} // namespace dualmeter
