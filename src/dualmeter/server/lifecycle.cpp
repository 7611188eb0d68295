#include "lifecycle.h"
#include "../core/logger.h"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <pthread.h>
#include <unistd.h>

namespace dualmeter {
namespace server {

namespace {

constexpr long kDrainPollMs = 100;

sigset_t handled_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

/**
 * Wait for one of the handled signals.
 *
 * @return Signal number, or 0 on timeout
 */
int wait_signal(long timeout_ms) {
    sigset_t set = handled_signals();
    struct timespec ts;
    ts.tv_sec = timeout_ms / 1000;
    ts.tv_nsec = (timeout_ms % 1000) * 1000000L;
    while (true) {
        int signo = sigtimedwait(&set, nullptr, &ts);
        if (signo >= 0) return signo;
        if (errno == EAGAIN) return 0;
        if (errno != EINTR) {
            LOG_ERROR("Lifecycle", "sigtimedwait failed: %s", std::strerror(errno));
            return 0;
        }
    }
}

} // namespace

std::string startup_failure_message(const std::string& stage) {
    return "dualmeter: startup failed at stage " + stage + "\n";
}

Lifecycle::Lifecycle(const ServerConfig& config)
    : config_(config) {}

Lifecycle::~Lifecycle() {
    stop_terminators();
    remove_ready_file();
}

void Lifecycle::block_signals() {
    sigset_t set = handled_signals();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

int Lifecycle::run() {
    if (!startup()) {
        stop_terminators();
        return kExitFatal;
    }

    int exit_code = kExitClean;
    while (true) {
        int signo = wait_signal(1000);
        if (signo == 0) continue;
        if (signo == SIGHUP) {
            reload_content();
            continue;
        }
        exit_code = shutdown(signo);
        break;
    }

    metrics_.log_snapshot("final");
    remove_ready_file();
    LOG_INFO("Lifecycle", "Exiting with code %d", exit_code);
    return exit_code;
}

bool Lifecycle::fail(const char* stage, const std::string& message) {
    failed_stage_ = stage;
    LOG_ERROR("Lifecycle", "Startup failed at stage %s: %s", stage, message.c_str());
    return false;
}

bool Lifecycle::startup() {
    LOG_INFO("Lifecycle", "Starting pid=%d workers=%u log-level=%s", static_cast<int>(getpid()),
             static_cast<unsigned>(config_.workers), core::log_level_name(config_.log_level));

    // Content
    std::string error;
    auto store = ContentStore::load(config_.content_root, &error);
    if (store.is_err()) {
        return fail("content", error);
    }
    content_ = std::make_unique<ContentStoreHandle>(std::move(store.value()));

    // TLS: one certificate for both listeners, separate ALPN and protocol limits
    net::TlsContextConfig tls_config;
    tls_config.cert_file = config_.cert_file;
    tls_config.key_file = config_.key_file;
    tls_config.alpn_protocols = {"h2"};
    tls_ = net::TlsContext::create_server(tls_config, &error);
    if (!tls_) {
        return fail("tls", error);
    }
    net::TlsContextConfig quic_tls_config;
    quic_tls_config.cert_file = config_.cert_file;
    quic_tls_config.key_file = config_.key_file;
    quic_tls_ = quic::QuicTls::create_server_context(quic_tls_config, &error);
    if (!quic_tls_) {
        return fail("tls", error);
    }

    RouterConfig router_config;
    router_config.http2_port = config_.http2_port;
    router_config.http3_port = config_.http3_port;
    router_config.max_payload = config_.max_payload;
    router_ = std::make_unique<Router>(router_config, *content_, metrics_);

    // HTTP/2
    Http2TerminatorConfig h2_config;
    h2_config.host = config_.host;
    h2_config.port = config_.http2_port;
    h2_config.num_workers = config_.workers;
    h2_config.idle_timeout_ms = config_.idle_timeout_s * 1000;
    h2_config.alt_svc_port = config_.http3_port;
    http2_ = std::make_unique<Http2Terminator>(h2_config, tls_, *router_, metrics_);
    if (http2_->bind() != 0) {
        return fail("bind-http2", config_.host + ":" + std::to_string(config_.http2_port) +
                                  ": " + std::strerror(errno));
    }

    // HTTP/3
    Http3TerminatorConfig h3_config;
    h3_config.host = config_.host;
    h3_config.port = config_.http3_port;
    h3_config.num_workers = config_.workers;
    h3_config.idle_timeout_ms = config_.idle_timeout_s * 1000;
    http3_ = std::make_unique<Http3Terminator>(h3_config, quic_tls_, *router_, metrics_);
    if (http3_->bind() != 0) {
        return fail("bind-http3", config_.host + ":" + std::to_string(config_.http3_port) +
                                  ": " + std::strerror(errno));
    }

    // Port 0 binds an ephemeral port; advertise what was actually bound
    router_->set_ports(http2_->port(), http3_->port());
    http2_->set_alt_svc_port(http3_->port());

    if (http2_->start() != 0) {
        return fail("bind-http2", "cannot start workers");
    }
    if (http3_->start() != 0) {
        return fail("bind-http3", "cannot start workers");
    }

    LOG_INFO("Lifecycle", "ready http2=%s:%u http3=%s:%u", config_.host.c_str(),
             http2_->port(), config_.host.c_str(), http3_->port());
    write_ready_file();
    return true;
}

void Lifecycle::write_ready_file() {
    if (config_.ready_file.empty()) {
        return;
    }
    std::ofstream out(config_.ready_file, std::ios::trunc);
    if (!out) {
        LOG_WARN("Lifecycle", "Cannot write ready file %s", config_.ready_file.c_str());
        return;
    }
    out << "ready " << getpid() << " http2=" << http2_->port()
        << " http3=" << http3_->port() << "\n";
    ready_file_written_ = true;
}

void Lifecycle::remove_ready_file() {
    if (!ready_file_written_) {
        return;
    }
    std::remove(config_.ready_file.c_str());
    ready_file_written_ = false;
}

void Lifecycle::reload_content() {
    std::string error;
    auto store = ContentStore::load(config_.content_root, &error);
    if (store.is_err()) {
        LOG_WARN("Content", "Reload failed, keeping previous content: %s", error.c_str());
        return;
    }
    size_t files = store.value()->file_count();
    content_->swap(std::move(store.value()));
    LOG_INFO("Content", "Reloaded %zu file(s) from %s", files, config_.content_root.c_str());
}

int Lifecycle::shutdown(int signo) {
    LOG_INFO("Lifecycle", "Received %s, draining for up to %us",
             signo == SIGINT ? "SIGINT" : "SIGTERM", config_.grace_period_s);
    remove_ready_file();

    http2_->drain();
    http3_->drain();

    int exit_code = kExitClean;
    long remaining_ms = static_cast<long>(config_.grace_period_s) * 1000;
    while (active_connections() > 0) {
        if (remaining_ms <= 0) {
            LOG_WARN("Lifecycle", "Grace period exceeded, force-closing %zu connection(s)",
                     active_connections());
            break;
        }
        int next = wait_signal(remaining_ms < kDrainPollMs ? remaining_ms : kDrainPollMs);
        remaining_ms -= kDrainPollMs;
        if (next == SIGINT || next == SIGTERM) {
            LOG_WARN("Lifecycle", "Second termination signal, aborting drain");
            exit_code = kExitInterrupted;
            break;
        }
        if (next == SIGHUP) {
            LOG_DEBUG("Lifecycle", "Ignoring SIGHUP while draining");
        }
    }

    http2_->force_close();
    http3_->force_close();
    stop_terminators();
    return exit_code;
}

size_t Lifecycle::active_connections() const {
    return http2_->active_connections() + http3_->active_connections();
}

void Lifecycle::stop_terminators() {
    if (http2_) http2_->stop();
    if (http3_) http3_->stop();
}

} // namespace server
} // namespace dualmeter
