#pragma once

#include "server_config.h"
#include "content_store.h"
#include "metrics.h"
#include "router.h"
#include "h2_terminator.h"
#include "h3_terminator.h"
#include "../net/tls_context.h"
#include "../http/quic/quic_tls.h"
#include <memory>
#include <string>

namespace dualmeter {
namespace server {

constexpr int kExitClean = 0;
constexpr int kExitFatal = 1;
constexpr int kExitInterrupted = 130;

/**
 * Line printed to stderr when startup fails, newline included.
 */
std::string startup_failure_message(const std::string& stage);

/**
 * Owns every server component and drives startup, signal handling and
 * shutdown on the calling thread.
 *
 * Startup order: content -> tls -> bind-http2 -> bind-http3 -> start.
 * SIGINT/SIGTERM drain both terminators for up to grace_period_s; a second
 * termination signal during the drain aborts it with exit code 130.
 * SIGHUP reloads the content root and swaps the snapshot in.
 */
class Lifecycle {
public:
    explicit Lifecycle(const ServerConfig& config);
    ~Lifecycle();

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    /**
     * Block SIGINT, SIGTERM and SIGHUP in the calling thread. Must run
     * before any other thread starts so every thread inherits the mask.
     */
    static void block_signals();

    /**
     * Start, serve until a termination signal, shut down.
     *
     * @return Process exit code
     */
    int run();

    /**
     * Startup stage that failed, empty after a successful start.
     */
    const std::string& failed_stage() const noexcept { return failed_stage_; }

    const MetricsAggregator& metrics() const noexcept { return metrics_; }

private:
    bool startup();
    bool fail(const char* stage, const std::string& message);
    void write_ready_file();
    void remove_ready_file();
    void reload_content();

    /**
     * Drain, wait out the grace period, force-close.
     *
     * @return kExitClean, or kExitInterrupted on a second signal
     */
    int shutdown(int signo);

    size_t active_connections() const;
    void stop_terminators();

    ServerConfig config_;
    MetricsAggregator metrics_;
    std::unique_ptr<ContentStoreHandle> content_;
    std::shared_ptr<net::TlsContext> tls_;
    std::shared_ptr<net::TlsContext> quic_tls_;
    std::unique_ptr<Router> router_;
    std::unique_ptr<Http2Terminator> http2_;
    std::unique_ptr<Http3Terminator> http3_;
    std::string failed_stage_;
    bool ready_file_written_{false};
};

} // namespace server
} // namespace dualmeter
