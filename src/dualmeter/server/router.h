#pragma once

#include "content_store.h"
#include "metrics.h"
#include "protocol.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dualmeter {
namespace server {

/**
 * Request headers with lowercase names.
 */
using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * Protocol-neutral response description. The terminators add framing
 * and protocol-specific headers.
 */
struct RouteResponse {
    uint16_t status{200};
    std::string content_type;
    std::shared_ptr<const std::string> body;   // Null for HEAD and empty bodies
    uint64_t content_length{0};                // Length of the GET body
    std::vector<std::pair<std::string, std::string>> headers;   // Lowercase names
};

struct RouterConfig {
    uint16_t http2_port{8443};
    uint16_t http3_port{8444};
    uint64_t max_payload{64ULL * 1024 * 1024};
};

/**
 * Maps (protocol, method, path, headers) to a response.
 *
 * Order: traversal check, content store, /health, /status,
 * /protocol-info (/quic-info), /payload/<n>, then 404. GET and HEAD are
 * served; other methods on a known path get 405.
 *
 * Stateless apart from the shared content and metrics references, so one
 * instance is shared by every worker thread.
 */
class Router {
public:
    Router(const RouterConfig& config,
           const ContentStoreHandle& content,
           const MetricsAggregator& metrics,
           uint64_t start_us = now_us());

    /**
     * @param target Request path, possibly with a query string
     */
    RouteResponse route(Protocol protocol,
                        const std::string& method,
                        const std::string& target,
                        const HeaderMap& headers) const;

    /**
     * True if the path is unsafe: a ".." segment in raw or percent-decoded
     * form, a backslash, a NUL byte, or broken percent-encoding.
     */
    static bool is_traversal(const std::string& path);

    /**
     * Percent-decode.
     *
     * @return false on a truncated or non-hex escape
     */
    static bool percent_decode(const std::string& in, std::string& out);

    std::string status_json(Protocol protocol) const;
    std::string protocol_info_json(Protocol protocol) const;

    const RouterConfig& config() const noexcept { return config_; }

    /**
     * Report the bound ports. Not thread-safe, call before serving.
     */
    void set_ports(uint16_t http2_port, uint16_t http3_port) noexcept {
        config_.http2_port = http2_port;
        config_.http3_port = http3_port;
    }

private:
    RouteResponse make_text(uint16_t status, const char* text, bool head) const;
    RouteResponse make_method_not_allowed() const;
    RouteResponse make_json(std::string json, bool head) const;
    RouteResponse make_payload(const std::string& count, bool head) const;

    RouterConfig config_;
    const ContentStoreHandle& content_;
    const MetricsAggregator& metrics_;
    uint64_t start_us_;
};

} // namespace server
} // namespace dualmeter
