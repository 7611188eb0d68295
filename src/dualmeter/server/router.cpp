#include "router.h"
#include "../core/logger.h"
#include <cstdio>
#include <sstream>

namespace dualmeter {
namespace server {

namespace {

constexpr const char* kNotFoundBody = "Not Found\n";
constexpr const char* kBadRequestBody = "Bad Request\n";
constexpr const char* kMethodNotAllowedBody = "Method Not Allowed\n";
constexpr const char* kAllowedMethods = "GET, HEAD";

constexpr const char kPayloadPattern[] = "abcdefghijklmnopqrstuvwxyz0123456789";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool has_dotdot_segment(const std::string& path) noexcept {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find_first_of("/\\", start);
        if (end == std::string::npos) end = path.size();
        if (end - start == 2 && path[start] == '.' && path[start + 1] == '.') {
            return true;
        }
        start = end + 1;
    }
    return false;
}

bool unsafe_chars(const std::string& path) noexcept {
    return path.find('\\') != std::string::npos || path.find('\0') != std::string::npos;
}

std::string format_ms(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", ms);
    return buf;
}

} // namespace

Router::Router(const RouterConfig& config,
               const ContentStoreHandle& content,
               const MetricsAggregator& metrics,
               uint64_t start_us)
    : config_(config), content_(content), metrics_(metrics), start_us_(start_us) {
}

bool Router::percent_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return false;
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

bool Router::is_traversal(const std::string& path) {
    if (unsafe_chars(path) || has_dotdot_segment(path)) {
        return true;
    }
    std::string decoded;
    if (!percent_decode(path, decoded)) {
        return true;
    }
    // Double-encoded forms (%252e) decode to a new escape
    if (decoded.find('%') != std::string::npos) {
        std::string twice;
        if (percent_decode(decoded, twice) && (unsafe_chars(twice) || has_dotdot_segment(twice))) {
            return true;
        }
    }
    return unsafe_chars(decoded) || has_dotdot_segment(decoded);
}

RouteResponse Router::route(Protocol protocol,
                            const std::string& method,
                            const std::string& target,
                            const HeaderMap& headers) const {
    (void)headers;
    const bool head = method == "HEAD";
    const bool allowed = method == "GET" || head;

    std::string raw_path = target.substr(0, target.find_first_of("?#"));
    std::string path;
    if (raw_path.empty() || raw_path[0] != '/' || is_traversal(raw_path) ||
        !percent_decode(raw_path, path)) {
        LOG_DEBUG("Router", "%s rejected path %s", protocol_name(protocol), target.c_str());
        return make_text(400, kBadRequestBody, head);
    }

    RouteResponse response;
    std::shared_ptr<const ContentStore> store = content_.get();
    const ContentEntry* entry = store ? store->find(path) : nullptr;

    if (entry != nullptr) {
        if (!allowed) return make_method_not_allowed();
        response.status = 200;
        response.content_type = entry->content_type;
        response.content_length = entry->size;
        if (!head && entry->size > 0) {
            response.body = entry->body;
        }
        response.headers.emplace_back("etag", entry->etag);
        response.headers.emplace_back("cache-control", "no-cache");
        return response;
    }

    if (path == "/health") {
        if (!allowed) return make_method_not_allowed();
        response = make_text(200, "OK", head);
        response.headers.emplace_back("cache-control", "no-store");
        return response;
    }
    if (path == "/status") {
        if (!allowed) return make_method_not_allowed();
        return make_json(status_json(protocol), head);
    }
    if (path == "/protocol-info" || path == "/quic-info") {
        if (!allowed) return make_method_not_allowed();
        return make_json(protocol_info_json(protocol), head);
    }
    if (path.compare(0, 9, "/payload/") == 0) {
        if (!allowed) return make_method_not_allowed();
        return make_payload(path.substr(9), head);
    }

    return make_text(404, kNotFoundBody, head);
}

RouteResponse Router::make_method_not_allowed() const {
    RouteResponse response = make_text(405, kMethodNotAllowedBody, false);
    response.headers.emplace_back("allow", kAllowedMethods);
    return response;
}

RouteResponse Router::make_text(uint16_t status, const char* text, bool head) const {
    RouteResponse response;
    response.status = status;
    response.content_type = "text/plain; charset=utf-8";
    auto body = std::make_shared<const std::string>(text);
    response.content_length = body->size();
    if (!head) response.body = std::move(body);
    return response;
}

RouteResponse Router::make_json(std::string json, bool head) const {
    RouteResponse response;
    response.status = 200;
    response.content_type = "application/json";
    response.content_length = json.size();
    if (!head) response.body = std::make_shared<const std::string>(std::move(json));
    response.headers.emplace_back("cache-control", "no-store");
    return response;
}

RouteResponse Router::make_payload(const std::string& count, bool head) const {
    if (count.empty() || count.size() > 19 ||
        count.find_first_not_of("0123456789") != std::string::npos) {
        return make_text(400, kBadRequestBody, head);
    }
    uint64_t n = std::stoull(count);
    if (n > config_.max_payload) {
        return make_text(400, kBadRequestBody, head);
    }

    RouteResponse response;
    response.status = 200;
    response.content_type = "application/octet-stream";
    response.content_length = n;
    response.headers.emplace_back("cache-control", "no-store");
    if (!head && n > 0) {
        std::string body;
        body.resize(static_cast<size_t>(n));
        constexpr size_t pattern_len = sizeof(kPayloadPattern) - 1;
        for (size_t i = 0; i < body.size(); i++) {
            body[i] = kPayloadPattern[i % pattern_len];
        }
        response.body = std::make_shared<const std::string>(std::move(body));
    }
    return response;
}

std::string Router::status_json(Protocol protocol) const {
    ProtocolSnapshot snap = metrics_.snapshot(protocol);
    uint64_t now = now_us();
    uint64_t uptime = now > start_us_ ? (now - start_us_) / 1000000 : 0;

    std::ostringstream out;
    out << "{\"protocol\":\"" << protocol_name(protocol) << "\""
        << ",\"uptime_seconds\":" << uptime
        << ",\"counters\":{\"count\":" << snap.count
        << ",\"avg_ms\":" << format_ms(snap.avg_ms())
        << ",\"min_ms\":" << format_ms(snap.min_ms)
        << ",\"max_ms\":" << format_ms(snap.max_ms)
        << ",\"avg_ttfb_ms\":" << format_ms(snap.avg_ttfb_ms()) << "}"
        << ",\"incomplete\":" << snap.incomplete
        << ",\"bytes_out\":" << snap.bytes_out
        << ",\"connections\":" << snap.connections
        << ",\"active_connections\":" << snap.active_connections
        << ",\"handshake_failures\":" << snap.handshake_failures
        << ",\"avg_handshake_ms\":" << format_ms(snap.avg_handshake_ms())
        << ",\"histogram\":{";
    for (size_t i = 0; i < kHistogramBuckets; i++) {
        if (i > 0) out << ",";
        if (i < kHistogramBoundsMs.size()) {
            out << "\"" << static_cast<uint64_t>(kHistogramBoundsMs[i]) << "\":";
        } else {
            out << "\"+inf\":";
        }
        out << snap.histogram[i];
    }
    out << "}}";
    return out.str();
}

std::string Router::protocol_info_json(Protocol protocol) const {
    std::ostringstream out;
    out << "{\"protocol\":\"" << protocol_name(protocol) << "\""
        << ",\"transport\":\"" << (protocol == Protocol::HTTP2 ? "TLS/TCP" : "QUIC/UDP") << "\""
        << ",\"alpn\":\"" << (protocol == Protocol::HTTP2 ? "h2" : "h3") << "\""
        << ",\"http2_port\":" << config_.http2_port
        << ",\"http3_port\":" << config_.http3_port
        << ",\"alt_svc\":\"h3=\\\":" << config_.http3_port << "\\\"\"}";
    return out.str();
}

} // namespace server
} // namespace dualmeter
