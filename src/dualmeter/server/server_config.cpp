#include "server_config.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace dualmeter {
namespace server {

namespace {

enum class Key {
    HOST, HTTP2_PORT, HTTP3_PORT, CERT, KEY, CONTENT_ROOT, IDLE_TIMEOUT,
    GRACE_PERIOD, LOG_LEVEL, WORKERS, MAX_PAYLOAD, READY_FILE, LOG_FILE
};

struct Option {
    Key key;
    const char* flag;
    const char* env;
    const char* help;
};

constexpr Option kOptions[] = {
    {Key::HOST, "host", "DUALMETER_HOST", "bind address (default 0.0.0.0)"},
    {Key::HTTP2_PORT, "http2-port", "HTTP2_PORT", "HTTP/2 TCP port (default 8443)"},
    {Key::HTTP3_PORT, "http3-port", "HTTP3_PORT", "HTTP/3 UDP port (default 8444)"},
    {Key::CERT, "cert", "DUALMETER_CERT", "certificate PEM (default certs/server.crt)"},
    {Key::KEY, "key", "DUALMETER_KEY", "private key PEM (default certs/server.key)"},
    {Key::CONTENT_ROOT, "content-root", "DUALMETER_CONTENT_ROOT", "static content directory (default web)"},
    {Key::IDLE_TIMEOUT, "idle-timeout", "DUALMETER_IDLE_TIMEOUT", "idle connection timeout, seconds (default 60)"},
    {Key::GRACE_PERIOD, "grace-period", "DUALMETER_GRACE_PERIOD", "shutdown drain period, seconds (default 5)"},
    {Key::LOG_LEVEL, "log-level", "LOG_LEVEL", "debug, info, warn or error (default info)"},
    {Key::WORKERS, "workers", "DUALMETER_WORKERS", "worker threads per protocol, 0 = auto (default 0)"},
    {Key::MAX_PAYLOAD, "max-payload", "DUALMETER_MAX_PAYLOAD", "largest /payload/<n> in bytes (default 67108864)"},
    {Key::READY_FILE, "ready-file", "DUALMETER_READY_FILE", "file created once both listeners are up"},
    {Key::LOG_FILE, "log-file", "DUALMETER_LOG_FILE", "log to this file instead of stderr"},
};

bool parse_uint(const std::string& text, uint64_t max, uint64_t& out) {
    if (text.empty() || text.size() > 20 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v > max) {
        return false;
    }
    out = v;
    return true;
}

/**
 * Apply one value. Returns false with error set on a malformed value.
 */
bool apply(ServerConfig& config, Key key, const std::string& value,
           const std::string& source, std::string& error) {
    uint64_t n = 0;
    switch (key) {
        case Key::HOST:
            if (value.empty()) break;
            config.host = value;
            return true;
        case Key::HTTP2_PORT:
        case Key::HTTP3_PORT:
            if (!parse_uint(value, 65535, n) || n == 0) {
                error = source + ": port must be 1..65535, got '" + value + "'";
                return false;
            }
            (key == Key::HTTP2_PORT ? config.http2_port : config.http3_port) = static_cast<uint16_t>(n);
            return true;
        case Key::CERT:
            if (value.empty()) break;
            config.cert_file = value;
            return true;
        case Key::KEY:
            if (value.empty()) break;
            config.key_file = value;
            return true;
        case Key::CONTENT_ROOT:
            if (value.empty()) break;
            config.content_root = value;
            return true;
        case Key::IDLE_TIMEOUT:
            if (!parse_uint(value, 86400, n) || n == 0) {
                error = source + ": idle timeout must be 1..86400 seconds, got '" + value + "'";
                return false;
            }
            config.idle_timeout_s = static_cast<uint32_t>(n);
            return true;
        case Key::GRACE_PERIOD:
            if (!parse_uint(value, 3600, n)) {
                error = source + ": grace period must be 0..3600 seconds, got '" + value + "'";
                return false;
            }
            config.grace_period_s = static_cast<uint32_t>(n);
            return true;
        case Key::LOG_LEVEL: {
            core::LogLevel level;
            if (!core::parse_log_level(value, level)) {
                error = source + ": unknown log level '" + value + "'";
                return false;
            }
            config.log_level = level;
            return true;
        }
        case Key::WORKERS:
            if (!parse_uint(value, 1024, n)) {
                error = source + ": workers must be 0..1024, got '" + value + "'";
                return false;
            }
            config.workers = static_cast<uint16_t>(n);
            return true;
        case Key::MAX_PAYLOAD:
            if (!parse_uint(value, 1ULL << 40, n)) {
                error = source + ": max payload must be a byte count, got '" + value + "'";
                return false;
            }
            config.max_payload = n;
            return true;
        case Key::READY_FILE:
            config.ready_file = value;
            return true;
        case Key::LOG_FILE:
            config.log_file = value;
            return true;
    }
    error = source + ": value must not be empty";
    return false;
}

const Option* find_flag(const std::string& name) {
    for (const auto& opt : kOptions) {
        if (name == opt.flag) return &opt;
    }
    return nullptr;
}

} // namespace

core::result<ServerConfig> load_config(int argc, const char* const* argv,
                                       const EnvLookup& env, std::string* error) {
    ServerConfig config;
    std::string message;

    auto fail = [&]() {
        if (error) *error = message;
        return core::error_code::config_error;
    };

    for (const auto& opt : kOptions) {
        const char* value = env ? env(opt.env) : std::getenv(opt.env);
        if (value == nullptr) continue;
        if (!apply(config, opt.key, value, opt.env, message)) {
            return fail();
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        }
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            message = "unexpected argument '" + arg + "'";
            return fail();
        }

        std::string name = arg.substr(2);
        std::string value;
        bool has_value = false;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.resize(eq);
            has_value = true;
        }

        const Option* opt = find_flag(name);
        if (opt == nullptr) {
            message = "unknown flag --" + name;
            return fail();
        }
        if (!has_value) {
            if (i + 1 >= argc) {
                message = "--" + name + " needs a value";
                return fail();
            }
            value = argv[++i];
        }
        if (!apply(config, opt->key, value, "--" + name, message)) {
            return fail();
        }
    }

    if (config.http2_port == config.http3_port) {
        message = "HTTP/2 and HTTP/3 ports must differ (both " +
                  std::to_string(config.http2_port) + ")";
        return fail();
    }
    return config;
}

std::string usage(const char* program) {
    std::string out = "Usage: ";
    out += program != nullptr ? program : "dualmeter";
    out += " [options]\n\nServes the same content over HTTP/2 (TLS/TCP) and HTTP/3 (QUIC/UDP)\n"
           "and records per-request timing for both.\n\nOptions:\n";
    for (const auto& opt : kOptions) {
        std::string flag = std::string("  --") + opt.flag + " <value>";
        if (flag.size() < 28) flag.resize(28, ' ');
        out += flag + opt.help + " [" + opt.env + "]\n";
    }
    out += "  -h, --help                print this help\n";
    return out;
}

} // namespace server
} // namespace dualmeter
