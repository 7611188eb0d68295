#pragma once

#include "../core/logger.h"
#include "../core/result.h"
#include <cstdint>
#include <functional>
#include <string>

namespace dualmeter {
namespace server {

/**
 * Server configuration. Defaults apply when neither a flag nor an
 * environment variable sets a value; flags win over the environment.
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t http2_port = 8443;
    uint16_t http3_port = 8444;
    std::string cert_file = "certs/server.crt";
    std::string key_file = "certs/server.key";
    std::string content_root = "web";
    uint32_t idle_timeout_s = 60;
    uint32_t grace_period_s = 5;
    core::LogLevel log_level = core::LogLevel::INFO;
    uint16_t workers = 0;                         // 0 = auto
    uint64_t max_payload = 64ULL * 1024 * 1024;   // Largest /payload/<n>
    std::string ready_file;                       // Empty = none
    std::string log_file;                         // Empty = stderr

    bool show_help = false;
};

/**
 * Environment lookup, getenv() semantics.
 */
using EnvLookup = std::function<const char*(const char*)>;

/**
 * Build the configuration from flags and environment.
 *
 * Accepts "--name value" and "--name=value". "--help" / "-h" sets
 * show_help and stops parsing.
 *
 * @param env Environment lookup, getenv when empty
 * @param error Names the offending flag or variable on failure
 * @return Config, or config_error
 */
core::result<ServerConfig> load_config(int argc, const char* const* argv,
                                       const EnvLookup& env = EnvLookup(),
                                       std::string* error = nullptr);

/**
 * Usage text for --help.
 */
std::string usage(const char* program);

} // namespace server
} // namespace dualmeter
