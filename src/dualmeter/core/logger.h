#pragma once

#include <cstdio>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <set>
#include <string>

/**
 * Process-wide logger for dualmeter.
 *
 * Lines are tagged by subsystem (Server, HTTP2, HTTP3, QUIC, TLS, Metrics,
 * Content, Router, Lifecycle) and filtered at runtime by level and tag.
 * Connection-scoped lines put `conn=<id>` and, where a stream is involved,
 * `stream=<id>` first in the message so they can be grepped per connection.
 *
 * Usage:
 *   LOG_DEBUG("HTTP2", "conn=%llu stream=%u HEADERS", id, stream_id);
 *   LOG_INFO("Server", "Listening on %s:%d", host, port);
 *   LOG_WARN("QUIC", "Dropping short datagram: %zu bytes", len);
 *
 * Build-time control:
 *   DUALMETER_ENABLE_LOGGING compiles the LOG_* macros in; without it they
 *   expand to nothing.
 */

namespace dualmeter {
namespace core {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 255
};

/**
 * Parse a level name, case-insensitive. Accepts debug (or trace), info,
 * warn (or warning), error, none (or off).
 *
 * @param out Untouched on failure
 * @return true if the name was recognised
 */
bool parse_log_level(const std::string& name, LogLevel& out) noexcept;

/**
 * Lower-case name of a level, as accepted by parse_log_level().
 */
const char* log_level_name(LogLevel level) noexcept;

/**
 * Thread-safe logger singleton.
 *
 * Each line is formatted on the caller's stack and written with a single
 * fwrite under the output mutex, so lines from worker threads never
 * interleave.
 */
class Logger {
public:
    static Logger& instance() noexcept {
        static Logger logger;
        return logger;
    }

    /**
     * Called by the LOG_* macros.
     */
    void log(LogLevel level, const char* tag, const char* file, int line,
             const char* fmt, ...) noexcept __attribute__((format(printf, 6, 7)));

    void set_level(LogLevel level) noexcept {
        min_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    bool enabled(LogLevel level) const noexcept {
        return static_cast<uint8_t>(level) >= min_level_.load(std::memory_order_relaxed);
    }

    /**
     * Mute or unmute one subsystem tag. All tags start enabled.
     */
    void set_tag_enabled(const std::string& tag, bool enabled);

    bool is_tag_enabled(const char* tag) const;

    /**
     * Append to `path` instead of stderr.
     *
     * @return false if the file cannot be opened; output is unchanged
     */
    bool set_output_file(const char* path) noexcept;

    /**
     * Close any log file and go back to stderr.
     */
    void close_output_file() noexcept;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() noexcept = default;
    ~Logger() noexcept;

    void write_line(const char* text, size_t len) noexcept;

    std::atomic<uint8_t> min_level_{static_cast<uint8_t>(LogLevel::INFO)};

    mutable std::mutex mutex_;          // Guards everything below
    FILE* output_{stderr};
    bool owns_output_{false};
    std::set<std::string, std::less<>> muted_tags_;
};

} // namespace core
} // namespace dualmeter

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef DUALMETER_ENABLE_LOGGING

#define DUALMETER_LOG(level, tag, fmt, ...)                                        \
    do {                                                                           \
        auto& dualmeter_logger_ = ::dualmeter::core::Logger::instance();           \
        if (dualmeter_logger_.enabled(level)) {                                    \
            dualmeter_logger_.log(level, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
        }                                                                          \
    } while (0)

#define LOG_DEBUG(tag, fmt, ...) \
    DUALMETER_LOG(::dualmeter::core::LogLevel::DEBUG, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...) \
    DUALMETER_LOG(::dualmeter::core::LogLevel::INFO, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...) \
    DUALMETER_LOG(::dualmeter::core::LogLevel::WARN, tag, fmt, ##__VA_ARGS__)
#define LOG_ERROR(tag, fmt, ...) \
    DUALMETER_LOG(::dualmeter::core::LogLevel::ERROR, tag, fmt, ##__VA_ARGS__)

#else

#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#define LOG_INFO(tag, fmt, ...)  ((void)0)
#define LOG_WARN(tag, fmt, ...)  ((void)0)
#define LOG_ERROR(tag, fmt, ...) ((void)0)

#endif // DUALMETER_ENABLE_LOGGING
