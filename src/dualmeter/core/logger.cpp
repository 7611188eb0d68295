#include "logger.h"

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <string_view>
#include <strings.h>

namespace dualmeter {
namespace core {

namespace {

struct LevelName {
    const char* name;
    LogLevel level;
};

constexpr LevelName kLevelNames[] = {
    {"debug", LogLevel::DEBUG}, {"trace", LogLevel::DEBUG},
    {"info", LogLevel::INFO},
    {"warn", LogLevel::WARN},   {"warning", LogLevel::WARN},
    {"error", LogLevel::ERROR},
    {"none", LogLevel::NONE},   {"off", LogLevel::NONE},
};

// Fixed width so messages line up
const char* level_label(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default:              return "-----";
    }
}

/**
 * UTC "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
size_t format_utc_timestamp(char* buf, size_t size) noexcept {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t secs = system_clock::to_time_t(now);
    int ms = static_cast<int>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    struct tm tm_utc;
    gmtime_r(&secs, &tm_utc);
    size_t n = std::strftime(buf, size, "%Y-%m-%dT%H:%M:%S", &tm_utc);
    int extra = std::snprintf(buf + n, size - n, ".%03dZ", ms);
    return extra > 0 ? n + static_cast<size_t>(extra) : n;
}

} // namespace

bool parse_log_level(const std::string& name, LogLevel& out) noexcept {
    for (const auto& entry : kLevelNames) {
        if (strcasecmp(name.c_str(), entry.name) == 0) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::NONE:  return "none";
    }
    return "none";
}

Logger::~Logger() noexcept {
    close_output_file();
}

void Logger::log(LogLevel level, const char* tag, const char* file, int line,
                 const char* fmt, ...) noexcept {
    if (!enabled(level) || !is_tag_enabled(tag)) {
        return;
    }

    char buf[4096];
    size_t len = format_utc_timestamp(buf, sizeof(buf));
    int n = std::snprintf(buf + len, sizeof(buf) - len, " [%s] [%s] ", level_label(level), tag);
    if (n > 0) len += static_cast<size_t>(n);

    va_list args;
    va_start(args, fmt);
    n = std::vsnprintf(buf + len, sizeof(buf) - len, fmt, args);
    va_end(args);
    if (n > 0) len = std::min(len + static_cast<size_t>(n), sizeof(buf) - 1);

    const char* base = std::strrchr(file, '/');
    base = base != nullptr ? base + 1 : file;
    n = std::snprintf(buf + len, sizeof(buf) - len, " (%s:%d)\n", base, line);
    if (n > 0) len = std::min(len + static_cast<size_t>(n), sizeof(buf) - 1);
    // Truncated lines still end the record
    buf[len - 1] = '\n';

    write_line(buf, len);
}

void Logger::write_line(const char* text, size_t len) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fwrite(text, 1, len, output_);
    std::fflush(output_);
}

void Logger::set_tag_enabled(const std::string& tag, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled) {
        muted_tags_.erase(tag);
    } else {
        muted_tags_.insert(tag);
    }
}

bool Logger::is_tag_enabled(const char* tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return muted_tags_.empty() || muted_tags_.find(std::string_view(tag)) == muted_tags_.end();
}

bool Logger::set_output_file(const char* path) noexcept {
    if (path == nullptr) {
        close_output_file();
        return true;
    }
    FILE* file = std::fopen(path, "a");
    if (file == nullptr) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (owns_output_) {
        std::fclose(output_);
    }
    output_ = file;
    owns_output_ = true;
    return true;
}

void Logger::close_output_file() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owns_output_) {
        std::fclose(output_);
    }
    output_ = stderr;
    owns_output_ = false;
}

} // namespace core
} // namespace dualmeter
