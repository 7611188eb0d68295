#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace dualmeter {
namespace server {

/**
 * Protocol kind of a listener, connection or metric sample.
 */
enum class Protocol : uint8_t {
    HTTP2 = 0,
    HTTP3 = 1,
};

constexpr size_t kProtocolCount = 2;

inline const char* protocol_name(Protocol protocol) noexcept {
    return protocol == Protocol::HTTP2 ? "HTTP/2" : "HTTP/3";
}

/**
 * Monotonic clock in microseconds. All timing in the server layer and
 * the QUIC engine uses this base.
 */
inline uint64_t now_us() noexcept {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

} // namespace server
} // namespace dualmeter
