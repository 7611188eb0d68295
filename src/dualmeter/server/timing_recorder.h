#pragma once

#include "metrics.h"
#include "protocol.h"
#include <cstdint>
#include <functional>

namespace dualmeter {
namespace server {

/**
 * Timing state carried by one request.
 */
struct RequestTiming {
    uint64_t start_us{0};
    uint64_t first_byte_us{0};    // 0 until the first response byte is handed off
    uint64_t handshake_us{0};     // Handshake latency of the owning connection
    bool started{false};
    bool recorded{false};
};

/**
 * Turns request lifecycle points into metric samples.
 *
 * Used from terminator worker threads; the recorder itself holds no
 * per-request state, so one instance serves every worker of a protocol.
 */
class TimingRecorder {
public:
    using Clock = std::function<uint64_t()>;

    /**
     * @param clock Microsecond clock, now_us() when empty
     */
    TimingRecorder(MetricsAggregator& metrics, Protocol protocol, Clock clock = Clock());

    /**
     * Request headers decoded.
     */
    void begin(RequestTiming& timing, uint64_t handshake_us = 0) const;

    /**
     * First response byte handed to the transport. Later calls keep the
     * first timestamp.
     */
    void mark_first_byte(RequestTiming& timing) const;

    /**
     * Build the sample and hand it to the aggregator.
     *
     * Without a first byte, ttfb equals the total and the sample counts as
     * incomplete. A second call records nothing.
     *
     * @param cancelled Request abandoned (reset, connection closed)
     * @return false if the request was already recorded or never begun
     */
    bool end(RequestTiming& timing, uint16_t status, uint64_t bytes_out,
             bool cancelled = false) const;

    Protocol protocol() const noexcept { return protocol_; }

private:
    uint64_t now() const { return clock_ ? clock_() : now_us(); }

    MetricsAggregator& metrics_;
    Protocol protocol_;
    Clock clock_;
};

} // namespace server
} // namespace dualmeter
