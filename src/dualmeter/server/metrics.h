#pragma once

#include "protocol.h"
#include <array>
#include <cstdint>
#include <mutex>

namespace dualmeter {
namespace server {

/**
 * Upper bounds (ms) of the latency histogram buckets. A final bucket
 * catches everything above the last bound.
 */
constexpr std::array<double, 12> kHistogramBoundsMs = {
    1, 2, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000
};
constexpr size_t kHistogramBuckets = kHistogramBoundsMs.size() + 1;

/**
 * Index of the bucket holding a latency.
 */
size_t histogram_bucket(double latency_ms) noexcept;

/**
 * One finished request.
 */
struct MetricSample {
    Protocol protocol{Protocol::HTTP2};
    double handshake_ms{0.0};
    double ttfb_ms{0.0};
    double total_ms{0.0};
    uint64_t bytes{0};
    bool incomplete{false};
};

/**
 * Point-in-time copy of one protocol's counters.
 *
 * count/sum/min/max/histogram cover complete samples only; incomplete
 * samples are counted separately.
 */
struct ProtocolSnapshot {
    Protocol protocol{Protocol::HTTP2};
    uint64_t count{0};
    double sum_ms{0.0};
    double min_ms{0.0};
    double max_ms{0.0};
    double ttfb_sum_ms{0.0};
    std::array<uint64_t, kHistogramBuckets> histogram{};

    uint64_t incomplete{0};
    uint64_t bytes_out{0};
    uint64_t connections{0};
    uint64_t active_connections{0};
    uint64_t handshake_failures{0};
    double handshake_sum_ms{0.0};

    double avg_ms() const noexcept { return count == 0 ? 0.0 : sum_ms / static_cast<double>(count); }
    double avg_ttfb_ms() const noexcept {
        return count == 0 ? 0.0 : ttfb_sum_ms / static_cast<double>(count);
    }
    double avg_handshake_ms() const noexcept {
        return connections == 0 ? 0.0 : handshake_sum_ms / static_cast<double>(connections);
    }
};

/**
 * Process-wide per-protocol counters.
 *
 * Each protocol has its own mutex, so the two terminators never contend
 * with each other.
 */
class MetricsAggregator {
public:
    MetricsAggregator();

    MetricsAggregator(const MetricsAggregator&) = delete;
    MetricsAggregator& operator=(const MetricsAggregator&) = delete;

    void record(const MetricSample& sample);

    /**
     * A connection finished its handshake.
     */
    void record_connection(Protocol protocol, double handshake_ms);
    void record_handshake_failure(Protocol protocol);

    /**
     * A connection that was counted by record_connection() went away.
     */
    void connection_closed(Protocol protocol);

    ProtocolSnapshot snapshot(Protocol protocol) const;

    /**
     * Zero every counter. Tests only.
     */
    void reset();

    /**
     * Log both protocols' counters at INFO.
     */
    void log_snapshot(const char* reason) const;

private:
    struct Slot {
        mutable std::mutex mutex;
        ProtocolSnapshot counters;
    };

    Slot& slot(Protocol protocol) noexcept { return slots_[static_cast<size_t>(protocol)]; }
    const Slot& slot(Protocol protocol) const noexcept {
        return slots_[static_cast<size_t>(protocol)];
    }

    std::array<Slot, kProtocolCount> slots_;
};

} // namespace server
} // namespace dualmeter
