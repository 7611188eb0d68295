#include "metrics.h"
#include "../core/logger.h"

namespace dualmeter {
namespace server {

size_t histogram_bucket(double latency_ms) noexcept {
    for (size_t i = 0; i < kHistogramBoundsMs.size(); i++) {
        if (latency_ms <= kHistogramBoundsMs[i]) {
            return i;
        }
    }
    return kHistogramBoundsMs.size();
}

MetricsAggregator::MetricsAggregator() {
    slot(Protocol::HTTP2).counters.protocol = Protocol::HTTP2;
    slot(Protocol::HTTP3).counters.protocol = Protocol::HTTP3;
}

void MetricsAggregator::record(const MetricSample& sample) {
    Slot& s = slot(sample.protocol);
    std::lock_guard<std::mutex> lock(s.mutex);
    ProtocolSnapshot& c = s.counters;

    c.bytes_out += sample.bytes;
    if (sample.incomplete) {
        c.incomplete++;
        return;
    }

    if (c.count == 0 || sample.total_ms < c.min_ms) c.min_ms = sample.total_ms;
    if (c.count == 0 || sample.total_ms > c.max_ms) c.max_ms = sample.total_ms;
    c.count++;
    c.sum_ms += sample.total_ms;
    c.ttfb_sum_ms += sample.ttfb_ms;
    c.histogram[histogram_bucket(sample.total_ms)]++;
}

void MetricsAggregator::record_connection(Protocol protocol, double handshake_ms) {
    Slot& s = slot(protocol);
    std::lock_guard<std::mutex> lock(s.mutex);
    s.counters.connections++;
    s.counters.active_connections++;
    s.counters.handshake_sum_ms += handshake_ms;
}

void MetricsAggregator::record_handshake_failure(Protocol protocol) {
    Slot& s = slot(protocol);
    std::lock_guard<std::mutex> lock(s.mutex);
    s.counters.handshake_failures++;
}

void MetricsAggregator::connection_closed(Protocol protocol) {
    Slot& s = slot(protocol);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.counters.active_connections > 0) {
        s.counters.active_connections--;
    }
}

ProtocolSnapshot MetricsAggregator::snapshot(Protocol protocol) const {
    const Slot& s = slot(protocol);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.counters;
}

void MetricsAggregator::reset() {
    for (size_t i = 0; i < kProtocolCount; i++) {
        std::lock_guard<std::mutex> lock(slots_[i].mutex);
        slots_[i].counters = ProtocolSnapshot();
        slots_[i].counters.protocol = static_cast<Protocol>(i);
    }
}

void MetricsAggregator::log_snapshot(const char* reason) const {
    for (size_t i = 0; i < kProtocolCount; i++) {
        ProtocolSnapshot snap = snapshot(static_cast<Protocol>(i));
        LOG_INFO("Metrics", "%s %s: requests=%llu avg=%.3fms min=%.3fms max=%.3fms "
                 "incomplete=%llu bytes_out=%llu connections=%llu handshake_failures=%llu "
                 "avg_handshake=%.3fms",
                 reason, protocol_name(snap.protocol),
                 (unsigned long long)snap.count, snap.avg_ms(), snap.min_ms, snap.max_ms,
                 (unsigned long long)snap.incomplete, (unsigned long long)snap.bytes_out,
                 (unsigned long long)snap.connections,
                 (unsigned long long)snap.handshake_failures, snap.avg_handshake_ms());
    }
}

} // namespace server
} // namespace dualmeter
