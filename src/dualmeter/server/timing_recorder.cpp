#include "timing_recorder.h"
#include "../core/logger.h"

namespace dualmeter {
namespace server {

TimingRecorder::TimingRecorder(MetricsAggregator& metrics, Protocol protocol, Clock clock)
    : metrics_(metrics), protocol_(protocol), clock_(std::move(clock)) {
}

void TimingRecorder::begin(RequestTiming& timing, uint64_t handshake_us) const {
    timing = RequestTiming();
    timing.start_us = now();
    timing.handshake_us = handshake_us;
    timing.started = true;
}

void TimingRecorder::mark_first_byte(RequestTiming& timing) const {
    if (!timing.started || timing.recorded || timing.first_byte_us != 0) {
        return;
    }
    timing.first_byte_us = now();
    if (timing.first_byte_us == 0) timing.first_byte_us = 1;
}

bool TimingRecorder::end(RequestTiming& timing, uint16_t status, uint64_t bytes_out,
                         bool cancelled) const {
    if (!timing.started) {
        LOG_ERROR("Metrics", "%s end() without begin()", protocol_name(protocol_));
        return false;
    }
    if (timing.recorded) {
        LOG_ERROR("Metrics", "%s end() called twice for one request (status %u)",
                  protocol_name(protocol_), static_cast<unsigned>(status));
        return false;
    }
    timing.recorded = true;

    uint64_t end_us = now();
    uint64_t total_us = end_us > timing.start_us ? end_us - timing.start_us : 0;
    bool has_first_byte = timing.first_byte_us != 0;
    uint64_t ttfb_us = total_us;
    if (has_first_byte) {
        ttfb_us = timing.first_byte_us > timing.start_us ? timing.first_byte_us - timing.start_us : 0;
    }

    MetricSample sample;
    sample.protocol = protocol_;
    sample.handshake_ms = static_cast<double>(timing.handshake_us) / 1000.0;
    sample.ttfb_ms = static_cast<double>(ttfb_us) / 1000.0;
    sample.total_ms = static_cast<double>(total_us) / 1000.0;
    sample.bytes = bytes_out;
    sample.incomplete = cancelled || !has_first_byte;
    metrics_.record(sample);

    LOG_DEBUG("Metrics", "%s status=%u ttfb=%.3fms total=%.3fms bytes=%llu%s",
              protocol_name(protocol_), static_cast<unsigned>(status), sample.ttfb_ms,
              sample.total_ms, (unsigned long long)bytes_out,
              sample.incomplete ? " incomplete" : "");
    return true;
}

} // namespace server
} // namespace dualmeter
