#pragma once

#include <algorithm>
#include <cstdint>

namespace dualmeter {
namespace quic {

/**
 * QUIC NewReno Congestion Control (RFC 9002 Section 7.3).
 *
 * - Slow start: window grows by the acked bytes
 * - Congestion avoidance: about one datagram per RTT
 * - Recovery: one reduction per loss episode; packets sent before the
 *   episode started do not grow the window
 */
class NewRenoCongestionControl {
public:
    static constexpr uint64_t kMaxDatagramSize = 1200;
    static constexpr uint64_t kInitialWindow = 10 * kMaxDatagramSize;
    static constexpr uint64_t kMinimumWindow = 2 * kMaxDatagramSize;

    /**
     * Process an acked packet (increases congestion window).
     *
     * @param acked_bytes Size of the acked packet
     * @param time_sent When the packet was sent (microseconds)
     */
    void on_packet_acked(uint64_t acked_bytes, uint64_t time_sent) noexcept {
        remove_from_flight(acked_bytes);

        if (in_recovery(time_sent)) {
            return;
        }

        if (in_slow_start()) {
            congestion_window_ += acked_bytes;
        } else {
            congestion_window_ += (kMaxDatagramSize * acked_bytes) / congestion_window_;
        }
    }

    /**
     * Record packet lost (the bytes leave the flight).
     */
    void on_packet_lost(uint64_t bytes) noexcept {
        remove_from_flight(bytes);
    }

    /**
     * Loss detected (decreases congestion window once per episode).
     *
     * @param largest_lost_sent_time Send time of the newest lost packet
     * @param now Current time (microseconds)
     */
    void on_congestion_event(uint64_t largest_lost_sent_time, uint64_t now) noexcept {
        if (in_recovery(largest_lost_sent_time)) {
            return;
        }

        recovery_start_time_ = now;
        ssthresh_ = std::max(congestion_window_ / 2, kMinimumWindow);
        congestion_window_ = ssthresh_;
    }

    /**
     * Persistent congestion: collapse to the minimum window.
     */
    void on_persistent_congestion() noexcept {
        congestion_window_ = kMinimumWindow;
        recovery_start_time_ = 0;
    }

    bool can_send(uint64_t bytes_to_send) const noexcept {
        return bytes_in_flight_ + bytes_to_send <= congestion_window_;
    }

    void on_packet_sent(uint64_t bytes) noexcept {
        bytes_in_flight_ += bytes;
    }

    uint64_t congestion_window() const noexcept { return congestion_window_; }
    uint64_t ssthresh() const noexcept { return ssthresh_; }
    uint64_t bytes_in_flight() const noexcept { return bytes_in_flight_; }

    bool in_slow_start() const noexcept {
        return congestion_window_ < ssthresh_;
    }

    /**
     * A packet sent at or before the start of the current recovery
     * period belongs to that episode.
     */
    bool in_recovery(uint64_t time_sent) const noexcept {
        return recovery_start_time_ > 0 && time_sent <= recovery_start_time_;
    }

    uint64_t available_capacity() const noexcept {
        if (bytes_in_flight_ >= congestion_window_) {
            return 0;
        }
        return congestion_window_ - bytes_in_flight_;
    }

private:
    void remove_from_flight(uint64_t bytes) noexcept {
        bytes_in_flight_ = bytes_in_flight_ >= bytes ? bytes_in_flight_ - bytes : 0;
    }

    uint64_t congestion_window_{kInitialWindow};
    uint64_t ssthresh_{UINT64_MAX};
    uint64_t bytes_in_flight_{0};
    uint64_t recovery_start_time_{0};
};

} // namespace quic
} // namespace dualmeter
