#pragma once

#include "quic_frames.h"
#include "quic_congestion.h"
#include <cstdint>
#include <map>
#include <vector>

namespace dualmeter {
namespace quic {

/**
 * Retransmittable content of a sent packet.
 *
 * On loss the connection re-queues what each entry describes; control
 * frames are re-sent with their current value.
 */
struct SentFrame {
    enum class Kind : uint8_t {
        STREAM,
        CRYPTO,
        HANDSHAKE_DONE,
        MAX_DATA,
        MAX_STREAM_DATA,
        MAX_STREAMS_BIDI,
        MAX_STREAMS_UNI,
        RESET_STREAM,
        STOP_SENDING,
        PING,
    };

    Kind kind{Kind::PING};
    uint64_t stream_id{0};
    uint64_t offset{0};
    uint64_t length{0};
    uint64_t error_code{0};
    bool fin{false};
};

/**
 * Sent packet information.
 */
struct SentPacket {
    uint64_t packet_number{0};
    uint64_t time_sent{0};      // Microseconds
    uint64_t size{0};           // Packet size in bytes
    bool ack_eliciting{false};  // Does this packet require an ACK?
    bool in_flight{false};      // Counted in bytes_in_flight?
    std::vector<SentFrame> frames;
};

/**
 * RTT estimator shared by all packet number spaces (RFC 9002 Section 5).
 */
struct RttStats {
    static constexpr uint64_t kInitialRtt = 333000;  // 333ms
    static constexpr uint64_t kGranularity = 1000;   // 1ms

    uint64_t latest_rtt{0};
    uint64_t smoothed_rtt{kInitialRtt};
    uint64_t rttvar{kInitialRtt / 2};
    uint64_t min_rtt{UINT64_MAX};
    bool has_sample{false};

    /**
     * @param ack_delay Peer-reported delay, microseconds
     * @param max_ack_delay Peer's max_ack_delay, microseconds
     */
    void update(uint64_t sample, uint64_t ack_delay, uint64_t max_ack_delay) noexcept {
        latest_rtt = sample;
        if (sample < min_rtt) {
            min_rtt = sample;
        }

        if (!has_sample) {
            has_sample = true;
            smoothed_rtt = sample;
            rttvar = sample / 2;
            return;
        }

        if (ack_delay > max_ack_delay) {
            ack_delay = max_ack_delay;
        }
        uint64_t adjusted = sample;
        if (sample >= min_rtt + ack_delay) {
            adjusted = sample - ack_delay;
        }

        // EWMA with alpha = 1/8, beta = 1/4
        uint64_t rtt_diff = adjusted > smoothed_rtt ? adjusted - smoothed_rtt
                                                    : smoothed_rtt - adjusted;
        rttvar = (3 * rttvar + rtt_diff) / 4;
        smoothed_rtt = (7 * smoothed_rtt + adjusted) / 8;
    }

    /**
     * PTO period without backoff (RFC 9002 Section 6.2.1).
     */
    uint64_t pto(uint64_t max_ack_delay) const noexcept {
        uint64_t var = 4 * rttvar;
        if (var < kGranularity) var = kGranularity;
        return smoothed_rtt + var + max_ack_delay;
    }
};

/**
 * QUIC Loss Detection for one packet number space (RFC 9002).
 *
 * Implements:
 * - ACK processing
 * - Loss detection (packet threshold and time threshold)
 * - Bookkeeping for PTO expiry
 */
class AckTracker {
public:
    static constexpr uint64_t kTimeThreshold = 9;  // 9/8 = 1.125x RTT
    static constexpr uint64_t kTimeThresholdDivisor = 8;
    static constexpr uint64_t kPacketThreshold = 3;

    explicit AckTracker(RttStats& rtt) : rtt_(rtt) {}

    /**
     * Record packet sent.
     */
    void on_packet_sent(SentPacket&& pkt, NewRenoCongestionControl& cc);

    /**
     * Process ACK frame.
     *
     * @param ack_delay_us Decoded ACK delay
     * @param max_ack_delay_us Peer's max_ack_delay (0 in the Initial space)
     * @param out_acked Newly acknowledged packets
     * @param out_lost Packets declared lost as a result
     * @return 0 on success, 1 if the frame acknowledges an unsent packet
     */
    int on_ack_received(const AckFrame& ack, uint64_t ack_delay_us,
                        uint64_t max_ack_delay_us, uint64_t now,
                        NewRenoCongestionControl& cc,
                        std::vector<SentPacket>& out_acked,
                        std::vector<SentPacket>& out_lost);

    /**
     * Detect lost packets (time-based and packet-based).
     */
    void detect_lost_packets(uint64_t now, NewRenoCongestionControl& cc,
                             std::vector<SentPacket>& out_lost);

    /**
     * Drop every outstanding packet without declaring loss (space discarded).
     */
    void discard(NewRenoCongestionControl& cc);

    /**
     * Remove the oldest ack-eliciting packets for retransmission on PTO expiry.
     *
     * @return Number of packets moved to out
     */
    size_t take_pto_packets(size_t count, NewRenoCongestionControl& cc,
                              std::vector<SentPacket>& out);

    uint64_t loss_time() const noexcept { return loss_time_; }
    uint64_t time_of_last_ack_eliciting() const noexcept { return time_of_last_ack_eliciting_; }
    bool has_ack_eliciting_in_flight() const noexcept { return ack_eliciting_in_flight_ > 0; }
    bool has_largest_acked() const noexcept { return has_largest_acked_; }
    uint64_t largest_acked() const noexcept { return largest_acked_; }
    uint64_t largest_sent() const noexcept { return largest_sent_; }
    size_t outstanding_count() const noexcept { return sent_packets_.size(); }

private:
    void remove_packet(std::map<uint64_t, SentPacket>::iterator it);

    RttStats& rtt_;
    std::map<uint64_t, SentPacket> sent_packets_;
    bool has_largest_acked_{false};
    uint64_t largest_acked_{0};
    bool has_sent_{false};
    uint64_t largest_sent_{0};
    uint64_t loss_time_{0};          // When the next time-threshold loss fires
    uint64_t time_of_last_ack_eliciting_{0};
    size_t ack_eliciting_in_flight_{0};
};

/**
 * Received packet numbers for one space, driving ACK generation.
 *
 * ACKs are sent immediately for out-of-order arrivals and every second
 * ack-eliciting packet, otherwise within max_ack_delay.
 */
class ReceivedPacketTracker {
public:
    static constexpr size_t kMaxTrackedRanges = 32;

    /**
     * @param max_ack_delay_us Zero means acknowledge immediately
     */
    explicit ReceivedPacketTracker(uint64_t max_ack_delay_us)
        : max_ack_delay_us_(max_ack_delay_us) {}

    bool is_duplicate(uint64_t pn) const noexcept;

    void on_packet_received(uint64_t pn, bool ack_eliciting, uint64_t now);

    /**
     * Build an ACK frame from the tracked ranges, newest first.
     *
     * @return false if nothing has been received
     */
    bool build_ack_frame(AckFrame& out, uint64_t now, uint64_t ack_delay_exponent) const noexcept;

    void on_ack_sent() noexcept {
        ack_pending_ = false;
        ack_immediate_ = false;
        unacked_eliciting_ = 0;
        ack_deadline_ = 0;
    }

    /**
     * True if an ACK should go out now.
     */
    bool ack_due(uint64_t now) const noexcept {
        return ack_pending_ && (ack_immediate_ || now >= ack_deadline_);
    }

    /**
     * True if there are unacknowledged packets worth piggybacking.
     */
    bool ack_pending() const noexcept { return ack_pending_; }

    /**
     * When a delayed ACK must go out, 0 if none is scheduled.
     */
    uint64_t ack_deadline() const noexcept {
        if (!ack_pending_) return 0;
        return ack_immediate_ ? 1 : ack_deadline_;
    }

    bool has_received() const noexcept { return !ranges_.empty(); }
    uint64_t largest_received() const noexcept {
        return ranges_.empty() ? 0 : ranges_.rbegin()->second;
    }

private:
    uint64_t max_ack_delay_us_;
    std::map<uint64_t, uint64_t> ranges_;  // first -> last, inclusive
    bool trimmed_{false};
    uint64_t largest_recv_time_{0};
    bool ack_pending_{false};
    bool ack_immediate_{false};
    size_t unacked_eliciting_{0};
    uint64_t ack_deadline_{0};
};

} // namespace quic
} // namespace dualmeter
