// QUIC loss detection and ACK generation (RFC 9000 Section 13, RFC 9002)

#include "quic_ack_tracker.h"

#include <algorithm>
#include <iterator>

namespace dualmeter {
namespace quic {

// ============================================================================
// AckTracker
// ============================================================================

void AckTracker::on_packet_sent(SentPacket&& pkt, NewRenoCongestionControl& cc) {
    if (!has_sent_ || pkt.packet_number > largest_sent_) {
        largest_sent_ = pkt.packet_number;
        has_sent_ = true;
    }

    if (!pkt.in_flight) {
        return;  // ACK-only packets carry nothing to retransmit
    }

    cc.on_packet_sent(pkt.size);
    if (pkt.ack_eliciting) {
        time_of_last_ack_eliciting_ = pkt.time_sent;
        ack_eliciting_in_flight_++;
    }

    uint64_t pn = pkt.packet_number;
    sent_packets_.emplace(pn, std::move(pkt));
}

void AckTracker::remove_packet(std::map<uint64_t, SentPacket>::iterator it) {
    if (it->second.ack_eliciting && ack_eliciting_in_flight_ > 0) {
        ack_eliciting_in_flight_--;
    }
    sent_packets_.erase(it);
}

int AckTracker::on_ack_received(const AckFrame& ack, uint64_t ack_delay_us,
                                uint64_t max_ack_delay_us, uint64_t now,
                                NewRenoCongestionControl& cc,
                                std::vector<SentPacket>& out_acked,
                                std::vector<SentPacket>& out_lost) {
    if (!has_sent_ || ack.largest_acked > largest_sent_) {
        return 1;
    }

    bool largest_newly_acked = false;
    bool any_eliciting_acked = false;
    uint64_t largest_time_sent = 0;

    auto ack_range = [&](uint64_t lo, uint64_t hi) {
        auto it = sent_packets_.lower_bound(lo);
        while (it != sent_packets_.end() && it->first <= hi) {
            SentPacket& pkt = it->second;
            if (pkt.packet_number == ack.largest_acked) {
                largest_newly_acked = true;
                largest_time_sent = pkt.time_sent;
            }
            if (pkt.ack_eliciting) {
                any_eliciting_acked = true;
            }
            cc.on_packet_acked(pkt.size, pkt.time_sent);
            out_acked.push_back(std::move(pkt));
            auto next = std::next(it);
            remove_packet(it);
            it = next;
        }
    };

    uint64_t smallest = ack.largest_acked - ack.first_ack_range;
    ack_range(smallest, ack.largest_acked);

    for (size_t i = 0; i < ack.range_count; i++) {
        uint64_t largest = smallest - ack.ranges[i].gap - 2;
        smallest = largest - ack.ranges[i].length;
        ack_range(smallest, largest);
    }

    if (!has_largest_acked_ || ack.largest_acked > largest_acked_) {
        largest_acked_ = ack.largest_acked;
        has_largest_acked_ = true;
    }

    // RTT sample only when the largest acknowledged packet is new
    if (largest_newly_acked && any_eliciting_acked && now >= largest_time_sent) {
        rtt_.update(now - largest_time_sent, ack_delay_us, max_ack_delay_us);
    }

    detect_lost_packets(now, cc, out_lost);
    return 0;
}

void AckTracker::detect_lost_packets(uint64_t now, NewRenoCongestionControl& cc,
                                     std::vector<SentPacket>& out_lost) {
    loss_time_ = 0;
    if (!has_largest_acked_) {
        return;
    }

    uint64_t loss_delay = (kTimeThreshold *
                           std::max(rtt_.latest_rtt, rtt_.smoothed_rtt)) /
                          kTimeThresholdDivisor;
    loss_delay = std::max(loss_delay, RttStats::kGranularity);

    bool any_lost = false;
    uint64_t newest_lost_time = 0;

    auto it = sent_packets_.begin();
    while (it != sent_packets_.end() && it->first < largest_acked_) {
        SentPacket& pkt = it->second;
        bool lost = largest_acked_ >= pkt.packet_number + kPacketThreshold ||
                    pkt.time_sent + loss_delay <= now;

        if (!lost) {
            uint64_t pkt_loss_time = pkt.time_sent + loss_delay;
            if (loss_time_ == 0 || pkt_loss_time < loss_time_) {
                loss_time_ = pkt_loss_time;
            }
            ++it;
            continue;
        }

        any_lost = true;
        newest_lost_time = std::max(newest_lost_time, pkt.time_sent);
        cc.on_packet_lost(pkt.size);
        out_lost.push_back(std::move(pkt));
        auto next = std::next(it);
        remove_packet(it);
        it = next;
    }

    if (any_lost) {
        cc.on_congestion_event(newest_lost_time, now);
    }
}

void AckTracker::discard(NewRenoCongestionControl& cc) {
    for (auto& entry : sent_packets_) {
        cc.on_packet_lost(entry.second.size);
    }
    sent_packets_.clear();
    ack_eliciting_in_flight_ = 0;
    loss_time_ = 0;
}

size_t AckTracker::take_pto_packets(size_t count, NewRenoCongestionControl& cc,
                                      std::vector<SentPacket>& out) {
    size_t taken = 0;
    auto it = sent_packets_.begin();
    while (it != sent_packets_.end() && taken < count) {
        if (!it->second.ack_eliciting) {
            ++it;
            continue;
        }
        cc.on_packet_lost(it->second.size);
        out.push_back(std::move(it->second));
        auto next = std::next(it);
        remove_packet(it);
        it = next;
        taken++;
    }
    return taken;
}

// ============================================================================
// ReceivedPacketTracker
// ============================================================================

bool ReceivedPacketTracker::is_duplicate(uint64_t pn) const noexcept {
    if (ranges_.empty()) {
        return false;
    }
    if (pn < ranges_.begin()->first && trimmed_) {
        return true;  // Older than anything still tracked
    }
    auto it = ranges_.upper_bound(pn);
    if (it == ranges_.begin()) {
        return false;
    }
    --it;
    return pn <= it->second;
}

void ReceivedPacketTracker::on_packet_received(uint64_t pn, bool ack_eliciting, uint64_t now) {
    bool out_of_order = !ranges_.empty() && pn != ranges_.rbegin()->second + 1;

    if (ranges_.empty() || pn > ranges_.rbegin()->second) {
        largest_recv_time_ = now;
    }

    auto next = ranges_.upper_bound(pn);
    bool merged = false;
    if (next != ranges_.begin()) {
        auto prev = std::prev(next);
        if (prev->second + 1 == pn) {
            prev->second = pn;
            if (next != ranges_.end() && next->first == pn + 1) {
                prev->second = next->second;
                ranges_.erase(next);
            }
            merged = true;
        }
    }
    if (!merged) {
        if (next != ranges_.end() && next->first == pn + 1) {
            uint64_t last = next->second;
            ranges_.erase(next);
            ranges_[pn] = last;
        } else {
            ranges_[pn] = pn;
        }
    }

    while (ranges_.size() > kMaxTrackedRanges) {
        ranges_.erase(ranges_.begin());
        trimmed_ = true;
    }

    if (!ack_eliciting) {
        return;
    }

    if (!ack_pending_) {
        ack_deadline_ = now + max_ack_delay_us_;
    }
    ack_pending_ = true;
    unacked_eliciting_++;

    if (max_ack_delay_us_ == 0 || unacked_eliciting_ >= 2 || out_of_order) {
        ack_immediate_ = true;
    }
}

bool ReceivedPacketTracker::build_ack_frame(AckFrame& out, uint64_t now,
                                            uint64_t ack_delay_exponent) const noexcept {
    if (ranges_.empty()) {
        return false;
    }

    auto it = ranges_.rbegin();
    out.largest_acked = it->second;
    out.first_ack_range = it->second - it->first;
    uint64_t delay = now > largest_recv_time_ ? now - largest_recv_time_ : 0;
    out.ack_delay = delay >> ack_delay_exponent;
    out.range_count = 0;

    uint64_t prev_smallest = it->first;
    for (++it; it != ranges_.rend() && out.range_count < AckFrame::MAX_RANGES; ++it) {
        AckRange& range = out.ranges[out.range_count++];
        range.gap = prev_smallest - it->second - 2;
        range.length = it->second - it->first;
        prev_smallest = it->first;
    }

    return true;
}

} // namespace quic
} // namespace dualmeter
