/**
 * QUIC flow control, NewReno congestion control, RTT estimation,
 * loss detection and ACK generation.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/dualmeter/http/quic/quic_flow_control.h"
#include "src/dualmeter/http/quic/quic_congestion.h"
#include "src/dualmeter/http/quic/quic_ack_tracker.h"

#include <vector>

using namespace dualmeter::quic;

// =============================================================================
// Connection flow control
// =============================================================================

TEST(QuicFlowControlTest, SendCreditFollowsPeerLimit) {
    FlowControl fc(1000, 500);

    EXPECT_TRUE(fc.can_send(500));
    EXPECT_FALSE(fc.can_send(501));

    fc.add_sent_data(300);
    EXPECT_EQ(fc.sent_data(), 300u);
    EXPECT_EQ(fc.available_window(), 200u);
    EXPECT_FALSE(fc.is_blocked());

    // Limits only ever grow
    EXPECT_FALSE(fc.update_peer_max_data(400));
    EXPECT_EQ(fc.peer_max_data(), 500u);
    EXPECT_TRUE(fc.update_peer_max_data(800));
    EXPECT_EQ(fc.available_window(), 500u);

    fc.add_sent_data(500);
    EXPECT_TRUE(fc.is_blocked());
    EXPECT_EQ(fc.available_window(), 0u);
    EXPECT_FALSE(fc.can_send(1));
}

TEST(QuicFlowControlTest, ReceiveWindowEnforcedAndExtended) {
    FlowControl fc(1000, 500);
    EXPECT_EQ(fc.recv_max_data(), 1000u);

    EXPECT_TRUE(fc.on_data_received(600));
    EXPECT_FALSE(fc.on_data_received(401));
    EXPECT_TRUE(fc.on_data_received(400));
    EXPECT_EQ(fc.recv_data(), 1000u);

    // Window is reopened once more than half of it has been consumed
    EXPECT_FALSE(fc.on_data_consumed(400));
    EXPECT_EQ(fc.recv_max_data(), 1000u);
    EXPECT_TRUE(fc.on_data_consumed(200));
    EXPECT_EQ(fc.recv_max_data(), 1600u);
    EXPECT_TRUE(fc.on_data_received(600));
}

TEST(QuicFlowControlTest, StreamCountsOnlyNewBytes) {
    StreamFlowControl sfc(1000, 500);
    uint64_t new_bytes = 0;

    ASSERT_TRUE(sfc.on_data_received(0, 300, new_bytes));
    EXPECT_EQ(new_bytes, 300u);
    EXPECT_EQ(sfc.highest_recv_offset(), 300u);

    // Retransmission of data already seen
    ASSERT_TRUE(sfc.on_data_received(100, 100, new_bytes));
    EXPECT_EQ(new_bytes, 0u);

    EXPECT_FALSE(sfc.on_data_received(900, 101, new_bytes));
    ASSERT_TRUE(sfc.on_data_received(900, 100, new_bytes));
    EXPECT_EQ(new_bytes, 700u);
    EXPECT_EQ(sfc.highest_recv_offset(), 1000u);

    EXPECT_TRUE(sfc.on_data_consumed(600));
    EXPECT_EQ(sfc.consumed_offset(), 600u);
    EXPECT_EQ(sfc.recv_max_offset(), 1600u);
}

TEST(QuicFlowControlTest, StreamSendCredit) {
    StreamFlowControl sfc(1000, 500);
    EXPECT_TRUE(sfc.can_send(500));
    sfc.add_sent_data(500);
    EXPECT_TRUE(sfc.is_blocked());
    EXPECT_EQ(sfc.sent_offset(), 500u);

    EXPECT_FALSE(sfc.update_peer_max_stream_data(500));
    EXPECT_TRUE(sfc.update_peer_max_stream_data(2000));
    EXPECT_EQ(sfc.available_window(), 1500u);
    EXPECT_EQ(sfc.peer_max_stream_data(), 2000u);
}

// =============================================================================
// NewReno
// =============================================================================

TEST(QuicCongestionTest, InitialState) {
    NewRenoCongestionControl cc;
    EXPECT_EQ(cc.congestion_window(), NewRenoCongestionControl::kInitialWindow);
    EXPECT_EQ(cc.congestion_window(), 12000u);
    EXPECT_EQ(cc.ssthresh(), UINT64_MAX);
    EXPECT_EQ(cc.bytes_in_flight(), 0u);
    EXPECT_TRUE(cc.in_slow_start());
}

TEST(QuicCongestionTest, WindowLimitsBytesInFlight) {
    NewRenoCongestionControl cc;
    EXPECT_TRUE(cc.can_send(12000));
    EXPECT_FALSE(cc.can_send(12001));

    cc.on_packet_sent(6000);
    EXPECT_TRUE(cc.can_send(6000));
    EXPECT_FALSE(cc.can_send(6001));

    cc.on_packet_sent(6000);
    EXPECT_EQ(cc.available_capacity(), 0u);
    EXPECT_FALSE(cc.can_send(1));
}

TEST(QuicCongestionTest, SlowStartGrowsByAckedBytes) {
    NewRenoCongestionControl cc;
    cc.on_packet_sent(1200);
    cc.on_packet_acked(1200, 100);
    EXPECT_EQ(cc.congestion_window(), 13200u);
    EXPECT_EQ(cc.bytes_in_flight(), 0u);
}

TEST(QuicCongestionTest, CongestionEventHalvesWindowOncePerRecovery) {
    NewRenoCongestionControl cc;
    cc.on_packet_sent(1200);
    cc.on_packet_acked(1200, 100);

    cc.on_congestion_event(50, 1000);
    EXPECT_EQ(cc.ssthresh(), 6600u);
    EXPECT_EQ(cc.congestion_window(), 6600u);
    EXPECT_FALSE(cc.in_slow_start());
    EXPECT_TRUE(cc.in_recovery(900));

    // Loss of a packet sent before recovery started is the same event
    cc.on_congestion_event(500, 2000);
    EXPECT_EQ(cc.congestion_window(), 6600u);

    // No growth for packets sent before recovery
    cc.on_packet_sent(1200);
    cc.on_packet_acked(1200, 900);
    EXPECT_EQ(cc.congestion_window(), 6600u);

    // Congestion avoidance afterwards
    cc.on_packet_sent(1200);
    cc.on_packet_acked(1200, 1100);
    EXPECT_EQ(cc.congestion_window(), 6600u + (1200u * 1200u) / 6600u);
}

TEST(QuicCongestionTest, WindowNeverBelowMinimum) {
    NewRenoCongestionControl cc;
    for (uint64_t t = 1; t <= 10; ++t) {
        cc.on_congestion_event(t * 1000, t * 1000 + 1);
    }
    EXPECT_EQ(cc.congestion_window(), NewRenoCongestionControl::kMinimumWindow);

    cc.on_persistent_congestion();
    EXPECT_EQ(cc.congestion_window(), NewRenoCongestionControl::kMinimumWindow);
    EXPECT_FALSE(cc.in_recovery(1));
}

TEST(QuicCongestionTest, LostBytesLeaveFlight) {
    NewRenoCongestionControl cc;
    cc.on_packet_sent(3000);
    cc.on_packet_lost(1000);
    EXPECT_EQ(cc.bytes_in_flight(), 2000u);
    cc.on_packet_lost(5000);
    EXPECT_EQ(cc.bytes_in_flight(), 0u);
}

// =============================================================================
// RTT
// =============================================================================

TEST(QuicRttTest, FirstSampleSeedsEstimate) {
    RttStats rtt;
    EXPECT_EQ(rtt.smoothed_rtt, RttStats::kInitialRtt);
    EXPECT_FALSE(rtt.has_sample);

    rtt.update(100000, 5000, 25000);
    EXPECT_TRUE(rtt.has_sample);
    EXPECT_EQ(rtt.smoothed_rtt, 100000u);
    EXPECT_EQ(rtt.rttvar, 50000u);
    EXPECT_EQ(rtt.min_rtt, 100000u);
}

TEST(QuicRttTest, LaterSamplesSubtractAckDelay) {
    RttStats rtt;
    rtt.update(100000, 0, 25000);
    rtt.update(120000, 10000, 25000);

    EXPECT_EQ(rtt.latest_rtt, 120000u);
    EXPECT_EQ(rtt.min_rtt, 100000u);
    EXPECT_EQ(rtt.rttvar, 40000u);
    EXPECT_EQ(rtt.smoothed_rtt, 101250u);
    EXPECT_EQ(rtt.pto(25000), 101250u + 4 * 40000u + 25000u);
}

TEST(QuicRttTest, AckDelayNotSubtractedBelowMinRtt) {
    RttStats rtt;
    rtt.update(100000, 0, 25000);
    rtt.update(105000, 20000, 25000);
    // 105000 - 20000 would undercut min_rtt, so the raw sample is used
    EXPECT_EQ(rtt.smoothed_rtt, (7 * 100000u + 105000u) / 8);
}

// =============================================================================
// AckTracker
// =============================================================================

class AckTrackerTest : public DualmeterTest {
protected:
    RttStats rtt_;
    NewRenoCongestionControl cc_;
    AckTracker tracker_{rtt_};

    void send(uint64_t pn, uint64_t time_sent, bool ack_eliciting = true) {
        SentPacket pkt;
        pkt.packet_number = pn;
        pkt.time_sent = time_sent;
        pkt.size = 1200;
        pkt.ack_eliciting = ack_eliciting;
        pkt.in_flight = true;
        SentFrame frame;
        frame.kind = SentFrame::Kind::STREAM;
        frame.stream_id = 0;
        frame.offset = pn * 1000;
        frame.length = 1000;
        pkt.frames.push_back(frame);
        tracker_.on_packet_sent(std::move(pkt), cc_);
    }
};

TEST_F(AckTrackerTest, AckRangesRemovePacketsAndDetectLoss) {
    for (uint64_t pn = 0; pn < 6; ++pn) {
        send(pn, 1000 * (pn + 1));
    }
    EXPECT_EQ(cc_.bytes_in_flight(), 7200u);
    EXPECT_EQ(tracker_.largest_sent(), 5u);

    // Acknowledge 5, 4 and 2
    AckFrame ack;
    ack.largest_acked = 5;
    ack.first_ack_range = 1;
    ack.ranges[0] = {0, 0};
    ack.range_count = 1;

    std::vector<SentPacket> acked, lost;
    ASSERT_EQ(tracker_.on_ack_received(ack, 0, 25000, 56000, cc_, acked, lost), 0);

    ASSERT_EQ(acked.size(), 3u);
    EXPECT_EQ(acked[0].packet_number, 4u);
    EXPECT_EQ(acked[1].packet_number, 5u);
    EXPECT_EQ(acked[2].packet_number, 2u);
    EXPECT_EQ(acked[0].frames.size(), 1u);

    EXPECT_TRUE(rtt_.has_sample);
    EXPECT_EQ(rtt_.latest_rtt, 50000u);

    // 0 and 1 trail the largest acknowledged by the packet threshold
    ASSERT_EQ(lost.size(), 2u);
    EXPECT_EQ(lost[0].packet_number, 0u);
    EXPECT_EQ(lost[1].packet_number, 1u);

    EXPECT_EQ(tracker_.outstanding_count(), 1u);
    EXPECT_TRUE(tracker_.has_largest_acked());
    EXPECT_EQ(tracker_.largest_acked(), 5u);
    EXPECT_EQ(cc_.bytes_in_flight(), 1200u);
    EXPECT_EQ(cc_.congestion_window(), (12000u + 3 * 1200u) / 2);

    // Packet 3 is declared lost by the time threshold
    EXPECT_EQ(tracker_.loss_time(), 4000u + (9 * 50000u) / 8);
    lost.clear();
    tracker_.detect_lost_packets(tracker_.loss_time(), cc_, lost);
    ASSERT_EQ(lost.size(), 1u);
    EXPECT_EQ(lost[0].packet_number, 3u);
    EXPECT_EQ(tracker_.loss_time(), 0u);
    EXPECT_FALSE(tracker_.has_ack_eliciting_in_flight());
    EXPECT_EQ(cc_.bytes_in_flight(), 0u);
    // Same recovery period, window unchanged
    EXPECT_EQ(cc_.congestion_window(), (12000u + 3 * 1200u) / 2);
}

TEST_F(AckTrackerTest, AckOfUnsentPacketRejected) {
    std::vector<SentPacket> acked, lost;
    AckFrame ack;
    ack.largest_acked = 0;
    EXPECT_EQ(tracker_.on_ack_received(ack, 0, 25000, 1000, cc_, acked, lost), 1);

    send(0, 1000);
    ack.largest_acked = 10;
    EXPECT_EQ(tracker_.on_ack_received(ack, 0, 25000, 2000, cc_, acked, lost), 1);
    EXPECT_TRUE(acked.empty());
}

TEST_F(AckTrackerTest, DuplicateAckIsHarmless) {
    send(0, 1000);
    AckFrame ack;
    ack.largest_acked = 0;

    std::vector<SentPacket> acked, lost;
    ASSERT_EQ(tracker_.on_ack_received(ack, 0, 25000, 11000, cc_, acked, lost), 0);
    EXPECT_EQ(acked.size(), 1u);
    EXPECT_EQ(rtt_.smoothed_rtt, 10000u);

    acked.clear();
    ASSERT_EQ(tracker_.on_ack_received(ack, 0, 25000, 50000, cc_, acked, lost), 0);
    EXPECT_TRUE(acked.empty());
    EXPECT_EQ(rtt_.smoothed_rtt, 10000u);
}

TEST_F(AckTrackerTest, NonInFlightPacketsNotTracked) {
    SentPacket ack_only;
    ack_only.packet_number = 0;
    ack_only.time_sent = 1000;
    ack_only.size = 50;
    tracker_.on_packet_sent(std::move(ack_only), cc_);

    EXPECT_EQ(tracker_.outstanding_count(), 0u);
    EXPECT_EQ(tracker_.largest_sent(), 0u);
    EXPECT_EQ(cc_.bytes_in_flight(), 0u);
    EXPECT_FALSE(tracker_.has_ack_eliciting_in_flight());
}

TEST_F(AckTrackerTest, PtoPacketsTakeOldestElicitingFirst) {
    send(0, 1000, false);
    send(1, 2000);
    send(2, 3000);
    send(3, 4000);
    EXPECT_EQ(tracker_.time_of_last_ack_eliciting(), 4000u);

    std::vector<SentPacket> resend;
    EXPECT_EQ(tracker_.take_pto_packets(2, cc_, resend), 2u);
    ASSERT_EQ(resend.size(), 2u);
    EXPECT_EQ(resend[0].packet_number, 1u);
    EXPECT_EQ(resend[1].packet_number, 2u);
    EXPECT_EQ(tracker_.outstanding_count(), 2u);
    EXPECT_TRUE(tracker_.has_ack_eliciting_in_flight());
}

TEST_F(AckTrackerTest, DiscardReleasesEverything) {
    send(0, 1000);
    send(1, 2000);
    tracker_.discard(cc_);
    EXPECT_EQ(tracker_.outstanding_count(), 0u);
    EXPECT_EQ(cc_.bytes_in_flight(), 0u);
    EXPECT_FALSE(tracker_.has_ack_eliciting_in_flight());
}

// =============================================================================
// ReceivedPacketTracker
// =============================================================================

TEST(ReceivedPacketTrackerTest, SingleElicitingPacketWaitsForDelay) {
    ReceivedPacketTracker tracker(25000);
    EXPECT_FALSE(tracker.has_received());

    tracker.on_packet_received(0, true, 1000);
    EXPECT_TRUE(tracker.ack_pending());
    EXPECT_EQ(tracker.ack_deadline(), 26000u);
    EXPECT_FALSE(tracker.ack_due(1000));
    EXPECT_TRUE(tracker.ack_due(26000));

    // Second eliciting packet forces an immediate ACK
    tracker.on_packet_received(1, true, 2000);
    EXPECT_TRUE(tracker.ack_due(2000));
    EXPECT_EQ(tracker.ack_deadline(), 1u);

    tracker.on_ack_sent();
    EXPECT_FALSE(tracker.ack_pending());
    EXPECT_EQ(tracker.ack_deadline(), 0u);
}

TEST(ReceivedPacketTrackerTest, NonElicitingPacketsNeedNoAck) {
    ReceivedPacketTracker tracker(25000);
    tracker.on_packet_received(0, false, 1000);
    tracker.on_packet_received(1, false, 2000);
    EXPECT_FALSE(tracker.ack_pending());
    EXPECT_TRUE(tracker.has_received());
    EXPECT_EQ(tracker.largest_received(), 1u);
}

TEST(ReceivedPacketTrackerTest, ReorderingAcksImmediately) {
    ReceivedPacketTracker tracker(25000);
    tracker.on_packet_received(0, true, 1000);
    tracker.on_ack_sent();

    tracker.on_packet_received(3, true, 2000);
    EXPECT_TRUE(tracker.ack_due(2000));
    tracker.on_packet_received(1, true, 2100);
    tracker.on_packet_received(2, true, 2200);

    EXPECT_TRUE(tracker.is_duplicate(2));
    EXPECT_FALSE(tracker.is_duplicate(4));

    AckFrame ack;
    ASSERT_TRUE(tracker.build_ack_frame(ack, 10000, 3));
    EXPECT_EQ(ack.largest_acked, 3u);
    EXPECT_EQ(ack.first_ack_range, 3u);
    EXPECT_EQ(ack.range_count, 0u);
    // Delay measured from receipt of the largest, scaled by the exponent
    EXPECT_EQ(ack.ack_delay, (10000u - 2000u) >> 3);
}

TEST(ReceivedPacketTrackerTest, GapsBecomeAckRanges) {
    ReceivedPacketTracker tracker(25000);
    for (uint64_t pn : {0, 1, 2, 5, 6}) {
        tracker.on_packet_received(pn, true, 1000);
    }
    tracker.on_packet_received(9, false, 1000);

    AckFrame ack;
    ASSERT_TRUE(tracker.build_ack_frame(ack, 1000, 3));
    EXPECT_EQ(ack.largest_acked, 9u);
    EXPECT_EQ(ack.first_ack_range, 0u);
    ASSERT_EQ(ack.range_count, 2u);
    EXPECT_EQ(ack.ranges[0].gap, 1u);     // 7..8 missing
    EXPECT_EQ(ack.ranges[0].length, 1u);  // 5..6
    EXPECT_EQ(ack.ranges[1].gap, 1u);     // 3..4 missing
    EXPECT_EQ(ack.ranges[1].length, 2u);  // 0..2

    // The frame this tracker builds is one the sender side accepts
    RttStats rtt;
    NewRenoCongestionControl cc;
    AckTracker sender(rtt);
    for (uint64_t pn = 0; pn < 10; ++pn) {
        SentPacket pkt;
        pkt.packet_number = pn;
        pkt.time_sent = 100;
        pkt.size = 100;
        pkt.ack_eliciting = true;
        pkt.in_flight = true;
        sender.on_packet_sent(std::move(pkt), cc);
    }
    std::vector<SentPacket> acked, lost;
    ASSERT_EQ(sender.on_ack_received(ack, 0, 25000, 200, cc, acked, lost), 0);
    EXPECT_EQ(acked.size(), 6u);
}

TEST(ReceivedPacketTrackerTest, OldRangesTrimmed) {
    ReceivedPacketTracker tracker(25000);
    for (uint64_t pn = 0; pn <= 80; pn += 2) {
        tracker.on_packet_received(pn, true, 1000);
    }
    // 41 single-packet ranges, only the newest 32 are kept
    EXPECT_TRUE(tracker.is_duplicate(0));
    EXPECT_TRUE(tracker.is_duplicate(1));
    EXPECT_TRUE(tracker.is_duplicate(18));
    EXPECT_FALSE(tracker.is_duplicate(19));
    EXPECT_FALSE(tracker.is_duplicate(81));
    EXPECT_EQ(tracker.largest_received(), 80u);
}

TEST(ReceivedPacketTrackerTest, ZeroMaxAckDelayAcksEverything) {
    ReceivedPacketTracker tracker(0);
    tracker.on_packet_received(0, true, 1000);
    EXPECT_TRUE(tracker.ack_due(1000));
}
