/**
 * HTTP/2 Frame Tests
 *
 * Frame header codec, padding removal and the frame writers used by the
 * connection state machine.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/dualmeter/http/http2_frame.h"

#include <cstring>

using namespace dualmeter::http2;
using dualmeter::core::error_code;

// =============================================================================
// HTTP/2 Frame Test Fixture
// =============================================================================

class HTTP2FrameTest : public DualmeterTest {
protected:
    // Build a frame header manually
    void build_header(uint8_t* out, uint32_t length, FrameType type,
                      uint8_t flags, uint32_t stream_id) {
        // Length (24-bit big-endian)
        out[0] = (length >> 16) & 0xFF;
        out[1] = (length >> 8) & 0xFF;
        out[2] = length & 0xFF;
        out[3] = static_cast<uint8_t>(type);
        out[4] = flags;
        // Stream ID (31-bit big-endian, R bit = 0)
        out[5] = (stream_id >> 24) & 0x7F;
        out[6] = (stream_id >> 16) & 0xFF;
        out[7] = (stream_id >> 8) & 0xFF;
        out[8] = stream_id & 0xFF;
    }

    // Generate random stream ID (31-bit)
    uint32_t random_stream_id() {
        return static_cast<uint32_t>(rng_.random_size(0, 0x7FFFFFFF));
    }

    // Split a buffer of back-to-back frames
    static std::vector<std::pair<FrameHeader, std::vector<uint8_t>>>
    split_frames(const std::vector<uint8_t>& buf) {
        std::vector<std::pair<FrameHeader, std::vector<uint8_t>>> frames;
        size_t offset = 0;
        while (offset + FRAME_HEADER_SIZE <= buf.size()) {
            FrameHeader header = parse_frame_header(buf.data() + offset);
            offset += FRAME_HEADER_SIZE;
            std::vector<uint8_t> payload(buf.begin() + offset,
                                         buf.begin() + offset + header.length);
            offset += header.length;
            frames.emplace_back(header, std::move(payload));
        }
        return frames;
    }
};

// =============================================================================
// Frame Header Parsing Tests
// =============================================================================

TEST_F(HTTP2FrameTest, ParseFrameHeader) {
    uint8_t buf[FRAME_HEADER_SIZE];
    build_header(buf, 1234, FrameType::HEADERS, FrameFlags::END_HEADERS, 7);

    FrameHeader header = parse_frame_header(buf);
    EXPECT_EQ(header.length, 1234u);
    EXPECT_EQ(header.type, FrameType::HEADERS);
    EXPECT_EQ(header.flags, FrameFlags::END_HEADERS);
    EXPECT_EQ(header.stream_id, 7u);
}

TEST_F(HTTP2FrameTest, ParseFrameHeaderAllTypes) {
    const FrameType types[] = {
        FrameType::DATA, FrameType::HEADERS, FrameType::PRIORITY,
        FrameType::RST_STREAM, FrameType::SETTINGS, FrameType::PUSH_PROMISE,
        FrameType::PING, FrameType::GOAWAY, FrameType::WINDOW_UPDATE,
        FrameType::CONTINUATION
    };
    for (FrameType type : types) {
        uint8_t buf[FRAME_HEADER_SIZE];
        build_header(buf, 8, type, 0, 1);
        EXPECT_EQ(parse_frame_header(buf).type, type);
    }
}

TEST_F(HTTP2FrameTest, ParseFrameHeaderMaxLength) {
    uint8_t buf[FRAME_HEADER_SIZE];
    build_header(buf, MAX_ALLOWED_FRAME_SIZE, FrameType::DATA, 0, 1);
    EXPECT_EQ(parse_frame_header(buf).length, MAX_ALLOWED_FRAME_SIZE);
}

TEST_F(HTTP2FrameTest, ParseFrameHeaderIgnoresReservedBit) {
    uint8_t buf[FRAME_HEADER_SIZE];
    build_header(buf, 0, FrameType::DATA, 0, 0x7FFFFFFF);
    buf[5] |= 0x80;
    EXPECT_EQ(parse_frame_header(buf).stream_id, 0x7FFFFFFFu);
}

TEST_F(HTTP2FrameTest, WriteFrameHeaderMatchesManualLayout) {
    constexpr int NUM_TESTS = 100;

    for (int i = 0; i < NUM_TESTS; ++i) {
        uint32_t length = static_cast<uint32_t>(rng_.random_size(0, MAX_ALLOWED_FRAME_SIZE));
        uint8_t flags = static_cast<uint8_t>(rng_.random_int(0, 255));
        uint32_t stream_id = random_stream_id();

        uint8_t expected[FRAME_HEADER_SIZE];
        build_header(expected, length, FrameType::DATA, flags, stream_id);

        uint8_t actual[FRAME_HEADER_SIZE];
        write_frame_header(FrameHeader(length, FrameType::DATA, flags, stream_id), actual);
        EXPECT_EQ(std::memcmp(expected, actual, FRAME_HEADER_SIZE), 0);
    }
}

// =============================================================================
// Padding
// =============================================================================

TEST_F(HTTP2FrameTest, UnpadUnpaddedPayload) {
    FrameHeader header(10, FrameType::DATA, 0, 1);
    uint8_t payload[10] = {};
    size_t offset = 99;
    size_t length = 99;
    ASSERT_TRUE(unpad_payload(header, payload, offset, length).is_ok());
    EXPECT_EQ(offset, 0u);
    EXPECT_EQ(length, 10u);
}

TEST_F(HTTP2FrameTest, UnpadPaddedData) {
    // pad length 3, 4 data bytes, 3 pad bytes
    uint8_t payload[] = {3, 'a', 'b', 'c', 'd', 0, 0, 0};
    FrameHeader header(sizeof(payload), FrameType::DATA, FrameFlags::PADDED, 1);
    size_t offset = 0;
    size_t length = 0;
    ASSERT_TRUE(unpad_payload(header, payload, offset, length).is_ok());
    EXPECT_EQ(offset, 1u);
    EXPECT_EQ(length, 4u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(payload + offset), length), "abcd");
}

TEST_F(HTTP2FrameTest, UnpadHeadersWithPriority) {
    // pad length 1, 5 priority bytes, 2 block bytes, 1 pad byte
    uint8_t payload[] = {1, 0, 0, 0, 3, 15, 0x82, 0x84, 0};
    FrameHeader header(sizeof(payload), FrameType::HEADERS,
                       FrameFlags::PADDED | FrameFlags::PRIORITY | FrameFlags::END_HEADERS, 1);
    size_t offset = 0;
    size_t length = 0;
    ASSERT_TRUE(unpad_payload(header, payload, offset, length).is_ok());
    EXPECT_EQ(offset, 6u);
    EXPECT_EQ(length, 2u);
    EXPECT_EQ(payload[offset], 0x82);
}

TEST_F(HTTP2FrameTest, PaddingLongerThanPayloadIsRejected) {
    uint8_t payload[] = {10, 'a', 'b'};
    FrameHeader header(sizeof(payload), FrameType::DATA, FrameFlags::PADDED, 1);
    size_t offset = 0;
    size_t length = 0;
    auto result = unpad_payload(header, payload, offset, length);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), error_code::protocol_violation);
}

TEST_F(HTTP2FrameTest, EmptyPaddedFrameIsRejected) {
    FrameHeader header(0, FrameType::DATA, FrameFlags::PADDED, 1);
    uint8_t unused = 0;
    size_t offset = 0;
    size_t length = 0;
    EXPECT_TRUE(unpad_payload(header, &unused, offset, length).is_err());
}

// =============================================================================
// DATA Frame Tests
// =============================================================================

TEST_F(HTTP2FrameTest, WriteDataFrame) {
    std::string data = "Hello, HTTP/2!";
    std::vector<uint8_t> frame;
    write_data_frame(frame, 1, reinterpret_cast<const uint8_t*>(data.data()), data.size(), false);

    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + data.size());
    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.type, FrameType::DATA);
    EXPECT_EQ(header.length, data.size());
    EXPECT_EQ(header.stream_id, 1u);
    EXPECT_EQ(header.flags & FrameFlags::END_STREAM, 0);
    EXPECT_EQ(std::string(frame.begin() + FRAME_HEADER_SIZE, frame.end()), data);
}

TEST_F(HTTP2FrameTest, WriteEmptyDataFrameEndStream) {
    std::vector<uint8_t> frame;
    write_data_frame(frame, 5, nullptr, 0, true);

    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE);
    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.length, 0u);
    EXPECT_NE(header.flags & FrameFlags::END_STREAM, 0);
}

TEST_F(HTTP2FrameTest, WritersAppend) {
    std::vector<uint8_t> out;
    write_settings_ack(out);
    write_rst_stream_frame(out, 3, ErrorCode::CANCEL);

    auto frames = split_frames(out);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].first.type, FrameType::SETTINGS);
    EXPECT_EQ(frames[1].first.type, FrameType::RST_STREAM);
}

// =============================================================================
// HEADERS Frame Tests
// =============================================================================

TEST_F(HTTP2FrameTest, HeadersFitInOneFrame) {
    std::vector<uint8_t> block = {0x88, 0x5f, 0x87};
    std::vector<uint8_t> out;
    write_headers_frames(out, 1, block, false, DEFAULT_MAX_FRAME_SIZE);

    auto frames = split_frames(out);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].first.type, FrameType::HEADERS);
    EXPECT_EQ(frames[0].first.flags, FrameFlags::END_HEADERS);
    EXPECT_EQ(frames[0].second, block);
}

TEST_F(HTTP2FrameTest, HeadersEndStream) {
    std::vector<uint8_t> block = {0x88};
    std::vector<uint8_t> out;
    write_headers_frames(out, 9, block, true, DEFAULT_MAX_FRAME_SIZE);

    FrameHeader header = parse_frame_header(out.data());
    EXPECT_EQ(header.flags, FrameFlags::END_HEADERS | FrameFlags::END_STREAM);
    EXPECT_EQ(header.stream_id, 9u);
}

TEST_F(HTTP2FrameTest, LargeHeaderBlockSplitsIntoContinuations) {
    auto bytes = rng_.random_bytes(40000);
    std::vector<uint8_t> block(bytes.begin(), bytes.end());
    std::vector<uint8_t> out;
    write_headers_frames(out, 3, block, true, DEFAULT_MAX_FRAME_SIZE);

    auto frames = split_frames(out);
    ASSERT_EQ(frames.size(), 3u);

    EXPECT_EQ(frames[0].first.type, FrameType::HEADERS);
    EXPECT_EQ(frames[0].first.flags, FrameFlags::END_STREAM);
    EXPECT_EQ(frames[0].first.length, DEFAULT_MAX_FRAME_SIZE);

    EXPECT_EQ(frames[1].first.type, FrameType::CONTINUATION);
    EXPECT_EQ(frames[1].first.flags, 0);

    EXPECT_EQ(frames[2].first.type, FrameType::CONTINUATION);
    EXPECT_EQ(frames[2].first.flags, FrameFlags::END_HEADERS);
    EXPECT_EQ(frames[2].first.length, 40000u - 2 * DEFAULT_MAX_FRAME_SIZE);

    std::vector<uint8_t> joined;
    for (auto& frame : frames) {
        EXPECT_EQ(frame.first.stream_id, 3u);
        joined.insert(joined.end(), frame.second.begin(), frame.second.end());
    }
    EXPECT_EQ(joined, block);
}

// =============================================================================
// SETTINGS Frame Tests
// =============================================================================

TEST_F(HTTP2FrameTest, WriteSettingsFrame) {
    std::vector<SettingsParameter> settings = {
        {SettingsId::MAX_CONCURRENT_STREAMS, 100},
        {SettingsId::INITIAL_WINDOW_SIZE, 65535},
        {SettingsId::MAX_FRAME_SIZE, 16384}
    };

    std::vector<uint8_t> frame;
    write_settings_frame(frame, settings);

    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.type, FrameType::SETTINGS);
    EXPECT_EQ(header.length, settings.size() * 6);  // 6 bytes per setting
    EXPECT_EQ(header.stream_id, 0u);
    EXPECT_EQ(header.flags & FrameFlags::ACK, 0);

    auto parsed = parse_settings_frame(frame.data() + FRAME_HEADER_SIZE, header.length);
    ASSERT_TRUE(parsed.is_ok());
    ASSERT_EQ(parsed.value().size(), settings.size());
    for (size_t i = 0; i < settings.size(); ++i) {
        EXPECT_EQ(parsed.value()[i].id, settings[i].id);
        EXPECT_EQ(parsed.value()[i].value, settings[i].value);
    }
}

TEST_F(HTTP2FrameTest, WriteSettingsAck) {
    std::vector<uint8_t> frame;
    write_settings_ack(frame);

    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.type, FrameType::SETTINGS);
    EXPECT_EQ(header.length, 0u);
    EXPECT_NE(header.flags & FrameFlags::ACK, 0);
}

TEST_F(HTTP2FrameTest, SettingsWithBadLengthRejected) {
    uint8_t payload[7] = {0, 3, 0, 0, 0, 100, 0};
    auto parsed = parse_settings_frame(payload, sizeof(payload));
    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error(), error_code::protocol_violation);
}

TEST_F(HTTP2FrameTest, EmptySettingsFrame) {
    auto parsed = parse_settings_frame(nullptr, 0);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().empty());
}

// =============================================================================
// WINDOW_UPDATE Frame Tests
// =============================================================================

TEST_F(HTTP2FrameTest, WindowUpdateRoundTrip) {
    std::vector<uint8_t> frame;
    write_window_update_frame(frame, 5, 1000);

    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.type, FrameType::WINDOW_UPDATE);
    EXPECT_EQ(header.length, 4u);
    EXPECT_EQ(header.stream_id, 5u);
    EXPECT_EQ(parse_window_update_frame(frame.data() + FRAME_HEADER_SIZE), 1000u);
}

TEST_F(HTTP2FrameTest, WindowUpdateMaxValue) {
    std::vector<uint8_t> frame;
    write_window_update_frame(frame, 0, static_cast<uint32_t>(MAX_WINDOW_SIZE));
    EXPECT_EQ(parse_window_update_frame(frame.data() + FRAME_HEADER_SIZE),
              static_cast<uint32_t>(MAX_WINDOW_SIZE));
}

TEST_F(HTTP2FrameTest, WindowUpdateReservedBitMasked) {
    uint8_t payload[4] = {0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(parse_window_update_frame(payload), 0x7FFFFFFFu);
}

// =============================================================================
// PING Frame Tests
// =============================================================================

TEST_F(HTTP2FrameTest, WritePingFrame) {
    uint8_t opaque[8] = {1, 2, 3, 4, 5, 6, 7, 8};
    std::vector<uint8_t> frame;
    write_ping_frame(frame, opaque, false);

    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.type, FrameType::PING);
    EXPECT_EQ(header.length, 8u);
    EXPECT_EQ(header.stream_id, 0u);
    EXPECT_EQ(header.flags & FrameFlags::ACK, 0);
    EXPECT_EQ(std::memcmp(frame.data() + FRAME_HEADER_SIZE, opaque, 8), 0);
}

TEST_F(HTTP2FrameTest, WritePingAck) {
    uint8_t opaque[8] = {};
    std::vector<uint8_t> frame;
    write_ping_frame(frame, opaque, true);
    EXPECT_NE(parse_frame_header(frame.data()).flags & FrameFlags::ACK, 0);
}

// =============================================================================
// GOAWAY Frame Tests
// =============================================================================

TEST_F(HTTP2FrameTest, GoawayRoundTrip) {
    std::vector<uint8_t> frame;
    write_goaway_frame(frame, 41, ErrorCode::ENHANCE_YOUR_CALM, "slow down");

    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.type, FrameType::GOAWAY);
    EXPECT_EQ(header.stream_id, 0u);

    auto info = parse_goaway_frame(frame.data() + FRAME_HEADER_SIZE, header.length);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().last_stream_id, 41u);
    EXPECT_EQ(info.value().error, ErrorCode::ENHANCE_YOUR_CALM);
    EXPECT_EQ(info.value().debug_data, "slow down");
}

TEST_F(HTTP2FrameTest, GoawayWithoutDebugData) {
    std::vector<uint8_t> frame;
    write_goaway_frame(frame, 0, ErrorCode::NO_ERROR);
    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.length, 8u);

    auto info = parse_goaway_frame(frame.data() + FRAME_HEADER_SIZE, header.length);
    ASSERT_TRUE(info.is_ok());
    EXPECT_TRUE(info.value().debug_data.empty());
}

TEST_F(HTTP2FrameTest, TruncatedGoawayRejected) {
    uint8_t payload[7] = {};
    EXPECT_TRUE(parse_goaway_frame(payload, sizeof(payload)).is_err());
}

// =============================================================================
// RST_STREAM Frame Tests
// =============================================================================

TEST_F(HTTP2FrameTest, RstStreamRoundTrip) {
    std::vector<uint8_t> frame;
    write_rst_stream_frame(frame, 7, ErrorCode::REFUSED_STREAM);

    FrameHeader header = parse_frame_header(frame.data());
    EXPECT_EQ(header.type, FrameType::RST_STREAM);
    EXPECT_EQ(header.length, 4u);
    EXPECT_EQ(header.stream_id, 7u);
    EXPECT_EQ(parse_rst_stream_frame(frame.data() + FRAME_HEADER_SIZE),
              ErrorCode::REFUSED_STREAM);
}

TEST_F(HTTP2FrameTest, AllErrorCodesHaveNames) {
    for (uint32_t code = 0; code <= 0xd; ++code) {
        EXPECT_STRNE(error_code_name(static_cast<ErrorCode>(code)), "UNKNOWN") << code;
    }
    EXPECT_STREQ(error_code_name(ErrorCode::FLOW_CONTROL_ERROR), "FLOW_CONTROL_ERROR");
    EXPECT_STREQ(error_code_name(static_cast<ErrorCode>(0x99)), "UNKNOWN");
}

// =============================================================================
// Constants
// =============================================================================

TEST_F(HTTP2FrameTest, ConnectionPreface) {
    EXPECT_EQ(std::strlen(CONNECTION_PREFACE), CONNECTION_PREFACE_LEN);
    EXPECT_EQ(std::string(CONNECTION_PREFACE, 3), "PRI");
}

TEST_F(HTTP2FrameTest, FrameHeaderDefaults) {
    FrameHeader header;
    EXPECT_EQ(header.length, 0u);
    EXPECT_EQ(header.type, FrameType::DATA);
    EXPECT_EQ(header.flags, 0);
    EXPECT_EQ(header.stream_id, 0u);
}
