/**
 * HTTP/3 frame layer tests (RFC 9114 Section 7).
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/dualmeter/http/http3_frame.h"
#include <cstring>

using namespace dualmeter::http3;

class Http3FrameTest : public DualmeterTest {};

TEST_F(Http3FrameTest, FrameHeaderRoundTrip) {
    std::vector<uint8_t> out;
    write_frame_header(FrameType::HEADERS, 300, out);
    EXPECT_EQ(out, std::vector<uint8_t>({0x01, 0x41, 0x2c}));

    FrameHeader header;
    size_t consumed = 0;
    ASSERT_EQ(parse_frame_header(out.data(), out.size(), header, consumed), 0);
    EXPECT_EQ(header.type, 0x01u);
    EXPECT_EQ(header.length, 300u);
    EXPECT_EQ(consumed, 3u);
}

TEST_F(Http3FrameTest, FrameHeaderNeedsMoreData) {
    std::vector<uint8_t> out;
    write_frame_header(FrameType::DATA, 70000, out);

    FrameHeader header;
    size_t consumed = 0;
    for (size_t len = 0; len < out.size(); ++len) {
        EXPECT_EQ(parse_frame_header(out.data(), len, header, consumed), -1) << "len=" << len;
    }
    EXPECT_EQ(parse_frame_header(out.data(), out.size(), header, consumed), 0);
}

TEST_F(Http3FrameTest, SettingsRoundTrip) {
    Settings local;
    local.max_field_section_size = 65536;

    std::vector<uint8_t> out;
    write_settings(local, out);

    FrameHeader header;
    size_t consumed = 0;
    ASSERT_EQ(parse_frame_header(out.data(), out.size(), header, consumed), 0);
    EXPECT_EQ(header.type, static_cast<uint64_t>(FrameType::SETTINGS));
    ASSERT_EQ(consumed + header.length, out.size());

    Settings parsed;
    parsed.max_field_section_size = 0;
    ASSERT_EQ(parse_settings(out.data() + consumed, header.length, parsed), 0);
    EXPECT_EQ(parsed.qpack_max_table_capacity, 0u);
    EXPECT_EQ(parsed.max_field_section_size, 65536u);
    EXPECT_EQ(parsed.qpack_blocked_streams, 0u);
}

TEST_F(Http3FrameTest, SettingsIgnoreUnknownAndGrease) {
    // GREASE id 0x21 (two-byte varint 0x40 0x21), then field section size 100
    std::vector<uint8_t> payload = {0x40, 0x21, 0x05, 0x06, 0x40, 0x64};
    Settings parsed;
    ASSERT_EQ(parse_settings(payload.data(), payload.size(), parsed), 0);
    EXPECT_EQ(parsed.max_field_section_size, 100u);
}

TEST_F(Http3FrameTest, SettingsErrors) {
    Settings parsed;

    std::vector<uint8_t> duplicate = {0x06, 0x10, 0x06, 0x20};
    EXPECT_EQ(parse_settings(duplicate.data(), duplicate.size(), parsed), 1);

    for (uint8_t id : {0x02, 0x03, 0x04, 0x05}) {
        std::vector<uint8_t> h2_only = {id, 0x00};
        EXPECT_EQ(parse_settings(h2_only.data(), h2_only.size(), parsed), 1) << int(id);
    }

    std::vector<uint8_t> truncated = {0x06};
    EXPECT_EQ(parse_settings(truncated.data(), truncated.size(), parsed), 1);

    EXPECT_EQ(parse_settings(nullptr, 0, parsed), 0);
}

TEST_F(Http3FrameTest, GoawayCarriesId) {
    std::vector<uint8_t> out;
    write_goaway(400, out);

    FrameHeader header;
    size_t consumed = 0;
    ASSERT_EQ(parse_frame_header(out.data(), out.size(), header, consumed), 0);
    EXPECT_EQ(header.type, static_cast<uint64_t>(FrameType::GOAWAY));
    EXPECT_EQ(header.length, 2u);

    uint64_t id = 0;
    ASSERT_EQ(dualmeter::quic::VarInt::decode(out.data() + consumed, header.length, id), 2);
    EXPECT_EQ(id, 400u);
}

TEST_F(Http3FrameTest, FramePlacement) {
    EXPECT_TRUE(allowed_on_request_stream(0x00));
    EXPECT_TRUE(allowed_on_request_stream(0x01));
    EXPECT_TRUE(allowed_on_request_stream(0x21));   // unknown types are skipped
    EXPECT_FALSE(allowed_on_request_stream(0x04));
    EXPECT_FALSE(allowed_on_request_stream(0x07));
    EXPECT_FALSE(allowed_on_request_stream(0x03));
    EXPECT_FALSE(allowed_on_request_stream(0x0D));
    EXPECT_FALSE(allowed_on_request_stream(0x06));  // HTTP/2 PING

    EXPECT_TRUE(allowed_on_control_stream(0x04));
    EXPECT_TRUE(allowed_on_control_stream(0x07));
    EXPECT_FALSE(allowed_on_control_stream(0x00));
    EXPECT_FALSE(allowed_on_control_stream(0x01));
    EXPECT_FALSE(allowed_on_control_stream(0x05));
    EXPECT_FALSE(allowed_on_control_stream(0x08));  // HTTP/2 WINDOW_UPDATE
}

TEST_F(Http3FrameTest, ErrorCodeNames) {
    EXPECT_STREQ(error_code_name(0x100), "H3_NO_ERROR");
    EXPECT_STREQ(error_code_name(0x10C), "H3_REQUEST_CANCELLED");
    EXPECT_STREQ(error_code_name(0x200), "QPACK_DECOMPRESSION_FAILED");
    EXPECT_STREQ(error_code_name(0x42), "UNKNOWN");
}
