/**
 * HTTP/2 connection state machine tests, driven entirely in memory.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "h2_test_client.h"
#include "src/dualmeter/http/http2_connection.h"

using namespace dualmeter::http2;
using dualmeter::http::HPACKHeader;
using dualmeter::core::error_code;

class Http2ConnectionTest : public DualmeterTest {
protected:
    std::unique_ptr<Http2Connection> conn_;
    H2TestClient client_;
    std::vector<uint32_t> requests_;
    std::vector<std::pair<uint32_t, StreamEvent>> events_;

    void SetUp() override {
        DualmeterTest::SetUp();
        create(ConnectionSettings());
    }

    void create(const ConnectionSettings& settings) {
        conn_ = std::make_unique<Http2Connection>(1, settings);
        requests_.clear();
        events_.clear();
        conn_->set_request_callback([this](Http2Stream& stream, bool) {
            requests_.push_back(stream.id());
        });
        conn_->set_stream_event_callback([this](const Http2Stream& stream, StreamEvent event) {
            events_.emplace_back(stream.id(), event);
        });
    }

    dualmeter::core::result<void> send(const std::vector<uint8_t>& bytes) {
        return conn_->process_input(bytes.data(), bytes.size());
    }

    // Move all server output into the client
    std::vector<H2Frame> pump() {
        std::vector<uint8_t> out;
        conn_->produce_output(out, 1 << 22);
        return client_.feed(out);
    }

    void handshake(const std::vector<SettingsParameter>& settings = {}) {
        ASSERT_TRUE(send(client_.preface(settings)).is_ok());
        pump();
        ASSERT_TRUE(send(client_.take_output()).is_ok());
        ASSERT_TRUE(conn_->is_active());
    }

    void respond(uint32_t stream_id, const std::string& body, uint16_t status = 200) {
        std::vector<HPACKHeader> headers = {
            {"content-type", "text/plain; charset=utf-8", false},
            {"content-length", std::to_string(body.size()), false},
        };
        auto shared = std::make_shared<const std::string>(body);
        ASSERT_TRUE(conn_->submit_response(stream_id, status, headers, shared).is_ok());
    }

    static std::vector<uint8_t> window_update(uint32_t stream_id, uint32_t increment) {
        std::vector<uint8_t> out;
        write_window_update_frame(out, stream_id, increment);
        return out;
    }

    static size_t count_frames(const std::vector<H2Frame>& frames, FrameType type) {
        size_t n = 0;
        for (const auto& frame : frames) {
            if (frame.header.type == type) ++n;
        }
        return n;
    }
};

// =============================================================================
// Preface and SETTINGS
// =============================================================================

TEST_F(Http2ConnectionTest, ServerSettingsQueuedImmediately) {
    EXPECT_TRUE(conn_->has_output());
    pump();
    ASSERT_FALSE(client_.server_settings.empty());

    bool push_disabled = false;
    bool streams_advertised = false;
    for (const auto& param : client_.server_settings) {
        if (param.id == SettingsId::ENABLE_PUSH) push_disabled = param.value == 0;
        if (param.id == SettingsId::MAX_CONCURRENT_STREAMS) streams_advertised = param.value == 100;
    }
    EXPECT_TRUE(push_disabled);
    EXPECT_TRUE(streams_advertised);
    EXPECT_EQ(conn_->state(), ConnectionState::PREFACE_PENDING);
}

TEST_F(Http2ConnectionTest, PrefaceAcrossManyReads) {
    auto bytes = client_.preface();
    for (uint8_t byte : bytes) {
        ASSERT_TRUE(conn_->process_input(&byte, 1).is_ok());
    }
    EXPECT_TRUE(conn_->is_active());
    pump();
    EXPECT_TRUE(client_.settings_acked);
}

TEST_F(Http2ConnectionTest, BadPrefaceIsConnectionError) {
    std::string http1 = "GET / HTTP/1.1\r\nHost: x\r\n\r\n";
    auto result = conn_->process_input(reinterpret_cast<const uint8_t*>(http1.data()), http1.size());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), error_code::protocol_violation);
    EXPECT_EQ(conn_->state(), ConnectionState::CLOSED);

    pump();
    ASSERT_TRUE(client_.goaway_received);
    EXPECT_EQ(client_.goaway.error, ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ConnectionTest, FirstFrameMustBeSettings) {
    std::vector<uint8_t> bytes(CONNECTION_PREFACE, CONNECTION_PREFACE + CONNECTION_PREFACE_LEN);
    uint8_t opaque[8] = {};
    write_ping_frame(bytes, opaque, false);
    EXPECT_TRUE(send(bytes).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ConnectionTest, InputAfterCloseRejected) {
    std::string junk = "garbage garbage garbage!";
    conn_->process_input(reinterpret_cast<const uint8_t*>(junk.data()), junk.size());
    auto again = send(client_.preface());
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error(), error_code::invalid_state);
}

TEST_F(Http2ConnectionTest, RemoteSettingsApplied) {
    handshake({{SettingsId::MAX_FRAME_SIZE, 32768}, {SettingsId::ENABLE_PUSH, 0}});
    EXPECT_EQ(conn_->remote_settings().max_frame_size, 32768u);
}

TEST_F(Http2ConnectionTest, InvalidMaxFrameSizeRejected) {
    EXPECT_TRUE(send(client_.preface({{SettingsId::MAX_FRAME_SIZE, 100}})).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ConnectionTest, InvalidEnablePushRejected) {
    EXPECT_TRUE(send(client_.preface({{SettingsId::ENABLE_PUSH, 2}})).is_err());
}

TEST_F(Http2ConnectionTest, OversizedInitialWindowRejected) {
    EXPECT_TRUE(send(client_.preface({{SettingsId::INITIAL_WINDOW_SIZE, 0x80000000u}})).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::FLOW_CONTROL_ERROR);
}

TEST_F(Http2ConnectionTest, PingAnswered) {
    handshake();
    uint8_t opaque[8] = {9, 8, 7, 6, 5, 4, 3, 2};
    std::vector<uint8_t> ping;
    write_ping_frame(ping, opaque, false);
    ASSERT_TRUE(send(ping).is_ok());
    pump();
    ASSERT_EQ(client_.ping_acks.size(), 1u);
    EXPECT_EQ(client_.ping_acks[0], std::vector<uint8_t>(opaque, opaque + 8));
}

TEST_F(Http2ConnectionTest, FrameAboveMaxSizeIsConnectionError) {
    handshake();
    std::vector<uint8_t> bytes(FRAME_HEADER_SIZE + 20000, 0);
    write_frame_header(FrameHeader(20000, FrameType::DATA, 0, 1), bytes.data());
    EXPECT_TRUE(send(bytes).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::FRAME_SIZE_ERROR);
}

// =============================================================================
// Requests and responses
// =============================================================================

TEST_F(Http2ConnectionTest, SimpleRequestResponse) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/hello.txt")).is_ok());
    ASSERT_EQ(requests_.size(), 1u);
    EXPECT_EQ(requests_[0], 1u);
    EXPECT_EQ(conn_->stream_count(), 1u);

    respond(1, "hello");
    pump();

    const H2Response& response = client_.responses[1];
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers.at("content-type"), "text/plain; charset=utf-8");
    EXPECT_EQ(response.headers.at("content-length"), "5");
    EXPECT_EQ(response.body, "hello");
    EXPECT_TRUE(response.complete);
    EXPECT_FALSE(response.reset);

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0].second, StreamEvent::FIRST_BYTE);
    EXPECT_EQ(events_[1].second, StreamEvent::COMPLETE);
    EXPECT_EQ(conn_->stream_count(), 0u);
}

TEST_F(Http2ConnectionTest, HeaderOnlyResponseEndsOnHeaders) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "HEAD", "/")).is_ok());
    ASSERT_TRUE(conn_->submit_response(1, 204, {}, nullptr).is_ok());
    auto frames = pump();

    EXPECT_EQ(count_frames(frames, FrameType::DATA), 0u);
    EXPECT_EQ(client_.responses[1].status, 204);
    EXPECT_TRUE(client_.responses[1].complete);
}

TEST_F(Http2ConnectionTest, RequestHeadersExposed) {
    handshake();
    std::string path;
    std::string authority;
    std::string accept;
    std::string cookie;
    conn_->set_request_callback([&](Http2Stream& stream, bool end_stream) {
        EXPECT_TRUE(end_stream);
        path = stream.request_header(":path");
        authority = stream.request_header(":authority");
        accept = stream.request_header("accept");
        cookie = stream.request_header("cookie");
    });

    ASSERT_TRUE(send(client_.request(1, "GET", "/a?b=c", true, {
        {"accept", "text/html", false},
        {"accept", "*/*", false},
        {"cookie", "a=1", false},
        {"cookie", "b=2", false},
    })).is_ok());

    EXPECT_EQ(path, "/a?b=c");
    EXPECT_EQ(authority, "localhost");
    EXPECT_EQ(accept, "text/html, */*");
    EXPECT_EQ(cookie, "a=1; b=2");
}

TEST_F(Http2ConnectionTest, ResponseFromInsideCallback) {
    handshake();
    conn_->set_request_callback([&](Http2Stream& stream, bool) {
        auto body = std::make_shared<const std::string>("inline");
        EXPECT_TRUE(conn_->submit_response(stream.id(), 200, {}, body).is_ok());
    });
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    pump();
    EXPECT_EQ(client_.responses[1].body, "inline");
}

TEST_F(Http2ConnectionTest, ManyStreamsInterleave) {
    handshake();
    for (uint32_t sid = 1; sid <= 19; sid += 2) {
        ASSERT_TRUE(send(client_.request(sid, "GET", "/s" + std::to_string(sid))).is_ok());
    }
    ASSERT_EQ(requests_.size(), 10u);

    // Answer in reverse order
    for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
        respond(*it, "body-" + std::to_string(*it));
    }
    pump();

    for (uint32_t sid = 1; sid <= 19; sid += 2) {
        EXPECT_EQ(client_.responses[sid].body, "body-" + std::to_string(sid));
        EXPECT_TRUE(client_.responses[sid].complete);
    }
    EXPECT_EQ(conn_->stream_count(), 0u);
}

TEST_F(Http2ConnectionTest, SubmitTwiceRejected) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/", true)).is_ok());
    respond(1, "x");
    auto again = conn_->submit_response(1, 200, {}, nullptr);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error(), error_code::invalid_state);
}

TEST_F(Http2ConnectionTest, SubmitForUnknownStreamRejected) {
    handshake();
    EXPECT_TRUE(conn_->submit_response(7, 200, {}, nullptr).is_err());
}

TEST_F(Http2ConnectionTest, HeaderBlockAcrossContinuations) {
    handshake();
    std::vector<HPACKHeader> fields = {
        {":method", "GET", false},
        {":scheme", "https", false},
        {":authority", "localhost", false},
        {":path", "/" + std::string(100, 'p'), false},
    };
    dualmeter::http::HPACKEncoder encoder;
    std::vector<uint8_t> block;
    encoder.encode(fields, block);

    std::vector<uint8_t> frames;
    write_headers_frames(frames, 1, block, true, 16);
    ASSERT_TRUE(send(frames).is_ok());
    ASSERT_EQ(requests_.size(), 1u);
    EXPECT_EQ(conn_->get_stream(1)->request_header(":path").size(), 101u);
}

TEST_F(Http2ConnectionTest, FrameInsideHeaderBlockIsConnectionError) {
    handshake();
    auto request = client_.request(1, "GET", "/");
    // Clear END_HEADERS so a CONTINUATION is expected
    request[4] &= static_cast<uint8_t>(~FrameFlags::END_HEADERS);
    ASSERT_TRUE(send(request).is_ok());

    uint8_t opaque[8] = {};
    std::vector<uint8_t> ping;
    write_ping_frame(ping, opaque, false);
    EXPECT_TRUE(send(ping).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ConnectionTest, RequestBodyThenResponse) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "POST", "/upload", false)).is_ok());
    ASSERT_EQ(requests_.size(), 1u);

    std::string body = rng_.random_string(500);
    std::vector<uint8_t> data;
    write_data_frame(data, 1, reinterpret_cast<const uint8_t*>(body.data()), body.size(), true);
    ASSERT_TRUE(send(data).is_ok());

    respond(1, "done");
    pump();
    EXPECT_EQ(client_.responses[1].body, "done");
    EXPECT_FALSE(client_.responses[1].reset);
}

TEST_F(Http2ConnectionTest, EarlyResponseResetsUnfinishedUpload) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "POST", "/upload", false)).is_ok());
    respond(1, "early");
    pump();

    const H2Response& response = client_.responses[1];
    EXPECT_TRUE(response.complete);
    EXPECT_TRUE(response.reset);
    EXPECT_EQ(response.reset_code, ErrorCode::NO_ERROR);

    // Late DATA for the finished stream is ignored
    std::vector<uint8_t> data;
    write_data_frame(data, 1, reinterpret_cast<const uint8_t*>("xx"), 2, true);
    EXPECT_TRUE(send(data).is_ok());
}

TEST_F(Http2ConnectionTest, LargeUploadReturnsWindow) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "POST", "/upload", false)).is_ok());

    auto chunk = rng_.random_bytes(16000);
    std::vector<uint8_t> data;
    for (int i = 0; i < 3; ++i) {
        write_data_frame(data, 1, chunk.data(), chunk.size(), false);
    }
    ASSERT_TRUE(send(data).is_ok());

    auto frames = pump();
    EXPECT_GE(count_frames(frames, FrameType::WINDOW_UPDATE), 1u);
}

// =============================================================================
// Request validation
// =============================================================================

TEST_F(Http2ConnectionTest, MissingPathResetsStream) {
    handshake();
    ASSERT_TRUE(send(client_.headers_frame(1, {
        {":method", "GET", false},
        {":scheme", "https", false},
    }, true)).is_ok());

    EXPECT_TRUE(requests_.empty());
    pump();
    EXPECT_TRUE(client_.responses[1].reset);
    EXPECT_EQ(client_.responses[1].reset_code, ErrorCode::PROTOCOL_ERROR);
    EXPECT_TRUE(conn_->is_active());
}

TEST_F(Http2ConnectionTest, UppercaseHeaderNameResetsStream) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/", true, {{"X-Upper", "1", false}})).is_ok());
    EXPECT_TRUE(requests_.empty());
    pump();
    EXPECT_EQ(client_.responses[1].reset_code, ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ConnectionTest, PseudoHeaderAfterRegularResetsStream) {
    handshake();
    ASSERT_TRUE(send(client_.headers_frame(1, {
        {":method", "GET", false},
        {":scheme", "https", false},
        {"accept", "*/*", false},
        {":path", "/", false},
    }, true)).is_ok());
    EXPECT_TRUE(requests_.empty());
}

TEST_F(Http2ConnectionTest, EvenStreamIdIsConnectionError) {
    handshake();
    EXPECT_TRUE(send(client_.request(2, "GET", "/")).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ConnectionTest, ReusedStreamIdIsRefused) {
    handshake();
    ASSERT_TRUE(send(client_.request(5, "GET", "/")).is_ok());
    respond(5, "x");
    pump();

    ASSERT_TRUE(send(client_.request(3, "GET", "/")).is_ok());
    pump();
    EXPECT_EQ(client_.responses[3].reset_code, ErrorCode::STREAM_CLOSED);
    EXPECT_EQ(requests_.size(), 1u);
}

TEST_F(Http2ConnectionTest, DataOnIdleStreamIsConnectionError) {
    handshake();
    std::vector<uint8_t> data;
    write_data_frame(data, 9, reinterpret_cast<const uint8_t*>("x"), 1, true);
    EXPECT_TRUE(send(data).is_err());
}

TEST_F(Http2ConnectionTest, PushPromiseFromClientIsConnectionError) {
    handshake();
    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + 4, 0);
    write_frame_header(FrameHeader(4, FrameType::PUSH_PROMISE, FrameFlags::END_HEADERS, 1),
                       frame.data());
    EXPECT_TRUE(send(frame).is_err());
}

TEST_F(Http2ConnectionTest, UnknownFrameTypeIgnored) {
    handshake();
    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + 3, 0);
    write_frame_header(FrameHeader(3, static_cast<FrameType>(0xfa), 0, 0), frame.data());
    EXPECT_TRUE(send(frame).is_ok());
    EXPECT_TRUE(conn_->is_active());
}

// =============================================================================
// Flow control
// =============================================================================

TEST_F(Http2ConnectionTest, BodyWaitsForWindowUpdates) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/big")).is_ok());
    std::string body = rng_.random_string(100000);
    respond(1, body);

    auto frames = pump();
    EXPECT_EQ(client_.responses[1].body.size(), static_cast<size_t>(DEFAULT_WINDOW_SIZE));
    EXPECT_FALSE(client_.responses[1].complete);
    EXPECT_EQ(conn_->connection_send_window(), 0);
    for (const auto& frame : frames) {
        EXPECT_LE(frame.header.length, DEFAULT_MAX_FRAME_SIZE);
    }

    // Stream window alone is not enough
    ASSERT_TRUE(send(window_update(1, 40000)).is_ok());
    pump();
    EXPECT_EQ(client_.responses[1].body.size(), static_cast<size_t>(DEFAULT_WINDOW_SIZE));

    ASSERT_TRUE(send(window_update(0, 40000)).is_ok());
    pump();
    EXPECT_EQ(client_.responses[1].body, body);
    EXPECT_TRUE(client_.responses[1].complete);
}

TEST_F(Http2ConnectionTest, InitialWindowSettingUnblocksStreams) {
    handshake({{SettingsId::INITIAL_WINDOW_SIZE, 0}});
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    respond(1, "0123456789");
    pump();

    EXPECT_TRUE(client_.responses[1].headers_received);
    EXPECT_TRUE(client_.responses[1].body.empty());

    std::vector<uint8_t> settings;
    write_settings_frame(settings, {{SettingsId::INITIAL_WINDOW_SIZE, 10}});
    ASSERT_TRUE(send(settings).is_ok());
    pump();
    EXPECT_EQ(client_.responses[1].body, "0123456789");
    EXPECT_TRUE(client_.responses[1].complete);
}

TEST_F(Http2ConnectionTest, LargerMaxFrameSizeUsed) {
    handshake({{SettingsId::MAX_FRAME_SIZE, 65536}, {SettingsId::INITIAL_WINDOW_SIZE, 1 << 20}});
    ASSERT_TRUE(send(window_update(0, 1 << 20)).is_ok());
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    respond(1, std::string(60000, 'z'));

    auto frames = pump();
    EXPECT_EQ(count_frames(frames, FrameType::DATA), 1u);
    EXPECT_TRUE(client_.responses[1].complete);
}

TEST_F(Http2ConnectionTest, OutputBudgetLimitsDataPerCall) {
    handshake({{SettingsId::INITIAL_WINDOW_SIZE, 1 << 20}});
    ASSERT_TRUE(send(window_update(0, 1 << 20)).is_ok());
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    respond(1, std::string(200000, 'q'));

    std::vector<uint8_t> out;
    conn_->produce_output(out, 32768);
    EXPECT_LT(out.size(), 32768u + DEFAULT_MAX_FRAME_SIZE + 2 * FRAME_HEADER_SIZE + 64);
    EXPECT_TRUE(conn_->has_output());
    client_.feed(out);

    pump();
    EXPECT_EQ(client_.responses[1].body.size(), 200000u);
}

TEST_F(Http2ConnectionTest, CompleteFiresWithTheEndStreamChunk) {
    handshake({{SettingsId::INITIAL_WINDOW_SIZE, 1 << 20}});
    ASSERT_TRUE(send(window_update(0, 1 << 20)).is_ok());
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    respond(1, std::string(100000, 'c'));

    auto completed = [this] {
        return std::count(events_.begin(), events_.end(),
                          std::make_pair(1u, StreamEvent::COMPLETE));
    };

    std::vector<uint8_t> out;
    conn_->produce_output(out, 32768);
    client_.feed(out);
    EXPECT_EQ(completed(), 0);
    EXPECT_FALSE(client_.responses[1].complete);

    while (conn_->has_output() && completed() == 0) {
        out.clear();
        conn_->produce_output(out, 32768);
        client_.feed(out);
        // Only the chunk that carries END_STREAM reports completion
        EXPECT_EQ(completed() == 1, client_.responses[1].complete);
    }
    EXPECT_EQ(completed(), 1);
    EXPECT_EQ(client_.responses[1].body.size(), 100000u);
}

TEST_F(Http2ConnectionTest, ZeroConnectionWindowUpdateIsError) {
    handshake();
    EXPECT_TRUE(send(window_update(0, 0)).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ConnectionTest, ConnectionWindowOverflowIsError) {
    handshake();
    EXPECT_TRUE(send(window_update(0, 0x7FFFFFFF)).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::FLOW_CONTROL_ERROR);
}

TEST_F(Http2ConnectionTest, StreamWindowOverflowResetsStream) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    ASSERT_TRUE(send(window_update(1, 0x7FFFFFFF)).is_ok());
    pump();
    EXPECT_EQ(client_.responses[1].reset_code, ErrorCode::FLOW_CONTROL_ERROR);
    EXPECT_TRUE(conn_->is_active());
}

// =============================================================================
// Resets, limits and draining
// =============================================================================

TEST_F(Http2ConnectionTest, ClientResetNotifies) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());

    std::vector<uint8_t> rst;
    write_rst_stream_frame(rst, 1, ErrorCode::CANCEL);
    ASSERT_TRUE(send(rst).is_ok());

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].first, 1u);
    EXPECT_EQ(events_[0].second, StreamEvent::RESET);
    EXPECT_EQ(conn_->stream_count(), 0u);
}

TEST_F(Http2ConnectionTest, ResetDuringBodyReportsPartialBody) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/big")).is_ok());
    size_t sent_at_reset = 0;
    conn_->set_stream_event_callback([&](const Http2Stream& stream, StreamEvent event) {
        if (event == StreamEvent::RESET) sent_at_reset = stream.body_sent();
    });
    respond(1, std::string(100000, 'b'));
    pump();

    std::vector<uint8_t> rst;
    write_rst_stream_frame(rst, 1, ErrorCode::CANCEL);
    ASSERT_TRUE(send(rst).is_ok());
    EXPECT_EQ(sent_at_reset, static_cast<size_t>(DEFAULT_WINDOW_SIZE));
}

TEST_F(Http2ConnectionTest, ServerResetStream) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    conn_->reset_stream(1, ErrorCode::INTERNAL_ERROR);
    pump();
    EXPECT_EQ(client_.responses[1].reset_code, ErrorCode::INTERNAL_ERROR);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].second, StreamEvent::RESET);
}

TEST_F(Http2ConnectionTest, ConcurrencyLimitRefusesStreams) {
    ConnectionSettings settings;
    settings.max_concurrent_streams = 2;
    create(settings);
    handshake();

    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());
    ASSERT_TRUE(send(client_.request(3, "GET", "/")).is_ok());
    ASSERT_TRUE(send(client_.request(5, "GET", "/")).is_ok());
    pump();

    EXPECT_EQ(requests_.size(), 2u);
    EXPECT_TRUE(client_.responses[5].reset);
    EXPECT_EQ(client_.responses[5].reset_code, ErrorCode::REFUSED_STREAM);

    // Capacity frees up once a stream finishes
    respond(1, "x");
    pump();
    ASSERT_TRUE(send(client_.request(7, "GET", "/")).is_ok());
    EXPECT_EQ(requests_.size(), 3u);
}

TEST_F(Http2ConnectionTest, DrainFinishesInFlightAndRefusesNew) {
    handshake();
    ASSERT_TRUE(send(client_.request(1, "GET", "/")).is_ok());

    EXPECT_TRUE(conn_->start_drain());
    EXPECT_FALSE(conn_->start_drain());
    EXPECT_EQ(conn_->state(), ConnectionState::GOAWAY_SENT);
    EXPECT_FALSE(conn_->is_drained());
    pump();
    ASSERT_TRUE(client_.goaway_received);
    EXPECT_EQ(client_.goaway.last_stream_id, 1u);
    EXPECT_EQ(client_.goaway.error, ErrorCode::NO_ERROR);

    ASSERT_TRUE(send(client_.request(3, "GET", "/")).is_ok());
    pump();
    EXPECT_EQ(client_.responses[3].reset_code, ErrorCode::REFUSED_STREAM);

    respond(1, "last");
    pump();
    EXPECT_EQ(client_.responses[1].body, "last");
    EXPECT_TRUE(conn_->is_drained());
}

TEST_F(Http2ConnectionTest, PeerGoawayRecorded) {
    handshake();
    std::vector<uint8_t> goaway;
    write_goaway_frame(goaway, 0, ErrorCode::NO_ERROR, "bye");
    ASSERT_TRUE(send(goaway).is_ok());
    EXPECT_TRUE(conn_->peer_goaway_received());
}

TEST_F(Http2ConnectionTest, CorruptHeaderBlockIsCompressionError) {
    handshake();
    std::vector<uint8_t> block = {0x80};  // index 0
    std::vector<uint8_t> frames;
    write_headers_frames(frames, 1, block, true, DEFAULT_MAX_FRAME_SIZE);
    EXPECT_TRUE(send(frames).is_err());
    EXPECT_EQ(conn_->last_error(), ErrorCode::COMPRESSION_ERROR);
}
