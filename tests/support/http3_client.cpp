#include "http3_client.h"

namespace dualmeter {
namespace testing {

int64_t Http3Client::submit_request(const std::string& method,
                                    const std::string& authority,
                                    const std::string& path,
                                    const std::vector<qpack::HeaderField>& headers) {
    if (quic().is_server() || !handshake_complete() || peer_goaway_received()) {
        return -1;
    }
    int64_t id = quic().open_stream(true);
    if (id < 0) {
        return -1;
    }

    std::vector<qpack::HeaderField> fields;
    fields.reserve(headers.size() + 4);
    fields.push_back({":method", method});
    fields.push_back({":scheme", "https"});
    fields.push_back({":authority", authority});
    fields.push_back({":path", path});
    fields.insert(fields.end(), headers.begin(), headers.end());

    std::vector<uint8_t> block;
    encoder().encode_field_section(fields, block);
    std::vector<uint8_t> frame;
    http3::write_frame_header(http3::FrameType::HEADERS, block.size(), frame);
    frame.insert(frame.end(), block.begin(), block.end());

    uint64_t sid = static_cast<uint64_t>(id);
    quic().write_stream(sid, frame.data(), frame.size());
    quic().finish_stream(sid);
    track_request(sid, method == "HEAD");
    return id;
}

} // namespace testing
} // namespace dualmeter
