/**
 * QUIC Stream Implementation
 *
 * Implements RFC 9000 stream semantics:
 * - Bidirectional and unidirectional streams
 * - Retransmission of lost ranges from the unacknowledged send buffer
 * - In-order delivery with reassembly
 * - Final size checks for FIN and RESET_STREAM
 */

#include "quic_stream.h"

#include <algorithm>
#include <iterator>

namespace dualmeter {
namespace quic {

// ============================================================================
// RangeSet
// ============================================================================

void RangeSet::add(uint64_t start, uint64_t end) {
    if (start >= end) return;

    auto it = ranges_.upper_bound(start);
    if (it != ranges_.begin()) {
        auto prev = std::prev(it);
        if (prev->second >= start) {
            start = prev->first;
            end = std::max(end, prev->second);
            ranges_.erase(prev);
        }
    }

    while (it != ranges_.end() && it->first <= end) {
        end = std::max(end, it->second);
        it = ranges_.erase(it);
    }

    ranges_[start] = end;
}

void RangeSet::remove(uint64_t start, uint64_t end) {
    if (start >= end) return;

    auto it = ranges_.upper_bound(start);
    if (it != ranges_.begin()) {
        auto prev = std::prev(it);
        if (prev->second > start) {
            uint64_t prev_end = prev->second;
            if (prev->first == start) {
                ranges_.erase(prev);
            } else {
                prev->second = start;
            }
            if (prev_end > end) {
                ranges_[end] = prev_end;
                return;
            }
        }
    }

    while (it != ranges_.end() && it->first < end) {
        if (it->second > end) {
            uint64_t tail_end = it->second;
            ranges_.erase(it);
            ranges_[end] = tail_end;
            return;
        }
        it = ranges_.erase(it);
    }
}

uint64_t RangeSet::contiguous_end(uint64_t start) const noexcept {
    auto it = ranges_.upper_bound(start);
    if (it == ranges_.begin()) {
        return start;
    }
    --it;
    return it->second > start ? it->second : start;
}

uint64_t RangeSet::next_start(uint64_t pos) const noexcept {
    auto it = ranges_.lower_bound(pos);
    return it == ranges_.end() ? UINT64_MAX : it->first;
}

// ============================================================================
// QUICStream
// ============================================================================

QUICStream::QUICStream(uint64_t stream_id, bool is_server,
                       uint64_t recv_window, uint64_t peer_max_stream_data)
    : stream_id_(stream_id),
      type_(static_cast<StreamType>(stream_id & 0x03)),
      is_local_(((stream_id & 0x01) == 1) == is_server),
      flow_control_(recv_window, peer_max_stream_data),
      recv_buffer_(can_receive() ? static_cast<size_t>(recv_window) : 1) {
}

size_t QUICStream::write(const uint8_t* data, size_t length) {
    if (!can_send() || fin_queued_ || reset_sent_) {
        return 0;
    }
    send_data_.append(reinterpret_cast<const char*>(data), length);
    return length;
}

void QUICStream::close_send() noexcept {
    if (can_send()) {
        fin_queued_ = true;
    }
}

bool QUICStream::has_data_to_send(uint64_t conn_credit) const noexcept {
    if (!can_send() || reset_sent_) {
        return false;
    }
    if (!retransmit_.empty() || fin_lost_) {
        return true;
    }

    uint64_t pending = bytes_written() - next_send_offset_;
    if (pending > 0) {
        return std::min(conn_credit, flow_control_.available_window()) > 0;
    }
    return fin_queued_ && !fin_sent_;
}

bool QUICStream::next_frame(size_t max_frame_size, uint64_t conn_credit,
                            StreamFrame& out, uint64_t& out_new_bytes) noexcept {
    out_new_bytes = 0;
    if (!can_send() || reset_sent_) {
        return false;
    }

    out.stream_id = stream_id_;

    // Lost ranges first; they were already counted against flow control
    if (!retransmit_.empty()) {
        auto range = retransmit_.front();
        uint64_t length = range.second - range.first;
        size_t header = StreamFrame::header_size(stream_id_, range.first, length);
        if (max_frame_size <= header) {
            return false;
        }
        length = std::min<uint64_t>(length, max_frame_size - header);

        out.offset = range.first;
        out.length = length;
        out.data = reinterpret_cast<const uint8_t*>(send_data_.data()) + (range.first - send_base_);
        out.fin = fin_lost_ && range.first + length == bytes_written();
        if (out.fin) {
            fin_lost_ = false;
        }
        retransmit_.remove(range.first, range.first + length);
        return true;
    }

    if (fin_lost_) {
        uint64_t final_size = bytes_written();
        if (max_frame_size < StreamFrame::header_size(stream_id_, final_size, 0)) {
            return false;
        }
        out.offset = final_size;
        out.length = 0;
        out.data = nullptr;
        out.fin = true;
        fin_lost_ = false;
        return true;
    }

    uint64_t pending = bytes_written() - next_send_offset_;
    uint64_t credit = std::min(conn_credit, flow_control_.available_window());
    uint64_t length = std::min(pending, credit);
    bool fin_pending = fin_queued_ && !fin_sent_;

    if (length == 0 && !(fin_pending && pending == 0)) {
        return false;
    }

    size_t header = StreamFrame::header_size(stream_id_, next_send_offset_, length);
    if (max_frame_size < header + (length > 0 ? 1 : 0)) {
        return false;
    }
    length = std::min<uint64_t>(length, max_frame_size - header);

    out.offset = next_send_offset_;
    out.length = length;
    out.data = reinterpret_cast<const uint8_t*>(send_data_.data()) + (next_send_offset_ - send_base_);
    out.fin = fin_pending && next_send_offset_ + length == bytes_written();

    next_send_offset_ += length;
    flow_control_.add_sent_data(length);
    out_new_bytes = length;

    if (length > 0) {
        first_byte_sent_ = true;
    }
    if (out.fin) {
        fin_sent_ = true;
    }
    return true;
}

void QUICStream::on_frame_acked(uint64_t offset, uint64_t length, bool fin) {
    if (reset_sent_) {
        return;
    }

    uint64_t end = offset + length;
    if (end > send_base_) {
        acked_.add(std::max(offset, send_base_), end);
    }
    retransmit_.remove(offset, end);

    if (fin) {
        fin_acked_ = true;
        fin_lost_ = false;
    }

    advance_send_base();
}

void QUICStream::on_frame_lost(uint64_t offset, uint64_t length, bool fin) {
    if (reset_sent_) {
        return;
    }

    uint64_t start = std::max(offset, send_base_);
    uint64_t end = offset + length;
    if (start < end) {
        retransmit_.add(start, end);
        // Parts acknowledged through another copy need no resend
        uint64_t pos = start;
        while (pos < end) {
            uint64_t acked_end = acked_.contiguous_end(pos);
            if (acked_end > pos) {
                retransmit_.remove(pos, std::min(acked_end, end));
                pos = acked_end;
            } else {
                pos = acked_.next_start(pos);
            }
        }
    }

    if (fin && !fin_acked_) {
        fin_lost_ = true;
    }
}

void QUICStream::advance_send_base() noexcept {
    uint64_t end = acked_.contiguous_end(send_base_);
    if (end > send_base_) {
        send_data_.erase(0, static_cast<size_t>(end - send_base_));
        acked_.remove(send_base_, end);
        send_base_ = end;
    }
}

void QUICStream::reset_send(uint64_t error_code) noexcept {
    if (!can_send() || reset_sent_) {
        return;
    }
    reset_sent_ = true;
    reset_error_code_ = error_code;
    send_base_ += send_data_.size();
    send_data_.clear();
    retransmit_.clear();
    acked_.clear();
    fin_lost_ = false;
}

TransportError QUICStream::on_stream_frame(uint64_t offset, const uint8_t* data,
                                           uint64_t length, bool fin) {
    uint64_t end = offset + length;

    if (final_size_known_) {
        if (end > final_size_ || (fin && end != final_size_)) {
            return TransportError::FINAL_SIZE_ERROR;
        }
    } else if (fin) {
        if (end < flow_control_.highest_recv_offset()) {
            return TransportError::FINAL_SIZE_ERROR;
        }
        final_size_known_ = true;
        final_size_ = end;
    }

    if (reset_received_ || stop_sending_ || end <= recv_offset_) {
        return TransportError::NO_ERROR;
    }

    if (offset < recv_offset_) {
        uint64_t skip = recv_offset_ - offset;
        data += skip;
        length -= skip;
        offset = recv_offset_;
    }

    if (offset > recv_offset_) {
        std::string& segment = out_of_order_[offset];
        if (segment.size() < length) {
            segment.assign(reinterpret_cast<const char*>(data), static_cast<size_t>(length));
        }
        return TransportError::NO_ERROR;
    }

    recv_buffer_.write(data, static_cast<size_t>(length));
    recv_offset_ += length;

    while (!out_of_order_.empty()) {
        auto it = out_of_order_.begin();
        if (it->first > recv_offset_) {
            break;
        }
        uint64_t segment_end = it->first + it->second.size();
        if (segment_end > recv_offset_) {
            size_t skip = static_cast<size_t>(recv_offset_ - it->first);
            recv_buffer_.write(reinterpret_cast<const uint8_t*>(it->second.data()) + skip,
                               it->second.size() - skip);
            recv_offset_ = segment_end;
        }
        out_of_order_.erase(it);
    }

    return TransportError::NO_ERROR;
}

TransportError QUICStream::on_reset(uint64_t final_size, uint64_t error_code) noexcept {
    if (final_size_known_ && final_size != final_size_) {
        return TransportError::FINAL_SIZE_ERROR;
    }
    if (final_size < flow_control_.highest_recv_offset()) {
        return TransportError::FINAL_SIZE_ERROR;
    }

    final_size_known_ = true;
    final_size_ = final_size;
    reset_received_ = true;
    peer_reset_code_ = error_code;
    recv_buffer_.clear();
    out_of_order_.clear();
    return TransportError::NO_ERROR;
}

void QUICStream::stop_receiving() noexcept {
    stop_sending_ = true;
    recv_buffer_.clear();
    out_of_order_.clear();
}

size_t QUICStream::read(uint8_t* buffer, size_t length) noexcept {
    return recv_buffer_.read(buffer, length);
}

size_t QUICStream::discard(size_t length) noexcept {
    return recv_buffer_.discard(length);
}

} // namespace quic
} // namespace dualmeter
