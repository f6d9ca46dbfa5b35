#include "../include/spoof_client_hello_assembler.hpp"
#include <sstream>
#include <iomanip>

namespace spoof {

const char* capture_error_to_string(CaptureError err) {
    switch (err) {
        case CaptureError::NONE:                 return "none";
        case CaptureError::NOT_HANDSHAKE_RECORD: return "not a handshake record";
        case CaptureError::BAD_RECORD_VERSION:   return "unknown record version";
        case CaptureError::NOT_CLIENT_HELLO:     return "not a ClientHello";
        case CaptureError::SPANS_RECORDS:        return "ClientHello spans multiple records";
        case CaptureError::OVERSIZED:            return "ClientHello exceeds size limit";
        default:                                 return "unknown";
    }
}

static std::string hex_byte(unsigned v, int width) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(width) << std::setfill('0') << v;
    return oss.str();
}

ClientHelloAssembler::ClientHelloAssembler(size_t max_bytes)
    : max_bytes_(max_bytes)
{}

ClientHelloAssembler::State ClientHelloAssembler::feed(const uint8_t* data,
                                                      size_t length) {
    if (state_ != State::NEED_MORE || data == nullptr || length == 0) {
        return state_;
    }

    buffer_.insert(buffer_.end(), data, data + length);

    if (expected_ == 0) {
        check_headers();
        if (state_ == State::ABORTED) return state_;
    }

    if (expected_ != 0 && buffer_.size() >= expected_) {
        // Surplus is the next record or application data.
        buffer_.resize(expected_);
        state_ = State::COMPLETE;
    }
    return state_;
}

void ClientHelloAssembler::check_headers() {
    if (!record_checked_ && buffer_.size() >= tls::RECORD_HEADER_LEN) {
        uint8_t type = buffer_[0];
        uint16_t version = static_cast<uint16_t>((buffer_[1] << 8) | buffer_[2]);
        record_length_ = static_cast<uint16_t>((buffer_[3] << 8) | buffer_[4]);

        if (type != static_cast<uint8_t>(tls::ContentType::HANDSHAKE)) {
            abort(CaptureError::NOT_HANDSHAKE_RECORD,
                  "record type " + hex_byte(type, 2));
            return;
        }
        if (version < tls::SSL_3_0 || version > tls::TLS_1_3) {
            abort(CaptureError::BAD_RECORD_VERSION,
                  "record version " + hex_byte(version, 4));
            return;
        }
        record_checked_ = true;
    }

    const size_t headers = tls::RECORD_HEADER_LEN + tls::HANDSHAKE_HEADER_LEN;
    if (!record_checked_ || buffer_.size() < headers) return;

    uint8_t msg_type = buffer_[5];
    uint32_t msg_len = (static_cast<uint32_t>(buffer_[6]) << 16) |
                       (static_cast<uint32_t>(buffer_[7]) << 8) |
                       buffer_[8];

    if (msg_type != static_cast<uint8_t>(tls::HandshakeType::CLIENT_HELLO)) {
        abort(CaptureError::NOT_CLIENT_HELLO,
              "handshake type " + std::to_string(msg_type));
        return;
    }
    if (tls::HANDSHAKE_HEADER_LEN + msg_len > record_length_) {
        abort(CaptureError::SPANS_RECORDS,
              "handshake length " + std::to_string(msg_len) +
              " > record length " + std::to_string(record_length_));
        return;
    }

    size_t total = headers + msg_len;
    if (total > max_bytes_) {
        abort(CaptureError::OVERSIZED,
              "declared " + std::to_string(total) + " bytes, limit " +
              std::to_string(max_bytes_));
        return;
    }
    expected_ = total;
}

void ClientHelloAssembler::abort(CaptureError err, const std::string& detail) {
    state_ = State::ABORTED;
    error_ = err;
    error_detail_ = detail;
    buffer_.clear();
    buffer_.shrink_to_fit();
}

std::vector<uint8_t> ClientHelloAssembler::take_buffer() {
    std::vector<uint8_t> out;
    out.swap(buffer_);
    return out;
}

} // namespace spoof
