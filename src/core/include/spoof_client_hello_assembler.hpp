#ifndef SPOOF_CLIENT_HELLO_ASSEMBLER_HPP
#define SPOOF_CLIENT_HELLO_ASSEMBLER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "spoof_client_hello.hpp"

namespace spoof {

/**
 * @brief Why fingerprinting was abandoned for a connection
 */
enum class CaptureError {
    NONE,
    NOT_HANDSHAKE_RECORD,   // first byte is not 0x16
    BAD_RECORD_VERSION,     // record version outside SSL 3.0 .. TLS 1.3
    NOT_CLIENT_HELLO,       // handshake type is not 1
    SPANS_RECORDS,          // ClientHello does not fit in its record
    OVERSIZED               // declared length above the configured bound
};

const char* capture_error_to_string(CaptureError err);

/**
 * @brief Incremental ClientHello reassembly from arbitrary read chunks
 *
 * Accumulates bytes until the record and handshake headers declare how
 * long the ClientHello is, then until that many bytes are present.
 * Anything past the declared end belongs to later protocol data and is
 * dropped. Headers are validated as soon as they are available; a
 * failure moves the assembler to ABORTED for good.
 *
 * Only a single record is honoured: a ClientHello whose declared length
 * does not fit inside its own record aborts with SPANS_RECORDS.
 *
 * Not thread-safe; one instance belongs to one connection.
 */
class ClientHelloAssembler {
public:
    enum class State {
        NEED_MORE,
        COMPLETE,
        ABORTED
    };

    static constexpr size_t DEFAULT_MAX_BYTES =
        tls::RECORD_HEADER_LEN + tls::MAX_PLAINTEXT_RECORD;

    explicit ClientHelloAssembler(size_t max_bytes = DEFAULT_MAX_BYTES);

    /// Appends a chunk. No-op once COMPLETE or ABORTED.
    State feed(const uint8_t* data, size_t length);

    State state() const { return state_; }
    bool complete() const { return state_ == State::COMPLETE; }
    bool aborted() const { return state_ == State::ABORTED; }

    CaptureError error() const { return error_; }
    const std::string& error_detail() const { return error_detail_; }

    /// 0 until both headers have been seen.
    size_t expected_length() const { return expected_; }

    /// Complete record once complete(), bytes gathered so far otherwise.
    const std::vector<uint8_t>& buffer() const { return buffer_; }

    /// Moves the buffer out; the assembler keeps its state.
    std::vector<uint8_t> take_buffer();

private:
    void check_headers();
    void abort(CaptureError err, const std::string& detail);

    size_t max_bytes_;
    std::vector<uint8_t> buffer_;
    size_t expected_ = 0;
    bool record_checked_ = false;
    uint16_t record_length_ = 0;
    State state_ = State::NEED_MORE;
    CaptureError error_ = CaptureError::NONE;
    std::string error_detail_;
};

} // namespace spoof

#endif // SPOOF_CLIENT_HELLO_ASSEMBLER_HPP
