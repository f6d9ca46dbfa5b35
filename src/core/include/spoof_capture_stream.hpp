#ifndef SPOOF_CAPTURE_STREAM_HPP
#define SPOOF_CAPTURE_STREAM_HPP

#include <memory>
#include <optional>
#include <string>

#include "spoof_byte_stream.hpp"
#include "spoof_client_hello.hpp"
#include "spoof_client_hello_assembler.hpp"
#include "spoof_fingerprint_store.hpp"
#include "spoof_ja4.hpp"

namespace spoof {

/**
 * @brief Observing decorator that fingerprints the peer's ClientHello
 *
 * Forwards every call to the wrapped stream. Bytes returned by read() are
 * handed to the caller unchanged; a copy goes to a ClientHelloAssembler
 * until it completes or aborts. On completion the record is parsed, the
 * JA4 fingerprint computed and recorded in the store under the wrapped
 * stream's remote address. Any failure only ends observation for this
 * connection and is logged; the caller never sees it.
 */
class ClientHelloCaptureStream : public ByteStream {
public:
    enum class Outcome {
        PENDING,        // still assembling
        FINGERPRINTED,
        TRANSPORT_ABORT,
        PARSE_ERROR,
        DISABLED
    };

    ClientHelloCaptureStream(std::unique_ptr<ByteStream> inner,
                             std::shared_ptr<FingerprintStore> store,
                             size_t max_client_hello_bytes =
                                 ClientHelloAssembler::DEFAULT_MAX_BYTES);

    ssize_t read(uint8_t* buf, size_t len) override;
    ssize_t write(const uint8_t* buf, size_t len) override;
    void close() override;
    std::string remote_address() const override;

    /// Stop observing; reads keep passing through.
    void disable();

    Outcome outcome() const { return outcome_; }
    const std::optional<JA4Fingerprint>& fingerprint() const { return fingerprint_; }
    const std::string& failure() const { return failure_; }

private:
    void observe(const uint8_t* data, size_t len);
    void finish();

    std::unique_ptr<ByteStream> inner_;
    std::shared_ptr<FingerprintStore> store_;
    ClientHelloAssembler assembler_;
    Outcome outcome_ = Outcome::PENDING;
    std::optional<JA4Fingerprint> fingerprint_;
    std::string failure_;
};

const char* capture_outcome_to_string(ClientHelloCaptureStream::Outcome outcome);

} // namespace spoof

#endif // SPOOF_CAPTURE_STREAM_HPP
