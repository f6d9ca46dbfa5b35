#include "../include/spoof_capture_stream.hpp"
#include "../include/spoof_logger.hpp"
#include <exception>
#include <stdexcept>

namespace spoof {

const char* capture_outcome_to_string(ClientHelloCaptureStream::Outcome outcome) {
    switch (outcome) {
        case ClientHelloCaptureStream::Outcome::PENDING:         return "pending";
        case ClientHelloCaptureStream::Outcome::FINGERPRINTED:   return "fingerprinted";
        case ClientHelloCaptureStream::Outcome::TRANSPORT_ABORT: return "transport-abort";
        case ClientHelloCaptureStream::Outcome::PARSE_ERROR:     return "parse-error";
        case ClientHelloCaptureStream::Outcome::DISABLED:        return "disabled";
        default:                                                 return "unknown";
    }
}

ClientHelloCaptureStream::ClientHelloCaptureStream(
    std::unique_ptr<ByteStream> inner,
    std::shared_ptr<FingerprintStore> store,
    size_t max_client_hello_bytes)
    : inner_(std::move(inner))
    , store_(std::move(store))
    , assembler_(max_client_hello_bytes)
{
    if (!inner_) {
        throw std::invalid_argument("ClientHelloCaptureStream needs a stream");
    }
}

ssize_t ClientHelloCaptureStream::read(uint8_t* buf, size_t len) {
    ssize_t n = inner_->read(buf, len);
    if (n > 0 && outcome_ == Outcome::PENDING) {
        // Runs under the TLS engine's BIO callback; nothing may escape.
        try {
            observe(buf, static_cast<size_t>(n));
        } catch (const std::exception& e) {
            outcome_ = Outcome::PARSE_ERROR;
            failure_ = e.what();
            SPOOF_LOG_WARN("capture", "fingerprinting aborted, " + failure_);
        }
    }
    return n;
}

ssize_t ClientHelloCaptureStream::write(const uint8_t* buf, size_t len) {
    return inner_->write(buf, len);
}

void ClientHelloCaptureStream::close() {
    inner_->close();
}

std::string ClientHelloCaptureStream::remote_address() const {
    return inner_->remote_address();
}

void ClientHelloCaptureStream::disable() {
    if (outcome_ == Outcome::PENDING) outcome_ = Outcome::DISABLED;
}

void ClientHelloCaptureStream::observe(const uint8_t* data, size_t len) {
    switch (assembler_.feed(data, len)) {
        case ClientHelloAssembler::State::NEED_MORE:
            if (Logger::instance().isEnabled(LogLevel::TRACE)) {
                SPOOF_LOG_TRACE("capture", remote_address() + " buffered " +
                                std::to_string(assembler_.buffer().size()) + " bytes");
            }
            return;
        case ClientHelloAssembler::State::ABORTED:
            outcome_ = Outcome::TRANSPORT_ABORT;
            failure_ = std::string(capture_error_to_string(assembler_.error())) +
                       ": " + assembler_.error_detail();
            SPOOF_LOG_WARN("capture", remote_address() +
                           " fingerprinting skipped, " + failure_);
            return;
        case ClientHelloAssembler::State::COMPLETE:
            finish();
            return;
    }
}

void ClientHelloCaptureStream::finish() {
    std::vector<uint8_t> record = assembler_.take_buffer();

    ClientHelloParser parser;
    ClientHelloParseResult parsed = parser.parse(record);
    if (!parsed.success) {
        outcome_ = Outcome::PARSE_ERROR;
        failure_ = parsed.error;
        SPOOF_LOG_WARN("capture", remote_address() +
                       " malformed ClientHello, " + failure_);
        return;
    }

    JA4Generator generator;
    fingerprint_ = generator.generate(parsed.fields);
    outcome_ = Outcome::FINGERPRINTED;

    const std::string key = remote_address();
    if (store_ && !key.empty()) {
        store_->record(key, *fingerprint_);
    }

    SPOOF_LOG_INFO("capture", key + " ja4=" + fingerprint_->raw +
                   (fingerprint_->sni_hostname.empty()
                        ? std::string()
                        : " sni=" + fingerprint_->sni_hostname));
    SPOOF_LOG_DEBUG("capture", key + " ja4_r=" + fingerprint_->to_debug_string());
}

} // namespace spoof
