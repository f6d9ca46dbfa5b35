/**
 * @file tls.cpp
 * @brief OpenSSL server session bound to a ByteStream through a custom BIO
 */

#include "../include/spoof_tls.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>

#include <cerrno>
#include <climits>
#include <stdexcept>

namespace spoof {

// ============================================================================
// Stream BIO
// ============================================================================

namespace {

int stream_bio_write(BIO* bio, const char* buf, int len) {
    auto* stream = static_cast<ByteStream*>(BIO_get_data(bio));
    BIO_clear_retry_flags(bio);
    if (!stream || len <= 0) return 0;

    ssize_t n = stream->write(reinterpret_cast<const uint8_t*>(buf),
                              static_cast<size_t>(len));
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        BIO_set_retry_write(bio);
    }
    return static_cast<int>(n);
}

int stream_bio_read(BIO* bio, char* buf, int len) {
    auto* stream = static_cast<ByteStream*>(BIO_get_data(bio));
    BIO_clear_retry_flags(bio);
    if (!stream || len <= 0) return 0;

    ssize_t n = stream->read(reinterpret_cast<uint8_t*>(buf),
                             static_cast<size_t>(len));
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        BIO_set_retry_read(bio);
    }
    return static_cast<int>(n);
}

int stream_bio_puts(BIO* bio, const char* str) {
    size_t len = std::char_traits<char>::length(str);
    if (len > static_cast<size_t>(INT_MAX)) return -1;
    return stream_bio_write(bio, str, static_cast<int>(len));
}

long stream_bio_ctrl(BIO* /*bio*/, int cmd, long /*num*/, void* /*ptr*/) {
    switch (cmd) {
        case BIO_CTRL_FLUSH:
            return 1;
        default:
            return 0;
    }
}

int stream_bio_create(BIO* bio) {
    BIO_set_init(bio, 1);
    BIO_set_data(bio, nullptr);
    return 1;
}

int stream_bio_destroy(BIO* bio) {
    if (!bio) return 0;
    // The stream is borrowed, never closed from here.
    BIO_set_data(bio, nullptr);
    BIO_set_init(bio, 0);
    return 1;
}

BIO_METHOD* stream_bio_method() {
    static BIO_METHOD* method = [] {
        BIO_METHOD* m = BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK,
                                     "spoof byte stream");
        if (m) {
            BIO_meth_set_write(m, stream_bio_write);
            BIO_meth_set_read(m, stream_bio_read);
            BIO_meth_set_puts(m, stream_bio_puts);
            BIO_meth_set_ctrl(m, stream_bio_ctrl);
            BIO_meth_set_create(m, stream_bio_create);
            BIO_meth_set_destroy(m, stream_bio_destroy);
        }
        return m;
    }();
    return method;
}

} // namespace

BIO* make_stream_bio(ByteStream& stream) {
    BIO_METHOD* method = stream_bio_method();
    if (!method) return nullptr;
    BIO* bio = BIO_new(method);
    if (!bio) return nullptr;
    BIO_set_data(bio, &stream);
    return bio;
}

std::string openssl_error_string() {
    std::string out;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

// ============================================================================
// TlsContext
// ============================================================================

TlsContext::TlsContext(const std::string& cert_file, const std::string& key_file) {
    OPENSSL_init_ssl(0, nullptr);

    ctx_ = SSL_CTX_new(TLS_server_method());
    if (!ctx_) {
        throw std::runtime_error("SSL_CTX_new failed: " + openssl_error_string());
    }

    // Scanners still connect with TLS 1.0; accept whatever they offer.
    SSL_CTX_set_min_proto_version(ctx_, TLS1_VERSION);

    if (SSL_CTX_use_certificate_chain_file(ctx_, cert_file.c_str()) != 1) {
        std::string err = openssl_error_string();
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("cannot load certificate " + cert_file + ": " + err);
    }
    if (SSL_CTX_use_PrivateKey_file(ctx_, key_file.c_str(), SSL_FILETYPE_PEM) != 1 ||
        SSL_CTX_check_private_key(ctx_) != 1) {
        std::string err = openssl_error_string();
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("cannot load private key " + key_file + ": " + err);
    }
}

TlsContext::~TlsContext() {
    if (ctx_) SSL_CTX_free(ctx_);
}

// ============================================================================
// TlsSession
// ============================================================================

TlsSession::TlsSession(const TlsContext& ctx, ByteStream& stream) {
    ssl_ = SSL_new(ctx.native());
    if (!ssl_) {
        throw std::runtime_error("SSL_new failed: " + openssl_error_string());
    }
    BIO* bio = make_stream_bio(stream);
    if (!bio) {
        SSL_free(ssl_);
        ssl_ = nullptr;
        throw std::runtime_error("cannot create stream BIO: " + openssl_error_string());
    }
    // SSL owns the BIO for both directions from here on.
    SSL_set_bio(ssl_, bio, bio);
    SSL_set_accept_state(ssl_);
}

TlsSession::~TlsSession() {
    if (ssl_) SSL_free(ssl_);
}

bool TlsSession::handshake() {
    int rc = SSL_accept(ssl_);
    if (rc == 1) return true;
    capture_error("SSL_accept", rc);
    return false;
}

ssize_t TlsSession::read(uint8_t* buf, size_t len) {
    int want = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
    int rc = SSL_read(ssl_, buf, want);
    if (rc > 0) return rc;
    if (SSL_get_error(ssl_, rc) == SSL_ERROR_ZERO_RETURN) return 0;
    capture_error("SSL_read", rc);
    return -1;
}

ssize_t TlsSession::write(const uint8_t* buf, size_t len) {
    int want = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
    int rc = SSL_write(ssl_, buf, want);
    if (rc > 0) return rc;
    capture_error("SSL_write", rc);
    return -1;
}

void TlsSession::shutdown() {
    if (SSL_is_init_finished(ssl_)) {
        // One-way close; the peer's close_notify is not awaited.
        if (SSL_shutdown(ssl_) < 0) {
            capture_error("SSL_shutdown", -1);
        }
    }
}

std::string TlsSession::negotiated_version() const {
    return SSL_get_version(ssl_);
}

void TlsSession::capture_error(const char* op, int rc) {
    int code = SSL_get_error(ssl_, rc);
    last_error_ = std::string(op) + " failed (ssl error " + std::to_string(code) + ")";
    std::string detail = openssl_error_string();
    if (!detail.empty()) last_error_ += ": " + detail;
}

} // namespace spoof
