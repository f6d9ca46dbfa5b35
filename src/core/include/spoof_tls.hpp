#ifndef SPOOF_TLS_HPP
#define SPOOF_TLS_HPP

/**
 * @file spoof_tls.hpp
 * @brief OpenSSL server side over a ByteStream
 *
 * The TLS engine reads through a custom BIO bound to a ByteStream, so a
 * ClientHelloCaptureStream placed in between sees exactly the bytes the
 * handshake consumes.
 */

#include <string>
#include <cstdint>
#include <sys/types.h>

#include <openssl/ssl.h>

#include "spoof_byte_stream.hpp"

namespace spoof {

/**
 * @brief BIO whose read/write call `stream`. The stream must outlive it.
 * @return New BIO (caller or SSL_set_bio owns it), nullptr on failure
 */
BIO* make_stream_bio(ByteStream& stream);

/**
 * @brief Server SSL_CTX loaded with a certificate and key (RAII)
 */
class TlsContext {
public:
    /// Throws std::runtime_error if the context or key material fails.
    TlsContext(const std::string& cert_file, const std::string& key_file);
    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* native() const { return ctx_; }

private:
    SSL_CTX* ctx_ = nullptr;
};

/**
 * @brief One server-side TLS connection over a ByteStream
 */
class TlsSession {
public:
    TlsSession(const TlsContext& ctx, ByteStream& stream);
    ~TlsSession();

    TlsSession(const TlsSession&) = delete;
    TlsSession& operator=(const TlsSession&) = delete;

    /// Runs SSL_accept. False on failure, see last_error().
    bool handshake();

    ssize_t read(uint8_t* buf, size_t len);
    ssize_t write(const uint8_t* buf, size_t len);
    void shutdown();

    std::string negotiated_version() const;
    const std::string& last_error() const { return last_error_; }

private:
    void capture_error(const char* op, int rc);

    SSL* ssl_ = nullptr;
    std::string last_error_;
};

/// Drains the OpenSSL error queue into one line.
std::string openssl_error_string();

} // namespace spoof

#endif // SPOOF_TLS_HPP
