/**
 * @file tls_test_util.hpp
 * @brief Self-signed certificate and TLS client helpers for socket tests
 */

#pragma once

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace spoof {
namespace testing {

/// Throwaway P-256 key and self-signed certificate written to /tmp.
class TempCertificate {
public:
    TempCertificate() {
        char dir_template[] = "/tmp/spoof-test-XXXXXX";
        const char* dir = mkdtemp(dir_template);
        if (!dir) throw std::runtime_error("mkdtemp failed");
        dir_ = dir;
        cert_path_ = dir_ + "/cert.pem";
        key_path_ = dir_ + "/key.pem";

        EVP_PKEY* pkey = EVP_EC_gen("P-256");
        if (!pkey) throw std::runtime_error("EVP_EC_gen failed");

        X509* cert = X509_new();
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, pkey);
        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"),
                                   -1, -1, 0);
        X509_set_issuer_name(cert, name);
        bool signed_ok = X509_sign(cert, pkey, EVP_sha256()) > 0;

        bool written = signed_ok && write_pem(cert_path_, [&](FILE* f) {
            return PEM_write_X509(f, cert) == 1;
        }) && write_pem(key_path_, [&](FILE* f) {
            return PEM_write_PrivateKey(f, pkey, nullptr, nullptr, 0, nullptr, nullptr) == 1;
        });

        X509_free(cert);
        EVP_PKEY_free(pkey);
        if (!written) throw std::runtime_error("cannot write test certificate");
    }

    ~TempCertificate() {
        std::remove(cert_path_.c_str());
        std::remove(key_path_.c_str());
        ::rmdir(dir_.c_str());
    }

    TempCertificate(const TempCertificate&) = delete;
    TempCertificate& operator=(const TempCertificate&) = delete;

    const std::string& cert_path() const { return cert_path_; }
    const std::string& key_path() const { return key_path_; }

private:
    template <typename Fn>
    static bool write_pem(const std::string& path, Fn fn) {
        FILE* f = std::fopen(path.c_str(), "w");
        if (!f) return false;
        bool ok = fn(f);
        return std::fclose(f) == 0 && ok;
    }

    std::string dir_;
    std::string cert_path_;
    std::string key_path_;
};

/// Client side of a TLS connection over a connected descriptor.
class TlsTestClient {
public:
    explicit TlsTestClient(int fd) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) throw std::runtime_error("SSL_CTX_new failed");
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        ssl_ = SSL_new(ctx_);
        if (!ssl_) throw std::runtime_error("SSL_new failed");
        SSL_set_fd(ssl_, fd);
    }

    ~TlsTestClient() {
        if (ssl_) SSL_free(ssl_);
        if (ctx_) SSL_CTX_free(ctx_);
    }

    TlsTestClient(const TlsTestClient&) = delete;
    TlsTestClient& operator=(const TlsTestClient&) = delete;

    bool connect(const std::string& sni, const unsigned char* alpn = nullptr,
                 unsigned alpn_len = 0) {
        if (!sni.empty()) SSL_set_tlsext_host_name(ssl_, sni.c_str());
        if (alpn) SSL_set_alpn_protos(ssl_, alpn, alpn_len);
        return SSL_connect(ssl_) == 1;
    }

    bool send(const std::string& data) {
        return SSL_write(ssl_, data.data(), static_cast<int>(data.size())) ==
               static_cast<int>(data.size());
    }

    std::string receive_all() {
        std::string out;
        char buf[512];
        int n;
        while ((n = SSL_read(ssl_, buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

    void close() { SSL_shutdown(ssl_); }

private:
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

} // namespace testing
} // namespace spoof
