#ifndef SPOOF_JA4_HPP
#define SPOOF_JA4_HPP

#include <string>
#include <vector>
#include <cstdint>

#include "spoof_client_hello.hpp"

namespace spoof {

/**
 * @brief JA4 client fingerprint of one ClientHello
 *
 * Layout: `{a}_{b}_{c}` where
 *   a = transport, version, SNI flag, cipher count, extension count, ALPN
 *   b = truncated SHA-256 of the sorted cipher list
 *   c = truncated SHA-256 of the sorted extension list and the
 *       signature algorithms in wire order
 * https://github.com/FoxIO-LLC/ja4/blob/main/technical_details/JA4.md
 */
struct JA4Fingerprint {
    std::string raw;
    std::string part_a;
    std::string part_b;
    std::string part_c;

    char transport = 't';
    std::string version;        // "13", "12", ..., "00"
    char sni = 'i';             // 'd' when SNI is present
    uint32_t cipher_count = 0;  // GREASE-filtered, uncapped
    uint32_t extension_count = 0;
    std::string alpn;           // two-char marker
    std::string sni_hostname;

    // Inputs of parts b and c, kept for the unhashed debug form.
    std::vector<uint16_t> sorted_ciphers;
    std::vector<uint16_t> sorted_extensions;
    std::vector<uint16_t> signature_algorithms;

    /// JA4_r style `a_ciphers_extensions_sigalgs` with nothing hashed.
    std::string to_debug_string() const;

    bool operator==(const JA4Fingerprint& other) const { return raw == other.raw; }
    bool operator!=(const JA4Fingerprint& other) const { return raw != other.raw; }
};

/**
 * @brief Reduces parsed ClientHello fields to a JA4 fingerprint
 *
 * Stateless and deterministic. Only the TLS-over-TCP transport ('t') is
 * produced; QUIC ('q') and DTLS ('d') tags are reserved.
 */
class JA4Generator {
public:
    static constexpr char TRANSPORT_TCP = 't';
    static constexpr size_t HASH_LENGTH = 12;

    JA4Fingerprint generate(const ClientHelloFields& fields) const;

    static std::string version_code(uint16_t version);
    static std::string alpn_marker(const std::vector<std::string>& protocols);

    /// `%04x` values joined by `sep`.
    static std::string hex_list(const std::vector<uint16_t>& values, char sep = ',');

    /// First 12 hex characters of SHA-256(input).
    static std::string truncated_sha256(const std::string& input);
};

} // namespace spoof

#endif // SPOOF_JA4_HPP
