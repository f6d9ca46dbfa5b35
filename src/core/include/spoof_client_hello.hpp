#ifndef SPOOF_CLIENT_HELLO_HPP
#define SPOOF_CLIENT_HELLO_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace spoof {
namespace tls {

enum class ContentType : uint8_t {
    CHANGE_CIPHER_SPEC = 20,
    ALERT = 21,
    HANDSHAKE = 22,
    APPLICATION_DATA = 23
};

enum class HandshakeType : uint8_t {
    CLIENT_HELLO = 1,
    SERVER_HELLO = 2
};

/**
 * @brief Extension codes the parser decodes beyond their type
 */
enum Extension : uint16_t {
    SERVER_NAME = 0x0000,
    SUPPORTED_GROUPS = 0x000A,
    EC_POINT_FORMATS = 0x000B,
    SIGNATURE_ALGORITHMS = 0x000D,
    ALPN = 0x0010,
    SUPPORTED_VERSIONS = 0x002B
};

enum Version : uint16_t {
    SSL_3_0 = 0x0300,
    TLS_1_0 = 0x0301,
    TLS_1_1 = 0x0302,
    TLS_1_2 = 0x0303,
    TLS_1_3 = 0x0304
};

constexpr size_t RECORD_HEADER_LEN = 5;
constexpr size_t HANDSHAKE_HEADER_LEN = 4;
constexpr size_t RANDOM_LEN = 32;
constexpr size_t MAX_PLAINTEXT_RECORD = 16384;

/**
 * @brief RFC 8701 GREASE test: 0x?A?A with both bytes equal
 */
inline bool is_grease(uint16_t value) {
    return (value >> 8) == (value & 0xFF) && (value & 0x0F) == 0x0A;
}

std::vector<uint16_t> filter_grease(const std::vector<uint16_t>& values);

} // namespace tls

/**
 * @brief One extension as it appeared on the wire
 */
struct TLSExtension {
    uint16_t type = 0;
    std::vector<uint8_t> payload;
};

/**
 * @brief Decoded ClientHello
 *
 * Lists keep wire order. `supported_versions` is already GREASE-filtered;
 * `cipher_suites` and `extensions` are not, the fingerprint generator
 * filters them.
 */
struct ClientHelloFields {
    uint16_t legacy_version = 0;
    std::vector<uint16_t> cipher_suites;
    std::vector<TLSExtension> extensions;

    bool has_sni = false;
    std::string sni_hostname;
    bool has_alpn = false;
    std::vector<std::string> alpn_protocols;
    bool has_supported_versions = false;
    std::vector<uint16_t> supported_versions;
    std::vector<uint16_t> signature_algorithms;
    std::vector<uint16_t> supported_groups;
    std::vector<uint8_t> ec_point_formats;

    /// Highest non-GREASE supported_versions entry, else the legacy version.
    uint16_t effective_version() const;

    /// Extension type codes in wire order, GREASE included.
    std::vector<uint16_t> extension_types() const;
};

struct ClientHelloParseResult {
    bool success = false;
    ClientHelloFields fields;
    std::string error;
};

/**
 * @brief Structural decoder for a complete ClientHello record
 *
 * Input starts at the TLS record header, as produced by
 * ClientHelloAssembler. Every length prefix is checked against the bytes
 * left in its enclosing structure; on any violation the result carries
 * `success == false`, an error description and empty fields.
 */
class ClientHelloParser {
public:
    ClientHelloParseResult parse(const uint8_t* data, size_t length) const;

    ClientHelloParseResult parse(const std::vector<uint8_t>& record) const {
        return parse(record.data(), record.size());
    }
};

} // namespace spoof

#endif // SPOOF_CLIENT_HELLO_HPP
