/**
 * @file ja4.cpp
 * @brief JA4 fingerprint generation from decoded ClientHello fields
 */

#include "../include/spoof_ja4.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace spoof {

// ============================================================================
// Helpers
// ============================================================================

static void ensure_sodium() {
    static const int rc = sodium_init();
    if (rc < 0) {
        throw std::runtime_error("libsodium initialisation failed");
    }
}

static bool is_printable_ascii(unsigned char c) {
    return c >= 0x20 && c < 0x7F;
}

static std::string two_digits(uint32_t value) {
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02u", std::min<uint32_t>(value, 99));
    return buf;
}

std::string JA4Generator::hex_list(const std::vector<uint16_t>& values, char sep) {
    std::string out;
    out.reserve(values.size() * 5);
    char hex[5];
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out.push_back(sep);
        std::snprintf(hex, sizeof(hex), "%04x", values[i]);
        out.append(hex, 4);
    }
    return out;
}

// SHA-256, first HASH_LENGTH hex characters.
std::string JA4Generator::truncated_sha256(const std::string& input) {
    ensure_sodium();

    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(hash,
                       reinterpret_cast<const unsigned char*>(input.data()),
                       input.size());

    char hex[HASH_LENGTH + 1];
    sodium_bin2hex(hex, sizeof(hex), hash, HASH_LENGTH / 2);
    return std::string(hex, HASH_LENGTH);
}

std::string JA4Generator::version_code(uint16_t version) {
    switch (version) {
        case 0x0304: return "13";
        case 0x0303: return "12";
        case 0x0302: return "11";
        case 0x0301: return "10";
        case 0x0300: return "s3";
        case 0xfeff: return "d1";
        case 0xfefd: return "d2";
        case 0xfefc: return "d3";
        default:     return "00";
    }
}

std::string JA4Generator::alpn_marker(const std::vector<std::string>& protocols) {
    if (protocols.empty() || protocols.front().empty()) return "00";

    const std::string& first = protocols.front();
    unsigned char a = static_cast<unsigned char>(first.front());
    unsigned char b = static_cast<unsigned char>(first.back());
    if (!is_printable_ascii(a) || !is_printable_ascii(b)) return "99";

    return std::string{static_cast<char>(a), static_cast<char>(b)};
}

// ============================================================================
// JA4Generator
// ============================================================================

JA4Fingerprint JA4Generator::generate(const ClientHelloFields& fields) const {
    JA4Fingerprint fp;
    fp.transport = TRANSPORT_TCP;
    fp.version = version_code(fields.effective_version());
    fp.sni = fields.has_sni ? 'd' : 'i';
    fp.sni_hostname = fields.sni_hostname;
    fp.alpn = alpn_marker(fields.alpn_protocols);

    // GREASE goes first; every count, sort and hash below sees filtered data.
    std::vector<uint16_t> ciphers = tls::filter_grease(fields.cipher_suites);
    std::vector<uint16_t> extensions = tls::filter_grease(fields.extension_types());

    fp.cipher_count = static_cast<uint32_t>(ciphers.size());
    fp.extension_count = static_cast<uint32_t>(extensions.size());

    std::sort(ciphers.begin(), ciphers.end());
    fp.sorted_ciphers = ciphers;

    for (auto type : extensions) {
        if (type == tls::SERVER_NAME || type == tls::ALPN) continue;
        fp.sorted_extensions.push_back(type);
    }
    std::sort(fp.sorted_extensions.begin(), fp.sorted_extensions.end());
    fp.signature_algorithms = fields.signature_algorithms;

    std::ostringstream a;
    a << fp.transport << fp.version << fp.sni
      << two_digits(fp.cipher_count) << two_digits(fp.extension_count)
      << fp.alpn;
    fp.part_a = a.str();

    const std::string zeros(HASH_LENGTH, '0');

    fp.part_b = fp.sorted_ciphers.empty()
        ? zeros
        : truncated_sha256(hex_list(fp.sorted_ciphers));

    if (fp.sorted_extensions.empty() && fp.signature_algorithms.empty()) {
        fp.part_c = zeros;
    } else {
        std::string input = hex_list(fp.sorted_extensions);
        if (!fp.signature_algorithms.empty()) {
            input += '_';
            input += hex_list(fp.signature_algorithms);
        }
        fp.part_c = truncated_sha256(input);
    }

    fp.raw = fp.part_a + "_" + fp.part_b + "_" + fp.part_c;
    return fp;
}

// ============================================================================
// JA4Fingerprint
// ============================================================================

std::string JA4Fingerprint::to_debug_string() const {
    std::string out = part_a;
    out += '_';
    out += JA4Generator::hex_list(sorted_ciphers);
    out += '_';
    out += JA4Generator::hex_list(sorted_extensions);
    if (!signature_algorithms.empty()) {
        out += '_';
        out += JA4Generator::hex_list(signature_algorithms);
    }
    return out;
}

} // namespace spoof
