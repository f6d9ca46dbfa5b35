/**
 * @file client_hello.cpp
 * @brief ClientHello structural decoder
 */

#include "../include/spoof_client_hello.hpp"
#include <algorithm>
#include <sstream>

namespace spoof {

namespace tls {

std::vector<uint16_t> filter_grease(const std::vector<uint16_t>& values) {
    std::vector<uint16_t> out;
    out.reserve(values.size());
    for (auto v : values) {
        if (!is_grease(v)) out.push_back(v);
    }
    return out;
}

} // namespace tls

// ============================================================================
// Bounded big-endian reader
// ============================================================================

namespace {

class Reader {
public:
    Reader(const uint8_t* data, size_t length) : data_(data), length_(length) {}

    size_t remaining() const { return length_ - pos_; }
    bool empty() const { return pos_ == length_; }

    bool u8(uint8_t& out) {
        if (remaining() < 1) return false;
        out = data_[pos_++];
        return true;
    }

    bool u16(uint16_t& out) {
        if (remaining() < 2) return false;
        out = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool u24(uint32_t& out) {
        if (remaining() < 3) return false;
        out = (static_cast<uint32_t>(data_[pos_]) << 16) |
              (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
              data_[pos_ + 2];
        pos_ += 3;
        return true;
    }

    bool skip(size_t n) {
        if (remaining() < n) return false;
        pos_ += n;
        return true;
    }

    // Carves the next `n` bytes off as an independent reader.
    bool sub(size_t n, Reader& out) {
        if (remaining() < n) return false;
        out = Reader(data_ + pos_, n);
        pos_ += n;
        return true;
    }

    const uint8_t* cursor() const { return data_ + pos_; }

private:
    const uint8_t* data_;
    size_t length_;
    size_t pos_ = 0;
};

ClientHelloParseResult fail(const std::string& what) {
    ClientHelloParseResult r;
    r.success = false;
    r.error = what;
    return r;
}

// ============================================================================
// Extension payload decoders. Empty payloads decode to empty lists.
// ============================================================================

bool decode_server_name(Reader payload, ClientHelloFields& f, std::string& err) {
    f.has_sni = true;
    if (payload.empty()) return true;

    uint16_t list_len;
    Reader list(nullptr, 0);
    if (!payload.u16(list_len) || !payload.sub(list_len, list)) {
        err = "server_name list length exceeds extension";
        return false;
    }
    if (list.empty()) return true;

    // Only the first entry is used.
    uint8_t name_type;
    uint16_t name_len;
    if (!list.u8(name_type) || !list.u16(name_len) || list.remaining() < name_len) {
        err = "server_name entry exceeds list";
        return false;
    }
    f.sni_hostname.assign(reinterpret_cast<const char*>(list.cursor()), name_len);
    return true;
}

bool decode_alpn(Reader payload, ClientHelloFields& f, std::string& err) {
    f.has_alpn = true;
    if (payload.empty()) return true;

    uint16_t list_len;
    Reader list(nullptr, 0);
    if (!payload.u16(list_len) || !payload.sub(list_len, list)) {
        err = "ALPN list length exceeds extension";
        return false;
    }
    while (!list.empty()) {
        uint8_t proto_len;
        const uint8_t* proto = nullptr;
        if (list.u8(proto_len)) proto = list.cursor();
        if (proto == nullptr || !list.skip(proto_len)) {
            err = "ALPN protocol exceeds list";
            return false;
        }
        f.alpn_protocols.emplace_back(reinterpret_cast<const char*>(proto),
                                      proto_len);
    }
    return true;
}

bool decode_u16_list(Reader payload, bool one_byte_prefix,
                     std::vector<uint16_t>& out, const char* name,
                     std::string& err) {
    if (payload.empty()) return true;

    size_t list_len = 0;
    if (one_byte_prefix) {
        uint8_t n;
        if (!payload.u8(n)) { err = std::string(name) + " truncated"; return false; }
        list_len = n;
    } else {
        uint16_t n;
        if (!payload.u16(n)) { err = std::string(name) + " truncated"; return false; }
        list_len = n;
    }

    Reader list(nullptr, 0);
    if (!payload.sub(list_len, list)) {
        err = std::string(name) + " length exceeds extension";
        return false;
    }
    if (list_len % 2 != 0) {
        err = std::string(name) + " length is odd";
        return false;
    }
    uint16_t v;
    while (list.u16(v)) out.push_back(v);
    return true;
}

bool decode_point_formats(Reader payload, ClientHelloFields& f, std::string& err) {
    if (payload.empty()) return true;
    uint8_t n;
    if (!payload.u8(n) || payload.remaining() < n) {
        err = "ec_point_formats length exceeds extension";
        return false;
    }
    f.ec_point_formats.assign(payload.cursor(), payload.cursor() + n);
    return true;
}

bool decode_extension(uint16_t type, Reader payload, ClientHelloFields& f,
                      std::string& err) {
    switch (type) {
        case tls::SERVER_NAME:
            return decode_server_name(payload, f, err);
        case tls::ALPN:
            return decode_alpn(payload, f, err);
        case tls::SIGNATURE_ALGORITHMS:
            return decode_u16_list(payload, false, f.signature_algorithms,
                                   "signature_algorithms", err);
        case tls::SUPPORTED_GROUPS:
            return decode_u16_list(payload, false, f.supported_groups,
                                   "supported_groups", err);
        case tls::EC_POINT_FORMATS:
            return decode_point_formats(payload, f, err);
        case tls::SUPPORTED_VERSIONS: {
            std::vector<uint16_t> versions;
            if (!decode_u16_list(payload, true, versions,
                                 "supported_versions", err)) {
                return false;
            }
            f.has_supported_versions = true;
            f.supported_versions = tls::filter_grease(versions);
            return true;
        }
        default:
            return true;
    }
}

} // namespace

// ============================================================================
// ClientHelloFields
// ============================================================================

uint16_t ClientHelloFields::effective_version() const {
    if (!supported_versions.empty()) {
        return *std::max_element(supported_versions.begin(),
                                 supported_versions.end());
    }
    return legacy_version;
}

std::vector<uint16_t> ClientHelloFields::extension_types() const {
    std::vector<uint16_t> types;
    types.reserve(extensions.size());
    for (const auto& ext : extensions) types.push_back(ext.type);
    return types;
}

// ============================================================================
// ClientHelloParser
// ============================================================================

ClientHelloParseResult ClientHelloParser::parse(const uint8_t* data,
                                                size_t length) const {
    if (data == nullptr) return fail("no input");

    Reader in(data, length);
    if (!in.skip(tls::RECORD_HEADER_LEN)) return fail("record header truncated");

    uint8_t msg_type;
    uint32_t msg_len;
    if (!in.u8(msg_type) || !in.u24(msg_len)) {
        return fail("handshake header truncated");
    }
    if (msg_type != static_cast<uint8_t>(tls::HandshakeType::CLIENT_HELLO)) {
        std::ostringstream oss;
        oss << "handshake type " << static_cast<int>(msg_type)
            << " is not ClientHello";
        return fail(oss.str());
    }

    Reader body(nullptr, 0);
    if (!in.sub(msg_len, body)) {
        std::ostringstream oss;
        oss << "ClientHello length " << msg_len << " exceeds buffer ("
            << in.remaining() << " bytes left)";
        return fail(oss.str());
    }

    ClientHelloParseResult result;
    ClientHelloFields& f = result.fields;

    if (!body.u16(f.legacy_version)) return fail("client version truncated");
    if (!body.skip(tls::RANDOM_LEN)) return fail("random truncated");

    uint8_t session_id_len;
    if (!body.u8(session_id_len) || !body.skip(session_id_len)) {
        return fail("session id exceeds ClientHello");
    }

    uint16_t suites_len;
    Reader suites(nullptr, 0);
    if (!body.u16(suites_len) || !body.sub(suites_len, suites)) {
        return fail("cipher suites exceed ClientHello");
    }
    if (suites_len % 2 != 0) return fail("cipher suites length is odd");
    f.cipher_suites.reserve(suites_len / 2);
    uint16_t suite;
    while (suites.u16(suite)) f.cipher_suites.push_back(suite);

    uint8_t compression_len;
    if (!body.u8(compression_len) || !body.skip(compression_len)) {
        return fail("compression methods exceed ClientHello");
    }

    // Pre-TLS 1.2 clients may omit the extensions block entirely.
    if (body.empty()) {
        result.success = true;
        return result;
    }

    uint16_t extensions_len;
    Reader exts(nullptr, 0);
    if (!body.u16(extensions_len) || !body.sub(extensions_len, exts)) {
        return fail("extensions exceed ClientHello");
    }

    while (!exts.empty()) {
        uint16_t type;
        uint16_t ext_len;
        Reader payload(nullptr, 0);
        if (!exts.u16(type) || !exts.u16(ext_len)) {
            return fail("extension header truncated");
        }
        const uint8_t* start = exts.cursor();
        if (!exts.sub(ext_len, payload)) {
            std::ostringstream oss;
            oss << "extension 0x" << std::hex << type << " length " << std::dec
                << ext_len << " exceeds extensions block";
            return fail(oss.str());
        }

        std::string err;
        if (!decode_extension(type, payload, f, err)) return fail(err);

        TLSExtension ext;
        ext.type = type;
        ext.payload.assign(start, start + ext_len);
        f.extensions.push_back(std::move(ext));
    }

    result.success = true;
    return result;
}

} // namespace spoof
