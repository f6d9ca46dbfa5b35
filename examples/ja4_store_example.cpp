/**
 * @file ja4_store_example.cpp
 * @brief Example: fingerprint a ClientHello fed in small reads, then look it up
 */

#include <algorithm>
#include <iostream>
#include <vector>
#include <spoof_client_hello.hpp>
#include <spoof_client_hello_assembler.hpp>
#include <spoof_fingerprint_store.hpp>
#include "../src/core/include/spoof_ja4.hpp"

using namespace spoof;

int main() {
    std::cout << "=== JA4 Capture Example ===\n\n";

    // ClientHello: GREASE + two TLS 1.3 suites, SNI "example.com",
    // supported_versions {TLS 1.3}
    const std::vector<uint8_t> record = {
        0x16, 0x03, 0x01, 0x00, 0x4e,
        0x01, 0x00, 0x00, 0x4a,
        0x03, 0x03,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00,
        0x00, 0x06, 0x0a, 0x0a, 0x13, 0x01, 0x13, 0x02,
        0x01, 0x00,
        0x00, 0x1b,
        0x00, 0x00, 0x00, 0x10, 0x00, 0x0e, 0x00, 0x00, 0x0b,
        'e', 'x', 'a', 'm', 'p', 'l', 'e', '.', 'c', 'o', 'm',
        0x00, 0x2b, 0x00, 0x03, 0x02, 0x03, 0x04,
    };

    // 1. Assemble from 7-byte reads, as a slow client would deliver it
    ClientHelloAssembler assembler;
    for (size_t off = 0; off < record.size() && !assembler.complete(); off += 7) {
        size_t n = std::min<size_t>(7, record.size() - off);
        if (assembler.feed(record.data() + off, n) == ClientHelloAssembler::State::ABORTED) {
            std::cerr << "aborted: " << capture_error_to_string(assembler.error()) << "\n";
            return 1;
        }
    }
    std::cout << "1. Assembled " << assembler.buffer().size() << " bytes\n";

    // 2. Parse and fingerprint
    ClientHelloParser parser;
    auto parsed = parser.parse(assembler.buffer());
    if (!parsed.success) {
        std::cerr << "parse failed: " << parsed.error << "\n";
        return 1;
    }
    JA4Generator generator;
    JA4Fingerprint fp = generator.generate(parsed.fields);
    std::cout << "2. JA4:   " << fp.raw << "\n";
    std::cout << "   JA4_r: " << fp.to_debug_string() << "\n";

    // 3. Record under the peer address and fetch it at request time
    FingerprintStore store(std::chrono::seconds(300));
    const std::string remote = format_remote_address("198.51.100.23", 51514);
    store.record(remote, fp);

    auto found = store.lookup(remote);
    std::cout << "3. Lookup " << remote << ": " << (found ? found->raw : "-") << "\n";

    return 0;
}
