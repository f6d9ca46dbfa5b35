/**
 * @file test_ja4.cpp
 * @brief Unit tests for JA4 fingerprint generation
 */

#include <gtest/gtest.h>
#include "spoof_client_hello.hpp"
#include "spoof_ja4.hpp"
#include "client_hello_builder.hpp"

#include <algorithm>

using namespace spoof;
using spoof::testing::ClientHelloBuilder;

class JA4Test : public ::testing::Test {
protected:
    JA4Fingerprint fingerprint(const ClientHelloBuilder& builder) {
        auto result = parser.parse(builder.build());
        EXPECT_TRUE(result.success) << result.error;
        return generator.generate(result.fields);
    }

    ClientHelloParser parser;
    JA4Generator generator;
};

// Test 1: Worked example end to end
TEST_F(JA4Test, WorkedExample) {
    auto fp = fingerprint(spoof::testing::worked_example());
    EXPECT_EQ(fp.part_a, "t13d020200");
    EXPECT_EQ(fp.part_b, "62ed6f6ca7ad");
    EXPECT_EQ(fp.part_c, "b9a491fefe05");
    EXPECT_EQ(fp.raw, "t13d020200_62ed6f6ca7ad_b9a491fefe05");
    EXPECT_EQ(fp.version, "13");
    EXPECT_EQ(fp.sni, 'd');
    EXPECT_EQ(fp.cipher_count, 2u);
    EXPECT_EQ(fp.extension_count, 2u);
    EXPECT_EQ(fp.sni_hostname, "example.com");
    EXPECT_EQ(fp.to_debug_string(), "t13d020200_1301,1302_002b");
}

// Test 2: Same input, same output
TEST_F(JA4Test, Deterministic) {
    auto builder = ClientHelloBuilder()
        .ciphers({0x1301, 0xC02B})
        .alpn({"h2"})
        .signature_algorithms({0x0403});
    EXPECT_EQ(fingerprint(builder).raw, fingerprint(builder).raw);
}

// Test 3: GREASE anywhere does not change the fingerprint
TEST_F(JA4Test, GreaseInvariance) {
    auto plain = ClientHelloBuilder()
        .ciphers({0x1301, 0x1302})
        .sni("example.com")
        .supported_versions({0x0304})
        .signature_algorithms({0x0403});
    auto greased = ClientHelloBuilder()
        .ciphers({0x3A3A, 0x1301, 0x1302, 0xDADA})
        .extension(0x0A0A)
        .sni("example.com")
        .supported_versions({0x2A2A, 0x0304})
        .signature_algorithms({0x0403})
        .extension(0xFAFA, {0x00});
    EXPECT_EQ(fingerprint(plain).raw, fingerprint(greased).raw);
}

// Test 4: Cipher and extension order do not matter
TEST_F(JA4Test, SortInvariance) {
    auto a = ClientHelloBuilder()
        .ciphers({0x1301, 0x1302, 0xC02F})
        .sni("example.com")
        .supported_groups({0x001D})
        .supported_versions({0x0304})
        .signature_algorithms({0x0403, 0x0804});
    auto b = ClientHelloBuilder()
        .ciphers({0xC02F, 0x1302, 0x1301})
        .signature_algorithms({0x0403, 0x0804})
        .supported_versions({0x0304})
        .supported_groups({0x001D})
        .sni("example.com");
    EXPECT_EQ(fingerprint(a).raw, fingerprint(b).raw);
}

// Test 5: Signature algorithm order does matter
TEST_F(JA4Test, SignatureAlgorithmOrderSensitive) {
    auto a = ClientHelloBuilder()
        .ciphers({0x1301})
        .supported_groups({0x001D})
        .supported_versions({0x0304})
        .signature_algorithms({0x0403, 0x0804, 0x0401});
    auto b = ClientHelloBuilder()
        .ciphers({0x1301})
        .supported_groups({0x001D})
        .supported_versions({0x0304})
        .signature_algorithms({0x0804, 0x0403, 0x0401});

    auto fa = fingerprint(a);
    auto fb = fingerprint(b);
    EXPECT_EQ(fa.part_a, fb.part_a);
    EXPECT_EQ(fa.part_b, fb.part_b);
    EXPECT_EQ(fa.part_c, "beb9f91c6f80");
    EXPECT_EQ(fb.part_c, "d538c6400f45");
    EXPECT_NE(fa, fb);
}

// Test 6: No ciphers and no extensions give zero hashes
TEST_F(JA4Test, EmptyListSentinels) {
    auto fp = fingerprint(ClientHelloBuilder().ciphers({0x0A0A}).omit_extensions());
    EXPECT_EQ(fp.part_a, "t12i000000");
    EXPECT_EQ(fp.part_b, "000000000000");
    EXPECT_EQ(fp.part_c, "000000000000");
}

// Test 7: SNI and ALPN are counted but not hashed
TEST_F(JA4Test, SniAndAlpnExcludedFromPartC) {
    auto fp = fingerprint(ClientHelloBuilder()
        .ciphers({0x1301})
        .sni("example.com")
        .alpn({"h2"}));
    EXPECT_EQ(fp.part_a, "t12d0102h2");
    EXPECT_EQ(fp.part_b, "0f2cb44170f4");
    EXPECT_TRUE(fp.sorted_extensions.empty());
    EXPECT_EQ(fp.part_c, "000000000000");
}

// Test 8: Only signature algorithms left after exclusions still hash
TEST_F(JA4Test, SignatureAlgorithmsAlone) {
    auto fp = fingerprint(ClientHelloBuilder()
        .ciphers({0x1301})
        .sni("example.com")
        .extension(0x000D, {0x00, 0x02, 0x04, 0x03}));
    // extension 0x000d itself is hashed, so the input is "000d_0403"
    EXPECT_EQ(fp.sorted_extensions, (std::vector<uint16_t>{0x000D}));
    EXPECT_EQ(fp.to_debug_string(), "t12d010200_1301_000d_0403");
    EXPECT_EQ(fp.part_c, "79c50902419d");
}

// Test 9: Larger realistic hello
TEST_F(JA4Test, BrowserLikeHello) {
    auto fp = fingerprint(ClientHelloBuilder()
        .ciphers({0x1A1A, 0x1301, 0x1302, 0x1303, 0xC02B})
        .sni("www.example.org")
        .extension(0x0017)
        .extension(0xFF01, {0x00})
        .supported_groups({0x001D, 0x0017})
        .extension(0x000B, {0x01, 0x00})
        .alpn({"h2", "http/1.1"})
        .signature_algorithms({0x0403, 0x0804})
        .supported_versions({0x0304, 0x0303}));
    EXPECT_EQ(fp.part_a, "t13d0408h2");
    EXPECT_EQ(fp.to_debug_string(),
              "t13d0408h2_1301,1302,1303,c02b_000a,000b,000d,0017,002b,ff01_0403,0804");
    EXPECT_EQ(fp.part_c, "e8f59da0a0df");
}

// Test 10: Version codes
TEST(JA4GeneratorTest, VersionCodes) {
    EXPECT_EQ(JA4Generator::version_code(0x0304), "13");
    EXPECT_EQ(JA4Generator::version_code(0x0303), "12");
    EXPECT_EQ(JA4Generator::version_code(0x0302), "11");
    EXPECT_EQ(JA4Generator::version_code(0x0301), "10");
    EXPECT_EQ(JA4Generator::version_code(0x0300), "s3");
    EXPECT_EQ(JA4Generator::version_code(0xFEFF), "d1");
    EXPECT_EQ(JA4Generator::version_code(0xFEFD), "d2");
    EXPECT_EQ(JA4Generator::version_code(0xFEFC), "d3");
    EXPECT_EQ(JA4Generator::version_code(0x0200), "00");
    EXPECT_EQ(JA4Generator::version_code(0x7F1C), "00");
}

// Test 11: ALPN marker rules
TEST(JA4GeneratorTest, AlpnMarker) {
    EXPECT_EQ(JA4Generator::alpn_marker({}), "00");
    EXPECT_EQ(JA4Generator::alpn_marker({""}), "00");
    EXPECT_EQ(JA4Generator::alpn_marker({"h2", "http/1.1"}), "h2");
    EXPECT_EQ(JA4Generator::alpn_marker({"http/1.1"}), "h1");
    EXPECT_EQ(JA4Generator::alpn_marker({"x"}), "xx");
    EXPECT_EQ(JA4Generator::alpn_marker({std::string("\x01h2")}), "99");
    EXPECT_EQ(JA4Generator::alpn_marker({std::string("h2\xff")}), "99");
}

// Test 12: Counts are capped at 99 in part a only
TEST(JA4GeneratorTest, CountsCapAt99) {
    ClientHelloFields fields;
    fields.legacy_version = 0x0303;
    for (uint16_t c = 1; c <= 120; ++c) fields.cipher_suites.push_back(c);

    JA4Generator generator;
    auto fp = generator.generate(fields);
    EXPECT_EQ(fp.part_a, "t12i990000");
    EXPECT_EQ(fp.cipher_count, 120u);
    EXPECT_EQ(fp.sorted_ciphers.size(), 120u);
}

// Test 13: Hash helpers
TEST(JA4GeneratorTest, HashHelpers) {
    EXPECT_EQ(JA4Generator::hex_list({0x1301, 0x002B, 0xC02F}), "1301,002b,c02f");
    EXPECT_EQ(JA4Generator::hex_list({}), "");
    EXPECT_EQ(JA4Generator::truncated_sha256("1301,1302"), "62ed6f6ca7ad");
    EXPECT_EQ(JA4Generator::truncated_sha256("002b"), "b9a491fefe05");
    EXPECT_EQ(JA4Generator::truncated_sha256("").size(), JA4Generator::HASH_LENGTH);
}
