/**
 * @file test_encoding.cpp
 * @brief Unit tests for wire encodings
 *
 * Tests coverage for:
 * - base64_encode: padding variants, credential strings, binary input
 * - hex_encode
 * - latin1_to_utf8
 */

#include <gtest/gtest.h>
#include <wsconn/transform/encoding.hpp>

#include <array>
#include <vector>

using namespace wsconn::transform;

// ============================================================================
// Base64 Tests
// ============================================================================

class Base64Test : public ::testing::Test {};

TEST_F(Base64Test, Empty) {
    EXPECT_EQ(base64_encode(std::string_view{}), "");
}

TEST_F(Base64Test, PaddingVariants) {
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foob"), "Zm9vYg==");
    EXPECT_EQ(base64_encode("fooba"), "Zm9vYmE=");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST_F(Base64Test, Credentials) {
    EXPECT_EQ(base64_encode("admin:secret"), "YWRtaW46c2VjcmV0");
    EXPECT_EQ(base64_encode("ABCDE:"), "QUJDREU6");
}

TEST_F(Base64Test, BinaryInput) {
    std::array<uint8_t, 3> bytes{0xFB, 0xFF, 0xBF};
    EXPECT_EQ(base64_encode(bytes), "+/+/");
}

TEST_F(Base64Test, Utf8Input) {
    // "é" in UTF-8 is C3 A9
    EXPECT_EQ(base64_encode("\xC3\xA9"), "w6k=");
}

// ============================================================================
// Hex Tests
// ============================================================================

class HexTest : public ::testing::Test {};

TEST_F(HexTest, Lowercase) {
    std::array<uint8_t, 4> bytes{0x00, 0x0F, 0xA0, 0xFF};
    EXPECT_EQ(hex_encode(bytes), "000fa0ff");
}

TEST_F(HexTest, Empty) {
    EXPECT_EQ(hex_encode(std::span<const uint8_t>{}), "");
}

// ============================================================================
// Latin-1 Tests
// ============================================================================

class Latin1Test : public ::testing::Test {};

TEST_F(Latin1Test, AsciiUnchanged) {
    std::string text = "plain text";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(latin1_to_utf8(bytes), text);
}

TEST_F(Latin1Test, HighBytesBecomeTwoByteSequences) {
    std::vector<uint8_t> bytes{'c', 'a', 'f', 0xE9, ' ', 0xFF};
    EXPECT_EQ(latin1_to_utf8(bytes), "caf\xC3\xA9 \xC3\xBF");
}
