/**
 * @file encoding.cpp
 * @brief Base64, hex and charset encoders
 */

#include <wsconn/transform/encoding.hpp>

namespace wsconn::transform {

// ============================================================================
// STATIC LOOKUP TABLES
// ============================================================================

namespace detail {

alignas(64) constexpr char BASE64_STANDARD_ALPHABET[65] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

alignas(16) constexpr char HEX_LOWER_ALPHABET[17] = "0123456789abcdef";

}  // namespace detail

// ============================================================================
// BASE64
// ============================================================================

std::string base64_encode(std::span<const uint8_t> input) {
    const char* alphabet = detail::BASE64_STANDARD_ALPHABET;

    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    // Process full 3-byte groups
    for (; i + 3 <= input.size(); i += 3) {
        uint32_t triple = (static_cast<uint32_t>(input[i]) << 16) |
                          (static_cast<uint32_t>(input[i + 1]) << 8) |
                          static_cast<uint32_t>(input[i + 2]);

        output.push_back(alphabet[(triple >> 18) & 0x3F]);
        output.push_back(alphabet[(triple >> 12) & 0x3F]);
        output.push_back(alphabet[(triple >> 6) & 0x3F]);
        output.push_back(alphabet[triple & 0x3F]);
    }

    // Tail of one or two bytes
    size_t remaining = input.size() - i;
    if (remaining > 0) {
        uint32_t triple = static_cast<uint32_t>(input[i]) << 16;
        if (remaining > 1) {
            triple |= static_cast<uint32_t>(input[i + 1]) << 8;
        }

        output.push_back(alphabet[(triple >> 18) & 0x3F]);
        output.push_back(alphabet[(triple >> 12) & 0x3F]);
        output.push_back(remaining > 1 ? alphabet[(triple >> 6) & 0x3F] : '=');
        output.push_back('=');
    }

    return output;
}

// ============================================================================
// HEX
// ============================================================================

std::string hex_encode(std::span<const uint8_t> input) {
    std::string output;
    output.reserve(input.size() * 2);
    for (uint8_t byte : input) {
        output.push_back(detail::HEX_LOWER_ALPHABET[byte >> 4]);
        output.push_back(detail::HEX_LOWER_ALPHABET[byte & 0x0F]);
    }
    return output;
}

// ============================================================================
// CHARSETS
// ============================================================================

std::string latin1_to_utf8(std::span<const uint8_t> input) {
    std::string output;
    output.reserve(input.size());
    for (uint8_t byte : input) {
        if (byte < 0x80) {
            output.push_back(static_cast<char>(byte));
        } else {
            output.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            output.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    return output;
}

}  // namespace wsconn::transform
