#pragma once

/**
 * @file encoding.hpp
 * @brief Text encodings used on the wire
 *
 * Provides:
 * - Base64 (standard alphabet, padded) for Basic credentials
 * - Hex for multipart boundaries
 * - ISO-8859-1 to UTF-8 transcoding for legacy response bodies
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace wsconn::transform {

// ============================================================================
// BASE64
// ============================================================================

/**
 * @brief Encode bytes as standard Base64 with '=' padding
 */
std::string base64_encode(std::span<const uint8_t> input);

/**
 * @brief Encode the raw bytes of a string as standard Base64
 */
inline std::string base64_encode(std::string_view input) {
    return base64_encode(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(input.data()), input.size()));
}

// ============================================================================
// HEX
// ============================================================================

/**
 * @brief Encode bytes as lowercase hexadecimal
 */
std::string hex_encode(std::span<const uint8_t> input);

// ============================================================================
// CHARSETS
// ============================================================================

/**
 * @brief Transcode ISO-8859-1 bytes to UTF-8
 *
 * Every byte maps to the code point of the same value, so the conversion
 * cannot fail.
 */
std::string latin1_to_utf8(std::span<const uint8_t> input);

}  // namespace wsconn::transform
