#pragma once

/**
 * @file multipart.hpp
 * @brief multipart/form-data body encoder
 */

#include <wsconn/common/error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wsconn::transport::http {

/**
 * @brief One named part: in-memory bytes or a file read at encode time
 */
struct FormPart {
    std::string name;
    std::string media_type;
    std::variant<std::vector<uint8_t>, std::filesystem::path> content;
};

/**
 * @brief Encoded body ready to send
 */
struct MultipartBody {
    std::string boundary;
    std::string content_type;  // multipart/form-data; boundary=...
    std::vector<uint8_t> bytes;
};

/**
 * @brief Builds a multipart/form-data body
 *
 * Parts are emitted in insertion order, each with Content-Disposition,
 * Content-Type (when a media type is set) and Content-Length headers.
 */
class MultipartEncoder {
public:
    MultipartEncoder& add(FormPart part) {
        parts_.push_back(std::move(part));
        return *this;
    }

    size_t part_count() const noexcept { return parts_.size(); }

    /**
     * @brief Read file parts and assemble the body
     *
     * @return INVALID_ARGUMENT for an empty part name, IO_FILE_NOT_FOUND or
     *         READ_ERROR for unreadable files, SECURITY_CRYPTO_ERROR if no
     *         random boundary can be produced
     */
    common::Result<MultipartBody> encode() const;

    /**
     * @brief Random boundary from 16 bytes of OpenSSL RAND_bytes
     */
    static common::Result<std::string> generate_boundary();

    /**
     * @brief Escape a field name for a quoted Content-Disposition parameter
     *
     * '"', CR and LF become %22, %0D and %0A.
     */
    static std::string escape_name(std::string_view name);

private:
    std::vector<FormPart> parts_;
};

}  // namespace wsconn::transport::http
