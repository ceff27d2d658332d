/**
 * @file multipart.cpp
 * @brief multipart/form-data encoding
 */

#include "wsconn/transport/http/multipart.hpp"

#include <wsconn/transform/encoding.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <system_error>

#include <openssl/rand.h>

namespace wsconn::transport::http {

using common::ErrorCode;
using common::Result;

namespace {

constexpr std::string_view CRLF = "\r\n";

// Attempts before giving up on a boundary absent from every part
constexpr int MAX_BOUNDARY_ATTEMPTS = 8;

void append(std::vector<uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<std::vector<uint8_t>>(ErrorCode::IO_FILE_NOT_FOUND,
                                            "File not found: '" + path.string() + "'");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::vector<uint8_t>>(ErrorCode::READ_ERROR,
                                            "Cannot open file: '" + path.string() + "'");
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::vector<uint8_t>>(ErrorCode::READ_ERROR,
                                            "Cannot read file: '" + path.string() + "'");
    }
    return bytes;
}

bool contains(const std::vector<uint8_t>& haystack, std::string_view needle) {
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) !=
           haystack.end();
}

}  // anonymous namespace

std::string MultipartEncoder::escape_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '"':
                out += "%22";
                break;
            case '\r':
                out += "%0D";
                break;
            case '\n':
                out += "%0A";
                break;
            default:
                out += c;
        }
    }
    return out;
}

Result<std::string> MultipartEncoder::generate_boundary() {
    std::array<uint8_t, 16> random{};
    if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        return Result<std::string>(ErrorCode::SECURITY_CRYPTO_ERROR,
                                   "RAND_bytes failed to produce a multipart boundary");
    }
    return "wsconn-" + transform::hex_encode(random);
}

Result<MultipartBody> MultipartEncoder::encode() const {
    // Load every part first so the boundary can be checked against all content
    std::vector<std::vector<uint8_t>> contents;
    contents.reserve(parts_.size());
    for (const auto& part : parts_) {
        if (part.name.empty()) {
            return Result<MultipartBody>(ErrorCode::INVALID_ARGUMENT,
                                         "Multipart part name must not be empty");
        }
        if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&part.content)) {
            contents.push_back(*bytes);
        } else {
            std::vector<uint8_t> loaded;
            WSCONN_TRY_ASSIGN(loaded, read_file(std::get<std::filesystem::path>(part.content)));
            contents.push_back(std::move(loaded));
        }
    }

    std::string boundary;
    for (int attempt = 0; attempt < MAX_BOUNDARY_ATTEMPTS && boundary.empty(); ++attempt) {
        std::string candidate;
        WSCONN_TRY_ASSIGN(candidate, generate_boundary());
        std::string delimiter = "--" + candidate;
        bool collides = std::any_of(contents.begin(), contents.end(), [&](const auto& content) {
            return contains(content, delimiter);
        });
        if (!collides) {
            boundary = std::move(candidate);
        }
    }
    if (boundary.empty()) {
        return Result<MultipartBody>(ErrorCode::SECURITY_CRYPTO_ERROR,
                                     "Cannot find a multipart boundary absent from content");
    }

    MultipartBody body;
    body.boundary     = boundary;
    body.content_type = "multipart/form-data; boundary=" + boundary;

    for (size_t i = 0; i < parts_.size(); ++i) {
        const auto& part    = parts_[i];
        const auto& content = contents[i];

        append(body.bytes, "--");
        append(body.bytes, boundary);
        append(body.bytes, CRLF);
        append(body.bytes, "Content-Disposition: form-data; name=\"");
        append(body.bytes, escape_name(part.name));
        append(body.bytes, "\"");
        append(body.bytes, CRLF);
        if (!part.media_type.empty()) {
            append(body.bytes, "Content-Type: ");
            append(body.bytes, part.media_type);
            append(body.bytes, CRLF);
        }
        append(body.bytes, "Content-Length: ");
        append(body.bytes, std::to_string(content.size()));
        append(body.bytes, CRLF);
        append(body.bytes, CRLF);
        body.bytes.insert(body.bytes.end(), content.begin(), content.end());
        append(body.bytes, CRLF);
    }

    append(body.bytes, "--");
    append(body.bytes, boundary);
    append(body.bytes, "--");
    append(body.bytes, CRLF);

    return body;
}

}  // namespace wsconn::transport::http
