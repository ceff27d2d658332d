/**
 * @file http_url.cpp
 * @brief URL validation and resolution over the libcurl URL API
 */

#include "wsconn/transport/http/http_url.hpp"

#include <memory>

#include <curl/curl.h>

namespace wsconn::transport::http {

using common::ErrorCode;
using common::Result;

namespace {

constexpr char HEX_UPPER[] = "0123456789ABCDEF";

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const noexcept { curl_url_cleanup(handle); }
};

using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
    void operator()(char* str) const noexcept { curl_free(str); }
};

using CurlString = std::unique_ptr<char, CurlStringDeleter>;

/**
 * @brief Read one URL component, empty if absent
 */
std::string get_part(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return {};
    }
    CurlString owned(raw);
    return std::string(owned.get());
}

void percent_encode_byte(std::string& out, unsigned char byte) {
    out += '%';
    out += HEX_UPPER[byte >> 4];
    out += HEX_UPPER[byte & 0x0F];
}

constexpr bool is_unreserved(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

constexpr bool is_path_forbidden(unsigned char c) noexcept {
    if (c <= 0x20 || c >= 0x7F) {
        return true;
    }
    switch (c) {
        case '"':
        case '<':
        case '>':
        case '\\':
        case '^':
        case '`':
        case '{':
        case '|':
        case '}':
            return true;
        default:
            return false;
    }
}

Result<std::string> malformed(std::string_view url) {
    return Result<std::string>(ErrorCode::CONFIG_MALFORMED_URL,
                               "Malformed URL: '" + std::string(url) + "'");
}

}  // anonymous namespace

//=============================================================================
// Encoding
//=============================================================================

std::string encode_query_component(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        } else {
            percent_encode_byte(out, c);
        }
    }
    return out;
}

std::string encode_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char ch : path) {
        auto c = static_cast<unsigned char>(ch);
        if (is_path_forbidden(c)) {
            percent_encode_byte(out, c);
        } else {
            out += ch;
        }
    }
    return out;
}

//=============================================================================
// Base URL
//=============================================================================

Result<std::string> normalize_base_url(std::string_view url) {
    CurlUrlPtr handle(curl_url());
    if (!handle) {
        return Result<std::string>(ErrorCode::OUT_OF_MEMORY, "Cannot allocate URL handle");
    }

    std::string input(url);
    if (curl_url_set(handle.get(), CURLUPART_URL, input.c_str(), 0) != CURLUE_OK) {
        return malformed(url);
    }

    std::string scheme = get_part(handle.get(), CURLUPART_SCHEME);
    if (scheme != "http" && scheme != "https") {
        return malformed(url);
    }
    if (get_part(handle.get(), CURLUPART_HOST).empty()) {
        return malformed(url);
    }

    std::string path = get_part(handle.get(), CURLUPART_PATH);
    if (path.empty() || path.back() != '/') {
        path += '/';
        if (curl_url_set(handle.get(), CURLUPART_PATH, path.c_str(), 0) != CURLUE_OK) {
            return malformed(url);
        }
    }

    std::string normalized = get_part(handle.get(), CURLUPART_URL);
    if (normalized.empty()) {
        return malformed(url);
    }
    return normalized;
}

//=============================================================================
// UrlResolver
//=============================================================================

Result<std::string> UrlResolver::resolve(std::string_view path, const QueryParams& params) const {
    CurlUrlPtr handle(curl_url());
    if (!handle) {
        return Result<std::string>(ErrorCode::OUT_OF_MEMORY, "Cannot allocate URL handle");
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, base_url_.c_str(), 0) != CURLUE_OK) {
        return Result<std::string>(ErrorCode::INVALID_STATE,
                                   "Base URL cannot be parsed: " + base_url_);
    }

    size_t first = path.find_first_not_of('/');
    std::string_view relative =
        first == std::string_view::npos ? std::string_view{} : path.substr(first);

    if (!relative.empty()) {
        std::string reference = encode_path(relative);

        // A colon in the first segment would read as a scheme (RFC 3986, 4.2)
        size_t colon = reference.find(':');
        size_t end   = reference.find_first_of("/?#");
        if (colon != std::string::npos && (end == std::string::npos || colon < end)) {
            reference.insert(0, "./");
        }

        if (curl_url_set(handle.get(), CURLUPART_URL, reference.c_str(), 0) != CURLUE_OK) {
            return Result<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid request path: '" + std::string(path) + "'");
        }
    }

    for (const auto& [key, value] : params) {
        std::string pair = encode_query_component(key) + "=" + encode_query_component(value);
        if (curl_url_set(handle.get(), CURLUPART_QUERY, pair.c_str(), CURLU_APPENDQUERY) !=
            CURLUE_OK) {
            return Result<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid query parameter: '" + key + "'");
        }
    }

    std::string resolved = get_part(handle.get(), CURLUPART_URL);
    if (resolved.empty()) {
        return Result<std::string>(ErrorCode::INVALID_ARGUMENT,
                                   "Cannot resolve path: '" + std::string(path) + "'");
    }
    return resolved;
}

}  // namespace wsconn::transport::http
