/**
 * @file ws_response.cpp
 * @brief Response wrapper implementation
 */

#include "wsconn/connector/ws_response.hpp"

#include <wsconn/transform/encoding.hpp>

#include <array>
#include <cctype>

namespace wsconn::connector {

using common::ErrorCode;
using common::Result;

namespace {

constexpr size_t READ_CHUNK_SIZE = 16 * 1024;

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_latin1(std::string_view charset) noexcept {
    return charset == "iso-8859-1" || charset == "latin1" || charset == "iso8859-1" ||
           charset == "l1";
}

}  // anonymous namespace

// ============================================================================
// ResponseBody
// ============================================================================

Result<std::vector<uint8_t>> ResponseBody::read_all() {
    std::vector<uint8_t> bytes;
    std::array<uint8_t, READ_CHUNK_SIZE> chunk{};
    for (;;) {
        size_t n = 0;
        WSCONN_TRY_ASSIGN(n, stream_->read(chunk));
        if (n == 0) {
            break;
        }
        bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + static_cast<ptrdiff_t>(n));
    }
    return bytes;
}

// ============================================================================
// Helpers
// ============================================================================

std::string charset_of(std::string_view content_type) {
    std::string lower = to_lower(content_type);
    std::string_view rest(lower);

    while (true) {
        size_t semicolon = rest.find(';');
        if (semicolon == std::string_view::npos) {
            return {};
        }
        rest.remove_prefix(semicolon + 1);
        size_t start = rest.find_first_not_of(" \t");
        if (start == std::string_view::npos) {
            return {};
        }
        std::string_view param = rest.substr(start);
        if (param.starts_with("charset=")) {
            std::string_view value = param.substr(8);
            value                  = value.substr(0, value.find_first_of("; \t"));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }
    }
}

// ============================================================================
// WsResponse
// ============================================================================

WsResponse::WsResponse(std::unique_ptr<transport::http::IResponseStream> stream)
    : stream_(std::move(stream)) {}

std::string WsResponse::content_type() const {
    auto value = header("Content-Type");
    return value ? std::string(*value) : std::string{};
}

bool WsResponse::has_content() const noexcept {
    int status = code();
    if (status == 204 || status == 304) {
        return false;
    }
    auto length = header("Content-Length");
    return !(length && *length == "0");
}

Result<void> WsResponse::take_body() {
    if (consumed_) {
        return Result<void>(ErrorCode::INVALID_STATE,
                            "Response body has already been consumed: " + request_url());
    }
    consumed_ = true;
    return common::ok();
}

Result<std::vector<uint8_t>> WsResponse::content_bytes() {
    WSCONN_TRY(take_body());
    auto bytes = ResponseBody(stream_.get()).read_all();
    stream_->close();
    return bytes;
}

Result<std::string> WsResponse::content() {
    std::vector<uint8_t> bytes;
    WSCONN_TRY_ASSIGN(bytes, content_bytes());

    if (is_latin1(charset_of(content_type()))) {
        return transform::latin1_to_utf8(bytes);
    }
    return std::string(bytes.begin(), bytes.end());
}

Result<ResponseBody> WsResponse::body() {
    WSCONN_TRY(take_body());
    return ResponseBody(stream_.get());
}

Result<void> WsResponse::fail_if_not_successful() {
    if (is_successful()) {
        return common::ok();
    }

    std::string text;
    std::optional<common::Error> read_failure;
    if (!consumed_) {
        auto read = content();
        if (read.is_success()) {
            text = std::move(read.value());
        } else {
            read_failure = read.error();
        }
    }

    common::Error error(ErrorCode::HTTP_ERROR_STATUS,
                        "Error " + std::to_string(code()) + " on " + request_url() + " : " + text);
    error.with_context("status", std::to_string(code()));
    error.with_context("url", request_url());
    error.with_context("body", text);
    if (read_failure) {
        error.with_cause(std::move(*read_failure));
    }
    return error;
}

}  // namespace wsconn::connector
