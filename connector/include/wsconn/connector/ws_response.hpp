#pragma once

/**
 * @file ws_response.hpp
 * @brief Response returned by HttpConnector::call()
 */

#include <wsconn/common/error.hpp>
#include <wsconn/transport/http/http_backend.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wsconn::connector {

/**
 * @brief Non-owning reader over a response body
 *
 * Valid while the WsResponse that produced it is alive.
 */
class ResponseBody {
public:
    explicit ResponseBody(transport::http::IResponseStream* stream) noexcept : stream_(stream) {}

    /**
     * @brief Read the next chunk
     * @return Bytes copied into @p buffer, 0 at end of body
     */
    common::Result<size_t> read(std::span<uint8_t> buffer) { return stream_->read(buffer); }

    /**
     * @brief Read everything left
     */
    common::Result<std::vector<uint8_t>> read_all();

private:
    transport::http::IResponseStream* stream_;
};

/**
 * @brief Status, headers and a body that can be consumed once
 *
 * Any HTTP status, including 4xx and 5xx, is a valid response. The pooled
 * transport handle goes back to the pool when the body has been read to the
 * end, and the connection is dropped if the response is destroyed or closed
 * before that.
 */
class WsResponse {
public:
    explicit WsResponse(std::unique_ptr<transport::http::IResponseStream> stream);

    WsResponse(WsResponse&&) noexcept            = default;
    WsResponse& operator=(WsResponse&&) noexcept = default;
    WsResponse(const WsResponse&)                = delete;
    WsResponse& operator=(const WsResponse&)     = delete;
    ~WsResponse()                                = default;

    int code() const noexcept { return stream_->status_code(); }

    /**
     * @brief True for 2xx statuses
     */
    bool is_successful() const noexcept { return code() >= 200 && code() < 300; }

    /**
     * @brief Final URL of the exchange, after redirects
     */
    const std::string& request_url() const noexcept { return stream_->url(); }

    /**
     * @brief First value of a header, name compared case-insensitively
     */
    std::optional<std::string_view> header(std::string_view name) const noexcept {
        return stream_->headers().find(name);
    }

    /**
     * @brief All values of a repeated header
     */
    std::vector<std::string_view> headers(std::string_view name) const {
        return stream_->headers().find_all(name);
    }

    const transport::http::ResponseHeaders& headers() const noexcept { return stream_->headers(); }

    /**
     * @brief Content-Type header value, empty when absent
     */
    std::string content_type() const;

    /**
     * @brief False for 204 and 304 responses and for a zero Content-Length
     */
    bool has_content() const noexcept;

    /**
     * @brief Body as raw bytes
     * @return INVALID_STATE if the body was already consumed
     */
    common::Result<std::vector<uint8_t>> content_bytes();

    /**
     * @brief Body as UTF-8 text
     *
     * ISO-8859-1 bodies (by Content-Type charset) are transcoded, any other
     * body is returned as received.
     *
     * @return INVALID_STATE if the body was already consumed
     */
    common::Result<std::string> content();

    /**
     * @brief Body as a stream
     * @return INVALID_STATE if the body was already consumed
     */
    common::Result<ResponseBody> body();

    /**
     * @brief Turn a non-2xx status into an error
     *
     * Consumes the body. The error is HTTP_ERROR_STATUS with "status",
     * "url" and "body" context entries.
     */
    common::Result<void> fail_if_not_successful();

    bool is_consumed() const noexcept { return consumed_; }

    /**
     * @brief Release the transport resource now, discarding any unread body
     */
    void close() noexcept { stream_->close(); }

private:
    common::Result<void> take_body();

    std::unique_ptr<transport::http::IResponseStream> stream_;
    bool consumed_ = false;
};

/**
 * @brief Extract the charset parameter of a media type, lowercased
 */
std::string charset_of(std::string_view content_type);

}  // namespace wsconn::connector
