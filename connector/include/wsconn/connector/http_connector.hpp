#pragma once

/**
 * @file http_connector.hpp
 * @brief Immutable HTTP connector to a web-service API
 *
 * Usage:
 * @code
 * auto connector = HttpConnector::new_builder()
 *                      .url("https://ws.example.com/api")
 *                      .token("ABCDE")
 *                      .user_agent("my-app/1.0")
 *                      .build();
 * if (!connector) { ... connector.error() ... }
 *
 * auto response = connector.value().call(GetRequest("rules/search").with_param("q", "x"));
 * @endcode
 *
 * A connector is safe to share between threads. Each call() blocks the
 * calling thread until the response headers arrive.
 */

#include "request_factory.hpp"
#include "ws_request.hpp"
#include "ws_response.hpp"

#include <wsconn/common/error.hpp>
#include <wsconn/transport/http/http_backend.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wsconn::connector {

class HttpConnector {
public:
    static constexpr int64_t DEFAULT_CONNECT_TIMEOUT_MS = 30000;
    static constexpr int64_t DEFAULT_READ_TIMEOUT_MS    = 60000;

    /**
     * @brief Accumulates settings; build() validates and freezes them
     */
    class Builder {
    public:
        Builder() = default;

        /**
         * @brief Mandatory server URL, for example "http://localhost:9000"
         */
        Builder& url(std::string url) {
            url_ = std::move(url);
            return *this;
        }

        Builder& user_agent(std::optional<std::string> user_agent) {
            user_agent_ = std::move(user_agent);
            return *this;
        }

        /**
         * @brief Login and password for Basic authentication
         */
        Builder& credentials(std::optional<std::string> login,
                             std::optional<std::string> password) {
            login_    = std::move(login);
            password_ = std::move(password);
            return *this;
        }

        /**
         * @brief Access token, sent as the Basic login with an empty password
         *
         * Replaces any login/password set before, and vice versa.
         */
        Builder& token(std::optional<std::string> token) {
            login_ = std::move(token);
            password_.reset();
            return *this;
        }

        /**
         * @brief Timeout for TCP and TLS setup, 0 = no limit
         */
        Builder& connect_timeout_ms(int64_t timeout) {
            connect_timeout_ms_ = timeout;
            return *this;
        }

        /**
         * @brief Maximum wait between two chunks of response data, 0 = no limit
         */
        Builder& read_timeout_ms(int64_t timeout) {
            read_timeout_ms_ = timeout;
            return *this;
        }

        /**
         * @brief Explicit proxy; unset means proxies from the environment
         */
        Builder& proxy(std::optional<transport::http::ProxySpec> proxy) {
            proxy_ = std::move(proxy);
            return *this;
        }

        /**
         * @brief Proxy credentials, also sent when only environment proxies apply
         */
        Builder& proxy_credentials(std::optional<std::string> login,
                                   std::optional<std::string> password) {
            proxy_login_    = std::move(login);
            proxy_password_ = std::move(password);
            return *this;
        }

        Builder& tls(transport::http::TlsPolicy policy) {
            tls_ = std::move(policy);
            return *this;
        }

        /**
         * @brief Use an existing backend instead of creating a libcurl one
         *
         * The backend's own options then apply; timeouts, proxy and TLS
         * settings of this builder are only validated.
         */
        Builder& backend(std::shared_ptr<transport::http::IHTTPBackend> backend) {
            backend_ = std::move(backend);
            return *this;
        }

        /**
         * @brief Validate settings and create the connector
         *
         * Performs no network I/O. Errors:
         * - CONFIG_REQUIRED_MISSING when the URL is unset or empty
         * - CONFIG_MALFORMED_URL when it is not an absolute http(s) URL
         * - CONFIG_INVALID_VALUE for negative timeouts, an incomplete proxy,
         *   an inverted TLS range or line breaks in header values
         */
        common::Result<HttpConnector> build() const;

        transport::http::TransportOptions transport_options() const;

    private:
        std::optional<std::string> url_;
        std::optional<std::string> user_agent_;
        std::optional<std::string> login_;
        std::optional<std::string> password_;
        std::optional<transport::http::ProxySpec> proxy_;
        std::optional<std::string> proxy_login_;
        std::optional<std::string> proxy_password_;
        int64_t connect_timeout_ms_ = DEFAULT_CONNECT_TIMEOUT_MS;
        int64_t read_timeout_ms_    = DEFAULT_READ_TIMEOUT_MS;
        transport::http::TlsPolicy tls_;
        std::shared_ptr<transport::http::IHTTPBackend> backend_;
    };

    static Builder new_builder() { return Builder(); }

    /**
     * @brief Base URL, always ending with '/'
     */
    const std::string& base_url() const noexcept { return factory_.resolver().base_url(); }

    const std::optional<std::string>& user_agent() const noexcept {
        return factory_.user_agent();
    }

    const transport::http::TransportOptions& transport_options() const noexcept {
        return backend_->options();
    }

    /**
     * @brief Execute one request
     *
     * Non-2xx statuses are returned as responses. Errors are ArgumentError
     * codes for descriptors that cannot be encoded and TRANSPORT_FAILED for
     * any I/O failure, never retried.
     */
    common::Result<WsResponse> call(const WsRequest& request) const;

    transport::http::BackendStats stats() const noexcept { return backend_->stats(); }

private:
    HttpConnector(RequestFactory factory, std::shared_ptr<transport::http::IHTTPBackend> backend)
        : factory_(std::move(factory)), backend_(std::move(backend)) {}

    RequestFactory factory_;
    std::shared_ptr<transport::http::IHTTPBackend> backend_;
};

}  // namespace wsconn::connector
