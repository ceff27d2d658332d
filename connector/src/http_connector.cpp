/**
 * @file http_connector.cpp
 * @brief Connector builder validation and call dispatch
 */

#include "wsconn/connector/http_connector.hpp"

#include "wsconn/connector/credentials.hpp"

#include <wsconn/common/debug.hpp>
#include <wsconn/transport/http/http_url.hpp>

namespace wsconn::connector {

using common::ErrorCode;
using common::Result;

namespace category = common::debug::category;

namespace {

common::Error invalid(std::string_view message) {
    return common::Error(ErrorCode::CONFIG_INVALID_VALUE, message);
}

Result<void> validate_header(std::string_view what, const std::optional<std::string>& value) {
    if (value && !is_valid_header_value(*value)) {
        return invalid(std::string(what) + " must not contain line breaks");
    }
    return common::ok();
}

}  // anonymous namespace

// ============================================================================
// Builder
// ============================================================================

transport::http::TransportOptions HttpConnector::Builder::transport_options() const {
    transport::http::TransportOptions options;
    options.connect_timeout = std::chrono::milliseconds(connect_timeout_ms_);
    options.read_timeout    = std::chrono::milliseconds(read_timeout_ms_);
    options.tls             = tls_;
    options.proxy           = proxy_;
    return options;
}

Result<HttpConnector> HttpConnector::Builder::build() const {
    if (!url_ || url_->empty()) {
        return Result<HttpConnector>(ErrorCode::CONFIG_REQUIRED_MISSING,
                                     "Server URL is not defined");
    }

    std::string base_url;
    WSCONN_TRY_ASSIGN(base_url, transport::http::normalize_base_url(*url_));

    if (connect_timeout_ms_ < 0) {
        return invalid("Connect timeout must not be negative: " +
                       std::to_string(connect_timeout_ms_));
    }
    if (read_timeout_ms_ < 0) {
        return invalid("Read timeout must not be negative: " + std::to_string(read_timeout_ms_));
    }
    if (tls_.min_version > tls_.max_version) {
        return invalid("TLS minimum version " +
                       std::string(transport::http::tls_version_name(tls_.min_version)) +
                       " is above maximum " +
                       std::string(transport::http::tls_version_name(tls_.max_version)));
    }
    if (proxy_ && proxy_->type != transport::http::ProxyType::DIRECT &&
        (proxy_->host.empty() || proxy_->port == 0)) {
        return invalid("Proxy requires a host and a port");
    }
    WSCONN_TRY(validate_header("User agent", user_agent_));

    auto credentials = basic_credentials(login_.value_or(""), password_);
    // Proxy credentials may be needed by system-wide proxies, even without proxy_
    auto proxy_credentials = basic_credentials(proxy_login_.value_or(""), proxy_password_);

    std::shared_ptr<transport::http::IHTTPBackend> backend = backend_;
    if (!backend) {
        std::unique_ptr<transport::http::IHTTPBackend> created;
        WSCONN_TRY_ASSIGN(created, transport::http::create_backend(transport_options()));
        backend = std::move(created);
    }

    WSCONN_LOG_DEBUG(category::CONNECTOR,
                     "Connector built for " << base_url << " (auth="
                                            << (credentials ? "basic" : "none")
                                            << ", backend=" << backend->name() << ")");

    RequestFactory factory(transport::http::UrlResolver(std::move(base_url)),
                           std::move(credentials), std::move(proxy_credentials), user_agent_);
    return HttpConnector(std::move(factory), std::move(backend));
}

// ============================================================================
// Calls
// ============================================================================

Result<WsResponse> HttpConnector::call(const WsRequest& request) const {
    common::debug::Span span("http_call", category::CONNECTOR);

    auto wire = factory_.create(request);
    if (wire.is_error()) {
        span.set_error(wire.code(), wire.message());
        return wire.error();
    }

    const auto& prepared = wire.value();
    span.add_context("method", transport::http::method_to_string(prepared.method));
    span.add_context("url", prepared.url);
    WSCONN_LOG_DEBUG(category::CONNECTOR, "Calling " << transport::http::method_to_string(
                                                            prepared.method)
                                                     << " " << prepared.url);

    auto stream = backend_->execute(prepared);
    if (stream.is_error()) {
        span.set_error(stream.code(), stream.message());
        return stream.error();
    }

    WsResponse response(std::move(stream).value());
    span.add_context("status", static_cast<int64_t>(response.code()));
    return Result<WsResponse>(std::move(response));
}

}  // namespace wsconn::connector
