#pragma once

/**
 * @file request_factory.hpp
 * @brief Turns request descriptors into wire requests
 */

#include "ws_request.hpp"

#include <wsconn/common/error.hpp>
#include <wsconn/transport/http/http_backend.hpp>
#include <wsconn/transport/http/http_url.hpp>

#include <optional>
#include <string>

namespace wsconn::connector {

/**
 * @brief Builds transport requests from descriptors and connector settings
 *
 * Headers are added in a fixed order: Accept, Accept-Charset, Authorization,
 * Proxy-Authorization, User-Agent. The last three only when configured.
 */
class RequestFactory {
public:
    RequestFactory(transport::http::UrlResolver resolver, std::optional<std::string> credentials,
                   std::optional<std::string> proxy_credentials,
                   std::optional<std::string> user_agent);

    /**
     * @brief Build the wire request for any descriptor kind
     *
     * @return INVALID_ARGUMENT for a descriptor that cannot be encoded,
     *         TRANSPORT_FAILED when a file part cannot be read
     */
    common::Result<transport::http::Request> create(const WsRequest& request) const;

    common::Result<transport::http::Request> create(const GetRequest& request) const;
    common::Result<transport::http::Request> create(const PostRequest& request) const;

    const transport::http::UrlResolver& resolver() const noexcept { return resolver_; }
    bool has_credentials() const noexcept { return credentials_.has_value(); }
    bool has_proxy_credentials() const noexcept { return proxy_credentials_.has_value(); }
    const std::optional<std::string>& user_agent() const noexcept { return user_agent_; }

private:
    template <typename Descriptor>
    common::Result<transport::http::Request> prepare(const Descriptor& request,
                                                     transport::http::Method method) const;

    transport::http::UrlResolver resolver_;
    std::optional<std::string> credentials_;
    std::optional<std::string> proxy_credentials_;
    std::optional<std::string> user_agent_;
};

/**
 * @brief True if @p value can be sent as a header value (no CR, LF or NUL)
 */
bool is_valid_header_value(std::string_view value) noexcept;

}  // namespace wsconn::connector
