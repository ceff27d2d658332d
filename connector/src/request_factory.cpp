/**
 * @file request_factory.cpp
 * @brief Descriptor to wire request conversion
 */

#include "wsconn/connector/request_factory.hpp"

#include <wsconn/transport/http/multipart.hpp>

#include <variant>

namespace wsconn::connector {

using common::ErrorCode;
using common::Result;
using transport::http::Method;
using transport::http::Request;

bool is_valid_header_value(std::string_view value) noexcept {
    return value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos;
}

RequestFactory::RequestFactory(transport::http::UrlResolver resolver,
                               std::optional<std::string> credentials,
                               std::optional<std::string> proxy_credentials,
                               std::optional<std::string> user_agent)
    : resolver_(std::move(resolver)),
      credentials_(std::move(credentials)),
      proxy_credentials_(std::move(proxy_credentials)),
      user_agent_(std::move(user_agent)) {}

Result<Request> RequestFactory::create(const WsRequest& request) const {
    return std::visit([this](const auto& descriptor) { return create(descriptor); }, request);
}

template <typename Descriptor>
Result<Request> RequestFactory::prepare(const Descriptor& request, Method method) const {
    if (!is_valid_header_value(request.media_type())) {
        return Result<Request>(ErrorCode::INVALID_ARGUMENT,
                               "Media type contains a line break: '" + request.media_type() + "'");
    }

    std::string url;
    WSCONN_TRY_ASSIGN(url, resolver_.resolve(request.path(), request.params()));

    Request wire;
    wire.method = method;
    wire.url    = std::move(url);

    wire.add_header("Accept", request.media_type());
    wire.add_header("Accept-Charset", "UTF-8");
    if (credentials_) {
        wire.add_header("Authorization", *credentials_);
    }
    if (proxy_credentials_) {
        wire.add_header("Proxy-Authorization", *proxy_credentials_);
    }
    if (user_agent_) {
        wire.add_header("User-Agent", *user_agent_);
    }
    return wire;
}

Result<Request> RequestFactory::create(const GetRequest& request) const {
    return prepare(request, Method::GET);
}

Result<Request> RequestFactory::create(const PostRequest& request) const {
    for (const auto& [name, part] : request.parts()) {
        if (name.empty()) {
            return Result<Request>(ErrorCode::INVALID_ARGUMENT,
                                   "Multipart part name must not be empty");
        }
        if (!is_valid_header_value(part.media_type())) {
            return Result<Request>(ErrorCode::INVALID_ARGUMENT,
                                   "Media type of part '" + name + "' contains a line break");
        }
    }

    Request wire;
    WSCONN_TRY_ASSIGN(wire, prepare(request, Method::POST));

    if (request.parts().empty()) {
        return wire;
    }

    transport::http::MultipartEncoder encoder;
    for (const auto& [name, part] : request.parts()) {
        encoder.add(transport::http::FormPart{name, part.media_type(), part.content()});
    }

    auto encoded = encoder.encode();
    if (encoded.is_error()) {
        if (encoded.code() == ErrorCode::INVALID_ARGUMENT) {
            return encoded.error();
        }
        // Unreadable file parts fail like any other I/O of the call
        return transport::http::transport_failure(wire.url, encoded.error());
    }

    auto& body        = encoded.value();
    wire.content_type = std::move(body.content_type);
    wire.body         = std::move(body.bytes);
    return wire;
}

}  // namespace wsconn::connector
