#pragma once

/**
 * @file ws_request.hpp
 * @brief Request descriptors accepted by HttpConnector::call()
 *
 * Descriptors are immutable values. The with_*() methods return a modified
 * copy and leave the source untouched, so one descriptor can be reused as
 * a template for many calls.
 */

#include <wsconn/transport/http/http_url.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace wsconn::connector {

/**
 * @brief Common Accept media types
 */
namespace media_types {
inline constexpr std::string_view JSON     = "application/json";
inline constexpr std::string_view PROTOBUF = "application/x-protobuf";
inline constexpr std::string_view TXT      = "text/plain";
}  // namespace media_types

/**
 * @brief Query parameters in insertion order, keys may repeat
 */
using Params = transport::http::QueryParams;

/**
 * @brief Content of one multipart field
 */
class Part {
public:
    using Content = std::variant<std::vector<uint8_t>, std::filesystem::path>;

    /**
     * @brief File uploaded with the given media type, read when the call is made
     */
    static Part file(std::string media_type, std::filesystem::path path) {
        return Part(std::move(media_type), Content(std::move(path)));
    }

    static Part bytes(std::string media_type, std::vector<uint8_t> data) {
        return Part(std::move(media_type), Content(std::move(data)));
    }

    /**
     * @brief Plain form field (text/plain; charset=UTF-8)
     */
    static Part text(std::string_view value);

    const std::string& media_type() const noexcept { return media_type_; }
    const Content& content() const noexcept { return content_; }
    bool is_file() const noexcept { return std::holds_alternative<std::filesystem::path>(content_); }

private:
    Part(std::string media_type, Content content)
        : media_type_(std::move(media_type)), content_(std::move(content)) {}

    std::string media_type_;
    Content content_;
};

/**
 * @brief Fields shared by every request kind
 */
template <typename Derived>
class RequestBase {
public:
    /**
     * @brief Path relative to the connector base URL; leading '/' are ignored
     */
    const std::string& path() const noexcept { return path_; }

    const Params& params() const noexcept { return params_; }

    /**
     * @brief Media type sent as Accept, application/json unless changed
     */
    const std::string& media_type() const noexcept { return media_type_; }

    /**
     * @brief Append a query parameter; an existing key gets another value
     */
    [[nodiscard]] Derived with_param(std::string key, std::string value) const {
        Derived copy(static_cast<const Derived&>(*this));
        copy.params_.emplace_back(std::move(key), std::move(value));
        return copy;
    }

    [[nodiscard]] Derived with_media_type(std::string media_type) const {
        Derived copy(static_cast<const Derived&>(*this));
        copy.media_type_ = std::move(media_type);
        return copy;
    }

protected:
    explicit RequestBase(std::string path) : path_(std::move(path)) {}

    std::string path_;
    Params params_;
    std::string media_type_{media_types::JSON};
};

/**
 * @brief GET request: no body
 */
class GetRequest : public RequestBase<GetRequest> {
public:
    explicit GetRequest(std::string path) : RequestBase(std::move(path)) {}
};

/**
 * @brief POST request: empty body, or multipart/form-data when parts are set
 */
class PostRequest : public RequestBase<PostRequest> {
public:
    using Parts = std::vector<std::pair<std::string, Part>>;

    explicit PostRequest(std::string path) : RequestBase(std::move(path)) {}

    /**
     * @brief Set a named part
     *
     * Parts keep insertion order. Setting an existing name replaces its
     * content in place.
     */
    [[nodiscard]] PostRequest with_part(std::string name, Part part) const;

    const Parts& parts() const noexcept { return parts_; }

    /**
     * @brief Part set under @p name, nullptr if none
     */
    const Part* part(std::string_view name) const noexcept;

private:
    Parts parts_;
};

/**
 * @brief Closed set of request kinds
 */
using WsRequest = std::variant<GetRequest, PostRequest>;

}  // namespace wsconn::connector
