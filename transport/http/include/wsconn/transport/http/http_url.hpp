#pragma once

/**
 * @file http_url.hpp
 * @brief Base URL validation and request URL resolution
 *
 * Parsing and reference resolution are delegated to the libcurl URL API.
 * Percent-encoding of path and query components is done here so that the
 * produced URL does not depend on libcurl encoding flags.
 */

#include <wsconn/common/error.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wsconn::transport::http {

/**
 * @brief Ordered query parameters, keys may repeat
 */
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Validate an absolute http/https URL and normalize it to end with '/'
 *
 * @return The normalized URL, or CONFIG_MALFORMED_URL ("Malformed URL: '<url>'")
 */
common::Result<std::string> normalize_base_url(std::string_view url);

/**
 * @brief Percent-encode a query key or value
 *
 * Everything except RFC 3986 unreserved characters is encoded, with
 * uppercase hex digits.
 */
std::string encode_query_component(std::string_view text);

/**
 * @brief Percent-encode characters that may not appear in a URL path
 *
 * Controls, space, non-ASCII bytes and "<>\^`{|} are encoded. Existing
 * percent escapes and the '/', '?', '#' delimiters are kept.
 */
std::string encode_path(std::string_view path);

/**
 * @brief Resolves request paths against a normalized base URL
 */
class UrlResolver {
public:
    /**
     * @param base_url Output of normalize_base_url()
     */
    explicit UrlResolver(std::string base_url) : base_url_(std::move(base_url)) {}

    const std::string& base_url() const noexcept { return base_url_; }

    /**
     * @brief Join @p path to the base URL and append @p params
     *
     * Leading '/' characters of @p path are ignored, so the path is always
     * relative to the base. An empty path resolves to the base itself.
     *
     * @return Resolved URL, or INVALID_ARGUMENT if the path cannot be resolved
     */
    common::Result<std::string> resolve(std::string_view path, const QueryParams& params) const;

private:
    std::string base_url_;
};

}  // namespace wsconn::transport::http
