#pragma once

/**
 * @file credentials.hpp
 * @brief HTTP Basic credentials encoding
 */

#include <optional>
#include <string>
#include <string_view>

namespace wsconn::connector {

/**
 * @brief Build an Authorization header value
 *
 * Returns "Basic " + base64(login ":" password) over the UTF-8 bytes of both
 * strings, or std::nullopt when @p login is empty. An unset password encodes
 * as empty, which is how access tokens are sent (token as login).
 */
std::optional<std::string> basic_credentials(std::string_view login,
                                             const std::optional<std::string>& password);

}  // namespace wsconn::connector
