/**
 * @file credentials.cpp
 * @brief HTTP Basic credential encoding
 */

#include "wsconn/connector/credentials.hpp"

#include <wsconn/transform/encoding.hpp>

namespace wsconn::connector {

std::optional<std::string> basic_credentials(std::string_view login,
                                             const std::optional<std::string>& password) {
    if (login.empty()) {
        return std::nullopt;
    }

    std::string user_pass(login);
    user_pass += ':';
    if (password) {
        user_pass += *password;
    }
    return "Basic " + transform::base64_encode(std::string_view(user_pass));
}

}  // namespace wsconn::connector
