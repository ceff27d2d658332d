#pragma once

/**
 * @file connector_error.hpp
 * @brief Error kinds reported by the connector
 *
 * Every failure is a common::Error. The kind follows from the error category,
 * so callers never need to inspect messages:
 * - ConfigurationError: CONFIG category, only from build() and the config loader
 * - ArgumentError: INVALID_ARGUMENT, a malformed descriptor
 * - TransportError: TRANSPORT_FAILED, the cause chain holds the I/O failure
 */

#include <wsconn/common/error.hpp>

#include <string_view>

namespace wsconn::connector {

enum class ConnectorErrorKind : uint8_t {
    NONE,
    CONFIGURATION,
    ARGUMENT,
    TRANSPORT,
    OTHER  // HTTP_ERROR_STATUS, INVALID_STATE and similar
};

constexpr std::string_view error_kind_name(ConnectorErrorKind kind) noexcept {
    switch (kind) {
        case ConnectorErrorKind::NONE:
            return "None";
        case ConnectorErrorKind::CONFIGURATION:
            return "ConfigurationError";
        case ConnectorErrorKind::ARGUMENT:
            return "ArgumentError";
        case ConnectorErrorKind::TRANSPORT:
            return "TransportError";
        case ConnectorErrorKind::OTHER:
        default:
            return "Error";
    }
}

constexpr ConnectorErrorKind classify(common::ErrorCode code) noexcept {
    if (code == common::ErrorCode::SUCCESS) {
        return ConnectorErrorKind::NONE;
    }
    if (code == common::ErrorCode::TRANSPORT_FAILED) {
        return ConnectorErrorKind::TRANSPORT;
    }
    if (code == common::ErrorCode::INVALID_ARGUMENT) {
        return ConnectorErrorKind::ARGUMENT;
    }
    switch (common::get_category(code)) {
        case common::ErrorCategory::CONFIG:
            return ConnectorErrorKind::CONFIGURATION;
        default:
            return ConnectorErrorKind::OTHER;
    }
}

inline ConnectorErrorKind classify(const common::Error& error) noexcept {
    return classify(error.code());
}

inline bool is_configuration_error(const common::Error& error) noexcept {
    return classify(error) == ConnectorErrorKind::CONFIGURATION;
}

inline bool is_argument_error(const common::Error& error) noexcept {
    return classify(error) == ConnectorErrorKind::ARGUMENT;
}

inline bool is_transport_error(const common::Error& error) noexcept {
    return classify(error) == ConnectorErrorKind::TRANSPORT;
}

}  // namespace wsconn::connector
