#pragma once

/**
 * @file config_types.hpp
 * @brief Configuration types for the connector
 *
 * Defines configuration structures that can be loaded from
 * YAML (default) or JSON files.
 */

#include <wsconn/common/debug.hpp>
#include <wsconn/transport/http/http_backend.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace wsconn::core::config {

// ============================================================================
// CONFIGURATION FORMAT
// ============================================================================

/**
 * @brief Supported configuration file formats
 */
enum class ConfigFormat : uint8_t {
    AUTO,  ///< Auto-detect from file extension or content
    YAML,  ///< YAML format (default)
    JSON   ///< JSON format
};

// ============================================================================
// CONNECTOR CONFIGURATION
// ============================================================================

/**
 * @brief Authentication section
 *
 * A token takes precedence over login/password.
 */
struct AuthConfig {
    std::optional<std::string> login;
    std::optional<std::string> password;
    std::optional<std::string> token;
};

/**
 * @brief Proxy section
 */
struct ProxyConfig {
    transport::http::ProxySpec spec;
    std::optional<std::string> login;
    std::optional<std::string> password;
};

/**
 * @brief Settings of one web-service endpoint
 */
struct EndpointConfig {
    std::string url;
    std::optional<std::string> user_agent;
    AuthConfig auth;

    int64_t connect_timeout_ms = 30000;
    int64_t read_timeout_ms    = 60000;

    std::optional<ProxyConfig> proxy;
    transport::http::TlsPolicy tls;
};

// ============================================================================
// LOGGING CONFIGURATION
// ============================================================================

struct LoggingConfig {
    common::debug::LogLevel level = common::debug::LogLevel::INFO;
    bool console                  = true;

    std::string file;  // empty = no file sink
    size_t max_file_size = 10 * 1024 * 1024;
    uint32_t max_files   = 5;

    std::map<std::string, common::debug::LogLevel> categories;
};

// ============================================================================
// ROOT CONFIGURATION
// ============================================================================

struct ConnectorConfig {
    EndpointConfig connector;
    LoggingConfig logging;
};

}  // namespace wsconn::core::config
