#pragma once

/**
 * @file config_loader.hpp
 * @brief Configuration loader for the connector
 *
 * Loads the connector and logging configuration from YAML (default) or JSON
 * files and turns it into a ready-to-build HttpConnector::Builder.
 */

#include <wsconn/common/error.hpp>
#include <wsconn/connector/http_connector.hpp>
#include <wsconn/core/config/config_types.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace wsconn::core::config {

/**
 * @brief Configuration loader interface
 *
 * Loads connector configurations from files or strings.
 * Supports YAML (default) and JSON formats.
 */
class ConfigLoader {
public:
    virtual ~ConfigLoader() = default;

    // ========================================================================
    // FORMAT DETECTION
    // ========================================================================

    /**
     * @brief Detect format from file extension
     * @return JSON for .json, YAML otherwise
     */
    static ConfigFormat detect_format(const std::filesystem::path& path);

    /**
     * @brief Detect format from content
     * @return JSON when the first non-blank character opens an object or array
     */
    static ConfigFormat detect_format_from_content(std::string_view content);

    // ========================================================================
    // LOADING
    // ========================================================================

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @param format Format override (AUTO to detect from extension)
     * @return Configuration, or CONFIG_FILE_NOT_FOUND / CONFIG_PARSE_ERROR /
     *         CONFIG_INVALID_VALUE
     */
    virtual common::Result<ConnectorConfig> load(const std::filesystem::path& path,
                                                 ConfigFormat format = ConfigFormat::AUTO) = 0;

    /**
     * @brief Parse configuration from string
     * @param content Configuration content
     * @param format Format of content (AUTO to detect)
     */
    virtual common::Result<ConnectorConfig> parse(std::string_view content,
                                                  ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // SERIALIZATION
    // ========================================================================

    virtual common::Result<std::string> serialize(const ConnectorConfig& config,
                                                  ConfigFormat format = ConfigFormat::YAML) = 0;

    /**
     * @brief Save configuration to file
     * @param format Format (AUTO to detect from extension)
     */
    virtual common::Result<void> save(const ConnectorConfig& config,
                                      const std::filesystem::path& path,
                                      ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // VALIDATION
    // ========================================================================

    /**
     * @brief Check required fields and value ranges
     */
    virtual common::Result<void> validate(const ConnectorConfig& config) = 0;
};

/**
 * @brief Default implementation backed by yaml-cpp and jsoncpp
 */
class ConfigLoaderImpl : public ConfigLoader {
public:
    ConfigLoaderImpl()           = default;
    ~ConfigLoaderImpl() override = default;

    common::Result<ConnectorConfig> load(const std::filesystem::path& path,
                                         ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<ConnectorConfig> parse(std::string_view content,
                                          ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<std::string> serialize(const ConnectorConfig& config,
                                          ConfigFormat format = ConfigFormat::YAML) override;

    common::Result<void> save(const ConnectorConfig& config, const std::filesystem::path& path,
                              ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<void> validate(const ConnectorConfig& config) override;

private:
    common::Result<std::string> read_file(const std::filesystem::path& path);
    common::Result<void> write_file(const std::filesystem::path& path, std::string_view content);
    ConfigFormat resolve_format(const std::filesystem::path& path, ConfigFormat format);
};

/**
 * @brief Create the default configuration loader
 */
std::unique_ptr<ConfigLoader> create_config_loader();

// ============================================================================
// APPLYING CONFIGURATION
// ============================================================================

/**
 * @brief Builder pre-filled with the endpoint settings
 *
 * Nothing is validated here; HttpConnector::Builder::build() does it.
 */
connector::HttpConnector::Builder to_builder(const ConnectorConfig& config);

/**
 * @brief Configure the global logger from the logging section
 *
 * Replaces the current sinks. Fails with OS_ERROR when the log file cannot
 * be opened.
 */
common::Result<void> apply_logging(const LoggingConfig& config);

}  // namespace wsconn::core::config
