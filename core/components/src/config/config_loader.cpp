/**
 * @file config_loader.cpp
 * @brief Configuration loader implementation
 */

#include <wsconn/core/config/config_loader.hpp>
#include <wsconn/transport/http/http_url.hpp>

#include <yaml-cpp/yaml.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace wsconn::core::config {

using common::ErrorCode;
using common::Result;
using common::debug::LogLevel;
using transport::http::ProxyType;
using transport::http::TlsPolicy;

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<ConfigLoader> create_config_loader() {
    return std::make_unique<ConfigLoaderImpl>();
}

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat ConfigLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;  // .yaml, .yml and anything else
}

ConfigFormat ConfigLoader::detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos < content.size() && (content[pos] == '{' || content[pos] == '[')) {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

// ============================================================================
// DOCUMENT ACCESS
// ============================================================================

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

/**
 * Read-only view over a YAML mapping. Conversion failures throw
 * YAML::Exception and end up as CONFIG_PARSE_ERROR.
 */
class YamlSection {
public:
    explicit YamlSection(YAML::Node node) : node_(std::move(node)) {}

    bool is_map() const { return node_.IsMap(); }

    bool has(const std::string& key) const { return node_[key] && !node_[key].IsNull(); }

    YamlSection child(const std::string& key) const { return YamlSection(node_[key]); }

    std::string get_string(const std::string& key, std::string default_value) const {
        return has(key) ? node_[key].as<std::string>() : default_value;
    }

    std::optional<std::string> get_optional(const std::string& key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        return node_[key].as<std::string>();
    }

    int64_t get_int(const std::string& key, int64_t default_value) const {
        return has(key) ? node_[key].as<int64_t>() : default_value;
    }

    bool get_bool(const std::string& key, bool default_value) const {
        return has(key) ? node_[key].as<bool>() : default_value;
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> result;
        for (auto it = node_.begin(); it != node_.end(); ++it) {
            result.push_back(it->first.as<std::string>());
        }
        return result;
    }

private:
    YAML::Node node_;
};

/**
 * Same view over a JSON object. Type errors throw Json::LogicError.
 */
class JsonSection {
public:
    explicit JsonSection(const Json::Value& node) : node_(node) {}

    bool is_map() const { return node_.isObject(); }

    bool has(const std::string& key) const {
        return node_.isObject() && node_.isMember(key) && !node_[key].isNull();
    }

    JsonSection child(const std::string& key) const { return JsonSection(node_[key]); }

    std::string get_string(const std::string& key, std::string default_value) const {
        return has(key) ? node_[key].asString() : default_value;
    }

    std::optional<std::string> get_optional(const std::string& key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        return node_[key].asString();
    }

    int64_t get_int(const std::string& key, int64_t default_value) const {
        return has(key) ? node_[key].asInt64() : default_value;
    }

    bool get_bool(const std::string& key, bool default_value) const {
        return has(key) ? node_[key].asBool() : default_value;
    }

    std::vector<std::string> keys() const { return node_.getMemberNames(); }

private:
    const Json::Value& node_;
};

// ============================================================================
// VALUE PARSERS
// ============================================================================

common::Error invalid_value(std::string_view field, std::string_view value, std::string_view what) {
    common::Error error(ErrorCode::CONFIG_INVALID_VALUE,
                        std::string(what) + ": '" + std::string(value) + "'");
    error.with_context("field", field);
    return error;
}

Result<LogLevel> parse_level(std::string_view field, const std::string& text) {
    static const std::vector<std::string> known = {"trace", "debug", "info",     "warn",
                                                   "warning", "error", "err",    "fatal",
                                                   "critical", "off",  "none"};
    if (std::find(known.begin(), known.end(), to_lower(text)) == known.end()) {
        return invalid_value(field, text, "Unknown log level");
    }
    return common::debug::parse_log_level(text);
}

Result<ProxyType> parse_proxy_type(const std::string& text) {
    auto lower = to_lower(text);
    if (lower == "direct" || lower == "none")
        return ProxyType::DIRECT;
    if (lower == "http")
        return ProxyType::HTTP;
    if (lower == "socks4")
        return ProxyType::SOCKS4;
    if (lower == "socks5")
        return ProxyType::SOCKS5;
    return invalid_value("connector.proxy.type", text, "Unknown proxy type");
}

Result<transport::http::TlsVersion> parse_version(std::string_view field, const std::string& text) {
    auto version = transport::http::parse_tls_version(text);
    if (!version) {
        return invalid_value(field, text, "Unknown TLS version");
    }
    return *version;
}

// ============================================================================
// SECTION PARSERS
// ============================================================================

template<typename Section>
Result<ProxyConfig> parse_proxy(const Section& node) {
    ProxyConfig config;

    ProxyType type;
    WSCONN_TRY_ASSIGN(type, parse_proxy_type(node.get_string("type", "http")));
    config.spec.type = type;
    config.spec.host = node.get_string("host", "");

    int64_t port = node.get_int("port", 0);
    if (port < 0 || port > 65535) {
        return invalid_value("connector.proxy.port", std::to_string(port), "Invalid proxy port");
    }
    config.spec.port = static_cast<uint16_t>(port);

    config.login    = node.get_optional("login");
    config.password = node.get_optional("password");
    return config;
}

template<typename Section>
Result<TlsPolicy> parse_tls(const Section& node) {
    TlsPolicy policy;

    auto min_name = node.get_string(
        "min_version", std::string(transport::http::tls_version_name(policy.min_version)));
    auto max_name = node.get_string(
        "max_version", std::string(transport::http::tls_version_name(policy.max_version)));

    transport::http::TlsVersion min_version;
    transport::http::TlsVersion max_version;
    WSCONN_TRY_ASSIGN(min_version, parse_version("connector.tls.min_version", min_name));
    WSCONN_TRY_ASSIGN(max_version, parse_version("connector.tls.max_version", max_name));
    policy.min_version = min_version;
    policy.max_version = max_version;

    policy.cipher_list = node.get_string("cipher_list", policy.cipher_list);
    policy.verify_peer = node.get_bool("verify_peer", policy.verify_peer);
    policy.ca_file     = node.get_string("ca_file", "");
    return policy;
}

template<typename Section>
Result<EndpointConfig> parse_endpoint(const Section& node) {
    EndpointConfig config;

    config.url        = node.get_string("url", "");
    config.user_agent = node.get_optional("user_agent");

    if (node.has("auth")) {
        auto auth            = node.child("auth");
        config.auth.login    = auth.get_optional("login");
        config.auth.password = auth.get_optional("password");
        config.auth.token    = auth.get_optional("token");
    }

    config.connect_timeout_ms = node.get_int("connect_timeout_ms", config.connect_timeout_ms);
    config.read_timeout_ms    = node.get_int("read_timeout_ms", config.read_timeout_ms);

    if (node.has("proxy")) {
        ProxyConfig proxy;
        WSCONN_TRY_ASSIGN(proxy, parse_proxy(node.child("proxy")));
        config.proxy = std::move(proxy);
    }

    if (node.has("tls")) {
        TlsPolicy tls;
        WSCONN_TRY_ASSIGN(tls, parse_tls(node.child("tls")));
        config.tls = std::move(tls);
    }

    return config;
}

template<typename Section>
Result<LoggingConfig> parse_logging(const Section& node) {
    LoggingConfig config;

    LogLevel level;
    WSCONN_TRY_ASSIGN(level, parse_level("logging.level", node.get_string("level", "info")));
    config.level   = level;
    config.console = node.get_bool("console", config.console);
    config.file    = node.get_string("file", "");

    int64_t max_file_size = node.get_int("max_file_size", static_cast<int64_t>(config.max_file_size));
    int64_t max_files     = node.get_int("max_files", config.max_files);
    if (max_file_size < 0) {
        return invalid_value("logging.max_file_size", std::to_string(max_file_size),
                             "Invalid log file size");
    }
    if (max_files < 1 || max_files > 100) {
        return invalid_value("logging.max_files", std::to_string(max_files),
                             "Invalid log file count");
    }
    config.max_file_size = static_cast<size_t>(max_file_size);
    config.max_files     = static_cast<uint32_t>(max_files);

    if (node.has("categories")) {
        auto categories = node.child("categories");
        for (const auto& name : categories.keys()) {
            LogLevel category_level;
            WSCONN_TRY_ASSIGN(category_level, parse_level("logging.categories." + name,
                                                          categories.get_string(name, "info")));
            config.categories[name] = category_level;
        }
    }

    return config;
}

template<typename Section>
Result<ConnectorConfig> parse_root(const Section& root) {
    if (!root.is_map()) {
        return Result<ConnectorConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                       "Configuration root must be a mapping");
    }

    ConnectorConfig config;

    if (root.has("connector")) {
        EndpointConfig connector;
        WSCONN_TRY_ASSIGN(connector, parse_endpoint(root.child("connector")));
        config.connector = std::move(connector);
    }

    if (root.has("logging")) {
        LoggingConfig logging;
        WSCONN_TRY_ASSIGN(logging, parse_logging(root.child("logging")));
        config.logging = std::move(logging);
    }

    return config;
}

// ============================================================================
// SERIALIZATION HELPERS
// ============================================================================

std::string level_string(LogLevel level) {
    return to_lower(common::debug::level_name(level));
}

void emit_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& value) {
    if (value) {
        out << YAML::Key << key << YAML::Value << *value;
    }
}

std::string serialize_yaml(const ConnectorConfig& config) {
    const auto& ep = config.connector;
    YAML::Emitter out;

    out << YAML::BeginMap;
    out << YAML::Key << "connector" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "url" << YAML::Value << ep.url;
    emit_optional(out, "user_agent", ep.user_agent);

    if (ep.auth.login || ep.auth.password || ep.auth.token) {
        out << YAML::Key << "auth" << YAML::Value << YAML::BeginMap;
        emit_optional(out, "login", ep.auth.login);
        emit_optional(out, "password", ep.auth.password);
        emit_optional(out, "token", ep.auth.token);
        out << YAML::EndMap;
    }

    out << YAML::Key << "connect_timeout_ms" << YAML::Value << ep.connect_timeout_ms;
    out << YAML::Key << "read_timeout_ms" << YAML::Value << ep.read_timeout_ms;

    if (ep.proxy) {
        out << YAML::Key << "proxy" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "type" << YAML::Value
            << std::string(transport::http::proxy_type_name(ep.proxy->spec.type));
        out << YAML::Key << "host" << YAML::Value << ep.proxy->spec.host;
        out << YAML::Key << "port" << YAML::Value << ep.proxy->spec.port;
        emit_optional(out, "login", ep.proxy->login);
        emit_optional(out, "password", ep.proxy->password);
        out << YAML::EndMap;
    }

    out << YAML::Key << "tls" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "min_version" << YAML::Value << YAML::DoubleQuoted
        << std::string(transport::http::tls_version_name(ep.tls.min_version));
    out << YAML::Key << "max_version" << YAML::Value << YAML::DoubleQuoted
        << std::string(transport::http::tls_version_name(ep.tls.max_version));
    out << YAML::Key << "cipher_list" << YAML::Value << ep.tls.cipher_list;
    out << YAML::Key << "verify_peer" << YAML::Value << ep.tls.verify_peer;
    out << YAML::Key << "ca_file" << YAML::Value << ep.tls.ca_file;
    out << YAML::EndMap;
    out << YAML::EndMap;

    const auto& log = config.logging;
    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << level_string(log.level);
    out << YAML::Key << "console" << YAML::Value << log.console;
    out << YAML::Key << "file" << YAML::Value << log.file;
    out << YAML::Key << "max_file_size" << YAML::Value << static_cast<uint64_t>(log.max_file_size);
    out << YAML::Key << "max_files" << YAML::Value << log.max_files;
    if (!log.categories.empty()) {
        out << YAML::Key << "categories" << YAML::Value << YAML::BeginMap;
        for (const auto& [name, level] : log.categories) {
            out << YAML::Key << name << YAML::Value << level_string(level);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

void set_optional(Json::Value& node, const char* key, const std::optional<std::string>& value) {
    if (value) {
        node[key] = *value;
    }
}

std::string serialize_json(const ConnectorConfig& config) {
    const auto& ep = config.connector;
    Json::Value root(Json::objectValue);

    Json::Value connector(Json::objectValue);
    connector["url"] = ep.url;
    set_optional(connector, "user_agent", ep.user_agent);

    if (ep.auth.login || ep.auth.password || ep.auth.token) {
        Json::Value auth(Json::objectValue);
        set_optional(auth, "login", ep.auth.login);
        set_optional(auth, "password", ep.auth.password);
        set_optional(auth, "token", ep.auth.token);
        connector["auth"] = auth;
    }

    connector["connect_timeout_ms"] = Json::Int64(ep.connect_timeout_ms);
    connector["read_timeout_ms"]    = Json::Int64(ep.read_timeout_ms);

    if (ep.proxy) {
        Json::Value proxy(Json::objectValue);
        proxy["type"] = std::string(transport::http::proxy_type_name(ep.proxy->spec.type));
        proxy["host"] = ep.proxy->spec.host;
        proxy["port"] = static_cast<Json::UInt>(ep.proxy->spec.port);
        set_optional(proxy, "login", ep.proxy->login);
        set_optional(proxy, "password", ep.proxy->password);
        connector["proxy"] = proxy;
    }

    Json::Value tls(Json::objectValue);
    tls["min_version"] = std::string(transport::http::tls_version_name(ep.tls.min_version));
    tls["max_version"] = std::string(transport::http::tls_version_name(ep.tls.max_version));
    tls["cipher_list"] = ep.tls.cipher_list;
    tls["verify_peer"] = ep.tls.verify_peer;
    tls["ca_file"]     = ep.tls.ca_file;
    connector["tls"]   = tls;
    root["connector"]  = connector;

    const auto& log = config.logging;
    Json::Value logging(Json::objectValue);
    logging["level"]         = level_string(log.level);
    logging["console"]       = log.console;
    logging["file"]          = log.file;
    logging["max_file_size"] = Json::UInt64(log.max_file_size);
    logging["max_files"]     = Json::UInt(log.max_files);
    if (!log.categories.empty()) {
        Json::Value categories(Json::objectValue);
        for (const auto& [name, level] : log.categories) {
            categories[name] = level_string(level);
        }
        logging["categories"] = categories;
    }
    root["logging"] = logging;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, root) + "\n";
}

}  // anonymous namespace

// ============================================================================
// IMPLEMENTATION
// ============================================================================

Result<std::string> ConfigLoaderImpl::read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        common::Error error(ErrorCode::CONFIG_FILE_NOT_FOUND,
                            "Configuration file not found: " + path.string());
        error.with_context("path", path.string());
        return error;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>(ErrorCode::OS_ERROR,
                                   "Failed to open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Result<void> ConfigLoaderImpl::write_file(const std::filesystem::path& path,
                                          std::string_view content) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result<void>(ErrorCode::OS_ERROR,
                                "Failed to create directory: " + parent.string());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<void>(ErrorCode::OS_ERROR,
                            "Failed to open file for writing: " + path.string());
    }

    file << content;
    if (!file.good()) {
        return Result<void>(ErrorCode::OS_ERROR, "Failed to write to file: " + path.string());
    }

    return common::ok();
}

ConfigFormat ConfigLoaderImpl::resolve_format(const std::filesystem::path& path,
                                              ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        return detect_format(path);
    }
    return format;
}

// ============================================================================
// LOADING
// ============================================================================

Result<ConnectorConfig> ConfigLoaderImpl::load(const std::filesystem::path& path,
                                               ConfigFormat format) {
    std::string content;
    WSCONN_TRY_ASSIGN(content, read_file(path));

    WSCONN_LOG_DEBUG(common::debug::category::CONFIG,
                     "Loading configuration from " << path.string());

    auto config = parse(content, resolve_format(path, format));
    if (!config) {
        common::Error error = config.error();
        error.with_context("path", path.string());
        return error;
    }
    return config;
}

Result<ConnectorConfig> ConfigLoaderImpl::parse(std::string_view content, ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        format = detect_format_from_content(content);
    }

    try {
        if (format == ConfigFormat::JSON) {
            Json::Value root;
            Json::CharReaderBuilder builder;
            std::string errors;
            std::istringstream stream{std::string{content}};

            if (!Json::parseFromStream(builder, stream, &root, &errors)) {
                return Result<ConnectorConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                               "JSON parse error: " + errors);
            }
            return parse_root(JsonSection(root));
        }

        return parse_root(YamlSection(YAML::Load(std::string(content))));
    } catch (const YAML::Exception& e) {
        return Result<ConnectorConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                       std::string("YAML parse error: ") + e.what());
    } catch (const Json::Exception& e) {
        return Result<ConnectorConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                       std::string("JSON parse error: ") + e.what());
    }
}

// ============================================================================
// SERIALIZATION
// ============================================================================

Result<std::string> ConfigLoaderImpl::serialize(const ConnectorConfig& config,
                                                ConfigFormat format) {
    try {
        if (format == ConfigFormat::JSON) {
            return serialize_json(config);
        }
        return serialize_yaml(config);
    } catch (const YAML::Exception& e) {
        return Result<std::string>(ErrorCode::CONFIG_INVALID,
                                   std::string("Serialization error: ") + e.what());
    }
}

Result<void> ConfigLoaderImpl::save(const ConnectorConfig& config,
                                    const std::filesystem::path& path, ConfigFormat format) {
    std::string content;
    WSCONN_TRY_ASSIGN(content, serialize(config, resolve_format(path, format)));
    return write_file(path, content);
}

// ============================================================================
// VALIDATION
// ============================================================================

Result<void> ConfigLoaderImpl::validate(const ConnectorConfig& config) {
    const auto& ep = config.connector;

    if (ep.url.empty()) {
        return Result<void>(ErrorCode::CONFIG_REQUIRED_MISSING, "connector.url is required");
    }
    WSCONN_TRY(transport::http::normalize_base_url(ep.url));

    if (ep.connect_timeout_ms < 0) {
        return Result<void>(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                            "connector.connect_timeout_ms must not be negative");
    }
    if (ep.read_timeout_ms < 0) {
        return Result<void>(ErrorCode::CONFIG_VALUE_OUT_OF_RANGE,
                            "connector.read_timeout_ms must not be negative");
    }

    if (ep.proxy && ep.proxy->spec.type != ProxyType::DIRECT &&
        (ep.proxy->spec.host.empty() || ep.proxy->spec.port == 0)) {
        return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                            "connector.proxy requires host and port");
    }

    if (ep.tls.min_version > ep.tls.max_version) {
        return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                            "connector.tls.min_version is above max_version");
    }

    return common::ok();
}

// ============================================================================
// APPLYING CONFIGURATION
// ============================================================================

connector::HttpConnector::Builder to_builder(const ConnectorConfig& config) {
    const auto& ep = config.connector;

    auto builder = connector::HttpConnector::new_builder();
    builder.url(ep.url)
        .user_agent(ep.user_agent)
        .connect_timeout_ms(ep.connect_timeout_ms)
        .read_timeout_ms(ep.read_timeout_ms)
        .tls(ep.tls);

    if (ep.auth.token) {
        builder.token(ep.auth.token);
    } else {
        builder.credentials(ep.auth.login, ep.auth.password);
    }

    if (ep.proxy) {
        builder.proxy(ep.proxy->spec);
        builder.proxy_credentials(ep.proxy->login, ep.proxy->password);
    }

    return builder;
}

Result<void> apply_logging(const LoggingConfig& config) {
    namespace debug = common::debug;

    std::shared_ptr<debug::FileSink> file_sink;
    if (!config.file.empty()) {
        debug::FileSink::Config file_config;
        file_config.file_path     = config.file;
        file_config.max_file_size = config.max_file_size;
        file_config.max_files     = config.max_files;

        file_sink = std::make_shared<debug::FileSink>(std::move(file_config));
        if (!file_sink->is_ready()) {
            return Result<void>(ErrorCode::OS_ERROR, "Failed to open log file: " + config.file);
        }
    }

    auto& logger = debug::Logger::instance();
    logger.clear_sinks();
    if (config.console) {
        logger.add_sink(std::make_shared<debug::ConsoleSink>());
    }
    if (file_sink) {
        logger.add_sink(file_sink);
    }

    logger.filter().reset();
    logger.set_level(config.level);
    for (const auto& [name, level] : config.categories) {
        logger.filter().set_category_level(name, level);
    }

    WSCONN_LOG_DEBUG(debug::category::CONFIG,
                     "Logging configured: level=" << debug::level_name(config.level));
    return common::ok();
}

}  // namespace wsconn::core::config
