/**
 * @file basic_connector_example.cpp
 * @brief Call one web-service endpoint and print the response
 *
 * Usage:
 *   wsconn_basic_example [config.yaml|config.json] [path]
 *
 * Without a configuration file the server URL is read from WSCONN_URL
 * (default http://localhost:9000) and an optional WSCONN_TOKEN is used for
 * authentication. The path defaults to "api/system/status".
 */

#include <wsconn/common/debug.hpp>
#include <wsconn/common/platform.hpp>
#include <wsconn/connector/connector_error.hpp>
#include <wsconn/connector/http_connector.hpp>
#include <wsconn/core/config/config_loader.hpp>

#include <iostream>
#include <string>

using namespace wsconn;

namespace {

common::Result<connector::HttpConnector::Builder> builder_from_file(const std::string& path) {
    auto loader = core::config::create_config_loader();

    core::config::ConnectorConfig config;
    WSCONN_TRY_ASSIGN(config, loader->load(path));
    WSCONN_TRY(loader->validate(config));
    WSCONN_TRY(core::config::apply_logging(config.logging));

    return core::config::to_builder(config);
}

connector::HttpConnector::Builder builder_from_env() {
    std::string url = common::platform::get_env("WSCONN_URL");
    if (url.empty()) {
        url = "http://localhost:9000";
    }

    auto builder = connector::HttpConnector::new_builder().url(url).user_agent(
        "wsconn-example/1.0");

    std::string token = common::platform::get_env("WSCONN_TOKEN");
    if (!token.empty()) {
        builder.token(token);
    }
    return builder;
}

void report(const common::Error& error) {
    std::cerr << connector::error_kind_name(connector::classify(error)) << ": "
              << error.to_string() << std::endl;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    common::debug::init_logging();

    std::string config_path = argc > 1 ? argv[1] : "";
    std::string path        = argc > 2 ? argv[2] : "api/system/status";

    connector::HttpConnector::Builder builder;
    if (config_path.empty()) {
        builder = builder_from_env();
    } else {
        auto loaded = builder_from_file(config_path);
        if (!loaded) {
            report(loaded.error());
            return 1;
        }
        builder = std::move(loaded).value();
    }

    auto built = builder.build();
    if (!built) {
        report(built.error());
        return 1;
    }
    const auto& http = built.value();

    auto response = http.call(connector::GetRequest(path));
    if (!response) {
        report(response.error());
        return 2;
    }

    auto& result = response.value();
    std::cout << "GET " << result.request_url() << " -> " << result.code() << std::endl;

    auto body = result.content();
    if (!body) {
        report(body.error());
        return 2;
    }
    std::cout << body.value() << std::endl;

    auto stats = http.stats();
    std::cout << "requests=" << stats.requests_sent
              << " avg_latency_us=" << stats.avg_request_time_us() << std::endl;

    return result.is_successful() ? 0 : 3;
}
