/**
 * @file test_connector_builder.cpp
 * @brief Tests for HttpConnector::Builder validation
 *
 * Tests cover:
 * - Required and malformed URLs
 * - Base URL normalization (trailing slash)
 * - Default and custom timeouts
 * - Invalid timeouts, TLS ranges, proxies and header values
 * - Credentials precedence between login/password and token
 */

#include <wsconn/connector/connector_error.hpp>
#include <wsconn/connector/http_connector.hpp>

#include <chrono>
#include <string>

#include <gtest/gtest.h>

using namespace wsconn::common;
using namespace wsconn::connector;
using namespace wsconn::transport::http;
using namespace std::chrono_literals;

class ConnectorBuilderTest : public ::testing::Test {};

TEST_F(ConnectorBuilderTest, UrlIsRequired) {
    auto result = HttpConnector::new_builder().build();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_REQUIRED_MISSING);
    EXPECT_EQ(result.message(), "Server URL is not defined");
    EXPECT_TRUE(is_configuration_error(result.error()));
}

TEST_F(ConnectorBuilderTest, EmptyUrlIsRequired) {
    auto result = HttpConnector::new_builder().url("").build();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_REQUIRED_MISSING);
}

TEST_F(ConnectorBuilderTest, MalformedUrl) {
    for (const char* url : {"localhost:9000", "ftp://localhost", "http://", "not a url"}) {
        auto result = HttpConnector::new_builder().url(url).build();
        ASSERT_TRUE(result.is_error()) << url;
        EXPECT_EQ(result.code(), ErrorCode::CONFIG_MALFORMED_URL) << url;
        EXPECT_TRUE(is_configuration_error(result.error()));
    }
}

TEST_F(ConnectorBuilderTest, BaseUrlGetsTrailingSlash) {
    auto without = HttpConnector::new_builder().url("http://localhost:9000/sonar").build();
    auto with    = HttpConnector::new_builder().url("http://localhost:9000/sonar/").build();

    ASSERT_TRUE(without.is_success());
    ASSERT_TRUE(with.is_success());
    EXPECT_EQ(without.value().base_url(), "http://localhost:9000/sonar/");
    EXPECT_EQ(with.value().base_url(), "http://localhost:9000/sonar/");
}

TEST_F(ConnectorBuilderTest, DefaultTimeouts) {
    auto result = HttpConnector::new_builder().url("http://localhost:9000").build();

    ASSERT_TRUE(result.is_success());
    const auto& options = result.value().transport_options();
    EXPECT_EQ(options.connect_timeout, 30000ms);
    EXPECT_EQ(options.read_timeout, 60000ms);
    EXPECT_FALSE(options.proxy.has_value());
    EXPECT_EQ(options.tls.min_version, TlsVersion::TLS_1_0);
    EXPECT_EQ(options.tls.max_version, TlsVersion::TLS_1_2);
}

TEST_F(ConnectorBuilderTest, CustomTimeouts) {
    auto result = HttpConnector::new_builder()
                      .url("http://localhost:9000")
                      .connect_timeout_ms(0)
                      .read_timeout_ms(1234)
                      .build();

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value().transport_options().connect_timeout, 0ms);
    EXPECT_EQ(result.value().transport_options().read_timeout, 1234ms);
}

TEST_F(ConnectorBuilderTest, NegativeTimeoutsAreRejected) {
    auto connect =
        HttpConnector::new_builder().url("http://localhost").connect_timeout_ms(-1).build();
    auto read = HttpConnector::new_builder().url("http://localhost").read_timeout_ms(-5).build();

    ASSERT_TRUE(connect.is_error());
    EXPECT_EQ(connect.code(), ErrorCode::CONFIG_INVALID_VALUE);
    ASSERT_TRUE(read.is_error());
    EXPECT_EQ(read.code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConnectorBuilderTest, InvertedTlsRangeIsRejected) {
    TlsPolicy policy;
    policy.min_version = TlsVersion::TLS_1_2;
    policy.max_version = TlsVersion::TLS_1_0;

    auto result = HttpConnector::new_builder().url("https://localhost").tls(policy).build();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConnectorBuilderTest, IncompleteProxyIsRejected) {
    auto no_host =
        HttpConnector::new_builder().url("http://localhost").proxy(ProxySpec::http("", 3128)).build();
    auto no_port = HttpConnector::new_builder()
                       .url("http://localhost")
                       .proxy(ProxySpec::http("proxy", 0))
                       .build();

    EXPECT_EQ(no_host.code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(no_port.code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConnectorBuilderTest, DirectProxyNeedsNoHost) {
    auto result =
        HttpConnector::new_builder().url("http://localhost").proxy(ProxySpec::direct()).build();

    ASSERT_TRUE(result.is_success());
    ASSERT_TRUE(result.value().transport_options().proxy.has_value());
    EXPECT_EQ(result.value().transport_options().proxy->type, ProxyType::DIRECT);
}

TEST_F(ConnectorBuilderTest, UserAgentWithLineBreakIsRejected) {
    auto result = HttpConnector::new_builder()
                      .url("http://localhost")
                      .user_agent("agent\r\nX-Injected: 1")
                      .build();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConnectorBuilderTest, UserAgentIsKept) {
    auto result =
        HttpConnector::new_builder().url("http://localhost").user_agent("scanner/2.0").build();

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value().user_agent(), "scanner/2.0");
}

TEST_F(ConnectorBuilderTest, BuilderOptionsMirrorSettings) {
    auto builder = HttpConnector::new_builder()
                       .url("http://localhost")
                       .connect_timeout_ms(10)
                       .proxy(ProxySpec::socks5("socks.local", 1080));

    auto options = builder.transport_options();
    EXPECT_EQ(options.connect_timeout, 10ms);
    ASSERT_TRUE(options.proxy.has_value());
    EXPECT_EQ(options.proxy->type, ProxyType::SOCKS5);
    EXPECT_EQ(options.proxy->host, "socks.local");
    EXPECT_EQ(options.proxy->port, 1080);
}

TEST_F(ConnectorBuilderTest, BuildIsRepeatable) {
    auto builder = HttpConnector::new_builder().url("http://localhost:9000");

    auto first  = builder.build();
    auto second = builder.build();
    ASSERT_TRUE(first.is_success());
    ASSERT_TRUE(second.is_success());
    EXPECT_EQ(first.value().base_url(), second.value().base_url());
}
