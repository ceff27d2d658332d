/**
 * @file test_error.cpp
 * @brief Unit tests for the wsconn error handling system
 *
 * Tests coverage for:
 * - ErrorCode: categories, transient and fatal classification, names
 * - Error: context, cause chains, formatting
 * - Result<T>: value and void results, propagation macros
 */

#include <gtest/gtest.h>
#include <wsconn/common/error.hpp>

#include <memory>
#include <string>

using namespace wsconn::common;

// ============================================================================
// ErrorCode Tests
// ============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, SuccessCode) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::INVALID_STATE));
}

TEST_F(ErrorCodeTest, CategoryExtraction) {
    EXPECT_EQ(get_category(ErrorCode::INVALID_ARGUMENT), ErrorCategory::GENERAL);
    EXPECT_EQ(get_category(ErrorCode::CONNECTION_REFUSED), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::TRANSPORT_FAILED), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::HTTP_ERROR_STATUS), ErrorCategory::PROTOCOL);
    EXPECT_EQ(get_category(ErrorCode::CONFIG_MALFORMED_URL), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::SECURITY_HANDSHAKE_FAILED), ErrorCategory::SECURITY);
    EXPECT_EQ(get_category(ErrorCode::OUT_OF_MEMORY), ErrorCategory::RESOURCE);
    EXPECT_EQ(get_category(ErrorCode::OS_ERROR), ErrorCategory::PLATFORM);
}

TEST_F(ErrorCodeTest, TransientErrors) {
    EXPECT_TRUE(is_transient(ErrorCode::CONNECTION_TIMEOUT));
    EXPECT_TRUE(is_transient(ErrorCode::CONNECTION_REFUSED));
    EXPECT_TRUE(is_transient(ErrorCode::READ_TIMEOUT));
    EXPECT_FALSE(is_transient(ErrorCode::CONFIG_INVALID_VALUE));
    EXPECT_FALSE(is_transient(ErrorCode::HTTP_ERROR_STATUS));
    EXPECT_FALSE(is_transient(ErrorCode::CONNECTION_FAILED));
    EXPECT_FALSE(is_transient(ErrorCode::TRANSPORT_FAILED));
}

TEST_F(ErrorCodeTest, FatalErrors) {
    EXPECT_TRUE(is_fatal(ErrorCode::OUT_OF_MEMORY));
    EXPECT_FALSE(is_fatal(ErrorCode::CONNECTION_FAILED));
}

TEST_F(ErrorCodeTest, Names) {
    EXPECT_EQ(error_name(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_EQ(error_name(ErrorCode::TRANSPORT_FAILED), "TRANSPORT_FAILED");
    EXPECT_EQ(error_name(ErrorCode::CONFIG_MALFORMED_URL), "CONFIG_MALFORMED_URL");
    EXPECT_EQ(category_name(ErrorCategory::CONFIG), "Configuration");
}

TEST_F(ErrorCodeTest, EveryCodeHasAName) {
    for (auto code : {ErrorCode::INVALID_ARGUMENT, ErrorCode::INVALID_STATE,
                      ErrorCode::CONNECTION_CLOSED, ErrorCode::DNS_RESOLUTION_FAILED,
                      ErrorCode::IO_FILE_NOT_FOUND, ErrorCode::PROXY_RESOLUTION_FAILED,
                      ErrorCode::UNSUPPORTED_PROTOCOL, ErrorCode::TOO_MANY_REDIRECTS,
                      ErrorCode::OUT_OF_MEMORY, ErrorCode::CONFIG_REQUIRED_MISSING,
                      ErrorCode::CERTIFICATE_ERROR, ErrorCode::OS_ERROR}) {
        EXPECT_NE(error_name(code), "UNKNOWN") << static_cast<uint32_t>(code);
    }
    EXPECT_EQ(error_name(static_cast<ErrorCode>(0x0908)), "UNKNOWN");
}

// ============================================================================
// Error Tests
// ============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    Error error;
    EXPECT_TRUE(error.is_success());
    EXPECT_TRUE(static_cast<bool>(error));
}

TEST_F(ErrorTest, CodeAndMessage) {
    Error error(ErrorCode::READ_TIMEOUT, "no data");
    EXPECT_TRUE(error.is_error());
    EXPECT_TRUE(error.is_transient());
    EXPECT_EQ(error.code(), ErrorCode::READ_TIMEOUT);
    EXPECT_EQ(error.message(), "no data");
    EXPECT_TRUE(error.location().is_valid());
}

TEST_F(ErrorTest, ContextLookup) {
    Error error(ErrorCode::TRANSPORT_FAILED, "Fail to request http://h/");
    error.with_context("url", "http://h/").with_context("attempt", "1");

    EXPECT_EQ(error.context("url"), "http://h/");
    EXPECT_EQ(error.context("attempt"), "1");
    EXPECT_TRUE(error.context("missing").empty());
}

TEST_F(ErrorTest, CauseChain) {
    Error root(ErrorCode::CONNECTION_REFUSED, "refused");
    Error middle(ErrorCode::CONNECTION_FAILED, "connect");
    middle.with_cause(root);
    Error top(ErrorCode::TRANSPORT_FAILED, "request");
    top.with_cause(middle);

    ASSERT_NE(top.cause(), nullptr);
    EXPECT_EQ(top.cause()->code(), ErrorCode::CONNECTION_FAILED);
    EXPECT_EQ(top.root_cause().code(), ErrorCode::CONNECTION_REFUSED);
    EXPECT_EQ(root.root_cause().code(), ErrorCode::CONNECTION_REFUSED);
}

TEST_F(ErrorTest, CopyIsDeep) {
    Error top(ErrorCode::TRANSPORT_FAILED, "request");
    top.with_cause(Error(ErrorCode::CONNECTION_REFUSED, "refused"));

    Error copy = top;
    top.with_cause(Error(ErrorCode::OS_ERROR, "replaced"));

    ASSERT_NE(copy.cause(), nullptr);
    EXPECT_EQ(copy.cause()->code(), ErrorCode::CONNECTION_REFUSED);
}

TEST_F(ErrorTest, ToStringIncludesEverything) {
    Error error(ErrorCode::TRANSPORT_FAILED, "Fail to request http://h/");
    error.with_context("url", "http://h/");
    error.with_cause(Error(ErrorCode::CONNECTION_REFUSED, "refused"));

    auto text = error.to_string();
    EXPECT_NE(text.find("TRANSPORT_FAILED"), std::string::npos);
    EXPECT_NE(text.find("Fail to request http://h/"), std::string::npos);
    EXPECT_NE(text.find("url: http://h/"), std::string::npos);
    EXPECT_NE(text.find("Caused by"), std::string::npos);
    EXPECT_NE(text.find("CONNECTION_REFUSED"), std::string::npos);
}

// ============================================================================
// Result Tests
// ============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ValueResult) {
    Result<int> result(42);
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
}

TEST_F(ResultTest, ErrorResult) {
    Result<int> result(ErrorCode::INVALID_ARGUMENT, "bad");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(result.message(), "bad");
    EXPECT_EQ(result.value_or(7), 7);
}

TEST_F(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(5));
    ASSERT_TRUE(result);
    auto owned = std::move(result).value();
    EXPECT_EQ(*owned, 5);
}

TEST_F(ResultTest, VoidResult) {
    auto success = ok();
    EXPECT_TRUE(success.is_success());

    auto failure = err(ErrorCode::OS_ERROR, "disk");
    EXPECT_TRUE(failure.is_error());
    EXPECT_EQ(failure.message(), "disk");
}

TEST_F(ResultTest, WithCause) {
    auto result = err<int>(ErrorCode::TRANSPORT_FAILED, "outer");
    result.with_cause(Error(ErrorCode::READ_TIMEOUT, "inner"));
    ASSERT_NE(result.error().cause(), nullptr);
    EXPECT_EQ(result.error().root_cause().code(), ErrorCode::READ_TIMEOUT);
}

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Result<int>(ErrorCode::INVALID_ARGUMENT, "not positive");
    }
    return value;
}

Result<std::string> describe(int value) {
    int checked = 0;
    WSCONN_TRY_ASSIGN(checked, parse_positive(value));
    return std::to_string(checked);
}

Result<void> check_both(int a, int b) {
    WSCONN_TRY(parse_positive(a));
    WSCONN_TRY(parse_positive(b));
    return ok();
}

}  // namespace

TEST_F(ResultTest, TryAssignPropagatesAcrossTypes) {
    auto good = describe(3);
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value(), "3");

    auto bad = describe(-1);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ResultTest, TryStopsAtFirstError) {
    EXPECT_TRUE(check_both(1, 2).is_success());
    EXPECT_EQ(check_both(1, 0).code(), ErrorCode::INVALID_ARGUMENT);
}
