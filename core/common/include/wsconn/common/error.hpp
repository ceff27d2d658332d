#pragma once

/**
 * @file error.hpp
 * @brief Error handling system for wsconn
 *
 * This header provides:
 * - Hierarchical error codes organized by category
 * - Rich error context with source location
 * - Error propagation without masking (cause chains)
 * - Result<T> return type and propagation macros
 */

#include "platform.hpp"

#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(WSCONN_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace wsconn::common {

// ============================================================================
// ERROR CATEGORY SYSTEM
// ============================================================================

/**
 * @brief Error categories for hierarchical classification
 *
 * Categories are grouped by functional area:
 * - 0x00xx: General/Common errors
 * - 0x01xx: I/O and Connection errors
 * - 0x02xx: Protocol errors
 * - 0x03xx: Resource errors
 * - 0x04xx: Configuration errors
 * - 0x05xx: Security errors
 * - 0x0Axx: Platform-specific errors
 */
enum class ErrorCategory : uint8_t {
    GENERAL    = 0x00,
    IO         = 0x01,
    PROTOCOL   = 0x02,
    RESOURCE   = 0x03,
    CONFIG     = 0x04,
    SECURITY   = 0x05,
    PLATFORM   = 0x0A,
};

/**
 * @brief Get category name as string
 */
constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::GENERAL:    return "General";
        case ErrorCategory::IO:         return "I/O";
        case ErrorCategory::PROTOCOL:   return "Protocol";
        case ErrorCategory::RESOURCE:   return "Resource";
        case ErrorCategory::CONFIG:     return "Configuration";
        case ErrorCategory::SECURITY:   return "Security";
        case ErrorCategory::PLATFORM:   return "Platform";
        default:                        return "Unknown";
    }
}

// ============================================================================
// ERROR CODE DEFINITIONS
// ============================================================================

/**
 * @brief Error codes
 *
 * Format: 0xCCEE where CC = category, EE = specific error
 */
enum class ErrorCode : uint32_t {
    // ========== General (0x00xx) ==========
    SUCCESS             = 0x0000,
    INVALID_ARGUMENT    = 0x0003,
    INVALID_STATE       = 0x0004,

    // ========== I/O and Connection (0x01xx) ==========
    CONNECTION_FAILED   = 0x0100,
    CONNECTION_REFUSED  = 0x0101,
    CONNECTION_TIMEOUT  = 0x0103,
    CONNECTION_CLOSED   = 0x0104,
    DNS_RESOLUTION_FAILED = 0x0107,
    READ_ERROR          = 0x0109,
    WRITE_ERROR         = 0x010A,
    IO_FILE_NOT_FOUND   = 0x0111,
    READ_TIMEOUT        = 0x0114,
    PROXY_RESOLUTION_FAILED = 0x0115,
    TRANSPORT_FAILED    = 0x0116,

    // ========== Protocol (0x02xx) ==========
    PROTOCOL_ERROR      = 0x0200,
    UNSUPPORTED_PROTOCOL = 0x0206,
    TOO_MANY_REDIRECTS  = 0x020D,
    HTTP_ERROR_STATUS   = 0x020E,

    // ========== Resource (0x03xx) ==========
    OUT_OF_MEMORY       = 0x0300,

    // ========== Configuration (0x04xx) ==========
    CONFIG_INVALID      = 0x0400,
    CONFIG_PARSE_ERROR  = 0x0402,
    CONFIG_VALUE_OUT_OF_RANGE = 0x0403,
    CONFIG_REQUIRED_MISSING = 0x0405,
    CONFIG_FILE_NOT_FOUND = 0x0406,
    CONFIG_INVALID_VALUE = 0x0408,
    CONFIG_MALFORMED_URL = 0x0409,

    // ========== Security (0x05xx) ==========
    CERTIFICATE_ERROR   = 0x0502,
    SECURITY_SSL_INIT_FAILED = 0x050C,
    SECURITY_HANDSHAKE_FAILED = 0x050F,
    SECURITY_CRYPTO_ERROR = 0x0510,

    // ========== Platform (0x0Axx) ==========
    PLATFORM_ERROR      = 0x0A00,
    OS_ERROR            = 0x0A09,
};

/**
 * @brief Extract category from error code
 */
constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

/**
 * @brief Check if error code is success
 */
constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

/**
 * @brief Check if error code indicates a transient error (can retry)
 */
constexpr bool is_transient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::CONNECTION_TIMEOUT:
        case ErrorCode::CONNECTION_REFUSED:
        case ErrorCode::READ_TIMEOUT:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Check if error is fatal (unrecoverable)
 */
constexpr bool is_fatal(ErrorCode code) noexcept {
    return code == ErrorCode::OUT_OF_MEMORY;
}

/**
 * @brief Get human-readable error name
 */
constexpr std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        // General
        case ErrorCode::SUCCESS:              return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_STATE:        return "INVALID_STATE";

        // I/O
        case ErrorCode::CONNECTION_FAILED:    return "CONNECTION_FAILED";
        case ErrorCode::CONNECTION_REFUSED:   return "CONNECTION_REFUSED";
        case ErrorCode::CONNECTION_TIMEOUT:   return "CONNECTION_TIMEOUT";
        case ErrorCode::CONNECTION_CLOSED:    return "CONNECTION_CLOSED";
        case ErrorCode::DNS_RESOLUTION_FAILED: return "DNS_RESOLUTION_FAILED";
        case ErrorCode::READ_ERROR:           return "READ_ERROR";
        case ErrorCode::WRITE_ERROR:          return "WRITE_ERROR";
        case ErrorCode::IO_FILE_NOT_FOUND:    return "IO_FILE_NOT_FOUND";
        case ErrorCode::READ_TIMEOUT:         return "READ_TIMEOUT";
        case ErrorCode::PROXY_RESOLUTION_FAILED: return "PROXY_RESOLUTION_FAILED";
        case ErrorCode::TRANSPORT_FAILED:     return "TRANSPORT_FAILED";

        // Protocol
        case ErrorCode::PROTOCOL_ERROR:       return "PROTOCOL_ERROR";
        case ErrorCode::UNSUPPORTED_PROTOCOL: return "UNSUPPORTED_PROTOCOL";
        case ErrorCode::TOO_MANY_REDIRECTS:   return "TOO_MANY_REDIRECTS";
        case ErrorCode::HTTP_ERROR_STATUS:    return "HTTP_ERROR_STATUS";

        // Resource
        case ErrorCode::OUT_OF_MEMORY:        return "OUT_OF_MEMORY";

        // Configuration
        case ErrorCode::CONFIG_INVALID:       return "CONFIG_INVALID";
        case ErrorCode::CONFIG_PARSE_ERROR:   return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_VALUE_OUT_OF_RANGE: return "CONFIG_VALUE_OUT_OF_RANGE";
        case ErrorCode::CONFIG_REQUIRED_MISSING: return "CONFIG_REQUIRED_MISSING";
        case ErrorCode::CONFIG_FILE_NOT_FOUND: return "CONFIG_FILE_NOT_FOUND";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_MALFORMED_URL: return "CONFIG_MALFORMED_URL";

        // Security
        case ErrorCode::CERTIFICATE_ERROR:    return "CERTIFICATE_ERROR";
        case ErrorCode::SECURITY_SSL_INIT_FAILED: return "SECURITY_SSL_INIT_FAILED";
        case ErrorCode::SECURITY_HANDSHAKE_FAILED: return "SECURITY_HANDSHAKE_FAILED";
        case ErrorCode::SECURITY_CRYPTO_ERROR: return "SECURITY_CRYPTO_ERROR";

        // Platform
        case ErrorCode::PLATFORM_ERROR:       return "PLATFORM_ERROR";
        case ErrorCode::OS_ERROR:             return "OS_ERROR";

        default:                              return "UNKNOWN";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

/**
 * @brief Source location information for error tracking
 */
struct SourceLocation {
    const char* file = "";
    const char* function = "";
    uint32_t line = 0;
    uint32_t column = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_,
                             uint32_t line_, uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(WSCONN_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name())
        , function(loc.function_name())
        , line(loc.line())
        , column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept {
        return SourceLocation();
    }
#endif

    constexpr bool is_valid() const noexcept {
        return line > 0 && file[0] != '\0';
    }
};

#if defined(WSCONN_HAS_SOURCE_LOCATION)
    #define WSCONN_CURRENT_LOCATION ::wsconn::common::SourceLocation::current()
#else
    #define WSCONN_CURRENT_LOCATION ::wsconn::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR CONTEXT
// ============================================================================

/**
 * @brief Rich error information with context
 */
class Error {
public:
    Error() noexcept = default;

    Error(ErrorCode code) noexcept
        : code_(code) {}

    Error(ErrorCode code, std::string_view message,
          SourceLocation loc = WSCONN_CURRENT_LOCATION)
        : code_(code), message_(message), location_(loc) {}

    // Copy constructor (deep copy cause chain)
    Error(const Error& other)
        : code_(other.code_)
        , message_(other.message_)
        , location_(other.location_)
        , context_(other.context_) {
        if (other.cause_) {
            cause_ = std::make_unique<Error>(*other.cause_);
        }
    }

    Error(Error&& other) noexcept = default;

    // Copy assignment (deep copy cause chain)
    Error& operator=(const Error& other) {
        if (this != &other) {
            code_ = other.code_;
            message_ = other.message_;
            location_ = other.location_;
            context_ = other.context_;
            if (other.cause_) {
                cause_ = std::make_unique<Error>(*other.cause_);
            } else {
                cause_.reset();
            }
        }
        return *this;
    }

    Error& operator=(Error&& other) noexcept = default;

    // Accessors
    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    const SourceLocation& location() const noexcept { return location_; }

    // Status checks
    bool is_success() const noexcept { return wsconn::common::is_success(code_); }
    bool is_error() const noexcept { return !is_success(); }
    bool is_transient() const noexcept { return wsconn::common::is_transient(code_); }
    bool is_fatal() const noexcept { return wsconn::common::is_fatal(code_); }

    explicit operator bool() const noexcept { return is_success(); }

    // Get formatted error string
    std::string to_string() const;

    // Chain errors (for error wrapping)
    Error& with_cause(Error cause) {
        cause_ = std::make_unique<Error>(std::move(cause));
        return *this;
    }

    const Error* cause() const noexcept { return cause_.get(); }

    /**
     * @brief Innermost error of the cause chain (this error if it has no cause)
     */
    const Error& root_cause() const noexcept;

    // Context addition
    Error& with_context(std::string_view key, std::string_view value);

    /**
     * @brief Look up a context value by key
     * @return Empty view when the key is absent
     */
    std::string_view context(std::string_view key) const noexcept;

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::unique_ptr<Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT TYPE
// ============================================================================

/**
 * @brief Result type carrying either a value or an Error
 */
template<typename T = void>
class Result;

// Specialization for void
template<>
class Result<void> {
public:
    // Success
    Result() noexcept = default;

    // Error from code
    Result(ErrorCode code) noexcept : error_(code) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = WSCONN_CURRENT_LOCATION)
        : error_(code, message, loc) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)) {}

    // Status
    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Error access
    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    // Chain errors
    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

private:
    Error error_;
};

// Specialization for non-void types
template<typename T>
class Result {
public:
    // Success with value
    Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(true) {
        new (&storage_) T(std::move(value));
    }

    // Error from code
    Result(ErrorCode code) noexcept : error_(code), has_value_(false) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = WSCONN_CURRENT_LOCATION)
        : error_(code, message, loc), has_value_(false) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)), has_value_(false) {}

    Result(const Result& other) : error_(other.error_), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(other.value_ref());
        }
    }

    Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : error_(std::move(other.error_)), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(std::move(other.value_ref()));
        }
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy_value();
            error_ = other.error_;
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(other.value_ref());
            }
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            destroy_value();
            error_ = std::move(other.error_);
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(std::move(other.value_ref()));
            }
        }
        return *this;
    }

    ~Result() {
        destroy_value();
    }

    // Status
    bool is_success() const noexcept { return has_value_; }
    bool is_error() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return is_success(); }

    // Value access (only call if is_success())
    T& value() & noexcept { return value_ref(); }
    const T& value() const& noexcept { return value_ref(); }
    T&& value() && noexcept { return std::move(value_ref()); }

    T value_or(T default_value) const& {
        return has_value_ ? value_ref() : std::move(default_value);
    }

    T value_or(T default_value) && {
        return has_value_ ? std::move(value_ref()) : std::move(default_value);
    }

    // Error access
    ErrorCode code() const noexcept { return has_value_ ? ErrorCode::SUCCESS : error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    // Chain errors
    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

private:
    alignas(T) unsigned char storage_[sizeof(T)];
    Error error_;
    bool has_value_;

    T& value_ref() noexcept {
        return *std::launder(reinterpret_cast<T*>(&storage_));
    }

    const T& value_ref() const noexcept {
        return *std::launder(reinterpret_cast<const T*>(&storage_));
    }

    void destroy_value() noexcept {
        if (has_value_) {
            value_ref().~T();
            has_value_ = false;
        }
    }
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Create a success Result
 */
template<typename T>
Result<T> ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> ok() {
    return Result<void>();
}

/**
 * @brief Create an error Result
 */
template<typename T = void>
Result<T> err(ErrorCode code,
              std::string_view message = {},
              SourceLocation loc = WSCONN_CURRENT_LOCATION) {
    return Result<T>(code, message, loc);
}

/**
 * @brief Create an error Result from Error object
 */
template<typename T = void>
Result<T> err(Error error) {
    return Result<T>(std::move(error));
}

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Return the error early if the result failed
 *
 * Works across Result types: the Error converts into the enclosing function's
 * Result.
 *
 * Usage: WSCONN_TRY(some_function_returning_result());
 */
#define WSCONN_TRY(expr)                                            \
    do {                                                            \
        auto _wsconn_result = (expr);                               \
        if (WSCONN_UNLIKELY(_wsconn_result.is_error())) {           \
            return _wsconn_result.error();                          \
        }                                                           \
    } while (0)

/**
 * @brief Assign value or return error
 *
 * Usage: WSCONN_TRY_ASSIGN(var, some_function_returning_result());
 */
#define WSCONN_TRY_ASSIGN(var, expr)                                \
    auto _wsconn_try_##var = (expr);                                \
    if (WSCONN_UNLIKELY(_wsconn_try_##var.is_error())) {            \
        return _wsconn_try_##var.error();                           \
    }                                                               \
    var = std::move(_wsconn_try_##var).value()

}  // namespace wsconn::common
