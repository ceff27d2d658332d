#pragma once

/**
 * @file debug.hpp
 * @brief Debug and logging system for wsconn
 *
 * Features:
 * - Hierarchical log levels
 * - Category-based filtering
 * - Automatic source location capture
 * - Scope-based timing (spans)
 * - Thread-safe logging
 * - No message formatting when a level is disabled
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace wsconn::common::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    TRACE = 0,  // Finest granularity, very verbose
    DEBUG = 1,  // Debugging information
    INFO  = 2,  // Informational messages
    WARN  = 3,  // Warning conditions
    ERROR = 4,  // Error conditions
    FATAL = 5,  // Fatal errors
    OFF   = 6   // Logging disabled
};

/**
 * @brief Get log level name
 */
constexpr std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Get short level name (1 char)
 */
constexpr char level_char(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return 'T';
        case LogLevel::DEBUG:
            return 'D';
        case LogLevel::INFO:
            return 'I';
        case LogLevel::WARN:
            return 'W';
        case LogLevel::ERROR:
            return 'E';
        case LogLevel::FATAL:
            return 'F';
        default:
            return '?';
    }
}

/**
 * @brief Parse log level from string (case-insensitive, INFO if unknown)
 */
WSCONN_API LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LOG CATEGORIES
// ============================================================================

/**
 * @brief Predefined log categories for filtering
 */
namespace category {
constexpr std::string_view GENERAL   = "general";
constexpr std::string_view TRANSPORT = "transport";
constexpr std::string_view CONNECTOR = "connector";
constexpr std::string_view CONFIG    = "config";
constexpr std::string_view SECURITY  = "security";
}  // namespace category

// ============================================================================
// LOG RECORD
// ============================================================================

/**
 * @brief A single log entry with all context
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;

    std::chrono::system_clock::time_point timestamp;

    uint64_t thread_id = 0;

    // Additional context (key-value pairs)
    std::vector<std::pair<std::string, std::string>> context;
};

// ============================================================================
// LOG SINK INTERFACE
// ============================================================================

/**
 * @brief Interface for log output destinations
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;

    /**
     * @brief Check if sink is ready to accept logs
     */
    virtual bool is_ready() const noexcept = 0;
};

// ============================================================================
// BUILT-IN LOG SINKS
// ============================================================================

/**
 * @brief Console log sink with optional color support
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool use_colors        = true;
        bool use_stderr        = true;  // Use stderr for warnings and errors
        bool include_timestamp = true;
        bool include_thread_id = true;
        bool include_location  = false;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * @brief File log sink with size-based rotation
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string file_path;
        size_t max_file_size = 10 * 1024 * 1024;  // 10MB
        uint32_t max_files   = 5;
    };

    explicit FileSink(Config config);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Callback-based sink for custom handling
 */
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    void write(const LogRecord& record) override {
        if (callback_)
            callback_(record);
    }

    void flush() override {}
    bool is_ready() const noexcept override { return callback_ != nullptr; }

private:
    Callback callback_;
};

// ============================================================================
// LOG FILTER
// ============================================================================

/**
 * @brief Log filtering configuration
 */
class LogFilter {
public:
    LogFilter() = default;

    void set_level(LogLevel level) noexcept { global_level_ = level; }
    LogLevel level() const noexcept { return global_level_.load(std::memory_order_relaxed); }

    /**
     * @brief Set level for specific category
     */
    void set_category_level(std::string_view category, LogLevel level);

    /**
     * @brief Check if a log should be emitted
     */
    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /**
     * @brief Reset all filters to defaults
     */
    void reset() noexcept;

private:
    std::atomic<LogLevel> global_level_{LogLevel::INFO};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LogLevel> category_levels_;
};

// ============================================================================
// LOGGER
// ============================================================================

/**
 * @brief Thread-safe logger with multiple sinks
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& instance() noexcept;

    void add_sink(std::shared_ptr<ILogSink> sink);

    /**
     * @brief Remove all sinks
     */
    void clear_sinks();

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }

    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    /**
     * @brief Check if logging is enabled for level/category
     */
    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = WSCONN_CURRENT_LOCATION);

    void log(LogLevel level, std::string_view category, std::string message,
             std::vector<std::pair<std::string, std::string>> context, SourceLocation loc);

    void flush();

private:
    Logger();
    ~Logger();

    void dispatch(const LogRecord& record);

    LogFilter filter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

// ============================================================================
// SPAN (TIMING SCOPE)
// ============================================================================

/**
 * @brief RAII scope for timing operations and logging duration
 *
 * Logs completion at DEBUG, or at WARN when set_error() was called.
 */
class Span {
public:
    Span(std::string_view name, std::string_view category = category::GENERAL,
         SourceLocation loc = WSCONN_CURRENT_LOCATION);

    ~Span();

    Span(const Span&)            = delete;
    Span& operator=(const Span&) = delete;

    /**
     * @brief Add key-value context to span
     */
    Span& add_context(std::string_view key, std::string_view value);
    Span& add_context(std::string_view key, int64_t value);

    /**
     * @brief Mark span as failed
     */
    void set_error(ErrorCode code, std::string_view message = {});

    std::chrono::nanoseconds elapsed() const noexcept;

private:
    std::string name_;
    std::string_view category_;
    SourceLocation location_;

    std::chrono::steady_clock::time_point start_time_;
    std::vector<std::pair<std::string, std::string>> context_;

    bool has_error_       = false;
    ErrorCode error_code_ = ErrorCode::SUCCESS;
    std::string error_message_;
};

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define WSCONN_LOG_ENABLED(level) \
    ::wsconn::common::debug::Logger::instance().is_enabled(::wsconn::common::debug::LogLevel::level)

#define WSCONN_LOG_IMPL(level, category, ...)                                                     \
    do {                                                                                          \
        auto& _wsconn_logger = ::wsconn::common::debug::Logger::instance();                       \
        if (_wsconn_logger.is_enabled(::wsconn::common::debug::LogLevel::level, category)) {      \
            std::ostringstream _wsconn_oss;                                                       \
            _wsconn_oss << __VA_ARGS__;                                                           \
            _wsconn_logger.log(::wsconn::common::debug::LogLevel::level, category,                \
                               _wsconn_oss.str(), WSCONN_CURRENT_LOCATION);                       \
        }                                                                                         \
    } while (0)

#define WSCONN_LOG_TRACE(cat, ...) WSCONN_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define WSCONN_LOG_DEBUG(cat, ...) WSCONN_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define WSCONN_LOG_INFO(cat, ...)  WSCONN_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define WSCONN_LOG_WARN(cat, ...)  WSCONN_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define WSCONN_LOG_ERROR(cat, ...) WSCONN_LOG_IMPL(ERROR, cat, __VA_ARGS__)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Initialize the logging system
 *
 * The WSCONN_LOG_LEVEL environment variable overrides @p level.
 */
WSCONN_API void init_logging(LogLevel level = LogLevel::INFO);

/**
 * @brief Flush and detach all sinks
 */
WSCONN_API void shutdown_logging();

}  // namespace wsconn::common::debug
