#include <wsconn/common/debug.hpp>
#include <wsconn/common/platform.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(WSCONN_OS_POSIX)
#include <unistd.h>  // For isatty, fileno
#elif defined(WSCONN_OS_WINDOWS)
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace wsconn::common::debug {

namespace {

// Platform-safe localtime conversion
inline std::tm safe_localtime(const std::time_t* time) {
    std::tm result{};
#if defined(WSCONN_OS_WINDOWS)
    localtime_s(&result, time);
#else
    localtime_r(time, &result);
#endif
    return result;
}

void write_timestamp(std::ostream& out, std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    auto tm_result = safe_localtime(&time);
    out << std::put_time(&tm_result, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count();
}

void write_context(std::ostream& out, const LogRecord& record) {
    for (const auto& [key, value] : record.context) {
        out << ' ' << key << '=' << value;
    }
}

}  // anonymous namespace

// ============================================================================
// Log Level Parsing
// ============================================================================

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR" || upper == "ERR")
        return LogLevel::ERROR;
    if (upper == "FATAL" || upper == "CRITICAL")
        return LogLevel::FATAL;
    if (upper == "OFF" || upper == "NONE")
        return LogLevel::OFF;

    return LogLevel::INFO;
}

// ============================================================================
// LogFilter Implementation
// ============================================================================

void LogFilter::set_category_level(std::string_view category, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_[std::string(category)] = level;
}

bool LogFilter::should_log(LogLevel level, std::string_view category) const noexcept {
    if (level == LogLevel::OFF) {
        return false;
    }

    // A category override takes precedence over the global level
    if (!category.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = category_levels_.find(std::string(category));
        if (it != category_levels_.end()) {
            return level >= it->second;
        }
    }

    return level >= global_level_.load(std::memory_order_relaxed);
}

void LogFilter::reset() noexcept {
    global_level_.store(LogLevel::INFO, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

namespace {

// ANSI color codes
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD  = "\033[1m";
constexpr const char* DIM   = "\033[2m";

constexpr const char* color_for_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "\033[90m";  // Dark gray
        case LogLevel::DEBUG:
            return "\033[36m";  // Cyan
        case LogLevel::INFO:
            return "\033[32m";  // Green
        case LogLevel::WARN:
            return "\033[33m";  // Yellow
        case LogLevel::ERROR:
            return "\033[31m";  // Red
        case LogLevel::FATAL:
            return "\033[35m";  // Magenta
        default:
            return "";
    }
}

bool should_use_colors(bool use_stderr) noexcept {
#if defined(WSCONN_OS_POSIX)
    return isatty(fileno(use_stderr ? stderr : stdout)) != 0;
#else
    (void)use_stderr;
    return false;
#endif
}

}  // anonymous namespace

ConsoleSink::ConsoleSink() : ConsoleSink(Config{}) {}

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {
    if (config_.use_colors) {
        config_.use_colors = should_use_colors(config_.use_stderr);
    }
}

ConsoleSink::~ConsoleSink() {
    flush();
}

void ConsoleSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostream& out =
        (config_.use_stderr && record.level >= LogLevel::WARN) ? std::cerr : std::cout;

    if (config_.include_timestamp) {
        if (config_.use_colors)
            out << DIM;
        write_timestamp(out, record.timestamp);
        if (config_.use_colors)
            out << RESET;
        out << ' ';
    }

    if (config_.use_colors) {
        out << color_for_level(record.level) << BOLD;
    }
    out << '[' << level_char(record.level) << ']';
    if (config_.use_colors)
        out << RESET;
    out << ' ';

    if (!record.category.empty()) {
        if (config_.use_colors)
            out << "\033[34m";  // Blue
        out << '[' << record.category << ']';
        if (config_.use_colors)
            out << RESET;
        out << ' ';
    }

    if (config_.include_thread_id) {
        if (config_.use_colors)
            out << DIM;
        out << "[T:" << std::hex << record.thread_id << std::dec << ']';
        if (config_.use_colors)
            out << RESET;
        out << ' ';
    }

    out << record.message;
    write_context(out, record);

    if (config_.include_location && record.location.is_valid()) {
        if (config_.use_colors)
            out << DIM;
        out << " (" << record.location.file << ':' << record.location.line << ')';
        if (config_.use_colors)
            out << RESET;
    }

    out << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

// ============================================================================
// FileSink Implementation
// ============================================================================

struct FileSink::Impl {
    Config config;
    std::ofstream file;
    std::mutex mutex;
    size_t current_size = 0;

    bool open() {
        file.open(config.file_path, std::ios::app);
        if (file.is_open()) {
            file.seekp(0, std::ios::end);
            current_size = static_cast<size_t>(file.tellp());
            return true;
        }
        return false;
    }

    void rotate() {
        file.close();

        for (int i = static_cast<int>(config.max_files) - 1; i >= 0; --i) {
            std::string old_name = config.file_path;
            if (i > 0) {
                old_name += "." + std::to_string(i);
            }
            std::string new_name = config.file_path + "." + std::to_string(i + 1);
            std::rename(old_name.c_str(), new_name.c_str());
        }

        std::string oldest = config.file_path + "." + std::to_string(config.max_files);
        std::remove(oldest.c_str());

        current_size = 0;
        open();
    }
};

FileSink::FileSink(Config config) : impl_(std::make_unique<Impl>()) {
    impl_->config = std::move(config);
    impl_->open();
}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->file.is_open())
        return;

    std::ostringstream oss;
    write_timestamp(oss, record.timestamp);
    oss << ' ' << level_name(record.level) << ' ';
    if (!record.category.empty()) {
        oss << '[' << record.category << "] ";
    }
    oss << "[T:" << std::hex << record.thread_id << std::dec << "] ";
    oss << record.message;
    write_context(oss, record);
    if (record.location.is_valid()) {
        oss << " (" << record.location.file << ':' << record.location.line << ')';
    }
    oss << '\n';

    std::string line = oss.str();
    impl_->file << line;
    impl_->current_size += line.size();

    if (impl_->config.max_file_size > 0 && impl_->current_size >= impl_->config.max_file_size) {
        impl_->rotate();
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->file.is_open()) {
        impl_->file.flush();
    }
}

bool FileSink::is_ready() const noexcept {
    return impl_->file.is_open();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 SourceLocation loc) {
    log(level, category, std::move(message), {}, loc);
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 std::vector<std::pair<std::string, std::string>> context, SourceLocation loc) {
    if (!filter_.should_log(level, category)) {
        return;
    }

    LogRecord record;
    record.level     = level;
    record.category  = category;
    record.message   = std::move(message);
    record.location  = loc;
    record.timestamp = std::chrono::system_clock::now();
    record.thread_id = platform::get_thread_id();
    record.context   = std::move(context);

    dispatch(record);
}

void Logger::dispatch(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink && sink->is_ready()) {
            sink->write(record);
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink)
            sink->flush();
    }
}

// ============================================================================
// Span Implementation
// ============================================================================

Span::Span(std::string_view name, std::string_view category, SourceLocation loc)
    : name_(name), category_(category), location_(loc),
      start_time_(std::chrono::steady_clock::now()) {
    WSCONN_LOG_TRACE(category_, "Span started: " << name_);
}

Span::~Span() {
    auto& logger = Logger::instance();
    LogLevel level = has_error_ ? LogLevel::WARN : LogLevel::DEBUG;
    if (!logger.is_enabled(level, category_)) {
        return;
    }

    auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed()).count();

    std::ostringstream oss;
    if (has_error_) {
        oss << "Span completed with error: " << name_ << " duration=" << us << "us"
            << " error=" << error_name(error_code_);
        if (!error_message_.empty()) {
            oss << " msg=" << error_message_;
        }
    } else {
        oss << "Span completed: " << name_ << " duration=" << us << "us";
    }

    logger.log(level, category_, oss.str(), context_, location_);
}

Span& Span::add_context(std::string_view key, std::string_view value) {
    context_.emplace_back(std::string(key), std::string(value));
    return *this;
}

Span& Span::add_context(std::string_view key, int64_t value) {
    context_.emplace_back(std::string(key), std::to_string(value));
    return *this;
}

void Span::set_error(ErrorCode code, std::string_view message) {
    has_error_     = true;
    error_code_    = code;
    error_message_ = std::string(message);
}

std::chrono::nanoseconds Span::elapsed() const noexcept {
    return std::chrono::steady_clock::now() - start_time_;
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(LogLevel level) {
    Logger::instance().set_level(level);

    std::string env_level = platform::get_env("WSCONN_LOG_LEVEL");
    if (!env_level.empty()) {
        Logger::instance().set_level(parse_log_level(env_level));
    }
}

void shutdown_logging() {
    Logger::instance().flush();
    Logger::instance().clear_sinks();
}

}  // namespace wsconn::common::debug
