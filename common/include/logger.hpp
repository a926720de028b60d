#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <fstream>
#include <chrono>
#include <format>
#include <optional>
#include <source_location>
#include <filesystem>

namespace mailprobe {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5
};

std::optional<LogLevel> parse_log_level(std::string_view name);

struct LoggerOptions {
    LogLevel level = LogLevel::Info;
    bool console = true;
    std::filesystem::path file;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

// Log sink shared by the session, the actions and the front end.
// Instances are handed around explicitly; there is no process-wide logger.
class Logger {
public:
    Logger() = default;
    explicit Logger(const LoggerOptions& options);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::shared_ptr<Logger> create(const LoggerOptions& options);

    // Logger that drops every message, for library users that pass none.
    static std::shared_ptr<Logger> null();

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_ && (console_ || file_stream_.is_open()); }

    template<typename... Args>
    void log(LogLevel level, const std::source_location& loc,
             std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level)) return;

        std::string message = std::format(fmt, std::forward<Args>(args)...);
        write(level, loc, message);
    }

    void trace(std::string_view msg, const std::source_location& loc = std::source_location::current());
    void debug(std::string_view msg, const std::source_location& loc = std::source_location::current());
    void info(std::string_view msg, const std::source_location& loc = std::source_location::current());
    void warning(std::string_view msg, const std::source_location& loc = std::source_location::current());
    void error(std::string_view msg, const std::source_location& loc = std::source_location::current());
    void fatal(std::string_view msg, const std::source_location& loc = std::source_location::current());

private:
    void open_file(const std::filesystem::path& file);
    void write(LogLevel level, const std::source_location& loc, const std::string& message);
    void rotate_if_needed();
    std::string level_to_string(LogLevel level) const;
    std::string get_timestamp() const;

    LogLevel level_ = LogLevel::Info;
    bool console_ = true;
    std::filesystem::path log_file_;
    std::ofstream file_stream_;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    size_t current_size_ = 0;
    std::mutex mutex_;
};

// Convenience macros, `logger` is a Logger reference
#define LOG_TRACE(logger, msg) (logger).trace(msg)
#define LOG_DEBUG(logger, msg) (logger).debug(msg)
#define LOG_INFO(logger, msg) (logger).info(msg)
#define LOG_WARNING(logger, msg) (logger).warning(msg)
#define LOG_ERROR(logger, msg) (logger).error(msg)
#define LOG_FATAL(logger, msg) (logger).fatal(msg)

// Format macros
#define LOG_TRACE_FMT(logger, fmt, ...) \
    (logger).log(mailprobe::LogLevel::Trace, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_DEBUG_FMT(logger, fmt, ...) \
    (logger).log(mailprobe::LogLevel::Debug, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_INFO_FMT(logger, fmt, ...) \
    (logger).log(mailprobe::LogLevel::Info, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_WARNING_FMT(logger, fmt, ...) \
    (logger).log(mailprobe::LogLevel::Warning, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_ERROR_FMT(logger, fmt, ...) \
    (logger).log(mailprobe::LogLevel::Error, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_FATAL_FMT(logger, fmt, ...) \
    (logger).log(mailprobe::LogLevel::Fatal, std::source_location::current(), fmt, __VA_ARGS__)

}  // namespace mailprobe
