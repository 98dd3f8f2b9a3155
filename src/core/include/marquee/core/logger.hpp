#pragma once

#include "types.hpp"
#include <fmt/format.h>
#include <concepts>
#include <string>
#include <string_view>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

namespace marquee {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Case-insensitive; accepts the names produced by log_level_name.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Message formatting (fmt syntax, format strings checked at compile time)
// ============================================================================

template<typename... Args>
[[nodiscard]] std::string format_message(fmt::format_string<Args...> format, Args&&... args) {
    return fmt::format(format, std::forward<Args>(args)...);
}

// Format string that also records where the logging call was written.
template<typename... Args>
struct FormatAt {
    template<typename S>
        requires std::convertible_to<const S&, std::string_view>
    consteval FormatAt(const S& text,
                       std::source_location loc = std::source_location::current())
        : format(text), location(loc) {}

    fmt::format_string<Args...> format;
    std::source_location location;
};

// ============================================================================
// Log record and sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    std::source_location location;
    std::chrono::system_clock::time_point timestamp;
};

// "2026-01-31 12:00:00.123 WARN  [fonts] message", plus " (file:line)" when
// `with_location` is set
[[nodiscard]] std::string format_record(const LogRecord& record, bool with_location);

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Everything goes to stderr; stdout is left to the tools.
class ConsoleSink : public LogSink {
public:
    ConsoleSink();
    explicit ConsoleSink(bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends to a file; every record carries its source location.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::filesystem::path& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::FILE* m_file{nullptr};
};

// ============================================================================
// Logger - a named channel ("fonts", "image", "render", ...)
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name) : m_name(name) {}

    void log(LogLevel level, std::string_view message,
             std::source_location loc = std::source_location::current());

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Trace, msg, loc);
    }
    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Debug, msg, loc);
    }
    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Info, msg, loc);
    }
    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Warn, msg, loc);
    }
    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log(LogLevel::Error, msg, loc);
    }

    // Formatting is skipped entirely when the level is filtered out
    template<typename... Args>
    void debug_fmt(FormatAt<std::type_identity_t<Args>...> format, Args&&... args) {
        log_fmt(LogLevel::Debug, format.location, format.format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(FormatAt<std::type_identity_t<Args>...> format, Args&&... args) {
        log_fmt(LogLevel::Info, format.location, format.format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(FormatAt<std::type_identity_t<Args>...> format, Args&&... args) {
        log_fmt(LogLevel::Warn, format.location, format.format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(FormatAt<std::type_identity_t<Args>...> format, Args&&... args) {
        log_fmt(LogLevel::Error, format.location, format.format, std::forward<Args>(args)...);
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    // Checks both this logger's level and the global one
    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    template<typename... Args>
    void log_fmt(LogLevel level, const std::source_location& loc,
                 fmt::format_string<Args...> format, Args&&... args) {
        if (is_enabled(level)) {
            log(level, fmt::format(format, std::forward<Args>(args)...), loc);
        }
    }

    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Global logging state
//
// Sinks and named loggers live until shutdown(). Loggers returned by get()
// must not be held across a shutdown().
// ============================================================================

namespace logging {

// Console sink on stderr; no-op when already initialized
void init();
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops every sink and logger
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Named logger, created on first use (initializes logging if needed)
[[nodiscard]] Logger& get(std::string_view name);

void flush();

} // namespace logging

} // namespace marquee
