#include "marquee/core/logger.hpp"
#include "marquee/core/string.hpp"
#include <array>
#include <ctime>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <unistd.h>

namespace marquee {

// ============================================================================
// Global state
// ============================================================================

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    LogLevel global_level{LogLevel::Info};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

void flush_locked(LoggingState& s) {
    for (auto& sink : s.sinks) {
        sink->flush();
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char out[32];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(millis));
    return out;
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[1;31m";
        case LogLevel::Off:   break;
    }
    return "";
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    static constexpr std::array levels{
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
        LogLevel::Warn, LogLevel::Error, LogLevel::Fatal, LogLevel::Off
    };
    const std::string trimmed = trim(name);
    for (auto level : levels) {
        if (equals_ignore_case(trimmed, log_level_name(level))) {
            return level;
        }
    }
    if (equals_ignore_case(trimmed, "warning")) {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

std::string format_record(const LogRecord& record, bool with_location) {
    std::string line = format_timestamp(record.timestamp);
    line += ' ';

    std::string level(log_level_name(record.level));
    level.resize(5, ' ');
    line += level;

    if (!record.logger_name.empty()) {
        line += " [";
        line += record.logger_name;
        line += ']';
    }
    line += ' ';
    line += record.message;

    if (with_location) {
        line += format_message(" ({}:{})", record.location.file_name(), record.location.line());
    }
    return line;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink() : m_use_colors(::isatty(STDERR_FILENO) == 1) {}

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    const std::string line = format_record(record, record.level <= LogLevel::Debug);
    if (m_use_colors) {
        std::cerr << level_color(record.level) << line << "\033[0m\n";
    } else {
        std::cerr << line << '\n';
    }
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::filesystem::path& path)
    : m_file(std::fopen(path.c_str(), "a"))
{
}

FileSink::~FileSink() {
    if (m_file) {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogRecord& record) {
    if (!m_file) {
        return;
    }
    const std::string line = format_record(record, true);
    std::fprintf(m_file, "%s\n", line.c_str());
}

void FileSink::flush() {
    if (m_file) {
        std::fflush(m_file);
    }
}

// ============================================================================
// Logger
// ============================================================================

bool Logger::is_enabled(LogLevel level) const {
    if (level == LogLevel::Off || level < m_level) {
        return false;
    }
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return level >= s.global_level;
}

void Logger::log(LogLevel level, std::string_view message, std::source_location loc) {
    if (level == LogLevel::Off || level < m_level) {
        return;
    }

    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (level < s.global_level) {
        return;
    }

    const LogRecord record{
        .level = level,
        .message = message,
        .logger_name = m_name,
        .location = loc,
        .timestamp = std::chrono::system_clock::now(),
    };
    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global functions
// ============================================================================

namespace logging {

void init() {
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    init(std::move(sinks));
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.initialized) {
        return;
    }
    s.sinks = std::move(sinks);
    s.initialized = true;
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    flush_locked(s);
    s.sinks.clear();
    s.loggers.clear();
    s.initialized = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
}

LogLevel level() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.global_level;
}

Logger& get(std::string_view name) {
    auto& s = state();
    {
        std::lock_guard lock(s.mutex);
        if (s.initialized) {
            auto it = s.loggers.find(std::string(name));
            if (it != s.loggers.end()) {
                return *it->second;
            }
        }
    }

    init();

    std::lock_guard lock(s.mutex);
    auto [it, inserted] = s.loggers.try_emplace(std::string(name), nullptr);
    if (inserted) {
        it->second = std::make_unique<Logger>(name);
    }
    return *it->second;
}

void flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    flush_locked(s);
}

} // namespace logging

} // namespace marquee
