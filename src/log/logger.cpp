//! # Logger Implementation
//!
//! Stage filter, record rendering (JSON records go through the json module),
//! console and build-log sinks, and the logger singleton.

#include "json/json_value.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace lspack::log {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Local wall-clock time of a record as "HH:MM:SS.mmm".
std::string clock_time(int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << timestamp_ms % 1000;
    return oss.str();
}

bool stderr_supports_color() {
#ifdef _WIN32
    HANDLE out = GetStdHandle(STD_ERROR_HANDLE);
    DWORD mode = 0;
    if (out == INVALID_HANDLE_VALUE || !GetConsoleMode(out, &mode))
        return false;
    return SetConsoleMode(out, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    const char* term = std::getenv("TERM");
    return isatty(fileno(stderr)) && term != nullptr && std::string_view(term) != "dumb";
#endif
}

const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

} // namespace

// ============================================================================
// Levels and Stage Tags
// ============================================================================

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

LogLevel parse_level(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        std::string name = level_name(level);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == name)
            return level;
    }
    return lower == "warning" ? LogLevel::Warn : LogLevel::Info;
}

const std::vector<std::string_view>& stage_tags() {
    static const std::vector<std::string_view> tags = {
        "build", "platform", "env", "deps", "bundle", "package", "process", "config", "container",
        "cli"};
    return tags;
}

bool is_stage_tag(std::string_view tag) {
    const auto& tags = stage_tags();
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

// ============================================================================
// Records and Sinks
// ============================================================================

std::string format_record(const LogRecord& record, LogFormat format) {
    if (format == LogFormat::JSON) {
        json::JsonValue object(json::JsonObject{});
        object.set("level", json::JsonValue(level_name(record.level)));
        object.set("module", json::JsonValue(std::string(record.module)));
        object.set("msg", json::JsonValue(record.message));
        object.set("ts", json::JsonValue(record.timestamp_ms));
        return object.to_string();
    }
    std::ostringstream oss;
    oss << clock_time(record.timestamp_ms) << " " << std::left << std::setw(5)
        << level_name(record.level) << " [" << record.module << "] " << record.message;
    return oss.str();
}

ConsoleSink::ConsoleSink(LogFormat format, bool use_colors)
    : format_(format), colors_(use_colors && format == LogFormat::Text && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    if (!colors_) {
        std::cerr << format_record(record, format_) << "\n";
        return;
    }
    std::ostringstream oss;
    oss << clock_time(record.timestamp_ms) << " " << level_color(record.level) << std::left
        << std::setw(5) << level_name(record.level) << "\033[0m [" << record.module << "] "
        << record.message << "\n";
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;
    file_ << format_record(record, format_) << "\n";
    if (record.level >= LogLevel::Error)
        file_.flush();
}

void FileSink::flush() {
    if (file_.is_open())
        file_.flush();
}

// ============================================================================
// Stage Filter
// ============================================================================

std::vector<std::string> LogFilter::parse(std::string_view spec) {
    stage_levels_.clear();
    std::vector<std::string> unknown;

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = std::min(spec.find(',', pos), spec.size());
        std::string_view token = spec.substr(pos, comma - pos);
        pos = comma + 1;
        if (token.empty())
            continue;

        size_t eq = token.find('=');
        std::string_view tag = token.substr(0, eq);
        LogLevel level = eq == std::string_view::npos ? LogLevel::Debug
                                                      : parse_level(token.substr(eq + 1));
        if (tag == "*") {
            default_level_ = level;
        } else if (is_stage_tag(tag)) {
            stage_levels_[std::string(tag)] = level;
        } else {
            unknown.emplace_back(tag);
        }
    }
    return unknown;
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = stage_levels_.find(module);
    return level >= (it != stage_levels_.end() ? it->second : default_level_);
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& [_, level] : stage_levels_) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>(LogFormat::Text, true));
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::vector<std::string> unknown;
    {
        std::lock_guard<std::mutex> lock(logger.mutex_);
        logger.filter_ = LogFilter{};
        logger.filter_.set_default_level(config.level);
        // A filter without "*=level" keeps the command-line level for other stages
        unknown = logger.filter_.parse(config.filter_spec);
        logger.threshold_ = logger.filter_.min_level();

        logger.sinks_.clear();
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.format, config.colors));
        if (!config.log_file.empty()) {
            auto file = std::make_unique<FileSink>(config.log_file, config.format);
            if (file->is_open()) {
                logger.sinks_.push_back(std::move(file));
            } else {
                std::cerr << "warning: could not open log file: " << config.log_file << "\n";
            }
        }
    }
    for (const auto& tag : unknown) {
        LSPACK_LOG_WARN("cli", "Log filter names unknown stage '" << tag << "'");
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    return level >= threshold_ && filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message) {
    LogRecord record{level, module, message, now_ms()};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = LogFilter{};
    filter_.set_default_level(level);
    threshold_ = level;
}

std::vector<std::string> Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto unknown = filter_.parse(spec);
    threshold_ = filter_.min_level();
    return unknown;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace lspack::log
