//! # lspack Logging
//!
//! Pipeline logging tagged by stage. Every record carries one of the stage
//! tags below, and `--log-filter` / `LSPACK_LOG` select levels per stage.
//!
//! | Tag         | Emitted by                                   |
//! |-------------|----------------------------------------------|
//! | `build`     | orchestrator progress and failures           |
//! | `platform`  | target resolution and host inspection        |
//! | `env`       | isolated environment creation, build locks   |
//! | `deps`      | acquisition strategies and fallbacks         |
//! | `bundle`    | manifest collection and exclusions           |
//! | `package`   | freezer and platform packagers               |
//! | `process`   | child processes (timeouts, job objects)      |
//! | `config`    | `lspack.toml` loading                        |
//! | `container` | Dockerfile generation and image builds       |
//! | `cli`       | command front end                            |
//!
//! ## Usage
//!
//! ```cpp
//! LSPACK_LOG_INFO("deps", "Installing " << spec.name << " via " << strategy);
//! LSPACK_LOG_WARN("platform", "Unknown architecture '" << machine << "', assuming x86_64");
//! ```

#ifndef LSPACK_LOG_HPP
#define LSPACK_LOG_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace lspack::log {

// ============================================================================
// Levels and Stage Tags
// ============================================================================

enum class LogLevel : int { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

const char* level_name(LogLevel level);

/// Parses a level name (any case, "warning" accepted). Unknown names map to Info.
LogLevel parse_level(std::string_view s);

/// Tags listed in the table above.
const std::vector<std::string_view>& stage_tags();

bool is_stage_tag(std::string_view tag);

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< One of `stage_tags()`, always a literal
    std::string message;
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [stage] message"
    JSON  ///< One object per line: level, module, msg, ts
};

/// Renders a record without a trailing newline.
std::string format_record(const LogRecord& record, LogFormat format);

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// stderr, with the level colored when stderr is a capable terminal.
class ConsoleSink : public LogSink {
public:
    ConsoleSink(LogFormat format, bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    LogFormat format_;
    bool colors_;
};

/// Build log file given with `--log-file`. Flushed after Error and Fatal.
class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogFormat format, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

// ============================================================================
// Stage Filter
// ============================================================================

/// Per-stage levels from specs like "deps=debug,package=trace,*=warn".
class LogFilter {
public:
    /// Applies `spec` and returns the tags it named that no stage uses.
    /// Those entries are ignored.
    std::vector<std::string> parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any stage lets through.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> stage_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty = console only
    bool colors = true;
};

/// Process-wide logger. Before `init()` it writes Info and above to stderr.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, const std::string& message);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Drops every sink (tests capture output this way).
    void clear_sinks();

    /// Sets one level for every stage.
    void set_level(LogLevel level);

    /// Replaces the per-stage levels; unknown tags are returned.
    std::vector<std::string> set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogFilter filter_;
    LogLevel threshold_ = LogLevel::Info;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads --log-level=, --log-filter=, --log-file=, --log-format=, -v/-vv and
/// -q from argv, falling back to the LSPACK_LOG environment variable (a level
/// or a filter spec). Default level is Info, which shows build progress.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

#define LSPACK_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        auto& logger_ = ::lspack::log::Logger::instance();                                         \
        if (logger_.should_log(level, module_str)) {                                               \
            std::ostringstream oss_;                                                               \
            oss_ << msg;                                                                           \
            logger_.log(level, module_str, oss_.str());                                            \
        }                                                                                          \
    } while (0)

#define LSPACK_LOG_TRACE(module, msg) LSPACK_LOG_IMPL(::lspack::log::LogLevel::Trace, module, msg)
#define LSPACK_LOG_DEBUG(module, msg) LSPACK_LOG_IMPL(::lspack::log::LogLevel::Debug, module, msg)
#define LSPACK_LOG_INFO(module, msg) LSPACK_LOG_IMPL(::lspack::log::LogLevel::Info, module, msg)
#define LSPACK_LOG_WARN(module, msg) LSPACK_LOG_IMPL(::lspack::log::LogLevel::Warn, module, msg)
#define LSPACK_LOG_ERROR(module, msg) LSPACK_LOG_IMPL(::lspack::log::LogLevel::Error, module, msg)
#define LSPACK_LOG_FATAL(module, msg) LSPACK_LOG_IMPL(::lspack::log::LogLevel::Fatal, module, msg)

} // namespace lspack::log

#endif // LSPACK_LOG_HPP
