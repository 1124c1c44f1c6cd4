//! # tyfix Logging
//!
//! Leveled, module-tagged logging used across the engine.
//!
//! - Levels Trace..Fatal, plus Off
//! - Module tags for per-component filtering (`coerce`, `convert`, `fix`,
//!   `traits`, `diag`, `cli`)
//! - Pluggable sinks (console, null, fan-out)
//! - Compile-time elision via TYFIX_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! TYFIX_LOG_DEBUG("coerce", "coercion sequence of " << ty << " has " << n << " steps");
//! TYFIX_LOG_WARN("traits", "deref chain cut off at depth " << depth);
//! ```

#ifndef TYFIX_LOG_HPP
#define TYFIX_LOG_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tyfix::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
auto level_name(LogLevel level) -> const char*;

/// Parses a level name (lower or upper case). Unrecognized names yield Info.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record & Sinks
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "coerce")
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for console records.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Abstract log output destination.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes records to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
    LogFormat format_;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Formats a record as a single text line (no trailing newline, no colors).
auto format_text(const LogRecord& record) -> std::string;

/// Formats a record as a single JSON object (no trailing newline).
auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like "coerce=trace,traits=debug,*=warn". A bare module name
/// enables Trace for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Logger configuration, usually built by `parse_log_options`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    bool console = true;
    bool colors = true;
};

/// Thread-safe global logger.
///
/// Without an explicit `init()` the logger has no sinks and drops everything,
/// so embedding type checkers see no output unless they opt in.
class Logger {
public:
    /// Replace the global configuration and sinks.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before formatting a message.
    auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);
    auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns milliseconds since epoch.
auto epoch_ms() -> int64_t;

/// Parse logging options from argv: --log-level=, --log-filter=, --log-format=,
/// -v/-vv/-vvv and -q. Falls back to the TYFIX_LOG environment variable.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// True if `arg` is one of the options consumed by `parse_log_options`.
auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef TYFIX_MIN_LOG_LEVEL
#define TYFIX_MIN_LOG_LEVEL 0
#endif

#define TYFIX_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= TYFIX_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::tyfix::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TYFIX_LOG_TRACE(module, msg) TYFIX_LOG_IMPL(::tyfix::log::LogLevel::Trace, module, msg)
#define TYFIX_LOG_DEBUG(module, msg) TYFIX_LOG_IMPL(::tyfix::log::LogLevel::Debug, module, msg)
#define TYFIX_LOG_INFO(module, msg) TYFIX_LOG_IMPL(::tyfix::log::LogLevel::Info, module, msg)
#define TYFIX_LOG_WARN(module, msg) TYFIX_LOG_IMPL(::tyfix::log::LogLevel::Warn, module, msg)
#define TYFIX_LOG_ERROR(module, msg) TYFIX_LOG_IMPL(::tyfix::log::LogLevel::Error, module, msg)

} // namespace tyfix::log

#endif // TYFIX_LOG_HPP
