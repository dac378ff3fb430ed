//! # tnet Logging
//!
//! Module-tagged diagnostics for the codec. The decoder reports rejected
//! input under `"decode"` and the encoder reports rejected values under
//! `"encode"`, both at Debug level.
//!
//! The logger starts with no sinks and a Warn threshold, so the library is
//! silent until the host program calls `Logger::init()`. Nothing logged here
//! changes a decode or encode result.
//!
//! ## Usage
//!
//! ```cpp
//! tnet::log::LogConfig config;
//! config.level = tnet::log::LogLevel::Debug;
//! tnet::log::Logger::init(config);
//!
//! TNET_LOG_DEBUG("decode", "rejected input: " << error.to_string());
//! ```

#ifndef TNET_LOG_HPP
#define TNET_LOG_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace tnet::log {

// ============================================================================
// Levels and Records
// ============================================================================

/// Severity levels in ascending order. `Off` is only used as a threshold.
enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

/// Upper-case name of a level, e.g. "DEBUG".
auto level_name(LogLevel level) -> const char*;

/// One message on its way to the sinks.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module;
    std::string message;
};

/// Renders a record as `HH:MM:SS.mmm LEVEL [module] message`.
auto format_record(const LogRecord& record) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

/// Destination for log records. The logger serializes calls to a sink.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/// Writes formatted records to stderr.
class ConsoleSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;
};

/// Appends formatted records to a file. Error records are flushed at once.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

/// Discards every record.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Logger
// ============================================================================

/// Settings applied by `Logger::init`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;               ///< Threshold for every module
    std::map<std::string, LogLevel> module_levels; ///< Per-module thresholds
    std::string log_file;                          ///< Empty for no file sink
    bool console = true;                           ///< Write to stderr
};

/// Process-wide, thread-safe logger.
class Logger {
public:
    /// Replaces the sinks and thresholds with those described by `config`.
    ///
    /// A log file that cannot be opened is reported on stderr and skipped.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Checked by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, std::string message);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel;

    /// Overrides the threshold for one module.
    void set_module_level(const std::string& module, LogLevel level);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    std::map<std::string, LogLevel, std::less<>> module_levels_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logging Macros
// ============================================================================

// Define TNET_MIN_LOG_LEVEL before including this header to compile out
// calls below that level (0 = Trace through 4 = Error).
#ifndef TNET_MIN_LOG_LEVEL
#define TNET_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define TNET_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= TNET_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::tnet::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str());                                        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: `TNET_LOG_DEBUG("decode", "rejected input: " << text);`
#define TNET_LOG_TRACE(module, msg) TNET_LOG_IMPL(::tnet::log::LogLevel::Trace, module, msg)
#define TNET_LOG_DEBUG(module, msg) TNET_LOG_IMPL(::tnet::log::LogLevel::Debug, module, msg)
#define TNET_LOG_INFO(module, msg) TNET_LOG_IMPL(::tnet::log::LogLevel::Info, module, msg)
#define TNET_LOG_WARN(module, msg) TNET_LOG_IMPL(::tnet::log::LogLevel::Warn, module, msg)
#define TNET_LOG_ERROR(module, msg) TNET_LOG_IMPL(::tnet::log::LogLevel::Error, module, msg)

} // namespace tnet::log

#endif // TNET_LOG_HPP
