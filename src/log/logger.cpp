//! # Logger Implementation

#include "tnet/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace tnet::log {

namespace {

/// Local wall-clock time as `HH:MM:SS.mmm`.
auto wall_clock() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm parts{};
#ifdef _WIN32
    localtime_s(&parts, &seconds);
#else
    localtime_r(&seconds, &parts);
#endif

    std::ostringstream oss;
    oss << std::put_time(&parts, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count();
    return oss.str();
}

} // namespace

auto level_name(LogLevel level) -> const char* {
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
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

auto format_record(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << wall_clock() << ' ' << std::left << std::setw(5) << level_name(record.level) << " ["
        << record.module << "] " << record.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << format_record(record) + "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path) : file_(path, std::ios::out | std::ios::app) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_record(record) << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();

    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        sinks.push_back(std::make_unique<ConsoleSink>());
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            sinks.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }

    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.level_ = config.level;
    logger.module_levels_.clear();
    for (const auto& [module, level] : config.module_levels) {
        logger.module_levels_.emplace(module, level);
    }
    logger.sinks_ = std::move(sinks);
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sinks_.empty()) {
        return false;
    }
    auto it = module_levels_.find(module);
    LogLevel threshold = it != module_levels_.end() ? it->second : level_;
    return threshold != LogLevel::Off && level >= threshold;
}

void Logger::log(LogLevel level, std::string_view module, std::string message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

auto Logger::level() const -> LogLevel {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_module_level(const std::string& module, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    module_levels_.insert_or_assign(module, level);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace tnet::log
