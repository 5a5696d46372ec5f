#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace solcino {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Controls logging verbosity. Debug logging should stay disabled in release
 * configurations; formatting is skipped entirely for disabled levels.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

using LogContext = std::map<std::string, std::string>;

/**
 * @brief One log line before formatting
 *
 * `error_code` and `context` are empty for plain LOG_* calls; the
 * LOG_STRUCTURED family fills them in.
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::INFO;
    std::string module;
    std::string thread_id;
    std::string message;
    std::string error_code;
    LogContext context;
};

/**
 * @brief Process-wide logger shared by the runtime and the raffle program
 *
 * Writes one line per entry, either as text or as a JSON object. Level and
 * format can change at any time; the output stream is guarded by a mutex.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output (tests capture into a stringstream); nullptr restores std::cout
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = out ? out : &std::cout;
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);
        output_log_entry(make_entry(level, module, oss.str()));
    }

    /// Log a message tagged with an error code and key/value context
    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const LogContext& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry = make_entry(level, module, message);
        entry.error_code = error_code;
        entry.context = context;
        output_log_entry(entry);
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

    static std::string level_to_string(LogLevel level);

    /// Parse "TRACE".."CRITICAL" (case-sensitive); nullopt for anything else
    static std::optional<LogLevel> level_from_string(const std::string& name);

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), output_(&std::cout) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::mutex output_mutex_;
    std::ostream* output_;

    LogEntry make_entry(LogLevel level, const std::string& module, std::string message) const;

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *output_ << line << '\n';
        output_->flush();
    }
};

} // namespace common
} // namespace solcino

/**
 * @brief Performance-conscious logging macros
 *
 * These macros avoid string formatting overhead when logging is disabled.
 * The first argument is always the module tag.
 */
#define LOG_DEBUG(...) \
    do { \
        if (solcino::common::Logger::instance().is_debug_enabled()) { \
            solcino::common::Logger::instance().log(solcino::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    solcino::common::Logger::instance().log(solcino::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    solcino::common::Logger::instance().log(solcino::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    solcino::common::Logger::instance().log(solcino::common::LogLevel::ERROR, __VA_ARGS__)

/// Structured entry: LOG_STRUCTURED(level, module, message[, error_code[, context]])
#define LOG_STRUCTURED(level, module, message, ...) \
    solcino::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

// Rollbacks in the runtime and rejected raffle instructions
#define LOG_SVM_WARN(message, ...) \
    LOG_STRUCTURED(solcino::common::LogLevel::WARN, "svm", message, ##__VA_ARGS__)

#define LOG_RAFFLE_REJECT(message, ...) \
    LOG_STRUCTURED(solcino::common::LogLevel::WARN, "raffle", message, ##__VA_ARGS__)
