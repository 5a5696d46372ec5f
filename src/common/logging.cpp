#include "common/logging.h"
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

namespace solcino {
namespace common {

namespace {

// UTC, millisecond precision: 2024-05-01T12:00:00.250Z
std::string iso8601(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
        1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return out.str();
}

} // namespace

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(const std::string& name) {
    for (int i = static_cast<int>(LogLevel::TRACE); i <= static_cast<int>(LogLevel::CRITICAL);
         ++i) {
        const auto level = static_cast<LogLevel>(i);
        if (level_to_string(level) == name) {
            return level;
        }
    }
    return std::nullopt;
}

LogEntry Logger::make_entry(LogLevel level, const std::string& module,
                            std::string message) const {
    std::ostringstream thread;
    thread << std::this_thread::get_id();

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.module = module;
    entry.thread_id = thread.str();
    entry.message = std::move(message);
    return entry;
}

std::string Logger::format_json(const LogEntry& entry) const {
    nlohmann::json line = {{"timestamp", iso8601(entry.timestamp)},
                           {"level", level_to_string(entry.level)},
                           {"module", entry.module},
                           {"thread_id", entry.thread_id},
                           {"message", entry.message}};
    if (!entry.error_code.empty()) {
        line["error_code"] = entry.error_code;
    }
    if (!entry.context.empty()) {
        line["context"] = entry.context;
    }
    // Invalid UTF-8 in a message is replaced rather than thrown
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text(const LogEntry& entry) const {
    std::ostringstream text;
    text << iso8601(entry.timestamp) << ' ' << std::left << std::setw(8)
         << level_to_string(entry.level) << '[' << entry.module << "] " << entry.message;

    if (!entry.error_code.empty()) {
        text << " code=" << entry.error_code;
    }
    for (const auto& [key, value] : entry.context) {
        text << ' ' << key << '=' << value;
    }
    return text.str();
}

} // namespace common
} // namespace solcino
