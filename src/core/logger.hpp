/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations)
 * and a thread-safe Logger front-end shared by every service in the process.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fleet_orchestrator {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Parse "debug" / "info" / "warn" / "error" (as written in the config file).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

/// Key/value appended to a log line after "msg", e.g. {"instance", id}.
struct LogField {
    std::string_view key;
    std::string_view value;
};

using LogFields = std::initializer_list<LogField>;

// ─────────────────────────────────────────────
// ILogSink (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Every line is one JSON object: level, ts, msg, then any fields in the
 * order given. Field values are always emitted as strings.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message, LogFields fields = {});
    void info(std::string_view message, LogFields fields = {});
    void warn(std::string_view message, LogFields fields = {});
    void error(std::string_view message, LogFields fields = {});

    void log(LogLevel level, std::string_view message, LogFields fields = {});
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

}  // namespace fleet_orchestrator
