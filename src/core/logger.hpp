/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end that emits one JSON
 * object per line.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace model_mesh {

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

/// Parse "debug" / "info" / "warn" / "error" (also accepts "warning").
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string escape_json(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink
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
 * Components hold a reference to the single Logger owned by the service
 * runner. Each line has the shape {"level":..,"ts":..,"msg":..}. Once a
 * node id is set, lines also carry "node" so the admin and worker logs can
 * be merged.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

    void set_node_id(std::string node_id);
    [[nodiscard]] std::string node_id() const;

private:
    [[nodiscard]] std::string format_line(LogLevel level, std::string_view message) const;

    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::string node_id_;
    mutable std::mutex mutex_;
};

}  // namespace model_mesh
