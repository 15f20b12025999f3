#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse "trace", "debug", "info", "warn", "error" or "off" (case-sensitive).
/// Unknown names map to Info.
[[nodiscard]] LogLevel log_level_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// `component` names the subsystem that emitted the record ("rpc", "process",
// "server:<id>", ...). It is a borrowed view and must outlive the log() call.

struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string_view comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    /// Cheap check used by the MCPLINK_LOG_* macros before building a message
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view component,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::string(msg), loc));
        }
    }

    template<typename... Args>
    void write_fmt(
        LogLevel level,
        std::string_view component,
        std::format_string<Args...> fmt,
        Args&&... args
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr, optional ANSI colors
// ─────────────────────────────────────────────────────────────────────────────
// Writes to stderr only: stdout may be a JSON-RPC channel when the process
// itself is driven over stdio.

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_enabled_ = enabled; }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

/// Global logger (NullLogger until set_logger() is called)
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the global logger; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define MCPLINK_LOG_AT(level, component, msg) \
    do { if (::mcplink::get_logger().should_log(level)) \
         ::mcplink::get_logger().write(level, component, msg); } while(false)

#define MCPLINK_LOG_TRACE(component, msg) MCPLINK_LOG_AT(::mcplink::LogLevel::Trace, component, msg)
#define MCPLINK_LOG_DEBUG(component, msg) MCPLINK_LOG_AT(::mcplink::LogLevel::Debug, component, msg)
#define MCPLINK_LOG_INFO(component, msg)  MCPLINK_LOG_AT(::mcplink::LogLevel::Info, component, msg)
#define MCPLINK_LOG_WARN(component, msg)  MCPLINK_LOG_AT(::mcplink::LogLevel::Warn, component, msg)
#define MCPLINK_LOG_ERROR(component, msg) MCPLINK_LOG_AT(::mcplink::LogLevel::Error, component, msg)

}  // namespace mcplink
