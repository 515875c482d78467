#pragma once

/// @file log.hpp
/// @brief Logging utilities for skirmish
///
/// Every subsystem logs through a named spdlog logger owned by a small
/// registry. The combat channel can additionally be mirrored into a plain
/// transcript file, which is how a finished encounter is kept for replay.

#include <spdlog/spdlog.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define SKIRMISH_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define SKIRMISH_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define SKIRMISH_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define SKIRMISH_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define SKIRMISH_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define SKIRMISH_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace skirmish_core {

/// Channel names used across the project
inline constexpr const char* k_core_channel = "skirmish_core";
inline constexpr const char* k_combat_channel = "combat";

// =============================================================================
// Setup
// =============================================================================

/// Logging setup applied by init_logging()
struct LogSettings {
    spdlog::level::level_enum level = spdlog::level::info;
    bool colored = true;
    /// When set, the combat channel is also written to this file (truncated)
    std::string transcript_path;
};

/// Install the console pattern and level, and open the transcript if requested.
/// Loggers created earlier are rebuilt so they pick up the new sinks.
/// @return false when the transcript file could not be opened; console logging still works
bool init_logging(const LogSettings& settings = {});

// =============================================================================
// Channels
// =============================================================================

/// Named logger, created on first use with the current level and sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> core_logger();

/// Turn reports, effect notifications and results
std::shared_ptr<spdlog::logger> combat_logger();

// =============================================================================
// Levels
// =============================================================================

/// Applies to spdlog's default logger and every registered channel
void set_global_log_level(spdlog::level::level_enum level);

/// Overrides one channel; unknown names are ignored
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Accepts spdlog's short names plus "warning" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Logs `message {key="value", ...}` on the given channel
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a block together with its wall time
class LogScope {
public:
    explicit LogScope(std::string name, const std::string& logger_name = k_core_channel);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define SKIRMISH_LOG_SCOPE(name) ::skirmish_core::LogScope _log_scope_##__LINE__(name)
#define SKIRMISH_LOG_FUNC() ::skirmish_core::LogScope _log_scope_func(__FUNCTION__)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flushes and drops every channel, closing the transcript
void shutdown_logging();

} // namespace skirmish_core
