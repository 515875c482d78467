/// @file log.cpp
/// @brief Logging system implementation for skirmish_core

#include <skirmish/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <array>
#include <mutex>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace skirmish_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_transcript_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

struct ChannelRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> channels;
    LogSettings settings;
    spdlog::sink_ptr console;
    spdlog::sink_ptr transcript;

    spdlog::sink_ptr console_sink() {
        if (!console) {
            if (settings.colored) {
                console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            } else {
                console = std::make_shared<spdlog::sinks::stdout_sink_mt>();
            }
            console->set_pattern(k_console_pattern);
        }
        return console;
    }

    std::vector<spdlog::sink_ptr> sinks_for(const std::string& name) {
        std::vector<spdlog::sink_ptr> sinks{console_sink()};
        if (transcript && name == k_combat_channel) {
            sinks.push_back(transcript);
        }
        return sinks;
    }
};

ChannelRegistry& registry() {
    static ChannelRegistry instance;
    return instance;
}

} // anonymous namespace

// =============================================================================
// Setup
// =============================================================================

bool init_logging(const LogSettings& settings) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.settings = settings;
    reg.console.reset();
    reg.transcript.reset();

    bool transcript_ok = true;
    if (!settings.transcript_path.empty()) {
        try {
            reg.transcript = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                settings.transcript_path, true);
            reg.transcript->set_pattern(k_transcript_pattern);
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open combat transcript '{}': {}", settings.transcript_path, ex.what());
            transcript_ok = false;
        }
    }

    for (auto& [name, logger] : reg.channels) {
        logger->sinks() = reg.sinks_for(name);
        logger->set_level(settings.level);
    }

    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(settings.level);
    return transcript_ok;
}

// =============================================================================
// Channels
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.channels.find(name); it != reg.channels.end()) {
        return it->second;
    }

    auto sinks = reg.sinks_for(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.settings.level);
    reg.channels.emplace(name, logger);

    // Another component may already own the name in spdlog's registry
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger(k_core_channel);
}

std::shared_ptr<spdlog::logger> combat_logger() {
    return get_logger(k_combat_channel);
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.settings.level = level;
    spdlog::set_level(level);
    for (auto& entry : reg.channels) {
        entry.second->set_level(level);
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.channels.find(name); it != reg.channels.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.settings.level;
}

namespace {

using LevelName = std::pair<std::string_view, spdlog::level::level_enum>;

constexpr std::array<LevelName, 10> k_level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

} // anonymous namespace

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& [name, level] : k_level_names) {
        if (name == str) {
            return level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    // First spelling per level in k_level_names is the canonical one
    for (const auto& [name, value] : k_level_names) {
        if (value == level) {
            return name.data();
        }
    }
    return "unknown";
}

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);
    if (!logger->should_log(level)) {
        return;
    }

    std::ostringstream line;
    line << message;
    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        line << separator << key << "=\"" << value << '"';
        separator = ", ";
    }
    if (!fields.empty()) {
        line << '}';
    }
    logger->log(level, line.str());
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(std::string name, const std::string& logger_name)
    : m_name(std::move(name))
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("enter {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("leave {} after {}us", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& entry : reg.channels) {
        entry.second->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& entry : reg.channels) {
        spdlog::drop(entry.first);
    }
    reg.channels.clear();
    reg.transcript.reset();
    spdlog::shutdown();
}

} // namespace skirmish_core
