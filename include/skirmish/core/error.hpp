#pragma once

/// @file error.hpp
/// @brief Error handling types for skirmish_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace skirmish_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse category shared by every error kind; Stalled must stay last
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    NotAvailable,
    Stalled,
};

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::NotAvailable: return "NotAvailable";
        case ErrorCode::Stalled: return "Stalled";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Encounter protocol errors
struct CombatError {
    enum class Kind : std::uint8_t {
        ActionNotAvailable, // Submitted action is not offered this turn
        InvalidRoster,      // Parties or initiative order are unusable
        InvalidState,       // Encounter is not in a state that accepts the call
        Stalled,            // Autonomous participant exceeded the stall limit
    };

    Kind kind;
    std::string message;
    std::string combatant_id;
    std::string action_id;

    [[nodiscard]] static CombatError action_not_available(const std::string& combatant, const std::string& action) {
        return CombatError{Kind::ActionNotAvailable,
            "Action '" + action + "' is not available to '" + combatant + "'", combatant, action};
    }

    [[nodiscard]] static CombatError invalid_roster(const std::string& reason) {
        return CombatError{Kind::InvalidRoster, "Invalid roster: " + reason, {}, {}};
    }

    [[nodiscard]] static CombatError invalid_state(const std::string& reason) {
        return CombatError{Kind::InvalidState, "Invalid encounter state: " + reason, {}, {}};
    }

    [[nodiscard]] static CombatError stalled(const std::string& combatant, std::uint32_t attempts) {
        return CombatError{Kind::Stalled,
            "Combatant '" + combatant + "' made no valid decision after " + std::to_string(attempts) + " attempts",
            combatant, {}};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,   // Config file missing or unreadable
        Malformed,      // Not valid JSON
        InvalidField,   // Field present with the wrong type or value
    };

    Kind kind;
    std::string message;
    std::string source;
    std::string field;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, path, {}};
    }

    [[nodiscard]] static ConfigError malformed(const std::string& source, const std::string& reason) {
        return ConfigError{Kind::Malformed, "Malformed config: " + reason, source, {}};
    }

    [[nodiscard]] static ConfigError invalid_field(const std::string& field, const std::string& reason) {
        return ConfigError{Kind::InvalidField, "Invalid field '" + field + "': " + reason, {}, field};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Error returned by every fallible skirmish operation.
/// Holds one of the kinds above, or a bare message, plus optional key/value context.
class Error {
public:
    using Variant = std::variant<
        CombatError,
        ConfigError,
        std::string  // Generic message
    >;

    Error() : m_code(ErrorCode::Unknown), m_error(std::string("unspecified error")) {}
    Error(CombatError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// nullptr unless the error holds a T
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Attaches e.g. the file a config error came from; shown by build_error_chain()
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// nullptr when the key was never attached
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(CombatError::Kind kind) {
        switch (kind) {
            case CombatError::Kind::ActionNotAvailable: return ErrorCode::NotAvailable;
            case CombatError::Kind::InvalidRoster: return ErrorCode::InvalidArgument;
            case CombatError::Kind::InvalidState: return ErrorCode::InvalidState;
            case CombatError::Kind::Stalled: return ErrorCode::Stalled;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::Malformed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidField: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Either a value or an Error. Engine operations report protocol and
/// configuration failures through this instead of throwing.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Accessors below require is_ok()
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &*m_value; }
    [[nodiscard]] const T* operator->() const { return &*m_value; }

    [[nodiscard]] T value_or(T fallback) const {
        return m_value ? *m_value : std::move(fallback);
    }

    /// Requires is_err()
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

private:
    std::optional<T> m_value;
    E m_error;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return !m_failed; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

private:
    E m_error;
    bool m_failed = false;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

/// Err<T>(...) for a failed Result<T>; T defaults to void
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Formatting and Statistics
// =============================================================================

/// "[Code] message (details)" followed by a "with key=value" line when context is attached
std::string build_error_chain(const Error& error);

/// Process-wide counters of errors returned to callers, bucketed by ErrorCode
namespace debug {

void record_error(const Error& error);

std::uint64_t total_error_count();

std::uint64_t error_count(ErrorCode code);

void reset_error_stats();

/// One "Code: count" line per code seen since the last reset
std::string error_stats_summary();

} // namespace debug

} // namespace skirmish_core
