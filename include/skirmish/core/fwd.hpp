#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for skirmish_core module

#include <cstdint>

namespace skirmish_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct CombatError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogSettings;
class LogScope;

} // namespace skirmish_core
