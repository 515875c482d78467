/// @file config.hpp
/// @brief Encounter configuration loading

#pragma once

#include "types.hpp"

#include <skirmish/core/error.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace skirmish_combat {

/// @brief Parse an encounter configuration from JSON text
///
/// Recognised keys (all optional):
/// @code
/// {
///     "seed": 42,
///     "initiative": ["hero", "boar"],
///     "verbose": true,
///     "max_stalled_decisions": 16,
///     "log_level": "debug"
/// }
/// @endcode
skirmish_core::Result<EncounterConfig> parse_encounter_config(std::string_view json_text);

/// @brief Load an encounter configuration from a JSON file
skirmish_core::Result<EncounterConfig> load_encounter_config(const std::filesystem::path& path);

/// @brief Apply the configured log level to the global log level
/// @return False when log_level is set but not a known level name
bool apply_log_level(const EncounterConfig& config);

/// @brief Serialize a configuration back to JSON text
std::string encounter_config_to_json(const EncounterConfig& config);

} // namespace skirmish_combat
