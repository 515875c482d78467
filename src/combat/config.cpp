/// @file config.cpp
/// @brief Encounter configuration loading for skirmish_combat module

#include <skirmish/combat/config.hpp>
#include <skirmish/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace skirmish_combat {

using skirmish_core::ConfigError;
using skirmish_core::Err;
using skirmish_core::Ok;
using skirmish_core::Result;

namespace {

Result<EncounterConfig> parse_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<EncounterConfig>(ConfigError::malformed("<root>", "expected a JSON object"));
    }

    EncounterConfig config;

    if (j.contains("seed")) {
        if (!j["seed"].is_number_unsigned()) {
            return Err<EncounterConfig>(ConfigError::invalid_field("seed", "expected a non-negative integer"));
        }
        config.seed = j["seed"].get<std::uint64_t>();
    }

    if (j.contains("initiative")) {
        const auto& arr = j["initiative"];
        if (!arr.is_array()) {
            return Err<EncounterConfig>(ConfigError::invalid_field("initiative", "expected an array of ids"));
        }
        for (const auto& entry : arr) {
            if (!entry.is_string()) {
                return Err<EncounterConfig>(ConfigError::invalid_field("initiative", "ids must be strings"));
            }
            config.initiative_order.push_back(entry.get<std::string>());
        }
    }

    if (j.contains("verbose")) {
        if (!j["verbose"].is_boolean()) {
            return Err<EncounterConfig>(ConfigError::invalid_field("verbose", "expected a boolean"));
        }
        config.verbose = j["verbose"].get<bool>();
    }

    if (j.contains("max_stalled_decisions")) {
        const auto& value = j["max_stalled_decisions"];
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() > UINT32_MAX) {
            return Err<EncounterConfig>(
                ConfigError::invalid_field("max_stalled_decisions", "expected a non-negative 32-bit integer"));
        }
        config.max_stalled_decisions = value.get<std::uint32_t>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return Err<EncounterConfig>(ConfigError::invalid_field("log_level", "expected a string"));
        }
        config.log_level = j["log_level"].get<std::string>();
        if (!skirmish_core::parse_log_level(config.log_level)) {
            return Err<EncounterConfig>(
                ConfigError::invalid_field("log_level", "unknown level '" + config.log_level + "'"));
        }
    }

    return Ok(std::move(config));
}

} // anonymous namespace

Result<EncounterConfig> parse_encounter_config(std::string_view json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<EncounterConfig>(ConfigError::malformed("<string>", e.what()));
    }
    return parse_json(j);
}

Result<EncounterConfig> load_encounter_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<EncounterConfig>(ConfigError::file_not_found(path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<EncounterConfig>(
            skirmish_core::Error(skirmish_core::ErrorCode::IOError, "Failed to open config: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return Err<EncounterConfig>(ConfigError::malformed(path.string(), e.what()));
    }

    auto result = parse_json(j);
    if (!result) {
        result.error().with_context("file", path.string());
        return result;
    }

    skirmish_core::core_logger()->debug("Loaded encounter config from {}", path.string());
    return result;
}

bool apply_log_level(const EncounterConfig& config) {
    if (config.log_level.empty()) {
        return true;
    }
    auto level = skirmish_core::parse_log_level(config.log_level);
    if (!level) {
        skirmish_core::core_logger()->warn("Unknown log level '{}'", config.log_level);
        return false;
    }
    skirmish_core::set_global_log_level(*level);
    return true;
}

std::string encounter_config_to_json(const EncounterConfig& config) {
    nlohmann::json j;
    if (config.seed) {
        j["seed"] = *config.seed;
    }
    if (!config.initiative_order.empty()) {
        j["initiative"] = config.initiative_order;
    }
    j["verbose"] = config.verbose;
    j["max_stalled_decisions"] = config.max_stalled_decisions;
    if (!config.log_level.empty()) {
        j["log_level"] = config.log_level;
    }
    return j.dump(4);
}

} // namespace skirmish_combat
