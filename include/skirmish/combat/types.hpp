/// @file types.hpp
/// @brief Common types and configurations for skirmish_combat module

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skirmish_combat {

// =============================================================================
// Effect Types
// =============================================================================

/// @brief Closed set of status effect kinds
enum class EffectKind : std::uint8_t {
    Staggered,      ///< Knocked off balance, cannot act
    Blocking,       ///< Shield raised by a protector
    Burning,        ///< Fire damage over time
    Casting,        ///< Channelling a spell that resolves on expiry
};

/// @brief Get effect kind name
[[nodiscard]] inline const char* effect_kind_name(EffectKind kind) {
    switch (kind) {
        case EffectKind::Staggered: return "Staggered";
        case EffectKind::Blocking: return "Blocking";
        case EffectKind::Burning: return "Burning";
        case EffectKind::Casting: return "Casting";
        default: return "Unknown";
    }
}

/// @brief Spell components a concentration effect depends on
enum class SpellComponent : std::uint8_t {
    None    = 0,
    Verbal  = 1 << 0,   ///< Requires speech
    Somatic = 1 << 1,   ///< Requires free movement
};

inline SpellComponent operator|(SpellComponent a, SpellComponent b) {
    return static_cast<SpellComponent>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

inline SpellComponent operator&(SpellComponent a, SpellComponent b) {
    return static_cast<SpellComponent>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
}

inline bool has_component(SpellComponent components, SpellComponent component) {
    return (static_cast<std::uint8_t>(components) & static_cast<std::uint8_t>(component)) != 0;
}

// =============================================================================
// Action Types
// =============================================================================

/// @brief Action category, used for grouping and for the null-action rule
enum class ActionType : std::uint8_t {
    Null,           ///< Does nothing, needs no target
    PhysicalAttack,
    MagicAttack,
    DamageOverTime,
    Heal,
    Help,           ///< Supportive, targets allies
    Item,           ///< Opens an item selection
    Spell,          ///< Opens a spell selection
};

/// @brief Get action type name
[[nodiscard]] inline const char* action_type_name(ActionType type) {
    switch (type) {
        case ActionType::Null: return "Null";
        case ActionType::PhysicalAttack: return "PhysicalAttack";
        case ActionType::MagicAttack: return "MagicAttack";
        case ActionType::DamageOverTime: return "DamageOverTime";
        case ActionType::Heal: return "Heal";
        case ActionType::Help: return "Help";
        case ActionType::Item: return "Item";
        case ActionType::Spell: return "Spell";
        default: return "Unknown";
    }
}

/// @brief Result of executing an action
///
/// - std::monostate: resolved, nothing to report
/// - bool: true consumes the turn, false keeps the same actor acting
/// - float: resolved magnitude (damage dealt, HP healed), informational only
using ActionOutcome = std::variant<std::monostate, bool, float>;

/// @brief Check whether an outcome ends the actor's turn
[[nodiscard]] inline bool consumes_turn(const ActionOutcome& outcome) {
    const bool* flag = std::get_if<bool>(&outcome);
    return flag == nullptr || *flag;
}

/// @brief Get reported magnitude, if any
[[nodiscard]] inline std::optional<float> outcome_magnitude(const ActionOutcome& outcome) {
    if (const float* value = std::get_if<float>(&outcome)) {
        return *value;
    }
    return std::nullopt;
}

// =============================================================================
// Combatant Types
// =============================================================================

/// @brief Who chooses a combatant's actions
enum class ControlMode : std::uint8_t {
    Autonomous,     ///< Decision function consulted synchronously
    External,       ///< Decision supplied by the caller through Encounter::resume
};

// =============================================================================
// Encounter Types
// =============================================================================

/// @brief Controller state
enum class EncounterState : std::uint8_t {
    Idle,               ///< Constructed, start() not called
    AwaitingDecision,   ///< Parked on a participant's decision
    Resolving,          ///< Executing a decision
    Finished,           ///< Result available, no more turns
};

/// @brief Get encounter state name
[[nodiscard]] inline const char* encounter_state_name(EncounterState state) {
    switch (state) {
        case EncounterState::Idle: return "Idle";
        case EncounterState::AwaitingDecision: return "AwaitingDecision";
        case EncounterState::Resolving: return "Resolving";
        case EncounterState::Finished: return "Finished";
        default: return "Unknown";
    }
}

/// @brief Terminal outcome of an encounter
struct CombatResult {
    PartyIndex winner{0};

    bool operator==(const CombatResult&) const = default;
};

/// @brief Encounter configuration
struct EncounterConfig {
    /// Initiative shuffle seed; a random seed is drawn when unset
    std::optional<std::uint64_t> seed;

    /// Fixed initiative order by combatant id; overrides the shuffle when non-empty
    std::vector<CombatantId> initiative_order;

    /// Log numeric action outcomes and the final result
    bool verbose{true};

    /// Consecutive unresolved autonomous decisions tolerated (0 = unlimited)
    std::uint32_t max_stalled_decisions{0};

    /// Log level name applied by the loader ("trace" .. "off"), empty = unchanged
    std::string log_level;
};

} // namespace skirmish_combat
