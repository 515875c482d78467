/// @file combat.hpp
/// @brief Main header for skirmish_combat module
///
/// Turn-resolution engine for two-party, turn-based encounters.
///
/// # Module Overview
///
/// ## Effect Ledger
/// Status effects measured in rounds and counted in turns:
/// - One record per (kind, target), stronger applications take over
/// - Per-round and per-turn callbacks, completion callbacks
/// - Interruption of concentration effects by blocked components
///
/// ## Turn Scheduler
/// Fixed shuffled initiative, skipping downed combatants while effects keep
/// ticking.
///
/// ## Action Executor
/// Offers, validates and executes actions; a `false` outcome lets the same
/// combatant act again.
///
/// ## Encounter
/// Step machine consulting autonomous combatants directly and suspending for
/// externally driven ones.
///
/// # Example Usage
///
/// @code
/// #include <skirmish/combat/combat.hpp>
/// using namespace skirmish_combat;
///
/// Combatant hero(CombatantConfig{.id = "hero", .name = "Hero", .max_hp = 30, .current_hp = 30});
/// Combatant boar(CombatantConfig{.id = "boar", .name = "Boar", .max_hp = 20, .current_hp = 20});
/// boar.set_strategy([](const TurnState& turn) { ... });
///
/// Encounter encounter({&hero}, {&boar});
/// auto step = encounter.start();
/// while (step && !is_finished(*step)) {
///     step = encounter.resume(ask_player(std::get<TurnState>(*step)));
/// }
/// @endcode

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "actions.hpp"
#include "effects.hpp"
#include "combatant.hpp"
#include "turn_state.hpp"
#include "scheduler.hpp"
#include "encounter.hpp"
#include "config.hpp"

namespace skirmish_combat {

// =============================================================================
// Prelude Namespace
// =============================================================================

/// @brief Commonly used types for convenient imports
namespace prelude {
    // IDs
    using skirmish_combat::CombatantId;
    using skirmish_combat::ActionId;
    using skirmish_combat::SkillId;
    using skirmish_combat::PartyIndex;
    using skirmish_combat::Party;

    // Types
    using skirmish_combat::EffectKind;
    using skirmish_combat::SpellComponent;
    using skirmish_combat::ActionType;
    using skirmish_combat::ActionOutcome;
    using skirmish_combat::ControlMode;
    using skirmish_combat::EncounterState;
    using skirmish_combat::CombatResult;
    using skirmish_combat::EncounterConfig;

    // Actions and effects
    using skirmish_combat::Action;
    using skirmish_combat::Decision;
    using skirmish_combat::EffectSpec;
    using skirmish_combat::ActiveEffect;
    using skirmish_combat::EffectPresets;

    // Combatants
    using skirmish_combat::ICombatant;
    using skirmish_combat::Combatant;
    using skirmish_combat::CombatantConfig;
    using skirmish_combat::Equipment;
    using skirmish_combat::Spell;

    // Systems
    using skirmish_combat::EffectLedger;
    using skirmish_combat::TurnScheduler;
    using skirmish_combat::ActionExecutor;
    using skirmish_combat::TurnState;
    using skirmish_combat::Encounter;
    using skirmish_combat::Step;
}

} // namespace skirmish_combat
