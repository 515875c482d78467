/// @file fwd.hpp
/// @brief Forward declarations for skirmish_combat module

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace skirmish_combat {

// =============================================================================
// Identifier Types
// =============================================================================

/// @brief Stable combatant identifier supplied by the owning application
using CombatantId = std::string;

/// @brief Stable action identifier ("SLASH", "BLOCK", ...)
using ActionId = std::string;

/// @brief Trainable skill identifier
using SkillId = std::string;

/// @brief Index of one of the two sides of an encounter (0 or 1)
using PartyIndex = std::uint8_t;

// =============================================================================
// Forward Declarations - Combatants
// =============================================================================

class ICombatant;
class Combatant;
struct CombatantConfig;
struct Equipment;
struct Spell;

/// @brief Ordered, non-owning collection of one side's combatants
using Party = std::vector<ICombatant*>;

// =============================================================================
// Forward Declarations - Actions
// =============================================================================

struct Action;
struct Decision;
struct ExecuteParams;
struct TargetQuery;
class ActionExecutor;

// =============================================================================
// Forward Declarations - Effects
// =============================================================================

struct EffectSpec;
struct ActiveEffect;
class EffectLedger;
class EffectPresets;

// =============================================================================
// Forward Declarations - Encounter
// =============================================================================

class TurnState;
class TurnScheduler;
class Encounter;
struct EncounterConfig;
struct CombatResult;

} // namespace skirmish_combat
