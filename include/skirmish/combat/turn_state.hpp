/// @file turn_state.hpp
/// @brief Per-turn snapshot handed to decision makers

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "actions.hpp"
#include "effects.hpp"

#include <vector>

namespace skirmish_combat {

/// @brief What the active combatant sees and may do this turn
///
/// Built fresh by the Encounter every turn. Holds a mutable handle to the
/// encounter's effect ledger; apply_effect and remove_effect are the only
/// ways actions and effects change engine state. A snapshot must not be used
/// after its Encounter is destroyed.
class TurnState {
public:
    TurnState(ICombatant& active, std::vector<Action> available_actions,
              Party allies, Party enemies, EffectLedger& ledger);

    // Participants
    [[nodiscard]] ICombatant& active() const { return *m_active; }
    [[nodiscard]] const Party& allies() const { return m_allies; }
    [[nodiscard]] const Party& enemies() const { return m_enemies; }

    // Offer
    [[nodiscard]] const std::vector<Action>& available_actions() const { return m_actions; }
    [[nodiscard]] const Action* find_action(const ActionId& id) const;
    [[nodiscard]] TargetQuery target_query() const { return TargetQuery{*m_active, m_allies, m_enemies}; }
    [[nodiscard]] std::vector<ICombatant*> targets_for(const Action& action) const;

    // Effects (read)
    [[nodiscard]] const EffectLedger& effects() const { return *m_ledger; }
    [[nodiscard]] std::vector<const ActiveEffect*> effects_on(const CombatantId& target) const;
    [[nodiscard]] std::size_t participant_count() const { return m_ledger->participant_count(); }

    // Effects (commands)
    ApplyOutcome apply_effect(const EffectSpec& effect, const CombatantId& target);
    void remove_effect(EffectKind kind, const CombatantId& target);

    /// @brief Same snapshot with another combatant as the active one
    [[nodiscard]] TurnState with_active(ICombatant& combatant) const;

private:
    ICombatant* m_active;
    std::vector<Action> m_actions;
    Party m_allies;
    Party m_enemies;
    EffectLedger* m_ledger;
};

} // namespace skirmish_combat
