/// @file turn_state.cpp
/// @brief Turn snapshot implementation for skirmish_combat module

#include <skirmish/combat/turn_state.hpp>

#include <algorithm>

namespace skirmish_combat {

TurnState::TurnState(ICombatant& active, std::vector<Action> available_actions,
                     Party allies, Party enemies, EffectLedger& ledger)
    : m_active(&active)
    , m_actions(std::move(available_actions))
    , m_allies(std::move(allies))
    , m_enemies(std::move(enemies))
    , m_ledger(&ledger) {
}

const Action* TurnState::find_action(const ActionId& id) const {
    auto it = std::find_if(m_actions.begin(), m_actions.end(),
        [&id](const Action& a) { return a.id == id; });
    return it != m_actions.end() ? &(*it) : nullptr;
}

std::vector<ICombatant*> TurnState::targets_for(const Action& action) const {
    return action.targets(target_query());
}

std::vector<const ActiveEffect*> TurnState::effects_on(const CombatantId& target) const {
    return m_ledger->effects_on(target);
}

ApplyOutcome TurnState::apply_effect(const EffectSpec& effect, const CombatantId& target) {
    return m_ledger->apply(effect, target);
}

void TurnState::remove_effect(EffectKind kind, const CombatantId& target) {
    m_ledger->remove(kind, target);
}

TurnState TurnState::with_active(ICombatant& combatant) const {
    TurnState copy(*this);
    copy.m_active = &combatant;
    return copy;
}

} // namespace skirmish_combat
