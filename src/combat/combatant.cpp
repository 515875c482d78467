/// @file combatant.cpp
/// @brief Reference combatant implementation for skirmish_combat module

#include <skirmish/combat/combatant.hpp>
#include <skirmish/combat/turn_state.hpp>
#include <skirmish/core/log.hpp>

#include <algorithm>

namespace skirmish_combat {

Combatant::Combatant(const CombatantConfig& config)
    : m_config(config)
    , m_current_hp(std::clamp(config.current_hp, 0.0f, config.max_hp))
    , m_current_mana(std::clamp(config.current_mana, 0.0f, config.max_mana)) {
}

void Combatant::set_current_hp(float hp) {
    m_current_hp = std::clamp(hp, 0.0f, m_config.max_hp);
}

void Combatant::set_current_mana(float mana) {
    m_current_mana = std::clamp(mana, 0.0f, m_config.max_mana);
}

ControlMode Combatant::control_mode() const {
    return m_strategy ? ControlMode::Autonomous : ControlMode::External;
}

Decision Combatant::decide(const TurnState& turn) {
    if (!m_strategy) {
        return Decision{};
    }
    return m_strategy(turn);
}

void Combatant::practice_skill(const SkillId& skill) {
    std::uint32_t total = ++m_skill_practice[skill];
    skirmish_core::combat_logger()->debug("'{}' practised {} ({})", m_config.id, skill, total);
    if (m_on_practice) {
        m_on_practice(skill, total);
    }
}

std::uint32_t Combatant::skill_practice(const SkillId& skill) const {
    auto it = m_skill_practice.find(skill);
    return it != m_skill_practice.end() ? it->second : 0;
}

void Combatant::add_action(Action action) {
    m_actions.push_back(std::move(action));
}

void Combatant::equip(Equipment item) {
    m_equipment.push_back(std::move(item));
}

bool Combatant::unequip(std::string_view item_id) {
    auto it = std::find_if(m_equipment.begin(), m_equipment.end(),
        [item_id](const Equipment& e) { return e.id == item_id; });
    if (it == m_equipment.end()) {
        return false;
    }
    m_equipment.erase(it);
    return true;
}

void Combatant::learn_spell(Spell spell) {
    m_spells.push_back(std::move(spell));
}

// =============================================================================
// ICombatant helpers
// =============================================================================

float ICombatant::take_damage(float amount) {
    float before = current_hp();
    set_current_hp(before - amount);
    return before - current_hp();
}

float ICombatant::heal(float amount) {
    float before = current_hp();
    set_current_hp(before + amount);
    return current_hp() - before;
}

bool ICombatant::spend_mana(float amount) {
    if (amount > current_mana()) {
        return false;
    }
    set_current_mana(current_mana() - amount);
    return true;
}

} // namespace skirmish_combat
