/// @file combatant.hpp
/// @brief Combatant contract and reference implementation for skirmish_combat

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "actions.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace skirmish_combat {

// =============================================================================
// Equipment and Spells
// =============================================================================

/// @brief Equipped item; items without actions leave the list empty
struct Equipment {
    std::string id;
    std::string name;
    std::vector<Action> actions;
};

/// @brief Known spell, offered as an action
struct Spell {
    std::string id;
    std::string name;
    float mana_cost{0};
    SpellComponent components{SpellComponent::None};
    Action action;

    [[nodiscard]] const Action& as_action() const { return action; }
};

// =============================================================================
// Combatant Interface
// =============================================================================

/// @brief What the engine reads from and writes to a participant
class ICombatant {
public:
    virtual ~ICombatant() = default;

    // Identity
    virtual const CombatantId& id() const = 0;
    virtual std::string_view name() const = 0;

    // Vitals
    virtual float current_hp() const = 0;
    virtual float max_hp() const = 0;
    virtual void set_current_hp(float hp) = 0;
    virtual float current_mana() const = 0;
    virtual float max_mana() const = 0;
    virtual void set_current_mana(float mana) = 0;

    // Offerable actions
    virtual const std::vector<Action>& intrinsic_actions() const = 0;
    virtual const std::vector<Equipment>& equipment() const = 0;
    virtual const std::vector<Spell>& spells() const = 0;

    // Control
    virtual ControlMode control_mode() const = 0;

    /// @brief Synchronous choice; only called for autonomous combatants
    virtual Decision decide(const TurnState& turn) = 0;

    /// @brief Skill practice hook; only called for external combatants
    virtual void practice_skill(const SkillId& skill) = 0;

    [[nodiscard]] bool is_alive() const { return current_hp() > 0; }

    // Vitals helpers over the setters above
    /// @brief Lower HP by amount
    /// @return HP actually removed once the implementation has bounded the value
    float take_damage(float amount);
    /// @return HP actually restored
    float heal(float amount);
    /// @brief Pay a mana cost; leaves mana untouched when it cannot be paid
    bool spend_mana(float amount);
};

// =============================================================================
// Combatant Implementation
// =============================================================================

/// @brief Combatant configuration
struct CombatantConfig {
    CombatantId id;
    std::string name;
    float max_hp{100.0f};
    float current_hp{100.0f};
    float max_mana{0};
    float current_mana{0};
};

/// @brief Standard combatant: vitals, actions, equipment, spells, skills
///
/// External by default; becomes autonomous once a strategy is set.
class Combatant : public ICombatant {
public:
    explicit Combatant(const CombatantConfig& config);
    ~Combatant() override = default;

    // ICombatant interface
    const CombatantId& id() const override { return m_config.id; }
    std::string_view name() const override { return m_config.name; }

    float current_hp() const override { return m_current_hp; }
    float max_hp() const override { return m_config.max_hp; }
    void set_current_hp(float hp) override;
    float current_mana() const override { return m_current_mana; }
    float max_mana() const override { return m_config.max_mana; }
    void set_current_mana(float mana) override;

    const std::vector<Action>& intrinsic_actions() const override { return m_actions; }
    const std::vector<Equipment>& equipment() const override { return m_equipment; }
    const std::vector<Spell>& spells() const override { return m_spells; }

    ControlMode control_mode() const override;
    Decision decide(const TurnState& turn) override;
    void practice_skill(const SkillId& skill) override;

    // Loadout
    void add_action(Action action);
    void equip(Equipment item);
    bool unequip(std::string_view item_id);
    void learn_spell(Spell spell);

    // Strategy
    using StrategyFunc = std::function<Decision(const TurnState& turn)>;
    void set_strategy(StrategyFunc strategy) { m_strategy = std::move(strategy); }

    // Skills
    [[nodiscard]] std::uint32_t skill_practice(const SkillId& skill) const;

    using SkillPracticeCallback = std::function<void(const SkillId& skill, std::uint32_t total)>;
    void on_skill_practice(SkillPracticeCallback callback) { m_on_practice = std::move(callback); }

    [[nodiscard]] const CombatantConfig& config() const { return m_config; }

private:
    CombatantConfig m_config;
    float m_current_hp{0};
    float m_current_mana{0};

    std::vector<Action> m_actions;
    std::vector<Equipment> m_equipment;
    std::vector<Spell> m_spells;
    std::unordered_map<SkillId, std::uint32_t> m_skill_practice;

    StrategyFunc m_strategy;
    SkillPracticeCallback m_on_practice;
};

} // namespace skirmish_combat
