/// @file effects.hpp
/// @brief Status effect ledger for skirmish_combat

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skirmish_combat {

// =============================================================================
// Effect Specification
// =============================================================================

/// @brief Declarative description of a status effect, as handed to apply_effect
struct EffectSpec {
    using TickCallback = std::function<void(ICombatant& target, TurnState& turn)>;
    using ExpireCallback = std::function<void(TurnState& turn)>;

    EffectKind kind{EffectKind::Staggered};
    std::uint32_t duration{1};                       ///< In rounds
    bool blocks_action{false};                       ///< Target is offered only the null action
    bool blocks_somatic{false};                      ///< Interrupts effects requiring Somatic
    bool blocks_verbal{false};                       ///< Interrupts effects requiring Verbal
    SpellComponent components{SpellComponent::None}; ///< Components this effect requires
    std::optional<float> magnitude;                  ///< Total strength over the duration
    bool tick_every_turn{false};                     ///< Fire on_tick on every tick, not once per round
    TickCallback on_tick;
    ExpireCallback on_expire;                        ///< Turn's active combatant is the target
    std::optional<CombatantId> source;               ///< Combatant that applied it (e.g. the blocker)

    /// @brief Magnitude per round, used to compare stacking strength
    [[nodiscard]] std::optional<float> rate() const {
        if (!magnitude || duration == 0) return std::nullopt;
        return *magnitude / static_cast<float>(duration);
    }

    /// @brief Check whether this effect blocks any of the given components
    [[nodiscard]] bool blocks_any(SpellComponent required) const {
        return (blocks_somatic && has_component(required, SpellComponent::Somatic)) ||
               (blocks_verbal && has_component(required, SpellComponent::Verbal));
    }
};

/// @brief Ledger record of an effect currently active on a combatant
struct ActiveEffect {
    EffectKind kind{EffectKind::Staggered};
    CombatantId target;
    std::uint32_t remaining_ticks{0};
    EffectSpec spec;

    /// @brief Whole rounds left, rounded up
    [[nodiscard]] std::uint32_t remaining_rounds(std::size_t participant_count) const {
        if (participant_count == 0) return remaining_ticks;
        auto n = static_cast<std::uint32_t>(participant_count);
        return (remaining_ticks + n - 1) / n;
    }
};

/// @brief What apply() did with an incoming effect
enum class ApplyOutcome : std::uint8_t {
    Created,    ///< New record
    Merged,     ///< Existing record extended
    Replaced,   ///< Existing record extended and overwritten by a stronger effect
    Ignored,    ///< Zero duration with nothing to merge into
};

// =============================================================================
// Effect Ledger
// =============================================================================

/// @brief Owns every active effect of an encounter and their countdowns
///
/// Durations are declared in rounds and tracked in ticks: one tick per
/// individual turn advance, participant_count ticks per round. Per-tick
/// callbacks fire on round boundaries (remaining_ticks % participant_count == 0)
/// unless the effect asks to fire on every tick.
///
/// Callbacks may apply or remove effects while a tick pass is running.
/// Removals are deferred to the end of the pass and records created during the
/// pass are not ticked by it.
class EffectLedger {
public:
    EffectLedger();
    explicit EffectLedger(std::size_t participant_count);
    ~EffectLedger();

    EffectLedger(const EffectLedger&) = delete;
    EffectLedger& operator=(const EffectLedger&) = delete;

    /// @brief Apply an effect to a target, merging into an existing record of the same kind
    ApplyOutcome apply(const EffectSpec& effect, const CombatantId& target);

    /// @brief Remove the effect of a kind from a target; no-op when absent
    /// @return True if a record was removed
    bool remove(EffectKind kind, const CombatantId& target);

    /// @brief Advance every record by one tick
    void tick_all(TurnState& turn);

    // Queries
    [[nodiscard]] const ActiveEffect* find(EffectKind kind, const CombatantId& target) const;
    [[nodiscard]] std::vector<const ActiveEffect*> effects_on(const CombatantId& target) const;
    [[nodiscard]] bool blocks_action(const CombatantId& target) const;
    [[nodiscard]] std::vector<ActiveEffect> snapshot() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

    // Configuration
    void set_participant_count(std::size_t count) { m_participant_count = count > 0 ? count : 1; }
    [[nodiscard]] std::size_t participant_count() const { return m_participant_count; }

    /// @brief Resolve a target id to a combatant for callbacks
    using ResolveFunc = std::function<ICombatant*(const CombatantId& id)>;
    void set_resolver(ResolveFunc func) { m_resolve = std::move(func); }

    // Callbacks
    using EffectAppliedCallback = std::function<void(EffectKind kind, const CombatantId& target, ApplyOutcome outcome)>;
    using EffectRemovedCallback = std::function<void(EffectKind kind, const CombatantId& target)>;

    void on_effect_applied(EffectAppliedCallback callback) { m_on_applied = std::move(callback); }
    void on_effect_removed(EffectRemovedCallback callback) { m_on_removed = std::move(callback); }

private:
    struct Record {
        ActiveEffect effect;
        bool removed{false};
    };

    Record* find_record(EffectKind kind, const CombatantId& target);
    const Record* find_record(EffectKind kind, const CombatantId& target) const;
    void interrupt(const EffectSpec& incoming, const CombatantId& target);
    void purge();
    [[nodiscard]] std::uint32_t ticks_for(std::uint32_t rounds) const;

    std::vector<Record> m_records;
    std::size_t m_participant_count{1};
    bool m_ticking{false};
    ResolveFunc m_resolve;

    EffectAppliedCallback m_on_applied;
    EffectRemovedCallback m_on_removed;
};

// =============================================================================
// Effect Presets
// =============================================================================

/// @brief Ready-made effects of the standard catalogue
class EffectPresets {
public:
    /// @brief Off balance: no actions, somatic components broken
    static EffectSpec staggered(std::uint32_t rounds = 1);

    /// @brief Shield raised on the target by the blocker
    static EffectSpec blocking(const CombatantId& blocker, std::uint32_t rounds = 1);

    /// @brief Deals total_damage spread evenly over the rounds
    static EffectSpec burning(float total_damage, std::uint32_t rounds);

    /// @brief Channels a spell; on_complete runs when the cast finishes uninterrupted
    static EffectSpec casting(std::uint32_t rounds, SpellComponent components,
                              EffectSpec::ExpireCallback on_complete);
};

} // namespace skirmish_combat
