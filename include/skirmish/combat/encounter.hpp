/// @file encounter.hpp
/// @brief Turn-by-turn controller of a two-party encounter

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "actions.hpp"
#include "effects.hpp"
#include "scheduler.hpp"
#include "turn_state.hpp"

#include <skirmish/core/error.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>

namespace skirmish_combat {

/// @brief What a step of the encounter produced: the next turn or the end
using Step = std::variant<TurnState, CombatResult>;

[[nodiscard]] inline bool is_finished(const Step& step) {
    return std::holds_alternative<CombatResult>(step);
}

/// @brief Drives an encounter between two parties until one is down
///
/// Pull-based step machine. start() and resume() run turns until a
/// participant with ControlMode::External must choose, returning that turn's
/// snapshot, or until the encounter is decided, returning the result.
/// Autonomous participants are consulted synchronously in between.
///
/// @code
/// Encounter encounter({&hero}, {&boar, &other_boar}, config);
/// auto step = encounter.start();
/// while (step && !is_finished(*step)) {
///     const auto& turn = std::get<TurnState>(*step);
///     step = encounter.resume(choose(turn));
/// }
/// @endcode
class Encounter {
public:
    Encounter(Party first, Party second, EncounterConfig config = {});
    ~Encounter();

    Encounter(const Encounter&) = delete;
    Encounter& operator=(const Encounter&) = delete;

    /// @brief Fix initiative and run until the first external decision or the result
    skirmish_core::Result<Step> start();

    /// @brief Supply the awaited decision and run until the next external decision or the result
    ///
    /// An incomplete decision (no action, or no target for an action that
    /// needs one) resolves nothing and the same participant is asked again.
    skirmish_core::Result<Step> resume(Decision decision);

    // State
    [[nodiscard]] EncounterState state() const { return m_state; }
    [[nodiscard]] const std::optional<CombatResult>& result() const { return m_result; }
    [[nodiscard]] const TurnState* current_turn() const { return m_turn ? &*m_turn : nullptr; }

    // Components
    [[nodiscard]] const EffectLedger& ledger() const { return m_ledger; }
    [[nodiscard]] const TurnScheduler* scheduler() const { return m_scheduler.get(); }
    [[nodiscard]] const EncounterConfig& config() const { return m_config; }

    // Parties
    [[nodiscard]] const Party& party(PartyIndex index) const { return index == 0 ? m_first : m_second; }
    [[nodiscard]] std::optional<PartyIndex> party_of(const CombatantId& id) const;
    [[nodiscard]] ICombatant* find_combatant(const CombatantId& id) const;

    /// @brief Sum of current HP over a party
    [[nodiscard]] float party_hp(PartyIndex index) const;

    // Statistics
    struct Stats {
        std::uint64_t turns_advanced{0};
        std::uint64_t actions_executed{0};
        std::uint64_t actions_rejected{0};
        std::uint64_t decisions_skipped{0};
        std::uint64_t effects_applied{0};
    };
    [[nodiscard]] Stats stats() const;

private:
    skirmish_core::Result<void> validate_roster() const;
    skirmish_core::Result<std::vector<ICombatant*>> initiative_order() const;
    skirmish_core::Result<Step> run(std::optional<Decision> supplied);
    skirmish_core::Result<bool> resolve(const Decision& decision);
    TurnState build_turn_state();
    void check_finish();
    void report(const Action& action, ICombatant* target, const ActionOutcome& outcome) const;

    Party m_first;
    Party m_second;
    EncounterConfig m_config;

    EffectLedger m_ledger;
    std::unique_ptr<TurnScheduler> m_scheduler;
    ActionExecutor m_executor;

    EncounterState m_state{EncounterState::Idle};
    std::optional<TurnState> m_turn;
    std::optional<CombatResult> m_result;
    std::uint32_t m_stalled{0};

    Stats m_stats;
};

} // namespace skirmish_combat
