/// @file scheduler.hpp
/// @brief Initiative order and turn pointer for skirmish_combat

#pragma once

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace skirmish_combat {

/// @brief Cycles through a fixed initiative queue, skipping downed combatants
///
/// Every step of the pointer ticks the effect ledger once, downed combatants
/// included, so effects decay in real turn order.
class TurnScheduler {
public:
    /// @param order Initiative queue, used as given
    /// @param ledger Ledger ticked on every step
    TurnScheduler(std::vector<ICombatant*> order, EffectLedger& ledger);
    ~TurnScheduler();

    TurnScheduler(const TurnScheduler&) = delete;
    TurnScheduler& operator=(const TurnScheduler&) = delete;

    /// @brief Random permutation of a roster (Fisher-Yates over mt19937_64)
    [[nodiscard]] static std::vector<ICombatant*> shuffle_initiative(std::vector<ICombatant*> roster,
                                                                     std::uint64_t seed);

    /// @brief Move to the next living participant
    /// @param turn Snapshot handed to effect callbacks while ticking
    /// @return False if a whole cycle found nobody alive; the pointer is then unchanged
    bool advance(TurnState& turn);

    /// @brief Move the pointer to the first living participant at or after it, without ticking
    bool seek_living();

    [[nodiscard]] ICombatant& current() const { return *m_order[m_index]; }
    [[nodiscard]] std::size_t current_index() const { return m_index; }
    [[nodiscard]] const std::vector<ICombatant*>& order() const { return m_order; }
    [[nodiscard]] std::size_t participant_count() const { return m_order.size(); }

    /// @brief Pointer steps taken, skipped participants included
    [[nodiscard]] std::uint64_t ticks_elapsed() const { return m_ticks; }

    /// @brief Completed advance() calls
    [[nodiscard]] std::uint64_t turns_advanced() const { return m_turns; }

private:
    std::vector<ICombatant*> m_order;
    EffectLedger* m_ledger;
    std::size_t m_index{0};
    std::uint64_t m_ticks{0};
    std::uint64_t m_turns{0};
};

} // namespace skirmish_combat
