/// @file scheduler.cpp
/// @brief Turn scheduler implementation for skirmish_combat module

#include <skirmish/combat/scheduler.hpp>
#include <skirmish/combat/combatant.hpp>
#include <skirmish/combat/effects.hpp>
#include <skirmish/combat/turn_state.hpp>
#include <skirmish/core/log.hpp>

#include <random>
#include <utility>

namespace skirmish_combat {

TurnScheduler::TurnScheduler(std::vector<ICombatant*> order, EffectLedger& ledger)
    : m_order(std::move(order))
    , m_ledger(&ledger) {
}

TurnScheduler::~TurnScheduler() = default;

std::vector<ICombatant*> TurnScheduler::shuffle_initiative(std::vector<ICombatant*> roster, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    for (std::size_t i = roster.size(); i > 1; --i) {
        std::uniform_int_distribution<std::size_t> pick(0, i - 1);
        std::swap(roster[i - 1], roster[pick(rng)]);
    }
    return roster;
}

bool TurnScheduler::advance(TurnState& turn) {
    if (m_order.empty()) return false;

    const std::size_t count = m_order.size();
    for (std::size_t step = 0; step < count; ++step) {
        m_ledger->tick_all(turn);
        ++m_ticks;
        m_index = (m_index + 1) % count;

        if (m_order[m_index]->is_alive()) {
            ++m_turns;
            return true;
        }
        skirmish_core::combat_logger()->trace("Skipping downed '{}'", m_order[m_index]->id());
    }

    skirmish_core::combat_logger()->warn("No living participant left in initiative order");
    return false;
}

bool TurnScheduler::seek_living() {
    const std::size_t count = m_order.size();
    for (std::size_t step = 0; step < count; ++step) {
        std::size_t index = (m_index + step) % count;
        if (m_order[index]->is_alive()) {
            m_index = index;
            return true;
        }
    }
    return false;
}

} // namespace skirmish_combat
