/// @file encounter.cpp
/// @brief Encounter controller implementation for skirmish_combat module

#include <skirmish/combat/encounter.hpp>
#include <skirmish/combat/combatant.hpp>
#include <skirmish/core/log.hpp>

#include <algorithm>
#include <random>
#include <string>
#include <unordered_set>

namespace skirmish_combat {

using skirmish_core::CombatError;
using skirmish_core::Err;
using skirmish_core::Ok;
using skirmish_core::Result;

Encounter::Encounter(Party first, Party second, EncounterConfig config)
    : m_first(std::move(first))
    , m_second(std::move(second))
    , m_config(std::move(config))
    , m_ledger(m_first.size() + m_second.size()) {
    m_ledger.set_resolver([this](const CombatantId& id) { return find_combatant(id); });
    m_ledger.on_effect_applied([this](EffectKind, const CombatantId&, ApplyOutcome outcome) {
        if (outcome != ApplyOutcome::Ignored) {
            ++m_stats.effects_applied;
        }
    });
    m_executor.set_win_check([this]() { check_finish(); });
}

Encounter::~Encounter() = default;

// =============================================================================
// Setup
// =============================================================================

Result<void> Encounter::validate_roster() const {
    if (m_first.empty() || m_second.empty()) {
        return Err(CombatError::invalid_roster("both parties need at least one combatant"));
    }

    std::unordered_set<CombatantId> seen;
    for (const Party* side : {&m_first, &m_second}) {
        for (const ICombatant* combatant : *side) {
            if (!combatant) {
                return Err(CombatError::invalid_roster("null combatant"));
            }
            if (!seen.insert(combatant->id()).second) {
                return Err(CombatError::invalid_roster("duplicate combatant id '" + combatant->id() + "'"));
            }
        }
    }
    return Ok();
}

Result<std::vector<ICombatant*>> Encounter::initiative_order() const {
    std::vector<ICombatant*> roster;
    roster.reserve(m_first.size() + m_second.size());
    roster.insert(roster.end(), m_first.begin(), m_first.end());
    roster.insert(roster.end(), m_second.begin(), m_second.end());

    if (m_config.initiative_order.empty()) {
        std::uint64_t seed = m_config.seed ? *m_config.seed : std::random_device{}();
        return Ok(TurnScheduler::shuffle_initiative(std::move(roster), seed));
    }

    if (m_config.initiative_order.size() != roster.size()) {
        return Err<std::vector<ICombatant*>>(
            CombatError::invalid_roster("initiative order must list every combatant exactly once"));
    }

    std::vector<ICombatant*> order;
    order.reserve(roster.size());
    for (const auto& id : m_config.initiative_order) {
        auto it = std::find_if(roster.begin(), roster.end(),
            [&id](const ICombatant* c) { return c && c->id() == id; });
        if (it == roster.end()) {
            return Err<std::vector<ICombatant*>>(
                CombatError::invalid_roster("initiative order names unknown or repeated id '" + id + "'"));
        }
        order.push_back(*it);
        *it = nullptr;
    }
    return Ok(std::move(order));
}

Result<Step> Encounter::start() {
    SKIRMISH_LOG_FUNC();

    if (m_state != EncounterState::Idle) {
        return Err<Step>(CombatError::invalid_state("encounter already started"));
    }

    if (auto valid = validate_roster(); !valid) {
        skirmish_core::debug::record_error(valid.error());
        return Err<Step>(valid.error());
    }

    auto order = initiative_order();
    if (!order) {
        skirmish_core::debug::record_error(order.error());
        return Err<Step>(order.error());
    }

    auto logger = skirmish_core::combat_logger();
    std::string names;
    for (const ICombatant* combatant : *order) {
        if (!names.empty()) names += ", ";
        names += combatant->name();
    }
    logger->info("Initiative: {}", names);

    m_scheduler = std::make_unique<TurnScheduler>(std::move(*order), m_ledger);
    m_executor.set_scheduler(m_scheduler.get());
    m_scheduler->seek_living();

    check_finish();
    return run(std::nullopt);
}

Result<Step> Encounter::resume(Decision decision) {
    if (m_state != EncounterState::AwaitingDecision || !m_turn) {
        return Err<Step>(CombatError::invalid_state(
            std::string("resume called while ") + encounter_state_name(m_state)));
    }
    return run(std::move(decision));
}

// =============================================================================
// Turn Loop
// =============================================================================

Result<Step> Encounter::run(std::optional<Decision> supplied) {
    while (!m_result) {
        if (!supplied) {
            m_turn = build_turn_state();
            ICombatant& actor = m_turn->active();

            if (actor.control_mode() == ControlMode::External) {
                m_state = EncounterState::AwaitingDecision;
                return Ok(Step{*m_turn});
            }

            m_state = EncounterState::Resolving;
            supplied = actor.decide(*m_turn);
        }

        Decision decision = std::move(*supplied);
        supplied.reset();
        m_state = EncounterState::Resolving;

        auto resolved = resolve(decision);
        if (!resolved) {
            m_state = EncounterState::AwaitingDecision;
            return Err<Step>(resolved.error());
        }

        if (*resolved) {
            m_stalled = 0;
            continue;
        }

        ++m_stats.decisions_skipped;
        if (m_turn->active().control_mode() == ControlMode::Autonomous) {
            ++m_stalled;
            if (m_config.max_stalled_decisions > 0 && m_stalled >= m_config.max_stalled_decisions) {
                auto error = CombatError::stalled(m_turn->active().id(), m_stalled);
                m_stalled = 0;
                m_state = EncounterState::AwaitingDecision;
                skirmish_core::debug::record_error(error);
                return Err<Step>(error);
            }
        }
    }

    m_state = EncounterState::Finished;
    m_turn.reset();
    if (m_config.verbose) {
        Stats totals = stats();
        skirmish_core::log_structured(spdlog::level::info, "combat", "Encounter finished", {
            {"winner", std::to_string(m_result->winner)},
            {"turns", std::to_string(totals.turns_advanced)},
            {"actions", std::to_string(totals.actions_executed)},
            {"effects", std::to_string(totals.effects_applied)},
        });
    }
    return Ok(Step{*m_result});
}

Result<bool> Encounter::resolve(const Decision& decision) {
    ICombatant& actor = m_turn->active();

    if (decision.action && decision.action->related_skill &&
        actor.control_mode() == ControlMode::External) {
        actor.practice_skill(*decision.action->related_skill);
    }

    if (!decision.is_actionable()) {
        skirmish_core::combat_logger()->debug("'{}' made no complete decision", actor.id());
        return Ok(false);
    }

    auto executed = m_executor.validate_and_execute(*decision.action, decision.target, *m_turn);
    if (!executed) {
        skirmish_core::debug::record_error(executed.error());
        return Err<bool>(executed.error());
    }

    report(*decision.action, decision.target, executed->outcome);
    return Ok(true);
}

TurnState Encounter::build_turn_state() {
    ICombatant& actor = m_scheduler->current();
    const bool first_side = std::find(m_first.begin(), m_first.end(), &actor) != m_first.end();
    const Party& allies = first_side ? m_first : m_second;
    const Party& enemies = first_side ? m_second : m_first;

    return TurnState(actor, ActionExecutor::offer_actions(actor, m_ledger), allies, enemies, m_ledger);
}

void Encounter::check_finish() {
    if (m_result) return;

    if (party_hp(0) <= 0) {
        m_result = CombatResult{1};
    } else if (party_hp(1) <= 0) {
        m_result = CombatResult{0};
    }
}

void Encounter::report(const Action& action, ICombatant* target, const ActionOutcome& outcome) const {
    if (!m_config.verbose) return;

    auto magnitude = outcome_magnitude(outcome);
    if (!magnitude) return;

    skirmish_core::combat_logger()->info("{} uses {} on {}: {:.2f} ({})",
        m_turn->active().name(), action.name,
        target ? target->name() : std::string_view("-"),
        *magnitude, action_type_name(action.type));
}

// =============================================================================
// Queries
// =============================================================================

std::optional<PartyIndex> Encounter::party_of(const CombatantId& id) const {
    auto has = [&id](const Party& side) {
        return std::any_of(side.begin(), side.end(),
            [&id](const ICombatant* c) { return c && c->id() == id; });
    };
    if (has(m_first)) return PartyIndex{0};
    if (has(m_second)) return PartyIndex{1};
    return std::nullopt;
}

ICombatant* Encounter::find_combatant(const CombatantId& id) const {
    for (const Party* side : {&m_first, &m_second}) {
        for (ICombatant* combatant : *side) {
            if (combatant && combatant->id() == id) {
                return combatant;
            }
        }
    }
    return nullptr;
}

float Encounter::party_hp(PartyIndex index) const {
    float total = 0;
    for (const ICombatant* combatant : party(index)) {
        if (combatant) {
            total += combatant->current_hp();
        }
    }
    return total;
}

Encounter::Stats Encounter::stats() const {
    Stats stats = m_stats;
    stats.turns_advanced = m_scheduler ? m_scheduler->turns_advanced() : 0;
    stats.actions_executed = m_executor.executed_count();
    stats.actions_rejected = m_executor.rejected_count();
    return stats;
}

} // namespace skirmish_combat
