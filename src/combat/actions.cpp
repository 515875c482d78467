/// @file actions.cpp
/// @brief Action validation and execution for skirmish_combat module

#include <skirmish/combat/actions.hpp>
#include <skirmish/combat/combatant.hpp>
#include <skirmish/combat/effects.hpp>
#include <skirmish/combat/scheduler.hpp>
#include <skirmish/combat/turn_state.hpp>
#include <skirmish/core/log.hpp>

#include <algorithm>

namespace skirmish_combat {

Action make_null_action() {
    Action action;
    action.id = "NULL";
    action.name = "ZzZz...";
    action.description = "Cannot act this turn";
    action.type = ActionType::Null;
    action.execute = [](const ExecuteParams&) -> ActionOutcome { return true; };
    action.available_targets = [](const TargetQuery&) { return std::vector<ICombatant*>{}; };
    return action;
}

// =============================================================================
// Targeting Helpers
// =============================================================================

namespace targeting {

Action::TargetFunc hostile() {
    return [](const TargetQuery& query) { return query.enemies; };
}

Action::TargetFunc friendly() {
    return [](const TargetQuery& query) { return query.allies; };
}

Action::TargetFunc self() {
    return [](const TargetQuery& query) {
        return std::vector<ICombatant*>{&query.actor};
    };
}

Action::TargetFunc living(Action::TargetFunc inner) {
    return [inner = std::move(inner)](const TargetQuery& query) {
        auto targets = inner(query);
        targets.erase(std::remove_if(targets.begin(), targets.end(),
            [](const ICombatant* c) { return !c->is_alive(); }), targets.end());
        return targets;
    };
}

Action::TargetFunc downed(Action::TargetFunc inner) {
    return [inner = std::move(inner)](const TargetQuery& query) {
        auto targets = inner(query);
        targets.erase(std::remove_if(targets.begin(), targets.end(),
            [](const ICombatant* c) { return c->is_alive(); }), targets.end());
        return targets;
    };
}

} // namespace targeting

// =============================================================================
// ActionExecutor Implementation
// =============================================================================

ActionExecutor::ActionExecutor() = default;

ActionExecutor::ActionExecutor(TurnScheduler* scheduler)
    : m_scheduler(scheduler) {
}

ActionExecutor::~ActionExecutor() = default;

std::vector<Action> ActionExecutor::offer_actions(const ICombatant& participant, const EffectLedger& ledger) {
    if (ledger.blocks_action(participant.id())) {
        return {make_null_action()};
    }

    std::vector<Action> offered = participant.intrinsic_actions();
    for (const auto& item : participant.equipment()) {
        offered.insert(offered.end(), item.actions.begin(), item.actions.end());
    }
    for (const auto& spell : participant.spells()) {
        offered.push_back(spell.as_action());
    }
    return offered;
}

bool ActionExecutor::is_offered(const Action& action, const std::vector<Action>& offered) {
    return std::any_of(offered.begin(), offered.end(),
        [&action](const Action& candidate) { return action.matches(candidate); });
}

skirmish_core::Result<ActionExecutor::Report> ActionExecutor::validate_and_execute(
    const Action& action, ICombatant* target, TurnState& turn) {

    if (!is_offered(action, turn.available_actions())) {
        ++m_rejected;
        skirmish_core::combat_logger()->warn("'{}' submitted unavailable action '{}'",
                                             turn.active().id(), action.id);
        return skirmish_core::Err<Report>(
            skirmish_core::CombatError::action_not_available(turn.active().id(), action.id));
    }

    Report report;
    if (action.execute) {
        report.outcome = action.execute(ExecuteParams{target, turn});
    }
    ++m_executed;

    if (consumes_turn(report.outcome) && m_scheduler) {
        report.advanced = m_scheduler->advance(turn);
    }

    if (m_win_check) {
        m_win_check();
    }

    return skirmish_core::Ok(std::move(report));
}

} // namespace skirmish_combat
