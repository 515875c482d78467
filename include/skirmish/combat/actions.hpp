/// @file actions.hpp
/// @brief Action contract, validation and execution for skirmish_combat

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <skirmish/core/error.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skirmish_combat {

// =============================================================================
// Action Contract
// =============================================================================

/// @brief Who an action may be aimed at this turn
struct TargetQuery {
    ICombatant& actor;
    const Party& allies;
    const Party& enemies;
};

/// @brief Arguments passed to Action::execute
struct ExecuteParams {
    ICombatant* target{nullptr};
    TurnState& turn;
};

/// @brief Something a combatant can do on its turn
///
/// Sub-actions (a specific potion under "Items", a specific spell under
/// "Spells") name the offered category in parent_id; they are accepted
/// whenever the parent is offered.
struct Action {
    using ExecuteFunc = std::function<ActionOutcome(const ExecuteParams& params)>;
    using TargetFunc = std::function<std::vector<ICombatant*>(const TargetQuery& query)>;

    ActionId id;
    std::optional<ActionId> parent_id;
    std::string name;
    std::string description;
    ActionType type{ActionType::Null};
    std::optional<SkillId> related_skill;
    ExecuteFunc execute;
    TargetFunc available_targets;

    /// @brief Null actions resolve without a target
    [[nodiscard]] bool requires_target() const { return type != ActionType::Null; }

    /// @brief True if this action is the offered one or one of its sub-actions
    [[nodiscard]] bool matches(const Action& offered) const {
        return id == offered.id || (parent_id && *parent_id == offered.id);
    }

    /// @brief Candidate targets; empty when no target function is set
    [[nodiscard]] std::vector<ICombatant*> targets(const TargetQuery& query) const {
        return available_targets ? available_targets(query) : std::vector<ICombatant*>{};
    }
};

/// @brief A turn consumer's choice
struct Decision {
    std::optional<Action> action;
    ICombatant* target{nullptr};

    /// @brief An action is present and either needs no target or has one
    [[nodiscard]] bool is_actionable() const {
        return action.has_value() && (!action->requires_target() || target != nullptr);
    }
};

/// @brief The single action offered to an incapacitated combatant
Action make_null_action();

// =============================================================================
// Targeting Helpers
// =============================================================================

namespace targeting {

/// @brief Every enemy
Action::TargetFunc hostile();

/// @brief Every ally, the actor included
Action::TargetFunc friendly();

/// @brief The actor only
Action::TargetFunc self();

/// @brief Keep only combatants with HP above zero
Action::TargetFunc living(Action::TargetFunc inner);

/// @brief Keep only downed combatants
Action::TargetFunc downed(Action::TargetFunc inner);

} // namespace targeting

// =============================================================================
// Action Executor
// =============================================================================

/// @brief Validates submitted actions against the offer and runs them
class ActionExecutor {
public:
    ActionExecutor();
    explicit ActionExecutor(TurnScheduler* scheduler);
    ~ActionExecutor();

    /// @brief Actions a participant may choose from this turn
    ///
    /// An action-blocking effect reduces the offer to the null action;
    /// otherwise intrinsic actions, then equipment actions, then spells.
    [[nodiscard]] static std::vector<Action> offer_actions(const ICombatant& participant,
                                                           const EffectLedger& ledger);

    /// @brief Execution report
    struct Report {
        ActionOutcome outcome;
        bool advanced{false};
    };

    /// @brief Check the action against the turn's offer, execute it, advance on a consuming outcome
    ///
    /// Fails with CombatError::Kind::ActionNotAvailable, without executing
    /// anything, when the action is neither offered nor a sub-action of an
    /// offered action.
    skirmish_core::Result<Report> validate_and_execute(const Action& action, ICombatant* target,
                                                       TurnState& turn);

    /// @brief Check an action against an offer without executing it
    [[nodiscard]] static bool is_offered(const Action& action, const std::vector<Action>& offered);

    // Collaborators
    void set_scheduler(TurnScheduler* scheduler) { m_scheduler = scheduler; }
    [[nodiscard]] TurnScheduler* scheduler() const { return m_scheduler; }

    using WinCheckFunc = std::function<void()>;
    void set_win_check(WinCheckFunc func) { m_win_check = std::move(func); }

    // Statistics
    [[nodiscard]] std::uint64_t executed_count() const { return m_executed; }
    [[nodiscard]] std::uint64_t rejected_count() const { return m_rejected; }

private:
    TurnScheduler* m_scheduler{nullptr};
    WinCheckFunc m_win_check;
    std::uint64_t m_executed{0};
    std::uint64_t m_rejected{0};
};

} // namespace skirmish_combat
