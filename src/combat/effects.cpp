/// @file effects.cpp
/// @brief Effect ledger implementation for skirmish_combat module

#include <skirmish/combat/effects.hpp>
#include <skirmish/combat/combatant.hpp>
#include <skirmish/combat/turn_state.hpp>
#include <skirmish/core/log.hpp>

#include <algorithm>

namespace skirmish_combat {

namespace {

/// Clears the ticking flag when a pass ends, also on exceptions from callbacks
struct TickingGuard {
    bool& flag;
    explicit TickingGuard(bool& f) : flag(f) { flag = true; }
    ~TickingGuard() { flag = false; }
};

} // anonymous namespace

// =============================================================================
// EffectLedger Implementation
// =============================================================================

EffectLedger::EffectLedger() = default;

EffectLedger::EffectLedger(std::size_t participant_count) {
    set_participant_count(participant_count);
}

EffectLedger::~EffectLedger() = default;

std::uint32_t EffectLedger::ticks_for(std::uint32_t rounds) const {
    return rounds * static_cast<std::uint32_t>(m_participant_count);
}

EffectLedger::Record* EffectLedger::find_record(EffectKind kind, const CombatantId& target) {
    auto it = std::find_if(m_records.begin(), m_records.end(), [&](const Record& r) {
        return !r.removed && r.effect.kind == kind && r.effect.target == target;
    });
    return it != m_records.end() ? &(*it) : nullptr;
}

const EffectLedger::Record* EffectLedger::find_record(EffectKind kind, const CombatantId& target) const {
    auto it = std::find_if(m_records.begin(), m_records.end(), [&](const Record& r) {
        return !r.removed && r.effect.kind == kind && r.effect.target == target;
    });
    return it != m_records.end() ? &(*it) : nullptr;
}

ApplyOutcome EffectLedger::apply(const EffectSpec& effect, const CombatantId& target) {
    auto logger = skirmish_core::combat_logger();
    ApplyOutcome outcome = ApplyOutcome::Created;

    if (Record* existing = find_record(effect.kind, target)) {
        outcome = ApplyOutcome::Merged;
        EffectSpec& current = existing->effect.spec;

        auto incoming_rate = effect.rate();
        auto current_rate = current.rate();
        if (incoming_rate && current_rate && *incoming_rate > *current_rate) {
            current.magnitude = effect.magnitude;
            current.duration = effect.duration;
            if (effect.on_tick) {
                current.on_tick = effect.on_tick;
            }
            outcome = ApplyOutcome::Replaced;
        }

        existing->effect.remaining_ticks += ticks_for(effect.duration);
        logger->debug("{} on '{}' {} ({} ticks left)", effect_kind_name(effect.kind), target,
                      outcome == ApplyOutcome::Replaced ? "replaced" : "extended",
                      existing->effect.remaining_ticks);
    } else if (effect.duration == 0) {
        // Nothing is recorded, but an instant effect still breaks concentration below
        logger->debug("{} on '{}' ignored: zero duration", effect_kind_name(effect.kind), target);
        outcome = ApplyOutcome::Ignored;
    } else {
        Record record;
        record.effect.kind = effect.kind;
        record.effect.target = target;
        record.effect.remaining_ticks = ticks_for(effect.duration);
        record.effect.spec = effect;
        m_records.push_back(std::move(record));
        logger->debug("{} applied to '{}' for {} rounds", effect_kind_name(effect.kind), target,
                      effect.duration);
    }

    interrupt(effect, target);

    if (m_on_applied) {
        m_on_applied(effect.kind, target, outcome);
    }

    return outcome;
}

void EffectLedger::interrupt(const EffectSpec& incoming, const CombatantId& target) {
    if (!incoming.blocks_somatic && !incoming.blocks_verbal) return;

    std::vector<EffectKind> interrupted;
    for (const auto& record : m_records) {
        const ActiveEffect& active = record.effect;
        if (record.removed || active.target != target || active.kind == incoming.kind) continue;
        if (active.spec.components == SpellComponent::None) continue;
        if (incoming.blocks_any(active.spec.components)) {
            interrupted.push_back(active.kind);
        }
    }

    for (EffectKind kind : interrupted) {
        skirmish_core::combat_logger()->info("{} on '{}' interrupted by {}", effect_kind_name(kind), target,
                                             effect_kind_name(incoming.kind));
        remove(kind, target);
    }
}

bool EffectLedger::remove(EffectKind kind, const CombatantId& target) {
    auto it = std::find_if(m_records.begin(), m_records.end(), [&](const Record& r) {
        return !r.removed && r.effect.kind == kind && r.effect.target == target;
    });
    if (it == m_records.end()) {
        return false;
    }

    if (m_ticking) {
        it->removed = true;
    } else {
        m_records.erase(it);
    }

    if (m_on_removed) {
        m_on_removed(kind, target);
    }
    return true;
}

void EffectLedger::tick_all(TurnState& turn) {
    auto logger = skirmish_core::combat_logger();
    const std::size_t count = m_records.size();
    {
        TickingGuard guard(m_ticking);

        for (std::size_t i = 0; i < count; ++i) {
            if (m_records[i].removed) continue;

            // Callbacks may append records, so re-index after each call
            {
                const ActiveEffect& active = m_records[i].effect;
                const bool round_boundary = active.remaining_ticks % m_participant_count == 0;
                if (active.spec.on_tick && (round_boundary || active.spec.tick_every_turn)) {
                    ICombatant* target = m_resolve ? m_resolve(active.target) : nullptr;
                    if (target) {
                        auto callback = active.spec.on_tick;
                        callback(*target, turn);
                    } else {
                        logger->warn("{} tick skipped: unknown target '{}'", effect_kind_name(active.kind),
                                     active.target);
                    }
                }
            }

            Record& record = m_records[i];
            if (record.removed) continue;

            if (record.effect.remaining_ticks > 0) {
                --record.effect.remaining_ticks;
            }

            if (record.effect.remaining_ticks == 0) {
                logger->debug("{} on '{}' expired", effect_kind_name(record.effect.kind), record.effect.target);
                if (record.effect.spec.on_expire) {
                    ICombatant* target = m_resolve ? m_resolve(record.effect.target) : nullptr;
                    if (target) {
                        auto callback = record.effect.spec.on_expire;
                        TurnState expiring = turn.with_active(*target);
                        callback(expiring);
                    } else {
                        logger->warn("{} expiry skipped: unknown target '{}'",
                                     effect_kind_name(record.effect.kind), record.effect.target);
                    }
                }
            }
        }
    }

    purge();
}

void EffectLedger::purge() {
    m_records.erase(std::remove_if(m_records.begin(), m_records.end(), [](const Record& r) {
        return r.removed || r.effect.remaining_ticks == 0;
    }), m_records.end());
}

const ActiveEffect* EffectLedger::find(EffectKind kind, const CombatantId& target) const {
    const Record* record = find_record(kind, target);
    return record ? &record->effect : nullptr;
}

std::vector<const ActiveEffect*> EffectLedger::effects_on(const CombatantId& target) const {
    std::vector<const ActiveEffect*> result;
    for (const auto& record : m_records) {
        if (!record.removed && record.effect.target == target) {
            result.push_back(&record.effect);
        }
    }
    return result;
}

bool EffectLedger::blocks_action(const CombatantId& target) const {
    return std::any_of(m_records.begin(), m_records.end(), [&](const Record& r) {
        return !r.removed && r.effect.target == target && r.effect.spec.blocks_action;
    });
}

std::vector<ActiveEffect> EffectLedger::snapshot() const {
    std::vector<ActiveEffect> result;
    result.reserve(m_records.size());
    for (const auto& record : m_records) {
        if (!record.removed) {
            result.push_back(record.effect);
        }
    }
    return result;
}

std::size_t EffectLedger::size() const {
    return static_cast<std::size_t>(std::count_if(m_records.begin(), m_records.end(),
        [](const Record& r) { return !r.removed; }));
}

// =============================================================================
// EffectPresets Implementation
// =============================================================================

EffectSpec EffectPresets::staggered(std::uint32_t rounds) {
    EffectSpec spec;
    spec.kind = EffectKind::Staggered;
    spec.duration = rounds;
    spec.blocks_action = true;
    spec.blocks_somatic = true;
    return spec;
}

EffectSpec EffectPresets::blocking(const CombatantId& blocker, std::uint32_t rounds) {
    EffectSpec spec;
    spec.kind = EffectKind::Blocking;
    spec.duration = rounds;
    spec.source = blocker;
    return spec;
}

EffectSpec EffectPresets::burning(float total_damage, std::uint32_t rounds) {
    EffectSpec spec;
    spec.kind = EffectKind::Burning;
    spec.duration = rounds;
    spec.magnitude = total_damage;

    const float per_round = rounds > 0 ? total_damage / static_cast<float>(rounds) : total_damage;
    spec.on_tick = [per_round](ICombatant& target, TurnState& /*turn*/) {
        target.take_damage(std::min(per_round, target.current_hp()));
        skirmish_core::combat_logger()->info("{} burns for {:.2f}", target.name(), per_round);
    };
    return spec;
}

EffectSpec EffectPresets::casting(std::uint32_t rounds, SpellComponent components,
                                  EffectSpec::ExpireCallback on_complete) {
    EffectSpec spec;
    spec.kind = EffectKind::Casting;
    spec.duration = rounds;
    spec.components = components;
    spec.on_expire = std::move(on_complete);
    return spec;
}

} // namespace skirmish_combat
