/// @file main.cpp
/// @brief Duel Demo
///
/// Runs a hero against two wild boars. The boars decide for themselves; the
/// hero is external and driven by a small scripted loop standing in for a UI.
/// An optional JSON encounter configuration can be passed as the first argument
/// and a combat transcript path as the second.

#include <skirmish/combat/combat.hpp>
#include <skirmish/combat/config.hpp>
#include <skirmish/core/log.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <random>
#include <variant>

using namespace skirmish_combat;

namespace {

// =============================================================================
// Catalogue
// =============================================================================

/// Damage reduced by half while the target is behind a raised shield
float mitigated(const TurnState& turn, const ICombatant& target, float damage) {
    if (turn.effects().find(EffectKind::Blocking, target.id())) {
        return damage * 0.5f;
    }
    return damage;
}

ActionOutcome deal(const ExecuteParams& params, float damage) {
    return params.target->take_damage(mitigated(params.turn, *params.target, damage));
}

Equipment make_sword() {
    Action slash;
    slash.id = "SLASH";
    slash.name = "Slash";
    slash.description = "A wide cut with the blade";
    slash.type = ActionType::PhysicalAttack;
    slash.related_skill = "blades";
    slash.available_targets = targeting::living(targeting::hostile());
    slash.execute = [](const ExecuteParams& params) { return deal(params, 8.0f); };
    return Equipment{"iron_sword", "Iron Sword", {slash}};
}

Equipment make_shield() {
    Action block;
    block.id = "BLOCK";
    block.name = "Raise Shield";
    block.description = "Halve incoming damage until the next turn";
    block.type = ActionType::Help;
    block.related_skill = "shields";
    block.available_targets = targeting::self();
    block.execute = [](const ExecuteParams& params) -> ActionOutcome {
        params.turn.apply_effect(EffectPresets::blocking(params.turn.active().id(), 1), params.target->id());
        return true;
    };
    return Equipment{"round_shield", "Round Shield", {block}};
}

Action make_items_menu() {
    Action items;
    items.id = "ITEMS";
    items.name = "Items";
    items.type = ActionType::Item;
    items.available_targets = targeting::self();
    items.execute = [](const ExecuteParams&) -> ActionOutcome { return false; };
    return items;
}

Action make_potion() {
    Action potion;
    potion.id = "POTION";
    potion.parent_id = "ITEMS";
    potion.name = "Healing Potion";
    potion.type = ActionType::Heal;
    potion.available_targets = targeting::living(targeting::friendly());
    potion.execute = [](const ExecuteParams& params) -> ActionOutcome {
        return params.target->heal(25.0f);
    };
    return potion;
}

Action make_molotov() {
    Action molotov;
    molotov.id = "MOLOTOV";
    molotov.parent_id = "ITEMS";
    molotov.name = "Molotov";
    molotov.type = ActionType::DamageOverTime;
    molotov.related_skill = "throwing";
    molotov.available_targets = targeting::living(targeting::hostile());
    molotov.execute = [](const ExecuteParams& params) -> ActionOutcome {
        params.turn.apply_effect(EffectPresets::burning(12.0f, 3), params.target->id());
        return true;
    };
    return molotov;
}

Spell make_fire_bolt() {
    Spell spell;
    spell.id = "fire_bolt";
    spell.name = "Fire Bolt";
    spell.mana_cost = 10.0f;
    spell.components = SpellComponent::Verbal | SpellComponent::Somatic;

    spell.action.id = "FIRE_BOLT";
    spell.action.name = "Fire Bolt";
    spell.action.description = "Channel for a round, then hurl fire";
    spell.action.type = ActionType::Spell;
    spell.action.related_skill = "pyromancy";
    spell.action.available_targets = targeting::living(targeting::hostile());
    spell.action.execute = [components = spell.components, cost = spell.mana_cost](const ExecuteParams& params) -> ActionOutcome {
        ICombatant& caster = params.turn.active();
        if (!caster.spend_mana(cost)) {
            spdlog::info("{} lacks the mana for Fire Bolt", caster.name());
            return false;
        }

        ICombatant* target = params.target;
        params.turn.apply_effect(EffectPresets::casting(1, components, [target](TurnState& turn) {
            if (!target->is_alive()) return;
            float dealt = target->take_damage(18.0f);
            spdlog::info("{}'s Fire Bolt hits {} for {:.0f}", turn.active().name(), target->name(), dealt);
        }), caster.id());
        return true;
    };
    return spell;
}

Action make_gore(float damage) {
    Action gore;
    gore.id = "GORE";
    gore.name = "Gore";
    gore.type = ActionType::PhysicalAttack;
    gore.available_targets = targeting::living(targeting::hostile());
    gore.execute = [damage](const ExecuteParams& params) { return deal(params, damage); };
    return gore;
}

Action make_stomp() {
    Action stomp;
    stomp.id = "STOMP";
    stomp.name = "Stomp";
    stomp.type = ActionType::PhysicalAttack;
    stomp.available_targets = targeting::living(targeting::hostile());
    stomp.execute = [](const ExecuteParams& params) -> ActionOutcome {
        params.turn.apply_effect(EffectPresets::staggered(1), params.target->id());
        return deal(params, 3.0f);
    };
    return stomp;
}

// =============================================================================
// Deciders
// =============================================================================

/// Random offered action at a random candidate target
Combatant::StrategyFunc wild_strategy(std::uint64_t seed) {
    auto rng = std::make_shared<std::mt19937_64>(seed);
    return [rng](const TurnState& turn) {
        const auto& offered = turn.available_actions();
        std::uniform_int_distribution<std::size_t> pick_action(0, offered.size() - 1);
        const Action& action = offered[pick_action(*rng)];

        auto targets = turn.targets_for(action);
        if (targets.empty()) {
            return Decision{action, nullptr};
        }
        std::uniform_int_distribution<std::size_t> pick_target(0, targets.size() - 1);
        return Decision{action, targets[pick_target(*rng)]};
    };
}

/// Scripted stand-in for a player
Decision hero_script(const TurnState& turn, int round) {
    ICombatant& hero = turn.active();

    if (turn.find_action("NULL")) {
        return Decision{*turn.find_action("NULL"), nullptr};
    }

    if (hero.current_hp() < hero.max_hp() * 0.4f) {
        return Decision{make_potion(), &hero};
    }

    auto foes = turn.targets_for(*turn.find_action("SLASH"));
    if (foes.empty()) {
        return Decision{};
    }
    ICombatant* foe = foes.front();

    if (round == 1) {
        return Decision{make_molotov(), foe};
    }
    if (round % 4 == 0) {
        return Decision{*turn.find_action("BLOCK"), &hero};
    }
    if (round % 3 == 0 && hero.current_mana() >= 10.0f) {
        return Decision{*turn.find_action("FIRE_BOLT"), foe};
    }
    return Decision{*turn.find_action("SLASH"), foe};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Usage: duel_demo [encounter.json] [transcript.log]
    skirmish_core::LogSettings log_settings;
    if (argc > 2) {
        log_settings.transcript_path = argv[2];
    }
    if (!skirmish_core::init_logging(log_settings)) {
        spdlog::warn("Continuing without a transcript");
    }
    spdlog::info("=== Duel Demo ===");

    EncounterConfig config;
    if (argc > 1) {
        auto loaded = load_encounter_config(argv[1]);
        if (!loaded) {
            spdlog::error("{}", skirmish_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
        if (!apply_log_level(config)) {
            spdlog::warn("Keeping the default log level");
        }
    }

    Combatant hero(CombatantConfig{"hero", "Aldric", 60.0f, 60.0f, 30.0f, 30.0f});
    hero.add_action(make_items_menu());
    hero.equip(make_sword());
    hero.equip(make_shield());
    hero.learn_spell(make_fire_bolt());
    hero.on_skill_practice([](const SkillId& skill, std::uint32_t total) {
        spdlog::debug("Aldric practised {} ({} total)", skill, total);
    });

    const std::uint64_t seed = config.seed.value_or(2024);
    Combatant tusker(CombatantConfig{"tusker", "Old Tusker", 40.0f, 40.0f});
    tusker.add_action(make_gore(7.0f));
    tusker.add_action(make_stomp());
    tusker.set_strategy(wild_strategy(seed));

    Combatant piglet(CombatantConfig{"piglet", "Piglet", 15.0f, 15.0f});
    piglet.add_action(make_gore(3.0f));
    piglet.set_strategy(wild_strategy(seed + 1));

    Encounter encounter({&hero}, {&tusker, &piglet}, config);
    auto step = encounter.start();

    int round = 0;
    while (step && !is_finished(*step)) {
        const auto& turn = std::get<TurnState>(*step);
        ++round;
        spdlog::info("-- {} ({:.0f} HP, {:.0f} mana) --", turn.active().name(),
                     turn.active().current_hp(), turn.active().current_mana());
        step = encounter.resume(hero_script(turn, round));
    }

    if (!step) {
        spdlog::error("{}", skirmish_core::build_error_chain(step.error()));
        return EXIT_FAILURE;
    }

    const auto& result = std::get<CombatResult>(*step);
    const auto stats = encounter.stats();
    spdlog::info("=== {} ===", result.winner == 0 ? "Aldric is victorious" : "The boars prevail");
    spdlog::info("Turns: {}, actions: {}, effects: {}, blades practised: {}",
                 stats.turns_advanced, stats.actions_executed, stats.effects_applied,
                 hero.skill_practice("blades"));

    skirmish_core::shutdown_logging();
    return EXIT_SUCCESS;
}
