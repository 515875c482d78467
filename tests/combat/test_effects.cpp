// skirmish_combat effect ledger tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <skirmish/combat/combat.hpp>

#include <string>
#include <vector>

using namespace skirmish_combat;
using Catch::Matchers::WithinAbs;

namespace {

/// Two combatants and a ledger sized for them
struct LedgerFixture {
    Combatant hero{CombatantConfig{"hero", "Hero", 10.0f, 10.0f}};
    Combatant boar{CombatantConfig{"boar", "Boar", 10.0f, 10.0f}};
    Party first{&hero};
    Party second{&boar};
    EffectLedger ledger{2};

    LedgerFixture() {
        ledger.set_resolver([this](const CombatantId& id) -> ICombatant* {
            if (id == "hero") return &hero;
            if (id == "boar") return &boar;
            return nullptr;
        });
    }

    TurnState turn() { return TurnState(hero, {}, first, second, ledger); }

    void tick(int times) {
        TurnState state = turn();
        for (int i = 0; i < times; ++i) {
            ledger.tick_all(state);
        }
    }
};

EffectSpec counting_effect(EffectKind kind, std::uint32_t rounds, int& fired) {
    EffectSpec spec;
    spec.kind = kind;
    spec.duration = rounds;
    spec.on_tick = [&fired](ICombatant&, TurnState&) { ++fired; };
    return spec;
}

} // anonymous namespace

// =============================================================================
// Apply and Merge
// =============================================================================

TEST_CASE("EffectLedger: apply creates a record", "[combat][effects]") {
    LedgerFixture f;

    REQUIRE(f.ledger.apply(EffectPresets::staggered(1), "boar") == ApplyOutcome::Created);
    REQUIRE(f.ledger.size() == 1);

    const ActiveEffect* effect = f.ledger.find(EffectKind::Staggered, "boar");
    REQUIRE(effect != nullptr);
    REQUIRE(effect->remaining_ticks == 2);
    REQUIRE(effect->remaining_rounds(2) == 1);
    REQUIRE(f.ledger.find(EffectKind::Staggered, "hero") == nullptr);
}

TEST_CASE("EffectLedger: same kind merges instead of duplicating", "[combat][effects]") {
    LedgerFixture f;

    SECTION("extends the countdown") {
        f.ledger.apply(EffectPresets::staggered(1), "boar");
        REQUIRE(f.ledger.apply(EffectPresets::staggered(2), "boar") == ApplyOutcome::Merged);

        REQUIRE(f.ledger.size() == 1);
        REQUIRE(f.ledger.find(EffectKind::Staggered, "boar")->remaining_ticks == 6);
    }

    SECTION("stronger rate replaces magnitude and duration") {
        f.ledger.apply(EffectPresets::burning(4.0f, 2), "boar");
        REQUIRE(f.ledger.apply(EffectPresets::burning(9.0f, 3), "boar") == ApplyOutcome::Replaced);

        const ActiveEffect* effect = f.ledger.find(EffectKind::Burning, "boar");
        REQUIRE(effect->remaining_ticks == 10);
        REQUIRE(effect->spec.duration == 3);
        REQUIRE_THAT(*effect->spec.magnitude, WithinAbs(9.0, 0.001));
    }

    SECTION("weaker rate keeps the current effect") {
        f.ledger.apply(EffectPresets::burning(4.0f, 2), "boar");
        REQUIRE(f.ledger.apply(EffectPresets::burning(2.0f, 2), "boar") == ApplyOutcome::Merged);

        const ActiveEffect* effect = f.ledger.find(EffectKind::Burning, "boar");
        REQUIRE(effect->remaining_ticks == 8);
        REQUIRE_THAT(*effect->spec.magnitude, WithinAbs(4.0, 0.001));
    }

    SECTION("same kind on another target is separate") {
        f.ledger.apply(EffectPresets::staggered(1), "boar");
        REQUIRE(f.ledger.apply(EffectPresets::staggered(1), "hero") == ApplyOutcome::Created);
        REQUIRE(f.ledger.size() == 2);
    }
}

TEST_CASE("EffectLedger: snapshot copies the live records", "[combat][effects]") {
    LedgerFixture f;
    f.ledger.apply(EffectPresets::burning(4.0f, 2), "boar");
    f.ledger.apply(EffectPresets::burning(9.0f, 3), "boar");
    f.ledger.apply(EffectPresets::blocking("hero", 1), "hero");

    std::vector<ActiveEffect> copy = f.ledger.snapshot();
    REQUIRE(copy.size() == 2);

    const ActiveEffect& burning = copy[0].kind == EffectKind::Burning ? copy[0] : copy[1];
    REQUIRE(burning.kind == EffectKind::Burning);
    REQUIRE(burning.target == "boar");
    REQUIRE(burning.remaining_ticks == 10);
    REQUIRE_THAT(*burning.spec.magnitude, WithinAbs(9.0, 0.001));

    f.ledger.remove(EffectKind::Burning, "boar");
    REQUIRE(f.ledger.size() == 1);
    REQUIRE(copy.size() == 2);
}

TEST_CASE("EffectLedger: zero duration", "[combat][effects]") {
    LedgerFixture f;

    SECTION("ignored without an existing record") {
        REQUIRE(f.ledger.apply(EffectPresets::staggered(0), "boar") == ApplyOutcome::Ignored);
        REQUIRE(f.ledger.empty());
    }

    SECTION("merges into an existing record without extending it") {
        f.ledger.apply(EffectPresets::staggered(1), "boar");
        REQUIRE(f.ledger.apply(EffectPresets::staggered(0), "boar") == ApplyOutcome::Merged);
        REQUIRE(f.ledger.find(EffectKind::Staggered, "boar")->remaining_ticks == 2);
    }
}

// =============================================================================
// Ticking
// =============================================================================

TEST_CASE("EffectLedger: two-round effect fires twice over four ticks", "[combat][effects]") {
    LedgerFixture f;
    int fired = 0;
    f.ledger.apply(counting_effect(EffectKind::Burning, 2, fired), "boar");

    f.tick(1);
    REQUIRE(fired == 1);
    f.tick(1);
    REQUIRE(fired == 1);
    f.tick(1);
    REQUIRE(fired == 2);
    f.tick(1);
    REQUIRE(fired == 2);

    REQUIRE(f.ledger.empty());

    f.tick(2);
    REQUIRE(fired == 2);
}

TEST_CASE("EffectLedger: burning preset deals its total over the duration", "[combat][effects]") {
    LedgerFixture f;
    f.ledger.apply(EffectPresets::burning(6.0f, 2), "boar");

    f.tick(4);

    REQUIRE_THAT(f.boar.current_hp(), WithinAbs(4.0, 0.001));
    REQUIRE_THAT(f.hero.current_hp(), WithinAbs(10.0, 0.001));
    REQUIRE(f.ledger.empty());
}

TEST_CASE("EffectLedger: every-turn effects fire on each tick", "[combat][effects]") {
    LedgerFixture f;
    int fired = 0;
    EffectSpec spec = counting_effect(EffectKind::Burning, 1, fired);
    spec.tick_every_turn = true;
    f.ledger.apply(spec, "boar");

    f.tick(2);
    REQUIRE(fired == 2);
    REQUIRE(f.ledger.empty());
}

TEST_CASE("EffectLedger: remaining ticks never increase while ticking", "[combat][effects]") {
    LedgerFixture f;
    f.ledger.apply(EffectPresets::burning(3.0f, 3), "boar");

    std::uint32_t previous = f.ledger.find(EffectKind::Burning, "boar")->remaining_ticks;
    for (int i = 0; i < 5; ++i) {
        f.tick(1);
        const ActiveEffect* effect = f.ledger.find(EffectKind::Burning, "boar");
        REQUIRE(effect != nullptr);
        REQUIRE(effect->remaining_ticks == previous - 1);
        previous = effect->remaining_ticks;
    }
}

TEST_CASE("EffectLedger: expiry runs with the target as active combatant", "[combat][effects]") {
    LedgerFixture f;
    std::string active_on_expire;
    int expired = 0;

    f.ledger.apply(EffectPresets::casting(1, SpellComponent::Verbal, [&](TurnState& turn) {
        active_on_expire = turn.active().id();
        ++expired;
    }), "boar");

    f.tick(1);
    REQUIRE(expired == 0);
    f.tick(1);
    REQUIRE(expired == 1);
    REQUIRE(active_on_expire == "boar");
    REQUIRE(f.ledger.empty());
}

TEST_CASE("EffectLedger: action blocking", "[combat][effects]") {
    LedgerFixture f;
    f.ledger.apply(EffectPresets::staggered(1), "boar");

    REQUIRE(f.ledger.blocks_action("boar"));
    REQUIRE_FALSE(f.ledger.blocks_action("hero"));

    f.tick(2);
    REQUIRE_FALSE(f.ledger.blocks_action("boar"));
}

// =============================================================================
// Interruption
// =============================================================================

TEST_CASE("EffectLedger: blocked components interrupt concentration", "[combat][effects]") {
    LedgerFixture f;
    int completed = 0;
    auto on_complete = [&completed](TurnState&) { ++completed; };

    SECTION("somatic cast broken by stagger") {
        f.ledger.apply(EffectPresets::casting(2, SpellComponent::Somatic, on_complete), "boar");
        f.ledger.apply(EffectPresets::staggered(1), "boar");

        REQUIRE(f.ledger.find(EffectKind::Casting, "boar") == nullptr);
        REQUIRE(f.ledger.find(EffectKind::Staggered, "boar") != nullptr);

        f.tick(4);
        REQUIRE(completed == 0);
    }

    SECTION("instant stagger still breaks a somatic cast") {
        f.ledger.apply(EffectPresets::casting(2, SpellComponent::Somatic, on_complete), "boar");
        REQUIRE(f.ledger.apply(EffectPresets::staggered(0), "boar") == ApplyOutcome::Ignored);

        REQUIRE(f.ledger.find(EffectKind::Casting, "boar") == nullptr);
        REQUIRE(f.ledger.find(EffectKind::Staggered, "boar") == nullptr);
        REQUIRE(f.ledger.empty());

        f.tick(4);
        REQUIRE(completed == 0);
    }

    SECTION("verbal-only cast survives stagger") {
        f.ledger.apply(EffectPresets::casting(2, SpellComponent::Verbal, on_complete), "boar");
        f.ledger.apply(EffectPresets::staggered(1), "boar");

        REQUIRE(f.ledger.find(EffectKind::Casting, "boar") != nullptr);
    }

    SECTION("stagger on another target leaves the cast alone") {
        f.ledger.apply(EffectPresets::casting(2, SpellComponent::Somatic, on_complete), "boar");
        f.ledger.apply(EffectPresets::staggered(1), "hero");

        REQUIRE(f.ledger.find(EffectKind::Casting, "boar") != nullptr);
    }
}

// =============================================================================
// Removal and Re-entrancy
// =============================================================================

TEST_CASE("EffectLedger: remove is idempotent", "[combat][effects]") {
    LedgerFixture f;
    f.ledger.apply(EffectPresets::blocking("hero", 1), "hero");

    REQUIRE(f.ledger.remove(EffectKind::Blocking, "hero"));
    REQUIRE_FALSE(f.ledger.remove(EffectKind::Blocking, "hero"));
    REQUIRE_FALSE(f.ledger.remove(EffectKind::Burning, "nobody"));
    REQUIRE(f.ledger.empty());
}

TEST_CASE("EffectLedger: callbacks may change the ledger while ticking", "[combat][effects]") {
    LedgerFixture f;

    SECTION("removal takes effect at once") {
        int blocking_ticks = 0;
        EffectSpec remover;
        remover.kind = EffectKind::Burning;
        remover.duration = 2;
        remover.on_tick = [](ICombatant&, TurnState& turn) {
            turn.remove_effect(EffectKind::Blocking, "hero");
        };
        f.ledger.apply(remover, "boar");

        EffectSpec shield = EffectPresets::blocking("hero", 2);
        shield.tick_every_turn = true;
        shield.on_tick = [&blocking_ticks](ICombatant&, TurnState&) { ++blocking_ticks; };
        f.ledger.apply(shield, "hero");

        f.tick(1);
        REQUIRE(blocking_ticks == 0);
        REQUIRE(f.ledger.find(EffectKind::Blocking, "hero") == nullptr);
        REQUIRE(f.ledger.size() == 1);
    }

    SECTION("records added during a pass are not ticked by it") {
        EffectSpec spreader;
        spreader.kind = EffectKind::Burning;
        spreader.duration = 2;
        spreader.on_tick = [](ICombatant&, TurnState& turn) {
            turn.apply_effect(EffectPresets::staggered(1), "hero");
        };
        f.ledger.apply(spreader, "boar");

        f.tick(1);
        const ActiveEffect* spread = f.ledger.find(EffectKind::Staggered, "hero");
        REQUIRE(spread != nullptr);
        REQUIRE(spread->remaining_ticks == 2);
        REQUIRE(f.ledger.find(EffectKind::Burning, "boar")->remaining_ticks == 3);
    }
}

TEST_CASE("EffectLedger: change notifications", "[combat][effects]") {
    LedgerFixture f;
    std::vector<ApplyOutcome> applied;
    std::vector<EffectKind> removed;

    f.ledger.on_effect_applied([&](EffectKind, const CombatantId&, ApplyOutcome outcome) {
        applied.push_back(outcome);
    });
    f.ledger.on_effect_removed([&](EffectKind kind, const CombatantId&) { removed.push_back(kind); });

    f.ledger.apply(EffectPresets::casting(2, SpellComponent::Somatic, nullptr), "boar");
    f.ledger.apply(EffectPresets::staggered(1), "boar");
    f.ledger.apply(EffectPresets::staggered(1), "boar");
    f.ledger.apply(EffectPresets::burning(3.0f, 0), "hero");

    REQUIRE(applied == std::vector<ApplyOutcome>{ApplyOutcome::Created, ApplyOutcome::Created,
                                                  ApplyOutcome::Merged, ApplyOutcome::Ignored});
    REQUIRE(removed == std::vector<EffectKind>{EffectKind::Casting});
}
