#include <doctest/doctest.h>

#include "skirmish/combat/SKComboResolver.hpp"

using namespace skirmish::combat;

namespace
{
    Combatant MakeFighter(CombatantId id, float attack, float health)
    {
        Combatant c{};
        c.id = id;
        c.name = "fighter";
        c.attack = attack;
        c.max_health = health;
        c.health = health;
        return c;
    }
}

TEST_CASE("ComboTracker: a gap longer than the window restarts the chain")
{
    ComboTracker combo(ComboConfig{}); // 800 ms window

    CHECK(combo.try_register_hit(0.0) == 1U);
    CHECK(combo.try_register_hit(300.0) == 2U);
    CHECK(combo.try_register_hit(1200.0) == 1U);
}

TEST_CASE("ComboTracker: hits inside the window keep counting")
{
    ComboTracker combo(ComboConfig{});

    TimeMs t = 0.0;
    for (std::uint32_t expected = 1; expected <= 6; ++expected)
    {
        const auto hit = combo.try_register_hit(t);
        REQUIRE(hit.has_value());
        CHECK(*hit == expected);
        t += 700.0;
    }
}

TEST_CASE("ComboTracker: cooldown gates hits without touching the chain")
{
    ComboTracker combo(ComboConfig{}); // 200 ms cooldown

    REQUIRE(combo.try_register_hit(1000.0) == 1U);
    CHECK_FALSE(combo.ready(1100.0));
    CHECK_FALSE(combo.try_register_hit(1100.0).has_value());
    CHECK(combo.count() == 1U);
    CHECK(combo.last_hit_ms() == doctest::Approx(1000.0));

    CHECK(combo.ready(1200.0));
    CHECK(combo.try_register_hit(1200.0) == 2U);
}

TEST_CASE("ComboTracker: count reads zero once the window has passed")
{
    ComboTracker combo(ComboConfig{});
    CHECK(combo.count_at(0.0) == 0U);

    (void)combo.try_register_hit(0.0);
    (void)combo.try_register_hit(400.0);
    CHECK(combo.count_at(1000.0) == 2U);
    CHECK(combo.count_at(1201.0) == 0U);

    combo.reset();
    CHECK(combo.count() == 0U);
    CHECK(combo.ready(0.0));
}

TEST_CASE("ComboResolver: damage grows ten percent per chained hit and is floored")
{
    ComboResolver resolver(ComboConfig{});

    CHECK(resolver.damage_for(15.0f, 1) == doctest::Approx(15.0f));
    CHECK(resolver.damage_for(15.0f, 2) == doctest::Approx(16.0f)); // 16.5
    CHECK(resolver.damage_for(15.0f, 3) == doctest::Approx(18.0f));
    CHECK(resolver.damage_for(10.0f, 2) == doctest::Approx(11.0f));
    CHECK(resolver.damage_for(10.0f, 0) == doctest::Approx(10.0f));
    CHECK(resolver.damage_for(-4.0f, 3) == doctest::Approx(0.0f));
}

TEST_CASE("ComboResolver: knockback and display tier scale with the hit index")
{
    ComboResolver resolver(ComboConfig{});

    CHECK(resolver.knockback_for(1) == doctest::Approx(350.0f));
    CHECK(resolver.knockback_for(4) == doctest::Approx(500.0f));

    CHECK(resolver.display_tier_for(1) == 0U);
    CHECK(resolver.display_tier_for(3) == 2U);
    CHECK(resolver.display_tier_for(5) == 4U);
    CHECK(resolver.display_tier_for(12) == 4U);
}

TEST_CASE("ComboResolver: strike applies damage and reports defeat")
{
    ComboResolver resolver(ComboConfig{});
    const Combatant hero = MakeFighter(1, 15.0f, 100.0f);
    Combatant foe = MakeFighter(10, 5.0f, 30.0f);

    StrikeResult r = resolver.strike(hero, foe, 1);
    CHECK(r.damage_dealt == doctest::Approx(15.0f));
    CHECK(r.hit_index == 1U);
    CHECK(r.combo_display_tier == 0U);
    CHECK_FALSE(r.target_defeated);
    CHECK(foe.health == doctest::Approx(15.0f));

    r = resolver.strike(hero, foe, 2);
    CHECK(r.damage_dealt == doctest::Approx(16.0f));
    CHECK(r.target_defeated);
    CHECK(foe.health == doctest::Approx(0.0f));
}

TEST_CASE("ComboResolver: striking a defeated target still reports the hit")
{
    ComboResolver resolver(ComboConfig{});
    const Combatant hero = MakeFighter(1, 15.0f, 100.0f);
    Combatant foe = MakeFighter(10, 5.0f, 30.0f);
    foe.health = 0.0f;

    const StrikeResult r = resolver.strike(hero, foe, 1);
    CHECK(r.damage_dealt == doctest::Approx(15.0f));
    CHECK(r.target_defeated);
    CHECK(foe.health == doctest::Approx(0.0f));
}
