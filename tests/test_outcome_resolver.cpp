#include <doctest/doctest.h>

#include "skirmish/combat/SKOutcomeResolver.hpp"

#include <vector>

using namespace skirmish::combat;

namespace
{
    Combatant PartyMember(CombatantId id, int level, bool leader)
    {
        Combatant c{};
        c.id = id;
        c.level = level;
        c.team = Team::Party;
        c.rank = leader ? PartyRank::Leader : PartyRank::Follower;
        return c;
    }

    Combatant Opponent(CombatantId id, int level, Archetype a = Archetype::Generic)
    {
        Combatant c{};
        c.id = id;
        c.level = level;
        c.team = Team::Opponent;
        c.profile.archetype = a;
        return c;
    }

    OpponentOutcomeRecord Removal(CombatantId id, int level, Archetype a, OpponentFate fate)
    {
        OpponentOutcomeRecord r{};
        r.id = id;
        r.level = level;
        r.archetype = a;
        r.fate = fate;
        return r;
    }

    int CountSuccesses(const std::function<bool(Rng&)>& roll, int trials)
    {
        Rng rng(2024);
        int n = 0;
        for (int i = 0; i < trials; ++i)
            n += roll(rng) ? 1 : 0;
        return n;
    }
}

TEST_CASE("OutcomeResolver: an empty opponent roster is a victory exactly once")
{
    Roster party;
    (void)party.add(PartyMember(1, 3, true));
    Roster opponents;
    (void)opponents.add(Opponent(10, 1));

    OutcomeResolver resolver;
    resolver.set_return_context("village_square");
    CHECK_FALSE(resolver.evaluate(party, opponents).has_value());

    (void)opponents.remove(10);
    resolver.record_removal(Removal(10, 1, Archetype::Generic, OpponentFate::Defeated));

    const auto first = resolver.evaluate(party, opponents);
    REQUIRE(first.has_value());
    CHECK(first->kind == OutcomeKind::Victory);
    CHECK(first->return_context == "village_square");
    REQUIRE(first->defeated_ids.size() == 1);
    CHECK(first->defeated_ids[0] == 10);
    REQUIRE(first->party.size() == 1);
    CHECK(first->party[0].id == 1);

    CHECK_FALSE(resolver.evaluate(party, opponents).has_value());
    CHECK_FALSE(resolver.disengage(party, opponents).has_value());
    CHECK(resolver.decided());
    CHECK(resolver.outcome()->kind == OutcomeKind::Victory);
}

TEST_CASE("OutcomeResolver: the whole party downed is a defeat")
{
    Roster party;
    (void)party.add(PartyMember(1, 1, true));
    (void)party.add(PartyMember(2, 1, false));
    Roster opponents;
    (void)opponents.add(Opponent(10, 1));

    OutcomeResolver resolver;
    party.try_get(1)->downed = true;
    CHECK_FALSE(resolver.evaluate(party, opponents).has_value());

    party.try_get(2)->downed = true;
    const auto out = resolver.evaluate(party, opponents);
    REQUIRE(out.has_value());
    CHECK(out->kind == OutcomeKind::Defeat);
    CHECK(out->reward == 0U);
    CHECK(out->remaining_opponents.empty());
}

TEST_CASE("OutcomeResolver: disengage reports the opponents left behind")
{
    Roster party;
    (void)party.add(PartyMember(1, 1, true));
    Roster opponents;
    (void)opponents.add(Opponent(10, 1));
    opponents.try_get(10)->health = 40.0f;

    OutcomeResolver resolver;
    const auto out = resolver.disengage(party, opponents);
    REQUIRE(out.has_value());
    CHECK(out->kind == OutcomeKind::Disengage);
    CHECK(out->reward == 0U);
    REQUIRE(out->remaining_opponents.size() == 1);
    CHECK(out->remaining_opponents[0].id == 10);
    CHECK(out->remaining_opponents[0].health == doctest::Approx(40.0f));

    (void)opponents.remove(10);
    CHECK_FALSE(resolver.evaluate(party, opponents).has_value());
}

TEST_CASE("OutcomeResolver: default reward scales with level gap and archetype")
{
    const RewardPolicy reward = make_default_reward_policy(RewardConfig{});

    CHECK(reward(Removal(10, 1, Archetype::Generic, OpponentFate::Defeated), 1) == 10U);
    CHECK(reward(Removal(10, 2, Archetype::Guard, OpponentFate::Defeated), 3) == 27U);
    CHECK(reward(Removal(10, 1, Archetype::Villager, OpponentFate::Defeated), 1) == 8U);
    CHECK(reward(Removal(10, 1, Archetype::Merchant, OpponentFate::Defeated), 3) == 10U);

    // Far weaker opponents still give a sliver.
    CHECK(reward(Removal(10, 1, Archetype::Generic, OpponentFate::Defeated), 20) == 1U);
}

TEST_CASE("OutcomeResolver: victory reward skips recruited opponents")
{
    Roster party;
    (void)party.add(PartyMember(1, 3, true));
    Roster opponents;

    OutcomeResolver resolver;
    resolver.record_removal(Removal(10, 2, Archetype::Guard, OpponentFate::Defeated));
    resolver.record_removal(Removal(11, 1, Archetype::Merchant, OpponentFate::Recruited));
    resolver.record_removal(Removal(12, 1, Archetype::Villager, OpponentFate::Negotiated));

    CHECK(resolver.total_reward(3) == 27U + 6U);

    const auto out = resolver.evaluate(party, opponents);
    REQUIRE(out.has_value());
    CHECK(out->reward == 33U);
    CHECK(out->defeated_ids == std::vector<CombatantId>{10});
    CHECK(out->recruited_ids == std::vector<CombatantId>{11});
    CHECK(out->negotiated_ids == std::vector<CombatantId>{12});
}

TEST_CASE("OutcomeResolver: default recruit policy needs a recruitable opponent and party room")
{
    OutcomeResolver resolver;
    Combatant villager = Opponent(12, 1, Archetype::Villager);

    CHECK_FALSE(resolver.can_recruit(villager, 1));

    villager.recruitable = true;
    CHECK(resolver.can_recruit(villager, 1));
    CHECK(resolver.can_recruit(villager, 3));
    CHECK_FALSE(resolver.can_recruit(villager, 4));
}

TEST_CASE("OutcomeResolver: flee odds follow the level gap")
{
    OutcomeResolver resolver;
    const Combatant weak = PartyMember(1, 1, true);
    const Combatant strong = PartyMember(1, 10, true);
    const std::vector<Combatant> opponents{Opponent(10, 1), Opponent(11, 6)};

    const int hard = CountSuccesses([&](Rng& rng) { return resolver.roll_flee(weak, opponents, rng); }, 1000);
    const int easy = CountSuccesses([&](Rng& rng) { return resolver.roll_flee(strong, opponents, rng); }, 1000);

    // weak: 0.5 - 0.5 = 0.0 -> clamped to 0.1; strong: 0.5 + 0.4 = 0.9
    CHECK(hard > 50);
    CHECK(hard < 150);
    CHECK(easy > 850);
}

TEST_CASE("OutcomeResolver: wounded opponents negotiate more readily")
{
    OutcomeResolver resolver;
    const Combatant leader = PartyMember(1, 1, true);
    Combatant fresh = Opponent(10, 1);
    Combatant wounded = Opponent(11, 1);
    wounded.health = 0.0f;

    const int a = CountSuccesses([&](Rng& rng) { return resolver.roll_negotiate(leader, fresh, rng); }, 1000);
    const int b = CountSuccesses([&](Rng& rng) { return resolver.roll_negotiate(leader, wounded, rng); }, 1000);

    CHECK(a > 220);
    CHECK(a < 380);
    CHECK(b > 720);
}

TEST_CASE("OutcomeResolver: injected policies replace the defaults")
{
    OutcomeResolver resolver;
    resolver.set_recruit_policy([](const Combatant&, std::size_t) { return true; });
    resolver.set_flee_policy([](const Combatant&, std::span<const Combatant>, Rng&) { return true; });
    resolver.set_reward_policy([](const OpponentOutcomeRecord&, int) { return 5U; });

    const Combatant leader = PartyMember(1, 1, true);
    const Combatant o = Opponent(10, 50);
    Rng rng(1);

    CHECK(resolver.can_recruit(o, 99));
    CHECK(resolver.roll_flee(leader, std::span<const Combatant>(&o, 1), rng));

    resolver.record_removal(Removal(10, 50, Archetype::Generic, OpponentFate::Defeated));
    resolver.record_removal(Removal(11, 50, Archetype::Generic, OpponentFate::Negotiated));
    CHECK(resolver.total_reward(1) == 10U);

    resolver.reset();
    CHECK(resolver.removals().empty());
    CHECK_FALSE(resolver.decided());
}
