#include <doctest/doctest.h>

#include "skirmish/combat/SKEncounterConfig.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

using namespace skirmish::combat;
using nlohmann::json;
using skirmish::ConfigError;

namespace fs = std::filesystem;

namespace
{
    fs::path DataDir()
    {
        return fs::path(SKIRMISH_TEST_DATA_DIR);
    }

    fs::path WriteTempFile(const std::string& name, const std::string& contents)
    {
        const fs::path p = fs::temp_directory_path() / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << contents;
        return p;
    }
}

TEST_CASE("EncounterConfig: an empty object keeps every default")
{
    const EncounterConfig c = encounter_config_from_json(json::object());
    const EncounterConfig d{};

    CHECK(c.mode == ActingMode::RealTime);
    CHECK(c.seed == d.seed);
    CHECK(c.ap.max_ap == doctest::Approx(20.0f));
    CHECK(c.combo.window_ms == doctest::Approx(800.0f));
    CHECK(c.combo.melee_ap_cost == doctest::Approx(3.0f));
    CHECK(c.behavior.defensive_health_frac == doctest::Approx(0.5f));
    CHECK(c.turn.timeout_ms == doctest::Approx(5000.0f));
    CHECK(c.abilities.item.heal == doctest::Approx(25.0f));
    CHECK(c.policy.max_party_size == 4);
}

TEST_CASE("EncounterConfig: present keys override defaults")
{
    const json j = {
        {"mode", "turn_based"},
        {"seed", 77},
        {"ap", {{"max", 30}, {"moveDrainPerSec", 3.5}}},
        {"combo", {{"windowMs", 600}, {"displayTiers", 3}}},
        {"abilities", {{"spell", {{"apCost", 6}, {"damage", 40}}}}},
        {"policy", {{"maxPartySize", 6}}},
    };

    const EncounterConfig c = encounter_config_from_json(j);
    CHECK(c.mode == ActingMode::TurnBased);
    CHECK(c.seed == 77U);
    CHECK(c.ap.max_ap == doctest::Approx(30.0f));
    CHECK(c.ap.move_drain_per_sec == doctest::Approx(3.5f));
    CHECK(c.ap.dash_drain_per_sec == doctest::Approx(4.0f));
    CHECK(c.combo.window_ms == doctest::Approx(600.0f));
    CHECK(c.combo.display_tiers == 3U);
    CHECK(c.abilities.spell.ap_cost == doctest::Approx(6.0f));
    CHECK(c.abilities.spell.damage == doctest::Approx(40.0f));
    CHECK(c.abilities.get(AbilityKind::Spell).damage == doctest::Approx(40.0f));
    CHECK(c.policy.max_party_size == 6);
}

TEST_CASE("EncounterConfig: malformed values raise ConfigError")
{
    CHECK_THROWS_AS((void)encounter_config_from_json(json::array()), ConfigError);
    CHECK_THROWS_AS((void)encounter_config_from_json(json{{"ap", 5}}), ConfigError);
    CHECK_THROWS_AS((void)encounter_config_from_json(json{{"ap", {{"max", "lots"}}}}), ConfigError);
    CHECK_THROWS_AS((void)encounter_config_from_json(json{{"arena", {{"width", 100}, {"margin", 50}}}}), ConfigError);
}

TEST_CASE("EncounterConfig: inverted turn delays are swapped")
{
    const EncounterConfig c =
        encounter_config_from_json(json{{"turn", {{"minDelayMs", 900}, {"maxDelayMs", 300}}}});
    CHECK(c.turn.min_delay_ms == doctest::Approx(300.0f));
    CHECK(c.turn.max_delay_ms == doctest::Approx(900.0f));
}

TEST_CASE("EncounterConfig: archetype and mode names are case-insensitive")
{
    CHECK(archetype_from_string("GUARD") == Archetype::Guard);
    CHECK(archetype_from_string("Merchant") == Archetype::Merchant);
    CHECK(archetype_from_string("villager") == Archetype::Villager);
    CHECK(archetype_from_string("dragon") == Archetype::Generic);

    CHECK(acting_mode_from_string("Turn_Based") == ActingMode::TurnBased);
    CHECK(acting_mode_from_string("legacy") == ActingMode::TurnBased);
    CHECK(acting_mode_from_string("realtime") == ActingMode::RealTime);
    CHECK(acting_mode_from_string("") == ActingMode::RealTime);
}

TEST_CASE("EncounterConfig: roster parsing fills combatants and picks one leader")
{
    const json j = {
        {"returnContext", "forest"},
        {"party", json::array({
            {{"id", 1}, {"name", "Hero"}, {"level", 3}, {"maxHealth", 120}, {"health", 150}},
            {{"id", 2}, {"name", "Mage"}, {"leader", true}},
            {{"id", 3}, {"name", "Bard"}, {"leader", true}},
        })},
        {"opponents", json::array({
            {{"id", 10}, {"name", "Guard"}, {"archetype", "GUARD"}, {"aggressiveness", 3.0},
             {"attackCooldownMs", 900}, {"recruitable", true}},
        })},
    };

    const RosterData r = roster_from_json(j);
    CHECK(r.return_context == "forest");
    REQUIRE(r.party.size() == 3);
    REQUIRE(r.opponents.size() == 1);

    CHECK(r.party[0].level == 3);
    CHECK(r.party[0].health == doctest::Approx(120.0f));
    CHECK(r.party[0].team == Team::Party);

    CHECK(r.party[0].rank == PartyRank::Follower);
    CHECK(r.party[1].rank == PartyRank::Leader);
    CHECK(r.party[2].rank == PartyRank::Follower);

    const Combatant& g = r.opponents[0];
    CHECK(g.team == Team::Opponent);
    CHECK(g.profile.archetype == Archetype::Guard);
    CHECK(g.profile.aggressiveness == doctest::Approx(1.0f));
    CHECK(g.profile.attack_cooldown_ms == doctest::Approx(900.0f));
    CHECK(g.recruitable);
}

TEST_CASE("EncounterConfig: opponent disposition is optional and validated")
{
    const json j = {
        {"party", json::array({{{"id", 1}}})},
        {"opponents", json::array({
            {{"id", 10}, {"archetype", "merchant"}},
            {{"id", 11}, {"initialState", "Combat"}, {"aggressiveness", 0.25}},
        })},
    };

    const RosterData r = roster_from_json(j);
    REQUIRE(r.opponents.size() == 2);
    CHECK(r.opponents[0].profile.aggressiveness < 0.0f); // archetype default applies later
    CHECK_FALSE(r.opponents[0].profile.initial_state.has_value());
    REQUIRE(r.opponents[1].profile.initial_state.has_value());
    CHECK(*r.opponents[1].profile.initial_state == BehaviorState::Combat);
    CHECK(r.opponents[1].profile.aggressiveness == doctest::Approx(0.25f));

    CHECK(behavior_state_from_string("DEFENSIVE") == BehaviorState::Defensive);
    CHECK_THROWS_AS((void)behavior_state_from_string("sleepy"), ConfigError);
    CHECK_THROWS_AS((void)roster_from_json(json{{"party", json::array({{{"id", 1}}})},
                                                {"opponents", json::array({{{"id", 2}, {"initialState", "sleepy"}}})}}),
                    ConfigError);
}

TEST_CASE("EncounterConfig: without a flagged leader the first member leads")
{
    const json j = {{"party", json::array({{{"id", 5}}, {{"id", 6}}})}};
    const RosterData r = roster_from_json(j);
    CHECK(r.party[0].rank == PartyRank::Leader);
    CHECK(r.party[1].rank == PartyRank::Follower);
    CHECK(r.opponents.empty());
}

TEST_CASE("EncounterConfig: unusable rosters raise ConfigError")
{
    CHECK_THROWS_AS((void)roster_from_json(json::object()), ConfigError);
    CHECK_THROWS_AS((void)roster_from_json(json{{"party", json::array()}}), ConfigError);
    CHECK_THROWS_AS((void)roster_from_json(json{{"party", json::array({{{"name", "NoId"}}})}}), ConfigError);
    CHECK_THROWS_AS((void)roster_from_json(json{{"party", json::array({{{"id", 1}}})},
                                                {"opponents", json::array({{{"id", 1}}})}}),
                    ConfigError);
    CHECK_THROWS_AS((void)roster_from_json(json{{"party", json::array({{{"id", 1}}})}, {"opponents", 3}}),
                    ConfigError);
    CHECK_THROWS_AS((void)roster_from_json(json{{"party", json::array({{{"id", "one"}}})}}), ConfigError);
}

TEST_CASE("EncounterConfig: sample files load")
{
    const EncounterConfig c = load_encounter_config(DataDir() / "encounter.json");
    CHECK(c.seed == 1337U);
    CHECK(c.mode == ActingMode::RealTime);
    CHECK(c.abilities.item.heal == doctest::Approx(25.0f));

    const RosterData r = load_roster(DataDir() / "roster.json");
    CHECK(r.return_context == "village_square");
    REQUIRE(r.party.size() == 2);
    REQUIRE(r.opponents.size() == 3);
    CHECK(r.party[0].is_leader());
    CHECK(r.opponents[0].profile.archetype == Archetype::Guard);
    CHECK(r.opponents[2].recruitable);
}

TEST_CASE("EncounterConfig: missing or broken files raise ConfigError")
{
    CHECK_THROWS_AS((void)load_encounter_config(DataDir() / "does_not_exist.json"), ConfigError);
    CHECK_THROWS_AS((void)load_roster(DataDir() / "does_not_exist.json"), ConfigError);

    const fs::path broken = WriteTempFile("skirmish_broken_config.json", "{ \"ap\": ");
    CHECK_THROWS_AS((void)load_encounter_config(broken), ConfigError);
    CHECK_THROWS_AS((void)load_roster(broken), ConfigError);

    std::error_code ec;
    fs::remove(broken, ec);
}

TEST_CASE("EncounterConfig: default roster has a leader and a recruitable villager")
{
    const RosterData r = default_roster();
    REQUIRE_FALSE(r.party.empty());
    CHECK(r.party[0].is_leader());
    REQUIRE(r.opponents.size() == 3);
    CHECK(r.opponents[2].profile.archetype == Archetype::Villager);
    CHECK(r.opponents[2].recruitable);
}
