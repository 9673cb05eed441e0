#include "skirmish/combat/SKEncounterConfig.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace skirmish::combat {

using json = nlohmann::json;

namespace {

[[nodiscard]] std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Empty object when `key` is absent, so callers can chain .value() lookups.
[[nodiscard]] const json& section(const json& j, const char* key) {
  static const json kEmpty = json::object();
  const auto it = j.find(key);
  if (it == j.end()) return kEmpty;
  if (!it->is_object()) throw ConfigError(std::string("Config section '") + key + "' must be an object");
  return *it;
}

void read_ability(const json& abilities, const char* key, AbilitySpec& a) {
  const json& s = section(abilities, key);
  a.ap_cost = s.value("apCost", a.ap_cost);
  a.damage  = s.value("damage", a.damage);
  a.heal    = s.value("heal", a.heal);
}

Combatant combatant_from_json(const json& c, Team team) {
  Combatant out{};
  out.team        = team;
  out.id          = c.value("id", kInvalidCombatant);
  out.name        = c.value("name", std::string(team == Team::Party ? "Ally" : "Opponent"));
  out.level       = std::max(1, c.value("level", 1));
  out.max_health  = c.value("maxHealth", out.max_health);
  out.health      = std::clamp(c.value("health", out.max_health), 0.0f, std::max(0.0f, out.max_health));
  out.attack      = c.value("attack", out.attack);
  out.position.x  = c.value("x", 0.0f);
  out.position.y  = c.value("y", 0.0f);

  if (team == Team::Party) {
    out.rank = c.value("leader", false) ? PartyRank::Leader : PartyRank::Follower;
    out.downed = out.health <= 0.0f;
    return out;
  }

  BehaviorProfile& p   = out.profile;
  p.archetype          = archetype_from_string(c.value("archetype", std::string("GENERIC")));
  if (c.contains("aggressiveness"))
    p.aggressiveness   = std::clamp(c.at("aggressiveness").get<float>(), 0.0f, 1.0f);
  if (c.contains("initialState"))
    p.initial_state    = behavior_state_from_string(c.at("initialState").get<std::string>());
  p.attack_range       = c.value("attackRange", p.attack_range);
  p.attack_cooldown_ms = c.value("attackCooldownMs", p.attack_cooldown_ms);
  p.base_damage        = c.value("baseDamage", p.base_damage);
  out.recruitable      = c.value("recruitable", false);
  return out;
}

} // namespace

Archetype archetype_from_string(const std::string& s) {
  const std::string k = lowercase(s);
  if (k == "guard")    return Archetype::Guard;
  if (k == "merchant") return Archetype::Merchant;
  if (k == "villager") return Archetype::Villager;
  return Archetype::Generic;
}

BehaviorState behavior_state_from_string(const std::string& s) {
  const std::string k = lowercase(s);
  if (k == "idle") return BehaviorState::Idle;
  if (k == "combat") return BehaviorState::Combat;
  if (k == "defensive") return BehaviorState::Defensive;
  throw ConfigError("Unknown behavior state '" + s + "'");
}

ActingMode acting_mode_from_string(const std::string& s) {
  const std::string k = lowercase(s);
  if (k == "turn_based" || k == "turnbased" || k == "legacy") return ActingMode::TurnBased;
  return ActingMode::RealTime;
}

EncounterConfig encounter_config_from_json(const json& J) {
  if (!J.is_object()) throw ConfigError("Encounter config must be a JSON object");

  EncounterConfig C{};
  try {
    C.mode = acting_mode_from_string(J.value("mode", std::string("realtime")));
    C.seed = J.value("seed", C.seed);

    const json& ap = section(J, "ap");
    C.ap.max_ap               = ap.value("max", C.ap.max_ap);
    C.ap.move_drain_per_sec   = ap.value("moveDrainPerSec", C.ap.move_drain_per_sec);
    C.ap.dash_drain_per_sec   = ap.value("dashDrainPerSec", C.ap.dash_drain_per_sec);
    C.ap.charge_regen_per_sec = ap.value("chargeRegenPerSec", C.ap.charge_regen_per_sec);
    C.ap.grant_on_hit         = ap.value("grantOnHit", C.ap.grant_on_hit);

    const json& combo = section(J, "combo");
    C.combo.window_ms              = combo.value("windowMs", C.combo.window_ms);
    C.combo.cooldown_ms            = combo.value("cooldownMs", C.combo.cooldown_ms);
    C.combo.per_hit_bonus          = combo.value("perHitBonus", C.combo.per_hit_bonus);
    C.combo.knockback_base         = combo.value("knockbackBase", C.combo.knockback_base);
    C.combo.knockback_per_hit      = combo.value("knockbackPerHit", C.combo.knockback_per_hit);
    C.combo.display_tiers          = combo.value("displayTiers", C.combo.display_tiers);
    C.combo.melee_ap_cost          = combo.value("meleeApCost", C.combo.melee_ap_cost);
    C.combo.optimal_melee_distance = combo.value("optimalMeleeDistance", C.combo.optimal_melee_distance);
    C.combo.max_melee_distance     = combo.value("maxMeleeDistance", C.combo.max_melee_distance);

    const json& b = section(J, "behavior");
    BehaviorConfig& B = C.behavior;
    B.move_speed                       = b.value("moveSpeed", B.move_speed);
    B.attack_range                     = b.value("attackRange", B.attack_range);
    B.ranged_attack_range              = b.value("rangedAttackRange", B.ranged_attack_range);
    B.attack_cooldown_ms               = b.value("attackCooldownMs", B.attack_cooldown_ms);
    B.defensive_health_frac            = b.value("defensiveHealthFrac", B.defensive_health_frac);
    B.idle_speed_factor                = b.value("idleSpeedFactor", B.idle_speed_factor);
    B.combat_charge_boost              = b.value("combatChargeBoost", B.combat_charge_boost);
    B.defensive_approach_factor        = b.value("defensiveApproachFactor", B.defensive_approach_factor);
    B.defensive_approach_charge_factor = b.value("defensiveApproachChargeFactor", B.defensive_approach_charge_factor);
    B.defensive_approach_range_mult    = b.value("defensiveApproachRangeMult", B.defensive_approach_range_mult);
    B.defensive_wander_factor          = b.value("defensiveWanderFactor", B.defensive_wander_factor);
    B.wander_min_ms                    = b.value("wanderMinMs", B.wander_min_ms);
    B.wander_max_ms                    = b.value("wanderMaxMs", B.wander_max_ms);
    B.base_damage                      = b.value("baseDamage", B.base_damage);
    B.damage_per_level                 = b.value("damagePerLevel", B.damage_per_level);
    B.knockback_base                   = b.value("knockbackBase", B.knockback_base);
    B.knockback_per_level              = b.value("knockbackPerLevel", B.knockback_per_level);

    C.targeting.lock_spacing = section(J, "targeting").value("lockSpacing", C.targeting.lock_spacing);

    const json& turn = section(J, "turn");
    C.turn.min_delay_ms = turn.value("minDelayMs", C.turn.min_delay_ms);
    C.turn.max_delay_ms = turn.value("maxDelayMs", C.turn.max_delay_ms);
    C.turn.timeout_ms   = turn.value("timeoutMs", C.turn.timeout_ms);

    const json& arena = section(J, "arena");
    C.arena.width                 = arena.value("width", C.arena.width);
    C.arena.margin                = arena.value("margin", C.arena.margin);
    C.arena.player_start_offset   = arena.value("playerStartOffset", C.arena.player_start_offset);
    C.arena.opponent_start_offset = arena.value("opponentStartOffset", C.arena.opponent_start_offset);
    C.arena.party_spacing         = arena.value("partySpacing", C.arena.party_spacing);
    C.arena.opponent_spacing      = arena.value("opponentSpacing", C.arena.opponent_spacing);

    const json& mv = section(J, "movement");
    C.movement.player_speed          = mv.value("playerSpeed", C.movement.player_speed);
    C.movement.dash_speed            = mv.value("dashSpeed", C.movement.dash_speed);
    C.movement.dash_duration_ms      = mv.value("dashDurationMs", C.movement.dash_duration_ms);
    C.movement.dash_cooldown_ms      = mv.value("dashCooldownMs", C.movement.dash_cooldown_ms);
    C.movement.knockback_duration_ms = mv.value("knockbackDurationMs", C.movement.knockback_duration_ms);
    C.movement.attack_lifetime_ms    = mv.value("attackLifetimeMs", C.movement.attack_lifetime_ms);

    const json& abilities = section(J, "abilities");
    read_ability(abilities, "basicAttack", C.abilities.basic_attack);
    read_ability(abilities, "specialAttack", C.abilities.special_attack);
    read_ability(abilities, "spell", C.abilities.spell);
    read_ability(abilities, "item", C.abilities.item);

    const json& reward = section(J, "reward");
    C.reward.base_per_level      = reward.value("basePerLevel", C.reward.base_per_level);
    C.reward.level_gap_factor    = reward.value("levelGapFactor", C.reward.level_gap_factor);
    C.reward.min_gap_multiplier  = reward.value("minGapMultiplier", C.reward.min_gap_multiplier);
    C.reward.generic_multiplier  = reward.value("genericMultiplier", C.reward.generic_multiplier);
    C.reward.guard_multiplier    = reward.value("guardMultiplier", C.reward.guard_multiplier);
    C.reward.merchant_multiplier = reward.value("merchantMultiplier", C.reward.merchant_multiplier);
    C.reward.villager_multiplier = reward.value("villagerMultiplier", C.reward.villager_multiplier);

    const json& policy = section(J, "policy");
    C.policy.max_party_size          = policy.value("maxPartySize", C.policy.max_party_size);
    C.policy.flee_base_chance        = policy.value("fleeBaseChance", C.policy.flee_base_chance);
    C.policy.flee_level_factor       = policy.value("fleeLevelFactor", C.policy.flee_level_factor);
    C.policy.flee_min_chance         = policy.value("fleeMinChance", C.policy.flee_min_chance);
    C.policy.flee_max_chance         = policy.value("fleeMaxChance", C.policy.flee_max_chance);
    C.policy.negotiate_base_chance   = policy.value("negotiateBaseChance", C.policy.negotiate_base_chance);
    C.policy.negotiate_wounded_bonus = policy.value("negotiateWoundedBonus", C.policy.negotiate_wounded_bonus);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("Invalid encounter config: ") + e.what());
  }

  if (C.turn.max_delay_ms < C.turn.min_delay_ms) std::swap(C.turn.min_delay_ms, C.turn.max_delay_ms);
  if (C.arena.max_x() <= C.arena.min_x()) throw ConfigError("Arena width must exceed twice its margin");

  return C;
}

EncounterConfig load_encounter_config(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw ConfigError("Could not open " + path.string());

  json J;
  try {
    f >> J;
  } catch (const json::parse_error& e) {
    throw ConfigError("Could not parse " + path.string() + ": " + e.what());
  }

  spdlog::info("Loaded encounter config from {}", path.string());
  return encounter_config_from_json(J);
}

RosterData roster_from_json(const json& J) {
  if (!J.is_object()) throw ConfigError("Roster must be a JSON object");

  RosterData R{};
  try {
    const auto party = J.find("party");
    if (party == J.end() || !party->is_array() || party->empty())
      throw ConfigError("Roster requires a non-empty 'party' array");

    for (const json& c : *party) R.party.push_back(combatant_from_json(c, Team::Party));

    if (const auto opp = J.find("opponents"); opp != J.end()) {
      if (!opp->is_array()) throw ConfigError("Roster 'opponents' must be an array");
      for (const json& c : *opp) R.opponents.push_back(combatant_from_json(c, Team::Opponent));
    }

    R.return_context = J.value("returnContext", std::string());
  } catch (const json::exception& e) {
    throw ConfigError(std::string("Invalid roster: ") + e.what());
  }

  std::unordered_set<CombatantId> seen;
  const auto check_id = [&](const Combatant& c) {
    if (c.id == kInvalidCombatant) throw ConfigError("Roster entry '" + c.name + "' has no id");
    if (!seen.insert(c.id).second) throw ConfigError("Duplicate roster id " + std::to_string(c.id));
  };
  for (const Combatant& c : R.party) check_id(c);
  for (const Combatant& c : R.opponents) check_id(c);

  // Exactly one leader.
  const auto leader = std::find_if(R.party.begin(), R.party.end(), [](const Combatant& c) { return c.is_leader(); });
  const auto keep = (leader != R.party.end()) ? leader : R.party.begin();
  for (auto it = R.party.begin(); it != R.party.end(); ++it) {
    it->rank = (it == keep) ? PartyRank::Leader : PartyRank::Follower;
  }

  return R;
}

RosterData load_roster(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw ConfigError("Could not open " + path.string());

  json J;
  try {
    f >> J;
  } catch (const json::parse_error& e) {
    throw ConfigError("Could not parse " + path.string() + ": " + e.what());
  }

  RosterData R = roster_from_json(J);
  spdlog::info("Loaded roster from {} ({} party, {} opponents)", path.string(), R.party.size(), R.opponents.size());
  return R;
}

RosterData default_roster() {
  RosterData R{};

  Combatant hero{};
  hero.id = 1;
  hero.name = "Hero";
  hero.team = Team::Party;
  hero.rank = PartyRank::Leader;
  hero.attack = 15.0f;
  R.party.push_back(hero);

  Combatant ally{};
  ally.id = 2;
  ally.name = "Mage";
  ally.team = Team::Party;
  ally.rank = PartyRank::Follower;
  ally.max_health = 80.0f;
  ally.health = 80.0f;
  ally.attack = 10.0f;
  R.party.push_back(ally);

  const auto make_opponent = [](CombatantId id, const char* name, Archetype a, int level, float aggr) {
    Combatant o{};
    o.id = id;
    o.name = name;
    o.team = Team::Opponent;
    o.level = level;
    o.profile.archetype = a;
    o.profile.aggressiveness = aggr;
    return o;
  };
  R.opponents.push_back(make_opponent(10, "Guard", Archetype::Guard, 2, 0.7f));
  R.opponents.push_back(make_opponent(11, "Merchant", Archetype::Merchant, 1, 0.4f));
  R.opponents.push_back(make_opponent(12, "Villager", Archetype::Villager, 1, 0.5f));
  R.opponents.back().recruitable = true;

  R.return_context = "world";
  return R;
}

} // namespace skirmish::combat
