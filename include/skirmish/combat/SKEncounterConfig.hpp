#pragma once

#include "SKComboResolver.hpp"
#include "SKCombatant.hpp"
#include "SKOpponentBehavior.hpp"
#include "SKOutcomeResolver.hpp"
#include "SKResourceLedger.hpp"
#include "SKTargetingCoordinator.hpp"
#include "SKTurnDispatcher.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace skirmish {

// Raised only at the configuration boundary (unreadable file, malformed JSON,
// values of the wrong type, unusable roster). The combat core never throws.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace skirmish

namespace skirmish::combat {

// Horizontal strip the encounter plays on.
struct ArenaConfig {
  float width{1280.0f};
  float margin{50.0f};
  float player_start_offset{150.0f};   // from the left bound
  float opponent_start_offset{150.0f}; // from the right bound
  float party_spacing{60.0f};
  float opponent_spacing{120.0f};

  [[nodiscard]] float min_x() const noexcept { return margin; }
  [[nodiscard]] float max_x() const noexcept { return width - margin; }
  [[nodiscard]] float center_x() const noexcept { return width * 0.5f; }
};

struct MovementConfig {
  float player_speed{300.0f};
  float dash_speed{1200.0f};
  float dash_duration_ms{300.0f};
  float dash_cooldown_ms{50.0f};
  float knockback_duration_ms{200.0f};
  float attack_lifetime_ms{300.0f};   // how long a resolved attack stays visible
};

struct AbilitySpec {
  float ap_cost{0.0f};
  float damage{0.0f};
  float heal{0.0f};
};

struct AbilityConfig {
  AbilitySpec basic_attack{8.0f, 20.0f, 0.0f};
  AbilitySpec special_attack{12.0f, 35.0f, 0.0f};
  AbilitySpec spell{10.0f, 30.0f, 0.0f};
  AbilitySpec item{5.0f, 0.0f, 25.0f};

  [[nodiscard]] const AbilitySpec& get(AbilityKind kind) const noexcept {
    switch (kind) {
      case AbilityKind::SpecialAttack: return special_attack;
      case AbilityKind::Spell:         return spell;
      case AbilityKind::Item:          return item;
      case AbilityKind::BasicAttack:
      default:                         return basic_attack;
    }
  }
};

// Every tunable of one encounter. Defaults reproduce the shipped balance.
struct EncounterConfig {
  ActingMode mode{ActingMode::RealTime};
  std::uint64_t seed{0x5EEDULL};

  ApConfig ap{};
  ComboConfig combo{};
  BehaviorConfig behavior{};
  TargetingConfig targeting{};
  TurnConfig turn{};
  ArenaConfig arena{};
  MovementConfig movement{};
  AbilityConfig abilities{};
  RewardConfig reward{};
  PolicyConfig policy{};
};

// Combatants supplied by the exploration layer at encounter start.
struct RosterData {
  std::vector<Combatant> party{};
  std::vector<Combatant> opponents{};
  std::string return_context{};
};

// "GUARD" / "guard" -> Guard, ... Unknown strings map to Generic.
[[nodiscard]] Archetype archetype_from_string(const std::string& s);
// "idle" / "combat" / "defensive", any case. Anything else raises ConfigError.
[[nodiscard]] BehaviorState behavior_state_from_string(const std::string& s);
// "turn_based" / "turnbased" / "legacy" -> TurnBased, anything else RealTime.
[[nodiscard]] ActingMode acting_mode_from_string(const std::string& s);

// Missing keys keep their defaults. Wrong value types raise ConfigError.
[[nodiscard]] EncounterConfig encounter_config_from_json(const nlohmann::json& j);
[[nodiscard]] EncounterConfig load_encounter_config(const std::filesystem::path& path);

// Requires a non-empty "party" array; ids must be non-zero and unique across
// both sides. The first party member becomes leader unless one is flagged.
[[nodiscard]] RosterData roster_from_json(const nlohmann::json& j);
[[nodiscard]] RosterData load_roster(const std::filesystem::path& path);

// Built-in demo roster (one leader, one follower, three opponents).
[[nodiscard]] RosterData default_roster();

} // namespace skirmish::combat
