#pragma once

#include "SKCombatTypes.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace skirmish::combat {

// Static tuning for one opponent. Range, cooldown and damage values <= 0 fall
// back to the encounter-wide behavior config (see BehaviorConfig). Unset
// aggressiveness and initial state come from the archetype defaults.
struct BehaviorProfile {
  Archetype archetype{Archetype::Generic};
  float aggressiveness{-1.0f};     // [0,1], scales movement speed; negative = archetype default
  std::optional<BehaviorState> initial_state{};
  float attack_range{0.0f};        // world units
  float attack_cooldown_ms{0.0f};
  float base_damage{0.0f};         // damage before the per-level bonus
};

// Per-opponent AI state. Lives inside the opponent's Combatant record.
struct BehaviorRecord {
  BehaviorState state{BehaviorState::Idle};
  float direction{1.0f};           // -1 left, +1 right
  bool been_attacked{false};
  bool moving{false};
  float aggressiveness{0.5f};
  TimeMs last_attack_ms{-1.0e9};
  float attack_cooldown_ms{1500.0f};

  // Defensive wander (back-and-forth) pacing.
  float wander_timer_ms{0.0f};
  float wander_interval_ms{1500.0f};
};

struct Combatant {
  CombatantId id{kInvalidCombatant};
  std::string name{};
  int level{1};

  float max_health{100.0f};
  float health{100.0f};
  float attack{15.0f};

  Team team{Team::Opponent};
  bool downed{false};

  // Party-only
  PartyRank rank{PartyRank::Follower};

  // Opponent-only
  BehaviorProfile profile{};
  BehaviorRecord behavior{};
  bool recruitable{false};

  // Arena state
  Vec2 position{};
  Vec2 velocity{};
  Vec2 knockback{};   // decays to zero when its scheduled end fires
  bool suppressed{false};

  [[nodiscard]] float health_frac() const noexcept {
    return (max_health > 0.0f) ? (health / max_health) : 0.0f;
  }

  [[nodiscard]] bool is_leader() const noexcept {
    return team == Team::Party && rank == PartyRank::Leader;
  }

  [[nodiscard]] bool can_act() const noexcept { return !downed && health > 0.0f; }
};

// Health mutations clamp to [0, max]. They return the amount actually applied.
inline float apply_damage(Combatant& c, float amount) noexcept {
  if (!(amount > 0.0f)) return 0.0f;
  const float before = c.health;
  c.health = std::clamp(c.health - amount, 0.0f, c.max_health);
  return before - c.health;
}

inline float apply_heal(Combatant& c, float amount) noexcept {
  if (!(amount > 0.0f)) return 0.0f;
  const float before = c.health;
  c.health = std::clamp(c.health + amount, 0.0f, c.max_health);
  return c.health - before;
}

// Why an opponent left the active roster.
enum class OpponentFate : std::uint8_t {
  Defeated   = 0,
  Recruited  = 1,
  Negotiated = 2
};

[[nodiscard]] constexpr std::string_view to_string(OpponentFate f) noexcept {
  switch (f) {
    case OpponentFate::Defeated:   return "Defeated";
    case OpponentFate::Recruited:  return "Recruited";
    case OpponentFate::Negotiated: return "Negotiated";
    default:                       return "Unknown";
  }
}

// Persists after the opponent is removed; input to reward computation.
struct OpponentOutcomeRecord {
  CombatantId id{kInvalidCombatant};
  std::string name{};
  int level{1};
  Archetype archetype{Archetype::Generic};
  OpponentFate fate{OpponentFate::Defeated};
};

} // namespace skirmish::combat
