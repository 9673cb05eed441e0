#pragma once

#include <cmath>
#include <cstdint>
#include <string_view>

namespace skirmish::combat {

// ----------------------------------------------------------------------------
// Basic identifiers
// ----------------------------------------------------------------------------
using CombatantId = std::uint32_t;
inline constexpr CombatantId kInvalidCombatant{0};

// Encounter clock, milliseconds since encounter start.
using TimeMs = double;

// ----------------------------------------------------------------------------
// Minimal math (arena is a horizontal strip; y is kept for distance checks)
// ----------------------------------------------------------------------------
struct Vec2 {
  float x{0.0f};
  float y{0.0f};

  constexpr Vec2() = default;
  constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}
};

[[nodiscard]] constexpr Vec2 operator+(Vec2 a, Vec2 b) noexcept { return {a.x + b.x, a.y + b.y}; }
[[nodiscard]] constexpr Vec2 operator-(Vec2 a, Vec2 b) noexcept { return {a.x - b.x, a.y - b.y}; }
[[nodiscard]] constexpr Vec2 operator*(Vec2 v, float s) noexcept { return {v.x * s, v.y * s}; }

constexpr Vec2& operator+=(Vec2& a, Vec2 b) noexcept {
  a.x += b.x;
  a.y += b.y;
  return a;
}

[[nodiscard]] constexpr float length_sq(Vec2 v) noexcept { return v.x * v.x + v.y * v.y; }
[[nodiscard]] inline float distance(Vec2 a, Vec2 b) noexcept { return std::sqrt(length_sq(a - b)); }

// -1 when `to` is left of `from`, +1 otherwise.
[[nodiscard]] constexpr float facing_sign(Vec2 from, Vec2 to) noexcept {
  return (to.x > from.x) ? 1.0f : -1.0f;
}

// ----------------------------------------------------------------------------
// Roster tags
// ----------------------------------------------------------------------------
enum class Team : std::uint8_t {
  Party    = 0,
  Opponent = 1
};

enum class PartyRank : std::uint8_t {
  Leader   = 0, // the player character
  Follower = 1
};

// Opponent archetypes drive the legacy turn policy, reward multipliers and
// which opponents may use ranged attacks.
enum class Archetype : std::uint8_t {
  Generic  = 0,
  Guard    = 1,
  Merchant = 2,
  Villager = 3
};

enum class BehaviorState : std::uint8_t {
  Idle      = 0,
  Combat    = 1,
  Defensive = 2
};

enum class TargetingState : std::uint8_t {
  Free      = 0,
  Selecting = 1,
  Locked    = 2
};

enum class AttackKind : std::uint8_t {
  Melee      = 0,
  Projectile = 1
};

// Opponent acting strategy: real-time vulnerability gating, or the legacy
// enemy-turn queue.
enum class ActingMode : std::uint8_t {
  RealTime  = 0,
  TurnBased = 1
};

enum class AbilityKind : std::uint8_t {
  BasicAttack   = 0,
  SpecialAttack = 1,
  Spell         = 2,
  Item          = 3
};

[[nodiscard]] constexpr std::string_view to_string(Team t) noexcept {
  switch (t) {
    case Team::Party:    return "Party";
    case Team::Opponent: return "Opponent";
    default:             return "Unknown";
  }
}

[[nodiscard]] constexpr std::string_view to_string(Archetype a) noexcept {
  switch (a) {
    case Archetype::Generic:  return "Generic";
    case Archetype::Guard:    return "Guard";
    case Archetype::Merchant: return "Merchant";
    case Archetype::Villager: return "Villager";
    default:                  return "Unknown";
  }
}

[[nodiscard]] constexpr std::string_view to_string(BehaviorState s) noexcept {
  switch (s) {
    case BehaviorState::Idle:      return "Idle";
    case BehaviorState::Combat:    return "Combat";
    case BehaviorState::Defensive: return "Defensive";
    default:                       return "Unknown";
  }
}

[[nodiscard]] constexpr std::string_view to_string(TargetingState s) noexcept {
  switch (s) {
    case TargetingState::Free:      return "Free";
    case TargetingState::Selecting: return "Selecting";
    case TargetingState::Locked:    return "Locked";
    default:                        return "Unknown";
  }
}

[[nodiscard]] constexpr std::string_view to_string(AttackKind k) noexcept {
  switch (k) {
    case AttackKind::Melee:      return "Melee";
    case AttackKind::Projectile: return "Projectile";
    default:                     return "Unknown";
  }
}

[[nodiscard]] constexpr std::string_view to_string(AbilityKind k) noexcept {
  switch (k) {
    case AbilityKind::BasicAttack:   return "BasicAttack";
    case AbilityKind::SpecialAttack: return "SpecialAttack";
    case AbilityKind::Spell:         return "Spell";
    case AbilityKind::Item:          return "Item";
    default:                         return "Unknown";
  }
}

[[nodiscard]] constexpr std::string_view to_string(ActingMode m) noexcept {
  switch (m) {
    case ActingMode::RealTime:  return "RealTime";
    case ActingMode::TurnBased: return "TurnBased";
    default:                    return "Unknown";
  }
}

} // namespace skirmish::combat
