#pragma once

#include "SKCombatTypes.hpp"
#include "SKCombatant.hpp"
#include "SKOutcomeResolver.hpp"
#include "SKTurnDispatcher.hpp"

#include <cstdint>
#include <string>
#include <string_view>

// Notifications published synchronously through the encounter's
// entt::dispatcher. Listeners connect with
//   encounter.dispatcher().sink<evt::ComboHit>().connect<&Listener::on_hit>(listener);
namespace skirmish::combat::evt {

// Player-side action that can be refused for lack of AP.
enum class PlayerAction : std::uint8_t {
  Move    = 0,
  Dash    = 1,
  Strike  = 2,
  Ability = 3
};

[[nodiscard]] constexpr std::string_view to_string(PlayerAction a) noexcept {
  switch (a) {
    case PlayerAction::Move:    return "Move";
    case PlayerAction::Dash:    return "Dash";
    case PlayerAction::Strike:  return "Strike";
    case PlayerAction::Ability: return "Ability";
    default:                    return "Unknown";
  }
}

struct ApChanged {
  float previous{0.0f};
  float current{0.0f};
  float max{0.0f};
};

struct NoResource {
  PlayerAction action{PlayerAction::Move};
  float required{0.0f};
  float available{0.0f};
};

struct OutOfRange {
  CombatantId target{kInvalidCombatant};
  float distance{0.0f};
  float max_distance{0.0f};
};

struct ComboHit {
  CombatantId attacker{kInvalidCombatant};
  CombatantId target{kInvalidCombatant};
  std::uint32_t hit_index{1};
  std::uint32_t display_tier{0};
  float damage{0.0f};
  float knockback{0.0f};
  bool target_defeated{false};
};

struct AbilityUsed {
  CombatantId member{kInvalidCombatant};
  CombatantId target{kInvalidCombatant}; // the member itself for Item
  AbilityKind ability{AbilityKind::BasicAttack};
  float amount{0.0f};                    // damage dealt or health restored
};

struct TargetingChanged {
  TargetingState previous{TargetingState::Free};
  TargetingState current{TargetingState::Free};
  CombatantId highlighted{kInvalidCombatant};
  CombatantId locked{kInvalidCombatant};
};

struct BehaviorStateChanged {
  CombatantId opponent{kInvalidCombatant};
  BehaviorState previous{BehaviorState::Idle};
  BehaviorState current{BehaviorState::Idle};
};

struct PartyMemberDamaged {
  CombatantId attacker{kInvalidCombatant};
  CombatantId member{kInvalidCombatant};
  AttackKind kind{AttackKind::Melee};
  float damage{0.0f};
  float health_after{0.0f};
};

struct PartyMemberDowned {
  CombatantId member{kInvalidCombatant};
};

struct OpponentRemoved {
  CombatantId opponent{kInvalidCombatant};
  OpponentFate fate{OpponentFate::Defeated};
};

struct EnemyTurnStarted {
  std::uint32_t queued{0};
};

struct EnemyTurnEnded {
  TurnEndReason reason{TurnEndReason::Completed};
};

struct EncounterEnded {
  OutcomePayload outcome{};
};

// Compact human-readable summaries (for logs).
[[nodiscard]] inline std::string describe(const ComboHit& e) {
  std::string out;
  out.reserve(96);
  out.append("ComboHit src=");
  out.append(std::to_string(e.attacker));
  out.append(" tgt=");
  out.append(std::to_string(e.target));
  out.append(" hit=");
  out.append(std::to_string(e.hit_index));
  out.append(" dmg=");
  out.append(std::to_string(static_cast<int>(e.damage)));
  if (e.target_defeated) out.append(" (DEFEATED)");
  return out;
}

[[nodiscard]] inline std::string describe(const PartyMemberDamaged& e) {
  std::string out;
  out.reserve(96);
  out.append("PartyMemberDamaged src=");
  out.append(std::to_string(e.attacker));
  out.append(" tgt=");
  out.append(std::to_string(e.member));
  out.append(" kind=");
  out.append(std::string(to_string(e.kind)));
  out.append(" dmg=");
  out.append(std::to_string(static_cast<int>(e.damage)));
  out.append(" hp=");
  out.append(std::to_string(static_cast<int>(e.health_after)));
  return out;
}

[[nodiscard]] inline std::string describe(const EncounterEnded& e) {
  std::string out;
  out.reserve(96);
  out.append("EncounterEnded ");
  out.append(std::string(to_string(e.outcome.kind)));
  out.append(" defeated=");
  out.append(std::to_string(e.outcome.defeated_ids.size()));
  out.append(" recruited=");
  out.append(std::to_string(e.outcome.recruited_ids.size()));
  out.append(" negotiated=");
  out.append(std::to_string(e.outcome.negotiated_ids.size()));
  out.append(" reward=");
  out.append(std::to_string(e.outcome.reward));
  return out;
}

} // namespace skirmish::combat::evt
