#pragma once

#include "SKCombatTypes.hpp"

namespace skirmish::combat {

// Per-tick snapshot of the encounter-level flags every opponent decision
// depends on. Built by the encounter and passed by value/reference; no
// component reads these from ambient state.
struct EncounterContext {
  TimeMs now_ms{0.0};
  ActingMode mode{ActingMode::RealTime};

  // Non-acting phases
  bool dialogue_open{false};
  bool selection_open{false};
  bool victory_sequence{false};
  bool encounter_over{false};

  // Player activity this tick
  bool player_moving{false};
  bool player_dashing{false};
  bool player_charging{false};

  // Legacy turn mode: the enemy phase is running.
  bool enemy_turn_active{false};

  [[nodiscard]] constexpr bool non_acting_phase() const noexcept {
    return dialogue_open || selection_open || victory_sequence || encounter_over;
  }

  // The player is exposed while spending AP (moving, dashing) or charging it.
  [[nodiscard]] constexpr bool player_vulnerable() const noexcept {
    return player_moving || player_dashing || player_charging;
  }

  // The single "opponents may act now" predicate shared by both acting modes.
  [[nodiscard]] constexpr bool opponents_may_act() const noexcept {
    if (non_acting_phase()) return false;
    if (mode == ActingMode::TurnBased) return enemy_turn_active;
    return player_vulnerable();
  }
};

} // namespace skirmish::combat
