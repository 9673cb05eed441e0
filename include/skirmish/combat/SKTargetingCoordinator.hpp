#pragma once

#include "SKCombatTypes.hpp"

#include <cstddef>
#include <span>

namespace skirmish::combat {

struct TargetingConfig {
  float lock_spacing{160.0f};   // gap between player and locked opponent, capped at its melee reach
};

// Free -> Selecting -> Locked. Every call takes the current live opponent
// roster (in roster order) so the coordinator never holds stale references.
class TargetingCoordinator final {
public:
  TargetingCoordinator() = default;

  [[nodiscard]] TargetingState state() const noexcept { return state_; }
  [[nodiscard]] std::size_t highlighted_index() const noexcept { return highlighted_; }
  [[nodiscard]] CombatantId locked_id() const noexcept { return locked_; }

  // Highlighted opponent while Selecting, kInvalidCombatant otherwise.
  [[nodiscard]] CombatantId highlighted_id(std::span<const CombatantId> roster) const noexcept;

  // Free -> Selecting (highlight index 0). Returns false from other states.
  bool begin_selection();

  // Wraps modulo roster size. No-op unless Selecting with a non-empty roster.
  bool select_next(std::span<const CombatantId> roster);
  bool select_previous(std::span<const CombatantId> roster);

  // Selecting -> Locked on the highlighted opponent. Empty roster: no-op.
  bool confirm(std::span<const CombatantId> roster);

  // Selecting -> Free.
  bool cancel_selection();

  // Locked -> Free (quick disengage).
  bool disengage();

  // Encounter ended: always back to Free.
  void reset() noexcept;

  // An opponent left the roster. `remaining` must no longer contain it.
  // Locked on it: Selecting(0) if opponents remain, else Free.
  // Returns true if the targeting state changed.
  bool on_opponent_removed(CombatantId removed, std::span<const CombatantId> remaining);

  // Liveness check for the locked target. Falls back exactly like removal
  // when the locked id is no longer in `roster`. Returns the locked id or
  // kInvalidCombatant.
  CombatantId validate_lock(std::span<const CombatantId> roster);

private:
  TargetingState state_{TargetingState::Free};
  std::size_t highlighted_{0};
  CombatantId locked_{kInvalidCombatant};

  // Id under the highlight when it was last moved; keeps the highlight on
  // the same opponent when an earlier one is removed.
  CombatantId highlighted_subject_{kInvalidCombatant};
};

} // namespace skirmish::combat
