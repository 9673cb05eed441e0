#include "skirmish/combat/SKTargetingCoordinator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace skirmish::combat {

namespace {
[[nodiscard]] bool roster_contains(std::span<const CombatantId> roster, CombatantId id) {
  return std::find(roster.begin(), roster.end(), id) != roster.end();
}
} // namespace

CombatantId TargetingCoordinator::highlighted_id(std::span<const CombatantId> roster) const noexcept {
  if (state_ != TargetingState::Selecting || roster.empty()) return kInvalidCombatant;
  return roster[std::min(highlighted_, roster.size() - 1U)];
}

bool TargetingCoordinator::begin_selection() {
  if (state_ != TargetingState::Free) return false;

  state_ = TargetingState::Selecting;
  highlighted_ = 0;
  highlighted_subject_ = kInvalidCombatant;
  spdlog::debug("Targeting: Free -> Selecting");
  return true;
}

bool TargetingCoordinator::select_next(std::span<const CombatantId> roster) {
  if (state_ != TargetingState::Selecting || roster.empty()) return false;

  highlighted_ = (highlighted_ + 1U) % roster.size();
  highlighted_subject_ = roster[highlighted_];
  return true;
}

bool TargetingCoordinator::select_previous(std::span<const CombatantId> roster) {
  if (state_ != TargetingState::Selecting || roster.empty()) return false;

  highlighted_ = (std::min(highlighted_, roster.size() - 1U) + roster.size() - 1U) % roster.size();
  highlighted_subject_ = roster[highlighted_];
  return true;
}

bool TargetingCoordinator::confirm(std::span<const CombatantId> roster) {
  if (state_ != TargetingState::Selecting || roster.empty()) return false;

  locked_ = roster[std::min(highlighted_, roster.size() - 1U)];
  state_ = TargetingState::Locked;
  highlighted_ = 0;
  highlighted_subject_ = kInvalidCombatant;
  spdlog::info("Targeting: locked on opponent {}", locked_);
  return true;
}

bool TargetingCoordinator::cancel_selection() {
  if (state_ != TargetingState::Selecting) return false;

  state_ = TargetingState::Free;
  highlighted_ = 0;
  highlighted_subject_ = kInvalidCombatant;
  spdlog::debug("Targeting: Selecting -> Free");
  return true;
}

bool TargetingCoordinator::disengage() {
  if (state_ != TargetingState::Locked) return false;

  spdlog::info("Targeting: disengaged from opponent {}", locked_);
  state_ = TargetingState::Free;
  locked_ = kInvalidCombatant;
  return true;
}

void TargetingCoordinator::reset() noexcept {
  state_ = TargetingState::Free;
  highlighted_ = 0;
  highlighted_subject_ = kInvalidCombatant;
  locked_ = kInvalidCombatant;
}

bool TargetingCoordinator::on_opponent_removed(CombatantId removed, std::span<const CombatantId> remaining) {
  switch (state_) {
    case TargetingState::Locked: {
      if (removed != locked_) return false;

      locked_ = kInvalidCombatant;
      highlighted_ = 0;
      highlighted_subject_ = kInvalidCombatant;
      state_ = remaining.empty() ? TargetingState::Free : TargetingState::Selecting;
      spdlog::info("Targeting: locked opponent {} removed -> {}", removed, to_string(state_));
      return true;
    }
    case TargetingState::Selecting: {
      if (remaining.empty()) {
        highlighted_ = 0;
        highlighted_subject_ = kInvalidCombatant;
        return false;
      }
      const auto it = std::find(remaining.begin(), remaining.end(), highlighted_subject_);
      if (it != remaining.end()) {
        highlighted_ = static_cast<std::size_t>(it - remaining.begin());
      } else {
        highlighted_ = std::min(highlighted_, remaining.size() - 1U);
      }
      return false;
    }
    case TargetingState::Free:
    default:
      return false;
  }
}

CombatantId TargetingCoordinator::validate_lock(std::span<const CombatantId> roster) {
  if (state_ != TargetingState::Locked) return kInvalidCombatant;
  if (roster_contains(roster, locked_)) return locked_;

  (void)on_opponent_removed(locked_, roster);
  return kInvalidCombatant;
}

} // namespace skirmish::combat
