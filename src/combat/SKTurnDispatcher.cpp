#include "skirmish/combat/SKTurnDispatcher.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace skirmish::combat {

AttackKind choose_turn_action(Archetype archetype, Rng& rng) {
  switch (archetype) {
    case Archetype::Guard:
      return rng.chance(0.5f) ? AttackKind::Melee : AttackKind::Projectile;
    case Archetype::Merchant:
      return AttackKind::Projectile;
    case Archetype::Villager:
    case Archetype::Generic:
    default:
      return AttackKind::Melee;
  }
}

bool TurnDispatcher::begin_turn(std::span<const Combatant> opponents, Rng& rng) {
  if (in_progress_) {
    spdlog::debug("Enemy turn already running; request ignored");
    return false;
  }

  std::vector<EnemyActionEntry> built;
  built.reserve(opponents.size());
  for (const Combatant& o : opponents) {
    if (!o.can_act()) continue;

    EnemyActionEntry e{};
    e.opponent = o.id;
    e.action = choose_turn_action(o.profile.archetype, rng);
    e.delay_ms = rng.uniform_range(config_.min_delay_ms, config_.max_delay_ms);
    built.push_back(e);
  }

  if (built.empty()) return false;

  queue_ = std::move(built);
  in_progress_ = true;
  elapsed_ms_ = 0.0f;
  entry_elapsed_ms_ = 0.0f;

  spdlog::info("Enemy turn started with {} queued action(s)", queue_.size());
  return true;
}

std::optional<TurnEndReason> TurnDispatcher::tick(float delta_ms, const ValidFn& is_valid, const ExecuteFn& execute) {
  if (!in_progress_) return std::nullopt;

  delta_ms = std::max(0.0f, delta_ms);
  elapsed_ms_ += delta_ms;

  if (elapsed_ms_ >= config_.timeout_ms) {
    spdlog::warn("Enemy turn timeout after {:.0f} ms - forcing end ({} action(s) dropped)", elapsed_ms_, queue_.size());
    finish(TurnEndReason::TimedOut);
    return TurnEndReason::TimedOut;
  }

  entry_elapsed_ms_ += delta_ms;

  while (in_progress_ && !queue_.empty()) {
    if (entry_elapsed_ms_ < queue_.front().delay_ms) break;

    const EnemyActionEntry entry = queue_.front();
    queue_.erase(queue_.begin());
    entry_elapsed_ms_ -= entry.delay_ms;

    if (!is_valid || !is_valid(entry.opponent)) {
      spdlog::debug("Enemy action for {} skipped (no longer valid)", entry.opponent);
      continue;
    }
    if (execute) execute(entry);
  }

  // `execute` may have torn the turn down.
  if (!in_progress_) return TurnEndReason::Cancelled;

  if (queue_.empty()) {
    finish(TurnEndReason::Completed);
    return TurnEndReason::Completed;
  }
  return std::nullopt;
}

void TurnDispatcher::cancel() {
  if (in_progress_) spdlog::debug("Enemy turn cancelled ({} pending)", queue_.size());
  queue_.clear();
  in_progress_ = false;
  elapsed_ms_ = 0.0f;
  entry_elapsed_ms_ = 0.0f;
}

void TurnDispatcher::finish(TurnEndReason reason) {
  queue_.clear();
  in_progress_ = false;
  entry_elapsed_ms_ = 0.0f;
  spdlog::info("Enemy turn ended: {} after {:.0f} ms", to_string(reason), elapsed_ms_);
}

} // namespace skirmish::combat
