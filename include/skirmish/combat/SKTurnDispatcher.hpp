#pragma once

#include "SKCombatRng.hpp"
#include "SKCombatant.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace skirmish::combat {

struct TurnConfig {
  float min_delay_ms{500.0f};
  float max_delay_ms{1000.0f};
  float timeout_ms{5000.0f};
};

struct EnemyActionEntry {
  CombatantId opponent{kInvalidCombatant};
  AttackKind action{AttackKind::Melee};
  float delay_ms{0.0f};
};

// Per-archetype action choice for the legacy enemy turn.
[[nodiscard]] AttackKind choose_turn_action(Archetype archetype, Rng& rng);

enum class TurnEndReason : std::uint8_t {
  Completed = 0,
  TimedOut  = 1,
  Cancelled = 2
};

[[nodiscard]] constexpr std::string_view to_string(TurnEndReason r) noexcept {
  switch (r) {
    case TurnEndReason::Completed: return "Completed";
    case TurnEndReason::TimedOut:  return "TimedOut";
    case TurnEndReason::Cancelled: return "Cancelled";
    default:                       return "Unknown";
  }
}

// Sequential, delay-paced enemy turn. Cooperative: only tick() advances it.
class TurnDispatcher final {
public:
  using ValidFn = std::function<bool(CombatantId)>;
  using ExecuteFn = std::function<void(const EnemyActionEntry&)>;

  TurnDispatcher() = default;
  explicit TurnDispatcher(const TurnConfig& cfg) : config_(cfg) {}

  void configure(const TurnConfig& cfg) { config_ = cfg; }

  [[nodiscard]] bool in_progress() const noexcept { return in_progress_; }
  [[nodiscard]] std::size_t pending() const noexcept { return queue_.size(); }
  [[nodiscard]] float elapsed_ms() const noexcept { return elapsed_ms_; }
  [[nodiscard]] std::span<const EnemyActionEntry> queue() const { return queue_; }

  // Builds one entry per living opponent. Returns false (and changes
  // nothing) while a turn is already running or when nobody can act.
  bool begin_turn(std::span<const Combatant> opponents, Rng& rng);

  // Advances pacing. Entries whose opponent fails `is_valid` when their delay
  // elapses are skipped. Returns the end reason when the turn finished during
  // this call.
  std::optional<TurnEndReason> tick(float delta_ms, const ValidFn& is_valid, const ExecuteFn& execute);

  // Drops the queue and pending timers.
  void cancel();

private:
  TurnConfig config_{};
  std::vector<EnemyActionEntry> queue_{};
  bool in_progress_{false};
  float elapsed_ms_{0.0f};       // since begin_turn, for the hard timeout
  float entry_elapsed_ms_{0.0f}; // since the head entry became current

  void finish(TurnEndReason reason);
};

} // namespace skirmish::combat
