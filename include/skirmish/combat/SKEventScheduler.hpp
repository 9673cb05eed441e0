#pragma once

#include "SKCombatTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace skirmish::combat {

enum class ScheduledEventKind : std::uint8_t {
  DashEnd           = 0,
  DashCooldownReady = 1,
  KnockbackEnd      = 2,
  AttackExpired     = 3
};

[[nodiscard]] constexpr std::string_view to_string(ScheduledEventKind k) noexcept {
  switch (k) {
    case ScheduledEventKind::DashEnd:           return "DashEnd";
    case ScheduledEventKind::DashCooldownReady: return "DashCooldownReady";
    case ScheduledEventKind::KnockbackEnd:      return "KnockbackEnd";
    case ScheduledEventKind::AttackExpired:     return "AttackExpired";
    default:                                    return "Unknown";
  }
}

using ScheduledEventId = std::uint32_t;

struct ScheduledEvent {
  ScheduledEventId id{0};
  ScheduledEventKind kind{ScheduledEventKind::DashEnd};
  std::uint32_t subject{0}; // combatant id or attack id, depending on kind
  TimeMs due_ms{0.0};
};

// Per-encounter timer list. Owned by the encounter, drained once per tick and
// cleared on teardown, so nothing fires after the encounter has ended.
class EventScheduler final {
public:
  EventScheduler() = default;

  ScheduledEventId schedule(ScheduledEventKind kind, std::uint32_t subject, TimeMs due_ms);

  // Drops every pending event of `kind` for `subject`. Returns how many were dropped.
  std::size_t cancel_for(ScheduledEventKind kind, std::uint32_t subject);

  // Removes and returns all events due at or before now_ms, ordered by due
  // time then by scheduling order.
  [[nodiscard]] std::vector<ScheduledEvent> drain(TimeMs now_ms);

  void clear() noexcept { pending_.clear(); }

  [[nodiscard]] std::size_t pending() const noexcept { return pending_.size(); }
  [[nodiscard]] bool has_pending(ScheduledEventKind kind, std::uint32_t subject) const noexcept;

private:
  std::vector<ScheduledEvent> pending_{};
  ScheduledEventId next_id_{1};
};

} // namespace skirmish::combat
