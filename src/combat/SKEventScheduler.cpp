#include "skirmish/combat/SKEventScheduler.hpp"

#include <algorithm>

namespace skirmish::combat {

ScheduledEventId EventScheduler::schedule(ScheduledEventKind kind, std::uint32_t subject, TimeMs due_ms) {
  ScheduledEvent e{};
  e.id = next_id_++;
  e.kind = kind;
  e.subject = subject;
  e.due_ms = due_ms;
  pending_.push_back(e);
  return e.id;
}

std::size_t EventScheduler::cancel_for(ScheduledEventKind kind, std::uint32_t subject) {
  const auto before = pending_.size();
  std::erase_if(pending_, [&](const ScheduledEvent& e) { return e.kind == kind && e.subject == subject; });
  return before - pending_.size();
}

std::vector<ScheduledEvent> EventScheduler::drain(TimeMs now_ms) {
  std::vector<ScheduledEvent> due;
  if (pending_.empty()) return due;

  auto split = std::stable_partition(pending_.begin(), pending_.end(),
                                     [&](const ScheduledEvent& e) { return e.due_ms > now_ms; });
  due.assign(split, pending_.end());
  pending_.erase(split, pending_.end());

  std::stable_sort(due.begin(), due.end(), [](const ScheduledEvent& a, const ScheduledEvent& b) {
    if (a.due_ms != b.due_ms) return a.due_ms < b.due_ms;
    return a.id < b.id;
  });
  return due;
}

bool EventScheduler::has_pending(ScheduledEventKind kind, std::uint32_t subject) const noexcept {
  return std::any_of(pending_.begin(), pending_.end(),
                     [&](const ScheduledEvent& e) { return e.kind == kind && e.subject == subject; });
}

} // namespace skirmish::combat
