#include "skirmish/combat/SKRoster.hpp"

#include <algorithm>
#include <utility>

namespace skirmish::combat {

Roster::Roster() = default;

void Roster::reserve(std::size_t count) {
  combatants_.reserve(count);
  index_by_id_.reserve(count);
}

bool Roster::contains(CombatantId id) const {
  return index_by_id_.find(id) != index_by_id_.end();
}

Combatant* Roster::add(Combatant c) {
  if (c.id == kInvalidCombatant || contains(c.id)) return nullptr;

  const std::size_t idx = combatants_.size();
  index_by_id_.emplace(c.id, idx);
  combatants_.push_back(std::move(c));
  return &combatants_.back();
}

Combatant* Roster::try_get(CombatantId id) {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return nullptr;
  return &combatants_[it->second];
}

const Combatant* Roster::try_get(CombatantId id) const {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return nullptr;
  return &combatants_[it->second];
}

std::optional<Combatant> Roster::remove(CombatantId id) {
  const auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return std::nullopt;

  const std::size_t idx = it->second;
  Combatant out = std::move(combatants_[idx]);

  index_by_id_.erase(it);
  combatants_.erase(combatants_.begin() + static_cast<std::ptrdiff_t>(idx));
  reindex_from(idx);
  return out;
}

void Roster::clear() {
  combatants_.clear();
  index_by_id_.clear();
}

std::vector<CombatantId> Roster::ids() const {
  std::vector<CombatantId> out;
  out.reserve(combatants_.size());
  for (const Combatant& c : combatants_) out.push_back(c.id);
  return out;
}

bool Roster::all_downed() const noexcept {
  return std::all_of(combatants_.begin(), combatants_.end(),
                     [](const Combatant& c) { return c.downed; });
}

Combatant* Roster::leader() {
  for (Combatant& c : combatants_) {
    if (c.is_leader()) return &c;
  }
  return nullptr;
}

const Combatant* Roster::leader() const {
  for (const Combatant& c : combatants_) {
    if (c.is_leader()) return &c;
  }
  return nullptr;
}

void Roster::reindex_from(std::size_t first) {
  for (std::size_t i = first; i < combatants_.size(); ++i) {
    index_by_id_[combatants_[i].id] = i;
  }
}

} // namespace skirmish::combat
