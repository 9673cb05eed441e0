#pragma once

#include "SKCombatant.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace skirmish::combat {

// Index-based combatant registry keyed by stable id. Removal preserves the
// relative order of the remaining entries so selection cycling stays stable.
class Roster final {
public:
  Roster();

  void reserve(std::size_t count);

  [[nodiscard]] std::size_t size() const noexcept { return combatants_.size(); }
  [[nodiscard]] bool empty() const noexcept { return combatants_.empty(); }

  [[nodiscard]] bool contains(CombatantId id) const;

  // Returns nullptr when the id is invalid or already present.
  Combatant* add(Combatant c);

  Combatant* try_get(CombatantId id);
  const Combatant* try_get(CombatantId id) const;

  // Removes and returns the record; nullopt if not present.
  std::optional<Combatant> remove(CombatantId id);

  void clear();

  [[nodiscard]] std::span<Combatant> combatants() { return combatants_; }
  [[nodiscard]] std::span<const Combatant> combatants() const { return combatants_; }

  [[nodiscard]] std::vector<CombatantId> ids() const;

  // Party helpers
  [[nodiscard]] bool all_downed() const noexcept;
  Combatant* leader();
  const Combatant* leader() const;

private:
  std::vector<Combatant> combatants_{};
  std::unordered_map<CombatantId, std::size_t> index_by_id_{};

  void reindex_from(std::size_t first);
};

} // namespace skirmish::combat
