#pragma once

#include "SKCombatant.hpp"

#include <cstdint>
#include <optional>

namespace skirmish::combat {

struct ComboConfig {
  float window_ms{800.0f};        // max gap between hits that keeps the chain
  float cooldown_ms{200.0f};      // min gap between accepted hits
  float per_hit_bonus{0.1f};      // +10% damage per chained hit
  float knockback_base{300.0f};
  float knockback_per_hit{50.0f};
  std::uint32_t display_tiers{5};
  float melee_ap_cost{3.0f};
  float optimal_melee_distance{150.0f};
  float max_melee_distance{195.0f};
};

struct StrikeResult {
  float damage_dealt{0.0f};
  bool target_defeated{false};
  std::uint32_t combo_display_tier{0};
  float knockback{0.0f};
  std::uint32_t hit_index{1};
};

// Chain bookkeeping for the caller. Owns all combo timing.
class ComboTracker final {
public:
  ComboTracker() = default;
  explicit ComboTracker(const ComboConfig& cfg) : config_(cfg) {}

  void configure(const ComboConfig& cfg) { config_ = cfg; }

  // Counts a hit at `now_ms`. Returns the hit index within the chain, or
  // nullopt while the cooldown since the previous hit has not elapsed.
  [[nodiscard]] std::optional<std::uint32_t> try_register_hit(TimeMs now_ms);

  // True when a hit at now_ms would pass the cooldown gate.
  [[nodiscard]] bool ready(TimeMs now_ms) const noexcept;

  // Count as it stands at now_ms (expired chains read as zero).
  [[nodiscard]] std::uint32_t count_at(TimeMs now_ms) const noexcept;

  [[nodiscard]] std::uint32_t count() const noexcept { return count_; }
  [[nodiscard]] TimeMs last_hit_ms() const noexcept { return last_hit_ms_; }

  void reset() noexcept;

private:
  ComboConfig config_{};
  std::uint32_t count_{0};
  TimeMs last_hit_ms_{0.0};
  bool has_hit_{false};
};

// Pure damage / knockback computation for one strike in a chain.
class ComboResolver final {
public:
  ComboResolver() = default;
  explicit ComboResolver(const ComboConfig& cfg) : config_(cfg) {}

  void configure(const ComboConfig& cfg) { config_ = cfg; }
  [[nodiscard]] const ComboConfig& config() const noexcept { return config_; }

  [[nodiscard]] float damage_for(float base_damage, std::uint32_t hit_index) const noexcept;
  [[nodiscard]] float knockback_for(std::uint32_t hit_index) const noexcept;
  [[nodiscard]] std::uint32_t display_tier_for(std::uint32_t hit_index) const noexcept;

  // Applies the strike to `target` (health clamps at 0).
  StrikeResult strike(const Combatant& attacker, Combatant& target, std::uint32_t hit_index) const;

private:
  ComboConfig config_{};
};

} // namespace skirmish::combat
