#include "skirmish/combat/SKComboResolver.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace skirmish::combat {

// ----------------------------------------------------------------------------
// ComboTracker
// ----------------------------------------------------------------------------
bool ComboTracker::ready(TimeMs now_ms) const noexcept {
  if (!has_hit_) return true;
  return (now_ms - last_hit_ms_) >= static_cast<TimeMs>(config_.cooldown_ms);
}

std::optional<std::uint32_t> ComboTracker::try_register_hit(TimeMs now_ms) {
  if (!ready(now_ms)) return std::nullopt;

  if (has_hit_ && (now_ms - last_hit_ms_) > static_cast<TimeMs>(config_.window_ms)) {
    count_ = 0;
  }

  ++count_;
  last_hit_ms_ = now_ms;
  has_hit_ = true;
  return count_;
}

std::uint32_t ComboTracker::count_at(TimeMs now_ms) const noexcept {
  if (!has_hit_) return 0;
  if ((now_ms - last_hit_ms_) > static_cast<TimeMs>(config_.window_ms)) return 0;
  return count_;
}

void ComboTracker::reset() noexcept {
  count_ = 0;
  last_hit_ms_ = 0.0;
  has_hit_ = false;
}

// ----------------------------------------------------------------------------
// ComboResolver
// ----------------------------------------------------------------------------
float ComboResolver::damage_for(float base_damage, std::uint32_t hit_index) const noexcept {
  const std::uint32_t hit = std::max<std::uint32_t>(1U, hit_index);
  const float mult = 1.0f + static_cast<float>(hit - 1U) * config_.per_hit_bonus;
  return std::floor(std::max(0.0f, base_damage) * mult);
}

float ComboResolver::knockback_for(std::uint32_t hit_index) const noexcept {
  const std::uint32_t hit = std::max<std::uint32_t>(1U, hit_index);
  return config_.knockback_base + static_cast<float>(hit) * config_.knockback_per_hit;
}

std::uint32_t ComboResolver::display_tier_for(std::uint32_t hit_index) const noexcept {
  const std::uint32_t hit = std::max<std::uint32_t>(1U, hit_index);
  const std::uint32_t tiers = std::max<std::uint32_t>(1U, config_.display_tiers);
  return std::min(hit - 1U, tiers - 1U);
}

StrikeResult ComboResolver::strike(const Combatant& attacker, Combatant& target, std::uint32_t hit_index) const {
  StrikeResult r{};
  r.hit_index = std::max<std::uint32_t>(1U, hit_index);
  r.damage_dealt = damage_for(attacker.attack, r.hit_index);
  r.knockback = knockback_for(r.hit_index);
  r.combo_display_tier = display_tier_for(r.hit_index);

  // Damage is still reported against an already-defeated target.
  (void)apply_damage(target, r.damage_dealt);
  r.target_defeated = target.health <= 0.0f;

  spdlog::debug("Combo hit {} {} -> {} dmg={} hp={}/{}{}", r.hit_index, attacker.name, target.name,
                r.damage_dealt, target.health, target.max_health, r.target_defeated ? " (defeated)" : "");
  return r;
}

} // namespace skirmish::combat
