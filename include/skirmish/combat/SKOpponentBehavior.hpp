#pragma once

#include "SKCombatRng.hpp"
#include "SKCombatant.hpp"
#include "SKEncounterContext.hpp"

namespace skirmish::combat {

struct BehaviorConfig {
  float move_speed{150.0f};              // units/s before aggressiveness scaling
  float attack_range{180.0f};            // melee reach
  float ranged_attack_range{250.0f};     // reach of ranged-capable archetypes
  float attack_cooldown_ms{1500.0f};
  float defensive_health_frac{0.5f};     // at or below => Defensive

  float idle_speed_factor{0.7f};
  float combat_charge_boost{1.2f};
  float defensive_approach_factor{0.4f};
  float defensive_approach_charge_factor{0.6f};
  float defensive_approach_range_mult{1.5f};
  float defensive_wander_factor{0.3f};
  float wander_min_ms{1000.0f};
  float wander_max_ms{2500.0f};

  // Attack payload: base + level * per_level
  float base_damage{15.0f};
  float damage_per_level{2.0f};
  float knockback_base{200.0f};
  float knockback_per_level{30.0f};
};

// Starting disposition per archetype: Guards and Villagers start Idle,
// Merchants and recruitable Generics start Defensive.
[[nodiscard]] BehaviorState default_initial_state(Archetype archetype, bool recruitable) noexcept;
// Guard 1.0, Merchant 0.3, Villager 0.5, Generic 0.8 (0.6 when recruitable).
[[nodiscard]] float default_aggressiveness(Archetype archetype, bool recruitable) noexcept;

// What one opponent wants to do this tick. The encounter applies it.
struct BehaviorDecision {
  float velocity_x{0.0f};
  bool wants_attack{false};
  AttackKind attack_kind{AttackKind::Melee};
  bool state_changed{false};
  BehaviorState previous_state{BehaviorState::Idle};
};

// Idle -> Combat -> Defensive state machine, one record per opponent.
class OpponentBehaviorEngine final {
public:
  OpponentBehaviorEngine() = default;
  explicit OpponentBehaviorEngine(const BehaviorConfig& cfg) : config_(cfg) {}

  void configure(const BehaviorConfig& cfg) { config_ = cfg; }
  [[nodiscard]] const BehaviorConfig& config() const noexcept { return config_; }

  // Seeds the behavior record from the opponent's profile, filling unset
  // fields from the archetype defaults.
  void init_record(Combatant& opponent, Rng& rng) const;

  // Called when the player's strike lands. Takes effect on the next acting update.
  static void mark_attacked(Combatant& opponent) noexcept { opponent.behavior.been_attacked = true; }

  // Applies the state transition rules. Returns true if the state changed.
  bool evaluate_state(Combatant& opponent) const noexcept;

  // `nearest_target` may be null when every party member is downed.
  BehaviorDecision update(Combatant& opponent,
                          const Combatant* nearest_target,
                          float distance_to_target,
                          float delta_ms,
                          const EncounterContext& ctx,
                          Rng& rng) const;

  [[nodiscard]] bool can_use_ranged(const Combatant& opponent, bool player_charging) const noexcept;
  [[nodiscard]] float attack_range_for(const Combatant& opponent, bool player_charging) const noexcept;
  [[nodiscard]] float attack_damage_for(const Combatant& opponent) const noexcept;
  [[nodiscard]] float knockback_for(const Combatant& opponent) const noexcept;

private:
  BehaviorConfig config_{};

  [[nodiscard]] bool try_attack(Combatant& opponent, const EncounterContext& ctx) const noexcept;

  void update_idle(Combatant& opponent, const Combatant& target, float distance,
                   const EncounterContext& ctx, BehaviorDecision& out) const;
  void update_combat(Combatant& opponent, const Combatant& target, float distance,
                     const EncounterContext& ctx, BehaviorDecision& out) const;
  void update_defensive(Combatant& opponent, const Combatant& target, float distance, float delta_ms,
                        const EncounterContext& ctx, Rng& rng, BehaviorDecision& out) const;
};

} // namespace skirmish::combat
