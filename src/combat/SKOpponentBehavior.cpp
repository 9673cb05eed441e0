#include "skirmish/combat/SKOpponentBehavior.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace skirmish::combat {

namespace {
[[nodiscard]] float clamp01(float v) noexcept {
  if (v < 0.0f) return 0.0f;
  if (v > 1.0f) return 1.0f;
  return v;
}
} // namespace

BehaviorState default_initial_state(Archetype archetype, bool recruitable) noexcept {
  switch (archetype) {
    case Archetype::Guard:
    case Archetype::Villager:
      return BehaviorState::Idle;
    case Archetype::Merchant:
      return BehaviorState::Defensive;
    default:
      return recruitable ? BehaviorState::Defensive : BehaviorState::Idle;
  }
}

float default_aggressiveness(Archetype archetype, bool recruitable) noexcept {
  switch (archetype) {
    case Archetype::Guard:    return 1.0f;
    case Archetype::Merchant: return 0.3f;
    case Archetype::Villager: return 0.5f;
    default:                  return recruitable ? 0.6f : 0.8f;
  }
}

void OpponentBehaviorEngine::init_record(Combatant& opponent, Rng& rng) const {
  const BehaviorProfile& p = opponent.profile;
  BehaviorRecord& b = opponent.behavior;
  b = BehaviorRecord{};
  b.state = p.initial_state.value_or(default_initial_state(p.archetype, opponent.recruitable));
  b.aggressiveness = (p.aggressiveness < 0.0f) ? default_aggressiveness(p.archetype, opponent.recruitable)
                                               : clamp01(p.aggressiveness);
  b.attack_cooldown_ms = (opponent.profile.attack_cooldown_ms > 0.0f)
                             ? opponent.profile.attack_cooldown_ms
                             : config_.attack_cooldown_ms;
  b.wander_interval_ms = rng.uniform_range(config_.wander_min_ms, config_.wander_max_ms);
  b.direction = -1.0f; // opponents spawn on the right and face the party
}

bool OpponentBehaviorEngine::evaluate_state(Combatant& opponent) const noexcept {
  BehaviorRecord& b = opponent.behavior;
  const BehaviorState before = b.state;

  if (b.state != BehaviorState::Defensive && opponent.health_frac() <= config_.defensive_health_frac) {
    b.state = BehaviorState::Defensive;
  } else if (b.state == BehaviorState::Idle && b.been_attacked) {
    b.state = BehaviorState::Combat;
  }

  return b.state != before;
}

bool OpponentBehaviorEngine::can_use_ranged(const Combatant& opponent, bool player_charging) const noexcept {
  switch (opponent.profile.archetype) {
    case Archetype::Guard:
    case Archetype::Merchant:
      return true;
    case Archetype::Villager:
      return player_charging; // throws rocks at a charging player
    default:
      return false;
  }
}

float OpponentBehaviorEngine::attack_range_for(const Combatant& opponent, bool player_charging) const noexcept {
  if (opponent.profile.attack_range > 0.0f) return opponent.profile.attack_range;
  return can_use_ranged(opponent, player_charging) ? config_.ranged_attack_range : config_.attack_range;
}

float OpponentBehaviorEngine::attack_damage_for(const Combatant& opponent) const noexcept {
  const float base = (opponent.profile.base_damage > 0.0f) ? opponent.profile.base_damage : config_.base_damage;
  return base + static_cast<float>(std::max(1, opponent.level)) * config_.damage_per_level;
}

float OpponentBehaviorEngine::knockback_for(const Combatant& opponent) const noexcept {
  return config_.knockback_base + static_cast<float>(std::max(1, opponent.level)) * config_.knockback_per_level;
}

bool OpponentBehaviorEngine::try_attack(Combatant& opponent, const EncounterContext& ctx) const noexcept {
  BehaviorRecord& b = opponent.behavior;
  if (ctx.now_ms - b.last_attack_ms < static_cast<TimeMs>(b.attack_cooldown_ms)) return false;
  b.last_attack_ms = ctx.now_ms;
  return true;
}

BehaviorDecision OpponentBehaviorEngine::update(Combatant& opponent,
                                                const Combatant* nearest_target,
                                                float distance_to_target,
                                                float delta_ms,
                                                const EncounterContext& ctx,
                                                Rng& rng) const {
  BehaviorDecision out{};
  out.previous_state = opponent.behavior.state;

  // Frozen outside acting windows: no movement, no attack, no state change.
  if (!ctx.opponents_may_act() || !opponent.can_act()) {
    opponent.behavior.moving = false;
    return out;
  }

  if (!nearest_target) {
    opponent.behavior.moving = false;
    return out;
  }

  out.state_changed = evaluate_state(opponent);
  if (out.state_changed) {
    spdlog::info("{} entering {} (hp {:.0f}%)", opponent.name, to_string(opponent.behavior.state),
                 opponent.health_frac() * 100.0f);
  }

  switch (opponent.behavior.state) {
    case BehaviorState::Idle:
      update_idle(opponent, *nearest_target, distance_to_target, ctx, out);
      break;
    case BehaviorState::Combat:
      update_combat(opponent, *nearest_target, distance_to_target, ctx, out);
      break;
    case BehaviorState::Defensive:
      update_defensive(opponent, *nearest_target, distance_to_target, delta_ms, ctx, rng, out);
      break;
  }

  if (out.wants_attack) {
    const bool ranged = distance_to_target > config_.attack_range && can_use_ranged(opponent, ctx.player_charging);
    out.attack_kind = ranged ? AttackKind::Projectile : AttackKind::Melee;
  }

  opponent.behavior.moving = out.velocity_x != 0.0f;
  return out;
}

void OpponentBehaviorEngine::update_idle(Combatant& opponent, const Combatant& target, float distance,
                                         const EncounterContext& ctx, BehaviorDecision& out) const {
  BehaviorRecord& b = opponent.behavior;
  b.direction = facing_sign(opponent.position, target.position);

  if (ctx.player_charging) {
    if (distance <= attack_range_for(opponent, true)) {
      out.velocity_x = 0.0f;
      out.wants_attack = try_attack(opponent, ctx);
    } else {
      out.velocity_x = config_.move_speed * b.aggressiveness * b.direction;
    }
    return;
  }

  out.velocity_x = config_.move_speed * config_.idle_speed_factor * b.aggressiveness * b.direction;
}

void OpponentBehaviorEngine::update_combat(Combatant& opponent, const Combatant& target, float distance,
                                           const EncounterContext& ctx, BehaviorDecision& out) const {
  BehaviorRecord& b = opponent.behavior;

  if (distance <= attack_range_for(opponent, ctx.player_charging)) {
    out.velocity_x = 0.0f;
    out.wants_attack = try_attack(opponent, ctx);
    return;
  }

  b.direction = facing_sign(opponent.position, target.position);
  const float boost = ctx.player_charging ? config_.combat_charge_boost : 1.0f;
  out.velocity_x = config_.move_speed * b.aggressiveness * boost * b.direction;
}

void OpponentBehaviorEngine::update_defensive(Combatant& opponent, const Combatant& target, float distance,
                                              float delta_ms, const EncounterContext& ctx, Rng& rng,
                                              BehaviorDecision& out) const {
  BehaviorRecord& b = opponent.behavior;
  b.wander_timer_ms += std::max(0.0f, delta_ms);

  const float range = attack_range_for(opponent, ctx.player_charging);

  if (distance <= range) {
    out.velocity_x = 0.0f;
    out.wants_attack = try_attack(opponent, ctx);
  } else if (distance < range * config_.defensive_approach_range_mult) {
    const float dir = facing_sign(opponent.position, target.position);
    const float factor = ctx.player_charging ? config_.defensive_approach_charge_factor
                                             : config_.defensive_approach_factor;
    out.velocity_x = config_.move_speed * b.aggressiveness * factor * dir;
  } else {
    if (b.wander_timer_ms >= b.wander_interval_ms) {
      b.wander_timer_ms = 0.0f;
      b.wander_interval_ms = rng.uniform_range(config_.wander_min_ms, config_.wander_max_ms);
      b.direction = -b.direction;
    }
    out.velocity_x = config_.move_speed * config_.defensive_wander_factor * b.aggressiveness * b.direction;
  }
}

} // namespace skirmish::combat
