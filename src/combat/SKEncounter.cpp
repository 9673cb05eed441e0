#include "skirmish/combat/SKEncounter.hpp"

#include "skirmish/core/Profiling.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

namespace skirmish::combat {

Encounter::Encounter(const EncounterConfig& cfg, const RosterData& roster)
    : config_(cfg),
      rng_(cfg.seed),
      ledger_(cfg.ap),
      combo_(cfg.combo),
      resolver_(cfg.combo),
      behavior_(cfg.behavior),
      turn_(cfg.turn),
      outcome_(cfg.reward, cfg.policy) {
  if (roster.party.empty()) throw ConfigError("Encounter requires at least one party member");

  party_.reserve(roster.party.size());
  for (const Combatant& src : roster.party) {
    Combatant m = src;
    m.team = Team::Party;
    m.downed = m.downed || m.health <= 0.0f;
    m.velocity = {};
    m.knockback = {};
    if (!party_.add(std::move(m))) spdlog::warn("Skipping party member with invalid or duplicate id {}", src.id);
  }
  if (party_.empty()) throw ConfigError("Encounter requires at least one party member with a valid id");
  if (!party_.leader()) party_.combatants().front().rank = PartyRank::Leader;

  opponents_.reserve(roster.opponents.size());
  for (const Combatant& src : roster.opponents) {
    if (party_.contains(src.id)) {
      spdlog::warn("Skipping opponent {}: id {} already used by the party", src.name, src.id);
      continue;
    }
    Combatant o = src;
    o.team = Team::Opponent;
    o.downed = false;
    o.velocity = {};
    o.knockback = {};
    if (Combatant* added = opponents_.add(std::move(o))) {
      behavior_.init_record(*added, rng_);
    } else {
      spdlog::warn("Skipping opponent with invalid or duplicate id {}", src.id);
    }
  }

  outcome_.set_return_context(roster.return_context);
  place_combatants();

  spdlog::info("Encounter started: {} party vs {} opponent(s), mode={}, seed={}", party_.size(), opponents_.size(),
               to_string(config_.mode), config_.seed);
}

// ----------------------------------------------------------------------------
// Setup helpers
// ----------------------------------------------------------------------------
void Encounter::place_combatants() {
  const ArenaConfig& a = config_.arena;

  float slot = 0.0f;
  for (Combatant& m : party_.combatants()) {
    if (m.position.x == 0.0f) m.position.x = clamp_x(a.min_x() + a.player_start_offset - slot * a.party_spacing);
    slot += 1.0f;
  }

  slot = 0.0f;
  for (Combatant& o : opponents_.combatants()) {
    if (o.position.x == 0.0f) o.position.x = clamp_x(a.max_x() - a.opponent_start_offset - slot * a.opponent_spacing);
    slot += 1.0f;
  }
}

float Encounter::clamp_x(float x) const noexcept {
  return std::clamp(x, config_.arena.min_x(), config_.arena.max_x());
}

bool Encounter::leader_can_act() const noexcept {
  const Combatant* leader = party_.leader();
  return leader != nullptr && leader->can_act();
}

bool Encounter::player_controls_blocked() const noexcept {
  if (finished_ || dialogue_open_) return true;
  if (targeting_.state() == TargetingState::Selecting) return true;
  return config_.mode == ActingMode::TurnBased && enemy_turn_active_;
}

EncounterContext Encounter::context() const noexcept {
  EncounterContext ctx{};
  ctx.now_ms = now_ms_;
  ctx.mode = config_.mode;
  ctx.dialogue_open = dialogue_open_;
  ctx.selection_open = targeting_.state() == TargetingState::Selecting;
  ctx.victory_sequence = finished_ && outcome_.outcome() && outcome_.outcome()->kind == OutcomeKind::Victory;
  ctx.encounter_over = finished_ || party_.all_downed();

  const bool can = leader_can_act();
  ctx.player_moving = can && move_dir_ != 0;
  ctx.player_dashing = can && dashing_;
  ctx.player_charging = can && charging_;
  ctx.enemy_turn_active = enemy_turn_active_;
  return ctx;
}

// ----------------------------------------------------------------------------
// Frame update
// ----------------------------------------------------------------------------
void Encounter::tick(float delta_ms) {
  SKIRMISH_TRACY_ZONE("Encounter::tick");

  if (finished_) return;
  if (!std::isfinite(delta_ms) || delta_ms <= 0.0f) return;

  now_ms_ += static_cast<TimeMs>(delta_ms);
  const float dt_sec = delta_ms / 1000.0f;

  for (const ScheduledEvent& e : scheduler_.drain(now_ms_)) handle_scheduled(e);

  tick_resources(delta_ms);
  integrate_party(dt_sec);

  if (targeting_.state() == TargetingState::Locked) {
    const TargetingState prev = targeting_.state();
    if (targeting_.validate_lock(opponents_.ids()) == kInvalidCombatant) {
      clear_suppression();
      publish_targeting(prev);
    }
  }

  update_opponents(delta_ms, dt_sec);
  if (finished_) return;

  if (config_.mode == ActingMode::TurnBased) {
    tick_enemy_turn(delta_ms);
    if (finished_) return;
  }

  evaluate_outcome();
}

void Encounter::handle_scheduled(const ScheduledEvent& e) {
  switch (e.kind) {
    case ScheduledEventKind::DashEnd:
      dashing_ = false;
      break;
    case ScheduledEventKind::DashCooldownReady:
      dash_ready_ = true;
      break;
    case ScheduledEventKind::KnockbackEnd: {
      Combatant* c = party_.try_get(e.subject);
      if (!c) c = opponents_.try_get(e.subject);
      if (c) c->knockback = {};
      break;
    }
    case ScheduledEventKind::AttackExpired:
      std::erase_if(active_attacks_, [&](const ActiveAttack& a) { return a.id == e.subject; });
      break;
  }
}

void Encounter::tick_resources(float delta_ms) {
  const bool can = leader_can_act();

  ActivityFlags flags{};
  flags.moving = can && move_dir_ != 0;
  flags.dashing = can && dashing_;
  flags.charging = can && charging_;

  const float before = ledger_.current();
  (void)ledger_.tick(delta_ms, flags);
  if (ledger_.current() != before) publish_ap(before);

  if (ledger_.empty() && (flags.moving || flags.dashing)) {
    const evt::PlayerAction action = flags.dashing ? evt::PlayerAction::Dash : evt::PlayerAction::Move;
    move_dir_ = 0;
    if (dashing_) {
      dashing_ = false;
      if (const Combatant* leader = party_.leader()) scheduler_.cancel_for(ScheduledEventKind::DashEnd, leader->id);
    }
    spdlog::debug("AP exhausted, player movement stopped");
    dispatcher_.trigger(evt::NoResource{action, 0.0f, ledger_.current()});
  }
}

void Encounter::integrate_party(float dt_sec) {
  const bool locked = targeting_.state() == TargetingState::Locked;

  float vx = 0.0f;
  if (leader_can_act() && !locked) {
    vx = dashing_ ? dash_dir_ * config_.movement.dash_speed
                  : static_cast<float>(move_dir_) * config_.movement.player_speed;
  }

  for (Combatant& m : party_.combatants()) {
    if (m.downed) {
      m.velocity = {};
      continue;
    }
    if (locked && m.is_leader()) {
      m.velocity = {};
      continue;
    }
    // Followers move as a group with the leader.
    m.velocity.x = vx;
    m.position.x = clamp_x(m.position.x + (m.velocity.x + m.knockback.x) * dt_sec);
  }
}

void Encounter::update_opponents(float delta_ms, float dt_sec) {
  const EncounterContext ctx = context();

  for (std::size_t i = 0; i < opponents_.size() && !finished_; ++i) {
    Combatant& o = opponents_.combatants()[i];

    float dist = 0.0f;
    const Combatant* target = nearest_standing_party_member(o.position, &dist);
    const BehaviorDecision d = behavior_.update(o, target, dist, delta_ms, ctx, rng_);

    if (d.state_changed) {
      dispatcher_.trigger(evt::BehaviorStateChanged{o.id, d.previous_state, o.behavior.state});
    }

    // The locked opponent keeps its own movement so it can close in on a pinned player.
    o.velocity.x = d.velocity_x;
    const float next = o.position.x + (o.velocity.x + o.knockback.x) * dt_sec;
    const float clamped = clamp_x(next);
    if (clamped != next) o.behavior.direction = -o.behavior.direction;
    o.position.x = clamped;

    if (d.wants_attack && config_.mode == ActingMode::RealTime) resolve_opponent_attack(o, d.attack_kind);
  }
}

void Encounter::tick_enemy_turn(float delta_ms) {
  if (!turn_.in_progress()) return;

  const auto is_valid = [this](CombatantId id) {
    const Combatant* o = opponents_.try_get(id);
    return o != nullptr && o->can_act();
  };
  const auto execute = [this](const EnemyActionEntry& e) {
    const Combatant* o = opponents_.try_get(e.opponent);
    if (!o) return;
    const Combatant attacker = *o;
    resolve_opponent_attack(attacker, e.action);
  };

  const std::optional<TurnEndReason> ended = turn_.tick(delta_ms, is_valid, execute);
  if (ended && !finished_) {
    enemy_turn_active_ = false;
    dispatcher_.trigger(evt::EnemyTurnEnded{*ended});
  }
}

// ----------------------------------------------------------------------------
// Attack resolution
// ----------------------------------------------------------------------------
void Encounter::resolve_opponent_attack(const Combatant& attacker, AttackKind kind) {
  if (finished_) return;

  Combatant* target = nearest_standing_party_member(attacker.position);
  if (!target) return;

  const float applied = apply_damage(*target, behavior_.attack_damage_for(attacker));
  apply_knockback(*target, facing_sign(attacker.position, target->position) * behavior_.knockback_for(attacker));
  record_attack(attacker.id, target->id, kind, applied);

  spdlog::debug("{} hits {} ({}) for {:.0f}, hp {:.0f}/{:.0f}", attacker.name, target->name, to_string(kind),
                applied, target->health, target->max_health);
  dispatcher_.trigger(evt::PartyMemberDamaged{attacker.id, target->id, kind, applied, target->health});

  if (target->is_leader() && target->health > 0.0f) {
    const float before = ledger_.current();
    if (ledger_.grant(config_.ap.grant_on_hit, "player hit") > 0.0f) publish_ap(before);
  }

  if (target->health <= 0.0f && !target->downed) {
    target->downed = true;
    target->velocity = {};
    target->knockback = {};
    scheduler_.cancel_for(ScheduledEventKind::KnockbackEnd, target->id);
    if (target->is_leader()) {
      move_dir_ = 0;
      dashing_ = false;
      charging_ = false;
    }
    spdlog::info("{} is down", target->name);
    dispatcher_.trigger(evt::PartyMemberDowned{target->id});
    evaluate_outcome();
  }
}

void Encounter::apply_knockback(Combatant& target, float signed_speed) {
  target.knockback = Vec2{signed_speed, 0.0f};
  scheduler_.cancel_for(ScheduledEventKind::KnockbackEnd, target.id);
  scheduler_.schedule(ScheduledEventKind::KnockbackEnd, target.id,
                      now_ms_ + static_cast<TimeMs>(config_.movement.knockback_duration_ms));
}

void Encounter::record_attack(CombatantId attacker, CombatantId target, AttackKind kind, float damage) {
  ActiveAttack a{};
  a.id = next_attack_id_++;
  a.attacker = attacker;
  a.target = target;
  a.kind = kind;
  a.damage = damage;
  a.expires_ms = now_ms_ + static_cast<TimeMs>(config_.movement.attack_lifetime_ms);
  active_attacks_.push_back(a);
  scheduler_.schedule(ScheduledEventKind::AttackExpired, a.id, a.expires_ms);
}

// ----------------------------------------------------------------------------
// Movement / resource requests
// ----------------------------------------------------------------------------
bool Encounter::request_move(int direction) {
  if (player_controls_blocked() || !leader_can_act()) return false;
  if (targeting_.state() == TargetingState::Locked) return false;

  const int dir = (direction > 0) ? 1 : ((direction < 0) ? -1 : 0);
  if (dir == 0) {
    move_dir_ = 0;
    return true;
  }

  if (ledger_.empty()) {
    dispatcher_.trigger(evt::NoResource{evt::PlayerAction::Move, 0.0f, ledger_.current()});
    return false;
  }

  move_dir_ = dir;
  facing_ = static_cast<float>(dir);
  return true;
}

bool Encounter::request_dash() {
  if (player_controls_blocked() || !leader_can_act()) return false;
  if (targeting_.state() == TargetingState::Locked) return false;
  if (dashing_ || !dash_ready_) return false;

  if (ledger_.empty()) {
    dispatcher_.trigger(evt::NoResource{evt::PlayerAction::Dash, 0.0f, ledger_.current()});
    return false;
  }

  const Combatant* leader = party_.leader();
  float dir = facing_;
  if (move_dir_ != 0) {
    dir = static_cast<float>(move_dir_);
  } else if (const Combatant* o = nearest_opponent(leader->position)) {
    dir = facing_sign(leader->position, o->position);
  }

  dashing_ = true;
  dash_ready_ = false;
  dash_dir_ = dir;

  const TimeMs end = now_ms_ + static_cast<TimeMs>(config_.movement.dash_duration_ms);
  scheduler_.schedule(ScheduledEventKind::DashEnd, leader->id, end);
  scheduler_.schedule(ScheduledEventKind::DashCooldownReady, leader->id,
                      end + static_cast<TimeMs>(config_.movement.dash_cooldown_ms));

  spdlog::debug("Dash {} ({:.0f} AP)", dir > 0.0f ? "right" : "left", ledger_.current());
  return true;
}

bool Encounter::request_charge_start() {
  if (finished_ || dialogue_open_ || !leader_can_act()) return false;
  if (targeting_.state() == TargetingState::Selecting) return false;
  if (charging_) return false;

  charging_ = true;

  if (config_.mode == ActingMode::TurnBased && !turn_.in_progress()) {
    if (turn_.begin_turn(opponents_.combatants(), rng_)) {
      enemy_turn_active_ = true;
      dispatcher_.trigger(evt::EnemyTurnStarted{static_cast<std::uint32_t>(turn_.pending())});
    }
  }
  return true;
}

bool Encounter::request_charge_stop() {
  if (!charging_) return false;
  charging_ = false;
  return true;
}

// ----------------------------------------------------------------------------
// Attacks
// ----------------------------------------------------------------------------
bool Encounter::request_strike() {
  if (player_controls_blocked() || !leader_can_act()) return false;

  Combatant* leader = party_.leader();
  Combatant* target = nullptr;

  if (targeting_.state() == TargetingState::Locked) {
    const TargetingState prev = targeting_.state();
    const CombatantId id = targeting_.validate_lock(opponents_.ids());
    if (id == kInvalidCombatant) {
      clear_suppression();
      publish_targeting(prev);
      return false;
    }
    target = opponents_.try_get(id);
  } else {
    float dist = 0.0f;
    target = nearest_opponent(leader->position, &dist);
    if (!target) return false;
    if (dist > config_.combo.max_melee_distance) {
      dispatcher_.trigger(evt::OutOfRange{target->id, dist, config_.combo.max_melee_distance});
      return false;
    }
  }
  if (!target) return false;

  if (!combo_.ready(now_ms_)) return false;

  const float before = ledger_.current();
  if (!ledger_.consume(config_.combo.melee_ap_cost)) {
    dispatcher_.trigger(evt::NoResource{evt::PlayerAction::Strike, config_.combo.melee_ap_cost, before});
    return false;
  }
  publish_ap(before);

  const std::uint32_t hit_index = combo_.try_register_hit(now_ms_).value_or(1U);
  const StrikeResult r = resolver_.strike(*leader, *target, hit_index);
  last_damage_ = r.damage_dealt;

  OpponentBehaviorEngine::mark_attacked(*target);
  if (!r.target_defeated) apply_knockback(*target, facing_sign(leader->position, target->position) * r.knockback);
  record_attack(leader->id, target->id, AttackKind::Melee, r.damage_dealt);

  const CombatantId target_id = target->id;
  dispatcher_.trigger(evt::ComboHit{leader->id, target_id, r.hit_index, r.combo_display_tier, r.damage_dealt,
                                    r.knockback, r.target_defeated});

  if (r.target_defeated) remove_opponent(target_id, OpponentFate::Defeated);
  return true;
}

bool Encounter::request_ability(std::size_t member_index, AbilityKind kind) {
  if (player_controls_blocked()) return false;
  if (member_index >= party_.size()) return false;

  Combatant& member = party_.combatants()[member_index];
  if (!member.can_act()) return false;

  const AbilitySpec& spec = config_.abilities.get(kind);

  CombatantId target_id = kInvalidCombatant;
  if (kind != AbilityKind::Item) {
    if (targeting_.state() == TargetingState::Locked) {
      const TargetingState prev = targeting_.state();
      target_id = targeting_.validate_lock(opponents_.ids());
      if (target_id == kInvalidCombatant) {
        clear_suppression();
        publish_targeting(prev);
        return false;
      }
    } else if (const Combatant* nearest = nearest_opponent(member.position)) {
      target_id = nearest->id;
    }
    if (target_id == kInvalidCombatant) return false;
  }

  const float before = ledger_.current();
  if (!ledger_.consume(spec.ap_cost)) {
    dispatcher_.trigger(evt::NoResource{evt::PlayerAction::Ability, spec.ap_cost, before});
    return false;
  }
  publish_ap(before);

  if (kind == AbilityKind::Item) {
    const float healed = apply_heal(member, spec.heal);
    spdlog::debug("{} uses an item (+{:.0f} hp)", member.name, healed);
    dispatcher_.trigger(evt::AbilityUsed{member.id, member.id, kind, healed});
    return true;
  }

  Combatant* target = opponents_.try_get(target_id);
  const float dealt = apply_damage(*target, spec.damage);
  OpponentBehaviorEngine::mark_attacked(*target);
  record_attack(member.id, target_id, kind == AbilityKind::Spell ? AttackKind::Projectile : AttackKind::Melee, dealt);

  spdlog::debug("{} uses {} on {} for {:.0f}", member.name, to_string(kind), target->name, dealt);
  const bool defeated = target->health <= 0.0f;
  dispatcher_.trigger(evt::AbilityUsed{member.id, target_id, kind, dealt});

  if (defeated) remove_opponent(target_id, OpponentFate::Defeated);
  return true;
}

// ----------------------------------------------------------------------------
// Targeting
// ----------------------------------------------------------------------------
bool Encounter::request_select() {
  if (finished_ || dialogue_open_) return false;

  const TargetingState prev = targeting_.state();
  if (!targeting_.begin_selection()) return false;

  move_dir_ = 0;
  publish_targeting(prev);
  return true;
}

bool Encounter::request_select_next() {
  if (finished_) return false;
  const TargetingState prev = targeting_.state();
  if (!targeting_.select_next(opponents_.ids())) return false;
  publish_targeting(prev);
  return true;
}

bool Encounter::request_select_previous() {
  if (finished_) return false;
  const TargetingState prev = targeting_.state();
  if (!targeting_.select_previous(opponents_.ids())) return false;
  publish_targeting(prev);
  return true;
}

bool Encounter::request_confirm_target() {
  if (finished_) return false;
  const TargetingState prev = targeting_.state();
  if (!targeting_.confirm(opponents_.ids())) return false;

  combo_.reset();
  apply_lock_layout();
  publish_targeting(prev);
  return true;
}

bool Encounter::request_cancel_selection() {
  const TargetingState prev = targeting_.state();
  if (!targeting_.cancel_selection()) return false;
  publish_targeting(prev);
  return true;
}

bool Encounter::request_disengage() {
  const TargetingState prev = targeting_.state();
  if (!targeting_.disengage()) return false;

  clear_suppression();
  combo_.reset();
  publish_targeting(prev);
  return true;
}

void Encounter::apply_lock_layout() {
  const CombatantId locked = targeting_.locked_id();
  const Combatant* subject = opponents_.try_get(locked);
  const float center = config_.arena.center_x();

  // Never stage the pair beyond the opponent's melee reach.
  float gap = std::max(0.0f, config_.targeting.lock_spacing);
  if (subject) gap = std::min(gap, behavior_.attack_range_for(*subject, false));
  const float half = gap * 0.5f;

  for (Combatant& m : party_.combatants()) {
    if (m.is_leader()) {
      m.position.x = clamp_x(center - half);
      m.velocity = {};
      m.suppressed = false;
    } else {
      m.suppressed = true;
    }
  }
  for (Combatant& o : opponents_.combatants()) {
    if (o.id == locked) {
      o.position.x = clamp_x(center + half);
      o.velocity = {};
      o.suppressed = false;
    } else {
      o.suppressed = true;
    }
  }

  move_dir_ = 0;
  dashing_ = false;
}

void Encounter::clear_suppression() {
  for (Combatant& m : party_.combatants()) m.suppressed = false;
  for (Combatant& o : opponents_.combatants()) o.suppressed = false;
}

void Encounter::publish_targeting(TargetingState previous) {
  const auto ids = opponents_.ids();
  dispatcher_.trigger(evt::TargetingChanged{previous, targeting_.state(), targeting_.highlighted_id(ids),
                                            targeting_.locked_id()});
}

// ----------------------------------------------------------------------------
// Dialogue outcomes
// ----------------------------------------------------------------------------
Combatant* Encounter::dialogue_subject() {
  switch (targeting_.state()) {
    case TargetingState::Locked:
      return opponents_.try_get(targeting_.locked_id());
    case TargetingState::Selecting:
      return opponents_.try_get(targeting_.highlighted_id(opponents_.ids()));
    case TargetingState::Free:
    default: {
      const Combatant* leader = party_.leader();
      return leader ? nearest_opponent(leader->position) : nullptr;
    }
  }
}

bool Encounter::request_flee() {
  if (finished_) return false;
  const Combatant* leader = party_.leader();
  if (!leader) return false;

  const bool escaped = outcome_.roll_flee(*leader, opponents_.combatants(), rng_);
  spdlog::info("Flee attempt {}", escaped ? "succeeded" : "failed");
  if (!escaped) return false;

  if (const auto payload = outcome_.disengage(party_, opponents_)) finish(*payload);
  return true;
}

bool Encounter::request_recruit() {
  if (finished_) return false;
  Combatant* subject = dialogue_subject();
  if (!subject) return false;

  const auto removals = outcome_.removals();
  const auto recruited = static_cast<std::size_t>(std::count_if(
      removals.begin(), removals.end(), [](const OpponentOutcomeRecord& r) { return r.fate == OpponentFate::Recruited; }));

  if (!outcome_.can_recruit(*subject, party_.size() + recruited)) {
    spdlog::info("{} cannot be recruited", subject->name);
    return false;
  }

  spdlog::info("{} joins the party", subject->name);
  remove_opponent(subject->id, OpponentFate::Recruited);
  return true;
}

bool Encounter::request_negotiate() {
  if (finished_) return false;
  const Combatant* leader = party_.leader();
  Combatant* subject = dialogue_subject();
  if (!leader || !subject) return false;

  const bool agreed = outcome_.roll_negotiate(*leader, *subject, rng_);
  spdlog::info("Negotiation with {} {}", subject->name, agreed ? "succeeded" : "failed");
  if (!agreed) return false;

  remove_opponent(subject->id, OpponentFate::Negotiated);
  return true;
}

void Encounter::set_dialogue_open(bool open) {
  if (dialogue_open_ == open) return;
  dialogue_open_ = open;
  if (open) move_dir_ = 0;
  spdlog::debug("Dialogue {}", open ? "opened" : "closed");
}

// ----------------------------------------------------------------------------
// Roster changes and termination
// ----------------------------------------------------------------------------
void Encounter::remove_opponent(CombatantId id, OpponentFate fate) {
  const std::optional<Combatant> removed = opponents_.remove(id);
  if (!removed) return;

  scheduler_.cancel_for(ScheduledEventKind::KnockbackEnd, id);
  outcome_.record_removal(
      OpponentOutcomeRecord{removed->id, removed->name, removed->level, removed->profile.archetype, fate});

  const TargetingState prev = targeting_.state();
  const bool changed = targeting_.on_opponent_removed(id, opponents_.ids());
  if (changed) {
    if (prev == TargetingState::Locked) {
      clear_suppression();
      combo_.reset();
    }
    publish_targeting(prev);
  } else if (prev == TargetingState::Selecting) {
    publish_targeting(prev); // highlight index may have shifted
  }

  spdlog::info("{} removed from the encounter ({})", removed->name, to_string(fate));
  dispatcher_.trigger(evt::OpponentRemoved{id, fate});

  evaluate_outcome();
}

void Encounter::evaluate_outcome() {
  if (finished_) return;
  if (const auto payload = outcome_.evaluate(party_, opponents_)) finish(*payload);
}

void Encounter::finish(const OutcomePayload& payload) {
  if (finished_) return;
  finished_ = true;

  scheduler_.clear();
  active_attacks_.clear();

  if (turn_.in_progress()) {
    turn_.cancel();
    dispatcher_.trigger(evt::EnemyTurnEnded{TurnEndReason::Cancelled});
  }
  enemy_turn_active_ = false;

  const TargetingState prev = targeting_.state();
  targeting_.reset();
  clear_suppression();
  if (prev != TargetingState::Free) publish_targeting(prev);

  move_dir_ = 0;
  dashing_ = false;
  charging_ = false;
  combo_.reset();

  for (Combatant& m : party_.combatants()) {
    m.velocity = {};
    m.knockback = {};
  }
  for (Combatant& o : opponents_.combatants()) {
    o.velocity = {};
    o.knockback = {};
    o.behavior.moving = false;
  }

  spdlog::info("Encounter ended at {:.0f} ms: {}", now_ms_, to_string(payload.kind));
  dispatcher_.trigger(evt::EncounterEnded{payload});
}

void Encounter::publish_ap(float previous) {
  dispatcher_.trigger(evt::ApChanged{previous, ledger_.current(), ledger_.max()});
}

// ----------------------------------------------------------------------------
// Queries
// ----------------------------------------------------------------------------
Combatant* Encounter::nearest_opponent(Vec2 from, float* out_distance) {
  Combatant* best = nullptr;
  float best_d = std::numeric_limits<float>::max();
  for (Combatant& o : opponents_.combatants()) {
    if (o.health <= 0.0f) continue;
    const float d = distance(from, o.position);
    if (d < best_d) {
      best_d = d;
      best = &o;
    }
  }
  if (out_distance) *out_distance = best ? best_d : 0.0f;
  return best;
}

Combatant* Encounter::nearest_standing_party_member(Vec2 from, float* out_distance) {
  Combatant* best = nullptr;
  float best_d = std::numeric_limits<float>::max();
  for (Combatant& m : party_.combatants()) {
    if (m.downed) continue;
    const float d = distance(from, m.position);
    if (d < best_d) {
      best_d = d;
      best = &m;
    }
  }
  if (out_distance) *out_distance = best ? best_d : 0.0f;
  return best;
}

EncounterSnapshot Encounter::snapshot() const {
  EncounterSnapshot s{};
  s.now_ms = now_ms_;
  s.mode = config_.mode;
  s.ap = ledger_.current();
  s.ap_max = ledger_.max();
  s.combo_count = combo_.count_at(now_ms_);
  s.last_damage = last_damage_;

  const auto ids = opponents_.ids();
  s.targeting = targeting_.state();
  s.highlighted = targeting_.highlighted_id(ids);
  s.locked = targeting_.locked_id();
  s.enemy_turn_active = enemy_turn_active_;
  s.dialogue_open = dialogue_open_;

  s.opponents.reserve(opponents_.size());
  for (const Combatant& o : opponents_.combatants()) {
    s.opponents.push_back(OpponentView{o.id, o.name, o.health, o.max_health, o.behavior.state, o.suppressed, o.position});
  }

  s.party.reserve(party_.size());
  for (const Combatant& m : party_.combatants()) {
    s.party.push_back(PartyView{m.id, m.name, m.health, m.max_health, m.downed, m.is_leader(), m.suppressed, m.position});
  }

  s.active_attacks = active_attacks_;
  s.outcome = outcome_.outcome();
  return s;
}

} // namespace skirmish::combat
