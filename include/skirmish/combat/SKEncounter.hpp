#pragma once

#include "SKCombatEvents.hpp"
#include "SKCombatRng.hpp"
#include "SKComboResolver.hpp"
#include "SKEncounterConfig.hpp"
#include "SKEncounterContext.hpp"
#include "SKEventScheduler.hpp"
#include "SKOpponentBehavior.hpp"
#include "SKOutcomeResolver.hpp"
#include "SKResourceLedger.hpp"
#include "SKRoster.hpp"
#include "SKTargetingCoordinator.hpp"
#include "SKTurnDispatcher.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <entt/signal/dispatcher.hpp>

namespace skirmish::combat {

// A resolved attack kept around for presentation until its lifetime expires.
struct ActiveAttack {
  std::uint32_t id{0};
  CombatantId attacker{kInvalidCombatant};
  CombatantId target{kInvalidCombatant};
  AttackKind kind{AttackKind::Melee};
  float damage{0.0f};
  TimeMs expires_ms{0.0};
};

struct OpponentView {
  CombatantId id{kInvalidCombatant};
  std::string name{};
  float health{0.0f};
  float max_health{0.0f};
  BehaviorState state{BehaviorState::Idle};
  bool suppressed{false};
  Vec2 position{};
};

struct PartyView {
  CombatantId id{kInvalidCombatant};
  std::string name{};
  float health{0.0f};
  float max_health{0.0f};
  bool downed{false};
  bool leader{false};
  bool suppressed{false};
  Vec2 position{};
};

// Read-only picture of the encounter for a presentation layer.
struct EncounterSnapshot {
  TimeMs now_ms{0.0};
  ActingMode mode{ActingMode::RealTime};

  float ap{0.0f};
  float ap_max{0.0f};

  std::uint32_t combo_count{0};
  float last_damage{0.0f};

  TargetingState targeting{TargetingState::Free};
  CombatantId highlighted{kInvalidCombatant};
  CombatantId locked{kInvalidCombatant};

  bool enemy_turn_active{false};
  bool dialogue_open{false};

  std::vector<OpponentView> opponents{};
  std::vector<PartyView> party{};
  std::vector<ActiveAttack> active_attacks{};

  std::optional<OutcomePayload> outcome{};
};

// Owns every combat component and all mutable encounter state. Driven by
// tick() once per frame plus the request_* entry points; everything it
// decides is published on dispatcher().
//
// Requests return true when accepted. Rejections change nothing; those caused
// by missing AP or reach also publish NoResource / OutOfRange. Listeners run
// synchronously inside the call that triggered them and must not re-enter
// the request_* entry points.
class Encounter final {
public:
  // Throws ConfigError when the roster has no party member.
  Encounter(const EncounterConfig& cfg, const RosterData& roster);

  Encounter(const Encounter&) = delete;
  Encounter& operator=(const Encounter&) = delete;

  [[nodiscard]] entt::dispatcher& dispatcher() noexcept { return dispatcher_; }

  void tick(float delta_ms);

  // --- movement / resource -------------------------------------------------
  bool request_move(int direction);
  bool request_dash();
  bool request_charge_start();
  bool request_charge_stop();

  // --- attacks -------------------------------------------------------------
  bool request_strike();
  bool request_ability(std::size_t member_index, AbilityKind kind);

  // --- targeting -----------------------------------------------------------
  bool request_select();
  bool request_select_next();
  bool request_select_previous();
  bool request_confirm_target();
  bool request_cancel_selection();
  bool request_disengage();

  // --- dialogue outcomes (act on the current subject) ----------------------
  bool request_flee();
  bool request_recruit();
  bool request_negotiate();

  void set_dialogue_open(bool open);

  [[nodiscard]] EncounterSnapshot snapshot() const;

  // --- inspection ----------------------------------------------------------
  [[nodiscard]] TimeMs now_ms() const noexcept { return now_ms_; }
  [[nodiscard]] bool finished() const noexcept { return finished_; }
  [[nodiscard]] const std::optional<OutcomePayload>& outcome() const noexcept { return outcome_.outcome(); }
  [[nodiscard]] EncounterContext context() const noexcept;

  [[nodiscard]] const EncounterConfig& config() const noexcept { return config_; }
  [[nodiscard]] const ResourceLedger& ledger() const noexcept { return ledger_; }
  [[nodiscard]] const ComboTracker& combo() const noexcept { return combo_; }
  [[nodiscard]] const TargetingCoordinator& targeting() const noexcept { return targeting_; }
  [[nodiscard]] const TurnDispatcher& turn_dispatcher() const noexcept { return turn_; }
  [[nodiscard]] const EventScheduler& scheduler() const noexcept { return scheduler_; }
  [[nodiscard]] const Roster& party() const noexcept { return party_; }
  [[nodiscard]] const Roster& opponents() const noexcept { return opponents_; }
  [[nodiscard]] std::span<const ActiveAttack> active_attacks() const noexcept { return active_attacks_; }

  [[nodiscard]] bool dashing() const noexcept { return dashing_; }
  [[nodiscard]] bool charging() const noexcept { return charging_; }
  [[nodiscard]] int move_direction() const noexcept { return move_dir_; }

  // Policy injection (reward, recruit, flee, negotiate).
  [[nodiscard]] OutcomeResolver& outcome_resolver() noexcept { return outcome_; }

  // Direct roster access for scripted setups and tests. Mutating health here
  // bypasses notifications; call evaluate_outcome() afterwards if needed.
  [[nodiscard]] Combatant* find_party_member(CombatantId id) { return party_.try_get(id); }
  [[nodiscard]] Combatant* find_opponent(CombatantId id) { return opponents_.try_get(id); }
  void evaluate_outcome();

private:
  EncounterConfig config_{};
  entt::dispatcher dispatcher_{};
  Rng rng_{};

  ResourceLedger ledger_{};
  ComboTracker combo_{};
  ComboResolver resolver_{};
  OpponentBehaviorEngine behavior_{};
  TargetingCoordinator targeting_{};
  TurnDispatcher turn_{};
  OutcomeResolver outcome_{};
  EventScheduler scheduler_{};

  Roster party_{};
  Roster opponents_{};
  std::vector<ActiveAttack> active_attacks_{};
  std::uint32_t next_attack_id_{1};

  TimeMs now_ms_{0.0};
  bool finished_{false};
  bool dialogue_open_{false};
  bool enemy_turn_active_{false};

  int move_dir_{0};
  float facing_{1.0f};
  bool dashing_{false};
  bool dash_ready_{true};
  float dash_dir_{1.0f};
  bool charging_{false};
  float last_damage_{0.0f};

  void place_combatants();

  [[nodiscard]] bool player_controls_blocked() const noexcept;
  [[nodiscard]] bool leader_can_act() const noexcept;

  void handle_scheduled(const ScheduledEvent& e);
  void tick_resources(float delta_ms);
  void integrate_party(float dt_sec);
  void update_opponents(float delta_ms, float dt_sec);
  void tick_enemy_turn(float delta_ms);

  // Shared opponent attack path (real-time behavior and the enemy-turn queue).
  void resolve_opponent_attack(const Combatant& attacker, AttackKind kind);

  void apply_knockback(Combatant& target, float signed_speed);
  void record_attack(CombatantId attacker, CombatantId target, AttackKind kind, float damage);

  void remove_opponent(CombatantId id, OpponentFate fate);
  [[nodiscard]] Combatant* dialogue_subject();
  [[nodiscard]] Combatant* nearest_opponent(Vec2 from, float* out_distance = nullptr);
  [[nodiscard]] Combatant* nearest_standing_party_member(Vec2 from, float* out_distance = nullptr);

  void publish_targeting(TargetingState previous);
  void apply_lock_layout();
  void clear_suppression();

  void publish_ap(float previous);
  void finish(const OutcomePayload& payload);

  [[nodiscard]] float clamp_x(float x) const noexcept;
};

} // namespace skirmish::combat
