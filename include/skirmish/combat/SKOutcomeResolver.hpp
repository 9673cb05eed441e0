#pragma once

#include "SKCombatRng.hpp"
#include "SKCombatant.hpp"
#include "SKRoster.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace skirmish::combat {

enum class OutcomeKind : std::uint8_t {
  Victory   = 0,
  Defeat    = 1,
  Disengage = 2
};

[[nodiscard]] constexpr std::string_view to_string(OutcomeKind k) noexcept {
  switch (k) {
    case OutcomeKind::Victory:   return "Victory";
    case OutcomeKind::Defeat:    return "Defeat";
    case OutcomeKind::Disengage: return "Disengage";
    default:                     return "Unknown";
  }
}

struct PartyHealthSnapshot {
  CombatantId id{kInvalidCombatant};
  float health{0.0f};
  float max_health{0.0f};
  bool downed{false};
};

struct OpponentHealthSnapshot {
  CombatantId id{kInvalidCombatant};
  float health{0.0f};
  float max_health{0.0f};
};

// Terminal result handed back to the exploration layer.
struct OutcomePayload {
  OutcomeKind kind{OutcomeKind::Victory};
  std::vector<PartyHealthSnapshot> party{};
  std::vector<CombatantId> defeated_ids{};
  std::vector<CombatantId> recruited_ids{};
  std::vector<CombatantId> negotiated_ids{};
  std::vector<OpponentHealthSnapshot> remaining_opponents{}; // Disengage only
  std::uint32_t reward{0};
  std::string return_context{};
};

// ----------------------------------------------------------------------------
// Policies
// ----------------------------------------------------------------------------
struct RewardConfig {
  float base_per_level{10.0f};
  float level_gap_factor{0.1f};     // +/- per level the opponent is above/below the player
  float min_gap_multiplier{0.1f};
  float generic_multiplier{1.0f};
  float guard_multiplier{1.5f};
  float merchant_multiplier{1.2f};
  float villager_multiplier{0.8f};
};

struct PolicyConfig {
  std::size_t max_party_size{4};
  float flee_base_chance{0.5f};
  float flee_level_factor{0.1f};    // per level the leader is above the strongest opponent
  float flee_min_chance{0.1f};
  float flee_max_chance{0.95f};
  float negotiate_base_chance{0.3f};
  float negotiate_wounded_bonus{0.5f}; // scaled by the opponent's missing health fraction
};

using RewardPolicy = std::function<std::uint32_t(const OpponentOutcomeRecord& opponent, int player_level)>;
using RecruitPolicy = std::function<bool(const Combatant& opponent, std::size_t party_size)>;
using FleePolicy = std::function<bool(const Combatant& leader, std::span<const Combatant> opponents, Rng& rng)>;
using NegotiatePolicy = std::function<bool(const Combatant& leader, const Combatant& opponent, Rng& rng)>;

[[nodiscard]] RewardPolicy make_default_reward_policy(const RewardConfig& cfg);
[[nodiscard]] RecruitPolicy make_default_recruit_policy(const PolicyConfig& cfg);
[[nodiscard]] FleePolicy make_default_flee_policy(const PolicyConfig& cfg);
[[nodiscard]] NegotiatePolicy make_default_negotiate_policy(const PolicyConfig& cfg);

// ----------------------------------------------------------------------------
// Resolver
// ----------------------------------------------------------------------------

// Watches both rosters and produces exactly one terminal payload per encounter.
class OutcomeResolver final {
public:
  OutcomeResolver();
  OutcomeResolver(const RewardConfig& reward, const PolicyConfig& policy);

  void configure(const RewardConfig& reward, const PolicyConfig& policy);

  void set_reward_policy(RewardPolicy p) { reward_policy_ = std::move(p); }
  void set_recruit_policy(RecruitPolicy p) { recruit_policy_ = std::move(p); }
  void set_flee_policy(FleePolicy p) { flee_policy_ = std::move(p); }
  void set_negotiate_policy(NegotiatePolicy p) { negotiate_policy_ = std::move(p); }

  void set_return_context(std::string ctx) { return_context_ = std::move(ctx); }

  // Called whenever an opponent leaves the roster.
  void record_removal(const OpponentOutcomeRecord& record);
  [[nodiscard]] std::span<const OpponentOutcomeRecord> removals() const noexcept { return removals_; }

  // Victory when no opponents remain, then Defeat when the whole party is
  // downed. Returns a payload only on the call that decides the encounter.
  std::optional<OutcomePayload> evaluate(const Roster& party, const Roster& opponents);

  // Successful flee. Returns nullopt when the encounter is already decided.
  std::optional<OutcomePayload> disengage(const Roster& party, const Roster& opponents);

  [[nodiscard]] bool can_recruit(const Combatant& opponent, std::size_t party_size) const;
  [[nodiscard]] bool roll_flee(const Combatant& leader, std::span<const Combatant> opponents, Rng& rng) const;
  [[nodiscard]] bool roll_negotiate(const Combatant& leader, const Combatant& opponent, Rng& rng) const;

  [[nodiscard]] std::uint32_t total_reward(int player_level) const;

  [[nodiscard]] bool decided() const noexcept { return outcome_.has_value(); }
  [[nodiscard]] const std::optional<OutcomePayload>& outcome() const noexcept { return outcome_; }

  void reset();

private:
  RewardPolicy reward_policy_{};
  RecruitPolicy recruit_policy_{};
  FleePolicy flee_policy_{};
  NegotiatePolicy negotiate_policy_{};

  std::vector<OpponentOutcomeRecord> removals_{};
  std::optional<OutcomePayload> outcome_{};
  std::string return_context_{};

  [[nodiscard]] OutcomePayload build_payload(OutcomeKind kind, const Roster& party, const Roster& opponents) const;
  const OutcomePayload& commit(OutcomePayload payload);
};

} // namespace skirmish::combat
