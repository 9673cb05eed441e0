#include "skirmish/combat/SKOutcomeResolver.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace skirmish::combat {

// ----------------------------------------------------------------------------
// Default policies
// ----------------------------------------------------------------------------
namespace {

[[nodiscard]] float archetype_multiplier(const RewardConfig& cfg, Archetype a) noexcept {
  switch (a) {
    case Archetype::Guard:    return cfg.guard_multiplier;
    case Archetype::Merchant: return cfg.merchant_multiplier;
    case Archetype::Villager: return cfg.villager_multiplier;
    case Archetype::Generic:
    default:                  return cfg.generic_multiplier;
  }
}

} // namespace

RewardPolicy make_default_reward_policy(const RewardConfig& cfg) {
  return [cfg](const OpponentOutcomeRecord& opponent, int player_level) -> std::uint32_t {
    const int level = std::max(1, opponent.level);
    const float gap = static_cast<float>(level - std::max(1, player_level));
    const float gap_mult = std::max(cfg.min_gap_multiplier, 1.0f + gap * cfg.level_gap_factor);
    const float raw = cfg.base_per_level * static_cast<float>(level) * gap_mult *
                      archetype_multiplier(cfg, opponent.archetype);
    if (!(raw > 0.0f)) return 0U;
    return static_cast<std::uint32_t>(std::lround(raw));
  };
}

RecruitPolicy make_default_recruit_policy(const PolicyConfig& cfg) {
  return [cfg](const Combatant& opponent, std::size_t party_size) {
    return opponent.recruitable && party_size < cfg.max_party_size;
  };
}

FleePolicy make_default_flee_policy(const PolicyConfig& cfg) {
  return [cfg](const Combatant& leader, std::span<const Combatant> opponents, Rng& rng) {
    int strongest = 1;
    for (const Combatant& o : opponents) strongest = std::max(strongest, o.level);

    const float gap = static_cast<float>(leader.level - strongest);
    const float p = std::clamp(cfg.flee_base_chance + gap * cfg.flee_level_factor,
                               cfg.flee_min_chance, cfg.flee_max_chance);
    return rng.chance(p);
  };
}

NegotiatePolicy make_default_negotiate_policy(const PolicyConfig& cfg) {
  return [cfg](const Combatant& /*leader*/, const Combatant& opponent, Rng& rng) {
    const float wounded = 1.0f - std::clamp(opponent.health_frac(), 0.0f, 1.0f);
    return rng.chance(cfg.negotiate_base_chance + wounded * cfg.negotiate_wounded_bonus);
  };
}

// ----------------------------------------------------------------------------
// OutcomeResolver
// ----------------------------------------------------------------------------
OutcomeResolver::OutcomeResolver() : OutcomeResolver(RewardConfig{}, PolicyConfig{}) {}

OutcomeResolver::OutcomeResolver(const RewardConfig& reward, const PolicyConfig& policy) {
  configure(reward, policy);
}

void OutcomeResolver::configure(const RewardConfig& reward, const PolicyConfig& policy) {
  reward_policy_ = make_default_reward_policy(reward);
  recruit_policy_ = make_default_recruit_policy(policy);
  flee_policy_ = make_default_flee_policy(policy);
  negotiate_policy_ = make_default_negotiate_policy(policy);
}

void OutcomeResolver::record_removal(const OpponentOutcomeRecord& record) {
  removals_.push_back(record);
  spdlog::debug("Opponent {} ({}) left the encounter: {}", record.name, record.id, to_string(record.fate));
}

std::optional<OutcomePayload> OutcomeResolver::evaluate(const Roster& party, const Roster& opponents) {
  if (decided()) return std::nullopt;

  if (opponents.empty()) return commit(build_payload(OutcomeKind::Victory, party, opponents));
  if (!party.empty() && party.all_downed()) return commit(build_payload(OutcomeKind::Defeat, party, opponents));

  return std::nullopt;
}

std::optional<OutcomePayload> OutcomeResolver::disengage(const Roster& party, const Roster& opponents) {
  if (decided()) return std::nullopt;
  return commit(build_payload(OutcomeKind::Disengage, party, opponents));
}

bool OutcomeResolver::can_recruit(const Combatant& opponent, std::size_t party_size) const {
  return recruit_policy_ ? recruit_policy_(opponent, party_size) : false;
}

bool OutcomeResolver::roll_flee(const Combatant& leader, std::span<const Combatant> opponents, Rng& rng) const {
  return flee_policy_ ? flee_policy_(leader, opponents, rng) : false;
}

bool OutcomeResolver::roll_negotiate(const Combatant& leader, const Combatant& opponent, Rng& rng) const {
  return negotiate_policy_ ? negotiate_policy_(leader, opponent, rng) : false;
}

std::uint32_t OutcomeResolver::total_reward(int player_level) const {
  if (!reward_policy_) return 0U;

  std::uint32_t total = 0;
  for (const OpponentOutcomeRecord& r : removals_) {
    if (r.fate == OpponentFate::Recruited) continue;
    total += reward_policy_(r, player_level);
  }
  return total;
}

void OutcomeResolver::reset() {
  removals_.clear();
  outcome_.reset();
}

OutcomePayload OutcomeResolver::build_payload(OutcomeKind kind, const Roster& party, const Roster& opponents) const {
  OutcomePayload p{};
  p.kind = kind;
  p.return_context = return_context_;

  p.party.reserve(party.size());
  for (const Combatant& c : party.combatants()) {
    p.party.push_back(PartyHealthSnapshot{c.id, c.health, c.max_health, c.downed});
  }

  for (const OpponentOutcomeRecord& r : removals_) {
    switch (r.fate) {
      case OpponentFate::Defeated:   p.defeated_ids.push_back(r.id); break;
      case OpponentFate::Recruited:  p.recruited_ids.push_back(r.id); break;
      case OpponentFate::Negotiated: p.negotiated_ids.push_back(r.id); break;
    }
  }

  if (kind == OutcomeKind::Disengage) {
    p.remaining_opponents.reserve(opponents.size());
    for (const Combatant& o : opponents.combatants()) {
      p.remaining_opponents.push_back(OpponentHealthSnapshot{o.id, o.health, o.max_health});
    }
  }

  if (kind == OutcomeKind::Victory) {
    const Combatant* leader = party.leader();
    p.reward = total_reward(leader ? leader->level : 1);
  }
  return p;
}

const OutcomePayload& OutcomeResolver::commit(OutcomePayload payload) {
  outcome_ = std::move(payload);
  spdlog::info("Encounter decided: {} (defeated={}, recruited={}, negotiated={}, reward={})",
               to_string(outcome_->kind), outcome_->defeated_ids.size(), outcome_->recruited_ids.size(),
               outcome_->negotiated_ids.size(), outcome_->reward);
  return *outcome_;
}

} // namespace skirmish::combat
