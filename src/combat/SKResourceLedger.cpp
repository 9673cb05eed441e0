#include "skirmish/combat/SKResourceLedger.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace skirmish::combat {

ResourceLedger::ResourceLedger(const ApConfig& cfg) {
  configure(cfg);
}

void ResourceLedger::configure(const ApConfig& cfg) {
  config_ = cfg;
  config_.max_ap = std::max(0.0f, config_.max_ap);
  config_.move_drain_per_sec = std::max(0.0f, config_.move_drain_per_sec);
  config_.dash_drain_per_sec = std::max(0.0f, config_.dash_drain_per_sec);
  config_.charge_regen_per_sec = std::max(0.0f, config_.charge_regen_per_sec);
  current_ = config_.max_ap;
}

float ResourceLedger::tick(float delta_ms, const ActivityFlags& flags) noexcept {
  if (!(delta_ms > 0.0f)) return 0.0f;

  const float before = current_;
  const float seconds = delta_ms / 1000.0f;

  float drain_rate = 0.0f;
  if (flags.dashing) {
    drain_rate = config_.dash_drain_per_sec;
  } else if (flags.moving) {
    drain_rate = config_.move_drain_per_sec;
  }

  if (flags.dashing || flags.moving) {
    current_ = std::max(0.0f, current_ - drain_rate * seconds);
  } else if (flags.charging) {
    current_ = std::min(config_.max_ap, current_ + config_.charge_regen_per_sec * seconds);
  }

  return current_ - before;
}

bool ResourceLedger::consume(float amount) noexcept {
  if (!std::isfinite(amount) || amount < 0.0f) return false;
  if (current_ < amount) return false;

  current_ = std::max(0.0f, current_ - amount);
  return true;
}

float ResourceLedger::grant(float amount, std::string_view reason) {
  if (!std::isfinite(amount) || amount <= 0.0f) return 0.0f;

  const float before = current_;
  current_ = std::min(config_.max_ap, current_ + amount);

  spdlog::debug("AP +{:.1f} from {} ({:.1f}/{:.1f})", current_ - before, reason, current_, config_.max_ap);
  return current_ - before;
}

} // namespace skirmish::combat
