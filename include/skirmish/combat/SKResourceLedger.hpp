#pragma once

#include <string_view>

namespace skirmish::combat {

struct ApConfig {
  float max_ap{20.0f};
  float move_drain_per_sec{2.0f};
  float dash_drain_per_sec{4.0f};
  float charge_regen_per_sec{8.0f};
  float grant_on_hit{5.0f};  // comeback AP when the leader is struck
};

// Activities active during one tick. Dash drain wins over move drain, and any
// drain wins over charge regen.
struct ActivityFlags {
  bool moving{false};
  bool dashing{false};
  bool charging{false};
};

// Bounded Action Point pool. 0 <= current() <= max() holds after every call.
class ResourceLedger final {
public:
  ResourceLedger() = default;
  explicit ResourceLedger(const ApConfig& cfg);

  void configure(const ApConfig& cfg);

  [[nodiscard]] float current() const noexcept { return current_; }
  [[nodiscard]] float max() const noexcept { return config_.max_ap; }
  [[nodiscard]] const ApConfig& config() const noexcept { return config_; }

  [[nodiscard]] bool empty() const noexcept { return current_ <= 0.0f; }

  // Applies drain or regen for delta_ms. Returns the signed AP change.
  float tick(float delta_ms, const ActivityFlags& flags) noexcept;

  // All-or-nothing spend. On failure nothing changes.
  [[nodiscard]] bool consume(float amount) noexcept;

  // Adds AP clamped to max. Returns the amount actually added.
  float grant(float amount, std::string_view reason);

  void reset() noexcept { current_ = config_.max_ap; }

private:
  ApConfig config_{};
  float current_{20.0f};
};

} // namespace skirmish::combat
