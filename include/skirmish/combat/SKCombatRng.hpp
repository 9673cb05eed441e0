#pragma once

#include <cstdint>

namespace skirmish::combat {

// Encounter random stream. One instance per encounter, seeded from
// EncounterConfig::seed; turn pacing, archetype action picks, defensive wander
// intervals and the default flee/negotiate policies all draw from it, so the
// same seed and the same request sequence replay the same fight.
//
// The generator is PCG32 (XSH-RR output on a 64-bit LCG).
class Rng final {
public:
  constexpr Rng() = default;
  explicit constexpr Rng(std::uint64_t seed) noexcept { reseed(seed); }

  constexpr void reseed(std::uint64_t seed) noexcept {
    state_ = 0U;
    (void)step();
    state_ += seed;
    (void)step();
  }

  // [0, 1) from the top 24 bits, exact in a float.
  [[nodiscard]] constexpr float next_float01() noexcept {
    return static_cast<float>(step() >> 8) * (1.0f / 16777216.0f);
  }

  // [lo, hi). An empty or inverted range yields lo.
  [[nodiscard]] constexpr float uniform_range(float lo, float hi) noexcept {
    if (!(hi > lo)) return lo;
    return lo + next_float01() * (hi - lo);
  }

  // True with probability p; p outside [0, 1] is saturated and draws nothing.
  [[nodiscard]] constexpr bool chance(float p) noexcept {
    if (p <= 0.0f) return false;
    if (p >= 1.0f) return true;
    return next_float01() < p;
  }

private:
  static constexpr std::uint64_t kMultiplier = 6364136223846793005ULL;
  static constexpr std::uint64_t kIncrement  = 1442695040888963407ULL; // odd

  std::uint64_t state_{0x4D595DF4D0F33173ULL};

  [[nodiscard]] constexpr std::uint32_t step() noexcept {
    const std::uint64_t old = state_;
    state_ = old * kMultiplier + kIncrement;
    const auto mixed = static_cast<std::uint32_t>(((old >> 18U) ^ old) >> 27U);
    const auto rot = static_cast<std::uint32_t>(old >> 59U);
    return (mixed >> rot) | (mixed << ((0U - rot) & 31U));
  }
};

} // namespace skirmish::combat
