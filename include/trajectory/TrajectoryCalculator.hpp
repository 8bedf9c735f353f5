/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRAJECTORY_CALCULATOR_HPP
#define TRAJECTORY_CALCULATOR_HPP

/**
 * @file TrajectoryCalculator.hpp
 * @brief Ascent-phase velocity modifiers
 *
 * A trajectory perturbs a rocket's velocity every ascent tick on top of
 * gravity. Rules are expressed per 1/60 s frame and scaled by dt * 60.
 * Each firework owns its own calculator, so accumulated time is per rocket.
 */

#include "utils/Vector3D.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace PyroForge {

enum class TrajectoryKind : uint8_t {
  LINEAR = 0,
  SPIRAL,
  ZIGZAG,
  ACCELERATE,
  DOUBLE_ACCELERATE,
  TRIPLE_ACCELERATE,
  DECELERATE,
  MIXED_SPEED,
  BEZIER_CURVE,
  PARABOLA,
  SINE_WAVE,
  HELIX,
  LINEAR_TO_CURVE,
  CURVE_TO_LINEAR,
  MULTI_SEGMENT,
  WOBBLE,
  FALL_RISE,
  ORBIT,
  COUNT
};

constexpr size_t TRAJECTORY_KIND_COUNT = static_cast<size_t>(TrajectoryKind::COUNT);

/**
 * @brief Velocity rule for one trajectory kind
 * @param velocity modified in place
 * @param t seconds since launch, including this tick
 * @param gravity settings gravity (per frame^2)
 * @param frames dt * 60
 * @param rng jitter source, only read by WOBBLE
 */
using TrajectoryFn = void (*)(Vector3D &velocity, float t, float gravity,
                              float frames, std::mt19937 &rng);

struct TrajectoryInfo {
  const char *id{"linear"};
  const char *name{"Linear"};
};

class TrajectoryCalculator {
public:
  explicit TrajectoryCalculator(TrajectoryKind kind = TrajectoryKind::LINEAR,
                                uint32_t seed = 0);

  /**
   * @brief Advance the accumulated time by dt and return the new velocity
   *
   * A non-positive dt returns the velocity untouched.
   */
  Vector3D calculate(const Vector3D &velocity, float gravity, float dt);

  TrajectoryKind getKind() const { return m_kind; }
  float getLifeTime() const { return m_lifeTime; }
  void reset() { m_lifeTime = 0.0f; }

private:
  TrajectoryKind m_kind;
  TrajectoryFn m_fn;
  float m_lifeTime{0.0f};
  std::mt19937 m_rng;
};

/**
 * @brief Kind -> rule table with O(1) lookup
 *
 * Unknown kinds resolve to LINEAR.
 */
class TrajectoryRegistry {
public:
  static const TrajectoryRegistry &Instance() {
    static const TrajectoryRegistry instance;
    return instance;
  }

  TrajectoryFn getFunction(TrajectoryKind kind) const;
  const TrajectoryInfo &getInfo(TrajectoryKind kind) const;

  // Fresh calculator for one rocket
  TrajectoryCalculator create(TrajectoryKind kind, uint32_t seed = 0) const {
    return TrajectoryCalculator(kind, seed);
  }

  static std::vector<TrajectoryKind> allKinds();

  // Uniform pick from list, LINEAR when empty
  static TrajectoryKind pickFrom(const std::vector<TrajectoryKind> &kinds,
                                 std::mt19937 &rng);

  static const char *toString(TrajectoryKind kind);
  static std::optional<TrajectoryKind> fromString(std::string_view id);

private:
  struct Entry {
    TrajectoryInfo info;
    TrajectoryFn fn{nullptr};
  };

  TrajectoryRegistry();

  std::array<Entry, TRAJECTORY_KIND_COUNT> m_entries{};
};

} // namespace PyroForge

#endif // TRAJECTORY_CALCULATOR_HPP
