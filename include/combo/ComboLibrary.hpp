/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBO_LIBRARY_HPP
#define COMBO_LIBRARY_HPP

/**
 * @file ComboLibrary.hpp
 * @brief Multi-stage explosion presets
 *
 * A combo is an ordered list of stages, each a timed sub-explosion with its
 * own shape, scale and overrides. Stage delays are seconds since the
 * explosion.
 */

#include "particles/Particle.hpp"
#include "shapes/ShapeTypes.hpp"
#include "trajectory/TrajectoryCalculator.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace PyroForge {

enum class ComboKind : uint8_t {
  SINGLE = 0,
  STAGED,
  DELAYED_BURST,
  MULTI_WAVE,
  MORPH,
  SPLIT,
  CONVERGE,
  EXPAND_CONTRACT,
  TRAIL_EXPLOSION,
  RAIN_DOWN,
  SPIRAL_SCATTER,
  PHOENIX_RISE,
  CASCADE_CHAIN,
  GALAXY_BIRTH,
  SUPERNOVA_COLLAPSE,
  FIREWORK_SYMPHONY,
  COUNT
};

constexpr size_t COMBO_KIND_COUNT = static_cast<size_t>(ComboKind::COUNT);

struct ComboStageConfig {
  float delay{0.0f}; // Seconds after the explosion
  ShapeKind shape{ShapeKind::SPHERE};
  float scale{1.0f};
  float particleCount{1.0f}; // Multiplier on the charge-derived count
  float hueShift{0.0f};
  std::optional<ParticleBehavior> behavior;
  std::optional<float> velocityScale;
  std::optional<float> gravity;
  std::optional<float> decay;
  std::optional<Vector3D> spawnOffset;
};

struct ComboConfig {
  ComboKind kind{ComboKind::SINGLE};
  TrajectoryKind trajectory{TrajectoryKind::LINEAR};
  std::vector<ComboStageConfig> stages;
  std::string name; // Set for combos loaded from settings
};

struct ComboInfo {
  const char *id{"single"};
  const char *name{"Single Burst"};
  size_t stageCount{1};
  float duration{0.0f}; // Delay of the last stage, seconds
};

class ComboLibrary {
public:
  /**
   * @brief Build the preset for a kind
   * @param baseShape shape used by stages that follow the firework's own
   * shape
   * @param rng source for randomized hue shifts and scales
   */
  static ComboConfig generate(ComboKind kind, ShapeKind baseShape,
                              std::mt19937 &rng);

  static ComboInfo getInfo(ComboKind kind);

  // Light combos suited to auto launch
  static const std::vector<ComboKind> &simpleKinds();
  // Showpiece combos for manual triggers
  static const std::vector<ComboKind> &advancedKinds();
  static std::vector<ComboKind> allKinds();

  // Uniform pick from list, SINGLE when empty
  static ComboKind pickFrom(const std::vector<ComboKind> &kinds,
                            std::mt19937 &rng);

  static const char *toString(ComboKind kind);
  static std::optional<ComboKind> fromString(std::string_view id);
};

} // namespace PyroForge

#endif // COMBO_LIBRARY_HPP
