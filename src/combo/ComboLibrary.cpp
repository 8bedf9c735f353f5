/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combo/ComboLibrary.hpp"
#include "utils/RandomUtils.hpp"
#include <array>

namespace PyroForge {

namespace {

struct ComboName {
  const char *id;
  const char *name;
};

constexpr std::array<ComboName, COMBO_KIND_COUNT> COMBO_NAMES{{
    {"single", "Single Burst"},
    {"staged", "Staged Burst"},
    {"delayed_burst", "Delayed Burst"},
    {"multi_wave", "Multi Wave"},
    {"morph", "Morph"},
    {"split", "Split"},
    {"converge", "Converge"},
    {"expand_contract", "Expand and Contract"},
    {"trail_explosion", "Trail Explosion"},
    {"rain_down", "Rain Down"},
    {"spiral_scatter", "Spiral Scatter"},
    {"phoenix_rise", "Phoenix Rise"},
    {"cascade_chain", "Cascade Chain"},
    {"galaxy_birth", "Galaxy Birth"},
    {"supernova_collapse", "Supernova Collapse"},
    {"firework_symphony", "Firework Symphony"},
}};

ComboStageConfig stage(float delay, ShapeKind shape, float scale,
                       float particleCount, float hueShift = 0.0f) {
  ComboStageConfig s;
  s.delay = delay;
  s.shape = shape;
  s.scale = scale;
  s.particleCount = particleCount;
  s.hueShift = hueShift;
  return s;
}

} // namespace

ComboConfig ComboLibrary::generate(ComboKind kind, ShapeKind baseShape,
                                   std::mt19937 &rng) {
  ComboConfig config;
  config.kind = kind < ComboKind::COUNT ? kind : ComboKind::SINGLE;
  auto &stages = config.stages;

  switch (config.kind) {
  case ComboKind::STAGED: {
    auto first = stage(0.0f, ShapeKind::SPHERE, 0.5f, 0.3f);
    first.decay = 0.05f;
    stages.push_back(first);
    stages.push_back(stage(0.8f, baseShape, 1.2f, 1.0f, 60.0f));
    break;
  }
  case ComboKind::DELAYED_BURST: {
    auto spark = stage(0.0f, ShapeKind::SPARKLE_CLOUD, 0.3f, 0.2f);
    spark.behavior = ParticleBehavior::Glitter;
    spark.velocityScale = 0.1f;
    stages.push_back(spark);
    auto burst = stage(1.2f, baseShape, 1.5f, 1.2f);
    burst.velocityScale = 1.4f;
    stages.push_back(burst);
    break;
  }
  case ComboKind::MULTI_WAVE:
    for (int i = 0; i < 3; ++i) {
      const float fi = static_cast<float>(i);
      stages.push_back(stage(fi * 0.5f, ShapeKind::RING_WAVE, 0.8f + fi * 0.3f,
                             0.5f, fi * 40.0f));
    }
    break;
  case ComboKind::MORPH: {
    auto sphere = stage(0.0f, ShapeKind::SPHERE, 0.8f, 0.5f);
    sphere.decay = 0.03f;
    stages.push_back(sphere);
    stages.push_back(stage(1.0f, ShapeKind::HEART_3D, 1.2f, 1.0f, 330.0f));
    break;
  }
  case ComboKind::SPLIT: {
    stages.push_back(stage(0.0f, ShapeKind::SPHERE, 0.6f, 0.3f));
    const std::array<Vector3D, 4> offsets{Vector3D(40.0f, 0.0f, 0.0f),
                                          Vector3D(-40.0f, 0.0f, 0.0f),
                                          Vector3D(0.0f, 0.0f, 40.0f),
                                          Vector3D(0.0f, 0.0f, -40.0f)};
    for (const auto &offset : offsets) {
      auto child = stage(0.6f, baseShape, 0.5f, 0.3f, Random::unit(rng) * 60.0f);
      child.spawnOffset = offset;
      stages.push_back(child);
    }
    break;
  }
  case ComboKind::TRAIL_EXPLOSION:
    for (int i = 0; i < 5; ++i) {
      const float fi = static_cast<float>(i);
      auto burst = stage(fi * 0.2f, ShapeKind::EXPLOSION_BURST, 0.4f, 0.2f,
                         fi * 30.0f);
      burst.spawnOffset = Vector3D(0.0f, -30.0f * fi, 0.0f);
      stages.push_back(burst);
    }
    break;
  case ComboKind::RAIN_DOWN: {
    stages.push_back(stage(0.0f, baseShape, 1.0f, 1.0f));
    auto rain = stage(0.8f, ShapeKind::CASCADE, 1.5f, 0.8f, 30.0f);
    rain.behavior = ParticleBehavior::Willow;
    rain.gravity = 0.15f;
    stages.push_back(rain);
    break;
  }
  case ComboKind::SPIRAL_SCATTER:
    config.trajectory = TrajectoryKind::SPIRAL;
    stages.push_back(stage(0.0f, ShapeKind::VORTEX, 1.2f, 1.0f));
    break;
  case ComboKind::PHOENIX_RISE: {
    config.trajectory = TrajectoryKind::FALL_RISE;
    auto willow = stage(0.0f, ShapeKind::FIREWORK_WILLOW, 0.8f, 0.5f, 30.0f);
    willow.gravity = 0.2f;
    stages.push_back(willow);
    auto swirl = stage(1.5f, ShapeKind::VORTEX, 0.5f, 0.3f, 15.0f);
    swirl.spawnOffset = Vector3D(0.0f, -80.0f, 0.0f);
    stages.push_back(swirl);
    auto rebirth = stage(3.0f, ShapeKind::PHOENIX, 1.5f, 1.2f);
    rebirth.velocityScale = 1.8f;
    rebirth.spawnOffset = Vector3D(0.0f, -80.0f, 0.0f);
    stages.push_back(rebirth);
    break;
  }
  case ComboKind::CASCADE_CHAIN:
    for (int i = 0; i < 5; ++i) {
      const float fi = static_cast<float>(i);
      auto ring = stage(fi * 0.5f, ShapeKind::RING_WAVE, 1.0f - fi * 0.15f, 0.4f,
                        fi * 20.0f);
      ring.spawnOffset = Vector3D(0.0f, -25.0f * fi, 0.0f);
      stages.push_back(ring);
    }
    break;
  case ComboKind::GALAXY_BIRTH: {
    auto seed = stage(0.0f, ShapeKind::EXPLOSION_BURST, 0.3f, 0.2f);
    seed.behavior = ParticleBehavior::Glitter;
    stages.push_back(seed);
    stages.push_back(stage(0.8f, ShapeKind::NEBULA, 0.6f, 0.4f, 200.0f));
    stages.push_back(stage(1.8f, ShapeKind::GALAXY_SPIRAL, 1.0f, 0.8f, 240.0f));
    auto full = stage(3.0f, ShapeKind::GALAXY_SPIRAL, 1.5f, 1.0f, 260.0f);
    full.velocityScale = 1.2f;
    stages.push_back(full);
    break;
  }
  case ComboKind::SUPERNOVA_COLLAPSE: {
    stages.push_back(stage(0.0f, ShapeKind::SUPERNOVA, 1.5f, 1.2f, 30.0f));
    stages.push_back(stage(0.8f, ShapeKind::SHOCKWAVE, 2.0f, 0.5f, 200.0f));
    // Negative velocity scale pulls the core inward
    auto collapse = stage(2.0f, ShapeKind::BLACK_HOLE, 0.3f, 0.3f, 270.0f);
    collapse.velocityScale = -0.5f;
    stages.push_back(collapse);
    break;
  }
  case ComboKind::FIREWORK_SYMPHONY: {
    config.trajectory = TrajectoryKind::SPIRAL;
    const std::array<ShapeKind, 6> movements{
        ShapeKind::SPHERE,  ShapeKind::RING_WAVE, ShapeKind::HEART_3D,
        ShapeKind::STAR_3D, ShapeKind::FLOWER_3D, ShapeKind::EXPLOSION_BURST};
    for (size_t i = 0; i < movements.size(); ++i) {
      const float fi = static_cast<float>(i);
      stages.push_back(stage(fi * 0.6f, movements[i],
                             0.7f + Random::unit(rng) * 0.4f, 0.5f, fi * 60.0f));
    }
    break;
  }
  case ComboKind::SINGLE:
  case ComboKind::CONVERGE:
  case ComboKind::EXPAND_CONTRACT:
  default:
    stages.push_back(stage(0.0f, baseShape, 1.0f, 1.0f));
    break;
  }

  return config;
}

ComboInfo ComboLibrary::getInfo(ComboKind kind) {
  if (kind >= ComboKind::COUNT) {
    return ComboInfo{};
  }
  std::mt19937 rng(0);
  const ComboConfig config = generate(kind, ShapeKind::SPHERE, rng);
  const auto &names = COMBO_NAMES[static_cast<size_t>(kind)];
  return ComboInfo{names.id, names.name, config.stages.size(),
                   config.stages.empty() ? 0.0f : config.stages.back().delay};
}

const std::vector<ComboKind> &ComboLibrary::simpleKinds() {
  static const std::vector<ComboKind> kinds{ComboKind::SINGLE, ComboKind::STAGED,
                                            ComboKind::MULTI_WAVE,
                                            ComboKind::SPLIT};
  return kinds;
}

const std::vector<ComboKind> &ComboLibrary::advancedKinds() {
  static const std::vector<ComboKind> kinds{
      ComboKind::PHOENIX_RISE, ComboKind::GALAXY_BIRTH,
      ComboKind::SUPERNOVA_COLLAPSE, ComboKind::FIREWORK_SYMPHONY};
  return kinds;
}

std::vector<ComboKind> ComboLibrary::allKinds() {
  std::vector<ComboKind> kinds;
  kinds.reserve(COMBO_KIND_COUNT);
  for (size_t i = 0; i < COMBO_KIND_COUNT; ++i) {
    kinds.push_back(static_cast<ComboKind>(i));
  }
  return kinds;
}

ComboKind ComboLibrary::pickFrom(const std::vector<ComboKind> &kinds,
                                 std::mt19937 &rng) {
  if (kinds.empty()) {
    return ComboKind::SINGLE;
  }
  return kinds[Random::index(rng, kinds.size())];
}

const char *ComboLibrary::toString(ComboKind kind) {
  if (kind >= ComboKind::COUNT) {
    return "unknown";
  }
  return COMBO_NAMES[static_cast<size_t>(kind)].id;
}

std::optional<ComboKind> ComboLibrary::fromString(std::string_view id) {
  for (size_t i = 0; i < COMBO_NAMES.size(); ++i) {
    if (id == COMBO_NAMES[i].id) {
      return static_cast<ComboKind>(i);
    }
  }
  return std::nullopt;
}

} // namespace PyroForge
