/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHAPE_TYPES_HPP
#define SHAPE_TYPES_HPP

#include "particles/Particle.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <optional>

namespace PyroForge {

/**
 * @brief Explosion point-cloud shapes, grouped by category
 */
enum class ShapeKind : uint8_t {
  // Basic geometry
  SPHERE = 0,
  CUBE,
  PYRAMID,
  OCTAHEDRON,
  DODECAHEDRON,
  ICOSAHEDRON,
  CYLINDER,
  CONE,
  TORUS,
  TORUS_KNOT,

  // Advanced geometry
  CAPSULE,
  PRISM,
  STAR_3D,
  CROSS_3D,
  DIAMOND,
  MOBIUS,
  KLEIN_BOTTLE,
  HELIX_TUBE,
  SPRING,
  NESTED_SPHERES,

  // Nature
  BUTTERFLY_3D,
  FLOWER_3D,
  TREE,
  FISH_3D,
  BIRD,
  JELLYFISH,
  SHELL,
  SNOWFLAKE_3D,
  LEAF,
  MUSHROOM,

  // Cosmos
  GALAXY_SPIRAL,
  PLANET_RINGS,
  NEBULA,
  BLACK_HOLE,
  SUPERNOVA,
  COMET,
  ASTEROID_BELT,
  CONSTELLATION,
  PULSAR,
  WORMHOLE,

  // Culture
  HEART_3D,
  CROWN_3D,
  DRAGON_3D,
  PHOENIX,
  YIN_YANG,
  LOTUS,
  LANTERN,
  FIREWORK_CLASSIC,
  RIBBON,
  FIREWORK_WILLOW,

  // Effects
  EXPLOSION_BURST,
  RING_WAVE,
  DOUBLE_RING,
  CASCADE,
  WATERFALL_3D,
  FOUNTAIN,
  VORTEX,
  SHOCKWAVE,
  SPARKLE_CLOUD,
  CHAOS_SCATTER,

  // Classic shells and flat patterns
  PISTIL,
  CROSSETTE,
  SATURN,
  HEART_OUTLINE,
  BUTTERFLY_CURVE,
  DRAGON_COIL,
  GREAT_WALL,
  ZODIAC_SERPENT,
  HEXAGON,
  HEXAGRAM,
  OCTAGRAM,
  SPIRAL_ARCHIMEDEAN,
  SPIRAL_LOGARITHMIC,

  COUNT
};

constexpr size_t SHAPE_KIND_COUNT = static_cast<size_t>(ShapeKind::COUNT);

enum class ShapeCategory : uint8_t {
  BasicGeometry = 0,
  AdvancedGeometry,
  Nature,
  Cosmos,
  Culture,
  Effects,
  ClassicPatterns,
  COUNT
};

const char *shapeCategoryToString(ShapeCategory category);

/**
 * @brief One point of a generated shape
 *
 * offset is relative to the explosion center. The optional hints override
 * the particle defaults when the point is spawned.
 */
struct ShapePoint {
  Vector3D offset;
  float hue{0.0f};
  std::optional<float> size;
  std::optional<ParticleBehavior> behavior;
  std::optional<float> decay;
  std::optional<float> friction;
};

struct ShapeInfo {
  const char *id{"sphere"};  // Stable identifier used in settings files
  const char *name{"Sphere"}; // Display name
  ShapeCategory category{ShapeCategory::BasicGeometry};
  float weight{1.0f};         // Relative weight for random picks
};

} // namespace PyroForge

#endif // SHAPE_TYPES_HPP
