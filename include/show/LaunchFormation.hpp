/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LAUNCH_FORMATION_HPP
#define LAUNCH_FORMATION_HPP

#include "utils/Vector3D.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace PyroForge {

enum class LaunchFormation : uint8_t {
  SINGLE = 0,
  CIRCLE,
  LINE,
  CROSS,
  V_SHAPE,
  RANDOM,
  COUNT
};

constexpr size_t LAUNCH_FORMATION_COUNT =
    static_cast<size_t>(LaunchFormation::COUNT);

// Offsets relative to the group's launch point and aim point
struct FormationOffset {
  Vector3D start;
  Vector3D target;
};

constexpr float FORMATION_RADIUS = 150.0f;

/**
 * @brief Per-launch offsets for a group of count rockets
 *
 * SINGLE or count <= 1 yields one zero offset. Only RANDOM draws from rng.
 */
std::vector<FormationOffset> computeFormationOffsets(LaunchFormation formation,
                                                     int count,
                                                     std::mt19937 &rng);

const char *launchFormationToString(LaunchFormation formation);
std::optional<LaunchFormation> launchFormationFromString(std::string_view id);

} // namespace PyroForge

#endif // LAUNCH_FORMATION_HPP
