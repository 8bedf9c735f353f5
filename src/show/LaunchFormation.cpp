/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "show/LaunchFormation.hpp"
#include "utils/RandomUtils.hpp"
#include <array>
#include <cmath>

namespace PyroForge {

namespace {

constexpr std::array<const char *, LAUNCH_FORMATION_COUNT> FORMATION_IDS = {
    "single", "circle", "line", "cross", "v_shape", "random"};

// Arm directions for CROSS in x/z
constexpr std::array<std::array<float, 2>, 4> CROSS_ARMS = {
    {{1.0f, 0.0f}, {-1.0f, 0.0f}, {0.0f, 1.0f}, {0.0f, -1.0f}}};

constexpr float V_ROW_SPACING = 50.0f;
constexpr float RANDOM_HEIGHT_SPREAD = 25.0f;

} // namespace

std::vector<FormationOffset> computeFormationOffsets(LaunchFormation formation,
                                                     int count,
                                                     std::mt19937 &rng) {
  std::vector<FormationOffset> offsets;
  if (count <= 1 || formation == LaunchFormation::SINGLE ||
      formation >= LaunchFormation::COUNT) {
    offsets.push_back({});
    return offsets;
  }

  offsets.reserve(static_cast<size_t>(count));
  const float r = FORMATION_RADIUS;
  const float n = static_cast<float>(count);

  for (int i = 0; i < count; ++i) {
    const float fi = static_cast<float>(i);
    FormationOffset offset;

    switch (formation) {
    case LaunchFormation::CIRCLE: {
      const float angle = fi / n * TWO_PI;
      const float c = std::cos(angle);
      const float s = std::sin(angle);
      offset.target.set(c * r, 0.0f, s * r);
      offset.start.set(c * r * 0.5f, 0.0f, s * r * 0.5f);
      break;
    }
    case LaunchFormation::LINE: {
      const float x = (fi - n / 2.0f) * (2.0f * r / n);
      offset.target.set(x, 0.0f, 0.0f);
      offset.start.set(x, 0.0f, 0.0f);
      break;
    }
    case LaunchFormation::CROSS: {
      const auto &arm = CROSS_ARMS[static_cast<size_t>(i % 4)];
      const float dist = std::floor(fi / 4.0f + 1.0f) * r / 2.0f;
      offset.target.set(arm[0] * dist, 0.0f, arm[1] * dist);
      offset.start = offset.target * 0.5f;
      break;
    }
    case LaunchFormation::V_SHAPE: {
      const float side = (i % 2 == 0) ? 1.0f : -1.0f;
      const float row = static_cast<float>(i / 2);
      offset.target.set(side * row * V_ROW_SPACING, 0.0f, row * V_ROW_SPACING);
      offset.start = offset.target;
      break;
    }
    case LaunchFormation::RANDOM:
      offset.target.set(Random::spread(rng, r),
                        Random::spread(rng, RANDOM_HEIGHT_SPREAD),
                        Random::spread(rng, r));
      offset.start.set(Random::spread(rng, r * 0.5f), 0.0f,
                       Random::spread(rng, r * 0.5f));
      break;
    default:
      break;
    }
    offsets.push_back(offset);
  }
  return offsets;
}

const char *launchFormationToString(LaunchFormation formation) {
  if (formation >= LaunchFormation::COUNT) {
    return "unknown";
  }
  return FORMATION_IDS[static_cast<size_t>(formation)];
}

std::optional<LaunchFormation> launchFormationFromString(std::string_view id) {
  for (size_t i = 0; i < FORMATION_IDS.size(); ++i) {
    if (id == FORMATION_IDS[i]) {
      return static_cast<LaunchFormation>(i);
    }
  }
  return std::nullopt;
}

} // namespace PyroForge
