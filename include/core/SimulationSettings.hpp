/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_SETTINGS_HPP
#define SIMULATION_SETTINGS_HPP

#include "combo/ComboLibrary.hpp"
#include "shapes/ShapeTypes.hpp"
#include "trajectory/TrajectoryCalculator.hpp"
#include <cstddef>
#include <vector>

namespace PyroForge {

/**
 * @brief Tunables read by the simulation, never written by it
 *
 * Every field has a usable default so a partially filled settings file is
 * always valid. Empty enabled lists mean "use the default kind".
 */
struct SimulationSettings {
  float gravity{0.12f};                 // Per frame^2, ascent uses 1.5x
  float friction{0.96f};                // Per-frame retention for burst sparks
  float autoLaunchDelay{2500.0f};       // Milliseconds of virtual time
  float particleCountMultiplier{1.0f};
  float explosionSizeMultiplier{1.0f};
  float starBlinkSpeed{0.001f};         // Background star twinkle, host side
  int trailLength{15};                  // Rendered trail points, host side
  size_t maxParticles{30000};
  bool ascentTrail{true};
  bool autoLaunch{false};

  std::vector<ShapeKind> enabledShapes;
  std::vector<TrajectoryKind> enabledTrajectories;
  std::vector<ComboKind> enabledCombos;
};

} // namespace PyroForge

#endif // SIMULATION_SETTINGS_HPP
