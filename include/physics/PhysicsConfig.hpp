/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_CONFIG_HPP
#define PHYSICS_CONFIG_HPP

#include "physics/Integrator.hpp"
#include <cstdint>

namespace PyroForge {

enum class StepMode : uint8_t {
  Fixed = 0, // Accumulator drained in fixedTimeStep slices
  Simple = 1 // Clamped delta split into subSteps equal slices
};

struct PhysicsConfig {
  IntegratorKind integrator{IntegratorKind::Verlet};
  int subSteps{4};                     // Simple mode slices, Fixed mode allows 2x this
  float fixedTimeStep{1.0f / 240.0f};  // 240 Hz physics
  float maxDeltaTime{1.0f / 30.0f};    // Clamp for long frames
  StepMode mode{StepMode::Fixed};
};

} // namespace PyroForge

#endif // PHYSICS_CONFIG_HPP
