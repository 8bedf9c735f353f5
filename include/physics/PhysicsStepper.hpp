/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_STEPPER_HPP
#define PHYSICS_STEPPER_HPP

#include "physics/PhysicsConfig.hpp"
#include <functional>

namespace PyroForge {

/**
 * PhysicsStepper slices a variable frame delta into physics steps.
 *
 * Fixed mode uses the classic accumulator: the (clamped) delta is added to
 * the accumulator and fixedTimeStep slices are drained from it, at most
 * subSteps * 2 per call. The remainder carries over to the next call.
 * Simple mode splits the clamped delta into subSteps equal slices.
 */
class PhysicsStepper {
public:
  using StepFn = std::function<void(float stepSeconds)>;

  explicit PhysicsStepper(const PhysicsConfig &config = PhysicsConfig{});

  /**
   * Advance using the configured mode
   * @param deltaTime frame delta in seconds (negative or NaN is treated as 0)
   * @param stepFn called once per physics step
   * @return number of steps executed
   */
  int step(float deltaTime, const StepFn &stepFn);

  int advance(float deltaTime, const StepFn &stepFn);
  int advanceSimple(float deltaTime, const StepFn &stepFn);

  /**
   * Interpolation factor between the last two fixed steps, clamped to [0,1]
   */
  float getInterpolationAlpha() const;

  float getAccumulator() const { return m_accumulator; }
  int getMaxStepsPerCall() const { return m_config.subSteps * 2; }

  void setConfig(const PhysicsConfig &config);
  const PhysicsConfig &getConfig() const { return m_config; }

  void reset() { m_accumulator = 0.0f; }

private:
  float clampDelta(float deltaTime) const;

  PhysicsConfig m_config;
  float m_accumulator{0.0f};
};

} // namespace PyroForge

#endif // PHYSICS_STEPPER_HPP
