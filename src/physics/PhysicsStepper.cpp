/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/PhysicsStepper.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace PyroForge {

namespace {
PhysicsConfig sanitize(PhysicsConfig config) {
  if (config.subSteps < 1) {
    PHYSICS_WARN(std::format("subSteps {} invalid, using 1", config.subSteps));
    config.subSteps = 1;
  }
  if (!(config.fixedTimeStep > 0.0f)) {
    PHYSICS_WARN("fixedTimeStep must be positive, using 1/240");
    config.fixedTimeStep = 1.0f / 240.0f;
  }
  if (!(config.maxDeltaTime > 0.0f)) {
    PHYSICS_WARN("maxDeltaTime must be positive, using 1/30");
    config.maxDeltaTime = 1.0f / 30.0f;
  }
  return config;
}
} // namespace

PhysicsStepper::PhysicsStepper(const PhysicsConfig &config)
    : m_config(sanitize(config)) {}

void PhysicsStepper::setConfig(const PhysicsConfig &config) {
  m_config = sanitize(config);
  m_accumulator = 0.0f;
}

float PhysicsStepper::clampDelta(float deltaTime) const {
  if (!(deltaTime > 0.0f)) {
    return 0.0f;
  }
  return std::min(deltaTime, m_config.maxDeltaTime);
}

int PhysicsStepper::step(float deltaTime, const StepFn &stepFn) {
  if (m_config.mode == StepMode::Simple) {
    return advanceSimple(deltaTime, stepFn);
  }
  return advance(deltaTime, stepFn);
}

int PhysicsStepper::advance(float deltaTime, const StepFn &stepFn) {
  m_accumulator += clampDelta(deltaTime);

  const float stepSize = m_config.fixedTimeStep;
  const int maxSteps = getMaxStepsPerCall();
  int steps = 0;

  while (m_accumulator >= stepSize && steps < maxSteps) {
    stepFn(stepSize);
    m_accumulator -= stepSize;
    ++steps;
  }

  // Spiral guard hit: drop the backlog rather than carry it forever
  if (steps == maxSteps && m_accumulator >= stepSize) {
    m_accumulator = std::fmod(m_accumulator, stepSize);
  }
  return steps;
}

int PhysicsStepper::advanceSimple(float deltaTime, const StepFn &stepFn) {
  const float clamped = clampDelta(deltaTime);
  if (clamped <= 0.0f) {
    return 0;
  }
  const float slice = clamped / static_cast<float>(m_config.subSteps);
  for (int i = 0; i < m_config.subSteps; ++i) {
    stepFn(slice);
  }
  return m_config.subSteps;
}

float PhysicsStepper::getInterpolationAlpha() const {
  return std::clamp(m_accumulator / m_config.fixedTimeStep, 0.0f, 1.0f);
}

} // namespace PyroForge
