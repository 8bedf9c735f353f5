/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/PhysicsEngine.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>

namespace PyroForge {

PhysicsEngine::PhysicsEngine(const PhysicsConfig &config)
    : m_config(config), m_integrator(createIntegrator(config.integrator)),
      m_stepper(config) {
  PHYSICS_INFO(std::format("PhysicsEngine using {} integrator, {} sub-steps",
                           integratorKindToString(config.integrator),
                           config.subSteps));
}

void PhysicsEngine::setConfig(const PhysicsConfig &config) {
  if (config.integrator != m_config.integrator) {
    m_integrator = createIntegrator(config.integrator);
    PHYSICS_DEBUG(std::format("Switched integrator to {}",
                              integratorKindToString(config.integrator)));
  }
  m_config = config;
  m_stepper.setConfig(config);
}

void PhysicsEngine::integrateParticle(IntegrationState &state, float gravity,
                                      float friction, float resistance,
                                      float dt) const {
  if (!(dt > 0.0f)) {
    return;
  }
  const float frames = dt * FRAMES_PER_SECOND;

  auto acceleration = [gravity, resistance](const Vector3D &,
                                            const Vector3D &velocity) {
    Vector3D a(0.0f, -gravity, 0.0f);
    float speedSq = velocity.lengthSquared();
    if (speedSq > MIN_DRAG_SPEED_SQ) {
      float speed = std::sqrt(speedSq);
      a -= velocity * (speed * resistance);
    }
    return a;
  };

  m_integrator->integrate(state, acceleration, frames);

  const float damping = std::pow(friction, frames);
  if (damping != 1.0f) {
    state.velocity *= damping;
    if (state.hasPreviousPosition) {
      state.previousPosition = state.position - state.velocity * frames;
    }
  }
}

} // namespace PyroForge
