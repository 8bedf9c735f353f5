/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_ENGINE_HPP
#define PHYSICS_ENGINE_HPP

/**
 * @file PhysicsEngine.hpp
 * @brief Particle motion integration with a selectable integrator
 *
 * One PhysicsEngine is owned by the SimulationDriver and handed by reference
 * to the systems that integrate motion. Particle integration works in
 * frame-normalized units: forces are expressed per 1/60 s frame, so a step of
 * dt seconds advances dt * 60 frames.
 */

#include "physics/Integrator.hpp"
#include "physics/PhysicsConfig.hpp"
#include "physics/PhysicsStepper.hpp"
#include <memory>

namespace PyroForge {

class PhysicsEngine {
public:
  static constexpr float FRAMES_PER_SECOND = 60.0f;
  static constexpr float MIN_DRAG_SPEED_SQ = 0.001f;

  explicit PhysicsEngine(const PhysicsConfig &config = PhysicsConfig{});

  /**
   * @brief Replace the configuration, rebuilding the integrator if its kind
   * changed. Resets the stepper accumulator.
   */
  void setConfig(const PhysicsConfig &config);
  const PhysicsConfig &getConfig() const { return m_config; }

  const Integrator &getIntegrator() const { return *m_integrator; }
  PhysicsStepper &getStepper() { return m_stepper; }
  const PhysicsStepper &getStepper() const { return m_stepper; }

  /**
   * @brief Advance one particle by dt seconds
   *
   * Acceleration is gravity (down the y axis) plus quadratic drag opposing
   * the velocity. After integration the velocity is damped by
   * friction^(dt*60) and the Verlet history is re-synchronized with it.
   *
   * @param state particle kinematics, updated in place
   * @param gravity downward acceleration per frame^2
   * @param friction per-frame velocity retention (0..1)
   * @param resistance quadratic drag coefficient
   * @param dt step in seconds; non-positive values are ignored
   */
  void integrateParticle(IntegrationState &state, float gravity,
                         float friction, float resistance, float dt) const;

private:
  PhysicsConfig m_config;
  std::unique_ptr<Integrator> m_integrator;
  PhysicsStepper m_stepper;
};

} // namespace PyroForge

#endif // PHYSICS_ENGINE_HPP
