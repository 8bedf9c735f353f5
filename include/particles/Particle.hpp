/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_HPP
#define PARTICLE_HPP

/**
 * @file Particle.hpp
 * @brief A single firework spark and its behavior rules
 *
 * Particles are owned by a ParticlePool and reinitialized on every acquire,
 * so init() must overwrite every field that update() reads.
 */

#include "physics/Integrator.hpp"
#include "utils/Vector3D.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>

namespace PyroForge {

class PhysicsEngine;

/**
 * @brief Behavior tag selecting per-particle motion and alpha rules
 */
enum class ParticleBehavior : uint8_t {
  Default = 0,
  Willow = 1,     // Long-lived drooping trails
  Glitter = 2,    // Twinkling sparks
  Firefly = 3,    // Wandering, pulsing, slightly buoyant
  Comet = 4,      // Low drag with a long trail
  Galaxy = 5,     // Orbits its origin in the XZ plane
  Ghost = 6,      // Flickers as it fades
  Stationary = 7, // Shape points that hold their formation
  COUNT = 8
};

const char *particleBehaviorToString(ParticleBehavior behavior);

/**
 * @brief Parse a behavior name
 *
 * Accepts the canonical names plus the combo aliases "vortex" (galaxy),
 * "fire" (default) and "falling" (willow).
 */
std::optional<ParticleBehavior> particleBehaviorFromString(std::string_view name);

/**
 * @brief Initialization parameters for Particle::init
 *
 * Unset optionals take the behavior defaults. velocity, when set, replaces
 * the spherical (theta, phi, speed) launch.
 */
struct ParticleSpawnOptions {
  Vector3D position;
  std::optional<Vector3D> origin;
  std::optional<Vector3D> velocity;
  float hue{0.0f};
  ParticleBehavior behavior{ParticleBehavior::Default};

  std::optional<float> theta;
  std::optional<float> phi;
  std::optional<float> speed;

  std::optional<float> friction;
  std::optional<float> gravity;
  std::optional<float> decay;
  std::optional<float> size;
  std::optional<float> resistance;
  std::optional<float> alpha;
};

class Particle {
public:
  static constexpr size_t TRAIL_INLINE_CAPACITY = 20;
  using Trail = boost::container::small_vector<Vector3D, TRAIL_INLINE_CAPACITY>;

  static constexpr float DEFAULT_DECAY = 0.02f;
  static constexpr float DEFAULT_FRICTION = 0.95f;
  static constexpr float DEFAULT_GRAVITY = 0.12f;
  static constexpr float DEFAULT_RESISTANCE = 0.005f;
  static constexpr size_t DEFAULT_TRAIL_LENGTH = 10;
  // One trail sample per 60 Hz frame of simulated time
  static constexpr float TRAIL_SAMPLE_FRAMES = 1.0f;

  Particle() = default;

  /**
   * @brief Full reinitialization. Leaves no state from a previous life.
   */
  void init(const ParticleSpawnOptions &options, std::mt19937 &rng);

  /**
   * @brief Advance the particle by dt seconds
   *
   * Runs the behavior perturbation, then drag, friction and gravity through
   * the physics engine, then decays life and recomputes alpha. A
   * non-positive dt does nothing.
   */
  void update(float dt, const PhysicsEngine &physics);

  bool isDead() const { return life <= 0.0f; }

  const Vector3D &getPosition() const { return m_state.position; }
  const Vector3D &getVelocity() const { return m_state.velocity; }
  void setPosition(const Vector3D &position) { m_state.position = position; }
  void setVelocity(const Vector3D &velocity) { m_state.velocity = velocity; }
  const IntegrationState &getState() const { return m_state; }

  const Trail &getTrail() const { return m_trail; }
  size_t getMaxTrailLength() const { return m_maxTrailLength; }

  // Accumulated simulated seconds since init
  float getAge() const { return m_age; }

  Vector3D origin;
  float hue{0.0f};
  float alpha{1.0f};
  float life{1.0f};
  float decay{DEFAULT_DECAY};
  float friction{DEFAULT_FRICTION};
  float gravity{DEFAULT_GRAVITY};
  float resistance{DEFAULT_RESISTANCE};
  float size{1.0f};
  float twinkleFactor{0.0f};
  float timeOffset{0.0f};
  float rotationSpeed{0.0f};
  ParticleBehavior behavior{ParticleBehavior::Default};

private:
  void applyBehavior(float frames);
  void updateAlpha();

  IntegrationState m_state;
  Trail m_trail;
  size_t m_maxTrailLength{DEFAULT_TRAIL_LENGTH};
  float m_age{0.0f};
  float m_trailFrames{0.0f};
  float m_baseAlpha{1.0f};
};

} // namespace PyroForge

#endif // PARTICLE_HPP
