/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/Particle.hpp"
#include "physics/PhysicsEngine.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <cmath>

namespace PyroForge {

namespace {
// Absorbs rounding when several sub-frame steps add up to one frame
constexpr float FRAME_EPSILON = 1e-3f;
} // namespace

const char *particleBehaviorToString(ParticleBehavior behavior) {
  switch (behavior) {
  case ParticleBehavior::Default:
    return "default";
  case ParticleBehavior::Willow:
    return "willow";
  case ParticleBehavior::Glitter:
    return "glitter";
  case ParticleBehavior::Firefly:
    return "firefly";
  case ParticleBehavior::Comet:
    return "comet";
  case ParticleBehavior::Galaxy:
    return "galaxy";
  case ParticleBehavior::Ghost:
    return "ghost";
  case ParticleBehavior::Stationary:
    return "stationary";
  default:
    return "default";
  }
}

std::optional<ParticleBehavior> particleBehaviorFromString(std::string_view name) {
  for (uint8_t i = 0; i < static_cast<uint8_t>(ParticleBehavior::COUNT); ++i) {
    auto behavior = static_cast<ParticleBehavior>(i);
    if (name == particleBehaviorToString(behavior)) {
      return behavior;
    }
  }
  if (name == "vortex")
    return ParticleBehavior::Galaxy;
  if (name == "fire")
    return ParticleBehavior::Default;
  if (name == "falling")
    return ParticleBehavior::Willow;
  return std::nullopt;
}

void Particle::init(const ParticleSpawnOptions &options, std::mt19937 &rng) {
  m_state.position = options.position;
  m_state.hasPreviousPosition = false;
  origin = options.origin.value_or(options.position);
  hue = options.hue;
  behavior = options.behavior;
  life = 1.0f;
  m_baseAlpha = std::clamp(options.alpha.value_or(1.0f), 0.0f, 1.0f);
  alpha = m_baseAlpha;
  timeOffset = Random::unit(rng) * 100.0f;
  twinkleFactor = Random::unit(rng);
  rotationSpeed = 0.0f;
  m_age = 0.0f;
  m_trailFrames = 0.0f;
  m_trail.clear();
  m_maxTrailLength = DEFAULT_TRAIL_LENGTH;

  if (options.velocity) {
    m_state.velocity = *options.velocity;
  } else {
    const float theta = options.theta ? *options.theta : Random::unit(rng) * TWO_PI;
    const float phi = options.phi ? *options.phi : Random::unit(rng) * PI;
    const float speed = options.speed ? *options.speed : Random::unit(rng) * 10.0f + 2.0f;
    m_state.velocity = Vector3D(speed * std::sin(phi) * std::cos(theta),
                                speed * std::cos(phi),
                                speed * std::sin(phi) * std::sin(theta));
  }
  m_state.previousPosition = m_state.position;

  resistance = options.resistance.value_or(DEFAULT_RESISTANCE);

  switch (behavior) {
  case ParticleBehavior::Willow:
    friction = options.friction.value_or(0.98f);
    gravity = options.gravity.value_or(0.04f);
    decay = options.decay.value_or(0.006f);
    size = options.size.value_or(1.5f);
    m_maxTrailLength = 15;
    break;
  case ParticleBehavior::Glitter:
    friction = options.friction.value_or(0.92f);
    gravity = options.gravity.value_or(0.15f);
    decay = options.decay.value_or(0.02f);
    size = options.size ? *options.size : Random::unit(rng) * 2.0f + 1.0f;
    break;
  case ParticleBehavior::Firefly:
    // Fixed: fireflies ignore overrides
    friction = 0.94f;
    gravity = -0.01f;
    decay = 0.005f;
    size = 1.2f;
    break;
  case ParticleBehavior::Comet:
    friction = 0.995f;
    gravity = 0.01f;
    decay = options.decay.value_or(0.006f);
    size = 3.0f;
    resistance = options.resistance.value_or(0.0001f);
    m_maxTrailLength = 20;
    break;
  case ParticleBehavior::Galaxy:
    friction = 0.98f;
    gravity = 0.0f;
    decay = options.decay.value_or(0.008f);
    size = Random::unit(rng) * 1.5f + 0.5f;
    rotationSpeed = (Random::unit(rng) - 0.5f) * 0.05f;
    break;
  case ParticleBehavior::Stationary:
    friction = options.friction.value_or(0.85f);
    gravity = options.gravity.value_or(0.01f);
    decay = options.decay ? *options.decay : 0.005f + Random::unit(rng) * 0.005f;
    size = options.size ? *options.size : Random::unit(rng) * 2.0f + 1.0f;
    break;
  default:
    friction = options.friction.value_or(DEFAULT_FRICTION);
    gravity = options.gravity.value_or(DEFAULT_GRAVITY);
    decay = options.decay ? *options.decay : Random::unit(rng) * 0.02f + 0.01f;
    size = options.size ? *options.size : Random::unit(rng) * 2.0f + 1.0f;
    break;
  }

  // A zero decay would never die; clamp to a tiny positive rate
  decay = std::max(decay, 1e-5f);
}

void Particle::update(float dt, const PhysicsEngine &physics) {
  if (!(dt > 0.0f)) {
    return;
  }
  const float frames = std::max(dt * PhysicsEngine::FRAMES_PER_SECOND, 0.001f);
  m_age += dt;

  if (behavior == ParticleBehavior::Comet ||
      behavior == ParticleBehavior::Willow) {
    m_trailFrames += frames;
    if (m_trailFrames >= TRAIL_SAMPLE_FRAMES - FRAME_EPSILON) {
      m_trailFrames = std::max(0.0f, m_trailFrames - TRAIL_SAMPLE_FRAMES);
      m_trail.push_back(m_state.position);
      if (m_trail.size() > m_maxTrailLength) {
        m_trail.erase(m_trail.begin());
      }
    }
  }

  applyBehavior(frames);

  physics.integrateParticle(m_state, gravity, friction, resistance, dt);

  life -= decay * frames;
  updateAlpha();

  if (behavior == ParticleBehavior::Glitter) {
    twinkleFactor = std::fmod(twinkleFactor + 0.15f * frames, 1.0f);
  }
}

void Particle::applyBehavior(float frames) {
  if (behavior == ParticleBehavior::Firefly) {
    const float t = m_age * 5.0f + timeOffset;
    m_state.velocity += Vector3D(std::sin(t), std::cos(t * 0.7f),
                                 std::sin(t * 1.3f)) *
                        (0.05f * frames);
  } else if (behavior == ParticleBehavior::Galaxy) {
    const Vector3D &p = m_state.position;
    const float dx = p.getX() - origin.getX();
    const float dz = p.getZ() - origin.getZ();
    const float dist = std::sqrt(dx * dx + dz * dz);
    const float angle = std::atan2(dz, dx) + rotationSpeed * frames;

    const float targetX = origin.getX() +
                          std::cos(angle) * (dist + m_state.velocity.getX() * frames);
    const float targetZ = origin.getZ() +
                          std::sin(angle) * (dist + m_state.velocity.getZ() * frames);

    if (frames > 0.001f) {
      m_state.velocity.setX((targetX - p.getX()) / frames);
      m_state.velocity.setZ((targetZ - p.getZ()) / frames);
    }
  } else {
    return;
  }

  // Velocity was rewritten, keep the Verlet history consistent with it
  if (m_state.hasPreviousPosition) {
    m_state.previousPosition = m_state.position - m_state.velocity * frames;
  }
}

void Particle::updateAlpha() {
  const float l = std::max(life, 0.0f);
  if (behavior == ParticleBehavior::Ghost) {
    alpha = (std::sin(l * 20.0f) * 0.5f + 0.5f) * l;
  } else if (behavior == ParticleBehavior::Firefly) {
    // m_age in ms * 0.01
    alpha = (std::sin(m_age * 10.0f + timeOffset) * 0.4f + 0.6f) * l;
  } else {
    alpha = l;
  }
  alpha *= m_baseAlpha;
}

} // namespace PyroForge
