/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/FireworkEntity.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleSpawner.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace PyroForge {

namespace {

ComboConfig buildCombo(const LaunchRequest &request, std::mt19937 &rng) {
  if (request.customCombo) {
    return *request.customCombo;
  }
  return ComboLibrary::generate(request.combo.value_or(ComboKind::SINGLE),
                                request.shape.value_or(ShapeKind::SPHERE), rng);
}

} // namespace

FireworkEntity::FireworkEntity(uint64_t id, const LaunchRequest &request,
                               const SimulationSettings &settings,
                               std::mt19937 &rng)
    : m_id(id), m_position(request.start), m_target(request.target),
      m_hue(request.hue), m_charge(std::clamp(request.charge, 0.0f, 1.0f)),
      m_rng(rng()), m_trajectory(TrajectoryKind::LINEAR),
      m_orchestrator(buildCombo(request, m_rng)) {
  m_trajectory = TrajectoryCalculator(
      request.trajectory.value_or(m_orchestrator.getConfig().trajectory),
      static_cast<uint32_t>(m_rng()));

  const float effectiveGravity = settings.gravity * ASCENT_GRAVITY_SCALE;
  const float distanceY =
      std::max(MIN_ASCENT_DISTANCE, m_target.getY() - m_position.getY());
  m_timeToApexFrames = solveTimeToApex(distanceY, effectiveGravity);

  if (m_timeToApexFrames > 0.0f) {
    m_velocity.set((m_target.getX() - m_position.getX()) / m_timeToApexFrames,
                   effectiveGravity * m_timeToApexFrames,
                   (m_target.getZ() - m_position.getZ()) / m_timeToApexFrames);
  } else {
    // Zero gravity has no apex; explode where we stand
    FIREWORK_WARN(std::format("Firework {} launched without gravity", m_id));
    triggerExplosion();
  }
  m_previousVelocity = m_velocity;
}

float FireworkEntity::solveTimeToApex(float distanceY, float effectiveGravity) {
  if (!(effectiveGravity > 0.0f)) {
    return 0.0f;
  }
  return std::sqrt(2.0f * std::max(MIN_ASCENT_DISTANCE, distanceY) /
                   effectiveGravity);
}

void FireworkEntity::update(float dt, const SimulationSettings &settings,
                            ParticleSpawner &spawner) {
  if (!(dt > 0.0f)) {
    return;
  }
  m_lifeTime += dt;

  if (!m_exploded) {
    const float frames = dt * 60.0f;
    m_previousVelocity = m_velocity;
    m_velocity = m_trajectory.calculate(m_velocity, settings.gravity, dt);
    // Average of old and new velocity: exact under constant acceleration
    m_position += (m_previousVelocity + m_velocity) * (0.5f * frames);

    if (settings.ascentTrail) {
      // At most one exhaust roll per 60 Hz frame of flight
      m_exhaustFrames += frames;
      if (m_exhaustFrames >= EXHAUST_INTERVAL_FRAMES - 1e-3f) {
        m_exhaustFrames =
            std::max(0.0f, m_exhaustFrames - EXHAUST_INTERVAL_FRAMES);
        spawnExhaust(spawner);
      }
    }

    if (m_velocity.getY() <= EXPLOSION_VELOCITY_THRESHOLD) {
      triggerExplosion();
    }
  }

  if (m_exploded) {
    ExplosionContext context{m_hue,
                             m_charge,
                             settings.particleCountMultiplier,
                             settings.explosionSizeMultiplier,
                             m_rng,
                             settings.gravity,
                             settings.friction};
    m_orchestrator.update(m_lifeTime, context, spawner);
  }
}

void FireworkEntity::triggerExplosion() {
  if (m_exploded) {
    return;
  }
  m_exploded = true;
  m_orchestrator.beginExplosion(m_lifeTime, m_position);
  FIREWORK_DEBUG(std::format("Firework {} exploded at ({:.1f}, {:.1f}, {:.1f})",
                             m_id, m_position.getX(), m_position.getY(),
                             m_position.getZ()));
}

void FireworkEntity::spawnExhaust(ParticleSpawner &spawner) {
  const float speed = m_velocity.length();
  if (Random::unit(m_rng) >= std::min(1.0f, speed / 15.0f)) {
    return;
  }

  ParticleSpawnOptions options;
  options.position =
      m_position + Vector3D(Random::spread(m_rng, EXHAUST_JITTER), -1.0f,
                            Random::spread(m_rng, EXHAUST_JITTER));
  options.velocity = Vector3D();
  options.hue = m_hue;
  options.behavior = ParticleBehavior::Default;
  options.decay = EXHAUST_DECAY;
  options.gravity = EXHAUST_GRAVITY;
  options.size = 5.0f * (speed / 30.0f + 0.5f);
  options.alpha = std::min(1.0f, speed / 20.0f);
  spawner.spawn(options);
}

} // namespace PyroForge
