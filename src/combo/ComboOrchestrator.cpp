/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combo/ComboOrchestrator.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleSpawner.hpp"
#include "shapes/ShapeGenerator.hpp"
#include <cmath>
#include <format>
#include <utility>

namespace PyroForge {

ComboOrchestrator::ComboOrchestrator(ComboConfig config)
    : m_config(std::move(config)) {}

void ComboOrchestrator::beginExplosion(float lifeTime, const Vector3D &position) {
  if (m_state != ComboState::Ascending) {
    return;
  }
  m_explosionLifeTime = lifeTime;
  m_explosionPosition = position;

  if (m_config.stages.empty()) {
    COMBO_ERROR(std::format("Combo '{}' has no stages",
                            ComboLibrary::toString(m_config.kind)));
    m_state = ComboState::Done;
    return;
  }
  m_state = ComboState::Exploding;
}

size_t ComboOrchestrator::update(float lifeTime, const ExplosionContext &context,
                                 ParticleSpawner &spawner) {
  if (m_state != ComboState::Exploding) {
    return 0;
  }

  size_t spawned = 0;
  const float elapsed = lifeTime - m_explosionLifeTime;
  const ComboStageConfig &stage = m_config.stages[m_stageIndex];
  if (elapsed >= stage.delay) {
    spawned = executeStage(stage, context, spawner);
    ++m_firedStages;
    ++m_stageIndex;
  }

  if (m_stageIndex >= m_config.stages.size()) {
    m_state = ComboState::Done;
  }
  return spawned;
}

int ComboOrchestrator::computeStageCount(const ComboStageConfig &stage,
                                         float charge,
                                         float particleCountMultiplier) {
  const float count = (BASE_PARTICLE_COUNT + charge * CHARGE_PARTICLE_COUNT) *
                      particleCountMultiplier * stage.particleCount;
  if (!(count > 0.0f)) {
    return 0;
  }
  return static_cast<int>(std::floor(count));
}

size_t ComboOrchestrator::executeStage(const ComboStageConfig &stage,
                                       const ExplosionContext &context,
                                       ParticleSpawner &spawner) {
  const int count = computeStageCount(stage, context.charge,
                                      context.particleCountMultiplier);
  const float sizeScale = context.explosionSizeMultiplier;
  const auto points =
      ShapeGenerator::generate(stage.shape, count, stage.scale * sizeScale,
                               context.hue + stage.hueShift, context.rng);

  const Vector3D center =
      m_explosionPosition + stage.spawnOffset.value_or(Vector3D());
  const float velocityFactor =
      SHAPE_VELOCITY_FACTOR * sizeScale * stage.velocityScale.value_or(1.0f);
  // Burst shells are free sparks, everything else holds its formation
  const ParticleBehavior fallbackBehavior =
      ShapeGenerator::isBurstShape(stage.shape) ? ParticleBehavior::Default
                                                : ParticleBehavior::Stationary;

  for (const auto &point : points) {
    ParticleSpawnOptions options;
    options.position = center;
    options.origin = center;
    options.velocity = point.offset * velocityFactor;
    options.hue = std::fmod(point.hue, 360.0f);
    if (options.hue < 0.0f) {
      options.hue += 360.0f;
    }
    options.behavior =
        stage.behavior.value_or(point.behavior.value_or(fallbackBehavior));
    options.gravity = stage.gravity;
    options.decay = stage.decay ? stage.decay : point.decay;
    options.size = point.size;
    options.friction = point.friction;
    if (options.behavior == ParticleBehavior::Default) {
      options.gravity = stage.gravity.value_or(context.gravity);
      options.friction = point.friction.value_or(context.friction);
    }
    spawner.spawn(options);
  }

  COMBO_DEBUG(std::format("Stage {}/{} fired: {} x{}", m_stageIndex + 1,
                          m_config.stages.size(),
                          ShapeGenerator::toString(stage.shape), points.size()));
  return points.size();
}

} // namespace PyroForge
