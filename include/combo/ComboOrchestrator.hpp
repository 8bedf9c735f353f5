/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBO_ORCHESTRATOR_HPP
#define COMBO_ORCHESTRATOR_HPP

/**
 * @file ComboOrchestrator.hpp
 * @brief Per-firework explosion stage scheduler
 *
 * ASCENDING -> EXPLODING -> DONE. While exploding, each update compares the
 * time since the explosion with the next stage's delay and fires at most one
 * stage. Stages fire strictly in order and never twice.
 */

#include "combo/ComboLibrary.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <random>

namespace PyroForge {

class ParticleSpawner;

enum class ComboState : uint8_t { Ascending, Exploding, Done };

/**
 * @brief Per-explosion inputs for stage execution
 */
struct ExplosionContext {
  float hue{0.0f};
  float charge{0.5f};
  float particleCountMultiplier{1.0f};
  float explosionSizeMultiplier{1.0f};
  std::mt19937 &rng;
  // Spark defaults when neither the stage nor the point overrides them
  float gravity{0.12f};
  float friction{0.96f};
};

class ComboOrchestrator {
public:
  static constexpr float BASE_PARTICLE_COUNT = 200.0f;
  static constexpr float CHARGE_PARTICLE_COUNT = 400.0f;
  static constexpr float SHAPE_VELOCITY_FACTOR = 1.5f;

  explicit ComboOrchestrator(ComboConfig config);

  /**
   * @brief Switch to EXPLODING
   * @param lifeTime owner's lifetime at the explosion, seconds
   * @param position explosion center
   *
   * Ignored unless ASCENDING. An empty stage list logs an error and goes
   * straight to DONE.
   */
  void beginExplosion(float lifeTime, const Vector3D &position);

  /**
   * @brief Fire the next stage if its delay has elapsed
   * @return number of particles spawned this call
   */
  size_t update(float lifeTime, const ExplosionContext &context,
                ParticleSpawner &spawner);

  /**
   * @brief Particle count for a stage: floor((200 + charge*400) * mult * stage)
   */
  static int computeStageCount(const ComboStageConfig &stage, float charge,
                               float particleCountMultiplier);

  ComboState getState() const { return m_state; }
  bool isDone() const { return m_state == ComboState::Done; }
  size_t getCurrentStageIndex() const { return m_stageIndex; }
  size_t getStageCount() const { return m_config.stages.size(); }
  size_t getFiredStageCount() const { return m_firedStages; }
  const ComboConfig &getConfig() const { return m_config; }
  const Vector3D &getExplosionPosition() const { return m_explosionPosition; }

private:
  size_t executeStage(const ComboStageConfig &stage,
                      const ExplosionContext &context,
                      ParticleSpawner &spawner);

  ComboConfig m_config;
  ComboState m_state{ComboState::Ascending};
  size_t m_stageIndex{0};
  size_t m_firedStages{0};
  float m_explosionLifeTime{0.0f};
  Vector3D m_explosionPosition;
};

} // namespace PyroForge

#endif // COMBO_ORCHESTRATOR_HPP
