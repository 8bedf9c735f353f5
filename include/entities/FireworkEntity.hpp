/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FIREWORK_ENTITY_HPP
#define FIREWORK_ENTITY_HPP

/**
 * @file FireworkEntity.hpp
 * @brief A launched rocket: ballistic ascent, then a staged explosion
 *
 * Launch velocity is solved in closed form so that an unperturbed (LINEAR)
 * ascent peaks exactly at the target height. Motion is in frame units: one
 * frame is 1/60 s and velocities are units per frame.
 */

#include "combo/ComboOrchestrator.hpp"
#include "core/SimulationSettings.hpp"
#include "trajectory/TrajectoryCalculator.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace PyroForge {

class ParticleSpawner;

struct LaunchRequest {
  Vector3D start;
  Vector3D target;
  float hue{0.0f};
  float charge{1.0f}; // 0..1, scales the particle count
  std::optional<TrajectoryKind> trajectory;
  std::optional<ComboKind> combo;
  std::optional<ShapeKind> shape;
  std::optional<ComboConfig> customCombo; // Replaces the combo preset when set
};

class FireworkEntity {
public:
  static constexpr float MIN_ASCENT_DISTANCE = 10.0f;
  static constexpr float EXPLOSION_VELOCITY_THRESHOLD = -3.0f;
  static constexpr float ASCENT_GRAVITY_SCALE = 1.5f;

  static constexpr float EXHAUST_JITTER = 0.75f;
  static constexpr float EXHAUST_DECAY = 0.08f;
  static constexpr float EXHAUST_GRAVITY = 0.02f;
  static constexpr float EXHAUST_INTERVAL_FRAMES = 1.0f;

  /**
   * @param id caller-assigned identifier reported to explosion listeners
   * @param request launch parameters
   * @param settings gravity used by the ballistic solve
   * @param rng seeds this rocket's own random stream
   */
  FireworkEntity(uint64_t id, const LaunchRequest &request,
                 const SimulationSettings &settings, std::mt19937 &rng);

  /**
   * @brief Advance by dt seconds
   *
   * Ascending: trajectory, integration, exhaust trail, explosion check.
   * Exploded: drives the combo stages. A non-positive dt does nothing.
   */
  void update(float dt, const SimulationSettings &settings,
              ParticleSpawner &spawner);

  /**
   * @brief Explode at the current position. Stage 0 fires on the next
   * update (the same update when triggered by the velocity threshold).
   */
  void triggerExplosion();

  /**
   * @brief Closed-form ascent time in frames: sqrt(2 * dy / G)
   */
  static float solveTimeToApex(float distanceY, float effectiveGravity);

  uint64_t getId() const { return m_id; }
  bool isExploded() const { return m_exploded; }
  bool isFinished() const { return m_orchestrator.isDone(); }

  const Vector3D &getPosition() const { return m_position; }
  const Vector3D &getVelocity() const { return m_velocity; }
  const Vector3D &getPreviousVelocity() const { return m_previousVelocity; }
  const Vector3D &getTarget() const { return m_target; }
  const Vector3D &getExplosionPosition() const {
    return m_orchestrator.getExplosionPosition();
  }
  float getHue() const { return m_hue; }
  float getCharge() const { return m_charge; }
  float getLifeTime() const { return m_lifeTime; }
  // Seconds from launch to apex for an unperturbed ascent
  float getPredictedApexTime() const { return m_timeToApexFrames / 60.0f; }

  const TrajectoryCalculator &getTrajectory() const { return m_trajectory; }
  const ComboOrchestrator &getOrchestrator() const { return m_orchestrator; }

private:
  void spawnExhaust(ParticleSpawner &spawner);

  uint64_t m_id;
  Vector3D m_position;
  Vector3D m_velocity;
  Vector3D m_previousVelocity;
  Vector3D m_target;
  float m_hue;
  float m_charge;
  float m_lifeTime{0.0f};
  float m_exhaustFrames{0.0f};
  float m_timeToApexFrames{0.0f};
  bool m_exploded{false};
  std::mt19937 m_rng;
  TrajectoryCalculator m_trajectory;
  ComboOrchestrator m_orchestrator;
};

} // namespace PyroForge

#endif // FIREWORK_ENTITY_HPP
