/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_DRIVER_HPP
#define SIMULATION_DRIVER_HPP

/**
 * @file SimulationDriver.hpp
 * @brief Top-level owner of the firework simulation
 *
 * The host calls tick() once per frame and reads getActiveParticles() to
 * draw. Each tick is scaled by the time scale and sliced into physics steps
 * by the engine's stepper. Per step: virtual time, auto launch, show
 * director, fireworks, then particles.
 *
 * Exploded fireworks move from the active list to the finishing list and
 * keep ticking until their last combo stage has fired.
 */

#include "combo/ComboLibrary.hpp"
#include "core/SimulationSettings.hpp"
#include "entities/FireworkEntity.hpp"
#include "particles/ParticlePool.hpp"
#include "physics/PhysicsConfig.hpp"
#include "physics/PhysicsEngine.hpp"
#include "show/ShowDirector.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace PyroForge {

/**
 * @brief Read-only render snapshot of one particle
 */
struct ParticleView {
  Vector3D position;
  float hue{0.0f};
  float alpha{1.0f};
  float size{1.0f};
};

using ExplosionListener =
    std::function<void(uint64_t fireworkId, const Vector3D &position)>;

class SimulationDriver {
public:
  static constexpr float MIN_TIME_SCALE = 0.1f;
  static constexpr float MAX_TIME_SCALE = 10.0f;
  static constexpr float MIN_AUTO_LAUNCH_DELAY = 100.0f; // ms

  // Random launch envelope, world units
  static constexpr float TARGET_SPREAD = 400.0f;
  static constexpr float START_SPREAD = 500.0f;
  static constexpr float MIN_TARGET_HEIGHT = 200.0f;
  static constexpr float MAX_TARGET_HEIGHT = 350.0f;
  // Show formations are widened on the way up
  static constexpr float SHOW_TARGET_SCALE = 1.5f;

  explicit SimulationDriver(const SimulationSettings &settings = {},
                            const PhysicsConfig &physics = {},
                            uint32_t seed = std::random_device{}());

  SimulationDriver(const SimulationDriver &) = delete;
  SimulationDriver &operator=(const SimulationDriver &) = delete;

  /**
   * @brief Advance the simulation by a frame delta in seconds
   *
   * Does nothing while paused or for a non-positive delta. Exceptions from
   * the update are logged and the simulation keeps running.
   */
  void tick(float deltaTime);

  FireworkEntity &launch(const LaunchRequest &request);

  /**
   * @brief Launch with a random aim, hue and kinds from the enabled lists
   */
  FireworkEntity &launchRandom();

  void setExplosionListener(ExplosionListener listener);

  std::vector<ParticleView> getActiveParticles() const;
  size_t getActiveParticleCount() const { return m_pool->activeCount(); }

  // Fireworks still ascending
  const std::vector<std::unique_ptr<FireworkEntity>> &getActiveFireworks() const {
    return m_activeFireworks;
  }
  // Exploded fireworks with stages left to fire
  const std::vector<std::unique_ptr<FireworkEntity>> &getFinishingFireworks() const {
    return m_finishingFireworks;
  }
  size_t getFireworkCount() const {
    return m_activeFireworks.size() + m_finishingFireworks.size();
  }

  // Time control
  void setPaused(bool paused);
  void togglePause() { setPaused(!m_paused); }
  bool isPaused() const { return m_paused; }
  void setTimeScale(float scale);
  float getTimeScale() const { return m_timeScale; }
  float getVirtualTime() const { return m_virtualTime; }
  /**
   * @brief Jump the virtual clock. Stops a running show, since its
   * schedule is anchored to the old timeline.
   */
  void seekTo(float seconds);
  std::string getFormattedTime() const { return formatTime(m_virtualTime); }
  static std::string formatTime(float seconds);

  // Shows
  void playShow(const ShowSequence &sequence);
  void stopShow();
  bool isShowActive() const { return m_showDirector.isActive(); }
  const ShowDirector &getShowDirector() const { return m_showDirector; }

  /**
   * @brief Combos loaded from settings, picked by random launches alongside
   * the enabled presets
   */
  void setCustomCombos(std::vector<ComboConfig> combos);
  const std::vector<ComboConfig> &getCustomCombos() const {
    return m_customCombos;
  }

  /**
   * @brief Replace the settings. A new maxParticles rebuilds the pool and
   * drops the live particles.
   */
  void setSettings(const SimulationSettings &settings);
  const SimulationSettings &getSettings() const { return m_settings; }
  void setPhysicsConfig(const PhysicsConfig &config);

  // Remove every firework and particle and stop the show
  void clear();

  const ParticlePool &getParticlePool() const { return *m_pool; }
  const PhysicsEngine &getPhysicsEngine() const { return m_physics; }

private:
  void stepSimulation(float step);
  void updateAutoLaunch(float step);
  void updateFireworks(float step);
  void launchShowRocket(const ShowStage &stage, const FormationOffset &offset);
  void notifyExplosion(const FireworkEntity &firework);
  void fillRandomKinds(LaunchRequest &request);

  SimulationSettings m_settings;
  std::mt19937 m_rng;
  PhysicsEngine m_physics;
  std::unique_ptr<ParticlePool> m_pool;
  std::vector<std::unique_ptr<FireworkEntity>> m_activeFireworks;
  std::vector<std::unique_ptr<FireworkEntity>> m_finishingFireworks;
  std::vector<ComboConfig> m_customCombos;
  ShowDirector m_showDirector;
  ExplosionListener m_explosionListener;

  uint64_t m_nextFireworkId{1};
  float m_virtualTime{0.0f};
  float m_timeScale{1.0f};
  float m_autoLaunchTimer{0.0f}; // ms
  bool m_paused{false};
};

} // namespace PyroForge

#endif // SIMULATION_DRIVER_HPP
