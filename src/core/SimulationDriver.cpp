/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationDriver.hpp"
#include "core/Logger.hpp"
#include "shapes/ShapeGenerator.hpp"
#include "trajectory/TrajectoryCalculator.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <utility>

namespace PyroForge {

SimulationDriver::SimulationDriver(const SimulationSettings &settings,
                                   const PhysicsConfig &physics, uint32_t seed)
    : m_settings(settings), m_rng(seed), m_physics(physics),
      m_pool(std::make_unique<ParticlePool>(settings.maxParticles, m_physics,
                                            static_cast<uint32_t>(m_rng()))),
      m_showDirector(static_cast<uint32_t>(m_rng())) {
  SIMULATION_INFO(std::format("SimulationDriver ready: {} particles max, {}",
                              m_settings.maxParticles,
                              integratorKindToString(physics.integrator)));
}

void SimulationDriver::tick(float deltaTime) {
  if (m_paused || !(deltaTime > 0.0f)) {
    return;
  }

  // Clamp the real frame first, then feed the scaled time in clamp-sized
  // chunks so a high time scale is not eaten by the stepper's own clamp
  const float maxDelta = m_physics.getStepper().getConfig().maxDeltaTime;
  float remaining = std::min(deltaTime, maxDelta) * m_timeScale;

  try {
    while (remaining > 0.0f) {
      const float chunk = std::min(remaining, maxDelta);
      m_physics.getStepper().step(chunk,
                                  [this](float step) { stepSimulation(step); });
      remaining -= chunk;
    }
  } catch (const std::exception &e) {
    SIMULATION_ERROR(
        std::format("Exception in SimulationDriver::tick: {}", e.what()));
  }
}

void SimulationDriver::stepSimulation(float step) {
  m_virtualTime += step;

  updateAutoLaunch(step);
  if (m_showDirector.isActive()) {
    m_showDirector.update(m_virtualTime,
                          [this](const ShowStage &stage,
                                 const FormationOffset &offset) {
                            launchShowRocket(stage, offset);
                          });
  }
  updateFireworks(step);
  m_pool->update(step);
}

void SimulationDriver::updateFireworks(float step) {
  // Finishing first: a rocket that explodes below is already updated
  for (auto &firework : m_finishingFireworks) {
    firework->update(step, m_settings, *m_pool);
  }
  std::erase_if(m_finishingFireworks,
                [](const auto &firework) { return firework->isFinished(); });

  std::vector<std::unique_ptr<FireworkEntity>> exploded;
  for (auto &firework : m_activeFireworks) {
    firework->update(step, m_settings, *m_pool);
    if (firework->isExploded()) {
      exploded.push_back(std::move(firework));
    }
  }
  std::erase(m_activeFireworks, nullptr);

  // Listeners may launch, so both lists must be settled first
  for (auto &firework : exploded) {
    notifyExplosion(*firework);
    if (!firework->isFinished()) {
      m_finishingFireworks.push_back(std::move(firework));
    }
  }
}

void SimulationDriver::updateAutoLaunch(float step) {
  if (!m_settings.autoLaunch) {
    m_autoLaunchTimer = 0.0f;
    return;
  }

  const float delay =
      std::max(MIN_AUTO_LAUNCH_DELAY, m_settings.autoLaunchDelay);
  m_autoLaunchTimer += step * 1000.0f;
  if (m_autoLaunchTimer >= delay) {
    m_autoLaunchTimer -= delay;
    launchRandom();
  }
}

FireworkEntity &SimulationDriver::launch(const LaunchRequest &request) {
  auto firework = std::make_unique<FireworkEntity>(m_nextFireworkId++, request,
                                                   m_settings, m_rng);
  FireworkEntity &ref = *firework;

  SIMULATION_DEBUG(std::format(
      "Launched firework {}: {} / {}", ref.getId(),
      TrajectoryRegistry::toString(ref.getTrajectory().getKind()),
      ref.getOrchestrator().getConfig().name.empty()
          ? ComboLibrary::toString(ref.getOrchestrator().getConfig().kind)
          : ref.getOrchestrator().getConfig().name.c_str()));

  if (ref.isExploded()) {
    notifyExplosion(ref);
    m_finishingFireworks.push_back(std::move(firework));
  } else {
    m_activeFireworks.push_back(std::move(firework));
  }
  return ref;
}

void SimulationDriver::fillRandomKinds(LaunchRequest &request) {
  if (!request.trajectory) {
    request.trajectory =
        TrajectoryRegistry::pickFrom(m_settings.enabledTrajectories, m_rng);
  }
  if (!request.shape) {
    request.shape = ShapeGenerator::pickFrom(m_settings.enabledShapes, m_rng);
  }
  if (!request.combo && !request.customCombo) {
    const size_t presets = m_settings.enabledCombos.size();
    const size_t slot = Random::index(m_rng, presets + m_customCombos.size());
    if (slot >= presets && !m_customCombos.empty()) {
      request.customCombo = m_customCombos[slot - presets];
    } else {
      request.combo = ComboLibrary::pickFrom(m_settings.enabledCombos, m_rng);
    }
  }
}

FireworkEntity &SimulationDriver::launchRandom() {
  LaunchRequest request;
  request.start.set(Random::spread(m_rng, START_SPREAD), 0.0f,
                    Random::spread(m_rng, START_SPREAD));
  request.target.set(
      Random::spread(m_rng, TARGET_SPREAD),
      Random::range(m_rng, MIN_TARGET_HEIGHT, MAX_TARGET_HEIGHT),
      Random::spread(m_rng, TARGET_SPREAD));
  request.hue = Random::range(m_rng, 0.0f, 360.0f);
  request.charge = 1.0f;
  fillRandomKinds(request);
  return launch(request);
}

void SimulationDriver::launchShowRocket(const ShowStage &stage,
                                        const FormationOffset &offset) {
  LaunchRequest request;
  request.start.set(offset.start.getX(), 0.0f, offset.start.getZ());
  request.target.set(
      offset.target.getX() * SHOW_TARGET_SCALE,
      Random::range(m_rng, MIN_TARGET_HEIGHT, MAX_TARGET_HEIGHT) +
          offset.target.getY(),
      offset.target.getZ() * SHOW_TARGET_SCALE);
  request.hue = Random::range(m_rng, 0.0f, 360.0f);
  request.charge = 1.0f;
  request.trajectory = stage.trajectory;
  request.shape = stage.shape;
  request.combo = stage.combo;
  fillRandomKinds(request);
  launch(request);
}

void SimulationDriver::notifyExplosion(const FireworkEntity &firework) {
  if (m_explosionListener) {
    m_explosionListener(firework.getId(), firework.getExplosionPosition());
  }
}

void SimulationDriver::setExplosionListener(ExplosionListener listener) {
  m_explosionListener = std::move(listener);
}

std::vector<ParticleView> SimulationDriver::getActiveParticles() const {
  std::vector<ParticleView> views;
  views.reserve(m_pool->activeCount());
  for (const Particle *particle : m_pool->getActive()) {
    views.push_back({particle->getPosition(), particle->hue, particle->alpha,
                     particle->size});
  }
  return views;
}

void SimulationDriver::setPaused(bool paused) {
  if (m_paused == paused) {
    return;
  }
  m_paused = paused;
  SIMULATION_INFO(paused ? "Paused" : "Resumed");
}

void SimulationDriver::setTimeScale(float scale) {
  if (std::isnan(scale)) {
    SIMULATION_WARN("Ignoring NaN time scale");
    return;
  }
  m_timeScale = std::clamp(scale, MIN_TIME_SCALE, MAX_TIME_SCALE);
}

void SimulationDriver::seekTo(float seconds) {
  m_virtualTime = (seconds > 0.0f) ? seconds : 0.0f;
  m_physics.getStepper().reset();
  m_autoLaunchTimer = 0.0f;
  if (m_showDirector.isActive()) {
    SIMULATION_INFO("Seek stopped the running show");
    m_showDirector.stop();
  }
}

std::string SimulationDriver::formatTime(float seconds) {
  const int total = seconds > 0.0f ? static_cast<int>(std::floor(seconds)) : 0;
  return std::format("{:02}:{:02}", total / 60, total % 60);
}

void SimulationDriver::playShow(const ShowSequence &sequence) {
  m_showDirector.start(sequence, m_virtualTime);
}

void SimulationDriver::stopShow() { m_showDirector.stop(); }

void SimulationDriver::setCustomCombos(std::vector<ComboConfig> combos) {
  std::erase_if(combos, [](const ComboConfig &combo) {
    if (combo.stages.empty()) {
      COMBO_ERROR(std::format("Custom combo '{}' has no stages", combo.name));
      return true;
    }
    return false;
  });
  m_customCombos = std::move(combos);
}

void SimulationDriver::setSettings(const SimulationSettings &settings) {
  const bool resizePool = settings.maxParticles != m_pool->maxActive();
  m_settings = settings;
  if (resizePool) {
    SIMULATION_INFO(std::format("Particle budget changed to {}",
                                settings.maxParticles));
    m_pool = std::make_unique<ParticlePool>(settings.maxParticles, m_physics,
                                            static_cast<uint32_t>(m_rng()));
  }
}

void SimulationDriver::setPhysicsConfig(const PhysicsConfig &config) {
  m_physics.setConfig(config);
}

void SimulationDriver::clear() {
  m_activeFireworks.clear();
  m_finishingFireworks.clear();
  m_pool->clear();
  m_showDirector.stop();
  m_autoLaunchTimer = 0.0f;
}

} // namespace PyroForge
