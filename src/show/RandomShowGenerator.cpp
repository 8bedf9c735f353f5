/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "show/RandomShowGenerator.hpp"
#include "core/Logger.hpp"
#include "shapes/ShapeGenerator.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <utility>

namespace PyroForge {

namespace {

constexpr std::array<const char *, 9> MIDDLE_STAGE_NAMES = {
    "Prelude", "Departure", "Bloom",  "Climax", "Ripple",
    "Ascent",  "Turn",      "Encore", "Coda"};

template <typename Kind>
std::vector<Kind> withoutExcluded(const std::vector<Kind> &pool,
                                  const std::vector<Kind> &excluded) {
  std::vector<Kind> result;
  result.reserve(pool.size());
  for (Kind kind : pool) {
    if (std::find(excluded.begin(), excluded.end(), kind) == excluded.end()) {
      result.push_back(kind);
    }
  }
  return result;
}

template <typename Kind>
Kind pickWeighted(const std::vector<Kind> &pool,
                  const boost::container::flat_map<Kind, float> &weights,
                  std::mt19937 &rng) {
  if (weights.empty()) {
    return pool[Random::index(rng, pool.size())];
  }

  float total = 0.0f;
  for (Kind kind : pool) {
    auto it = weights.find(kind);
    total += std::max(0.0f, it != weights.end() ? it->second : 1.0f);
  }
  if (!(total > 0.0f)) {
    return pool[Random::index(rng, pool.size())];
  }

  float roll = Random::unit(rng) * total;
  for (Kind kind : pool) {
    auto it = weights.find(kind);
    roll -= std::max(0.0f, it != weights.end() ? it->second : 1.0f);
    if (roll < 0.0f) {
      return kind;
    }
  }
  return pool.back();
}

} // namespace

RandomShowGenerator::RandomShowGenerator(RandomShowConfig config)
    : m_config(std::move(config)) {
  if (m_config.maxStages < m_config.minStages) {
    SHOW_WARN("Random show maxStages below minStages, using minStages");
    m_config.maxStages = m_config.minStages;
  }
  if (m_config.maxCount < m_config.minCount) {
    m_config.maxCount = m_config.minCount;
  }
  if (m_config.maxDelay < m_config.minDelay) {
    m_config.maxDelay = m_config.minDelay;
  }
  setEnabledPools(ShapeGenerator::getAllKinds(),
                  TrajectoryRegistry::allKinds(), ComboLibrary::allKinds());
}

void RandomShowGenerator::setEnabledPools(
    const std::vector<ShapeKind> &shapes,
    const std::vector<TrajectoryKind> &trajectories,
    const std::vector<ComboKind> &combos) {
  m_shapes = withoutExcluded(shapes, m_config.excludedShapes);
  m_trajectories = withoutExcluded(trajectories, m_config.excludedTrajectories);
  m_combos = withoutExcluded(combos, m_config.excludedCombos);
}

ShowSequence RandomShowGenerator::generateSequence(std::mt19937 &rng) {
  m_lastShape.reset();
  m_lastTrajectory.reset();

  const int stageCount = Random::rangeInt(
      rng, std::max(1, m_config.minStages), std::max(1, m_config.maxStages));

  ShowSequence sequence;
  sequence.reserve(static_cast<size_t>(stageCount));
  for (int i = 0; i < stageCount; ++i) {
    sequence.push_back(generateStage(i, stageCount, rng));
  }

  SHOW_DEBUG(std::format("Generated random show: {} stages, ~{:.1f}s",
                         sequence.size(), estimateDuration(sequence)));
  return sequence;
}

ShowStage RandomShowGenerator::generateStage(int index, int total,
                                             std::mt19937 &rng) {
  const bool isOpening = index == 0;
  const bool isFinale = index == total - 1;

  ShowStage stage;

  ShapeKind shape = pickShape(rng);
  for (int attempt = 0; attempt < REPEAT_RETRIES && shape == m_lastShape;
       ++attempt) {
    shape = pickShape(rng);
  }
  m_lastShape = shape;
  stage.shape = shape;

  TrajectoryKind trajectory = pickTrajectory(rng);
  for (int attempt = 0;
       attempt < REPEAT_RETRIES && trajectory == m_lastTrajectory; ++attempt) {
    trajectory = pickTrajectory(rng);
  }
  m_lastTrajectory = trajectory;
  stage.trajectory = trajectory;

  stage.combo = ComboLibrary::pickFrom(m_combos, rng);
  stage.formation = pickFormation(rng);

  stage.count = Random::rangeInt(rng, m_config.minCount, m_config.maxCount);
  if (isOpening || isFinale) {
    stage.count = std::min(stage.count * 2, MAX_FEATURE_COUNT);
  }

  stage.delay = isOpening ? 0.0f
                          : std::round(Random::range(rng, m_config.minDelay,
                                                     m_config.maxDelay));
  stage.interval =
      static_cast<float>(Random::rangeInt(rng, MIN_INTERVAL, MAX_INTERVAL));

  const char *name = "Opening";
  if (isFinale && !isOpening) {
    name = "Finale";
  } else if (!isOpening) {
    name = MIDDLE_STAGE_NAMES[Random::index(rng, MIDDLE_STAGE_NAMES.size())];
  }
  stage.name = std::format("{} #{}", name, index + 1);
  return stage;
}

ShapeKind RandomShowGenerator::pickShape(std::mt19937 &rng) const {
  if (m_shapes.empty()) {
    return ShapeKind::SPHERE;
  }
  return pickWeighted(m_shapes, m_config.shapeWeights, rng);
}

TrajectoryKind RandomShowGenerator::pickTrajectory(std::mt19937 &rng) const {
  if (m_trajectories.empty()) {
    return TrajectoryKind::LINEAR;
  }
  return pickWeighted(m_trajectories, m_config.trajectoryWeights, rng);
}

LaunchFormation RandomShowGenerator::pickFormation(std::mt19937 &rng) const {
  std::vector<LaunchFormation> formations;
  formations.reserve(LAUNCH_FORMATION_COUNT);
  for (size_t i = 0; i < LAUNCH_FORMATION_COUNT; ++i) {
    formations.push_back(static_cast<LaunchFormation>(i));
  }
  return pickWeighted(formations, m_config.formationWeights, rng);
}

float RandomShowGenerator::estimateDuration(const ShowSequence &sequence) {
  float stageStart = 0.0f;
  float end = 0.0f;
  for (const ShowStage &stage : sequence) {
    stageStart += std::max(0.0f, stage.delay) / 1000.0f;
    const float lastLaunch = static_cast<float>(std::max(0, stage.count - 1)) *
                             std::max(0.0f, stage.interval) / 1000.0f;
    end = std::max(end, stageStart + lastLaunch + STAGE_TAIL);
  }
  return end;
}

} // namespace PyroForge
