/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_SHOW_GENERATOR_HPP
#define RANDOM_SHOW_GENERATOR_HPP

#include "combo/ComboLibrary.hpp"
#include "shapes/ShapeTypes.hpp"
#include "show/LaunchFormation.hpp"
#include "show/ShowDirector.hpp"
#include "trajectory/TrajectoryCalculator.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <random>
#include <vector>

namespace PyroForge {

struct RandomShowConfig {
  int minStages{3};
  int maxStages{6};
  float minDelay{500.0f};  // ms
  float maxDelay{2000.0f}; // ms
  int minCount{3};
  int maxCount{10};

  std::vector<ShapeKind> excludedShapes;
  std::vector<TrajectoryKind> excludedTrajectories;
  std::vector<ComboKind> excludedCombos;

  // Missing entries weigh 1. Empty maps mean uniform picks.
  boost::container::flat_map<ShapeKind, float> shapeWeights;
  boost::container::flat_map<TrajectoryKind, float> trajectoryWeights;
  boost::container::flat_map<LaunchFormation, float> formationWeights;
};

/**
 * @brief Builds show sequences with an opening, a finale and varied middles
 *
 * Consecutive stages avoid repeating the previous shape and trajectory when
 * the pools allow it. Opening and finale launch twice as many rockets.
 */
class RandomShowGenerator {
public:
  static constexpr int MAX_FEATURE_COUNT = 20;
  static constexpr int REPEAT_RETRIES = 3;
  static constexpr int MIN_INTERVAL = 50;  // ms
  static constexpr int MAX_INTERVAL = 200; // ms
  // Assumed burn time after a stage's last launch, seconds
  static constexpr float STAGE_TAIL = 3.0f;

  explicit RandomShowGenerator(RandomShowConfig config = {});

  /**
   * @brief Restrict the pools, minus the configured exclusions
   *
   * Empty pools fall back to SPHERE, LINEAR and SINGLE.
   */
  void setEnabledPools(const std::vector<ShapeKind> &shapes,
                       const std::vector<TrajectoryKind> &trajectories,
                       const std::vector<ComboKind> &combos);

  ShowSequence generateSequence(std::mt19937 &rng);

  /**
   * @brief Seconds from start until the last stage has burnt out
   */
  static float estimateDuration(const ShowSequence &sequence);

  const RandomShowConfig &getConfig() const { return m_config; }
  const std::vector<ShapeKind> &getShapePool() const { return m_shapes; }
  const std::vector<TrajectoryKind> &getTrajectoryPool() const {
    return m_trajectories;
  }
  const std::vector<ComboKind> &getComboPool() const { return m_combos; }

private:
  ShowStage generateStage(int index, int total, std::mt19937 &rng);
  ShapeKind pickShape(std::mt19937 &rng) const;
  TrajectoryKind pickTrajectory(std::mt19937 &rng) const;
  LaunchFormation pickFormation(std::mt19937 &rng) const;

  RandomShowConfig m_config;
  std::vector<ShapeKind> m_shapes;
  std::vector<TrajectoryKind> m_trajectories;
  std::vector<ComboKind> m_combos;
  std::optional<ShapeKind> m_lastShape;
  std::optional<TrajectoryKind> m_lastTrajectory;
};

} // namespace PyroForge

#endif // RANDOM_SHOW_GENERATOR_HPP
