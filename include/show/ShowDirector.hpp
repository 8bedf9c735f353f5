/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHOW_DIRECTOR_HPP
#define SHOW_DIRECTOR_HPP

/**
 * @file ShowDirector.hpp
 * @brief Plays a scripted sequence of launch groups on simulated time
 *
 * Stage k starts at the sum of the delays of stages 0..k. Its i-th rocket
 * launches at stageStart + i * interval. Nothing runs on its own: update()
 * must be polled with the current virtual time.
 */

#include "combo/ComboLibrary.hpp"
#include "shapes/ShapeTypes.hpp"
#include "show/LaunchFormation.hpp"
#include "trajectory/TrajectoryCalculator.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace PyroForge {

struct ShowStage {
  std::string name;
  float delay{0.0f};    // Milliseconds after the previous stage started
  LaunchFormation formation{LaunchFormation::RANDOM};
  int count{1};
  float interval{0.0f}; // Milliseconds between launches in the group
  std::optional<ShapeKind> shape;
  std::optional<TrajectoryKind> trajectory;
  std::optional<ComboKind> combo;
};

using ShowSequence = std::vector<ShowStage>;

// Receives one scheduled rocket: its stage and its formation offset
using ShowLaunchFn =
    std::function<void(const ShowStage &stage, const FormationOffset &offset)>;

class ShowDirector {
public:
  explicit ShowDirector(uint32_t seed = 0);

  /**
   * @brief Schedule every launch of the sequence relative to now (seconds)
   *
   * Replaces any show in progress. An empty sequence logs a warning and
   * leaves the director idle.
   */
  void start(const ShowSequence &sequence, float now);

  /**
   * @brief Fire every launch scheduled at or before now, in order
   * @return number of launches fired
   */
  size_t update(float now, const ShowLaunchFn &launchFn);

  bool isActive() const { return m_active; }
  void stop();

  size_t getPendingLaunchCount() const { return m_schedule.size() - m_next; }
  size_t getTotalLaunchCount() const { return m_schedule.size(); }
  // Virtual time of the last scheduled launch, seconds
  float getEndTime() const;
  const ShowSequence &getSequence() const { return m_sequence; }

private:
  struct ScheduledLaunch {
    float time{0.0f};
    size_t stageIndex{0};
    FormationOffset offset;
  };

  ShowSequence m_sequence;
  std::vector<ScheduledLaunch> m_schedule;
  size_t m_next{0};
  size_t m_announcedStages{0};
  std::mt19937 m_rng;
  bool m_active{false};
};

} // namespace PyroForge

#endif // SHOW_DIRECTOR_HPP
