/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "show/ShowDirector.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace PyroForge {

ShowDirector::ShowDirector(uint32_t seed) : m_rng(seed) {}

void ShowDirector::start(const ShowSequence &sequence, float now) {
  stop();
  if (sequence.empty()) {
    SHOW_WARN("Cannot start an empty show");
    return;
  }
  m_sequence = sequence;

  float stageStart = now;
  for (size_t s = 0; s < m_sequence.size(); ++s) {
    const ShowStage &stage = m_sequence[s];
    stageStart += std::max(0.0f, stage.delay) / 1000.0f;
    if (stage.count <= 0) {
      SHOW_WARN(std::format("Stage '{}' has no launches", stage.name));
      continue;
    }

    const float interval = std::max(0.0f, stage.interval) / 1000.0f;
    const auto offsets =
        computeFormationOffsets(stage.formation, stage.count, m_rng);
    for (size_t i = 0; i < offsets.size(); ++i) {
      m_schedule.push_back(
          {stageStart + static_cast<float>(i) * interval, s, offsets[i]});
    }
  }

  // Groups with long intervals may overlap the next stage
  std::stable_sort(m_schedule.begin(), m_schedule.end(),
                   [](const ScheduledLaunch &a, const ScheduledLaunch &b) {
                     return a.time < b.time;
                   });

  m_active = !m_schedule.empty();
  SHOW_INFO(std::format("Show started: {} stages, {} launches",
                        m_sequence.size(), m_schedule.size()));
}

size_t ShowDirector::update(float now, const ShowLaunchFn &launchFn) {
  if (!m_active) {
    return 0;
  }
  if (!launchFn) {
    SHOW_ERROR("Show update without a launch callback");
    return 0;
  }

  size_t fired = 0;
  while (m_next < m_schedule.size() && m_schedule[m_next].time <= now) {
    const ScheduledLaunch &launch = m_schedule[m_next];
    const ShowStage &stage = m_sequence[launch.stageIndex];
    if (launch.stageIndex >= m_announcedStages) {
      m_announcedStages = launch.stageIndex + 1;
      SHOW_INFO(std::format("Stage '{}': {} x{}", stage.name,
                            launchFormationToString(stage.formation),
                            stage.count));
    }
    launchFn(stage, launch.offset);
    ++m_next;
    ++fired;
  }

  if (m_next >= m_schedule.size()) {
    m_active = false;
    SHOW_INFO("Show finished");
  }
  return fired;
}

void ShowDirector::stop() {
  m_sequence.clear();
  m_schedule.clear();
  m_next = 0;
  m_announcedStages = 0;
  m_active = false;
}

float ShowDirector::getEndTime() const {
  return m_schedule.empty() ? 0.0f : m_schedule.back().time;
}

} // namespace PyroForge
