/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticlePool.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsEngine.hpp"
#include <algorithm>
#include <format>

namespace PyroForge {

ParticlePool::ParticlePool(size_t maxActive, const PhysicsEngine &physics,
                           uint32_t seed)
    : m_physics(physics), m_maxActive(maxActive), m_rng(seed) {
  if (m_maxActive == 0) {
    PARTICLE_ERROR("ParticlePool created with zero capacity, using 1");
    m_maxActive = 1;
  }

  const size_t prewarm = std::min(PREWARM_COUNT, m_maxActive);
  m_free.reserve(prewarm);
  for (size_t i = 0; i < prewarm; ++i) {
    m_free.push_back(&allocate());
  }
  PARTICLE_INFO(std::format("ParticlePool ready: capacity {}, prewarmed {}",
                            m_maxActive, prewarm));
}

Particle &ParticlePool::allocate() {
  m_storage.emplace_back();
  return m_storage.back();
}

Particle &ParticlePool::acquire(const ParticleSpawnOptions &options) {
  Particle *particle = nullptr;

  if (m_active.size() >= m_maxActive) {
    particle = m_active.front();
    m_active.pop_front();
    ++m_stats.evicted;
  } else if (!m_free.empty()) {
    particle = m_free.back();
    m_free.pop_back();
  } else {
    particle = &allocate();
  }

  particle->init(options, m_rng);
  m_active.push_back(particle);

  ++m_stats.acquired;
  m_stats.peakActive = std::max(m_stats.peakActive, m_active.size());
  return *particle;
}

void ParticlePool::update(float dt) {
  if (!(dt > 0.0f) || m_active.empty()) {
    return;
  }

  for (auto it = m_active.rbegin(); it != m_active.rend(); ++it) {
    (*it)->update(dt, m_physics);
  }

  // Stable compaction keeps the FIFO order of survivors
  auto firstDead = std::stable_partition(
      m_active.begin(), m_active.end(),
      [](const Particle *p) { return !p->isDead(); });
  for (auto it = firstDead; it != m_active.end(); ++it) {
    m_free.push_back(*it);
    ++m_stats.recycled;
  }
  m_active.erase(firstDead, m_active.end());
}

void ParticlePool::clear() {
  m_stats.recycled += m_active.size();
  while (!m_active.empty()) {
    m_free.push_back(m_active.back());
    m_active.pop_back();
  }
}

} // namespace PyroForge
