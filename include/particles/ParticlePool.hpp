/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_POOL_HPP
#define PARTICLE_POOL_HPP

/**
 * @file ParticlePool.hpp
 * @brief Capacity-bounded particle pool with FIFO recycling
 *
 * Every particle the pool ever allocated is either active or free:
 * activeCount() + freeCount() == totalAllocated(). When the active list is
 * full, acquiring evicts the oldest active particle and reinitializes it.
 */

#include "particles/ParticleSpawner.hpp"
#include <cstdint>
#include <deque>
#include <random>
#include <vector>

namespace PyroForge {

class PhysicsEngine;

/**
 * @brief Counters for monitoring pool churn
 */
struct ParticlePoolStats {
  uint64_t acquired{0};
  uint64_t evicted{0};
  uint64_t recycled{0};
  size_t peakActive{0};

  void reset() {
    acquired = 0;
    evicted = 0;
    recycled = 0;
    peakActive = 0;
  }
};

class ParticlePool : public ParticleSpawner {
public:
  static constexpr size_t PREWARM_COUNT = 2000;

  /**
   * @param maxActive upper bound on simultaneously active particles
   * @param physics engine used to integrate particle motion
   * @param seed seed for the particle initialization RNG
   */
  ParticlePool(size_t maxActive, const PhysicsEngine &physics,
               uint32_t seed = std::random_device{}());

  ParticlePool(const ParticlePool &) = delete;
  ParticlePool &operator=(const ParticlePool &) = delete;

  /**
   * @brief Hand out a freshly initialized particle
   *
   * Recycles the oldest active particle when the pool is at capacity.
   */
  Particle &acquire(const ParticleSpawnOptions &options);

  Particle &spawn(const ParticleSpawnOptions &options) override {
    return acquire(options);
  }

  /**
   * @brief Advance every active particle and recycle the dead ones
   */
  void update(float dt);

  /**
   * @brief Recycle all active particles
   */
  void clear();

  // Active particles, oldest first
  const std::deque<Particle *> &getActive() const { return m_active; }

  size_t activeCount() const { return m_active.size(); }
  size_t freeCount() const { return m_free.size(); }
  size_t totalAllocated() const { return m_storage.size(); }
  size_t maxActive() const { return m_maxActive; }

  const ParticlePoolStats &getStats() const { return m_stats; }

private:
  Particle &allocate();

  const PhysicsEngine &m_physics;
  size_t m_maxActive;
  std::deque<Particle> m_storage; // Stable addresses on push_back
  std::deque<Particle *> m_active;
  std::vector<Particle *> m_free;
  std::mt19937 m_rng;
  ParticlePoolStats m_stats;
};

} // namespace PyroForge

#endif // PARTICLE_POOL_HPP
