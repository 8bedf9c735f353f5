/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_SPAWNER_HPP
#define PARTICLE_SPAWNER_HPP

#include "particles/Particle.hpp"

namespace PyroForge {

/**
 * @brief Source of initialized particles
 *
 * Fireworks and combo stages spawn through this interface so they never
 * touch the pool directly. The returned reference stays valid until the
 * particle is recycled.
 */
class ParticleSpawner {
public:
  virtual ~ParticleSpawner() = default;
  virtual Particle &spawn(const ParticleSpawnOptions &options) = 0;
};

} // namespace PyroForge

#endif // PARTICLE_SPAWNER_HPP
