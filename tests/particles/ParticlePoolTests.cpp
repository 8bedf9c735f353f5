/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ParticlePoolTests
#include <boost/test/unit_test.hpp>

#include "particles/ParticlePool.hpp"
#include "physics/PhysicsEngine.hpp"
#include <set>

using namespace PyroForge;

namespace {

constexpr float FRAME = 1.0f / 60.0f;

ParticleSpawnOptions sparkAt(float x, float decay = 0.01f) {
  ParticleSpawnOptions options;
  options.position = Vector3D(x, 0.0f, 0.0f);
  options.velocity = Vector3D(0.0f, 1.0f, 0.0f);
  options.decay = decay;
  return options;
}

struct PoolFixture {
  PhysicsEngine physics;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ParticlePoolSuite, PoolFixture)

BOOST_AUTO_TEST_CASE(TestPrewarmIsBoundedByCapacity) {
  ParticlePool small(100, physics, 1);
  BOOST_CHECK_EQUAL(small.freeCount(), 100u);
  BOOST_CHECK_EQUAL(small.activeCount(), 0u);

  ParticlePool large(50000, physics, 1);
  BOOST_CHECK_EQUAL(large.freeCount(), ParticlePool::PREWARM_COUNT);
  BOOST_CHECK_EQUAL(large.totalAllocated(), ParticlePool::PREWARM_COUNT);
}

BOOST_AUTO_TEST_CASE(TestZeroCapacityFallsBackToOne) {
  ParticlePool pool(0, physics, 1);
  BOOST_CHECK_EQUAL(pool.maxActive(), 1u);
  pool.acquire(sparkAt(0.0f));
  pool.acquire(sparkAt(1.0f));
  BOOST_CHECK_EQUAL(pool.activeCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestActiveNeverExceedsCapacity) {
  ParticlePool pool(64, physics, 7);
  for (int i = 0; i < 1000; ++i) {
    pool.acquire(sparkAt(static_cast<float>(i)));
    BOOST_REQUIRE_LE(pool.activeCount(), 64u);
  }
  BOOST_CHECK_EQUAL(pool.activeCount(), 64u);
  BOOST_CHECK_EQUAL(pool.getStats().acquired, 1000u);
  BOOST_CHECK_EQUAL(pool.getStats().evicted, 1000u - 64u);
  BOOST_CHECK_EQUAL(pool.getStats().peakActive, 64u);
}

BOOST_AUTO_TEST_CASE(TestEvictionRecyclesOldestFirst) {
  ParticlePool pool(3, physics, 7);
  Particle &first = pool.acquire(sparkAt(1.0f));
  pool.acquire(sparkAt(2.0f));
  pool.acquire(sparkAt(3.0f));

  Particle &fourth = pool.acquire(sparkAt(4.0f));
  BOOST_CHECK_EQUAL(&fourth, &first);

  const auto &active = pool.getActive();
  BOOST_REQUIRE_EQUAL(active.size(), 3u);
  BOOST_CHECK_CLOSE(active[0]->getPosition().getX(), 2.0f, 0.001f);
  BOOST_CHECK_CLOSE(active[1]->getPosition().getX(), 3.0f, 0.001f);
  BOOST_CHECK_CLOSE(active[2]->getPosition().getX(), 4.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNoParticleIsLost) {
  ParticlePool pool(500, physics, 3);
  for (int round = 0; round < 5; ++round) {
    for (int i = 0; i < 300; ++i) {
      pool.acquire(sparkAt(0.0f, 0.05f + 0.001f * static_cast<float>(i)));
    }
    for (int f = 0; f < 10; ++f) {
      pool.update(FRAME);
      BOOST_REQUIRE_EQUAL(pool.activeCount() + pool.freeCount(),
                          pool.totalAllocated());
    }
  }

  std::set<const Particle *> seen(pool.getActive().begin(),
                                  pool.getActive().end());
  BOOST_CHECK_EQUAL(seen.size(), pool.activeCount());
}

BOOST_AUTO_TEST_CASE(TestDeadParticlesReturnToFreeList) {
  ParticlePool pool(10, physics, 3);
  pool.acquire(sparkAt(0.0f, 0.5f));  // Dead after 2 frames
  pool.acquire(sparkAt(1.0f, 0.001f));

  pool.update(FRAME);
  BOOST_CHECK_EQUAL(pool.activeCount(), 2u);
  pool.update(FRAME);
  pool.update(FRAME);
  BOOST_REQUIRE_EQUAL(pool.activeCount(), 1u);
  BOOST_CHECK_CLOSE(pool.getActive().front()->getPosition().getX(), 1.0f,
                    0.001f);
  BOOST_CHECK_EQUAL(pool.getStats().recycled, 1u);
}

BOOST_AUTO_TEST_CASE(TestUpdateIgnoresNonPositiveDelta) {
  ParticlePool pool(10, physics, 3);
  Particle &p = pool.acquire(sparkAt(0.0f));
  pool.update(0.0f);
  pool.update(-1.0f);
  BOOST_CHECK_EQUAL(p.life, 1.0f);
  BOOST_CHECK_EQUAL(p.getAge(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestClearRecyclesEverything) {
  ParticlePool pool(20, physics, 3);
  for (int i = 0; i < 15; ++i) {
    pool.acquire(sparkAt(0.0f));
  }
  pool.clear();
  BOOST_CHECK_EQUAL(pool.activeCount(), 0u);
  BOOST_CHECK_EQUAL(pool.freeCount(), pool.totalAllocated());
}

BOOST_AUTO_TEST_CASE(TestRecycledParticleIsFullyReinitialized) {
  ParticlePool pool(1, physics, 3);
  ParticleSpawnOptions comet = sparkAt(0.0f);
  comet.behavior = ParticleBehavior::Comet;
  Particle &p = pool.acquire(comet);
  for (int i = 0; i < 30; ++i) {
    pool.update(FRAME);
  }
  BOOST_REQUIRE(!p.getTrail().empty());
  BOOST_REQUIRE_LT(p.life, 1.0f);

  ParticleSpawnOptions plain = sparkAt(50.0f);
  plain.hue = 200.0f;
  Particle &q = pool.acquire(plain);
  BOOST_CHECK_EQUAL(&p, &q);
  BOOST_CHECK_EQUAL(q.life, 1.0f);
  BOOST_CHECK_EQUAL(q.getAge(), 0.0f);
  BOOST_CHECK(q.getTrail().empty());
  BOOST_CHECK(q.behavior == ParticleBehavior::Default);
  BOOST_CHECK_CLOSE(q.hue, 200.0f, 0.001f);
  BOOST_CHECK_CLOSE(q.getPosition().getX(), 50.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ParticleSuite, PoolFixture)

BOOST_AUTO_TEST_CASE(TestLifeDecreasesMonotonically) {
  std::mt19937 rng(11);
  for (uint8_t b = 0; b < static_cast<uint8_t>(ParticleBehavior::COUNT); ++b) {
    Particle p;
    ParticleSpawnOptions options;
    options.behavior = static_cast<ParticleBehavior>(b);
    p.init(options, rng);

    float previous = p.life;
    for (int i = 0; i < 200; ++i) {
      p.update(FRAME, physics);
      BOOST_REQUIRE_LT(p.life, previous);
      previous = p.life;
    }
  }
}

BOOST_AUTO_TEST_CASE(TestAlphaStaysInRange) {
  std::mt19937 rng(5);
  for (uint8_t b = 0; b < static_cast<uint8_t>(ParticleBehavior::COUNT); ++b) {
    Particle p;
    ParticleSpawnOptions options;
    options.behavior = static_cast<ParticleBehavior>(b);
    p.init(options, rng);
    while (!p.isDead()) {
      p.update(FRAME, physics);
      BOOST_REQUIRE_GE(p.alpha, 0.0f);
      BOOST_REQUIRE_LE(p.alpha, 1.0f);
    }
  }
}

BOOST_AUTO_TEST_CASE(TestZeroDecayIsClamped) {
  std::mt19937 rng(5);
  Particle p;
  ParticleSpawnOptions options;
  options.decay = 0.0f;
  p.init(options, rng);
  BOOST_CHECK_GT(p.decay, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestExplicitVelocityIsUsed) {
  std::mt19937 rng(5);
  Particle p;
  ParticleSpawnOptions options;
  options.velocity = Vector3D(1.0f, 2.0f, 3.0f);
  p.init(options, rng);
  BOOST_CHECK_CLOSE(p.getVelocity().getY(), 2.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSphericalVelocityUsesGivenSpeed) {
  std::mt19937 rng(5);
  Particle p;
  ParticleSpawnOptions options;
  options.speed = 6.0f;
  p.init(options, rng);
  BOOST_CHECK_CLOSE(p.getVelocity().length(), 6.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestCometTrailIsBounded) {
  std::mt19937 rng(5);
  Particle p;
  ParticleSpawnOptions options;
  options.behavior = ParticleBehavior::Comet;
  p.init(options, rng);
  for (int i = 0; i < 100; ++i) {
    p.update(FRAME, physics);
  }
  BOOST_CHECK_EQUAL(p.getTrail().size(), p.getMaxTrailLength());
}

BOOST_AUTO_TEST_CASE(TestTrailSamplesFollowSimulatedTime) {
  std::mt19937 rng(5);
  ParticleSpawnOptions options;
  options.behavior = ParticleBehavior::Comet;
  options.velocity = Vector3D(1.0f, 0.0f, 0.0f);

  Particle coarse;
  coarse.init(options, rng);
  Particle fine;
  fine.init(options, rng);
  for (int i = 0; i < 8; ++i) {
    coarse.update(FRAME, physics);
  }
  for (int i = 0; i < 32; ++i) {
    fine.update(FRAME / 4.0f, physics);
  }
  BOOST_CHECK_EQUAL(coarse.getTrail().size(), 8u);
  BOOST_CHECK_EQUAL(fine.getTrail().size(), 8u);
}

BOOST_AUTO_TEST_CASE(TestBehaviorNames) {
  BOOST_CHECK(particleBehaviorFromString("glitter") == ParticleBehavior::Glitter);
  BOOST_CHECK(particleBehaviorFromString("vortex") == ParticleBehavior::Galaxy);
  BOOST_CHECK(!particleBehaviorFromString("nonsense").has_value());
  for (uint8_t b = 0; b < static_cast<uint8_t>(ParticleBehavior::COUNT); ++b) {
    auto behavior = static_cast<ParticleBehavior>(b);
    BOOST_CHECK(particleBehaviorFromString(particleBehaviorToString(behavior)) ==
                behavior);
  }
}

BOOST_AUTO_TEST_SUITE_END()
