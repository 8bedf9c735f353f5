/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FireworkEntityTests
#include <boost/test/unit_test.hpp>

#include "entities/FireworkEntity.hpp"
#include "mocks/MockSpawner.hpp"
#include <cmath>

using namespace PyroForge;

namespace {

constexpr float FRAME = 1.0f / 60.0f;

struct FireworkFixture {
  FireworkFixture() { settings.ascentTrail = false; }

  LaunchRequest request(const Vector3D &target) const {
    LaunchRequest r;
    r.start = Vector3D(0.0f, 0.0f, 0.0f);
    r.target = target;
    r.hue = 120.0f;
    r.charge = 0.5f;
    r.trajectory = TrajectoryKind::LINEAR;
    r.combo = ComboKind::SINGLE;
    r.shape = ShapeKind::SPHERE;
    return r;
  }

  SimulationSettings settings;
  std::mt19937 rng{21};
  MockSpawner spawner;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(FireworkBallisticSuite, FireworkFixture)

BOOST_AUTO_TEST_CASE(TestLaunchVelocityReachesTargetHeight) {
  FireworkEntity firework(1, request(Vector3D(0.0f, 100.0f, 0.0f)), settings, rng);
  const float g = settings.gravity * FireworkEntity::ASCENT_GRAVITY_SCALE;
  const float vy = firework.getVelocity().getY();
  BOOST_CHECK_CLOSE(vy * vy, 2.0f * g * 100.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestApexMatchesTarget) {
  const Vector3D target(60.0f, 100.0f, -30.0f);
  FireworkEntity firework(1, request(target), settings, rng);

  const float apexTime = firework.getPredictedApexTime();
  BOOST_REQUIRE_GT(apexTime, 0.0f);
  const int steps = 100;
  const float dt = apexTime / static_cast<float>(steps);
  for (int i = 0; i < steps; ++i) {
    firework.update(dt, settings, spawner);
  }

  BOOST_CHECK(!firework.isExploded());
  BOOST_CHECK_CLOSE(firework.getPosition().getY(), 100.0f, 0.1f);
  BOOST_CHECK_CLOSE(firework.getPosition().getX(), 60.0f, 0.1f);
  BOOST_CHECK_CLOSE(firework.getPosition().getZ(), -30.0f, 0.1f);
  BOOST_CHECK_SMALL(firework.getVelocity().getY(), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestTimeToApexFormula) {
  BOOST_CHECK_CLOSE(FireworkEntity::solveTimeToApex(100.0f, 0.18f),
                    std::sqrt(200.0f / 0.18f), 0.001f);
  // Short ascents use the minimum distance
  BOOST_CHECK_CLOSE(FireworkEntity::solveTimeToApex(1.0f, 0.18f),
                    FireworkEntity::solveTimeToApex(
                        FireworkEntity::MIN_ASCENT_DISTANCE, 0.18f),
                    0.001f);
  BOOST_CHECK_EQUAL(FireworkEntity::solveTimeToApex(100.0f, 0.0f), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestTargetBelowStartStillRises) {
  FireworkEntity firework(1, request(Vector3D(0.0f, -50.0f, 0.0f)), settings, rng);
  BOOST_CHECK_GT(firework.getVelocity().getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveDeltaIsIgnored) {
  FireworkEntity firework(1, request(Vector3D(0.0f, 100.0f, 0.0f)), settings, rng);
  const Vector3D before = firework.getPosition();
  firework.update(0.0f, settings, spawner);
  firework.update(-1.0f, settings, spawner);
  BOOST_CHECK(firework.getPosition() == before);
  BOOST_CHECK_EQUAL(firework.getLifeTime(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(FireworkExplosionSuite, FireworkFixture)

BOOST_AUTO_TEST_CASE(TestExplodesPastApexAndSpawnsBurst) {
  FireworkEntity firework(7, request(Vector3D(0.0f, 200.0f, 0.0f)), settings, rng);
  int frames = 0;
  while (!firework.isExploded() && frames < 60 * 20) {
    firework.update(FRAME, settings, spawner);
    ++frames;
  }
  BOOST_REQUIRE(firework.isExploded());
  BOOST_CHECK_LE(firework.getVelocity().getY(),
                 FireworkEntity::EXPLOSION_VELOCITY_THRESHOLD);
  BOOST_CHECK_GT(static_cast<float>(frames) * FRAME, firework.getPredictedApexTime());

  // Single preset: one stage of (200 + 0.5 * 400) particles on the same update
  BOOST_CHECK_EQUAL(spawner.spawned.size(), 400u);
  BOOST_CHECK(firework.isFinished());
  BOOST_CHECK_CLOSE(firework.getExplosionPosition().getY(),
                    firework.getPosition().getY(), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestManualTriggerExplodesOnNextUpdate) {
  FireworkEntity firework(7, request(Vector3D(0.0f, 200.0f, 0.0f)), settings, rng);
  firework.update(FRAME, settings, spawner);
  firework.triggerExplosion();
  BOOST_CHECK(firework.isExploded());
  BOOST_CHECK(spawner.spawned.empty());
  firework.update(FRAME, settings, spawner);
  BOOST_CHECK_EQUAL(spawner.spawned.size(), 400u);

  // Triggering twice changes nothing
  firework.triggerExplosion();
  firework.update(FRAME, settings, spawner);
  BOOST_CHECK_EQUAL(spawner.spawned.size(), 400u);
}

BOOST_AUTO_TEST_CASE(TestZeroGravityExplodesImmediately) {
  settings.gravity = 0.0f;
  FireworkEntity firework(3, request(Vector3D(0.0f, 200.0f, 0.0f)), settings, rng);
  BOOST_CHECK(firework.isExploded());
  firework.update(FRAME, settings, spawner);
  BOOST_CHECK(!spawner.spawned.empty());
}

BOOST_AUTO_TEST_CASE(TestCustomComboReplacesPreset) {
  LaunchRequest r = request(Vector3D(0.0f, 150.0f, 0.0f));
  ComboConfig custom;
  custom.name = "double_tap";
  for (float delay : {0.0f, 0.5f}) {
    ComboStageConfig stage;
    stage.delay = delay;
    stage.particleCount = 0.1f;
    custom.stages.push_back(stage);
  }
  r.customCombo = custom;

  FireworkEntity firework(9, r, settings, rng);
  BOOST_CHECK_EQUAL(firework.getOrchestrator().getStageCount(), 2u);
  BOOST_CHECK_EQUAL(firework.getOrchestrator().getConfig().name, "double_tap");

  firework.triggerExplosion();
  for (int i = 0; i < 60 && !firework.isFinished(); ++i) {
    firework.update(FRAME, settings, spawner);
  }
  BOOST_CHECK(firework.isFinished());
  BOOST_CHECK_EQUAL(spawner.spawned.size(), 80u);
}

BOOST_AUTO_TEST_CASE(TestAscentTrailSpawnsExhaust) {
  settings.ascentTrail = true;
  FireworkEntity firework(2, request(Vector3D(0.0f, 300.0f, 0.0f)), settings, rng);
  for (int i = 0; i < 30; ++i) {
    firework.update(FRAME, settings, spawner);
  }
  BOOST_REQUIRE(!firework.isExploded());
  BOOST_CHECK(!spawner.spawned.empty());
  for (const auto &options : spawner.spawned) {
    BOOST_REQUIRE(options.decay.has_value());
    BOOST_CHECK_CLOSE(*options.decay, FireworkEntity::EXHAUST_DECAY, 0.001f);
  }
}

BOOST_AUTO_TEST_CASE(TestExhaustDensityIgnoresStepSize) {
  settings.ascentTrail = true;
  // Fast sideways flight keeps the spawn chance at 1
  const LaunchRequest r = request(Vector3D(1000.0f, 300.0f, 0.0f));

  MockSpawner coarseSpawner;
  FireworkEntity coarse(5, r, settings, rng);
  for (int i = 0; i < 30; ++i) {
    coarse.update(FRAME, settings, coarseSpawner);
  }

  MockSpawner fineSpawner;
  FireworkEntity fine(6, r, settings, rng);
  for (int i = 0; i < 120; ++i) {
    fine.update(FRAME / 4.0f, settings, fineSpawner);
  }

  BOOST_REQUIRE(!coarse.isExploded());
  BOOST_REQUIRE(!fine.isExploded());
  BOOST_CHECK_EQUAL(coarseSpawner.spawned.size(), 30u);
  BOOST_CHECK_EQUAL(fineSpawner.spawned.size(), 30u);
}

BOOST_AUTO_TEST_CASE(TestChargeIsClamped) {
  LaunchRequest r = request(Vector3D(0.0f, 150.0f, 0.0f));
  r.charge = 4.0f;
  FireworkEntity firework(4, r, settings, rng);
  BOOST_CHECK_EQUAL(firework.getCharge(), 1.0f);
}

BOOST_AUTO_TEST_SUITE_END()
