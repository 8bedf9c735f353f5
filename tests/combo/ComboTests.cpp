/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ComboTests
#include <boost/test/unit_test.hpp>

#include "combo/ComboLibrary.hpp"
#include "combo/ComboOrchestrator.hpp"
#include "mocks/MockSpawner.hpp"
#include <algorithm>
#include <set>
#include <string>

using namespace PyroForge;

namespace {

ComboConfig threeStageCombo() {
  ComboConfig config;
  config.name = "test_triple";
  for (float delay : {0.0f, 0.8f, 2.0f}) {
    ComboStageConfig stage;
    stage.delay = delay;
    stage.particleCount = 0.1f;
    config.stages.push_back(stage);
  }
  return config;
}

struct ComboFixture {
  std::mt19937 rng{17};
  MockSpawner spawner;
  ExplosionContext context{40.0f, 0.5f, 1.0f, 1.0f, rng};
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ComboOrchestratorSuite, ComboFixture)

BOOST_AUTO_TEST_CASE(TestStagesFireInOrderAtTheirDelays) {
  ComboOrchestrator orchestrator(threeStageCombo());
  BOOST_CHECK(orchestrator.getState() == ComboState::Ascending);

  // Exploding 1 s into the firework's life
  orchestrator.beginExplosion(1.0f, Vector3D(0.0f, 300.0f, 0.0f));
  BOOST_REQUIRE(orchestrator.getState() == ComboState::Exploding);

  BOOST_CHECK_GT(orchestrator.update(1.0f, context, spawner), 0u);
  BOOST_CHECK_EQUAL(orchestrator.getFiredStageCount(), 1u);

  BOOST_CHECK_EQUAL(orchestrator.update(1.5f, context, spawner), 0u);
  BOOST_CHECK_EQUAL(orchestrator.update(1.79f, context, spawner), 0u);
  BOOST_CHECK_EQUAL(orchestrator.getFiredStageCount(), 1u);

  BOOST_CHECK_GT(orchestrator.update(1.81f, context, spawner), 0u);
  BOOST_CHECK_EQUAL(orchestrator.getFiredStageCount(), 2u);

  BOOST_CHECK_EQUAL(orchestrator.update(2.5f, context, spawner), 0u);
  BOOST_CHECK(!orchestrator.isDone());

  BOOST_CHECK_GT(orchestrator.update(3.0f, context, spawner), 0u);
  BOOST_CHECK_EQUAL(orchestrator.getFiredStageCount(), 3u);
  BOOST_CHECK(orchestrator.isDone());

  const size_t total = spawner.spawned.size();
  BOOST_CHECK_EQUAL(orchestrator.update(10.0f, context, spawner), 0u);
  BOOST_CHECK_EQUAL(spawner.spawned.size(), total);
}

BOOST_AUTO_TEST_CASE(TestAtMostOneStagePerUpdate) {
  ComboOrchestrator orchestrator(threeStageCombo());
  orchestrator.beginExplosion(0.0f, Vector3D());
  // Late update: every stage is due, still one at a time
  orchestrator.update(5.0f, context, spawner);
  BOOST_CHECK_EQUAL(orchestrator.getFiredStageCount(), 1u);
  orchestrator.update(5.0f, context, spawner);
  BOOST_CHECK_EQUAL(orchestrator.getFiredStageCount(), 2u);
  orchestrator.update(5.0f, context, spawner);
  BOOST_CHECK(orchestrator.isDone());
}

BOOST_AUTO_TEST_CASE(TestUpdateBeforeExplosionDoesNothing) {
  ComboOrchestrator orchestrator(threeStageCombo());
  BOOST_CHECK_EQUAL(orchestrator.update(10.0f, context, spawner), 0u);
  BOOST_CHECK(spawner.spawned.empty());
}

BOOST_AUTO_TEST_CASE(TestSecondExplosionIsIgnored) {
  ComboOrchestrator orchestrator(threeStageCombo());
  orchestrator.beginExplosion(1.0f, Vector3D(1.0f, 2.0f, 3.0f));
  orchestrator.beginExplosion(4.0f, Vector3D(9.0f, 9.0f, 9.0f));
  BOOST_CHECK_CLOSE(orchestrator.getExplosionPosition().getX(), 1.0f, 0.001f);
  orchestrator.update(1.0f, context, spawner);
  BOOST_CHECK_EQUAL(orchestrator.getFiredStageCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestEmptyComboGoesStraightToDone) {
  ComboOrchestrator orchestrator(ComboConfig{});
  orchestrator.beginExplosion(0.0f, Vector3D());
  BOOST_CHECK(orchestrator.isDone());
  BOOST_CHECK_EQUAL(orchestrator.update(1.0f, context, spawner), 0u);
}

BOOST_AUTO_TEST_CASE(TestStageCountFormula) {
  ComboStageConfig stage;
  BOOST_CHECK_EQUAL(ComboOrchestrator::computeStageCount(stage, 0.5f, 1.0f), 400);
  BOOST_CHECK_EQUAL(ComboOrchestrator::computeStageCount(stage, 0.0f, 1.0f), 200);
  BOOST_CHECK_EQUAL(ComboOrchestrator::computeStageCount(stage, 1.0f, 2.0f), 1200);
  stage.particleCount = 0.3f;
  BOOST_CHECK_EQUAL(ComboOrchestrator::computeStageCount(stage, 0.5f, 1.0f), 120);
  stage.particleCount = 0.0f;
  BOOST_CHECK_EQUAL(ComboOrchestrator::computeStageCount(stage, 0.5f, 1.0f), 0);
  stage.particleCount = -1.0f;
  BOOST_CHECK_EQUAL(ComboOrchestrator::computeStageCount(stage, 0.5f, 1.0f), 0);
}

BOOST_AUTO_TEST_CASE(TestStageSpawnsComputedCount) {
  ComboConfig config;
  config.stages.push_back(ComboStageConfig{});
  ComboOrchestrator orchestrator(config);
  orchestrator.beginExplosion(0.0f, Vector3D());
  BOOST_CHECK_EQUAL(orchestrator.update(0.0f, context, spawner), 400u);
  BOOST_CHECK_EQUAL(spawner.spawned.size(), 400u);
}

BOOST_AUTO_TEST_CASE(TestStageOverridesReachParticles) {
  ComboConfig config;
  ComboStageConfig stage;
  stage.particleCount = 0.05f;
  stage.hueShift = 350.0f;
  stage.behavior = ParticleBehavior::Willow;
  stage.gravity = 0.3f;
  stage.spawnOffset = Vector3D(0.0f, -50.0f, 0.0f);
  config.stages.push_back(stage);

  ComboOrchestrator orchestrator(config);
  orchestrator.beginExplosion(0.0f, Vector3D(10.0f, 300.0f, 0.0f));
  orchestrator.update(0.0f, context, spawner);

  BOOST_REQUIRE(!spawner.spawned.empty());
  for (const auto &options : spawner.spawned) {
    BOOST_CHECK(options.behavior == ParticleBehavior::Willow);
    BOOST_REQUIRE(options.gravity.has_value());
    BOOST_CHECK_CLOSE(*options.gravity, 0.3f, 0.001f);
    BOOST_CHECK_CLOSE(options.position.getY(), 250.0f, 0.001f);
    BOOST_CHECK_CLOSE(options.position.getX(), 10.0f, 0.001f);
    BOOST_CHECK_GE(options.hue, 0.0f);
    BOOST_CHECK_LT(options.hue, 360.0f);
  }
}

BOOST_AUTO_TEST_CASE(TestBurstSparksUseSettingsPhysics) {
  context.gravity = 0.2f;
  context.friction = 0.9f;
  ComboConfig config;
  ComboStageConfig stage;
  stage.shape = ShapeKind::SPHERE;
  stage.particleCount = 0.05f;
  config.stages.push_back(stage);

  ComboOrchestrator orchestrator(config);
  orchestrator.beginExplosion(0.0f, Vector3D());
  orchestrator.update(0.0f, context, spawner);

  BOOST_REQUIRE(!spawner.spawned.empty());
  for (const auto &options : spawner.spawned) {
    BOOST_CHECK(options.behavior == ParticleBehavior::Default);
    BOOST_REQUIRE(options.friction.has_value());
    BOOST_CHECK_CLOSE(*options.friction, 0.9f, 0.001f);
    BOOST_REQUIRE(options.gravity.has_value());
    BOOST_CHECK_CLOSE(*options.gravity, 0.2f, 0.001f);
  }
}

BOOST_AUTO_TEST_CASE(TestFigureShapesHoldFormation) {
  context.friction = 0.5f;
  ComboConfig config;
  ComboStageConfig stage;
  stage.shape = ShapeKind::CUBE;
  stage.particleCount = 0.05f;
  config.stages.push_back(stage);

  ComboOrchestrator orchestrator(config);
  orchestrator.beginExplosion(0.0f, Vector3D());
  orchestrator.update(0.0f, context, spawner);

  BOOST_REQUIRE(!spawner.spawned.empty());
  for (const auto &options : spawner.spawned) {
    BOOST_CHECK(options.behavior == ParticleBehavior::Stationary);
    BOOST_CHECK(!options.friction.has_value());
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ComboLibrarySuite)

BOOST_AUTO_TEST_CASE(TestEveryPresetHasOrderedStages) {
  std::mt19937 rng(3);
  for (ComboKind kind : ComboLibrary::allKinds()) {
    ComboConfig config = ComboLibrary::generate(kind, ShapeKind::CUBE, rng);
    BOOST_CHECK(config.kind == kind);
    BOOST_REQUIRE_MESSAGE(!config.stages.empty(), ComboLibrary::toString(kind));
    BOOST_CHECK_EQUAL(config.stages.front().delay, 0.0f);
    for (size_t i = 1; i < config.stages.size(); ++i) {
      BOOST_CHECK_GE(config.stages[i].delay, config.stages[i - 1].delay);
    }
  }
}

BOOST_AUTO_TEST_CASE(TestSingleFollowsBaseShape) {
  std::mt19937 rng(3);
  ComboConfig config = ComboLibrary::generate(ComboKind::SINGLE, ShapeKind::LOTUS, rng);
  BOOST_REQUIRE_EQUAL(config.stages.size(), 1u);
  BOOST_CHECK(config.stages[0].shape == ShapeKind::LOTUS);
}

BOOST_AUTO_TEST_CASE(TestPresetInfo) {
  ComboInfo info = ComboLibrary::getInfo(ComboKind::PHOENIX_RISE);
  BOOST_CHECK_EQUAL(std::string(info.id), "phoenix_rise");
  BOOST_CHECK_EQUAL(info.stageCount, 3u);
  BOOST_CHECK_CLOSE(info.duration, 3.0f, 0.001f);

  ComboInfo staged = ComboLibrary::getInfo(ComboKind::STAGED);
  BOOST_CHECK_EQUAL(staged.stageCount, 2u);
  BOOST_CHECK_CLOSE(staged.duration, 0.8f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNamesRoundTrip) {
  std::set<std::string> ids;
  for (ComboKind kind : ComboLibrary::allKinds()) {
    const std::string id = ComboLibrary::toString(kind);
    BOOST_CHECK(ids.insert(id).second);
    auto parsed = ComboLibrary::fromString(id);
    BOOST_REQUIRE(parsed.has_value());
    BOOST_CHECK(*parsed == kind);
  }
  BOOST_CHECK_EQUAL(ids.size(), COMBO_KIND_COUNT);
  BOOST_CHECK(!ComboLibrary::fromString("mega_combo").has_value());
}

BOOST_AUTO_TEST_CASE(TestPickFrom) {
  std::mt19937 rng(3);
  BOOST_CHECK(ComboLibrary::pickFrom({}, rng) == ComboKind::SINGLE);
  const auto &simple = ComboLibrary::simpleKinds();
  BOOST_REQUIRE(!simple.empty());
  for (int i = 0; i < 100; ++i) {
    ComboKind kind = ComboLibrary::pickFrom(simple, rng);
    BOOST_REQUIRE(std::find(simple.begin(), simple.end(), kind) != simple.end());
  }
}

BOOST_AUTO_TEST_SUITE_END()
