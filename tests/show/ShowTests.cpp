/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ShowTests
#include <boost/test/unit_test.hpp>

#include "show/LaunchFormation.hpp"
#include "show/RandomShowGenerator.hpp"
#include "show/ShowDirector.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace PyroForge;

BOOST_AUTO_TEST_SUITE(LaunchFormationSuite)

BOOST_AUTO_TEST_CASE(TestSingleIsOneZeroOffset) {
  std::mt19937 rng(1);
  auto offsets = computeFormationOffsets(LaunchFormation::SINGLE, 5, rng);
  BOOST_REQUIRE_EQUAL(offsets.size(), 1u);
  BOOST_CHECK_EQUAL(offsets[0].target.lengthSquared(), 0.0f);
  BOOST_CHECK_EQUAL(offsets[0].start.lengthSquared(), 0.0f);

  offsets = computeFormationOffsets(LaunchFormation::CIRCLE, 1, rng);
  BOOST_CHECK_EQUAL(offsets.size(), 1u);
  offsets = computeFormationOffsets(LaunchFormation::LINE, 0, rng);
  BOOST_CHECK_EQUAL(offsets.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestEveryFormationYieldsCount) {
  std::mt19937 rng(1);
  for (size_t f = 1; f < LAUNCH_FORMATION_COUNT; ++f) {
    auto formation = static_cast<LaunchFormation>(f);
    BOOST_CHECK_EQUAL(computeFormationOffsets(formation, 7, rng).size(), 7u);
  }
}

BOOST_AUTO_TEST_CASE(TestCircleTargetsLieOnRadius) {
  std::mt19937 rng(1);
  auto offsets = computeFormationOffsets(LaunchFormation::CIRCLE, 8, rng);
  for (const auto &offset : offsets) {
    BOOST_CHECK_CLOSE(offset.target.length(), FORMATION_RADIUS, 0.01f);
    BOOST_CHECK_CLOSE(offset.start.length(), FORMATION_RADIUS * 0.5f, 0.01f);
  }
  // First rocket at angle zero
  BOOST_CHECK_CLOSE(offsets[0].target.getX(), FORMATION_RADIUS, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestLineIsEvenlySpaced) {
  std::mt19937 rng(1);
  auto offsets = computeFormationOffsets(LaunchFormation::LINE, 4, rng);
  const float spacing = 2.0f * FORMATION_RADIUS / 4.0f;
  for (size_t i = 0; i < offsets.size(); ++i) {
    const float expected = (static_cast<float>(i) - 2.0f) * spacing;
    BOOST_CHECK_CLOSE(offsets[i].target.getX() + 1000.0f, expected + 1000.0f, 0.001f);
    BOOST_CHECK_EQUAL(offsets[i].start.getX(), offsets[i].target.getX());
    BOOST_CHECK_EQUAL(offsets[i].target.getZ(), 0.0f);
  }
}

BOOST_AUTO_TEST_CASE(TestCrossUsesFourArms) {
  std::mt19937 rng(1);
  auto offsets = computeFormationOffsets(LaunchFormation::CROSS, 8, rng);
  for (const auto &offset : offsets) {
    // Each rocket sits on exactly one axis
    const bool onX = offset.target.getZ() == 0.0f && offset.target.getX() != 0.0f;
    const bool onZ = offset.target.getX() == 0.0f && offset.target.getZ() != 0.0f;
    BOOST_CHECK(onX != onZ);
  }
  // Second ring is farther out than the first
  BOOST_CHECK_GT(offsets[4].target.length(), offsets[0].target.length());
}

BOOST_AUTO_TEST_CASE(TestVShapeAlternatesSides) {
  std::mt19937 rng(1);
  auto offsets = computeFormationOffsets(LaunchFormation::V_SHAPE, 6, rng);
  // The first pair shares the tip of the V
  for (size_t i = 3; i < offsets.size(); ++i) {
    BOOST_CHECK_LT(offsets[i].target.getX() * offsets[i - 1].target.getX(), 0.0f);
  }
  BOOST_CHECK_GT(offsets[4].target.getZ(), offsets[2].target.getZ());
}

BOOST_AUTO_TEST_CASE(TestRandomStaysInEnvelope) {
  std::mt19937 rng(1);
  auto offsets = computeFormationOffsets(LaunchFormation::RANDOM, 100, rng);
  for (const auto &offset : offsets) {
    BOOST_CHECK_LE(std::fabs(offset.target.getX()), FORMATION_RADIUS);
    BOOST_CHECK_LE(std::fabs(offset.target.getZ()), FORMATION_RADIUS);
    BOOST_CHECK_LE(std::fabs(offset.start.getX()), FORMATION_RADIUS * 0.5f);
    BOOST_CHECK_EQUAL(offset.start.getY(), 0.0f);
  }
}

BOOST_AUTO_TEST_CASE(TestFormationNames) {
  for (size_t f = 0; f < LAUNCH_FORMATION_COUNT; ++f) {
    auto formation = static_cast<LaunchFormation>(f);
    auto parsed = launchFormationFromString(launchFormationToString(formation));
    BOOST_REQUIRE(parsed.has_value());
    BOOST_CHECK(*parsed == formation);
  }
  BOOST_CHECK(launchFormationFromString("v_shape") == LaunchFormation::V_SHAPE);
  BOOST_CHECK(!launchFormationFromString("diamond").has_value());
}

BOOST_AUTO_TEST_SUITE_END()

namespace {

struct LaunchRecord {
  float time;
  std::string stage;
};

ShowStage makeStage(const std::string &name, float delay, int count,
                    float interval) {
  ShowStage stage;
  stage.name = name;
  stage.delay = delay;
  stage.count = count;
  stage.interval = interval;
  stage.formation = LaunchFormation::LINE;
  return stage;
}

// Polls the director like the simulation does, one 1/240 s step at a time
std::vector<LaunchRecord> runShow(ShowDirector &director, float from, float until) {
  std::vector<LaunchRecord> launches;
  const float step = 1.0f / 240.0f;
  for (float now = from; now <= until; now += step) {
    director.update(now, [&](const ShowStage &stage, const FormationOffset &) {
      launches.push_back({now, stage.name});
    });
  }
  return launches;
}

} // namespace

BOOST_AUTO_TEST_SUITE(ShowDirectorSuite)

BOOST_AUTO_TEST_CASE(TestStagesFollowCumulativeDelays) {
  ShowDirector director(3);
  ShowSequence sequence{makeStage("first", 0.0f, 2, 100.0f),
                        makeStage("second", 500.0f, 3, 50.0f)};
  director.start(sequence, 10.0f);
  BOOST_CHECK(director.isActive());
  BOOST_CHECK_EQUAL(director.getTotalLaunchCount(), 5u);
  BOOST_CHECK_CLOSE(director.getEndTime(), 10.6f, 0.001f);

  auto launches = runShow(director, 10.0f, 12.0f);
  BOOST_REQUIRE_EQUAL(launches.size(), 5u);
  BOOST_CHECK_EQUAL(launches[0].stage, "first");
  BOOST_CHECK_EQUAL(launches[1].stage, "first");
  BOOST_CHECK_EQUAL(launches[2].stage, "second");
  BOOST_CHECK_CLOSE(launches[1].time, 10.1f, 0.1f);
  BOOST_CHECK_CLOSE(launches[2].time, 10.5f, 0.1f);
  BOOST_CHECK_CLOSE(launches[4].time, 10.6f, 0.1f);
  BOOST_CHECK(!director.isActive());
  BOOST_CHECK_EQUAL(director.getPendingLaunchCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestLateUpdateFiresEverythingDue) {
  ShowDirector director(3);
  director.start({makeStage("burst", 0.0f, 4, 100.0f)}, 0.0f);
  size_t fired = director.update(0.25f, [](const ShowStage &, const FormationOffset &) {});
  BOOST_CHECK_EQUAL(fired, 3u);
  BOOST_CHECK_EQUAL(director.getPendingLaunchCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestOverlappingStagesAreOrderedByTime) {
  ShowDirector director(3);
  // First group still launching when the second begins
  ShowSequence sequence{makeStage("slow", 0.0f, 3, 1000.0f),
                        makeStage("fast", 500.0f, 1, 0.0f)};
  director.start(sequence, 0.0f);
  auto launches = runShow(director, 0.0f, 3.0f);
  BOOST_REQUIRE_EQUAL(launches.size(), 4u);
  BOOST_CHECK_EQUAL(launches[1].stage, "fast");
  for (size_t i = 1; i < launches.size(); ++i) {
    BOOST_CHECK_GE(launches[i].time, launches[i - 1].time);
  }
}

BOOST_AUTO_TEST_CASE(TestEmptySequenceStaysIdle) {
  ShowDirector director;
  director.start({}, 0.0f);
  BOOST_CHECK(!director.isActive());
  BOOST_CHECK_EQUAL(director.getEndTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestStageWithoutLaunchesIsSkipped) {
  ShowDirector director;
  director.start({makeStage("empty", 0.0f, 0, 0.0f),
                  makeStage("real", 200.0f, 2, 0.0f)},
                 0.0f);
  BOOST_CHECK_EQUAL(director.getTotalLaunchCount(), 2u);
  auto launches = runShow(director, 0.0f, 1.0f);
  BOOST_REQUIRE_EQUAL(launches.size(), 2u);
  BOOST_CHECK_CLOSE(launches[0].time, 0.2f, 3.0f);
}

BOOST_AUTO_TEST_CASE(TestNegativeDelayCountsAsZero) {
  ShowDirector director;
  director.start({makeStage("a", -500.0f, 1, 0.0f)}, 1.0f);
  BOOST_CHECK_CLOSE(director.getEndTime(), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRestartReplacesShow) {
  ShowDirector director;
  director.start({makeStage("a", 0.0f, 5, 100.0f)}, 0.0f);
  director.start({makeStage("b", 0.0f, 2, 100.0f)}, 0.0f);
  BOOST_CHECK_EQUAL(director.getTotalLaunchCount(), 2u);
  BOOST_CHECK_EQUAL(director.getSequence().front().name, "b");
}

BOOST_AUTO_TEST_CASE(TestStopClearsSchedule) {
  ShowDirector director;
  director.start({makeStage("a", 0.0f, 5, 100.0f)}, 0.0f);
  director.stop();
  BOOST_CHECK(!director.isActive());
  auto launches = runShow(director, 0.0f, 1.0f);
  BOOST_CHECK(launches.empty());
}

BOOST_AUTO_TEST_CASE(TestNullCallbackFiresNothing) {
  ShowDirector director;
  director.start({makeStage("a", 0.0f, 1, 0.0f)}, 0.0f);
  BOOST_CHECK_EQUAL(director.update(1.0f, ShowLaunchFn{}), 0u);
  BOOST_CHECK(director.isActive());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RandomShowSuite)

BOOST_AUTO_TEST_CASE(TestSequenceRespectsConfig) {
  RandomShowGenerator generator;
  std::mt19937 rng(11);
  for (int run = 0; run < 50; ++run) {
    ShowSequence sequence = generator.generateSequence(rng);
    BOOST_REQUIRE_GE(sequence.size(), 3u);
    BOOST_REQUIRE_LE(sequence.size(), 6u);

    BOOST_CHECK_EQUAL(sequence.front().delay, 0.0f);
    BOOST_CHECK_EQUAL(sequence.front().name, "Opening #1");
    BOOST_CHECK_EQUAL(sequence.back().name,
                      "Finale #" + std::to_string(sequence.size()));

    for (size_t i = 0; i < sequence.size(); ++i) {
      const ShowStage &stage = sequence[i];
      BOOST_CHECK(stage.shape.has_value());
      BOOST_CHECK(stage.trajectory.has_value());
      BOOST_CHECK(stage.combo.has_value());
      BOOST_CHECK_GE(stage.interval, 50.0f);
      BOOST_CHECK_LE(stage.interval, 200.0f);
      const bool feature = i == 0 || i + 1 == sequence.size();
      if (feature) {
        BOOST_CHECK_GE(stage.count, 6);
        BOOST_CHECK_LE(stage.count, RandomShowGenerator::MAX_FEATURE_COUNT);
      } else {
        BOOST_CHECK_GE(stage.count, 3);
        BOOST_CHECK_LE(stage.count, 10);
        BOOST_CHECK_GE(stage.delay, 500.0f);
        BOOST_CHECK_LE(stage.delay, 2000.0f);
      }
    }
  }
}

BOOST_AUTO_TEST_CASE(TestPoolsHonorExclusions) {
  RandomShowConfig config;
  config.excludedShapes = {ShapeKind::CUBE};
  config.excludedCombos = {ComboKind::SPLIT};
  RandomShowGenerator generator(config);
  generator.setEnabledPools({ShapeKind::CUBE, ShapeKind::LOTUS},
                            {TrajectoryKind::HELIX},
                            {ComboKind::SPLIT, ComboKind::MORPH});
  BOOST_CHECK_EQUAL(generator.getShapePool().size(), 1u);
  BOOST_CHECK_EQUAL(generator.getComboPool().size(), 1u);

  std::mt19937 rng(5);
  ShowSequence sequence = generator.generateSequence(rng);
  for (const auto &stage : sequence) {
    BOOST_CHECK(*stage.shape == ShapeKind::LOTUS);
    BOOST_CHECK(*stage.trajectory == TrajectoryKind::HELIX);
    BOOST_CHECK(*stage.combo == ComboKind::MORPH);
  }
}

BOOST_AUTO_TEST_CASE(TestEmptyPoolsFallBack) {
  RandomShowGenerator generator;
  generator.setEnabledPools({}, {}, {});
  std::mt19937 rng(5);
  for (const auto &stage : generator.generateSequence(rng)) {
    BOOST_CHECK(*stage.shape == ShapeKind::SPHERE);
    BOOST_CHECK(*stage.trajectory == TrajectoryKind::LINEAR);
    BOOST_CHECK(*stage.combo == ComboKind::SINGLE);
  }
}

BOOST_AUTO_TEST_CASE(TestConsecutiveStagesRarelyRepeat) {
  RandomShowGenerator generator;
  generator.setEnabledPools({ShapeKind::SPHERE, ShapeKind::HEXAGON},
                            TrajectoryRegistry::allKinds(),
                            ComboLibrary::allKinds());
  std::mt19937 rng(8);
  int repeats = 0;
  int pairs = 0;
  for (int run = 0; run < 100; ++run) {
    ShowSequence sequence = generator.generateSequence(rng);
    for (size_t i = 1; i < sequence.size(); ++i) {
      ++pairs;
      repeats += *sequence[i].shape == *sequence[i - 1].shape ? 1 : 0;
    }
  }
  // Three retries over two shapes leave a 1/16 repeat chance
  BOOST_CHECK_LT(repeats, pairs / 4);
}

BOOST_AUTO_TEST_CASE(TestZeroWeightsExcludeFormations) {
  RandomShowConfig config;
  for (size_t f = 0; f < LAUNCH_FORMATION_COUNT; ++f) {
    config.formationWeights[static_cast<LaunchFormation>(f)] = 0.0f;
  }
  config.formationWeights[LaunchFormation::CIRCLE] = 1.0f;
  RandomShowGenerator generator(config);
  std::mt19937 rng(2);
  for (const auto &stage : generator.generateSequence(rng)) {
    BOOST_CHECK(stage.formation == LaunchFormation::CIRCLE);
  }
}

BOOST_AUTO_TEST_CASE(TestInvertedRangesAreRepaired) {
  RandomShowConfig config;
  config.minStages = 4;
  config.maxStages = 2;
  RandomShowGenerator generator(config);
  BOOST_CHECK_EQUAL(generator.getConfig().maxStages, 4);
  std::mt19937 rng(2);
  BOOST_CHECK_EQUAL(generator.generateSequence(rng).size(), 4u);
}

BOOST_AUTO_TEST_CASE(TestEstimateDuration) {
  ShowSequence sequence{makeStage("a", 0.0f, 3, 100.0f),
                        makeStage("b", 1000.0f, 1, 0.0f)};
  // a ends at 0.2 + 3, b at 1.0 + 3
  BOOST_CHECK_CLOSE(RandomShowGenerator::estimateDuration(sequence), 4.0f, 0.001f);
  BOOST_CHECK_EQUAL(RandomShowGenerator::estimateDuration({}), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()
