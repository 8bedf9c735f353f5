/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TrajectoryTests
#include <boost/test/unit_test.hpp>

#include "trajectory/TrajectoryCalculator.hpp"
#include <cmath>
#include <set>
#include <string>

using namespace PyroForge;

namespace {

constexpr float FRAME = 1.0f / 60.0f;
constexpr float GRAVITY = 0.12f;

} // namespace

BOOST_AUTO_TEST_SUITE(TrajectoryRegistrySuite)

BOOST_AUTO_TEST_CASE(TestAllKindsHaveUniqueIds) {
  std::set<std::string> ids;
  auto kinds = TrajectoryRegistry::allKinds();
  BOOST_CHECK_EQUAL(kinds.size(), TRAJECTORY_KIND_COUNT);
  for (TrajectoryKind kind : kinds) {
    BOOST_CHECK(TrajectoryRegistry::Instance().getFunction(kind) != nullptr);
    const std::string id = TrajectoryRegistry::toString(kind);
    BOOST_CHECK(ids.insert(id).second);
    auto parsed = TrajectoryRegistry::fromString(id);
    BOOST_REQUIRE(parsed.has_value());
    BOOST_CHECK(*parsed == kind);
  }
  BOOST_CHECK(!TrajectoryRegistry::fromString("loop_de_loop").has_value());
}

BOOST_AUTO_TEST_CASE(TestUnknownKindFallsBackToLinear) {
  const auto bogus = static_cast<TrajectoryKind>(200);
  const auto &registry = TrajectoryRegistry::Instance();
  BOOST_CHECK(registry.getFunction(bogus) ==
              registry.getFunction(TrajectoryKind::LINEAR));
  TrajectoryCalculator calc(bogus);
  BOOST_CHECK(calc.getKind() == TrajectoryKind::LINEAR);
}

BOOST_AUTO_TEST_CASE(TestPickFromEmptyIsLinear) {
  std::mt19937 rng(1);
  BOOST_CHECK(TrajectoryRegistry::pickFrom({}, rng) == TrajectoryKind::LINEAR);
  const std::vector<TrajectoryKind> only{TrajectoryKind::ORBIT};
  BOOST_CHECK(TrajectoryRegistry::pickFrom(only, rng) == TrajectoryKind::ORBIT);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TrajectoryRuleSuite)

BOOST_AUTO_TEST_CASE(TestLinearAppliesAscentGravity) {
  TrajectoryCalculator calc(TrajectoryKind::LINEAR);
  Vector3D v(1.0f, 10.0f, -1.0f);
  v = calc.calculate(v, GRAVITY, FRAME);
  BOOST_CHECK_CLOSE(v.getY(), 10.0f - GRAVITY * 1.5f, 0.01f);
  BOOST_CHECK_CLOSE(v.getX(), 1.0f, 0.001f);
  BOOST_CHECK_CLOSE(v.getZ(), -1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRulesScaleWithFrameDelta) {
  TrajectoryCalculator one(TrajectoryKind::LINEAR);
  TrajectoryCalculator two(TrajectoryKind::LINEAR);
  Vector3D a = one.calculate(Vector3D(0.0f, 10.0f, 0.0f), GRAVITY, FRAME);
  a = one.calculate(a, GRAVITY, FRAME);
  Vector3D b = two.calculate(Vector3D(0.0f, 10.0f, 0.0f), GRAVITY, 2.0f * FRAME);
  BOOST_CHECK_CLOSE(a.getY(), b.getY(), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestDecelerateDampingScalesWithFrameDelta) {
  TrajectoryCalculator coarse(TrajectoryKind::DECELERATE);
  TrajectoryCalculator fine(TrajectoryKind::DECELERATE);
  const Vector3D start(1.0f, 10.0f, 1.0f);

  Vector3D a = coarse.calculate(start, GRAVITY, FRAME);
  Vector3D b = start;
  for (int i = 0; i < 4; ++i) {
    b = fine.calculate(b, GRAVITY, FRAME / 4.0f);
  }
  BOOST_CHECK_CLOSE(a.getX(), b.getX(), 0.1f);
  BOOST_CHECK_CLOSE(a.getZ(), b.getZ(), 0.1f);
  BOOST_CHECK_CLOSE(a.getY(), b.getY(), 0.01f);

  // Two seconds at 60 Hz and at 240 Hz end up with similar sideways speed
  for (int i = 1; i < 120; ++i) {
    a = coarse.calculate(a, GRAVITY, FRAME);
  }
  for (int i = 4; i < 480; ++i) {
    b = fine.calculate(b, GRAVITY, FRAME / 4.0f);
  }
  BOOST_REQUIRE_GT(a.getX(), 0.0f);
  BOOST_CHECK_CLOSE(a.getX(), b.getX(), 10.0f);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveDeltaIsIgnored) {
  TrajectoryCalculator calc(TrajectoryKind::SPIRAL);
  const Vector3D v(1.0f, 2.0f, 3.0f);
  Vector3D out = calc.calculate(v, GRAVITY, 0.0f);
  BOOST_CHECK(out == v);
  out = calc.calculate(v, GRAVITY, -0.5f);
  BOOST_CHECK(out == v);
  BOOST_CHECK_EQUAL(calc.getLifeTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestLifeTimeAccumulatesPerCalculator) {
  TrajectoryCalculator a(TrajectoryKind::HELIX);
  TrajectoryCalculator b(TrajectoryKind::HELIX);
  Vector3D v(0.0f, 10.0f, 0.0f);
  for (int i = 0; i < 30; ++i) {
    v = a.calculate(v, GRAVITY, FRAME);
  }
  BOOST_CHECK_CLOSE(a.getLifeTime(), 0.5f, 0.01f);
  BOOST_CHECK_EQUAL(b.getLifeTime(), 0.0f);
  a.reset();
  BOOST_CHECK_EQUAL(a.getLifeTime(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestAccelerateBoostsInSecondPhase) {
  TrajectoryCalculator calc(TrajectoryKind::ACCELERATE);
  Vector3D v(0.0f, 10.0f, 0.0f);
  // Run into the 0.5..1.0 s boost window
  for (int i = 0; i < 36; ++i) {
    v = calc.calculate(v, GRAVITY, FRAME);
  }
  const float before = v.getY();
  v = calc.calculate(v, GRAVITY, FRAME);
  BOOST_CHECK_GT(v.getY(), before);
}

BOOST_AUTO_TEST_CASE(TestOrbitReplacesLateralVelocity) {
  TrajectoryCalculator calc(TrajectoryKind::ORBIT);
  Vector3D v(50.0f, 10.0f, 50.0f);
  v = calc.calculate(v, GRAVITY, FRAME);
  BOOST_CHECK_LT(std::fabs(v.getX()), 1.0f);
  BOOST_CHECK_LT(std::fabs(v.getZ()), 1.0f);

  // Same lateral velocity at the same time, whatever the step size
  TrajectoryCalculator fine(TrajectoryKind::ORBIT);
  Vector3D w(50.0f, 10.0f, 50.0f);
  for (int i = 0; i < 4; ++i) {
    w = fine.calculate(w, GRAVITY, FRAME / 4.0f);
  }
  BOOST_CHECK_CLOSE(v.getX(), w.getX(), 0.01f);
  BOOST_CHECK_CLOSE(v.getZ(), w.getZ(), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestWobbleIsDeterministicPerSeed) {
  TrajectoryCalculator a(TrajectoryKind::WOBBLE, 99);
  TrajectoryCalculator b(TrajectoryKind::WOBBLE, 99);
  Vector3D va(0.0f, 10.0f, 0.0f);
  Vector3D vb = va;
  for (int i = 0; i < 20; ++i) {
    va = a.calculate(va, GRAVITY, FRAME);
    vb = b.calculate(vb, GRAVITY, FRAME);
  }
  BOOST_CHECK_EQUAL(va.getX(), vb.getX());
  BOOST_CHECK_EQUAL(va.getZ(), vb.getZ());
}

BOOST_AUTO_TEST_CASE(TestEveryRuleEventuallyDescends) {
  for (TrajectoryKind kind : TrajectoryRegistry::allKinds()) {
    TrajectoryCalculator calc(kind, 5);
    Vector3D v(0.0f, 8.0f, 0.0f);
    bool descending = false;
    for (int i = 0; i < 60 * 30 && !descending; ++i) {
      v = calc.calculate(v, GRAVITY, FRAME);
      BOOST_REQUIRE(std::isfinite(v.getX()) && std::isfinite(v.getY()) &&
                    std::isfinite(v.getZ()));
      descending = v.getY() <= -3.0f;
    }
    BOOST_CHECK_MESSAGE(descending, TrajectoryRegistry::toString(kind)
                                        << " never reached the explosion threshold");
  }
}

BOOST_AUTO_TEST_SUITE_END()
