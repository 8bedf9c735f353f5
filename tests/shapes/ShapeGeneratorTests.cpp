/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ShapeGeneratorTests
#include <boost/test/unit_test.hpp>

#include "shapes/ShapeGenerator.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <string>

using namespace PyroForge;

BOOST_AUTO_TEST_SUITE(ShapeRegistrySuite)

BOOST_AUTO_TEST_CASE(TestEveryKindIsRegistered) {
  BOOST_CHECK_EQUAL(ShapeRegistry::Instance().size(), SHAPE_KIND_COUNT);
  for (size_t i = 0; i < SHAPE_KIND_COUNT; ++i) {
    BOOST_CHECK(ShapeGenerator::isRegistered(static_cast<ShapeKind>(i)));
  }
}

BOOST_AUTO_TEST_CASE(TestIdsAreUniqueAndRoundTrip) {
  std::set<std::string> ids;
  for (ShapeKind kind : ShapeGenerator::getAllKinds()) {
    const std::string id = ShapeGenerator::toString(kind);
    BOOST_CHECK_MESSAGE(ids.insert(id).second, "duplicate shape id " << id);
    auto parsed = ShapeGenerator::fromString(id);
    BOOST_REQUIRE(parsed.has_value());
    BOOST_CHECK(*parsed == kind);
  }
  BOOST_CHECK(!ShapeGenerator::fromString("not_a_shape").has_value());
  BOOST_CHECK(!ShapeGenerator::fromString("").has_value());
}

BOOST_AUTO_TEST_CASE(TestCategoriesPartitionKinds) {
  size_t total = 0;
  for (uint8_t c = 0; c < static_cast<uint8_t>(ShapeCategory::COUNT); ++c) {
    auto kinds = ShapeGenerator::getKindsByCategory(static_cast<ShapeCategory>(c));
    BOOST_CHECK_MESSAGE(!kinds.empty(), "empty category "
                                            << shapeCategoryToString(
                                                   static_cast<ShapeCategory>(c)));
    total += kinds.size();
  }
  BOOST_CHECK_EQUAL(total, SHAPE_KIND_COUNT);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ShapeGenerationSuite)

BOOST_AUTO_TEST_CASE(TestEveryKindYieldsExactCount) {
  std::mt19937 rng(42);
  const int counts[] = {1, 2, 7, 100, 333};
  for (ShapeKind kind : ShapeGenerator::getAllKinds()) {
    for (int count : counts) {
      auto points = ShapeGenerator::generate(kind, count, 1.0f, 120.0f, rng);
      BOOST_CHECK_MESSAGE(points.size() == static_cast<size_t>(count),
                          ShapeGenerator::toString(kind)
                              << " gave " << points.size() << " of " << count);
    }
  }
}

BOOST_AUTO_TEST_CASE(TestPointsAreFiniteAndWithinExtent) {
  std::mt19937 rng(9);
  for (ShapeKind kind : ShapeGenerator::getAllKinds()) {
    auto points = ShapeGenerator::generate(kind, 200, 2.0f, 0.0f, rng);
    const float limit = ShapeGenerator::NORMALIZED_EXTENT * 2.0f * 1.0001f;
    for (const auto &p : points) {
      const float len = p.offset.length();
      BOOST_REQUIRE_MESSAGE(std::isfinite(len) && std::isfinite(p.hue),
                            ShapeGenerator::toString(kind) << " non-finite point");
      BOOST_REQUIRE_LE(len, limit);
    }
  }
}

BOOST_AUTO_TEST_CASE(TestNonPositiveCountIsEmpty) {
  std::mt19937 rng(1);
  BOOST_CHECK(ShapeGenerator::generate(ShapeKind::SPHERE, 0, 1.0f, 0.0f, rng).empty());
  BOOST_CHECK(ShapeGenerator::generate(ShapeKind::HEXAGON, -5, 1.0f, 0.0f, rng).empty());
}

BOOST_AUTO_TEST_CASE(TestSpherePointsLieOnRadius) {
  std::mt19937 rng(1234);
  const float scale = 1.5f;
  const float radius = ShapeGenerator::NORMALIZED_EXTENT * scale;
  auto points = ShapeGenerator::generate(ShapeKind::SPHERE, 1000, scale, 0.0f, rng);
  BOOST_REQUIRE_EQUAL(points.size(), 1000u);

  Vector3D centroid;
  for (const auto &p : points) {
    const float len = p.offset.length();
    BOOST_REQUIRE_GE(len, radius * 0.95f);
    BOOST_REQUIRE_LE(len, radius * 1.05f);
    centroid += p.offset;
  }
  // Directions are uniform, so the cloud is centered
  centroid /= 1000.0f;
  BOOST_CHECK_LT(centroid.length(), radius * 0.1f);
}

BOOST_AUTO_TEST_CASE(TestNormalizeScalesFarthestPoint) {
  std::vector<ShapePoint> points(3);
  points[0].offset = Vector3D(1.0f, 0.0f, 0.0f);
  points[1].offset = Vector3D(0.0f, 4.0f, 0.0f);
  points[2].offset = Vector3D(0.0f, 0.0f, 2.0f);
  ShapeGenerator::normalize(points, 10.0f);
  BOOST_CHECK_CLOSE(points[1].offset.length(), 10.0f, 0.001f);
  BOOST_CHECK_CLOSE(points[0].offset.length(), 2.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNormalizeLeavesDegenerateCloud) {
  std::vector<ShapePoint> points(4);
  ShapeGenerator::normalize(points, 10.0f);
  for (const auto &p : points) {
    BOOST_CHECK_EQUAL(p.offset.lengthSquared(), 0.0f);
  }
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameShape) {
  std::mt19937 a(77);
  std::mt19937 b(77);
  auto first = ShapeGenerator::generate(ShapeKind::GALAXY_SPIRAL, 150, 1.0f, 30.0f, a);
  auto second = ShapeGenerator::generate(ShapeKind::GALAXY_SPIRAL, 150, 1.0f, 30.0f, b);
  BOOST_REQUIRE_EQUAL(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    BOOST_CHECK_EQUAL(first[i].offset.getX(), second[i].offset.getX());
    BOOST_CHECK_EQUAL(first[i].hue, second[i].hue);
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ShapePickSuite)

BOOST_AUTO_TEST_CASE(TestPickFromEmptyIsSphere) {
  std::mt19937 rng(3);
  BOOST_CHECK(ShapeGenerator::pickFrom({}, rng) == ShapeKind::SPHERE);
}

BOOST_AUTO_TEST_CASE(TestPickFromStaysInList) {
  std::mt19937 rng(3);
  const std::vector<ShapeKind> pool{ShapeKind::CUBE, ShapeKind::HEXAGON,
                                    ShapeKind::PHOENIX};
  std::set<ShapeKind> seen;
  for (int i = 0; i < 300; ++i) {
    ShapeKind kind = ShapeGenerator::pickFrom(pool, rng);
    BOOST_REQUIRE(std::find(pool.begin(), pool.end(), kind) != pool.end());
    seen.insert(kind);
  }
  BOOST_CHECK_EQUAL(seen.size(), pool.size());
}

BOOST_AUTO_TEST_CASE(TestWeightedPickReturnsRegisteredKinds) {
  std::mt19937 rng(3);
  for (int i = 0; i < 500; ++i) {
    BOOST_REQUIRE(ShapeGenerator::isRegistered(ShapeGenerator::pickWeighted(rng)));
  }
}

BOOST_AUTO_TEST_SUITE_END()
