/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ShapeBuilders.hpp"
#include <algorithm>
#include <cmath>

namespace PyroForge {

namespace {

constexpr float PATTERN_RADIUS = 40.0f;

float fraction(int i, int count) {
  return static_cast<float>(i) / static_cast<float>(count);
}

// Point on the outline of a regular polygon given corner positions
Vector3D onOutline(ShapeBuilder &b, const std::vector<Vector3D> &corners) {
  const size_t n = corners.size();
  const size_t edge = Random::index(b.rng, n);
  const float t = b.rand();
  return corners[edge] * (1.0f - t) + corners[(edge + 1) % n] * t;
}

std::vector<Vector3D> starCorners(int points, float outer) {
  std::vector<Vector3D> corners;
  corners.reserve(static_cast<size_t>(points) * 2);
  const float inner = outer * 0.4f;
  for (int k = 0; k < points * 2; ++k) {
    const float r = k % 2 == 0 ? outer : inner;
    const float a = static_cast<float>(k) * PI / static_cast<float>(points) - PI * 0.5f;
    corners.push_back(Vector3D(std::cos(a) * r, std::sin(a) * r, 0.0f));
  }
  return corners;
}

void buildPistil(ShapeBuilder &b) {
  const int inner = b.share(0.4f);
  for (int i = 0; i < b.count; ++i) {
    if (i < inner) {
      auto &pt = b.add(b.direction() * (12.0f * b.s), b.baseHue + 180.0f);
      pt.behavior = ParticleBehavior::Glitter;
    } else {
      b.add(b.direction() * (30.0f * b.s), b.baseHue);
    }
  }
}

void buildCrossette(ShapeBuilder &b) {
  constexpr int beams = 8;
  std::vector<Vector3D> dirs;
  dirs.reserve(beams);
  for (int k = 0; k < beams; ++k) {
    dirs.push_back(b.direction());
  }
  for (int i = 0; i < b.count; ++i) {
    const Vector3D &d = dirs[static_cast<size_t>(i % beams)];
    const float t = 0.2f + 0.8f * b.rand();
    auto &pt = b.add(d * (t * 35.0f * b.s), b.baseHue + t * 30.0f);
    pt.behavior = ParticleBehavior::Comet;
  }
}

void buildSaturn(ShapeBuilder &b) {
  const int body = b.share(0.4f);
  const float tilt = 0.45f;
  for (int i = 0; i < b.count; ++i) {
    if (i < body) {
      b.add(b.direction() * (15.0f * b.s), b.baseHue);
    } else {
      const float a = b.angle();
      const float r = (25.0f + b.rand() * 8.0f) * b.s;
      const float z = std::sin(a) * r;
      b.add(std::cos(a) * r, z * std::sin(tilt), z * std::cos(tilt),
            b.baseHue + 60.0f);
    }
  }
}

void buildHeartOutline(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float t = fraction(i, b.count) * TWO_PI;
    const float sinT = std::sin(t);
    const float x = 16.0f * sinT * sinT * sinT;
    const float y = 13.0f * std::cos(t) - 5.0f * std::cos(2.0f * t) -
                    2.0f * std::cos(3.0f * t) - std::cos(4.0f * t);
    b.add(x * b.s, y * b.s, 0.0f, b.baseHue);
  }
}

void buildButterflyCurve(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float t = static_cast<float>(i) * 0.1f;
    const float r = butterflyRadius(t);
    b.add(std::sin(t) * r * 10.0f * b.s, std::cos(t) * r * 10.0f * b.s, 0.0f,
          b.baseHue + fraction(i, b.count) * 60.0f);
  }
}

void buildDragonCoil(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float p = fraction(i, b.count);
    const float a = p * 6.0f * TWO_PI;
    const float r = (10.0f + 30.0f * p) * 1.5f * b.s;
    b.add(std::cos(a) * r, (p - 0.5f) * 200.0f * b.s, std::sin(a) * r,
          b.baseHue + p * 40.0f);
  }
}

void buildGreatWall(ShapeBuilder &b) {
  constexpr float width = 350.0f;
  for (int i = 0; i < b.count; ++i) {
    const float x = (fraction(i, b.count) - 0.5f) * width;
    float top = 20.0f;
    if (std::sin(x * 0.15f) > 0.8f) {
      top = 35.0f; // watchtower
    }
    const float y = b.rand() * top;
    b.add(x * b.s, (y - 15.0f) * b.s, std::sin(x * 0.02f) * 20.0f * b.s,
          b.baseHue + (top > 20.0f ? 30.0f : 0.0f));
  }
}

void buildZodiacSerpent(ShapeBuilder &b) {
  const float len = static_cast<float>(b.count);
  for (int i = 0; i < b.count; ++i) {
    const float t = static_cast<float>(i) * 0.15f;
    b.add((t - len * 0.15f * 0.5f) * 12.0f * b.s, std::cos(t * 0.5f) * 15.0f * b.s,
          std::sin(t) * 30.0f * b.s, b.baseHue + fraction(i, b.count) * 90.0f);
  }
}

void buildHexagon(ShapeBuilder &b) {
  std::vector<Vector3D> corners;
  corners.reserve(6);
  for (int k = 0; k < 6; ++k) {
    const float a = static_cast<float>(k) * TWO_PI / 6.0f;
    corners.push_back(
        Vector3D(std::cos(a), std::sin(a), 0.0f) * (PATTERN_RADIUS * b.s));
  }
  for (int i = 0; i < b.count; ++i) {
    b.add(onOutline(b, corners), b.baseHue);
  }
}

void buildStarOutline(ShapeBuilder &b, int points) {
  const std::vector<Vector3D> corners = starCorners(points, PATTERN_RADIUS * b.s);
  for (int i = 0; i < b.count; ++i) {
    b.add(onOutline(b, corners), b.baseHue + fraction(i, b.count) * 30.0f);
  }
}

void buildHexagram(ShapeBuilder &b) { buildStarOutline(b, 6); }

void buildOctagram(ShapeBuilder &b) { buildStarOutline(b, 8); }

void buildSpiralArchimedean(ShapeBuilder &b) {
  constexpr float turns = 5.0f;
  const float R = PATTERN_RADIUS * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float t = fraction(i, b.count);
    const float a = t * turns * TWO_PI;
    b.add(std::cos(a) * R * t, std::sin(a) * R * t, 0.0f, b.baseHue + t * 120.0f);
  }
}

void buildSpiralLogarithmic(ShapeBuilder &b) {
  const float R = PATTERN_RADIUS * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float theta = fraction(i, b.count) * 4.0f * TWO_PI;
    const float r = std::min(R, 0.1f * R * std::exp(0.3f * theta));
    b.add(std::cos(theta) * r, std::sin(theta) * r, 0.0f,
          b.baseHue + fraction(i, b.count) * 120.0f);
  }
}

} // namespace

void registerPatternShapes(ShapeRegistry &registry) {
  using C = ShapeCategory;
  registry.add(ShapeKind::PISTIL, {"pistil", "Pistil", C::ClassicPatterns, 1.0f}, buildPistil);
  registry.add(ShapeKind::CROSSETTE, {"crossette", "Crossette", C::ClassicPatterns, 1.0f}, buildCrossette);
  registry.add(ShapeKind::SATURN, {"saturn", "Saturn", C::ClassicPatterns, 1.0f}, buildSaturn);
  registry.add(ShapeKind::HEART_OUTLINE, {"heart_outline", "Heart Outline", C::ClassicPatterns, 1.0f}, buildHeartOutline);
  registry.add(ShapeKind::BUTTERFLY_CURVE, {"butterfly_curve", "Butterfly Curve", C::ClassicPatterns, 1.0f}, buildButterflyCurve);
  registry.add(ShapeKind::DRAGON_COIL, {"dragon_coil", "Dragon Coil", C::ClassicPatterns, 1.0f}, buildDragonCoil);
  registry.add(ShapeKind::GREAT_WALL, {"great_wall", "Great Wall", C::ClassicPatterns, 1.0f}, buildGreatWall);
  registry.add(ShapeKind::ZODIAC_SERPENT, {"zodiac_serpent", "Zodiac Serpent", C::ClassicPatterns, 1.0f}, buildZodiacSerpent);
  registry.add(ShapeKind::HEXAGON, {"hexagon", "Hexagon", C::ClassicPatterns, 1.0f}, buildHexagon);
  registry.add(ShapeKind::HEXAGRAM, {"hexagram", "Hexagram", C::ClassicPatterns, 1.0f}, buildHexagram);
  registry.add(ShapeKind::OCTAGRAM, {"octagram", "Octagram", C::ClassicPatterns, 1.0f}, buildOctagram);
  registry.add(ShapeKind::SPIRAL_ARCHIMEDEAN, {"spiral_archimedean", "Archimedean Spiral", C::ClassicPatterns, 1.0f}, buildSpiralArchimedean);
  registry.add(ShapeKind::SPIRAL_LOGARITHMIC, {"spiral_logarithmic", "Logarithmic Spiral", C::ClassicPatterns, 1.0f}, buildSpiralLogarithmic);
}

} // namespace PyroForge
