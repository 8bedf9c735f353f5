/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHAPE_BUILDERS_HPP
#define SHAPE_BUILDERS_HPP

// Internal to the shapes module: helpers shared by the category generators.

#include "shapes/ShapeGenerator.hpp"
#include "utils/RandomUtils.hpp"
#include <cmath>
#include <vector>

namespace PyroForge {

/**
 * @brief Output sink and parameters handed to a shape generator
 *
 * Generators append exactly `count` points. s is the pre-normalization
 * scale; since clouds are normalized afterwards only its ratio between
 * features of the same shape matters.
 */
struct ShapeBuilder {
  std::vector<ShapePoint> &points;
  std::mt19937 &rng;
  int count;
  float s;
  float baseHue;

  float rand() { return Random::unit(rng); }

  // Uniform in [-0.5, 0.5)
  float centered() { return Random::unit(rng) - 0.5f; }

  float angle() { return Random::unit(rng) * TWO_PI; }

  int pick(int n) { return static_cast<int>(Random::index(rng, static_cast<size_t>(n))); }

  // Uniform direction on the unit sphere
  Vector3D direction() {
    const float theta = angle();
    const float phi = std::acos(2.0f * rand() - 1.0f);
    return Vector3D(std::sin(phi) * std::cos(theta),
                    std::sin(phi) * std::sin(theta), std::cos(phi));
  }

  ShapePoint &add(const Vector3D &offset, float hue) {
    points.push_back(ShapePoint{offset, hue, {}, {}, {}, {}});
    return points.back();
  }

  ShapePoint &add(float x, float y, float z, float hue) {
    return add(Vector3D(x, y, z), hue);
  }

  // Portion of count for a feature, rounded down
  int share(float fraction) const {
    return static_cast<int>(static_cast<float>(count) * fraction);
  }

  // Barycentric point inside triangle abc
  Vector3D inTriangle(const Vector3D &a, const Vector3D &b, const Vector3D &c) {
    float u = rand();
    float v = rand();
    if (u + v > 1.0f) {
      u = 1.0f - u;
      v = 1.0f - v;
    }
    return a * (1.0f - u - v) + b * u + c * v;
  }
};

// Per-category registration, called by the ShapeRegistry constructor
void registerGeometryShapes(ShapeRegistry &registry);
void registerNatureShapes(ShapeRegistry &registry);
void registerCosmosShapes(ShapeRegistry &registry);
void registerCultureShapes(ShapeRegistry &registry);
void registerEffectShapes(ShapeRegistry &registry);
void registerPatternShapes(ShapeRegistry &registry);

// Shared by several categories
void buildSphere(ShapeBuilder &b);

// Point on an M-shaped wing spanning [-span, span] along x
Vector3D wingPoint(ShapeBuilder &b, float span, float lift);

// Fay butterfly curve radius at parameter t
float butterflyRadius(float t);

} // namespace PyroForge

#endif // SHAPE_BUILDERS_HPP
