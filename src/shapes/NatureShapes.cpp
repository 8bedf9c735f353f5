/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ShapeBuilders.hpp"
#include <algorithm>

namespace PyroForge {

Vector3D wingPoint(ShapeBuilder &b, float span, float lift) {
  const float x = b.centered() * 2.0f;
  const float ax = std::abs(x);
  const float y = (ax < 0.5f ? ax : 1.0f - ax) * lift;
  return Vector3D(x * span, y, b.centered() * span * 0.15f);
}

float butterflyRadius(float t) {
  return std::exp(std::cos(t)) - 2.0f * std::cos(4.0f * t) -
         std::pow(std::sin(t / 12.0f), 5.0f);
}

namespace {

void buildButterfly3D(ShapeBuilder &b) {
  const float k = 8.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float t = b.rand() * 12.0f * PI;
    const float r = butterflyRadius(t);
    const float x = std::sin(t) * r;
    const float y = std::cos(t) * r;
    // Wings fold slightly toward the viewer away from the body
    const float z = std::abs(x) * 0.3f + b.centered() * 0.5f;
    b.add(x * k, y * k, z * k, b.baseHue + std::abs(x) * 15.0f);
  }
}

void buildFlower3D(ShapeBuilder &b) {
  constexpr int layers = 3;
  constexpr int petals = 6;
  const float R = 30.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const int layer = i % layers;
    const float a = b.angle();
    const float petal = std::abs(std::cos(a * petals * 0.5f));
    const float r = R * (1.0f - 0.25f * static_cast<float>(layer)) * petal *
                    std::sqrt(b.rand());
    const float y = static_cast<float>(layer) * 5.0f * b.s + r * 0.2f;
    b.add(std::cos(a) * r, y, std::sin(a) * r,
          b.baseHue + static_cast<float>(layer) * 30.0f);
  }
}

void buildTree(ShapeBuilder &b) {
  const int trunk = b.share(0.2f);
  const float trunkHeight = 30.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    if (i < trunk) {
      b.add(b.centered() * 4.0f * b.s, b.rand() * trunkHeight - trunkHeight,
            b.centered() * 4.0f * b.s, 30.0f)
          .size = 3.0f;
    } else {
      // Conical crown above the trunk
      const float t = b.rand();
      const float r = (1.0f - t) * 25.0f * b.s * std::sqrt(b.rand());
      const float a = b.angle();
      b.add(std::cos(a) * r, t * 45.0f * b.s, std::sin(a) * r, 120.0f + t * 20.0f);
    }
  }
}

void buildFish3D(ShapeBuilder &b) {
  const float len = 40.0f * b.s;
  const int tail = b.share(0.2f);
  for (int i = 0; i < b.count; ++i) {
    if (i < tail) {
      const float t = b.rand();
      const float spread = t * 12.0f * b.s;
      b.add(-len * 0.5f - t * 12.0f * b.s, b.centered() * 2.0f * spread,
            b.centered() * 2.0f * b.s, b.baseHue + 40.0f);
    } else {
      const float x = b.centered() * len;
      const float bodyR = std::sqrt(std::max(0.0f, 1.0f - std::pow(2.0f * x / len, 2.0f))) *
                          10.0f * b.s;
      const float a = b.angle();
      b.add(x, std::sin(a) * bodyR, std::cos(a) * bodyR * 0.6f, b.baseHue);
    }
  }
}

void buildBird(ShapeBuilder &b) {
  const int body = b.share(0.15f);
  for (int i = 0; i < b.count; ++i) {
    if (i < body) {
      b.add(b.centered() * 4.0f * b.s, b.centered() * 4.0f * b.s,
            b.centered() * 14.0f * b.s, b.baseHue);
    } else {
      b.add(wingPoint(b, 35.0f * b.s, 20.0f * b.s), b.baseHue + 20.0f);
    }
  }
}

void buildJellyfish(ShapeBuilder &b) {
  const float R = 25.0f * b.s;
  const int cap = b.count / 2;
  for (int i = 0; i < b.count; ++i) {
    if (i < cap) {
      Vector3D d = b.direction();
      d.setY(std::abs(d.getY()));
      auto &pt = b.add(d * R, b.baseHue);
      pt.behavior = ParticleBehavior::Glitter;
    } else {
      constexpr int tentacles = 8;
      const float a = static_cast<float>(i % tentacles) * TWO_PI / tentacles;
      const float t = b.rand();
      const float sway = std::sin(t * 3.0f * PI) * 3.0f * b.s;
      auto &pt = b.add(std::cos(a) * R * 0.6f + sway, -t * 40.0f * b.s,
                       std::sin(a) * R * 0.6f, b.baseHue + 40.0f);
      pt.behavior = ParticleBehavior::Willow;
    }
  }
}

void buildShell(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float t = static_cast<float>(i) / static_cast<float>(b.count) * 4.0f * PI;
    const float r = 2.0f * b.s * std::exp(0.2f * t);
    const float tube = r * 0.3f;
    const float v = b.angle();
    b.add(std::cos(t) * (r + tube * std::cos(v)), tube * std::sin(v) + t * b.s,
          std::sin(t) * (r + tube * std::cos(v)), b.baseHue + t * 8.0f);
  }
}

void buildSnowflake3D(ShapeBuilder &b) {
  constexpr int arms = 6;
  const float R = 35.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float a = static_cast<float>(i % arms) * TWO_PI / arms;
    const float t = b.rand();
    Vector3D p(std::cos(a) * R * t, std::sin(a) * R * t, b.centered() * b.s);
    if (b.rand() < 0.4f) {
      // Branch off the arm at 60 degrees
      const float side = b.rand() < 0.5f ? -1.0f : 1.0f;
      const float ba = a + side * PI / 3.0f;
      const float bl = (1.0f - t) * R * 0.3f * b.rand();
      p += Vector3D(std::cos(ba) * bl, std::sin(ba) * bl, 0.0f);
    }
    b.add(p, 180.0f + t * 40.0f).size = 3.0f;
  }
}

void buildLeaf(ShapeBuilder &b) {
  const float len = 40.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float t = b.rand();
    const float width = std::sin(t * PI) * 12.0f * b.s;
    const float x = b.centered() * 2.0f * width;
    const float curl = x * x * 0.01f / std::max(b.s, 0.001f);
    b.add(x, t * len - len * 0.5f, curl, 100.0f + t * 40.0f);
  }
}

void buildMushroom(ShapeBuilder &b) {
  const int cap = b.share(0.7f);
  const float R = 30.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    if (i < cap) {
      Vector3D d = b.direction();
      d.setY(std::abs(d.getY()) * 0.6f);
      b.add(d * R + Vector3D(0.0f, 10.0f * b.s, 0.0f), b.baseHue);
    } else {
      const float a = b.angle();
      const float r = 6.0f * b.s;
      b.add(std::cos(a) * r, b.rand() * -30.0f * b.s + 10.0f * b.s,
            std::sin(a) * r, 40.0f);
    }
  }
}

} // namespace

void registerNatureShapes(ShapeRegistry &registry) {
  using C = ShapeCategory;
  registry.add(ShapeKind::BUTTERFLY_3D, {"butterfly_3d", "Butterfly", C::Nature, 1.5f}, buildButterfly3D);
  registry.add(ShapeKind::FLOWER_3D, {"flower_3d", "Flower", C::Nature, 1.0f}, buildFlower3D);
  registry.add(ShapeKind::TREE, {"tree", "Tree", C::Nature, 1.0f}, buildTree);
  registry.add(ShapeKind::FISH_3D, {"fish_3d", "Fish", C::Nature, 1.0f}, buildFish3D);
  registry.add(ShapeKind::BIRD, {"bird", "Bird", C::Nature, 1.0f}, buildBird);
  registry.add(ShapeKind::JELLYFISH, {"jellyfish", "Jellyfish", C::Nature, 1.0f}, buildJellyfish);
  registry.add(ShapeKind::SHELL, {"shell", "Shell", C::Nature, 1.0f}, buildShell);
  registry.add(ShapeKind::SNOWFLAKE_3D, {"snowflake_3d", "Snowflake", C::Nature, 1.0f}, buildSnowflake3D);
  registry.add(ShapeKind::LEAF, {"leaf", "Leaf", C::Nature, 1.0f}, buildLeaf);
  registry.add(ShapeKind::MUSHROOM, {"mushroom", "Mushroom", C::Nature, 1.0f}, buildMushroom);
}

} // namespace PyroForge
