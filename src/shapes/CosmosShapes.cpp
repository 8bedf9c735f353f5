/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ShapeBuilders.hpp"
#include <algorithm>

namespace PyroForge {

namespace {

void buildGalaxySpiral(ShapeBuilder &b) {
  constexpr int arms = 4;
  const float R = 40.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const int arm = i % arms;
    const float t = b.rand();
    const float a = static_cast<float>(arm) * TWO_PI / arms + t * 2.0f * PI;
    const float r = t * R;
    const float scatter = (1.0f - t) * 4.0f * b.s + 1.0f * b.s;
    auto &pt = b.add(std::cos(a) * r + b.centered() * scatter,
                     b.centered() * 3.0f * b.s,
                     std::sin(a) * r + b.centered() * scatter,
                     b.baseHue + t * 60.0f);
    pt.behavior = ParticleBehavior::Glitter;
  }
}

void buildPlanetRings(ShapeBuilder &b) {
  const int planet = b.share(0.3f);
  const float tilt = 0.3f;
  for (int i = 0; i < b.count; ++i) {
    if (i < planet) {
      b.add(b.direction() * (15.0f * b.s), b.baseHue).size = 3.0f;
    } else {
      const float a = b.angle();
      const float r = (22.0f + b.rand() * 14.0f) * b.s;
      const float x = std::cos(a) * r;
      const float z = std::sin(a) * r;
      b.add(x, z * std::sin(tilt), z * std::cos(tilt), b.baseHue + 40.0f);
    }
  }
}

void buildNebula(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    // Lumpy cloud: radius biased toward the center, squashed on y
    const Vector3D d = b.direction();
    const float r = std::pow(b.rand(), 0.6f) * 40.0f * b.s;
    auto &pt = b.add(d.getX() * r, d.getY() * r * 0.5f, d.getZ() * r,
                     b.baseHue + b.rand() * 80.0f);
    pt.behavior = ParticleBehavior::Glitter;
    pt.size = 1.0f + b.rand() * 2.0f;
  }
}

void buildBlackHole(ShapeBuilder &b) {
  const int disk = b.share(0.8f);
  for (int i = 0; i < b.count; ++i) {
    if (i < disk) {
      const float a = b.angle();
      const float r = (8.0f + b.rand() * 32.0f) * b.s;
      auto &pt = b.add(std::cos(a) * r, b.centered() * 2.0f * b.s,
                       std::sin(a) * r, b.baseHue + (r / b.s) * 2.0f);
      pt.behavior = ParticleBehavior::Galaxy;
    } else {
      b.add(b.direction() * (5.0f * b.s), 270.0f).size = 2.0f;
    }
  }
}

void buildSupernova(ShapeBuilder &b) {
  const int rays = b.share(0.3f);
  for (int i = 0; i < b.count; ++i) {
    if (i < rays) {
      auto &pt = b.add(b.direction() * ((30.0f + b.rand() * 10.0f) * b.s),
                       b.baseHue + 20.0f);
      pt.behavior = ParticleBehavior::Glitter;
      pt.size = 8.0f;
    } else {
      auto &pt = b.add(b.direction() * (b.rand() * 25.0f * b.s),
                       b.baseHue + b.rand() * 30.0f);
      pt.behavior = ParticleBehavior::Default;
    }
  }
}

void buildComet(ShapeBuilder &b) {
  const int head = b.share(0.2f);
  for (int i = 0; i < b.count; ++i) {
    if (i < head) {
      b.add(b.direction() * (5.0f * b.s), b.baseHue).size = 4.0f;
    } else {
      const float t = b.rand();
      const float spread = t * 10.0f * b.s;
      auto &pt = b.add(-t * 40.0f * b.s, b.centered() * spread,
                       b.centered() * spread, b.baseHue + t * 30.0f);
      pt.behavior = ParticleBehavior::Willow;
    }
  }
}

void buildAsteroidBelt(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float a = b.angle();
    const float r = (28.0f + b.centered() * 12.0f) * b.s;
    auto &pt = b.add(std::cos(a) * r, b.centered() * 4.0f * b.s,
                     std::sin(a) * r, 30.0f + b.rand() * 20.0f);
    pt.friction = 0.98f;
    pt.size = 1.0f + b.rand() * 3.0f;
  }
}

void buildConstellation(ShapeBuilder &b) {
  // A few bright stars joined by faint dotted lines
  const int stars = std::max(2, b.share(0.1f));
  std::vector<Vector3D> anchors;
  anchors.reserve(static_cast<size_t>(stars));
  for (int k = 0; k < stars; ++k) {
    anchors.push_back(Vector3D(b.centered() * 70.0f * b.s, b.centered() * 50.0f * b.s,
                               b.centered() * 20.0f * b.s));
  }
  for (int i = 0; i < b.count; ++i) {
    if (i < stars) {
      auto &pt = b.add(anchors[static_cast<size_t>(i)], b.baseHue);
      pt.size = 6.0f;
      pt.behavior = ParticleBehavior::Glitter;
    } else {
      const int k = b.pick(stars - 1);
      const float t = b.rand();
      const Vector3D &from = anchors[static_cast<size_t>(k)];
      const Vector3D &to = anchors[static_cast<size_t>(k + 1)];
      b.add(from * (1.0f - t) + to * t, b.baseHue + 20.0f).size = 1.0f;
    }
  }
}

void buildPulsar(ShapeBuilder &b) {
  const int core = b.share(0.4f);
  for (int i = 0; i < b.count; ++i) {
    if (i < core) {
      auto &pt = b.add(b.direction() * (8.0f * b.s), b.baseHue);
      pt.behavior = ParticleBehavior::Glitter;
    } else {
      const float dir = i % 2 == 0 ? 1.0f : -1.0f;
      const float t = b.rand();
      const float spread = t * 4.0f * b.s;
      auto &pt = b.add(b.centered() * spread, dir * (8.0f + t * 32.0f) * b.s,
                       b.centered() * spread, b.baseHue + 180.0f);
      pt.behavior = ParticleBehavior::Glitter;
    }
  }
}

void buildWormhole(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float t = b.centered() * 2.0f;
    const float a = b.angle() + t * PI;
    // Hyperboloid throat that twists along its length
    const float r = (8.0f + 20.0f * t * t) * b.s;
    b.add(std::cos(a) * r, t * 40.0f * b.s, std::sin(a) * r,
          b.baseHue + std::abs(t) * 100.0f);
  }
}

} // namespace

void registerCosmosShapes(ShapeRegistry &registry) {
  using C = ShapeCategory;
  registry.add(ShapeKind::GALAXY_SPIRAL, {"galaxy_spiral", "Spiral Galaxy", C::Cosmos, 2.0f}, buildGalaxySpiral);
  registry.add(ShapeKind::PLANET_RINGS, {"planet_rings", "Ringed Planet", C::Cosmos, 1.5f}, buildPlanetRings);
  registry.add(ShapeKind::NEBULA, {"nebula", "Nebula", C::Cosmos, 1.0f}, buildNebula);
  registry.add(ShapeKind::BLACK_HOLE, {"black_hole", "Black Hole", C::Cosmos, 1.0f}, buildBlackHole);
  registry.add(ShapeKind::SUPERNOVA, {"supernova", "Supernova", C::Cosmos, 1.0f}, buildSupernova);
  registry.add(ShapeKind::COMET, {"comet", "Comet", C::Cosmos, 1.0f}, buildComet);
  registry.add(ShapeKind::ASTEROID_BELT, {"asteroid_belt", "Asteroid Belt", C::Cosmos, 1.0f}, buildAsteroidBelt);
  registry.add(ShapeKind::CONSTELLATION, {"constellation", "Constellation", C::Cosmos, 1.0f}, buildConstellation);
  registry.add(ShapeKind::PULSAR, {"pulsar", "Pulsar", C::Cosmos, 1.0f}, buildPulsar);
  registry.add(ShapeKind::WORMHOLE, {"wormhole", "Wormhole", C::Cosmos, 1.0f}, buildWormhole);
}

} // namespace PyroForge
