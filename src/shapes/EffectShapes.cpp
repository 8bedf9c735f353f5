/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ShapeBuilders.hpp"

namespace PyroForge {

namespace {

void buildExplosionBurst(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float r = (20.0f + b.rand() * 15.0f) * b.s;
    auto &pt = b.add(b.direction() * r, b.baseHue + b.rand() * 40.0f);
    pt.behavior = ParticleBehavior::Glitter;
  }
}

void buildRingWave(ShapeBuilder &b) {
  const float r = 30.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float f = static_cast<float>(i) / static_cast<float>(b.count);
    const float a = f * TWO_PI;
    b.add(std::cos(a) * r, b.centered() * 2.0f * b.s, std::sin(a) * r,
          b.baseHue + f * 360.0f);
  }
}

void buildDoubleRing(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const bool outer = i % 2 == 0;
    const float r = (outer ? 35.0f : 20.0f) * b.s;
    const float a = b.angle();
    // Rings sit in perpendicular planes
    if (outer) {
      b.add(std::cos(a) * r, 0.0f, std::sin(a) * r, b.baseHue);
    } else {
      b.add(std::cos(a) * r, std::sin(a) * r, 0.0f, b.baseHue + 120.0f);
    }
  }
}

void buildCascade(ShapeBuilder &b) {
  constexpr int layers = 5;
  for (int i = 0; i < b.count; ++i) {
    const int layer = i % layers;
    const float r = (1.0f - 0.15f * static_cast<float>(layer)) * 90.0f * b.s;
    const float a = b.angle();
    const float h = static_cast<float>(layer - 2) * 20.0f * b.s;
    const float noise = 2.5f * b.s;
    auto &pt = b.add(std::cos(a) * r + b.centered() * 2.0f * noise,
                     h + b.centered() * 2.0f * noise,
                     std::sin(a) * r + b.centered() * 2.0f * noise,
                     b.baseHue + static_cast<float>(layer) * 15.0f);
    pt.behavior = ParticleBehavior::Willow;
  }
}

void buildWaterfall3D(ShapeBuilder &b) {
  // Curved curtain: wide at the lip, thinning as it falls
  for (int i = 0; i < b.count; ++i) {
    const float t = b.rand();
    const float width = (1.0f - 0.4f * t) * 60.0f * b.s;
    const float x = b.centered() * width;
    const float bow = std::cos(x / (60.0f * b.s) * PI) * 8.0f * b.s;
    auto &pt = b.add(x, (0.5f - t) * 80.0f * b.s, bow + b.centered() * 3.0f * b.s,
                     b.baseHue + 180.0f + t * 20.0f);
    pt.behavior = ParticleBehavior::Willow;
  }
}

void buildFountain(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float t = b.rand();
    const float h = t * 150.0f * b.s - 75.0f * b.s;
    const float r = std::sin(t * PI) * 60.0f * b.s;
    const float a = b.angle();
    b.add(std::cos(a) * r, h, std::sin(a) * r, b.baseHue + t * 60.0f);
  }
}

void buildVortex(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float t = static_cast<float>(i) / static_cast<float>(b.count);
    const float a = t * 12.0f * PI;
    const float r = (0.1f + 0.9f * t) * 95.0f * b.s;
    const float h = (t - 0.5f) * 60.0f * b.s;
    b.add(std::cos(a) * r, h, std::sin(a) * r, b.baseHue + t * 90.0f);
  }
}

void buildShockwave(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float r = std::sqrt(b.rand()) * 95.0f * b.s;
    const float a = b.angle();
    b.add(std::cos(a) * r, b.centered() * 6.0f * b.s, std::sin(a) * r,
          b.baseHue + r / (95.0f * b.s) * 40.0f);
  }
}

void buildSparkleCloud(ShapeBuilder &b) {
  const float side = 180.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    auto &pt = b.add(b.centered() * side, b.centered() * side, b.centered() * side,
                     b.baseHue + b.rand() * 60.0f);
    pt.behavior = ParticleBehavior::Glitter;
    pt.size = 1.0f + b.rand();
  }
}

void buildChaosScatter(ShapeBuilder &b) {
  const float side = 60.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    b.add(b.centered() * side, b.centered() * side, b.centered() * side,
          b.rand() * 360.0f);
  }
}

} // namespace

void registerEffectShapes(ShapeRegistry &registry) {
  using C = ShapeCategory;
  registry.add(ShapeKind::EXPLOSION_BURST, {"explosion_burst", "Burst", C::Effects, 1.0f}, buildExplosionBurst);
  registry.add(ShapeKind::RING_WAVE, {"ring_wave", "Ring Wave", C::Effects, 1.0f}, buildRingWave);
  registry.add(ShapeKind::DOUBLE_RING, {"double_ring", "Double Ring", C::Effects, 1.0f}, buildDoubleRing);
  registry.add(ShapeKind::CASCADE, {"cascade", "Cascade", C::Effects, 1.0f}, buildCascade);
  registry.add(ShapeKind::WATERFALL_3D, {"waterfall_3d", "Waterfall", C::Effects, 1.0f}, buildWaterfall3D);
  registry.add(ShapeKind::FOUNTAIN, {"fountain", "Fountain", C::Effects, 1.0f}, buildFountain);
  registry.add(ShapeKind::VORTEX, {"vortex", "Vortex", C::Effects, 1.0f}, buildVortex);
  registry.add(ShapeKind::SHOCKWAVE, {"shockwave", "Shockwave", C::Effects, 1.0f}, buildShockwave);
  registry.add(ShapeKind::SPARKLE_CLOUD, {"sparkle_cloud", "Sparkle Cloud", C::Effects, 1.0f}, buildSparkleCloud);
  registry.add(ShapeKind::CHAOS_SCATTER, {"chaos_scatter", "Chaos Scatter", C::Effects, 1.0f}, buildChaosScatter);
}

} // namespace PyroForge
