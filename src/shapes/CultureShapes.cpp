/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ShapeBuilders.hpp"
#include <algorithm>

namespace PyroForge {

namespace {

void buildHeart3D(ShapeBuilder &b) {
  const float k = 1.8f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float t = b.angle();
    const float sinT = std::sin(t);
    const float x = 16.0f * sinT * sinT * sinT;
    const float y = 13.0f * std::cos(t) - 5.0f * std::cos(2.0f * t) -
                    2.0f * std::cos(3.0f * t) - std::cos(4.0f * t);
    // Thicker in the middle, thin at the point
    const float depth = (1.0f - std::abs(x) / 16.0f) * 6.0f * b.centered();
    auto &pt = b.add(x * k, y * k, depth * k, 340.0f + b.rand() * 40.0f);
    pt.size = 5.0f + b.rand() * 3.0f;
    pt.decay = 0.006f;
  }
}

void buildCrown3D(ShapeBuilder &b) {
  constexpr int spikes = 5;
  const float R = 25.0f * b.s;
  const float h = 15.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float a = b.angle();
    const float spike = std::abs(std::cos(a * spikes * 0.5f));
    const float top = h + spike * spike * 20.0f * b.s;
    b.add(std::cos(a) * R, b.rand() * top - h * 0.5f, std::sin(a) * R, 50.0f)
        .size = 6.0f;
  }
}

void buildDragon3D(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float p = b.rand();
    const float a = p * 10.0f * PI;
    const Vector3D spine(std::sin(a * 0.25f) * 75.0f * b.s,
                         std::cos(a * 0.35f) * 75.0f * b.s,
                         (p - 0.5f) * 180.0f * b.s);
    const float radius = (1.0f + std::sin(25.0f * p)) * 12.0f * b.s;
    b.add(spine + b.direction() * (radius * std::sqrt(b.rand())),
          b.baseHue + p * 60.0f);
  }
}

void buildPhoenix(ShapeBuilder &b) {
  const int tail = b.share(0.25f);
  for (int i = 0; i < b.count; ++i) {
    if (i < tail) {
      const float t = b.rand();
      auto &pt = b.add(b.centered() * 10.0f * b.s * t, -t * 40.0f * b.s,
                       b.centered() * 6.0f * b.s, 10.0f);
      pt.behavior = ParticleBehavior::Willow;
    } else {
      auto &pt = b.add(wingPoint(b, 45.0f * b.s, 25.0f * b.s),
                       20.0f + b.rand() * 40.0f);
      pt.size = 6.0f;
      pt.behavior = ParticleBehavior::Default;
    }
  }
}

void buildYinYang(ShapeBuilder &b) {
  const float R = 35.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float a = b.angle();
    const float r = std::sqrt(b.rand()) * R;
    const float x = std::cos(a) * r;
    const float y = std::sin(a) * r;
    // Light half: right side plus the upper lobe, minus the lower lobe
    const float upper = x * x + (y - R * 0.5f) * (y - R * 0.5f);
    const float lower = x * x + (y + R * 0.5f) * (y + R * 0.5f);
    const float lobe = R * R * 0.25f;
    bool light = x > 0.0f;
    if (upper < lobe) {
      light = true;
    } else if (lower < lobe) {
      light = false;
    }
    b.add(x, y, b.centered() * 2.0f * b.s, light ? b.baseHue : b.baseHue + 180.0f);
  }
}

void buildLotus(ShapeBuilder &b) {
  constexpr int layers = 4;
  for (int i = 0; i < b.count; ++i) {
    const int layer = i % layers;
    const int petals = 6 + layer * 2;
    const float a = b.angle();
    const float petal = std::abs(std::sin(a * static_cast<float>(petals) * 0.5f));
    const float r = (10.0f + static_cast<float>(layer) * 7.0f) * b.s * petal *
                    (0.5f + 0.5f * b.rand());
    const float y = (static_cast<float>(layers - layer) * 4.0f + petal * 6.0f) * b.s;
    b.add(std::cos(a) * r, y, std::sin(a) * r,
          b.baseHue + 300.0f + static_cast<float>(layer) * 10.0f);
  }
}

void buildLantern(ShapeBuilder &b) {
  const int tassels = b.share(0.2f);
  const float R = 20.0f * b.s;
  const float h = 35.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float a = b.angle();
    if (i < tassels) {
      const float t = b.rand();
      auto &pt = b.add(std::cos(a) * 3.0f * b.s, -h * 0.5f - t * 15.0f * b.s,
                       std::sin(a) * 3.0f * b.s, 50.0f);
      pt.behavior = ParticleBehavior::Willow;
    } else {
      const float t = b.centered() * 2.0f;
      const float r = R * std::sqrt(std::max(0.0f, 1.0f - t * t * 0.7f));
      b.add(std::cos(a) * r, t * h * 0.5f, std::sin(a) * r, 0.0f + b.rand() * 15.0f);
    }
  }
}

void buildFireworkClassic(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float dist = std::pow(b.rand(), 0.15f) * 100.0f * b.s;
    b.add(b.direction() * dist, b.baseHue + b.rand() * 30.0f);
  }
}

void buildRibbon(ShapeBuilder &b) {
  for (int i = 0; i < b.count; ++i) {
    const float t = b.rand();
    const float a = t * 2.0f * TWO_PI;
    const float band = b.centered() * 8.0f * b.s;
    b.add((t - 0.5f) * 80.0f * b.s, std::sin(a) * 20.0f * b.s + band,
          std::cos(a) * 10.0f * b.s, b.baseHue + t * 120.0f);
  }
}

void buildFireworkWillow(ShapeBuilder &b) {
  const float r = 20.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    auto &pt = b.add(b.direction() * r, b.baseHue + b.rand() * 20.0f);
    pt.behavior = ParticleBehavior::Willow;
    pt.decay = 0.008f;
  }
}

} // namespace

void registerCultureShapes(ShapeRegistry &registry) {
  using C = ShapeCategory;
  registry.add(ShapeKind::HEART_3D, {"heart_3d", "Heart", C::Culture, 1.5f}, buildHeart3D);
  registry.add(ShapeKind::CROWN_3D, {"crown_3d", "Crown", C::Culture, 1.0f}, buildCrown3D);
  registry.add(ShapeKind::DRAGON_3D, {"dragon_3d", "Dragon", C::Culture, 1.0f}, buildDragon3D);
  registry.add(ShapeKind::PHOENIX, {"phoenix", "Phoenix", C::Culture, 1.0f}, buildPhoenix);
  registry.add(ShapeKind::YIN_YANG, {"yin_yang", "Yin Yang", C::Culture, 1.0f}, buildYinYang);
  registry.add(ShapeKind::LOTUS, {"lotus", "Lotus", C::Culture, 1.0f}, buildLotus);
  registry.add(ShapeKind::LANTERN, {"lantern", "Lantern", C::Culture, 1.0f}, buildLantern);
  registry.add(ShapeKind::FIREWORK_CLASSIC, {"firework_classic", "Classic Peony", C::Culture, 1.0f}, buildFireworkClassic);
  registry.add(ShapeKind::RIBBON, {"ribbon", "Ribbon", C::Culture, 1.0f}, buildRibbon);
  registry.add(ShapeKind::FIREWORK_WILLOW, {"firework_willow", "Willow", C::Culture, 1.0f}, buildFireworkWillow);
}

} // namespace PyroForge
