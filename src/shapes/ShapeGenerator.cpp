/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "shapes/ShapeGenerator.hpp"
#include "ShapeBuilders.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace PyroForge {

const char *shapeCategoryToString(ShapeCategory category) {
  switch (category) {
  case ShapeCategory::BasicGeometry:
    return "basic_geometry";
  case ShapeCategory::AdvancedGeometry:
    return "advanced_geometry";
  case ShapeCategory::Nature:
    return "nature";
  case ShapeCategory::Cosmos:
    return "cosmos";
  case ShapeCategory::Culture:
    return "culture";
  case ShapeCategory::Effects:
    return "effects";
  case ShapeCategory::ClassicPatterns:
    return "classic_patterns";
  default:
    return "unknown";
  }
}

void buildSphere(ShapeBuilder &b) {
  const float r = 30.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    b.add(b.direction() * r,
          b.baseHue + static_cast<float>(i) / static_cast<float>(b.count) * 60.0f);
  }
}

ShapeRegistry::ShapeRegistry() {
  m_entries.reserve(SHAPE_KIND_COUNT);
  registerGeometryShapes(*this);
  registerNatureShapes(*this);
  registerCosmosShapes(*this);
  registerCultureShapes(*this);
  registerEffectShapes(*this);
  registerPatternShapes(*this);

  if (m_entries.size() != SHAPE_KIND_COUNT) {
    SHAPE_WARN(std::format("{} of {} shape kinds registered", m_entries.size(),
                           SHAPE_KIND_COUNT));
  }
}

void ShapeRegistry::add(ShapeKind kind, const ShapeInfo &info,
                        ShapeGeneratorFn generate) {
  if (generate == nullptr) {
    SHAPE_ERROR(std::format("Null generator for shape '{}'", info.id));
    return;
  }
  m_entries[kind] = ShapeEntry{info, generate};
}

const ShapeEntry *ShapeRegistry::find(ShapeKind kind) const {
  auto it = m_entries.find(kind);
  return it != m_entries.end() ? &it->second : nullptr;
}

std::vector<ShapePoint> ShapeGenerator::generate(ShapeKind kind, int count,
                                                 float scale, float baseHue,
                                                 std::mt19937 &rng) {
  std::vector<ShapePoint> points;
  if (count <= 0) {
    return points;
  }
  points.reserve(static_cast<size_t>(count));

  ShapeBuilder builder{points, rng, count, 1.0f, baseHue};
  const ShapeEntry *entry = ShapeRegistry::Instance().find(kind);
  if (entry != nullptr) {
    entry->generate(builder);
  } else {
    SHAPE_WARN(std::format("Shape kind {} not registered, using sphere",
                           static_cast<int>(kind)));
    buildSphere(builder);
  }

  if (points.size() != static_cast<size_t>(count)) {
    // Generators own the exact count; trim or pad with center-ring points
    SHAPE_ERROR(std::format("Shape '{}' produced {} of {} points", toString(kind),
                            points.size(), count));
    points.resize(static_cast<size_t>(count),
                  ShapePoint{Vector3D(), baseHue, {}, {}, {}, {}});
  }

  normalize(points, NORMALIZED_EXTENT * std::max(scale, 0.0f));
  return points;
}

void ShapeGenerator::normalize(std::vector<ShapePoint> &points,
                               float targetExtent) {
  float maxExtentSq = 0.0f;
  for (const auto &p : points) {
    maxExtentSq = std::max(maxExtentSq, p.offset.lengthSquared());
  }
  if (maxExtentSq <= 0.0f) {
    return;
  }
  const float factor = targetExtent / std::sqrt(maxExtentSq);
  for (auto &p : points) {
    p.offset *= factor;
  }
}

ShapeInfo ShapeGenerator::getInfo(ShapeKind kind) {
  const ShapeEntry *entry = ShapeRegistry::Instance().find(kind);
  return entry != nullptr ? entry->info : ShapeInfo{};
}

bool ShapeGenerator::isBurstShape(ShapeKind kind) {
  switch (kind) {
  case ShapeKind::SPHERE:
  case ShapeKind::NESTED_SPHERES:
  case ShapeKind::EXPLOSION_BURST:
  case ShapeKind::FIREWORK_CLASSIC:
    return true;
  default:
    return false;
  }
}

bool ShapeGenerator::isRegistered(ShapeKind kind) {
  return ShapeRegistry::Instance().contains(kind);
}

std::vector<ShapeKind> ShapeGenerator::getAllKinds() {
  std::vector<ShapeKind> kinds;
  const auto &entries = ShapeRegistry::Instance().entries();
  kinds.reserve(entries.size());
  for (const auto &[kind, entry] : entries) {
    kinds.push_back(kind);
  }
  return kinds;
}

std::vector<ShapeKind> ShapeGenerator::getKindsByCategory(ShapeCategory category) {
  std::vector<ShapeKind> kinds;
  for (const auto &[kind, entry] : ShapeRegistry::Instance().entries()) {
    if (entry.info.category == category) {
      kinds.push_back(kind);
    }
  }
  return kinds;
}

ShapeKind ShapeGenerator::pickWeighted(std::mt19937 &rng) {
  const auto &entries = ShapeRegistry::Instance().entries();
  float total = 0.0f;
  for (const auto &[kind, entry] : entries) {
    total += std::max(entry.info.weight, 0.0f);
  }
  if (total <= 0.0f) {
    return ShapeKind::SPHERE;
  }

  float roll = Random::unit(rng) * total;
  for (const auto &[kind, entry] : entries) {
    roll -= std::max(entry.info.weight, 0.0f);
    if (roll < 0.0f) {
      return kind;
    }
  }
  return entries.rbegin()->first;
}

ShapeKind ShapeGenerator::pickFrom(const std::vector<ShapeKind> &kinds,
                                   std::mt19937 &rng) {
  if (kinds.empty()) {
    return ShapeKind::SPHERE;
  }
  return kinds[Random::index(rng, kinds.size())];
}

const char *ShapeGenerator::toString(ShapeKind kind) {
  const ShapeEntry *entry = ShapeRegistry::Instance().find(kind);
  return entry != nullptr ? entry->info.id : "unknown";
}

std::optional<ShapeKind> ShapeGenerator::fromString(std::string_view id) {
  for (const auto &[kind, entry] : ShapeRegistry::Instance().entries()) {
    if (id == entry.info.id) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace PyroForge
