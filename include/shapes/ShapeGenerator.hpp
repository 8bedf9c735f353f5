/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHAPE_GENERATOR_HPP
#define SHAPE_GENERATOR_HPP

/**
 * @file ShapeGenerator.hpp
 * @brief Procedural point clouds for explosion shapes
 *
 * Each shape kind is registered with a generator function by its category
 * module. Generation always returns exactly the requested number of points
 * and then normalizes the cloud so its farthest point sits at
 * NORMALIZED_EXTENT * scale from the center, which keeps every shape the
 * same visual size for a given scale.
 */

#include "shapes/ShapeTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

namespace PyroForge {

struct ShapeBuilder;
using ShapeGeneratorFn = void (*)(ShapeBuilder &builder);

struct ShapeEntry {
  ShapeInfo info;
  ShapeGeneratorFn generate{nullptr};
};

/**
 * @brief Kind -> generator lookup, populated once per process
 */
class ShapeRegistry {
public:
  static ShapeRegistry &Instance() {
    static ShapeRegistry instance;
    return instance;
  }

  /**
   * @brief Register or replace the generator for a kind
   */
  void add(ShapeKind kind, const ShapeInfo &info, ShapeGeneratorFn generate);

  const ShapeEntry *find(ShapeKind kind) const;
  bool contains(ShapeKind kind) const { return find(kind) != nullptr; }
  size_t size() const { return m_entries.size(); }

  const boost::container::flat_map<ShapeKind, ShapeEntry> &entries() const {
    return m_entries;
  }

private:
  ShapeRegistry();
  ShapeRegistry(const ShapeRegistry &) = delete;
  ShapeRegistry &operator=(const ShapeRegistry &) = delete;

  boost::container::flat_map<ShapeKind, ShapeEntry> m_entries;
};

class ShapeGenerator {
public:
  static constexpr float NORMALIZED_EXTENT = 40.0f;

  /**
   * @brief Generate a shape point cloud
   * @param kind shape to build; unregistered kinds build a sphere
   * @param count number of points; <= 0 returns an empty list
   * @param scale size multiplier applied after normalization
   * @param baseHue hue the shape's palette is built around (degrees)
   * @param rng randomness source
   * @return exactly count points
   */
  static std::vector<ShapePoint> generate(ShapeKind kind, int count,
                                          float scale, float baseHue,
                                          std::mt19937 &rng);

  /**
   * @brief Rescale offsets so the farthest point is at targetExtent
   *
   * A cloud with zero extent is left untouched.
   */
  static void normalize(std::vector<ShapePoint> &points, float targetExtent);

  static ShapeInfo getInfo(ShapeKind kind);

  // Shells that scatter as loose sparks instead of holding a figure
  static bool isBurstShape(ShapeKind kind);

  static bool isRegistered(ShapeKind kind);
  static std::vector<ShapeKind> getAllKinds();
  static std::vector<ShapeKind> getKindsByCategory(ShapeCategory category);

  // Weighted pick over every registered kind
  static ShapeKind pickWeighted(std::mt19937 &rng);

  // Uniform pick from list, SPHERE when empty
  static ShapeKind pickFrom(const std::vector<ShapeKind> &kinds,
                            std::mt19937 &rng);

  static const char *toString(ShapeKind kind);
  static std::optional<ShapeKind> fromString(std::string_view id);
};

} // namespace PyroForge

#endif // SHAPE_GENERATOR_HPP
