/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ShapeBuilders.hpp"
#include <array>

namespace PyroForge {

namespace {

float fraction(int i, int count) {
  return static_cast<float>(i) / static_cast<float>(count);
}

void buildCube(ShapeBuilder &b) {
  const float half = 25.0f * b.s * 0.5f;
  const int edgePoints = b.share(0.4f);
  for (int i = 0; i < b.count; ++i) {
    Vector3D p(b.centered() * 2.0f * half, b.centered() * 2.0f * half,
               b.centered() * 2.0f * half);
    if (i < edgePoints) {
      // Snap two axes to the surface to land on an edge
      const int openAxis = b.pick(3);
      const float sx = b.rand() < 0.5f ? -half : half;
      const float sy = b.rand() < 0.5f ? -half : half;
      if (openAxis == 0) {
        p.set(p.getX(), sx, sy);
      } else if (openAxis == 1) {
        p.set(sx, p.getY(), sy);
      } else {
        p.set(sx, sy, p.getZ());
      }
      b.add(p, b.baseHue).size = 4.0f;
    } else {
      const int axis = b.pick(3);
      const float side = b.rand() < 0.5f ? -half : half;
      if (axis == 0) {
        p.setX(side);
      } else if (axis == 1) {
        p.setY(side);
      } else {
        p.setZ(side);
      }
      auto &pt = b.add(p, b.baseHue + 20.0f);
      pt.size = 3.0f;
      pt.decay = 0.008f;
    }
  }
}

void buildPyramid(ShapeBuilder &b) {
  const float h = 40.0f * b.s;
  const float half = 30.0f * b.s * 0.5f;
  const Vector3D apex(0.0f, h * 0.5f, 0.0f);
  const std::array<Vector3D, 4> base{
      Vector3D(-half, -h * 0.5f, -half), Vector3D(half, -h * 0.5f, -half),
      Vector3D(half, -h * 0.5f, half), Vector3D(-half, -h * 0.5f, half)};
  for (int i = 0; i < b.count; ++i) {
    const int face = b.pick(5);
    Vector3D p;
    if (face < 4) {
      p = b.inTriangle(apex, base[face], base[(face + 1) % 4]);
    } else {
      p.set(b.centered() * 2.0f * half, -h * 0.5f, b.centered() * 2.0f * half);
    }
    b.add(p, b.baseHue + static_cast<float>(face) * 10.0f);
  }
}

void buildOctahedron(ShapeBuilder &b) {
  const float r = 35.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float sx = b.rand() < 0.5f ? -r : r;
    const float sy = b.rand() < 0.5f ? -r : r;
    const float sz = b.rand() < 0.5f ? -r : r;
    const Vector3D p = b.inTriangle(Vector3D(sx, 0, 0), Vector3D(0, sy, 0),
                                    Vector3D(0, 0, sz));
    b.add(p, b.baseHue + fraction(i, b.count) * 40.0f).size = 3.0f;
  }
}

void buildDodecahedron(ShapeBuilder &b) {
  const float phi = (1.0f + std::sqrt(5.0f)) * 0.5f;
  const float inv = 1.0f / phi;
  const std::array<Vector3D, 20> vertices{
      Vector3D(1, 1, 1),       Vector3D(1, 1, -1),      Vector3D(1, -1, 1),
      Vector3D(1, -1, -1),     Vector3D(-1, 1, 1),      Vector3D(-1, 1, -1),
      Vector3D(-1, -1, 1),     Vector3D(-1, -1, -1),    Vector3D(0, inv, phi),
      Vector3D(0, inv, -phi),  Vector3D(0, -inv, phi),  Vector3D(0, -inv, -phi),
      Vector3D(inv, phi, 0),   Vector3D(inv, -phi, 0),  Vector3D(-inv, phi, 0),
      Vector3D(-inv, -phi, 0), Vector3D(phi, 0, inv),   Vector3D(phi, 0, -inv),
      Vector3D(-phi, 0, inv),  Vector3D(-phi, 0, -inv)};
  const float r = 20.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const Vector3D &v = vertices[static_cast<size_t>(i) % vertices.size()];
    const Vector3D jitter(b.centered() * 4.0f, b.centered() * 4.0f,
                          b.centered() * 4.0f);
    b.add(v * r + jitter * b.s, b.baseHue + fraction(i, b.count) * 60.0f).size =
        4.0f;
  }
}

void buildIcosahedron(ShapeBuilder &b) {
  const float r = 35.0f * b.s;
  const float grid = 5.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const Vector3D p = b.direction() * r;
    b.add(std::round(p.getX() / grid) * grid, std::round(p.getY() / grid) * grid,
          std::round(p.getZ() / grid) * grid, b.baseHue + 200.0f);
  }
}

void buildCylinder(ShapeBuilder &b) {
  const float h = 60.0f * b.s;
  const float r = 25.0f * b.s;
  const int capPoints = b.share(0.2f);
  for (int i = 0; i < b.count; ++i) {
    const float a = b.angle();
    if (i < capPoints * 2) {
      const float rr = std::sqrt(b.rand()) * r;
      const float y = i < capPoints ? h * 0.5f : -h * 0.5f;
      b.add(std::cos(a) * rr, y, std::sin(a) * rr, b.baseHue + 30.0f);
    } else {
      b.add(std::cos(a) * r, b.centered() * h, std::sin(a) * r, b.baseHue);
    }
  }
}

void buildCone(ShapeBuilder &b) {
  const float h = 60.0f * b.s;
  const float r = 30.0f * b.s;
  const int basePoints = b.share(0.3f);
  for (int i = 0; i < b.count; ++i) {
    const float a = b.angle();
    if (i < basePoints) {
      const float rr = std::sqrt(b.rand()) * r;
      b.add(std::cos(a) * rr, -h * 0.5f, std::sin(a) * rr, b.baseHue + 30.0f);
    } else {
      const float t = b.rand();
      const float rr = (1.0f - t) * r;
      b.add(std::cos(a) * rr, t * h - h * 0.5f, std::sin(a) * rr,
            b.baseHue + t * 40.0f);
    }
  }
}

void buildTorus(ShapeBuilder &b) {
  const float R = 30.0f * b.s;
  const float r = 10.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float u = b.angle();
    const float v = b.angle();
    b.add((R + r * std::cos(v)) * std::cos(u), r * std::sin(v),
          (R + r * std::cos(v)) * std::sin(u), b.baseHue + u / TWO_PI * 60.0f);
  }
}

void buildTorusKnot(ShapeBuilder &b) {
  const float R = 20.0f * b.s;
  const float r = 6.0f * b.s;
  constexpr float p = 2.0f;
  constexpr float q = 3.0f;
  for (int i = 0; i < b.count; ++i) {
    const float t = fraction(i, b.count) * 3.0f * TWO_PI;
    const float radius = R + r * std::cos(q * t);
    const Vector3D jitter(b.centered(), b.centered(), b.centered());
    b.add(Vector3D(radius * std::cos(p * t), r * std::sin(q * t) * 2.0f,
                   radius * std::sin(p * t)) +
              jitter * (2.0f * b.s),
          b.baseHue + fraction(i, b.count) * 120.0f);
  }
}

void buildCapsule(ShapeBuilder &b) {
  const float h = 40.0f * b.s;
  const float r = 15.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float a = b.angle();
    const float region = b.rand();
    if (region < 0.5f) {
      b.add(std::cos(a) * r, b.centered() * h, std::sin(a) * r, b.baseHue);
    } else {
      Vector3D d = b.direction();
      const float cap = region < 0.75f ? h * 0.5f : -h * 0.5f;
      d.setY(std::abs(d.getY()) * (cap > 0.0f ? 1.0f : -1.0f));
      b.add(d * r + Vector3D(0.0f, cap, 0.0f), b.baseHue + 30.0f);
    }
  }
}

void buildPrism(ShapeBuilder &b) {
  const float h = 50.0f * b.s;
  const float r = 25.0f * b.s;
  std::array<Vector3D, 3> corners;
  for (size_t k = 0; k < corners.size(); ++k) {
    const float a = static_cast<float>(k) * TWO_PI / 3.0f;
    corners[k] = Vector3D(std::cos(a) * r, 0.0f, std::sin(a) * r);
  }
  for (int i = 0; i < b.count; ++i) {
    const int side = b.pick(3);
    const float t = b.rand();
    const Vector3D edge =
        corners[side] * (1.0f - t) + corners[(side + 1) % 3] * t;
    b.add(edge.getX(), b.centered() * h, edge.getZ(),
          b.baseHue + static_cast<float>(side) * 40.0f);
  }
}

void buildStar3D(ShapeBuilder &b) {
  constexpr int starPoints = 5;
  const float outer = 30.0f * b.s;
  const float inner = 12.0f * b.s;
  const float depth = 5.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const int vertex = i % (starPoints * 2);
    const bool isOuter = vertex % 2 == 0;
    const float a = static_cast<float>(vertex) * PI / starPoints - PI * 0.5f;
    const float r = (isOuter ? outer : inner) * (0.3f + 0.7f * b.rand());
    b.add(std::cos(a) * r, std::sin(a) * r, b.centered() * 2.0f * depth,
          b.baseHue + (isOuter ? 0.0f : 30.0f))
        .size = isOuter ? 8.0f : 4.0f;
  }
}

void buildCross3D(ShapeBuilder &b) {
  const float len = 40.0f * b.s;
  const float thick = 10.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const int axis = i % 3;
    const float along = b.centered() * len;
    const float u = b.centered() * thick;
    const float v = b.centered() * thick;
    if (axis == 0) {
      b.add(along, u, v, b.baseHue);
    } else if (axis == 1) {
      b.add(u, along, v, b.baseHue + 40.0f);
    } else {
      b.add(u, v, along, b.baseHue + 80.0f);
    }
  }
}

void buildDiamond(ShapeBuilder &b) {
  const float r = 35.0f * b.s;
  const float h = 40.0f * b.s;
  constexpr int facets = 8;
  for (int i = 0; i < b.count; ++i) {
    const float a = static_cast<float>(i % facets) * TWO_PI / facets;
    const bool top = b.rand() < 0.3f;
    const float t = b.rand();
    const float rr = top ? r : r * (1.0f - t);
    const float y = top ? h * 0.25f * t : -h * 0.75f * t;
    b.add(std::cos(a) * rr, y, std::sin(a) * rr, 200.0f).size = 4.0f;
  }
}

void buildMobius(ShapeBuilder &b) {
  const float R = 30.0f * b.s;
  const float w = 15.0f * b.s;
  for (int i = 0; i < b.count; ++i) {
    const float u = b.angle();
    const float v = b.centered() * w;
    b.add((R + v * std::cos(u * 0.5f)) * std::cos(u), v * std::sin(u * 0.5f),
          (R + v * std::cos(u * 0.5f)) * std::sin(u),
          b.baseHue + u / TWO_PI * 90.0f);
  }
}

void buildKleinBottle(ShapeBuilder &b) {
  const float k = 15.0f * b.s / 6.0f;
  for (int i = 0; i < b.count; ++i) {
    const float u = b.angle();
    const float v = b.angle();
    const float r = 4.0f * (1.0f - std::cos(u) * 0.5f);
    float x;
    float y;
    if (u < PI) {
      x = 6.0f * std::cos(u) * (1.0f + std::sin(u)) + r * std::cos(u) * std::cos(v);
      y = 16.0f * std::sin(u) + r * std::sin(u) * std::cos(v);
    } else {
      x = 6.0f * std::cos(u) * (1.0f + std::sin(u)) + r * std::cos(v + PI);
      y = 16.0f * std::sin(u);
    }
    const float z = r * std::sin(v);
    b.add(x * k, (y - 5.0f) * k, z * k, b.baseHue + u / TWO_PI * 120.0f);
  }
}

void buildHelixTube(ShapeBuilder &b) {
  const float h = 80.0f * b.s;
  const float r = 20.0f * b.s;
  constexpr float turns = 3.0f;
  for (int i = 0; i < b.count; ++i) {
    const float t = b.rand();
    const float a = t * turns * TWO_PI + (i % 2 == 0 ? 0.0f : PI);
    b.add(std::cos(a) * r, t * h - h * 0.5f, std::sin(a) * r,
          b.baseHue + (i % 2 == 0 ? 0.0f : 180.0f));
  }
}

void buildSpring(ShapeBuilder &b) {
  const float R = 30.0f * b.s;
  const float h = 80.0f * b.s;
  constexpr float turns = 5.0f;
  for (int i = 0; i < b.count; ++i) {
    const float t = fraction(i, b.count);
    const float a = t * turns * TWO_PI;
    const float wire = 3.0f * b.s;
    b.add(std::cos(a) * R + b.centered() * wire, t * h - h * 0.5f,
          std::sin(a) * R + b.centered() * wire, b.baseHue + t * 90.0f);
  }
}

void buildNestedSpheres(ShapeBuilder &b) {
  constexpr int layers = 3;
  for (int i = 0; i < b.count; ++i) {
    const int layer = i % layers + 1;
    const float r = static_cast<float>(layer) / layers * 35.0f * b.s;
    b.add(b.direction() * r, b.baseHue + static_cast<float>(layer) * 60.0f).size =
        2.0f + static_cast<float>(layers - layer) * 2.0f;
  }
}

} // namespace

void registerGeometryShapes(ShapeRegistry &registry) {
  using C = ShapeCategory;
  registry.add(ShapeKind::SPHERE, {"sphere", "Sphere", C::BasicGeometry, 0.1f}, buildSphere);
  registry.add(ShapeKind::CUBE, {"cube", "Cube", C::BasicGeometry, 1.0f}, buildCube);
  registry.add(ShapeKind::PYRAMID, {"pyramid", "Pyramid", C::BasicGeometry, 1.0f}, buildPyramid);
  registry.add(ShapeKind::OCTAHEDRON, {"octahedron", "Octahedron", C::BasicGeometry, 1.0f}, buildOctahedron);
  registry.add(ShapeKind::DODECAHEDRON, {"dodecahedron", "Dodecahedron", C::BasicGeometry, 1.0f}, buildDodecahedron);
  registry.add(ShapeKind::ICOSAHEDRON, {"icosahedron", "Icosahedron", C::BasicGeometry, 1.0f}, buildIcosahedron);
  registry.add(ShapeKind::CYLINDER, {"cylinder", "Cylinder", C::BasicGeometry, 1.0f}, buildCylinder);
  registry.add(ShapeKind::CONE, {"cone", "Cone", C::BasicGeometry, 1.0f}, buildCone);
  registry.add(ShapeKind::TORUS, {"torus", "Torus", C::BasicGeometry, 1.0f}, buildTorus);
  registry.add(ShapeKind::TORUS_KNOT, {"torus_knot", "Torus Knot", C::BasicGeometry, 1.0f}, buildTorusKnot);

  registry.add(ShapeKind::CAPSULE, {"capsule", "Capsule", C::AdvancedGeometry, 1.0f}, buildCapsule);
  registry.add(ShapeKind::PRISM, {"prism", "Prism", C::AdvancedGeometry, 1.0f}, buildPrism);
  registry.add(ShapeKind::STAR_3D, {"star_3d", "Star", C::AdvancedGeometry, 1.0f}, buildStar3D);
  registry.add(ShapeKind::CROSS_3D, {"cross_3d", "Cross", C::AdvancedGeometry, 1.0f}, buildCross3D);
  registry.add(ShapeKind::DIAMOND, {"diamond", "Diamond", C::AdvancedGeometry, 1.0f}, buildDiamond);
  registry.add(ShapeKind::MOBIUS, {"mobius", "Mobius Strip", C::AdvancedGeometry, 1.0f}, buildMobius);
  registry.add(ShapeKind::KLEIN_BOTTLE, {"klein_bottle", "Klein Bottle", C::AdvancedGeometry, 1.0f}, buildKleinBottle);
  registry.add(ShapeKind::HELIX_TUBE, {"helix_tube", "Double Helix", C::AdvancedGeometry, 1.0f}, buildHelixTube);
  registry.add(ShapeKind::SPRING, {"spring", "Spring", C::AdvancedGeometry, 1.0f}, buildSpring);
  registry.add(ShapeKind::NESTED_SPHERES, {"nested_spheres", "Nested Spheres", C::AdvancedGeometry, 0.1f}, buildNestedSpheres);
}

} // namespace PyroForge
