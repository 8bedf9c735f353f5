/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "trajectory/TrajectoryCalculator.hpp"
#include "core/Logger.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace PyroForge {

namespace {

void applyGravity(Vector3D &v, float gravity, float factor, float frames) {
  v.setY(v.getY() - gravity * factor * frames);
}

void linear(Vector3D &v, float, float g, float f, std::mt19937 &) {
  applyGravity(v, g, 1.5f, f);
}

void spiral(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  const float angle = t * 10.0f;
  v.setX(v.getX() + std::cos(angle) * 0.04f * f);
  v.setZ(v.getZ() + std::sin(angle) * 0.04f * f);
  applyGravity(v, g, 1.5f, f);
}

void zigzag(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  v.setX(v.getX() + std::cos(t * 8.0f) * 0.05f * f);
  applyGravity(v, g, 1.5f, f);
}

void accelerate(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  if (t < 0.5f) {
    applyGravity(v, g, 1.5f, f);
  } else if (t < 1.0f) {
    v.setY(v.getY() + 0.08f * f);
  } else {
    applyGravity(v, g, 2.0f, f);
  }
}

void doubleAccelerate(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  if (t < 0.3f) {
    applyGravity(v, g, 1.2f, f);
  } else if (t < 0.5f) {
    v.setY(v.getY() + 0.1f * f);
  } else if (t < 0.8f) {
    applyGravity(v, g, 1.0f, f);
  } else if (t < 1.0f) {
    v.setY(v.getY() + 0.15f * f);
  } else {
    applyGravity(v, g, 2.0f, f);
  }
}

void tripleAccelerate(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  if (t < 0.2f) {
    applyGravity(v, g, 1.0f, f);
  } else if (t < 0.3f) {
    v.setY(v.getY() + 0.1f * f);
  } else if (t < 0.5f) {
    applyGravity(v, g, 0.8f, f);
  } else if (t < 0.6f) {
    v.setY(v.getY() + 0.12f * f);
  } else if (t < 0.8f) {
    applyGravity(v, g, 0.6f, f);
  } else if (t < 0.9f) {
    v.setY(v.getY() + 0.15f * f);
  } else {
    applyGravity(v, g, 2.0f, f);
  }
}

void decelerate(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  // Per-frame retention, raised to the frame count of this step
  const float damping = std::pow(std::max(0.9f, 1.0f - t * 0.1f), f);
  applyGravity(v, g, 1.5f, f);
  v.setX(v.getX() * damping);
  v.setZ(v.getZ() * damping);
}

void mixedSpeed(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  const float cycle = std::sin(t * 4.0f) * 0.5f + 0.5f;
  applyGravity(v, g, 0.8f + cycle * 0.8f, f);
  if (cycle > 0.7f) {
    v.setY(v.getY() + 0.05f * f);
  }
}

void bezierCurve(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  const float u = std::min(1.0f, t * 0.5f);
  v.setX(v.getX() + std::sin(u * PI) * 2.0f * 0.02f * f);
  applyGravity(v, g, 1.5f, f);
}

void parabola(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  const float u = std::min(1.0f, t / 1.5f);
  v.setX(v.getX() + (1.0f - u) * 0.05f * f);
  applyGravity(v, g, 1.5f, f);
}

void sineWave(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  v.setX(v.getX() + std::sin(t * 6.0f) * 1.5f * 0.03f * f);
  v.setZ(v.getZ() + std::cos(t * 6.0f) * 0.8f * 0.03f * f);
  applyGravity(v, g, 1.5f, f);
}

void helix(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  const float angle = t * 8.0f;
  const float radius = 0.4f + t * 0.1f;
  v.setX(v.getX() + std::cos(angle) * radius * 0.1f * f);
  v.setZ(v.getZ() + std::sin(angle) * radius * 0.1f * f);
  applyGravity(v, g, 1.2f, f);
}

void curve(Vector3D &v, float angle, float f) {
  v.setX(v.getX() + std::sin(angle) * 0.06f * f);
  v.setZ(v.getZ() + std::cos(angle) * 0.04f * f);
}

void linearToCurve(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  if (t < 1.0f) {
    applyGravity(v, g, 1.5f, f);
  } else {
    curve(v, (t - 1.0f) * 5.0f, f);
    applyGravity(v, g, 1.8f, f);
  }
}

void curveToLinear(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  if (t < 1.0f) {
    curve(v, t * 5.0f, f);
    applyGravity(v, g, 1.2f, f);
  } else {
    applyGravity(v, g, 1.5f, f);
  }
}

void multiSegment(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  static constexpr std::array<float, 5> headings{0.0f, PI / 4.0f, -PI / 4.0f,
                                                 PI / 2.0f, 0.0f};
  const size_t segment = std::min(static_cast<size_t>(std::max(0.0f, t / 0.5f)),
                                  headings.size() - 1);
  v.setX(v.getX() + std::sin(headings[segment]) * 0.06f * f);
  v.setZ(v.getZ() + std::cos(headings[segment]) * 0.04f * f);
  applyGravity(v, g, 1.5f, f);
}

void wobble(Vector3D &v, float, float g, float f, std::mt19937 &rng) {
  v.setX(v.getX() + (Random::unit(rng) - 0.5f) * 0.1f * f);
  v.setZ(v.getZ() + (Random::unit(rng) - 0.5f) * 0.1f * f);
  applyGravity(v, g, 1.5f, f);
}

void fallRise(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  if (t < 0.3f) {
    applyGravity(v, g, 2.5f, f);
  } else if (t < 0.6f) {
    v.setY(v.getY() + 0.2f * f);
  } else {
    applyGravity(v, g, 1.5f, f);
  }
}

void orbit(Vector3D &v, float t, float g, float f, std::mt19937 &) {
  constexpr float radius = 0.6f;
  const float angle = t * 6.0f;
  // Lateral velocity is replaced, not accumulated, so it takes no frame factor
  v.setX(std::cos(angle) * radius * 0.05f);
  v.setZ(std::sin(angle) * radius * 0.05f);
  applyGravity(v, g, 1.3f, f);
}

} // namespace

TrajectoryCalculator::TrajectoryCalculator(TrajectoryKind kind, uint32_t seed)
    : m_kind(kind < TrajectoryKind::COUNT ? kind : TrajectoryKind::LINEAR),
      m_fn(TrajectoryRegistry::Instance().getFunction(m_kind)), m_rng(seed) {}

Vector3D TrajectoryCalculator::calculate(const Vector3D &velocity, float gravity,
                                         float dt) {
  if (!(dt > 0.0f)) {
    return velocity;
  }
  m_lifeTime += dt;
  Vector3D result = velocity;
  m_fn(result, m_lifeTime, gravity, dt * 60.0f, m_rng);
  return result;
}

TrajectoryRegistry::TrajectoryRegistry() {
  auto add = [this](TrajectoryKind kind, const char *id, const char *name,
                    TrajectoryFn fn) {
    m_entries[static_cast<size_t>(kind)] = Entry{TrajectoryInfo{id, name}, fn};
  };

  add(TrajectoryKind::LINEAR, "linear", "Linear", linear);
  add(TrajectoryKind::SPIRAL, "spiral", "Spiral", spiral);
  add(TrajectoryKind::ZIGZAG, "zigzag", "Zigzag", zigzag);
  add(TrajectoryKind::ACCELERATE, "accelerate", "Accelerate", accelerate);
  add(TrajectoryKind::DOUBLE_ACCELERATE, "double_accelerate", "Double Burn", doubleAccelerate);
  add(TrajectoryKind::TRIPLE_ACCELERATE, "triple_accelerate", "Triple Burn", tripleAccelerate);
  add(TrajectoryKind::DECELERATE, "decelerate", "Decelerate", decelerate);
  add(TrajectoryKind::MIXED_SPEED, "mixed_speed", "Mixed Speed", mixedSpeed);
  add(TrajectoryKind::BEZIER_CURVE, "bezier_curve", "Bezier Curve", bezierCurve);
  add(TrajectoryKind::PARABOLA, "parabola", "Parabola", parabola);
  add(TrajectoryKind::SINE_WAVE, "sine_wave", "Sine Wave", sineWave);
  add(TrajectoryKind::HELIX, "helix", "Helix", helix);
  add(TrajectoryKind::LINEAR_TO_CURVE, "linear_to_curve", "Linear to Curve", linearToCurve);
  add(TrajectoryKind::CURVE_TO_LINEAR, "curve_to_linear", "Curve to Linear", curveToLinear);
  add(TrajectoryKind::MULTI_SEGMENT, "multi_segment", "Multi Segment", multiSegment);
  add(TrajectoryKind::WOBBLE, "wobble", "Wobble", wobble);
  add(TrajectoryKind::FALL_RISE, "fall_rise", "Fall and Rise", fallRise);
  add(TrajectoryKind::ORBIT, "orbit", "Orbit", orbit);

  for (size_t i = 0; i < m_entries.size(); ++i) {
    if (m_entries[i].fn == nullptr) {
      TRAJECTORY_ERROR(std::format("Trajectory kind {} has no rule, using linear", i));
      m_entries[i] = Entry{TrajectoryInfo{}, linear};
    }
  }
}

TrajectoryFn TrajectoryRegistry::getFunction(TrajectoryKind kind) const {
  const size_t index = static_cast<size_t>(kind);
  if (index >= m_entries.size()) {
    return m_entries[static_cast<size_t>(TrajectoryKind::LINEAR)].fn;
  }
  return m_entries[index].fn;
}

const TrajectoryInfo &TrajectoryRegistry::getInfo(TrajectoryKind kind) const {
  const size_t index = static_cast<size_t>(kind);
  if (index >= m_entries.size()) {
    return m_entries[static_cast<size_t>(TrajectoryKind::LINEAR)].info;
  }
  return m_entries[index].info;
}

std::vector<TrajectoryKind> TrajectoryRegistry::allKinds() {
  std::vector<TrajectoryKind> kinds;
  kinds.reserve(TRAJECTORY_KIND_COUNT);
  for (size_t i = 0; i < TRAJECTORY_KIND_COUNT; ++i) {
    kinds.push_back(static_cast<TrajectoryKind>(i));
  }
  return kinds;
}

TrajectoryKind TrajectoryRegistry::pickFrom(const std::vector<TrajectoryKind> &kinds,
                                            std::mt19937 &rng) {
  if (kinds.empty()) {
    return TrajectoryKind::LINEAR;
  }
  return kinds[Random::index(rng, kinds.size())];
}

const char *TrajectoryRegistry::toString(TrajectoryKind kind) {
  return Instance().getInfo(kind).id;
}

std::optional<TrajectoryKind> TrajectoryRegistry::fromString(std::string_view id) {
  const auto &registry = Instance();
  for (size_t i = 0; i < TRAJECTORY_KIND_COUNT; ++i) {
    if (id == registry.m_entries[i].info.id) {
      return static_cast<TrajectoryKind>(i);
    }
  }
  return std::nullopt;
}

} // namespace PyroForge
