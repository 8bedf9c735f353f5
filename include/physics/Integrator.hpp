/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INTEGRATOR_HPP
#define INTEGRATOR_HPP

#include "utils/Vector3D.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace PyroForge {

enum class IntegratorKind : uint8_t { Euler = 0, Verlet = 1, RK4 = 2 };

/**
 * @brief Kinematic state advanced by an Integrator
 *
 * previousPosition is the Verlet history. It is only meaningful while
 * hasPreviousPosition is true; Euler and RK4 leave it alone.
 */
struct IntegrationState {
  Vector3D position;
  Vector3D velocity;
  Vector3D previousPosition;
  bool hasPreviousPosition{false};
};

/**
 * @brief Acceleration as a function of position and velocity
 */
using AccelerationFn =
    std::function<Vector3D(const Vector3D &position, const Vector3D &velocity)>;

/**
 * @brief Numeric integration strategy
 */
class Integrator {
public:
  virtual ~Integrator() = default;

  /**
   * @brief Advances state by dt. A non-positive dt leaves state untouched.
   */
  virtual void integrate(IntegrationState &state,
                         const AccelerationFn &acceleration,
                         float dt) const = 0;

  virtual IntegratorKind getKind() const = 0;
};

// v' = v + a dt, p' = p + v' dt
class EulerIntegrator : public Integrator {
public:
  void integrate(IntegrationState &state, const AccelerationFn &acceleration,
                 float dt) const override;
  IntegratorKind getKind() const override { return IntegratorKind::Euler; }
};

// Position Verlet with the history kept in the state
class VerletIntegrator : public Integrator {
public:
  void integrate(IntegrationState &state, const AccelerationFn &acceleration,
                 float dt) const override;
  IntegratorKind getKind() const override { return IntegratorKind::Verlet; }
};

// Classic fourth-order Runge-Kutta
class RK4Integrator : public Integrator {
public:
  void integrate(IntegrationState &state, const AccelerationFn &acceleration,
                 float dt) const override;
  IntegratorKind getKind() const override { return IntegratorKind::RK4; }
};

std::unique_ptr<Integrator> createIntegrator(IntegratorKind kind);

const char *integratorKindToString(IntegratorKind kind);
std::optional<IntegratorKind> integratorKindFromString(std::string_view name);

} // namespace PyroForge

#endif // INTEGRATOR_HPP
