/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/Integrator.hpp"

namespace PyroForge {

void EulerIntegrator::integrate(IntegrationState &state,
                                const AccelerationFn &acceleration,
                                float dt) const {
  if (!(dt > 0.0f)) {
    return;
  }
  Vector3D a = acceleration(state.position, state.velocity);
  state.velocity += a * dt;
  state.position += state.velocity * dt;
}

void VerletIntegrator::integrate(IntegrationState &state,
                                 const AccelerationFn &acceleration,
                                 float dt) const {
  if (!(dt > 0.0f)) {
    return;
  }
  if (!state.hasPreviousPosition) {
    state.previousPosition = state.position - state.velocity * dt;
    state.hasPreviousPosition = true;
  }

  Vector3D a = acceleration(state.position, state.velocity);
  Vector3D current = state.position;
  Vector3D next = current * 2.0f - state.previousPosition + a * (dt * dt);

  state.previousPosition = current;
  state.position = next;
  state.velocity = (next - current) / dt;
}

void RK4Integrator::integrate(IntegrationState &state,
                              const AccelerationFn &acceleration,
                              float dt) const {
  if (!(dt > 0.0f)) {
    return;
  }
  const Vector3D p = state.position;
  const Vector3D v = state.velocity;
  const float half = dt * 0.5f;

  Vector3D k1v = acceleration(p, v);
  Vector3D k1p = v;

  Vector3D k2p = v + k1v * half;
  Vector3D k2v = acceleration(p + k1p * half, k2p);

  Vector3D k3p = v + k2v * half;
  Vector3D k3v = acceleration(p + k2p * half, k3p);

  Vector3D k4p = v + k3v * dt;
  Vector3D k4v = acceleration(p + k3p * dt, k4p);

  const float sixth = dt / 6.0f;
  state.position = p + (k1p + k2p * 2.0f + k3p * 2.0f + k4p) * sixth;
  state.velocity = v + (k1v + k2v * 2.0f + k3v * 2.0f + k4v) * sixth;
}

std::unique_ptr<Integrator> createIntegrator(IntegratorKind kind) {
  switch (kind) {
  case IntegratorKind::Euler:
    return std::make_unique<EulerIntegrator>();
  case IntegratorKind::RK4:
    return std::make_unique<RK4Integrator>();
  case IntegratorKind::Verlet:
  default:
    return std::make_unique<VerletIntegrator>();
  }
}

const char *integratorKindToString(IntegratorKind kind) {
  switch (kind) {
  case IntegratorKind::Euler:
    return "euler";
  case IntegratorKind::Verlet:
    return "verlet";
  case IntegratorKind::RK4:
    return "rk4";
  }
  return "verlet";
}

std::optional<IntegratorKind> integratorKindFromString(std::string_view name) {
  if (name == "euler")
    return IntegratorKind::Euler;
  if (name == "verlet")
    return IntegratorKind::Verlet;
  if (name == "rk4")
    return IntegratorKind::RK4;
  return std::nullopt;
}

} // namespace PyroForge
