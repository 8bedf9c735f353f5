/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace PyroForge {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("PyroForge - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define PYRO_CRITICAL(system, msg)                                             \
  PyroForge::Logger::Log(PyroForge::LogLevel::CRITICAL, system, msg)
#define PYRO_ERROR(system, msg)                                                \
  PyroForge::Logger::Log(PyroForge::LogLevel::ERROR_LEVEL, system, msg)
#define PYRO_WARN(system, msg)                                                 \
  PyroForge::Logger::Log(PyroForge::LogLevel::WARNING, system, msg)
#define PYRO_INFO(system, msg)                                                 \
  PyroForge::Logger::Log(PyroForge::LogLevel::INFO, system, msg)
#define PYRO_DEBUG(system, msg)                                                \
  PyroForge::Logger::Log(PyroForge::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a rotating log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define PYRO_CRITICAL(system, msg)                                             \
  PyroForge::Logger::Log("CRITICAL", system, msg)

#define PYRO_ERROR(system, msg) PyroForge::Logger::Log("ERROR", system, msg)

#define PYRO_WARN(system, msg) ((void)0)  // Zero overhead
#define PYRO_INFO(system, msg) ((void)0)  // Zero overhead
#define PYRO_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define SIMULATION_CRITICAL(msg) PYRO_CRITICAL("SimulationDriver", msg)
#define SIMULATION_ERROR(msg) PYRO_ERROR("SimulationDriver", msg)
#define SIMULATION_WARN(msg) PYRO_WARN("SimulationDriver", msg)
#define SIMULATION_INFO(msg) PYRO_INFO("SimulationDriver", msg)
#define SIMULATION_DEBUG(msg) PYRO_DEBUG("SimulationDriver", msg)

#define PHYSICS_CRITICAL(msg) PYRO_CRITICAL("PhysicsEngine", msg)
#define PHYSICS_ERROR(msg) PYRO_ERROR("PhysicsEngine", msg)
#define PHYSICS_WARN(msg) PYRO_WARN("PhysicsEngine", msg)
#define PHYSICS_INFO(msg) PYRO_INFO("PhysicsEngine", msg)
#define PHYSICS_DEBUG(msg) PYRO_DEBUG("PhysicsEngine", msg)

#define PARTICLE_CRITICAL(msg) PYRO_CRITICAL("ParticlePool", msg)
#define PARTICLE_ERROR(msg) PYRO_ERROR("ParticlePool", msg)
#define PARTICLE_WARN(msg) PYRO_WARN("ParticlePool", msg)
#define PARTICLE_INFO(msg) PYRO_INFO("ParticlePool", msg)
#define PARTICLE_DEBUG(msg) PYRO_DEBUG("ParticlePool", msg)

// Generators
#define SHAPE_CRITICAL(msg) PYRO_CRITICAL("ShapeGenerator", msg)
#define SHAPE_ERROR(msg) PYRO_ERROR("ShapeGenerator", msg)
#define SHAPE_WARN(msg) PYRO_WARN("ShapeGenerator", msg)
#define SHAPE_INFO(msg) PYRO_INFO("ShapeGenerator", msg)
#define SHAPE_DEBUG(msg) PYRO_DEBUG("ShapeGenerator", msg)

#define TRAJECTORY_CRITICAL(msg) PYRO_CRITICAL("Trajectory", msg)
#define TRAJECTORY_ERROR(msg) PYRO_ERROR("Trajectory", msg)
#define TRAJECTORY_WARN(msg) PYRO_WARN("Trajectory", msg)
#define TRAJECTORY_INFO(msg) PYRO_INFO("Trajectory", msg)
#define TRAJECTORY_DEBUG(msg) PYRO_DEBUG("Trajectory", msg)

// Entities and choreography
#define COMBO_CRITICAL(msg) PYRO_CRITICAL("ComboOrchestrator", msg)
#define COMBO_ERROR(msg) PYRO_ERROR("ComboOrchestrator", msg)
#define COMBO_WARN(msg) PYRO_WARN("ComboOrchestrator", msg)
#define COMBO_INFO(msg) PYRO_INFO("ComboOrchestrator", msg)
#define COMBO_DEBUG(msg) PYRO_DEBUG("ComboOrchestrator", msg)

#define FIREWORK_CRITICAL(msg) PYRO_CRITICAL("Firework", msg)
#define FIREWORK_ERROR(msg) PYRO_ERROR("Firework", msg)
#define FIREWORK_WARN(msg) PYRO_WARN("Firework", msg)
#define FIREWORK_INFO(msg) PYRO_INFO("Firework", msg)
#define FIREWORK_DEBUG(msg) PYRO_DEBUG("Firework", msg)

#define SHOW_CRITICAL(msg) PYRO_CRITICAL("ShowDirector", msg)
#define SHOW_ERROR(msg) PYRO_ERROR("ShowDirector", msg)
#define SHOW_WARN(msg) PYRO_WARN("ShowDirector", msg)
#define SHOW_INFO(msg) PYRO_INFO("ShowDirector", msg)
#define SHOW_DEBUG(msg) PYRO_DEBUG("ShowDirector", msg)

#define SETTINGS_CRITICAL(msg) PYRO_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) PYRO_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) PYRO_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) PYRO_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) PYRO_DEBUG("SettingsManager", msg)

// Host application
#define DEMO_CRITICAL(msg) PYRO_CRITICAL("FireworkDemo", msg)
#define DEMO_ERROR(msg) PYRO_ERROR("FireworkDemo", msg)
#define DEMO_WARN(msg) PYRO_WARN("FireworkDemo", msg)
#define DEMO_INFO(msg) PYRO_INFO("FireworkDemo", msg)
#define DEMO_DEBUG(msg) PYRO_DEBUG("FireworkDemo", msg)

// Benchmark mode convenience macros
#define PYRO_ENABLE_BENCHMARK_MODE() PyroForge::Logger::SetBenchmarkMode(true)
#define PYRO_DISABLE_BENCHMARK_MODE()                                          \
  PyroForge::Logger::SetBenchmarkMode(false)

} // namespace PyroForge

#endif // LOGGER_HPP
