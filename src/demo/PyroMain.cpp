/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SimulationDriver.hpp"
#include "demo/FireworkDemo.hpp"
#include "managers/SettingsManager.hpp"
#include <exception>
#include <format>
#include <random>
#include <string>

const std::string APP_TITLE{"PyroForge"};
const std::string SETTINGS_PATH{"res/settings.json"};

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  DEMO_INFO(std::format("Initializing {}", APP_TITLE));

  auto& settingsManager = PyroForge::SettingsManager::Instance();
  if (!settingsManager.loadFromFile(SETTINGS_PATH)) {
    DEMO_WARN(std::format("Failed to load {} - using defaults", SETTINGS_PATH));
  }

  PyroForge::DemoConfig demoConfig;
  demoConfig.windowWidth = settingsManager.get<int>("demo", "window_width", demoConfig.windowWidth);
  demoConfig.windowHeight = settingsManager.get<int>("demo", "window_height", demoConfig.windowHeight);
  demoConfig.targetFPS = settingsManager.get<float>("demo", "target_fps", demoConfig.targetFPS);
  demoConfig.vsync = settingsManager.get<bool>("demo", "vsync", demoConfig.vsync);

  try {
    PyroForge::SimulationDriver driver(settingsManager.getSimulationSettings(),
                                       settingsManager.getPhysicsConfig(),
                                       std::random_device{}());
    driver.setCustomCombos(settingsManager.getCustomCombos());

    PyroForge::FireworkDemo demo(driver, settingsManager.getShowSequence());
    if (!demo.init(APP_TITLE, demoConfig)) {
      DEMO_CRITICAL(std::format("Init {} failed", APP_TITLE));
      demo.clean();
      return -1;
    }

    DEMO_INFO("Starting main loop");
    demo.run();
    demo.clean();
  } catch (const std::exception& e) {
    DEMO_CRITICAL(std::format("Unhandled exception: {}", e.what()));
    return -1;
  }

  DEMO_INFO(std::format("{} shutting down", APP_TITLE));
  return 0;
}
