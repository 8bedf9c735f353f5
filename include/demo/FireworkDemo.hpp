/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FIREWORK_DEMO_HPP
#define FIREWORK_DEMO_HPP

/**
 * @file FireworkDemo.hpp
 * @brief SDL3 window that drives a SimulationDriver and draws its particles
 *
 * Rendering is a plain perspective projection onto SDL_RenderFillRects,
 * batched by quantized color. Controls:
 *   Left click  launch toward the clicked column
 *   1-9 / 0     select a combo for clicks / back to random
 *   S           play a random show
 *   L           play the show from settings
 *   Space       pause
 *   + / -       time scale
 *   A           toggle auto launch
 *   C           clear
 *   Escape      quit
 */

#include "core/SimulationDriver.hpp"
#include "demo/FrameTimer.hpp"
#include "show/RandomShowGenerator.hpp"
#include <SDL3/SDL.h>
#include <array>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace PyroForge {

struct DemoConfig {
  int windowWidth{1280};
  int windowHeight{720};
  float targetFPS{60.0f};
  bool vsync{true};
};

class FireworkDemo {
public:
  static constexpr int HUE_BUCKETS = 36;
  static constexpr int ALPHA_LEVELS = 4;
  static constexpr float CAMERA_HEIGHT = 180.0f;
  static constexpr float CAMERA_DISTANCE = 700.0f;
  static constexpr float MIN_CLICK_HEIGHT = 100.0f;
  static constexpr float MAX_CLICK_HEIGHT = 450.0f;

  FireworkDemo(SimulationDriver &driver, ShowSequence configuredShow);
  ~FireworkDemo();

  FireworkDemo(const FireworkDemo &) = delete;
  FireworkDemo &operator=(const FireworkDemo &) = delete;

  bool init(const std::string &title, const DemoConfig &config);
  void run();
  void clean();

private:
  void handleEvents();
  void handleKey(SDL_Keycode key);
  void launchAt(float screenX, float screenY);
  void render();
  void updateTitle();

  SimulationDriver &m_driver;
  ShowSequence m_configuredShow;
  RandomShowGenerator m_showGenerator;
  FrameTimer m_frameTimer;
  std::mt19937 m_rng;

  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{
      nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{
      nullptr, SDL_DestroyRenderer};

  std::array<std::vector<SDL_FRect>, HUE_BUCKETS * ALPHA_LEVELS> m_batches;
  std::string m_title;
  std::optional<ComboKind> m_selectedCombo;
  float m_titleTimer{0.0f};
  int m_width{0};
  int m_height{0};
  bool m_sdlInitialized{false};
  bool m_running{false};
};

} // namespace PyroForge

#endif // FIREWORK_DEMO_HPP
