/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "demo/FireworkDemo.hpp"
#include "core/Logger.hpp"
#include "shapes/ShapeGenerator.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace PyroForge {

namespace {

constexpr Uint8 SKY_R = 4;
constexpr Uint8 SKY_G = 6;
constexpr Uint8 SKY_B = 16;

struct Rgb {
  float r;
  float g;
  float b;
};

// HSL with fixed saturation 1 and lightness 0.6
Rgb hueToRgb(float hue) {
  const float h = std::fmod(std::max(0.0f, hue), 360.0f) / 60.0f;
  const float lightness = 0.6f;
  const float chroma = (1.0f - std::fabs(2.0f * lightness - 1.0f));
  const float x = chroma * (1.0f - std::fabs(std::fmod(h, 2.0f) - 1.0f));
  const float m = lightness - chroma / 2.0f;

  Rgb rgb{0.0f, 0.0f, 0.0f};
  switch (static_cast<int>(h)) {
  case 0: rgb = {chroma, x, 0.0f}; break;
  case 1: rgb = {x, chroma, 0.0f}; break;
  case 2: rgb = {0.0f, chroma, x}; break;
  case 3: rgb = {0.0f, x, chroma}; break;
  case 4: rgb = {x, 0.0f, chroma}; break;
  default: rgb = {chroma, 0.0f, x}; break;
  }
  return {rgb.r + m, rgb.g + m, rgb.b + m};
}

} // namespace

FireworkDemo::FireworkDemo(SimulationDriver &driver,
                           ShowSequence configuredShow)
    : m_driver(driver), m_configuredShow(std::move(configuredShow)),
      m_rng(std::random_device{}()) {
  m_showGenerator.setEnabledPools(
      driver.getSettings().enabledShapes.empty()
          ? ShapeGenerator::getAllKinds()
          : driver.getSettings().enabledShapes,
      driver.getSettings().enabledTrajectories.empty()
          ? TrajectoryRegistry::allKinds()
          : driver.getSettings().enabledTrajectories,
      driver.getSettings().enabledCombos.empty()
          ? ComboLibrary::allKinds()
          : driver.getSettings().enabledCombos);
}

FireworkDemo::~FireworkDemo() { clean(); }

bool FireworkDemo::init(const std::string &title, const DemoConfig &config) {
  if (!SDL_Init(SDL_INIT_VIDEO)) {
    DEMO_CRITICAL(std::format("SDL video init failed: {}", SDL_GetError()));
    return false;
  }
  m_sdlInitialized = true;

  m_title = title;
  m_width = std::max(320, config.windowWidth);
  m_height = std::max(240, config.windowHeight);

  mp_window.reset(SDL_CreateWindow(m_title.c_str(), m_width, m_height,
                                   SDL_WINDOW_RESIZABLE));
  if (!mp_window) {
    DEMO_ERROR(std::format("Failed to create window: {}", SDL_GetError()));
    return false;
  }

  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), NULL));
  if (!mp_renderer) {
    DEMO_ERROR(std::format("Failed to create renderer: {}", SDL_GetError()));
    return false;
  }

  const bool vsyncEnabled =
      config.vsync && SDL_SetRenderVSync(mp_renderer.get(), 1);
  if (config.vsync && !vsyncEnabled) {
    DEMO_WARN(std::format("VSync unavailable, using software frame limiting: {}",
                          SDL_GetError()));
  }
  m_frameTimer.setTargetFPS(config.targetFPS);
  m_frameTimer.setFrameLimiting(!vsyncEnabled);

  if (!SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_ADD)) {
    DEMO_WARN(std::format("Additive blending unavailable: {}", SDL_GetError()));
  }

  m_driver.setExplosionListener([](uint64_t id, const Vector3D &position) {
    DEMO_DEBUG(std::format("Firework {} burst at ({:.0f}, {:.0f}, {:.0f})", id,
                           position.getX(), position.getY(), position.getZ()));
  });

  DEMO_INFO(std::format("Demo window {}x{} ready ({})", m_width, m_height,
                        vsyncEnabled ? "VSync" : "software frame limiting"));
  m_running = true;
  return true;
}

void FireworkDemo::run() {
  m_frameTimer.reset();
  while (m_running) {
    m_frameTimer.startFrame();
    handleEvents();

    const float dt = m_frameTimer.getDeltaTime();
    m_driver.tick(dt);

    render();

    m_titleTimer += dt;
    if (m_titleTimer >= 0.5f) {
      m_titleTimer = 0.0f;
      updateTitle();
    }
    m_frameTimer.endFrame();
  }
}

void FireworkDemo::clean() {
  m_driver.setExplosionListener(nullptr);
  mp_renderer.reset();
  mp_window.reset();
  if (m_sdlInitialized) {
    m_sdlInitialized = false;
    SDL_Quit();
  }
}

void FireworkDemo::handleEvents() {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
    case SDL_EVENT_QUIT:
      m_running = false;
      break;
    case SDL_EVENT_KEY_DOWN:
      if (!event.key.repeat) {
        handleKey(event.key.key);
      }
      break;
    case SDL_EVENT_MOUSE_BUTTON_DOWN:
      if (event.button.button == SDL_BUTTON_LEFT) {
        launchAt(event.button.x, event.button.y);
      }
      break;
    case SDL_EVENT_WINDOW_RESIZED:
      m_width = event.window.data1;
      m_height = event.window.data2;
      break;
    default:
      break;
    }
  }
}

void FireworkDemo::handleKey(SDL_Keycode key) {
  if (key >= SDLK_1 && key <= SDLK_9) {
    m_selectedCombo = static_cast<ComboKind>(key - SDLK_1);
    DEMO_INFO(std::format("Click combo: {}",
                          ComboLibrary::toString(*m_selectedCombo)));
    return;
  }

  switch (key) {
  case SDLK_ESCAPE:
    m_running = false;
    break;
  case SDLK_0:
    m_selectedCombo.reset();
    DEMO_INFO("Click combo: random");
    break;
  case SDLK_SPACE:
    m_driver.togglePause();
    break;
  case SDLK_EQUALS:
  case SDLK_PLUS:
  case SDLK_KP_PLUS:
    m_driver.setTimeScale(m_driver.getTimeScale() * 1.5f);
    break;
  case SDLK_MINUS:
  case SDLK_KP_MINUS:
    m_driver.setTimeScale(m_driver.getTimeScale() / 1.5f);
    break;
  case SDLK_A: {
    SimulationSettings settings = m_driver.getSettings();
    settings.autoLaunch = !settings.autoLaunch;
    m_driver.setSettings(settings);
    DEMO_INFO(std::format("Auto launch {}", settings.autoLaunch ? "on" : "off"));
    break;
  }
  case SDLK_S: {
    ShowSequence show = m_showGenerator.generateSequence(m_rng);
    DEMO_INFO(std::format("Random show: {} stages, ~{:.0f}s", show.size(),
                          RandomShowGenerator::estimateDuration(show)));
    m_driver.playShow(show);
    break;
  }
  case SDLK_L:
    if (m_configuredShow.empty()) {
      DEMO_WARN("No show in settings");
    } else {
      m_driver.playShow(m_configuredShow);
    }
    break;
  case SDLK_C:
    m_driver.clear();
    break;
  default:
    break;
  }
}

void FireworkDemo::launchAt(float screenX, float screenY) {
  // Unproject onto the z = 0 plane
  const float focal = static_cast<float>(m_height) * 0.9f;
  const float x =
      (screenX - static_cast<float>(m_width) * 0.5f) * CAMERA_DISTANCE / focal;
  const float y =
      (static_cast<float>(m_height) * 0.5f - screenY) * CAMERA_DISTANCE / focal +
      CAMERA_HEIGHT;

  LaunchRequest request;
  request.start.set(x, 0.0f, 0.0f);
  request.target.set(x, std::clamp(y, MIN_CLICK_HEIGHT, MAX_CLICK_HEIGHT), 0.0f);
  request.hue = Random::range(m_rng, 0.0f, 360.0f);
  request.charge = 1.0f;
  request.combo = m_selectedCombo;
  if (!request.combo) {
    request.combo = ComboLibrary::pickFrom(m_driver.getSettings().enabledCombos,
                                           m_rng);
  }
  request.shape =
      ShapeGenerator::pickFrom(m_driver.getSettings().enabledShapes, m_rng);
  m_driver.launch(request);
}

void FireworkDemo::render() {
  SDL_Renderer *renderer = mp_renderer.get();
  SDL_SetRenderDrawColor(renderer, SKY_R, SKY_G, SKY_B, 255);
  SDL_RenderClear(renderer);

  for (auto &batch : m_batches) {
    batch.clear();
  }

  const float focal = static_cast<float>(m_height) * 0.9f;
  const float halfW = static_cast<float>(m_width) * 0.5f;
  const float halfH = static_cast<float>(m_height) * 0.5f;

  for (const ParticleView &view : m_driver.getActiveParticles()) {
    const float depth = view.position.getZ() + CAMERA_DISTANCE;
    if (depth < 1.0f || view.alpha <= 0.0f) {
      continue;
    }
    const float scale = focal / depth;
    const float sx = halfW + view.position.getX() * scale;
    const float sy = halfH - (view.position.getY() - CAMERA_HEIGHT) * scale;
    const float side = std::max(1.0f, view.size * scale * 0.6f);

    const int hueBucket =
        static_cast<int>(std::fmod(std::max(0.0f, view.hue), 360.0f) / 360.0f *
                         HUE_BUCKETS) % HUE_BUCKETS;
    const int alphaLevel = std::min(
        ALPHA_LEVELS - 1, static_cast<int>(view.alpha * ALPHA_LEVELS));
    m_batches[hueBucket * ALPHA_LEVELS + alphaLevel].push_back(
        {sx - side * 0.5f, sy - side * 0.5f, side, side});
  }

  for (int hueBucket = 0; hueBucket < HUE_BUCKETS; ++hueBucket) {
    const Rgb rgb = hueToRgb((static_cast<float>(hueBucket) + 0.5f) * 360.0f /
                             HUE_BUCKETS);
    for (int level = 0; level < ALPHA_LEVELS; ++level) {
      const auto &batch = m_batches[hueBucket * ALPHA_LEVELS + level];
      if (batch.empty()) {
        continue;
      }
      const float alpha = (static_cast<float>(level) + 1.0f) / ALPHA_LEVELS;
      SDL_SetRenderDrawColorFloat(renderer, rgb.r, rgb.g, rgb.b, alpha);
      SDL_RenderFillRects(renderer, batch.data(), static_cast<int>(batch.size()));
    }
  }

  SDL_RenderPresent(renderer);
}

void FireworkDemo::updateTitle() {
  const std::string title = std::format(
      "{} | {} | x{:.2f}{} | {} particles | {:.0f} FPS", m_title,
      m_driver.getFormattedTime(), m_driver.getTimeScale(),
      m_driver.isPaused() ? " paused" : "", m_driver.getActiveParticleCount(),
      m_frameTimer.getCurrentFPS());
  SDL_SetWindowTitle(mp_window.get(), title.c_str());
}

} // namespace PyroForge
