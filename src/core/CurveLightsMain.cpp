/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ConfigLoader.hpp"
#include "core/CurveLightsConfig.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "managers/LightShowManager.hpp"
#include "managers/SettingsManager.hpp"
#include "path/PathGenerator.hpp"
#include "render/SDLRenderSink.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <memory>
#include <string>

using namespace CurveLights;

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
const std::string APP_NAME{"Curve Lights"};

namespace {

constexpr int COUNT_STEP = 50;
constexpr int MIN_PARTICLE_COUNT = 1;
constexpr int MAX_PARTICLE_COUNT = 5000;

std::string nextColorMode(ColorStrategy strategy) {
  switch (strategy) {
  case ColorStrategy::Uniform:
    return "rainbow";
  case ColorStrategy::RandomHue:
    return "palette";
  case ColorStrategy::Palette:
  default:
    return "single";
  }
}

// Every key goes through SettingsManager so the bound listener applies it
bool handleKey(SDL_Keycode key) {
  auto &settings = SettingsManager::Instance();
  auto &lightShow = LightShowManager::Instance();
  const CurveLightsConfig &config = lightShow.getConfig();

  switch (key) {
  case SDLK_ESCAPE:
    return false;
  case SDLK_1:
    settings.set("particles", "type", std::string("trail"));
    break;
  case SDLK_2:
    settings.set("particles", "type", std::string("burst"));
    break;
  case SDLK_3:
    settings.set("particles", "type", std::string("comet"));
    break;
  case SDLK_P: {
    const int next = (static_cast<int>(config.path.family) + 1) %
                     static_cast<int>(PathFamily::COUNT);
    settings.set("path", "family",
                 std::string(pathFamilyToString(static_cast<PathFamily>(next))));
    break;
  }
  case SDLK_C:
    settings.set("color", "mode", nextColorMode(config.color.strategy));
    break;
  case SDLK_T:
    settings.set("render", "theme",
                 std::string(config.render.theme == Theme::Dark ? "light" : "dark"));
    break;
  case SDLK_R:
    lightShow.recolor();
    break;
  case SDLK_EQUALS:
  case SDLK_KP_PLUS:
    settings.set("particles", "count",
                 std::min(config.particleCount + COUNT_STEP, MAX_PARTICLE_COUNT));
    break;
  case SDLK_MINUS:
  case SDLK_KP_MINUS:
    settings.set("particles", "count",
                 std::max(config.particleCount - COUNT_STEP, MIN_PARTICLE_COUNT));
    break;
  default:
    break;
  }
  return true;
}

} // namespace

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  APP_INFO("Initializing " + APP_NAME);

  // Load settings from disk before anything is built
  auto &settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    APP_WARN("Failed to load settings.json - using defaults");
  } else {
    APP_INFO("Settings loaded from res/settings.json");
  }

  CurveLightsConfig config;
  loadConfig(settingsManager, config);

  const int windowWidth = settingsManager.get<int>("window", "width", WINDOW_WIDTH);
  const int windowHeight = settingsManager.get<int>("window", "height", WINDOW_HEIGHT);

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    APP_CRITICAL(std::string("SDL initialization failed: ") + SDL_GetError());
    return -1;
  }

  SDL_SetHint(SDL_HINT_RENDER_LINE_METHOD, "3"); // Use geometry for smoother lines

  SDL_Window *window = SDL_CreateWindow(APP_NAME.c_str(), std::max(windowWidth, 320),
                                        std::max(windowHeight, 240), SDL_WINDOW_RESIZABLE);
  if (!window) {
    APP_CRITICAL(std::string("Window creation failed: ") + SDL_GetError());
    SDL_Quit();
    return -1;
  }

  SDL_Renderer *renderer = SDL_CreateRenderer(window, NULL);
  if (!renderer) {
    APP_CRITICAL(std::string("Renderer creation failed: ") + SDL_GetError());
    SDL_DestroyWindow(window);
    SDL_Quit();
    return -1;
  }

  TimestepManager ts(60.0f, 1.0f / 60.0f);
  if (SDL_SetRenderVSync(renderer, 1)) {
    APP_INFO("Frame timing configured: hardware VSync");
  } else {
    APP_WARN(std::string("VSync unavailable, using software frame limiting: ") + SDL_GetError());
    ts.setSoftwareFrameLimiting(true);
  }

  auto &lightShow = LightShowManager::Instance();
  if (!lightShow.init(config)) {
    APP_CRITICAL("LightShowManager initialization failed");
    lightShow.clean();
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return -1;
  }
  lightShow.bindSettings();

  SDLRenderSink sink(renderer);
  std::shared_ptr<const Path> focusedPath;

  APP_INFO("Starting Main Loop");

  bool running = true;
  while (running) {
    ts.startFrame();

    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      if (event.type == SDL_EVENT_QUIT) {
        running = false;
      } else if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
        running = handleKey(event.key.key) && running;
      }
    }

    while (ts.shouldUpdate()) {
      lightShow.update();
      sink.advanceOrbit(ts.getUpdateDeltaTime());
    }

    // The path is replaced wholesale on rebuild; refocus when it changes
    if (lightShow.getPath() != focusedPath) {
      focusedPath = lightShow.getPath();
      if (focusedPath) {
        sink.setFocus(focusedPath->getCenter(), focusedPath->getBoundingRadius());
      }
    }

    const CurveLightsConfig &current = lightShow.getConfig();
    sink.setTheme(current.render.theme);
    sink.setLineAlpha(current.render.lineAlpha);
    lightShow.render(sink);

    ts.endFrame();
  }

  APP_INFO(APP_NAME + " shutting down after " + std::to_string(lightShow.getFrameCount()) +
           " ticks");

  focusedPath.reset();
  lightShow.clean();
  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();

  return 0;
}
