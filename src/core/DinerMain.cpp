/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/FrameDriver.hpp"
#include "core/GameTuning.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include "platform/SDLRenderBackend.hpp"
#include "platform/SDLSoundSink.hpp"
#include <SDL3/SDL.h>
#include <optional>
#include <string>

namespace {

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
// Game Name goes here.
const std::string GAME_NAME{"Diner Rush"};

std::optional<DinerEngine::KeyCode> mapScancode(SDL_Scancode scancode) {
  using DinerEngine::KeyCode;
  switch (scancode) {
    case SDL_SCANCODE_W: return KeyCode::W;
    case SDL_SCANCODE_A: return KeyCode::A;
    case SDL_SCANCODE_S: return KeyCode::S;
    case SDL_SCANCODE_D: return KeyCode::D;
    case SDL_SCANCODE_P:
    case SDL_SCANCODE_ESCAPE: return KeyCode::Pause;
    default: return std::nullopt;
  }
}

std::optional<DinerEngine::KeyCode> mapMouseButton(Uint8 button) {
  using DinerEngine::KeyCode;
  switch (button) {
    case SDL_BUTTON_LEFT: return KeyCode::MouseLeft;
    case SDL_BUTTON_RIGHT: return KeyCode::MouseRight;
    default: return std::nullopt;
  }
}

// Returns false once the window should close
bool pumpEvents(DinerEngine::FrameDriver& driver) {
  using DinerEngine::InputEventType;
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
      case SDL_EVENT_QUIT:
        return false;
      case SDL_EVENT_KEY_DOWN:
      case SDL_EVENT_KEY_UP:
        if (!event.key.repeat) {
          if (auto code = mapScancode(event.key.scancode)) {
            driver.onInputEvent(event.type == SDL_EVENT_KEY_DOWN ? InputEventType::ButtonDown
                                                                 : InputEventType::ButtonUp,
                                *code);
          }
        }
        break;
      case SDL_EVENT_MOUSE_BUTTON_DOWN:
      case SDL_EVENT_MOUSE_BUTTON_UP:
        if (auto code = mapMouseButton(event.button.button)) {
          driver.onInputEvent(event.type == SDL_EVENT_MOUSE_BUTTON_DOWN ? InputEventType::ButtonDown
                                                                        : InputEventType::ButtonUp,
                              *code);
        }
        break;
      case SDL_EVENT_MOUSE_MOTION:
        driver.onMouseDelta(event.motion.xrel, event.motion.yrel);
        break;
      default:
        break;
    }
  }
  return true;
}

} // namespace

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  GAMELOOP_INFO("Initializing " + GAME_NAME);

  // Load tuning from disk before building the world
  auto& settingsManager = DinerEngine::SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/tuning.json")) {
    GAMELOOP_WARN("Failed to load tuning.json - using defaults");
  }
  const DinerEngine::GameTuning tuning = DinerEngine::GameTuning::fromSettings(settingsManager);

  const int windowWidth = settingsManager.get<int>("graphics", "resolution_width", WINDOW_WIDTH);
  const int windowHeight = settingsManager.get<int>("graphics", "resolution_height", WINDOW_HEIGHT);

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
    GAMELOOP_CRITICAL("SDL_Init failed: " + std::string(SDL_GetError()));
    return -1;
  }

  SDL_Window* window = nullptr;
  SDL_Renderer* renderer = nullptr;
  if (!SDL_CreateWindowAndRenderer(GAME_NAME.c_str(), windowWidth, windowHeight, 0, &window,
                                   &renderer)) {
    GAMELOOP_CRITICAL("Init " + GAME_NAME + " Failed: " + SDL_GetError());
    SDL_Quit();
    return -1;
  }
  SDL_SetRenderVSync(renderer, 1);
  SDL_SetWindowRelativeMouseMode(window, true);

  int returnCode = 0;
  {
    DinerEngine::SDLRenderBackend backend(renderer, static_cast<float>(windowHeight));
    DinerEngine::SDLSoundSink sound;
    if (!sound.init("assets/sfx")) {
      GAMELOOP_WARN("Audio unavailable, continuing without sound");
    }

    DinerEngine::FrameDriver driver(backend, &backend, &sound, tuning);
    const auto seed = static_cast<uint32_t>(SDL_GetTicksNS());
    if (!driver.init(windowWidth, windowHeight, seed)) {
      GAMELOOP_CRITICAL("Failed to build the world");
      returnCode = -1;
    } else {
      GAMELOOP_INFO("Starting Main Loop");
      uint32_t shownScore = UINT32_MAX;
      while (pumpEvents(driver)) {
        driver.onFrame(static_cast<int64_t>(SDL_GetTicks()));
        backend.present();

        // Score digits are shown in the title bar
        if (driver.getScore() != shownScore) {
          shownScore = driver.getScore();
          const std::string title = GAME_NAME + " - Score " + std::to_string(shownScore);
          SDL_SetWindowTitle(window, title.c_str());
        }
      }
    }
    backend.clean();
    sound.clean();
  }

  GAMELOOP_INFO("Game " + GAME_NAME + " shutting down");
  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();
  return returnCode;
}
