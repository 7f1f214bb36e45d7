#include "Gapwing/Config.h"
#include "Gapwing/GWCommon.h"
#include "Gapwing/GameState.h"
#include "Gapwing/GameUI.h"
#include "Gapwing/RandomSource.h"
#include "Gapwing/Renderer.h"
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <exception>
#include <iostream>

/**
 * Gapwing - fly the bird through the gaps.
 *
 * Space / Up / left click: flap (restart after a crash)
 * R: restart after a crash
 * Escape: quit
 */

// Longest run of ticks simulated in one frame after a stall
#define MAX_CATCHUP_TICKS 5

// --- Function Declarations ---
void process_events(GameSession &session);
bool run_game(const GameConfig &config);

// --- Main Function ---
int main(int argc, char *argv[]) {
  if (!SDL_Init(SDL_INIT_VIDEO)) {
    std::cerr << "SDL_Init Error: " << SDL_GetError() << std::endl;
    return 1;
  }

  GameConfig config;
  bool ok = false;
  try {
    ok = run_game(config);
  } catch (const std::exception &e) {
    std::cerr << "Fatal: " << e.what() << std::endl;
  }

  SDL_Quit();
  return ok ? 0 : 1;
}

bool run_game(const GameConfig &config) {
  MersenneRandomSource rng;
  GameSession session(config, rng);

  Renderer renderer;
  if (!renderer.initialize("Gapwing", config.screen_width,
                           config.screen_height)) {
    std::cerr << "Failed to initialize renderer" << std::endl;
    return false;
  }

  if (!ui_init(renderer.window, renderer.renderer)) {
    std::cerr << "Failed to initialize UI" << std::endl;
    renderer.shutdown();
    return false;
  }

  const double tick_ms = 1000.0 / config.tick_rate;
  double accumulator = 0.0;
  Uint64 last_time = SDL_GetTicks();

  while (!session.quitRequested()) {
    Uint64 current_time = SDL_GetTicks();
    accumulator += static_cast<double>(current_time - last_time);
    last_time = current_time;

    // Input is applied before the physics step of this frame
    process_events(session);
    if (session.quitRequested())
      break;

    int steps = 0;
    while (accumulator >= tick_ms && steps < MAX_CATCHUP_TICKS) {
      session.tick(1.0f);
      accumulator -= tick_ms;
      steps++;
    }
    if (steps == MAX_CATCHUP_TICKS)
      accumulator = 0.0;

    RenderSnapshot snapshot = session.snapshot();
    renderer.drawSnapshot(snapshot);

    ui_new_frame();
    ui_render(snapshot, config.screen_width, config.screen_height);
    ui_present(renderer.renderer);

    renderer.present();
    SDL_Delay(1);
  }

  GWLOG("Quit after %llu ticks",
        static_cast<unsigned long long>(session.getTickCount()));

  ui_shutdown();
  renderer.shutdown();
  return true;
}

// Space doubles as the restart key once the round is over
static void press_action(GameSession &session) {
  session.handleInput(session.isPlaying() ? InputEvent::JUMP
                                          : InputEvent::RESTART);
}

void process_events(GameSession &session) {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    ui_process_event(&event);
    if (event.type == SDL_EVENT_QUIT) {
      session.handleInput(InputEvent::QUIT);
    } else if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
      switch (event.key.scancode) {
      case SDL_SCANCODE_ESCAPE:
        session.handleInput(InputEvent::QUIT);
        break;
      case SDL_SCANCODE_SPACE:
      case SDL_SCANCODE_UP:
        press_action(session);
        break;
      case SDL_SCANCODE_R:
        session.handleInput(InputEvent::RESTART);
        break;
      default:
        break;
      }
    } else if (event.type == SDL_EVENT_MOUSE_BUTTON_DOWN &&
               event.button.button == SDL_BUTTON_LEFT) {
      press_action(session);
    }
  }
}
