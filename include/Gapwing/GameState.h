#pragma once

#include "Gapwing/Background.h"
#include "Gapwing/Bird.h"
#include "Gapwing/Config.h"
#include "Gapwing/Entity.h"
#include "Gapwing/Particles.h"
#include "Gapwing/Pipe.h"
#include "Gapwing/RandomSource.h"
#include <cstdint>
#include <vector>

enum class GameStateEnum { GAME_STATE_PLAYING, GAME_STATE_GAME_OVER };

// Discrete input delivered by the platform layer, already edge-triggered
enum class InputEvent { JUMP, RESTART, QUIT };

// Everything the presentation side needs for one frame. Drawables are in
// back-to-front order.
struct RenderSnapshot {
  std::vector<Drawable> drawables;
  int score = 0;
  GameStateEnum state = GameStateEnum::GAME_STATE_PLAYING;
  int shake_offset_x = 0;
  int shake_offset_y = 0;
};

/**
 * GameSession - the simulation state machine.
 *
 * PLAYING advances the bird and the pipe stream, runs collision and scoring,
 * and switches to GAME_OVER on the first collision. GAME_OVER freezes the
 * bird and the pipes while the death burst plays out, until a restart
 * brings back a fresh PLAYING session.
 *
 * Inputs that do not apply to the current state are ignored.
 */
class GameSession {
public:
  // Throws std::invalid_argument if `config` fails validateConfig().
  // `rng` is not owned and must outlive the session.
  GameSession(const GameConfig &config, RandomSource &rng);

  GameSession(const GameSession &) = delete;
  GameSession &operator=(const GameSession &) = delete;

  void handleInput(InputEvent event);

  // One fixed simulation step
  void tick(float dt_ticks = 1.0f);

  void restart();

  RenderSnapshot snapshot() const;

  GameStateEnum getState() const { return state; }
  bool isPlaying() const { return state == GameStateEnum::GAME_STATE_PLAYING; }
  int getScore() const { return score; }
  int getShakeTicks() const { return shake_ticks; }
  int getShakeOffsetX() const { return shake_offset_x; }
  int getShakeOffsetY() const { return shake_offset_y; }
  bool quitRequested() const { return quit_requested; }
  uint64_t getTickCount() const { return tick_count; }

  const GameConfig &getConfig() const { return config; }
  Bird &getBird() { return bird; }
  const Bird &getBird() const { return bird; }
  PipeStream &getPipes() { return pipes; }
  const PipeStream &getPipes() const { return pipes; }
  const DeathParticleSet &getDeathParticles() const { return death_particles; }
  const ParallaxBackground &getBackground() const { return background; }

private:
  GameConfig config;
  RandomSource *rng;

  GameStateEnum state = GameStateEnum::GAME_STATE_PLAYING;
  int score = 0;
  int shake_ticks = 0;
  int shake_offset_x = 0;
  int shake_offset_y = 0;
  bool quit_requested = false;
  uint64_t tick_count = 0;

  Bird bird;
  PipeStream pipes;
  DeathParticleSet death_particles;
  ParallaxBackground background;

  void tickPlaying(float dt_ticks);
  void tickGameOver(float dt_ticks);
  void endGame();
  void stepShake();
};
