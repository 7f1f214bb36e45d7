#include "Gapwing/GameState.h"
#include "Gapwing/Collision.h"
#include "Gapwing/GWCommon.h"
#include <stdexcept>
#include <string>

static const GameConfig &checked_config(const GameConfig &config) {
  std::string reason;
  if (!validateConfig(config, reason))
    throw std::invalid_argument("Invalid game config: " + reason);
  return config;
}

GameSession::GameSession(const GameConfig &config, RandomSource &rng)
    : config(checked_config(config)), rng(&rng), bird(config, rng),
      pipes(config, rng),
      death_particles(config.death_particle_gravity,
                      config.death_particle_shrink),
      background(config, rng) {
  GWLOG("Session started (%dx%d @ %d Hz)", config.screen_width,
        config.screen_height, config.tick_rate);
}

void GameSession::handleInput(InputEvent event) {
  switch (event) {
  case InputEvent::JUMP:
    if (state == GameStateEnum::GAME_STATE_PLAYING)
      bird.jump();
    break;
  case InputEvent::RESTART:
    if (state == GameStateEnum::GAME_STATE_GAME_OVER)
      restart();
    break;
  case InputEvent::QUIT:
    quit_requested = true;
    break;
  }
}

void GameSession::tick(float dt_ticks) {
  if (state == GameStateEnum::GAME_STATE_PLAYING)
    tickPlaying(dt_ticks);
  else
    tickGameOver(dt_ticks);

  background.update(dt_ticks);
  stepShake();
  tick_count++;
}

void GameSession::tickPlaying(float dt_ticks) {
  bird.update(dt_ticks);
  pipes.update(dt_ticks);

  // A pipe hit ends the round where the bird stands. The ground check still
  // runs afterwards so the clamp applies, but it cannot end the round twice.
  if (bird_hits_pipe(bird, pipes))
    endGame();
  if (bird_touches_ground(bird, config) && isPlaying())
    endGame();

  score += score_passed_pipes(bird, pipes);
  pipes.retireOffscreen();
}

void GameSession::tickGameOver(float dt_ticks) {
  death_particles.update(dt_ticks);
}

void GameSession::endGame() {
  state = GameStateEnum::GAME_STATE_GAME_OVER;
  shake_ticks = config.shake_ticks;
  death_particles.emitBurst(bird.x, static_cast<float>(bird.y),
                            config.death_particle_count, *rng);
  GWLOG("Game over at tick %llu - score: %d",
        static_cast<unsigned long long>(tick_count), score);
}

void GameSession::stepShake() {
  if (shake_ticks > 0) {
    shake_offset_x = rng->randomInt(-config.shake_magnitude,
                                    config.shake_magnitude);
    shake_offset_y = rng->randomInt(-config.shake_magnitude,
                                    config.shake_magnitude);
    shake_ticks--;
  } else {
    shake_offset_x = 0;
    shake_offset_y = 0;
  }
}

void GameSession::restart() {
  bird.reset();
  pipes.clear();
  death_particles.clear();
  background.generate();
  score = 0;
  shake_ticks = 0;
  shake_offset_x = 0;
  shake_offset_y = 0;
  state = GameStateEnum::GAME_STATE_PLAYING;
  GWLOG("Session restarted");
}

RenderSnapshot GameSession::snapshot() const {
  RenderSnapshot snap;
  snap.score = score;
  snap.state = state;
  snap.shake_offset_x = shake_offset_x;
  snap.shake_offset_y = shake_offset_y;

  background.appendDrawables(snap.drawables);
  pipes.appendDrawables(snap.drawables);
  if (state == GameStateEnum::GAME_STATE_PLAYING)
    bird.appendDrawables(snap.drawables);
  death_particles.appendDrawables(snap.drawables);

  const float ground = config.groundLine();
  snap.drawables.push_back({DrawableKind::GROUND,
                            {0.0f, ground,
                             static_cast<float>(config.screen_width),
                             config.ground_height},
                            COLOR_GROUND});
  return snap;
}
