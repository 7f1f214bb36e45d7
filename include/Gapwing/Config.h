#pragma once

#include <SDL3/SDL.h>
#include <string>

// Window and timing
static constexpr int SCREEN_WIDTH = 800;
static constexpr int SCREEN_HEIGHT = 600;
static constexpr int TICK_RATE = 60;

// Physics (px per tick). Bird motion accumulates in double so the
// truncated per-tick displacement lands on the same whole pixels every run.
static constexpr double GRAVITY = 0.4;
static constexpr double JUMP_STRENGTH = -9.0;
static constexpr float PIPE_SPEED = -4.0f;
static constexpr float PIPE_GAP_SIZE = 180.0f;
static constexpr int PIPE_SPAWN_INTERVAL_MS = 1400;
static constexpr float GROUND_HEIGHT = 100.0f;

// Bird
static constexpr float BIRD_WIDTH = 45.0f;
static constexpr float BIRD_HEIGHT = 35.0f;
static constexpr float BIRD_START_X = 150.0f;

// Pipes
static constexpr float PIPE_WIDTH = 80.0f;
static constexpr float PIPE_SPAWN_MARGIN = 50.0f;
static constexpr int PIPE_GAP_MARGIN = 200; // gap center stays this far from top/bottom

// Trail particles
static constexpr float TRAIL_EMIT_OFFSET_X = 5.0f;
static constexpr int TRAIL_JITTER_Y = 5;
static constexpr int TRAIL_RADIUS_MIN = 2;
static constexpr int TRAIL_RADIUS_MAX = 4;
static constexpr int TRAIL_LIFETIME_MIN = 10;
static constexpr int TRAIL_LIFETIME_MAX = 20;
static constexpr float TRAIL_DRIFT_X = 2.0f;
static constexpr float TRAIL_SHRINK = 0.1f;

// Game over effects
static constexpr int SHAKE_TICKS = 20;
static constexpr int SHAKE_MAGNITUDE = 5;
static constexpr int DEATH_PARTICLE_COUNT = 30;
static constexpr float DEATH_PARTICLE_GRAVITY = 0.3f;
static constexpr float DEATH_PARTICLE_SHRINK = 0.2f;
static constexpr float DEATH_VX_MIN = -4.0f;
static constexpr float DEATH_VX_MAX = 4.0f;
static constexpr float DEATH_VY_MIN = -6.0f;
static constexpr float DEATH_VY_MAX = 2.0f;
static constexpr int DEATH_SIZE_MIN = 5;
static constexpr int DEATH_SIZE_MAX = 10;

// Colors
static constexpr SDL_Color COLOR_WHITE = {255, 255, 255, 255};
static constexpr SDL_Color COLOR_BLACK = {0, 0, 0, 255};
static constexpr SDL_Color COLOR_SKY_BLUE = {135, 206, 235, 255};
static constexpr SDL_Color COLOR_GROUND = {148, 114, 89, 255};
static constexpr SDL_Color COLOR_PIPE_GREEN = {46, 172, 57, 255};
static constexpr SDL_Color COLOR_PIPE_HIGHLIGHT = {127, 255, 138, 255};
static constexpr SDL_Color COLOR_BIRD_LIGHT = {255, 240, 100, 255};
static constexpr SDL_Color COLOR_BIRD_DARK = {245, 190, 40, 255};
static constexpr SDL_Color COLOR_BIRD_BEAK = {245, 130, 50, 255};
static constexpr SDL_Color COLOR_TRAIL = {255, 255, 224, 255};
static constexpr SDL_Color COLOR_DEATH_RED = {255, 100, 100, 255};

static constexpr int DEATH_PALETTE_SIZE = 3;
static constexpr SDL_Color DEATH_PALETTE[DEATH_PALETTE_SIZE] = {
    COLOR_BIRD_LIGHT, COLOR_BIRD_DARK, COLOR_DEATH_RED};

/**
 * GameConfig - immutable set of simulation constants.
 *
 * A session copies its config at construction; nothing mutates it after
 * that. Tests build alternates to exercise other physics.
 */
struct GameConfig {
  int screen_width{SCREEN_WIDTH};
  int screen_height{SCREEN_HEIGHT};
  int tick_rate{TICK_RATE};

  double gravity{GRAVITY};
  double jump_strength{JUMP_STRENGTH};
  float pipe_speed{PIPE_SPEED};
  float pipe_gap_size{PIPE_GAP_SIZE};
  int pipe_spawn_interval_ms{PIPE_SPAWN_INTERVAL_MS};
  float ground_height{GROUND_HEIGHT};

  float bird_width{BIRD_WIDTH};
  float bird_height{BIRD_HEIGHT};
  float bird_start_x{BIRD_START_X};

  float pipe_width{PIPE_WIDTH};
  float pipe_spawn_margin{PIPE_SPAWN_MARGIN};
  int pipe_gap_margin{PIPE_GAP_MARGIN};

  float trail_emit_offset_x{TRAIL_EMIT_OFFSET_X};
  int trail_jitter_y{TRAIL_JITTER_Y};
  int trail_radius_min{TRAIL_RADIUS_MIN};
  int trail_radius_max{TRAIL_RADIUS_MAX};
  int trail_lifetime_min{TRAIL_LIFETIME_MIN};
  int trail_lifetime_max{TRAIL_LIFETIME_MAX};
  float trail_drift_x{TRAIL_DRIFT_X};
  float trail_shrink{TRAIL_SHRINK};

  int shake_ticks{SHAKE_TICKS};
  int shake_magnitude{SHAKE_MAGNITUDE};
  int death_particle_count{DEATH_PARTICLE_COUNT};
  float death_particle_gravity{DEATH_PARTICLE_GRAVITY};
  float death_particle_shrink{DEATH_PARTICLE_SHRINK};

  // Spawn cadence expressed in ticks (84 for 1400 ms at 60 Hz)
  float spawnIntervalTicks() const {
    return static_cast<float>(pipe_spawn_interval_ms) * tick_rate / 1000.0f;
  }

  // Spawn center follows the screen height
  float birdStartY() const { return static_cast<float>(screen_height / 2); }

  // y coordinate of the top of the ground band
  float groundLine() const { return screen_height - ground_height; }
};

// Checks that a config describes a playable screen. On failure `reason`
// names the first offending field.
bool validateConfig(const GameConfig &config, std::string &reason);
