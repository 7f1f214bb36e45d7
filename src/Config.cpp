#include "Gapwing/Config.h"

bool validateConfig(const GameConfig &config, std::string &reason) {
  if (config.screen_width <= 0 || config.screen_height <= 0) {
    reason = "screen dimensions must be positive";
    return false;
  }
  if (config.tick_rate <= 0) {
    reason = "tick_rate must be positive";
    return false;
  }
  if (config.pipe_spawn_interval_ms <= 0) {
    reason = "pipe_spawn_interval_ms must be positive";
    return false;
  }
  if (config.bird_width <= 0 || config.bird_height <= 0) {
    reason = "bird size must be positive";
    return false;
  }
  if (config.pipe_width <= 0 || config.pipe_gap_size <= 0) {
    reason = "pipe width and gap size must be positive";
    return false;
  }
  if (config.ground_height < 0 || config.ground_height >= config.screen_height) {
    reason = "ground_height must lie inside the screen";
    return false;
  }
  if (config.pipe_gap_margin < 0 ||
      config.screen_height - config.pipe_gap_margin < config.pipe_gap_margin) {
    reason = "pipe_gap_margin leaves no room for a gap center";
    return false;
  }
  if (config.trail_radius_min > config.trail_radius_max ||
      config.trail_lifetime_min > config.trail_lifetime_max ||
      config.trail_jitter_y < 0) {
    reason = "trail particle ranges are inverted";
    return false;
  }
  if (config.shake_ticks < 0 || config.shake_magnitude < 0 ||
      config.death_particle_count < 0) {
    reason = "game over effect counts must not be negative";
    return false;
  }
  return true;
}
