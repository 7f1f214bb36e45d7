#include "Gapwing/Bird.h"
#include <cmath>

Bird::Bird(const GameConfig &config, RandomSource &rng)
    : trail(config.trail_drift_x, config.trail_shrink), config(config),
      rng(&rng) {
  reset();
}

void Bird::reset() {
  x = config.bird_start_x;
  y = config.birdStartY();
  velocity = 0.0;
  width = config.bird_width;
  height = config.bird_height;
  trail.clear();
}

void Bird::jump() { velocity = config.jump_strength; }

void Bird::update(float dt_ticks) {
  velocity += config.gravity * dt_ticks;
  y += std::trunc(velocity * dt_ticks);

  if (top() < 0.0f) {
    setTop(0.0f);
    velocity = 0.0;
  }

  emitTrailParticle();
  trail.update(dt_ticks);
}

void Bird::emitTrailParticle() {
  float px = left() - config.trail_emit_offset_x;
  float py = static_cast<float>(
      y + rng->randomInt(-config.trail_jitter_y, config.trail_jitter_y));
  float radius = static_cast<float>(
      rng->randomInt(config.trail_radius_min, config.trail_radius_max));
  int lifetime =
      rng->randomInt(config.trail_lifetime_min, config.trail_lifetime_max);
  trail.emit(px, py, radius, lifetime);
}

void Bird::appendDrawables(std::vector<Drawable> &out) const {
  out.push_back({DrawableKind::BIRD, bounds(), COLOR_BIRD_LIGHT});
  trail.appendDrawables(out);
}
