#pragma once

#include "Gapwing/Config.h"
#include "Gapwing/Entity.h"
#include "Gapwing/Particles.h"
#include "Gapwing/RandomSource.h"
#include <cmath>

/**
 * Bird - the player avatar.
 *
 * Position is the center of the bounding box. The box edges sit on whole
 * pixels: the center is floor(size / 2) in from the left and top edges, so
 * a 45x35 bird centered at (150, 300) spans 128..173 by 283..318. The
 * vertical displacement of each step is truncated toward zero, so a
 * velocity below one pixel per tick does not move the bird. A step that
 * carries the top edge above the screen clamps it and cancels the velocity.
 */
class Bird : public Entity {
public:
  // Center position
  float x = 0.0f;
  double y = 0.0;

  double velocity = 0.0;
  float width = 0.0f;
  float height = 0.0f;

  TrailParticleSet trail;

  Bird(const GameConfig &config, RandomSource &rng);

  void update(float dt_ticks) override;
  void appendDrawables(std::vector<Drawable> &out) const override;

  // Upward impulse, replaces whatever velocity the bird had
  void jump();

  // Back to the spawn point, at rest, with no trail
  void reset();

  float left() const { return x - std::floor(width / 2.0f); }
  float right() const { return left() + width; }
  float top() const {
    return static_cast<float>(y - std::floor(height / 2.0f));
  }
  float bottom() const { return top() + height; }
  void setTop(float top_edge) { y = top_edge + std::floor(height / 2.0f); }
  void setBottom(float bottom_edge) { setTop(bottom_edge - height); }

  SDL_FRect bounds() const { return {left(), top(), width, height}; }

private:
  GameConfig config;
  RandomSource *rng;

  void emitTrailParticle();
};
