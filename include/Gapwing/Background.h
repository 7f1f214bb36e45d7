#pragma once

#include "Gapwing/Config.h"
#include "Gapwing/Entity.h"
#include "Gapwing/RandomSource.h"
#include <vector>

struct BackgroundLayer {
  std::vector<Drawable> shapes; // laid out for one screen width
  float speed = 0.0f;           // px per tick
  float offset = 0.0f;          // in (-screen_width, 0]
};

/**
 * ParallaxBackground - decorative scenery: far clouds, a skyline and near
 * hills, each scrolling left at its own rate and wrapping after one screen
 * width. Each layer is drawn twice, side by side, so the wrap is seamless.
 */
class ParallaxBackground : public Entity {
public:
  std::vector<BackgroundLayer> layers;

  ParallaxBackground(const GameConfig &config, RandomSource &rng);

  // Rebuilds every layer from the random source and rewinds the scroll
  void generate();

  void update(float dt_ticks) override;
  void appendDrawables(std::vector<Drawable> &out) const override;

private:
  GameConfig config;
  RandomSource *rng;
};
