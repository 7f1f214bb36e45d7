#pragma once

#include "Gapwing/Config.h"
#include "Gapwing/Entity.h"
#include "Gapwing/RandomSource.h"
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * PipePair - one obstacle: a top and a bottom half sharing a gap.
 *
 * Both halves are derived from the gap center, so the pair is the unit of
 * scoring while collision is tested per half. `passed` only ever goes from
 * false to true.
 */
class PipePair : public Entity {
public:
  uint32_t id = 0;
  float x = 0.0f; // left edge
  float gap_y = 0.0f;
  float width = 0.0f;
  float gap_size = 0.0f;
  float speed = 0.0f;
  float screen_height = 0.0f;
  bool passed = false;

  PipePair(uint32_t id, float x, float gap_y, const GameConfig &config);

  void update(float dt_ticks) override;
  void appendDrawables(std::vector<Drawable> &out) const override;

  SDL_FRect topRect() const;
  SDL_FRect bottomRect() const;

  float centerX() const { return x + width / 2.0f; }
  float right() const { return x + width; }
};

/**
 * PipeStream - spawns pairs on a fixed cadence and keeps them in spawn
 * order, which is also their left-to-right order on screen.
 */
class PipeStream : public Entity {
public:
  std::vector<PipePair> pairs;
  float spawn_accumulator = 0.0f; // ticks since the last spawn

  PipeStream(const GameConfig &config, RandomSource &rng);

  // Spawn + scroll
  void update(float dt_ticks) override;
  void appendDrawables(std::vector<Drawable> &out) const override;

  // Advances the spawn timer; returns true if a pair was spawned
  bool maybeSpawn(float dt_ticks);

  // Adds one pair just past the right edge of the screen
  PipePair &spawn();
  PipePair &spawnAt(float x, float gap_y);

  void scroll(float dt_ticks);

  // Drops pairs whose right edge has left the screen, returns how many
  size_t retireOffscreen();

  void clear();

  bool empty() const { return pairs.empty(); }
  size_t size() const { return pairs.size(); }

private:
  GameConfig config;
  RandomSource *rng;
  uint32_t next_id = 0;
};
