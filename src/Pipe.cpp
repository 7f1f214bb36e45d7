#include "Gapwing/Pipe.h"
#include <algorithm>

// =============================================================================
// PipePair
// =============================================================================

PipePair::PipePair(uint32_t id, float x, float gap_y, const GameConfig &config)
    : id(id), x(x), gap_y(gap_y), width(config.pipe_width),
      gap_size(config.pipe_gap_size), speed(config.pipe_speed),
      screen_height(static_cast<float>(config.screen_height)) {}

void PipePair::update(float dt_ticks) { x += speed * dt_ticks; }

SDL_FRect PipePair::topRect() const {
  float height = gap_y - gap_size / 2.0f;
  return {x, 0.0f, width, height};
}

SDL_FRect PipePair::bottomRect() const {
  float top = gap_y + gap_size / 2.0f;
  return {x, top, width, screen_height - top};
}

void PipePair::appendDrawables(std::vector<Drawable> &out) const {
  out.push_back({DrawableKind::PIPE_TOP, topRect(), COLOR_PIPE_GREEN});
  out.push_back({DrawableKind::PIPE_BOTTOM, bottomRect(), COLOR_PIPE_GREEN});
}

// =============================================================================
// PipeStream
// =============================================================================

PipeStream::PipeStream(const GameConfig &config, RandomSource &rng)
    : config(config), rng(&rng) {}

bool PipeStream::maybeSpawn(float dt_ticks) {
  spawn_accumulator += dt_ticks;
  if (spawn_accumulator < config.spawnIntervalTicks())
    return false;

  spawn_accumulator = 0.0f;
  spawn();
  return true;
}

PipePair &PipeStream::spawn() {
  int gap_y = rng->randomInt(config.pipe_gap_margin,
                             config.screen_height - config.pipe_gap_margin);
  return spawnAt(config.screen_width + config.pipe_spawn_margin,
                 static_cast<float>(gap_y));
}

PipePair &PipeStream::spawnAt(float x, float gap_y) {
  pairs.emplace_back(next_id++, x, gap_y, config);
  return pairs.back();
}

void PipeStream::scroll(float dt_ticks) {
  for (PipePair &pair : pairs) {
    pair.update(dt_ticks);
  }
}

void PipeStream::update(float dt_ticks) {
  maybeSpawn(dt_ticks);
  scroll(dt_ticks);
}

size_t PipeStream::retireOffscreen() {
  size_t before = pairs.size();
  pairs.erase(std::remove_if(pairs.begin(), pairs.end(),
                             [](const PipePair &pair) {
                               return pair.right() < 0.0f;
                             }),
              pairs.end());
  return before - pairs.size();
}

void PipeStream::clear() {
  pairs.clear();
  spawn_accumulator = 0.0f;
}

void PipeStream::appendDrawables(std::vector<Drawable> &out) const {
  for (const PipePair &pair : pairs) {
    pair.appendDrawables(out);
  }
}
