#pragma once

#include "Gapwing/Entity.h"
#include "Gapwing/RandomSource.h"
#include <cstddef>
#include <vector>

struct TrailParticle {
  float x, y;
  float radius;
  int lifetime; // ticks left
};

struct DeathParticle {
  float x, y;
  float vx, vy;
  float size;
  SDL_Color color;
};

/**
 * TrailParticleSet - inert markers left behind the bird. Each update ages
 * every particle by one tick: it dies when its lifetime runs out, otherwise
 * it drifts left and shrinks.
 */
class TrailParticleSet : public Entity {
public:
  std::vector<TrailParticle> particles;

  float drift_x = 0.0f;
  float shrink = 0.0f;

  TrailParticleSet() = default;
  TrailParticleSet(float drift_x, float shrink);

  void emit(float x, float y, float radius, int lifetime);
  void update(float dt_ticks) override;
  void appendDrawables(std::vector<Drawable> &out) const override;

  void clear() { particles.clear(); }
  bool empty() const { return particles.empty(); }
  size_t size() const { return particles.size(); }
};

/**
 * DeathParticleSet - ballistic burst emitted once when the bird dies.
 * Particles fall under their own gravity and are dropped once their size
 * reaches zero.
 */
class DeathParticleSet : public Entity {
public:
  std::vector<DeathParticle> particles;

  float gravity = 0.0f;
  float shrink = 0.0f;

  DeathParticleSet() = default;
  DeathParticleSet(float gravity, float shrink);

  // Velocities and sizes come from `rng`, colors from DEATH_PALETTE
  void emitBurst(float x, float y, int count, RandomSource &rng);
  void update(float dt_ticks) override;
  void appendDrawables(std::vector<Drawable> &out) const override;

  void clear() { particles.clear(); }
  bool empty() const { return particles.empty(); }
  size_t size() const { return particles.size(); }
};
