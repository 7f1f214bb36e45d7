#include "Gapwing/Particles.h"
#include "Gapwing/Config.h"
#include <algorithm>

// =============================================================================
// TrailParticleSet
// =============================================================================

TrailParticleSet::TrailParticleSet(float drift_x, float shrink)
    : drift_x(drift_x), shrink(shrink) {}

void TrailParticleSet::emit(float x, float y, float radius, int lifetime) {
  particles.push_back({x, y, radius, lifetime});
}

void TrailParticleSet::update(float dt_ticks) {
  for (TrailParticle &p : particles) {
    p.lifetime -= 1;
    if (p.lifetime > 0) {
      p.x -= drift_x * dt_ticks;
      p.radius -= shrink * dt_ticks;
    }
  }

  particles.erase(std::remove_if(particles.begin(), particles.end(),
                                 [](const TrailParticle &p) {
                                   return p.lifetime <= 0;
                                 }),
                  particles.end());
}

void TrailParticleSet::appendDrawables(std::vector<Drawable> &out) const {
  for (const TrailParticle &p : particles) {
    if (p.radius <= 0.0f)
      continue;
    out.push_back({DrawableKind::CIRCLE,
                   {p.x - p.radius, p.y - p.radius, p.radius * 2.0f,
                    p.radius * 2.0f},
                   COLOR_TRAIL});
  }
}

// =============================================================================
// DeathParticleSet
// =============================================================================

DeathParticleSet::DeathParticleSet(float gravity, float shrink)
    : gravity(gravity), shrink(shrink) {}

void DeathParticleSet::emitBurst(float x, float y, int count,
                                 RandomSource &rng) {
  particles.reserve(particles.size() + count);
  for (int i = 0; i < count; ++i) {
    DeathParticle p;
    p.x = x;
    p.y = y;
    p.vx = rng.randomFloat(DEATH_VX_MIN, DEATH_VX_MAX);
    p.vy = rng.randomFloat(DEATH_VY_MIN, DEATH_VY_MAX);
    p.size = static_cast<float>(rng.randomInt(DEATH_SIZE_MIN, DEATH_SIZE_MAX));
    p.color = DEATH_PALETTE[rng.randomInt(0, DEATH_PALETTE_SIZE - 1)];
    particles.push_back(p);
  }
}

void DeathParticleSet::update(float dt_ticks) {
  for (DeathParticle &p : particles) {
    p.vy += gravity * dt_ticks;
    p.x += p.vx * dt_ticks;
    p.y += p.vy * dt_ticks;
    p.size -= shrink * dt_ticks;
  }

  particles.erase(std::remove_if(particles.begin(), particles.end(),
                                 [](const DeathParticle &p) {
                                   return p.size <= 0.0f;
                                 }),
                  particles.end());
}

void DeathParticleSet::appendDrawables(std::vector<Drawable> &out) const {
  for (const DeathParticle &p : particles) {
    out.push_back({DrawableKind::RECT, {p.x, p.y, p.size, p.size}, p.color});
  }
}
