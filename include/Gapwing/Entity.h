#pragma once

#include <SDL3/SDL.h>
#include <vector>

// What the renderer should draw for a Drawable. Circles and ellipses are
// described by their bounding box.
enum class DrawableKind : uint8_t {
  RECT,
  CIRCLE,
  ELLIPSE,
  BIRD,
  PIPE_TOP,
  PIPE_BOTTOM,
  GROUND
};

struct Drawable {
  DrawableKind kind;
  SDL_FRect rect;
  SDL_Color color;
};

/**
 * Entity - shared capability of everything the simulation advances:
 * step by some number of ticks, then describe itself as plain drawables.
 * The set of entity kinds is closed, so there is no type lookup.
 */
class Entity {
public:
  virtual ~Entity() = default;

  virtual void update(float dt_ticks) = 0;
  virtual void appendDrawables(std::vector<Drawable> &out) const = 0;
};

// Strict AABB overlap, touching edges do not count
inline bool rectsOverlap(const SDL_FRect &a, const SDL_FRect &b) {
  return a.x < b.x + b.w && a.x + a.w > b.x && a.y < b.y + b.h &&
         a.y + a.h > b.y;
}
