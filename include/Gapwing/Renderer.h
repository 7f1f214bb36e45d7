#ifndef GAPWING_RENDERER_H
#define GAPWING_RENDERER_H

#include "Gapwing/GameState.h"
#include <SDL3/SDL.h>

/**
 * Renderer - owns the SDL window and renderer and turns a RenderSnapshot
 * into draw calls. It never touches simulation state.
 *
 * Shapes are drawn with plain SDL primitives (filled rects, scanline
 * circles and ellipses, RenderGeometry triangles); there are no textures.
 */
class Renderer {
public:
  SDL_Window *window = nullptr;
  SDL_Renderer *renderer = nullptr;

  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer &) = delete;
  Renderer &operator=(const Renderer &) = delete;

  bool initialize(const char *title, int window_width, int window_height);
  void shutdown();

  // Clears to the sky color and draws every drawable, shifted by the
  // snapshot's shake offset
  void drawSnapshot(const RenderSnapshot &snapshot);

  void present();

private:
  // Shake offset of the frame being drawn
  float offset_x = 0.0f;
  float offset_y = 0.0f;

  void setColor(const SDL_Color &color);
  void fillRect(float x, float y, float w, float h);
  void fillCircle(float cx, float cy, float radius);
  void fillEllipse(const SDL_FRect &box);
  void fillTriangle(const SDL_FPoint &a, const SDL_FPoint &b,
                    const SDL_FPoint &c, const SDL_Color &color);

  void drawPipe(const SDL_FRect &rect, bool is_top);
  void drawBird(const SDL_FRect &rect);
  void drawGround(const SDL_FRect &rect);
};

#endif // GAPWING_RENDERER_H
