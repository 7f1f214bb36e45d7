#include "Gapwing/Renderer.h"
#include "Gapwing/Config.h"
#include "Gapwing/GWCommon.h"
#include <algorithm>
#include <cmath>
#include <iostream>

static constexpr float PIPE_CAP_HEIGHT = 30.0f;
static constexpr float PIPE_CAP_BORDER = 3.0f;
static constexpr float PIPE_HIGHLIGHT_INSET = 7.5f;
static constexpr float PIPE_HIGHLIGHT_THICKNESS = 4.0f;
static constexpr float GROUND_LINE_THICKNESS = 5.0f;

static SDL_FColor to_fcolor(const SDL_Color &c) {
  return {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f};
}

Renderer::~Renderer() { shutdown(); }

bool Renderer::initialize(const char *title, int window_width,
                          int window_height) {
  window = SDL_CreateWindow(title, window_width, window_height, 0);
  if (!window) {
    std::cerr << "Failed to create window: " << SDL_GetError() << std::endl;
    return false;
  }

  renderer = SDL_CreateRenderer(window, nullptr);
  if (!renderer) {
    std::cerr << "Failed to create renderer: " << SDL_GetError() << std::endl;
    SDL_DestroyWindow(window);
    window = nullptr;
    return false;
  }

  if (!SDL_SetRenderVSync(renderer, 1))
    GWLOG("VSync unavailable: %s", SDL_GetError());

  GWLOG("Renderer ready (%dx%d, %s)", window_width, window_height,
        SDL_GetRendererName(renderer));
  return true;
}

void Renderer::shutdown() {
  if (renderer) {
    SDL_DestroyRenderer(renderer);
    renderer = nullptr;
  }
  if (window) {
    SDL_DestroyWindow(window);
    window = nullptr;
  }
}

void Renderer::setColor(const SDL_Color &color) {
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

void Renderer::fillRect(float x, float y, float w, float h) {
  SDL_FRect r = {x + offset_x, y + offset_y, w, h};
  SDL_RenderFillRect(renderer, &r);
}

void Renderer::fillCircle(float cx, float cy, float radius) {
  if (radius <= 0.0f)
    return;
  // One horizontal span per pixel row
  for (float dy = -radius; dy <= radius; dy += 1.0f) {
    float half = std::sqrt(radius * radius - dy * dy);
    SDL_RenderLine(renderer, cx - half + offset_x, cy + dy + offset_y,
                   cx + half + offset_x, cy + dy + offset_y);
  }
}

void Renderer::fillEllipse(const SDL_FRect &box) {
  float a = box.w / 2.0f;
  float b = box.h / 2.0f;
  if (a <= 0.0f || b <= 0.0f)
    return;
  float cx = box.x + a;
  float cy = box.y + b;
  for (float dy = -b; dy <= b; dy += 1.0f) {
    float half = a * std::sqrt(std::max(0.0f, 1.0f - (dy * dy) / (b * b)));
    SDL_RenderLine(renderer, cx - half + offset_x, cy + dy + offset_y,
                   cx + half + offset_x, cy + dy + offset_y);
  }
}

void Renderer::fillTriangle(const SDL_FPoint &a, const SDL_FPoint &b,
                            const SDL_FPoint &c, const SDL_Color &color) {
  SDL_FColor fc = to_fcolor(color);
  SDL_Vertex verts[3] = {
      {{a.x + offset_x, a.y + offset_y}, fc, {0.0f, 0.0f}},
      {{b.x + offset_x, b.y + offset_y}, fc, {0.0f, 0.0f}},
      {{c.x + offset_x, c.y + offset_y}, fc, {0.0f, 0.0f}},
  };
  SDL_RenderGeometry(renderer, nullptr, verts, 3, nullptr, 0);
}

void Renderer::drawPipe(const SDL_FRect &rect, bool is_top) {
  if (rect.w <= 0.0f || rect.h <= 0.0f)
    return;

  // Body, darker toward the right
  for (int i = 0; i < static_cast<int>(rect.w); ++i) {
    int shade = 20 + static_cast<int>((i / rect.w) * 60.0f);
    SDL_Color c = {
        static_cast<Uint8>(std::max(0, COLOR_PIPE_GREEN.r - shade)),
        static_cast<Uint8>(std::max(0, COLOR_PIPE_GREEN.g - shade)),
        static_cast<Uint8>(std::max(0, COLOR_PIPE_GREEN.b - shade)), 255};
    setColor(c);
    fillRect(rect.x + i, rect.y, 1.0f, rect.h);
  }

  // End cap faces the gap
  float cap_h = std::min(PIPE_CAP_HEIGHT, rect.h);
  float cap_y = is_top ? rect.y + rect.h - cap_h : rect.y;

  setColor(COLOR_BLACK);
  fillRect(rect.x, cap_y, rect.w, cap_h);
  setColor(COLOR_PIPE_GREEN);
  fillRect(rect.x + PIPE_CAP_BORDER, cap_y + PIPE_CAP_BORDER,
           rect.w - 2 * PIPE_CAP_BORDER, cap_h - 2 * PIPE_CAP_BORDER);

  float hx = rect.x + PIPE_HIGHLIGHT_INSET;
  float hy = cap_y + PIPE_HIGHLIGHT_INSET;
  float hw = rect.w - 2 * PIPE_HIGHLIGHT_INSET;
  float hh = cap_h - 2 * PIPE_HIGHLIGHT_INSET;
  if (hw > 2 * PIPE_HIGHLIGHT_THICKNESS && hh > 2 * PIPE_HIGHLIGHT_THICKNESS) {
    setColor(COLOR_PIPE_HIGHLIGHT);
    fillRect(hx, hy, hw, PIPE_HIGHLIGHT_THICKNESS);
    fillRect(hx, hy + hh - PIPE_HIGHLIGHT_THICKNESS, hw,
             PIPE_HIGHLIGHT_THICKNESS);
    fillRect(hx, hy, PIPE_HIGHLIGHT_THICKNESS, hh);
    fillRect(hx + hw - PIPE_HIGHLIGHT_THICKNESS, hy, PIPE_HIGHLIGHT_THICKNESS,
             hh);
  }
}

void Renderer::drawBird(const SDL_FRect &rect) {
  // Sprite layout for a 45x35 box, scaled to whatever the config asks for
  float sx = rect.w / BIRD_WIDTH;
  float sy = rect.h / BIRD_HEIGHT;
  auto px = [&](float v) { return rect.x + v * sx; };
  auto py = [&](float v) { return rect.y + v * sy; };

  // Body
  setColor(COLOR_BIRD_DARK);
  fillCircle(px(22), py(20), 15 * sy);
  setColor(COLOR_BIRD_LIGHT);
  fillCircle(px(22), py(17), 15 * sy);

  // Beak
  fillTriangle({px(38), py(18)}, {px(50), py(22)}, {px(38), py(26)},
               COLOR_BIRD_BEAK);

  // Eye
  setColor(COLOR_BLACK);
  fillCircle(px(32), py(14), 4 * sy);
  setColor(COLOR_WHITE);
  fillCircle(px(33), py(13), 2 * sy);

  // Wing
  setColor(COLOR_BIRD_DARK);
  fillEllipse({px(15), py(12), 20 * sx, 10 * sy});
  setColor(COLOR_BIRD_LIGHT);
  fillEllipse({px(15), py(10), 20 * sx, 10 * sy});
}

void Renderer::drawGround(const SDL_FRect &rect) {
  setColor(COLOR_GROUND);
  fillRect(rect.x, rect.y, rect.w, rect.h);
  setColor(COLOR_BLACK);
  fillRect(rect.x, rect.y - GROUND_LINE_THICKNESS / 2.0f, rect.w,
           GROUND_LINE_THICKNESS);
}

void Renderer::drawSnapshot(const RenderSnapshot &snapshot) {
  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
  setColor(COLOR_SKY_BLUE);
  SDL_RenderClear(renderer);

  offset_x = static_cast<float>(snapshot.shake_offset_x);
  offset_y = static_cast<float>(snapshot.shake_offset_y);

  for (const Drawable &d : snapshot.drawables) {
    switch (d.kind) {
    case DrawableKind::RECT:
      setColor(d.color);
      fillRect(d.rect.x, d.rect.y, d.rect.w, d.rect.h);
      break;
    case DrawableKind::CIRCLE:
      setColor(d.color);
      fillCircle(d.rect.x + d.rect.w / 2.0f, d.rect.y + d.rect.h / 2.0f,
                 d.rect.w / 2.0f);
      break;
    case DrawableKind::ELLIPSE:
      setColor(d.color);
      fillEllipse(d.rect);
      break;
    case DrawableKind::BIRD:
      drawBird(d.rect);
      break;
    case DrawableKind::PIPE_TOP:
      drawPipe(d.rect, true);
      break;
    case DrawableKind::PIPE_BOTTOM:
      drawPipe(d.rect, false);
      break;
    case DrawableKind::GROUND:
      drawGround(d.rect);
      break;
    }
  }

  offset_x = 0.0f;
  offset_y = 0.0f;
}

void Renderer::present() { SDL_RenderPresent(renderer); }
