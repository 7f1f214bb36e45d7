#include "Gapwing/Background.h"
#include <initializer_list>

// Layer layout
static constexpr int CLOUD_COUNT = 10;
static constexpr int CLOUD_Y_MIN = 50;
static constexpr int CLOUD_Y_MAX = 200;
static constexpr int CLOUD_RADIUS_MIN = 20;
static constexpr int CLOUD_RADIUS_MAX = 50;
static constexpr float CLOUD_SPEED = 0.5f;

static constexpr int BUILDING_COUNT = 25;
static constexpr float BUILDING_SPACING = 40.0f;
static constexpr float BUILDING_WIDTH = 30.0f;
static constexpr int BUILDING_HEIGHT_MIN = 50;
static constexpr int BUILDING_HEIGHT_MAX = 150;
static constexpr float SKYLINE_SPEED = 1.0f;

static constexpr float HILLS_SPEED = 2.0f;

static constexpr SDL_Color COLOR_CLOUD = {220, 235, 245, 255};
static constexpr SDL_Color COLOR_BUILDING = {100, 100, 120, 255};
static constexpr SDL_Color COLOR_HILL = {50, 180, 50, 255};

ParallaxBackground::ParallaxBackground(const GameConfig &config,
                                       RandomSource &rng)
    : config(config), rng(&rng) {
  generate();
}

void ParallaxBackground::generate() {
  const float w = static_cast<float>(config.screen_width);
  const float h = static_cast<float>(config.screen_height);

  layers.clear();
  layers.resize(3);

  // Distant clouds
  BackgroundLayer &clouds = layers[0];
  clouds.speed = CLOUD_SPEED;
  for (int i = 0; i < CLOUD_COUNT; ++i) {
    float cx = static_cast<float>(rng->randomInt(0, config.screen_width));
    float cy = static_cast<float>(rng->randomInt(CLOUD_Y_MIN, CLOUD_Y_MAX));
    float r = static_cast<float>(
        rng->randomInt(CLOUD_RADIUS_MIN, CLOUD_RADIUS_MAX));
    clouds.shapes.push_back(
        {DrawableKind::CIRCLE, {cx - r, cy - r, r * 2.0f, r * 2.0f},
         COLOR_CLOUD});
  }

  // Skyline standing on the ground line
  BackgroundLayer &skyline = layers[1];
  skyline.speed = SKYLINE_SPEED;
  for (int i = 0; i < BUILDING_COUNT; ++i) {
    float bh = static_cast<float>(
        rng->randomInt(BUILDING_HEIGHT_MIN, BUILDING_HEIGHT_MAX));
    skyline.shapes.push_back({DrawableKind::RECT,
                              {i * BUILDING_SPACING,
                               config.groundLine() - bh, BUILDING_WIDTH, bh},
                              COLOR_BUILDING});
  }

  // Foreground hills
  BackgroundLayer &hills = layers[2];
  hills.speed = HILLS_SPEED;
  hills.shapes.push_back(
      {DrawableKind::ELLIPSE, {-100.0f, h - 150.0f, w / 2.0f, 200.0f},
       COLOR_HILL});
  hills.shapes.push_back({DrawableKind::ELLIPSE,
                          {w / 2.0f - 50.0f, h - 180.0f, w / 1.5f, 250.0f},
                          COLOR_HILL});
}

void ParallaxBackground::update(float dt_ticks) {
  const float w = static_cast<float>(config.screen_width);
  for (BackgroundLayer &layer : layers) {
    layer.offset -= layer.speed * dt_ticks;
    if (layer.offset <= -w)
      layer.offset = 0.0f;
  }
}

void ParallaxBackground::appendDrawables(std::vector<Drawable> &out) const {
  const float w = static_cast<float>(config.screen_width);
  for (const BackgroundLayer &layer : layers) {
    for (float base : {layer.offset, layer.offset + w}) {
      for (const Drawable &shape : layer.shapes) {
        Drawable d = shape;
        d.rect.x += base;
        out.push_back(d);
      }
    }
  }
}
