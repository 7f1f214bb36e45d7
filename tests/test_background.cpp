#include "Gapwing/Background.h"
#include "ScriptedRandom.h"
#include <gtest/gtest.h>

class BackgroundTest : public ::testing::Test {
protected:
  GameConfig config;
  ScriptedRandomSource rng;
};

TEST_F(BackgroundTest, GeneratesCloudsSkylineAndHills) {
  ParallaxBackground background(config, rng);
  ASSERT_EQ(background.layers.size(), 3u);
  EXPECT_EQ(background.layers[0].shapes.size(), 10u);
  EXPECT_EQ(background.layers[1].shapes.size(), 25u);
  EXPECT_EQ(background.layers[2].shapes.size(), 2u);

  EXPECT_FLOAT_EQ(background.layers[0].speed, 0.5f);
  EXPECT_FLOAT_EQ(background.layers[1].speed, 1.0f);
  EXPECT_FLOAT_EQ(background.layers[2].speed, 2.0f);
}

TEST_F(BackgroundTest, CloudsComeFromTheRandomSource) {
  rng.ints = {400, 120, 30}; // x, y, radius of the first cloud
  ParallaxBackground background(config, rng);

  const Drawable &cloud = background.layers[0].shapes[0];
  EXPECT_EQ(cloud.kind, DrawableKind::CIRCLE);
  EXPECT_FLOAT_EQ(cloud.rect.x, 370.0f);
  EXPECT_FLOAT_EQ(cloud.rect.y, 90.0f);
  EXPECT_FLOAT_EQ(cloud.rect.w, 60.0f);
}

TEST_F(BackgroundTest, BuildingsStandOnTheGroundLine) {
  MersenneRandomSource mt(9);
  ParallaxBackground background(config, mt);
  int i = 0;
  for (const Drawable &building : background.layers[1].shapes) {
    EXPECT_FLOAT_EQ(building.rect.x, i * 40.0f);
    EXPECT_FLOAT_EQ(building.rect.y + building.rect.h, config.groundLine());
    EXPECT_GE(building.rect.h, 50.0f);
    EXPECT_LE(building.rect.h, 150.0f);
    i++;
  }
}

TEST_F(BackgroundTest, LayersScrollAtTheirOwnSpeed) {
  ParallaxBackground background(config, rng);
  background.update(1.0f);
  EXPECT_FLOAT_EQ(background.layers[0].offset, -0.5f);
  EXPECT_FLOAT_EQ(background.layers[1].offset, -1.0f);
  EXPECT_FLOAT_EQ(background.layers[2].offset, -2.0f);
}

TEST_F(BackgroundTest, LayerWrapsAfterOneScreenWidth) {
  ParallaxBackground background(config, rng);
  for (int i = 0; i < 399; ++i)
    background.update(1.0f);
  EXPECT_FLOAT_EQ(background.layers[2].offset, -798.0f);

  background.update(1.0f);
  EXPECT_FLOAT_EQ(background.layers[2].offset, 0.0f);
  background.update(1.0f);
  EXPECT_FLOAT_EQ(background.layers[2].offset, -2.0f);
}

TEST_F(BackgroundTest, EachLayerIsDrawnTwiceSideBySide) {
  ParallaxBackground background(config, rng);
  background.update(1.0f);

  std::vector<Drawable> out;
  background.appendDrawables(out);
  ASSERT_EQ(out.size(), 74u);

  // First cloud, then its copy one screen width to the right
  EXPECT_FLOAT_EQ(out[10].rect.x - out[0].rect.x, 800.0f);
  EXPECT_FLOAT_EQ(out[0].rect.x, background.layers[0].shapes[0].rect.x - 0.5f);
}

TEST_F(BackgroundTest, GenerateRewindsTheScroll) {
  ParallaxBackground background(config, rng);
  for (int i = 0; i < 10; ++i)
    background.update(1.0f);
  background.generate();
  for (const BackgroundLayer &layer : background.layers)
    EXPECT_FLOAT_EQ(layer.offset, 0.0f);
  EXPECT_EQ(background.layers[0].shapes.size(), 10u);
}
