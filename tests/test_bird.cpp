#include "Gapwing/Bird.h"
#include "ScriptedRandom.h"
#include <gtest/gtest.h>

class BirdTest : public ::testing::Test {
protected:
  GameConfig config;
  ScriptedRandomSource rng;
};

TEST_F(BirdTest, SpawnsAtStartPositionAtRest) {
  Bird bird(config, rng);
  EXPECT_FLOAT_EQ(bird.x, 150.0f);
  EXPECT_FLOAT_EQ(bird.y, 300.0f);
  EXPECT_FLOAT_EQ(bird.velocity, 0.0f);
  EXPECT_FLOAT_EQ(bird.width, 45.0f);
  EXPECT_FLOAT_EQ(bird.height, 35.0f);
  EXPECT_TRUE(bird.trail.empty());
}

TEST_F(BirdTest, SpawnBoxSitsOnWholePixels) {
  Bird bird(config, rng);
  EXPECT_FLOAT_EQ(bird.left(), 128.0f);
  EXPECT_FLOAT_EQ(bird.right(), 173.0f);
  EXPECT_FLOAT_EQ(bird.top(), 283.0f);
  EXPECT_FLOAT_EQ(bird.bottom(), 318.0f);

  bird.setBottom(500.0f);
  EXPECT_FLOAT_EQ(bird.top(), 465.0f);
  EXPECT_DOUBLE_EQ(bird.y, 482.0);
}

TEST_F(BirdTest, SpawnCenterFollowsScreenHeight) {
  config.screen_height = 700;
  Bird bird(config, rng);
  EXPECT_DOUBLE_EQ(bird.y, 350.0);
  EXPECT_FLOAT_EQ(bird.top(), 333.0f);
}

TEST_F(BirdTest, FirstTickAddsGravityAndTruncatesDisplacement) {
  Bird bird(config, rng);
  bird.update(1.0f);
  EXPECT_FLOAT_EQ(bird.velocity, 0.4f);
  EXPECT_FLOAT_EQ(bird.y, 300.0f);
}

TEST_F(BirdTest, VelocityGrowsByGravityEveryTick) {
  Bird bird(config, rng);
  for (int i = 0; i < 20; ++i) {
    double before = bird.velocity;
    bird.update(1.0f);
    EXPECT_NEAR(bird.velocity - before, config.gravity, 1e-4f);
  }
}

TEST_F(BirdTest, JumpReplacesVelocityWhetherRisingOrFalling) {
  Bird bird(config, rng);
  bird.velocity = 7.5f;
  bird.jump();
  EXPECT_FLOAT_EQ(bird.velocity, -9.0f);

  bird.velocity = -3.0f;
  bird.jump();
  EXPECT_FLOAT_EQ(bird.velocity, -9.0f);
}

TEST_F(BirdTest, DisplacementTruncatesTowardZero) {
  Bird bird(config, rng);
  bird.velocity = -1.7f; // -1.3 after gravity
  bird.update(1.0f);
  EXPECT_FLOAT_EQ(bird.y, 299.0f);

  bird.velocity = 1.5f; // 1.9 after gravity
  bird.update(1.0f);
  EXPECT_FLOAT_EQ(bird.y, 300.0f);
}

TEST_F(BirdTest, RiseAfterJumpMovesWholePixels) {
  Bird bird(config, rng);
  bird.jump();

  // -8.6, -8.2, -7.8, -7.4, then a velocity just short of -7
  const double expected[] = {-8.0, -8.0, -7.0, -7.0, -6.0};
  for (double step : expected) {
    double before = bird.y;
    bird.update(1.0f);
    EXPECT_DOUBLE_EQ(bird.y - before, step);
  }
  EXPECT_FLOAT_EQ(bird.top(), 283.0f - 36.0f);
}

TEST_F(BirdTest, TopLandingExactlyOnZeroKeepsVelocity) {
  Bird bird(config, rng);
  bird.setTop(8.0f);
  bird.velocity = -8.5; // -8.1 after gravity
  bird.update(1.0f);
  EXPECT_FLOAT_EQ(bird.top(), 0.0f);
  EXPECT_NEAR(bird.velocity, -8.1, 1e-9);
}

TEST_F(BirdTest, TopEdgeClampsAndCancelsVelocity) {
  Bird bird(config, rng);
  bird.setTop(3.0f);
  bird.velocity = -9.0f;
  bird.update(1.0f);
  EXPECT_FLOAT_EQ(bird.top(), 0.0f);
  EXPECT_FLOAT_EQ(bird.velocity, 0.0f);
}

TEST_F(BirdTest, TopEdgeNeverNegativeWhileFlappingContinuously) {
  Bird bird(config, rng);
  for (int i = 0; i < 300; ++i) {
    bird.jump();
    bird.update(1.0f);
    ASSERT_GE(bird.top(), 0.0f) << "tick " << i;
  }
}

TEST_F(BirdTest, EmitsOneTrailParticleBehindTheBirdEachTick) {
  rng.ints = {3, 4, 12}; // jitter, radius, lifetime
  Bird bird(config, rng);
  bird.update(1.0f);

  ASSERT_EQ(bird.trail.size(), 1u);
  const TrailParticle &p = bird.trail.particles[0];
  // Emitted at left - 5, then aged once along with the rest
  EXPECT_FLOAT_EQ(p.x, 128.0f - 5.0f - 2.0f);
  EXPECT_FLOAT_EQ(p.y, 303.0f);
  EXPECT_NEAR(p.radius, 3.9f, 1e-5f);
  EXPECT_EQ(p.lifetime, 11);
}

TEST_F(BirdTest, TrailReachesSteadyStateWithShortestLifetime) {
  // Every particle gets the minimum lifetime of 10 ticks
  Bird bird(config, rng);
  for (int i = 0; i < 40; ++i)
    bird.update(1.0f);
  EXPECT_EQ(bird.trail.size(), 9u);
  for (const TrailParticle &p : bird.trail.particles)
    EXPECT_GT(p.lifetime, 0);
}

TEST_F(BirdTest, ResetReturnsToSpawnAndClearsTrail) {
  Bird bird(config, rng);
  bird.jump();
  for (int i = 0; i < 5; ++i)
    bird.update(1.0f);
  bird.reset();
  EXPECT_FLOAT_EQ(bird.x, 150.0f);
  EXPECT_FLOAT_EQ(bird.y, 300.0f);
  EXPECT_FLOAT_EQ(bird.velocity, 0.0f);
  EXPECT_TRUE(bird.trail.empty());
}

TEST_F(BirdTest, AlternatePhysicsFromConfig) {
  config.gravity = 1.0;
  config.jump_strength = -12.0;
  Bird bird(config, rng);
  bird.update(1.0f);
  EXPECT_FLOAT_EQ(bird.velocity, 1.0f);
  EXPECT_FLOAT_EQ(bird.y, 301.0f);
  bird.jump();
  EXPECT_FLOAT_EQ(bird.velocity, -12.0f);
}

TEST_F(BirdTest, DrawablesStartWithTheBirdThenItsTrail) {
  Bird bird(config, rng);
  bird.update(1.0f);
  std::vector<Drawable> out;
  bird.appendDrawables(out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].kind, DrawableKind::BIRD);
  EXPECT_FLOAT_EQ(out[0].rect.x, 128.0f);
  EXPECT_FLOAT_EQ(out[0].rect.y, 283.0f);
  EXPECT_EQ(out[1].kind, DrawableKind::CIRCLE);
}
