#include "Gapwing/Collision.h"
#include "ScriptedRandom.h"
#include <gtest/gtest.h>

class CollisionTest : public ::testing::Test {
protected:
  GameConfig config;
  ScriptedRandomSource rng;
  Bird bird{config, rng};
  PipeStream pipes{config, rng};
};

TEST_F(CollisionTest, RectsOverlapIsStrict) {
  SDL_FRect a = {0.0f, 0.0f, 10.0f, 10.0f};
  SDL_FRect touching = {10.0f, 0.0f, 10.0f, 10.0f};
  SDL_FRect inside = {9.0f, 9.0f, 10.0f, 10.0f};
  EXPECT_FALSE(rectsOverlap(a, touching));
  EXPECT_TRUE(rectsOverlap(a, inside));
}

TEST_F(CollisionTest, BirdInsideTheGapIsSafe) {
  pipes.spawnAt(130.0f, 300.0f); // gap spans 210..390
  EXPECT_FALSE(bird_hits_pipe(bird, pipes));
}

TEST_F(CollisionTest, BirdHittingTopHalf) {
  pipes.spawnAt(130.0f, 300.0f);
  bird.y = 200.0f;
  EXPECT_TRUE(bird_hits_pipe(bird, pipes));
}

TEST_F(CollisionTest, BirdHittingBottomHalf) {
  pipes.spawnAt(130.0f, 300.0f);
  bird.y = 380.0f;
  EXPECT_TRUE(bird_hits_pipe(bird, pipes));
}

TEST_F(CollisionTest, PipeTouchingBirdEdgeIsNotAHit) {
  pipes.spawnAt(bird.right(), 100.0f);
  EXPECT_FALSE(bird_hits_pipe(bird, pipes));
  pipes.pairs[0].update(0.25f);
  EXPECT_TRUE(bird_hits_pipe(bird, pipes));
}

TEST_F(CollisionTest, AnyPairCanCauseTheHit) {
  pipes.spawnAt(-200.0f, 300.0f);
  pipes.spawnAt(600.0f, 300.0f);
  pipes.spawnAt(140.0f, 500.0f); // bottom half starts at 590, top covers 0..410
  EXPECT_TRUE(bird_hits_pipe(bird, pipes));
}

TEST_F(CollisionTest, GroundContactClampsTheBird) {
  bird.setBottom(505.0f);
  EXPECT_TRUE(bird_touches_ground(bird, config));
  EXPECT_FLOAT_EQ(bird.bottom(), 500.0f);

  // Exactly on the line still counts
  EXPECT_TRUE(bird_touches_ground(bird, config));
  EXPECT_FLOAT_EQ(bird.bottom(), 500.0f);
}

TEST_F(CollisionTest, AboveGroundLeavesTheBirdAlone) {
  bird.setBottom(499.0f);
  EXPECT_FALSE(bird_touches_ground(bird, config));
  EXPECT_FLOAT_EQ(bird.bottom(), 499.0f);
}

TEST_F(CollisionTest, PassingAPairScoresOnce) {
  pipes.spawnAt(bird.x - 41.0f, 300.0f); // center just left of the bird
  EXPECT_EQ(score_passed_pipes(bird, pipes), 1);
  EXPECT_TRUE(pipes.pairs[0].passed);
  EXPECT_EQ(score_passed_pipes(bird, pipes), 0);
  EXPECT_TRUE(pipes.pairs[0].passed);
}

TEST_F(CollisionTest, PairAheadOrLevelDoesNotScore) {
  pipes.spawnAt(bird.x - 40.0f, 300.0f); // center exactly at the bird
  pipes.spawnAt(500.0f, 300.0f);
  EXPECT_EQ(score_passed_pipes(bird, pipes), 0);
  EXPECT_FALSE(pipes.pairs[0].passed);
  EXPECT_FALSE(pipes.pairs[1].passed);
}

TEST_F(CollisionTest, SeveralPairsPassedTogetherScoreOneEach) {
  pipes.spawnAt(-50.0f, 300.0f);
  pipes.spawnAt(20.0f, 250.0f);
  pipes.spawnAt(600.0f, 300.0f);
  EXPECT_EQ(score_passed_pipes(bird, pipes), 2);
  EXPECT_EQ(score_passed_pipes(bird, pipes), 0);
}
