#include "Gapwing/Collision.h"

bool bird_hits_pipe(const Bird &bird, const PipeStream &pipes) {
  SDL_FRect box = bird.bounds();
  for (const PipePair &pair : pipes.pairs) {
    if (rectsOverlap(box, pair.topRect()) ||
        rectsOverlap(box, pair.bottomRect()))
      return true;
  }
  return false;
}

bool bird_touches_ground(Bird &bird, const GameConfig &config) {
  float ground = config.groundLine();
  if (bird.bottom() < ground)
    return false;

  bird.setBottom(ground);
  return true;
}

int score_passed_pipes(const Bird &bird, PipeStream &pipes) {
  int scored = 0;
  for (PipePair &pair : pipes.pairs) {
    if (!pair.passed && pair.centerX() < bird.x) {
      pair.passed = true;
      scored++;
    }
  }
  return scored;
}
