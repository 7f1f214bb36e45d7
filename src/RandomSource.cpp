#include "Gapwing/RandomSource.h"

MersenneRandomSource::MersenneRandomSource() {
  std::random_device rd;
  gen.seed(rd());
}

MersenneRandomSource::MersenneRandomSource(uint32_t seed) : gen(seed) {}

int MersenneRandomSource::randomInt(int lo, int hi) {
  std::uniform_int_distribution<int> dis(lo, hi);
  return dis(gen);
}

float MersenneRandomSource::randomFloat(float lo, float hi) {
  std::uniform_real_distribution<float> dis(lo, hi);
  return dis(gen);
}
