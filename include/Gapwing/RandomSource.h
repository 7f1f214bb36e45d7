#pragma once

#include <cstdint>
#include <random>

/**
 * RandomSource - every random draw of the simulation goes through here
 * (gap placement, particle jitter, background layout, shake offset).
 * Tests substitute a scripted source to get deterministic runs.
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform integer in [lo, hi], both ends inclusive
  virtual int randomInt(int lo, int hi) = 0;

  // Uniform float in [lo, hi]
  virtual float randomFloat(float lo, float hi) = 0;
};

class MersenneRandomSource : public RandomSource {
public:
  MersenneRandomSource();
  explicit MersenneRandomSource(uint32_t seed);

  int randomInt(int lo, int hi) override;
  float randomFloat(float lo, float hi) override;

private:
  std::mt19937 gen;
};
