#ifndef SPRAY_RANDOM_HPP
#define SPRAY_RANDOM_HPP
#pragma once

#include "math.hpp"

#include <random>

/**
 * Uniform [0,1) source shared by the sampler and the materials of one render.
 * Equal seeds give equal draw sequences for the same standard library.
 */
class RandomSource {
  // Relevant: https://github.com/s9w/articles/blob/master/perf%20cpp%20random.md
  std::default_random_engine engine;
  std::uniform_real_distribution<float> distribution{0.f, 1.f};

public:
  explicit RandomSource(unsigned seed = std::default_random_engine::default_seed) : engine(seed) {}

  float next() {
    // uniform_real_distribution may round up to 1 for float
    float value;
    do {
      value = distribution(engine);
    } while (value >= 1.f);
    return value;
  }

  float next(float min, float max) {
    return min + (max - min) * next();
  }

  /// Rejection sampled point strictly inside the unit sphere.
  Vector3 inUnitSphere() {
    while (true) {
      const Vector3 p(next(-1.f, 1.f), next(-1.f, 1.f), next(-1.f, 1.f));
      if (p.lengthSquared() < 1.f) return p;
    }
  }

  Vector3 unitVector() {
    while (true) {
      const Vector3 p = inUnitSphere();
      if (p.lengthSquared() > 1e-12f) return p.normalized();
    }
  }
};

#endif // SPRAY_RANDOM_HPP
