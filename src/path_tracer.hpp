#ifndef SPRAY_PATH_TRACER_H
#define SPRAY_PATH_TRACER_H
#pragma once

#include "scene.hpp"
#include "ray.hpp"
#include "random.hpp"

struct PathTracer {
  // keeps scattered rays from hitting the surface they leave
  static constexpr Ray::distance_t shadow_acne_epsilon = 0.001f;

  RandomSource &rng;

  explicit PathTracer(RandomSource &rng) : rng(rng) {}

  /**
   * Radiance on the 0..255 scale arriving along ray. depth is the number of
   * calls left, zero yields black.
   */
  Color trace(const Scene &scene, const Ray &ray, unsigned depth) const;

  /// White at the bottom, light blue at the top.
  static Color sky(const Ray &ray);
};

#endif /* SPRAY_PATH_TRACER_H */
