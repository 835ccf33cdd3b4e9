#ifndef SPRAY_SAMPLER_HPP
#define SPRAY_SAMPLER_HPP
#pragma once

#include "scene.hpp"
#include "image.hpp"
#include "path_tracer.hpp"
#include "random.hpp"

namespace sampler {
  /**
   * Camera ray through a random point of pixel (x, y), y counting upwards from
   * the bottom image row.
   */
  Ray cast(const Camera &cam, IntDimension2::dim_t x, IntDimension2::dim_t y, const IntDimension2 &resolution, RandomSource &rng);

  /**
   * Gamma 2 mapping of an averaged 0..255 radiance, sqrt(c / 255) * 256,
   * truncated and clamped to [0,255].
   */
  Pixel toPixel(const Color &average);
}

struct monte_carlo_sampler {
  /// Averages num_samples jittered traces per pixel into image.
  static void render(const Scene &scene, const Camera &camera, Image &image, const PathTracer &tracer, const RenderOptions::Path &opts, RandomSource &rng);
};

#endif // SPRAY_SAMPLER_HPP
