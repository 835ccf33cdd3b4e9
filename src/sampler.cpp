#include "sampler.hpp"

#include <algorithm>

namespace sampler {
  Ray cast(const Camera &cam, IntDimension2::dim_t x, IntDimension2::dim_t y, const IntDimension2 &resolution, RandomSource &rng)
  {
    const float max_x = (float) std::max(resolution.w, 2u) - 1.f;
    const float max_y = (float) std::max(resolution.h, 2u) - 1.f;
    const float u = (x + rng.next()) / max_x;
    const float v = (y + rng.next()) / max_y;
    return cam.getRay(u, v);
  }

  static inline uint8_t toByte(float value)
  {
    // also catches the NaN of a negative radiance
    if (!(value > 0.f)) return 0;
    return (uint8_t) std::min(value, 255.f);
  }

  Pixel toPixel(const Color &average)
  {
    const Color c = (average / 255.f).sqrt() * 256.f;
    return Pixel(toByte(c.r), toByte(c.g), toByte(c.b));
  }
}

void monte_carlo_sampler::render(const Scene &scene, const Camera &camera, Image &image, const PathTracer &tracer, const RenderOptions::Path &opts, RandomSource &rng) {
  ASSERT(opts.num_samples > 0);
  const auto h = image.resolution.h;

  for (IntDimension2::dim_t y = 0; y < h; ++y) {
    for (IntDimension2::dim_t x = 0; x < image.resolution.w; ++x) {
      Color sum{0.f, 0.f, 0.f};
      for (size_t s = 0; s < opts.num_samples; ++s) {
        const Ray ray = sampler::cast(camera, x, y, image.resolution, rng);
        sum += tracer.trace(scene, ray, opts.max_depth);
      }
      // y runs bottom up, the image top down
      image.setPixel(x, h - y - 1, sampler::toPixel(sum / (float) opts.num_samples));
    }
  }
}
