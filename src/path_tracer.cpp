#include "path_tracer.hpp"
#include "material.hpp"

#include <limits>

constexpr Ray::distance_t PathTracer::shadow_acne_epsilon;

Color PathTracer::sky(const Ray &ray) {
  const float w = 0.5f * (ray.direction.normalized().y + 1.f);
  const Color white(1.f, 1.f, 1.f);
  const Color blue(0.5f, 0.7f, 1.f);
  return (white * (1.f - w) + blue * w) * 255.f;
}

Color PathTracer::trace(const Scene &scene, const Ray &ray, unsigned depth) const {
  if (depth == 0)
    return Color{0, 0, 0};

  HitRecord hit;
  if (!scene.closestHit(ray, shadow_acne_epsilon, std::numeric_limits<Ray::distance_t>::infinity(), &hit))
    return sky(ray);

  ASSERT(hit.material != nullptr);
  Color attenuation;
  Ray scattered;
  if (!hit.material->scatter(ray, hit, rng, &attenuation, &scattered))
    return Color{0, 0, 0};

  return attenuation * trace(scene, scattered, depth - 1);
}
