#include "sampler.hpp"
#include "material.hpp"
#include "sphere.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace {

void buildDiffuseSphere(Scene *scene) {
  scene->clear();
  scene->insert<Sphere>(Vector3(0.f, 0.f, -1.f), 0.5f, std::make_shared<Lambertian>(Color(0.5f, 0.5f, 0.5f)));
}

void render(const Scene &scene, const RenderOptions &opts, Image &image) {
  RandomSource rng(opts.seed);
  const PathTracer tracer(rng);
  monte_carlo_sampler::render(scene, opts.makeCamera(), image, tracer, opts.path_opts, rng);
}

unsigned brightness(const Pixel &p) {
  return p.r + p.g + p.b;
}

}

TEST(SamplerTest, GammaMapping) {
  EXPECT_EQ(sampler::toPixel(Color(0.f, 0.f, 0.f)), Pixel(0, 0, 0));
  // sqrt(1) * 256 saturates
  EXPECT_EQ(sampler::toPixel(Color(255.f, 255.f, 255.f)), Pixel(255, 255, 255));
  // sqrt(0.25) * 256 = 128
  EXPECT_EQ(sampler::toPixel(Color(63.75f, 0.f, 0.f)), Pixel(128, 0, 0));
  // truncated: sqrt(0.5) * 256 = 181.02
  EXPECT_EQ(sampler::toPixel(Color(127.5f, 127.5f, 127.5f)), Pixel(181, 181, 181));
  EXPECT_EQ(sampler::toPixel(Color(1000.f, -1.f, 0.f)).r, 255);
}

TEST(SamplerTest, CastStaysInsidePixelFootprint) {
  const Camera camera(Vector3(0.f, 0.f, 0.f), 2.f, 2.f, 1.f);
  const IntDimension2 resolution(5, 5);
  RandomSource rng(17);

  for (int i = 0; i < 200; ++i) {
    const Ray ray = sampler::cast(camera, 1, 3, resolution, rng);
    // back onto the z = -1 viewport, u = (1 + r) / 4, v = (3 + r) / 4
    const Vector3 p = ray.direction / -ray.direction.z;
    const float u = (p.x + 1.f) / 2.f;
    const float v = (p.y + 1.f) / 2.f;
    EXPECT_GE(u, 0.25f - 1e-5f);
    EXPECT_LT(u, 0.5f + 1e-5f);
    EXPECT_GE(v, 0.75f - 1e-5f);
    EXPECT_LT(v, 1.f + 1e-5f);
  }
}

TEST(SamplerTest, EmptySceneRendersSkyTopDown) {
  RenderOptions opts;
  opts.resolution = {4, 8};
  opts.aspect_ratio = 0.5f;
  opts.path_opts.num_samples = 4;
  opts.path_opts.max_depth = 5;

  Image image(opts.resolution);
  render(Scene(), opts, image);

  // the top row looks up into the blue, the bottom row down into the white
  const Pixel top = image.getPixel(0, 0);
  const Pixel bottom = image.getPixel(0, 7);
  EXPECT_LT(top.r, bottom.r);
  EXPECT_EQ(top.b, 255);
  EXPECT_EQ(bottom.b, 255);
}

TEST(SamplerTest, DiffuseSphereIsDarkerThanSky) {
  Scene scene;
  buildDiffuseSphere(&scene);

  RenderOptions opts;
  opts.resolution = {32, 18};
  opts.path_opts.num_samples = 1;
  opts.path_opts.max_depth = 2;

  Image image(opts.resolution);
  render(scene, opts, image);

  const Pixel center = image.getPixel(16, 9);
  EXPECT_NE(center, Pixel::black());
  for (const auto &edge : {image.getPixel(0, 0), image.getPixel(31, 0), image.getPixel(0, 17), image.getPixel(31, 17)}) {
    EXPECT_LT(brightness(center), brightness(edge));
  }
}

TEST(SamplerTest, SingleCallBudgetLeavesSurfacesBlack) {
  Scene scene;
  buildDiffuseSphere(&scene);

  RenderOptions opts;
  opts.resolution = {32, 18};
  opts.path_opts.num_samples = 1;
  opts.path_opts.max_depth = 1;

  Image image(opts.resolution);
  render(scene, opts, image);

  EXPECT_EQ(image.getPixel(16, 9), Pixel::black());
  EXPECT_NE(image.getPixel(0, 0), Pixel::black());
}

TEST(SamplerTest, MoreSamplesKeepMeanAndReduceVariance) {
  Scene scene;
  buildDiffuseSphere(&scene);

  // the whole single pixel sees the sphere
  RenderOptions opts;
  opts.resolution = {1, 1};
  opts.aspect_ratio = 1.f;
  opts.viewport_height = 0.2f;
  opts.path_opts.max_depth = 3;

  auto estimate = [&](size_t samples, unsigned seed) {
    opts.path_opts.num_samples = samples;
    opts.seed = seed;
    Image image(opts.resolution);
    render(scene, opts, image);
    return (float) image.getPixel(0, 0).r;
  };

  auto statistics = [&](size_t samples, float *mean, float *variance) {
    std::vector<float> values;
    for (unsigned seed = 1; seed <= 40; ++seed) values.push_back(estimate(samples, seed));
    *mean = 0.f;
    for (float v : values) *mean += v;
    *mean /= values.size();
    *variance = 0.f;
    for (float v : values) *variance += (v - *mean) * (v - *mean);
    *variance /= values.size();
  };

  float few_mean, few_variance, many_mean, many_variance;
  statistics(2, &few_mean, &few_variance);
  statistics(64, &many_mean, &many_variance);

  EXPECT_NEAR(few_mean, many_mean, 6.f);
  EXPECT_LT(many_variance, few_variance);
}
