#ifndef SPRAY_SCENE_H
#define SPRAY_SCENE_H
#pragma once

#include "debug.hpp"
#include "math.hpp"
#include "ray.hpp"
#include "hittable.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * Pinhole camera looking down -z. The viewport is a width x height rectangle
 * at focal_length in front of the origin, (u,v) = (0,0) is its lower left
 * corner and (1,1) its upper right one.
 */
struct Camera
{
	const Vector3 origin;
	const Vector3 horizontal;
	const Vector3 vertical;
	const Vector3 lower_left_corner;

	Camera(const Vector3 &origin, float viewport_height, float viewport_width, float focal_length)
		: origin(origin),
		  horizontal(viewport_width, 0.f, 0.f),
		  vertical(0.f, viewport_height, 0.f),
		  lower_left_corner(origin - horizontal / 2.f - vertical / 2.f - Vector3(0.f, 0.f, focal_length))
	{
		ASSERT(viewport_height > 0.f); ASSERT(viewport_width > 0.f); ASSERT(focal_length > 0.f);
	}

	/// Ray with unit direction through the viewport point (u,v).
	Ray getRay(float u, float v) const
	{
		return Ray(origin, (lower_left_corner + horizontal * u + vertical * v - origin).normalize());
	}
};

struct json_fwd;

struct RenderOptions {
	struct Path {
		size_t num_samples = 100;
		unsigned max_depth = 50;
	};

	// largest accepted image side and recursion depth of a job
	static constexpr IntDimension2::dim_t max_resolution = 16384;
	static constexpr unsigned max_depth_limit = 10000;

	// width follows from height and aspect_ratio unless the job sets both
	IntDimension2 resolution = {711, 400};
	float aspect_ratio = 16.f / 9.f;
	float viewport_height = 2.f;
	float focal_length = 1.f;
	Vector3 camera_position = Vector3(0.f, 0.f, 0.f);
	unsigned seed = 1;
	Path path_opts;
	std::unique_ptr<json_fwd> json;
	// job file, empty for the built-in job
	std::string filename;
	std::string output = "test.ppm";

	float viewportWidth() const { return viewport_height * aspect_ratio; }
	Camera makeCamera() const { return Camera(camera_position, viewport_height, viewportWidth(), focal_length); }

	RenderOptions();
	~RenderOptions();
};

/**
 * Ordered list of objects, queried by linear scan.
 */
struct Scene
{
	std::vector<std::unique_ptr<Hittable>> objects;

	void clear() { objects.clear(); }
	bool empty() const { return objects.empty(); }
	size_t size() const { return objects.size(); }

	template<class hittable_t, class... Args>
	hittable_t &insert(Args&&... args)
	{
		objects.push_back(std::make_unique<hittable_t>(std::forward<Args>(args)...));
		return static_cast<hittable_t &>(*objects.back());
	}

	/**
	 * Globally nearest hit in (t_min, t_max). Each accepted hit narrows the
	 * interval for the objects after it.
	 */
	bool closestHit(const Ray &ray, Ray::distance_t t_min, Ray::distance_t t_max, HitRecord *out_record) const;
};

/// Three spheres standing on a huge ground sphere.
void BuildDefaultScene(Scene *scene);

bool LoadJob(std::string filename, RenderOptions *out_opts);
bool LoadScene(const RenderOptions &opts, Scene *scene);

#endif
