#ifndef SPRAY_HITTABLE_H
#define SPRAY_HITTABLE_H
#pragma once

#include "math.hpp"
#include "ray.hpp"

#include <memory>

struct Material;

struct HitRecord
{
	Vector3 point;
	// unit length, facing against the incoming ray
	Vector3 normal;
	Ray::distance_t t;
	// false if the ray hit the surface from the inside
	bool front_face;
	std::shared_ptr<const Material> material;

	void setFaceNormal(const Ray &ray, const Vector3 &outward_normal)
	{
		front_face = ray.direction.dot(outward_normal) < 0.f;
		normal = front_face ? outward_normal : -outward_normal;
	}
};

struct Hittable
{
	virtual ~Hittable() = default;

	/**
	 * Nearest intersection with t in the open interval (t_min, t_max).
	 * out_record is only written on a hit.
	 */
	virtual bool hit(const Ray &ray, Ray::distance_t t_min, Ray::distance_t t_max, HitRecord *out_record) const = 0;
};

#endif
