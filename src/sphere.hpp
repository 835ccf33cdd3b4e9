#ifndef SPRAY_SPHERE_H
#define SPRAY_SPHERE_H
#pragma once

#include "hittable.hpp"

#include <memory>

struct Sphere : public Hittable
{
	Vector3 center;
	float radius;
	std::shared_ptr<const Material> material;

	Sphere(const Vector3 &center, float radius, std::shared_ptr<const Material> material);

	bool hit(const Ray &ray, Ray::distance_t t_min, Ray::distance_t t_max, HitRecord *out_record) const override;
};

#endif
