#ifndef SPRAY_MATERIAL_H
#define SPRAY_MATERIAL_H
#pragma once

#include "math.hpp"
#include "ray.hpp"
#include "hittable.hpp"
#include "random.hpp"

/**
 * Decides how light arriving along a ray leaves a surface point.
 * Materials are immutable once built and shared between spheres.
 */
struct Material
{
	virtual ~Material() = default;

	/**
	 * Returns false if the ray is absorbed. Otherwise out_attenuation holds a
	 * factor in [0,1] per channel and out_scattered the continuing ray
	 * (unit direction, starting at the hit point).
	 */
	virtual bool scatter(const Ray &ray, const HitRecord &hit, RandomSource &rng, Color *out_attenuation, Ray *out_scattered) const = 0;
};

/// Diffuse surface.
struct Lambertian : public Material
{
	Color albedo;

	explicit Lambertian(const Color &albedo);

	bool scatter(const Ray &ray, const HitRecord &hit, RandomSource &rng, Color *out_attenuation, Ray *out_scattered) const override;
};

/// Mirror, blurred by fuzz in [0,1].
struct Metal : public Material
{
	Color albedo;
	float fuzz;

	Metal(const Color &albedo, float fuzz);

	bool scatter(const Ray &ray, const HitRecord &hit, RandomSource &rng, Color *out_attenuation, Ray *out_scattered) const override;
};

/// Clear glass-like medium, never absorbs.
struct Dielectric : public Material
{
	float refraction_index;

	explicit Dielectric(float refraction_index);

	bool scatter(const Ray &ray, const HitRecord &hit, RandomSource &rng, Color *out_attenuation, Ray *out_scattered) const override;

	/// Schlick's approximation of the Fresnel reflectance.
	static float reflectance(float cosine, float refraction_ratio);
};

#endif
