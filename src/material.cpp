#include "material.hpp"

#include <algorithm>
#include <cmath>

static inline bool isUnitRange(const Color &c)
{
	return c.r >= 0.f && c.r <= 1.f && c.g >= 0.f && c.g <= 1.f && c.b >= 0.f && c.b <= 1.f;
}

Lambertian::Lambertian(const Color &albedo) : albedo(albedo)
{
	ASSERT(isUnitRange(albedo));
}

bool Lambertian::scatter(const Ray &, const HitRecord &hit, RandomSource &rng, Color *out_attenuation, Ray *out_scattered) const
{
	Vector3 direction = hit.normal + rng.unitVector();

	// the sample may cancel the normal out
	if(direction.isNearZero()) direction = hit.normal;

	*out_scattered = Ray(hit.point, direction.normalize());
	*out_attenuation = albedo;
	return true;
}

Metal::Metal(const Color &albedo, float fuzz) : albedo(albedo), fuzz(fuzz)
{
	ASSERT(isUnitRange(albedo));
	ASSERT(fuzz >= 0.f && fuzz <= 1.f);
}

bool Metal::scatter(const Ray &ray, const HitRecord &hit, RandomSource &rng, Color *out_attenuation, Ray *out_scattered) const
{
	Vector3 direction = ray.direction.normalized().reflect(hit.normal);
	if(fuzz > 0.f) direction += rng.inUnitSphere() * fuzz;

	if(direction.dot(hit.normal) <= 0.f) return false;

	*out_scattered = Ray(hit.point, direction.normalize());
	*out_attenuation = albedo;
	return true;
}

Dielectric::Dielectric(float refraction_index) : refraction_index(refraction_index)
{
	ASSERT(refraction_index >= 1.f);
}

float Dielectric::reflectance(float cosine, float refraction_ratio)
{
	float r0 = (1.f - refraction_ratio) / (1.f + refraction_ratio);
	r0 = r0 * r0;
	return r0 + (1.f - r0) * std::pow(1.f - cosine, 5.f);
}

bool Dielectric::scatter(const Ray &ray, const HitRecord &hit, RandomSource &rng, Color *out_attenuation, Ray *out_scattered) const
{
	*out_attenuation = Color(1.f, 1.f, 1.f);

	const Vector3 unit_direction = ray.direction.normalized();

	// matching indices make the boundary invisible
	if(refraction_index == 1.f)
	{
		*out_scattered = Ray(hit.point, unit_direction);
		return true;
	}

	const float refraction_ratio = hit.front_face ? 1.f / refraction_index : refraction_index;

	const float cos_theta = std::min(-unit_direction.dot(hit.normal), 1.f);
	const float sin_theta = std::sqrt(1.f - cos_theta * cos_theta);

	const bool cannot_refract = refraction_ratio * sin_theta > 1.f;

	Vector3 direction;
	if(cannot_refract || reflectance(cos_theta, refraction_ratio) > rng.next())
		direction = unit_direction.reflect(hit.normal);
	else
		direction = unit_direction.refract(hit.normal, refraction_ratio);

	*out_scattered = Ray(hit.point, direction.normalize());
	return true;
}
