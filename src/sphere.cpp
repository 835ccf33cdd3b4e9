#include "sphere.hpp"

#include <cmath>
#include <utility>

Sphere::Sphere(const Vector3 &center, float radius, std::shared_ptr<const Material> material)
	: center(center), radius(radius), material(std::move(material))
{
	ASSERT(radius > 0.f);
	ASSERT(this->material != nullptr);
}

bool Sphere::hit(const Ray &ray, Ray::distance_t t_min, Ray::distance_t t_max, HitRecord *out_record) const
{
	// |O + tD - C|^2 = r^2, with b = 2h
	const Vector3 oc = ray.origin - center;
	const float a = ray.direction.lengthSquared();
	const float half_b = oc.dot(ray.direction);
	const float c = oc.lengthSquared() - radius * radius;

	const float discriminant = half_b * half_b - a * c;
	if(discriminant < 0.f) return false;
	const float sqrt_d = std::sqrt(discriminant);

	float root = (-half_b - sqrt_d) / a;
	if(root <= t_min || root >= t_max)
	{
		root = (-half_b + sqrt_d) / a;
		if(root <= t_min || root >= t_max) return false;
	}

	out_record->t = root;
	out_record->point = ray.at(root);
	out_record->setFaceNormal(ray, (out_record->point - center) / radius);
	out_record->material = material;
	return true;
}
