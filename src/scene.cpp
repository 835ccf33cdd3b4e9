#include "scene.hpp"
#include "sphere.hpp"
#include "material.hpp"

bool Scene::closestHit(const Ray &ray, Ray::distance_t t_min, Ray::distance_t t_max, HitRecord *out_record) const
{
	bool hit_anything = false;
	auto closest_so_far = t_max;

	HitRecord record;
	for(auto &object : objects)
	{
		if(object->hit(ray, t_min, closest_so_far, &record))
		{
			hit_anything = true;
			closest_so_far = record.t;
			*out_record = record;
		}
	}

	return hit_anything;
}

void BuildDefaultScene(Scene *scene)
{
	scene->clear();

	const auto material_ground = std::make_shared<Lambertian>(Color(0.8f, 0.8f, 0.f));
	const auto material_left = std::make_shared<Dielectric>(1.5f);
	const auto material_right = std::make_shared<Metal>(Color(0.8f, 0.6f, 0.2f), 0.f);
	const auto material_center = std::make_shared<Lambertian>(Color(0.1f, 0.2f, 0.5f));

	scene->insert<Sphere>(Vector3( 0.f, -100.5f, -1.f), 100.f, material_ground);
	scene->insert<Sphere>(Vector3(-1.f,     0.f, -1.f), 0.5f, material_left);
	scene->insert<Sphere>(Vector3( 1.f,     0.f, -1.f), 0.5f, material_right);
	scene->insert<Sphere>(Vector3( 0.f,     0.f, -1.f), 0.5f, material_center);
}
