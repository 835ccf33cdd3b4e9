#include "scene.hpp"
#include "sphere.hpp"
#include "material.hpp"

#include "ext.hpp"

#include <fstream>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>

using namespace std;

struct json_fwd {
	// Cannot forward-declare nlohmann::json itself because it is a typedef
	// to a template with default arguments
	nlohmann::json json;
};
// This makes std::unique_ptr of forwared-declared json possible
RenderOptions::RenderOptions() = default;
RenderOptions::~RenderOptions() = default;

constexpr IntDimension2::dim_t RenderOptions::max_resolution;
constexpr unsigned RenderOptions::max_depth_limit;

static inline bool has(const json &j, const char *key) {
	return j.find(key) != j.end();
}

static inline Vector3 readVector3(const json &j) {
	if (!j.is_array() || j.size() != 3) throw std::runtime_error("expected an array of 3 numbers, got " + j.dump());
	return Vector3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

/// Non-negative integer no larger than max, throws otherwise.
template<class T>
static inline T readCount(const json &j, const char *key, T max) {
	const auto &value = j.at(key);
	if (!value.is_number_unsigned() || value.get<uint64_t>() > max)
		throw std::runtime_error(string(key) + " must be an integer in [0, " + to_string(max) + "], got " + value.dump());
	return value.get<T>();
}

static inline Color readColor(const json &j) {
	return Color(readVector3(j));
}

static inline bool isUnitRange(const Color &c) {
	return c.r >= 0.f && c.r <= 1.f && c.g >= 0.f && c.g <= 1.f && c.b >= 0.f && c.b <= 1.f;
}

static shared_ptr<const Material> makeMaterial(const string &name, const json &m) {
	const auto type = m.at("type").get<string>();
	if (type == "lambertian" || type == "metal") {
		const auto albedo = readColor(m.at("albedo"));
		if (!isUnitRange(albedo)) {
			cerr << "material " << name << ": albedo must lie in [0,1]\n";
			return nullptr;
		}
		if (type == "lambertian") return make_shared<Lambertian>(albedo);

		const float fuzz = has(m, "fuzz") ? m["fuzz"].get<float>() : 0.f;
		if (fuzz < 0.f || fuzz > 1.f) {
			cerr << "material " << name << ": fuzz must lie in [0,1]\n";
			return nullptr;
		}
		return make_shared<Metal>(albedo, fuzz);
	}
	if (type == "dielectric") {
		const float refraction_index = m.at("refraction_index").get<float>();
		if (!(refraction_index >= 1.f)) {
			cerr << "material " << name << ": refraction_index must be at least 1\n";
			return nullptr;
		}
		return make_shared<Dielectric>(refraction_index);
	}
	cerr << "material " << name << ": unknown type " << type << "\n";
	return nullptr;
}

static bool LoadSceneObjects(const json &json_input, Scene *scene) {
	map<string, shared_ptr<const Material>> materials;
	if (has(json_input, "materials")) {
		for (auto it = json_input["materials"].begin(); it != json_input["materials"].end(); ++it) {
			auto material = makeMaterial(it.key(), it.value());
			if (!material) return false;
			materials[it.key()] = std::move(material);
		}
	}

	for (auto &s : json_input["spheres"]) {
		const auto center = readVector3(s.at("center"));
		const float radius = s.at("radius").get<float>();
		if (!(radius > 0.f)) {
			cerr << "sphere radius must be positive, got " << radius << "\n";
			return false;
		}
		const auto material_name = s.at("material").get<string>();
		const auto material = materials.find(material_name);
		if (material == materials.end()) {
			cerr << "sphere references unknown material " << material_name << "\n";
			return false;
		}
		scene->insert<Sphere>(center, radius, material->second);
	}
	return true;
}

bool LoadScene(const RenderOptions &opts, Scene *scene) {
	scene->clear();
	if (!opts.json || !has(opts.json->json, "spheres")) {
		BuildDefaultScene(scene);
		return true;
	}

	try {
		if (LoadSceneObjects(opts.json->json, scene)) return true;
	} catch (const json::exception &e) {
		cerr << "invalid scene in " << opts.filename << ": " << e.what() << "\n";
	} catch (const std::runtime_error &e) {
		cerr << "invalid scene in " << opts.filename << ": " << e.what() << "\n";
	}
	scene->clear();
	return false;
}

static bool LoadJobOptions(const json &json_input, RenderOptions *out_opts) {
	if (has(json_input, "aspect_ratio"))
		out_opts->aspect_ratio = json_input["aspect_ratio"].get<float>();
	if (!(out_opts->aspect_ratio > 0.f)) {
		cerr << "aspect_ratio must be positive\n";
		return false;
	}

	const bool has_x = has(json_input, "resolution_x");
	const bool has_y = has(json_input, "resolution_y");
	if (has_x && has_y) {
		out_opts->resolution = {readCount(json_input, "resolution_x", RenderOptions::max_resolution), readCount(json_input, "resolution_y", RenderOptions::max_resolution)};
		if (!has(json_input, "aspect_ratio") && out_opts->resolution.h > 0)
			out_opts->aspect_ratio = (float) out_opts->resolution.w / out_opts->resolution.h;
	} else if (has_y) {
		const auto h = readCount(json_input, "resolution_y", RenderOptions::max_resolution);
		const double w = (double) h * out_opts->aspect_ratio;
		if (w > RenderOptions::max_resolution) {
			cerr << "derived resolution_x " << w << " exceeds " << RenderOptions::max_resolution << "\n";
			return false;
		}
		out_opts->resolution = {(IntDimension2::dim_t) w, h};
	} else if (has_x) {
		cerr << "resolution_x requires resolution_y\n";
		return false;
	} else {
		const double w = (double) out_opts->resolution.h * out_opts->aspect_ratio;
		if (w > RenderOptions::max_resolution) {
			cerr << "derived resolution_x " << w << " exceeds " << RenderOptions::max_resolution << "\n";
			return false;
		}
		out_opts->resolution.w = (IntDimension2::dim_t) w;
	}

	if (has(json_input, "viewport_height"))
		out_opts->viewport_height = json_input["viewport_height"].get<float>();
	if (has(json_input, "focal_length"))
		out_opts->focal_length = json_input["focal_length"].get<float>();
	if (has(json_input, "camera_position"))
		out_opts->camera_position = readVector3(json_input["camera_position"]);
	if (has(json_input, "num_samples"))
		out_opts->path_opts.num_samples = readCount(json_input, "num_samples", (size_t) std::numeric_limits<unsigned>::max());
	if (has(json_input, "max_depth"))
		out_opts->path_opts.max_depth = readCount(json_input, "max_depth", RenderOptions::max_depth_limit);
	if (has(json_input, "seed"))
		out_opts->seed = readCount(json_input, "seed", std::numeric_limits<unsigned>::max());
	if (has(json_input, "output"))
		out_opts->output = json_input["output"].get<string>();

	if (out_opts->resolution.w == 0 || out_opts->resolution.h == 0) {
		cerr << "resolution must not be zero\n";
		return false;
	}
	if (!(out_opts->aspect_ratio > 0.f) || !(out_opts->viewport_height > 0.f) || !(out_opts->focal_length > 0.f)) {
		cerr << "viewport_height and focal_length must be positive\n";
		return false;
	}
	if (out_opts->path_opts.num_samples == 0) {
		cerr << "num_samples must not be zero\n";
		return false;
	}
	return true;
}

bool LoadJob(string filename, RenderOptions *out_opts)
{
	out_opts->json = std::make_unique<json_fwd>();
	auto &json_input = out_opts->json->json;

	try {
		ifstream in(filename);
		if(!in.good())
		{
			cerr << "could not open input file " << filename << "\n";
			return false;
		}

		json_input = json::parse(in);

		if (!LoadJobOptions(json_input, out_opts)) {
			cerr << "invalid job " << filename << "\n";
			return false;
		}
	} catch (const json::exception &e) {
		cerr << "invalid job " << filename << ": " << e.what() << "\n";
		return false;
	} catch (const std::runtime_error &e) {
		cerr << "invalid job " << filename << ": " << e.what() << "\n";
		return false;
	}

	out_opts->filename = std::move(filename);
	return true;
}
