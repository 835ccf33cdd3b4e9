#ifndef SPRAY_MATH_H
#define SPRAY_MATH_H
#pragma once

#include <cmath>
#include <cstdint>
#include <algorithm>
#include <ostream>
#include "debug.hpp"


struct approx
{
	constexpr approx(float x) : x(x) {}
	float x;
};
inline constexpr bool operator==(float a, const approx &approx) { return a > approx.x - 0.00001f && a < approx.x + 0.00001f; }
inline constexpr bool operator!=(float a, const approx &approx) { return !(a == approx); }

struct Vector3
{
	using component_t = float;

	component_t x, y, z;

	Vector3() {}
	constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

	constexpr Vector3 operator-() const { return Vector3(-x, -y, -z); }
	constexpr Vector3 operator+(const Vector3 &a) const { return Vector3(x+a.x, y+a.y, z+a.z); }
	constexpr Vector3 operator-(const Vector3 &a) const { return Vector3(x-a.x, y-a.y, z-a.z); }
	constexpr Vector3 operator*(const Vector3 &a) const { return Vector3(x*a.x, y*a.y, z*a.z); }
	constexpr Vector3 operator*(component_t a) const { return Vector3(x*a, y*a, z*a); }
	constexpr Vector3 operator/(component_t a) const { return Vector3(x/a, y/a, z/a); }

	Vector3 &operator+=(const Vector3 &a) { return *this = *this + a; }
	Vector3 &operator*=(component_t a) { return *this = *this * a; }
	Vector3 &operator/=(component_t a) { return *this = *this / a; }

	constexpr component_t dot(const Vector3 &a) const { return x*a.x+y*a.y+z*a.z; }
	constexpr Vector3 cross(const Vector3 &a) const { return Vector3(y*a.z-z*a.y, z*a.x-x*a.z, x*a.y-y*a.x); }

	constexpr component_t lengthSquared() const { return x*x + y*y + z*z; }
	component_t length() const { return std::sqrt(lengthSquared()); }
	// zero vectors are an invariant violation, the result is NaN
	Vector3 &normalize() { ASSERT(length() != approx(0)); return *this /= length(); }
	Vector3 normalized() const { return Vector3(*this).normalize(); }
	Vector3 sqrt() const { return Vector3(std::sqrt(x), std::sqrt(y), std::sqrt(z)); }

	bool isNearZero() const
	{
		const component_t eps = 1e-8f;
		return std::fabs(x) < eps && std::fabs(y) < eps && std::fabs(z) < eps;
	}

	/**
	 * Mirror this direction about the (unit) normal n.
	 */
	constexpr Vector3 reflect(const Vector3 &n) const { return *this - n * (2.f * dot(n)); }

	/**
	 * Snell refraction of this unit direction through the unit normal n facing
	 * against it, eta being the ratio of refraction indices (from / to).
	 * Total internal reflection has to be ruled out by the caller.
	 */
	Vector3 refract(const Vector3 &n, component_t eta) const
	{
		const component_t cos_theta = std::min(-dot(n), 1.f);
		const Vector3 out_perp = (*this + n * cos_theta) * eta;
		const Vector3 out_parallel = n * -std::sqrt(std::fabs(1.f - out_perp.lengthSquared()));
		return out_perp + out_parallel;
	}
};

inline constexpr Vector3 operator*(Vector3::component_t a, const Vector3 &v) { return v * a; }

inline std::ostream &operator<<(std::ostream &o, const Vector3 &v)
{
	o << v.x << " " << v.y << " " << v.z;
	return o;
}

struct IntDimension2
{
	using dim_t = uint32_t;
	dim_t w, h;

	IntDimension2() {}
	constexpr IntDimension2(dim_t w, dim_t h) : w(w), h(h) {}
};

/**
 * Linear radiance. Traced colors are kept on the 0..255 scale of the output
 * bytes, attenuations are factors in [0,1].
 */
struct Color
{
	float r, g, b;

	Color() {}
	constexpr Color(float r, float g, float b) : r(r), g(g), b(b) {}
	explicit constexpr Color(const Vector3 &v) : r(v.x), g(v.y), b(v.z) {}

	constexpr Color operator+(const Color &a) const { return Color(r+a.r, g+a.g, b+a.b); }
	constexpr Color operator*(const Color &a) const { return Color(r*a.r, g*a.g, b*a.b); }
	constexpr Color operator*(float a) const { return Color(r*a, g*a, b*a); }
	constexpr Color operator/(float a) const { return Color(r/a, g/a, b/a); }

	Color &operator+=(const Color &a) { return *this = *this + a; }

	Color sqrt() const { return Color(std::sqrt(r), std::sqrt(g), std::sqrt(b)); }
};

#endif
