#ifndef SPRAY_IMAGE_H
#define SPRAY_IMAGE_H
#pragma once

#include "spray/Config.h"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "math.hpp"
#ifdef WITH_PROGRESS
	#include <atomic>
#endif

struct Pixel
{
	uint8_t r, g, b;

	Pixel() : r(0), g(0), b(0) {}
	constexpr Pixel(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

	static constexpr Pixel black() { return Pixel(0, 0, 0); }

	bool operator==(const Pixel &p) const { return r == p.r && g == p.g && b == p.b; }
	bool operator!=(const Pixel &p) const { return !(*this == p); }
};

/**
 * RGB byte raster, row-major with row 0 at the top.
 */
struct Image
{
	const IntDimension2 resolution;
	std::vector<uint8_t> pixels;
	using dim_t = IntDimension2::dim_t;

#ifdef WITH_PROGRESS
	std::atomic<unsigned> writtenPixels{0};
#endif

	Image(const IntDimension2 &res) : resolution(res), pixels(3 * size_t(resolution.w) * resolution.h) {}

	void setPixel(dim_t x, dim_t y, const Pixel &p)
	{
		ASSERT(x < resolution.w); ASSERT(y < resolution.h);

#ifdef WITH_PROGRESS
		writtenPixels++;
#endif

		pixels[index(x, y) + 0] = p.r;
		pixels[index(x, y) + 1] = p.g;
		pixels[index(x, y) + 2] = p.b;
	}

	Pixel getPixel(dim_t x, dim_t y) const
	{
		ASSERT(x < resolution.w); ASSERT(y < resolution.h);
		return Pixel(pixels[index(x, y) + 0],
		             pixels[index(x, y) + 1],
		             pixels[index(x, y) + 2]);
	}

	size_t index(dim_t x, dim_t y) const
	{
		return 3 * (size_t(y) * resolution.w + x);
	}

	/// Plain text "P3" pixel map, one "R G B" line per pixel, top row first.
	void writePPM(std::ostream &out) const;
	std::string toPPM() const;

	/**
	 * Writes .bmp, .png and .tga files by extension, anything else as P3.
	 * Reports the reason on std::cerr and returns false on failure.
	 */
	bool save(const std::string &filename) const;
};

#endif
