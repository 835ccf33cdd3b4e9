#include "image.hpp"
#include "ext.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

static std::string extensionOf(const std::string &filename)
{
	const auto dot = filename.find_last_of('.');
	const auto slash = filename.find_last_of("/\\");
	if(dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";

	std::string ext = filename.substr(dot + 1);
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char) std::tolower(c); });
	return ext;
}

void Image::writePPM(std::ostream &out) const
{
	out << "P3\n" << resolution.w << " " << resolution.h << "\n255\n";
	for(size_t i = 0; i < pixels.size(); i += 3)
	{
		out << (unsigned) pixels[i + 0] << " " << (unsigned) pixels[i + 1] << " " << (unsigned) pixels[i + 2] << "\n";
	}
}

std::string Image::toPPM() const
{
	std::ostringstream out;
	writePPM(out);
	return out.str();
}

bool Image::save(const std::string &filename) const
{
	const auto ext = extensionOf(filename);
	const int w = resolution.w, h = resolution.h;

	int write_success;
	if(ext == "bmp") write_success = stbi_write_bmp(filename.c_str(), w, h, 3, pixels.data());
	else if(ext == "png") write_success = stbi_write_png(filename.c_str(), w, h, 3, pixels.data(), 3 * w);
	else if(ext == "tga") write_success = stbi_write_tga(filename.c_str(), w, h, 3, pixels.data());
	else
	{
		std::ofstream out(filename);
		if(out.good()) writePPM(out);
		out.close();
		write_success = !out.fail();
	}

	if(write_success == 0)
	{
		std::cerr << "could not write output image " << filename << "\n";
		return false;
	}
	return true;
}
