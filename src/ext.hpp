#pragma once

/* Dependency: image writing to disk: PNG, TGA, BMP
*  https://github.com/nothings/stb
*/
#include "stb_image_write.h"

/* Dependency: JSON for Modern C++
*  https://nlohmann.github.io/json/
*/
#include <nlohmann/json.hpp>
using json = nlohmann::json;
