#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "ext.hpp"
