#ifndef SPRAY_RAY_HPP
#define SPRAY_RAY_HPP
#pragma once

#include "math.hpp"

/**
 * Half line origin + t * direction. The direction is not necessarily of unit
 * length, producers say when it is.
 */
struct Ray {
  using location_t = Vector3;
  using vec3_t = Vector3;
  using distance_t = float;

  Vector3 origin;
  Vector3 direction;

  Ray() {}
  Ray(location_t origin, vec3_t direction) : origin(origin), direction(direction) {}

  location_t at(distance_t t) const {
    return origin + direction * t;
  }
};

#endif // SPRAY_RAY_HPP
