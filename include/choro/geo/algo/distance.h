#pragma once

#include "choro/geo/geometry.h"

namespace choro {

// distance from p to the closest point of segment [a, b]
// a == b degenerates to the point distance |p - a|
double segment_distance(geo_xy const& p, geo_xy const& a, geo_xy const& b);

}  // namespace choro
