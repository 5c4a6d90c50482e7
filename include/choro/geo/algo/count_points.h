#pragma once

#include <numeric>

#include "choro/geo/geometry.h"

namespace choro {

inline size_t count_points(geo_invalid const&) { return 0; }

inline size_t count_points(geo_polygon const& polygon) {
  return std::accumulate(
      begin(polygon.inners()), end(polygon.inners()), polygon.outer().size(),
      [](auto const acc, auto const& inner) { return acc + inner.size(); });
}

inline size_t count_points(geo_multi_polygon const& multi_polygon) {
  return std::accumulate(begin(multi_polygon), end(multi_polygon), size_t{0},
                         [](auto const acc, auto const& polygon) {
                           return acc + count_points(polygon);
                         });
}

inline size_t count_points(geo_geometry const& geometry) {
  return std::visit([&](auto const& arg) { return count_points(arg); },
                    geometry);
}

}  // namespace choro
