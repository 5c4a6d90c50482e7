#include "choro/geo/algo/distance.h"

#include "boost/geometry/algorithms/distance.hpp"
#include "boost/geometry/geometries/segment.hpp"
#include "boost/geometry/strategies/cartesian/distance_projected_point.hpp"

namespace choro {

double segment_distance(geo_xy const& p, geo_xy const& a, geo_xy const& b) {
  return boost::geometry::distance(
      p, boost::geometry::model::referring_segment<geo_xy const>{a, b});
}

}  // namespace choro
