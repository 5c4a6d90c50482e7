#pragma once

#include <cstddef>
#include <string>
#include <tuple>
#include <variant>

#include "boost/geometry/geometries/linestring.hpp"
#include "boost/geometry/geometries/multi_polygon.hpp"
#include "boost/geometry/geometries/point_xy.hpp"
#include "boost/geometry/geometries/polygon.hpp"
#include "boost/geometry/geometries/ring.hpp"

namespace choro {

// x = longitude, y = latitude (GeoJSON position order)
using geo_coord_t = double;

using geo_xy = boost::geometry::model::d2::point_xy<geo_coord_t>;

using geo_line = boost::geometry::model::linestring<geo_xy>;
using geo_polygon = boost::geometry::model::polygon<geo_xy>;
using geo_ring = geo_polygon::ring_type;
using geo_multi_polygon = boost::geometry::model::multi_polygon<geo_polygon>;

// smallest valid closed ring: triangle + closing point
constexpr auto kMinRingSize = size_t{4};

// decoded input which is neither Polygon nor MultiPolygon
struct geo_invalid {
  friend bool operator==(geo_invalid const& lhs, geo_invalid const& rhs) {
    return std::tie(lhs.type_, lhs.reason_) == std::tie(rhs.type_, rhs.reason_);
  }

  std::string type_;
  std::string reason_;
};

using geo_geometry = std::variant<geo_polygon, geo_multi_polygon, geo_invalid>;

}  // namespace choro

namespace boost {
namespace geometry {
namespace model {
namespace d2 {

inline bool operator==(point_xy<choro::geo_coord_t> const& lhs,
                       point_xy<choro::geo_coord_t> const& rhs) {
  return lhs.x() == rhs.x() && lhs.y() == rhs.y();
}

inline bool operator!=(point_xy<choro::geo_coord_t> const& lhs,
                       point_xy<choro::geo_coord_t> const& rhs) {
  return !(lhs == rhs);
}

}  // namespace d2
}  // namespace model
}  // namespace geometry
}  // namespace boost
