#include "choro/geo/transform.h"

#include "choro/geo/algo/quantize.h"

namespace choro {

geo_geometry transform(geo_geometry const& in, double const tolerance,
                       unsigned const precision, ring_stats& stats) {
  auto out = simplify(in, tolerance, stats);
  quantize(out, precision);
  return out;
}

geo_geometry transform(geo_geometry const& in, double const tolerance,
                       unsigned const precision) {
  ring_stats stats;
  return transform(in, tolerance, precision, stats);
}

}  // namespace choro
