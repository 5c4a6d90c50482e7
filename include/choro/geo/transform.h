#pragma once

#include "choro/geo/algo/simplify.h"
#include "choro/geo/geometry.h"

namespace choro {

// simplify every ring, then round every coordinate (never the other way round)
// throws malformed_geometry for geo_invalid
geo_geometry transform(geo_geometry const&, double tolerance,
                       unsigned precision, ring_stats&);

geo_geometry transform(geo_geometry const&, double tolerance,
                       unsigned precision);

}  // namespace choro
