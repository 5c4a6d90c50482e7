#pragma once

#include "choro/geo/geometry.h"

namespace choro {

constexpr auto kMaxPrecision = 15U;

// nearest decimal with `precision` fractional digits, decided on the exact
// binary value (4.5985 is stored below the tie and becomes 4.598)
double quantize(double value, unsigned precision);

void quantize(geo_ring&, unsigned precision);
void quantize(geo_polygon&, unsigned precision);
void quantize(geo_multi_polygon&, unsigned precision);
void quantize(geo_invalid&, unsigned precision);

void quantize(geo_geometry&, unsigned precision);

}  // namespace choro
