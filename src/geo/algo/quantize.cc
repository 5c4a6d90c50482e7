#include "choro/geo/algo/quantize.h"

#include <cstdlib>
#include <iterator>

#include "fmt/format.h"

#include "utl/verify.h"

namespace choro {

double quantize(double const value, unsigned const precision) {
  utl::verify(precision <= kMaxPrecision, "quantize: precision {} > {}",
              precision, kMaxPrecision);
  fmt::memory_buffer buf;
  fmt::format_to(std::back_inserter(buf), "{:.{}f}", value, precision);
  buf.push_back('\0');
  return std::strtod(buf.data(), nullptr);
}

void quantize(geo_ring& ring, unsigned const precision) {
  for (auto& pt : ring) {
    pt.x(quantize(pt.x(), precision));
    pt.y(quantize(pt.y(), precision));
  }
}

void quantize(geo_polygon& polygon, unsigned const precision) {
  quantize(polygon.outer(), precision);
  for (auto& inner : polygon.inners()) {
    quantize(inner, precision);
  }
}

void quantize(geo_multi_polygon& multi_polygon, unsigned const precision) {
  for (auto& polygon : multi_polygon) {
    quantize(polygon, precision);
  }
}

void quantize(geo_invalid&, unsigned const) {}

void quantize(geo_geometry& geometry, unsigned const precision) {
  std::visit([&](auto& arg) { quantize(arg, precision); }, geometry);
}

}  // namespace choro
