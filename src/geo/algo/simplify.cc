#include "choro/geo/algo/simplify.h"

#include "fmt/core.h"

#include "choro/error.h"

namespace choro {

geo_ring simplify_ring(geo_ring const& in, double const tolerance,
                       ring_stats& stats) {
  ++stats.rings_;
  if (in.size() < kMinRingSize) {
    ++stats.degenerate_;
    return in;
  }

  auto out = simplify_line(in, tolerance);
  if (out.size() < kMinRingSize) {
    ++stats.fallback_;
    return in;
  }
  return out;
}

geo_ring simplify_ring(geo_ring const& in, double const tolerance) {
  ring_stats stats;
  return simplify_ring(in, tolerance, stats);
}

geo_polygon simplify_polygon(geo_polygon const& in, double const tolerance,
                             ring_stats& stats) {
  geo_polygon out;
  out.outer() = simplify_ring(in.outer(), tolerance, stats);

  out.inners().reserve(in.inners().size());
  for (auto const& inner : in.inners()) {
    out.inners().emplace_back(simplify_ring(inner, tolerance, stats));
  }
  return out;
}

geo_geometry simplify(geo_polygon const& in, double const tolerance,
                      ring_stats& stats) {
  return simplify_polygon(in, tolerance, stats);
}

geo_geometry simplify(geo_multi_polygon const& in, double const tolerance,
                      ring_stats& stats) {
  geo_multi_polygon out;
  out.reserve(in.size());
  for (auto const& polygon : in) {
    out.emplace_back(simplify_polygon(polygon, tolerance, stats));
  }
  return out;
}

geo_geometry simplify(geo_invalid const& in, double const, ring_stats&) {
  throw malformed_geometry{
      fmt::format("unsupported geometry '{}': {}", in.type_, in.reason_)};
}

geo_geometry simplify(geo_geometry const& in, double const tolerance,
                      ring_stats& stats) {
  return std::visit(
      [&](auto const& arg) { return simplify(arg, tolerance, stats); }, in);
}

geo_geometry simplify(geo_geometry const& in, double const tolerance) {
  ring_stats stats;
  return simplify(in, tolerance, stats);
}

}  // namespace choro
