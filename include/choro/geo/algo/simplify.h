#pragma once

#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

#include "utl/verify.h"

#include "choro/geo/algo/distance.h"
#include "choro/geo/geometry.h"

namespace choro {

// Douglas-Peucker without call recursion: pending (first, last) index ranges
// live on an explicit stack; the result is the mask of retained indices.
template <typename Points>
std::vector<bool> make_simplify_mask(Points const& points,
                                     double const tolerance) {
  utl::verify(!std::isnan(tolerance) && tolerance >= 0,
              "simplify: invalid tolerance {}", tolerance);

  auto const n = points.size();
  std::vector<bool> mask(n, n <= 2);
  if (n <= 2) {
    return mask;
  }

  mask.front() = true;
  mask.back() = true;

  std::vector<std::pair<size_t, size_t>> stack{{0, n - 1}};
  while (!stack.empty()) {
    auto const [first, last] = stack.back();
    stack.pop_back();

    auto max_dist = 0.;
    auto max_idx = first;
    for (auto i = first + 1; i < last; ++i) {
      auto const dist =
          segment_distance(points[i], points[first], points[last]);
      if (dist > max_dist) {
        max_idx = i;
        max_dist = dist;
      }
    }

    if (max_dist <= tolerance) {
      continue;  // drop everything strictly between first and last
    }

    mask[max_idx] = true;
    if (max_idx - first > 1) {
      stack.emplace_back(first, max_idx);
    }
    if (last - max_idx > 1) {
      stack.emplace_back(max_idx, last);
    }
  }
  return mask;
}

template <typename Points>
Points apply_simplify_mask(Points const& points,
                           std::vector<bool> const& mask) {
  Points out;
  for (auto i = size_t{0}; i < points.size(); ++i) {
    if (mask[i]) {
      out.push_back(points[i]);
    }
  }
  return out;
}

// ordered subsequence of points; first and last are always retained
template <typename Points>
Points simplify_line(Points const& points, double const tolerance) {
  return apply_simplify_mask(points, make_simplify_mask(points, tolerance));
}

struct ring_stats {
  ring_stats& operator+=(ring_stats const& o) {
    rings_ += o.rings_;
    fallback_ += o.fallback_;
    degenerate_ += o.degenerate_;
    return *this;
  }

  size_t rings_{0};
  size_t fallback_{0};  // simplified below kMinRingSize, original kept
  size_t degenerate_{0};  // below kMinRingSize already on input
};

// never returns less than kMinRingSize points unless the input ring had less
geo_ring simplify_ring(geo_ring const&, double tolerance, ring_stats&);
geo_ring simplify_ring(geo_ring const&, double tolerance);

geo_geometry simplify(geo_polygon const&, double tolerance, ring_stats&);
geo_geometry simplify(geo_multi_polygon const&, double tolerance, ring_stats&);
geo_geometry simplify(geo_invalid const&, double tolerance, ring_stats&);

geo_geometry simplify(geo_geometry const&, double tolerance, ring_stats&);
geo_geometry simplify(geo_geometry const&, double tolerance);

}  // namespace choro
