#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "choro/geo/algo/simplify.h"

namespace choro {

struct skipped_feature {
  size_t idx_;
  std::string id_;  // empty if the identifier itself was missing
  std::string reason_;
};

struct metrics {
  metrics& operator+=(metrics const&);

  size_t features_in_{0};
  size_t features_out_{0};
  size_t points_before_{0};
  size_t points_after_{0};
  ring_stats rings_;
  std::vector<skipped_feature> skipped_;  // appended, caller keeps order
};

// (1 - after / before) * 100, zero for an empty input
double reduction_percent(metrics const&);

void report(metrics const&);

}  // namespace choro
