#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "choro/geo/geometry.h"

namespace choro {

struct metadata {
  metadata() = default;
  metadata(std::string key, std::string value)
      : key_{std::move(key)}, value_{std::move(value)} {}

  friend bool operator==(metadata const& lhs, metadata const& rhs) {
    return std::tie(lhs.key_, lhs.value_) == std::tie(rhs.key_, rhs.value_);
  }

  friend bool operator!=(metadata const& lhs, metadata const& rhs) {
    return std::tie(lhs.key_, lhs.value_) != std::tie(rhs.key_, rhs.value_);
  }

  std::string key_, value_;
};

struct feature {
  std::vector<metadata> meta_;
  geo_geometry geometry_;
};

struct feature_collection {
  std::vector<feature> features_;

  // top-level members besides "type" and "features", value_ is raw json
  std::vector<metadata> foreign_members_;
};

inline std::optional<std::string_view> find_meta(feature const& f,
                                                 std::string_view key) {
  for (auto const& m : f.meta_) {
    if (m.key_ == key) {
      return std::string_view{m.value_};
    }
  }
  return std::nullopt;
}

}  // namespace choro
