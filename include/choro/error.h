#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace choro {

struct malformed_geometry : public std::runtime_error {
  explicit malformed_geometry(std::string const& msg)
      : std::runtime_error{msg} {}
};

struct missing_property : public std::runtime_error {
  missing_property(size_t feature_idx, std::string field)
      : std::runtime_error{"feature " + std::to_string(feature_idx) +
                           ": missing required property '" + field + "'"},
        feature_idx_{feature_idx},
        field_{std::move(field)} {}

  size_t feature_idx_;
  std::string field_;
};

enum class error_policy { strict, lenient };

}  // namespace choro
