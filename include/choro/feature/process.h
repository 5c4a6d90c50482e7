#pragma once

#include <cstddef>
#include <string>

#include "choro/error.h"
#include "choro/feature/feature.h"
#include "choro/feature/metrics.h"

namespace choro {

struct process_settings {
  double tolerance_{0.008};
  unsigned precision_{3};

  std::string id_field_{"DPTOMPIO"};
  std::string label_field_{"MPIO_CNMBR"};

  std::string id_key_{"id"};
  std::string label_key_{"label"};

  error_policy policy_{error_policy::strict};
  unsigned threads_{0};  // 0: std::thread::hardware_concurrency()
};

void verify_settings(process_settings const&);

// replaces geometry and properties of one feature
// the feature is left untouched if an exception is thrown
metrics process_feature(feature&, size_t idx, process_settings const&);

// features are processed independently (in parallel), order is preserved
// strict: rethrows the error of the first failing feature (by index),
//         the collection is left unchanged
// lenient: removes failing features and lists them in metrics::skipped_
metrics process_collection(feature_collection&, process_settings const&);

}  // namespace choro
