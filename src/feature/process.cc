#include "choro/feature/process.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "fmt/core.h"

#include "utl/verify.h"

#include "choro/geo/algo/count_points.h"
#include "choro/geo/algo/quantize.h"
#include "choro/geo/transform.h"
#include "choro/util.h"

namespace choro {

constexpr auto kProcessBatchSize = size_t{16};

void verify_settings(process_settings const& s) {
  utl::verify(std::isfinite(s.tolerance_) && s.tolerance_ > 0,
              "tolerance must be a positive number (got {})", s.tolerance_);
  utl::verify(s.precision_ <= kMaxPrecision, "precision must be <= {} (got {})",
              kMaxPrecision, s.precision_);
  utl::verify(!s.id_field_.empty(), "id_field must not be empty");
  utl::verify(!s.label_field_.empty(), "label_field must not be empty");
  utl::verify(!s.id_key_.empty() && !s.label_key_.empty(),
              "output property keys must not be empty");
  utl::verify(s.id_key_ != s.label_key_,
              "output property keys must differ (both '{}')", s.id_key_);
}

std::string get_required(feature const& f, size_t const idx,
                         std::string const& field) {
  auto const value = find_meta(f, field);
  if (!value || value->empty()) {
    throw missing_property{idx, field};
  }
  return std::string{*value};
}

metrics process_feature(feature& f, size_t const idx,
                        process_settings const& s) {
  auto id = get_required(f, idx, s.id_field_);
  auto label = get_required(f, idx, s.label_field_);

  metrics m;
  m.points_before_ = count_points(f.geometry_);

  try {
    f.geometry_ = transform(f.geometry_, s.tolerance_, s.precision_, m.rings_);
  } catch (malformed_geometry const& e) {
    throw malformed_geometry{
        fmt::format("feature {} [id={}]: {}", idx, id, e.what())};
  }

  if (m.rings_.degenerate_ != 0) {
    t_log("warning: feature {} [id={}]: {} ring(s) with less than {} points "
          "passed through unchanged",
          idx, id, m.rings_.degenerate_, kMinRingSize);
  }

  f.meta_ = {{s.id_key_, std::move(id)}, {s.label_key_, std::move(label)}};

  m.points_after_ = count_points(f.geometry_);
  m.features_out_ = 1;
  return m;
}

struct process_manager {
  explicit process_manager(size_t total) : total_{total} {}

  std::optional<std::pair<size_t, size_t>> get_batch() {
    std::lock_guard<std::mutex> lock{mutex_};
    if (next_ == total_) {
      return std::nullopt;
    }

    auto const lb = next_;
    next_ = std::min(total_, next_ + kProcessBatchSize);
    return std::make_pair(lb, next_);
  }

  std::mutex mutex_;
  size_t total_;
  size_t next_{0};
};

struct feature_result {
  std::optional<feature> feature_;
  metrics metrics_;
  std::exception_ptr error_;
};

metrics process_collection(feature_collection& fc,
                           process_settings const& s) {
  verify_settings(s);

  auto& features = fc.features_;
  std::vector<feature_result> results(features.size());

  {
    process_manager mgr{features.size()};
    progress_tracker progress{"simplify features", features.size()};

    auto const num_threads =
        s.threads_ == 0 ? std::max(1U, std::thread::hardware_concurrency())
                        : s.threads_;
    auto const num_batches =
        (features.size() + kProcessBatchSize - 1) / kProcessBatchSize;
    auto const num_workers = std::max(
        size_t{1}, std::min(static_cast<size_t>(num_threads), num_batches));

    std::vector<std::thread> threads;
    threads.reserve(num_workers);
    for (auto i = size_t{0}; i < num_workers; ++i) {
      threads.emplace_back([&] {
        while (auto batch = mgr.get_batch()) {
          for (auto idx = batch->first; idx < batch->second; ++idx) {
            try {
              auto f = features[idx];
              results[idx].metrics_ = process_feature(f, idx, s);
              results[idx].feature_ = std::move(f);
            } catch (std::exception const&) {
              results[idx].error_ = std::current_exception();
            }
          }
          progress.inc(batch->second - batch->first);
        }
      });
    }
    std::for_each(begin(threads), end(threads), [](auto& t) { t.join(); });
  }

  // fc is untouched until here
  if (s.policy_ == error_policy::strict) {
    auto const it =
        std::find_if(begin(results), end(results),
                     [](auto const& r) { return r.error_ != nullptr; });
    if (it != end(results)) {
      std::rethrow_exception(it->error_);
    }
  }

  metrics total;
  total.features_in_ = features.size();

  std::vector<feature> kept;
  kept.reserve(features.size());
  for (auto idx = size_t{0}; idx < features.size(); ++idx) {
    auto& r = results[idx];
    if (!r.error_) {
      total += r.metrics_;
      kept.emplace_back(std::move(*r.feature_));
      continue;
    }

    try {
      std::rethrow_exception(r.error_);
    } catch (std::exception const& e) {
      auto const id = find_meta(features[idx], s.id_field_);
      total.skipped_.push_back(
          {idx, id ? std::string{*id} : std::string{}, e.what()});
    }
  }
  features = std::move(kept);

  return total;
}

}  // namespace choro
