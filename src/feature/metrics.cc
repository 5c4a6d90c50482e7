#include "choro/feature/metrics.h"

#include "choro/util.h"

namespace choro {

metrics& metrics::operator+=(metrics const& o) {
  features_in_ += o.features_in_;
  features_out_ += o.features_out_;
  points_before_ += o.points_before_;
  points_after_ += o.points_after_;
  rings_ += o.rings_;

  skipped_.insert(end(skipped_), begin(o.skipped_), end(o.skipped_));
  return *this;
}

double reduction_percent(metrics const& m) {
  if (m.points_before_ == 0) {
    return 0.;
  }
  return (1. - static_cast<double>(m.points_after_) / m.points_before_) * 100.;
}

void report(metrics const& m) {
  t_log("features    > in: {} out: {} skipped: {}",
        printable_num{m.features_in_}, printable_num{m.features_out_},
        printable_num{m.skipped_.size()});
  t_log("rings       > total: {} kept original: {} degenerate: {}",
        printable_num{m.rings_.rings_}, printable_num{m.rings_.fallback_},
        printable_num{m.rings_.degenerate_});
  t_log("coordinates > {} -> {} ({:.1f}% reduction)",
        printable_num{m.points_before_}, printable_num{m.points_after_},
        reduction_percent(m));

  for (auto const& s : m.skipped_) {
    t_log("skipped feature {} [id={}]: {}", s.idx_, s.id_, s.reason_);
  }
}

}  // namespace choro
