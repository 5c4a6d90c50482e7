#pragma once

#include <time.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "fmt/ostream.h"

namespace choro {

template <typename... Args>
inline void t_log(Args&&... args) {
  using clock = std::chrono::system_clock;
  auto const now = clock::to_time_t(clock::now());
  struct tm tmp;
#if _MSC_VER >= 1400
  gmtime_s(&tmp, &now);
#else
  gmtime_r(&now, &tmp);
#endif
  std::clog << std::put_time(&tmp, "%FT%TZ") << " | ";
  fmt::print(std::clog, std::forward<Args>(args)...);
  std::clog << std::endl;
}

struct progress_tracker {
  explicit progress_tracker(std::string label, size_t total)
      : label_{std::move(label)},
        total_{total},
        curr_{0},
        pos_{std::numeric_limits<size_t>::max()} {}

  void inc(size_t i = 1) {
    curr_ += i;
    log_progress_maybe();
  }

  void log_progress_maybe() {
    if (total_ == 0) {
      return;
    }

    size_t curr_pos = static_cast<size_t>(100. * curr_ / total_ / 5) * 5;
    size_t prev_pos = pos_.exchange(curr_pos);
    if (prev_pos != curr_pos) {
      t_log("{} : {:>3}%", label_, curr_pos);
    }
  }

  std::string label_;
  size_t total_;
  std::atomic_size_t curr_;
  std::atomic_size_t pos_;
};

struct scoped_timer final {
  explicit scoped_timer(std::string label)
      : label_{std::move(label)}, start_{std::chrono::steady_clock::now()} {
    std::clog << "|> start: " << label_ << "\n";
  }

  ~scoped_timer() {
    using namespace std::chrono;

    auto const now = steady_clock::now();
    double dur = duration_cast<microseconds>(now - start_).count() / 1000.0;

    std::clog << "|> done: " << label_ << " (";
    if (dur < 1000) {
      std::clog << std::setw(6) << std::setprecision(4) << dur << "ms";
    } else {
      dur /= 1000;
      std::clog << std::setw(6) << std::setprecision(4) << dur << "s";
    }
    std::clog << ")" << std::endl;
  }

  std::string label_;
  std::chrono::time_point<std::chrono::steady_clock> start_;
};

struct printable_num {
  explicit printable_num(double n) : n_{n} {}
  explicit printable_num(uint64_t n) : n_{static_cast<double>(n)} {}
  double n_;
};

}  // namespace choro

namespace fmt {

template <>
struct formatter<choro::printable_num> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(choro::printable_num const& num, FormatContext& ctx) const {
    auto const n = num.n_;
    auto const k = n / 1e3;
    auto const m = n / 1e6;
    auto const g = n / 1e9;
    if (n < 1e3) {
      return format_to(ctx.out(), "{:>6} ", n);
    } else if (k < 1e3) {
      return format_to(ctx.out(), "{:>6.1f}K", k);
    } else if (m < 1e3) {
      return format_to(ctx.out(), "{:>6.1f}M", m);
    } else {
      return format_to(ctx.out(), "{:>6.1f}G", g);
    }
  }
};

}  // namespace fmt
