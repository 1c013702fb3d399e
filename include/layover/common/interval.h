#pragma once

#include <tuple>
#include <type_traits>

namespace layover {

template <typename T>
struct interval {
  bool contains(T const t) const { return t >= from_ && t < to_; }

  bool overlaps(interval const& o) const {
    return from_ < o.to_ && to_ > o.from_;
  }

  friend bool operator==(interval const& a, interval const& b) {
    return std::tie(a.from_, a.to_) == std::tie(b.from_, b.to_);
  }

  T from_{}, to_{};
};

template <typename T, typename T1, typename = std::common_type_t<T1, T>>
interval(T, T1) -> interval<std::common_type_t<T, T1>>;

}  // namespace layover
