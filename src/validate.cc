#include "layover/validate.h"

#include "fmt/core.h"

#include "layover/block_assignment.h"
#include "layover/common/parse_time.h"

namespace layover {

std::vector<issue> validate(schedule const& s) {
  auto issues = std::vector<issue>{};
  auto const report = [&](trip const& t, std::string msg) {
    issues.push_back({.trip_ = t.nr_, .msg_ = std::move(msg)});
  };

  for (auto i = 0U; i != s.trips_.size(); ++i) {
    auto const& t = *s.trips_[i];

    for (auto j = 1U; j < t.n_timepoints(); ++j) {
      if (!t.is_active(static_cast<tp_idx_t>(j)) ||
          !t.arrival_[j].has_value() || !t.departure_times_[j].has_value()) {
        continue;
      }
      if (*t.departure_times_[j] != *t.arrival_[j] + t.recovery_[j]) {
        report(t, fmt::format("{}: departure {} != arrival {} + recovery {}",
                              s.timepoints_[j].id_,
                              format_time(t.departure_times_[j]),
                              format_time(t.arrival_[j]),
                              t.recovery_[j].count()));
      }
    }

    if (t.nr_.v_ != i + 1U) {
      report(t, fmt::format("trip number {} at position {}", t.nr_.v_, i + 1U));
    }
    if (i != 0U && is_before(t, *s.trips_[i - 1U])) {
      report(t, "not in chronological order");
    }

    auto const has_backup = t.original_arrival_.has_value() ||
                            t.original_departure_.has_value() ||
                            t.original_recovery_.has_value();
    if (has_backup != t.is_truncated()) {
      report(t, t.is_truncated() ? "truncated without original times"
                                 : "original times without truncation");
    }
  }

  for (auto const& [block, order] : s.blocks()) {
    for (auto k = 1U; k < order.size(); ++k) {
      auto const& prev = *s.trips_[order[k - 1U]];
      auto const& curr = *s.trips_[order[k]];
      auto const prev_end = prev.last_active_departure();
      if (prev_end != curr.departure_) {
        report(curr, fmt::format("block {}: starts {}, predecessor ends {}",
                                 block.v_, format_time(curr.departure_),
                                 format_time(prev_end)));
      }

      auto const a = trip_window(prev);
      auto const b = trip_window(curr);
      if (a.has_value() && b.has_value() && a->overlaps(*b)) {
        report(curr, fmt::format("block {}: overlaps trip {}", block.v_,
                                 prev.nr_.v_));
      }
    }

    auto const& last = *s.trips_[order.back()];
    if (!is_all_zero(last.recovery_) ||
        last.recovery_minutes_ != minutes_t{0}) {
      report(last, fmt::format("block {}: last trip carries recovery {}",
                               block.v_, last.recovery_minutes_.count()));
    }
  }

  return issues;
}

}  // namespace layover
