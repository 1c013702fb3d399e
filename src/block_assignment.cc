#include "layover/block_assignment.h"

#include <algorithm>
#include <numeric>

#include "utl/enumerate.h"
#include "utl/helpers/algorithm.h"
#include "utl/to_vec.h"
#include "utl/verify.h"

#include "layover/common/parse_time.h"
#include "layover/logging.h"
#include "layover/tail_recovery.h"

namespace layover {

namespace {

struct window_builder {
  void record(std::optional<minutes_t> const& t) {
    if (!t.has_value()) {
      return;
    }

    auto m = *t;
    if (last_seen_.has_value() && m < *last_seen_ &&
        *last_seen_ - m >= kMinutesPerDay / 2) {
      while (m < *last_seen_) {
        m += kMinutesPerDay;
      }
    }

    earliest_ = earliest_.has_value() ? std::min(*earliest_, m) : m;
    latest_ = latest_.has_value() ? std::max(*latest_, m) : m;
    last_seen_ = m;
  }

  std::optional<interval<minutes_t>> get() const {
    if (!earliest_.has_value() || !latest_.has_value()) {
      return std::nullopt;
    }
    return interval<minutes_t>{*earliest_, std::max(*earliest_, *latest_)};
  }

  std::optional<minutes_t> earliest_, latest_, last_seen_;
};

struct bus {
  block_nr_t block_;
  minutes_t available_at_;
};

}  // namespace

std::optional<interval<minutes_t>> trip_window(trip const& t) {
  auto w = window_builder{};
  w.record(t.departure_);
  for (auto i = 0U; i != t.n_timepoints(); ++i) {
    if (!t.is_active(static_cast<tp_idx_t>(i))) {
      break;
    }
    if (i == 0U) {
      w.record(t.departure_times_[i]);
      w.record(t.arrival_[i]);
    } else {
      w.record(t.arrival_[i]);
      w.record(t.departure_times_[i]);
    }
  }
  return w.get();
}

bool needs_block_recompute(schedule const& s) {
  if (s.trips_.empty()) {
    return false;
  }

  if (utl::any_of(s.trips_,
                  [](trip_ptr const& t) { return t->block_.v_ == 0U; })) {
    return true;
  }

  auto const monotonic = [&]() {
    for (auto const [i, t] : utl::enumerate(s.trips_)) {
      if (t->block_.v_ != i + 1U) {
        return false;
      }
    }
    return true;
  }();
  auto const blocks = s.blocks();
  auto const all_unique =
      blocks.size() == s.trips_.size() && s.trips_.size() > 1U;
  if (monotonic || all_unique) {
    return true;
  }

  for (auto const& [block, indices] : blocks) {
    for (auto i = 1U; i < indices.size(); ++i) {
      auto const prev = trip_window(*s.trips_[indices[i - 1U]]);
      auto const curr = trip_window(*s.trips_[indices[i]]);
      if (prev.has_value() && curr.has_value() && prev->overlaps(*curr)) {
        return true;
      }
    }
  }

  return false;
}

std::optional<std::vector<block_nr_t>> compute_blocks(
    std::vector<std::optional<interval<minutes_t>>> const& windows) {
  if (utl::any_of(windows, [](auto const& w) { return !w.has_value(); })) {
    return std::nullopt;
  }

  auto order = std::vector<std::size_t>(windows.size());
  std::iota(begin(order), end(order), 0U);
  std::stable_sort(begin(order), end(order),
                   [&](std::size_t const a, std::size_t const b) {
                     return windows[a]->from_ < windows[b]->from_;
                   });

  auto buses = std::vector<bus>{};
  auto assigned = std::vector<block_nr_t>(windows.size(), block_nr_t{0U});
  for (auto const idx : order) {
    auto const& w = *windows[idx];

    auto selected = static_cast<bus*>(nullptr);
    for (auto& b : buses) {
      if (b.available_at_ <= w.from_ &&
          (selected == nullptr || b.available_at_ < selected->available_at_)) {
        selected = &b;
      }
    }

    if (selected == nullptr) {
      buses.push_back(
          {block_nr_t{static_cast<block_nr_t::value_t>(buses.size() + 1U)},
           w.to_});
      selected = &buses.back();
    } else {
      selected->available_at_ = std::max(w.to_, w.from_);
    }

    assigned[idx] = selected->block_;
  }

  return assigned;
}

schedule compute_blocks_for_trips(schedule const& s) {
  auto const windows =
      utl::to_vec(s.trips_, [](trip_ptr const& t) { return trip_window(*t); });
  auto const blocks = compute_blocks(windows);
  if (!blocks.has_value()) {
    log(log_lvl::warn, "layover.block_assignment",
        "unable to compute blocks: some trips lack timing data");
    return s;
  }

  auto out = s;
  for (auto const [i, block] : utl::enumerate(*blocks)) {
    if (out.trips_[i]->block_ != block) {
      out.update_trip(i, [&](trip& t) { t.block_ = block; });
    }
  }
  return out;
}

schedule reassign_blocks_if_needed(schedule const& s, engine_config const& c) {
  if (!needs_block_recompute(s)) {
    return s;
  }

  auto out = compute_blocks_for_trips(s);
  sort_chronologically(out);
  renumber(out);
  return enforce_tail_recovery(out, c);
}

schedule rebuild_trips_from_matrix(
    std::vector<timepoint> timepoints,
    std::vector<std::vector<std::string>> const& rows,
    engine_config const& c) {
  utl::verify(!timepoints.empty(),
              "rebuild from source: no timepoints available");
  utl::verify(!rows.empty(), "rebuild from source: no imported rows available");

  std::stable_sort(begin(timepoints), end(timepoints),
                   [](timepoint const& a, timepoint const& b) {
                     return a.sequence_ < b.sequence_;
                   });

  auto const n = timepoints.size();
  auto trips = std::vector<trip>{};
  trips.reserve(rows.size());
  for (auto const [row_idx, row] : utl::enumerate(rows)) {
    auto times = time_vec(n);
    for (auto i = 0U; i != n && i != row.size(); ++i) {
      times[i] = parse_time(row[i]);
    }
    utl::verify(utl::any_of(times, [](auto const& t) { return t.has_value(); }),
                "rebuild from source: row {} has no usable times", row_idx);

    auto t = make_trip(trip_nr_t{static_cast<trip_nr_t::value_t>(row_idx + 1U)},
                       block_nr_t{0U}, times, recovery_vec(n, minutes_t{0}),
                       "Legacy Import");
    t.departure_times_ = times;
    t.sync_departure();
    trips.push_back(std::move(t));
  }

  auto s = make_schedule(std::move(timepoints), std::move(trips));
  auto const blocks = compute_blocks(
      utl::to_vec(s.trips_, [](trip_ptr const& t) { return trip_window(*t); }));
  utl::verify(blocks.has_value(),
              "rebuild from source: unable to derive trip windows");
  for (auto const [i, block] : utl::enumerate(*blocks)) {
    s.update_trip(i, [&](trip& t) { t.block_ = block; });
  }

  sort_chronologically(s);
  renumber(s);
  return enforce_tail_recovery(s, c);
}

}  // namespace layover
