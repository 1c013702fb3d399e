#include "layover/schedule.h"

#include <algorithm>
#include <numeric>

#include "utl/enumerate.h"
#include "utl/helpers/algorithm.h"
#include "utl/to_vec.h"
#include "utl/verify.h"

#include "layover/common/parse_time.h"
#include "layover/service_band.h"

namespace layover {

tp_idx_t trip::last_active_idx() const {
  auto const last = static_cast<tp_idx_t>(n_timepoints() - 1U);
  return end_idx_.has_value() ? std::min(*end_idx_, last) : last;
}

std::optional<minutes_t> trip::first_departure() const {
  for (auto i = 0U; i != n_timepoints(); ++i) {
    if (departure_times_[i].has_value()) {
      return departure_times_[i];
    }
    if (arrival_[i].has_value()) {
      return arrival_[i];
    }
  }
  return std::nullopt;
}

std::optional<minutes_t> trip::last_active_departure() const {
  if (n_timepoints() == 0U) {
    return std::nullopt;
  }
  for (auto i = static_cast<int>(last_active_idx()); i >= 0; --i) {
    if (departure_times_[static_cast<std::size_t>(i)].has_value()) {
      return departure_times_[static_cast<std::size_t>(i)];
    }
    if (arrival_[static_cast<std::size_t>(i)].has_value()) {
      return arrival_[static_cast<std::size_t>(i)];
    }
  }
  return std::nullopt;
}

void trip::sync_departure() { departure_ = first_departure(); }

void trip::sync_recovery_minutes() {
  auto total = minutes_t{0};
  for (auto i = 0U; i != recovery_.size(); ++i) {
    if (is_active(static_cast<tp_idx_t>(i))) {
      total += recovery_[i];
    }
  }
  recovery_minutes_ = total;
}

std::optional<tp_idx_t> schedule::find_timepoint(std::string_view id) const {
  auto const it = utl::find_if(
      timepoints_, [&](timepoint const& tp) { return tp.id_ == id; });
  if (it == end(timepoints_)) {
    return std::nullopt;
  }
  return static_cast<tp_idx_t>(std::distance(begin(timepoints_), it));
}

std::optional<std::size_t> schedule::find_trip(trip_nr_t const nr) const {
  auto const it =
      utl::find_if(trips_, [&](trip_ptr const& t) { return t->nr_ == nr; });
  if (it == end(trips_)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(begin(trips_), it));
}

service_band_info schedule::band_info(std::string_view band) const {
  auto const it = utl::find_if(service_bands_, [&](service_band_info const& b) {
    return b.name_ == band;
  });
  if (it != end(service_bands_)) {
    return *it;
  }
  return {.name_ = std::string{band},
          .color_ = std::string{band_color(band)},
          .total_minutes_ = std::nullopt};
}

std::map<block_nr_t, std::vector<std::size_t>> schedule::blocks() const {
  auto ret = std::map<block_nr_t, std::vector<std::size_t>>{};
  for (auto const [i, t] : utl::enumerate(trips_)) {
    ret[t->block_].push_back(i);
  }
  for (auto& [block, indices] : ret) {
    std::stable_sort(begin(indices), end(indices),
                     [&](std::size_t const a, std::size_t const b) {
                       return is_before(*trips_[a], *trips_[b]);
                     });
  }
  return ret;
}

bool operator==(schedule const& a, schedule const& b) {
  return a.timepoints_ == b.timepoints_ &&
         a.service_bands_ == b.service_bands_ &&
         a.deleted_periods_ == b.deleted_periods_ &&
         a.travel_times_ == b.travel_times_ &&
         std::equal(begin(a.trips_), end(a.trips_), begin(b.trips_),
                    end(b.trips_), [](trip_ptr const& x, trip_ptr const& y) {
                      return x == y || *x == *y;
                    });
}

schedule make_schedule(std::vector<timepoint> timepoints,
                       std::vector<trip> trips,
                       std::vector<service_band_info> bands) {
  std::stable_sort(begin(timepoints), end(timepoints),
                   [](timepoint const& a, timepoint const& b) {
                     return a.sequence_ < b.sequence_;
                   });
  for (auto const [i, tp] : utl::enumerate(timepoints)) {
    auto const same_id = [&](timepoint const& x) { return x.id_ == tp.id_; };
    utl::verify(std::none_of(begin(timepoints),
                             begin(timepoints) + static_cast<std::ptrdiff_t>(i),
                             same_id),
                "duplicate timepoint id {}", tp.id_);
  }

  auto const n = timepoints.size();
  auto s = schedule{};
  s.timepoints_ = std::move(timepoints);
  s.service_bands_ = std::move(bands);
  s.trips_ = utl::to_vec(trips, [&](trip& t) -> trip_ptr {
    t.arrival_.resize(n);
    t.departure_times_.resize(n);
    t.recovery_.resize(n, minutes_t{0});
    if (t.end_idx_.has_value() && *t.end_idx_ >= n) {
      t.end_idx_ = std::nullopt;
    }
    t.sync_departure();
    t.sync_recovery_minutes();
    return std::make_shared<trip const>(std::move(t));
  });
  return s;
}

trip make_trip(trip_nr_t const nr,
               block_nr_t const block,
               time_vec arrival,
               recovery_vec recovery,
               std::string service_band) {
  recovery.resize(arrival.size(), minutes_t{0});
  auto t = trip{};
  t.nr_ = nr;
  t.block_ = block;
  t.service_band_ = std::move(service_band);
  t.departure_times_.resize(arrival.size());
  for (auto i = 0U; i != arrival.size(); ++i) {
    t.departure_times_[i] = shift(arrival[i], recovery[i]);
  }
  t.arrival_ = std::move(arrival);
  t.recovery_ = std::move(recovery);
  t.sync_departure();
  t.sync_recovery_minutes();
  return t;
}

bool is_before(trip const& a, trip const& b) {
  if (a.departure_.has_value() != b.departure_.has_value()) {
    return a.departure_.has_value();
  }
  if (a.departure_.has_value() && *a.departure_ != *b.departure_) {
    return *a.departure_ < *b.departure_;
  }
  return a.block_ < b.block_;
}

void sort_chronologically(schedule& s) {
  std::stable_sort(
      begin(s.trips_), end(s.trips_),
      [](trip_ptr const& a, trip_ptr const& b) { return is_before(*a, *b); });
}

void renumber(schedule& s) {
  for (auto i = 0U; i != s.trips_.size(); ++i) {
    auto const nr = trip_nr_t{static_cast<trip_nr_t::value_t>(i + 1U)};
    if (s.trips_[i]->nr_ != nr) {
      s.update_trip(i, [&](trip& t) { t.nr_ = nr; });
    }
  }
}

bool is_all_zero(recovery_vec const& v) {
  return utl::all_of(v, [](minutes_t const m) { return m == minutes_t{0}; });
}

minutes_t sum(recovery_vec const& v) {
  return std::accumulate(begin(v), end(v), minutes_t{0});
}

}  // namespace layover
