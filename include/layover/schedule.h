#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "layover/types.h"

namespace layover {

struct timepoint {
  bool operator==(timepoint const&) const = default;

  std::string id_;
  std::string name_;
  unsigned sequence_{0U};
};

struct service_band_info {
  bool operator==(service_band_info const&) const = default;

  std::string name_;
  std::string color_;
  std::optional<minutes_t> total_minutes_{};
};

// One row of the travel time analysis: travel between two timepoints during
// one 30 minute period ("07:00 - 07:29").
struct travel_time_row {
  bool operator==(travel_time_row const&) const = default;

  std::string from_;
  std::string to_;
  std::string time_period_;
  double percentile50_{0.0};
  double percentile80_{0.0};
};

struct trip {
  bool operator==(trip const&) const = default;

  std::size_t n_timepoints() const { return arrival_.size(); }

  bool is_truncated() const { return end_idx_.has_value(); }
  bool is_active(tp_idx_t const i) const {
    return !end_idx_.has_value() || i <= *end_idx_;
  }
  tp_idx_t last_active_idx() const;

  std::optional<minutes_t> first_departure() const;
  std::optional<minutes_t> last_active_departure() const;

  // Recomputes the cached departure from the per-timepoint times.
  void sync_departure();
  void sync_recovery_minutes();

  trip_nr_t nr_{0U};
  block_nr_t block_{0U};
  std::optional<minutes_t> departure_{};
  std::string service_band_;
  std::optional<service_band_info> band_info_{};
  time_vec arrival_;
  time_vec departure_times_;
  recovery_vec recovery_;
  minutes_t recovery_minutes_{0};
  std::optional<tp_idx_t> end_idx_{};
  std::optional<time_vec> original_arrival_{};
  std::optional<time_vec> original_departure_{};
  std::optional<recovery_vec> original_recovery_{};
  std::optional<recovery_vec> hidden_tail_recovery_{};
};

using trip_ptr = std::shared_ptr<trip const>;

struct schedule {
  std::optional<tp_idx_t> find_timepoint(std::string_view id) const;
  std::optional<std::size_t> find_trip(trip_nr_t) const;
  service_band_info band_info(std::string_view band) const;

  // Trip indices per block, each block ordered chronologically.
  std::map<block_nr_t, std::vector<std::size_t>> blocks() const;

  // Copy-on-write: replaces trip i with an updated copy.
  template <typename Fn>
  void update_trip(std::size_t const i, Fn&& fn) {
    auto copy = std::make_shared<trip>(*trips_[i]);
    fn(*copy);
    trips_[i] = std::move(copy);
  }

  friend bool operator==(schedule const&, schedule const&);

  std::vector<timepoint> timepoints_;
  std::vector<service_band_info> service_bands_;
  std::vector<trip_ptr> trips_;
  std::vector<travel_time_row> travel_times_;
  period_set deleted_periods_;
};

// Sorts timepoints by sequence, validates ids and sizes all trip vectors to
// the number of timepoints.
schedule make_schedule(std::vector<timepoint>,
                       std::vector<trip>,
                       std::vector<service_band_info> = {});

// Builds a trip from arrival times and recovery minutes:
// departure = arrival + recovery.
trip make_trip(trip_nr_t,
               block_nr_t,
               time_vec arrival,
               recovery_vec recovery,
               std::string service_band = {});

bool is_before(trip const&, trip const&);

// Stable chronological order, ties by block number. Trips without any time
// go last.
void sort_chronologically(schedule&);

// Dense 1..N numbering in list order. Only renumbered trips are copied.
void renumber(schedule&);

bool is_all_zero(recovery_vec const&);

minutes_t sum(recovery_vec const&);

}  // namespace layover
