#include "layover/statistics.h"

#include <algorithm>

#include "fmt/core.h"

namespace layover {

minutes_t trip_time(trip const& t) {
  if (t.n_timepoints() == 0U) {
    return minutes_t{0};
  }
  auto const first = t.departure_times_[0].has_value() ? t.departure_times_[0]
                                                       : t.arrival_[0];
  auto const last_idx = t.last_active_idx();
  auto const last = t.departure_times_[last_idx].has_value()
                        ? t.departure_times_[last_idx]
                        : t.arrival_[last_idx];
  if (!first.has_value() || !last.has_value()) {
    return minutes_t{0};
  }
  return *last - *first;
}

minutes_t trip_recovery(trip const& t) {
  auto total = minutes_t{0};
  for (auto i = 0U; i != t.recovery_.size(); ++i) {
    if (t.is_active(static_cast<tp_idx_t>(i))) {
      total += t.recovery_[i];
    }
  }
  return total;
}

minutes_t travel_time(minutes_t const trip_time, minutes_t const recovery) {
  return std::max(minutes_t{0}, trip_time - recovery);
}

double recovery_percentage(minutes_t const recovery, minutes_t const travel) {
  if (travel == minutes_t{0}) {
    return 0.0;
  }
  return static_cast<double>(recovery.count()) /
         static_cast<double>(travel.count()) * 100.0;
}

std::string format_duration(minutes_t const m) {
  return fmt::format("{}:{:02}", m.count() / 60, m.count() % 60);
}

schedule_summary summarize(schedule const& s) {
  auto trip_total = minutes_t{0};
  auto recovery_total = minutes_t{0};
  auto travel_total = minutes_t{0};
  auto n = 0U;
  for (auto const& t : s.trips_) {
    auto const tt = trip_time(*t);
    if (tt <= minutes_t{0}) {
      continue;
    }
    auto const rec = trip_recovery(*t);
    trip_total += tt;
    recovery_total += rec;
    travel_total += travel_time(tt, rec);
    ++n;
  }

  return {.total_trip_time_ = format_duration(trip_total),
          .total_travel_time_ = format_duration(travel_total),
          .total_recovery_time_ = format_duration(recovery_total),
          .average_recovery_percent_ =
              recovery_percentage(recovery_total, travel_total),
          .trip_count_ = n};
}

}  // namespace layover
