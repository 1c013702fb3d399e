#pragma once

#include <string>

#include "layover/schedule.h"

namespace layover {

// First departure to last active departure, 0 if either is unknown.
minutes_t trip_time(trip const&);

// Recovery over all active timepoints.
minutes_t trip_recovery(trip const&);

minutes_t travel_time(minutes_t trip_time, minutes_t recovery);

// recovery / travel * 100, 0 without travel time.
double recovery_percentage(minutes_t recovery, minutes_t travel);

// "H:MM", hours not wrapped.
std::string format_duration(minutes_t);

struct schedule_summary {
  std::string total_trip_time_;
  std::string total_travel_time_;
  std::string total_recovery_time_;
  double average_recovery_percent_{0.0};
  unsigned trip_count_{0U};
};

schedule_summary summarize(schedule const&);

}  // namespace layover
