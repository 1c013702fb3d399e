#pragma once

#include <string_view>

#include "layover/engine_config.h"
#include "layover/schedule.h"

namespace layover {

// Sets the recovery at timepoint idx, recomputes its departure and shifts all
// later active timepoints by the difference. Returns the difference.
minutes_t set_recovery(trip&, tp_idx_t idx, minutes_t recovery);

// Single trip recovery edit without any block effects.
trip edit_trip_recovery(trip const&, tp_idx_t idx, minutes_t recovery);

// Shifts every time of the trip (including truncation backups).
void shift_trip(trip&, minutes_t delta);

struct cascade_stats {
  unsigned shifted_{0U};
  unsigned rebanded_{0U};
  bool aborted_{false};
};

// Re-chains all trips of the block that follow trip_idx: each one starts at
// the last active departure of its predecessor. Trips whose 30 minute period
// changes get their service band re-evaluated (label only).
cascade_stats cascade_block(schedule&,
                            std::size_t trip_idx,
                            engine_config const& = {});

schedule apply_recovery_edit(schedule const&,
                             trip_nr_t,
                             std::string_view timepoint_id,
                             minutes_t recovery,
                             engine_config const& = {});

}  // namespace layover
