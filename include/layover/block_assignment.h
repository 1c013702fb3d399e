#pragma once

#include <optional>
#include <string>
#include <vector>

#include "layover/common/interval.h"
#include "layover/engine_config.h"
#include "layover/schedule.h"

namespace layover {

// Service window of a trip: first departure to last active departure.
// Times that jump back by half a day or more are treated as past midnight.
std::optional<interval<minutes_t>> trip_window(trip const&);

bool needs_block_recompute(schedule const&);

// Greedy interval partitioning: each trip (by window start) goes to the block
// that became available first among those free at its start, otherwise to a
// new block. Returns one block number per trip, or nothing if a window is
// malformed.
std::optional<std::vector<block_nr_t>> compute_blocks(
    std::vector<std::optional<interval<minutes_t>>> const& windows);

schedule compute_blocks_for_trips(schedule const&);

schedule reassign_blocks_if_needed(schedule const&, engine_config const& = {});

// Rebuilds trips from raw imported rows (one time string per timepoint).
// Throws if the rows cannot produce a complete set of trips.
schedule rebuild_trips_from_matrix(
    std::vector<timepoint>,
    std::vector<std::vector<std::string>> const& rows,
    engine_config const& = {});

}  // namespace layover
