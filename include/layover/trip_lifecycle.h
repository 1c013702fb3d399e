#pragma once

#include <cinttypes>
#include <optional>
#include <string>

#include "layover/engine_config.h"
#include "layover/recovery_template.h"
#include "layover/schedule.h"

namespace layover {

enum class add_mode : std::uint8_t {
  kAfterLast,  // appended to the anchor's block
  kEarly,  // ends where the anchor's block starts
  kMidRoute  // own block, explicit start and end
};

struct add_trip_params {
  add_mode mode_{add_mode::kAfterLast};
  std::optional<trip_nr_t> anchor_{};
  std::optional<minutes_t> start_{};
  std::optional<minutes_t> target_end_{};
  std::optional<std::string> service_band_{};
  std::optional<recovery_template> recovery_template_{};
};

schedule add_trip(schedule const&,
                  add_trip_params const&,
                  engine_config const& = {});

// Truncates the trip after timepoint idx and cancels all later trips of its
// block. The untruncated times are kept for restore_trip.
schedule end_trip(schedule const&,
                  trip_nr_t,
                  tp_idx_t idx,
                  engine_config const& = {});

schedule restore_trip(schedule const&, trip_nr_t, engine_config const& = {});

schedule delete_trip(schedule const&, trip_nr_t, engine_config const& = {});

// Lowest positive block number not used by any trip.
block_nr_t lowest_unused_block(schedule const&);

}  // namespace layover
