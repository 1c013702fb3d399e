#pragma once

#include <string>
#include <vector>

#include "layover/engine_config.h"
#include "layover/recovery_template.h"
#include "layover/schedule.h"
#include "layover/service_band.h"

namespace layover {

struct block_config {
  block_nr_t block_;
  minutes_t start_;
};

// Travel profile of one service band: travel minutes per segment
// (timepoint i to i + 1) and recovery per timepoint.
struct band_profile {
  minutes_t total_travel() const;

  std::string band_;
  std::vector<minutes_t> segment_travel_;
  recovery_template recovery_;
};

struct generation_config {
  minutes_t first_trip_{7 * 60};
  minutes_t last_trip_{22 * 60};
  minutes_t cycle_time_{60};

  // Staggers block starts evenly over one cycle, based on the first block.
  bool automate_block_start_times_{true};

  unsigned max_trips_per_block_{50U};
  unsigned max_total_trips_{500U};
  unsigned max_loop_iterations_{1000U};
};

schedule generate_schedule(std::vector<timepoint>,
                           std::vector<band_profile> const&,
                           std::vector<block_config> const&,
                           generation_config const&,
                           period_band_map const& = {},
                           engine_config const& = {});

}  // namespace layover
