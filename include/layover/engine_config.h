#pragma once

#include <chrono>

#include "layover/types.h"

namespace layover {

struct engine_config {
  // Guard against runaway block cascades: maximum number of trips shifted
  // per block and wall clock budget per block.
  unsigned max_cascade_iterations_{100U};
  std::chrono::milliseconds cascade_time_budget_{5000};

  // Travel time per segment for trips added without a target end time.
  minutes_t default_segment_travel_{10};
};

}  // namespace layover
