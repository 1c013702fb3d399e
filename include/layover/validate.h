#pragma once

#include <string>
#include <vector>

#include "layover/schedule.h"

namespace layover {

struct issue {
  trip_nr_t trip_;
  std::string msg_;
};

// Checks departure consistency, block chains, tail recovery, numbering,
// truncation backups and block overlaps.
std::vector<issue> validate(schedule const&);

}  // namespace layover
