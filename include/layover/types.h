#pragma once

#include <chrono>
#include <cinttypes>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cista/strong.h"

namespace layover {

using minutes_t = std::chrono::duration<std::int32_t, std::ratio<60>>;

// Length of the analysis windows used for service band lookups.
constexpr auto const kPeriodLength = minutes_t{30};

constexpr auto const kMinutesPerDay = minutes_t{24 * 60};

using tp_idx_t = std::uint16_t;

using trip_nr_t = cista::strong<std::uint32_t, struct _trip_nr>;
using block_nr_t = cista::strong<std::uint32_t, struct _block_nr>;

// Per-timepoint times, indexed by timepoint position. Empty = no time.
using time_vec = std::vector<std::optional<minutes_t>>;

// Per-timepoint recovery minutes, indexed by timepoint position.
using recovery_vec = std::vector<minutes_t>;

// Explicit set of excluded analysis periods, keyed by window start.
using period_set = std::set<minutes_t>;

}  // namespace layover
