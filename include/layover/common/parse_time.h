#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "layover/common/interval.h"
#include "layover/types.h"

namespace layover {

// Parses "HH:MM" (hours may exceed 23 for service after midnight).
// Returns an empty optional for empty, placeholder ("-", "--") or malformed
// input. Malformed non-empty input is logged.
std::optional<minutes_t> parse_time(std::string_view);

// Formats as zero-padded "HH:MM". Hours are not wrapped at midnight.
std::string format_time(minutes_t);

std::string format_time(std::optional<minutes_t> const&);

// Returns the input unchanged if it does not parse.
std::string add_minutes(std::string_view time, int delta);

// Minutes from a to b, wrapping over midnight if b is earlier than a.
minutes_t time_difference(minutes_t a, minutes_t b);

// Start of the 30 minute analysis window containing t.
minutes_t period_start(minutes_t t);

// Parses "07:00 - 07:29" into [07:00, 07:30[.
// An inclusive end on :29/:59 is normalized to the exclusive end.
std::optional<interval<minutes_t>> parse_time_period(std::string_view);

std::optional<minutes_t> shift(std::optional<minutes_t> const&, minutes_t);

}  // namespace layover
