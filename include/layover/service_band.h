#pragma once

#include <array>
#include <cinttypes>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "layover/schedule.h"
#include "layover/types.h"

namespace layover {

enum class service_band : std::uint8_t {
  kFastest,
  kFast,
  kStandard,
  kSlow,
  kSlowest
};

constexpr auto const kNumServiceBands = 5U;

constexpr auto const kServiceBands = std::array{
    service_band::kFastest, service_band::kFast, service_band::kStandard,
    service_band::kSlow, service_band::kSlowest};

constexpr std::string_view to_str(service_band const b) {
  switch (b) {
    case service_band::kFastest: return "Fastest Service";
    case service_band::kFast: return "Fast Service";
    case service_band::kStandard: return "Standard Service";
    case service_band::kSlow: return "Slow Service";
    case service_band::kSlowest: return "Slowest Service";
  }
  return "";
}

std::optional<service_band> parse_service_band(std::string_view);

// Display color of a band label. Free-form labels get a neutral grey.
std::string_view band_color(std::string_view band);

// Fallback without analysis data:
// 06-09 fastest, 09-12 fast, 12-15 standard, 15-18 slow, else slowest.
service_band static_service_band(minutes_t departure);

// Total percentile50 travel minutes per analysis period (keyed by window
// start), skipping excluded periods.
std::map<minutes_t, double> period_totals(std::span<travel_time_row const>,
                                          period_set const& excluded = {});

// 20/40/60/80 percentile thresholds over the rounded period totals.
std::array<double, 4U> band_thresholds(std::map<minutes_t, double> const&);

service_band band_for_total(double total,
                            std::array<double, 4U> const& thresholds);

service_band classify_service_band(minutes_t departure,
                                   std::span<travel_time_row const> = {},
                                   period_set const& excluded = {});

service_band classify_service_band(minutes_t departure, schedule const&);

// Precomputed band per 30 minute window start.
struct period_band_map {
  std::optional<service_band> lookup(minutes_t) const;

  std::map<minutes_t, service_band> bands_;
};

period_band_map build_period_band_map(std::span<travel_time_row const>,
                                      period_set const& excluded = {});

service_band determine_service_band_for_time(minutes_t, period_band_map const&);

// Band catalogue derived from the analysis: color and mean period total per
// band. Bands without any period are omitted.
std::vector<service_band_info> create_service_bands(
    std::span<travel_time_row const>, period_set const& excluded = {});

}  // namespace layover
