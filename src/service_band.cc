#include "layover/service_band.h"

#include <algorithm>
#include <cmath>

#include "utl/helpers/algorithm.h"
#include "utl/to_vec.h"

#include "layover/common/parse_time.h"
#include "layover/logging.h"

namespace layover {

namespace {

double percentile(std::vector<double> const& sorted, double const p) {
  if (sorted.empty()) {
    return 0.0;
  }
  auto const rank = std::ceil(p / 100.0 * static_cast<double>(sorted.size()));
  auto const idx = static_cast<int>(rank) - 1;
  return sorted[static_cast<std::size_t>(std::max(0, idx))];
}

std::optional<minutes_t> find_period(minutes_t const departure,
                                     std::span<travel_time_row const> rows) {
  for (auto const& row : rows) {
    auto const period = parse_time_period(row.time_period_);
    if (period.has_value() && period->contains(departure)) {
      return period->from_;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<service_band> parse_service_band(std::string_view s) {
  auto const it =
      utl::find_if(kServiceBands,
                   [&](service_band const b) { return to_str(b) == s; });
  if (it == end(kServiceBands)) {
    return std::nullopt;
  }
  return *it;
}

std::string_view band_color(std::string_view band) {
  auto const b = parse_service_band(band);
  if (!b.has_value()) {
    return "#9b9b9b";
  }
  switch (*b) {
    case service_band::kFastest: return "#2e7d32";
    case service_band::kFast: return "#388e3c";
    case service_band::kStandard: return "#f9a825";
    case service_band::kSlow: return "#f57c00";
    case service_band::kSlowest: return "#d32f2f";
  }
  return "#9b9b9b";
}

service_band static_service_band(minutes_t const departure) {
  auto const hour = (departure.count() / 60) % 24;
  if (hour >= 6 && hour < 9) {
    return service_band::kFastest;
  } else if (hour >= 9 && hour < 12) {
    return service_band::kFast;
  } else if (hour >= 12 && hour < 15) {
    return service_band::kStandard;
  } else if (hour >= 15 && hour < 18) {
    return service_band::kSlow;
  }
  return service_band::kSlowest;
}

std::map<minutes_t, double> period_totals(std::span<travel_time_row const> rows,
                                          period_set const& excluded) {
  auto totals = std::map<minutes_t, double>{};
  for (auto const& row : rows) {
    auto const period = parse_time_period(row.time_period_);
    if (!period.has_value()) {
      log(log_lvl::warn, "layover.service_band",
          "skipping row with malformed period \"{}\"", row.time_period_);
      continue;
    }
    if (excluded.contains(period->from_)) {
      continue;
    }
    totals[period->from_] += row.percentile50_;
  }
  return totals;
}

std::array<double, 4U> band_thresholds(
    std::map<minutes_t, double> const& totals) {
  auto sorted = utl::to_vec(
      totals, [](auto const& entry) { return std::round(entry.second); });
  std::sort(begin(sorted), end(sorted));
  return {percentile(sorted, 20.0), percentile(sorted, 40.0),
          percentile(sorted, 60.0), percentile(sorted, 80.0)};
}

service_band band_for_total(double const total,
                            std::array<double, 4U> const& thresholds) {
  if (total < thresholds[0]) {
    return service_band::kFastest;
  }
  if (total < thresholds[1]) {
    return service_band::kFast;
  }
  if (total < thresholds[2]) {
    return service_band::kStandard;
  }
  if (total < thresholds[3]) {
    return service_band::kSlow;
  }
  return service_band::kSlowest;
}

service_band classify_service_band(minutes_t const departure,
                                   std::span<travel_time_row const> rows,
                                   period_set const& excluded) {
  if (rows.empty()) {
    return static_service_band(departure);
  }

  auto const period = find_period(departure, rows);
  if (!period.has_value()) {
    return service_band::kStandard;
  }

  auto const totals = period_totals(rows, excluded);
  auto const it = totals.find(*period);
  return band_for_total(it == end(totals) ? 0.0 : it->second,
                        band_thresholds(totals));
}

service_band classify_service_band(minutes_t const departure,
                                   schedule const& s) {
  return classify_service_band(departure, s.travel_times_, s.deleted_periods_);
}

std::optional<service_band> period_band_map::lookup(minutes_t const t) const {
  auto const it = bands_.find(period_start(t));
  if (it == end(bands_)) {
    return std::nullopt;
  }
  return it->second;
}

period_band_map build_period_band_map(std::span<travel_time_row const> rows,
                                      period_set const& excluded) {
  auto const totals = period_totals(rows, excluded);
  auto const thresholds = band_thresholds(totals);
  auto m = period_band_map{};
  for (auto const& [start, total] : totals) {
    m.bands_.emplace(start, band_for_total(total, thresholds));
  }
  return m;
}

service_band determine_service_band_for_time(minutes_t const t,
                                             period_band_map const& m) {
  return m.lookup(t).value_or(static_service_band(t));
}

std::vector<service_band_info> create_service_bands(
    std::span<travel_time_row const> rows, period_set const& excluded) {
  auto const totals = period_totals(rows, excluded);
  auto const thresholds = band_thresholds(totals);

  auto sums = std::array<double, kNumServiceBands>{};
  auto counts = std::array<unsigned, kNumServiceBands>{};
  for (auto const& [start, total] : totals) {
    auto const b = static_cast<std::size_t>(band_for_total(total, thresholds));
    sums[b] += std::round(total);
    ++counts[b];
  }

  auto bands = std::vector<service_band_info>{};
  for (auto const b : kServiceBands) {
    auto const i = static_cast<std::size_t>(b);
    if (counts[i] == 0U) {
      continue;
    }
    bands.push_back(service_band_info{
        .name_ = std::string{to_str(b)},
        .color_ = std::string{band_color(to_str(b))},
        .total_minutes_ = minutes_t{static_cast<minutes_t::rep>(
            std::lround(sums[i] / counts[i]))}});
  }
  return bands;
}

}  // namespace layover
