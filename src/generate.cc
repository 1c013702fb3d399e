#include "layover/generate.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "utl/helpers/algorithm.h"
#include "utl/to_vec.h"
#include "utl/verify.h"

#include "layover/common/parse_time.h"
#include "layover/logging.h"
#include "layover/scoped_timer.h"
#include "layover/tail_recovery.h"

namespace layover {

minutes_t band_profile::total_travel() const {
  return std::accumulate(begin(segment_travel_), end(segment_travel_),
                         minutes_t{0});
}

namespace {

minutes_t block_start(std::vector<block_config> const& blocks,
                      std::size_t const idx,
                      generation_config const& c) {
  if (!c.automate_block_start_times_ || idx == 0U) {
    return blocks[idx].start_;
  }
  auto const frequency = static_cast<minutes_t::rep>(
      std::round(static_cast<double>(c.cycle_time_.count()) /
                 static_cast<double>(blocks.size())));
  return blocks.front().start_ +
         minutes_t{frequency * static_cast<minutes_t::rep>(idx)};
}

trip make_generated_trip(std::size_t const n,
                         minutes_t const start,
                         band_profile const& p,
                         generation_config const& c) {
  auto rec = fit_template(p.recovery_, n);
  rec[0] = minutes_t{0};

  auto arrival = time_vec(n);
  arrival[0] = start;
  auto t = start;
  for (auto i = 1U; i < n; ++i) {
    auto const travel = i - 1U < p.segment_travel_.size()
                            ? p.segment_travel_[i - 1U]
                            : minutes_t{0};
    arrival[i] = t + travel;
    if (i + 1U != n) {
      t = *arrival[i] + rec[i];
    }
  }

  // Slack up to the cycle time is held at the last timepoint.
  auto const last_arrival = *arrival[n - 1U];
  auto const last_departure =
      std::max(start + c.cycle_time_, last_arrival + rec[n - 1U]);
  rec[n - 1U] = last_departure - last_arrival;

  return make_trip(trip_nr_t{0U}, block_nr_t{0U}, std::move(arrival),
                   std::move(rec), p.band_);
}

}  // namespace

schedule generate_schedule(std::vector<timepoint> timepoints,
                           std::vector<band_profile> const& profiles,
                           std::vector<block_config> const& blocks,
                           generation_config const& c,
                           period_band_map const& bands,
                           engine_config const& ec) {
  utl::verify(c.cycle_time_ > minutes_t{0}, "generate: cycle time {} <= 0",
              c.cycle_time_.count());
  utl::verify(!blocks.empty(), "generate: no blocks configured");
  utl::verify(!timepoints.empty(), "generate: no timepoints");
  utl::verify(c.first_trip_ < c.last_trip_,
              "generate: first trip {} not before last trip {}",
              format_time(c.first_trip_), format_time(c.last_trip_));

  auto const timer = scoped_timer{"layover.generate"};

  auto const n = timepoints.size();
  auto trips = std::vector<trip>{};
  for (auto b = 0U; b != blocks.size(); ++b) {
    auto const block = blocks[b].block_;
    auto current = std::max(block_start(blocks, b, c), c.first_trip_);
    auto n_block_trips = 0U;
    auto iterations = 0U;

    while (current <= c.last_trip_ &&
           n_block_trips < c.max_trips_per_block_ &&
           trips.size() < c.max_total_trips_ &&
           iterations < c.max_loop_iterations_) {
      ++iterations;

      auto const band = to_str(determine_service_band_for_time(current, bands));
      auto const profile = utl::find_if(
          profiles, [&](band_profile const& p) { return p.band_ == band; });
      if (profile == end(profiles)) {
        log(log_lvl::debug, "layover.generate",
            "block {}: no profile for {} at {}, skipping", block.v_, band,
            format_time(current));
        current += c.cycle_time_;
        continue;
      }

      auto t = make_generated_trip(n, current, *profile, c);
      t.block_ = block;
      current = *t.last_active_departure();
      trips.push_back(std::move(t));
      ++n_block_trips;
    }

    if (n_block_trips >= c.max_trips_per_block_) {
      log(log_lvl::warn, "layover.generate",
          "block {}: trip limit {} reached", block.v_, c.max_trips_per_block_);
    }
    if (iterations >= c.max_loop_iterations_) {
      log(log_lvl::warn, "layover.generate",
          "block {}: loop limit {} reached", block.v_, c.max_loop_iterations_);
    }
  }
  if (trips.size() >= c.max_total_trips_) {
    log(log_lvl::warn, "layover.generate", "total trip limit {} reached",
        c.max_total_trips_);
  }

  auto catalogue = utl::to_vec(profiles, [](band_profile const& p) {
    return service_band_info{.name_ = p.band_,
                             .color_ = std::string{band_color(p.band_)},
                             .total_minutes_ = p.total_travel()};
  });

  auto s = make_schedule(std::move(timepoints), std::move(trips),
                         std::move(catalogue));
  for (auto i = 0U; i != s.trips_.size(); ++i) {
    s.update_trip(i, [&](trip& t) {
      t.band_info_ = s.band_info(t.service_band_);
    });
  }
  sort_chronologically(s);
  renumber(s);

  log(log_lvl::info, "layover.generate", "generated {} trips in {} blocks",
      s.trips_.size(), blocks.size());

  return enforce_tail_recovery(s, ec);
}

}  // namespace layover
