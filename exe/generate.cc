#include <iostream>
#include <string>
#include <vector>

#include "boost/algorithm/string.hpp"
#include "boost/program_options.hpp"

#include "fmt/core.h"

#include "utl/enumerate.h"
#include "utl/verify.h"

#include "layover/cascade.h"
#include "layover/common/parse_time.h"
#include "layover/generate.h"
#include "layover/logging.h"
#include "layover/scoped_timer.h"
#include "layover/service_band.h"
#include "layover/statistics.h"
#include "layover/validate.h"

namespace bpo = boost::program_options;
using namespace layover;
using namespace std::string_literals;

namespace {

void print_schedule(schedule const& s) {
  fmt::print("{:>4} {:>5} {:<18}", "trip", "block", "band");
  for (auto const& tp : s.timepoints_) {
    fmt::print(" {:>11}", tp.id_);
  }
  fmt::print(" {:>5}\n", "rec");

  for (auto const& t : s.trips_) {
    fmt::print("{:>4} {:>5} {:<18}", t->nr_.v_, t->block_.v_, t->service_band_);
    for (auto i = 0U; i != t->n_timepoints(); ++i) {
      fmt::print(" {}/{}", format_time(t->arrival_[i]),
                 format_time(t->departure_times_[i]));
    }
    fmt::print(" {:>5}\n", t->recovery_minutes_.count());
  }
}

}  // namespace

int main(int ac, char** av) {
  auto timepoints = "A,B,C,D,E"s;
  auto n_blocks = 3U;
  auto first = "07:00"s;
  auto last = "22:00"s;
  auto segment = 10;
  auto edit_trip = 0U;
  auto edit_timepoint = ""s;
  auto edit_minutes = 0;
  auto verbose = false;

  auto gc = generation_config{};
  auto cycle = gc.cycle_time_.count();
  auto ec = engine_config{};
  auto max_cascade = ec.max_cascade_iterations_;

  auto desc = bpo::options_description{"Options"};
  desc.add_options()  //
      ("help,h", "produce this help message")  //
      ("timepoints,t", bpo::value(&timepoints)->default_value(timepoints),
       "comma separated timepoint ids")  //
      ("blocks,b", bpo::value(&n_blocks)->default_value(n_blocks),
       "number of vehicle blocks")  //
      ("first", bpo::value(&first)->default_value(first),
       "first trip time, format: HH:MM")  //
      ("last", bpo::value(&last)->default_value(last),
       "last trip time, format: HH:MM")  //
      ("cycle,c", bpo::value(&cycle)->default_value(cycle),
       "cycle time in minutes")  //
      ("segment,s", bpo::value(&segment)->default_value(segment),
       "travel minutes per segment for the fastest band")  //
      ("automate_starts",
       bpo::value(&gc.automate_block_start_times_)
           ->default_value(gc.automate_block_start_times_),
       "stagger block start times over one cycle")  //
      ("max_cascade", bpo::value(&max_cascade)->default_value(max_cascade),
       "maximum number of trips shifted per block cascade")  //
      ("edit_trip", bpo::value(&edit_trip),
       "trip number for a recovery edit")  //
      ("edit_timepoint", bpo::value(&edit_timepoint),
       "timepoint id for a recovery edit")  //
      ("edit_minutes", bpo::value(&edit_minutes),
       "new recovery minutes for a recovery edit")  //
      ("verbose,v", bpo::bool_switch(&verbose)->default_value(false),
       "debug logging");

  auto vm = bpo::variables_map{};
  bpo::store(bpo::command_line_parser(ac, av).options(desc).run(), vm);
  bpo::notify(vm);

  if (vm.count("help") != 0U) {
    std::cout << desc << "\n";
    return 0;
  }

  if (verbose) {
    s_verbosity = log_lvl::debug;
  }

  try {
    auto ids = std::vector<std::string>{};
    boost::split(ids, timepoints, boost::is_any_of(","));
    auto tps = std::vector<timepoint>{};
    for (auto const [i, id] : utl::enumerate(ids)) {
      tps.push_back(
          {.id_ = id, .name_ = id, .sequence_ = static_cast<unsigned>(i)});
    }

    auto const first_trip = parse_time(first);
    auto const last_trip = parse_time(last);
    utl::verify(first_trip.has_value() && last_trip.has_value(),
                "invalid service hours {} - {}", first, last);
    gc.first_trip_ = *first_trip;
    gc.last_trip_ = *last_trip;
    gc.cycle_time_ = minutes_t{cycle};
    ec.max_cascade_iterations_ = max_cascade;

    auto blocks = std::vector<block_config>{};
    for (auto b = 0U; b != n_blocks; ++b) {
      blocks.push_back({.block_ = block_nr_t{b + 1U}, .start_ = *first_trip});
    }

    auto const templates = default_recovery_templates();
    auto profiles = std::vector<band_profile>{};
    for (auto const [i, band] : utl::enumerate(kServiceBands)) {
      auto p = band_profile{.band_ = std::string{to_str(band)},
                            .segment_travel_ = std::vector<minutes_t>(
                                tps.size() - 1U, minutes_t{segment}),
                            .recovery_ = templates.templates_.at(band)};
      if (!p.segment_travel_.empty()) {
        p.segment_travel_.back() += minutes_t{static_cast<int>(i)};
      }
      profiles.push_back(std::move(p));
    }

    auto const timer = scoped_timer{"layover.main"};
    auto s = generate_schedule(tps, profiles, blocks, gc, {}, ec);
    if (vm.contains("edit_trip")) {
      s = apply_recovery_edit(
          s, trip_nr_t{edit_trip}, edit_timepoint, minutes_t{edit_minutes}, ec);
    }

    print_schedule(s);

    auto const summary = summarize(s);
    fmt::print(
        "\ntrips: {}\ntrip time: {}\ntravel time: {}\nrecovery time: {}\n"
        "recovery: {:.1f}%\n",
        summary.trip_count_, summary.total_trip_time_,
        summary.total_travel_time_, summary.total_recovery_time_,
        summary.average_recovery_percent_);

    auto const issues = validate(s);
    for (auto const& i : issues) {
      fmt::print("trip {}: {}\n", i.trip_.v_, i.msg_);
    }
    return issues.empty() ? 0 : 1;
  } catch (std::exception const& e) {
    log(log_lvl::error, "layover.main", "error: {}", e.what());
    return 1;
  }
}
