#include "layover/cascade.h"

#include <algorithm>
#include <chrono>

#include "utl/helpers/algorithm.h"
#include "utl/verify.h"

#include "layover/common/parse_time.h"
#include "layover/logging.h"
#include "layover/service_band.h"
#include "layover/tail_recovery.h"

namespace layover {

minutes_t set_recovery(trip& t, tp_idx_t const idx, minutes_t const recovery) {
  auto const delta = recovery - t.recovery_[idx];
  t.recovery_[idx] = recovery;
  if (t.arrival_[idx].has_value()) {
    t.departure_times_[idx] = *t.arrival_[idx] + recovery;
  }

  if (delta != minutes_t{0}) {
    for (auto i = static_cast<std::size_t>(idx) + 1U; i < t.n_timepoints();
         ++i) {
      if (!t.is_active(static_cast<tp_idx_t>(i))) {
        break;
      }
      t.arrival_[i] = shift(t.arrival_[i], delta);
      t.departure_times_[i] = shift(t.departure_times_[i], delta);
    }
  }

  t.sync_recovery_minutes();
  t.sync_departure();
  return delta;
}

trip edit_trip_recovery(trip const& t,
                        tp_idx_t const idx,
                        minutes_t const recovery) {
  auto copy = t;
  if (idx < copy.n_timepoints() && copy.is_active(idx)) {
    set_recovery(copy, idx, recovery);
  }
  return copy;
}

void shift_trip(trip& t, minutes_t const delta) {
  auto const shift_all = [&](time_vec& v) {
    for (auto& x : v) {
      x = shift(x, delta);
    }
  };
  shift_all(t.arrival_);
  shift_all(t.departure_times_);
  if (t.original_arrival_.has_value()) {
    shift_all(*t.original_arrival_);
  }
  if (t.original_departure_.has_value()) {
    shift_all(*t.original_departure_);
  }
  t.sync_departure();
}

cascade_stats cascade_block(schedule& s,
                            std::size_t const trip_idx,
                            engine_config const& c) {
  auto stats = cascade_stats{};
  auto const block = s.trips_[trip_idx]->block_;
  auto const blocks = s.blocks();
  auto const& order = blocks.at(block);
  auto const pos = std::distance(begin(order), utl::find(order, trip_idx));

  auto const start = std::chrono::steady_clock::now();
  auto iterations = 0U;
  for (auto k = static_cast<std::size_t>(pos) + 1U; k < order.size(); ++k) {
    if (++iterations > c.max_cascade_iterations_) {
      log(log_lvl::warn, "layover.cascade",
          "block {}: iteration limit {} reached, aborting cascade", block.v_,
          c.max_cascade_iterations_);
      stats.aborted_ = true;
      break;
    }
    if (std::chrono::steady_clock::now() - start >=
        c.cascade_time_budget_) {
      log(log_lvl::warn, "layover.cascade",
          "block {}: time budget {}ms exceeded, aborting cascade", block.v_,
          c.cascade_time_budget_.count());
      stats.aborted_ = true;
      break;
    }

    auto const& prev = *s.trips_[order[k - 1U]];
    auto const& curr = *s.trips_[order[k]];
    auto const new_start = prev.last_active_departure();
    auto const old_start = curr.departure_;
    if (!new_start.has_value() || !old_start.has_value()) {
      log(log_lvl::warn, "layover.cascade",
          "block {}: trip {} lacks timing data, not shifted", block.v_,
          curr.nr_.v_);
      continue;
    }

    auto const delta = *new_start - *old_start;
    if (delta == minutes_t{0}) {
      continue;
    }

    s.update_trip(order[k], [&](trip& t) {
      shift_trip(t, delta);
      ++stats.shifted_;

      if (period_start(*old_start) == period_start(*new_start)) {
        return;
      }
      auto const band = to_str(classify_service_band(*new_start, s));
      if (band != t.service_band_) {
        log(log_lvl::debug, "layover.cascade",
            "trip {}: band {} -> {}, segment travel times kept", t.nr_.v_,
            t.service_band_, band);
        t.service_band_ = std::string{band};
        t.band_info_ = s.band_info(band);
        ++stats.rebanded_;
      }
    });
  }

  return stats;
}

schedule apply_recovery_edit(schedule const& s,
                             trip_nr_t const nr,
                             std::string_view timepoint_id,
                             minutes_t const recovery,
                             engine_config const& c) {
  utl::verify(recovery >= minutes_t{0}, "negative recovery {} at {}",
              recovery.count(), timepoint_id);

  auto const trip_idx = s.find_trip(nr);
  auto const tp_idx = s.find_timepoint(timepoint_id);
  if (!trip_idx.has_value() || !tp_idx.has_value()) {
    log(log_lvl::debug, "layover.cascade",
        "recovery edit: trip {} / {} not found", nr.v_, timepoint_id);
    return s;
  }
  if (!s.trips_[*trip_idx]->is_active(*tp_idx)) {
    log(log_lvl::debug, "layover.cascade",
        "recovery edit: {} is past the end of trip {}", timepoint_id, nr.v_);
    return s;
  }

  auto out = s;
  auto delta = minutes_t{0};
  out.update_trip(*trip_idx,
                  [&](trip& t) { delta = set_recovery(t, *tp_idx, recovery); });

  if (delta != minutes_t{0}) {
    cascade_block(out, *trip_idx, c);
  }

  sort_chronologically(out);
  renumber(out);
  return enforce_tail_recovery(out, c);
}

}  // namespace layover
