#include "layover/trip_lifecycle.h"

#include <algorithm>
#include <set>

#include "utl/erase_if.h"
#include "utl/helpers/algorithm.h"
#include "utl/verify.h"

#include "layover/cascade.h"
#include "layover/common/parse_time.h"
#include "layover/logging.h"
#include "layover/service_band.h"
#include "layover/tail_recovery.h"

namespace layover {

namespace {

schedule finish(schedule s, engine_config const& c) {
  sort_chronologically(s);
  renumber(s);
  return enforce_tail_recovery(s, c);
}

trip_nr_t next_trip_nr(schedule const& s) {
  auto max = trip_nr_t::value_t{0U};
  for (auto const& t : s.trips_) {
    max = std::max(max, t->nr_.v_);
  }
  return trip_nr_t{max + 1U};
}

struct block_span {
  std::optional<minutes_t> first_departure_, last_departure_;
};

block_span get_block_span(schedule const& s, block_nr_t const block) {
  auto const blocks = s.blocks();
  auto const it = blocks.find(block);
  if (it == end(blocks) || it->second.empty()) {
    return {};
  }
  return {.first_departure_ = s.trips_[it->second.front()]->departure_,
          .last_departure_ =
              s.trips_[it->second.back()]->last_active_departure()};
}

trip build_trip(schedule const& s,
                minutes_t const start,
                std::optional<minutes_t> const target_end,
                std::string band,
                recovery_template const& tpl,
                engine_config const& c) {
  auto const n = s.timepoints_.size();

  auto rec = fit_template(tpl, n);
  rec[0] = minutes_t{0};
  auto const total_recovery = sum(rec);

  auto segment = c.default_segment_travel_;
  if (target_end.has_value() && n > 1U) {
    auto const free = *target_end - start - total_recovery;
    segment = std::max(minutes_t{0},
                       minutes_t{free.count() /
                                 static_cast<minutes_t::rep>(n - 1U)});
  }

  auto arrival = time_vec(n);
  arrival[0] = start;
  auto t = start;
  for (auto i = 1U; i < n; ++i) {
    arrival[i] = t + segment;
    t = *arrival[i] + rec[i];
  }

  if (target_end.has_value() && n > 1U) {
    auto const prev_departure =
        n > 2U ? *arrival[n - 2U] + rec[n - 2U] : start;
    utl::verify(*target_end >= prev_departure,
                "add trip: recovery template does not fit into {} - {}",
                format_time(start), format_time(*target_end));
    arrival[n - 1U] = std::max(prev_departure, *target_end - rec[n - 1U]);
    rec[n - 1U] = *target_end - *arrival[n - 1U];
  }

  auto x = make_trip(trip_nr_t{0U}, block_nr_t{0U}, std::move(arrival),
                     std::move(rec), band);
  x.band_info_ = s.band_info(band);
  return x;
}

}  // namespace

block_nr_t lowest_unused_block(schedule const& s) {
  auto used = std::set<block_nr_t::value_t>{};
  for (auto const& t : s.trips_) {
    used.insert(t->block_.v_);
  }
  auto b = block_nr_t::value_t{1U};
  while (used.contains(b)) {
    ++b;
  }
  return block_nr_t{b};
}

schedule add_trip(schedule const& s,
                  add_trip_params const& p,
                  engine_config const& c) {
  utl::verify(!s.timepoints_.empty(), "add trip: schedule has no timepoints");
  utl::verify(!p.start_.has_value() || !p.target_end_.has_value() ||
                  *p.target_end_ >= *p.start_,
              "add trip: end {} before start {}", format_time(p.target_end_),
              format_time(p.start_));

  auto block = block_nr_t{0U};
  auto start = p.start_;
  auto end = p.target_end_;

  if (p.mode_ == add_mode::kMidRoute) {
    utl::verify(start.has_value() && end.has_value(),
                "add trip: mid-route trip requires start and end time");
    block = lowest_unused_block(s);
  } else {
    utl::verify(p.anchor_.has_value(), "add trip: anchor trip required");
    auto const anchor = s.find_trip(*p.anchor_);
    if (!anchor.has_value()) {
      log(log_lvl::debug, "layover.lifecycle", "add trip: anchor {} not found",
          p.anchor_->v_);
      return s;
    }
    block = s.trips_[*anchor]->block_;
    auto const span = get_block_span(s, block);

    if (p.mode_ == add_mode::kAfterLast) {
      if (!start.has_value()) {
        start = span.last_departure_;
      }
    } else {
      if (!end.has_value()) {
        end = span.first_departure_;
      }
    }
  }

  auto const band =
      p.service_band_.has_value()
          ? *p.service_band_
          : std::string{to_str(classify_service_band(
                start.value_or(end.value_or(minutes_t{0})), s))};
  auto const tpl = p.recovery_template_.has_value()
                       ? *p.recovery_template_
                       : default_recovery_templates().find(band).value_or(
                             recovery_template{});

  if (!start.has_value() && end.has_value()) {
    auto const n = s.timepoints_.size();
    auto rec = fit_template(tpl, n);
    rec[0] = minutes_t{0};
    start = *end - sum(rec) -
            c.default_segment_travel_ * static_cast<minutes_t::rep>(n - 1U);
  }
  utl::verify(start.has_value(), "add trip: no start time for block {}",
              block.v_);
  utl::verify(!end.has_value() || *end >= *start,
              "add trip: end {} before start {}", format_time(end),
              format_time(start));

  auto t = build_trip(s, *start, end, band, tpl, c);
  t.nr_ = next_trip_nr(s);
  t.block_ = block;

  log(log_lvl::info, "layover.lifecycle", "add trip: block {} {} - {} ({})",
      block.v_, format_time(t.departure_),
      format_time(t.last_active_departure()), band);

  auto out = s;
  out.trips_.push_back(std::make_shared<trip const>(std::move(t)));
  return finish(std::move(out), c);
}

schedule end_trip(schedule const& s,
                  trip_nr_t const nr,
                  tp_idx_t const idx,
                  engine_config const& c) {
  auto const i = s.find_trip(nr);
  if (!i.has_value() || idx >= s.timepoints_.size()) {
    log(log_lvl::debug, "layover.lifecycle", "end trip: {} / {} not found",
        nr.v_, idx);
    return s;
  }

  auto out = s;
  out.update_trip(*i, [&](trip& t) {
    if (!t.original_arrival_.has_value()) {
      t.original_arrival_ = t.arrival_;
      t.original_departure_ = t.departure_times_;
      t.original_recovery_ = t.recovery_;
    }
    for (auto j = static_cast<std::size_t>(idx); j != t.n_timepoints(); ++j) {
      t.recovery_[j] = minutes_t{0};
      if (j != idx) {
        t.arrival_[j] = std::nullopt;
        t.departure_times_[j] = std::nullopt;
      }
    }
    if (t.arrival_[idx].has_value()) {
      t.departure_times_[idx] = t.arrival_[idx];
    }
    t.end_idx_ = idx;
    t.sync_departure();
    t.sync_recovery_minutes();
  });

  auto const blocks = out.blocks();
  auto const& order = blocks.at(out.trips_[*i]->block_);
  auto cancelled = std::set<trip const*>{};
  for (auto it = utl::find(order, *i); it != end(order); ++it) {
    if (*it != *i) {
      cancelled.insert(out.trips_[*it].get());
    }
  }
  if (!cancelled.empty()) {
    log(log_lvl::info, "layover.lifecycle",
        "end trip {}: cancelled {} later trips of block {}", nr.v_,
        cancelled.size(), out.trips_[*i]->block_.v_);
    utl::erase_if(out.trips_, [&](trip_ptr const& t) {
      return cancelled.contains(t.get());
    });
  }

  return finish(std::move(out), c);
}

schedule restore_trip(schedule const& s,
                      trip_nr_t const nr,
                      engine_config const& c) {
  auto const i = s.find_trip(nr);
  if (!i.has_value()) {
    log(log_lvl::debug, "layover.lifecycle", "restore trip: {} not found",
        nr.v_);
    return s;
  }

  auto const& t = *s.trips_[*i];
  if (!t.is_truncated()) {
    return s;
  }
  utl::verify(t.original_arrival_.has_value() &&
                  t.original_departure_.has_value() &&
                  t.original_recovery_.has_value(),
              "restore trip {}: original times missing", nr.v_);

  auto out = s;
  out.update_trip(*i, [](trip& x) {
    x.arrival_ = std::move(*x.original_arrival_);
    x.departure_times_ = std::move(*x.original_departure_);
    x.recovery_ = std::move(*x.original_recovery_);
    x.original_arrival_ = std::nullopt;
    x.original_departure_ = std::nullopt;
    x.original_recovery_ = std::nullopt;
    x.end_idx_ = std::nullopt;
    x.sync_departure();
    x.sync_recovery_minutes();
  });
  cascade_block(out, *i, c);
  log(log_lvl::info, "layover.lifecycle",
      "restore trip {}: cancelled later trips of block {} are not regenerated",
      nr.v_, t.block_.v_);

  return finish(std::move(out), c);
}

schedule delete_trip(schedule const& s,
                     trip_nr_t const nr,
                     engine_config const& c) {
  auto const i = s.find_trip(nr);
  if (!i.has_value()) {
    log(log_lvl::debug, "layover.lifecycle", "delete trip: {} not found",
        nr.v_);
    return s;
  }

  auto out = s;
  out.trips_.erase(begin(out.trips_) + static_cast<std::ptrdiff_t>(*i));
  return finish(std::move(out), c);
}

}  // namespace layover
