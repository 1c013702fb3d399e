#include "layover/tail_recovery.h"

#include "layover/cascade.h"
#include "layover/logging.h"

namespace layover {

namespace {

void restore_stash(trip& t) {
  auto const stash = *t.hidden_tail_recovery_;
  for (auto i = 0U; i != stash.size() && i != t.n_timepoints(); ++i) {
    auto const idx = static_cast<tp_idx_t>(i);
    if (stash[i] != minutes_t{0} && t.is_active(idx)) {
      set_recovery(t, idx, stash[i]);
    }
  }
  t.hidden_tail_recovery_ = std::nullopt;
  t.sync_recovery_minutes();
}

void stash_and_zero(trip& t) {
  auto merged = t.hidden_tail_recovery_.value_or(
      recovery_vec(t.n_timepoints(), minutes_t{0}));
  merged.resize(t.n_timepoints(), minutes_t{0});
  for (auto i = 0U; i != t.n_timepoints(); ++i) {
    if (t.recovery_[i] != minutes_t{0}) {
      merged[i] = t.recovery_[i];
    }
  }
  for (auto i = 0U; i != t.n_timepoints(); ++i) {
    if (t.recovery_[i] != minutes_t{0}) {
      set_recovery(t, static_cast<tp_idx_t>(i), minutes_t{0});
    }
  }
  t.hidden_tail_recovery_ = std::move(merged);
}

}  // namespace

schedule enforce_tail_recovery(schedule const& s, engine_config const& c) {
  auto out = s;
  auto restored = false;

  for (auto const& [block, order] : s.blocks()) {
    for (auto k = 0U; k + 1U < order.size(); ++k) {
      auto const& stash = out.trips_[order[k]]->hidden_tail_recovery_;
      if (!stash.has_value()) {
        continue;
      }
      if (is_all_zero(*stash)) {
        out.update_trip(order[k], [](trip& t) {
          t.hidden_tail_recovery_ = std::nullopt;
        });
        continue;
      }
      log(log_lvl::debug, "layover.tail",
          "block {}: restoring tail recovery of trip {}", block.v_,
          out.trips_[order[k]]->nr_.v_);
      out.update_trip(order[k], restore_stash);
      cascade_block(out, order[k], c);
      restored = true;
    }

    auto const last = order.back();
    if (is_all_zero(out.trips_[last]->recovery_)) {
      continue;
    }
    log(log_lvl::debug, "layover.tail",
        "block {}: stashing tail recovery of trip {}", block.v_,
        out.trips_[last]->nr_.v_);
    out.update_trip(last, stash_and_zero);
  }

  if (restored) {
    sort_chronologically(out);
    renumber(out);
  }

  return out;
}

}  // namespace layover
