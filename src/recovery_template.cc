#include "layover/recovery_template.h"

#include <cmath>

#include "utl/helpers/algorithm.h"
#include "utl/verify.h"

#include "layover/cascade.h"
#include "layover/logging.h"
#include "layover/tail_recovery.h"

namespace layover {

recovery_template fit_template(recovery_template t, std::size_t const n) {
  auto const fill = t.empty() ? minutes_t{0} : t.back();
  t.resize(n, fill);
  return t;
}

void recovery_templates::set(service_band const b,
                             std::size_t const idx,
                             minutes_t const m) {
  auto& t = templates_[b];
  if (t.size() <= idx) {
    t.resize(idx + 1U, minutes_t{0});
  }
  t[idx] = m;
}

void recovery_templates::broadcast(recovery_template const& master) {
  for (auto const b : kServiceBands) {
    templates_[b] = master;
  }
}

std::optional<recovery_template> recovery_templates::find(
    std::string_view band) const {
  auto const b = parse_service_band(band);
  if (!b.has_value()) {
    return std::nullopt;
  }
  auto const it = templates_.find(*b);
  if (it == end(templates_)) {
    return std::nullopt;
  }
  return it->second;
}

recovery_templates default_recovery_templates() {
  auto const m = [](std::initializer_list<int> l) {
    auto t = recovery_template{};
    for (auto const x : l) {
      t.emplace_back(x);
    }
    return t;
  };
  return {.templates_ = {{service_band::kFastest, m({0, 1, 1, 2, 3})},
                         {service_band::kFast, m({0, 1, 2, 2, 4})},
                         {service_band::kStandard, m({0, 2, 2, 3, 5})},
                         {service_band::kSlow, m({0, 2, 3, 3, 6})},
                         {service_band::kSlowest, m({0, 3, 3, 4, 7})}}};
}

recovery_template target_recovery_template(minutes_t const travel,
                                           double const pct,
                                           std::size_t const n) {
  utl::verify(pct >= 0.0, "negative target recovery percentage {}", pct);

  auto t = recovery_template(n, minutes_t{0});
  if (n < 2U) {
    return t;
  }

  auto const total = static_cast<minutes_t::rep>(
      std::round(static_cast<double>(travel.count()) * pct / 100.0));
  auto const segments = static_cast<minutes_t::rep>(n - 1U);
  auto const each = total / segments;
  for (auto i = 1U; i != n; ++i) {
    t[i] = minutes_t{each};
  }
  t[n - 1U] += minutes_t{total - each * segments};
  return t;
}

schedule apply_recovery_template(schedule const& s,
                                 std::string_view band,
                                 recovery_template const& tpl,
                                 engine_config const& c) {
  auto const fitted = fit_template(tpl, s.timepoints_.size());

  auto out = s;
  auto n_changed = 0U;
  for (auto i = 0U; i != out.trips_.size(); ++i) {
    auto const& t = *out.trips_[i];
    if (t.service_band_ != band) {
      continue;
    }

    auto needs_update = t.hidden_tail_recovery_.has_value();
    for (auto j = 0U; j != t.n_timepoints() && !needs_update; ++j) {
      needs_update = t.is_active(static_cast<tp_idx_t>(j)) &&
                     t.recovery_[j] != fitted[j];
    }
    if (!needs_update) {
      continue;
    }

    auto const before = t.last_active_departure();
    auto after = before;
    out.update_trip(i, [&](trip& x) {
      x.hidden_tail_recovery_ = std::nullopt;
      for (auto j = 0U; j != x.n_timepoints(); ++j) {
        auto const idx = static_cast<tp_idx_t>(j);
        if (!x.is_active(idx)) {
          break;
        }
        set_recovery(x, idx, fitted[j]);
      }
      after = x.last_active_departure();
    });
    ++n_changed;

    if (before != after) {
      cascade_block(out, i, c);
    }
  }

  log(log_lvl::info, "layover.template",
      "band {}: template applied to {} trips", band, n_changed);

  sort_chronologically(out);
  renumber(out);
  return enforce_tail_recovery(out, c);
}

schedule apply_target_recovery_percentage(schedule const& s,
                                          std::string_view band,
                                          double const pct,
                                          engine_config const& c) {
  auto const it = utl::find_if(
      s.service_bands_,
      [&](service_band_info const& b) { return b.name_ == band; });
  if (it == end(s.service_bands_) || !it->total_minutes_.has_value()) {
    log(log_lvl::warn, "layover.template",
        "band {}: no travel minutes known, target recovery not applied", band);
    return s;
  }

  return apply_recovery_template(
      s, band,
      target_recovery_template(*it->total_minutes_, pct, s.timepoints_.size()),
      c);
}

}  // namespace layover
