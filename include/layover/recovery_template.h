#pragma once

#include <map>
#include <optional>
#include <string_view>

#include "layover/engine_config.h"
#include "layover/schedule.h"
#include "layover/service_band.h"

namespace layover {

// Recovery minutes per timepoint position.
using recovery_template = recovery_vec;

// Resizes to n entries, extending with the last value (zero if empty).
recovery_template fit_template(recovery_template, std::size_t n);

struct recovery_templates {
  void set(service_band, std::size_t idx, minutes_t);
  void broadcast(recovery_template const& master);
  std::optional<recovery_template> find(std::string_view band) const;

  std::map<service_band, recovery_template> templates_;
};

recovery_templates default_recovery_templates();

// total = round(travel * pct / 100). First timepoint 0, the others get
// floor(total / (n - 1)), the remainder goes to the last timepoint.
recovery_template target_recovery_template(minutes_t travel,
                                           double pct,
                                           std::size_t n);

schedule apply_recovery_template(schedule const&,
                                 std::string_view band,
                                 recovery_template const&,
                                 engine_config const& = {});

schedule apply_target_recovery_percentage(schedule const&,
                                          std::string_view band,
                                          double pct,
                                          engine_config const& = {});

}  // namespace layover
