#pragma once

#include <string>
#include <variant>

#include "layover/engine_config.h"
#include "layover/recovery_template.h"
#include "layover/schedule.h"
#include "layover/trip_lifecycle.h"

namespace layover {

struct persistence_port {
  persistence_port() = default;
  persistence_port(persistence_port const&) = delete;
  persistence_port& operator=(persistence_port const&) = delete;
  virtual ~persistence_port() = default;

  virtual void store(schedule const&) = 0;
};

namespace edit {

struct recovery {
  trip_nr_t trip_;
  std::string timepoint_;
  minutes_t minutes_;
};

struct add {
  add_trip_params params_;
};

struct end {
  trip_nr_t trip_;
  tp_idx_t idx_;
};

struct restore {
  trip_nr_t trip_;
};

struct remove {
  trip_nr_t trip_;
};

struct apply_template {
  std::string band_;
  recovery_template template_;
};

struct target_percentage {
  std::string band_;
  double pct_;
};

struct reassign_blocks {};

}  // namespace edit

using edit_t = std::variant<edit::recovery,
                            edit::add,
                            edit::end,
                            edit::restore,
                            edit::remove,
                            edit::apply_template,
                            edit::target_percentage,
                            edit::reassign_blocks>;

// Holds the current snapshot. Every committed edit that changes it is handed
// to the persistence port exactly once.
struct editor {
  explicit editor(schedule,
                  engine_config = {},
                  persistence_port* port = nullptr);

  // Returns true if the snapshot changed. Throws (snapshot unchanged) if
  // the edit is invalid.
  bool commit(edit_t const&);

  schedule const& current() const { return current_; }

  schedule current_;
  engine_config config_;
  persistence_port* port_;
  unsigned n_commits_{0U};
};

}  // namespace layover
