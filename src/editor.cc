#include "layover/editor.h"

#include "utl/overloaded.h"

#include "layover/block_assignment.h"
#include "layover/cascade.h"
#include "layover/logging.h"

namespace layover {

editor::editor(schedule s, engine_config c, persistence_port* port)
    : current_{std::move(s)}, config_{c}, port_{port} {}

bool editor::commit(edit_t const& e) {
  auto next = std::visit(
      utl::overloaded{
          [&](edit::recovery const& x) {
            return apply_recovery_edit(current_, x.trip_, x.timepoint_,
                                       x.minutes_, config_);
          },
          [&](edit::add const& x) {
            return add_trip(current_, x.params_, config_);
          },
          [&](edit::end const& x) {
            return end_trip(current_, x.trip_, x.idx_, config_);
          },
          [&](edit::restore const& x) {
            return restore_trip(current_, x.trip_, config_);
          },
          [&](edit::remove const& x) {
            return delete_trip(current_, x.trip_, config_);
          },
          [&](edit::apply_template const& x) {
            return apply_recovery_template(current_, x.band_, x.template_,
                                           config_);
          },
          [&](edit::target_percentage const& x) {
            return apply_target_recovery_percentage(current_, x.band_, x.pct_,
                                                    config_);
          },
          [&](edit::reassign_blocks const&) {
            return reassign_blocks_if_needed(current_, config_);
          }},
      e);

  if (next == current_) {
    log(log_lvl::debug, "layover.editor", "edit {}: no change", e.index());
    return false;
  }

  current_ = std::move(next);
  ++n_commits_;
  if (port_ != nullptr) {
    port_->store(current_);
  }
  return true;
}

}  // namespace layover
