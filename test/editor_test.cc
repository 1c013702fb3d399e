#include "gtest/gtest.h"

#include "layover/editor.h"
#include "layover/tail_recovery.h"

#include "./util.h"

using namespace layover;
using namespace layover::test;

namespace {

struct counting_port : public persistence_port {
  void store(schedule const& s) override {
    ++n_stored_;
    last_ = s;
  }

  unsigned n_stored_{0U};
  schedule last_;
};

schedule block_pair() {
  return enforce_tail_recovery(make_schedule(
      timepoints({"A", "B"}), {chain_trip(1U, 1U, "06:00", {20}, {0, 5}),
                               chain_trip(2U, 1U, "06:25", {20}, {0, 0})}));
}

}  // namespace

TEST(editor, stores_each_change_once) {
  auto port = counting_port{};
  auto e = editor{block_pair(), {}, &port};

  EXPECT_TRUE(e.commit(edit::recovery{.trip_ = trip_nr_t{1U},
                                      .timepoint_ = "B",
                                      .minutes_ = minutes_t{10}}));
  EXPECT_EQ(1U, port.n_stored_);
  EXPECT_EQ(e.current(), port.last_);
  EXPECT_EQ(hm("06:30"), e.current().trips_[1]->departure_);

  EXPECT_TRUE(e.commit(edit::remove{.trip_ = trip_nr_t{2U}}));
  EXPECT_EQ(2U, port.n_stored_);
  EXPECT_EQ(1U, e.current().trips_.size());
}

TEST(editor, no_store_without_change) {
  auto port = counting_port{};
  auto e = editor{block_pair(), {}, &port};

  EXPECT_FALSE(e.commit(edit::recovery{.trip_ = trip_nr_t{9U},
                                       .timepoint_ = "B",
                                       .minutes_ = minutes_t{10}}));
  EXPECT_FALSE(e.commit(edit::restore{.trip_ = trip_nr_t{1U}}));
  EXPECT_FALSE(e.commit(edit::reassign_blocks{}));
  EXPECT_EQ(0U, port.n_stored_);
  EXPECT_EQ(0U, e.n_commits_);
}

TEST(editor, failed_edit_keeps_snapshot) {
  auto port = counting_port{};
  auto const initial = block_pair();
  auto e = editor{initial, {}, &port};

  EXPECT_THROW(
      e.commit(edit::add{.params_ = {.mode_ = add_mode::kMidRoute,
                                     .start_ = hm("10:00")}}),
      std::exception);
  EXPECT_EQ(initial, e.current());
  EXPECT_EQ(0U, port.n_stored_);
}

TEST(editor, end_restore_round_trip) {
  auto e = editor{block_pair()};

  EXPECT_TRUE(e.commit(edit::end{.trip_ = trip_nr_t{1U}, .idx_ = 0U}));
  EXPECT_EQ(1U, e.current().trips_.size());
  EXPECT_TRUE(e.current().trips_[0]->is_truncated());

  EXPECT_TRUE(e.commit(edit::restore{.trip_ = trip_nr_t{1U}}));
  EXPECT_FALSE(e.current().trips_[0]->is_truncated());
  expect_consistent(e.current());
}

TEST(editor, templates) {
  auto e = editor{block_pair()};

  EXPECT_TRUE(e.commit(edit::apply_template{.band_ = "Standard Service",
                                            .template_ = rec({0, 8})}));
  EXPECT_EQ(hm("06:28"), e.current().trips_[1]->departure_);

  // No travel minutes known for the band.
  EXPECT_FALSE(e.commit(
      edit::target_percentage{.band_ = "Standard Service", .pct_ = 20.0}));
}
