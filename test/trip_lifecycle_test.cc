#include "gtest/gtest.h"

#include "layover/tail_recovery.h"
#include "layover/trip_lifecycle.h"

#include "./util.h"

using namespace layover;
using namespace layover::test;

namespace {

// Block 1: 06:00, 06:40, 07:20. Block 2: 06:20, 07:00.
schedule five_trips() {
  return enforce_tail_recovery(make_schedule(
      timepoints({"A", "B", "C"}),
      {chain_trip(1U, 1U, "06:00", {20, 15}, {0, 0, 5}),
       chain_trip(2U, 2U, "06:20", {20, 15}, {0, 0, 5}),
       chain_trip(3U, 1U, "06:40", {20, 15}, {0, 0, 5}),
       chain_trip(4U, 2U, "07:00", {20, 15}, {0, 0, 5}),
       chain_trip(5U, 1U, "07:20", {20, 15}, {0, 0, 5})}));
}

}  // namespace

TEST(trip_lifecycle, delete_renumbers) {
  auto const s = five_trips();
  expect_consistent(s);

  auto const out = delete_trip(s, trip_nr_t{2U});

  ASSERT_EQ(4U, out.trips_.size());
  for (auto i = 0U; i != out.trips_.size(); ++i) {
    EXPECT_EQ(trip_nr_t{i + 1U}, out.trips_[i]->nr_);
    if (i != 0U) {
      EXPECT_LE(*out.trips_[i - 1U]->departure_, *out.trips_[i]->departure_);
    }
  }
  EXPECT_EQ(hm("07:00"), out.trips_[2]->departure_);
}

TEST(trip_lifecycle, delete_last_of_block) {
  auto const out = delete_trip(five_trips(), trip_nr_t{5U});

  // Trip 3 is now last in block 1 and hands its recovery to the stash.
  auto const& t = *out.trips_[2];
  EXPECT_EQ(block_nr_t{1U}, t.block_);
  EXPECT_TRUE(is_all_zero(t.recovery_));
  EXPECT_EQ(rec({0, 0, 5}), t.hidden_tail_recovery_);
  expect_consistent(out);
}

TEST(trip_lifecycle, delete_unknown) {
  auto const s = five_trips();
  EXPECT_EQ(s, delete_trip(s, trip_nr_t{42U}));
}

TEST(trip_lifecycle, end_and_restore) {
  auto const s = five_trips();

  auto const ended = end_trip(s, trip_nr_t{1U}, 1U);

  // Later trips of block 1 are cancelled.
  ASSERT_EQ(3U, ended.trips_.size());
  auto const& t = *ended.trips_[0];
  ASSERT_TRUE(t.is_truncated());
  EXPECT_EQ(1U, *t.end_idx_);
  EXPECT_FALSE(t.arrival_[2].has_value());
  EXPECT_FALSE(t.departure_times_[2].has_value());
  EXPECT_EQ(hm("06:20"), t.last_active_departure());
  EXPECT_TRUE(t.original_arrival_.has_value());
  EXPECT_EQ(hm("06:35"), (*t.original_arrival_)[2]);
  expect_consistent(ended);

  auto const restored = restore_trip(ended, trip_nr_t{1U});
  auto const& r = *restored.trips_[0];
  EXPECT_FALSE(r.is_truncated());
  EXPECT_FALSE(r.original_arrival_.has_value());
  EXPECT_FALSE(r.original_departure_.has_value());
  EXPECT_FALSE(r.original_recovery_.has_value());
  EXPECT_EQ(hm("06:35"), r.arrival_[2]);

  // Last in its block again: recovery goes to the stash.
  EXPECT_TRUE(is_all_zero(r.recovery_));
  EXPECT_EQ(rec({0, 0, 5}), r.hidden_tail_recovery_);
  EXPECT_EQ(3U, restored.trips_.size());
  expect_consistent(restored);
}

TEST(trip_lifecycle, restore_rechains_added_trip) {
  auto const ended = end_trip(five_trips(), trip_nr_t{1U}, 1U);
  auto const extended =
      add_trip(ended, {.mode_ = add_mode::kAfterLast,
                       .anchor_ = trip_nr_t{1U},
                       .service_band_ = "Standard Service",
                       .recovery_template_ = rec({0, 0, 5})});
  ASSERT_EQ(4U, extended.trips_.size());
  expect_consistent(extended);

  auto const restored = restore_trip(extended, trip_nr_t{1U});

  // The trip appended after the cut now follows the restored end.
  auto const blocks = restored.blocks();
  auto const& order = blocks.at(block_nr_t{1U});
  ASSERT_EQ(2U, order.size());
  auto const& first = *restored.trips_[order[0]];
  auto const& added = *restored.trips_[order[1]];
  EXPECT_FALSE(first.is_truncated());
  EXPECT_EQ(hm("06:40"), first.last_active_departure());
  EXPECT_EQ(hm("06:40"), added.departure_);
  expect_consistent(restored);
}

TEST(trip_lifecycle, end_twice_keeps_first_backup) {
  auto const once = end_trip(five_trips(), trip_nr_t{1U}, 1U);
  auto const twice = end_trip(once, trip_nr_t{1U}, 0U);

  auto const& t = *twice.trips_[0];
  EXPECT_EQ(0U, *t.end_idx_);
  EXPECT_EQ(hm("06:35"), (*t.original_arrival_)[2]);
}

TEST(trip_lifecycle, restore_without_backup) {
  auto t = chain_trip(1U, 1U, "06:00", {20}, {0, 0});
  t.end_idx_ = 0U;
  auto const s = make_schedule(timepoints({"A", "B"}), {std::move(t)});

  EXPECT_THROW(restore_trip(s, trip_nr_t{1U}), std::exception);
}

TEST(trip_lifecycle, restore_untruncated) {
  auto const s = five_trips();
  EXPECT_EQ(s, restore_trip(s, trip_nr_t{3U}));
}

TEST(trip_lifecycle, add_after_last) {
  auto const s = enforce_tail_recovery(make_schedule(
      timepoints({"A", "B"}), {chain_trip(1U, 1U, "06:00", {20}, {0, 3})}));
  ASSERT_EQ(hm("06:20"), s.trips_[0]->last_active_departure());

  auto const out = add_trip(
      s, {.mode_ = add_mode::kAfterLast,
          .anchor_ = trip_nr_t{1U},
          .service_band_ = "Standard Service",
          .recovery_template_ = rec({0, 4})});

  ASSERT_EQ(2U, out.trips_.size());
  auto const& first = *out.trips_[0];
  auto const& added = *out.trips_[1];

  // The former tail gets its recovery back, the new trip follows it.
  EXPECT_EQ(rec({0, 3}), first.recovery_);
  EXPECT_FALSE(first.hidden_tail_recovery_.has_value());
  EXPECT_EQ(hm("06:23"), first.last_active_departure());

  EXPECT_EQ(trip_nr_t{2U}, added.nr_);
  EXPECT_EQ(block_nr_t{1U}, added.block_);
  EXPECT_EQ(hm("06:23"), added.departure_);
  EXPECT_EQ(hm("06:33"), added.arrival_[1]);
  EXPECT_EQ(hm("06:33"), added.departure_times_[1]);
  EXPECT_EQ(rec({0, 4}), added.hidden_tail_recovery_);
  EXPECT_EQ("Standard Service", added.service_band_);
  expect_consistent(out);
}

TEST(trip_lifecycle, add_early) {
  auto const s = make_schedule(timepoints({"A", "B"}),
                               {chain_trip(1U, 1U, "08:00", {20}, {0, 0})});

  auto const out = add_trip(s, {.mode_ = add_mode::kEarly,
                                .anchor_ = trip_nr_t{1U},
                                .start_ = hm("07:30"),
                                .recovery_template_ = rec({0, 5})});

  ASSERT_EQ(2U, out.trips_.size());
  auto const& early = *out.trips_[0];
  EXPECT_EQ(hm("07:30"), early.departure_);
  EXPECT_EQ(hm("07:55"), early.arrival_[1]);
  EXPECT_EQ(hm("08:00"), early.departure_times_[1]);
  EXPECT_EQ(block_nr_t{1U}, early.block_);
  EXPECT_EQ("Fastest Service", early.service_band_);
  EXPECT_EQ(trip_nr_t{2U}, out.trips_[1]->nr_);
  expect_consistent(out);
}

TEST(trip_lifecycle, add_mid_route) {
  auto const s = five_trips();

  auto const out = add_trip(s, {.mode_ = add_mode::kMidRoute,
                                .start_ = hm("10:00"),
                                .target_end_ = hm("10:40"),
                                .service_band_ = "Fast Service",
                                .recovery_template_ = rec({0, 2, 3})});

  ASSERT_EQ(6U, out.trips_.size());
  auto const& t = *out.trips_.back();
  EXPECT_EQ(block_nr_t{3U}, t.block_);
  EXPECT_EQ(trip_nr_t{6U}, t.nr_);
  EXPECT_EQ(hm("10:00"), t.departure_);
  EXPECT_EQ(hm("10:17"), t.arrival_[1]);

  // Alone in its block: recovery stashed.
  EXPECT_EQ(rec({0, 2, 3}), t.hidden_tail_recovery_);
  expect_consistent(out);
}

TEST(trip_lifecycle, add_target_end_exact) {
  auto const s = make_schedule(
      timepoints({"A", "B", "C"}),
      {chain_trip(1U, 1U, "08:00", {20, 20}, {0, 0, 0})});

  auto const out = add_trip(s, {.mode_ = add_mode::kEarly,
                                .anchor_ = trip_nr_t{1U},
                                .start_ = hm("07:00"),
                                .recovery_template_ = rec({0, 2, 3})});

  auto const& early = *out.trips_[0];
  // (60 - 5) / 2 = 27 per segment, last departure forced to 08:00.
  EXPECT_EQ(hm("07:27"), early.arrival_[1]);
  EXPECT_EQ(hm("07:29"), early.departure_times_[1]);
  EXPECT_EQ(hm("07:57"), early.arrival_[2]);
  EXPECT_EQ(hm("08:00"), early.departure_times_[2]);
  expect_consistent(out);
}

TEST(trip_lifecycle, add_invalid) {
  auto const s = five_trips();

  EXPECT_THROW(add_trip(s, {.mode_ = add_mode::kMidRoute,
                            .start_ = hm("10:00")}),
               std::exception);
  EXPECT_THROW(add_trip(s, {.mode_ = add_mode::kMidRoute,
                            .start_ = hm("10:00"),
                            .target_end_ = hm("09:00")}),
               std::exception);
  EXPECT_THROW(add_trip(s, {.mode_ = add_mode::kAfterLast}), std::exception);
}

TEST(trip_lifecycle, add_unknown_anchor) {
  auto const s = five_trips();
  EXPECT_EQ(s, add_trip(s, {.mode_ = add_mode::kAfterLast,
                            .anchor_ = trip_nr_t{99U}}));
}

TEST(trip_lifecycle, lowest_unused_block) {
  auto const s = make_schedule(
      timepoints({"A", "B"}), {chain_trip(1U, 1U, "06:00", {20}, {0, 0}),
                               chain_trip(2U, 3U, "06:10", {20}, {0, 0})});
  EXPECT_EQ(block_nr_t{2U}, lowest_unused_block(s));
}
