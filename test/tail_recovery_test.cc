#include "gtest/gtest.h"

#include "layover/tail_recovery.h"

#include "./util.h"

using namespace layover;
using namespace layover::test;

TEST(tail_recovery, last_trip_is_zeroed) {
  auto const s = make_schedule(
      timepoints({"A", "B", "C"}),
      {chain_trip(1U, 1U, "06:00", {20, 15}, {0, 2, 5}),
       chain_trip(2U, 1U, "06:42", {20, 15}, {0, 3, 4})});

  auto const out = enforce_tail_recovery(s);

  // Not last: untouched.
  EXPECT_EQ(s.trips_[0].get(), out.trips_[0].get());

  auto const& last = *out.trips_[1];
  EXPECT_TRUE(is_all_zero(last.recovery_));
  EXPECT_EQ(minutes_t{0}, last.recovery_minutes_);
  ASSERT_TRUE(last.hidden_tail_recovery_.has_value());
  EXPECT_EQ(rec({0, 3, 4}), *last.hidden_tail_recovery_);

  // Times collapsed: departure = arrival everywhere.
  EXPECT_EQ(hm("07:02"), last.arrival_[1]);
  EXPECT_EQ(hm("07:02"), last.departure_times_[1]);
  EXPECT_EQ(hm("07:17"), last.arrival_[2]);
  EXPECT_EQ(hm("07:17"), last.departure_times_[2]);
  EXPECT_EQ(hm("06:42"), last.departure_);

  expect_consistent(out);
}

TEST(tail_recovery, idempotent) {
  auto const s = make_schedule(
      timepoints({"A", "B"}),
      {chain_trip(1U, 1U, "06:00", {20}, {0, 3}),
       chain_trip(2U, 2U, "06:10", {20}, {0, 4}),
       chain_trip(3U, 1U, "06:23", {20}, {0, 5})});

  auto const once = enforce_tail_recovery(s);
  auto const twice = enforce_tail_recovery(once);

  EXPECT_EQ(once, twice);
  ASSERT_EQ(once.trips_.size(), twice.trips_.size());
  for (auto i = 0U; i != once.trips_.size(); ++i) {
    EXPECT_EQ(once.trips_[i].get(), twice.trips_[i].get());
  }
  expect_consistent(twice);
}

TEST(tail_recovery, restores_stash_when_no_longer_last) {
  auto t1 = chain_trip(1U, 1U, "06:00", {20}, {0, 0});
  t1.hidden_tail_recovery_ = rec({0, 3});
  auto const s = make_schedule(timepoints({"A", "B"}),
                               {std::move(t1),
                                chain_trip(2U, 1U, "06:20", {10}, {0, 0})});

  auto const out = enforce_tail_recovery(s);

  auto const& first = *out.trips_[0];
  EXPECT_FALSE(first.hidden_tail_recovery_.has_value());
  EXPECT_EQ(rec({0, 3}), first.recovery_);
  EXPECT_EQ(minutes_t{3}, first.recovery_minutes_);
  EXPECT_EQ(hm("06:23"), first.departure_times_[1]);

  // Chain kept.
  auto const& second = *out.trips_[1];
  EXPECT_EQ(hm("06:23"), second.departure_);
  EXPECT_EQ(hm("06:33"), second.arrival_[1]);

  expect_consistent(out);
}

TEST(tail_recovery, zero_stash_is_cleared) {
  auto t1 = chain_trip(1U, 1U, "06:00", {20}, {0, 0});
  t1.hidden_tail_recovery_ = rec({0, 0});
  auto const s = make_schedule(timepoints({"A", "B"}),
                               {std::move(t1),
                                chain_trip(2U, 1U, "06:20", {10}, {0, 0})});

  auto const out = enforce_tail_recovery(s);

  // Only the stash goes away, times and the untouched tail stay as they are.
  EXPECT_FALSE(out.trips_[0]->hidden_tail_recovery_.has_value());
  EXPECT_EQ(s.trips_[0]->departure_times_, out.trips_[0]->departure_times_);
  EXPECT_EQ(s.trips_[1].get(), out.trips_[1].get());

  auto const again = enforce_tail_recovery(out);
  EXPECT_EQ(out.trips_[0].get(), again.trips_[0].get());
  EXPECT_EQ(out.trips_[1].get(), again.trips_[1].get());
}

TEST(tail_recovery, merges_into_existing_stash) {
  auto t = chain_trip(1U, 1U, "06:00", {20, 10}, {0, 0, 6});
  t.hidden_tail_recovery_ = rec({0, 2, 1});
  auto const s = make_schedule(timepoints({"A", "B", "C"}), {std::move(t)});

  auto const out = enforce_tail_recovery(s);
  EXPECT_EQ(rec({0, 2, 6}), out.trips_[0]->hidden_tail_recovery_);
  EXPECT_TRUE(is_all_zero(out.trips_[0]->recovery_));
  EXPECT_EQ(hm("06:30"), out.trips_[0]->departure_times_[2]);
}
