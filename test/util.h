#pragma once

#include <initializer_list>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"

#include "layover/common/parse_time.h"
#include "layover/schedule.h"
#include "layover/validate.h"

namespace layover::test {

inline minutes_t hm(std::string_view s) { return *parse_time(s); }

inline std::vector<timepoint> timepoints(
    std::initializer_list<char const*> ids) {
  auto tps = std::vector<timepoint>{};
  for (auto const id : ids) {
    tps.push_back({.id_ = id,
                   .name_ = std::string{"Stop "} + id,
                   .sequence_ = static_cast<unsigned>(tps.size())});
  }
  return tps;
}

// Trip starting at `start`, travel minutes per segment and recovery minutes
// per timepoint.
inline trip chain_trip(unsigned const nr,
                       unsigned const block,
                       std::string_view start,
                       std::initializer_list<int> travel,
                       std::initializer_list<int> recovery,
                       std::string band = "Standard Service") {
  auto rec = recovery_vec{};
  for (auto const r : recovery) {
    rec.emplace_back(r);
  }
  rec.resize(travel.size() + 1U, minutes_t{0});

  auto arrival = time_vec{};
  auto t = hm(start);
  arrival.emplace_back(t);
  auto i = 1U;
  for (auto const x : travel) {
    arrival.emplace_back(t + minutes_t{x});
    t = *arrival.back() + rec[i++];
  }

  return make_trip(trip_nr_t{nr}, block_nr_t{block}, std::move(arrival),
                   std::move(rec), std::move(band));
}

inline recovery_vec rec(std::initializer_list<int> l) {
  auto v = recovery_vec{};
  for (auto const x : l) {
    v.emplace_back(x);
  }
  return v;
}

inline void expect_consistent(schedule const& s) {
  for (auto const& i : validate(s)) {
    ADD_FAILURE() << "trip " << i.trip_.v_ << ": " << i.msg_;
  }
}

}  // namespace layover::test
