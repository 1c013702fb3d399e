#include "layover/common/parse_time.h"

#include <algorithm>

#include "fmt/format.h"

#include "utl/parser/arg_parser.h"
#include "utl/parser/cstr.h"

#include "layover/logging.h"

namespace layover {

namespace {

constexpr auto const kMaxHours = 48;

bool is_number(utl::cstr s, std::size_t const max_digits) {
  if (s.empty() || s.len > max_digits) {
    return false;
  }
  auto const v = s.view();
  return std::all_of(begin(v), end(v),
                     [](char const c) { return c >= '0' && c <= '9'; });
}

}  // namespace

std::optional<minutes_t> parse_time(std::string_view str) {
  auto const s = utl::cstr{str.data(), str.size()}.trim();
  if (s.empty() || s.view() == "-" || s.view() == "--") {
    return std::nullopt;
  }

  auto const invalid = [&](char const* reason) -> std::optional<minutes_t> {
    log(log_lvl::warn, "layover.parse_time", "{} time \"{}\"", reason,
        s.view());
    return std::nullopt;
  };

  auto const colon = s.view().find(':');
  if (colon == std::string_view::npos) {
    return invalid("malformed");
  }

  auto const hh = s.substr(0U, utl::size{colon});
  auto const mm = s.substr(colon + 1U);
  if (!is_number(hh, 2U) || !is_number(mm, 2U)) {
    return invalid("malformed");
  }

  auto const hours = utl::parse<int>(hh);
  auto const minutes = utl::parse<int>(mm);
  if (hours > kMaxHours || minutes > 59) {
    return invalid("out of range");
  }

  return minutes_t{hours * 60 + minutes};
}

std::string format_time(minutes_t const t) {
  if (t.count() < 0) {
    return "00:00";
  }
  return fmt::format("{:02}:{:02}", t.count() / 60, t.count() % 60);
}

std::string format_time(std::optional<minutes_t> const& t) {
  return t.has_value() ? format_time(*t) : "--:--";
}

std::string add_minutes(std::string_view time, int const delta) {
  auto const t = parse_time(time);
  if (!t.has_value()) {
    return std::string{time};
  }
  return format_time(*t + minutes_t{delta});
}

minutes_t time_difference(minutes_t const a, minutes_t const b) {
  auto diff = b - a;
  if (diff < minutes_t{0}) {
    diff += kMinutesPerDay;
  }
  return diff;
}

minutes_t period_start(minutes_t const t) {
  auto const n = kPeriodLength.count();
  auto const c = t.count();
  return minutes_t{(c >= 0 ? c / n : (c - n + 1) / n) * n};
}

std::optional<interval<minutes_t>> parse_time_period(std::string_view s) {
  auto const sep = s.find('-');
  if (sep == std::string_view::npos) {
    return std::nullopt;
  }

  auto const from = parse_time(s.substr(0U, sep));
  auto to = parse_time(s.substr(sep + 1U));
  if (!from.has_value() || !to.has_value()) {
    return std::nullopt;
  }

  if (to->count() % 30 == 29) {
    *to += minutes_t{1};
  }
  return interval<minutes_t>{*from, *to};
}

std::optional<minutes_t> shift(std::optional<minutes_t> const& t,
                               minutes_t const delta) {
  return t.has_value() ? std::optional{*t + delta} : std::nullopt;
}

}  // namespace layover
