#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "fmt/core.h"
#include "fmt/ostream.h"

namespace layover {

enum class log_lvl { debug, info, warn, error };

constexpr char const* to_str(log_lvl const lvl) {
  switch (lvl) {
    case log_lvl::debug: return "debug";
    case log_lvl::info: return "info";
    case log_lvl::warn: return "warn";
    case log_lvl::error: return "error";
  }
  return "";
}

inline log_lvl s_verbosity{log_lvl::info};

inline std::string now() {
  using clock = std::chrono::system_clock;
  auto const now = clock::to_time_t(clock::now());
  struct tm tmp {};
#if _MSC_VER >= 1400
  gmtime_s(&tmp, &now);
#else
  gmtime_r(&now, &tmp);
#endif

  std::stringstream ss;
  ss << std::put_time(&tmp, "%FT%TZ");
  return ss.str();
}

#ifndef LAYOVER_LOG_HEADER
template <typename... Args>
void log(log_lvl const lvl,
         char const* ctx,
         fmt::format_string<Args...> fmt_str,
         Args&&... args) {
  if (lvl >= ::layover::s_verbosity) {
    fmt::print(
        std::clog, "{time} | [{lvl}][{ctx:30}] {msg}\n",
        fmt::arg("time", now()), fmt::arg("lvl", to_str(lvl)),
        fmt::arg("ctx", ctx),
        fmt::arg("msg", fmt::format(fmt_str, std::forward<Args>(args)...)));
  }
}
#else
#include LAYOVER_LOG_HEADER
#endif

}  // namespace layover
