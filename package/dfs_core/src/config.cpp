#include "dfs_core/config.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace dfs_core {

namespace {

std::string lowered(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace

Objective objective_from_string(const std::string &name) {
  const std::string n = lowered(name);
  if (n == "projection")
    return Objective::projection;
  if (n == "ev")
    return Objective::ev;
  if (n == "ceiling")
    return Objective::ceiling;
  throw ValidationError(fmt::format(
      "unknown objective '{}' (expected projection, ev or ceiling)", name));
}

DistributionMode distribution_from_string(const std::string &name) {
  const std::string n = lowered(name);
  if (n == "normal")
    return DistributionMode::normal;
  if (n == "lognormal")
    return DistributionMode::lognormal;
  if (n == "empirical")
    return DistributionMode::empirical;
  throw ValidationError(fmt::format(
      "unknown distribution mode '{}' (expected normal, lognormal or "
      "empirical)",
      name));
}

ContestType contest_from_string(const std::string &name) {
  const std::string n = lowered(name);
  if (n == "cash")
    return ContestType::cash;
  if (n == "gpp")
    return ContestType::gpp;
  throw ValidationError(
      fmt::format("unknown contest type '{}' (expected cash or gpp)", name));
}

Sport sport_from_string(const std::string &name) {
  const std::string n = lowered(name);
  if (n == "nfl")
    return Sport::nfl;
  if (n == "nba")
    return Sport::nba;
  throw ValidationError(
      fmt::format("unknown sport '{}' (expected nfl or nba)", name));
}

LogLevel log_level_from_string(const std::string &name) {
  const std::string n = lowered(name);
  if (n == "off")
    return LogLevel::off;
  if (n == "error")
    return LogLevel::error;
  if (n == "warn")
    return LogLevel::warn;
  if (n == "info")
    return LogLevel::info;
  if (n == "debug")
    return LogLevel::debug;
  throw ValidationError(fmt::format("unknown log level '{}'", name));
}

const char *to_string(Objective o) {
  switch (o) {
  case Objective::projection:
    return "projection";
  case Objective::ev:
    return "ev";
  case Objective::ceiling:
    return "ceiling";
  }
  return "projection";
}

const char *to_string(DistributionMode d) {
  switch (d) {
  case DistributionMode::normal:
    return "normal";
  case DistributionMode::lognormal:
    return "lognormal";
  case DistributionMode::empirical:
    return "empirical";
  }
  return "normal";
}

const char *to_string(ContestType c) {
  return c == ContestType::cash ? "cash" : "gpp";
}

const char *to_string(Sport s) { return s == Sport::nfl ? "nfl" : "nba"; }

} // namespace dfs_core
