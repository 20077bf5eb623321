#include "dfs_core/roster.hpp"

#include <fmt/format.h>

#include "dfs_core/errors.hpp"

namespace dfs_core {

void RosterSpec::validate() const {
  if (slots.empty()) {
    throw ValidationError(fmt::format("roster '{}' has no slots", name));
  }
  for (std::size_t s = 0; s < slots.size(); ++s) {
    if (slots[s].positions.empty()) {
      throw ValidationError(fmt::format(
          "roster '{}' slot {} ({}) has no eligible positions", name, s,
          slots[s].name));
    }
  }
}

RosterSpec dk_nfl_classic() {
  RosterSpec r;
  r.name = "dk_nfl_classic";
  r.default_salary_cap = 50000;
  r.slots = {{"QB", {"QB"}},   {"RB", {"RB"}},
             {"RB", {"RB"}},   {"WR", {"WR"}},
             {"WR", {"WR"}},   {"WR", {"WR"}},
             {"TE", {"TE"}},   {"FLEX", {"RB", "WR", "TE"}},
             {"DST", {"DST"}}};
  return r;
}

RosterSpec fd_nfl() {
  RosterSpec r;
  r.name = "fd_nfl";
  r.default_salary_cap = 60000;
  r.slots = {{"QB", {"QB"}},   {"RB", {"RB"}},
             {"RB", {"RB"}},   {"WR", {"WR"}},
             {"WR", {"WR"}},   {"WR", {"WR"}},
             {"TE", {"TE"}},   {"FLEX", {"RB", "WR", "TE"}},
             {"D", {"D"}}};
  return r;
}

RosterSpec dk_nba_classic() {
  RosterSpec r;
  r.name = "dk_nba_classic";
  r.default_salary_cap = 50000;
  r.slots = {{"PG", {"PG"}},
             {"SG", {"SG"}},
             {"SF", {"SF"}},
             {"PF", {"PF"}},
             {"C", {"C"}},
             {"G", {"PG", "SG"}},
             {"F", {"SF", "PF"}},
             {"UTIL", {"PG", "SG", "SF", "PF", "C"}}};
  return r;
}

RosterSpec roster_from_string(const std::string &name) {
  if (name == "dk_nfl_classic")
    return dk_nfl_classic();
  if (name == "fd_nfl")
    return fd_nfl();
  if (name == "dk_nba_classic")
    return dk_nba_classic();
  throw ValidationError(fmt::format("unknown roster preset '{}'", name));
}

} // namespace dfs_core
