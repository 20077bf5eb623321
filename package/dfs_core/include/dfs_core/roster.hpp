#pragma once

#include <string>
#include <utility>
#include <vector>

namespace dfs_core {

// One roster slot and the positions that may fill it. Slots that accept
// more than one position (FLEX, UTIL, G, F) are flex slots.
struct RosterSlot {
  std::string name;
  std::vector<std::string> positions;

  RosterSlot() = default;
  RosterSlot(std::string name_, std::vector<std::string> positions_)
      : name(std::move(name_)), positions(std::move(positions_)) {}

  bool is_flex() const { return positions.size() > 1; }

  bool accepts(const std::string &position) const {
    for (const auto &p : positions) {
      if (p == position)
        return true;
    }
    return false;
  }

  bool accepts_any(const std::vector<std::string> &player_positions) const {
    for (const auto &p : player_positions) {
      if (accepts(p))
        return true;
    }
    return false;
  }

  // True if every position this slot accepts is also accepted by `other`.
  bool subset_of(const RosterSlot &other) const {
    for (const auto &p : positions) {
      if (!other.accepts(p))
        return false;
    }
    return true;
  }
};

// Fixed slot list for a site/sport combination.
struct RosterSpec {
  std::string name;
  std::vector<RosterSlot> slots;
  int default_salary_cap{0};

  std::size_t size() const { return slots.size(); }

  // Throws ValidationError on an empty slot list or a slot with no positions.
  void validate() const;
};

RosterSpec dk_nfl_classic();
RosterSpec fd_nfl();
RosterSpec dk_nba_classic();

// Looks up a preset by name ("dk_nfl_classic", "fd_nfl", "dk_nba_classic").
RosterSpec roster_from_string(const std::string &name);

} // namespace dfs_core
