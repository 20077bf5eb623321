#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace dfs_core {

// One filled roster slot. Carries slot name and player id so a downstream
// site formatter never has to re-derive the assignment.
struct SlotAssignment {
  std::string slot_name;
  std::size_t slot_index{0};
  std::string player_id;
  std::size_t pool_index{0};
};

struct Lineup {
  std::string id;
  int generation_index{-1};
  std::vector<SlotAssignment> slots; // roster order
  int total_salary{0};
  double total_projection{0.0};
  double objective_value{0.0};
  bool proven_optimal{true};
  std::string stack_label;

  // Pool indices, sorted ascending.
  std::vector<std::size_t> player_indices() const {
    std::vector<std::size_t> out;
    out.reserve(slots.size());
    for (const auto &s : slots)
      out.push_back(s.pool_index);
    std::sort(out.begin(), out.end());
    return out;
  }

  std::vector<std::string> player_ids() const {
    std::vector<std::string> out;
    out.reserve(slots.size());
    for (const auto &s : slots)
      out.push_back(s.player_id);
    return out;
  }

  bool contains(std::size_t pool_index) const {
    for (const auto &s : slots) {
      if (s.pool_index == pool_index)
        return true;
    }
    return false;
  }
};

inline int shared_players(const Lineup &a, const Lineup &b) {
  int shared = 0;
  for (const auto &s : a.slots) {
    if (b.contains(s.pool_index))
      ++shared;
  }
  return shared;
}

} // namespace dfs_core
