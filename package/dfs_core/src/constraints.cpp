#include "dfs_core/constraints.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

#include <fmt/format.h>

namespace dfs_core {

namespace {

std::size_t resolve_id(const PlayerPool &pool, const std::string &id,
                       const char *what) {
  if (!pool.has_id(id)) {
    throw ConstraintConfigError(
        fmt::format("{} references unknown player id {}", what, id));
  }
  return pool.index_of(id);
}

bool position_filter(const Player &p, const std::vector<std::string> &filter) {
  if (filter.empty())
    return true;
  for (const auto &pos : filter) {
    if (p.has_position(pos))
      return true;
  }
  return false;
}

ResolvedStack resolve_stack(const PlayerPool &pool, const StackRule &rule) {
  ResolvedStack rs;
  rs.name = rule.name;
  rs.min_count = rule.min_count;
  rs.max_count = rule.max_count;
  rs.bring_back_min = rule.bring_back_min;

  if (rule.min_count < 0) {
    throw ConstraintConfigError(
        fmt::format("stack '{}': min {} < 0", rule.name, rule.min_count));
  }
  if (rule.max_count != -1 && rule.max_count < rule.min_count) {
    throw ConstraintConfigError(fmt::format("stack '{}': min {} > max {}",
                                            rule.name, rule.min_count,
                                            rule.max_count));
  }
  if (rule.bring_back_min < 0) {
    throw ConstraintConfigError(fmt::format(
        "stack '{}': bring-back min {} < 0", rule.name, rule.bring_back_min));
  }

  std::set<std::string> opponents;
  if (!rule.player_ids.empty()) {
    std::set<std::size_t> uniq;
    for (const auto &id : rule.player_ids) {
      uniq.insert(resolve_id(pool, id, "stack rule"));
    }
    rs.group.assign(uniq.begin(), uniq.end());
  } else if (!rule.team.empty()) {
    for (std::size_t i = 0; i < pool.size(); ++i) {
      const Player &p = pool.at(i);
      if (p.team == rule.team && position_filter(p, rule.positions)) {
        rs.group.push_back(i);
      }
    }
  } else {
    throw ConstraintConfigError(fmt::format(
        "stack '{}' names neither players nor a team", rule.name));
  }
  if (rs.group.empty()) {
    throw ConstraintConfigError(
        fmt::format("stack '{}' matches no players", rule.name));
  }
  if (rule.min_count > static_cast<int>(rs.group.size())) {
    throw ConstraintConfigError(fmt::format(
        "stack '{}': min {} exceeds group size {}", rule.name, rule.min_count,
        rs.group.size()));
  }

  if (rule.bring_back_min > 0) {
    for (const std::size_t i : rs.group) {
      const Player &p = pool.at(i);
      if (!p.opponent.empty() && p.opponent != p.team)
        opponents.insert(p.opponent);
    }
    for (std::size_t i = 0; i < pool.size(); ++i) {
      const Player &p = pool.at(i);
      if (opponents.count(p.team) &&
          position_filter(p, rule.bring_back_positions)) {
        rs.bring_back.push_back(i);
      }
    }
    if (rule.bring_back_min > static_cast<int>(rs.bring_back.size())) {
      throw ConstraintConfigError(fmt::format(
          "stack '{}': bring-back min {} exceeds opposing group size {}",
          rule.name, rule.bring_back_min, rs.bring_back.size()));
    }
  }
  return rs;
}

int count_in(const std::vector<std::size_t> &group,
             const std::vector<char> &picked) {
  int c = 0;
  for (const std::size_t i : group) {
    if (picked[i])
      ++c;
  }
  return c;
}

} // namespace

ConstraintSet::ConstraintSet(const PlayerPool &pool, const RosterSpec &roster,
                             const Constraints &constraints)
    : pool_(&pool), roster_(roster), constraints_(constraints) {
  roster_.validate();
  const Constraints &c = constraints_;
  const int roster_size = static_cast<int>(roster_.size());
  if (c.salary_cap <= 0) {
    throw ConstraintConfigError(
        fmt::format("salary cap must be positive, got {}", c.salary_cap));
  }
  if (c.salary_floor < 0) {
    throw ConstraintConfigError(
        fmt::format("salary floor must be >= 0, got {}", c.salary_floor));
  }
  if (c.max_per_team == 0 || c.max_per_team < -1) {
    throw ConstraintConfigError(fmt::format(
        "max players per team must be >= 1 or -1, got {}", c.max_per_team));
  }
  if (c.min_games < 0) {
    throw ConstraintConfigError(
        fmt::format("min games must be >= 0, got {}", c.min_games));
  }
  if (c.min_unique < 0 || c.min_unique > roster_size) {
    throw ConstraintConfigError(fmt::format(
        "min unique players must be within [0, {}], got {}", roster_size,
        c.min_unique));
  }

  const std::size_t n = pool.size();
  locked_mask_.assign(n, 0);
  banned_mask_.assign(n, 0);
  for (std::size_t i = 0; i < n; ++i) {
    if (pool.at(i).locked)
      locked_mask_[i] = 1;
    if (pool.at(i).banned)
      banned_mask_[i] = 1;
  }
  for (const auto &id : c.locked_ids)
    locked_mask_[resolve_id(pool, id, "lock list")] = 1;
  for (const auto &id : c.banned_ids)
    banned_mask_[resolve_id(pool, id, "ban list")] = 1;
  for (std::size_t i = 0; i < n; ++i) {
    if (locked_mask_[i] && banned_mask_[i]) {
      throw ConstraintConfigError(fmt::format(
          "player {} is both locked and banned", pool.at(i).id));
    }
    if (locked_mask_[i])
      locked_.push_back(i);
  }
  if (static_cast<int>(locked_.size()) > roster_size) {
    throw ConstraintConfigError(fmt::format(
        "{} locked players exceed roster size {}", locked_.size(),
        roster_size));
  }

  for (const auto &rule : c.stacks) {
    stacks_.push_back(resolve_stack(pool, rule));
  }

  std::unordered_map<std::string, int> teams, games;
  team_id_.resize(n);
  game_id_.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    const Player &p = pool.at(i);
    auto t = teams.emplace(p.team, static_cast<int>(teams.size())).first;
    auto g = games.emplace(p.game_key(), static_cast<int>(games.size())).first;
    team_id_[i] = t->second;
    game_id_[i] = g->second;
  }
  n_teams_ = static_cast<int>(teams.size());
  n_games_ = static_cast<int>(games.size());
}

std::optional<InfeasibilityReason>
ConstraintSet::diagnose(const LineupCandidate &candidate,
                        const std::vector<Lineup> &prior) const {
  const PlayerPool &pool = *pool_;
  const std::size_t n = pool.size();
  const std::size_t roster_size = roster_.size();
  if (candidate.picks.size() > roster_size)
    return InfeasibilityReason::roster_size;

  std::vector<char> slot_used(roster_size, 0);
  std::vector<char> picked(n, 0);
  long long salary = 0;
  for (const auto &pick : candidate.picks) {
    if (pick.slot >= roster_size || pick.player >= n)
      return InfeasibilityReason::position;
    if (slot_used[pick.slot] || picked[pick.player])
      return InfeasibilityReason::position;
    const Player &p = pool.at(pick.player);
    if (!roster_.slots[pick.slot].accepts_any(p.positions))
      return InfeasibilityReason::position;
    if (banned_mask_[pick.player])
      return InfeasibilityReason::locks;
    slot_used[pick.slot] = 1;
    picked[pick.player] = 1;
    salary += p.salary;
  }
  const bool complete = candidate.picks.size() == roster_size;
  const int open = static_cast<int>(roster_size - candidate.picks.size());

  if (salary > constraints_.salary_cap)
    return InfeasibilityReason::salary_cap;
  if (complete && salary < constraints_.salary_floor)
    return InfeasibilityReason::salary_floor;

  if (constraints_.max_per_team > 0) {
    std::vector<int> per_team(static_cast<std::size_t>(n_teams_), 0);
    for (const auto &pick : candidate.picks) {
      if (++per_team[static_cast<std::size_t>(team_id_[pick.player])] >
          constraints_.max_per_team)
        return InfeasibilityReason::team_limit;
    }
  }

  int missing_locks = 0;
  for (const std::size_t i : locked_) {
    if (!picked[i])
      ++missing_locks;
  }
  if (missing_locks > open)
    return InfeasibilityReason::locks;

  for (const auto &s : stacks_) {
    const int in_group = count_in(s.group, picked);
    if (s.max_count >= 0 && in_group > s.max_count)
      return InfeasibilityReason::stack;
    if (in_group + open < s.min_count)
      return InfeasibilityReason::stack;
    if (s.bring_back_min > 0 &&
        count_in(s.bring_back, picked) + open < s.bring_back_min)
      return InfeasibilityReason::stack;
  }

  if (constraints_.min_games > 0) {
    std::set<int> games;
    for (const auto &pick : candidate.picks)
      games.insert(game_id_[pick.player]);
    if (static_cast<int>(games.size()) + open < constraints_.min_games)
      return InfeasibilityReason::games;
  }

  const int limit = max_shared();
  for (const auto &lu : prior) {
    int shared = 0;
    for (const auto &s : lu.slots) {
      if (s.pool_index < n && picked[s.pool_index])
        ++shared;
    }
    if (shared > limit)
      return InfeasibilityReason::uniqueness;
  }
  return std::nullopt;
}

bool ConstraintSet::is_feasible(const LineupCandidate &candidate,
                                const std::vector<Lineup> &prior) const {
  return !diagnose(candidate, prior).has_value();
}

} // namespace dfs_core
