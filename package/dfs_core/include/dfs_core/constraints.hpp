#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dfs_core/errors.hpp"
#include "dfs_core/lineup.hpp"
#include "dfs_core/player.hpp"
#include "dfs_core/roster.hpp"

namespace dfs_core {

// Players that must appear together. The group is either an explicit id list
// or a team (optionally filtered by positions). A bring-back asks for
// players from the group's opposing team.
struct StackRule {
  std::string name;
  std::vector<std::string> player_ids;
  std::string team;
  std::vector<std::string> positions;
  int min_count{0};
  int max_count{-1}; // -1: no upper bound
  int bring_back_min{0};
  std::vector<std::string> bring_back_positions;
};

struct Constraints {
  int salary_cap{50000};
  int salary_floor{0};   // 0: none
  int max_per_team{-1};  // -1: no limit
  int min_games{0};
  int min_unique{1};     // U: min players differing between two lineups
  std::vector<std::string> locked_ids;
  std::vector<std::string> banned_ids;
  std::vector<StackRule> stacks;
};

struct ResolvedStack {
  std::string name;
  std::vector<std::size_t> group;
  int min_count{0};
  int max_count{-1};
  std::vector<std::size_t> bring_back;
  int bring_back_min{0};
};

// (slot index, pool index) pairs; may cover only part of the roster.
struct SlotPick {
  std::size_t slot{0};
  std::size_t player{0};
};

struct LineupCandidate {
  std::vector<SlotPick> picks;
};

// Roster construction rules resolved against a pool and roster. The pool
// must outlive the set.
class ConstraintSet {
public:
  // Throws ConstraintConfigError for malformed definitions.
  ConstraintSet(const PlayerPool &pool, const RosterSpec &roster,
                const Constraints &constraints);

  // Complete candidates are checked against every rule; partial ones against
  // rules already violated plus whether locks, stacks and games can still be
  // met with the open slots.
  bool is_feasible(const LineupCandidate &candidate,
                   const std::vector<Lineup> &prior = {}) const;

  // First violated rule class, or nullopt when feasible.
  std::optional<InfeasibilityReason>
  diagnose(const LineupCandidate &candidate,
           const std::vector<Lineup> &prior = {}) const;

  const PlayerPool &pool() const { return *pool_; }
  const RosterSpec &roster() const { return roster_; }
  const Constraints &constraints() const { return constraints_; }
  std::size_t roster_size() const { return roster_.size(); }

  const std::vector<std::size_t> &locked() const { return locked_; }
  bool is_locked(std::size_t i) const { return locked_mask_.at(i) != 0; }
  bool is_banned(std::size_t i) const { return banned_mask_.at(i) != 0; }
  const std::vector<ResolvedStack> &stacks() const { return stacks_; }

  int team_of(std::size_t i) const { return team_id_.at(i); }
  int game_of(std::size_t i) const { return game_id_.at(i); }
  int n_teams() const { return n_teams_; }
  int n_games() const { return n_games_; }

  // Most players a lineup may share with any earlier lineup of the batch.
  int max_shared() const {
    return static_cast<int>(roster_.size()) - constraints_.min_unique;
  }

private:
  const PlayerPool *pool_{nullptr};
  RosterSpec roster_;
  Constraints constraints_;
  std::vector<std::size_t> locked_;
  std::vector<char> locked_mask_;
  std::vector<char> banned_mask_;
  std::vector<ResolvedStack> stacks_;
  std::vector<int> team_id_;
  std::vector<int> game_id_;
  int n_teams_{0};
  int n_games_{0};
};

} // namespace dfs_core
