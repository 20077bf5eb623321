#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "dfs_core/roster.hpp"

namespace dfs_core {

struct Player {
  // Data members
  std::string id;
  std::string name;
  std::vector<std::string> positions;
  std::string team;
  std::string opponent;
  std::string game_id; // empty: derived from team/opponent
  int salary{0};
  double projection{0.0};
  // NaN means "not provided"; see effective_* accessors.
  double floor{std::numeric_limits<double>::quiet_NaN()};
  double ceiling{std::numeric_limits<double>::quiet_NaN()};
  double stdev{std::numeric_limits<double>::quiet_NaN()};
  double volatility{0.4};
  double ownership{0.0}; // 0-1
  bool locked{false};
  bool banned{false};
  // Historical or modelled outcomes for the empirical marginal.
  std::vector<double> outcome_samples;

  // Default constructor
  Player() = default;
  // Constructor with parameters
  Player(std::string id_, std::string name_,
         std::vector<std::string> positions_, std::string team_,
         std::string opponent_, int salary_, double projection_)
      : id(std::move(id_)), name(std::move(name_)),
        positions(std::move(positions_)), team(std::move(team_)),
        opponent(std::move(opponent_)), salary(salary_),
        projection(projection_) {}

  bool has_position(const std::string &pos) const {
    for (const auto &p : positions) {
      if (p == pos)
        return true;
    }
    return false;
  }

  double effective_stdev() const {
    if (!std::isnan(stdev))
      return stdev;
    return std::max(0.0, projection * volatility);
  }

  double effective_floor() const {
    return std::isnan(floor) ? 0.6 * projection : floor;
  }

  double effective_ceiling() const {
    return std::isnan(ceiling) ? 1.8 * projection : ceiling;
  }

  // Games are keyed by the sorted team pair so both sides share one key.
  std::string game_key() const {
    if (!game_id.empty())
      return game_id;
    if (opponent.empty())
      return team;
    return team < opponent ? team + "@" + opponent : opponent + "@" + team;
  }
};

// Validated, read-only player universe for one optimization run.
class PlayerPool {
public:
  PlayerPool() = default;

  // Validates every player; throws ValidationError on non-positive salary,
  // empty positions, duplicate or empty ids and inconsistent projections.
  static PlayerPool load(const std::vector<Player> &players);

  void add_player(const Player &p);

  std::size_t size() const { return players_.size(); }
  bool empty() const { return players_.empty(); }

  bool has_id(const std::string &id) const {
    return id_index_.find(id) != id_index_.end();
  }

  // Throws std::out_of_range for unknown ids.
  std::size_t index_of(const std::string &id) const;
  const Player &get_by_id(const std::string &id) const;
  const Player &at(std::size_t idx) const { return players_.at(idx); }

  const std::vector<Player> &players() const { return players_; }

  // Players whose positions intersect the slot's eligible set, banned
  // players excluded.
  std::vector<Player> eligible_for_slot(const RosterSlot &slot) const;
  std::vector<std::size_t> eligible_indices(const RosterSlot &slot) const;

  // Pool indices of a team's players, in pool order.
  std::vector<std::size_t> team_players(const std::string &team) const;

  std::map<std::string, int> count_by_position() const;
  std::map<std::string, int> count_by_team() const;
  std::vector<std::string> teams() const;
  std::vector<std::string> games() const;

  Eigen::VectorXd projections() const;
  Eigen::VectorXd stdevs() const;
  Eigen::VectorXd ownerships() const;

private:
  std::vector<Player> players_;
  std::unordered_map<std::string, std::size_t> id_index_;
};

} // namespace dfs_core
