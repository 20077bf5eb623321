#include "dfs_core/player.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <fmt/format.h>

#include "dfs_core/errors.hpp"

namespace dfs_core {

namespace {

void validate_player(const Player &p) {
  if (p.id.empty()) {
    throw ValidationError(
        fmt::format("player '{}' has an empty identifier", p.name));
  }
  if (p.salary <= 0) {
    throw ValidationError(fmt::format(
        "player {} ({}) has non-positive salary {}", p.id, p.name, p.salary));
  }
  if (p.positions.empty()) {
    throw ValidationError(
        fmt::format("player {} ({}) has no positions", p.id, p.name));
  }
  if (!std::isfinite(p.projection)) {
    throw ValidationError(
        fmt::format("player {} has a non-finite projection", p.id));
  }
  if (!std::isnan(p.floor) && p.floor > p.projection) {
    throw ValidationError(fmt::format("player {}: floor {} > projection {}",
                                      p.id, p.floor, p.projection));
  }
  if (!std::isnan(p.ceiling) && p.ceiling < p.projection) {
    throw ValidationError(fmt::format("player {}: ceiling {} < projection {}",
                                      p.id, p.ceiling, p.projection));
  }
  if (!std::isnan(p.stdev) && (p.stdev < 0.0 || !std::isfinite(p.stdev))) {
    throw ValidationError(
        fmt::format("player {}: invalid stdev {}", p.id, p.stdev));
  }
  if (p.volatility < 0.0) {
    throw ValidationError(
        fmt::format("player {}: negative volatility {}", p.id, p.volatility));
  }
  if (!(p.ownership >= 0.0 && p.ownership <= 1.0)) {
    throw ValidationError(fmt::format(
        "player {}: ownership {} outside [0, 1]", p.id, p.ownership));
  }
  for (const double s : p.outcome_samples) {
    if (!std::isfinite(s)) {
      throw ValidationError(
          fmt::format("player {}: non-finite outcome sample", p.id));
    }
  }
}

} // namespace

PlayerPool PlayerPool::load(const std::vector<Player> &players) {
  PlayerPool pool;
  pool.players_.reserve(players.size());
  for (const auto &p : players) {
    pool.add_player(p);
  }
  return pool;
}

void PlayerPool::add_player(const Player &p) {
  validate_player(p);
  if (has_id(p.id)) {
    throw ValidationError(fmt::format("duplicate player id {}", p.id));
  }
  const std::size_t idx = players_.size();
  players_.push_back(p);
  id_index_[p.id] = idx;
}

std::size_t PlayerPool::index_of(const std::string &id) const {
  auto it = id_index_.find(id);
  if (it == id_index_.end()) {
    throw std::out_of_range(fmt::format("player id {} not found", id));
  }
  return it->second;
}

const Player &PlayerPool::get_by_id(const std::string &id) const {
  return players_.at(index_of(id));
}

std::vector<std::size_t>
PlayerPool::eligible_indices(const RosterSlot &slot) const {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < players_.size(); ++i) {
    const Player &p = players_[i];
    if (!p.banned && slot.accepts_any(p.positions)) {
      out.push_back(i);
    }
  }
  return out;
}

std::vector<Player> PlayerPool::eligible_for_slot(const RosterSlot &slot) const {
  std::vector<Player> out;
  for (const std::size_t i : eligible_indices(slot)) {
    out.push_back(players_[i]);
  }
  return out;
}

std::vector<std::size_t>
PlayerPool::team_players(const std::string &team) const {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < players_.size(); ++i) {
    if (players_[i].team == team)
      out.push_back(i);
  }
  return out;
}

std::map<std::string, int> PlayerPool::count_by_position() const {
  std::map<std::string, int> counts;
  for (const auto &p : players_) {
    for (const auto &pos : p.positions)
      ++counts[pos];
  }
  return counts;
}

std::map<std::string, int> PlayerPool::count_by_team() const {
  std::map<std::string, int> counts;
  for (const auto &p : players_)
    ++counts[p.team];
  return counts;
}

std::vector<std::string> PlayerPool::teams() const {
  std::set<std::string> s;
  for (const auto &p : players_)
    s.insert(p.team);
  return {s.begin(), s.end()};
}

std::vector<std::string> PlayerPool::games() const {
  std::set<std::string> s;
  for (const auto &p : players_)
    s.insert(p.game_key());
  return {s.begin(), s.end()};
}

Eigen::VectorXd PlayerPool::projections() const {
  Eigen::VectorXd v(static_cast<Eigen::Index>(players_.size()));
  for (std::size_t i = 0; i < players_.size(); ++i)
    v(static_cast<Eigen::Index>(i)) = players_[i].projection;
  return v;
}

Eigen::VectorXd PlayerPool::stdevs() const {
  Eigen::VectorXd v(static_cast<Eigen::Index>(players_.size()));
  for (std::size_t i = 0; i < players_.size(); ++i)
    v(static_cast<Eigen::Index>(i)) = players_[i].effective_stdev();
  return v;
}

Eigen::VectorXd PlayerPool::ownerships() const {
  Eigen::VectorXd v(static_cast<Eigen::Index>(players_.size()));
  for (std::size_t i = 0; i < players_.size(); ++i)
    v(static_cast<Eigen::Index>(i)) = players_[i].ownership;
  return v;
}

} // namespace dfs_core
