#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "dfs_core/lineup.hpp"
#include "dfs_core/player.hpp"
#include "dfs_core/roster.hpp"

namespace dfs_core {
namespace fixtures {

inline Player make_player(const std::string &id, const std::string &pos,
                          const std::string &team, const std::string &opp,
                          int salary, double projection,
                          double ownership = 0.10) {
  Player p(id, id, {pos}, team, opp, salary, projection);
  p.ownership = ownership;
  return p;
}

// Two games (KC@BUF, DAL@PHI), 20 players: 3 QB, 5 RB, 6 WR, 3 TE, 3 DST.
inline std::vector<Player> nfl_20_players() {
  return {
      make_player("kc_qb", "QB", "KC", "BUF", 8000, 24.0, 0.30),
      make_player("buf_qb", "QB", "BUF", "KC", 7800, 23.0, 0.20),
      make_player("dal_qb", "QB", "DAL", "PHI", 6500, 19.0, 0.10),
      make_player("kc_rb", "RB", "KC", "BUF", 7000, 18.0, 0.25),
      make_player("buf_rb", "RB", "BUF", "KC", 6200, 15.0, 0.15),
      make_player("dal_rb", "RB", "DAL", "PHI", 7500, 19.0, 0.30),
      make_player("phi_rb", "RB", "PHI", "DAL", 5800, 14.0, 0.12),
      make_player("phi_rb2", "RB", "PHI", "DAL", 4500, 10.0, 0.05),
      make_player("kc_wr", "WR", "KC", "BUF", 6800, 17.0, 0.22),
      make_player("buf_wr", "WR", "BUF", "KC", 7900, 20.0, 0.28),
      make_player("buf_wr2", "WR", "BUF", "KC", 5000, 12.0, 0.08),
      make_player("dal_wr", "WR", "DAL", "PHI", 8200, 21.0, 0.35),
      make_player("phi_wr", "WR", "PHI", "DAL", 6600, 16.0, 0.18),
      make_player("phi_wr2", "WR", "PHI", "DAL", 4200, 9.0, 0.04),
      make_player("kc_te", "TE", "KC", "BUF", 6000, 14.0, 0.20),
      make_player("phi_te", "TE", "PHI", "DAL", 4800, 10.0, 0.10),
      make_player("dal_te", "TE", "DAL", "PHI", 3500, 7.0, 0.06),
      make_player("kc_dst", "DST", "KC", "BUF", 3200, 8.0, 0.15),
      make_player("buf_dst", "DST", "BUF", "KC", 2800, 7.0, 0.10),
      make_player("phi_dst", "DST", "PHI", "DAL", 3000, 7.0, 0.12),
  };
}

inline PlayerPool nfl_20_pool() { return PlayerPool::load(nfl_20_players()); }

// A full-slate sized DK NFL pool: `n_teams` teams (even), paired into games
// T0@T1, T2@T3, ..., each with 1 QB, 2 RB, 3 WR, 1 TE and 1 DST.
inline PlayerPool nfl_slate_pool(int n_teams, std::uint32_t seed) {
  struct Shape {
    const char *pos;
    int count;
    int min_salary; // hundreds
    int max_salary;
  };
  const Shape shapes[] = {{"QB", 1, 50, 82},
                          {"RB", 2, 40, 90},
                          {"WR", 3, 35, 88},
                          {"TE", 1, 25, 72},
                          {"DST", 1, 20, 40}};
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> noise(0.8, 1.2);
  std::vector<Player> players;
  for (int t = 0; t < n_teams; ++t) {
    const std::string team = "T" + std::to_string(t);
    const std::string opp = "T" + std::to_string(t % 2 == 0 ? t + 1 : t - 1);
    for (const auto &shape : shapes) {
      std::uniform_int_distribution<int> salary(shape.min_salary,
                                                shape.max_salary);
      for (int k = 0; k < shape.count; ++k) {
        const int s = salary(rng) * 100;
        const double projection = s / 1000.0 * 2.6 * noise(rng);
        players.push_back(make_player(
            team + "_" + shape.pos + std::to_string(k + 1), shape.pos, team,
            opp, s, projection, 0.1 * noise(rng)));
      }
    }
  }
  return PlayerPool::load(players);
}

inline int count_position(const Lineup &lu, const PlayerPool &pool,
                          const std::string &pos) {
  int n = 0;
  for (const auto &s : lu.slots) {
    if (pool.at(s.pool_index).has_position(pos))
      ++n;
  }
  return n;
}

// Builds a lineup straight from pool indices, one per roster slot.
inline Lineup make_lineup(const PlayerPool &pool, const RosterSpec &roster,
                          const std::vector<std::size_t> &indices,
                          const std::string &id, double objective = 0.0) {
  Lineup lu;
  lu.id = id;
  lu.objective_value = objective;
  for (std::size_t s = 0; s < indices.size(); ++s) {
    const Player &p = pool.at(indices[s]);
    lu.slots.push_back({roster.slots.at(s).name, s, p.id, indices[s]});
    lu.total_salary += p.salary;
    lu.total_projection += p.projection;
  }
  return lu;
}

} // namespace fixtures
} // namespace dfs_core
