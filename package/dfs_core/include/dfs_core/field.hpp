#pragma once

#include <cstdint>
#include <vector>

#include "dfs_core/player.hpp"
#include "dfs_core/roster.hpp"

namespace dfs_core {

struct FieldConfig {
  int n_lineups{500};       // opponent lineups sampled to represent the field
  std::uint64_t seed{0};
  int salary_cap{50000};
  double ownership_floor{0.005}; // weight added to every player's ownership
  int max_attempts{200};         // per opponent lineup
};

// Opponent lineups as pool indices, one vector per lineup.
struct OpponentField {
  std::vector<std::vector<std::size_t>> lineups;
  int failed{0}; // lineups abandoned after max_attempts

  std::size_t size() const { return lineups.size(); }
  bool empty() const { return lineups.empty(); }
};

// Samples a contest field slot by slot with probability proportional to
// projected ownership. Opponents ignore our locks and bans.
class FieldGenerator {
public:
  FieldGenerator(const PlayerPool &pool, const RosterSpec &roster);

  // Throws ValidationError for an invalid config. Deterministic for a seed.
  OpponentField generate(const FieldConfig &cfg) const;

private:
  bool sample_one(std::uint64_t seed, const FieldConfig &cfg,
                  std::vector<std::size_t> &out) const;

  const PlayerPool *pool_{nullptr};
  RosterSpec roster_;
  std::vector<std::size_t> slot_order_;
  std::vector<std::vector<std::size_t>> eligible_; // [slot][k] -> pool index
  std::vector<int> min_salary_;                    // [slot]
};

} // namespace dfs_core
