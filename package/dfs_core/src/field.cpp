#include "dfs_core/field.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <random>

#include <fmt/format.h>

#include "dfs_core/errors.hpp"
#include "dfs_core/projection.hpp"

namespace dfs_core {

FieldGenerator::FieldGenerator(const PlayerPool &pool, const RosterSpec &roster)
    : pool_(&pool), roster_(roster) {
  roster_.validate();
  const std::size_t r = roster_.size();
  eligible_.resize(r);
  min_salary_.assign(r, std::numeric_limits<int>::max());
  for (std::size_t s = 0; s < r; ++s) {
    for (std::size_t i = 0; i < pool.size(); ++i) {
      if (roster_.slots[s].accepts_any(pool.at(i).positions)) {
        eligible_[s].push_back(i);
        min_salary_[s] = std::min(min_salary_[s], pool.at(i).salary);
      }
    }
  }
  slot_order_.resize(r);
  std::iota(slot_order_.begin(), slot_order_.end(), 0);
  std::stable_sort(slot_order_.begin(), slot_order_.end(),
                   [&](std::size_t a, std::size_t b) {
                     return eligible_[a].size() < eligible_[b].size();
                   });
}

bool FieldGenerator::sample_one(std::uint64_t seed, const FieldConfig &cfg,
                                std::vector<std::size_t> &out) const {
  const PlayerPool &pool = *pool_;
  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> unif(0.0, 1.0);

  const std::size_t r = slot_order_.size();
  // Cheapest possible fill of the slots after depth d.
  std::vector<long long> min_tail(r + 1, 0);
  for (std::size_t d = r; d-- > 0;) {
    const int m = min_salary_[slot_order_[d]];
    if (m == std::numeric_limits<int>::max())
      return false;
    min_tail[d] = min_tail[d + 1] + m;
  }

  std::vector<char> used(pool.size(), 0);
  std::vector<double> weights;
  long long salary = 0;
  out.assign(r, 0);
  for (std::size_t d = 0; d < r; ++d) {
    const std::size_t slot = slot_order_[d];
    const auto &cand = eligible_[slot];
    weights.assign(cand.size(), 0.0);
    double total = 0.0;
    for (std::size_t k = 0; k < cand.size(); ++k) {
      const std::size_t i = cand[k];
      if (used[i])
        continue;
      if (salary + pool.at(i).salary + min_tail[d + 1] > cfg.salary_cap)
        continue;
      weights[k] = pool.at(i).ownership + cfg.ownership_floor;
      total += weights[k];
    }
    if (total <= 0.0)
      return false;
    double u = unif(rng) * total;
    std::size_t pick = cand.size();
    for (std::size_t k = 0; k < cand.size(); ++k) {
      if (weights[k] <= 0.0)
        continue;
      pick = k;
      if (u < weights[k])
        break;
      u -= weights[k];
    }
    const std::size_t i = cand[pick];
    used[i] = 1;
    salary += pool.at(i).salary;
    out[slot] = i;
  }
  return salary <= cfg.salary_cap;
}

OpponentField FieldGenerator::generate(const FieldConfig &cfg) const {
  if (cfg.n_lineups < 0) {
    throw ValidationError(
        fmt::format("field n_lineups must be >= 0, got {}", cfg.n_lineups));
  }
  if (cfg.salary_cap <= 0) {
    throw ValidationError(
        fmt::format("field salary_cap must be > 0, got {}", cfg.salary_cap));
  }
  if (!(cfg.ownership_floor > 0.0)) {
    throw ValidationError(fmt::format(
        "field ownership_floor must be > 0, got {}", cfg.ownership_floor));
  }
  if (cfg.max_attempts < 1) {
    throw ValidationError(fmt::format(
        "field max_attempts must be >= 1, got {}", cfg.max_attempts));
  }

  OpponentField field;
  field.lineups.reserve(static_cast<std::size_t>(cfg.n_lineups));
  std::vector<std::size_t> lineup;
  for (int k = 0; k < cfg.n_lineups; ++k) {
    bool ok = false;
    for (int a = 0; a < cfg.max_attempts && !ok; ++a) {
      const std::uint64_t s = mix_seed(
          cfg.seed, (static_cast<std::uint64_t>(k) << 32) ^
                        static_cast<std::uint64_t>(a));
      ok = sample_one(s, cfg, lineup);
    }
    if (ok) {
      field.lineups.push_back(lineup);
    } else {
      ++field.failed;
    }
  }
  return field;
}

} // namespace dfs_core
