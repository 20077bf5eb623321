#include "dfs_core/portfolio.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_map>

#include <fmt/format.h>

#include "dfs_core/errors.hpp"

namespace dfs_core {

namespace {

constexpr const char *kComponent = "portfolio";

struct Candidate {
  std::size_t input{0};
  std::vector<std::size_t> players;
};

struct Bound {
  std::size_t player{0};
  double min_exposure{0.0};
  double max_exposure{1.0};
};

bool contains(const Candidate &c, std::size_t p) {
  return std::find(c.players.begin(), c.players.end(), p) != c.players.end();
}

// Picks `size` lineups from `cands` (priority order) so that every bounded
// player stays within floor(max * size) and reaches ceil(min * size) when
// `enforce_min` is set. Greedy fill followed by single-swap repair.
bool select(const std::vector<Candidate> &cands,
            const std::vector<Bound> &bounds, std::size_t n_players, int size,
            bool enforce_min, std::vector<char> &chosen) {
  const double eps = 1e-9;
  std::vector<int> max_count(n_players, size);
  std::vector<int> min_count(n_players, 0);
  for (const auto &b : bounds) {
    max_count[b.player] =
        static_cast<int>(std::floor(b.max_exposure * size + eps));
    if (enforce_min) {
      min_count[b.player] =
          static_cast<int>(std::ceil(b.min_exposure * size - eps));
    }
  }

  std::vector<int> count(n_players, 0);
  chosen.assign(cands.size(), 0);
  int n_chosen = 0;
  for (std::size_t c = 0; c < cands.size() && n_chosen < size; ++c) {
    bool fits = true;
    for (const std::size_t p : cands[c].players) {
      if (count[p] + 1 > max_count[p]) {
        fits = false;
        break;
      }
    }
    if (!fits)
      continue;
    chosen[c] = 1;
    ++n_chosen;
    for (const std::size_t p : cands[c].players)
      ++count[p];
  }
  if (n_chosen < size)
    return false;

  const std::size_t max_swaps = static_cast<std::size_t>(size) * cands.size();
  for (std::size_t iter = 0; iter <= max_swaps; ++iter) {
    std::size_t short_player = n_players;
    for (const auto &b : bounds) {
      if (count[b.player] < min_count[b.player]) {
        short_player = b.player;
        break;
      }
    }
    if (short_player == n_players)
      return true;

    bool swapped = false;
    for (std::size_t in = 0; in < cands.size() && !swapped; ++in) {
      if (chosen[in] || !contains(cands[in], short_player))
        continue;
      for (std::size_t k = cands.size(); k-- > 0 && !swapped;) {
        if (!chosen[k] || contains(cands[k], short_player))
          continue;
        bool ok = true;
        for (const std::size_t q : cands[k].players) {
          if (!contains(cands[in], q) && count[q] - 1 < min_count[q]) {
            ok = false;
            break;
          }
        }
        for (const std::size_t q : cands[in].players) {
          if (ok && !contains(cands[k], q) && count[q] + 1 > max_count[q])
            ok = false;
        }
        if (!ok)
          continue;
        for (const std::size_t q : cands[k].players)
          --count[q];
        for (const std::size_t q : cands[in].players)
          ++count[q];
        chosen[k] = 0;
        chosen[in] = 1;
        swapped = true;
      }
    }
    if (!swapped)
      return false;
  }
  return false;
}

} // namespace

void PortfolioThresholds::validate() const {
  if (field_size < 1) {
    throw ValidationError(
        fmt::format("field_size must be >= 1, got {}", field_size));
  }
  if (!std::isnan(min_win_probability) &&
      !(min_win_probability >= 0.0 && min_win_probability <= 1.0)) {
    throw ValidationError(fmt::format(
        "min_win_probability must be within [0, 1], got {}",
        min_win_probability));
  }
  if (!std::isnan(min_leverage) && !(min_leverage >= 0.0 && min_leverage <= 1.0)) {
    throw ValidationError(fmt::format(
        "min_leverage must be within [0, 1], got {}", min_leverage));
  }
  if (!std::isnan(max_duplicate_risk) && max_duplicate_risk < 0.0) {
    throw ValidationError(fmt::format(
        "max_duplicate_risk must be >= 0, got {}", max_duplicate_risk));
  }
  if (!std::isnan(max_total_ownership) && max_total_ownership < 0.0) {
    throw ValidationError(fmt::format(
        "max_total_ownership must be >= 0, got {}", max_total_ownership));
  }
}

double duplicate_risk(const Lineup &lineup, const PlayerPool &pool,
                      int field_size) {
  double prob = 1.0;
  for (const auto &s : lineup.slots)
    prob *= pool.at(s.pool_index).ownership;
  return static_cast<double>(field_size) * prob;
}

double leverage_score(const Lineup &lineup, const PlayerPool &pool) {
  double weighted = 0.0;
  double upside = 0.0;
  for (const auto &s : lineup.slots) {
    const Player &p = pool.at(s.pool_index);
    const double u = std::max(0.0, p.effective_ceiling() - p.projection);
    weighted += u * (1.0 - p.ownership);
    upside += u;
  }
  return upside > 0.0 ? weighted / upside : 0.0;
}

double total_ownership(const Lineup &lineup, const PlayerPool &pool) {
  double total = 0.0;
  for (const auto &s : lineup.slots)
    total += pool.at(s.pool_index).ownership;
  return total;
}

FilterResult
PortfolioFilter::filter(const std::vector<Lineup> &lineups,
                        const std::vector<SimulationResult> &sim_results,
                        const std::vector<ExposureTarget> &targets,
                        const PortfolioThresholds &thresholds) const {
  thresholds.validate();
  const PlayerPool &pool = *pool_;

  std::unordered_map<std::string, const SimulationResult *> by_id;
  for (const auto &r : sim_results)
    by_id[r.lineup_id] = &r;

  std::set<std::string> seen_ids;
  for (const auto &lu : lineups) {
    if (!seen_ids.insert(lu.id).second) {
      throw ValidationError(fmt::format("duplicate lineup id {}", lu.id));
    }
    for (const auto &s : lu.slots) {
      if (s.pool_index >= pool.size() ||
          pool.at(s.pool_index).id != s.player_id) {
        throw ValidationError(fmt::format(
            "lineup {} references player {} outside the pool", lu.id,
            s.player_id));
      }
    }
  }

  std::vector<Bound> bounds;
  std::set<std::size_t> bounded;
  for (const auto &t : targets) {
    if (!pool.has_id(t.player_id)) {
      throw ValidationError(
          fmt::format("exposure target for unknown player {}", t.player_id));
    }
    if (!(t.min_exposure >= 0.0 && t.max_exposure <= 1.0 &&
          t.min_exposure <= t.max_exposure)) {
      throw ValidationError(fmt::format(
          "exposure target for {} needs 0 <= min <= max <= 1, got [{}, {}]",
          t.player_id, t.min_exposure, t.max_exposure));
    }
    const std::size_t idx = pool.index_of(t.player_id);
    if (!bounded.insert(idx).second) {
      throw ValidationError(
          fmt::format("duplicate exposure target for {}", t.player_id));
    }
    bounds.push_back({idx, t.min_exposure, t.max_exposure});
  }

  const bool needs_sim = !std::isnan(thresholds.min_roi) ||
                         !std::isnan(thresholds.min_win_probability);

  FilterResult result;
  std::vector<std::string> reason(lineups.size());
  std::vector<Candidate> cands;
  for (std::size_t k = 0; k < lineups.size(); ++k) {
    const Lineup &lu = lineups[k];
    const auto it = by_id.find(lu.id);
    const SimulationResult *sim = it == by_id.end() ? nullptr : it->second;
    if (needs_sim && sim == nullptr) {
      throw ValidationError(
          fmt::format("no simulation result for lineup {}", lu.id));
    }
    if (!std::isnan(thresholds.min_roi)) {
      if (std::isnan(sim->roi)) {
        throw ValidationError(fmt::format(
            "lineup {} has no ROI; simulate it against a field", lu.id));
      }
      if (sim->roi < thresholds.min_roi) {
        reason[k] = "roi_floor";
        continue;
      }
    }
    if (!std::isnan(thresholds.min_win_probability)) {
      if (std::isnan(sim->win_probability)) {
        throw ValidationError(fmt::format(
            "lineup {} has no win probability; simulate it against a field",
            lu.id));
      }
      if (sim->win_probability < thresholds.min_win_probability) {
        reason[k] = "win_probability";
        continue;
      }
    }
    if (!std::isnan(thresholds.max_duplicate_risk) &&
        duplicate_risk(lu, pool, thresholds.field_size) >
            thresholds.max_duplicate_risk) {
      reason[k] = "duplicate_risk";
      continue;
    }
    if (!std::isnan(thresholds.min_leverage) &&
        leverage_score(lu, pool) < thresholds.min_leverage) {
      reason[k] = "leverage";
      continue;
    }
    if (!std::isnan(thresholds.max_total_ownership) &&
        total_ownership(lu, pool) > thresholds.max_total_ownership) {
      reason[k] = "total_ownership";
      continue;
    }
    cands.push_back({k, lu.player_indices()});
  }

  // Retention priority: objective, then simulated mean, then batch order.
  const auto sim_mean = [&](std::size_t k) {
    const auto it = by_id.find(lineups[k].id);
    return it == by_id.end() ? 0.0 : it->second->mean;
  };
  std::stable_sort(cands.begin(), cands.end(),
                   [&](const Candidate &a, const Candidate &b) {
                     const Lineup &la = lineups[a.input];
                     const Lineup &lb = lineups[b.input];
                     if (la.objective_value != lb.objective_value)
                       return la.objective_value > lb.objective_value;
                     const double ma = sim_mean(a.input);
                     const double mb = sim_mean(b.input);
                     if (ma != mb)
                       return ma > mb;
                     return la.generation_index < lb.generation_index;
                   });

  // Minimums of players absent from every candidate cannot be met.
  std::vector<Bound> enforced = bounds;
  for (auto &b : enforced) {
    bool present = false;
    for (const auto &c : cands)
      present = present || contains(c, b.player);
    if (!present)
      b.min_exposure = 0.0;
  }

  std::vector<char> chosen(cands.size(), 0);
  bool found = bounds.empty();
  if (found)
    std::fill(chosen.begin(), chosen.end(), 1);
  for (int pass = 0; pass < 2 && !found; ++pass) {
    const bool enforce_min = pass == 0;
    for (int size = static_cast<int>(cands.size()); size >= 1 && !found;
         --size) {
      found = select(cands, enforced, pool.size(), size, enforce_min, chosen);
    }
    if (!found && enforce_min) {
      log(thresholds.log_level, LogLevel::warn, kComponent,
          "exposure minimums cannot be met together; enforcing maximums only");
    }
  }
  if (!found)
    std::fill(chosen.begin(), chosen.end(), 0);

  std::vector<char> keep(lineups.size(), 0);
  for (std::size_t c = 0; c < cands.size(); ++c) {
    if (chosen[c])
      keep[cands[c].input] = 1;
    else
      reason[cands[c].input] = "exposure";
  }

  std::vector<int> count(pool.size(), 0);
  for (std::size_t k = 0; k < lineups.size(); ++k) {
    if (keep[k]) {
      result.kept.push_back(lineups[k]);
      for (const auto &s : lineups[k].slots)
        ++count[s.pool_index];
    } else {
      result.excluded.push_back({lineups[k].id, reason[k]});
    }
  }

  const double kept = static_cast<double>(result.kept.size());
  const auto percent = [&](std::size_t p) {
    return kept > 0.0 ? 100.0 * count[p] / kept : 0.0;
  };
  for (const auto &lu : lineups) {
    for (const auto &s : lu.slots)
      result.exposure[s.player_id] = percent(s.pool_index);
  }
  for (const auto &b : bounds) {
    const std::string &id = pool.at(b.player).id;
    result.exposure[id] = percent(b.player);
    const double achieved = kept > 0.0 ? count[b.player] / kept : 0.0;
    const double needed =
        std::ceil(b.min_exposure * kept - 1e-9) / std::max(kept, 1.0);
    if (b.min_exposure > 0.0 && (kept == 0.0 || achieved + 1e-12 < needed)) {
      result.unmet_minimums.push_back({id, b.min_exposure, achieved});
    }
  }

  log(thresholds.log_level, LogLevel::info, kComponent,
      "kept {} of {} lineups ({} unmet minimums)", result.kept.size(),
      lineups.size(), result.unmet_minimums.size());
  return result;
}

} // namespace dfs_core
