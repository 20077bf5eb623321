#include "dfs_core/optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <unordered_map>

#include <fmt/format.h>

#include "dfs_core/log.hpp"
#include "dfs_core/projection.hpp"

namespace dfs_core {

namespace {

constexpr const char *kComponent = "optimizer";

// Kuhn's augmenting-path matching of `players` into roster slots.
bool try_assign(std::size_t p, const std::vector<std::vector<char>> &can,
                std::vector<char> &seen, std::vector<int> &slot_owner) {
  for (std::size_t s = 0; s < slot_owner.size(); ++s) {
    if (!can[p][s] || seen[s])
      continue;
    seen[s] = 1;
    if (slot_owner[s] < 0 ||
        try_assign(static_cast<std::size_t>(slot_owner[s]), can, seen,
                   slot_owner)) {
      slot_owner[s] = static_cast<int>(p);
      return true;
    }
  }
  return false;
}

int max_matching(const std::vector<std::vector<char>> &can,
                 std::size_t n_slots) {
  std::vector<int> owner(n_slots, -1);
  int matched = 0;
  for (std::size_t p = 0; p < can.size(); ++p) {
    std::vector<char> seen(n_slots, 0);
    if (try_assign(p, can, seen, owner))
      ++matched;
  }
  return matched;
}

} // namespace

void OptimizerConfig::validate() const {
  if (num_lineups < 1) {
    throw ValidationError(
        fmt::format("num_lineups must be >= 1, got {}", num_lineups));
  }
  if (!(leverage_weight >= 0.0 && leverage_weight <= 1.0)) {
    throw ValidationError(fmt::format(
        "leverage_weight must be within [0, 1], got {}", leverage_weight));
  }
  if (!(randomness >= 0.0 && randomness < 1.0)) {
    throw ValidationError(
        fmt::format("randomness must be within [0, 1), got {}", randomness));
  }
  if (!(max_exposure > 0.0 && max_exposure <= 1.0)) {
    throw ValidationError(fmt::format(
        "max_exposure must be within (0, 1], got {}", max_exposure));
  }
  for (const auto &kv : player_max_exposure) {
    if (!(kv.second >= 0.0 && kv.second <= 1.0)) {
      throw ValidationError(
          fmt::format("max exposure for {} must be within [0, 1], got {}",
                      kv.first, kv.second));
    }
  }
  if (!(time_limit_seconds > 0.0)) {
    throw ValidationError(fmt::format(
        "time_limit_seconds must be > 0, got {}", time_limit_seconds));
  }
}

const char *to_string(BatchState s) {
  switch (s) {
  case BatchState::initializing:
    return "initializing";
  case BatchState::solving:
    return "solving";
  case BatchState::emitted:
    return "emitted";
  case BatchState::complete:
    return "complete";
  case BatchState::failed:
    return "failed";
  }
  return "failed";
}

double objective_value(const Player &p, Objective objective,
                       double leverage_weight) {
  switch (objective) {
  case Objective::projection:
    return p.projection;
  case Objective::ceiling:
    return p.effective_ceiling();
  case Objective::ev: {
    const double upside = std::max(0.0, p.effective_ceiling() - p.projection);
    return p.projection + leverage_weight * upside * (1.0 - p.ownership);
  }
  }
  return p.projection;
}

LineupOptimizer::LineupOptimizer(const PlayerPool &pool,
                                 const RosterSpec &roster,
                                 const Constraints &constraints,
                                 OptimizerConfig cfg)
    : pool_(&pool), roster_(roster), constraints_(constraints),
      cs_(pool, roster, constraints), cfg_(cfg) {
  cfg_.validate();
  for (const auto &kv : cfg_.player_max_exposure) {
    if (!pool.has_id(kv.first)) {
      throw ValidationError(
          fmt::format("max exposure given for unknown player {}", kv.first));
    }
  }
  values_.reserve(pool.size());
  for (const auto &p : pool.players()) {
    values_.push_back(objective_value(p, cfg_.objective, cfg_.leverage_weight));
  }
}

void LineupOptimizer::check_feasibility() const {
  const PlayerPool &pool = *pool_;
  const Constraints &c = cs_.constraints();
  const std::size_t r = roster_.size();

  if (c.salary_floor > c.salary_cap) {
    throw InfeasibleError(
        InfeasibilityReason::salary_floor,
        fmt::format("salary floor {} exceeds salary cap {}", c.salary_floor,
                    c.salary_cap));
  }

  long long locked_salary = 0;
  for (const std::size_t i : cs_.locked())
    locked_salary += pool.at(i).salary;
  if (locked_salary > c.salary_cap) {
    throw InfeasibleError(
        InfeasibilityReason::salary_cap,
        fmt::format("locked players cost {} which exceeds salary cap {}",
                    locked_salary, c.salary_cap));
  }

  if (c.max_per_team > 0) {
    std::vector<int> per_team(static_cast<std::size_t>(cs_.n_teams()), 0);
    for (const std::size_t i : cs_.locked()) {
      if (++per_team[static_cast<std::size_t>(cs_.team_of(i))] >
          c.max_per_team) {
        throw InfeasibleError(
            InfeasibilityReason::team_limit,
            fmt::format("locked players exceed {} per team on {}",
                        c.max_per_team, pool.at(i).team));
      }
    }
  }

  // Locked players must fit into distinct slots.
  std::vector<std::vector<char>> can_lock;
  for (const std::size_t i : cs_.locked()) {
    std::vector<char> row(r, 0);
    for (std::size_t s = 0; s < r; ++s)
      row[s] = roster_.slots[s].accepts_any(pool.at(i).positions) ? 1 : 0;
    can_lock.push_back(row);
  }
  if (max_matching(can_lock, r) < static_cast<int>(can_lock.size())) {
    throw InfeasibleError(
        InfeasibilityReason::locks,
        "locked players cannot be assigned to distinct roster slots");
  }

  // Every slot must be fillable at the same time.
  std::vector<std::vector<char>> can_fill;
  for (std::size_t i = 0; i < pool.size(); ++i) {
    if (cs_.is_banned(i))
      continue;
    std::vector<char> row(r, 0);
    bool any = false;
    for (std::size_t s = 0; s < r; ++s) {
      row[s] = roster_.slots[s].accepts_any(pool.at(i).positions) ? 1 : 0;
      any = any || row[s];
    }
    if (any)
      can_fill.push_back(row);
  }
  if (max_matching(can_fill, r) < static_cast<int>(r)) {
    throw InfeasibleError(
        InfeasibilityReason::position,
        fmt::format("pool cannot fill all {} roster slots", r));
  }

  if (c.min_games > cs_.n_games()) {
    throw InfeasibleError(
        InfeasibilityReason::games,
        fmt::format("min games {} exceeds the {} games in the pool",
                    c.min_games, cs_.n_games()));
  }
}

std::vector<double> LineupOptimizer::jittered_values(int generation_index) const {
  if (cfg_.randomness <= 0.0)
    return values_;
  std::mt19937_64 rng(
      mix_seed(cfg_.seed, static_cast<std::uint64_t>(generation_index)));
  std::uniform_real_distribution<double> unif(-cfg_.randomness,
                                              cfg_.randomness);
  std::vector<double> out = values_;
  for (double &v : out)
    v *= 1.0 + unif(rng);
  return out;
}

SolveOutcome LineupOptimizer::run_solve(const std::vector<Lineup> &prior,
                                        const std::vector<char> &excluded,
                                        int generation_index,
                                        const CancellationToken *cancel) const {
  LineupSolver solver(cs_, jittered_values(generation_index));
  SolverConfig scfg;
  scfg.time_limit_seconds = cfg_.time_limit_seconds;
  scfg.max_nodes = cfg_.max_nodes;
  scfg.backend = cfg_.solver_backend;
  return solver.solve(prior, excluded, scfg, cancel);
}

Lineup LineupOptimizer::make_lineup(const SolveOutcome &outcome,
                                    int generation_index) const {
  Lineup lu;
  lu.generation_index = generation_index;
  lu.id = fmt::format("lineup_{}", generation_index + 1);
  lu.proven_optimal = outcome.status == SolveStatus::optimal;
  for (std::size_t s = 0; s < outcome.slot_players.size(); ++s) {
    const std::size_t p = outcome.slot_players[s];
    const Player &pl = pool_->at(p);
    lu.slots.push_back({roster_.slots[s].name, s, pl.id, p});
    lu.total_salary += pl.salary;
    lu.total_projection += pl.projection;
    lu.objective_value += values_[p];
  }
  lu.stack_label = classify_stack(lu, *pool_);
  return lu;
}

InfeasibilityReason
LineupOptimizer::explain_infeasibility(const std::vector<Lineup> &prior,
                                       const std::vector<char> &excluded) const {
  SolverConfig probe;
  probe.time_limit_seconds = std::min(cfg_.time_limit_seconds, 2.0);
  probe.backend = cfg_.solver_backend;
  auto solvable = [&](const ConstraintSet &cs, const std::vector<Lineup> &p,
                      const std::vector<char> &ex) {
    LineupSolver solver(cs, values_);
    const SolveOutcome o = solver.solve(p, ex, probe);
    return o.status == SolveStatus::optimal ||
           o.status == SolveStatus::feasible;
  };

  const bool any_excluded =
      std::find(excluded.begin(), excluded.end(), 1) != excluded.end();
  if (any_excluded && solvable(cs_, prior, {}))
    return InfeasibilityReason::exposure;
  if (!prior.empty() && solvable(cs_, {}, excluded))
    return InfeasibilityReason::uniqueness;
  if (any_excluded && !prior.empty() && solvable(cs_, {}, {}))
    return InfeasibilityReason::uniqueness;

  auto feasible_without = [&](Constraints relaxed) {
    ConstraintSet cs(*pool_, roster_, relaxed);
    return solvable(cs, {}, {});
  };

  const Constraints &base = constraints_;
  if (!base.stacks.empty()) {
    Constraints c = base;
    c.stacks.clear();
    if (feasible_without(c))
      return InfeasibilityReason::stack;
  }
  if (base.max_per_team > 0) {
    Constraints c = base;
    c.max_per_team = -1;
    if (feasible_without(c))
      return InfeasibilityReason::team_limit;
  }
  if (base.min_games > 0) {
    Constraints c = base;
    c.min_games = 0;
    if (feasible_without(c))
      return InfeasibilityReason::games;
  }
  if (base.salary_floor > 0) {
    Constraints c = base;
    c.salary_floor = 0;
    if (feasible_without(c))
      return InfeasibilityReason::salary_floor;
  }
  {
    Constraints c = base;
    c.salary_cap = std::numeric_limits<int>::max() / 2;
    c.salary_floor = 0;
    if (feasible_without(c))
      return InfeasibilityReason::salary_cap;
  }
  return InfeasibilityReason::unknown;
}

Lineup LineupOptimizer::solve_one(const std::vector<Lineup> &prior,
                                  int generation_index) const {
  check_feasibility();
  const int gen =
      generation_index >= 0 ? generation_index : static_cast<int>(prior.size());
  const SolveOutcome outcome = run_solve(prior, {}, gen, nullptr);
  switch (outcome.status) {
  case SolveStatus::optimal:
  case SolveStatus::feasible:
    return make_lineup(outcome, gen);
  case SolveStatus::infeasible: {
    const InfeasibilityReason why = explain_infeasibility(prior, {});
    throw InfeasibleError(
        why, fmt::format("no lineup satisfies the constraints ({})",
                         to_string(why)));
  }
  case SolveStatus::timeout:
  case SolveStatus::cancelled:
    break;
  }
  throw TimeoutError(fmt::format(
      "lineup {} found no feasible solution within {:.3f}s ({} nodes)",
      gen + 1, cfg_.time_limit_seconds, outcome.nodes));
}

std::vector<int> LineupOptimizer::exposure_caps(int num_lineups) const {
  auto cap_for = [&](double exposure) {
    return static_cast<int>(
        std::ceil(exposure * static_cast<double>(num_lineups) - 1e-9));
  };
  std::vector<int> caps(pool_->size(), cap_for(cfg_.max_exposure));
  for (const auto &kv : cfg_.player_max_exposure)
    caps[pool_->index_of(kv.first)] = cap_for(kv.second);
  return caps;
}

BatchResult LineupOptimizer::generate(int num_lineups,
                                      const CancellationToken *cancel) const {
  BatchResult result;
  result.requested = num_lineups > 0 ? num_lineups : cfg_.num_lineups;
  result.transitions.push_back({BatchState::initializing, -1, ""});

  auto fail = [&](const std::string &reason, const std::string &detail) {
    result.reason = reason;
    result.stack_summary = summarize_stacks(result.lineups);
    result.transitions.push_back({BatchState::failed, result.delivered, detail});
    log(cfg_.log_level, LogLevel::warn, kComponent,
        "batch stopped after {}/{} lineups: {}", result.delivered,
        result.requested, detail);
  };

  try {
    check_feasibility();
  } catch (const InfeasibleError &e) {
    result.infeasibility = e.reason();
    fail("infeasible", e.what());
    return result;
  }

  const std::size_t n = pool_->size();
  std::vector<int> appearances(n, 0);
  std::vector<char> excluded(n, 0);
  const std::vector<int> exposure_cap = exposure_caps(result.requested);
  for (std::size_t i = 0; i < n; ++i) {
    if (exposure_cap[i] <= 0 && !cs_.is_locked(i))
      excluded[i] = 1;
  }

  for (int k = 0; k < result.requested; ++k) {
    if (is_cancelled(cancel)) {
      fail("cancelled", "cancelled between lineup solves");
      return result;
    }
    result.transitions.push_back({BatchState::solving, k, ""});
    const SolveOutcome outcome = run_solve(result.lineups, excluded, k, cancel);

    if (outcome.status == SolveStatus::optimal ||
        outcome.status == SolveStatus::feasible) {
      Lineup lu = make_lineup(outcome, k);
      if (!lu.proven_optimal) {
        log(cfg_.log_level, LogLevel::warn, kComponent,
            "{} hit the time budget; emitting best incumbent", lu.id);
      }
      log(cfg_.log_level, LogLevel::debug, kComponent,
          "{} salary={} projection={:.2f} objective={:.2f} stack='{}' "
          "nodes={} elapsed={:.3f}s",
          lu.id, lu.total_salary, lu.total_projection, lu.objective_value,
          lu.stack_label, outcome.nodes, outcome.elapsed_seconds);
      for (const auto &s : lu.slots) {
        if (++appearances[s.pool_index] >= exposure_cap[s.pool_index] &&
            !cs_.is_locked(s.pool_index)) {
          excluded[s.pool_index] = 1;
        }
      }
      result.lineups.push_back(std::move(lu));
      result.delivered = static_cast<int>(result.lineups.size());
      result.transitions.push_back({BatchState::emitted, k, ""});
      continue;
    }

    if (outcome.status == SolveStatus::infeasible) {
      const InfeasibilityReason why =
          explain_infeasibility(result.lineups, excluded);
      result.infeasibility = why;
      fail("infeasible",
           fmt::format("lineup {} infeasible ({})", k + 1, to_string(why)));
    } else if (outcome.status == SolveStatus::timeout) {
      fail("timeout", fmt::format("lineup {} exceeded {:.3f}s", k + 1,
                                  cfg_.time_limit_seconds));
    } else {
      fail("cancelled", fmt::format("lineup {} cancelled", k + 1));
    }
    return result;
  }

  result.complete = true;
  result.stack_summary = summarize_stacks(result.lineups);
  result.transitions.push_back({BatchState::complete, result.delivered, ""});
  log(cfg_.log_level, LogLevel::info, kComponent, "generated {} lineups",
      result.delivered);
  return result;
}

std::string classify_stack(const Lineup &lineup, const PlayerPool &pool) {
  // Teams in order of first appearance in the lineup.
  std::vector<std::string> teams;
  std::unordered_map<std::string, int> count, skill;
  std::unordered_map<std::string, bool> has_qb;
  std::unordered_map<std::string, std::string> opponent;
  for (const auto &s : lineup.slots) {
    const Player &p = pool.at(s.pool_index);
    if (count[p.team]++ == 0) {
      teams.push_back(p.team);
      opponent[p.team] = p.opponent;
    }
    if (p.has_position("QB"))
      has_qb[p.team] = true;
    else if (p.has_position("RB") || p.has_position("WR") ||
             p.has_position("TE"))
      ++skill[p.team];
  }

  for (const auto &team : teams) {
    if (has_qb[team] && skill[team] > 0)
      return fmt::format("QB+{} Stack ({})", skill[team], team);
  }
  for (const auto &team : teams) {
    const auto opp = count.find(opponent[team]);
    if (count[team] >= 2 && opp != count.end() && opp->second >= 2)
      return fmt::format("Game Stack ({}/{})", team, opponent[team]);
  }
  return "No Stack";
}

std::vector<StackUsage> summarize_stacks(const std::vector<Lineup> &lineups) {
  std::vector<StackUsage> out;
  for (const auto &lu : lineups) {
    auto it = std::find_if(out.begin(), out.end(), [&](const StackUsage &u) {
      return u.label == lu.stack_label;
    });
    if (it == out.end())
      out.push_back({lu.stack_label, 1, 0.0});
    else
      ++it->count;
  }
  for (auto &u : out) {
    u.percentage = 100.0 * u.count / static_cast<double>(lineups.size());
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const StackUsage &a, const StackUsage &b) {
                     return a.count > b.count;
                   });
  return out;
}

} // namespace dfs_core
