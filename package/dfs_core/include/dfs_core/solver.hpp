#pragma once

#include <string>
#include <vector>

#include "dfs_core/cancellation.hpp"
#include "dfs_core/constraints.hpp"
#include "dfs_core/errors.hpp"
#include "dfs_core/lineup.hpp"

namespace dfs_core {

struct SolverConfig {
  double time_limit_seconds{10.0};
  // Branch-and-bound node limit, -1: unbounded. 0 allows no search at all.
  // Only the SCIP backend honours positive limits.
  long long max_nodes{-1};
  std::string backend{"SCIP"}; // any OR-Tools MIP backend id, e.g. "CBC"
};

enum class SolveStatus { optimal, feasible, infeasible, timeout, cancelled };

const char *to_string(SolveStatus s);

struct SolveOutcome {
  SolveStatus status{SolveStatus::infeasible};
  std::vector<std::size_t> slot_players; // pool index per roster slot
  double objective{0.0};
  long long nodes{0};
  double elapsed_seconds{0.0};
};

// 0/1 program over slot-assignment variables x_{p,slot}, solved with
// OR-Tools' MPSolver.
//
// Rows: one player per slot, each player at most once, salary cap and
// floor, per-team cap, stack minimum/maximum and bring-back, distinct games
// (one indicator per game), and one cut per prior lineup limiting the shared
// players to roster_size - U. Locked players are fixed to 1; banned and
// excluded players are not given variables.
//
// solve() builds a fresh model per call, so one solver may be used from
// several threads.
class LineupSolver {
public:
  // `values` is the per-player objective, aligned to pool index order.
  LineupSolver(const ConstraintSet &cs, std::vector<double> values);

  // `excluded` (pool-sized, may be empty) bans extra players for this solve
  // only; locked players are never excluded. Throws SolverError when the
  // backend is unavailable or fails.
  SolveOutcome solve(const std::vector<Lineup> &prior,
                     const std::vector<char> &excluded,
                     const SolverConfig &cfg,
                     const CancellationToken *cancel = nullptr) const;

  const std::vector<double> &values() const { return values_; }

private:
  const ConstraintSet *cs_{nullptr};
  std::vector<double> values_;
  std::vector<std::vector<char>> eligible_; // [slot][player]
};

} // namespace dfs_core
