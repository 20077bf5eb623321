#include "dfs_core/solver.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <thread>

#include <absl/time/time.h>
#include <fmt/format.h>
#include <ortools/linear_solver/linear_solver.h>

namespace dfs_core {

namespace ort = operations_research;

const char *to_string(SolveStatus s) {
  switch (s) {
  case SolveStatus::optimal:
    return "optimal";
  case SolveStatus::feasible:
    return "feasible";
  case SolveStatus::infeasible:
    return "infeasible";
  case SolveStatus::timeout:
    return "timeout";
  case SolveStatus::cancelled:
    return "cancelled";
  }
  return "infeasible";
}

namespace {

using Clock = std::chrono::steady_clock;

// Interrupts a running MPSolver once the token is cancelled. The watcher
// keeps interrupting until the solve returns, so a cancel that lands before
// Solve() has started is not lost.
class CancelWatch {
public:
  CancelWatch(ort::MPSolver &solver, const CancellationToken *cancel) {
    if (cancel == nullptr)
      return;
    thread_ = std::thread([this, &solver, cancel] {
      while (!done_.load()) {
        if (cancel->cancelled()) {
          fired_.store(true);
          solver.InterruptSolve();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    });
  }
  CancelWatch(const CancelWatch &) = delete;
  CancelWatch &operator=(const CancelWatch &) = delete;

  ~CancelWatch() { stop(); }

  void stop() {
    done_.store(true);
    if (thread_.joinable())
      thread_.join();
  }

  bool fired() const { return fired_.load(); }

private:
  std::atomic<bool> done_{false};
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

} // namespace

LineupSolver::LineupSolver(const ConstraintSet &cs, std::vector<double> values)
    : cs_(&cs), values_(std::move(values)) {
  const PlayerPool &pool = cs.pool();
  if (values_.size() != pool.size()) {
    throw ValidationError(fmt::format(
        "solver values has {} entries for a pool of {}", values_.size(),
        pool.size()));
  }
  for (const double v : values_) {
    if (!std::isfinite(v))
      throw ValidationError("solver values must be finite");
  }
  const auto &slots = cs.roster().slots;
  eligible_.assign(slots.size(), std::vector<char>(pool.size(), 0));
  for (std::size_t s = 0; s < slots.size(); ++s) {
    for (std::size_t p = 0; p < pool.size(); ++p)
      eligible_[s][p] = slots[s].accepts_any(pool.at(p).positions) ? 1 : 0;
  }
}

SolveOutcome LineupSolver::solve(const std::vector<Lineup> &prior,
                                 const std::vector<char> &excluded,
                                 const SolverConfig &cfg,
                                 const CancellationToken *cancel) const {
  const auto start = Clock::now();
  const ConstraintSet &cs = *cs_;
  const PlayerPool &pool = cs.pool();
  const Constraints &c = cs.constraints();
  const std::size_t n = pool.size();
  const std::size_t r = cs.roster_size();

  SolveOutcome out;
  auto finish = [&](SolveStatus status) {
    out.status = status;
    out.elapsed_seconds =
        std::chrono::duration<double>(Clock::now() - start).count();
    return out;
  };

  if (is_cancelled(cancel))
    return finish(SolveStatus::cancelled);
  if (cfg.max_nodes == 0)
    return finish(SolveStatus::timeout);

  std::unique_ptr<ort::MPSolver> solver(
      ort::MPSolver::CreateSolver(cfg.backend));
  if (!solver) {
    throw SolverError(fmt::format(
        "OR-Tools was built without the '{}' MIP backend", cfg.backend));
  }
  const double inf = ort::MPSolver::infinity();

  // y_p = sum_slot x_{p,slot}; y_p is null for players that cannot play.
  std::vector<ort::MPVariable *> y(n, nullptr);
  std::vector<std::vector<ort::MPVariable *>> x(
      r, std::vector<ort::MPVariable *>(n, nullptr));
  for (std::size_t p = 0; p < n; ++p) {
    const bool excl = !excluded.empty() && excluded[p];
    if (!cs.is_locked(p) && (cs.is_banned(p) || excl))
      continue;
    ort::MPConstraint *link = nullptr;
    for (std::size_t s = 0; s < r; ++s) {
      if (!eligible_[s][p])
        continue;
      if (y[p] == nullptr) {
        y[p] = solver->MakeBoolVar(fmt::format("y_{}", p));
        link = solver->MakeRowConstraint(0.0, 0.0);
        link->SetCoefficient(y[p], -1.0);
      }
      x[s][p] = solver->MakeBoolVar(fmt::format("x_{}_{}", p, s));
      link->SetCoefficient(x[s][p], 1.0);
    }
  }

  for (const std::size_t p : cs.locked()) {
    if (y[p] == nullptr)
      return finish(SolveStatus::infeasible);
    y[p]->SetLB(1.0);
  }

  for (std::size_t s = 0; s < r; ++s) {
    ort::MPConstraint *fill = solver->MakeRowConstraint(1.0, 1.0);
    for (std::size_t p = 0; p < n; ++p) {
      if (x[s][p] != nullptr)
        fill->SetCoefficient(x[s][p], 1.0);
    }
  }

  ort::MPConstraint *salary = solver->MakeRowConstraint(
      c.salary_floor > 0 ? static_cast<double>(c.salary_floor) : -inf,
      static_cast<double>(c.salary_cap));
  for (std::size_t p = 0; p < n; ++p) {
    if (y[p] != nullptr)
      salary->SetCoefficient(y[p], static_cast<double>(pool.at(p).salary));
  }

  if (c.max_per_team > 0) {
    std::vector<ort::MPConstraint *> team(
        static_cast<std::size_t>(cs.n_teams()), nullptr);
    for (std::size_t p = 0; p < n; ++p) {
      if (y[p] == nullptr)
        continue;
      auto &row = team[static_cast<std::size_t>(cs.team_of(p))];
      if (row == nullptr)
        row = solver->MakeRowConstraint(-inf, c.max_per_team);
      row->SetCoefficient(y[p], 1.0);
    }
  }

  for (const auto &stack : cs.stacks()) {
    ort::MPConstraint *group = solver->MakeRowConstraint(
        stack.min_count,
        stack.max_count >= 0 ? static_cast<double>(stack.max_count) : inf);
    for (const std::size_t p : stack.group) {
      if (y[p] != nullptr)
        group->SetCoefficient(y[p], 1.0);
    }
    if (stack.bring_back_min > 0) {
      ort::MPConstraint *bring =
          solver->MakeRowConstraint(stack.bring_back_min, inf);
      for (const std::size_t p : stack.bring_back) {
        if (y[p] != nullptr)
          bring->SetCoefficient(y[p], 1.0);
      }
    }
  }

  if (c.min_games > 0) {
    // z_g <= sum of y_p in game g; at least min_games games with z_g = 1.
    const auto n_games = static_cast<std::size_t>(cs.n_games());
    std::vector<ort::MPVariable *> z(n_games, nullptr);
    std::vector<ort::MPConstraint *> used(n_games, nullptr);
    ort::MPConstraint *games = solver->MakeRowConstraint(c.min_games, inf);
    for (std::size_t g = 0; g < n_games; ++g) {
      z[g] = solver->MakeBoolVar(fmt::format("z_{}", g));
      used[g] = solver->MakeRowConstraint(-inf, 0.0);
      used[g]->SetCoefficient(z[g], 1.0);
      games->SetCoefficient(z[g], 1.0);
    }
    for (std::size_t p = 0; p < n; ++p) {
      if (y[p] != nullptr)
        used[static_cast<std::size_t>(cs.game_of(p))]->SetCoefficient(y[p],
                                                                      -1.0);
    }
  }

  const double limit_shared = cs.max_shared();
  for (const auto &lu : prior) {
    ort::MPConstraint *cut = solver->MakeRowConstraint(-inf, limit_shared);
    for (const auto &s : lu.slots) {
      if (s.pool_index < n && y[s.pool_index] != nullptr)
        cut->SetCoefficient(y[s.pool_index], 1.0);
    }
  }

  ort::MPObjective *objective = solver->MutableObjective();
  for (std::size_t p = 0; p < n; ++p) {
    if (y[p] != nullptr)
      objective->SetCoefficient(y[p], values_[p]);
  }
  objective->SetMaximization();

  if (cfg.time_limit_seconds > 0.0) {
    solver->SetTimeLimit(absl::Milliseconds(
        static_cast<std::int64_t>(std::ceil(cfg.time_limit_seconds * 1000.0))));
  }
  if (cfg.max_nodes > 0 &&
      solver->ProblemType() == ort::MPSolver::SCIP_MIXED_INTEGER_PROGRAMMING) {
    solver->SetSolverSpecificParametersAsString(
        fmt::format("limits/nodes = {}\n", cfg.max_nodes));
  }
  ort::MPSolverParameters params;
  params.SetDoubleParam(ort::MPSolverParameters::RELATIVE_MIP_GAP, 0.0);

  CancelWatch watch(*solver, cancel);
  const ort::MPSolver::ResultStatus result = solver->Solve(params);
  watch.stop();
  out.nodes = static_cast<long long>(solver->nodes());

  SolveStatus status = SolveStatus::infeasible;
  switch (result) {
  case ort::MPSolver::OPTIMAL:
    status = SolveStatus::optimal;
    break;
  case ort::MPSolver::FEASIBLE:
    status = SolveStatus::feasible;
    break;
  case ort::MPSolver::INFEASIBLE:
    status = SolveStatus::infeasible;
    break;
  case ort::MPSolver::NOT_SOLVED:
    status = SolveStatus::timeout;
    break;
  default:
    throw SolverError(fmt::format("{} backend stopped with result status {}",
                                  cfg.backend, static_cast<int>(result)));
  }

  if (status == SolveStatus::optimal || status == SolveStatus::feasible) {
    LineupCandidate cand;
    out.slot_players.assign(r, 0);
    for (std::size_t s = 0; s < r; ++s) {
      for (std::size_t p = 0; p < n; ++p) {
        if (x[s][p] != nullptr && x[s][p]->solution_value() > 0.5) {
          out.slot_players[s] = p;
          cand.picks.push_back({s, p});
          out.objective += values_[p];
          break;
        }
      }
    }
    if (!cs.is_feasible(cand, prior)) {
      throw SolverError(fmt::format(
          "{} backend returned an assignment that breaks the roster rules",
          cfg.backend));
    }
  }

  if (watch.fired() || is_cancelled(cancel))
    status = SolveStatus::cancelled;
  return finish(status);
}

} // namespace dfs_core
