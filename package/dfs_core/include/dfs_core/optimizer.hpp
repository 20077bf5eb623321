#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "dfs_core/cancellation.hpp"
#include "dfs_core/config.hpp"
#include "dfs_core/constraints.hpp"
#include "dfs_core/lineup.hpp"
#include "dfs_core/player.hpp"
#include "dfs_core/roster.hpp"
#include "dfs_core/solver.hpp"

namespace dfs_core {

struct OptimizerConfig {
  Objective objective{Objective::projection};
  // ev = projection + leverage_weight * (ceiling - projection) * (1 - own)
  double leverage_weight{0.5};
  int num_lineups{1};
  // Per-lineup uniform jitter of each player's value, as a fraction.
  double randomness{0.0};
  // Players reaching ceil(max_exposure * num_lineups) appearances are left
  // out of later solves.
  double max_exposure{1.0};
  // Per-player override of max_exposure, by player id; 0 keeps the player
  // out of every lineup unless locked.
  std::map<std::string, double> player_max_exposure;
  double time_limit_seconds{10.0}; // per lineup
  long long max_nodes{-1};
  std::string solver_backend{"SCIP"};
  std::uint64_t seed{0};
  LogLevel log_level{LogLevel::warn};

  // Throws ValidationError for out-of-range values.
  void validate() const;
};

enum class BatchState { initializing, solving, emitted, complete, failed };

const char *to_string(BatchState s);

struct BatchTransition {
  BatchState state{BatchState::initializing};
  int lineup_index{-1};
  std::string detail;
};

// How often one stack label occurs in a batch.
struct StackUsage {
  std::string label;
  int count{0};
  double percentage{0.0};
};

struct BatchResult {
  std::vector<Lineup> lineups;
  int requested{0};
  int delivered{0};
  bool complete{false};
  // "", "infeasible", "timeout" or "cancelled"
  std::string reason;
  std::optional<InfeasibilityReason> infeasibility;
  std::vector<BatchTransition> transitions;
  // Most used label first.
  std::vector<StackUsage> stack_summary;
};

// Generates batches of diverse lineups. Holds only read-only state, so
// several batches may run concurrently on one optimizer; the prior-lineup
// accumulator lives in each generate() call.
class LineupOptimizer {
public:
  // Throws ConstraintConfigError / ValidationError for bad definitions.
  LineupOptimizer(const PlayerPool &pool, const RosterSpec &roster,
                  const Constraints &constraints, OptimizerConfig cfg);

  // Objective value per player for the configured objective.
  const std::vector<double> &objective_values() const { return values_; }

  // Cheap checks run before any search. Throws InfeasibleError.
  void check_feasibility() const;

  // Best lineup sharing at most roster_size - U players with each of
  // `prior`. Throws InfeasibleError or TimeoutError.
  Lineup solve_one(const std::vector<Lineup> &prior,
                   int generation_index = -1) const;

  // Sequential batch with accumulating cutting planes. Infeasibility,
  // timeout and cancellation end the batch early with a reason instead of
  // throwing.
  BatchResult generate(int num_lineups = -1,
                       const CancellationToken *cancel = nullptr) const;

  const ConstraintSet &constraint_set() const { return cs_; }
  const OptimizerConfig &config() const { return cfg_; }

private:
  std::vector<double> jittered_values(int generation_index) const;
  SolveOutcome run_solve(const std::vector<Lineup> &prior,
                         const std::vector<char> &excluded,
                         int generation_index,
                         const CancellationToken *cancel) const;
  Lineup make_lineup(const SolveOutcome &outcome, int generation_index) const;
  // Relaxes the exclusions, then the prior lineups, then each structural
  // rule in turn, and names the first one whose removal makes a solve
  // feasible.
  InfeasibilityReason
  explain_infeasibility(const std::vector<Lineup> &prior,
                        const std::vector<char> &excluded) const;
  std::vector<int> exposure_caps(int num_lineups) const;

  const PlayerPool *pool_{nullptr};
  RosterSpec roster_;
  Constraints constraints_;
  ConstraintSet cs_;
  OptimizerConfig cfg_;
  std::vector<double> values_;
};

// Objective value of one player.
double objective_value(const Player &p, Objective objective,
                       double leverage_weight);

// "QB+<n> Stack (<team>)" when a quarterback is joined by n RB/WR/TE
// teammates, "Game Stack (<a>/<b>)" when both teams of one game supply at
// least two players, otherwise "No Stack".
std::string classify_stack(const Lineup &lineup, const PlayerPool &pool);

std::vector<StackUsage> summarize_stacks(const std::vector<Lineup> &lineups);

} // namespace dfs_core
