#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "dfs_core/cancellation.hpp"
#include "dfs_core/config.hpp"
#include "dfs_core/correlation.hpp"
#include "dfs_core/field.hpp"
#include "dfs_core/lineup.hpp"
#include "dfs_core/player.hpp"
#include "dfs_core/projection.hpp"

namespace dfs_core {

// Finishing ranks [min_rank, max_rank] (1-based, inclusive) pay `amount`.
struct PayoutTier {
  int min_rank{1};
  int max_rank{1};
  double amount{0.0};
};

struct ContestConfig {
  ContestType type{ContestType::gpp};
  Sport sport{Sport::nfl};
  int field_size{1000}; // entries including ours
  double entry_fee{20.0};
  double rake{0.15}; // share of entry fees not paid out (gpp default table)
  std::vector<PayoutTier> payouts; // empty: default table for `type`

  void validate() const;
};

// cash: double-up, top 45% paid 1.8x entry. gpp: top 20% paid, amounts
// proportional to 1/rank over the prize pool.
std::vector<PayoutTier> default_payouts(const ContestConfig &contest);

// Score lines from the contest thresholds per sport and contest type.
double default_cash_line(Sport sport, ContestType type);
double default_boom_line(Sport sport, ContestType type);

struct SimulationConfig {
  long long trials{10000};
  std::uint64_t seed{0};
  DistributionMode mode{DistributionMode::normal};
  // Normal draws below zero become zero. Lognormal never goes negative.
  bool clamp_negative{true};
  int chunk_size{4096};
  int histogram_bins{4096};
  int threads{0}; // 0: OpenMP default
  // NaN: derived from the contest's sport and type.
  double target_score{std::numeric_limits<double>::quiet_NaN()};
  double cash_line{std::numeric_limits<double>::quiet_NaN()};
  double boom_line{std::numeric_limits<double>::quiet_NaN()};
  // Budgets; exceeding any raises ResourceBudgetExceeded. <= 0: unlimited.
  long long max_trials{5000000};
  long long max_memory_bytes{1LL << 30};
  double max_seconds{0.0};
  LogLevel log_level{LogLevel::warn};

  void validate() const;
};

struct SimulationResult {
  std::string lineup_id;
  double mean{0.0};
  double stdev{0.0};
  double p5{0.0};
  double p25{0.0};
  double p50{0.0};
  double p75{0.0};
  double p95{0.0};
  double min{0.0};
  double max{0.0};
  double target_probability{0.0};
  double cash_rate{0.0};
  double boom_rate{0.0};
  // NaN when no opponent field was supplied.
  double win_probability{std::numeric_limits<double>::quiet_NaN()};
  double expected_payout{std::numeric_limits<double>::quiet_NaN()};
  double roi{std::numeric_limits<double>::quiet_NaN()};
};

struct PlayerSimMetrics {
  std::string player_id;
  double mean{0.0};
  double stdev{0.0};
  double boom_rate{0.0}; // P(score >= ceiling)
  double bust_rate{0.0}; // P(score <= floor)
};

struct SimulationReport {
  long long trials_requested{0};
  long long trials_run{0};
  std::uint64_t seed{0};
  DistributionMode mode{DistributionMode::normal};
  double elapsed_seconds{0.0};
  int chunks{0};
  bool cancelled{false};
  double target_score{0.0};
  double cash_line{0.0};
  double boom_line{0.0};
  int field_lineups{0};
  CorrelationAdjustment correlation{};
  std::vector<SimulationResult> results; // input lineup order
  std::vector<PlayerSimMetrics> players; // pool order
};

// Correlated Monte Carlo over a lineup batch. Trials run in fixed-size
// chunks, each with its own seed mix_seed(seed, chunk); chunks are spread
// over OpenMP threads and merged in chunk order, so reports are identical
// for any thread count. Raw draws never outlive their chunk.
class SimulationEngine {
public:
  // Throws ValidationError for invalid configs or a correlation matrix
  // whose size differs from the pool.
  SimulationEngine(const PlayerPool &pool, const CorrelationMatrix &corr,
                   SimulationConfig cfg, ContestConfig contest = {});

  // Throws ValidationError for lineups referencing players outside the pool
  // and ResourceBudgetExceeded when a budget would be or was exceeded.
  // Cancellation between chunk waves returns a partial report.
  SimulationReport run(const std::vector<Lineup> &lineups,
                       const OpponentField &field = {},
                       const CancellationToken *cancel = nullptr) const;

  // Player scores (players x n_trials) of one chunk.
  Eigen::MatrixXd sample_chunk(std::size_t chunk_index, int n_trials) const;

  // Expected score and standard deviation of a lineup from the marginals and
  // the correlation matrix.
  double analytic_mean(const std::vector<std::size_t> &players) const;
  double analytic_stdev(const std::vector<std::size_t> &players) const;

  // Working set of one chunk wave plus the merged histograms.
  long long estimated_memory_bytes(std::size_t n_lineups,
                                   std::size_t field_lineups) const;

  const SimulationConfig &config() const { return cfg_; }
  const ContestConfig &contest() const { return contest_; }
  double target_score() const { return target_; }
  double cash_line() const { return cash_line_; }
  double boom_line() const { return boom_line_; }

private:
  int wave_size() const;

  const PlayerPool *pool_{nullptr};
  const CorrelationMatrix *corr_{nullptr};
  SimulationConfig cfg_;
  ContestConfig contest_;
  std::vector<Marginal> marginals_;
  std::vector<double> payout_by_rank_; // index = rank, 0 unused
  double target_{0.0};
  double cash_line_{0.0};
  double boom_line_{0.0};
};

} // namespace dfs_core
