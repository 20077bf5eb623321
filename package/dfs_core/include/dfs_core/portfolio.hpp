#pragma once

#include <limits>
#include <map>
#include <string>
#include <vector>

#include "dfs_core/lineup.hpp"
#include "dfs_core/log.hpp"
#include "dfs_core/player.hpp"
#include "dfs_core/simulator.hpp"

namespace dfs_core {

struct ExposureTarget {
  std::string player_id;
  double min_exposure{0.0};
  double max_exposure{1.0};
};

// A NaN threshold is disabled.
struct PortfolioThresholds {
  double min_roi{std::numeric_limits<double>::quiet_NaN()};
  double min_win_probability{std::numeric_limits<double>::quiet_NaN()};
  double max_duplicate_risk{std::numeric_limits<double>::quiet_NaN()};
  double min_leverage{std::numeric_limits<double>::quiet_NaN()};
  double max_total_ownership{std::numeric_limits<double>::quiet_NaN()};
  int field_size{1000}; // entries assumed when scoring duplicate risk
  LogLevel log_level{LogLevel::warn};

  void validate() const;
};

struct ExcludedLineup {
  std::string lineup_id;
  // roi_floor, win_probability, duplicate_risk, leverage, total_ownership
  // or exposure
  std::string reason;
};

struct UnmetMinimum {
  std::string player_id;
  double target{0.0};
  double achieved{0.0};
};

struct FilterResult {
  std::vector<Lineup> kept;               // input order
  std::vector<ExcludedLineup> excluded;   // input order
  std::map<std::string, double> exposure; // player id -> percent of kept
  std::vector<UnmetMinimum> unmet_minimums;
};

// Expected number of identical entries in a field of `field_size`.
double duplicate_risk(const Lineup &lineup, const PlayerPool &pool,
                      int field_size);
// Ownership-weighted share of the lineup's upside, in [0, 1].
double leverage_score(const Lineup &lineup, const PlayerPool &pool);
double total_ownership(const Lineup &lineup, const PlayerPool &pool);

// Partitions a lineup batch into kept and excluded lineups. Lineups are
// copied, never modified.
class PortfolioFilter {
public:
  explicit PortfolioFilter(const PlayerPool &pool) : pool_(&pool) {}

  // Throws ValidationError for unknown target ids, bad exposure bounds,
  // duplicate lineup ids, or a simulation-based threshold without a matching
  // simulation result.
  FilterResult filter(const std::vector<Lineup> &lineups,
                      const std::vector<SimulationResult> &sim_results,
                      const std::vector<ExposureTarget> &targets,
                      const PortfolioThresholds &thresholds) const;

private:
  const PlayerPool *pool_{nullptr};
};

} // namespace dfs_core
