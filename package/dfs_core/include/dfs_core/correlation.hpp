#pragma once

#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "dfs_core/player.hpp"

namespace dfs_core {

struct CorrelationEntry {
  std::string player_a;
  std::string player_b;
  double coefficient{0.0};
  std::string reason;

  CorrelationEntry() = default;
  CorrelationEntry(std::string a, std::string b, double c, std::string why = {})
      : player_a(std::move(a)), player_b(std::move(b)), coefficient(c),
        reason(std::move(why)) {}
};

// Defaults for the rule-based entry generator. The values are starting
// points to be calibrated against historical slates.
struct CorrelationRules {
  double qb_pass_catcher{0.65}; // QB with same-team WR/TE
  double qb_rb{0.20};           // QB with same-team RB
  double pass_catchers{0.10};   // same-team WR/TE pairs
  double bring_back{0.25};      // QB with opposing WR/TE
  double rb_own_dst{0.10};      // RB with own DST
  double dst_vs_qb{-0.40};
  double dst_vs_rb{-0.35};
  double dst_vs_pass_catcher{-0.20};
};

std::vector<CorrelationEntry> heuristic_entries(const PlayerPool &pool,
                                                const CorrelationRules &rules);

struct CorrelationBuildConfig {
  double min_eigenvalue{1e-8};
  int max_iterations{50};
};

// What the nearest-PSD correction changed.
struct CorrelationAdjustment {
  bool adjusted{false};
  double min_eigenvalue_before{1.0};
  double max_abs_change{0.0};
  int iterations{0};
};

// Full pairwise correlation matrix over the pool, aligned to pool index
// order. Always symmetric, unit-diagonal, entries in [-1, 1] and positive
// (semi-)definite with a successful Cholesky factorisation.
class CorrelationMatrix {
public:
  CorrelationMatrix() = default;

  // Throws InvalidCorrelationError for out-of-range or NaN coefficients,
  // unknown ids, conflicting duplicate pairs, non-unit self entries, or a
  // matrix the correction cannot make factorisable.
  static CorrelationMatrix build(const PlayerPool &pool,
                                 const std::vector<CorrelationEntry> &entries,
                                 const CorrelationBuildConfig &cfg = {});

  // Identity correlation for a pool of n players.
  static CorrelationMatrix independent(std::size_t n);

  std::size_t size() const { return static_cast<std::size_t>(corr_.rows()); }
  double at(std::size_t i, std::size_t j) const {
    return corr_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
  }
  const Eigen::MatrixXd &matrix() const { return corr_; }
  // Lower-triangular L with matrix() == L * L^T.
  const Eigen::MatrixXd &cholesky() const { return chol_; }
  const CorrelationAdjustment &adjustment() const { return adjustment_; }

  // Z_corr = L * Z_indep, column-wise.
  Eigen::MatrixXd correlate(const Eigen::MatrixXd &independent_z) const;

private:
  Eigen::MatrixXd corr_;
  Eigen::MatrixXd chol_;
  CorrelationAdjustment adjustment_{};
};

} // namespace dfs_core
