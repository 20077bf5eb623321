#include "dfs_core/correlation.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include <fmt/format.h>

#include "dfs_core/errors.hpp"

namespace dfs_core {

namespace {

bool is_qb(const Player &p) { return p.has_position("QB"); }
bool is_rb(const Player &p) { return p.has_position("RB"); }
bool is_pass_catcher(const Player &p) {
  return p.has_position("WR") || p.has_position("TE");
}
bool is_dst(const Player &p) {
  return p.has_position("DST") || p.has_position("D");
}

// Coefficient for an ordered pair (a, b); 0 when no rule applies.
std::pair<double, const char *> rule_for(const Player &a, const Player &b,
                                         const CorrelationRules &r) {
  if (a.team == b.team) {
    if (is_qb(a) && is_pass_catcher(b))
      return {r.qb_pass_catcher, "qb_pass_catcher"};
    if (is_qb(a) && is_rb(b))
      return {r.qb_rb, "qb_rb"};
    if (is_pass_catcher(a) && is_pass_catcher(b))
      return {r.pass_catchers, "pass_catchers"};
    if (is_rb(a) && is_dst(b))
      return {r.rb_own_dst, "rb_own_dst"};
    return {0.0, ""};
  }
  if (!a.opponent.empty() && a.opponent == b.team) {
    if (is_qb(a) && is_pass_catcher(b))
      return {r.bring_back, "bring_back"};
    if (is_dst(a) && is_qb(b))
      return {r.dst_vs_qb, "dst_vs_qb"};
    if (is_dst(a) && is_rb(b))
      return {r.dst_vs_rb, "dst_vs_rb"};
    if (is_dst(a) && is_pass_catcher(b))
      return {r.dst_vs_pass_catcher, "dst_vs_pass_catcher"};
  }
  return {0.0, ""};
}

bool factorise(const Eigen::MatrixXd &m, Eigen::MatrixXd &lower) {
  Eigen::LLT<Eigen::MatrixXd> llt(m);
  if (llt.info() != Eigen::Success)
    return false;
  lower = llt.matrixL();
  return lower.allFinite();
}

} // namespace

std::vector<CorrelationEntry> heuristic_entries(const PlayerPool &pool,
                                                const CorrelationRules &rules) {
  std::vector<CorrelationEntry> out;
  const auto &players = pool.players();
  for (std::size_t i = 0; i < players.size(); ++i) {
    for (std::size_t j = i + 1; j < players.size(); ++j) {
      auto rule = rule_for(players[i], players[j], rules);
      if (rule.first == 0.0)
        rule = rule_for(players[j], players[i], rules);
      if (rule.first != 0.0) {
        out.emplace_back(players[i].id, players[j].id, rule.first, rule.second);
      }
    }
  }
  return out;
}

CorrelationMatrix
CorrelationMatrix::build(const PlayerPool &pool,
                         const std::vector<CorrelationEntry> &entries,
                         const CorrelationBuildConfig &cfg) {
  if (!(cfg.min_eigenvalue > 0.0) || cfg.max_iterations < 1) {
    throw ValidationError("correlation build: min_eigenvalue must be > 0 and "
                          "max_iterations >= 1");
  }
  const Eigen::Index n = static_cast<Eigen::Index>(pool.size());
  Eigen::MatrixXd c = Eigen::MatrixXd::Identity(n, n);
  std::map<std::pair<Eigen::Index, Eigen::Index>, double> seen;

  for (const auto &e : entries) {
    if (!std::isfinite(e.coefficient) || e.coefficient < -1.0 ||
        e.coefficient > 1.0) {
      throw InvalidCorrelationError(
          fmt::format("correlation {}-{} = {} outside [-1, 1]", e.player_a,
                      e.player_b, e.coefficient));
    }
    if (!pool.has_id(e.player_a) || !pool.has_id(e.player_b)) {
      throw InvalidCorrelationError(fmt::format(
          "correlation entry references unknown player ({}, {})", e.player_a,
          e.player_b));
    }
    const auto a = static_cast<Eigen::Index>(pool.index_of(e.player_a));
    const auto b = static_cast<Eigen::Index>(pool.index_of(e.player_b));
    if (a == b) {
      if (std::abs(e.coefficient - 1.0) > 1e-12) {
        throw InvalidCorrelationError(fmt::format(
            "self-correlation of {} must be 1, got {}", e.player_a,
            e.coefficient));
      }
      continue;
    }
    const auto key = std::make_pair(std::min(a, b), std::max(a, b));
    auto it = seen.find(key);
    if (it != seen.end()) {
      if (std::abs(it->second - e.coefficient) > 1e-12) {
        throw InvalidCorrelationError(fmt::format(
            "conflicting correlations for ({}, {}): {} vs {}", e.player_a,
            e.player_b, it->second, e.coefficient));
      }
      continue;
    }
    seen.emplace(key, e.coefficient);
    c(a, b) = e.coefficient;
    c(b, a) = e.coefficient;
  }

  CorrelationMatrix out;
  out.corr_ = c;
  if (n == 0) {
    out.chol_ = c;
    return out;
  }

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es0(c);
  if (es0.info() != Eigen::Success) {
    throw InvalidCorrelationError("correlation eigen-decomposition failed");
  }
  out.adjustment_.min_eigenvalue_before = es0.eigenvalues().minCoeff();

  if (factorise(c, out.chol_))
    return out;

  // Nearest-PSD by eigenvalue clipping, rescaled back to a unit diagonal.
  // The clipping floor grows when the rescaled matrix still fails LLT.
  Eigen::MatrixXd x = c;
  double floor_ev = cfg.min_eigenvalue;
  bool ok = false;
  int it = 0;
  for (; it < cfg.max_iterations && !ok; ++it) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(x);
    if (es.info() != Eigen::Success)
      break;
    const Eigen::VectorXd vals = es.eigenvalues().cwiseMax(floor_ev);
    x = es.eigenvectors() * vals.asDiagonal() * es.eigenvectors().transpose();
    const Eigen::VectorXd inv_sqrt = x.diagonal().cwiseSqrt().cwiseInverse();
    x = inv_sqrt.asDiagonal() * x * inv_sqrt.asDiagonal();
    x = 0.5 * (x + x.transpose());
    x = x.cwiseMax(-1.0).cwiseMin(1.0);
    x.diagonal().setOnes();
    ok = factorise(x, out.chol_);
    floor_ev *= 10.0;
  }
  if (!ok) {
    throw InvalidCorrelationError(
        fmt::format("correlation matrix could not be corrected to positive "
                    "semi-definite after {} iterations",
                    it));
  }
  out.adjustment_.adjusted = true;
  out.adjustment_.iterations = it;
  out.adjustment_.max_abs_change = (x - c).cwiseAbs().maxCoeff();
  out.corr_ = x;
  return out;
}

CorrelationMatrix CorrelationMatrix::independent(std::size_t n) {
  CorrelationMatrix out;
  const auto k = static_cast<Eigen::Index>(n);
  out.corr_ = Eigen::MatrixXd::Identity(k, k);
  out.chol_ = Eigen::MatrixXd::Identity(k, k);
  out.adjustment_.min_eigenvalue_before = 1.0;
  return out;
}

Eigen::MatrixXd
CorrelationMatrix::correlate(const Eigen::MatrixXd &independent_z) const {
  if (independent_z.rows() != chol_.rows()) {
    throw ValidationError(fmt::format(
        "CorrelationMatrix.correlate: got {} rows for a {}x{} matrix",
        independent_z.rows(), chol_.rows(), chol_.cols()));
  }
  return chol_.triangularView<Eigen::Lower>() * independent_z;
}

} // namespace dfs_core
