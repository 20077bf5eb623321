#include "dfs_core/projection.hpp"

#include <algorithm>

namespace dfs_core {

Marginal::Marginal(const Player &p, DistributionMode mode, bool clamp_negative)
    : mode_(mode), mean_(p.projection), sd_(p.effective_stdev()),
      clamp_(clamp_negative) {
  switch (mode_) {
  case DistributionMode::normal:
    constant_ = sd_ <= 0.0;
    break;
  case DistributionMode::lognormal:
    // Moment matched: E = exp(mu + s^2/2), Var = (exp(s^2) - 1) E^2.
    if (mean_ <= 0.0 || sd_ <= 0.0) {
      constant_ = true;
    } else {
      sigma_ = std::sqrt(std::log1p((sd_ * sd_) / (mean_ * mean_)));
      mu_ = std::log(mean_) - 0.5 * sigma_ * sigma_;
    }
    break;
  case DistributionMode::empirical:
    if (!p.outcome_samples.empty()) {
      sorted_samples_ = p.outcome_samples;
      std::sort(sorted_samples_.begin(), sorted_samples_.end());
      constant_ = sorted_samples_.front() == sorted_samples_.back();
    } else {
      const double lo = std::min(p.effective_floor(), mean_);
      const double hi = std::max(p.effective_ceiling(), mean_);
      tri_ = Triangular::with_mean(lo, mean_, hi);
      constant_ = hi <= lo;
    }
    break;
  }
}

double Marginal::transform(double z) const {
  double v = 0.0;
  if (constant_) {
    if (mode_ == DistributionMode::empirical) {
      v = sorted_samples_.empty() ? tri_.low : sorted_samples_.front();
    } else {
      v = mean_;
    }
  } else {
    switch (mode_) {
    case DistributionMode::normal:
      v = mean_ + sd_ * z;
      break;
    case DistributionMode::lognormal:
      v = std::exp(mu_ + sigma_ * z);
      break;
    case DistributionMode::empirical: {
      const double u = normal_cdf(z);
      if (sorted_samples_.empty()) {
        v = tri_.quantile(u);
      } else {
        const double pos = u * static_cast<double>(sorted_samples_.size() - 1);
        const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
        const std::size_t hi = std::min(lo + 1, sorted_samples_.size() - 1);
        const double frac = pos - static_cast<double>(lo);
        v = sorted_samples_[lo] + frac * (sorted_samples_[hi] - sorted_samples_[lo]);
      }
      break;
    }
    }
  }
  if (clamp_ && v < 0.0)
    v = 0.0;
  return v;
}

double Marginal::analytic_mean() const {
  if (mode_ == DistributionMode::empirical) {
    if (!sorted_samples_.empty()) {
      double s = 0.0;
      for (const double x : sorted_samples_)
        s += x;
      return s / static_cast<double>(sorted_samples_.size());
    }
    return tri_.mean();
  }
  return mean_;
}

double Marginal::analytic_stdev() const {
  if (constant_)
    return 0.0;
  if (mode_ == DistributionMode::empirical) {
    if (!sorted_samples_.empty()) {
      const double m = analytic_mean();
      double ss = 0.0;
      for (const double x : sorted_samples_)
        ss += (x - m) * (x - m);
      return std::sqrt(ss / static_cast<double>(sorted_samples_.size()));
    }
    return std::sqrt(tri_.variance());
  }
  return sd_;
}

std::vector<Marginal> build_marginals(const PlayerPool &pool,
                                      DistributionMode mode,
                                      bool clamp_negative) {
  std::vector<Marginal> out;
  out.reserve(pool.size());
  for (const auto &p : pool.players()) {
    out.emplace_back(p, mode, clamp_negative);
  }
  return out;
}

} // namespace dfs_core
