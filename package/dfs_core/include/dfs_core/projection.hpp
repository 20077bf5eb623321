#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "dfs_core/config.hpp"
#include "dfs_core/player.hpp"

namespace dfs_core {

// splitmix64-style mixing to decorrelate seeds
inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

inline double normal_cdf(double z) {
  return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

// Simple triangular distribution parameterized by low <= mode <= high.
struct Triangular {
  double low{0.0};
  double mode{0.0};
  double high{0.0};

  Triangular() = default;
  Triangular(double low_, double mode_, double high_)
      : low(low_), mode(mode_), high(high_) {
    if (!(low <= mode && mode <= high)) {
      throw std::invalid_argument("Triangular: require low <= mode <= high");
    }
  }

  // Triangular over [low, high] whose mean is as close to `mean` as the
  // support allows.
  static Triangular with_mean(double low, double mean, double high) {
    double m = 3.0 * mean - low - high;
    if (m < low)
      m = low;
    if (m > high)
      m = high;
    return Triangular(low, m, high);
  }

  double mean() const { return (low + mode + high) / 3.0; }

  double variance() const {
    const double l = low, m = mode, h = high;
    return (l * l + m * m + h * h - l * m - l * h - m * h) / 18.0;
  }

  // Inverse CDF for u in [0, 1].
  double quantile(double u) const {
    const double range = high - low;
    if (range <= 0.0)
      return low;
    const double c = (mode - low) / range;
    if (u < c)
      return low + std::sqrt(u * range * (mode - low));
    return high - std::sqrt((1.0 - u) * range * (high - mode));
  }
};

// Maps a correlated standard normal draw to one player's score.
class Marginal {
public:
  Marginal() = default;
  Marginal(const Player &p, DistributionMode mode, bool clamp_negative);

  double transform(double z) const;

  double mean() const { return mean_; }
  double stdev() const { return sd_; }
  DistributionMode mode() const { return mode_; }

  // Analytic mean/stdev of the transformed score, used to size histograms
  // and to check convergence. Clamping is ignored.
  double analytic_mean() const;
  double analytic_stdev() const;

private:
  DistributionMode mode_{DistributionMode::normal};
  double mean_{0.0};
  double sd_{0.0};
  bool clamp_{true};
  bool constant_{false};
  // lognormal
  double mu_{0.0};
  double sigma_{0.0};
  // empirical
  std::vector<double> sorted_samples_;
  Triangular tri_{};
};

std::vector<Marginal> build_marginals(const PlayerPool &pool,
                                      DistributionMode mode,
                                      bool clamp_negative);

} // namespace dfs_core
