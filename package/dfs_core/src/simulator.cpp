#include "dfs_core/simulator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <random>
#include <utility>

#include <fmt/format.h>
#include <omp.h>

#include "dfs_core/errors.hpp"
#include "dfs_core/log.hpp"

namespace dfs_core {

namespace {

constexpr const char *kComponent = "simulator";
using Clock = std::chrono::steady_clock;

// Welford running moments; merge() is Chan's parallel update.
struct Moments {
  double n{0.0};
  double mean{0.0};
  double m2{0.0};

  void add(double x) {
    n += 1.0;
    const double d = x - mean;
    mean += d / n;
    m2 += d * (x - mean);
  }

  void merge(const Moments &o) {
    if (o.n == 0.0)
      return;
    if (n == 0.0) {
      *this = o;
      return;
    }
    const double total = n + o.n;
    const double d = o.mean - mean;
    mean += d * o.n / total;
    m2 += o.m2 + d * d * n * o.n / total;
    n = total;
  }

  double stdev() const { return n > 1.0 ? std::sqrt(m2 / (n - 1.0)) : 0.0; }
};

struct LineupAccum {
  Moments moments;
  std::vector<long long> hist;
  long long above_target{0};
  long long cashed{0};
  long long boomed{0};
  double win_sum{0.0};
  double payout_sum{0.0};
  double min{std::numeric_limits<double>::infinity()};
  double max{-std::numeric_limits<double>::infinity()};

  void merge(const LineupAccum &o) {
    moments.merge(o.moments);
    for (std::size_t b = 0; b < hist.size(); ++b)
      hist[b] += o.hist[b];
    above_target += o.above_target;
    cashed += o.cashed;
    boomed += o.boomed;
    win_sum += o.win_sum;
    payout_sum += o.payout_sum;
    min = std::min(min, o.min);
    max = std::max(max, o.max);
  }
};

struct PlayerAccum {
  Moments moments;
  long long boom{0};
  long long bust{0};

  void merge(const PlayerAccum &o) {
    moments.merge(o.moments);
    boom += o.boom;
    bust += o.bust;
  }
};

struct ChunkPartial {
  long long trials{0};
  std::vector<LineupAccum> lineups;
  std::vector<PlayerAccum> players;
};

struct HistRange {
  double lo{0.0};
  double width{1.0};
};

// Read-only state shared by all chunks of one run.
struct RunContext {
  std::vector<std::vector<std::size_t>> lineup_players;
  std::vector<HistRange> ranges;
  std::vector<double> player_ceiling;
  std::vector<double> player_floor;
  const OpponentField *field{nullptr};
  int bins{0};
  int field_size{1};
  double target{0.0};
  double cash_line{0.0};
  double boom_line{0.0};
};

double percentile(const LineupAccum &acc, const HistRange &range, double q) {
  const double n = acc.moments.n;
  if (n <= 0.0)
    return 0.0;
  const double target = q * n;
  long long cum = 0;
  for (std::size_t b = 0; b < acc.hist.size(); ++b) {
    const long long c = acc.hist[b];
    if (c > 0 && static_cast<double>(cum + c) >= target) {
      const double frac = (target - static_cast<double>(cum)) /
                          static_cast<double>(c);
      const double v =
          range.lo + (static_cast<double>(b) + frac) * range.width;
      return std::min(std::max(v, acc.min), acc.max);
    }
    cum += c;
  }
  return acc.max;
}

double sum_rows(const Eigen::MatrixXd &scores,
                const std::vector<std::size_t> &rows, Eigen::Index t) {
  double s = 0.0;
  for (const std::size_t i : rows)
    s += scores(static_cast<Eigen::Index>(i), t);
  return s;
}

} // namespace

// ContestConfig --------------------------------------------------------------

void ContestConfig::validate() const {
  if (field_size < 1) {
    throw ValidationError(
        fmt::format("contest field_size must be >= 1, got {}", field_size));
  }
  if (!(entry_fee > 0.0)) {
    throw ValidationError(
        fmt::format("contest entry_fee must be > 0, got {}", entry_fee));
  }
  if (!(rake >= 0.0 && rake < 1.0)) {
    throw ValidationError(
        fmt::format("contest rake must be within [0, 1), got {}", rake));
  }
  for (const auto &t : payouts) {
    if (t.min_rank < 1 || t.max_rank < t.min_rank || t.max_rank > field_size) {
      throw ValidationError(fmt::format(
          "payout tier [{}, {}] outside ranks 1..{}", t.min_rank, t.max_rank,
          field_size));
    }
    if (!(t.amount >= 0.0)) {
      throw ValidationError(
          fmt::format("payout amount must be >= 0, got {}", t.amount));
    }
  }
}

std::vector<PayoutTier> default_payouts(const ContestConfig &contest) {
  const int f = contest.field_size;
  std::vector<PayoutTier> tiers;
  if (contest.type == ContestType::cash) {
    const int paid = std::max(1, static_cast<int>(std::floor(0.45 * f)));
    tiers.push_back({1, paid, 1.8 * contest.entry_fee});
    return tiers;
  }
  const int paid = std::max(1, f / 5);
  const double prize_pool = (1.0 - contest.rake) * f * contest.entry_fee;
  double harmonic = 0.0;
  for (int r = 1; r <= paid; ++r)
    harmonic += 1.0 / r;
  tiers.reserve(static_cast<std::size_t>(paid));
  for (int r = 1; r <= paid; ++r)
    tiers.push_back({r, r, prize_pool / (r * harmonic)});
  return tiers;
}

double default_cash_line(Sport sport, ContestType type) {
  if (sport == Sport::nba)
    return type == ContestType::cash ? 250.0 : 280.0;
  return type == ContestType::cash ? 120.0 : 140.0;
}

double default_boom_line(Sport sport, ContestType type) {
  if (sport == Sport::nba)
    return type == ContestType::cash ? 400.0 : 450.0;
  return type == ContestType::cash ? 200.0 : 250.0;
}

// SimulationConfig -----------------------------------------------------------

void SimulationConfig::validate() const {
  if (trials < 1)
    throw ValidationError(fmt::format("trials must be >= 1, got {}", trials));
  if (chunk_size < 1) {
    throw ValidationError(
        fmt::format("chunk_size must be >= 1, got {}", chunk_size));
  }
  if (histogram_bins < 16) {
    throw ValidationError(
        fmt::format("histogram_bins must be >= 16, got {}", histogram_bins));
  }
  if (threads < 0)
    throw ValidationError(fmt::format("threads must be >= 0, got {}", threads));
  if (std::isinf(target_score) || std::isinf(cash_line) ||
      std::isinf(boom_line)) {
    throw ValidationError("score lines must be finite");
  }
}

// SimulationEngine -----------------------------------------------------------

SimulationEngine::SimulationEngine(const PlayerPool &pool,
                                   const CorrelationMatrix &corr,
                                   SimulationConfig cfg, ContestConfig contest)
    : pool_(&pool), corr_(&corr), cfg_(cfg), contest_(std::move(contest)) {
  cfg_.validate();
  contest_.validate();
  if (corr.size() != pool.size()) {
    throw ValidationError(
        fmt::format("correlation matrix is {0}x{0} but the pool has {1} players",
                    corr.size(), pool.size()));
  }
  marginals_ = build_marginals(pool, cfg_.mode, cfg_.clamp_negative);

  cash_line_ = std::isnan(cfg_.cash_line)
                   ? default_cash_line(contest_.sport, contest_.type)
                   : cfg_.cash_line;
  boom_line_ = std::isnan(cfg_.boom_line)
                   ? default_boom_line(contest_.sport, contest_.type)
                   : cfg_.boom_line;
  target_ = std::isnan(cfg_.target_score) ? cash_line_ : cfg_.target_score;

  const std::vector<PayoutTier> tiers =
      contest_.payouts.empty() ? default_payouts(contest_) : contest_.payouts;
  payout_by_rank_.assign(static_cast<std::size_t>(contest_.field_size) + 1,
                         0.0);
  for (const auto &t : tiers) {
    for (int r = t.min_rank; r <= t.max_rank; ++r)
      payout_by_rank_[static_cast<std::size_t>(r)] = t.amount;
  }
}

int SimulationEngine::wave_size() const {
  return cfg_.threads > 0 ? cfg_.threads : std::max(1, omp_get_max_threads());
}

Eigen::MatrixXd SimulationEngine::sample_chunk(std::size_t chunk_index,
                                               int n_trials) const {
  const Eigen::Index p = static_cast<Eigen::Index>(pool_->size());
  std::mt19937_64 rng(mix_seed(cfg_.seed, chunk_index));
  std::normal_distribution<double> norm(0.0, 1.0);
  Eigen::MatrixXd z(p, n_trials);
  for (Eigen::Index t = 0; t < n_trials; ++t) {
    for (Eigen::Index i = 0; i < p; ++i)
      z(i, t) = norm(rng);
  }
  Eigen::MatrixXd scores = corr_->correlate(z);
  for (Eigen::Index t = 0; t < n_trials; ++t) {
    for (Eigen::Index i = 0; i < p; ++i) {
      scores(i, t) =
          marginals_[static_cast<std::size_t>(i)].transform(scores(i, t));
    }
  }
  return scores;
}

double SimulationEngine::analytic_mean(
    const std::vector<std::size_t> &players) const {
  double m = 0.0;
  for (const std::size_t i : players)
    m += marginals_.at(i).analytic_mean();
  return m;
}

double SimulationEngine::analytic_stdev(
    const std::vector<std::size_t> &players) const {
  double var = 0.0;
  for (const std::size_t i : players) {
    for (const std::size_t j : players) {
      var += marginals_.at(i).analytic_stdev() *
             marginals_.at(j).analytic_stdev() * corr_->at(i, j);
    }
  }
  return std::sqrt(std::max(0.0, var));
}

long long
SimulationEngine::estimated_memory_bytes(std::size_t n_lineups,
                                         std::size_t field_lineups) const {
  const long long d = static_cast<long long>(sizeof(double));
  const long long p = static_cast<long long>(pool_->size());
  const long long l = static_cast<long long>(n_lineups);
  const long long k = static_cast<long long>(field_lineups);
  const long long chunk = std::min<long long>(cfg_.chunk_size, cfg_.trials);
  // z and correlated scores, field scores, lineup histograms and accumulators
  const long long per_chunk = chunk * p * 2 * d + k * d +
                              l * cfg_.histogram_bins * d +
                              l * static_cast<long long>(sizeof(LineupAccum)) +
                              p * static_cast<long long>(sizeof(PlayerAccum));
  const long long n_chunks = (cfg_.trials + cfg_.chunk_size - 1) / cfg_.chunk_size;
  const long long wave = std::min<long long>(wave_size(), n_chunks);
  return wave * per_chunk + l * cfg_.histogram_bins * d;
}

SimulationReport SimulationEngine::run(const std::vector<Lineup> &lineups,
                                       const OpponentField &field,
                                       const CancellationToken *cancel) const {
  const auto start = Clock::now();
  const std::size_t n_players = pool_->size();
  const std::size_t n_lineups = lineups.size();

  SimulationReport report;
  report.trials_requested = cfg_.trials;
  report.seed = cfg_.seed;
  report.mode = cfg_.mode;
  report.target_score = target_;
  report.cash_line = cash_line_;
  report.boom_line = boom_line_;
  report.field_lineups = static_cast<int>(field.size());
  report.correlation = corr_->adjustment();

  if (cfg_.max_trials > 0 && cfg_.trials > cfg_.max_trials) {
    throw ResourceBudgetExceeded(
        fmt::format("{} trials exceed the budget of {}", cfg_.trials,
                    cfg_.max_trials));
  }
  const long long mem = estimated_memory_bytes(n_lineups, field.size());
  if (cfg_.max_memory_bytes > 0 && mem > cfg_.max_memory_bytes) {
    throw ResourceBudgetExceeded(fmt::format(
        "estimated working set of {} bytes exceeds the budget of {} bytes",
        mem, cfg_.max_memory_bytes));
  }

  RunContext ctx;
  ctx.bins = cfg_.histogram_bins;
  ctx.field = field.empty() ? nullptr : &field;
  ctx.field_size = contest_.field_size;
  ctx.target = target_;
  ctx.cash_line = cash_line_;
  ctx.boom_line = boom_line_;
  for (const auto &p : pool_->players()) {
    ctx.player_ceiling.push_back(p.effective_ceiling());
    ctx.player_floor.push_back(p.effective_floor());
  }
  for (const auto &lu : lineups) {
    std::vector<std::size_t> rows;
    for (const auto &s : lu.slots) {
      if (s.pool_index >= n_players ||
          pool_->at(s.pool_index).id != s.player_id) {
        throw ValidationError(fmt::format(
            "lineup {} references player {} outside the pool", lu.id,
            s.player_id));
      }
      rows.push_back(s.pool_index);
    }
    const double mean = analytic_mean(rows);
    const double sd = analytic_stdev(rows);
    HistRange range;
    if (sd > 0.0) {
      range.lo = mean - 8.0 * sd;
      range.width = 16.0 * sd / ctx.bins;
    } else {
      range.lo = mean - 1.0;
      range.width = 2.0 / ctx.bins;
    }
    ctx.ranges.push_back(range);
    ctx.lineup_players.push_back(std::move(rows));
  }
  for (const auto &opp : field.lineups) {
    for (const std::size_t i : opp) {
      if (i >= n_players) {
        throw ValidationError(
            fmt::format("opponent lineup references pool index {}", i));
      }
    }
  }

  const auto run_chunk = [&](long long chunk) {
    ChunkPartial part;
    const long long first = chunk * cfg_.chunk_size;
    const int n = static_cast<int>(
        std::min<long long>(cfg_.chunk_size, cfg_.trials - first));
    part.trials = n;
    part.lineups.resize(n_lineups);
    for (auto &acc : part.lineups)
      acc.hist.assign(static_cast<std::size_t>(ctx.bins), 0);
    part.players.resize(n_players);

    const Eigen::MatrixXd scores =
        sample_chunk(static_cast<std::size_t>(chunk), n);
    std::vector<double> field_scores(ctx.field ? ctx.field->size() : 0);
    const double opponents = static_cast<double>(field_scores.size());
    const double others = static_cast<double>(ctx.field_size - 1);

    for (Eigen::Index t = 0; t < n; ++t) {
      for (std::size_t i = 0; i < n_players; ++i) {
        const double x = scores(static_cast<Eigen::Index>(i), t);
        PlayerAccum &pa = part.players[i];
        pa.moments.add(x);
        if (x >= ctx.player_ceiling[i])
          ++pa.boom;
        if (x <= ctx.player_floor[i])
          ++pa.bust;
      }
      if (ctx.field) {
        for (std::size_t k = 0; k < field_scores.size(); ++k)
          field_scores[k] = sum_rows(scores, ctx.field->lineups[k], t);
        std::sort(field_scores.begin(), field_scores.end());
      }
      for (std::size_t l = 0; l < n_lineups; ++l) {
        const double s = sum_rows(scores, ctx.lineup_players[l], t);
        LineupAccum &acc = part.lineups[l];
        acc.moments.add(s);
        acc.min = std::min(acc.min, s);
        acc.max = std::max(acc.max, s);
        const double pos = (s - ctx.ranges[l].lo) / ctx.ranges[l].width;
        const long long b = std::min<long long>(
            ctx.bins - 1, std::max<long long>(0, static_cast<long long>(
                                                     std::floor(pos))));
        ++acc.hist[static_cast<std::size_t>(b)];
        if (s > ctx.target)
          ++acc.above_target;
        if (s >= ctx.cash_line)
          ++acc.cashed;
        if (s >= ctx.boom_line)
          ++acc.boomed;
        if (ctx.field) {
          const auto lo =
              std::lower_bound(field_scores.begin(), field_scores.end(), s);
          const auto hi = std::upper_bound(lo, field_scores.end(), s);
          // Share of the field this lineup beats, ties counted half.
          const double q = (static_cast<double>(lo - field_scores.begin()) +
                            0.5 * static_cast<double>(hi - lo)) /
                           opponents;
          acc.win_sum += std::pow(q, others);
          const long long rank = 1 + std::llround(others * (1.0 - q));
          acc.payout_sum += payout_by_rank_[static_cast<std::size_t>(rank)];
        }
      }
    }
    return part;
  };

  std::vector<LineupAccum> total(n_lineups);
  for (auto &acc : total)
    acc.hist.assign(static_cast<std::size_t>(ctx.bins), 0);
  std::vector<PlayerAccum> player_total(n_players);

  const long long n_chunks =
      (cfg_.trials + cfg_.chunk_size - 1) / cfg_.chunk_size;
  const int wave = wave_size();
  log(cfg_.log_level, LogLevel::info, kComponent,
      "simulating {} lineups over {} trials ({} chunks, {} per wave, "
      "{} field lineups, mode {})",
      n_lineups, cfg_.trials, n_chunks, wave, field.size(),
      to_string(cfg_.mode));
  if (corr_->adjustment().adjusted) {
    log(cfg_.log_level, LogLevel::warn, kComponent,
        "correlation matrix was corrected (min eigenvalue {:.3g}, max change "
        "{:.3g})",
        corr_->adjustment().min_eigenvalue_before,
        corr_->adjustment().max_abs_change);
  }

  for (long long wave_start = 0; wave_start < n_chunks; wave_start += wave) {
    if (is_cancelled(cancel)) {
      report.cancelled = true;
      log(cfg_.log_level, LogLevel::warn, kComponent,
          "cancelled after {} of {} trials", report.trials_run, cfg_.trials);
      break;
    }
    const long long wave_end = std::min(n_chunks, wave_start + wave);
    std::vector<ChunkPartial> partials(
        static_cast<std::size_t>(wave_end - wave_start));
    std::exception_ptr error;

#pragma omp parallel for num_threads(wave) schedule(dynamic, 1)
    for (long long c = wave_start; c < wave_end; ++c) {
      try {
        partials[static_cast<std::size_t>(c - wave_start)] = run_chunk(c);
      } catch (...) {
#pragma omp critical(dfs_core_sim_error)
        {
          if (!error)
            error = std::current_exception();
        }
      }
    }
    if (error)
      std::rethrow_exception(error);

    // Merge in chunk order.
    for (const auto &part : partials) {
      for (std::size_t l = 0; l < n_lineups; ++l)
        total[l].merge(part.lineups[l]);
      for (std::size_t i = 0; i < n_players; ++i)
        player_total[i].merge(part.players[i]);
      report.trials_run += part.trials;
      ++report.chunks;
    }

    const double elapsed =
        std::chrono::duration<double>(Clock::now() - start).count();
    log(cfg_.log_level, LogLevel::debug, kComponent,
        "chunks {}-{} merged, {} trials, {:.3f}s", wave_start, wave_end - 1,
        report.trials_run, elapsed);
    if (cfg_.max_seconds > 0.0 && elapsed > cfg_.max_seconds &&
        report.trials_run < cfg_.trials) {
      throw ResourceBudgetExceeded(fmt::format(
          "{} of {} trials done after {:.3f}s, over the {:.3f}s budget",
          report.trials_run, cfg_.trials, elapsed, cfg_.max_seconds));
    }
  }

  report.results.reserve(n_lineups);
  for (std::size_t l = 0; l < n_lineups; ++l) {
    const LineupAccum &acc = total[l];
    SimulationResult r;
    r.lineup_id = lineups[l].id;
    const double n = acc.moments.n;
    if (n > 0.0) {
      r.mean = acc.moments.mean;
      r.stdev = acc.moments.stdev();
      r.p5 = percentile(acc, ctx.ranges[l], 0.05);
      r.p25 = percentile(acc, ctx.ranges[l], 0.25);
      r.p50 = percentile(acc, ctx.ranges[l], 0.50);
      r.p75 = percentile(acc, ctx.ranges[l], 0.75);
      r.p95 = percentile(acc, ctx.ranges[l], 0.95);
      r.min = acc.min;
      r.max = acc.max;
      r.target_probability = static_cast<double>(acc.above_target) / n;
      r.cash_rate = static_cast<double>(acc.cashed) / n;
      r.boom_rate = static_cast<double>(acc.boomed) / n;
      if (ctx.field) {
        r.win_probability = acc.win_sum / n;
        r.expected_payout = acc.payout_sum / n;
        r.roi = (r.expected_payout - contest_.entry_fee) / contest_.entry_fee;
      }
    }
    report.results.push_back(std::move(r));
  }

  report.players.reserve(n_players);
  for (std::size_t i = 0; i < n_players; ++i) {
    const PlayerAccum &acc = player_total[i];
    PlayerSimMetrics m;
    m.player_id = pool_->at(i).id;
    const double n = acc.moments.n;
    if (n > 0.0) {
      m.mean = acc.moments.mean;
      m.stdev = acc.moments.stdev();
      m.boom_rate = static_cast<double>(acc.boom) / n;
      m.bust_rate = static_cast<double>(acc.bust) / n;
    }
    report.players.push_back(std::move(m));
  }

  report.elapsed_seconds =
      std::chrono::duration<double>(Clock::now() - start).count();
  log(cfg_.log_level, LogLevel::info, kComponent,
      "{} trials in {:.3f}s{}", report.trials_run, report.elapsed_seconds,
      report.cancelled ? " (cancelled)" : "");
  return report;
}

} // namespace dfs_core
