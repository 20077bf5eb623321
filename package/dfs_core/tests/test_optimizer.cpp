#include <algorithm>
#include <functional>
#include <map>
#include <random>

#include <gtest/gtest.h>

#include "dfs_core/errors.hpp"
#include "dfs_core/optimizer.hpp"
#include "fixtures.hpp"

using namespace dfs_core;
using dfs_core::fixtures::count_position;
using dfs_core::fixtures::make_player;

namespace {

LineupCandidate as_candidate(const Lineup &lu) {
  LineupCandidate c;
  for (const auto &s : lu.slots)
    c.picks.push_back({s.slot_index, s.pool_index});
  return c;
}

// Best projection under the cap by exhaustive enumeration.
// Pool layout: QB 0-2, RB 3-7, WR 8-13, TE 14-16, DST 17-19.
double brute_force_best(const PlayerPool &pool, int cap) {
  double best = -1.0;
  auto sal = [&](std::size_t i) { return pool.at(i).salary; };
  auto pts = [&](std::size_t i) { return pool.at(i).projection; };
  for (std::size_t qb = 0; qb <= 2; ++qb)
    for (std::size_t dst = 17; dst <= 19; ++dst)
      for (std::size_t r1 = 3; r1 <= 7; ++r1)
        for (std::size_t r2 = r1 + 1; r2 <= 7; ++r2)
          for (std::size_t w1 = 8; w1 <= 13; ++w1)
            for (std::size_t w2 = w1 + 1; w2 <= 13; ++w2)
              for (std::size_t w3 = w2 + 1; w3 <= 13; ++w3)
                for (std::size_t te = 14; te <= 16; ++te)
                  for (std::size_t fx = 3; fx <= 16; ++fx) {
                    if (fx == r1 || fx == r2 || fx == w1 || fx == w2 ||
                        fx == w3 || fx == te)
                      continue;
                    const int salary = sal(qb) + sal(dst) + sal(r1) + sal(r2) +
                                       sal(w1) + sal(w2) + sal(w3) + sal(te) +
                                       sal(fx);
                    if (salary > cap)
                      continue;
                    const double total = pts(qb) + pts(dst) + pts(r1) +
                                         pts(r2) + pts(w1) + pts(w2) +
                                         pts(w3) + pts(te) + pts(fx);
                    best = std::max(best, total);
                  }
  return best;
}

// Players may be matched to distinct roster slots they are eligible for.
bool fills_roster(const PlayerPool &pool, const RosterSpec &roster,
                  const std::vector<std::size_t> &players) {
  std::vector<int> owner(roster.size(), -1);
  std::function<bool(std::size_t, std::vector<char> &)> place =
      [&](std::size_t k, std::vector<char> &seen) {
        for (std::size_t s = 0; s < roster.size(); ++s) {
          if (seen[s] ||
              !roster.slots[s].accepts_any(pool.at(players[k]).positions))
            continue;
          seen[s] = 1;
          if (owner[s] < 0 ||
              place(static_cast<std::size_t>(owner[s]), seen)) {
            owner[s] = static_cast<int>(k);
            return true;
          }
        }
        return false;
      };
  for (std::size_t k = 0; k < players.size(); ++k) {
    std::vector<char> seen(roster.size(), 0);
    if (!place(k, seen))
      return false;
  }
  return true;
}

// Best projection over every player subset that fills the roster under the
// cap; -1 when none does. Small pools only.
double brute_force_best(const PlayerPool &pool, const RosterSpec &roster,
                        int cap) {
  const std::size_t n = pool.size();
  double best = -1.0;
  for (unsigned mask = 0; mask < (1u << n); ++mask) {
    std::vector<std::size_t> picked;
    int salary = 0;
    double total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      if (mask & (1u << i)) {
        picked.push_back(i);
        salary += pool.at(i).salary;
        total += pool.at(i).projection;
      }
    }
    if (picked.size() != roster.size() || salary > cap || total <= best)
      continue;
    if (fills_roster(pool, roster, picked))
      best = total;
  }
  return best;
}

// Small NBA pool in which most players carry two positions. The first five
// cover PG, SG, SF, PF and C once each.
PlayerPool random_nba_pool(std::uint32_t seed, int size) {
  const std::vector<std::vector<std::string>> eligibility = {
      {"PG"},       {"SG"},       {"SF"},       {"PF"},      {"C"},
      {"PG", "SG"}, {"SG", "SF"}, {"SF", "PF"}, {"PF", "C"}};
  const std::vector<std::string> teams = {"BOS", "NYK", "LAL", "GSW"};
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> pick_pos(0, 8);
  std::uniform_int_distribution<int> pick_team(0, 3);
  std::uniform_int_distribution<int> salary(30, 110);
  std::uniform_real_distribution<double> noise(-6.0, 6.0);
  std::vector<Player> players;
  for (int i = 0; i < size; ++i) {
    const auto &pos =
        eligibility[static_cast<std::size_t>(i < 5 ? i : pick_pos(rng))];
    const int t = pick_team(rng);
    const int s = salary(rng) * 100;
    Player p("p" + std::to_string(i), "p" + std::to_string(i), pos,
             teams[static_cast<std::size_t>(t)],
             teams[static_cast<std::size_t>(t ^ 1)], s, s / 200.0 + noise(rng));
    players.push_back(p);
  }
  return PlayerPool::load(players);
}

class LineupOptimizerTest : public ::testing::Test {
protected:
  PlayerPool pool = fixtures::nfl_20_pool();
  RosterSpec roster = dk_nfl_classic();
};

} // namespace

TEST_F(LineupOptimizerTest, GeneratesDistinctValidLineups) {
  Constraints c;
  c.min_unique = 2;
  OptimizerConfig cfg;
  cfg.num_lineups = 5;
  LineupOptimizer opt(pool, roster, c, cfg);

  const BatchResult batch = opt.generate();
  EXPECT_TRUE(batch.complete);
  EXPECT_EQ(batch.reason, "");
  EXPECT_EQ(batch.requested, 5);
  ASSERT_EQ(batch.delivered, 5);
  ASSERT_EQ(batch.lineups.size(), 5u);

  for (std::size_t k = 0; k < batch.lineups.size(); ++k) {
    const Lineup &lu = batch.lineups[k];
    EXPECT_EQ(lu.id, "lineup_" + std::to_string(k + 1));
    EXPECT_EQ(lu.generation_index, static_cast<int>(k));
    EXPECT_EQ(lu.slots.size(), 9u);
    EXPECT_LE(lu.total_salary, 50000);
    EXPECT_EQ(count_position(lu, pool, "QB"), 1);
    EXPECT_EQ(count_position(lu, pool, "DST"), 1);
    EXPECT_TRUE(lu.proven_optimal);
    EXPECT_TRUE(opt.constraint_set().is_feasible(as_candidate(lu)));
    for (std::size_t j = 0; j < k; ++j)
      EXPECT_LE(shared_players(lu, batch.lineups[j]), 7);
  }
  // Cutting planes only remove solutions, so objectives never improve.
  for (std::size_t k = 1; k < batch.lineups.size(); ++k) {
    EXPECT_LE(batch.lineups[k].objective_value,
              batch.lineups[k - 1].objective_value + 1e-9);
  }
}

TEST_F(LineupOptimizerTest, FirstLineupMatchesExhaustiveSearch) {
  LineupOptimizer opt(pool, roster, Constraints{}, OptimizerConfig{});
  const Lineup lu = opt.solve_one({});
  EXPECT_NEAR(lu.total_projection, brute_force_best(pool, 50000), 1e-6);
  EXPECT_NEAR(lu.total_projection, brute_force_best(pool, roster, 50000),
              1e-6);
  EXPECT_NEAR(lu.objective_value, lu.total_projection, 1e-9);
  EXPECT_EQ(lu.id, "lineup_1");
}

TEST(LineupOptimizerNba, MultiPositionPoolsMatchExhaustiveSearch) {
  const RosterSpec nba = dk_nba_classic();
  int solved = 0;
  for (std::uint32_t seed = 1; seed <= 25; ++seed) {
    const PlayerPool pool = random_nba_pool(seed, 14);
    const double best = brute_force_best(pool, nba, 50000);
    LineupOptimizer opt(pool, nba, Constraints{}, OptimizerConfig{});
    if (best < 0.0) {
      EXPECT_THROW(opt.solve_one({}), InfeasibleError) << "seed " << seed;
      continue;
    }
    const Lineup lu = opt.solve_one({});
    EXPECT_TRUE(lu.proven_optimal);
    EXPECT_NEAR(lu.total_projection, best, 1e-6) << "seed " << seed;
    EXPECT_TRUE(opt.constraint_set().is_feasible(as_candidate(lu)));
    ++solved;
  }
  EXPECT_GT(solved, 10);
}

TEST_F(LineupOptimizerTest, LockedPlayerOverCapIsInfeasible) {
  auto players = fixtures::nfl_20_players();
  players.push_back(make_player("star", "WR", "KC", "BUF", 51000, 40.0));
  const PlayerPool big = PlayerPool::load(players);
  Constraints c;
  c.locked_ids = {"star"};
  LineupOptimizer opt(big, roster, c, OptimizerConfig{});

  try {
    opt.solve_one({});
    FAIL() << "expected InfeasibleError";
  } catch (const InfeasibleError &e) {
    EXPECT_EQ(e.reason(), InfeasibilityReason::salary_cap);
  }

  const BatchResult batch = opt.generate(3);
  EXPECT_FALSE(batch.complete);
  EXPECT_EQ(batch.reason, "infeasible");
  EXPECT_EQ(batch.delivered, 0);
  ASSERT_TRUE(batch.infeasibility.has_value());
  EXPECT_EQ(*batch.infeasibility, InfeasibilityReason::salary_cap);
  EXPECT_EQ(batch.transitions.back().state, BatchState::failed);
}

TEST_F(LineupOptimizerTest, SalaryFloorAboveCapIsInfeasible) {
  Constraints c;
  c.salary_floor = 50000;
  c.salary_cap = 45000;
  LineupOptimizer opt(pool, roster, c, OptimizerConfig{});
  try {
    opt.check_feasibility();
    FAIL() << "expected InfeasibleError";
  } catch (const InfeasibleError &e) {
    EXPECT_EQ(e.reason(), InfeasibilityReason::salary_floor);
  }
}

TEST_F(LineupOptimizerTest, NodeBudgetWithoutIncumbentTimesOut) {
  OptimizerConfig cfg;
  cfg.max_nodes = 0;
  LineupOptimizer opt(pool, roster, Constraints{}, cfg);
  EXPECT_THROW(opt.solve_one({}), TimeoutError);

  const BatchResult batch = opt.generate(2);
  EXPECT_EQ(batch.reason, "timeout");
  EXPECT_EQ(batch.delivered, 0);
  EXPECT_FALSE(batch.complete);
}

TEST_F(LineupOptimizerTest, SmallNodeBudgetNeverReturnsAnInvalidLineup) {
  const double best = brute_force_best(pool, 50000);
  for (const long long budget : {5LL, 12LL, 40LL}) {
    OptimizerConfig cfg;
    cfg.max_nodes = budget;
    LineupOptimizer opt(pool, roster, Constraints{}, cfg);
    try {
      const Lineup lu = opt.solve_one({});
      EXPECT_TRUE(opt.constraint_set().is_feasible(as_candidate(lu)));
      EXPECT_LE(lu.total_projection, best + 1e-6);
      if (lu.proven_optimal)
        EXPECT_NEAR(lu.total_projection, best, 1e-6);
    } catch (const TimeoutError &) {
      // no incumbent within the budget
    }
  }
}

TEST_F(LineupOptimizerTest, HonoursStacksAndBringBacks) {
  StackRule kc;
  kc.name = "kc_pass";
  kc.team = "KC";
  kc.positions = {"QB", "WR", "TE"};
  kc.min_count = 2;
  kc.bring_back_min = 1;
  kc.bring_back_positions = {"WR"};
  Constraints c;
  c.stacks = {kc};
  c.min_unique = 2;
  OptimizerConfig cfg;
  cfg.num_lineups = 3;
  LineupOptimizer opt(pool, roster, c, cfg);

  const BatchResult batch = opt.generate();
  ASSERT_EQ(batch.delivered, 3);
  for (const auto &lu : batch.lineups) {
    int kc_group = 0;
    int buf_wr = 0;
    for (const auto &s : lu.slots) {
      const Player &p = pool.at(s.pool_index);
      if (p.team == "KC" &&
          (p.has_position("QB") || p.has_position("WR") ||
           p.has_position("TE")))
        ++kc_group;
      if (p.team == "BUF" && p.has_position("WR"))
        ++buf_wr;
    }
    EXPECT_GE(kc_group, 2) << lu.id;
    EXPECT_GE(buf_wr, 1) << lu.id;
  }
}

TEST_F(LineupOptimizerTest, HonoursTeamLimitLocksAndBans) {
  Constraints c;
  c.max_per_team = 3;
  c.locked_ids = {"phi_te"};
  c.banned_ids = {"dal_wr", "kc_qb"};
  c.min_unique = 3;
  OptimizerConfig cfg;
  cfg.num_lineups = 3;
  LineupOptimizer opt(pool, roster, c, cfg);

  const BatchResult batch = opt.generate();
  ASSERT_GE(batch.delivered, 1);
  for (const auto &lu : batch.lineups) {
    std::map<std::string, int> per_team;
    for (const auto &s : lu.slots)
      ++per_team[pool.at(s.pool_index).team];
    for (const auto &kv : per_team)
      EXPECT_LE(kv.second, 3) << lu.id << " " << kv.first;
    EXPECT_TRUE(lu.contains(pool.index_of("phi_te")));
    EXPECT_FALSE(lu.contains(pool.index_of("dal_wr")));
    EXPECT_FALSE(lu.contains(pool.index_of("kc_qb")));
  }
}

TEST_F(LineupOptimizerTest, ExposureCapLimitsAppearances) {
  OptimizerConfig cfg;
  cfg.num_lineups = 5;
  cfg.max_exposure = 0.6; // at most 3 of 5
  LineupOptimizer opt(pool, roster, Constraints{}, cfg);

  const BatchResult batch = opt.generate();
  ASSERT_GE(batch.delivered, 1);
  std::map<std::size_t, int> appearances;
  for (const auto &lu : batch.lineups) {
    for (const auto &s : lu.slots)
      ++appearances[s.pool_index];
  }
  for (const auto &kv : appearances)
    EXPECT_LE(kv.second, 3) << pool.at(kv.first).id;
}

TEST_F(LineupOptimizerTest, PerPlayerExposureOverridesGlobalCap) {
  OptimizerConfig cfg;
  cfg.num_lineups = 5;
  cfg.player_max_exposure = {{"kc_qb", 0.4}, {"dal_wr", 0.0}};
  LineupOptimizer opt(pool, roster, Constraints{}, cfg);

  const BatchResult batch = opt.generate();
  ASSERT_EQ(batch.delivered, 5);
  int kc_qb = 0;
  for (const auto &lu : batch.lineups) {
    kc_qb += lu.contains(pool.index_of("kc_qb")) ? 1 : 0;
    EXPECT_FALSE(lu.contains(pool.index_of("dal_wr"))) << lu.id;
  }
  EXPECT_LE(kc_qb, 2);

  auto build = [&](const OptimizerConfig &bad) {
    LineupOptimizer rejected(pool, roster, Constraints{}, bad);
  };
  OptimizerConfig bad = cfg;
  bad.player_max_exposure = {{"nobody", 0.5}};
  EXPECT_THROW(build(bad), ValidationError);
  bad.player_max_exposure = {{"kc_qb", 1.5}};
  EXPECT_THROW(build(bad), ValidationError);
}

TEST_F(LineupOptimizerTest, ExhaustedExposureIsReportedAsExposure) {
  // One appearance per player: five RBs cannot fill two slots five times,
  // while uniqueness U=1 alone would never bind.
  OptimizerConfig cfg;
  cfg.num_lineups = 5;
  cfg.max_exposure = 0.2;
  LineupOptimizer opt(pool, roster, Constraints{}, cfg);

  const BatchResult batch = opt.generate();
  EXPECT_FALSE(batch.complete);
  EXPECT_EQ(batch.reason, "infeasible");
  EXPECT_GE(batch.delivered, 1);
  EXPECT_LT(batch.delivered, 5);
  ASSERT_TRUE(batch.infeasibility.has_value());
  EXPECT_EQ(*batch.infeasibility, InfeasibilityReason::exposure);
  EXPECT_STREQ(to_string(InfeasibilityReason::exposure), "exposure");
}

TEST_F(LineupOptimizerTest, RandomnessIsReproducibleForASeed) {
  OptimizerConfig cfg;
  cfg.num_lineups = 3;
  cfg.randomness = 0.3;
  cfg.seed = 42;
  Constraints c;
  c.min_unique = 2;
  LineupOptimizer a(pool, roster, c, cfg);
  LineupOptimizer b(pool, roster, c, cfg);

  const BatchResult ra = a.generate();
  const BatchResult rb = b.generate();
  ASSERT_EQ(ra.delivered, rb.delivered);
  for (std::size_t k = 0; k < ra.lineups.size(); ++k)
    EXPECT_EQ(ra.lineups[k].player_ids(), rb.lineups[k].player_ids());
}

TEST_F(LineupOptimizerTest, CancelledBeforeStartDeliversNothing) {
  OptimizerConfig cfg;
  cfg.num_lineups = 4;
  LineupOptimizer opt(pool, roster, Constraints{}, cfg);
  CancellationToken token;
  token.cancel();

  const BatchResult batch = opt.generate(-1, &token);
  EXPECT_EQ(batch.reason, "cancelled");
  EXPECT_EQ(batch.delivered, 0);
  EXPECT_FALSE(batch.complete);
}

TEST_F(LineupOptimizerTest, RecordsStateTransitions) {
  OptimizerConfig cfg;
  cfg.num_lineups = 2;
  LineupOptimizer opt(pool, roster, Constraints{}, cfg);

  const BatchResult batch = opt.generate();
  std::vector<BatchState> states;
  for (const auto &t : batch.transitions)
    states.push_back(t.state);
  const std::vector<BatchState> expected = {
      BatchState::initializing, BatchState::solving, BatchState::emitted,
      BatchState::solving,      BatchState::emitted, BatchState::complete};
  EXPECT_EQ(states, expected);
  EXPECT_STREQ(to_string(BatchState::emitted), "emitted");
}

TEST_F(LineupOptimizerTest, FullUniquenessRunsOutOfLineups) {
  // Disjoint lineups: the 18 players left after one QB and one DST cost
  // more than two salary caps, so only one lineup fits.
  Constraints c;
  c.min_unique = 9;
  OptimizerConfig cfg;
  cfg.num_lineups = 4;
  LineupOptimizer opt(pool, roster, c, cfg);

  const BatchResult batch = opt.generate();
  EXPECT_FALSE(batch.complete);
  EXPECT_EQ(batch.reason, "infeasible");
  EXPECT_GE(batch.delivered, 1);
  EXPECT_LT(batch.delivered, 4);
  ASSERT_TRUE(batch.infeasibility.has_value());
  EXPECT_EQ(*batch.infeasibility, InfeasibilityReason::uniqueness);
  for (std::size_t k = 0; k < batch.lineups.size(); ++k) {
    for (std::size_t j = 0; j < k; ++j)
      EXPECT_EQ(shared_players(batch.lineups[k], batch.lineups[j]), 0);
  }

  try {
    opt.solve_one(batch.lineups);
    FAIL() << "expected InfeasibleError";
  } catch (const InfeasibleError &e) {
    EXPECT_EQ(e.reason(), InfeasibilityReason::uniqueness);
  }
}

TEST_F(LineupOptimizerTest, ClassifiesStacks) {
  auto make = [&](const std::vector<std::string> &ids) {
    std::vector<std::size_t> idx;
    for (const auto &id : ids)
      idx.push_back(pool.index_of(id));
    return fixtures::make_lineup(pool, roster, idx, "x");
  };
  EXPECT_EQ(classify_stack(make({"kc_qb", "kc_rb", "dal_rb", "kc_wr", "buf_wr",
                                 "dal_wr", "kc_te", "phi_rb", "kc_dst"}),
                           pool),
            "QB+3 Stack (KC)");
  EXPECT_EQ(classify_stack(make({"dal_qb", "kc_rb", "buf_rb", "kc_wr", "buf_wr",
                                 "phi_wr", "phi_te", "phi_rb", "kc_dst"}),
                           pool),
            "Game Stack (KC/BUF)");
  EXPECT_EQ(classify_stack(make({"dal_qb", "kc_rb", "phi_rb", "kc_wr", "phi_wr",
                                 "phi_wr2", "kc_te", "phi_rb2", "kc_dst"}),
                           pool),
            "No Stack");
}

TEST_F(LineupOptimizerTest, BatchSummarisesStackUsage) {
  StackRule kc;
  kc.team = "KC";
  kc.positions = {"QB", "WR"};
  kc.min_count = 2;
  Constraints c;
  c.stacks = {kc};
  c.min_unique = 2;
  OptimizerConfig cfg;
  cfg.num_lineups = 4;
  LineupOptimizer opt(pool, roster, c, cfg);

  const BatchResult batch = opt.generate();
  ASSERT_EQ(batch.delivered, 4);
  std::map<std::string, int> expected;
  for (const auto &lu : batch.lineups) {
    EXPECT_EQ(lu.stack_label, classify_stack(lu, pool));
    EXPECT_EQ(lu.stack_label.rfind("QB+", 0), 0u) << lu.stack_label;
    ++expected[lu.stack_label];
  }
  ASSERT_EQ(batch.stack_summary.size(), expected.size());
  double percent = 0.0;
  for (std::size_t k = 0; k < batch.stack_summary.size(); ++k) {
    const StackUsage &u = batch.stack_summary[k];
    EXPECT_EQ(u.count, expected.at(u.label));
    EXPECT_DOUBLE_EQ(u.percentage, 25.0 * u.count);
    if (k > 0)
      EXPECT_LE(u.count, batch.stack_summary[k - 1].count);
    percent += u.percentage;
  }
  EXPECT_NEAR(percent, 100.0, 1e-9);
}

TEST(LineupOptimizerSlate, ConstrainedFullSlateSolvesEveryLineupToOptimality) {
  const PlayerPool slate = fixtures::nfl_slate_pool(24, 2024);
  ASSERT_EQ(slate.size(), 192u);
  StackRule t0;
  t0.name = "t0_pass";
  t0.team = "T0";
  t0.positions = {"QB", "WR", "TE"};
  t0.min_count = 3;
  t0.bring_back_min = 1;
  Constraints c;
  c.min_unique = 3;
  c.max_per_team = 4;
  c.stacks = {t0};
  OptimizerConfig cfg;
  cfg.num_lineups = 20;
  cfg.time_limit_seconds = 30.0;
  LineupOptimizer opt(slate, dk_nfl_classic(), c, cfg);

  const BatchResult batch = opt.generate();
  ASSERT_TRUE(batch.complete) << batch.reason;
  ASSERT_EQ(batch.delivered, 20);
  for (std::size_t k = 0; k < batch.lineups.size(); ++k) {
    const Lineup &lu = batch.lineups[k];
    EXPECT_TRUE(lu.proven_optimal) << lu.id;
    EXPECT_TRUE(opt.constraint_set().is_feasible(as_candidate(lu)));
    int t0_group = 0;
    int t1 = 0;
    for (const auto &s : lu.slots) {
      const Player &p = slate.at(s.pool_index);
      if (p.team == "T0" && !p.has_position("RB") && !p.has_position("DST"))
        ++t0_group;
      t1 += p.team == "T1" ? 1 : 0;
    }
    EXPECT_GE(t0_group, 3) << lu.id;
    EXPECT_GE(t1, 1) << lu.id;
    for (std::size_t j = 0; j < k; ++j)
      EXPECT_LE(shared_players(lu, batch.lineups[j]), 6);
  }
}

TEST_F(LineupOptimizerTest, UnknownBackendIsASolverError) {
  OptimizerConfig cfg;
  cfg.solver_backend = "no_such_backend";
  LineupOptimizer opt(pool, roster, Constraints{}, cfg);
  EXPECT_THROW(opt.solve_one({}), SolverError);
}

TEST_F(LineupOptimizerTest, ValidatesConfig) {
  auto build = [&](const OptimizerConfig &cfg) {
    LineupOptimizer opt(pool, roster, Constraints{}, cfg);
  };
  OptimizerConfig bad;
  bad.num_lineups = 0;
  EXPECT_THROW(build(bad), ValidationError);
  bad = OptimizerConfig{};
  bad.leverage_weight = 1.5;
  EXPECT_THROW(build(bad), ValidationError);
  bad = OptimizerConfig{};
  bad.randomness = 1.0;
  EXPECT_THROW(build(bad), ValidationError);
  bad = OptimizerConfig{};
  bad.max_exposure = 0.0;
  EXPECT_THROW(build(bad), ValidationError);
  bad = OptimizerConfig{};
  bad.time_limit_seconds = 0.0;
  EXPECT_THROW(build(bad), ValidationError);

  Constraints unknown;
  unknown.banned_ids = {"nobody"};
  auto build_with = [&](const Constraints &c) {
    LineupOptimizer opt(pool, roster, c, OptimizerConfig{});
  };
  EXPECT_THROW(build_with(unknown), ConstraintConfigError);
}

TEST(ObjectiveValue, EvRewardsLowOwnedUpside) {
  const Player p = make_player("a", "WR", "KC", "BUF", 6000, 20.0, 0.10);
  EXPECT_DOUBLE_EQ(objective_value(p, Objective::projection, 0.5), 20.0);
  EXPECT_DOUBLE_EQ(objective_value(p, Objective::ceiling, 0.5), 36.0);
  // 20 + 0.5 * (36 - 20) * 0.9
  EXPECT_NEAR(objective_value(p, Objective::ev, 0.5), 27.2, 1e-12);

  const Player chalk = make_player("b", "WR", "KC", "BUF", 6000, 20.0, 0.90);
  EXPECT_LT(objective_value(chalk, Objective::ev, 0.5),
            objective_value(p, Objective::ev, 0.5));
}
