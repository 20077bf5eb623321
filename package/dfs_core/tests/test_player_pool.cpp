#include <cmath>

#include <gtest/gtest.h>

#include "dfs_core/errors.hpp"
#include "dfs_core/player.hpp"
#include "dfs_core/projection.hpp"
#include "fixtures.hpp"

using namespace dfs_core;
using dfs_core::fixtures::make_player;

TEST(PlayerPool, LoadsAndIndexesPlayers) {
  const PlayerPool pool = fixtures::nfl_20_pool();
  EXPECT_EQ(pool.size(), 20u);
  EXPECT_TRUE(pool.has_id("kc_qb"));
  EXPECT_FALSE(pool.has_id("nyj_qb"));
  EXPECT_EQ(pool.at(pool.index_of("dal_wr")).salary, 8200);
  EXPECT_EQ(pool.get_by_id("phi_te").team, "PHI");
  EXPECT_THROW(pool.index_of("nyj_qb"), std::out_of_range);
}

TEST(PlayerPool, RejectsInvalidPlayers) {
  auto bad_salary = make_player("a", "QB", "KC", "BUF", 0, 20.0);
  EXPECT_THROW(PlayerPool::load({bad_salary}), ValidationError);

  Player no_pos("b", "b", {}, "KC", "BUF", 5000, 10.0);
  EXPECT_THROW(PlayerPool::load({no_pos}), ValidationError);

  auto dup = make_player("c", "RB", "KC", "BUF", 5000, 10.0);
  EXPECT_THROW(PlayerPool::load({dup, dup}), ValidationError);

  auto own = make_player("d", "RB", "KC", "BUF", 5000, 10.0, 1.5);
  EXPECT_THROW(PlayerPool::load({own}), ValidationError);

  auto floor_high = make_player("e", "RB", "KC", "BUF", 5000, 10.0);
  floor_high.floor = 12.0;
  EXPECT_THROW(PlayerPool::load({floor_high}), ValidationError);

  auto ceil_low = make_player("f", "RB", "KC", "BUF", 5000, 10.0);
  ceil_low.ceiling = 8.0;
  EXPECT_THROW(PlayerPool::load({ceil_low}), ValidationError);

  auto nan_proj = make_player("g", "RB", "KC", "BUF", 5000, std::nan(""));
  EXPECT_THROW(PlayerPool::load({nan_proj}), ValidationError);

  auto no_id = make_player("", "RB", "KC", "BUF", 5000, 10.0);
  EXPECT_THROW(PlayerPool::load({no_id}), ValidationError);
}

TEST(PlayerPool, DerivesMissingDistributionParameters) {
  const Player p = make_player("a", "WR", "KC", "BUF", 6000, 20.0);
  EXPECT_DOUBLE_EQ(p.effective_stdev(), 8.0);
  EXPECT_DOUBLE_EQ(p.effective_floor(), 12.0);
  EXPECT_DOUBLE_EQ(p.effective_ceiling(), 36.0);

  Player q = p;
  q.stdev = 3.0;
  q.floor = 15.0;
  q.ceiling = 30.0;
  EXPECT_DOUBLE_EQ(q.effective_stdev(), 3.0);
  EXPECT_DOUBLE_EQ(q.effective_floor(), 15.0);
  EXPECT_DOUBLE_EQ(q.effective_ceiling(), 30.0);
}

TEST(PlayerPool, EligibleForSlotHonoursFlexAndBans) {
  std::vector<Player> players = fixtures::nfl_20_players();
  players[3].banned = true; // kc_rb
  const PlayerPool pool = PlayerPool::load(players);
  const RosterSpec roster = dk_nfl_classic();

  EXPECT_EQ(pool.eligible_for_slot(roster.slots[0]).size(), 3u); // QB
  EXPECT_EQ(pool.eligible_for_slot(roster.slots[1]).size(), 4u); // RB
  // FLEX: 4 RB + 6 WR + 3 TE
  EXPECT_EQ(pool.eligible_for_slot(roster.slots[7]).size(), 13u);
  for (const auto &p : pool.eligible_for_slot(roster.slots[7]))
    EXPECT_NE(p.id, "kc_rb");
}

TEST(PlayerPool, MultiPositionPlayersFillEitherSlot) {
  Player hybrid("h", "h", {"RB", "WR"}, "KC", "BUF", 5000, 12.0);
  const PlayerPool pool = PlayerPool::load({hybrid});
  const RosterSpec roster = dk_nfl_classic();
  EXPECT_EQ(pool.eligible_for_slot(roster.slots[1]).size(), 1u);
  EXPECT_EQ(pool.eligible_for_slot(roster.slots[3]).size(), 1u);
  EXPECT_EQ(pool.eligible_for_slot(roster.slots[6]).size(), 0u);
}

TEST(PlayerPool, ReadModelQueries) {
  const PlayerPool pool = fixtures::nfl_20_pool();
  const auto by_pos = pool.count_by_position();
  EXPECT_EQ(by_pos.at("QB"), 3);
  EXPECT_EQ(by_pos.at("WR"), 6);
  EXPECT_EQ(pool.count_by_team().at("KC"), 5);
  EXPECT_EQ(pool.teams().size(), 4u);
  ASSERT_EQ(pool.games().size(), 2u);
  EXPECT_EQ(pool.games()[0], "BUF@KC");
  EXPECT_EQ(pool.team_players("DAL").size(), 4u);
  EXPECT_DOUBLE_EQ(pool.projections()(0), 24.0);
  EXPECT_DOUBLE_EQ(pool.stdevs()(0), 24.0 * 0.4);
  EXPECT_DOUBLE_EQ(pool.ownerships()(0), 0.30);
}

TEST(Marginals, TriangularWithMeanMatchesProjection) {
  const Triangular t = Triangular::with_mean(12.0, 20.0, 36.0);
  EXPECT_NEAR(t.mean(), 20.0, 1e-12);
  EXPECT_DOUBLE_EQ(t.quantile(0.0), 12.0);
  EXPECT_DOUBLE_EQ(t.quantile(1.0), 36.0);
}

TEST(Marginals, NormalClampsNegativeDraws) {
  const Player p = make_player("a", "WR", "KC", "BUF", 6000, 5.0);
  const Marginal clamped(p, DistributionMode::normal, true);
  const Marginal raw(p, DistributionMode::normal, false);
  EXPECT_DOUBLE_EQ(clamped.transform(-4.0), 0.0);
  EXPECT_LT(raw.transform(-4.0), 0.0);
  EXPECT_DOUBLE_EQ(clamped.transform(1.0), 7.0);
}

TEST(Marginals, LognormalMatchesMoments) {
  const Player p = make_player("a", "WR", "KC", "BUF", 6000, 20.0);
  const Marginal m(p, DistributionMode::lognormal, true);
  // median of the moment-matched lognormal sits below the mean
  EXPECT_LT(m.transform(0.0), 20.0);
  EXPECT_GT(m.transform(-6.0), 0.0);
  EXPECT_DOUBLE_EQ(m.analytic_mean(), 20.0);
  EXPECT_DOUBLE_EQ(m.analytic_stdev(), 8.0);
}

TEST(Marginals, EmpiricalUsesSampleQuantiles) {
  Player p = make_player("a", "WR", "KC", "BUF", 6000, 10.0);
  p.outcome_samples = {0.0, 5.0, 10.0, 15.0, 20.0};
  const Marginal m(p, DistributionMode::empirical, true);
  EXPECT_NEAR(m.transform(0.0), 10.0, 1e-9);
  EXPECT_NEAR(m.transform(-8.0), 0.0, 1e-6);
  EXPECT_NEAR(m.transform(8.0), 20.0, 1e-6);
}
