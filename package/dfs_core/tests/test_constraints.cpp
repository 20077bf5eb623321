#include <gtest/gtest.h>

#include "dfs_core/constraints.hpp"
#include "dfs_core/errors.hpp"
#include "fixtures.hpp"

using namespace dfs_core;

namespace {

class ConstraintSetTest : public ::testing::Test {
protected:
  PlayerPool pool = fixtures::nfl_20_pool();
  RosterSpec roster = dk_nfl_classic();

  std::size_t idx(const std::string &id) const { return pool.index_of(id); }

  // Slot order QB RB RB WR WR WR TE FLEX DST.
  LineupCandidate full(const std::vector<std::string> &ids) const {
    LineupCandidate c;
    for (std::size_t s = 0; s < ids.size(); ++s)
      c.picks.push_back({s, idx(ids[s])});
    return c;
  }

  // Salary 43,700, two games.
  LineupCandidate cheap_lineup() const {
    return full({"dal_qb", "phi_rb", "phi_rb2", "phi_wr2", "buf_wr2", "phi_wr",
                 "dal_te", "phi_te", "buf_dst"});
  }
};

} // namespace

TEST_F(ConstraintSetTest, AcceptsValidCompleteLineup) {
  ConstraintSet cs(pool, roster, Constraints{});
  EXPECT_TRUE(cs.is_feasible(cheap_lineup()));
  EXPECT_FALSE(cs.diagnose(cheap_lineup()).has_value());
}

TEST_F(ConstraintSetTest, DetectsEachViolatedRule) {
  Constraints c;
  c.salary_cap = 40000;
  ConstraintSet capped(pool, roster, c);
  EXPECT_EQ(capped.diagnose(cheap_lineup()), InfeasibilityReason::salary_cap);

  Constraints f;
  f.salary_floor = 49000;
  ConstraintSet floored(pool, roster, f);
  EXPECT_EQ(floored.diagnose(cheap_lineup()),
            InfeasibilityReason::salary_floor);

  Constraints t;
  t.max_per_team = 3;
  ConstraintSet team(pool, roster, t);
  // five PHI players
  EXPECT_EQ(team.diagnose(cheap_lineup()), InfeasibilityReason::team_limit);

  ConstraintSet plain(pool, roster, Constraints{});
  // QB in an RB slot
  auto wrong = cheap_lineup();
  wrong.picks[1].player = idx("kc_qb");
  EXPECT_EQ(plain.diagnose(wrong), InfeasibilityReason::position);
  // the same player twice
  auto twice = cheap_lineup();
  twice.picks[2].player = idx("phi_rb");
  EXPECT_EQ(plain.diagnose(twice), InfeasibilityReason::position);
}

TEST_F(ConstraintSetTest, LocksAndBans) {
  Constraints c;
  c.locked_ids = {"kc_qb"};
  ConstraintSet locked(pool, roster, c);
  EXPECT_EQ(locked.diagnose(cheap_lineup()), InfeasibilityReason::locks);
  EXPECT_TRUE(locked.is_locked(idx("kc_qb")));

  Constraints b;
  b.banned_ids = {"dal_qb"};
  ConstraintSet banned(pool, roster, b);
  EXPECT_EQ(banned.diagnose(cheap_lineup()), InfeasibilityReason::locks);
}

TEST_F(ConstraintSetTest, StacksAndBringBacks) {
  StackRule kc;
  kc.name = "kc_pass";
  kc.team = "KC";
  kc.positions = {"QB", "WR", "TE"};
  kc.min_count = 2;
  kc.bring_back_min = 1;
  kc.bring_back_positions = {"WR"};
  Constraints c;
  c.stacks = {kc};
  ConstraintSet cs(pool, roster, c);
  ASSERT_EQ(cs.stacks().size(), 1u);
  EXPECT_EQ(cs.stacks()[0].group.size(), 3u);
  EXPECT_EQ(cs.stacks()[0].bring_back.size(), 2u);
  EXPECT_EQ(cs.diagnose(cheap_lineup()), InfeasibilityReason::stack);

  const auto stacked = full({"kc_qb", "phi_rb", "phi_rb2", "kc_wr", "buf_wr2",
                             "phi_wr2", "dal_te", "phi_te", "buf_dst"});
  EXPECT_TRUE(cs.is_feasible(stacked));

  StackRule cap;
  cap.name = "at_most_one_kc";
  cap.team = "KC";
  cap.max_count = 1;
  Constraints m;
  m.stacks = {cap};
  ConstraintSet capped(pool, roster, m);
  EXPECT_EQ(capped.diagnose(stacked), InfeasibilityReason::stack);
}

TEST_F(ConstraintSetTest, MinimumGames) {
  Constraints c;
  c.min_games = 2;
  ConstraintSet cs(pool, roster, c);
  const auto one_game = full({"dal_qb", "phi_rb", "phi_rb2", "phi_wr2",
                              "dal_wr", "phi_wr", "dal_te", "phi_te",
                              "phi_dst"});
  EXPECT_EQ(cs.diagnose(one_game), InfeasibilityReason::games);
  EXPECT_TRUE(cs.is_feasible(cheap_lineup()));
}

TEST_F(ConstraintSetTest, UniquenessAgainstPriorLineups) {
  Constraints c;
  c.min_unique = 2;
  ConstraintSet cs(pool, roster, c);
  EXPECT_EQ(cs.max_shared(), 7);

  const std::vector<std::string> base = {"dal_qb", "phi_rb", "phi_rb2",
                                         "phi_wr2", "buf_wr2", "phi_wr",
                                         "dal_te", "phi_te", "buf_dst"};
  std::vector<std::size_t> ids;
  for (const auto &id : base)
    ids.push_back(idx(id));
  const Lineup prior = fixtures::make_lineup(pool, roster, ids, "lineup_1");

  // one player swapped: 8 shared > 7
  auto one_swap = cheap_lineup();
  one_swap.picks[8].player = idx("phi_dst");
  EXPECT_EQ(cs.diagnose(one_swap, {prior}), InfeasibilityReason::uniqueness);

  auto two_swaps = one_swap;
  two_swaps.picks[0].player = idx("buf_qb");
  EXPECT_TRUE(cs.is_feasible(two_swaps, {prior}));
}

TEST_F(ConstraintSetTest, PartialCandidatesCheckCompletability) {
  Constraints c;
  c.locked_ids = {"kc_qb", "kc_wr"};
  ConstraintSet cs(pool, roster, c);
  LineupCandidate partial;
  partial.picks = {{0, idx("dal_qb")}};
  // kc_qb can no longer be placed but there are open slots for both locks
  EXPECT_TRUE(cs.is_feasible(partial));

  for (std::size_t s = 1; s < 8; ++s) {
    const std::vector<std::string> fill = {"", "phi_rb", "phi_rb2", "phi_wr2",
                                           "buf_wr2", "phi_wr", "dal_te",
                                           "phi_te"};
    partial.picks.push_back({s, idx(fill[s])});
  }
  // one open slot left, two locks missing
  EXPECT_EQ(cs.diagnose(partial), InfeasibilityReason::locks);
}

TEST_F(ConstraintSetTest, RejectsInconsistentDefinitions) {
  auto build = [&](const Constraints &c) { ConstraintSet cs(pool, roster, c); };

  Constraints cap;
  cap.salary_cap = 0;
  EXPECT_THROW(build(cap), ConstraintConfigError);

  Constraints team;
  team.max_per_team = 0;
  EXPECT_THROW(build(team), ConstraintConfigError);

  Constraints uniq;
  uniq.min_unique = 10;
  EXPECT_THROW(build(uniq), ConstraintConfigError);

  Constraints unknown;
  unknown.locked_ids = {"nobody"};
  EXPECT_THROW(build(unknown), ConstraintConfigError);

  Constraints both;
  both.locked_ids = {"kc_qb"};
  both.banned_ids = {"kc_qb"};
  EXPECT_THROW(build(both), ConstraintConfigError);

  StackRule bad;
  bad.name = "inverted";
  bad.team = "KC";
  bad.min_count = 3;
  bad.max_count = 2;
  Constraints s;
  s.stacks = {bad};
  EXPECT_THROW(build(s), ConstraintConfigError);

  StackRule too_big;
  too_big.name = "too_big";
  too_big.player_ids = {"kc_qb", "kc_wr"};
  too_big.min_count = 3;
  s.stacks = {too_big};
  EXPECT_THROW(build(s), ConstraintConfigError);

  StackRule empty;
  empty.name = "nobody";
  empty.team = "NYJ";
  empty.min_count = 1;
  s.stacks = {empty};
  EXPECT_THROW(build(s), ConstraintConfigError);

  StackRule no_group;
  no_group.name = "no_group";
  s.stacks = {no_group};
  EXPECT_THROW(build(s), ConstraintConfigError);
}
