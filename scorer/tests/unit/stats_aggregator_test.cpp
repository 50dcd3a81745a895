#include <gtest/gtest.h>

#include "match_fixture.hpp"
#include "scorer/errors.hpp"
#include "scorer/stats.hpp"

namespace {

using scorer_test::Bowl;
using scorer_test::BowlMany;
using scorer_test::MakeConfig;
using scorer_test::NextWicket;
using scorer_test::OpenSecondInnings;

// 2오버 경기. lions 11/1, tigers 0/1로 lions가 11점 차 승리.
scorer::ScoringSession PlayShortMatch() {
  scorer::ScoringSession session(MakeConfig(2));
  Bowl(session, 4);
  Bowl(session, 1);
  auto caught = NextWicket(session.GetSnapshot(), scorer::DismissalKind::kCaught);
  caught.fielder = "T5";
  session.AppendBall(caught);
  Bowl(session, 6);
  BowlMany(session, 2);
  BowlMany(session, 6);

  OpenSecondInnings(session);
  auto run_out = NextWicket(session.GetSnapshot(), scorer::DismissalKind::kRunOut);
  run_out.fielder = "L4";
  session.AppendBall(run_out);
  BowlMany(session, 5);
  BowlMany(session, 6);
  return session;
}

}  // namespace

TEST(StatsAggregatorTest, FoldsBattingBowlingAndFielding) {
  auto session = PlayShortMatch();
  auto snapshot = session.SetManOfTheMatch("L3");
  ASSERT_TRUE(snapshot.completed);
  ASSERT_EQ(snapshot.result.kind, scorer::ResultKind::kWonByRuns);
  ASSERT_EQ(snapshot.result.margin, 11);

  auto deltas = scorer::AggregateCompletedMatch(snapshot);
  EXPECT_EQ(deltas.size(), 22u);
  for (const auto& [player, stats] : deltas) {
    EXPECT_EQ(stats.matches, 1) << player;
  }

  const auto& l1 = deltas.at("L1");
  EXPECT_EQ(l1.innings, 1);
  EXPECT_EQ(l1.runs, 5);
  EXPECT_EQ(l1.balls_faced, 8);
  EXPECT_EQ(l1.fours, 1);
  EXPECT_EQ(l1.not_outs, 1);
  EXPECT_EQ(l1.times_out, 0);
  EXPECT_FALSE(l1.BattingAverage().has_value());
  EXPECT_EQ(l1.balls_bowled, 6);
  EXPECT_EQ(l1.maidens, 1);
  EXPECT_EQ(l1.dot_balls, 6);
  EXPECT_EQ(l1.wickets, 0);

  const auto& l2 = deltas.at("L2");
  EXPECT_EQ(l2.times_out, 1);
  EXPECT_EQ(l2.ducks, 1);
  EXPECT_DOUBLE_EQ(l2.BattingAverage().value_or(-1.0), 0.0);

  const auto& l3 = deltas.at("L3");
  EXPECT_EQ(l3.runs, 6);
  EXPECT_EQ(l3.sixes, 1);
  EXPECT_EQ(l3.man_of_the_match, 1);

  const auto& t1 = deltas.at("T1");
  EXPECT_EQ(t1.wickets, 1);
  EXPECT_EQ(t1.runs_conceded, 11);
  EXPECT_EQ(t1.dot_balls, 3);
  ASSERT_TRUE(t1.best_bowling.has_value());
  EXPECT_EQ(t1.best_bowling->ToString(), "1/11");
  EXPECT_EQ(t1.times_out, 1);
  EXPECT_EQ(t1.ducks, 1);

  EXPECT_EQ(deltas.at("T2").maidens, 1);
  EXPECT_EQ(deltas.at("T5").catches, 1);
  EXPECT_EQ(deltas.at("L4").run_outs, 1);
  EXPECT_EQ(deltas.at("L4").wickets, 0);
  EXPECT_EQ(deltas.at("L9").innings, 0);
}

TEST(StatsAggregatorTest, RejectsIncompleteMatch) {
  scorer::ScoringSession session(MakeConfig());
  Bowl(session, 1);
  EXPECT_THROW(scorer::AggregateCompletedMatch(session.GetSnapshot()), scorer::StateError);
}

TEST(StatsAggregatorTest, MilestonesAndRetiredBatters) {
  scorer::MatchSnapshot snapshot;
  snapshot.config = MakeConfig();
  snapshot.completed = true;
  scorer::InningsSummary innings;
  scorer::BattingCard century;
  century.player = "L1";
  century.runs = 104;
  century.balls = 60;
  century.out = true;
  scorer::BattingCard fifty;
  fifty.player = "L2";
  fifty.runs = 50;
  fifty.balls = 40;
  scorer::BattingCard retired;
  retired.player = "L3";
  retired.runs = 0;
  retired.balls = 2;
  retired.retired = true;
  innings.batting = {century, fifty, retired};
  snapshot.innings.push_back(innings);

  auto deltas = scorer::AggregateCompletedMatch(snapshot);
  EXPECT_EQ(deltas.at("L1").hundreds, 1);
  EXPECT_EQ(deltas.at("L1").fifties, 0);
  EXPECT_EQ(deltas.at("L2").fifties, 1);
  EXPECT_EQ(deltas.at("L3").ducks, 0);
  EXPECT_EQ(deltas.at("L3").not_outs, 1);
  EXPECT_EQ(deltas.at("L3").times_out, 0);
}

TEST(StatsAggregatorTest, DerivedRatesComputedOnRead) {
  scorer::PlayerStats stats;
  stats.runs = 150;
  stats.times_out = 3;
  stats.balls_faced = 100;
  stats.balls_bowled = 24;
  stats.runs_conceded = 30;
  stats.wickets = 3;

  EXPECT_DOUBLE_EQ(stats.BattingAverage().value_or(0.0), 50.0);
  EXPECT_DOUBLE_EQ(stats.StrikeRate(), 150.0);
  EXPECT_DOUBLE_EQ(stats.Economy().value_or(0.0), 7.5);
  EXPECT_DOUBLE_EQ(stats.BowlingAverage().value_or(0.0), 10.0);
  EXPECT_DOUBLE_EQ(stats.BowlingStrikeRate().value_or(0.0), 8.0);

  scorer::PlayerStats empty;
  EXPECT_FALSE(empty.BattingAverage().has_value());
  EXPECT_FALSE(empty.Economy().has_value());
  EXPECT_DOUBLE_EQ(empty.StrikeRate(), 0.0);
}

TEST(StatsAggregatorTest, MergeKeepsBestFiguresAndHighestScore) {
  scorer::PlayerStats career;
  career.highest_score = 80;
  career.best_bowling = scorer::BowlingFigures{3, 20};

  scorer::PlayerStats match;
  match.highest_score = 45;
  match.best_bowling = scorer::BowlingFigures{3, 15};
  career.Merge(match);
  EXPECT_EQ(career.highest_score, 80);
  EXPECT_EQ(career.best_bowling->ToString(), "3/15");

  match.best_bowling = scorer::BowlingFigures{2, 5};
  career.Merge(match);
  EXPECT_EQ(career.best_bowling->ToString(), "3/15");
}
