#include <functional>
#include <string>
#include <variant>

#include <gtest/gtest.h>

#include "match_fixture.hpp"
#include "scorer/errors.hpp"

namespace {

using scorer_test::Bowl;
using scorer_test::BowlMany;
using scorer_test::Dump;
using scorer_test::MakeConfig;
using scorer_test::NextBall;
using scorer_test::NextWicket;
using scorer_test::OpenSecondInnings;
using scorer_test::TakeWicket;

std::string RejectionCode(scorer::ScoringSession& session, const scorer::Ball& ball) {
  const auto before = Dump(session.GetSnapshot());
  const auto ledger_size = session.Entries().size();
  try {
    session.AppendBall(ball);
  } catch (const scorer::ScoringError& ex) {
    EXPECT_EQ(session.Entries().size(), ledger_size);
    EXPECT_EQ(Dump(session.GetSnapshot()), before);
    return ex.code;
  }
  return "";
}

scorer::ScoringSession CompletedMatch() {
  scorer::ScoringSession session(MakeConfig(1));
  Bowl(session, 4);
  BowlMany(session, 5);
  OpenSecondInnings(session);
  BowlMany(session, 6);
  return session;
}

}  // namespace

TEST(ScoringSessionTest, AssignsSequenceInningsAndBattingTeam) {
  scorer::ScoringSession session(MakeConfig());
  Bowl(session, 1);
  Bowl(session, 0);
  const auto& entries = session.Entries();
  ASSERT_EQ(entries.size(), 2u);
  const auto& second = std::get<scorer::Ball>(entries[1]);
  EXPECT_EQ(second.sequence, 2u);
  EXPECT_EQ(second.innings, 1);
  EXPECT_EQ(second.batting_team, "lions");
}

TEST(ScoringSessionTest, RejectsInvalidDeliveriesWithoutMutation) {
  scorer::ScoringSession session(MakeConfig());
  Bowl(session, 0);
  const auto& snapshot = session.GetSnapshot();

  auto negative = NextBall(snapshot, -2);
  EXPECT_EQ(RejectionCode(session, negative), "negative_runs");

  auto outsider = NextBall(snapshot);
  outsider.bowler = "L9";
  EXPECT_EQ(RejectionCode(session, outsider), "bowler_mid_over");

  auto wrong_striker = NextBall(snapshot);
  wrong_striker.striker = "L5";
  EXPECT_EQ(RejectionCode(session, wrong_striker), "striker_mismatch");

  auto wrong_innings = NextBall(snapshot);
  wrong_innings.innings = 2;
  EXPECT_EQ(RejectionCode(session, wrong_innings), "innings_mismatch");

  auto wrong_team = NextBall(snapshot);
  wrong_team.batting_team = "tigers";
  EXPECT_EQ(RejectionCode(session, wrong_team), "batting_team_mismatch");

  auto foreign_fielder = NextWicket(snapshot, scorer::DismissalKind::kCaught);
  foreign_fielder.fielder = "L7";
  EXPECT_EQ(RejectionCode(session, foreign_fielder), "fielder_wrong_team");

  auto wide_and_no_ball = NextBall(snapshot);
  wide_and_no_ball.wide = true;
  wide_and_no_ball.no_ball = true;
  EXPECT_EQ(RejectionCode(session, wide_and_no_ball), "extras_conflict");
}

TEST(ScoringSessionTest, NewOverRequiresDifferentBowlerFromRoster) {
  scorer::ScoringSession session(MakeConfig());
  BowlMany(session, 6);
  auto same_bowler = NextBall(session.GetSnapshot());
  same_bowler.bowler = "T1";
  EXPECT_EQ(RejectionCode(session, same_bowler), "bowler_consecutive_overs");

  auto batting_side_bowler = NextBall(session.GetSnapshot());
  batting_side_bowler.bowler = "L4";
  EXPECT_EQ(RejectionCode(session, batting_side_bowler), "player_wrong_team");

  auto new_bowler = NextBall(session.GetSnapshot());
  new_bowler.bowler = "T7";
  EXPECT_NO_THROW(session.AppendBall(new_bowler));
}

TEST(ScoringSessionTest, DismissedBatterCannotReturn) {
  scorer::ScoringSession session(MakeConfig());
  TakeWicket(session);
  auto comeback = NextBall(session.GetSnapshot());
  comeback.striker = "L1";
  EXPECT_EQ(RejectionCode(session, comeback), "batter_already_out");

  auto retired_ball = NextWicket(session.GetSnapshot(), scorer::DismissalKind::kRetired);
  retired_ball.dismissed_player = retired_ball.non_striker;
  auto snapshot = session.AppendBall(retired_ball);
  const auto* retired = snapshot.CurrentInnings().FindBatter("L2");
  ASSERT_NE(retired, nullptr);
  EXPECT_TRUE(retired->retired);
  EXPECT_FALSE(retired->out);
  EXPECT_EQ(snapshot.CurrentInnings().wickets, 2);

  auto return_of_retired = NextBall(snapshot);
  return_of_retired.non_striker = "L2";
  EXPECT_EQ(RejectionCode(session, return_of_retired), "batter_already_out");
}

TEST(ScoringSessionTest, RejectsNegativePenaltyRules) {
  scorer::ScoringRules rules;
  rules.no_ball_penalty_runs = -1;
  try {
    scorer::ScoringSession session(MakeConfig(), rules);
    FAIL() << "negative penalty accepted";
  } catch (const scorer::ValidationError& ex) {
    EXPECT_EQ(ex.code, "rules_invalid");
  }
}

TEST(ScoringSessionTest, ManOfTheMatchOnlyAfterCompletion) {
  scorer::ScoringSession session(MakeConfig());
  try {
    session.SetManOfTheMatch("L1");
    FAIL() << "award accepted mid-match";
  } catch (const scorer::StateError& ex) {
    EXPECT_EQ(ex.code, "match_not_complete");
  }

  auto finished = CompletedMatch();
  EXPECT_THROW(finished.SetManOfTheMatch("X99"), scorer::ValidationError);
  auto snapshot = finished.SetManOfTheMatch("L1");
  EXPECT_EQ(snapshot.man_of_the_match.value_or(""), "L1");

  snapshot = finished.Undo();
  EXPECT_FALSE(snapshot.completed);
  EXPECT_FALSE(snapshot.man_of_the_match.has_value());
  snapshot = finished.Redo();
  EXPECT_TRUE(snapshot.completed);
  EXPECT_EQ(snapshot.man_of_the_match.value_or(""), "L1");
}

TEST(ScoringSessionTest, UndoRedoKeepsManOfTheMatch) {
  auto finished = CompletedMatch();
  auto before = finished.SetManOfTheMatch("T1");

  finished.Undo();
  auto after = finished.Redo();
  EXPECT_EQ(Dump(after), Dump(before));
}

TEST(ScoringSessionTest, NewBranchAfterUndoDropsManOfTheMatch) {
  auto finished = CompletedMatch();
  finished.SetManOfTheMatch("L1");

  finished.Undo();
  auto snapshot = Bowl(finished, 1);
  EXPECT_TRUE(snapshot.completed);
  EXPECT_FALSE(snapshot.man_of_the_match.has_value());
  EXPECT_FALSE(finished.CanRedo());
}

TEST(ScoringSessionTest, RestoreReproducesSnapshot) {
  auto original = CompletedMatch();
  original.SetManOfTheMatch("T2");

  auto restored = scorer::ScoringSession::Restore(original.Config(), original.Entries(), original.Rules(),
                                                  original.GetSnapshot().man_of_the_match);
  EXPECT_EQ(Dump(restored.GetSnapshot()), Dump(original.GetSnapshot()));
  EXPECT_FALSE(restored.CanRedo());
}

TEST(ScoringSessionTest, RestoreRejectsCorruptedLedger) {
  scorer::ScoringSession session(MakeConfig());
  BowlMany(session, 6);
  auto entries = session.Entries();
  // 7번째 투구를 직전 오버 투수로 위조한다.
  scorer::Ball forged = std::get<scorer::Ball>(entries.back());
  forged.sequence = 7;
  entries.push_back(forged);
  EXPECT_THROW(scorer::ScoringSession::Restore(session.Config(), entries, session.Rules()), scorer::ValidationError);
}
