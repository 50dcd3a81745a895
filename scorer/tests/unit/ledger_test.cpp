#include <variant>

#include <gtest/gtest.h>

#include "scorer/ledger.hpp"

namespace {

scorer::Ball BallWithRuns(int runs) {
  scorer::Ball ball;
  ball.striker = "L1";
  ball.non_striker = "L2";
  ball.bowler = "T1";
  ball.runs = runs;
  return ball;
}

int RunsOf(const scorer::LedgerEntry& entry) { return std::get<scorer::Ball>(entry).runs; }

}  // namespace

TEST(BallLedgerTest, TruncateMovesLastEntryToRedo) {
  scorer::BallLedger ledger;
  ledger.Append(BallWithRuns(1));
  ledger.Append(BallWithRuns(2));

  auto removed = ledger.Truncate();
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(RunsOf(*removed), 2);
  EXPECT_EQ(ledger.Size(), 1u);
  EXPECT_EQ(ledger.RedoDepth(), 1u);

  auto restored = ledger.Reappend();
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(RunsOf(*restored), 2);
  EXPECT_EQ(ledger.Size(), 2u);
  EXPECT_FALSE(ledger.CanRedo());
}

TEST(BallLedgerTest, RedoReturnsMostRecentlyUndoneFirst) {
  scorer::BallLedger ledger;
  ledger.Append(BallWithRuns(1));
  ledger.Append(BallWithRuns(2));
  ledger.Append(BallWithRuns(3));
  ledger.Truncate();
  ledger.Truncate();

  EXPECT_EQ(RunsOf(*ledger.Reappend()), 2);
  EXPECT_EQ(RunsOf(*ledger.Reappend()), 3);
}

TEST(BallLedgerTest, AppendClearsRedoBuffer) {
  scorer::BallLedger ledger;
  ledger.Append(BallWithRuns(1));
  ledger.Truncate();
  ASSERT_TRUE(ledger.CanRedo());

  ledger.Append(BallWithRuns(4));
  EXPECT_FALSE(ledger.CanRedo());
  EXPECT_FALSE(ledger.Reappend().has_value());
  EXPECT_EQ(RunsOf(ledger.Entries().back()), 4);
}

TEST(BallLedgerTest, EmptyLedgerOperationsAreNoOps) {
  scorer::BallLedger ledger;
  EXPECT_FALSE(ledger.CanUndo());
  EXPECT_FALSE(ledger.Truncate().has_value());
  EXPECT_FALSE(ledger.Reappend().has_value());
  EXPECT_EQ(ledger.Size(), 0u);
}
