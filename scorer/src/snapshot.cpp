/*
 * 설명: 스냅샷 표기(오버, 단계 문자열)와 런레이트 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/replay_test.cpp
 */
#include "scorer/snapshot.hpp"

#include <algorithm>

namespace scorer {

std::string_view ToString(MatchPhase phase) {
  switch (phase) {
    case MatchPhase::kInnings1InProgress:
      return "innings1_in_progress";
    case MatchPhase::kInnings1Complete:
      return "innings1_complete";
    case MatchPhase::kInnings2InProgress:
      return "innings2_in_progress";
    case MatchPhase::kMatchComplete:
      return "match_complete";
  }
  return "unknown";
}

std::string_view ToString(InningsEnd end) {
  switch (end) {
    case InningsEnd::kNone:
      return "none";
    case InningsEnd::kAllOut:
      return "all_out";
    case InningsEnd::kOversComplete:
      return "overs_complete";
    case InningsEnd::kTargetReached:
      return "target_reached";
  }
  return "unknown";
}

std::string_view ToString(ResultKind kind) {
  switch (kind) {
    case ResultKind::kNone:
      return "none";
    case ResultKind::kWonByRuns:
      return "won_by_runs";
    case ResultKind::kWonByWickets:
      return "won_by_wickets";
    case ResultKind::kTie:
      return "tie";
  }
  return "unknown";
}

std::string FormatOvers(int legal_balls) {
  return std::to_string(legal_balls / kBallsPerOver) + "." + std::to_string(legal_balls % kBallsPerOver);
}

double BattingCard::StrikeRate() const {
  return balls > 0 ? static_cast<double>(runs) * 100.0 / static_cast<double>(balls) : 0.0;
}

double BowlingCard::Economy() const {
  return legal_balls > 0 ? static_cast<double>(runs_conceded) * kBallsPerOver / static_cast<double>(legal_balls) : 0.0;
}

double InningsSummary::RunRate() const {
  return legal_balls > 0 ? static_cast<double>(score) * kBallsPerOver / static_cast<double>(legal_balls) : 0.0;
}

const BattingCard* InningsSummary::FindBatter(const PlayerId& player) const {
  auto it = std::find_if(batting.begin(), batting.end(), [&](const BattingCard& c) { return c.player == player; });
  return it == batting.end() ? nullptr : &*it;
}

const BowlingCard* InningsSummary::FindBowler(const PlayerId& player) const {
  auto it = std::find_if(bowling.begin(), bowling.end(), [&](const BowlingCard& c) { return c.player == player; });
  return it == bowling.end() ? nullptr : &*it;
}

std::optional<int> MatchSnapshot::RunsNeeded() const {
  if (!target || current_innings != 2 || innings.size() < 2) {
    return std::nullopt;
  }
  return std::max(0, *target - innings.back().score);
}

std::optional<int> MatchSnapshot::BallsRemaining() const {
  if (innings.empty()) {
    return std::nullopt;
  }
  return std::max(0, config.total_overs * kBallsPerOver - innings.back().legal_balls);
}

std::optional<double> MatchSnapshot::RequiredRunRate() const {
  auto needed = RunsNeeded();
  auto remaining = BallsRemaining();
  if (!needed || !remaining || *remaining == 0 || completed) {
    return std::nullopt;
  }
  return static_cast<double>(*needed) * kBallsPerOver / static_cast<double>(*remaining);
}

}  // namespace scorer
