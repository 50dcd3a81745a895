/*
 * 설명: 원장 재생으로 도출되는 경기 스냅샷(이닝 합계, 스코어카드, 결과) 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/replay_test.cpp, scorer/tests/unit/innings_transition_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "scorer/extras.hpp"
#include "scorer/over_state.hpp"
#include "scorer/types.hpp"
#include "scorer/wicket.hpp"

namespace scorer {

enum class MatchPhase { kInnings1InProgress, kInnings1Complete, kInnings2InProgress, kMatchComplete };

enum class InningsEnd { kNone, kAllOut, kOversComplete, kTargetReached };

enum class ResultKind { kNone, kWonByRuns, kWonByWickets, kTie };

std::string_view ToString(MatchPhase phase);
std::string_view ToString(InningsEnd end);
std::string_view ToString(ResultKind kind);

// "15.3" 형식의 오버 표기.
std::string FormatOvers(int legal_balls);

struct FallOfWicket {
  int wicket_number{0};
  PlayerId player;
  int score{0};
  int legal_balls{0};
};

struct Partnership {
  PlayerId first;
  PlayerId second;
  int runs{0};
  int balls{0};
};

struct BattingCard {
  PlayerId player;
  int runs{0};
  int balls{0};
  int fours{0};
  int sixes{0};
  int dot_balls{0};
  bool out{false};
  bool retired{false};
  std::optional<DismissalKind> dismissal;
  std::optional<PlayerId> dismissed_by;
  std::optional<PlayerId> fielder;

  double StrikeRate() const;
};

struct BowlingCard {
  PlayerId player;
  int legal_balls{0};
  int runs_conceded{0};
  int wickets{0};
  int maidens{0};
  int dot_balls{0};
  int wides{0};
  int no_balls{0};

  double Economy() const;
};

struct InningsSummary {
  int number{1};
  std::string batting_team;
  std::string bowling_team;
  int score{0};
  int wickets{0};
  int legal_balls{0};
  ExtrasBreakdown extras;
  std::vector<FallOfWicket> fall_of_wickets;
  std::vector<Partnership> partnerships;
  std::vector<BattingCard> batting;
  std::vector<BowlingCard> bowling;
  std::vector<FieldingCredit> fielding;
  bool complete{false};
  InningsEnd end{InningsEnd::kNone};

  std::string Overs() const { return FormatOvers(legal_balls); }
  double RunRate() const;
  const BattingCard* FindBatter(const PlayerId& player) const;
  const BowlingCard* FindBowler(const PlayerId& player) const;
};

struct MatchResult {
  ResultKind kind{ResultKind::kNone};
  std::optional<std::string> winner_team;
  int margin{0};
};

// 원장과 설정만으로 재계산되는 값. 호출자는 반환된 스냅샷을 수정하지 않는다.
struct MatchSnapshot {
  MatchConfig config;
  MatchPhase phase{MatchPhase::kInnings1InProgress};
  int current_innings{1};
  std::string batting_team;
  std::string bowling_team;
  std::vector<InningsSummary> innings;
  CreaseState crease;
  std::optional<int> first_innings_score;
  std::optional<int> target;
  MatchResult result;
  bool completed{false};
  std::optional<PlayerId> man_of_the_match;
  std::chrono::system_clock::time_point started_at{};
  std::optional<std::chrono::system_clock::time_point> ended_at;
  std::size_t ledger_size{0};

  const InningsSummary& CurrentInnings() const { return innings.back(); }
  std::optional<int> RunsNeeded() const;
  std::optional<int> BallsRemaining() const;
  std::optional<double> RequiredRunRate() const;
};

}  // namespace scorer
