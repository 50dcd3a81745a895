/*
 * 설명: 종료된 경기를 선수별 통산 기록 증분으로 집계하고 파생 비율을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/stats_aggregator_test.cpp
 */
#pragma once

#include <map>
#include <optional>
#include <string>

#include "scorer/snapshot.hpp"
#include "scorer/types.hpp"

namespace scorer {

struct BowlingFigures {
  int wickets{0};
  int runs{0};

  bool BetterThan(const BowlingFigures& other) const;
  std::string ToString() const;
};

// 누적값만 저장한다. 평균/스트라이크율/이코노미는 읽을 때 계산한다.
struct PlayerStats {
  int matches{0};
  int innings{0};
  int runs{0};
  int balls_faced{0};
  int fours{0};
  int sixes{0};
  int times_out{0};
  int not_outs{0};
  int highest_score{0};
  int fifties{0};
  int hundreds{0};
  int ducks{0};

  int wickets{0};
  int balls_bowled{0};
  int runs_conceded{0};
  int maidens{0};
  int dot_balls{0};
  std::optional<BowlingFigures> best_bowling;

  int catches{0};
  int run_outs{0};
  int stumpings{0};
  int man_of_the_match{0};

  void Merge(const PlayerStats& delta);

  std::optional<double> BattingAverage() const;
  double StrikeRate() const;
  std::optional<double> Economy() const;
  std::optional<double> BowlingAverage() const;
  std::optional<double> BowlingStrikeRate() const;
};

using StatsDelta = std::map<PlayerId, PlayerStats>;

// 완료되지 않은 경기는 StateError. 중복 반영 방지는 호출자(CareerBook)가 경기 식별자로 보장한다.
StatsDelta AggregateCompletedMatch(const MatchSnapshot& snapshot);

}  // namespace scorer
