/*
 * 설명: 경기 스코어카드를 선수별 타격/투구/수비 증분으로 접고 통산 기록에 병합한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/stats_aggregator_test.cpp, scorer/tests/unit/career_book_test.cpp
 */
#include "scorer/stats.hpp"

#include <algorithm>

#include "scorer/errors.hpp"

namespace scorer {

bool BowlingFigures::BetterThan(const BowlingFigures& other) const {
  if (wickets != other.wickets) {
    return wickets > other.wickets;
  }
  return runs < other.runs;
}

std::string BowlingFigures::ToString() const { return std::to_string(wickets) + "/" + std::to_string(runs); }

void PlayerStats::Merge(const PlayerStats& delta) {
  matches += delta.matches;
  innings += delta.innings;
  runs += delta.runs;
  balls_faced += delta.balls_faced;
  fours += delta.fours;
  sixes += delta.sixes;
  times_out += delta.times_out;
  not_outs += delta.not_outs;
  highest_score = std::max(highest_score, delta.highest_score);
  fifties += delta.fifties;
  hundreds += delta.hundreds;
  ducks += delta.ducks;

  wickets += delta.wickets;
  balls_bowled += delta.balls_bowled;
  runs_conceded += delta.runs_conceded;
  maidens += delta.maidens;
  dot_balls += delta.dot_balls;
  if (delta.best_bowling && (!best_bowling || delta.best_bowling->BetterThan(*best_bowling))) {
    best_bowling = delta.best_bowling;
  }

  catches += delta.catches;
  run_outs += delta.run_outs;
  stumpings += delta.stumpings;
  man_of_the_match += delta.man_of_the_match;
}

std::optional<double> PlayerStats::BattingAverage() const {
  if (times_out == 0) {
    return std::nullopt;
  }
  return static_cast<double>(runs) / static_cast<double>(times_out);
}

double PlayerStats::StrikeRate() const {
  return balls_faced > 0 ? static_cast<double>(runs) * 100.0 / static_cast<double>(balls_faced) : 0.0;
}

std::optional<double> PlayerStats::Economy() const {
  if (balls_bowled == 0) {
    return std::nullopt;
  }
  return static_cast<double>(runs_conceded) * kBallsPerOver / static_cast<double>(balls_bowled);
}

std::optional<double> PlayerStats::BowlingAverage() const {
  if (wickets == 0) {
    return std::nullopt;
  }
  return static_cast<double>(runs_conceded) / static_cast<double>(wickets);
}

std::optional<double> PlayerStats::BowlingStrikeRate() const {
  if (wickets == 0) {
    return std::nullopt;
  }
  return static_cast<double>(balls_bowled) / static_cast<double>(wickets);
}

StatsDelta AggregateCompletedMatch(const MatchSnapshot& snapshot) {
  if (!snapshot.completed) {
    throw StateError("match_not_complete", "종료되지 않은 경기는 집계할 수 없습니다");
  }

  StatsDelta deltas;
  for (const auto& team : snapshot.config.teams) {
    for (const auto& player : team.players) {
      deltas[player].matches = 1;
    }
  }

  for (const auto& innings : snapshot.innings) {
    for (const auto& card : innings.batting) {
      PlayerStats& stats = deltas[card.player];
      ++stats.innings;
      stats.runs += card.runs;
      stats.balls_faced += card.balls;
      stats.fours += card.fours;
      stats.sixes += card.sixes;
      stats.highest_score = std::max(stats.highest_score, card.runs);
      if (card.out) {
        ++stats.times_out;
        if (card.runs == 0) {
          ++stats.ducks;
        }
      } else {
        ++stats.not_outs;
      }
      if (card.runs >= 100) {
        ++stats.hundreds;
      } else if (card.runs >= 50) {
        ++stats.fifties;
      }
    }

    for (const auto& card : innings.bowling) {
      PlayerStats& stats = deltas[card.player];
      stats.wickets += card.wickets;
      stats.balls_bowled += card.legal_balls;
      stats.runs_conceded += card.runs_conceded;
      stats.maidens += card.maidens;
      stats.dot_balls += card.dot_balls;
      BowlingFigures figures{card.wickets, card.runs_conceded};
      if (!stats.best_bowling || figures.BetterThan(*stats.best_bowling)) {
        stats.best_bowling = figures;
      }
    }

    for (const auto& credit : innings.fielding) {
      PlayerStats& stats = deltas[credit.fielder];
      switch (credit.kind) {
        case FieldingKind::kCatch:
          ++stats.catches;
          break;
        case FieldingKind::kStumping:
          ++stats.stumpings;
          break;
        case FieldingKind::kRunOut:
          ++stats.run_outs;
          break;
      }
    }
  }

  if (snapshot.man_of_the_match) {
    ++deltas[*snapshot.man_of_the_match].man_of_the_match;
  }
  return deltas;
}

}  // namespace scorer
