#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "scorer/match_codec.hpp"
#include "scorer/scoring_session.hpp"

namespace scorer_test {

using scorer::Ball;
using scorer::DismissalKind;
using scorer::MatchConfig;
using scorer::MatchSnapshot;
using scorer::PlayerId;
using scorer::ScoringSession;

inline std::chrono::system_clock::time_point MatchStart() {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000LL));
}

// lions(L1..Ln)가 토스에 이겨 먼저 공격한다. 오프닝은 L1/L2, 첫 투수는 T1.
inline MatchConfig MakeConfig(int overs = 20, int roster = 11) {
  MatchConfig config;
  config.match_id = "match-test";
  config.teams[0].id = "lions";
  config.teams[0].name = "Lions";
  config.teams[1].id = "tigers";
  config.teams[1].name = "Tigers";
  for (int i = 1; i <= roster; ++i) {
    config.teams[0].players.push_back("L" + std::to_string(i));
    config.teams[1].players.push_back("T" + std::to_string(i));
  }
  config.toss.winner_team_id = "lions";
  config.toss.decision = scorer::TossDecision::kBat;
  config.total_overs = overs;
  config.opening_striker = "L1";
  config.opening_non_striker = "L2";
  config.opening_bowler = "T1";
  config.started_at = MatchStart();
  return config;
}

inline const scorer::Team& TeamOf(const MatchSnapshot& snapshot, const std::string& team_id) {
  return snapshot.config.teams[*scorer::FindTeamIndex(snapshot.config, team_id)];
}

// 아직 타석에 서지 않은 첫 번째 타자.
inline PlayerId NextBatter(const MatchSnapshot& snapshot) {
  const auto& innings = snapshot.CurrentInnings();
  for (const auto& player : TeamOf(snapshot, snapshot.batting_team).players) {
    if (innings.FindBatter(player) == nullptr) {
      return player;
    }
  }
  return {};
}

// 현재 크리즈 상태에 맞는 투구. 새 오버에는 직전 투수가 아닌 첫 두 투수 중 하나를 고른다.
inline Ball NextBall(const MatchSnapshot& snapshot, int runs = 0) {
  const auto& crease = snapshot.crease;
  Ball ball;
  ball.striker = crease.striker ? *crease.striker : NextBatter(snapshot);
  ball.non_striker = crease.non_striker ? *crease.non_striker : NextBatter(snapshot);
  if (crease.bowler) {
    ball.bowler = *crease.bowler;
  } else {
    const auto& bowlers = TeamOf(snapshot, snapshot.bowling_team).players;
    ball.bowler = crease.previous_bowler && *crease.previous_bowler == bowlers[0] ? bowlers[1] : bowlers[0];
  }
  ball.runs = runs;
  ball.recorded_at = MatchStart() + std::chrono::seconds(snapshot.ledger_size + 1);
  return ball;
}

inline Ball NextWicket(const MatchSnapshot& snapshot, DismissalKind kind) {
  Ball ball = NextBall(snapshot);
  ball.wicket = true;
  ball.dismissal = kind;
  return ball;
}

inline MatchSnapshot Bowl(ScoringSession& session, int runs = 0) {
  return session.AppendBall(NextBall(session.GetSnapshot(), runs));
}

inline MatchSnapshot BowlMany(ScoringSession& session, int count, int runs = 0) {
  for (int i = 0; i < count; ++i) {
    Bowl(session, runs);
  }
  return session.GetSnapshot();
}

inline MatchSnapshot TakeWicket(ScoringSession& session, DismissalKind kind = DismissalKind::kBowled) {
  return session.AppendBall(NextWicket(session.GetSnapshot(), kind));
}

// 1이닝을 runs/4개의 4점과 점 투구로 채워 오버를 모두 소진한다. runs는 4의 배수여야 한다.
inline MatchSnapshot PlayFirstInningsOfFours(ScoringSession& session, int runs) {
  const int balls = session.Config().total_overs * scorer::kBallsPerOver;
  for (int i = 0; i < balls; ++i) {
    Bowl(session, i < runs / 4 ? 4 : 0);
  }
  return session.GetSnapshot();
}

inline MatchSnapshot OpenSecondInnings(ScoringSession& session) {
  return session.StartSecondInnings("T1", "T2", "L1");
}

// 1오버 경기. L1이 첫 투구부터 fours개의 4점을 치고 tigers는 무득점으로 끝난다.
inline ScoringSession PlayOneOverMatch(const std::string& match_id, int fours = 1) {
  MatchConfig config = MakeConfig(1);
  config.match_id = match_id;
  ScoringSession session(config);
  for (int i = 0; i < scorer::kBallsPerOver; ++i) {
    Bowl(session, i < fours ? 4 : 0);
  }
  OpenSecondInnings(session);
  BowlMany(session, scorer::kBallsPerOver);
  return session;
}

inline nlohmann::json Dump(const MatchSnapshot& snapshot) { return scorer::ToJson(snapshot); }

}  // namespace scorer_test
