/*
 * 설명: 이닝/경기 전이 규칙과 결과 산정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/innings_transition_test.cpp
 */
#include "scorer/transition.hpp"

#include <set>

#include "scorer/errors.hpp"

namespace scorer {
namespace {
const Team& TeamById(const MatchConfig& config, const std::string& team_id) {
  auto index = FindTeamIndex(config, team_id);
  if (!index) {
    throw ValidationError("unknown_team", "존재하지 않는 팀입니다: " + team_id);
  }
  return config.teams[*index];
}

void RequireMember(const Team& team, const PlayerId& player) {
  if (player.empty()) {
    throw ValidationError("player_required", "선수를 지정해야 합니다");
  }
  if (!team.HasPlayer(player)) {
    throw ValidationError("player_wrong_team", player + " 선수는 " + team.id + " 팀 소속이 아닙니다");
  }
}
}  // namespace

InningsEnd DetectInningsEnd(const InningsSummary& innings, std::size_t roster_size, int total_overs,
                            std::optional<int> target) {
  if (innings.wickets >= static_cast<int>(roster_size) - 1) {
    return InningsEnd::kAllOut;
  }
  if (innings.legal_balls >= total_overs * kBallsPerOver) {
    return InningsEnd::kOversComplete;
  }
  if (target && innings.score >= *target) {
    return InningsEnd::kTargetReached;
  }
  return InningsEnd::kNone;
}

MatchResult ResolveResult(const MatchSnapshot& snapshot) {
  MatchResult result;
  if (snapshot.innings.size() < 2 || !snapshot.innings[1].complete || !snapshot.target) {
    return result;
  }
  const InningsSummary& first = snapshot.innings[0];
  const InningsSummary& second = snapshot.innings[1];

  if (second.score >= *snapshot.target) {
    const Team& chasing = TeamById(snapshot.config, second.batting_team);
    result.kind = ResultKind::kWonByWickets;
    result.winner_team = second.batting_team;
    result.margin = static_cast<int>(chasing.players.size()) - 1 - second.wickets;
    return result;
  }
  if (second.score == first.score) {
    result.kind = ResultKind::kTie;
    return result;
  }
  result.kind = ResultKind::kWonByRuns;
  result.winner_team = first.batting_team;
  result.margin = *snapshot.target - 1 - second.score;
  return result;
}

void ValidateMatchConfig(const MatchConfig& config) {
  std::set<std::string> team_ids;
  std::set<PlayerId> players;
  for (const auto& team : config.teams) {
    if (team.id.empty()) {
      throw ValidationError("team_id_required", "팀 식별자가 비어 있습니다");
    }
    if (!team_ids.insert(team.id).second) {
      throw ValidationError("duplicate_team", "두 팀의 식별자가 같습니다");
    }
    if (team.players.size() < 2) {
      throw ValidationError("roster_too_small", team.id + " 팀은 최소 2명이 필요합니다");
    }
    for (const auto& player : team.players) {
      if (player.empty()) {
        throw ValidationError("player_required", "선수 식별자가 비어 있습니다");
      }
      if (!players.insert(player).second) {
        throw ValidationError("duplicate_player", player + " 선수가 중복 등록되었습니다");
      }
    }
  }
  if (config.total_overs <= 0) {
    throw ValidationError("overs_invalid", "오버 수는 1 이상이어야 합니다");
  }
  if (!FindTeamIndex(config, config.toss.winner_team_id)) {
    throw ValidationError("toss_winner_invalid", "토스 승리 팀이 경기 참가 팀이 아닙니다");
  }

  const std::size_t batting = BattingFirstIndex(config);
  const Team& batting_team = config.teams[batting];
  const Team& bowling_team = config.teams[1 - batting];
  RequireMember(batting_team, config.opening_striker);
  RequireMember(batting_team, config.opening_non_striker);
  if (config.opening_striker == config.opening_non_striker) {
    throw ValidationError("same_batter", "오프닝 타자 두 명이 같을 수 없습니다");
  }
  RequireMember(bowling_team, config.opening_bowler);
}

void ValidateSecondInningsOpening(const MatchSnapshot& snapshot, const InningsOpening& opening) {
  if (snapshot.phase != MatchPhase::kInnings1Complete) {
    throw StateError("innings_not_complete", "1이닝이 끝난 뒤에만 2이닝을 시작할 수 있습니다");
  }
  const Team& batting = TeamById(snapshot.config, snapshot.batting_team);
  const Team& bowling = TeamById(snapshot.config, snapshot.bowling_team);
  RequireMember(batting, opening.striker);
  RequireMember(batting, opening.non_striker);
  if (opening.striker == opening.non_striker) {
    throw ValidationError("same_batter", "오프닝 타자 두 명이 같을 수 없습니다");
  }
  RequireMember(bowling, opening.bowler);
}

}  // namespace scorer
