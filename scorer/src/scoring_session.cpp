/*
 * 설명: 투구 검증 후 원장에 추가하고 전체 재생으로 스냅샷을 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/scoring_session_test.cpp, scorer/tests/unit/replay_test.cpp
 */
#include "scorer/scoring_session.hpp"

#include <utility>
#include <variant>

#include "scorer/errors.hpp"
#include "scorer/extras.hpp"
#include "scorer/over_state.hpp"
#include "scorer/replay.hpp"
#include "scorer/transition.hpp"
#include "scorer/wicket.hpp"

namespace scorer {
namespace {
const Team& TeamOf(const MatchConfig& config, const std::string& team_id) {
  auto index = FindTeamIndex(config, team_id);
  if (!index) {
    throw ValidationError("unknown_team", "존재하지 않는 팀입니다: " + team_id);
  }
  return config.teams[*index];
}
}  // namespace

ScoringSession::ScoringSession(MatchConfig config, ScoringRules rules)
    : config_(std::move(config)), rules_(rules) {
  ValidateMatchConfig(config_);
  if (rules_.no_ball_penalty_runs < 0 || rules_.wide_penalty_runs < 0) {
    throw ValidationError("rules_invalid", "페널티 득점은 음수일 수 없습니다");
  }
  Rebuild();
}

ScoringSession ScoringSession::Restore(MatchConfig config, const std::vector<LedgerEntry>& entries, ScoringRules rules,
                                       const std::optional<PlayerId>& man_of_the_match) {
  ScoringSession session(std::move(config), rules);
  for (const auto& entry : entries) {
    if (const auto* ball = std::get_if<Ball>(&entry)) {
      session.AppendBall(*ball);
      continue;
    }
    const auto& opening = std::get<InningsOpening>(entry);
    session.StartSecondInnings(opening.striker, opening.non_striker, opening.bowler);
  }
  if (man_of_the_match) {
    session.SetManOfTheMatch(*man_of_the_match);
  }
  return session;
}

MatchSnapshot ScoringSession::AppendBall(Ball ball) {
  if (ball.innings == 0) {
    ball.innings = snapshot_.current_innings;
  }
  if (ball.batting_team.empty()) {
    ball.batting_team = snapshot_.batting_team;
  }
  ValidateBall(ball);
  ball.sequence = static_cast<std::uint64_t>(ledger_.Size()) + 1;
  ledger_.Append(std::move(ball));
  // 새 분기가 시작되면 재실행 버퍼와 함께 이전 결말의 최우수 선수도 버린다.
  man_of_the_match_.reset();
  Rebuild();
  return snapshot_;
}

MatchSnapshot ScoringSession::Undo() {
  if (ledger_.Truncate()) {
    Rebuild();
  }
  return snapshot_;
}

MatchSnapshot ScoringSession::Redo() {
  if (ledger_.Reappend()) {
    Rebuild();
  }
  return snapshot_;
}

MatchSnapshot ScoringSession::StartSecondInnings(const PlayerId& striker, const PlayerId& non_striker,
                                                 const PlayerId& bowler) {
  InningsOpening opening{2, striker, non_striker, bowler};
  ValidateSecondInningsOpening(snapshot_, opening);
  ledger_.Append(std::move(opening));
  man_of_the_match_.reset();
  Rebuild();
  return snapshot_;
}

MatchSnapshot ScoringSession::SetManOfTheMatch(const PlayerId& player) {
  if (!snapshot_.completed) {
    throw StateError("match_not_complete", "경기가 끝난 뒤에만 최우수 선수를 지정할 수 있습니다");
  }
  if (!config_.teams[0].HasPlayer(player) && !config_.teams[1].HasPlayer(player)) {
    throw ValidationError("player_wrong_team", player + " 선수는 이 경기 참가자가 아닙니다");
  }
  man_of_the_match_ = player;
  snapshot_.man_of_the_match = player;
  return snapshot_;
}

void ScoringSession::ValidateBall(const Ball& ball) const {
  if (snapshot_.phase == MatchPhase::kMatchComplete) {
    throw StateError("match_complete", "이미 종료된 경기입니다");
  }
  if (snapshot_.phase == MatchPhase::kInnings1Complete) {
    throw StateError("innings_setup_pending", "2이닝 시작 정보가 먼저 필요합니다");
  }
  if (ball.innings != snapshot_.current_innings) {
    throw ValidationError("innings_mismatch", "현재 이닝과 투구의 이닝 번호가 다릅니다");
  }
  if (ball.batting_team != snapshot_.batting_team) {
    throw ValidationError("batting_team_mismatch", "현재 공격 팀과 일치하지 않습니다");
  }

  ValidateExtras(ball);
  OverStateMachine(snapshot_.crease).ValidateCrease(ball);
  ValidateDismissal(ball);
  // 승리 득점이 완료되면 경기가 끝나므로 같은 투구의 아웃은 성립하지 않는다.
  if (ball.wicket && snapshot_.target &&
      snapshot_.CurrentInnings().score + ClassifyDelivery(ball, rules_).TotalRuns() >= *snapshot_.target) {
    throw ValidationError("dismissal_after_target", "목표 점수에 도달한 투구에는 아웃을 기록할 수 없습니다");
  }

  const Team& batting = TeamOf(config_, snapshot_.batting_team);
  const Team& bowling = TeamOf(config_, snapshot_.bowling_team);
  const InningsSummary& innings = snapshot_.CurrentInnings();
  for (const PlayerId* batter : {&ball.striker, &ball.non_striker}) {
    if (!batting.HasPlayer(*batter)) {
      throw ValidationError("player_wrong_team", *batter + " 선수는 공격 팀 소속이 아닙니다");
    }
    const BattingCard* card = innings.FindBatter(*batter);
    if (card && (card->out || card->retired)) {
      throw ValidationError("batter_already_out", *batter + " 선수는 이미 아웃되었습니다");
    }
  }
  if (!bowling.HasPlayer(ball.bowler)) {
    throw ValidationError("player_wrong_team", ball.bowler + " 선수는 수비 팀 소속이 아닙니다");
  }
  if (ball.fielder && !bowling.HasPlayer(*ball.fielder)) {
    throw ValidationError("fielder_wrong_team", *ball.fielder + " 선수는 수비 팀 소속이 아닙니다");
  }
}

void ScoringSession::Rebuild() {
  snapshot_ = Replay(config_, ledger_.Entries(), rules_);
  // 경기가 다시 열려 있는 동안에는 보관만 하고 노출하지 않는다.
  if (snapshot_.completed) {
    snapshot_.man_of_the_match = man_of_the_match_;
  }
}

}  // namespace scorer
