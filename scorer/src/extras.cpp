/*
 * 설명: 엑스트라 분류 규칙(와이드, 노볼 페널티, 바이/레그바이)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/extras_classifier_test.cpp
 */
#include "scorer/extras.hpp"

#include "scorer/errors.hpp"

namespace scorer {

ExtrasBreakdown& ExtrasBreakdown::operator+=(const ExtrasBreakdown& other) {
  wides += other.wides;
  no_balls += other.no_balls;
  byes += other.byes;
  leg_byes += other.leg_byes;
  return *this;
}

void ValidateExtras(const Ball& ball) {
  if (ball.runs < 0) {
    throw ValidationError("negative_runs", "득점은 음수일 수 없습니다");
  }
  if (ball.wide && ball.no_ball) {
    throw ValidationError("extras_conflict", "와이드와 노볼은 동시에 지정할 수 없습니다");
  }
  if (ball.wide && (ball.bye || ball.leg_bye)) {
    throw ValidationError("extras_conflict", "와이드에는 바이/레그바이를 함께 지정할 수 없습니다");
  }
  if (ball.bye && ball.leg_bye) {
    throw ValidationError("extras_conflict", "바이와 레그바이는 동시에 지정할 수 없습니다");
  }
}

DeliveryCredit ClassifyDelivery(const Ball& ball, const ScoringRules& rules) {
  DeliveryCredit credit;

  if (ball.wide) {
    credit.legal = false;
    credit.extras.wides = rules.wide_penalty_runs + ball.runs;
    credit.team_extras = credit.extras.wides;
    credit.bowler_conceded = credit.extras.wides;
    return credit;
  }

  if (ball.no_ball) {
    credit.legal = false;
    credit.extras.no_balls = rules.no_ball_penalty_runs;
    if (ball.bye) {
      credit.extras.byes = ball.runs;
    } else if (ball.leg_bye) {
      credit.extras.leg_byes = ball.runs;
    } else {
      credit.batsman_runs = ball.runs;
    }
    credit.team_extras = credit.extras.Total();
    credit.bowler_conceded = rules.no_ball_penalty_runs + credit.batsman_runs;
    return credit;
  }

  if (ball.bye || ball.leg_bye) {
    if (ball.bye) {
      credit.extras.byes = ball.runs;
    } else {
      credit.extras.leg_byes = ball.runs;
    }
    credit.team_extras = ball.runs;
    return credit;
  }

  credit.batsman_runs = ball.runs;
  credit.bowler_conceded = ball.runs;
  credit.four = ball.runs == 4;
  credit.six = ball.runs == 6;
  return credit;
}

}  // namespace scorer
