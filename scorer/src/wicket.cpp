/*
 * 설명: 아웃 유형별 투수/야수 기여 규칙과 엑스트라 투구에서의 허용 아웃을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/wicket_resolver_test.cpp
 */
#include "scorer/wicket.hpp"

#include "scorer/errors.hpp"

namespace scorer {

bool CreditsBowler(DismissalKind kind) {
  switch (kind) {
    case DismissalKind::kBowled:
    case DismissalKind::kCaught:
    case DismissalKind::kLbw:
    case DismissalKind::kStumped:
    case DismissalKind::kHitWicket:
      return true;
    case DismissalKind::kRunOut:
    case DismissalKind::kRetired:
      return false;
  }
  return false;
}

bool AcceptsFielder(DismissalKind kind) {
  return kind == DismissalKind::kCaught || kind == DismissalKind::kStumped || kind == DismissalKind::kRunOut;
}

void ValidateDismissal(const Ball& ball) {
  if (!ball.wicket) {
    if (ball.dismissal || ball.fielder || ball.dismissed_player) {
      throw ValidationError("dismissal_without_wicket", "위켓이 아닌 투구에 아웃 정보가 포함되어 있습니다");
    }
    return;
  }
  if (!ball.dismissal) {
    throw ValidationError("dismissal_kind_required", "아웃 유형을 지정해야 합니다");
  }

  const DismissalKind kind = *ball.dismissal;
  if (ball.fielder && !AcceptsFielder(kind)) {
    throw ValidationError("fielder_not_allowed", "해당 아웃 유형에는 야수를 지정할 수 없습니다");
  }
  if (ball.no_ball && kind != DismissalKind::kRunOut && kind != DismissalKind::kRetired) {
    throw ValidationError("dismissal_on_no_ball", "노볼에서는 런아웃만 인정됩니다");
  }
  if (ball.wide && (kind == DismissalKind::kBowled || kind == DismissalKind::kCaught || kind == DismissalKind::kLbw)) {
    throw ValidationError("dismissal_on_wide", "와이드에서는 해당 아웃 유형이 인정되지 않습니다");
  }

  if (ball.dismissed_player) {
    const PlayerId& out = *ball.dismissed_player;
    if (out != ball.striker && out != ball.non_striker) {
      throw ValidationError("dismissed_not_batting", "아웃된 선수가 현재 타석에 있지 않습니다");
    }
    if (out == ball.non_striker && kind != DismissalKind::kRunOut && kind != DismissalKind::kRetired) {
      throw ValidationError("non_striker_dismissal", "논스트라이커는 런아웃 또는 은퇴로만 아웃될 수 있습니다");
    }
  }
}

DismissalCredit ResolveDismissal(const Ball& ball) {
  DismissalCredit credit;
  credit.kind = ball.dismissal.value_or(DismissalKind::kBowled);
  credit.batter_out = ball.dismissed_player.value_or(ball.striker);
  credit.bowler_credited = CreditsBowler(credit.kind);
  credit.counts_as_out = credit.kind != DismissalKind::kRetired;

  if (ball.fielder) {
    switch (credit.kind) {
      case DismissalKind::kCaught:
        credit.fielding = FieldingCredit{*ball.fielder, FieldingKind::kCatch};
        break;
      case DismissalKind::kStumped:
        credit.fielding = FieldingCredit{*ball.fielder, FieldingKind::kStumping};
        break;
      case DismissalKind::kRunOut:
        credit.fielding = FieldingCredit{*ball.fielder, FieldingKind::kRunOut};
        break;
      default:
        break;
    }
  }
  return credit;
}

}  // namespace scorer
