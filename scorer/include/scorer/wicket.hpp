/*
 * 설명: 아웃 유형을 검증하고 투수/야수 기여를 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/wicket_resolver_test.cpp
 */
#pragma once

#include <optional>

#include "scorer/types.hpp"

namespace scorer {

enum class FieldingKind { kCatch, kStumping, kRunOut };

struct FieldingCredit {
  PlayerId fielder;
  FieldingKind kind;
};

struct DismissalCredit {
  PlayerId batter_out;
  DismissalKind kind{DismissalKind::kBowled};
  bool bowler_credited{false};
  // 은퇴(retired)는 팀 위켓에는 포함되지만 타자 아웃 횟수에는 포함되지 않는다.
  bool counts_as_out{true};
  std::optional<FieldingCredit> fielding;
};

bool CreditsBowler(DismissalKind kind);
bool AcceptsFielder(DismissalKind kind);

// 팀 로스터와 무관한 정적 규칙만 검사한다. 실패 시 ValidationError.
void ValidateDismissal(const Ball& ball);

DismissalCredit ResolveDismissal(const Ball& ball);

}  // namespace scorer
