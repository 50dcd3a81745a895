/*
 * 설명: 투구별 득점을 타자/팀 엑스트라/투수 실점으로 나누고 정규 투구 여부를 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/extras_classifier_test.cpp
 */
#pragma once

#include "scorer/types.hpp"

namespace scorer {

struct ExtrasBreakdown {
  int wides{0};
  int no_balls{0};
  int byes{0};
  int leg_byes{0};

  int Total() const { return wides + no_balls + byes + leg_byes; }
  ExtrasBreakdown& operator+=(const ExtrasBreakdown& other);
};

struct DeliveryCredit {
  int batsman_runs{0};
  int team_extras{0};
  int bowler_conceded{0};
  bool legal{true};
  bool four{false};
  bool six{false};
  ExtrasBreakdown extras;

  int TotalRuns() const { return batsman_runs + team_extras; }
};

// 와이드/노볼/바이/레그바이 조합이 허용되지 않으면 ValidationError를 던진다.
void ValidateExtras(const Ball& ball);

DeliveryCredit ClassifyDelivery(const Ball& ball, const ScoringRules& rules);

}  // namespace scorer
