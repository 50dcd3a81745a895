/*
 * 설명: 서비스 환경설정 로딩과 기본값, 채점 규칙 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/config_test.cpp
 */
#pragma once

#include <string>

#include "scorer/types.hpp"

namespace scorer {

struct AppConfig {
  unsigned short port{8080};
  std::string log_level{"info"};
  int default_overs{20};
  int no_ball_penalty_runs{1};
  int wide_penalty_runs{1};
};

// 값이 숫자가 아니거나 허용 범위를 벗어나면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

ScoringRules RulesFromConfig(const AppConfig& config);

}  // namespace scorer
