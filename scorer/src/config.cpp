/*
 * 설명: 환경 변수에서 서비스 설정을 읽고 기본값을 채운다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/config_test.cpp
 */
#include "scorer/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace scorer {

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.default_overs = std::stoi(get_env("DEFAULT_OVERS", "20"));
  cfg.no_ball_penalty_runs = std::stoi(get_env("NO_BALL_PENALTY_RUNS", "1"));
  cfg.wide_penalty_runs = std::stoi(get_env("WIDE_PENALTY_RUNS", "1"));
  if (cfg.default_overs <= 0) {
    throw std::invalid_argument("DEFAULT_OVERS는 1 이상이어야 합니다");
  }
  if (cfg.no_ball_penalty_runs < 0 || cfg.wide_penalty_runs < 0) {
    throw std::invalid_argument("NO_BALL_PENALTY_RUNS, WIDE_PENALTY_RUNS는 음수일 수 없습니다");
  }
  return cfg;
}

ScoringRules RulesFromConfig(const AppConfig& config) {
  ScoringRules rules;
  rules.no_ball_penalty_runs = config.no_ball_penalty_runs;
  rules.wide_penalty_runs = config.wide_penalty_runs;
  return rules;
}

}  // namespace scorer
