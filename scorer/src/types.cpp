/*
 * 설명: 공용 값 타입의 문자열 변환과 팀 조회 도우미를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/match_codec_test.cpp
 */
#include "scorer/types.hpp"

#include <algorithm>

namespace scorer {

std::string_view ToString(DismissalKind kind) {
  switch (kind) {
    case DismissalKind::kBowled:
      return "bowled";
    case DismissalKind::kCaught:
      return "caught";
    case DismissalKind::kLbw:
      return "lbw";
    case DismissalKind::kRunOut:
      return "run_out";
    case DismissalKind::kStumped:
      return "stumped";
    case DismissalKind::kHitWicket:
      return "hit_wicket";
    case DismissalKind::kRetired:
      return "retired";
  }
  return "unknown";
}

std::optional<DismissalKind> ParseDismissalKind(std::string_view text) {
  if (text == "bowled") {
    return DismissalKind::kBowled;
  }
  if (text == "caught") {
    return DismissalKind::kCaught;
  }
  if (text == "lbw") {
    return DismissalKind::kLbw;
  }
  if (text == "run_out") {
    return DismissalKind::kRunOut;
  }
  if (text == "stumped") {
    return DismissalKind::kStumped;
  }
  if (text == "hit_wicket") {
    return DismissalKind::kHitWicket;
  }
  if (text == "retired") {
    return DismissalKind::kRetired;
  }
  return std::nullopt;
}

std::string_view ToString(TossDecision decision) { return decision == TossDecision::kBat ? "bat" : "bowl"; }

std::optional<TossDecision> ParseTossDecision(std::string_view text) {
  if (text == "bat") {
    return TossDecision::kBat;
  }
  if (text == "bowl") {
    return TossDecision::kBowl;
  }
  return std::nullopt;
}

bool Team::HasPlayer(const PlayerId& player) const {
  return std::find(players.begin(), players.end(), player) != players.end();
}

std::size_t BattingFirstIndex(const MatchConfig& config) {
  std::size_t winner = config.teams[0].id == config.toss.winner_team_id ? 0 : 1;
  return config.toss.decision == TossDecision::kBat ? winner : 1 - winner;
}

std::optional<std::size_t> FindTeamIndex(const MatchConfig& config, std::string_view team_id) {
  for (std::size_t i = 0; i < config.teams.size(); ++i) {
    if (config.teams[i].id == team_id) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace scorer
