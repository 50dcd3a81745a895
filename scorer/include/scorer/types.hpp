/*
 * 설명: 투구 기록(Ball), 팀/경기 설정 등 엔진 전역에서 공유하는 값 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/ledger_test.cpp, scorer/tests/unit/match_codec_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scorer {

using PlayerId = std::string;

constexpr int kBallsPerOver = 6;

enum class DismissalKind { kBowled, kCaught, kLbw, kRunOut, kStumped, kHitWicket, kRetired };

enum class TossDecision { kBat, kBowl };

std::string_view ToString(DismissalKind kind);
std::optional<DismissalKind> ParseDismissalKind(std::string_view text);
std::string_view ToString(TossDecision decision);
std::optional<TossDecision> ParseTossDecision(std::string_view text);

// 원장에 추가된 뒤에는 변경되지 않는다. 정정은 원장 절단 후 재추가로만 한다.
struct Ball {
  std::uint64_t sequence{0};
  int innings{0};
  PlayerId striker;
  PlayerId non_striker;
  PlayerId bowler;
  int runs{0};
  bool wide{false};
  bool no_ball{false};
  bool bye{false};
  bool leg_bye{false};
  bool wicket{false};
  std::optional<DismissalKind> dismissal;
  std::optional<PlayerId> fielder;
  std::optional<PlayerId> dismissed_player;
  std::string batting_team;
  std::chrono::system_clock::time_point recorded_at{};

  bool IsExtra() const { return wide || no_ball || bye || leg_bye; }
};

// 2이닝 시작 시 외부에서 지정한 오프닝 타자/투수 기록.
struct InningsOpening {
  int innings{2};
  PlayerId striker;
  PlayerId non_striker;
  PlayerId bowler;
};

using LedgerEntry = std::variant<Ball, InningsOpening>;

struct Team {
  std::string id;
  std::string name;
  std::vector<PlayerId> players;

  bool HasPlayer(const PlayerId& player) const;
};

struct Toss {
  std::string winner_team_id;
  TossDecision decision{TossDecision::kBat};
};

struct MatchConfig {
  std::string match_id;
  std::array<Team, 2> teams;
  Toss toss;
  int total_overs{20};
  PlayerId opening_striker;
  PlayerId opening_non_striker;
  PlayerId opening_bowler;
  std::chrono::system_clock::time_point started_at{};
};

struct ScoringRules {
  int no_ball_penalty_runs{1};
  int wide_penalty_runs{1};
};

std::size_t BattingFirstIndex(const MatchConfig& config);
std::optional<std::size_t> FindTeamIndex(const MatchConfig& config, std::string_view team_id);

}  // namespace scorer
