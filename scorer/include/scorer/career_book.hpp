/*
 * 설명: 종료된 경기의 선수별 증분을 경기 식별자 단위로 보관하고 통산 기록과 리더보드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/career_book_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "scorer/snapshot.hpp"
#include "scorer/stats.hpp"

namespace scorer {

enum class LeaderboardMetric { kRuns, kWickets };

std::optional<LeaderboardMetric> ParseLeaderboardMetric(std::string_view text);

struct LeaderboardEntry {
  PlayerId player;
  int value{0};
  PlayerStats stats;
};

class CareerBook {
 public:
  // 같은 경기 식별자가 이미 반영되어 있으면 false를 반환하고 아무것도 바꾸지 않는다.
  bool ApplyCompletedMatch(const MatchSnapshot& snapshot);
  // 되돌리기로 경기가 미완료가 되었을 때 반영분을 제거한다.
  bool Revoke(const std::string& match_id);

  bool IsApplied(const std::string& match_id) const;
  std::size_t Count() const;
  std::optional<PlayerStats> Find(const PlayerId& player) const;
  std::vector<LeaderboardEntry> Leaderboard(LeaderboardMetric metric, std::size_t size) const;

 private:
  std::map<PlayerId, PlayerStats> FoldLocked() const;

  std::map<std::string, StatsDelta> applied_;
  mutable std::mutex mutex_;
};

}  // namespace scorer
