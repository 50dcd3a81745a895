/*
 * 설명: 경기별 증분 반영의 중복을 막고 통산 기록을 읽을 때 합산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/career_book_test.cpp
 */
#include "scorer/career_book.hpp"

#include <algorithm>

namespace scorer {

std::optional<LeaderboardMetric> ParseLeaderboardMetric(std::string_view text) {
  if (text == "runs") {
    return LeaderboardMetric::kRuns;
  }
  if (text == "wickets") {
    return LeaderboardMetric::kWickets;
  }
  return std::nullopt;
}

bool CareerBook::ApplyCompletedMatch(const MatchSnapshot& snapshot) {
  StatsDelta delta = AggregateCompletedMatch(snapshot);
  std::lock_guard<std::mutex> lock(mutex_);
  return applied_.emplace(snapshot.config.match_id, std::move(delta)).second;
}

bool CareerBook::Revoke(const std::string& match_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return applied_.erase(match_id) > 0;
}

bool CareerBook::IsApplied(const std::string& match_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return applied_.count(match_id) > 0;
}

std::size_t CareerBook::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return applied_.size();
}

std::optional<PlayerStats> CareerBook::Find(const PlayerId& player) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<PlayerStats> total;
  for (const auto& [match_id, delta] : applied_) {
    auto it = delta.find(player);
    if (it == delta.end()) {
      continue;
    }
    if (!total) {
      total = PlayerStats{};
    }
    total->Merge(it->second);
  }
  return total;
}

std::vector<LeaderboardEntry> CareerBook::Leaderboard(LeaderboardMetric metric, std::size_t size) const {
  std::map<PlayerId, PlayerStats> totals;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    totals = FoldLocked();
  }

  std::vector<LeaderboardEntry> entries;
  entries.reserve(totals.size());
  for (auto& [player, stats] : totals) {
    int value = metric == LeaderboardMetric::kRuns ? stats.runs : stats.wickets;
    entries.push_back(LeaderboardEntry{player, value, stats});
  }
  // 동률이면 선수 식별자 오름차순. map 순회 순서를 유지하도록 stable_sort를 쓴다.
  std::stable_sort(entries.begin(), entries.end(),
                   [](const LeaderboardEntry& a, const LeaderboardEntry& b) { return a.value > b.value; });
  if (entries.size() > size) {
    entries.resize(size);
  }
  return entries;
}

std::map<PlayerId, PlayerStats> CareerBook::FoldLocked() const {
  std::map<PlayerId, PlayerStats> totals;
  for (const auto& [match_id, delta] : applied_) {
    for (const auto& [player, stats] : delta) {
      totals[player].Merge(stats);
    }
  }
  return totals;
}

}  // namespace scorer
