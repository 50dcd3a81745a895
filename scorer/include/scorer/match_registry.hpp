/*
 * 설명: 진행 중인 경기 세션을 보관하고 경기별 변경 호출을 직렬화하며 종료 시 통산 기록에 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/api_router_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "scorer/career_book.hpp"
#include "scorer/match_codec.hpp"
#include "scorer/observability.hpp"
#include "scorer/scoring_session.hpp"

namespace scorer {

class MatchRegistry {
 public:
  MatchRegistry(ScoringRules rules, std::shared_ptr<CareerBook> career_book,
                std::shared_ptr<Observability> observability);

  // 식별자는 "match-N" 형식으로 부여한다.
  MatchSnapshot CreateMatch(MatchConfig config);
  // 저장된 식별자가 비어 있으면 새로 부여하고, 이미 등록된 식별자면 StateError.
  MatchSnapshot ImportMatch(PersistedMatch persisted);

  MatchSnapshot AppendBall(const std::string& match_id, const Ball& ball);
  MatchSnapshot Undo(const std::string& match_id);
  MatchSnapshot Redo(const std::string& match_id);
  MatchSnapshot StartSecondInnings(const std::string& match_id, const PlayerId& striker, const PlayerId& non_striker,
                                   const PlayerId& bowler);
  MatchSnapshot SetManOfTheMatch(const std::string& match_id, const PlayerId& player);
  MatchSnapshot GetSnapshot(const std::string& match_id) const;
  PersistedMatch Export(const std::string& match_id) const;

  std::size_t ActiveMatchCount() const;

 private:
  struct MatchContext {
    explicit MatchContext(ScoringSession s) : session(std::move(s)) {}

    ScoringSession session;
    bool career_applied{false};
    std::mutex mutex;
  };

  std::shared_ptr<MatchContext> Lookup(const std::string& match_id) const;
  std::string NextMatchIdLocked();
  MatchSnapshot Register(ScoringSession session);
  // 호출 시점에 ctx.mutex를 잡고 있어야 한다.
  void SyncCareer(const std::string& match_id, MatchContext& ctx);
  void LogEvent(const std::string& match_id, const std::string& name, LogLevel level, nlohmann::json detail) const;

  ScoringRules rules_;
  std::shared_ptr<CareerBook> career_book_;
  std::shared_ptr<Observability> observability_;
  std::size_t next_match_id_{1};
  std::unordered_map<std::string, std::shared_ptr<MatchContext>> matches_;
  mutable std::mutex mutex_;
};

}  // namespace scorer
