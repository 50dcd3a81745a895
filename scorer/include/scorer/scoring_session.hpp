/*
 * 설명: 한 경기의 원장과 스냅샷을 소유하며 투구 추가, 되돌리기/다시하기, 2이닝 시작을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/scoring_session_test.cpp, scorer/tests/unit/replay_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

#include "scorer/ledger.hpp"
#include "scorer/snapshot.hpp"
#include "scorer/types.hpp"

namespace scorer {

class ScoringSession {
 public:
  explicit ScoringSession(MatchConfig config, ScoringRules rules = ScoringRules{});

  // 저장된 경기를 재구성한다. 모든 항목을 다시 검증하므로 손상된 기록은 예외로 거부된다.
  static ScoringSession Restore(MatchConfig config, const std::vector<LedgerEntry>& entries, ScoringRules rules,
                                const std::optional<PlayerId>& man_of_the_match = std::nullopt);

  MatchSnapshot AppendBall(Ball ball);
  MatchSnapshot Undo();
  MatchSnapshot Redo();
  MatchSnapshot StartSecondInnings(const PlayerId& striker, const PlayerId& non_striker, const PlayerId& bowler);
  MatchSnapshot SetManOfTheMatch(const PlayerId& player);

  const MatchSnapshot& GetSnapshot() const { return snapshot_; }
  const MatchConfig& Config() const { return config_; }
  const ScoringRules& Rules() const { return rules_; }
  const std::vector<LedgerEntry>& Entries() const { return ledger_.Entries(); }
  bool CanUndo() const { return ledger_.CanUndo(); }
  bool CanRedo() const { return ledger_.CanRedo(); }

 private:
  void ValidateBall(const Ball& ball) const;
  void Rebuild();

  MatchConfig config_;
  ScoringRules rules_;
  BallLedger ledger_;
  MatchSnapshot snapshot_;
  std::optional<PlayerId> man_of_the_match_;
};

}  // namespace scorer
