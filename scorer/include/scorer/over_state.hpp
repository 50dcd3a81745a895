/*
 * 설명: 오버 진행(정규 투구 수)과 스트라이크 교대, 투수 교체 요구를 관리하는 상태 기계.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/over_state_test.cpp
 */
#pragma once

#include <optional>
#include <utility>

#include "scorer/types.hpp"

namespace scorer {

enum class OverEvent { kWithinOver, kOverComplete };

struct CreaseState {
  std::optional<PlayerId> striker;
  std::optional<PlayerId> non_striker;
  std::optional<PlayerId> bowler;
  std::optional<PlayerId> previous_bowler;
  int legal_balls{0};
  bool awaiting_bowler{false};

  int BallsInOver() const { return legal_balls % kBallsPerOver; }
  int CompletedOvers() const { return legal_balls / kBallsPerOver; }
};

class OverStateMachine {
 public:
  OverStateMachine() = default;
  explicit OverStateMachine(CreaseState state) : state_(std::move(state)) {}

  void Open(const PlayerId& striker, const PlayerId& non_striker, const PlayerId& bowler);
  void Reset();

  // 투구 직전 상태와 투구 기록의 타자/투수 배치가 일치하는지 확인한다.
  void ValidateCrease(const Ball& ball) const;
  void ValidateBowler(const PlayerId& bowler) const;

  // final_ball이면 이닝이 이 투구로 끝나므로 스트라이크 교대를 생략한다.
  OverEvent Advance(const Ball& ball, bool legal, bool final_ball);
  void Dismiss(const PlayerId& player);

  const CreaseState& State() const { return state_; }

 private:
  void SwapStrike();

  CreaseState state_;
};

}  // namespace scorer
