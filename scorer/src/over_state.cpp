/*
 * 설명: 오버 완료 시 스트라이크 교대와 투수 교체 요구, 홀수 득점 교대를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/over_state_test.cpp
 */
#include "scorer/over_state.hpp"

#include <utility>

#include "scorer/errors.hpp"

namespace scorer {

void OverStateMachine::Open(const PlayerId& striker, const PlayerId& non_striker, const PlayerId& bowler) {
  state_ = CreaseState{};
  state_.striker = striker;
  state_.non_striker = non_striker;
  state_.bowler = bowler;
}

void OverStateMachine::Reset() { state_ = CreaseState{}; }

void OverStateMachine::ValidateCrease(const Ball& ball) const {
  if (ball.striker.empty() || ball.non_striker.empty()) {
    throw ValidationError("batter_required", "스트라이커와 논스트라이커를 모두 지정해야 합니다");
  }
  if (ball.striker == ball.non_striker) {
    throw ValidationError("same_batter", "스트라이커와 논스트라이커가 같을 수 없습니다");
  }
  if (state_.striker && *state_.striker != ball.striker) {
    throw ValidationError("striker_mismatch", "현재 스트라이커와 일치하지 않습니다");
  }
  if (state_.non_striker && *state_.non_striker != ball.non_striker) {
    throw ValidationError("non_striker_mismatch", "현재 논스트라이커와 일치하지 않습니다");
  }
  ValidateBowler(ball.bowler);
}

void OverStateMachine::ValidateBowler(const PlayerId& bowler) const {
  if (bowler.empty()) {
    throw ValidationError("bowler_required", "투수를 지정해야 합니다");
  }
  if (state_.awaiting_bowler) {
    if (state_.previous_bowler && *state_.previous_bowler == bowler) {
      throw ValidationError("bowler_consecutive_overs", "직전 오버를 던진 투수는 연속으로 던질 수 없습니다");
    }
    return;
  }
  if (state_.bowler && *state_.bowler != bowler) {
    throw ValidationError("bowler_mid_over", "오버 도중에는 투수를 바꿀 수 없습니다");
  }
}

OverEvent OverStateMachine::Advance(const Ball& ball, bool legal, bool final_ball) {
  state_.striker = ball.striker;
  state_.non_striker = ball.non_striker;
  state_.bowler = ball.bowler;
  state_.awaiting_bowler = false;

  if (legal) {
    ++state_.legal_balls;
  }
  const bool over_complete = legal && state_.BallsInOver() == 0;

  if (!final_ball) {
    if (ball.runs % 2 == 1) {
      SwapStrike();
    }
    if (over_complete) {
      SwapStrike();
    }
  }

  if (over_complete) {
    state_.previous_bowler = state_.bowler;
    state_.bowler.reset();
    state_.awaiting_bowler = true;
    return OverEvent::kOverComplete;
  }
  return OverEvent::kWithinOver;
}

void OverStateMachine::Dismiss(const PlayerId& player) {
  if (state_.striker && *state_.striker == player) {
    state_.striker.reset();
    return;
  }
  if (state_.non_striker && *state_.non_striker == player) {
    state_.non_striker.reset();
  }
}

void OverStateMachine::SwapStrike() { std::swap(state_.striker, state_.non_striker); }

}  // namespace scorer
