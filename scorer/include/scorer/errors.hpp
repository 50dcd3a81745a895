/*
 * 설명: 입력 검증 오류와 상태 전이 오류를 구분하는 예외 계층을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/scoring_session_test.cpp, scorer/tests/unit/api_router_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace scorer {

class ScoringError : public std::runtime_error {
 public:
  ScoringError(const std::string& code, const std::string& message) : std::runtime_error(message), code(code) {}
  std::string code;
};

// 잘못된 투구/선수 지정. 원장은 변경되지 않으며 호출자가 다시 입력해야 한다.
class ValidationError : public ScoringError {
 public:
  using ScoringError::ScoringError;
};

// 현재 경기 단계에서 허용되지 않는 호출.
class StateError : public ScoringError {
 public:
  using ScoringError::ScoringError;
};

// 등록되지 않은 경기/선수 조회.
class NotFoundError : public ScoringError {
 public:
  using ScoringError::ScoringError;
};

}  // namespace scorer
