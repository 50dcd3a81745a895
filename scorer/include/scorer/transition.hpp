/*
 * 설명: 이닝 종료(올아웃/오버 소진/목표 달성) 판정과 경기 결과, 2이닝 시작 검증을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/innings_transition_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>

#include "scorer/snapshot.hpp"
#include "scorer/types.hpp"

namespace scorer {

// 먼저 만족한 조건이 우선한다: 올아웃, 오버 소진, (2이닝) 목표 달성.
InningsEnd DetectInningsEnd(const InningsSummary& innings, std::size_t roster_size, int total_overs,
                            std::optional<int> target);

MatchResult ResolveResult(const MatchSnapshot& snapshot);

void ValidateMatchConfig(const MatchConfig& config);
void ValidateSecondInningsOpening(const MatchSnapshot& snapshot, const InningsOpening& opening);

}  // namespace scorer
