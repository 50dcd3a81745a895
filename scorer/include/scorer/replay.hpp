/*
 * 설명: 원장 접두부와 경기 설정으로부터 스냅샷을 도출하는 순수 재생 함수.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/replay_test.cpp
 */
#pragma once

#include <cstddef>
#include <vector>

#include "scorer/snapshot.hpp"
#include "scorer/types.hpp"

namespace scorer {

// 같은 설정과 접두부는 항상 같은 스냅샷을 만든다. 항목은 이미 검증되었다고 가정한다.
MatchSnapshot Replay(const MatchConfig& config, const std::vector<LedgerEntry>& entries, const ScoringRules& rules);
MatchSnapshot Replay(const MatchConfig& config, const std::vector<LedgerEntry>& entries, std::size_t prefix_length,
                     const ScoringRules& rules);

}  // namespace scorer
