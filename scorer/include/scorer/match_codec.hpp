/*
 * 설명: 경기 설정/원장/스냅샷/선수 기록의 JSON 직렬화. 저장 형식은 {config, entries}이며 손실 없이 왕복한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/match_codec_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "scorer/snapshot.hpp"
#include "scorer/stats.hpp"
#include "scorer/types.hpp"

namespace scorer {

struct PersistedMatch {
  MatchConfig config;
  std::vector<LedgerEntry> entries;
  std::optional<PlayerId> man_of_the_match;
};

nlohmann::json ToJson(const Ball& ball);
nlohmann::json ToJson(const LedgerEntry& entry);
nlohmann::json ToJson(const MatchConfig& config);
nlohmann::json ToJson(const MatchSnapshot& snapshot);
nlohmann::json ToJson(const PlayerStats& stats);

// 형식이 잘못되면 ValidationError("malformed_json")를 던진다.
Ball BallFromJson(const nlohmann::json& j);
LedgerEntry EntryFromJson(const nlohmann::json& j);
MatchConfig ConfigFromJson(const nlohmann::json& j);

nlohmann::json SerializeMatch(const PersistedMatch& match);
PersistedMatch DeserializeMatch(const nlohmann::json& j);

}  // namespace scorer
