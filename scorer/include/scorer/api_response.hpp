/*
 * 설명: REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "scorer/errors.hpp"

namespace scorer {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

// 채점 예외를 엔벨로프로 변환한다. detail.kind에 validation/state를 기록한다.
nlohmann::json MakeErrorEnvelope(const ScoringError& error);

}  // namespace scorer
