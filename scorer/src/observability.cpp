/*
 * 설명: 구조화 로그와 채점 서비스 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/api_router_test.cpp
 */
#include "scorer/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scorer {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementBallAccepted() { balls_accepted_.fetch_add(1); }

void Observability::IncrementBallRejected() { balls_rejected_.fetch_add(1); }

void Observability::IncrementUndo() { undo_total_.fetch_add(1); }

void Observability::IncrementRedo() { redo_total_.fetch_add(1); }

void Observability::IncrementMatchCompleted() { matches_completed_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_matches) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.balls_accepted = balls_accepted_.load();
  snapshot.balls_rejected = balls_rejected_.load();
  snapshot.undo_total = undo_total_.load();
  snapshot.redo_total = redo_total_.load();
  snapshot.matches_completed = matches_completed_.load();
  snapshot.active_matches = active_matches;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = std::string(ToString(ctx.level));
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.match_id) {
    log_json["matchId"] = *ctx.match_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::cout << log_json.dump() << std::endl;
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return nlohmann::json{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"balls", {{"accepted", snapshot.balls_accepted}, {"rejected", snapshot.balls_rejected}}},
                        {"corrections", {{"undo", snapshot.undo_total}, {"redo", snapshot.redo_total}}},
                        {"matches", {{"active", snapshot.active_matches}, {"completed", snapshot.matches_completed}}}};
}

}  // namespace scorer
