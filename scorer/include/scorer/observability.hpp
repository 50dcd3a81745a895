/*
 * 설명: 구조화 로그와 채점 서비스 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/api_router_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace scorer {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 값은 info로 취급한다.
LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> match_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t balls_accepted{0};
  std::uint64_t balls_rejected{0};
  std::uint64_t undo_total{0};
  std::uint64_t redo_total{0};
  std::uint64_t matches_completed{0};
  std::uint64_t active_matches{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementBallAccepted();
  void IncrementBallRejected();
  void IncrementUndo();
  void IncrementRedo();
  void IncrementMatchCompleted();
  MetricsSnapshot Snapshot(std::uint64_t active_matches) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> balls_accepted_{0};
  std::atomic<std::uint64_t> balls_rejected_{0};
  std::atomic<std::uint64_t> undo_total_{0};
  std::atomic<std::uint64_t> redo_total_{0};
  std::atomic<std::uint64_t> matches_completed_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);

}  // namespace scorer
