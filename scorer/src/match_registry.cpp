/*
 * 설명: 경기 세션 생성/복원과 경기별 잠금 아래의 채점 호출, 통산 기록 반영을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/api_router_test.cpp
 */
#include "scorer/match_registry.hpp"

#include <sstream>
#include <utility>

#include "scorer/errors.hpp"

namespace scorer {

MatchRegistry::MatchRegistry(ScoringRules rules, std::shared_ptr<CareerBook> career_book,
                             std::shared_ptr<Observability> observability)
    : rules_(rules), career_book_(std::move(career_book)), observability_(std::move(observability)) {}

MatchSnapshot MatchRegistry::CreateMatch(MatchConfig config) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config.match_id = NextMatchIdLocked();
  }
  return Register(ScoringSession(std::move(config), rules_));
}

MatchSnapshot MatchRegistry::ImportMatch(PersistedMatch persisted) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (persisted.config.match_id.empty()) {
      persisted.config.match_id = NextMatchIdLocked();
    } else if (matches_.count(persisted.config.match_id) > 0) {
      throw StateError("match_exists", "이미 등록된 경기 식별자입니다: " + persisted.config.match_id);
    }
  }
  return Register(ScoringSession::Restore(std::move(persisted.config), persisted.entries, rules_,
                                          persisted.man_of_the_match));
}

MatchSnapshot MatchRegistry::AppendBall(const std::string& match_id, const Ball& ball) {
  auto ctx = Lookup(match_id);
  std::lock_guard<std::mutex> lock(ctx->mutex);
  MatchSnapshot snapshot;
  try {
    snapshot = ctx->session.AppendBall(ball);
  } catch (const ScoringError& ex) {
    if (observability_) {
      observability_->IncrementBallRejected();
    }
    LogEvent(match_id, "ball_rejected", LogLevel::kWarn, {{"code", ex.code}, {"message", ex.what()}});
    throw;
  }
  if (observability_) {
    observability_->IncrementBallAccepted();
  }
  LogEvent(match_id, "ball_recorded", LogLevel::kDebug,
           {{"innings", snapshot.current_innings},
            {"score", snapshot.CurrentInnings().score},
            {"wickets", snapshot.CurrentInnings().wickets},
            {"overs", snapshot.CurrentInnings().Overs()}});
  SyncCareer(match_id, *ctx);
  return ctx->session.GetSnapshot();
}

MatchSnapshot MatchRegistry::Undo(const std::string& match_id) {
  auto ctx = Lookup(match_id);
  std::lock_guard<std::mutex> lock(ctx->mutex);
  const bool changed = ctx->session.CanUndo();
  ctx->session.Undo();
  if (changed) {
    if (observability_) {
      observability_->IncrementUndo();
    }
    LogEvent(match_id, "ball_undone", LogLevel::kInfo, {{"ledgerSize", ctx->session.GetSnapshot().ledger_size}});
    SyncCareer(match_id, *ctx);
  }
  return ctx->session.GetSnapshot();
}

MatchSnapshot MatchRegistry::Redo(const std::string& match_id) {
  auto ctx = Lookup(match_id);
  std::lock_guard<std::mutex> lock(ctx->mutex);
  const bool changed = ctx->session.CanRedo();
  ctx->session.Redo();
  if (changed) {
    if (observability_) {
      observability_->IncrementRedo();
    }
    LogEvent(match_id, "ball_redone", LogLevel::kInfo, {{"ledgerSize", ctx->session.GetSnapshot().ledger_size}});
    SyncCareer(match_id, *ctx);
  }
  return ctx->session.GetSnapshot();
}

MatchSnapshot MatchRegistry::StartSecondInnings(const std::string& match_id, const PlayerId& striker,
                                                const PlayerId& non_striker, const PlayerId& bowler) {
  auto ctx = Lookup(match_id);
  std::lock_guard<std::mutex> lock(ctx->mutex);
  auto snapshot = ctx->session.StartSecondInnings(striker, non_striker, bowler);
  LogEvent(match_id, "second_innings_started", LogLevel::kInfo,
           {{"battingTeam", snapshot.batting_team}, {"target", snapshot.target ? *snapshot.target : 0}});
  return snapshot;
}

MatchSnapshot MatchRegistry::SetManOfTheMatch(const std::string& match_id, const PlayerId& player) {
  auto ctx = Lookup(match_id);
  std::lock_guard<std::mutex> lock(ctx->mutex);
  auto snapshot = ctx->session.SetManOfTheMatch(player);
  // 수상 집계를 바꾸려면 이미 반영된 증분을 교체해야 한다.
  if (ctx->career_applied && career_book_) {
    career_book_->Revoke(match_id);
    career_book_->ApplyCompletedMatch(snapshot);
  }
  LogEvent(match_id, "man_of_the_match_set", LogLevel::kInfo, {{"player", player}});
  return snapshot;
}

MatchSnapshot MatchRegistry::GetSnapshot(const std::string& match_id) const {
  auto ctx = Lookup(match_id);
  std::lock_guard<std::mutex> lock(ctx->mutex);
  return ctx->session.GetSnapshot();
}

PersistedMatch MatchRegistry::Export(const std::string& match_id) const {
  auto ctx = Lookup(match_id);
  std::lock_guard<std::mutex> lock(ctx->mutex);
  PersistedMatch persisted;
  persisted.config = ctx->session.Config();
  persisted.entries = ctx->session.Entries();
  persisted.man_of_the_match = ctx->session.GetSnapshot().man_of_the_match;
  return persisted;
}

std::size_t MatchRegistry::ActiveMatchCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t active = 0;
  for (const auto& [id, ctx] : matches_) {
    std::lock_guard<std::mutex> match_lock(ctx->mutex);
    if (!ctx->session.GetSnapshot().completed) {
      ++active;
    }
  }
  return active;
}

std::shared_ptr<MatchRegistry::MatchContext> MatchRegistry::Lookup(const std::string& match_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) {
    throw NotFoundError("match_not_found", "경기를 찾을 수 없습니다: " + match_id);
  }
  return it->second;
}

std::string MatchRegistry::NextMatchIdLocked() {
  std::string id;
  do {
    std::ostringstream oss;
    oss << "match-" << next_match_id_++;
    id = oss.str();
  } while (matches_.count(id) > 0);
  return id;
}

MatchSnapshot MatchRegistry::Register(ScoringSession session) {
  const std::string match_id = session.Config().match_id;
  auto ctx = std::make_shared<MatchContext>(std::move(session));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!matches_.emplace(match_id, ctx).second) {
      throw StateError("match_exists", "이미 등록된 경기 식별자입니다: " + match_id);
    }
  }
  std::lock_guard<std::mutex> match_lock(ctx->mutex);
  LogEvent(match_id, "match_registered", LogLevel::kInfo,
           {{"teams", {ctx->session.Config().teams[0].id, ctx->session.Config().teams[1].id}},
            {"ledgerSize", ctx->session.Entries().size()}});
  SyncCareer(match_id, *ctx);
  return ctx->session.GetSnapshot();
}

void MatchRegistry::SyncCareer(const std::string& match_id, MatchContext& ctx) {
  if (!career_book_) {
    return;
  }
  const MatchSnapshot& snapshot = ctx.session.GetSnapshot();
  if (snapshot.completed && !ctx.career_applied) {
    ctx.career_applied = true;
    if (career_book_->ApplyCompletedMatch(snapshot)) {
      if (observability_) {
        observability_->IncrementMatchCompleted();
      }
      LogEvent(match_id, "match_completed", LogLevel::kInfo,
               {{"result", std::string(ToString(snapshot.result.kind))},
                {"winner", snapshot.result.winner_team ? *snapshot.result.winner_team : std::string{}},
                {"margin", snapshot.result.margin}});
    }
    return;
  }
  if (!snapshot.completed && ctx.career_applied) {
    ctx.career_applied = false;
    career_book_->Revoke(match_id);
    LogEvent(match_id, "match_reopened", LogLevel::kInfo, nlohmann::json::object());
  }
}

void MatchRegistry::LogEvent(const std::string& match_id, const std::string& name, LogLevel level,
                             nlohmann::json detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.match_id = match_id;
  ctx.name = name;
  ctx.level = level;
  ctx.detail = std::move(detail);
  observability_->Log(ctx);
}

}  // namespace scorer
