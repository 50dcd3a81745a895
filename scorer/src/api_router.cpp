/*
 * 설명: 채점 REST 경로를 분기하고 예외를 상태 코드와 오류 엔벨로프로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/api_router_test.cpp
 */
#include "scorer/api_router.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "scorer/api_response.hpp"
#include "scorer/errors.hpp"
#include "scorer/match_codec.hpp"

namespace scorer {

namespace http = boost::beast::http;

namespace {
constexpr std::size_t kDefaultLeaderboardSize = 10;
constexpr std::size_t kMaxLeaderboardSize = 100;

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size() || parsed == 0) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto slash = path.find('/', pos);
    if (slash == std::string::npos) {
      slash = path.size();
    }
    if (slash > pos) {
      segments.push_back(path.substr(pos, slash - pos));
    }
    pos = slash + 1;
  }
  return segments;
}

nlohmann::json ParseBody(const std::string& body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error&) {
    throw ValidationError("malformed_json", "JSON 본문이 올바르지 않습니다");
  }
}

std::string RequireString(const nlohmann::json& body, const char* key) {
  if (!body.is_object() || !body.contains(key) || !body.at(key).is_string()) {
    throw ValidationError("field_required", std::string(key) + " 값이 필요합니다");
  }
  return body.at(key).get<std::string>();
}

ApiResponse Success(http::status status, const nlohmann::json& data) {
  return ApiResponse{status, MakeSuccessEnvelope(data)};
}

ApiResponse NotFoundRoute() {
  return ApiResponse{http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다")};
}
}  // namespace

ApiRouter::ApiRouter(const AppConfig& config, std::shared_ptr<MatchRegistry> registry,
                     std::shared_ptr<CareerBook> career_book, std::shared_ptr<Observability> observability)
    : config_(config), registry_(std::move(registry)), career_book_(std::move(career_book)),
      observability_(std::move(observability)) {}

ApiResponse ApiRouter::Handle(http::verb method, std::string_view target, const std::string& body) {
  const auto request_start = std::chrono::steady_clock::now();
  const std::string trace_id = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  std::string target_str(target);
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  ApiResponse response;
  try {
    response = Dispatch(method, path, query, body);
  } catch (const NotFoundError& ex) {
    response = ApiResponse{http::status::not_found, MakeErrorEnvelope(ex)};
  } catch (const StateError& ex) {
    response = ApiResponse{http::status::conflict, MakeErrorEnvelope(ex)};
  } catch (const ValidationError& ex) {
    auto status = ex.code == "malformed_json" ? http::status::bad_request : http::status::unprocessable_entity;
    response = ApiResponse{status, MakeErrorEnvelope(ex)};
  }

  if (observability_) {
    const bool failed = static_cast<unsigned>(response.status) >= 400;
    if (failed) {
      observability_->IncrementError();
    }
    LogContext ctx;
    ctx.trace_id = trace_id;
    ctx.name = std::string(http::to_string(method)) + " " + path;
    ctx.latency_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - request_start)
                                           .count());
    ctx.level = failed ? LogLevel::kWarn : LogLevel::kInfo;
    ctx.detail = {{"status", static_cast<unsigned>(response.status)}};
    if (failed) {
      ctx.detail["code"] = response.body["error"]["code"];
    }
    observability_->Log(ctx);
  }
  return response;
}

ApiResponse ApiRouter::Dispatch(http::verb method, const std::string& path, const std::string& query,
                                const std::string& body) {
  if (method == http::verb::get && path == "/api/health") {
    return Success(http::status::ok, {{"status", "ok"}, {"version", "v1.0.0"}});
  }

  if (method == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(registry_->ActiveMatchCount());
    return Success(http::status::ok, ToJson(snapshot));
  }

  if (method == http::verb::get && path == "/api/leaderboard") {
    return Leaderboard(query);
  }

  auto segments = SplitPath(path);
  if (segments.size() >= 2 && segments[0] == "api" && segments[1] == "matches") {
    return HandleMatchRoute(method, segments, body);
  }

  if (method == http::verb::get && segments.size() == 4 && segments[0] == "api" && segments[1] == "players" &&
      segments[3] == "stats") {
    return PlayerStatsFor(segments[2]);
  }

  return NotFoundRoute();
}

ApiResponse ApiRouter::HandleMatchRoute(http::verb method, const std::vector<std::string>& segments,
                                        const std::string& body) {
  if (segments.size() == 2) {
    if (method != http::verb::post) {
      return NotFoundRoute();
    }
    auto snapshot = registry_->CreateMatch(ParseMatchConfig(body));
    return Success(http::status::created, ToJson(snapshot));
  }

  if (segments.size() == 3 && segments[2] == "import") {
    if (method != http::verb::post) {
      return NotFoundRoute();
    }
    auto snapshot = registry_->ImportMatch(DeserializeMatch(ParseBody(body)));
    return Success(http::status::created, ToJson(snapshot));
  }

  const std::string& match_id = segments[2];
  if (segments.size() == 3) {
    if (method != http::verb::get) {
      return NotFoundRoute();
    }
    return Success(http::status::ok, ToJson(registry_->GetSnapshot(match_id)));
  }
  if (segments.size() != 4) {
    return NotFoundRoute();
  }

  const std::string& action = segments[3];
  if (method == http::verb::get && action == "export") {
    return Success(http::status::ok, SerializeMatch(registry_->Export(match_id)));
  }
  if (method != http::verb::post) {
    return NotFoundRoute();
  }

  if (action == "balls") {
    auto json = ParseBody(body);
    Ball ball = BallFromJson(json);
    if (!json.contains("recordedAtMs")) {
      ball.recorded_at = std::chrono::system_clock::now();
    }
    return Success(http::status::ok, ToJson(registry_->AppendBall(match_id, ball)));
  }
  if (action == "undo") {
    return Success(http::status::ok, ToJson(registry_->Undo(match_id)));
  }
  if (action == "redo") {
    return Success(http::status::ok, ToJson(registry_->Redo(match_id)));
  }
  if (action == "second-innings") {
    auto json = ParseBody(body);
    auto snapshot = registry_->StartSecondInnings(match_id, RequireString(json, "striker"),
                                                  RequireString(json, "nonStriker"), RequireString(json, "bowler"));
    return Success(http::status::ok, ToJson(snapshot));
  }
  if (action == "man-of-the-match") {
    auto json = ParseBody(body);
    return Success(http::status::ok, ToJson(registry_->SetManOfTheMatch(match_id, RequireString(json, "player"))));
  }
  return NotFoundRoute();
}

ApiResponse ApiRouter::Leaderboard(const std::string& query) {
  auto params = ParseQueryParams(query);
  LeaderboardMetric metric = LeaderboardMetric::kRuns;
  auto metric_it = params.find("metric");
  if (metric_it != params.end()) {
    auto parsed = ParseLeaderboardMetric(metric_it->second);
    if (!parsed) {
      throw ValidationError("metric_invalid", "metric은 runs 또는 wickets 이어야 합니다");
    }
    metric = *parsed;
  }
  std::size_t size = kDefaultLeaderboardSize;
  auto size_it = params.find("size");
  if (size_it != params.end()) {
    auto parsed = ParsePositiveInt(size_it->second);
    if (!parsed || *parsed > kMaxLeaderboardSize) {
      throw ValidationError("size_invalid", "size는 1 이상 100 이하여야 합니다");
    }
    size = *parsed;
  }

  nlohmann::json items = nlohmann::json::array();
  int rank = 1;
  for (const auto& entry : career_book_->Leaderboard(metric, size)) {
    items.push_back({{"rank", rank++},
                     {"player", entry.player},
                     {"value", entry.value},
                     {"matches", entry.stats.matches}});
  }
  nlohmann::json data{{"metric", metric == LeaderboardMetric::kRuns ? "runs" : "wickets"},
                      {"size", size},
                      {"items", items}};
  return Success(http::status::ok, data);
}

ApiResponse ApiRouter::PlayerStatsFor(const PlayerId& player) {
  auto stats = career_book_->Find(player);
  if (!stats) {
    throw NotFoundError("player_not_found", "기록이 없는 선수입니다: " + player);
  }
  nlohmann::json data = ToJson(*stats);
  data["player"] = player;
  return Success(http::status::ok, data);
}

MatchConfig ApiRouter::ParseMatchConfig(const std::string& body) const {
  auto json = ParseBody(body);
  if (json.is_object() && !json.contains("totalOvers")) {
    json["totalOvers"] = config_.default_overs;
  }
  MatchConfig config = ConfigFromJson(json);
  if (!json.contains("startedAtMs")) {
    config.started_at = std::chrono::system_clock::now();
  }
  return config;
}

}  // namespace scorer
