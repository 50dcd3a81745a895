/*
 * 설명: nlohmann::json 기반 경기/스냅샷/선수 기록 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/match_codec_test.cpp
 */
#include "scorer/match_codec.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>

#include "scorer/errors.hpp"

namespace scorer {
namespace {
std::int64_t ToMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(std::int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

nlohmann::json OptionalJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
nlohmann::json OptionalNumber(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> ReadOptionalString(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

[[noreturn]] void RaiseMalformed(const std::string& what, const nlohmann::json::exception& ex) {
  throw ValidationError("malformed_json", what + " JSON 형식이 올바르지 않습니다: " + ex.what());
}

// 정수가 아니거나 int 범위를 벗어난 값은 잘라내지 않고 거부한다.
int ReadInt(const nlohmann::json& j, const char* key, int def) {
  if (!j.contains(key)) {
    return def;
  }
  const auto& value = j.at(key);
  if (!value.is_number_integer()) {
    throw ValidationError("malformed_json", std::string(key) + " 값은 정수여야 합니다");
  }
  const bool in_range = value.is_number_unsigned()
                            ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                            : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                  value.get<std::int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    throw ValidationError("malformed_json", std::string(key) + " 값이 허용 범위를 벗어났습니다");
  }
  return static_cast<int>(value.get<std::int64_t>());
}

nlohmann::json CreaseToJson(const CreaseState& crease) {
  return nlohmann::json{{"striker", OptionalJson(crease.striker)},
                        {"nonStriker", OptionalJson(crease.non_striker)},
                        {"bowler", OptionalJson(crease.bowler)},
                        {"previousBowler", OptionalJson(crease.previous_bowler)},
                        {"ballsInOver", crease.BallsInOver()},
                        {"awaitingBowler", crease.awaiting_bowler}};
}

nlohmann::json InningsToJson(const InningsSummary& innings) {
  nlohmann::json batting = nlohmann::json::array();
  for (const auto& card : innings.batting) {
    batting.push_back({{"player", card.player},
                       {"runs", card.runs},
                       {"balls", card.balls},
                       {"fours", card.fours},
                       {"sixes", card.sixes},
                       {"dotBalls", card.dot_balls},
                       {"strikeRate", card.StrikeRate()},
                       {"out", card.out},
                       {"retired", card.retired},
                       {"dismissal", card.dismissal ? nlohmann::json(std::string(ToString(*card.dismissal)))
                                                    : nlohmann::json(nullptr)},
                       {"dismissedBy", OptionalJson(card.dismissed_by)},
                       {"fielder", OptionalJson(card.fielder)}});
  }

  nlohmann::json bowling = nlohmann::json::array();
  for (const auto& card : innings.bowling) {
    bowling.push_back({{"player", card.player},
                       {"overs", FormatOvers(card.legal_balls)},
                       {"legalBalls", card.legal_balls},
                       {"runsConceded", card.runs_conceded},
                       {"wickets", card.wickets},
                       {"maidens", card.maidens},
                       {"dotBalls", card.dot_balls},
                       {"wides", card.wides},
                       {"noBalls", card.no_balls},
                       {"economy", card.Economy()}});
  }

  nlohmann::json fall = nlohmann::json::array();
  for (const auto& fow : innings.fall_of_wickets) {
    fall.push_back({{"wicket", fow.wicket_number},
                    {"player", fow.player},
                    {"score", fow.score},
                    {"overs", FormatOvers(fow.legal_balls)}});
  }

  nlohmann::json partnerships = nlohmann::json::array();
  for (const auto& p : innings.partnerships) {
    partnerships.push_back({{"batters", {p.first, p.second}}, {"runs", p.runs}, {"balls", p.balls}});
  }

  return nlohmann::json{{"number", innings.number},
                        {"battingTeam", innings.batting_team},
                        {"bowlingTeam", innings.bowling_team},
                        {"score", innings.score},
                        {"wickets", innings.wickets},
                        {"overs", innings.Overs()},
                        {"legalBalls", innings.legal_balls},
                        {"runRate", innings.RunRate()},
                        {"extras",
                         {{"wides", innings.extras.wides},
                          {"noBalls", innings.extras.no_balls},
                          {"byes", innings.extras.byes},
                          {"legByes", innings.extras.leg_byes},
                          {"total", innings.extras.Total()}}},
                        {"fallOfWickets", fall},
                        {"partnerships", partnerships},
                        {"batting", batting},
                        {"bowling", bowling},
                        {"complete", innings.complete},
                        {"end", std::string(ToString(innings.end))}};
}
}  // namespace

nlohmann::json ToJson(const Ball& ball) {
  return nlohmann::json{{"sequence", ball.sequence},
                        {"innings", ball.innings},
                        {"striker", ball.striker},
                        {"nonStriker", ball.non_striker},
                        {"bowler", ball.bowler},
                        {"runs", ball.runs},
                        {"wide", ball.wide},
                        {"noBall", ball.no_ball},
                        {"bye", ball.bye},
                        {"legBye", ball.leg_bye},
                        {"wicket", ball.wicket},
                        {"dismissal", ball.dismissal ? nlohmann::json(std::string(ToString(*ball.dismissal)))
                                                     : nlohmann::json(nullptr)},
                        {"fielder", OptionalJson(ball.fielder)},
                        {"dismissedPlayer", OptionalJson(ball.dismissed_player)},
                        {"battingTeam", ball.batting_team},
                        {"recordedAtMs", ToMillis(ball.recorded_at)}};
}

nlohmann::json ToJson(const LedgerEntry& entry) {
  if (const auto* ball = std::get_if<Ball>(&entry)) {
    nlohmann::json j = ToJson(*ball);
    j["type"] = "ball";
    return j;
  }
  const auto& opening = std::get<InningsOpening>(entry);
  return nlohmann::json{{"type", "innings_opening"},
                        {"innings", opening.innings},
                        {"striker", opening.striker},
                        {"nonStriker", opening.non_striker},
                        {"bowler", opening.bowler}};
}

nlohmann::json ToJson(const MatchConfig& config) {
  nlohmann::json teams = nlohmann::json::array();
  for (const auto& team : config.teams) {
    teams.push_back({{"id", team.id}, {"name", team.name}, {"players", team.players}});
  }
  return nlohmann::json{{"matchId", config.match_id},
                        {"teams", teams},
                        {"toss",
                         {{"winner", config.toss.winner_team_id},
                          {"decision", std::string(ToString(config.toss.decision))}}},
                        {"totalOvers", config.total_overs},
                        {"openingStriker", config.opening_striker},
                        {"openingNonStriker", config.opening_non_striker},
                        {"openingBowler", config.opening_bowler},
                        {"startedAtMs", ToMillis(config.started_at)}};
}

nlohmann::json ToJson(const MatchSnapshot& snapshot) {
  nlohmann::json innings = nlohmann::json::array();
  for (const auto& summary : snapshot.innings) {
    innings.push_back(InningsToJson(summary));
  }

  nlohmann::json result{{"kind", std::string(ToString(snapshot.result.kind))},
                        {"winner", OptionalJson(snapshot.result.winner_team)},
                        {"margin", snapshot.result.margin}};

  return nlohmann::json{{"matchId", snapshot.config.match_id},
                        {"phase", std::string(ToString(snapshot.phase))},
                        {"currentInnings", snapshot.current_innings},
                        {"battingTeam", snapshot.batting_team},
                        {"bowlingTeam", snapshot.bowling_team},
                        {"totalOvers", snapshot.config.total_overs},
                        {"innings", innings},
                        {"crease", CreaseToJson(snapshot.crease)},
                        {"firstInningsScore", OptionalNumber(snapshot.first_innings_score)},
                        {"target", OptionalNumber(snapshot.target)},
                        {"runsNeeded", OptionalNumber(snapshot.RunsNeeded())},
                        {"ballsRemaining", OptionalNumber(snapshot.BallsRemaining())},
                        {"requiredRunRate", OptionalNumber(snapshot.RequiredRunRate())},
                        {"result", result},
                        {"completed", snapshot.completed},
                        {"manOfTheMatch", OptionalJson(snapshot.man_of_the_match)},
                        {"startedAtMs", ToMillis(snapshot.started_at)},
                        {"endedAtMs", snapshot.ended_at ? nlohmann::json(ToMillis(*snapshot.ended_at))
                                                        : nlohmann::json(nullptr)},
                        {"ledgerSize", snapshot.ledger_size}};
}

nlohmann::json ToJson(const PlayerStats& stats) {
  return nlohmann::json{
      {"matches", stats.matches},
      {"batting",
       {{"innings", stats.innings},
        {"runs", stats.runs},
        {"ballsFaced", stats.balls_faced},
        {"fours", stats.fours},
        {"sixes", stats.sixes},
        {"timesOut", stats.times_out},
        {"notOuts", stats.not_outs},
        {"highestScore", stats.highest_score},
        {"fifties", stats.fifties},
        {"hundreds", stats.hundreds},
        {"ducks", stats.ducks},
        {"average", OptionalNumber(stats.BattingAverage())},
        {"strikeRate", stats.StrikeRate()}}},
      {"bowling",
       {{"wickets", stats.wickets},
        {"ballsBowled", stats.balls_bowled},
        {"overs", FormatOvers(stats.balls_bowled)},
        {"runsConceded", stats.runs_conceded},
        {"maidens", stats.maidens},
        {"dotBalls", stats.dot_balls},
        {"best", stats.best_bowling ? nlohmann::json(stats.best_bowling->ToString()) : nlohmann::json(nullptr)},
        {"economy", OptionalNumber(stats.Economy())},
        {"average", OptionalNumber(stats.BowlingAverage())},
        {"strikeRate", OptionalNumber(stats.BowlingStrikeRate())}}},
      {"fielding", {{"catches", stats.catches}, {"runOuts", stats.run_outs}, {"stumpings", stats.stumpings}}},
      {"manOfTheMatch", stats.man_of_the_match}};
}

Ball BallFromJson(const nlohmann::json& j) {
  try {
    Ball ball;
    ball.sequence = j.value("sequence", std::uint64_t{0});
    ball.innings = ReadInt(j, "innings", 0);
    ball.striker = j.at("striker").get<std::string>();
    ball.non_striker = j.at("nonStriker").get<std::string>();
    ball.bowler = j.at("bowler").get<std::string>();
    ball.runs = ReadInt(j, "runs", 0);
    ball.wide = j.value("wide", false);
    ball.no_ball = j.value("noBall", false);
    ball.bye = j.value("bye", false);
    ball.leg_bye = j.value("legBye", false);
    ball.wicket = j.value("wicket", false);
    if (auto kind = ReadOptionalString(j, "dismissal")) {
      auto parsed = ParseDismissalKind(*kind);
      if (!parsed) {
        throw ValidationError("dismissal_kind_invalid", "알 수 없는 아웃 유형입니다: " + *kind);
      }
      ball.dismissal = parsed;
    }
    ball.fielder = ReadOptionalString(j, "fielder");
    ball.dismissed_player = ReadOptionalString(j, "dismissedPlayer");
    ball.batting_team = j.value("battingTeam", std::string{});
    ball.recorded_at = FromMillis(j.value("recordedAtMs", std::int64_t{0}));
    return ball;
  } catch (const nlohmann::json::exception& ex) {
    RaiseMalformed("투구", ex);
  }
}

LedgerEntry EntryFromJson(const nlohmann::json& j) {
  try {
    const std::string type = j.value("type", std::string{"ball"});
    if (type == "ball") {
      return BallFromJson(j);
    }
    if (type != "innings_opening") {
      throw ValidationError("entry_type_invalid", "알 수 없는 원장 항목입니다: " + type);
    }
    InningsOpening opening;
    opening.innings = j.value("innings", 2);
    opening.striker = j.at("striker").get<std::string>();
    opening.non_striker = j.at("nonStriker").get<std::string>();
    opening.bowler = j.at("bowler").get<std::string>();
    return opening;
  } catch (const nlohmann::json::exception& ex) {
    RaiseMalformed("원장 항목", ex);
  }
}

MatchConfig ConfigFromJson(const nlohmann::json& j) {
  try {
    MatchConfig config;
    config.match_id = j.value("matchId", std::string{});
    const auto& teams = j.at("teams");
    if (!teams.is_array() || teams.size() != 2) {
      throw ValidationError("teams_invalid", "팀은 정확히 두 개여야 합니다");
    }
    for (std::size_t i = 0; i < 2; ++i) {
      config.teams[i].id = teams.at(i).at("id").get<std::string>();
      config.teams[i].name = teams.at(i).value("name", config.teams[i].id);
      config.teams[i].players = teams.at(i).at("players").get<std::vector<PlayerId>>();
    }
    const auto& toss = j.at("toss");
    config.toss.winner_team_id = toss.at("winner").get<std::string>();
    const std::string decision = toss.at("decision").get<std::string>();
    auto parsed = ParseTossDecision(decision);
    if (!parsed) {
      throw ValidationError("toss_decision_invalid", "토스 선택은 bat 또는 bowl 이어야 합니다");
    }
    config.toss.decision = *parsed;
    config.total_overs = j.value("totalOvers", 20);
    config.opening_striker = j.at("openingStriker").get<std::string>();
    config.opening_non_striker = j.at("openingNonStriker").get<std::string>();
    config.opening_bowler = j.at("openingBowler").get<std::string>();
    config.started_at = FromMillis(j.value("startedAtMs", std::int64_t{0}));
    return config;
  } catch (const nlohmann::json::exception& ex) {
    RaiseMalformed("경기 설정", ex);
  }
}

nlohmann::json SerializeMatch(const PersistedMatch& match) {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& entry : match.entries) {
    entries.push_back(ToJson(entry));
  }
  return nlohmann::json{{"config", ToJson(match.config)},
                        {"entries", entries},
                        {"manOfTheMatch", OptionalJson(match.man_of_the_match)}};
}

PersistedMatch DeserializeMatch(const nlohmann::json& j) {
  try {
    PersistedMatch match;
    match.config = ConfigFromJson(j.at("config"));
    for (const auto& entry : j.at("entries")) {
      match.entries.push_back(EntryFromJson(entry));
    }
    match.man_of_the_match = ReadOptionalString(j, "manOfTheMatch");
    return match;
  } catch (const nlohmann::json::exception& ex) {
    RaiseMalformed("경기", ex);
  }
}

}  // namespace scorer
