#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "match_fixture.hpp"
#include "scorer/api_router.hpp"

namespace {

namespace http = boost::beast::http;

class ApiRouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.default_overs = 1;
    observability_ = std::make_shared<scorer::Observability>(scorer::LogLevel::kError);
    career_book_ = std::make_shared<scorer::CareerBook>();
    registry_ = std::make_shared<scorer::MatchRegistry>(scorer::RulesFromConfig(config_), career_book_,
                                                        observability_);
    router_ = std::make_unique<scorer::ApiRouter>(config_, registry_, career_book_, observability_);
  }

  scorer::ApiResponse Post(const std::string& target, const nlohmann::json& body) {
    return router_->Handle(http::verb::post, target, body.dump());
  }

  scorer::ApiResponse Get(const std::string& target) { return router_->Handle(http::verb::get, target, ""); }

  std::string CreateMatch() {
    auto body = scorer::ToJson(scorer_test::MakeConfig());
    body.erase("matchId");
    body.erase("totalOvers");
    auto res = Post("/api/matches", body);
    EXPECT_EQ(res.status, http::status::created);
    return res.body["data"]["matchId"].get<std::string>();
  }

  scorer::ApiResponse PostNextBall(const std::string& match_id, int runs = 0) {
    auto ball = scorer_test::NextBall(registry_->GetSnapshot(match_id), runs);
    return Post("/api/matches/" + match_id + "/balls", scorer::ToJson(ball));
  }

  // 1오버씩: lions 4/0, tigers 0/0.
  void CompleteMatch(const std::string& match_id) {
    PostNextBall(match_id, 4);
    for (int i = 0; i < 5; ++i) {
      PostNextBall(match_id);
    }
    auto res = Post("/api/matches/" + match_id + "/second-innings",
                    {{"striker", "T1"}, {"nonStriker", "T2"}, {"bowler", "L1"}});
    ASSERT_EQ(res.status, http::status::ok);
    for (int i = 0; i < 6; ++i) {
      PostNextBall(match_id);
    }
  }

  scorer::AppConfig config_;
  std::shared_ptr<scorer::Observability> observability_;
  std::shared_ptr<scorer::CareerBook> career_book_;
  std::shared_ptr<scorer::MatchRegistry> registry_;
  std::unique_ptr<scorer::ApiRouter> router_;
};

}  // namespace

TEST_F(ApiRouterTest, HealthReturnsEnvelope) {
  auto res = Get("/api/health");
  EXPECT_EQ(res.status, http::status::ok);
  EXPECT_TRUE(res.body["success"].get<bool>());
  EXPECT_EQ(res.body["data"]["status"], "ok");
}

TEST_F(ApiRouterTest, CreateMatchAppliesDefaultOvers) {
  auto match_id = CreateMatch();
  EXPECT_EQ(match_id, "match-1");

  auto res = Get("/api/matches/" + match_id);
  EXPECT_EQ(res.status, http::status::ok);
  EXPECT_EQ(res.body["data"]["totalOvers"], 1);
  EXPECT_EQ(res.body["data"]["phase"], "innings1_in_progress");
  EXPECT_EQ(res.body["data"]["crease"]["striker"], "L1");
}

TEST_F(ApiRouterTest, BallUpdatesSnapshot) {
  auto match_id = CreateMatch();
  auto res = PostNextBall(match_id, 3);
  EXPECT_EQ(res.status, http::status::ok);
  EXPECT_EQ(res.body["data"]["innings"][0]["score"], 3);
  EXPECT_EQ(res.body["data"]["crease"]["striker"], "L2");
}

TEST_F(ApiRouterTest, MapsErrorsToStatusCodes) {
  auto match_id = CreateMatch();

  auto bad_ball = scorer::ToJson(scorer_test::NextBall(registry_->GetSnapshot(match_id), -1));
  auto res = Post("/api/matches/" + match_id + "/balls", bad_ball);
  EXPECT_EQ(res.status, http::status::unprocessable_entity);
  EXPECT_EQ(res.body["error"]["code"], "negative_runs");
  EXPECT_FALSE(res.body["success"].get<bool>());

  res = router_->Handle(http::verb::post, "/api/matches/" + match_id + "/balls", "{not json");
  EXPECT_EQ(res.status, http::status::bad_request);
  EXPECT_EQ(res.body["error"]["code"], "malformed_json");

  res = Post("/api/matches/" + match_id + "/second-innings", {{"striker", "T1"}, {"nonStriker", "T2"}, {"bowler", "L1"}});
  EXPECT_EQ(res.status, http::status::conflict);
  EXPECT_EQ(res.body["error"]["code"], "innings_not_complete");

  res = Post("/api/matches/match-404/undo", nlohmann::json::object());
  EXPECT_EQ(res.status, http::status::not_found);
  EXPECT_EQ(res.body["error"]["code"], "match_not_found");

  res = Get("/api/unknown");
  EXPECT_EQ(res.status, http::status::not_found);
  EXPECT_EQ(res.body["error"]["code"], "not_found");

  res = Get("/api/leaderboard?metric=catches");
  EXPECT_EQ(res.status, http::status::unprocessable_entity);
  EXPECT_EQ(res.body["error"]["code"], "metric_invalid");

  EXPECT_EQ(registry_->GetSnapshot(match_id).ledger_size, 0u);
}

TEST_F(ApiRouterTest, CompletedMatchFeedsCareerStatsOnce) {
  auto match_id = CreateMatch();
  CompleteMatch(match_id);

  auto snapshot = Get("/api/matches/" + match_id);
  EXPECT_EQ(snapshot.body["data"]["completed"], true);
  EXPECT_EQ(snapshot.body["data"]["result"]["winner"], "lions");

  auto stats = Get("/api/players/L1/stats");
  ASSERT_EQ(stats.status, http::status::ok);
  EXPECT_EQ(stats.body["data"]["batting"]["runs"], 4);
  EXPECT_EQ(stats.body["data"]["matches"], 1);

  auto award = Post("/api/matches/" + match_id + "/man-of-the-match", {{"player", "L1"}});
  EXPECT_EQ(award.status, http::status::ok);
  stats = Get("/api/players/L1/stats");
  EXPECT_EQ(stats.body["data"]["matches"], 1);
  EXPECT_EQ(stats.body["data"]["manOfTheMatch"], 1);

  auto board = Get("/api/leaderboard?metric=runs&size=1");
  ASSERT_EQ(board.status, http::status::ok);
  ASSERT_EQ(board.body["data"]["items"].size(), 1u);
  EXPECT_EQ(board.body["data"]["items"][0]["player"], "L1");
  EXPECT_EQ(board.body["data"]["items"][0]["value"], 4);
}

TEST_F(ApiRouterTest, UndoReopensMatchAndRevokesStats) {
  auto match_id = CreateMatch();
  CompleteMatch(match_id);
  ASSERT_TRUE(career_book_->IsApplied(match_id));
  Post("/api/matches/" + match_id + "/man-of-the-match", {{"player", "L1"}});

  auto res = Post("/api/matches/" + match_id + "/undo", nlohmann::json::object());
  EXPECT_EQ(res.status, http::status::ok);
  EXPECT_EQ(res.body["data"]["completed"], false);
  EXPECT_FALSE(career_book_->IsApplied(match_id));
  EXPECT_EQ(Get("/api/players/L1/stats").status, http::status::not_found);

  res = Post("/api/matches/" + match_id + "/redo", nlohmann::json::object());
  EXPECT_EQ(res.body["data"]["completed"], true);
  EXPECT_EQ(res.body["data"]["manOfTheMatch"], "L1");
  auto stats = Get("/api/players/L1/stats");
  EXPECT_EQ(stats.body["data"]["matches"], 1);
  EXPECT_EQ(stats.body["data"]["manOfTheMatch"], 1);

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.body["data"]["corrections"]["undo"], 1);
  EXPECT_EQ(metrics.body["data"]["corrections"]["redo"], 1);
  EXPECT_EQ(metrics.body["data"]["balls"]["accepted"], 12);
  EXPECT_EQ(metrics.body["data"]["matches"]["completed"], 2);
  EXPECT_EQ(metrics.body["data"]["matches"]["active"], 0);
}

TEST_F(ApiRouterTest, ExportImportRoundTrip) {
  auto match_id = CreateMatch();
  PostNextBall(match_id, 1);
  PostNextBall(match_id, 2);

  auto exported = Get("/api/matches/" + match_id + "/export");
  ASSERT_EQ(exported.status, http::status::ok);
  auto document = exported.body["data"];
  EXPECT_EQ(document["entries"].size(), 2u);

  auto duplicate = Post("/api/matches/import", document);
  EXPECT_EQ(duplicate.status, http::status::conflict);
  EXPECT_EQ(duplicate.body["error"]["code"], "match_exists");

  document["config"]["matchId"] = "";
  auto imported = Post("/api/matches/import", document);
  ASSERT_EQ(imported.status, http::status::created);
  auto imported_id = imported.body["data"]["matchId"].get<std::string>();
  EXPECT_NE(imported_id, match_id);

  auto original = Get("/api/matches/" + match_id).body["data"];
  auto copy = imported.body["data"];
  original.erase("matchId");
  copy.erase("matchId");
  EXPECT_EQ(copy, original);
}
