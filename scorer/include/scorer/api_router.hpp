/*
 * 설명: HTTP 메서드/경로를 채점 API 호출로 분기하고 엔벨로프 응답을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: scorer/tests/unit/api_router_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "scorer/career_book.hpp"
#include "scorer/config.hpp"
#include "scorer/match_registry.hpp"
#include "scorer/observability.hpp"

namespace scorer {

struct ApiResponse {
  boost::beast::http::status status{boost::beast::http::status::ok};
  nlohmann::json body;
};

class ApiRouter {
 public:
  ApiRouter(const AppConfig& config, std::shared_ptr<MatchRegistry> registry, std::shared_ptr<CareerBook> career_book,
            std::shared_ptr<Observability> observability);

  // target은 쿼리 문자열을 포함할 수 있다.
  ApiResponse Handle(boost::beast::http::verb method, std::string_view target, const std::string& body);

 private:
  ApiResponse Dispatch(boost::beast::http::verb method, const std::string& path, const std::string& query,
                       const std::string& body);
  ApiResponse HandleMatchRoute(boost::beast::http::verb method, const std::vector<std::string>& segments,
                               const std::string& body);
  ApiResponse Leaderboard(const std::string& query);
  ApiResponse PlayerStatsFor(const PlayerId& player);
  MatchConfig ParseMatchConfig(const std::string& body) const;

  AppConfig config_;
  std::shared_ptr<MatchRegistry> registry_;
  std::shared_ptr<CareerBook> career_book_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace scorer
