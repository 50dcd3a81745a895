/*
 * 설명: 채점 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "scorer/api_router.hpp"
#include "scorer/career_book.hpp"
#include "scorer/config.hpp"
#include "scorer/match_registry.hpp"
#include "scorer/observability.hpp"

namespace scorer {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<MatchRegistry> GetMatchRegistry() { return registry_; }
  std::shared_ptr<CareerBook> GetCareerBook() { return career_book_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<CareerBook> career_book_;
  std::shared_ptr<MatchRegistry> registry_;
  std::shared_ptr<ApiRouter> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace scorer
