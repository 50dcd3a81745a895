/*
 * 설명: 채점 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <csignal>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "scorer/app.hpp"

int main() {
  using namespace scorer;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 값이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int /*signal*/) {
    if (!ec) {
      std::cout << "종료 신호 수신, 서버를 멈춥니다\n";
      app.GetContext().stop();
    }
  });

  app.Run();
  return 0;
}
