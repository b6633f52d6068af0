/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고 종료 신호를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/invite_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "meetlink/app.hpp"

int main() {
  using namespace meetlink;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int signo) {
    if (ec) {
      return;
    }
    std::cout << "종료 신호 수신(" << signo << "), 종료를 준비합니다\n";
    app.GetContext().stop();
  });

  app.Run();
  return 0;
}
