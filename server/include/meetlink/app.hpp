/*
 * 설명: 서버 전체 수명주기와 구성요소 조립, 만료 세션 정리 타이머를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/invite_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "meetlink/config.hpp"
#include "meetlink/lifecycle_service.hpp"
#include "meetlink/meeting_registry.hpp"
#include "meetlink/meeting_store.hpp"
#include "meetlink/notifier.hpp"
#include "meetlink/observability.hpp"
#include "meetlink/signaling_relay.hpp"

namespace meetlink {

class Listener;
class MariaDbClient;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }

 private:
  void RunWorkers();
  void ScheduleSweep();
  void OnSweep(const boost::system::error_code& ec);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::steady_timer sweep_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MeetingStore> store_;
  std::shared_ptr<MeetingRegistry> registry_;
  std::shared_ptr<InvitationNotifier> notifier_;
  std::shared_ptr<MeetingLifecycleService> lifecycle_;
  std::shared_ptr<SignalingRelay> relay_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace meetlink
