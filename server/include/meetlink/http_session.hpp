/*
 * 설명: HTTP 연결을 처리하고 미팅 생성/슬롯 확정/검증 엔드포인트와 시그널링 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/invite_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "meetlink/api_response.hpp"
#include "meetlink/config.hpp"
#include "meetlink/lifecycle_service.hpp"
#include "meetlink/meeting_registry.hpp"
#include "meetlink/observability.hpp"
#include "meetlink/signaling_relay.hpp"
#include "meetlink/websocket_session.hpp"

namespace meetlink {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<MeetingLifecycleService> lifecycle, std::shared_ptr<MeetingRegistry> registry,
              std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::string& path, Response& res);
  void HandleCreateMeeting(Response& res);
  void HandleSelectSlot(Response& res);
  void HandleValidateMeeting(const std::string& meeting_id, Response& res);
  void HandleMetrics(Response& res);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<MeetingLifecycleService> lifecycle_;
  std::shared_ptr<MeetingRegistry> registry_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace meetlink
