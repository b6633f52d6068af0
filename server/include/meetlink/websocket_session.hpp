/*
 * 설명: 시그널링 WebSocket 연결의 메시지 처리, 백프레셔, 중계 이벤트 전달을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/invite_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "meetlink/api_response.hpp"
#include "meetlink/observability.hpp"
#include "meetlink/signaling_relay.hpp"

namespace meetlink {

class WebSocketSession : public SignalingPeer, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string conn_id,
                   std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  const std::string& ConnectionId() const override { return conn_id_; }
  void SendServerEvent(const std::string& event, const nlohmann::json& payload) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleJoinRoom(const nlohmann::json& payload, std::uint64_t seq);
  void HandleSendOffer(const nlohmann::json& payload, std::uint64_t seq);
  void HandleAcceptOffer(const nlohmann::json& payload, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void Post(std::string message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void StartClose();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string conn_id_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace meetlink
