/*
 * 설명: 시그널링 WebSocket 메시지를 읽어 중계기로 넘기고, 서버 이벤트를 strand 위에서 순서대로 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/invite_flow_test.cpp
 */
#include "meetlink/websocket_session.hpp"

#include <string>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace meetlink {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string conn_id,
                                   std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability,
                                   std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), conn_id_(std::move(conn_id)), relay_(std::move(relay)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { relay_->Disconnect(conn_id_, this); }

void WebSocketSession::Run() {
  relay_->Register(shared_from_this());
  WsEnvelope env{.type = "event", .event = "connected", .seq = 0, .payload = {{"connId", conn_id_}}};
  EnqueueMessage(ToWsJson(env).dump());
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed || closing_) {
    return;
  }
  if (ec) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kDebug, "ws.read_failed", {{"connId", conn_id_}, {"error", ec.message()}});
    }
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    auto message = ParseWsJson(nlohmann::json::parse(data));
    if (!message) {
      SendError("bad_request", "잘못된 메시지 형식", 0);
    } else if (message->type != "event" || message->event.empty()) {
      SendError("bad_request", "알 수 없는 메시지 유형", message->seq);
    } else if (message->event == "join-room") {
      HandleJoinRoom(message->payload, message->seq);
    } else if (message->event == "send-offer") {
      HandleSendOffer(message->payload, message->seq);
    } else if (message->event == "accept-offer") {
      HandleAcceptOffer(message->payload, message->seq);
    } else {
      SendError("bad_request", "알 수 없는 이벤트", message->seq);
    }
  } catch (const nlohmann::json::exception&) {
    SendError("bad_request", "JSON 파싱 오류", 0);
  }

  DoRead();
}

void WebSocketSession::HandleJoinRoom(const nlohmann::json& payload, std::uint64_t seq) {
  if (!payload.contains("roomId") || !payload["roomId"].is_string()) {
    SendError("bad_request", "roomId 필드가 필요합니다", seq);
    return;
  }
  auto room_id = payload["roomId"].get<std::string>();
  std::vector<std::string> existing;
  std::string error_code;
  std::string error_message;
  if (!relay_->Join(conn_id_, room_id, existing, error_code, error_message)) {
    SendError(error_code, error_message, seq);
    return;
  }
  nlohmann::json peers = existing;
  WsEnvelope env{.type = "event",
                 .event = "room-joined",
                 .seq = seq,
                 .payload = {{"roomId", room_id}, {"connId", conn_id_}, {"peers", peers}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::HandleSendOffer(const nlohmann::json& payload, std::uint64_t seq) {
  if (!payload.contains("targetConnId") || !payload["targetConnId"].is_string() || !payload.contains("signal") ||
      payload["signal"].is_null()) {
    SendError("bad_request", "targetConnId와 signal 필드가 필요합니다", seq);
    return;
  }
  std::string caller_id;
  if (payload.contains("callerId")) {
    if (!payload["callerId"].is_string()) {
      SendError("bad_request", "callerId 형식이 올바르지 않습니다", seq);
      return;
    }
    caller_id = payload["callerId"].get<std::string>();
  }
  std::string error_code;
  std::string error_message;
  auto outcome = relay_->SendOffer(conn_id_, payload["targetConnId"].get<std::string>(), caller_id,
                                   payload["signal"], error_code, error_message);
  if (outcome == RelayOutcome::kRejected) {
    SendError(error_code, error_message, seq);
  }
}

void WebSocketSession::HandleAcceptOffer(const nlohmann::json& payload, std::uint64_t seq) {
  if (!payload.contains("callerId") || !payload["callerId"].is_string() || !payload.contains("signal") ||
      payload["signal"].is_null()) {
    SendError("bad_request", "callerId와 signal 필드가 필요합니다", seq);
    return;
  }
  std::string error_code;
  std::string error_message;
  auto outcome = relay_->AcceptOffer(conn_id_, payload["callerId"].get<std::string>(), payload["signal"],
                                     error_code, error_message);
  if (outcome == RelayOutcome::kRejected) {
    SendError(error_code, error_message, seq);
  }
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  Post(ToWsJson(env).dump());
}

void WebSocketSession::Post(std::string message) {
  // 다른 연결의 strand 에서 호출될 수 있으므로 자신의 strand 로 넘긴다.
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return;
  }
  if (closing_) {
    StartClose();
    return;
  }
  WriteNext();
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  if (observability_) {
    observability_->LogEvent(LogLevel::kWarn, "ws.backpressure_close",
                             {{"connId", conn_id_}, {"queued", send_queue_.size()}, {"queuedBytes", queued_bytes_}});
  }
  // 진행 중인 쓰기 버퍼는 완료 콜백까지 살아 있어야 하므로 OnWrite 에서 닫는다.
  if (!writing_) {
    StartClose();
  }
}

void WebSocketSession::StartClose() {
  send_queue_.clear();
  queued_bytes_ = 0;
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace meetlink
