/*
 * 설명: HTTP 요청을 처리하고 미팅 생성/슬롯 확정/검증/메트릭/시그널링 WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/invite_flow_test.cpp
 */
#include "meetlink/http_session.hpp"

#include <stdexcept>
#include <string_view>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "meetlink/db_client.hpp"
#include "meetlink/meeting.hpp"
#include "meetlink/token_generator.hpp"

namespace meetlink {

namespace {
constexpr std::string_view kValidatePrefix = "/validate-meeting/";
constexpr std::string_view kSignalPath = "/signal";

void SetJson(HttpSession::Response& res, boost::beast::http::status status, const nlohmann::json& body) {
  res.result(status);
  res.body() = body.dump();
  res.content_length(res.body().size());
}

void SetError(HttpSession::Response& res, boost::beast::http::status status, std::string_view code,
              std::string_view message, const nlohmann::json& detail = nullptr) {
  SetJson(res, status, MakeErrorEnvelope(code, message, detail));
}

// 빈 본문은 빈 객체로 취급한다. 형식이 틀리면 예외를 던진다.
nlohmann::json ParseBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(body);
  if (!parsed.is_object()) {
    throw std::runtime_error("JSON 객체가 아닙니다");
  }
  return parsed;
}

std::string StringField(const nlohmann::json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::string StripQuery(const std::string& target) {
  auto qpos = target.find('?');
  return qpos == std::string::npos ? target : target.substr(0, qpos);
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<MeetingLifecycleService> lifecycle, std::shared_ptr<MeetingRegistry> registry,
                         std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), lifecycle_(std::move(lifecycle)), registry_(std::move(registry)),
      relay_(std::move(relay)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) { self->OnRead(ec, bytes_transferred); });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_) && StripQuery(std::string(req_.target())) == kSignalPath) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "meetlink");
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->set(http::field::access_control_allow_origin, config_.cors_origin);

  try {
    Route(StripQuery(std::string(req_.target())), *res);
  } catch (const DbException& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "storage.failed", {{"traceId", trace_id_}, {"error", ex.what()}});
    }
    SetError(*res, http::status::service_unavailable, "storage_unavailable", "저장소를 사용할 수 없습니다");
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "request.failed", {{"traceId", trace_id_}, {"error", ex.what()}});
    }
    SetError(*res, http::status::internal_server_error, "internal_error", "서버 내부 오류");
  }
  SendResponse(res);
}

void HttpSession::Route(const std::string& path, Response& res) {
  using namespace boost::beast;
  if (req_.method() == http::verb::options) {
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.result(http::status::no_content);
    res.content_length(0);
    return;
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return SetJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    return HandleMetrics(res);
  }

  if (req_.method() == http::verb::post && path == "/create-meeting") {
    return HandleCreateMeeting(res);
  }

  if (req_.method() == http::verb::post && path == "/select-slot") {
    return HandleSelectSlot(res);
  }

  if (req_.method() == http::verb::get && path.compare(0, kValidatePrefix.size(), kValidatePrefix) == 0) {
    return HandleValidateMeeting(path.substr(kValidatePrefix.size()), res);
  }

  SetError(res, http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::HandleCreateMeeting(Response& res) {
  using namespace boost::beast;
  nlohmann::json body;
  try {
    body = ParseBody(req_.body());
  } catch (const std::exception&) {
    return SetError(res, http::status::bad_request, "bad_request", "JSON 본문이 올바르지 않습니다");
  }
  // 기존 클라이언트는 recipientEmail 을 보낸다.
  std::string contact = StringField(body, "contact");
  if (contact.empty()) {
    contact = StringField(body, "recipientEmail");
  }

  std::string error_code;
  std::string error_message;
  auto created = lifecycle_->CreateSession(contact, error_code, error_message);
  if (!created) {
    auto status = error_code == "missing_contact" ? http::status::bad_request : http::status::internal_server_error;
    return SetError(res, status, error_code, error_message);
  }
  nlohmann::json data{{"meetingId", created->id},
                      {"expiresAt", ToIsoString(created->expires_at)},
                      {"expiresAtMs", ToEpochMillis(created->expires_at)},
                      {"joinLink", created->join_link}};
  if (!created->notified) {
    return SetError(res, http::status::bad_gateway, error_code, error_message, data);
  }
  SetJson(res, http::status::created, MakeSuccessEnvelope(data));
}

void HttpSession::HandleSelectSlot(Response& res) {
  using namespace boost::beast;
  nlohmann::json body;
  try {
    body = ParseBody(req_.body());
  } catch (const std::exception&) {
    return SetError(res, http::status::bad_request, "bad_request", "JSON 본문이 올바르지 않습니다");
  }
  auto meeting_id = StringField(body, "meetingId");
  auto slot_time = StringField(body, "slotTime");

  std::string error_code;
  std::string error_message;
  if (!lifecycle_->ConfirmSlot(meeting_id, slot_time, error_code, error_message)) {
    auto status = error_code == "not_found" ? http::status::not_found : http::status::bad_request;
    return SetError(res, status, error_code, error_message);
  }
  nlohmann::json data{{"confirmed", true}, {"meetingId", TokenGenerator::Normalize(meeting_id)}, {"slotTime", slot_time}};
  SetJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleValidateMeeting(const std::string& meeting_id, Response& res) {
  auto result = lifecycle_->ValidateSession(meeting_id);
  nlohmann::json data{{"valid", result.valid}, {"meetingId", result.meeting_id}};
  if (result.valid) {
    data["slotTime"] = result.slot_time ? nlohmann::json(*result.slot_time) : nlohmann::json(nullptr);
    data["status"] = ToString(result.status.value_or(MeetingStatus::kPending));
  } else {
    auto reason = result.reason.value_or(InvalidReason::kNotFound);
    data["reason"] = ToString(reason);
    data["message"] = reason == InvalidReason::kExpired ? "초대 링크가 만료되었습니다" : "미팅을 찾을 수 없습니다";
  }
  SetJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleMetrics(Response& res) {
  auto snapshot = observability_->Snapshot(registry_->Count(), relay_->RoomCount());
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"connections", {{"websocket", snapshot.websocket_active}}},
                      {"meetings",
                       {{"created", snapshot.meetings_created},
                        {"confirmed", snapshot.slots_confirmed},
                        {"stored", snapshot.meetings_stored}}},
                      {"signaling",
                       {{"rooms", snapshot.rooms_active},
                        {"relayed", snapshot.signals_relayed},
                        {"dropped", snapshot.signals_dropped}}}};
  SetJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(latency);
    ctx.fields = {{"method", std::string(req_.method_string())}, {"status", res->result_int()}};
    observability_->Log(ctx);
  }
  res->keep_alive(false);
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.next_layer().expires_never();
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "meetlink");
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kWarn, "ws.accept_failed", {{"error", ec.message()}});
    }
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  auto conn_id = relay_->NextConnectionId();
  std::make_shared<WebSocketSession>(std::move(ws), conn_id, relay_, observability_, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace meetlink
