#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "meetlink/app.hpp"
#include "meetlink/config.hpp"

namespace {

unsigned short ResolvePort() {
  const char* env_port = std::getenv("E2E_PORT");
  return env_port ? static_cast<unsigned short>(std::stoi(env_port)) : 18431;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  ASSERT_TRUE(body.contains("success"));
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

void ExpectWsEvent(const nlohmann::json& msg, const std::string& event_name) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "event");
  EXPECT_EQ(msg["event"], event_name);
  ASSERT_TRUE(msg.contains("p"));
  EXPECT_TRUE(msg["p"].is_object());
}

void ExpectWsError(const nlohmann::json& msg, const std::string& code) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "error");
  EXPECT_EQ(msg["p"]["code"], code);
}

class InviteFlowFixture : public ::testing::Test {
 protected:
  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  static void SetUpTestSuite() {
    auto config = meetlink::LoadConfigFromEnv();
    config.port = ResolvePort();
    config.worker_threads = 2;
    config.store_backend = "memory";
    config.notifier = "log";
    config.log_level = "warn";
    config.join_link_base = "http://localhost:3000/schedule/";
    config.relay_room_capacity = 2;
    config.relay_require_shared_room = false;
    config.sweep_interval_seconds = 0;
    app_ = new meetlink::ServerApp(config);
    server_thread_ = new std::thread([] { app_->Run(); });
  }

  static void TearDownTestSuite() {
    app_->Stop();
    if (server_thread_->joinable()) {
      server_thread_->join();
    }
    delete server_thread_;
    delete app_;
    server_thread_ = nullptr;
    app_ = nullptr;
  }

  void SetUp() override {
    port_ = ResolvePort();
    WaitForReady();
  }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const nlohmann::json* body) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, host_);
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (body) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body->dump();
    }
    req.prepare_payload();
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body) {
    return Send(boost::beast::http::verb::post, target, &body);
  }

  SimpleHttpResponse Get(const std::string& target) { return Send(boost::beast::http::verb::get, target, nullptr); }

  std::string CreateMeeting() {
    auto res = PostJson("/create-meeting", {{"contact", "guest@example.com"}});
    EXPECT_EQ(res.status, boost::beast::http::status::created);
    ExpectSuccessEnvelope(res.body);
    return res.body["data"]["meetingId"].get<std::string>();
  }

  std::unique_ptr<WebSocket> ConnectWs() {
    auto ws = std::make_unique<WebSocket>(ioc_);
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    ws->next_layer().connect(results);
    ws->handshake(host_, "/signal");
    return ws;
  }

  nlohmann::json ReadWs(WebSocket& ws, boost::beast::flat_buffer& buffer) {
    buffer.consume(buffer.size());
    ws.read(buffer);
    auto raw = boost::beast::buffers_to_string(buffer.cdata());
    return nlohmann::json::parse(raw);
  }

  void SendWs(WebSocket& ws, const std::string& event, std::uint64_t seq, const nlohmann::json& payload) {
    nlohmann::json msg{{"t", "event"}, {"seq", seq}, {"event", event}, {"p", payload}};
    ws.write(boost::asio::buffer(msg.dump()));
  }

  // connected 이벤트를 읽고 연결 id 를 돌려준다.
  std::string ReadConnectionId(WebSocket& ws, boost::beast::flat_buffer& buffer) {
    auto connected = ReadWs(ws, buffer);
    ExpectWsEvent(connected, "connected");
    return connected["p"]["connId"].get<std::string>();
  }

  void CloseWs(WebSocket& ws) {
    boost::beast::error_code ec;
    ws.close(boost::beast::websocket::close_code::normal, ec);
  }

  void WaitForReady() {
    for (int i = 0; i < 25; ++i) {
      try {
        auto res = Get("/api/health");
        if (res.status == boost::beast::http::status::ok) {
          return;
        }
      } catch (const boost::system::system_error&) {
        // 아직 리스너가 열리지 않았다.
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  }

  static meetlink::ServerApp* app_;
  static std::thread* server_thread_;

  std::string host_{"127.0.0.1"};
  unsigned short port_{18431};
  boost::asio::io_context ioc_;
};

meetlink::ServerApp* InviteFlowFixture::app_ = nullptr;
std::thread* InviteFlowFixture::server_thread_ = nullptr;

}  // namespace

TEST_F(InviteFlowFixture, CreateSelectAndValidate) {
  auto created = PostJson("/create-meeting", {{"contact", "guest@example.com"}});
  ASSERT_EQ(created.status, boost::beast::http::status::created);
  ExpectSuccessEnvelope(created.body);
  auto meeting_id = created.body["data"]["meetingId"].get<std::string>();
  EXPECT_EQ(meeting_id.size(), 8u);
  EXPECT_EQ(created.body["data"]["joinLink"], "http://localhost:3000/schedule/" + meeting_id);
  EXPECT_TRUE(created.body["data"]["expiresAt"].is_string());

  auto pending = Get("/validate-meeting/" + meeting_id);
  ASSERT_EQ(pending.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(pending.body);
  EXPECT_TRUE(pending.body["data"]["valid"].get<bool>());
  EXPECT_TRUE(pending.body["data"]["slotTime"].is_null());
  EXPECT_EQ(pending.body["data"]["status"], "pending");

  auto selected = PostJson("/select-slot", {{"meetingId", meeting_id}, {"slotTime", "14:30"}});
  ASSERT_EQ(selected.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(selected.body);
  EXPECT_TRUE(selected.body["data"]["confirmed"].get<bool>());

  auto lower = meeting_id;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  auto confirmed = Get("/validate-meeting/" + lower);
  ExpectSuccessEnvelope(confirmed.body);
  EXPECT_TRUE(confirmed.body["data"]["valid"].get<bool>());
  EXPECT_EQ(confirmed.body["data"]["meetingId"], meeting_id);
  EXPECT_EQ(confirmed.body["data"]["slotTime"], "14:30");
  EXPECT_EQ(confirmed.body["data"]["status"], "confirmed");
}

TEST_F(InviteFlowFixture, LegacyRecipientEmailFieldIsAccepted) {
  auto created = PostJson("/create-meeting", {{"recipientEmail", "legacy@example.com"}});
  EXPECT_EQ(created.status, boost::beast::http::status::created);
  ExpectSuccessEnvelope(created.body);
}

TEST_F(InviteFlowFixture, RejectsBadRequests) {
  auto missing = PostJson("/create-meeting", nlohmann::json::object());
  EXPECT_EQ(missing.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(missing.body, "missing_contact");

  auto meeting_id = CreateMeeting();
  auto bad_slot = PostJson("/select-slot", {{"meetingId", meeting_id}, {"slotTime", "2pm"}});
  EXPECT_EQ(bad_slot.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(bad_slot.body, "invalid_format");

  auto unknown = PostJson("/select-slot", {{"meetingId", "ZZZZZZZZ"}, {"slotTime", "10:00"}});
  EXPECT_EQ(unknown.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(unknown.body, "not_found");

  auto incomplete = PostJson("/select-slot", {{"meetingId", meeting_id}});
  EXPECT_EQ(incomplete.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(incomplete.body, "bad_request");

  auto no_route = Get("/nope");
  EXPECT_EQ(no_route.status, boost::beast::http::status::not_found);
}

TEST_F(InviteFlowFixture, UnknownMeetingValidatesAsNotFound) {
  auto res = Get("/validate-meeting/ZZZZZZZZ");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_FALSE(res.body["data"]["valid"].get<bool>());
  EXPECT_EQ(res.body["data"]["reason"], "NotFound");
  EXPECT_TRUE(res.body["data"]["message"].is_string());
}

TEST_F(InviteFlowFixture, TwoParticipantsExchangeOfferAndAnswer) {
  auto meeting_id = CreateMeeting();

  auto ws_a = ConnectWs();
  boost::beast::flat_buffer buf_a;
  auto conn_a = ReadConnectionId(*ws_a, buf_a);
  SendWs(*ws_a, "join-room", 1, {{"roomId", meeting_id}});
  auto joined_a = ReadWs(*ws_a, buf_a);
  ExpectWsEvent(joined_a, "room-joined");
  EXPECT_EQ(joined_a["seq"], 1);
  EXPECT_TRUE(joined_a["p"]["peers"].empty());

  auto ws_b = ConnectWs();
  boost::beast::flat_buffer buf_b;
  auto conn_b = ReadConnectionId(*ws_b, buf_b);
  EXPECT_NE(conn_a, conn_b);
  SendWs(*ws_b, "join-room", 1, {{"roomId", meeting_id}});
  auto joined_b = ReadWs(*ws_b, buf_b);
  ExpectWsEvent(joined_b, "room-joined");
  ASSERT_EQ(joined_b["p"]["peers"].size(), 1u);
  EXPECT_EQ(joined_b["p"]["peers"][0], conn_a);

  auto peer_joined = ReadWs(*ws_a, buf_a);
  ExpectWsEvent(peer_joined, "peer-joined");
  EXPECT_EQ(peer_joined["p"]["connId"], conn_b);

  nlohmann::json offer{{"type", "offer"}, {"sdp", "v=0\r\no=- 46117 2 IN IP4 127.0.0.1\r\n"}};
  SendWs(*ws_a, "send-offer", 2, {{"targetConnId", conn_b}, {"callerId", conn_a}, {"signal", offer}});
  auto received = ReadWs(*ws_b, buf_b);
  ExpectWsEvent(received, "receive-offer");
  EXPECT_EQ(received["p"]["callerId"], conn_a);
  EXPECT_EQ(received["p"]["signal"], offer);

  nlohmann::json answer{{"type", "answer"}, {"sdp", "v=0\r\no=- 46118 2 IN IP4 127.0.0.1\r\n"}};
  SendWs(*ws_b, "accept-offer", 2, {{"callerId", conn_a}, {"signal", answer}});
  auto accepted = ReadWs(*ws_a, buf_a);
  ExpectWsEvent(accepted, "call-accepted");
  EXPECT_EQ(accepted["p"]["responderId"], conn_b);
  EXPECT_EQ(accepted["p"]["signal"], answer);

  // 존재하지 않는 대상으로 보낸 offer 는 조용히 버려지므로 다음 메시지는 뒤이은 오류다.
  SendWs(*ws_a, "send-offer", 3, {{"targetConnId", "0000000000000000"}, {"signal", offer}});
  SendWs(*ws_a, "ping", 4, nlohmann::json::object());
  auto error = ReadWs(*ws_a, buf_a);
  ExpectWsError(error, "bad_request");
  EXPECT_EQ(error["seq"], 4);

  auto ws_c = ConnectWs();
  boost::beast::flat_buffer buf_c;
  ReadConnectionId(*ws_c, buf_c);
  SendWs(*ws_c, "join-room", 1, {{"roomId", meeting_id}});
  auto full = ReadWs(*ws_c, buf_c);
  ExpectWsError(full, "room_full");

  CloseWs(*ws_c);
  CloseWs(*ws_b);
  CloseWs(*ws_a);
}

TEST_F(InviteFlowFixture, MalformedSignalingMessagesGetErrors) {
  auto ws = ConnectWs();
  boost::beast::flat_buffer buffer;
  ReadConnectionId(*ws, buffer);

  ws->write(boost::asio::buffer(std::string("not json")));
  ExpectWsError(ReadWs(*ws, buffer), "bad_request");

  SendWs(*ws, "join-room", 7, nlohmann::json::object());
  auto missing_room = ReadWs(*ws, buffer);
  ExpectWsError(missing_room, "bad_request");
  EXPECT_EQ(missing_room["seq"], 7);

  SendWs(*ws, "send-offer", 8, {{"targetConnId", "abc"}});
  ExpectWsError(ReadWs(*ws, buffer), "bad_request");

  CloseWs(*ws);
}

TEST_F(InviteFlowFixture, MetricsReportCounters) {
  CreateMeeting();
  auto res = Get("/metrics");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_GE(res.body["data"]["meetings"]["created"].get<std::uint64_t>(), 1u);
  EXPECT_GE(res.body["data"]["meetings"]["stored"].get<std::uint64_t>(), 1u);
  EXPECT_GE(res.body["data"]["requests"]["total"].get<std::uint64_t>(), 1u);
  EXPECT_TRUE(res.body["data"]["signaling"].contains("rooms"));
}
