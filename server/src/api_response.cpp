/*
 * 설명: JSON 응답 엔벨로프를 생성하고 WS 메시지를 직렬화/해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "meetlink/api_response.hpp"

#include <chrono>

#include "meetlink/meeting.hpp"

namespace meetlink {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

std::optional<WsEnvelope> ParseWsJson(const nlohmann::json& message) {
  if (!message.is_object()) {
    return std::nullopt;
  }
  WsEnvelope env{.type = "", .event = "", .seq = 0, .payload = nlohmann::json::object()};
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_integer() && seq_it->get<std::int64_t>() >= 0) {
    env.seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  env.type = type_it->get<std::string>();
  auto event_it = message.find("event");
  if (event_it != message.end() && event_it->is_string()) {
    env.event = event_it->get<std::string>();
  }
  auto payload_it = message.find("p");
  if (payload_it != message.end() && payload_it->is_object()) {
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace meetlink
