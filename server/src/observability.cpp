/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "meetlink/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace meetlink {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementMeetingCreated() { meetings_created_.fetch_add(1); }

void Observability::IncrementSlotConfirmed() { slots_confirmed_.fetch_add(1); }

void Observability::IncrementSignalRelayed() { signals_relayed_.fetch_add(1); }

void Observability::IncrementSignalDropped() { signals_dropped_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t meetings_stored, std::uint64_t rooms_active) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.meetings_created = meetings_created_.load();
  snapshot.slots_confirmed = slots_confirmed_.load();
  snapshot.signals_relayed = signals_relayed_.load();
  snapshot.signals_dropped = signals_dropped_.load();
  snapshot.meetings_stored = meetings_stored;
  snapshot.rooms_active = rooms_active;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json = ctx.fields.is_object() ? ctx.fields : nlohmann::json::object();
  log_json["level"] = ToString(ctx.level);
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
    log_json["latencyMs"] = ctx.latency_ms;
  }
  if (ctx.meeting_id) {
    log_json["meetingId"] = *ctx.meeting_id;
  }
  if (ctx.conn_id) {
    log_json["connId"] = *ctx.conn_id;
  }
  auto line = log_json.dump();
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line << std::endl;
}

void Observability::LogEvent(LogLevel level, std::string name, nlohmann::json fields) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.name = std::move(name);
  ctx.level = level;
  ctx.fields = std::move(fields);
  Log(ctx);
}

}  // namespace meetlink
