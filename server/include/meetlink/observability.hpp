/*
 * 설명: 구조화 로그(JSON 라인)와 요청/미팅/시그널링 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/invite_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace meetlink {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> meeting_id;
  std::optional<std::string> conn_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json fields{};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t meetings_created{0};
  std::uint64_t slots_confirmed{0};
  std::uint64_t signals_relayed{0};
  std::uint64_t signals_dropped{0};
  std::uint64_t meetings_stored{0};
  std::uint64_t rooms_active{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementMeetingCreated();
  void IncrementSlotConfirmed();
  void IncrementSignalRelayed();
  void IncrementSignalDropped();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t meetings_stored, std::uint64_t rooms_active) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void LogEvent(LogLevel level, std::string name, nlohmann::json fields = nlohmann::json::object()) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> meetings_created_{0};
  std::atomic<std::uint64_t> slots_confirmed_{0};
  std::atomic<std::uint64_t> signals_relayed_{0};
  std::atomic<std::uint64_t> signals_dropped_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace meetlink
