/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/invite_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace meetlink {

struct AppConfig {
  unsigned short port;
  std::size_t worker_threads;
  std::string join_link_base;
  std::string cors_origin;
  std::size_t session_ttl_seconds;
  std::size_t token_max_attempts;
  std::string store_backend;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::size_t sweep_interval_seconds;
  std::size_t sweep_retention_seconds;
  std::string notifier;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t relay_room_capacity;
  bool relay_require_shared_room;
  bool relay_notify_peer_left;
};

AppConfig LoadConfigFromEnv();

}  // namespace meetlink
