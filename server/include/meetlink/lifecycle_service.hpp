/*
 * 설명: HTTP 경계가 호출하는 미팅 생성/슬롯 확정/검증 계약을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lifecycle_service_test.cpp, server/tests/e2e/invite_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "meetlink/meeting_registry.hpp"
#include "meetlink/notifier.hpp"
#include "meetlink/observability.hpp"

namespace meetlink {

struct CreatedSession {
  std::string id;
  std::chrono::system_clock::time_point expires_at;
  std::string join_link;
  bool notified{false};
};

class MeetingLifecycleService {
 public:
  MeetingLifecycleService(std::shared_ptr<MeetingRegistry> registry, std::shared_ptr<InvitationNotifier> notifier,
                          std::shared_ptr<Observability> observability, std::string join_link_base);

  // 알림 실패 시에도 세션은 반환되며 notified=false, error_code="notification_failed" 가 설정된다.
  std::optional<CreatedSession> CreateSession(const std::string& contact, std::string& error_code,
                                              std::string& error_message);
  bool ConfirmSlot(const std::string& id, const std::string& slot_time, std::string& error_code,
                   std::string& error_message);
  SessionValidation ValidateSession(const std::string& id) const;

  std::string BuildJoinLink(const std::string& id) const;

 private:
  std::shared_ptr<MeetingRegistry> registry_;
  std::shared_ptr<InvitationNotifier> notifier_;
  std::shared_ptr<Observability> observability_;
  std::string join_link_base_;
};

}  // namespace meetlink
