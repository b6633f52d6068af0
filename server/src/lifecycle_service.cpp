/*
 * 설명: 미팅 생성 시 토큰 발급/초대 전달을 묶고, 슬롯 확정과 검증을 레지스트리에 위임한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lifecycle_service_test.cpp, server/tests/e2e/invite_flow_test.cpp
 */
#include "meetlink/lifecycle_service.hpp"

#include <algorithm>
#include <cctype>

#include "meetlink/token_generator.hpp"

namespace meetlink {
namespace {
bool IsBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}
}  // namespace

MeetingLifecycleService::MeetingLifecycleService(std::shared_ptr<MeetingRegistry> registry,
                                                 std::shared_ptr<InvitationNotifier> notifier,
                                                 std::shared_ptr<Observability> observability,
                                                 std::string join_link_base)
    : registry_(std::move(registry)), notifier_(std::move(notifier)), observability_(std::move(observability)),
      join_link_base_(std::move(join_link_base)) {
  while (!join_link_base_.empty() && join_link_base_.back() == '/') {
    join_link_base_.pop_back();
  }
}

std::string MeetingLifecycleService::BuildJoinLink(const std::string& id) const {
  return join_link_base_ + "/" + id;
}

std::optional<CreatedSession> MeetingLifecycleService::CreateSession(const std::string& contact,
                                                                     std::string& error_code,
                                                                     std::string& error_message) {
  if (IsBlank(contact)) {
    error_code = "missing_contact";
    error_message = "수신자 연락처가 필요합니다";
    return std::nullopt;
  }

  Meeting meeting;
  try {
    meeting = registry_->Create(contact);
  } catch (const TokenExhaustedError& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "meeting.token_exhausted", {{"attempts", ex.attempts}});
    }
    error_code = "internal_error";
    error_message = "미팅 토큰을 할당하지 못했습니다";
    return std::nullopt;
  }

  CreatedSession created{meeting.id, meeting.expires_at, BuildJoinLink(meeting.id), false};
  if (observability_) {
    observability_->IncrementMeetingCreated();
    observability_->LogEvent(LogLevel::kInfo, "meeting.created",
                             {{"meetingId", meeting.id}, {"expiresAt", ToIsoString(meeting.expires_at)}});
  }

  Invitation invitation{contact, created.join_link, meeting.id, registry_->GetConfig().session_ttl};
  created.notified = notifier_ && notifier_->Send(invitation);
  if (!created.notified) {
    // 세션은 이미 저장되었으므로 되돌리지 않는다.
    error_code = "notification_failed";
    error_message = "초대 메시지를 전달하지 못했습니다";
    if (observability_) {
      observability_->LogEvent(LogLevel::kWarn, "invitation.failed", {{"meetingId", meeting.id}});
    }
  }
  return created;
}

bool MeetingLifecycleService::ConfirmSlot(const std::string& id, const std::string& slot_time,
                                          std::string& error_code, std::string& error_message) {
  if (id.empty() || slot_time.empty()) {
    error_code = "bad_request";
    error_message = "meetingId와 slotTime이 필요합니다";
    return false;
  }
  auto normalized = TokenGenerator::Normalize(id);
  if (!registry_->ConfirmSlot(normalized, slot_time, error_code, error_message)) {
    return false;
  }
  if (observability_) {
    observability_->IncrementSlotConfirmed();
    observability_->LogEvent(LogLevel::kInfo, "meeting.slot_confirmed",
                             {{"meetingId", normalized}, {"slotTime", slot_time}});
  }
  return true;
}

SessionValidation MeetingLifecycleService::ValidateSession(const std::string& id) const {
  auto normalized = TokenGenerator::Normalize(id);
  if (!TokenGenerator::IsWellFormed(normalized)) {
    SessionValidation result;
    result.meeting_id = normalized;
    result.reason = InvalidReason::kNotFound;
    return result;
  }
  return registry_->Validate(normalized);
}

}  // namespace meetlink
