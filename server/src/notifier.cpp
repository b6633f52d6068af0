/*
 * 설명: 초대 전달 구현체(로그 기록/비활성)를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lifecycle_service_test.cpp
 */
#include "meetlink/notifier.hpp"

namespace meetlink {

std::string MaskContact(std::string_view contact) {
  constexpr std::size_t kVisibleTail = 4;
  auto at = contact.find('@');
  if (at != std::string_view::npos && at > 0) {
    return std::string(contact.substr(0, 1)) + "***" + std::string(contact.substr(at));
  }
  if (contact.size() <= kVisibleTail) {
    return std::string(contact.size(), '*');
  }
  return std::string(contact.size() - kVisibleTail, '*') + std::string(contact.substr(contact.size() - kVisibleTail));
}

LoggingNotifier::LoggingNotifier(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

bool LoggingNotifier::Send(const Invitation& invitation) {
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "invitation.sent",
                             {{"contact", MaskContact(invitation.contact)},
                              {"meetingId", invitation.meeting_id},
                              {"joinLink", invitation.join_link},
                              {"expiresInSeconds", invitation.expires_in.count()}});
  }
  return true;
}

std::shared_ptr<InvitationNotifier> MakeNotifier(const std::string& kind,
                                                 const std::shared_ptr<Observability>& observability) {
  if (kind == "disabled") {
    return std::make_shared<DisabledNotifier>();
  }
  return std::make_shared<LoggingNotifier>(observability);
}

}  // namespace meetlink
