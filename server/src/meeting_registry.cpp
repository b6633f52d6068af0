/*
 * 설명: 초대 세션 생성/슬롯 확정/검증과 만료 레코드 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/meeting_registry_test.cpp
 */
#include "meetlink/meeting_registry.hpp"

namespace meetlink {

std::string ToString(InvalidReason reason) {
  switch (reason) {
    case InvalidReason::kNotFound:
      return "NotFound";
    case InvalidReason::kExpired:
      return "Expired";
  }
  return "NotFound";
}

MeetingRegistry::MeetingRegistry(std::shared_ptr<MeetingStore> store, TokenGenerator generator,
                                 const RegistryConfig& config, Clock clock)
    : store_(std::move(store)), generator_(std::move(generator)), config_(config), clock_(std::move(clock)) {}

Meeting MeetingRegistry::Create(const std::string& contact) {
  auto now = clock_();
  Meeting meeting;
  meeting.created_at = now;
  meeting.expires_at = now + config_.session_ttl;
  meeting.recipient_contact = contact;
  meeting.status = MeetingStatus::kPending;
  meeting.id = generator_.Generate([&](const std::string& candidate) {
    meeting.id = candidate;
    return store_->InsertIfAbsent(meeting);
  });
  return meeting;
}

bool MeetingRegistry::ConfirmSlot(const std::string& id, const std::string& slot_time, std::string& error_code,
                                  std::string& error_message) {
  if (!store_->Find(id)) {
    error_code = "not_found";
    error_message = "미팅을 찾을 수 없습니다";
    return false;
  }
  if (!IsValidSlotTime(slot_time)) {
    error_code = "invalid_format";
    error_message = "슬롯 시각 형식이 올바르지 않습니다. HH:MM 형식이어야 합니다";
    return false;
  }
  // 조회와 갱신 사이에 정리 타이머가 레코드를 지웠을 수 있다.
  if (!store_->ConfirmSlot(id, slot_time)) {
    error_code = "not_found";
    error_message = "미팅을 찾을 수 없습니다";
    return false;
  }
  return true;
}

std::optional<Meeting> MeetingRegistry::Get(const std::string& id) const { return store_->Find(id); }

SessionValidation MeetingRegistry::Validate(const std::string& id) const {
  SessionValidation result;
  result.meeting_id = id;
  auto meeting = store_->Find(id);
  if (!meeting) {
    result.reason = InvalidReason::kNotFound;
    return result;
  }
  result.status = meeting->status;
  if (IsExpired(*meeting, clock_())) {
    result.reason = InvalidReason::kExpired;
    return result;
  }
  result.valid = true;
  result.slot_time = meeting->slot_time;
  return result;
}

std::size_t MeetingRegistry::SweepExpired(std::chrono::seconds retention) {
  return store_->EraseExpiredBefore(clock_() - retention);
}

}  // namespace meetlink
