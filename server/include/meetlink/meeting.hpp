/*
 * 설명: 초대 세션(미팅) 레코드와 상태, 슬롯 시각 형식 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/meeting_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace meetlink {

enum class MeetingStatus { kPending, kConfirmed };

std::string ToString(MeetingStatus status);
std::optional<MeetingStatus> ParseMeetingStatus(std::string_view text);

struct Meeting {
  std::string id;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point expires_at;
  std::string recipient_contact;
  // confirmed 상태일 때만 값이 있다.
  std::optional<std::string> slot_time;
  MeetingStatus status{MeetingStatus::kPending};
};

// 24시간제 HH:MM (00:00 ~ 23:59) 만 허용한다.
bool IsValidSlotTime(std::string_view text);

inline bool IsExpired(const Meeting& meeting, std::chrono::system_clock::time_point now) {
  return now > meeting.expires_at;
}

std::string ToIsoString(std::chrono::system_clock::time_point tp);
long long ToEpochMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromEpochMillis(long long millis);

}  // namespace meetlink
