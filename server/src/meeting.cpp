/*
 * 설명: 미팅 상태 문자열 변환, 슬롯 시각 검증, 시각 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/meeting_registry_test.cpp
 */
#include "meetlink/meeting.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace meetlink {
namespace {
bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
int TwoDigits(std::string_view text, std::size_t pos) { return (text[pos] - '0') * 10 + (text[pos + 1] - '0'); }
}  // namespace

std::string ToString(MeetingStatus status) {
  switch (status) {
    case MeetingStatus::kPending:
      return "pending";
    case MeetingStatus::kConfirmed:
      return "confirmed";
  }
  return "pending";
}

std::optional<MeetingStatus> ParseMeetingStatus(std::string_view text) {
  if (text == "pending") {
    return MeetingStatus::kPending;
  }
  if (text == "confirmed") {
    return MeetingStatus::kConfirmed;
  }
  return std::nullopt;
}

bool IsValidSlotTime(std::string_view text) {
  if (text.size() != 5 || text[2] != ':') {
    return false;
  }
  if (!IsDigit(text[0]) || !IsDigit(text[1]) || !IsDigit(text[3]) || !IsDigit(text[4])) {
    return false;
  }
  return TwoDigits(text, 0) < 24 && TwoDigits(text, 3) < 60;
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

long long ToEpochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(long long millis) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

}  // namespace meetlink
