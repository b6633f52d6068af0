/*
 * 설명: 프로세스 메모리에 미팅 레코드를 보관하는 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/meeting_registry_test.cpp
 */
#include "meetlink/meeting_store.hpp"

#include <mutex>

namespace meetlink {

bool InMemoryMeetingStore::InsertIfAbsent(const Meeting& meeting) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return meetings_.emplace(meeting.id, meeting).second;
}

std::optional<Meeting> InMemoryMeetingStore::Find(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = meetings_.find(id);
  if (it == meetings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryMeetingStore::ConfirmSlot(const std::string& id, const std::string& slot_time) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = meetings_.find(id);
  if (it == meetings_.end()) {
    return false;
  }
  it->second.slot_time = slot_time;
  it->second.status = MeetingStatus::kConfirmed;
  return true;
}

std::size_t InMemoryMeetingStore::EraseExpiredBefore(std::chrono::system_clock::time_point cutoff) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::size_t erased = 0;
  for (auto it = meetings_.begin(); it != meetings_.end();) {
    if (it->second.expires_at < cutoff) {
      it = meetings_.erase(it);
      ++erased;
    } else {
      ++it;
    }
  }
  return erased;
}

std::size_t InMemoryMeetingStore::Count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return meetings_.size();
}

}  // namespace meetlink
