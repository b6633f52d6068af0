/*
 * 설명: 미팅 레코드 저장소 인터페이스와 메모리 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/meeting_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "meetlink/meeting.hpp"

namespace meetlink {

class MeetingStore {
 public:
  virtual ~MeetingStore() = default;

  // id 가 비어 있을 때만 삽입한다. 이미 존재하면 false.
  virtual bool InsertIfAbsent(const Meeting& meeting) = 0;
  virtual std::optional<Meeting> Find(const std::string& id) const = 0;
  // slot_time 설정과 confirmed 전이를 한 번에 적용한다. id 가 없으면 false.
  virtual bool ConfirmSlot(const std::string& id, const std::string& slot_time) = 0;
  virtual std::size_t EraseExpiredBefore(std::chrono::system_clock::time_point cutoff) = 0;
  virtual std::size_t Count() const = 0;
};

class InMemoryMeetingStore : public MeetingStore {
 public:
  bool InsertIfAbsent(const Meeting& meeting) override;
  std::optional<Meeting> Find(const std::string& id) const override;
  bool ConfirmSlot(const std::string& id, const std::string& slot_time) override;
  std::size_t EraseExpiredBefore(std::chrono::system_clock::time_point cutoff) override;
  std::size_t Count() const override;

 private:
  std::unordered_map<std::string, Meeting> meetings_;
  mutable std::shared_mutex mutex_;
};

}  // namespace meetlink
