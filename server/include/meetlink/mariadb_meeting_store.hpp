/*
 * 설명: MariaDB meetings 테이블 기반 미팅 저장소를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "meetlink/db_client.hpp"
#include "meetlink/meeting_store.hpp"

namespace meetlink {

class MariaDbMeetingStore : public MeetingStore {
 public:
  explicit MariaDbMeetingStore(std::shared_ptr<MariaDbClient> db_client);

  bool InsertIfAbsent(const Meeting& meeting) override;
  std::optional<Meeting> Find(const std::string& id) const override;
  bool ConfirmSlot(const std::string& id, const std::string& slot_time) override;
  std::size_t EraseExpiredBefore(std::chrono::system_clock::time_point cutoff) override;
  std::size_t Count() const override;

  void ClearAll() const;

 private:
  Meeting BuildMeeting(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace meetlink
