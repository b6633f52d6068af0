/*
 * 설명: 미팅 레코드를 MariaDB meetings 테이블에 저장하고 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "meetlink/mariadb_meeting_store.hpp"

#include <sstream>

namespace meetlink {
namespace {
long long ToLongLong(const char* value) { return value ? std::stoll(value) : 0; }
}  // namespace

MariaDbMeetingStore::MariaDbMeetingStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

bool MariaDbMeetingStore::InsertIfAbsent(const Meeting& meeting) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO meetings(id, created_at_ms, expires_at_ms, recipient_contact, slot_time, status) VALUES('"
        << db_client_->Escape(conn, meeting.id) << "', " << ToEpochMillis(meeting.created_at) << ", "
        << ToEpochMillis(meeting.expires_at) << ", '" << db_client_->Escape(conn, meeting.recipient_contact) << "', ";
    if (meeting.slot_time) {
      oss << "'" << db_client_->Escape(conn, *meeting.slot_time) << "'";
    } else {
      oss << "NULL";
    }
    oss << ", '" << ToString(meeting.status) << "');";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == MariaDbClient::kDuplicateEntry) {
        return false;
      }
      db_client_->RaiseError(conn, "미팅 저장 실패");
    }
    return true;
  });
}

std::optional<Meeting> MariaDbMeetingStore::Find(const std::string& id) const {
  std::optional<Meeting> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, created_at_ms, expires_at_ms, recipient_contact, slot_time, status FROM meetings WHERE id='"
        << db_client_->Escape(conn, id) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "미팅 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "미팅 조회 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      result = BuildMeeting(row);
    }
    mysql_free_result(res);
  });
  return result;
}

bool MariaDbMeetingStore::ConfirmSlot(const std::string& id, const std::string& slot_time) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE meetings SET slot_time='" << db_client_->Escape(conn, slot_time) << "', status='"
        << ToString(MeetingStatus::kConfirmed) << "' WHERE id='" << db_client_->Escape(conn, id) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "슬롯 확정 실패");
    }
    // CLIENT_FOUND_ROWS 로 연결하므로 같은 값으로 갱신해도 1 이다.
    return mysql_affected_rows(conn) > 0;
  });
}

std::size_t MariaDbMeetingStore::EraseExpiredBefore(std::chrono::system_clock::time_point cutoff) {
  std::size_t erased = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM meetings WHERE expires_at_ms < " << ToEpochMillis(cutoff) << ";";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "만료 미팅 정리 실패");
    }
    erased = static_cast<std::size_t>(mysql_affected_rows(conn));
    return true;
  });
  return erased;
}

std::size_t MariaDbMeetingStore::Count() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, "SELECT COUNT(*) FROM meetings;") != 0) {
      db_client_->RaiseError(conn, "미팅 카운트 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "카운트 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      count = static_cast<std::size_t>(std::stoull(row[0]));
    }
    mysql_free_result(res);
  });
  return count;
}

void MariaDbMeetingStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, "DELETE FROM meetings;") != 0) {
      db_client_->RaiseError(conn, "미팅 초기화 실패");
    }
  });
}

Meeting MariaDbMeetingStore::BuildMeeting(MYSQL_ROW row) const {
  Meeting meeting;
  meeting.id = row[0] ? row[0] : "";
  meeting.created_at = FromEpochMillis(ToLongLong(row[1]));
  meeting.expires_at = FromEpochMillis(ToLongLong(row[2]));
  meeting.recipient_contact = row[3] ? row[3] : "";
  if (row[4]) {
    meeting.slot_time = std::string(row[4]);
  }
  meeting.status = ParseMeetingStatus(row[5] ? row[5] : "").value_or(MeetingStatus::kPending);
  return meeting;
}

}  // namespace meetlink
