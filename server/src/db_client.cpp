/*
 * 설명: MariaDB 연결과 일시 오류 재시도 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "meetlink/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace meetlink {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

struct ConnectionCloser {
  MYSQL* conn{nullptr};
  bool rollback{false};
  ~ConnectionCloser() {
    if (!conn) {
      return;
    }
    if (rollback) {
      mysql_rollback(conn);
    }
    mysql_close(conn);
  }
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  // 값이 바뀌지 않은 UPDATE 도 일치 행으로 집계해야 슬롯 재확정이 not_found 로 보이지 않는다.
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, CLIENT_FOUND_ROWS)) {
    ConnectionCloser closer{conn, false};
    RaiseError(conn, "연결 실패");
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      ConnectionCloser closer{Connect(), true};
      mysql_autocommit(closer.conn, 0);
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      bool commit = work(closer.conn);
      if (commit) {
        if (mysql_commit(closer.conn) != 0) {
          RaiseError(closer.conn, "커밋 실패");
        }
        closer.rollback = false;
      }
      return commit;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      ConnectionCloser closer{Connect(), false};
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      work(closer.conn);
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::Ping() const {
  try {
    ConnectionCloser closer{Connect(), false};
    return mysql_ping(closer.conn) == 0;
  } catch (const DbException&) {
    return false;
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::this_thread::sleep_for(std::chrono::milliseconds(base_ms + static_cast<std::size_t>(dist(gen))));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace meetlink
