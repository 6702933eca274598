/*
 * 설명: MariaDB 연결, 쿼리 실행과 재시도 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: ladder/tests/it/ladder_service_it_test.cpp, ladder/tests/it/replay_it_test.cpp
 */
#include "ladder/db_client.hpp"

#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace ladder {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kErDeadlock = 1213;
constexpr unsigned int kErLockWaitTimeout = 1205;
constexpr const char* kSessionSetup = "SET SESSION innodb_lock_wait_timeout=2;";
}  // namespace

const char* LockClause(RowLock lock) {
  switch (lock) {
    case RowLock::kShare:
      return " LOCK IN SHARE MODE";
    case RowLock::kExclusive:
      return " FOR UPDATE";
    case RowLock::kNone:
      break;
  }
  return "";
}

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::Connection MariaDbClient::Connect() const {
  Connection conn(mysql_init(nullptr), &mysql_close);
  if (!conn) {
    throw DbException("MariaDB 핸들 할당 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &io_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &io_timeout_seconds_);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패 " + config_.host + ":" + std::to_string(config_.port));
  }
  Execute(conn.get(), kSessionSetup, "세션 설정 실패");
  return conn;
}

void MariaDbClient::RetryOnTransient(const std::function<void(MYSQL*, std::size_t)>& attempt) const {
  for (std::size_t n = 1;; ++n) {
    try {
      Connection conn = Connect();
      if (transient_injector_ && transient_injector_(n)) {
        throw DbException("주입된 일시 오류 (시도 " + std::to_string(n) + ")", kErDeadlock, true);
      }
      attempt(conn.get(), n);
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || n >= kMaxAttempts) {
        throw;
      }
    }
    std::this_thread::sleep_for(BackoffDelay(n));
  }
}

// 커밋 전에 연결이 닫히면 서버가 트랜잭션을 롤백한다.
bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  bool committed = false;
  RetryOnTransient([&](MYSQL* conn, std::size_t) {
    mysql_autocommit(conn, 0);
    if (!work(conn)) {
      mysql_rollback(conn);
      committed = false;
      return;
    }
    if (mysql_commit(conn) != 0) {
      RaiseError(conn, "커밋 실패");
    }
    committed = true;
  });
  return committed;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RetryOnTransient([&](MYSQL* conn, std::size_t) { work(conn); });
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.data(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

void MariaDbClient::ForEachRow(MYSQL* conn, const std::string& sql, const std::string& ctx,
                               const std::function<void(MYSQL_ROW)>& on_row) const {
  Execute(conn, sql, ctx);
  std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> result(mysql_store_result(conn), &mysql_free_result);
  if (!result) {
    RaiseError(conn, ctx + " (결과 집합 없음)");
  }
  while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
    on_row(row);
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string out(value.size() * 2 + 1, '\0');
  unsigned long written = mysql_real_escape_string(conn, &out[0], value.data(), value.size());
  out.resize(written);
  return out;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": [" + std::to_string(code) + "] " + mysql_error(conn), code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) {
  switch (code) {
    case kErDeadlock:
    case kErLockWaitTimeout:
    case CR_SERVER_LOST:
    case CR_SERVER_GONE_ERROR:
    case CR_CONN_HOST_ERROR:
    case CR_SERVER_LOST_EXTENDED:
      return true;
    default:
      return false;
  }
}

// 50ms에서 시작해 두 배씩 늘리고 0~25ms 지터를 더한다.
std::chrono::milliseconds MariaDbClient::BackoffDelay(std::size_t attempt) {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<int> jitter(0, 25);
  return std::chrono::milliseconds((50 << (attempt - 1)) + jitter(gen));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace ladder
