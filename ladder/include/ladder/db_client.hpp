/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace ladder {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

// SELECT 문 끝에 붙는 InnoDB 잠금 읽기 모드.
enum class RowLock { kNone, kShare, kExclusive };

const char* LockClause(RowLock lock);

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 false를 반환하면 롤백한다. 재시도 가능한 오류는 work 전체를 다시 실행한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  void ForEachRow(MYSQL* conn, const std::string& sql, const std::string& ctx,
                  const std::function<void(MYSQL_ROW)>& on_row) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  using Connection = std::unique_ptr<MYSQL, decltype(&mysql_close)>;

  Connection Connect() const;
  // 재시도 가능한 DbException이면 새 연결로 attempt를 다시 호출한다.
  void RetryOnTransient(const std::function<void(MYSQL*, std::size_t)>& attempt) const;
  static bool IsRetryable(unsigned int code);
  static std::chrono::milliseconds BackoffDelay(std::size_t attempt);

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int io_timeout_seconds_ = 5;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace ladder
