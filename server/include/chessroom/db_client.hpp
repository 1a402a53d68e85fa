/*
 * 설명: MariaDB 연결, 트랜잭션 재시도 정책과 결과셋 읽기 보조 기능을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/unit/db_retry_test.cpp, server/tests/it/finalize_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

namespace chessroom {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  std::size_t max_attempts{3};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

using DbRow = std::vector<std::optional<std::string>>;

struct ConnectionCloser {
  void operator()(MYSQL* conn) const { mysql_close(conn); }
};
using ConnectionHandle = std::unique_ptr<MYSQL, ConnectionCloser>;

// 데드락, 락 대기 초과, 연결 끊김은 재시도 대상이다.
bool IsRetryableDbError(unsigned int code);

// body를 최대 max_attempts번 실행한다. 재시도 가능한 DbException 사이마다 backoff(시도 번호)를 부른다.
void RetryTransient(std::size_t max_attempts, const std::function<void()>& body,
                    const std::function<void(std::size_t)>& backoff);

class MariaDbClient {
 public:
  static constexpr unsigned int kDuplicateEntry = 1062;

  explicit MariaDbClient(const DbConfig& config);

  // work가 false를 돌려주면 롤백한다. 재시도 가능한 오류는 지수 백오프 후 다시 시도한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;
  bool Ping() const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::vector<DbRow> Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  ConnectionHandle Connect() const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
};

}  // namespace chessroom
