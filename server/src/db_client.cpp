/*
 * 설명: MariaDB 연결, 재시도 가능한 트랜잭션 실행과 쿼리 결과 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/unit/db_retry_test.cpp, server/tests/it/finalize_it_test.cpp
 */
#include "chessroom/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace chessroom {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr auto kBackoffBase = std::chrono::milliseconds(50);
constexpr int kBackoffJitterMs = 25;
}  // namespace

bool IsRetryableDbError(unsigned int code) {
  switch (code) {
    case kDeadlock:
    case kLockWaitTimeout:
    case CR_SERVER_LOST:
    case CR_SERVER_GONE_ERROR:
    case CR_CONN_HOST_ERROR:
    case CR_SERVER_LOST_EXTENDED:
      return true;
    default:
      return false;
  }
}

void RetryTransient(std::size_t max_attempts, const std::function<void()>& body,
                    const std::function<void(std::size_t)>& backoff) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      body();
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= max_attempts) {
        throw;
      }
    }
    backoff(attempt);
  }
}

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

ConnectionHandle MariaDbClient::Connect() const {
  ConnectionHandle conn(mysql_init(nullptr));
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  if (mysql_set_character_set(conn.get(), "utf8mb4") != 0) {
    unsigned int code = mysql_errno(conn.get());
    throw DbException(std::string("문자셋 설정 실패: ") + mysql_error(conn.get()), code, false);
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  bool committed = false;
  RetryTransient(
      config_.max_attempts,
      [&]() {
        committed = false;
        auto conn = Connect();
        mysql_autocommit(conn.get(), 0);
        bool commit = false;
        try {
          commit = work(conn.get());
        } catch (...) {
          mysql_rollback(conn.get());
          throw;
        }
        if (!commit) {
          mysql_rollback(conn.get());
          return;
        }
        // 커밋 실패 시 연결을 닫으면 서버가 트랜잭션을 되돌린다.
        if (mysql_commit(conn.get()) != 0) {
          RaiseError(conn.get(), "커밋 실패");
        }
        committed = true;
      },
      [this](std::size_t attempt) { Backoff(attempt); });
  return committed;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RetryTransient(
      config_.max_attempts,
      [&]() {
        auto conn = Connect();
        work(conn.get());
      },
      [this](std::size_t attempt) { Backoff(attempt); });
}

bool MariaDbClient::Ping() const {
  try {
    auto conn = Connect();
    return mysql_ping(conn.get()) == 0;
  } catch (const DbException&) {
    return false;
  }
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
}

std::vector<DbRow> MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> res(mysql_store_result(conn), &mysql_free_result);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  const unsigned int columns = mysql_num_fields(res.get());
  std::vector<DbRow> rows;
  while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
    DbRow values;
    values.reserve(columns);
    for (unsigned int i = 0; i < columns; ++i) {
      values.push_back(row[i] ? std::optional<std::string>{row[i]} : std::nullopt);
    }
    rows.push_back(std::move(values));
  }
  return rows;
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped(value.size() * 2 + 1, '\0');
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsRetryableDbError(code));
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<int> jitter(0, kBackoffJitterMs);
  auto delay = kBackoffBase * (1 << (attempt - 1)) + std::chrono::milliseconds(jitter(gen));
  std::this_thread::sleep_for(delay);
}

}  // namespace chessroom
