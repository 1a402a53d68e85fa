/*
 * 설명: 구조화 로그(JSON 라인)와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chessroom {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::string trace_id;
  std::optional<std::string> room_id;
  std::optional<std::uint64_t> connection_id;
  std::optional<int> user_id;
  std::string message;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t moves_applied{0};
  std::uint64_t games_finished{0};
  std::uint64_t finalize_failures{0};
  std::uint64_t rooms{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  // 테스트에서 출력 대상을 바꿀 때 사용한다. 스트림 수명은 호출자가 보장한다.
  Observability(LogLevel min_level, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementMovesApplied();
  void IncrementGamesFinished();
  void IncrementFinalizeFailures();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t rooms) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> moves_applied_{0};
  std::atomic<std::uint64_t> games_finished_{0};
  std::atomic<std::uint64_t> finalize_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace chessroom
