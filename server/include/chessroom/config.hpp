/*
 * 설명: 서버 환경설정 필드와 환경 변수 로더를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace chessroom {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  // 0이면 하드웨어 동시성 수를 사용한다.
  std::size_t worker_threads;
};

AppConfig LoadConfigFromEnv();

}  // namespace chessroom
