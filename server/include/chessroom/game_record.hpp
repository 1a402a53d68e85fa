/*
 * 설명: 종료된 게임의 영속 레코드 형식을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_test.cpp, server/tests/it/finalize_it_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "chessroom/rules_engine.hpp"

namespace chessroom {

struct GameRecord {
  std::string game_id;
  std::string room_id;
  std::optional<int> white_user_id;
  std::optional<int> black_user_id;
  GameResult result;
  TerminalReason reason;
  std::string moves;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point finished_at;
};

}  // namespace chessroom
